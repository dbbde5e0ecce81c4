#ifndef ECCFLOW_ENGINE_H
#define ECCFLOW_ENGINE_H

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace eccflow {

struct EngineInvocation {
    std::string engine;      // logical name, e.g. "realign"
    std::string executable;  // resolved through PATH when it has no '/'
    std::vector<std::string> args;
};

class EngineFailureError : public std::runtime_error {
public:
    EngineFailureError(const std::string& engine, int status);

    const std::string& engine() const { return engine_; }
    int status() const { return status_; }

private:
    std::string engine_;
    int status_ = 0;
};

/**
 * EngineRunner: runs one external engine to completion.
 * Parameters in, exit status out (0 = success). Blocking, no timeout.
 */
class EngineRunner {
public:
    virtual ~EngineRunner() = default;

    virtual int run(const EngineInvocation& invocation) = 0;
};

// Runs the invocation through the shell and waits for it.
// Signals are reported as 128 + signal number, -1 when no shell could start.
std::unique_ptr<EngineRunner> make_process_engine_runner(bool echo_commands = false);

std::string shell_quote(const std::string& arg);
std::string format_command_line(const EngineInvocation& invocation);

// Throws EngineFailureError on a non-zero status.
void run_engine_checked(EngineRunner& runner, const EngineInvocation& invocation);

}  // namespace eccflow

#endif  // ECCFLOW_ENGINE_H
