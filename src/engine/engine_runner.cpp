#include "engine.h"

#include <cstdlib>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include <sys/wait.h>

namespace eccflow {
namespace {

int decode_wait_status(int raw) {
    if (raw == -1) {
        return -1;
    }
    if (WIFEXITED(raw)) {
        return WEXITSTATUS(raw);
    }
    if (WIFSIGNALED(raw)) {
        return 128 + WTERMSIG(raw);
    }
    return -1;
}

class ProcessEngineRunner final : public EngineRunner {
public:
    explicit ProcessEngineRunner(bool echo_commands) : echo_commands_(echo_commands) {}

    int run(const EngineInvocation& invocation) override {
        const std::string cmd = format_command_line(invocation);
        if (echo_commands_) {
            std::cerr << "[Engine] " << invocation.engine << ": " << cmd << '\n';
        }

        // Make sure our own buffered log lines land before the child's output.
        std::cout.flush();
        std::cerr.flush();

        const int status = decode_wait_status(std::system(cmd.c_str()));
        if (status == 127) {
            std::cerr << "[Engine] " << invocation.engine
                      << ": command not found: " << invocation.executable << '\n';
        }
        return status;
    }

private:
    bool echo_commands_ = false;
};

std::string failure_message(const std::string& engine, int status) {
    std::ostringstream oss;
    oss << "engine '" << engine << "' failed with exit status " << status;
    return oss.str();
}

}  // namespace

EngineFailureError::EngineFailureError(const std::string& engine, int status)
    : std::runtime_error(failure_message(engine, status)),
      engine_(engine),
      status_(status) {}

std::string shell_quote(const std::string& arg) {
    if (arg.empty()) {
        return "''";
    }

    bool safe = true;
    for (const char c : arg) {
        const bool plain = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                           (c >= '0' && c <= '9') || c == '_' || c == '-' ||
                           c == '.' || c == '/' || c == '=' || c == ':' ||
                           c == ',' || c == '+';
        if (!plain) {
            safe = false;
            break;
        }
    }
    if (safe) {
        return arg;
    }

    std::string out = "'";
    for (const char c : arg) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += "'";
    return out;
}

std::string format_command_line(const EngineInvocation& invocation) {
    std::string cmd = shell_quote(invocation.executable);
    for (const auto& arg : invocation.args) {
        cmd += ' ';
        cmd += shell_quote(arg);
    }
    return cmd;
}

void run_engine_checked(EngineRunner& runner, const EngineInvocation& invocation) {
    const int status = runner.run(invocation);
    if (status != 0) {
        throw EngineFailureError(invocation.engine, status);
    }
}

std::unique_ptr<EngineRunner> make_process_engine_runner(bool echo_commands) {
    return std::make_unique<ProcessEngineRunner>(echo_commands);
}

}  // namespace eccflow
