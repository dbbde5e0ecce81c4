#ifndef ECCFLOW_CLI_H
#define ECCFLOW_CLI_H

#include "engine_commands.h"
#include "pipeline.h"

#include <cstdint>
#include <ostream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace eccflow {

constexpr int kExitSuccess = 0;
constexpr int kExitRuntimeFailure = 1;
constexpr int kExitArgumentError = 2;

class ArgumentError : public std::runtime_error {
public:
    explicit ArgumentError(const std::string& what) : std::runtime_error(what) {}
};

struct CliOption {
    std::string name;           // e.g. "--output"
    std::string short_name;     // e.g. "-o", may be empty
    std::string arg_name;       // "" for flags
    std::string description;
    std::string default_value;  // "" if required or no default
    bool required = false;

    bool is_flag() const { return arg_name.empty(); }
};

class ParsedOptions {
public:
    bool help_requested() const { return help_requested_; }

    bool has(const std::string& name) const;
    bool flag(const std::string& name) const { return has(name); }

    // Value given on the command line, else the option's default.
    std::string get(const std::string& name) const;
    int64_t get_int(const std::string& name) const;
    double get_double(const std::string& name) const;

private:
    friend struct CliCommand;

    bool help_requested_ = false;
    std::unordered_map<std::string, std::string> values_;
    std::unordered_map<std::string, std::string> defaults_;
};

struct CliCommand {
    std::string name;
    std::string description;
    std::vector<CliOption> options;

    void print_help(std::ostream& os, const std::string& program) const;

    // Throws ArgumentError on unknown options, missing values and missing
    // required options (unless --help is present).
    ParsedOptions parse(const std::vector<std::string>& args) const;

    const CliOption* find(const std::string& token) const;
};

CliCommand make_realign_command();
CliCommand make_extract_command();

void print_main_usage(std::ostream& os, const std::string& program);

// Both throw ArgumentError on out-of-range values.
PipelineConfig pipeline_config_from_options(const ParsedOptions& options);
ExtractConfig extract_config_from_options(const ParsedOptions& options);

// Dispatch `argv` (subcommand first, program name excluded) and map the
// outcome to kExitSuccess, kExitRuntimeFailure or kExitArgumentError.
int run_command_line(const std::string& program, const std::vector<std::string>& argv);

}  // namespace eccflow

#endif  // ECCFLOW_CLI_H
