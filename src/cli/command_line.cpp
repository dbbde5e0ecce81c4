#include "cli.h"

#include <chrono>
#include <exception>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "engine.h"
#include "insert_size.h"
#include "pipeline.h"

namespace eccflow {
namespace {

void print_run_summary(const PipelineRunReport& report, double elapsed) {
    std::ostringstream out;
    out << "\n=== eccflow Summary ===\n";
    for (const auto& stage : report.stages) {
        out << "  " << std::left << std::setw(12) << stage.name
            << stage_outcome_tag(stage.outcome) << '\n';
    }
    out << std::fixed;
    if (report.has_insert_size) {
        const auto& is = report.insert_size;
        out << std::setprecision(2)
            << "Insert size:       mean=" << is.mean << " std=" << is.stddev
            << " pairs=" << is.sample_count << "/" << is.requested_sample_size << '\n';
    }
    out << "Working directory: " << report.working_directory
        << (report.working_directory_removed ? " (removed)" : "") << '\n';
    out << "Elapsed:           " << std::setprecision(1) << elapsed << "s\n";
    std::cout << out.str() << std::flush;
}

int run_realign(const std::string& program, const std::vector<std::string>& args) {
    const CliCommand command = make_realign_command();
    PipelineConfig config;
    try {
        const ParsedOptions options = command.parse(args);
        if (options.help_requested()) {
            command.print_help(std::cout, program);
            return kExitSuccess;
        }
        config = pipeline_config_from_options(options);
    } catch (const ArgumentError& e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        command.print_help(std::cerr, program);
        return kExitArgumentError;
    }

    std::cout << "=== eccflow realign ===" << std::endl;
    std::cout << "Candidates:  " << config.candidates_bam_path << std::endl;
    std::cout << "Name-sorted: " << config.qname_bam_path << std::endl;
    std::cout << "Sorted:      " << config.sorted_bam_path << std::endl;
    std::cout << "Reference:   " << config.reference_fasta_path << std::endl;
    std::cout << "Output:      " << config.output_path << std::endl;

    const auto start = std::chrono::steady_clock::now();
    auto controller = build_default_controller(config);
    const PipelineRunReport report = controller->run();
    const double elapsed = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - start).count();

    print_run_summary(report, elapsed);
    return kExitSuccess;
}

int run_extract(const std::string& program, const std::vector<std::string>& args) {
    const CliCommand command = make_extract_command();
    ExtractConfig config;
    try {
        const ParsedOptions options = command.parse(args);
        if (options.help_requested()) {
            command.print_help(std::cout, program);
            return kExitSuccess;
        }
        config = extract_config_from_options(options);
    } catch (const ArgumentError& e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        command.print_help(std::cerr, program);
        return kExitArgumentError;
    }

    auto runner = make_process_engine_runner(config.verbose);
    run_read_extraction(config, *runner);
    return kExitSuccess;
}

}  // namespace

int run_command_line(const std::string& program, const std::vector<std::string>& argv) {
    if (argv.empty()) {
        print_main_usage(std::cerr, program);
        return kExitArgumentError;
    }

    const std::string& subcommand = argv[0];
    if (subcommand == "-h" || subcommand == "--help") {
        print_main_usage(std::cout, program);
        return kExitSuccess;
    }

    const std::vector<std::string> args(argv.begin() + 1, argv.end());

    try {
        if (subcommand == "realign") {
            return run_realign(program, args);
        }
        if (subcommand == "extract") {
            return run_extract(program, args);
        }
    } catch (const EmptySampleError& e) {
        std::cerr << "[eccflow] error: " << e.what()
                  << " (check --insert-mapq and that the BAM is name-sorted)" << std::endl;
        return kExitRuntimeFailure;
    } catch (const std::exception& e) {
        std::cerr << "[eccflow] error: " << e.what() << std::endl;
        return kExitRuntimeFailure;
    }

    std::cerr << "Error: unknown command '" << subcommand << "'\n\n";
    print_main_usage(std::cerr, program);
    return kExitArgumentError;
}

}  // namespace eccflow
