#include "cli.h"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace eccflow {
namespace {

std::string join(const std::vector<std::string>& items, const char* sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += sep;
        out += items[i];
    }
    return out;
}

int32_t to_int32_at_least(const ParsedOptions& options, const std::string& name, int64_t min) {
    const int64_t value = options.get_int(name);
    if (value < min || value > std::numeric_limits<int32_t>::max()) {
        throw ArgumentError(name + " must be >= " + std::to_string(min) +
                            ", got " + std::to_string(value));
    }
    return static_cast<int32_t>(value);
}

double to_fraction(const ParsedOptions& options, const std::string& name) {
    const double value = options.get_double(name);
    if (value < 0.0 || value > 1.0) {
        throw ArgumentError(name + " must be within [0, 1], got " + options.get(name));
    }
    return value;
}

double to_non_negative(const ParsedOptions& options, const std::string& name) {
    const double value = options.get_double(name);
    if (value < 0.0) {
        throw ArgumentError(name + " must be non-negative, got " + options.get(name));
    }
    return value;
}

}  // namespace

bool ParsedOptions::has(const std::string& name) const {
    return values_.count(name) > 0;
}

std::string ParsedOptions::get(const std::string& name) const {
    auto it = values_.find(name);
    if (it != values_.end()) {
        return it->second;
    }
    auto dit = defaults_.find(name);
    return dit != defaults_.end() ? dit->second : std::string();
}

int64_t ParsedOptions::get_int(const std::string& name) const {
    const std::string raw = get(name);
    size_t used = 0;
    int64_t value = 0;
    try {
        value = std::stoll(raw, &used);
    } catch (const std::exception&) {
        throw ArgumentError("invalid integer for " + name + ": '" + raw + "'");
    }
    if (used != raw.size()) {
        throw ArgumentError("invalid integer for " + name + ": '" + raw + "'");
    }
    return value;
}

double ParsedOptions::get_double(const std::string& name) const {
    const std::string raw = get(name);
    size_t used = 0;
    double value = 0.0;
    try {
        value = std::stod(raw, &used);
    } catch (const std::exception&) {
        throw ArgumentError("invalid number for " + name + ": '" + raw + "'");
    }
    if (used != raw.size()) {
        throw ArgumentError("invalid number for " + name + ": '" + raw + "'");
    }
    return value;
}

const CliOption* CliCommand::find(const std::string& token) const {
    for (const auto& opt : options) {
        if (token == opt.name || (!opt.short_name.empty() && token == opt.short_name)) {
            return &opt;
        }
    }
    return nullptr;
}

ParsedOptions CliCommand::parse(const std::vector<std::string>& args) const {
    ParsedOptions parsed;
    for (const auto& opt : options) {
        if (!opt.is_flag() && !opt.default_value.empty()) {
            parsed.defaults_[opt.name] = opt.default_value;
        }
    }

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& token = args[i];
        if (token == "-h" || token == "--help") {
            parsed.help_requested_ = true;
            return parsed;
        }

        std::string key = token;
        std::string inline_value;
        bool has_inline = false;
        const size_t eq = token.find('=');
        if (token.rfind("--", 0) == 0 && eq != std::string::npos) {
            key = token.substr(0, eq);
            inline_value = token.substr(eq + 1);
            has_inline = true;
        }

        const CliOption* opt = find(key);
        if (opt == nullptr) {
            throw ArgumentError("unknown option for '" + name + "': " + token);
        }

        if (opt->is_flag()) {
            if (has_inline) {
                throw ArgumentError(opt->name + " does not take a value");
            }
            parsed.values_[opt->name] = "1";
            continue;
        }

        if (has_inline) {
            parsed.values_[opt->name] = inline_value;
        } else {
            if (i + 1 >= args.size()) {
                throw ArgumentError("missing value for " + opt->name);
            }
            parsed.values_[opt->name] = args[++i];
        }
    }

    std::vector<std::string> missing;
    for (const auto& opt : options) {
        if (opt.required && !parsed.has(opt.name)) {
            missing.push_back(opt.name);
        }
    }
    if (!missing.empty()) {
        throw ArgumentError("missing required option(s): " + join(missing, ", "));
    }

    return parsed;
}

void CliCommand::print_help(std::ostream& os, const std::string& program) const {
    os << "Usage: " << program << " " << name;
    for (const auto& opt : options) {
        if (opt.required) {
            os << " " << (opt.short_name.empty() ? opt.name : opt.short_name)
               << " " << opt.arg_name;
        }
    }
    os << " [options]\n\n" << description << "\n\n";

    os << "Required:\n";
    for (const auto& opt : options) {
        if (!opt.required) continue;
        std::string flags = opt.short_name.empty() ? opt.name : opt.short_name + ", " + opt.name;
        flags += " " + opt.arg_name;
        os << "  " << std::left << std::setw(34) << flags << opt.description << "\n";
    }

    os << "\nOptional:\n";
    for (const auto& opt : options) {
        if (opt.required) continue;
        std::string flags = opt.short_name.empty() ? opt.name : opt.short_name + ", " + opt.name;
        if (!opt.is_flag()) {
            flags += " " + opt.arg_name;
        }
        os << "  " << std::left << std::setw(34) << flags << opt.description;
        if (!opt.default_value.empty()) {
            os << " [" << opt.default_value << "]";
        }
        os << "\n";
    }
    os << "  " << std::left << std::setw(34) << "-h, --help" << "Show this help\n";
}

CliCommand make_realign_command() {
    const PipelineConfig d;
    const auto num = [](double v) { return format_engine_number(v); };

    CliCommand cmd;
    cmd.name = "realign";
    cmd.description =
        "Estimate the insert size distribution, then call candidate intervals,\n"
        "realign split and discordant reads, compute coverage and merge the\n"
        "evidence into the final eccDNA report. Stages with an existing\n"
        "checkpoint in the working directory are skipped.";
    cmd.options = {
        {"--candidates", "-i", "FILE", "Candidate reads BAM (from 'extract')", "", true},
        {"--qname-bam", "-qbam", "FILE", "Query-name sorted BAM", "", true},
        {"--sorted-bam", "-sbam", "FILE", "Coordinate sorted BAM", "", true},
        {"--fasta", "-fasta", "FILE", "Reference genome FASTA", "", true},
        {"--output", "-o", "FILE", "Output report", "", true},
        {"--directory", "-dir", "DIR", "Working directory (kept after the run)", "", false},
        {"--threads", "-t", "N", "Threads passed to the engines", std::to_string(d.threads), false},
        {"--bam-threads", "", "N", "htslib decompression threads", std::to_string(d.bam_threads), false},

        {"--sample-size", "", "N", "Read pairs sampled for the insert size",
         std::to_string(d.insert_size.sample_size), false},
        {"--insert-mapq", "", "N", "Minimum MAPQ of pairs sampled for the insert size",
         std::to_string(d.insert_size.mapq_cutoff), false},

        {"--std-multiplier", "", "X", "Insert size standard deviations searched",
         num(d.realign.std_multiplier), false},
        {"--mapq", "", "N", "Minimum MAPQ of realigned reads", std::to_string(d.realign.mapq), false},
        {"--interval-probability", "", "P", "Minimum interval probability",
         num(d.realign.interval_probability), false},
        {"--edit-distance-fraction", "", "F", "Maximum edit distance fraction",
         num(d.realign.edit_distance_fraction), false},
        {"--min-softclip", "", "N", "Minimum soft-clip length realigned",
         std::to_string(d.realign.min_softclip_length), false},
        {"--max-hits", "", "N", "Maximum alignments reported per read",
         std::to_string(d.realign.max_hits), false},
        {"--gap-open", "", "X", "Gap open penalty", num(d.realign.gap_open), false},
        {"--gap-extend", "", "X", "Gap extension penalty", num(d.realign.gap_extend), false},
        {"--prob-cutoff", "", "P", "Minimum alignment probability", num(d.realign.prob_cutoff), false},

        {"--allele-frequency", "", "F", "Minimum split read allele frequency",
         num(d.merge.allele_frequency), false},
        {"--discordants", "", "N", "Minimum discordant reads", std::to_string(d.merge.discordants), false},
        {"--split", "", "N", "Minimum split reads", std::to_string(d.merge.split_reads), false},
        {"--split-quality", "", "X", "Minimum split read quality", num(d.merge.split_quality), false},
        {"--merge-fraction", "", "F", "Reciprocal overlap to merge intervals",
         num(d.merge.merge_fraction), false},
        {"--extension", "", "N", "Bases searched around breakpoints", std::to_string(d.merge.extension), false},
        {"--bases", "", "N", "Bases used for the coverage ratio", std::to_string(d.merge.bases), false},
        {"--ratio", "", "X", "Minimum in/out coverage ratio", num(d.merge.coverage_ratio), false},
        {"--no-coverage", "", "", "Skip coverage and merge without it", "", false},

        {"--intervals-bin", "", "CMD", "Interval calling engine", d.executables.intervals, false},
        {"--realign-bin", "", "CMD", "Realignment engine", d.executables.realign, false},
        {"--coverage-bin", "", "CMD", "Coverage engine", d.executables.coverage, false},
        {"--merge-bin", "", "CMD", "Merge engine", d.executables.merge, false},
        {"--verbose", "-v", "", "Echo engine command lines", "", false},
    };
    return cmd;
}

CliCommand make_extract_command() {
    const ExtractConfig d;

    CliCommand cmd;
    cmd.name = "extract";
    cmd.description =
        "Extract split and discordant candidate reads from a query-name\n"
        "sorted BAM. The output feeds 'realign --candidates'.";
    cmd.options = {
        {"--input", "-i", "FILE", "Query-name sorted BAM", "", true},
        {"--output", "-o", "FILE", "Candidate reads BAM", "", true},
        {"--directory", "-dir", "DIR", "Working directory for the engine", "", false},
        {"--mapq", "-q", "N", "Minimum MAPQ", std::to_string(d.mapq), false},
        {"--no-discordants", "", "", "Do not extract discordant reads", "", false},
        {"--no-soft-clipped", "", "", "Do not extract soft-clipped reads", "", false},
        {"--no-hard-clipped", "", "", "Do not extract hard-clipped reads", "", false},
        {"--extract-bin", "", "CMD", "Read extraction engine", d.executable, false},
        {"--verbose", "-v", "", "Echo the engine command line", "", false},
    };
    return cmd;
}

void print_main_usage(std::ostream& os, const std::string& program) {
    os << "Usage: " << program << " <command> [options]\n\n"
       << "eccflow - eccDNA detection pipeline driver\n\n"
       << "Commands:\n"
       << "  extract   Extract candidate split/discordant reads\n"
       << "  realign   Run the checkpointed detection pipeline\n\n"
       << "Run '" << program << " <command> --help' for command options.\n";
}

PipelineConfig pipeline_config_from_options(const ParsedOptions& options) {
    PipelineConfig config;
    config.candidates_bam_path = options.get("--candidates");
    config.qname_bam_path = options.get("--qname-bam");
    config.sorted_bam_path = options.get("--sorted-bam");
    config.reference_fasta_path = options.get("--fasta");
    config.output_path = options.get("--output");
    if (options.has("--directory")) {
        const std::string dir = options.get("--directory");
        if (dir.empty()) {
            throw ArgumentError("--directory must not be empty");
        }
        config.working_directory = dir;
    }

    config.threads = to_int32_at_least(options, "--threads", 1);
    config.bam_threads = to_int32_at_least(options, "--bam-threads", 1);
    config.skip_coverage = options.flag("--no-coverage");
    config.verbose = options.flag("--verbose");

    config.insert_size.sample_size =
        static_cast<size_t>(to_int32_at_least(options, "--sample-size", 1));
    config.insert_size.mapq_cutoff = to_int32_at_least(options, "--insert-mapq", 0);

    RealignParams& r = config.realign;
    r.std_multiplier = to_non_negative(options, "--std-multiplier");
    r.mapq = to_int32_at_least(options, "--mapq", 0);
    r.interval_probability = to_fraction(options, "--interval-probability");
    r.edit_distance_fraction = to_fraction(options, "--edit-distance-fraction");
    r.min_softclip_length = to_int32_at_least(options, "--min-softclip", 0);
    r.max_hits = to_int32_at_least(options, "--max-hits", 1);
    r.gap_open = to_non_negative(options, "--gap-open");
    r.gap_extend = to_non_negative(options, "--gap-extend");
    r.prob_cutoff = to_fraction(options, "--prob-cutoff");

    MergeParams& m = config.merge;
    m.allele_frequency = to_fraction(options, "--allele-frequency");
    m.discordants = to_int32_at_least(options, "--discordants", 0);
    m.split_reads = to_int32_at_least(options, "--split", 0);
    m.split_quality = to_non_negative(options, "--split-quality");
    m.merge_fraction = to_fraction(options, "--merge-fraction");
    m.extension = to_int32_at_least(options, "--extension", 0);
    m.bases = to_int32_at_least(options, "--bases", 0);
    m.coverage_ratio = to_non_negative(options, "--ratio");

    config.executables.intervals = options.get("--intervals-bin");
    config.executables.realign = options.get("--realign-bin");
    config.executables.coverage = options.get("--coverage-bin");
    config.executables.merge = options.get("--merge-bin");
    return config;
}

ExtractConfig extract_config_from_options(const ParsedOptions& options) {
    ExtractConfig config;
    config.qname_bam_path = options.get("--input");
    config.output_path = options.get("--output");
    config.working_directory = options.get("--directory");
    config.mapq = to_int32_at_least(options, "--mapq", 0);
    config.keep_discordants = !options.flag("--no-discordants");
    config.keep_soft_clipped = !options.flag("--no-soft-clipped");
    config.keep_hard_clipped = !options.flag("--no-hard-clipped");
    config.executable = options.get("--extract-bin");
    config.verbose = options.flag("--verbose");
    return config;
}

}  // namespace eccflow
