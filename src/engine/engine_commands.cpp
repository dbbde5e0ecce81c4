#include "engine_commands.h"

#include <iomanip>
#include <iterator>
#include <sstream>
#include <string>

namespace eccflow {

std::string format_engine_number(double value) {
    std::ostringstream oss;
    oss << std::setprecision(10) << value;
    return oss.str();
}

EngineInvocation build_intervals_invocation(
    const std::string& executable,
    const IntervalsInputs& inputs) {
    EngineInvocation inv;
    inv.engine = "intervals";
    inv.executable = executable;
    inv.args = {
        "-i", inputs.sorted_bam_path,
        "-f", inputs.reference_fasta_path,
        "-o", inputs.peaks_path,
        "-t", std::to_string(inputs.threads)
    };
    return inv;
}

EngineInvocation build_realign_invocation(
    const std::string& executable,
    const RealignInputs& inputs,
    const InsertSizeStats& insert_size,
    const RealignParams& params) {
    EngineInvocation inv;
    inv.engine = "realign";
    inv.executable = executable;
    inv.args = {
        "-i", inputs.candidates_bam_path,
        "-q", inputs.qname_bam_path,
        "-s", inputs.sorted_bam_path,
        "-f", inputs.reference_fasta_path,
        "-b", inputs.peaks_path,
        "-o", inputs.output_path,
        "--insert-mean", format_engine_number(insert_size.mean),
        "--insert-std", format_engine_number(insert_size.stddev),
        "--std-multiplier", format_engine_number(params.std_multiplier),
        "--mapq", std::to_string(params.mapq),
        "--interval-probability", format_engine_number(params.interval_probability),
        "--edit-distance-fraction", format_engine_number(params.edit_distance_fraction),
        "--min-softclip", std::to_string(params.min_softclip_length),
        "--max-hits", std::to_string(params.max_hits),
        "--gap-open", format_engine_number(params.gap_open),
        "--gap-extend", format_engine_number(params.gap_extend),
        "--prob-cutoff", format_engine_number(params.prob_cutoff),
        "-t", std::to_string(inputs.threads)
    };
    return inv;
}

EngineInvocation build_coverage_invocation(
    const std::string& executable,
    const CoverageInputs& inputs) {
    EngineInvocation inv;
    inv.engine = "coverage";
    inv.executable = executable;
    inv.args = {
        "-i", inputs.sorted_bam_path,
        "-o", inputs.output_path,
        "-t", std::to_string(inputs.threads)
    };
    return inv;
}

EngineInvocation build_merge_invocation(
    const std::string& executable,
    const MergeInputs& inputs,
    const MergeParams& params) {
    EngineInvocation inv;
    inv.engine = "merge";
    inv.executable = executable;

    if (inputs.coverage_path.empty()) {
        inv.args.push_back("--no-coverage");
    } else {
        inv.args.push_back("-c");
        inv.args.push_back(inputs.coverage_path);
    }

    const std::string tail[] = {
        "-f", inputs.reference_fasta_path,
        "-r", inputs.realign_path,
        "-o", inputs.output_path,
        "--allele-frequency", format_engine_number(params.allele_frequency),
        "--discordants", std::to_string(params.discordants),
        "--split", std::to_string(params.split_reads),
        "--split-quality", format_engine_number(params.split_quality),
        "--merge-fraction", format_engine_number(params.merge_fraction),
        "--extension", std::to_string(params.extension),
        "--bases", std::to_string(params.bases),
        "--ratio", format_engine_number(params.coverage_ratio)
    };
    inv.args.insert(inv.args.end(), std::begin(tail), std::end(tail));
    return inv;
}

EngineInvocation build_extract_invocation(const ExtractConfig& config) {
    EngineInvocation inv;
    inv.engine = "extract";
    inv.executable = config.executable;
    inv.args = {
        "-i", config.qname_bam_path,
        "-o", config.output_path,
        "-q", std::to_string(config.mapq)
    };
    if (!config.working_directory.empty()) {
        inv.args.push_back("-d");
        inv.args.push_back(config.working_directory);
    }
    if (!config.keep_discordants) {
        inv.args.push_back("--no-discordants");
    }
    if (!config.keep_soft_clipped) {
        inv.args.push_back("--no-soft-clipped");
    }
    if (!config.keep_hard_clipped) {
        inv.args.push_back("--no-hard-clipped");
    }
    return inv;
}

}  // namespace eccflow
