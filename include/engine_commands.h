#ifndef ECCFLOW_ENGINE_COMMANDS_H
#define ECCFLOW_ENGINE_COMMANDS_H

#include "engine.h"
#include "insert_size.h"

#include <cstdint>
#include <string>

namespace eccflow {

struct EngineExecutables {
    std::string intervals = "ecc-intervals";
    std::string realign = "ecc-realign";
    std::string coverage = "ecc-coverage";
    std::string merge = "ecc-merge";
    std::string extract = "ecc-extract";
};

// Realignment engine tuning, passed through unchanged.
struct RealignParams {
    double std_multiplier = 4.0;
    int32_t mapq = 20;
    double interval_probability = 0.01;
    double edit_distance_fraction = 0.05;
    int32_t min_softclip_length = 8;
    int32_t max_hits = 10;
    double gap_open = 5.0;
    double gap_extend = 1.0;
    double prob_cutoff = 0.99;
};

// Merge engine reporting thresholds.
struct MergeParams {
    double allele_frequency = 0.1;
    int32_t discordants = 3;
    int32_t split_reads = 0;
    double split_quality = 0.0;
    double merge_fraction = 0.99;
    int32_t extension = 100;
    int32_t bases = 200;
    double coverage_ratio = 0.0;
};

struct IntervalsInputs {
    std::string sorted_bam_path;
    std::string reference_fasta_path;
    std::string peaks_path;
    int32_t threads = 1;
};

struct RealignInputs {
    std::string candidates_bam_path;
    std::string qname_bam_path;
    std::string sorted_bam_path;
    std::string reference_fasta_path;
    std::string peaks_path;
    std::string output_path;
    int32_t threads = 1;
};

struct CoverageInputs {
    std::string sorted_bam_path;
    std::string output_path;
    int32_t threads = 1;
};

struct MergeInputs {
    // Empty selects the coverage-suppressed variant.
    std::string coverage_path;
    std::string reference_fasta_path;
    std::string realign_path;
    std::string output_path;
};

struct ExtractConfig {
    std::string qname_bam_path;
    std::string output_path;
    std::string working_directory;
    int32_t mapq = 10;
    bool keep_discordants = true;
    bool keep_soft_clipped = true;
    bool keep_hard_clipped = true;
    bool verbose = false;
    std::string executable = EngineExecutables{}.extract;
};

std::string format_engine_number(double value);

EngineInvocation build_intervals_invocation(
    const std::string& executable,
    const IntervalsInputs& inputs);

EngineInvocation build_realign_invocation(
    const std::string& executable,
    const RealignInputs& inputs,
    const InsertSizeStats& insert_size,
    const RealignParams& params);

EngineInvocation build_coverage_invocation(
    const std::string& executable,
    const CoverageInputs& inputs);

EngineInvocation build_merge_invocation(
    const std::string& executable,
    const MergeInputs& inputs,
    const MergeParams& params);

EngineInvocation build_extract_invocation(const ExtractConfig& config);

}  // namespace eccflow

#endif  // ECCFLOW_ENGINE_COMMANDS_H
