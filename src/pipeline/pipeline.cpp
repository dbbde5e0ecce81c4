#include "pipeline.h"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace eccflow {
namespace {

double seconds_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

std::string format_seconds(double seconds) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << seconds << "s";
    return oss.str();
}

void require_path(const std::string& value, const char* what) {
    if (value.empty()) {
        throw std::invalid_argument(std::string("pipeline input not set: ") + what);
    }
}

}  // namespace

PipelineController::PipelineController(
    PipelineConfig config,
    std::unique_ptr<EngineRunner> engine_runner,
    AlignmentSourceFactory source_factory)
    : config_(std::move(config)),
      engine_runner_(std::move(engine_runner)),
      source_factory_(std::move(source_factory)) {
    if (!engine_runner_) {
        throw std::invalid_argument("PipelineController needs an engine runner");
    }
    if (!source_factory_) {
        throw std::invalid_argument("PipelineController needs an alignment source factory");
    }
}

std::vector<StageRecord> PipelineController::run_stages(
    const std::vector<PipelineStage>& stages) const {
    std::vector<StageRecord> records;
    records.reserve(stages.size());

    for (size_t i = 0; i < stages.size(); ++i) {
        const PipelineStage& stage = stages[i];

        StageRecord record;
        record.name = stage.name;
        record.checkpoint = probe_checkpoint(stage);

        if (record.checkpoint.completed()) {
            record.outcome = StageOutcome::kSkippedCheckpoint;
            std::cerr << "[Pipeline] [" << (i + 1) << "/" << stages.size() << "] "
                      << stage.name << ": checkpoint " << record.checkpoint.artifact_path
                      << " exists, skipping\n";
            records.push_back(std::move(record));
            continue;
        }

        std::cerr << "[Pipeline] [" << (i + 1) << "/" << stages.size() << "] "
                  << stage.name << ": running\n";
        const auto start = std::chrono::steady_clock::now();
        if (stage.run_action) {
            stage.run_action();
        }
        record.outcome = StageOutcome::kExecuted;
        record.elapsed_seconds = seconds_since(start);
        std::cerr << "[Pipeline] " << stage.name << ": done in "
                  << format_seconds(record.elapsed_seconds) << '\n';

        records.push_back(std::move(record));
    }

    return records;
}

void PipelineController::validate_config() const {
    require_path(config_.candidates_bam_path, "candidate reads BAM");
    require_path(config_.qname_bam_path, "name-sorted BAM");
    require_path(config_.sorted_bam_path, "coordinate-sorted BAM");
    require_path(config_.reference_fasta_path, "reference FASTA");
    require_path(config_.output_path, "output path");
}

InsertSizeStats PipelineController::estimate_insert_size() const {
    std::unique_ptr<AlignmentRecordSource> source = source_factory_(config_.qname_bam_path);
    if (!source || !source->is_valid()) {
        throw std::runtime_error("cannot open name-sorted alignments: " + config_.qname_bam_path);
    }

    InsertSizeEstimator estimator(config_.insert_size);
    return estimator.estimate(*source);
}

std::vector<PipelineStage> PipelineController::build_stages(
    const WorkingDirectorySession& session,
    RunState& state) {
    const std::string peaks = session.artifact(kPeaksArtifact);
    const std::string realigned = session.artifact(kRealignArtifact);
    const std::string coverage = session.artifact(kCoverageArtifact);

    std::vector<PipelineStage> stages;

    {
        IntervalsInputs in;
        in.sorted_bam_path = config_.sorted_bam_path;
        in.reference_fasta_path = config_.reference_fasta_path;
        in.peaks_path = peaks;
        in.threads = config_.threads;
        stages.push_back({kStageIntervals, peaks, [this, in]() {
            run_engine_checked(*engine_runner_,
                               build_intervals_invocation(config_.executables.intervals, in));
        }});
    }

    // Full scan of the name-sorted input; cheaper to redo than to checkpoint.
    stages.push_back({kStageInsertSize, std::nullopt, [this, &state]() {
        state.insert_size = estimate_insert_size();
    }});

    {
        RealignInputs in;
        in.candidates_bam_path = config_.candidates_bam_path;
        in.qname_bam_path = config_.qname_bam_path;
        in.sorted_bam_path = config_.sorted_bam_path;
        in.reference_fasta_path = config_.reference_fasta_path;
        in.peaks_path = peaks;
        in.output_path = realigned;
        in.threads = config_.threads;
        stages.push_back({kStageRealign, realigned, [this, &state, in]() {
            if (!state.insert_size.has_value()) {
                throw std::logic_error("realign stage reached without insert size statistics");
            }
            run_engine_checked(*engine_runner_,
                               build_realign_invocation(config_.executables.realign, in,
                                                        *state.insert_size, config_.realign));
        }});
    }

    if (!config_.skip_coverage) {
        CoverageInputs in;
        in.sorted_bam_path = config_.sorted_bam_path;
        in.output_path = coverage;
        in.threads = config_.threads;
        stages.push_back({kStageCoverage, coverage, [this, in]() {
            run_engine_checked(*engine_runner_,
                               build_coverage_invocation(config_.executables.coverage, in));
        }});
    }

    {
        MergeInputs in;
        in.coverage_path = config_.skip_coverage ? std::string() : coverage;
        in.reference_fasta_path = config_.reference_fasta_path;
        in.realign_path = realigned;
        in.output_path = config_.output_path;
        stages.push_back({kStageMerge, std::nullopt, [this, in]() {
            run_engine_checked(*engine_runner_,
                               build_merge_invocation(config_.executables.merge, in,
                                                      config_.merge));
        }});
    }

    return stages;
}

PipelineRunReport PipelineController::run() {
    validate_config();

    WorkingDirectorySession session = WorkingDirectorySession::open(config_.working_directory);

    RunState state;
    const std::vector<PipelineStage> stages = build_stages(session, state);

    PipelineRunReport report;
    report.working_directory = session.path().string();
    report.stages = run_stages(stages);

    if (state.insert_size.has_value()) {
        report.has_insert_size = true;
        report.insert_size = *state.insert_size;
    }

    // Reached only when every stage returned normally.
    report.working_directory_removed = session.close();
    return report;
}

std::unique_ptr<PipelineController> build_default_controller(const PipelineConfig& config) {
    const int32_t bam_threads = config.bam_threads;
    return std::make_unique<PipelineController>(
        config,
        make_process_engine_runner(config.verbose),
        [bam_threads](const std::string& path) {
            return make_alignment_source(path, bam_threads);
        });
}

void run_read_extraction(const ExtractConfig& config, EngineRunner& runner) {
    require_path(config.qname_bam_path, "name-sorted BAM");
    require_path(config.output_path, "output path");

    std::cerr << "[Extract] extracting candidate reads from " << config.qname_bam_path << '\n';
    const auto start = std::chrono::steady_clock::now();
    run_engine_checked(runner, build_extract_invocation(config));
    std::cerr << "[Extract] wrote " << config.output_path << " in "
              << format_seconds(seconds_since(start)) << '\n';
}

}  // namespace eccflow
