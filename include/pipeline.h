#ifndef ECCFLOW_PIPELINE_H
#define ECCFLOW_PIPELINE_H

#include "alignment_source.h"
#include "engine.h"
#include "engine_commands.h"
#include "insert_size.h"
#include "stage.h"
#include "workdir.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace eccflow {

constexpr char kStageIntervals[] = "intervals";
constexpr char kStageInsertSize[] = "insert_size";
constexpr char kStageRealign[] = "realign";
constexpr char kStageCoverage[] = "coverage";
constexpr char kStageMerge[] = "merge";

constexpr char kPeaksArtifact[] = "peaks.bed";
constexpr char kRealignArtifact[] = "ecctemp.txt";
constexpr char kCoverageArtifact[] = "coverage.txt";

struct PipelineConfig {
    std::string candidates_bam_path;   // reads extracted by `eccflow extract`
    std::string qname_bam_path;        // name-sorted, drives the insert size scan
    std::string sorted_bam_path;       // coordinate-sorted
    std::string reference_fasta_path;
    std::string output_path;

    // Unset: a temporary directory under the cwd, removed after success.
    std::optional<std::string> working_directory;

    int32_t threads = 1;       // passed through to engines
    int32_t bam_threads = 2;   // htslib decompression threads

    // Drop the coverage stage and merge without a coverage table.
    bool skip_coverage = false;
    bool verbose = false;

    InsertSizeConfig insert_size;
    RealignParams realign;
    MergeParams merge;
    EngineExecutables executables;
};

struct PipelineRunReport {
    std::vector<StageRecord> stages;

    bool has_insert_size = false;
    InsertSizeStats insert_size;

    std::string working_directory;
    bool working_directory_removed = false;
};

using AlignmentSourceFactory =
    std::function<std::unique_ptr<AlignmentRecordSource>(const std::string& path)>;

/**
 * PipelineController: runs stages strictly in order, one at a time.
 *
 * run() builds the eccDNA sequence
 *   intervals -> insert_size -> realign -> coverage -> merge
 * in a fresh WorkingDirectorySession. Insert size statistics live only in
 * memory and are handed to the realign engine. Any exception stops the run
 * and leaves the working directory untouched.
 */
class PipelineController {
public:
    PipelineController(
        PipelineConfig config,
        std::unique_ptr<EngineRunner> engine_runner,
        AlignmentSourceFactory source_factory);

    // Skip stages whose checkpoint exists, run the others synchronously.
    std::vector<StageRecord> run_stages(const std::vector<PipelineStage>& stages) const;

    PipelineRunReport run();

    const PipelineConfig& config() const { return config_; }

private:
    struct RunState {
        std::optional<InsertSizeStats> insert_size;
    };

    std::vector<PipelineStage> build_stages(
        const WorkingDirectorySession& session,
        RunState& state);

    void validate_config() const;
    InsertSizeStats estimate_insert_size() const;

    PipelineConfig config_;
    std::unique_ptr<EngineRunner> engine_runner_;
    AlignmentSourceFactory source_factory_;
};

std::unique_ptr<PipelineController> build_default_controller(const PipelineConfig& config);

// `eccflow extract`: one call to the read extraction engine.
void run_read_extraction(const ExtractConfig& config, EngineRunner& runner);

}  // namespace eccflow

#endif  // ECCFLOW_PIPELINE_H
