#ifndef ECCFLOW_STAGE_H
#define ECCFLOW_STAGE_H

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>

namespace eccflow {

enum class CheckpointState : uint8_t {
    kNotStarted = 0,
    kCompleted = 1
};

// Tagged checkpoint status; artifact_path is set only when completed.
struct CheckpointStatus {
    CheckpointState state = CheckpointState::kNotStarted;
    std::string artifact_path;

    bool completed() const { return state == CheckpointState::kCompleted; }

    static CheckpointStatus not_started() { return CheckpointStatus{}; }
    static CheckpointStatus completed_at(std::string path) {
        return CheckpointStatus{CheckpointState::kCompleted, std::move(path)};
    }
};

struct PipelineStage {
    std::string name;
    // No artifact: the stage runs on every invocation.
    std::optional<std::string> checkpoint_artifact;
    std::function<void()> run_action;
};

enum class StageOutcome : uint8_t {
    kExecuted = 0,
    kSkippedCheckpoint = 1
};

struct StageRecord {
    std::string name;
    StageOutcome outcome = StageOutcome::kExecuted;
    CheckpointStatus checkpoint;
    double elapsed_seconds = 0.0;
};

// Existence of any filesystem entry at the artifact path means completed.
// Throws std::filesystem::filesystem_error when existence cannot be decided.
CheckpointStatus probe_checkpoint(const PipelineStage& stage);

const char* stage_outcome_tag(StageOutcome outcome);

}  // namespace eccflow

#endif  // ECCFLOW_STAGE_H
