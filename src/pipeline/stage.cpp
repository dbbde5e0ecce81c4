#include "stage.h"

#include <filesystem>

namespace eccflow {

CheckpointStatus probe_checkpoint(const PipelineStage& stage) {
    if (!stage.checkpoint_artifact.has_value() || stage.checkpoint_artifact->empty()) {
        return CheckpointStatus::not_started();
    }

    const std::filesystem::path artifact(*stage.checkpoint_artifact);
    // symlink_status so a dangling link still counts as an entry.
    if (std::filesystem::exists(std::filesystem::symlink_status(artifact))) {
        return CheckpointStatus::completed_at(*stage.checkpoint_artifact);
    }
    return CheckpointStatus::not_started();
}

const char* stage_outcome_tag(StageOutcome outcome) {
    switch (outcome) {
        case StageOutcome::kExecuted: return "EXECUTED";
        case StageOutcome::kSkippedCheckpoint: return "SKIPPED_CHECKPOINT";
        default: return "NA";
    }
}

}  // namespace eccflow
