#include "IngestState.hpp"

const char* ingest_state_to_string(IngestState state) {
    switch (state) {
        case IngestState::Init:    return "INIT";
        case IngestState::Fresh:   return "FRESH";
        case IngestState::Resume:  return "RESUME";
        case IngestState::Running: return "RUNNING";
        case IngestState::Done:    return "DONE";
        default: return "UNKNOWN";
    }
}

StartDecision decide_start(bool force_restart,
                           const std::optional<Checkpoint>& checkpoint,
                           bool checkpoint_valid,
                           std::optional<uint64_t> output_size) {
    if (force_restart) {
        return {IngestState::Fresh, "restart forced"};
    }
    if (!checkpoint) {
        return {IngestState::Fresh, "no checkpoint"};
    }
    if (!checkpoint_valid) {
        return {IngestState::Fresh, "checkpoint does not match the current configuration or source"};
    }
    if (!output_size) {
        return {IngestState::Fresh, "output file is missing"};
    }
    if (*output_size != checkpoint->output_bytes_written) {
        return {IngestState::Fresh, "output file has " + std::to_string(*output_size) +
                                    " bytes, checkpoint recorded " +
                                    std::to_string(checkpoint->output_bytes_written)};
    }
    return {IngestState::Resume, "resuming after " + std::to_string(checkpoint->pages_processed) + " pages"};
}
