#pragma once

#include "Checkpoint.hpp"
#include <cstdint>
#include <optional>
#include <string>

enum class IngestState {
    Init,
    Fresh,
    Resume,
    Running,
    Done
};

const char* ingest_state_to_string(IngestState state);

struct StartDecision {
    IngestState state = IngestState::Fresh;
    std::string reason;
};

// Init transition. output_size is empty when the output file does not exist.
StartDecision decide_start(bool force_restart,
                           const std::optional<Checkpoint>& checkpoint,
                           bool checkpoint_valid,
                           std::optional<uint64_t> output_size);
