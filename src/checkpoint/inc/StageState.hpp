#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct StageState {
    std::string stage_name;
    std::string input_hash;
    bool completed = false;
    std::string completed_at;
    std::vector<std::string> output_files;
};

void to_json(nlohmann::json& j, const StageState& state);
void from_json(const nlohmann::json& j, StageState& state);

// Whole-stage completion marker; a finished stage with the same input
// hash and intact outputs need not run again.
class StageStateStore {
public:
    explicit StageStateStore(std::string path) : path_(std::move(path)) {}

    std::optional<StageState> load() const;

    bool should_skip(const std::string& input_hash) const;

    // Throws CheckpointError
    void persist(const StageState& state) const;

    // Forgets a previous completion
    void clear() const;

    const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
};
