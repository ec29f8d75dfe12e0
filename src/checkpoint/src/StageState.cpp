#include "StageState.hpp"
#include "AtomicFile.hpp"
#include "LogUtils.hpp"
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

void to_json(nlohmann::json& j, const StageState& state) {
    j = nlohmann::json{
        {"stage_name", state.stage_name},
        {"input_hash", state.input_hash},
        {"completed", state.completed},
        {"completed_at", state.completed_at},
        {"output_files", state.output_files}
    };
}

void from_json(const nlohmann::json& j, StageState& state) {
    j.at("stage_name").get_to(state.stage_name);
    j.at("input_hash").get_to(state.input_hash);
    j.at("completed").get_to(state.completed);
    state.completed_at = j.value("completed_at", std::string());
    state.output_files = j.value("output_files", std::vector<std::string>());
}

std::optional<StageState> StageStateStore::load() const {
    std::ifstream ifs(path_);
    if (!ifs) {
        return std::nullopt;
    }
    try {
        nlohmann::json json_data;
        ifs >> json_data;
        return json_data.get<StageState>();
    } catch (const nlohmann::json::exception& e) {
        LogUtils::warn("Ignoring unreadable stage state {}: {}", path_, e.what());
        return std::nullopt;
    }
}

bool StageStateStore::should_skip(const std::string& input_hash) const {
    const auto state = load();
    if (!state || !state->completed || state->input_hash != input_hash) {
        return false;
    }
    for (const auto& file : state->output_files) {
        std::error_code ec;
        if (!fs::exists(file, ec)) {
            LogUtils::info("Stage output {} is missing; stage will run again", file);
            return false;
        }
    }
    return true;
}

void StageStateStore::persist(const StageState& state) const {
    const nlohmann::json json_data = state;
    write_file_atomically(path_, json_data.dump(2) + "\n");
}

void StageStateStore::clear() const {
    std::error_code ec;
    fs::remove(path_, ec);
    if (ec) {
        LogUtils::warn("Cannot remove stage state {}: {}", path_, ec.message());
    }
}
