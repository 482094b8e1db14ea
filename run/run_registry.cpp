#include "dirgen.h"
#include "run/run_registry.h"

using json = nlohmann::json;

json RunRecord::to_json() const {
    json j = {
        {"run_id", id},
        {"state", ::to_string(state)},
        {"terminal", is_terminal(state)},
        {"created_at", dirgen::format_iso_time(created_at)},
        {"updated_at", dirgen::format_iso_time(updated_at)},
        {"input_path", input_path},
        {"context_path", context_path},
        {"metadata", metadata}
    };
    j["approval_gate"] = gate ? json(::to_string(*gate)) : json(nullptr);
    if (retry) {
        j["retry"] = {{"count", retry->count}, {"history", retry->history}};
    } else {
        j["retry"] = nullptr;
    }
    return j;
}

std::shared_ptr<RunRecord> RunRegistry::create() {
    auto record = std::make_shared<RunRecord>();
    record->created_at = RunRecord::Clock::now();
    record->updated_at = record->created_at;

    std::lock_guard<std::mutex> lock(mutex_);
    do {
        record->id = dirgen::generate_id("run-");
    } while (runs_.count(record->id));
    runs_[record->id] = record;
    return record;
}

std::shared_ptr<RunRecord> RunRegistry::find(const std::string& run_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = runs_.find(run_id);
    if (it == runs_.end()) {
        throw UnknownRunError(run_id);
    }
    return it->second;
}

bool RunRegistry::contains(const std::string& run_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return runs_.count(run_id) > 0;
}

void RunRegistry::remove(const std::string& run_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    runs_.erase(run_id);
}

size_t RunRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return runs_.size();
}

json RunRegistry::summary() const {
    std::vector<std::shared_ptr<RunRecord>> runs;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, record] : runs_) {
            runs.push_back(record);
        }
    }

    std::map<std::string, int> by_state;
    for (const auto& record : runs) {
        std::lock_guard<std::mutex> lock(record->mutex);
        by_state[::to_string(record->state)]++;
    }
    return json{{"total", runs.size()}, {"by_state", by_state}};
}
