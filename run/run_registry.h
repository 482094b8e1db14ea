#pragma once

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>
#include <chrono>
#include <optional>
#include <stdexcept>
#include <nlohmann/json.hpp>

#include "run/run_state.h"

/// @brief Raised for a run id the registry has never issued
class UnknownRunError : public std::runtime_error {
public:
    explicit UnknownRunError(const std::string& run_id)
        : std::runtime_error("Unknown run: " + run_id) {}
};

/// @brief Bounded-retry bookkeeping for the design stage
struct RetryRecord {
    int count = 0;
    std::vector<std::string> history;  // failure reasons, oldest first
};

/// @brief Everything known about one run
/// Fields are only touched with mutex held; the orchestrator holds it for
/// the whole of each operation, which serializes work on the run.
struct RunRecord {
    using Clock = std::chrono::system_clock;

    std::string id;
    RunState state = RunState::Initial;
    Clock::time_point created_at;
    Clock::time_point updated_at;
    std::optional<RetryRecord> retry;
    std::optional<ApprovalKind> gate;
    std::map<std::string, std::string> metadata;  // "message", "last_error"
    std::string input_path;    // sandbox-relative
    std::string context_path;  // sandbox-relative

    std::mutex mutex;

    /// @brief Snapshot for GET /run/{id}; caller holds mutex
    nlohmann::json to_json() const;
};

/// @brief Owner of every run for the lifetime of the process
class RunRegistry {
public:
    RunRegistry() = default;

    RunRegistry(const RunRegistry&) = delete;
    RunRegistry& operator=(const RunRegistry&) = delete;

    /// @brief New run in Initial with a fresh "run-<uuid>" id
    std::shared_ptr<RunRecord> create();

    /// @throws UnknownRunError
    std::shared_ptr<RunRecord> find(const std::string& run_id) const;

    bool contains(const std::string& run_id) const;

    /// @brief Forget a run that never started
    void remove(const std::string& run_id);
    size_t size() const;

    /// @brief Number of runs per state
    nlohmann::json summary() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<RunRecord>> runs_;
};
