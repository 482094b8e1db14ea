#pragma once

#include <string>
#include <set>
#include <optional>
#include <nlohmann/json.hpp>

#include "run/run_state.h"
#include "run/run_registry.h"
#include "run/protocol.h"

class WorkerSupervisor;
class EventBroadcaster;
class SandboxFilesystem;

/// @brief Drives runs through the pipeline
/// Every public operation locks the run for its whole duration, so reports,
/// approvals and cancellations for one run apply one at a time in arrival
/// order. Different runs proceed independently.
///
/// Flow: requirements -> [start_design gate] -> design -> [execute_plan gate]
/// -> validation -> execution (only when an execution command is configured).
/// An incomplete design or a failed validation re-runs design with
/// accumulated feedback until max_retries is exhausted.
class Orchestrator {
public:
    struct Options {
        int max_retries = 3;
        std::string input_dir = "temp";
        std::string context_file = "temp/{run_id}_context.yml";
        std::set<ApprovalKind> gates{ApprovalKind::StartDesign, ApprovalKind::ExecutePlan};
    };

    Orchestrator(Options options,
                 RunRegistry& registry,
                 WorkerSupervisor& supervisor,
                 EventBroadcaster& broadcaster,
                 SandboxFilesystem& sandbox);
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    /// @brief Store the input document and launch requirements analysis
    /// A run whose input cannot be stored is discarded before the error
    /// propagates.
    /// @return new run id
    std::string submit(const std::string& document);

    /// @brief Worker completion report (/agent/{id}/task_complete)
    /// Reports for a run that already ended are ignored.
    /// @throws UnknownRunError, InvalidStateError if the stage is not running
    void report_stage_outcome(const std::string& run_id, const TaskReport& report);

    /// @brief Validation verdict (/agent/{id}/validation_result)
    void report_validation(const std::string& run_id, const ValidationReport& report);

    /// @brief Resolve the run's open approval gate
    /// @throws InvalidStateError if no gate is open (or a different one is)
    /// @return state after the decision has been applied
    RunState approve(const std::string& run_id, const ApprovalDecision& decision);

    /// @brief Mark the run Cancelled; running workers are left alone
    RunState cancel(const std::string& run_id);

    /// @brief A tracked worker process exited (called by the supervisor)
    /// A non-zero exit while its stage is still processing fails the stage.
    /// Exits after the worker reported, or of finished runs, are ignored.
    void worker_exited(const std::string& run_id, Stage stage, int exit_code);

    /// @brief Forward a worker progress message to the run's subscriber
    void relay(const std::string& run_id, const BroadcastMessage& message);

    nlohmann::json get_run(const std::string& run_id) const;
    RunState state(const std::string& run_id) const;

    /// @brief Sandbox-relative path of the run's context document
    std::string context_path(const std::string& run_id) const;

private:
    void transition(RunRecord& run, RunState to, const std::string& reason = "");
    void publish(const RunRecord& run, const std::string& type, nlohmann::json data);

    void start_stage(RunRecord& run, Stage stage, const std::optional<std::string>& feedback = std::nullopt);
    void fail_stage(RunRecord& run, Stage stage, const std::string& reason);
    void open_gate(RunRecord& run, ApprovalKind kind, nlohmann::json details);
    void apply_decision(RunRecord& run, ApprovalKind kind, bool approved,
                        const std::string& user_response, bool automatic);
    void retry_design(RunRecord& run, const std::string& reason);
    void validation_passed(RunRecord& run);
    void finish(RunRecord& run);

    bool is_finished(const RunRecord& run) const;

    Options options_;
    RunRegistry& registry_;
    WorkerSupervisor& supervisor_;
    EventBroadcaster& broadcaster_;
    SandboxFilesystem& sandbox_;
};
