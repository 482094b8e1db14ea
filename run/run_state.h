#pragma once

#include <string>
#include <optional>
#include <stdexcept>

/// @brief Lifecycle of one pipeline run
/// Transitions only move forward along the graph in can_transition(), with
/// two exceptions: DesignProcessing may re-enter itself (incomplete retry)
/// and ValidationFailed may return to DesignProcessing (validation retry).
enum class RunState {
    Initial,
    RequirementsProcessing,
    RequirementsWaitingApproval,
    RequirementsApproved,
    RequirementsRejected,
    DesignProcessing,
    DesignWaitingApproval,
    DesignApproved,
    DesignRejected,
    ValidationProcessing,
    ValidationPassed,
    ValidationFailed,
    ExecutionProcessing,
    ExecutionCompleted,
    ExecutionFailed,
    Cancelled
};

enum class Stage {
    Requirements,
    Design,
    Validation,
    Execution
};

enum class StageStatus {
    Success,
    Failed,
    Incomplete,
    Impossible
};

/// @brief The two human approval points of the pipeline
enum class ApprovalKind {
    StartDesign,   // after requirements
    ExecutePlan    // after design
};

/// @brief Raised when an operation does not match the run's current state
class InvalidStateError : public std::runtime_error {
public:
    explicit InvalidStateError(const std::string& message) : std::runtime_error(message) {}
};

std::string to_string(RunState state);
std::string to_string(Stage stage);
std::string to_string(StageStatus status);
std::string to_string(ApprovalKind kind);

std::optional<RunState> parse_run_state(const std::string& name);
std::optional<Stage> parse_stage(const std::string& name);
std::optional<StageStatus> parse_stage_status(const std::string& name);
std::optional<ApprovalKind> parse_approval_kind(const std::string& name);

/// @brief True if the edge from -> to exists in the run graph
bool can_transition(RunState from, RunState to);

/// @brief True for states with no outgoing edges
/// ValidationPassed is not terminal here; the orchestrator decides whether a
/// run ends there based on whether an execution stage is configured.
bool is_terminal(RunState state);

/// @brief The state a stage's worker runs in
RunState processing_state(Stage stage);
