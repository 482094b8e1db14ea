#include "run/run_state.h"

#include <map>

namespace {

const std::map<RunState, std::string>& run_state_names() {
    static const std::map<RunState, std::string> names = {
        {RunState::Initial, "initial"},
        {RunState::RequirementsProcessing, "requirements_processing"},
        {RunState::RequirementsWaitingApproval, "requirements_waiting_approval"},
        {RunState::RequirementsApproved, "requirements_approved"},
        {RunState::RequirementsRejected, "requirements_rejected"},
        {RunState::DesignProcessing, "design_processing"},
        {RunState::DesignWaitingApproval, "design_waiting_approval"},
        {RunState::DesignApproved, "design_approved"},
        {RunState::DesignRejected, "design_rejected"},
        {RunState::ValidationProcessing, "validation_processing"},
        {RunState::ValidationPassed, "validation_passed"},
        {RunState::ValidationFailed, "validation_failed"},
        {RunState::ExecutionProcessing, "execution_processing"},
        {RunState::ExecutionCompleted, "execution_completed"},
        {RunState::ExecutionFailed, "execution_failed"},
        {RunState::Cancelled, "cancelled"}
    };
    return names;
}

template<typename E>
std::optional<E> reverse_lookup(const std::map<E, std::string>& names, const std::string& name) {
    for (const auto& [value, n] : names) {
        if (n == name) {
            return value;
        }
    }
    return std::nullopt;
}

const std::map<Stage, std::string> stage_names = {
    {Stage::Requirements, "requirements"},
    {Stage::Design, "design"},
    {Stage::Validation, "validation"},
    {Stage::Execution, "execution"}
};

const std::map<StageStatus, std::string> status_names = {
    {StageStatus::Success, "success"},
    {StageStatus::Failed, "failed"},
    {StageStatus::Incomplete, "incomplete"},
    {StageStatus::Impossible, "impossible"}
};

const std::map<ApprovalKind, std::string> approval_names = {
    {ApprovalKind::StartDesign, "start_design"},
    {ApprovalKind::ExecutePlan, "execute_plan"}
};

} // namespace

std::string to_string(RunState state) {
    return run_state_names().at(state);
}

std::string to_string(Stage stage) {
    return stage_names.at(stage);
}

std::string to_string(StageStatus status) {
    return status_names.at(status);
}

std::string to_string(ApprovalKind kind) {
    return approval_names.at(kind);
}

std::optional<RunState> parse_run_state(const std::string& name) {
    return reverse_lookup(run_state_names(), name);
}

std::optional<Stage> parse_stage(const std::string& name) {
    return reverse_lookup(stage_names, name);
}

std::optional<StageStatus> parse_stage_status(const std::string& name) {
    return reverse_lookup(status_names, name);
}

std::optional<ApprovalKind> parse_approval_kind(const std::string& name) {
    return reverse_lookup(approval_names, name);
}

bool is_terminal(RunState state) {
    switch (state) {
        case RunState::RequirementsRejected:
        case RunState::DesignRejected:
        case RunState::ExecutionCompleted:
        case RunState::ExecutionFailed:
        case RunState::Cancelled:
            return true;
        default:
            return false;
    }
}

bool can_transition(RunState from, RunState to) {
    if (is_terminal(from)) {
        return false;
    }
    if (to == RunState::Cancelled) {
        return true;
    }

    switch (from) {
        case RunState::Initial:
            return to == RunState::RequirementsProcessing;
        case RunState::RequirementsProcessing:
            return to == RunState::RequirementsWaitingApproval ||
                   to == RunState::RequirementsRejected;
        case RunState::RequirementsWaitingApproval:
            return to == RunState::RequirementsApproved ||
                   to == RunState::RequirementsRejected;
        case RunState::RequirementsApproved:
            return to == RunState::DesignProcessing ||
                   to == RunState::DesignRejected;
        case RunState::DesignProcessing:
            return to == RunState::DesignWaitingApproval ||
                   to == RunState::DesignRejected ||
                   to == RunState::DesignProcessing;
        case RunState::DesignWaitingApproval:
            return to == RunState::DesignApproved ||
                   to == RunState::DesignRejected;
        case RunState::DesignApproved:
            return to == RunState::ValidationProcessing ||
                   to == RunState::DesignRejected;
        case RunState::ValidationProcessing:
            return to == RunState::ValidationPassed ||
                   to == RunState::ValidationFailed;
        case RunState::ValidationFailed:
            return to == RunState::DesignProcessing ||
                   to == RunState::DesignRejected;
        case RunState::ValidationPassed:
            return to == RunState::ExecutionProcessing;
        case RunState::ExecutionProcessing:
            return to == RunState::ExecutionCompleted ||
                   to == RunState::ExecutionFailed;
        default:
            return false;
    }
}

RunState processing_state(Stage stage) {
    switch (stage) {
        case Stage::Requirements: return RunState::RequirementsProcessing;
        case Stage::Design:       return RunState::DesignProcessing;
        case Stage::Validation:   return RunState::ValidationProcessing;
        case Stage::Execution:    return RunState::ExecutionProcessing;
    }
    return RunState::Initial;
}
