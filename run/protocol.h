#pragma once

#include <string>
#include <optional>
#include <stdexcept>
#include <nlohmann/json.hpp>

#include "run/run_state.h"

/// @brief Raised when a worker or client body does not match the wire contract
class StructuralProtocolError : public std::runtime_error {
public:
    explicit StructuralProtocolError(const std::string& message) : std::runtime_error(message) {}
};

/// @brief {source, type, data} envelope carried on the event stream
struct BroadcastMessage {
    std::string source;
    std::string type;
    nlohmann::json data = nlohmann::json::object();

    nlohmann::json to_json() const;
    static BroadcastMessage from_json(const nlohmann::json& j);
};

/// @brief Completion report posted by a worker to /agent/{id}/task_complete
struct TaskReport {
    Stage stage = Stage::Requirements;
    StageStatus status = StageStatus::Success;
    std::string reason;
    std::string summary;
    nlohmann::json extra = nlohmann::json::object();  // e.g. planner "tasks"
};

/// @brief Body of /agent/{id}/validation_result
struct ValidationReport {
    bool success = false;
    std::string message;
    nlohmann::json raw = nlohmann::json::object();
};

/// @brief Body of /run/{id}/approve
struct ApprovalDecision {
    bool approved = false;
    std::string user_response;
    std::optional<ApprovalKind> kind;  // optional guard against approving the wrong gate
};

namespace protocol {

/// @brief Validate a report envelope; source and type must be non-empty
/// strings and data must be an object
void validate_envelope(const nlohmann::json& body);

/// @brief Map a worker role name to its stage
/// Accepts both stage names and the historical agent role names
/// ("planner", "validator", "executor").
std::optional<Stage> stage_for_role(const std::string& role);

TaskReport parse_task_complete(const nlohmann::json& body);
ValidationReport parse_validation_result(const nlohmann::json& body);
ApprovalDecision parse_approval(const nlohmann::json& body);

/// @brief Parse a raw HTTP body as a JSON object
nlohmann::json parse_body(const std::string& body);

} // namespace protocol
