#include "run/protocol.h"

using json = nlohmann::json;

json BroadcastMessage::to_json() const {
    return json{{"source", source}, {"type", type}, {"data", data}};
}

BroadcastMessage BroadcastMessage::from_json(const json& j) {
    protocol::validate_envelope(j);
    BroadcastMessage msg;
    msg.source = j["source"].get<std::string>();
    msg.type = j["type"].get<std::string>();
    msg.data = j["data"];
    return msg;
}

namespace protocol {

namespace {

bool is_blank(const std::string& s) {
    return s.find_first_not_of(" \t\r\n") == std::string::npos;
}

std::string optional_string(const json& body, const char* key) {
    if (!body.contains(key) || body[key].is_null()) {
        return "";
    }
    if (!body[key].is_string()) {
        throw StructuralProtocolError(std::string("Field '") + key + "' must be a string");
    }
    return body[key].get<std::string>();
}

} // namespace

json parse_body(const std::string& body) {
    if (body.empty()) {
        throw StructuralProtocolError("Request body is empty");
    }
    json parsed = json::parse(body, nullptr, false);
    if (parsed.is_discarded()) {
        throw StructuralProtocolError("Request body is not valid JSON");
    }
    if (!parsed.is_object()) {
        throw StructuralProtocolError("Request body must be a JSON object");
    }
    return parsed;
}

void validate_envelope(const json& body) {
    if (!body.is_object()) {
        throw StructuralProtocolError("Message must be a JSON object");
    }
    for (const char* key : {"source", "type", "data"}) {
        if (!body.contains(key)) {
            throw StructuralProtocolError("Message must include: source, type, data");
        }
    }
    if (!body["data"].is_object()) {
        throw StructuralProtocolError("Field 'data' must be a JSON object");
    }
    if (!body["source"].is_string() || is_blank(body["source"].get<std::string>())) {
        throw StructuralProtocolError("Field 'source' must be a non-empty string");
    }
    if (!body["type"].is_string() || is_blank(body["type"].get<std::string>())) {
        throw StructuralProtocolError("Field 'type' must be a non-empty string");
    }
}

std::optional<Stage> stage_for_role(const std::string& role) {
    if (role == "planner") return Stage::Design;
    if (role == "validator") return Stage::Validation;
    if (role == "executor") return Stage::Execution;
    return parse_stage(role);
}

TaskReport parse_task_complete(const json& body) {
    if (!body.is_object()) {
        throw StructuralProtocolError("Task report must be a JSON object");
    }
    if (!body.contains("role") || !body["role"].is_string()) {
        throw StructuralProtocolError("Task report must include a string 'role'");
    }

    TaskReport report;
    std::string role = body["role"].get<std::string>();
    auto stage = stage_for_role(role);
    if (!stage) {
        throw StructuralProtocolError("Unknown worker role: " + role);
    }
    report.stage = *stage;

    // Workers that omit status are reporting success
    std::string status = optional_string(body, "status");
    if (!status.empty()) {
        auto parsed = parse_stage_status(status);
        if (!parsed) {
            throw StructuralProtocolError("Unknown task status: " + status);
        }
        report.status = *parsed;
    }

    report.reason = optional_string(body, "reason");
    report.summary = optional_string(body, "summary");
    if (body.contains("tasks")) {
        report.extra["tasks"] = body["tasks"];
    }
    return report;
}

ValidationReport parse_validation_result(const json& body) {
    if (!body.is_object()) {
        throw StructuralProtocolError("Validation result must be a JSON object");
    }
    if (!body.contains("success") || !body["success"].is_boolean()) {
        throw StructuralProtocolError("Validation result must include a boolean 'success'");
    }
    ValidationReport result;
    result.success = body["success"].get<bool>();
    result.message = optional_string(body, "message");
    result.raw = body;
    return result;
}

ApprovalDecision parse_approval(const json& body) {
    if (!body.is_object()) {
        throw StructuralProtocolError("Approval must be a JSON object");
    }
    if (!body.contains("approved") || !body["approved"].is_boolean()) {
        throw StructuralProtocolError("Approval must include a boolean 'approved'");
    }
    ApprovalDecision decision;
    decision.approved = body["approved"].get<bool>();
    decision.user_response = optional_string(body, "userResponse");
    if (decision.user_response.empty()) {
        decision.user_response = optional_string(body, "user_response");
    }
    std::string kind = optional_string(body, "gate");
    if (!kind.empty()) {
        decision.kind = parse_approval_kind(kind);
        if (!decision.kind) {
            throw StructuralProtocolError("Unknown approval gate: " + kind);
        }
    }
    return decision;
}

} // namespace protocol
