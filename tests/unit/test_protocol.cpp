#include <gtest/gtest.h>
#include "run/protocol.h"

using json = nlohmann::json;

// =============================================================================
// Envelope validation
// =============================================================================

TEST(ProtocolTest, ValidEnvelope) {
    json body = {{"source", "planner"}, {"type", "progress"}, {"data", {{"step", 2}}}};
    EXPECT_NO_THROW(protocol::validate_envelope(body));

    BroadcastMessage msg = BroadcastMessage::from_json(body);
    EXPECT_EQ(msg.source, "planner");
    EXPECT_EQ(msg.type, "progress");
    EXPECT_EQ(msg.data["step"], 2);
    EXPECT_EQ(msg.to_json(), body);
}

TEST(ProtocolTest, EnvelopeMissingField) {
    json body = {{"source", "planner"}, {"data", json::object()}};
    EXPECT_THROW(protocol::validate_envelope(body), StructuralProtocolError);
}

TEST(ProtocolTest, EnvelopeDataMustBeObject) {
    json body = {{"source", "planner"}, {"type", "progress"}, {"data", "text"}};
    EXPECT_THROW(protocol::validate_envelope(body), StructuralProtocolError);
}

TEST(ProtocolTest, EnvelopeBlankSource) {
    json body = {{"source", "  "}, {"type", "progress"}, {"data", json::object()}};
    EXPECT_THROW(protocol::validate_envelope(body), StructuralProtocolError);

    body["source"] = 7;
    EXPECT_THROW(protocol::validate_envelope(body), StructuralProtocolError);
}

// =============================================================================
// Task reports
// =============================================================================

TEST(ProtocolTest, RoleNamesMapToStages) {
    EXPECT_EQ(protocol::stage_for_role("planner").value(), Stage::Design);
    EXPECT_EQ(protocol::stage_for_role("validator").value(), Stage::Validation);
    EXPECT_EQ(protocol::stage_for_role("executor").value(), Stage::Execution);
    EXPECT_EQ(protocol::stage_for_role("requirements").value(), Stage::Requirements);
    EXPECT_FALSE(protocol::stage_for_role("reviewer").has_value());
}

TEST(ProtocolTest, TaskReportDefaultsToSuccess) {
    TaskReport report = protocol::parse_task_complete({{"role", "requirements"}});
    EXPECT_EQ(report.stage, Stage::Requirements);
    EXPECT_EQ(report.status, StageStatus::Success);
    EXPECT_TRUE(report.reason.empty());
}

TEST(ProtocolTest, TaskReportCarriesReasonAndTasks) {
    json body = {
        {"role", "planner"},
        {"status", "incomplete"},
        {"reason", "missing module list"},
        {"tasks", json::array({"a", "b"})}
    };
    TaskReport report = protocol::parse_task_complete(body);
    EXPECT_EQ(report.stage, Stage::Design);
    EXPECT_EQ(report.status, StageStatus::Incomplete);
    EXPECT_EQ(report.reason, "missing module list");
    EXPECT_EQ(report.extra["tasks"].size(), 2u);
}

TEST(ProtocolTest, TaskReportRejectsBadFields) {
    EXPECT_THROW(protocol::parse_task_complete({{"status", "success"}}), StructuralProtocolError);
    EXPECT_THROW(protocol::parse_task_complete({{"role", "reviewer"}}), StructuralProtocolError);
    EXPECT_THROW(protocol::parse_task_complete({{"role", "planner"}, {"status", "done"}}), StructuralProtocolError);
    EXPECT_THROW(protocol::parse_task_complete({{"role", "planner"}, {"reason", 3}}), StructuralProtocolError);
}

// =============================================================================
// Validation results and approvals
// =============================================================================

TEST(ProtocolTest, ValidationResultNeedsBooleanSuccess) {
    ValidationReport report = protocol::parse_validation_result({{"success", false}, {"message", "2 errors"}});
    EXPECT_FALSE(report.success);
    EXPECT_EQ(report.message, "2 errors");

    EXPECT_THROW(protocol::parse_validation_result({{"success", "yes"}}), StructuralProtocolError);
    EXPECT_THROW(protocol::parse_validation_result({{"message", "x"}}), StructuralProtocolError);
}

TEST(ProtocolTest, ApprovalAcceptsBothResponseSpellings) {
    ApprovalDecision a = protocol::parse_approval({{"approved", true}, {"userResponse", "go"}});
    EXPECT_TRUE(a.approved);
    EXPECT_EQ(a.user_response, "go");
    EXPECT_FALSE(a.kind.has_value());

    ApprovalDecision b = protocol::parse_approval({{"approved", false}, {"user_response", "no"}});
    EXPECT_FALSE(b.approved);
    EXPECT_EQ(b.user_response, "no");
}

TEST(ProtocolTest, ApprovalGateGuard) {
    ApprovalDecision d = protocol::parse_approval({{"approved", true}, {"gate", "execute_plan"}});
    ASSERT_TRUE(d.kind.has_value());
    EXPECT_EQ(*d.kind, ApprovalKind::ExecutePlan);

    EXPECT_THROW(protocol::parse_approval({{"approved", true}, {"gate", "deploy"}}), StructuralProtocolError);
    EXPECT_THROW(protocol::parse_approval({{"approved", "true"}}), StructuralProtocolError);
}

TEST(ProtocolTest, ParseBody) {
    EXPECT_EQ(protocol::parse_body(R"({"a":1})")["a"], 1);
    EXPECT_THROW(protocol::parse_body(""), StructuralProtocolError);
    EXPECT_THROW(protocol::parse_body("{not json"), StructuralProtocolError);
    EXPECT_THROW(protocol::parse_body("[1,2]"), StructuralProtocolError);
}
