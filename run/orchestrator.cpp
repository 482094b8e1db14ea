#include "dirgen.h"
#include "run/orchestrator.h"
#include "workers/supervisor.h"
#include "events/broadcaster.h"
#include "sandbox/sandbox_fs.h"

using json = nlohmann::json;

namespace {

const char* const SOURCE = "Orchestrator";

std::string substitute_run_id(std::string pattern, const std::string& run_id) {
    const std::string token = "{run_id}";
    size_t pos;
    while ((pos = pattern.find(token)) != std::string::npos) {
        pattern.replace(pos, token.length(), run_id);
    }
    return pattern;
}

std::string join_reasons(const std::vector<std::string>& reasons, size_t count) {
    std::string joined;
    for (size_t i = 0; i < count && i < reasons.size(); i++) {
        if (i > 0) joined += "; ";
        joined += reasons[i];
    }
    return joined;
}

} // namespace

Orchestrator::Orchestrator(Options options,
                           RunRegistry& registry,
                           WorkerSupervisor& supervisor,
                           EventBroadcaster& broadcaster,
                           SandboxFilesystem& sandbox)
    : options_(std::move(options)),
      registry_(registry),
      supervisor_(supervisor),
      broadcaster_(broadcaster),
      sandbox_(sandbox) {
    supervisor_.set_exit_handler([this](const WorkerInvocation& worker, int exit_code) {
        worker_exited(worker.run_id, worker.stage, exit_code);
    });
}

Orchestrator::~Orchestrator() {
    supervisor_.set_exit_handler(nullptr);
}

// ---------------------------------------------------------------------------
// Helpers (run mutex held)
// ---------------------------------------------------------------------------

void Orchestrator::publish(const RunRecord& run, const std::string& type, json data) {
    BroadcastMessage message;
    message.source = SOURCE;
    message.type = type;
    message.data = std::move(data);
    broadcaster_.publish(run.id, message);
}

void Orchestrator::transition(RunRecord& run, RunState to, const std::string& reason) {
    RunState from = run.state;
    if (!can_transition(from, to)) {
        throw InvalidStateError("Run " + run.id + " cannot move from " + to_string(from) + " to " + to_string(to));
    }

    run.state = to;
    run.updated_at = RunRecord::Clock::now();
    if (!reason.empty()) {
        run.metadata["message"] = reason;
    }

    std::string line = "Run " + run.id + ": " + to_string(from) + " -> " + to_string(to);
    if (!reason.empty()) {
        line += " (" + reason + ")";
    }
    LOG_INFO(line);

    json data = {{"from", to_string(from)}, {"to", to_string(to)}};
    if (!reason.empty()) {
        data["reason"] = reason;
    }
    publish(run, "state_change", data);
}

bool Orchestrator::is_finished(const RunRecord& run) const {
    if (is_terminal(run.state)) {
        return true;
    }
    return run.state == RunState::ValidationPassed && !supervisor_.has_stage(Stage::Execution);
}

void Orchestrator::finish(RunRecord& run) {
    run.gate.reset();
    supervisor_.forget_run(run.id);
    LOG_INFO("Run " + run.id + " finished in state " + to_string(run.state));
}

void Orchestrator::start_stage(RunRecord& run, Stage stage, const std::optional<std::string>& feedback) {
    std::string input = stage == Stage::Requirements ? run.input_path : run.context_path;

    if (stage != Stage::Requirements && !sandbox_.exists(input)) {
        fail_stage(run, stage, "Context document not found at " + input);
        return;
    }

    try {
        WorkerInvocation worker = supervisor_.launch(run.id, stage, input, feedback);
        json data = {{"stage", to_string(stage)}, {"pid", worker.pid}, {"input_path", input}};
        if (feedback) {
            data["feedback"] = *feedback;
        }
        publish(run, "stage_start", data);
    } catch (const ProcessLaunchError& e) {
        LOG_ERROR("Run " + run.id + ": could not launch " + to_string(stage) + " worker: " + e.what());
        fail_stage(run, stage, std::string("Worker launch failed: ") + e.what());
    }
}

void Orchestrator::fail_stage(RunRecord& run, Stage stage, const std::string& reason) {
    run.metadata["last_error"] = reason;
    publish(run, "stage_end", {{"stage", to_string(stage)}, {"status", "rejected"}, {"reason", reason}});

    switch (stage) {
        case Stage::Requirements:
            transition(run, RunState::RequirementsRejected, reason);
            break;
        case Stage::Design:
            run.retry.reset();
            transition(run, RunState::DesignRejected, reason);
            break;
        case Stage::Validation:
            run.retry.reset();
            if (run.state == RunState::ValidationProcessing) {
                transition(run, RunState::ValidationFailed, reason);
            }
            transition(run, RunState::DesignRejected, reason);
            break;
        case Stage::Execution:
            transition(run, RunState::ExecutionFailed, reason);
            break;
    }
    finish(run);
}

void Orchestrator::open_gate(RunRecord& run, ApprovalKind kind, json details) {
    run.gate = kind;

    if (!options_.gates.count(kind)) {
        apply_decision(run, kind, true, "", true);
        return;
    }

    details["gate"] = to_string(kind);
    details["status"] = "awaiting_approval";
    publish(run, "approval_request", details);
    LOG_INFO("Run " + run.id + " waiting for approval (" + to_string(kind) + ")");
}

void Orchestrator::apply_decision(RunRecord& run, ApprovalKind kind, bool approved,
                                  const std::string& user_response, bool automatic) {
    run.gate.reset();

    json data = {{"gate", to_string(kind)}, {"user_response", user_response}};
    if (automatic) {
        data["auto"] = true;
    }

    if (!approved) {
        std::string reason = (kind == ApprovalKind::StartDesign ? "Design phase rejected by user"
                                                                : "Execution plan rejected by user");
        if (!user_response.empty()) {
            reason += ": " + user_response;
        }
        publish(run, "approval_rejected", data);
        run.retry.reset();
        transition(run, kind == ApprovalKind::StartDesign ? RunState::RequirementsRejected
                                                          : RunState::DesignRejected, reason);
        finish(run);
        return;
    }

    publish(run, "approval_granted", data);
    if (kind == ApprovalKind::StartDesign) {
        transition(run, RunState::RequirementsApproved, automatic ? "approved automatically" : "approved");
        transition(run, RunState::DesignProcessing);
        start_stage(run, Stage::Design);
    } else {
        transition(run, RunState::DesignApproved, automatic ? "approved automatically" : "approved");
        transition(run, RunState::ValidationProcessing);
        start_stage(run, Stage::Validation);
    }
}

void Orchestrator::retry_design(RunRecord& run, const std::string& reason) {
    if (!run.retry) {
        run.retry.emplace();
    }
    RetryRecord& retry = *run.retry;
    retry.count++;
    retry.history.push_back(reason);
    run.metadata["last_error"] = reason;

    LOG_INFO("Run " + run.id + ": design attempt failed (" + std::to_string(retry.count) + "/" +
             std::to_string(options_.max_retries) + "): " + reason);

    if (retry.count > options_.max_retries) {
        std::string summary = "Exhausted " + std::to_string(options_.max_retries) +
                              " retries. Last error: " + reason;
        run.retry.reset();
        publish(run, "stage_end", {{"stage", to_string(Stage::Design)}, {"status", "rejected"}, {"reason", summary}});
        transition(run, RunState::DesignRejected, summary);
        finish(run);
        return;
    }

    std::string feedback = "Attempt " + std::to_string(retry.count) + "/" +
                           std::to_string(options_.max_retries) + ". Error: " + reason;
    if (retry.history.size() > 1) {
        feedback += " Previous errors: " + join_reasons(retry.history, retry.history.size() - 1);
    }

    publish(run, "retry_attempt", {
        {"attempt", retry.count},
        {"max_attempts", options_.max_retries},
        {"feedback", feedback}
    });
    transition(run, RunState::DesignProcessing, "retry " + std::to_string(retry.count));
    start_stage(run, Stage::Design, feedback);
}

void Orchestrator::validation_passed(RunRecord& run) {
    run.retry.reset();
    publish(run, "stage_end", {{"stage", to_string(Stage::Validation)}, {"status", "approved"}});
    transition(run, RunState::ValidationPassed);

    if (supervisor_.has_stage(Stage::Execution)) {
        transition(run, RunState::ExecutionProcessing);
        start_stage(run, Stage::Execution);
    } else {
        finish(run);
    }
}

// ---------------------------------------------------------------------------
// Public operations
// ---------------------------------------------------------------------------

std::string Orchestrator::submit(const std::string& document) {
    auto run = registry_.create();
    std::lock_guard<std::mutex> lock(run->mutex);

    run->input_path = options_.input_dir + "/" + run->id + "_input.md";
    run->context_path = substitute_run_id(options_.context_file, run->id);
    try {
        sandbox_.write(run->input_path, document);
    } catch (const std::exception& e) {
        LOG_ERROR("Could not store input for run " + run->id + ": " + e.what());
        registry_.remove(run->id);
        throw;
    }

    LOG_INFO("Run " + run->id + " created (" + std::to_string(document.size()) + " byte input)");
    transition(*run, RunState::RequirementsProcessing, "input received");
    start_stage(*run, Stage::Requirements);
    return run->id;
}

void Orchestrator::report_stage_outcome(const std::string& run_id, const TaskReport& report) {
    if (report.stage == Stage::Validation) {
        ValidationReport verdict;
        verdict.success = report.status == StageStatus::Success;
        verdict.message = report.reason.empty() ? report.summary : report.reason;
        verdict.raw = {{"success", verdict.success}, {"message", verdict.message}};
        report_validation(run_id, verdict);
        return;
    }

    auto run = registry_.find(run_id);
    std::lock_guard<std::mutex> lock(run->mutex);

    if (is_finished(*run)) {
        LOG_INFO("Ignoring " + to_string(report.stage) + " report for finished run " + run_id +
                 " (" + to_string(run->state) + ")");
        return;
    }
    if (run->state != processing_state(report.stage)) {
        throw InvalidStateError("Run " + run_id + " is " + to_string(run->state) + ", not processing " +
                                to_string(report.stage));
    }

    dprintf(1, "Run %s: %s reported %s", run_id.c_str(), to_string(report.stage).c_str(),
            to_string(report.status).c_str());

    if (report.status == StageStatus::Success && !report.summary.empty()) {
        publish(*run, "executive_summary", {{"summary", report.summary}, {"agent_role", to_string(report.stage)}});
    }

    switch (report.stage) {
        case Stage::Requirements:
            if (report.status == StageStatus::Success) {
                publish(*run, "stage_end", {{"stage", "requirements"}, {"status", "approved"}});
                transition(*run, RunState::RequirementsWaitingApproval, "requirements analysed");
                open_gate(*run, ApprovalKind::StartDesign, {
                    {"message", "Context document generated. Start the design phase?"},
                    {"phase_completed", "requirements"},
                    {"phase_requested", "design"}
                });
            } else {
                fail_stage(*run, Stage::Requirements,
                           "Input document rejected: " + (report.reason.empty() ? to_string(report.status) : report.reason));
            }
            break;

        case Stage::Design:
            switch (report.status) {
                case StageStatus::Success: {
                    publish(*run, "stage_end", {{"stage", "design"}, {"status", "approved"}});
                    transition(*run, RunState::DesignWaitingApproval, "plan generated");
                    json details = {
                        {"message", "Execution plan generated. Proceed with the plan?"},
                        {"phase_completed", "design"},
                        {"phase_requested", "validation"}
                    };
                    if (report.extra.contains("tasks")) {
                        details["tasks"] = report.extra["tasks"];
                    }
                    open_gate(*run, ApprovalKind::ExecutePlan, details);
                    break;
                }
                case StageStatus::Impossible:
                    fail_stage(*run, Stage::Design, "Agent declared the task impossible: " +
                               (report.reason.empty() ? std::string("no reason given") : report.reason));
                    break;
                case StageStatus::Failed:
                    fail_stage(*run, Stage::Design, "Verification failed: " +
                               (report.reason.empty() ? std::string("no reason given") : report.reason));
                    break;
                case StageStatus::Incomplete:
                    retry_design(*run, report.reason.empty() ? "Task incomplete" : report.reason);
                    break;
            }
            break;

        case Stage::Execution:
            if (report.status == StageStatus::Success) {
                publish(*run, "stage_end", {{"stage", "execution"}, {"status", "approved"}});
                transition(*run, RunState::ExecutionCompleted, "plan executed");
                finish(*run);
            } else {
                fail_stage(*run, Stage::Execution,
                           report.reason.empty() ? "Execution " + to_string(report.status) : report.reason);
            }
            break;

        case Stage::Validation:
            break;
    }
}

void Orchestrator::report_validation(const std::string& run_id, const ValidationReport& report) {
    auto run = registry_.find(run_id);
    std::lock_guard<std::mutex> lock(run->mutex);

    if (is_finished(*run)) {
        LOG_INFO("Ignoring validation result for finished run " + run_id + " (" + to_string(run->state) + ")");
        return;
    }
    if (run->state != RunState::ValidationProcessing) {
        throw InvalidStateError("Run " + run_id + " is " + to_string(run->state) + ", not processing validation");
    }

    publish(*run, "validation_result", {{"success", report.success}, {"message", report.message}});
    publish(*run, "quality_gate_result", report.raw);

    if (report.success) {
        validation_passed(*run);
        return;
    }

    std::string reason = report.message.empty() ? "Unknown validation error" : report.message;
    transition(*run, RunState::ValidationFailed, reason);
    retry_design(*run, reason);
}

RunState Orchestrator::approve(const std::string& run_id, const ApprovalDecision& decision) {
    auto run = registry_.find(run_id);
    std::lock_guard<std::mutex> lock(run->mutex);

    if (!run->gate) {
        throw InvalidStateError("Run " + run_id + " is not waiting for approval (state " +
                                to_string(run->state) + ")");
    }
    if (decision.kind && *decision.kind != *run->gate) {
        throw InvalidStateError("Run " + run_id + " is waiting for " + to_string(*run->gate) +
                                ", not " + to_string(*decision.kind));
    }

    LOG_INFO("Run " + run_id + ": " + (decision.approved ? "approval" : "rejection") + " of " +
             to_string(*run->gate) + (decision.user_response.empty() ? "" : " ('" + decision.user_response + "')"));
    apply_decision(*run, *run->gate, decision.approved, decision.user_response, false);
    return run->state;
}

RunState Orchestrator::cancel(const std::string& run_id) {
    auto run = registry_.find(run_id);
    std::lock_guard<std::mutex> lock(run->mutex);

    if (is_finished(*run)) {
        dprintf(1, "Cancel of finished run %s ignored", run_id.c_str());
        return run->state;
    }

    run->retry.reset();
    transition(*run, RunState::Cancelled, "cancelled by user");
    finish(*run);
    return run->state;
}

void Orchestrator::worker_exited(const std::string& run_id, Stage stage, int exit_code) {
    if (!registry_.contains(run_id)) {
        return;
    }
    auto run = registry_.find(run_id);
    std::lock_guard<std::mutex> lock(run->mutex);

    if (is_finished(*run) || run->state != processing_state(stage)) {
        return;
    }
    if (exit_code == 0) {
        LOG_WARN("Run " + run_id + ": " + to_string(stage) + " worker exited without reporting");
        return;
    }

    fail_stage(*run, stage, to_string(stage) + " worker exited with code " +
               std::to_string(exit_code) + " before reporting");
}

void Orchestrator::relay(const std::string& run_id, const BroadcastMessage& message) {
    auto run = registry_.find(run_id);
    std::lock_guard<std::mutex> lock(run->mutex);

    if (run->state == RunState::Cancelled) {
        dprintf(2, "Dropping %s message for cancelled run %s", message.type.c_str(), run_id.c_str());
        return;
    }
    if (message.type == "error" && message.data.contains("message") && message.data["message"].is_string()) {
        run->metadata["last_error"] = message.data["message"].get<std::string>();
    }
    broadcaster_.publish(run_id, message);
}

json Orchestrator::get_run(const std::string& run_id) const {
    auto run = registry_.find(run_id);
    std::lock_guard<std::mutex> lock(run->mutex);
    json j = run->to_json();
    j["finished"] = is_finished(*run);
    j["active_workers"] = json::array();
    for (Stage stage : {Stage::Requirements, Stage::Design, Stage::Validation, Stage::Execution}) {
        auto worker = supervisor_.find(run_id, stage);
        if (worker) {
            j["active_workers"].push_back(worker->to_json());
        }
    }
    return j;
}

RunState Orchestrator::state(const std::string& run_id) const {
    auto run = registry_.find(run_id);
    std::lock_guard<std::mutex> lock(run->mutex);
    return run->state;
}

std::string Orchestrator::context_path(const std::string& run_id) const {
    auto run = registry_.find(run_id);
    std::lock_guard<std::mutex> lock(run->mutex);
    return run->context_path;
}
