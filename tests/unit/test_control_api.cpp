#include <gtest/gtest.h>
#include "server/control_api.h"
#include "run/orchestrator.h"
#include "run/run_registry.h"
#include "run/protocol.h"
#include "workers/supervisor.h"
#include "events/broadcaster.h"
#include "sandbox/sandbox_fs.h"
#include "llm/llm_provider.h"
#include "temp_dir.h"

#include <thread>
#include <functional>
#include <vector>
#include <chrono>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

using json = nlohmann::json;

namespace {

class NullSpawner : public ProcessSpawner {
public:
    int spawn(const std::vector<std::string>&,
              const std::map<std::string, std::string>&,
              const std::string&) override {
        return next_pid++;
    }

    std::optional<int> poll_exit(int) override { return std::nullopt; }

    int next_pid = 2000;
};

// Ask the kernel for an unused loopback port
int free_port() {
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        return -1;
    }
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    int port = -1;
    socklen_t len = sizeof(addr);
    if (bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0 &&
        getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0) {
        port = ntohs(addr.sin_port);
    }
    close(fd);
    return port;
}

} // namespace

// Exception to status mapping

TEST(HandleRequestTest, SuccessReturnsHandlerBody) {
    httplib::Response res;
    handle_request(res, []() { return json{{"status", "ok"}}; });
    EXPECT_EQ(res.status, -1);  // left for httplib to default to 200
    EXPECT_EQ(json::parse(res.body)["status"], "ok");
}

TEST(HandleRequestTest, ErrorsMapToStatusCodes) {
    struct Case {
        std::function<json()> handler;
        int status;
        std::string type;
    };
    std::vector<Case> cases = {
        {[]() -> json { throw StructuralProtocolError("bad envelope"); }, 400, "invalid_request_error"},
        {[]() -> json { return json::parse("{not json"); }, 400, "invalid_request_error"},
        {[]() -> json { throw UnknownRunError("run-x"); }, 404, "not_found_error"},
        {[]() -> json { throw InvalidStateError("not waiting for approval"); }, 409, "invalid_state_error"},
        {[]() -> json { throw SandboxViolation("Invalid or unsafe path: ../x"); }, 400, "invalid_request_error"},
        {[]() -> json { throw SandboxNotFound("File not found: x"); }, 404, "not_found_error"},
        {[]() -> json { throw ProviderExhaustedError("all providers failed"); }, 502, "provider_error"},
        {[]() -> json { throw std::runtime_error("boom"); }, 500, "server_error"},
    };

    for (const auto& c : cases) {
        httplib::Response res;
        handle_request(res, c.handler);
        EXPECT_EQ(res.status, c.status);
        json body = json::parse(res.body);
        EXPECT_EQ(body["error"]["type"], c.type);
        EXPECT_EQ(body["error"]["code"], c.status);
        EXPECT_FALSE(body["error"]["message"].get<std::string>().empty());
    }
}

TEST(HandleRequestTest, UnknownRunMessageNamesRun) {
    httplib::Response res;
    handle_request(res, []() -> json { throw UnknownRunError("run-42"); });
    EXPECT_EQ(json::parse(res.body)["error"]["message"], "Unknown run: run-42");
}

TEST(HandleToolRequestTest, FailuresAreReportedInBand) {
    std::vector<std::function<json()>> handlers = {
        []() -> json { throw SandboxViolation("Invalid or unsafe path: ../etc/passwd"); },
        []() -> json { throw SandboxNotFound("File not found: missing.txt"); },
        []() -> json { throw StructuralProtocolError("Field 'path' must be a string"); },
        []() -> json { throw std::runtime_error("Failed to write: x"); },
    };

    for (const auto& handler : handlers) {
        httplib::Response res;
        handle_tool_request(res, handler);
        EXPECT_EQ(res.status, -1);
        json body = json::parse(res.body);
        EXPECT_FALSE(body["success"].get<bool>());
        EXPECT_TRUE(body["error"].is_string());
    }
}

// Routes served by a listening ControlApi

class ControlApiTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(temp_dir.valid());
        sandbox = std::make_unique<SandboxFilesystem>(temp_dir.path());

        std::map<Stage, StageCommand> commands = {
            {Stage::Requirements, StageCommand{"req-agent", {}, "--svad-path"}},
            {Stage::Design, StageCommand{"plan-agent", {}, "--pcce-path"}},
            {Stage::Validation, StageCommand{"val-agent", {}, "--pcce-path"}}
        };
        WorkerSupervisor::Options options;
        options.working_dir = temp_dir.path();
        options.callback_url = "http://127.0.0.1:8000";
        supervisor = std::make_unique<WorkerSupervisor>(std::make_unique<NullSpawner>(), commands, options);

        Orchestrator::Options orch_options;
        orch_options.gates = {ApprovalKind::StartDesign, ApprovalKind::ExecutePlan};
        orchestrator = std::make_unique<Orchestrator>(orch_options, registry, *supervisor, broadcaster, *sandbox);

        ControlApi::Services services;
        services.orchestrator = orchestrator.get();
        services.registry = &registry;
        services.supervisor = supervisor.get();
        services.broadcaster = &broadcaster;
        services.sandbox = sandbox.get();

        port = free_port();
        ASSERT_GT(port, 0);
        api = std::make_unique<ControlApi>("127.0.0.1", port, services);
        api->set_control_socket_path(temp_dir.file_path("ctl.sock"));
        server_thread = std::thread([this]() { api->run(); });

        client = std::make_unique<httplib::Client>("127.0.0.1", port);
        client->set_connection_timeout(1);
        client->set_read_timeout(5);

        bool ready = false;
        for (int i = 0; i < 100 && !ready; i++) {
            auto res = client->Get("/health");
            ready = res && res->status == 200;
            if (!ready) {
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
            }
        }
        ASSERT_TRUE(ready) << "control API did not come up on port " << port;
    }

    void TearDown() override {
        if (api) {
            api->shutdown();
        }
        if (server_thread.joinable()) {
            server_thread.join();
        }
    }

    json post_json(const std::string& path, const json& body, int expected_status) {
        auto res = client->Post(path, body.dump(), "application/json");
        EXPECT_TRUE(res);
        if (!res) {
            return json();
        }
        EXPECT_EQ(res->status, expected_status) << path << ": " << res->body;
        return json::parse(res->body, nullptr, false);
    }

    std::string submit(const std::string& prefix = "") {
        auto res = client->Post(prefix + "/run/from-input", "# Build a web service", "text/markdown");
        EXPECT_TRUE(res);
        if (!res) {
            return "";
        }
        EXPECT_EQ(res->status, 200) << res->body;
        return json::parse(res->body)["run_id"].get<std::string>();
    }

    test_helpers::TempDir temp_dir;
    std::unique_ptr<SandboxFilesystem> sandbox;
    RunRegistry registry;
    EventBroadcaster broadcaster;
    std::unique_ptr<WorkerSupervisor> supervisor;
    std::unique_ptr<Orchestrator> orchestrator;
    std::unique_ptr<ControlApi> api;
    std::unique_ptr<httplib::Client> client;
    std::thread server_thread;
    int port = -1;
};

TEST_F(ControlApiTest, SubmitStartsRequirements) {
    std::string run_id = submit();
    ASSERT_FALSE(run_id.empty());

    auto res = client->Get("/run/" + run_id);
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    json run = json::parse(res->body);
    EXPECT_EQ(run["state"], "requirements_processing");
    EXPECT_FALSE(run["finished"].get<bool>());
}

TEST_F(ControlApiTest, EmptyUploadIsRejected) {
    auto res = client->Post("/run/from-input", "", "text/markdown");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);
    EXPECT_EQ(registry.size(), 0u);
}

TEST_F(ControlApiTest, UnknownRunIsNotFound) {
    auto res = client->Get("/run/no-such-run");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 404);
    json body = json::parse(res->body);
    EXPECT_EQ(body["error"]["type"], "not_found_error");

    post_json("/run/no-such-run/approve", {{"approved", true}}, 404);
    post_json("/agent/no-such-run/task_complete", {{"role", "requirements"}}, 404);
}

TEST_F(ControlApiTest, ApproveWithoutGateConflicts) {
    std::string run_id = submit();
    ASSERT_FALSE(run_id.empty());

    json body = post_json("/run/" + run_id + "/approve", {{"approved", true}}, 409);
    EXPECT_EQ(body["error"]["type"], "invalid_state_error");

    auto res = client->Get("/run/" + run_id);
    ASSERT_TRUE(res);
    EXPECT_EQ(json::parse(res->body)["state"], "requirements_processing");
}

TEST_F(ControlApiTest, MalformedApprovalIsRejected) {
    std::string run_id = submit();
    post_json("/run/" + run_id + "/approve", {{"approved", "yes"}}, 400);
}

TEST_F(ControlApiTest, MalformedAgentReportIsRejected) {
    std::string run_id = submit();
    ASSERT_FALSE(run_id.empty());

    // Envelope missing type and data
    post_json("/agent/" + run_id + "/report", {{"source", "requirements"}}, 400);

    auto res = client->Post("/agent/" + run_id + "/report", "{not json", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);

    res = client->Post("/agent/" + run_id + "/report", "[1, 2]", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);
}

TEST_F(ControlApiTest, WellFormedAgentReportIsRelayed) {
    std::string run_id = submit();
    auto sub = broadcaster.subscribe(run_id);

    json body = post_json("/agent/" + run_id + "/report",
                          {{"source", "requirements"}, {"type", "status"}, {"data", {{"message", "working"}}}},
                          200);
    EXPECT_EQ(body["status"], "reported");

    auto frame = sub->next(std::chrono::milliseconds(1000));
    ASSERT_TRUE(frame);
    EXPECT_NE(frame->find("working"), std::string::npos);
}

TEST_F(ControlApiTest, TaskCompleteFromWrongStageConflicts) {
    std::string run_id = submit();
    post_json("/agent/" + run_id + "/task_complete", {{"role", "design"}}, 409);
    post_json("/agent/" + run_id + "/task_complete", {{"role", "nobody"}}, 400);
}

TEST_F(ControlApiTest, FilesystemToolsReportErrorsInBand) {
    json body = post_json("/tools/filesystem/write", {{"path", "../escape.txt"}, {"content", "x"}}, 200);
    EXPECT_FALSE(body["success"].get<bool>());
    EXPECT_TRUE(body["error"].is_string());
    EXPECT_FALSE(temp_dir.exists("../escape.txt"));

    body = post_json("/tools/filesystem/read", {{"path", "missing.txt"}}, 200);
    EXPECT_FALSE(body["success"].get<bool>());
    EXPECT_NE(body["error"].get<std::string>().find("missing.txt"), std::string::npos);

    body = post_json("/tools/filesystem/read", {{"path", 7}}, 200);
    EXPECT_FALSE(body["success"].get<bool>());

    body = post_json("/tools/filesystem/list", {{"path", "/etc"}}, 200);
    EXPECT_FALSE(body["success"].get<bool>());
}

TEST_F(ControlApiTest, FilesystemToolsRoundTrip) {
    json body = post_json("/tools/filesystem/writeFile", {{"path", "docs/notes.md"}, {"content", "hello"}}, 200);
    EXPECT_TRUE(body["success"].get<bool>());
    EXPECT_TRUE(temp_dir.exists("docs/notes.md"));

    body = post_json("/tools/filesystem/readFile", {{"path", "docs/notes.md"}}, 200);
    EXPECT_TRUE(body["success"].get<bool>());
    EXPECT_EQ(body["content"], "hello");

    body = post_json("/tools/filesystem/listFiles", {{"path", "docs"}}, 200);
    EXPECT_TRUE(body["success"].get<bool>());
    EXPECT_EQ(body["files"], json::array({"docs/notes.md"}));
}

TEST_F(ControlApiTest, VersionedRoutesMatchBareRoutes) {
    std::string run_id = submit("/v1");
    ASSERT_FALSE(run_id.empty());

    auto bare = client->Get("/run/" + run_id);
    auto versioned = client->Get("/v1/run/" + run_id);
    ASSERT_TRUE(bare);
    ASSERT_TRUE(versioned);
    EXPECT_EQ(versioned->status, 200);
    EXPECT_EQ(json::parse(versioned->body)["state"], json::parse(bare->body)["state"]);

    auto missing = client->Get("/v1/run/no-such-run");
    ASSERT_TRUE(missing);
    EXPECT_EQ(missing->status, 404);

    post_json("/v1/run/" + run_id + "/approve", {{"approved", true}}, 409);
    post_json("/v1/agent/" + run_id + "/report", {{"source", "requirements"}}, 400);

    json body = post_json("/v1/tools/filesystem/read", {{"path", "missing.txt"}}, 200);
    EXPECT_FALSE(body["success"].get<bool>());
}

TEST_F(ControlApiTest, UnconfiguredGatewayIsServerError) {
    auto res = client->Get("/llm/stats");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 500);
    EXPECT_EQ(json::parse(res->body)["error"]["type"], "server_error");
}
