#pragma once

#include "server/server.h"

#include <map>
#include <memory>
#include <string>
#include <functional>
#include <chrono>

class Orchestrator;
class RunRegistry;
class WorkerSupervisor;
class EventBroadcaster;
class SandboxFilesystem;
class FailoverEngine;
class LocalModelManager;
class CredentialPool;

/// @brief HTTP surface of the control plane
/// Every route is served both bare and under /v1. Errors map to status
/// codes: malformed body 400, unknown run 404, wrong run state 409,
/// provider exhaustion 502, anything else 500. Filesystem tool errors are
/// reported in-band as {success:false, error}.
class ControlApi : public Server {
public:
    struct Services {
        Orchestrator* orchestrator = nullptr;
        RunRegistry* registry = nullptr;
        WorkerSupervisor* supervisor = nullptr;
        EventBroadcaster* broadcaster = nullptr;
        SandboxFilesystem* sandbox = nullptr;
        FailoverEngine* failover = nullptr;            // optional
        LocalModelManager* local_models = nullptr;     // optional
        std::map<std::string, std::shared_ptr<CredentialPool>> credential_pools;
    };

    ControlApi(const std::string& host, int port, Services services);
    ~ControlApi() override;

    /// @brief Interval between keepalive comments on idle event streams
    void set_keepalive_interval(std::chrono::milliseconds interval) { keepalive_interval = interval; }

protected:
    void register_endpoints() override;
    void add_status_info(nlohmann::json& status) override;
    void on_server_stop() override;

private:
    using Handler = std::function<void(const httplib::Request&, httplib::Response&)>;

    void post(const std::string& pattern, Handler handler);
    void get(const std::string& pattern, Handler handler);

    void register_run_endpoints();
    void register_agent_endpoints();
    void register_filesystem_endpoints();
    void register_llm_endpoints();
    void register_model_endpoints();
    void register_event_stream();

    Services services;
    std::chrono::milliseconds keepalive_interval{std::chrono::seconds(15)};
};

/// @brief Run handler, translating exceptions into JSON error responses
void handle_request(httplib::Response& res, const std::function<nlohmann::json()>& handler);

/// @brief Run a filesystem tool handler; failures become {success:false, error}
void handle_tool_request(httplib::Response& res, const std::function<nlohmann::json()>& handler);
