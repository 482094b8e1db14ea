#pragma once

#include <httplib.h>
#include <nlohmann/json.hpp>
#include <memory>
#include <string>
#include <atomic>
#include <thread>
#include <chrono>

/// @brief Base class for HTTP servers
/// Manages HTTP server lifecycle, control socket, and common endpoints
class Server {
public:
    Server(const std::string& host, int port, const std::string& server_type);
    virtual ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    /// @brief Run the server - starts TCP and control socket listeners
    /// Blocks until shutdown() is called.
    /// @return 0 on success, non-zero on error
    int run();

    /// @brief Initiate graceful shutdown
    void shutdown();

    bool is_running() const { return running; }

    /// @brief Override the default control socket location
    void set_control_socket_path(const std::string& path) { control_socket_path = path; }
    const std::string& get_control_socket_path() const { return control_socket_path; }

    /// @brief Default control socket path (/var/tmp/dirgen.sock, else /tmp)
    static std::string default_control_socket_path();

protected:
    /// @brief Register server-specific endpoints on the TCP server
    virtual void register_endpoints() = 0;

    /// @brief Add subclass-specific info to status response
    /// @param status JSON object to add fields to
    virtual void add_status_info(nlohmann::json& status) {}

    /// @brief Called before server starts listening (after endpoints registered)
    virtual void on_server_start() {}

    /// @brief Called after server stops listening (before cleanup)
    virtual void on_server_stop() {}

    // TCP server for main API endpoints
    httplib::Server tcp_server;

    // Control socket server (Unix domain socket)
    httplib::Server control_server;

    // Server state
    std::atomic<bool> running{true};
    std::chrono::steady_clock::time_point start_time;
    std::atomic<uint64_t> requests_processed{0};

    // Configuration
    std::string host;
    int port;
    std::string server_type;
    std::string control_socket_path;

private:
    /// @brief Register common endpoints (/health, /status)
    void register_common_endpoints();

    /// @brief Register control socket endpoints (/shutdown, /status)
    void register_control_endpoints();

    /// @brief Status document shared by /status and the control socket
    nlohmann::json build_status();

    /// @brief Setup and start the control socket listener
    /// @return true if successful, false on error
    bool start_control_socket();

    /// @brief Cleanup control socket on shutdown
    void cleanup_control_socket();

    // Control socket thread
    std::thread control_thread;
    std::atomic<bool> control_failed{false};
};
