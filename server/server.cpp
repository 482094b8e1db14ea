#include "dirgen.h"
#include "server/server.h"

#include <cerrno>
#include <cstring>
#include <sys/socket.h>
#include <sys/stat.h>
#include <unistd.h>

using json = nlohmann::json;

Server::Server(const std::string& host, int port, const std::string& server_type)
    : host(host), port(port), server_type(server_type),
      control_socket_path(default_control_socket_path()) {
}

Server::~Server() {
    // Ensure shutdown is called
    shutdown();
    // Join control thread if still joinable
    if (control_thread.joinable()) {
        control_thread.join();
    }
}

std::string Server::default_control_socket_path() {
    // Prefer /var/tmp (persistent, user-writable) over /tmp
    if (access("/var/tmp", W_OK) == 0) {
        return "/var/tmp/dirgen.sock";
    }
    return "/tmp/dirgen.sock";
}

void Server::shutdown() {
    if (!running.exchange(false)) {
        return;  // Already shutting down
    }
    LOG_INFO("Server shutdown requested");

    tcp_server.stop();
    control_server.stop();
}

json Server::build_status() {
    auto now = std::chrono::steady_clock::now();
    auto uptime = std::chrono::duration_cast<std::chrono::seconds>(now - start_time).count();

    json status = {
        {"status", "ok"},
        {"server_type", server_type},
        {"version", DIRGEN_VERSION},
        {"uptime_seconds", uptime},
        {"requests_processed", requests_processed.load()},
        {"pid", getpid()}
    };

    // Let subclass add additional info
    add_status_info(status);
    return status;
}

void Server::register_common_endpoints() {
    // GET /health - Health check
    tcp_server.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        json response = {
            {"status", "ok"},
            {"server_type", server_type}
        };
        res.set_content(response.dump(), "application/json");
    });

    // GET /status - Server status
    tcp_server.Get("/status", [this](const httplib::Request&, httplib::Response& res) {
        res.set_content(build_status().dump(), "application/json");
    });

    // Count every handled request
    tcp_server.set_post_routing_handler([this](const httplib::Request&, httplib::Response&) {
        requests_processed++;
    });
}

void Server::register_control_endpoints() {
    // GET /status - Status via control socket
    control_server.Get("/status", [this](const httplib::Request&, httplib::Response& res) {
        json status = build_status();
        status["host"] = host;
        status["port"] = port;
        status["control_socket"] = control_socket_path;
        res.set_content(status.dump(), "application/json");
    });

    // POST /shutdown - Graceful shutdown via control socket
    control_server.Post("/shutdown", [this](const httplib::Request&, httplib::Response& res) {
        LOG_INFO("Shutdown command received via control socket");

        json response = {
            {"status", "shutting_down"}
        };
        res.set_content(response.dump(), "application/json");

        // Schedule shutdown after response is sent
        std::thread([this]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            shutdown();
        }).detach();
    });
}

bool Server::start_control_socket() {
    // Remove stale socket file if it exists
    if (access(control_socket_path.c_str(), F_OK) == 0) {
        LOG_WARN("Removing stale control socket: " + control_socket_path);
        unlink(control_socket_path.c_str());
    }

    // Configure for Unix domain socket
    control_server.set_address_family(AF_UNIX);
    control_server.set_error_logger([](const auto& err, const auto* /*req*/) {
        LOG_ERROR("Control socket error: " + httplib::to_string(err));
    });

    // Register control endpoints
    register_control_endpoints();

    // Start control socket in a separate thread
    control_thread = std::thread([this]() {
        LOG_INFO("Control socket listening on " + control_socket_path);
        // Port must be non-zero to avoid httplib bug in bind_internal that doesn't handle AF_UNIX
        if (!control_server.listen(control_socket_path.c_str(), 1) && running) {
            LOG_ERROR("Failed to start control socket on " + control_socket_path + " (errno=" +
                      std::to_string(errno) + ": " + strerror(errno) + ")");
            control_failed = true;
        }
    });

    // Wait for socket file to appear
    for (int i = 0; i < 50; i++) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        if (control_failed) {
            break;
        }
        if (access(control_socket_path.c_str(), F_OK) == 0) {
            chmod(control_socket_path.c_str(), 0600);
            return true;
        }
    }

    LOG_ERROR("Control socket failed to start");
    control_server.stop();
    if (control_thread.joinable()) {
        control_thread.join();
    }
    return false;
}

void Server::cleanup_control_socket() {
    // Join control thread (shutdown() already called stop())
    control_server.stop();
    if (control_thread.joinable()) {
        control_thread.join();
    }

    // Remove socket file
    if (!control_socket_path.empty() && access(control_socket_path.c_str(), F_OK) == 0) {
        unlink(control_socket_path.c_str());
    }
}

int Server::run() {
    // Record start time
    start_time = std::chrono::steady_clock::now();

    // Register common endpoints
    register_common_endpoints();

    // Let subclass register its endpoints
    register_endpoints();

    // Start control socket (required for graceful shutdown)
    if (!start_control_socket()) {
        LOG_ERROR("Failed to start control socket - server cannot start");
        return 1;
    }

    // Let subclass do any startup work
    on_server_start();

    LOG_INFO(server_type + " server ready on " + host + ":" + std::to_string(port));

    // Start TCP server (blocks until stopped)
    bool success = tcp_server.listen(host.c_str(), port);

    // A stop() requested before listen() began leaves the flag cleared
    bool requested = !running;
    running = false;

    // Let subclass do any cleanup
    on_server_stop();

    // Cleanup control socket
    cleanup_control_socket();

    if (!success && !requested) {
        LOG_ERROR("Failed to start " + server_type + " server on " + host + ":" + std::to_string(port));
        return 1;
    }

    LOG_INFO(server_type + " server stopped");
    return 0;
}
