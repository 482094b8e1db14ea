#include "dirgen.h"
#include "server/control_api.h"
#include "run/orchestrator.h"
#include "run/run_registry.h"
#include "workers/supervisor.h"
#include "events/broadcaster.h"
#include "sandbox/sandbox_fs.h"
#include "llm/failover.h"
#include "llm/local_models.h"
#include "llm/credential_pool.h"

#include <chrono>
#include <memory>

using json = nlohmann::json;

namespace {

const char* const ROUTE_PREFIXES[] = {"", "/v1"};

json create_error_response(int status_code, const std::string& message) {
    std::string error_type;
    switch (status_code) {
        case 400:
            error_type = "invalid_request_error";
            break;
        case 404:
            error_type = "not_found_error";
            break;
        case 409:
            error_type = "invalid_state_error";
            break;
        case 502:
            error_type = "provider_error";
            break;
        default:
            error_type = "server_error";
            break;
    }

    return json{
        {"error", {
            {"message", message},
            {"type", error_type},
            {"code", status_code}
        }}
    };
}

void send_error(httplib::Response& res, int status_code, const std::string& message) {
    res.status = status_code;
    res.set_content(create_error_response(status_code, message).dump(), "application/json");
}

// Uploaded document from a multipart form, or the raw body
std::string read_upload(const httplib::Request& req) {
    if (req.is_multipart_form_data()) {
        for (const char* field : {"file", "input_file", "svad_file", "pcce_file"}) {
            if (req.has_file(field)) {
                return req.get_file_value(field).content;
            }
        }
        throw StructuralProtocolError("Multipart upload has no 'file' field");
    }
    if (req.body.empty()) {
        throw StructuralProtocolError("Empty input document");
    }
    return req.body;
}

std::string require_string(const json& body, const std::string& key) {
    if (!body.contains(key) || !body[key].is_string()) {
        throw StructuralProtocolError("Field '" + key + "' must be a string");
    }
    return body[key].get<std::string>();
}

json listing_to_json(const SandboxFilesystem::Listing& listing) {
    return json{
        {"success", true},
        {"files", listing.files},
        {"dirs", listing.dirs},
        {"directories", listing.dirs}
    };
}

} // namespace

void handle_request(httplib::Response& res, const std::function<json()>& handler) {
    try {
        json body = handler();
        res.set_content(body.dump(), "application/json");
    } catch (const StructuralProtocolError& e) {
        LOG_WARN(std::string("Rejected request: ") + e.what());
        send_error(res, 400, e.what());
    } catch (const json::exception& e) {
        LOG_WARN(std::string("Rejected request: ") + e.what());
        send_error(res, 400, std::string("Malformed request: ") + e.what());
    } catch (const UnknownRunError& e) {
        send_error(res, 404, e.what());
    } catch (const InvalidStateError& e) {
        LOG_WARN(e.what());
        send_error(res, 409, e.what());
    } catch (const SandboxViolation& e) {
        send_error(res, 400, e.what());
    } catch (const SandboxNotFound& e) {
        send_error(res, 404, e.what());
    } catch (const ProviderExhaustedError& e) {
        send_error(res, 502, e.what());
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Request failed: ") + e.what());
        send_error(res, 500, e.what());
    }
}

void handle_tool_request(httplib::Response& res, const std::function<json()>& handler) {
    json body;
    try {
        body = handler();
    } catch (const SandboxViolation& e) {
        LOG_WARN(std::string("Sandbox violation: ") + e.what());
        body = {{"success", false}, {"error", e.what()}};
    } catch (const SandboxNotFound& e) {
        body = {{"success", false}, {"error", e.what()}};
    } catch (const StructuralProtocolError& e) {
        body = {{"success", false}, {"error", e.what()}};
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Filesystem tool failed: ") + e.what());
        body = {{"success", false}, {"error", e.what()}};
    }
    res.set_content(body.dump(), "application/json");
}

ControlApi::ControlApi(const std::string& host, int port, Services services)
    : Server(host, port, "dirgen"), services(std::move(services)) {
}

ControlApi::~ControlApi() {
}

void ControlApi::post(const std::string& pattern, Handler handler) {
    for (const char* prefix : ROUTE_PREFIXES) {
        tcp_server.Post(prefix + pattern, handler);
    }
}

void ControlApi::get(const std::string& pattern, Handler handler) {
    for (const char* prefix : ROUTE_PREFIXES) {
        tcp_server.Get(prefix + pattern, handler);
    }
}

void ControlApi::register_endpoints() {
    register_run_endpoints();
    register_agent_endpoints();
    register_filesystem_endpoints();
    register_llm_endpoints();
    register_model_endpoints();
    register_event_stream();
}

void ControlApi::add_status_info(json& status) {
    status["runs"] = services.registry->summary();
    status["active_workers"] = services.supervisor->active_count();
    status["subscribers"] = services.broadcaster->subscriber_count();
    status["project_root"] = services.sandbox->root().string();
}

void ControlApi::on_server_stop() {
    // Wake every event stream so its connection can close
    services.broadcaster->close_all();
}

// ---------------------------------------------------------------------------
// Runs
// ---------------------------------------------------------------------------

void ControlApi::register_run_endpoints() {
    auto submit = [this](const httplib::Request& req, httplib::Response& res) {
        handle_request(res, [&]() {
            std::string document = read_upload(req);
            std::string run_id = services.orchestrator->submit(document);
            return json{
                {"run_id", run_id},
                {"runId", run_id},
                {"message", "Requirements analysis started"}
            };
        });
    };
    post("/run/from-input", submit);
    post("/initiate_from_svad", submit);

    auto approve = [this](const httplib::Request& req, httplib::Response& res) {
        handle_request(res, [&]() {
            std::string run_id = req.path_params.at("run_id");
            ApprovalDecision decision = protocol::parse_approval(protocol::parse_body(req.body));
            RunState state = services.orchestrator->approve(run_id, decision);
            return json{
                {"status", decision.approved ? "approved" : "rejected"},
                {"run_id", run_id},
                {"state", to_string(state)}
            };
        });
    };
    post("/run/:run_id/approve", approve);
    post("/run/:run_id/approve_plan", approve);

    post("/run/:run_id/cancel", [this](const httplib::Request& req, httplib::Response& res) {
        handle_request(res, [&]() {
            std::string run_id = req.path_params.at("run_id");
            RunState state = services.orchestrator->cancel(run_id);
            return json{{"status", "cancelled"}, {"run_id", run_id}, {"state", to_string(state)}};
        });
    });

    get("/run/:run_id", [this](const httplib::Request& req, httplib::Response& res) {
        handle_request(res, [&]() {
            return services.orchestrator->get_run(req.path_params.at("run_id"));
        });
    });
}

// ---------------------------------------------------------------------------
// Worker callbacks
// ---------------------------------------------------------------------------

void ControlApi::register_agent_endpoints() {
    post("/agent/:run_id/report", [this](const httplib::Request& req, httplib::Response& res) {
        handle_request(res, [&]() {
            std::string run_id = req.path_params.at("run_id");
            json body = protocol::parse_body(req.body);
            BroadcastMessage message = BroadcastMessage::from_json(body);
            dprintf(1, "Relaying [%s:%s] for %s", message.source.c_str(), message.type.c_str(), run_id.c_str());
            services.orchestrator->relay(run_id, message);
            return json{{"status", "reported"}};
        });
    });

    post("/agent/:run_id/task_complete", [this](const httplib::Request& req, httplib::Response& res) {
        handle_request(res, [&]() {
            std::string run_id = req.path_params.at("run_id");
            TaskReport report = protocol::parse_task_complete(protocol::parse_body(req.body));
            services.orchestrator->report_stage_outcome(run_id, report);
            return json{{"status", "acknowledged"}};
        });
    });

    post("/agent/:run_id/validation_result", [this](const httplib::Request& req, httplib::Response& res) {
        handle_request(res, [&]() {
            std::string run_id = req.path_params.at("run_id");
            ValidationReport report = protocol::parse_validation_result(protocol::parse_body(req.body));
            services.orchestrator->report_validation(run_id, report);
            return json{{"status", "processed"}};
        });
    });
}

// ---------------------------------------------------------------------------
// Filesystem tools
// ---------------------------------------------------------------------------

void ControlApi::register_filesystem_endpoints() {
    auto write_file = [this](const httplib::Request& req, httplib::Response& res) {
        handle_tool_request(res, [&]() {
            json body = protocol::parse_body(req.body);
            std::string path = require_string(body, "path");
            std::string content = require_string(body, "content");
            services.sandbox->write(path, content);
            LOG_INFO("File written: " + path + " (" + std::to_string(content.size()) + " bytes)");
            return json{{"success", true}};
        });
    };
    post("/tools/filesystem/write", write_file);
    post("/tools/filesystem/writeFile", write_file);

    auto read_file = [this](const httplib::Request& req, httplib::Response& res) {
        handle_tool_request(res, [&]() {
            json body = protocol::parse_body(req.body);
            std::string path = require_string(body, "path");
            std::string content = services.sandbox->read(path);
            dprintf(1, "File read: %s (%zu bytes)", path.c_str(), content.size());
            return json{{"success", true}, {"content", content}};
        });
    };
    post("/tools/filesystem/read", read_file);
    post("/tools/filesystem/readFile", read_file);

    auto list_files = [this](const httplib::Request& req, httplib::Response& res) {
        handle_tool_request(res, [&]() {
            json body = req.body.empty() ? json::object() : protocol::parse_body(req.body);
            std::string path = body.contains("path") ? require_string(body, "path") : ".";
            return listing_to_json(services.sandbox->list(path));
        });
    };
    post("/tools/filesystem/list", list_files);
    post("/tools/filesystem/listFiles", list_files);
}

// ---------------------------------------------------------------------------
// LLM gateway
// ---------------------------------------------------------------------------

void ControlApi::register_llm_endpoints() {
    post("/llm/ask", [this](const httplib::Request& req, httplib::Response& res) {
        handle_request(res, [&]() {
            if (!services.failover) {
                throw std::runtime_error("LLM gateway is not configured");
            }
            json body = protocol::parse_body(req.body);
            std::string user_prompt = require_string(body, "user_prompt");
            std::string system_prompt = body.contains("system_prompt") ? require_string(body, "system_prompt") : "";
            std::string model_id = body.contains("model_id") ? require_string(body, "model_id") : "";

            TaskClass task = TaskClass::General;
            if (body.contains("task_class")) {
                std::string name = require_string(body, "task_class");
                auto parsed = parse_task_class(name);
                if (!parsed) {
                    throw StructuralProtocolError("Unknown task_class: " + name);
                }
                task = *parsed;
            }
            bool use_cache = body.value("use_cache", true);

            std::string text = services.failover->ask(model_id, system_prompt, user_prompt, task, use_cache);
            return json{{"success", true}, {"response", text}, {"task_class", to_string(task)}};
        });
    });

    get("/llm/stats", [this](const httplib::Request&, httplib::Response& res) {
        handle_request(res, [&]() {
            if (!services.failover) {
                throw std::runtime_error("LLM gateway is not configured");
            }
            return services.failover->stats();
        });
    });

    get("/llm/credentials", [this](const httplib::Request&, httplib::Response& res) {
        handle_request(res, [&]() {
            json pools = json::object();
            for (const auto& [name, pool] : services.credential_pools) {
                pools[name] = pool->stats();
            }
            return json{{"success", true}, {"providers", pools}};
        });
    });

    post("/llm/credentials/reset", [this](const httplib::Request& req, httplib::Response& res) {
        handle_request(res, [&]() {
            json body = req.body.empty() ? json::object() : protocol::parse_body(req.body);
            std::string id = body.contains("id") ? require_string(body, "id") : "";
            std::string provider = body.contains("provider") ? require_string(body, "provider") : "";

            int reset = 0;
            for (const auto& [name, pool] : services.credential_pools) {
                if (provider.empty() || provider == name) {
                    pool->reset(id);
                    reset++;
                }
            }
            return json{{"success", true}, {"pools_reset", reset}};
        });
    });
}

// ---------------------------------------------------------------------------
// Local models
// ---------------------------------------------------------------------------

void ControlApi::register_model_endpoints() {
    get("/models/status", [this](const httplib::Request&, httplib::Response& res) {
        handle_request(res, [&]() {
            if (!services.local_models) {
                throw std::runtime_error("Local model manager is not configured");
            }
            return json{
                {"success", true},
                {"timestamp", dirgen::format_iso_time(std::chrono::system_clock::now())},
                {"stats", services.local_models->stats()}
            };
        });
    });

    auto ensure = [this](const std::string& model_id, httplib::Response& res) {
        handle_request(res, [&]() {
            if (!services.local_models) {
                throw std::runtime_error("Local model manager is not configured");
            }
            bool ok = services.local_models->ensure_running(model_id);
            return json{
                {"success", ok},
                {"model_id", model_id},
                {"message", ok ? "Model available" : "Model failed to start"},
                {"timestamp", dirgen::format_iso_time(std::chrono::system_clock::now())}
            };
        });
    };

    post("/models/ensure", [ensure](const httplib::Request& req, httplib::Response& res) {
        std::string model_id;
        try {
            model_id = require_string(protocol::parse_body(req.body), "model_id");
        } catch (const StructuralProtocolError& e) {
            send_error(res, 400, e.what());
            return;
        }
        ensure(model_id, res);
    });

    // Model ids contain a slash ("ai/gemma3"), so match the rest of the path
    for (const char* prefix : ROUTE_PREFIXES) {
        tcp_server.Post(std::string(prefix) + R"(/models/(.+)/ensure)",
                        [ensure](const httplib::Request& req, httplib::Response& res) {
            ensure(req.matches[1].str(), res);
        });
    }

    post("/models/cleanup", [this](const httplib::Request&, httplib::Response& res) {
        handle_request(res, [&]() {
            if (!services.local_models) {
                throw std::runtime_error("Local model manager is not configured");
            }
            size_t stopped = services.local_models->sweep_idle();
            return json{
                {"success", true},
                {"stopped", stopped},
                {"message", "Idle model sweep completed"},
                {"timestamp", dirgen::format_iso_time(std::chrono::system_clock::now())}
            };
        });
    });
}

// ---------------------------------------------------------------------------
// Event stream
// ---------------------------------------------------------------------------

void ControlApi::register_event_stream() {
    get("/ws/:run_id", [this](const httplib::Request& req, httplib::Response& res) {
        std::string run_id = req.path_params.at("run_id");
        auto sub = services.broadcaster->subscribe(run_id);
        LOG_INFO("Event stream opened for " + run_id);

        res.set_header("Cache-Control", "no-cache");
        res.set_header("X-Accel-Buffering", "no");

        auto last_write = std::make_shared<std::chrono::steady_clock::time_point>(std::chrono::steady_clock::now());
        auto interval = keepalive_interval;

        res.set_chunked_content_provider(
            "text/event-stream",
            [this, sub, last_write, interval](size_t /*offset*/, httplib::DataSink& sink) {
                if (!running) {
                    sink.done();
                    return false;
                }

                auto frame = sub->next(std::chrono::milliseconds(100));
                auto now = std::chrono::steady_clock::now();

                if (frame) {
                    if (!sink.write(frame->data(), frame->size())) {
                        sub->disconnect();
                        return false;
                    }
                    *last_write = now;
                    return true;
                }

                if (sub->closed()) {
                    // Replaced by a newer subscriber or shutting down
                    sink.done();
                    return false;
                }

                if (now - *last_write >= interval) {
                    static const std::string keepalive = ": keepalive\n\n";
                    if (!sink.write(keepalive.data(), keepalive.size())) {
                        sub->disconnect();
                        return false;
                    }
                    *last_write = now;
                }
                return true;
            },
            [this, sub, run_id](bool /*success*/) {
                sub->disconnect();
                services.broadcaster->unsubscribe(sub);
                LOG_INFO("Event stream closed for " + run_id);
            });
    });
}
