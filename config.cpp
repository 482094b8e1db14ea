#include "dirgen.h"
#include "config.h"

#include <fstream>
#include <filesystem>
#include <cstdlib>
#include <pwd.h>
#include <unistd.h>
#include <algorithm>
#include <sstream>

static const char* DEFAULT_LOCAL_ENDPOINT = "http://localhost:12434/engines/v1/chat/completions";

Config::Config() {
    set_defaults();
}

void Config::set_defaults() {
    host = "127.0.0.1";
    port = 8000;
    project_root = std::filesystem::current_path().string();
    log_file = "";
    callback_url = "";  // Empty = http://<host>:<port>

    max_retries = 3;
    input_dir = "temp";
    context_file = "temp/{run_id}_context.yml";
    approval_gates = {"start_design", "execute_plan"};

    stages.clear();
    stages["requirements"] = StageCommand{"python3", {"agents/requirements/requirements_agent.py"}, "--svad-path"};
    stages["design"] = StageCommand{"python3", {"agents/planner/planner_agent.py"}, "--pcce-path"};
    stages["validation"] = StageCommand{"python3", {"agents/validator/validator_agent.py"}, "--pcce-path"};
    // No execution stage by default: runs finish at ValidationPassed

    llm.priority_order = {"gemini", "local"};
    llm.local_fallback = "local";
    llm.cache_capacity = 50;
    llm.cache_prefix_chars = 200;
    llm.credential_cooldown_seconds = 300;
    llm.local_endpoint = DEFAULT_LOCAL_ENDPOINT;
    llm.providers = nlohmann::json::array();

    local_models.command = "docker";
    local_models.idle_timeout_seconds = 300;
    local_models.max_concurrent = 2;
    local_models.poll_attempts = 12;
    local_models.poll_interval_seconds = 5;
    local_models.sweep_interval_seconds = 30;
    local_models.model_prefix = "ai/";
}

std::string Config::get_home_directory() {
    // Try HOME environment variable first (respects user's explicit setting)
    const char* home = getenv("HOME");
    if (home && home[0] != '\0') {
        return std::string(home);
    }

    // Fallback to system passwd database
    struct passwd* pw = getpwuid(getuid());
    if (pw && pw->pw_dir) {
        return std::string(pw->pw_dir);
    }

    throw ConfigError("Unable to determine home directory");
}

std::string Config::get_config_dir() {
    std::string config_home;
    const char* xdg_config = getenv("XDG_CONFIG_HOME");
    if (xdg_config && xdg_config[0] != '\0') {
        config_home = xdg_config;
    } else {
        config_home = get_home_directory() + "/.config";
    }
    return config_home + "/dirgen";
}

std::string Config::get_default_config_path() {
    return get_config_dir() + "/config.json";
}

std::string Config::get_config_path() const {
    if (!custom_config_path_.empty()) {
        return custom_config_path_;
    }
    return get_default_config_path();
}

std::vector<std::string> Config::parse_priority_list(const std::string& value) {
    std::vector<std::string> result;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item.erase(0, item.find_first_not_of(" \t"));
        size_t end = item.find_last_not_of(" \t");
        if (end == std::string::npos) {
            continue;
        }
        item.erase(end + 1);
        result.push_back(dirgen::to_lower(item));
    }
    return result;
}

void Config::load() {
    std::string config_path = get_config_path();

    dprintf(1, "Loading config from: %s", config_path.c_str());

    if (!std::filesystem::exists(config_path)) {
        // An explicit -c path must exist; the default one is optional
        if (!custom_config_path_.empty()) {
            throw ConfigError("Config file not found: " + config_path);
        }
        dprintf(1, "Config file not found, using defaults: %s", config_path.c_str());
        return;
    }

    std::ifstream file(config_path);
    if (!file.is_open()) {
        throw ConfigError("Failed to open config file: " + config_path);
    }

    nlohmann::json parsed;
    try {
        file >> parsed;
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError("Invalid JSON in config file: " + std::string(e.what()));
    }

    load_json(parsed);
    LOG_INFO("Loaded configuration from: " + config_path);
}

void Config::load_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ConfigError("Config root must be a JSON object");
    }
    json = j;

    try {
        if (j.contains("host")) host = j["host"].get<std::string>();
        if (j.contains("port")) port = j["port"].get<int>();
        if (j.contains("project_root")) project_root = j["project_root"].get<std::string>();
        if (j.contains("log_file")) log_file = j["log_file"].get<std::string>();
        if (j.contains("callback_url")) callback_url = j["callback_url"].get<std::string>();
        if (j.contains("max_retries")) max_retries = j["max_retries"].get<int>();
        if (j.contains("input_dir")) input_dir = j["input_dir"].get<std::string>();
        if (j.contains("context_file")) context_file = j["context_file"].get<std::string>();
        if (j.contains("approval_gates")) {
            approval_gates = j["approval_gates"].get<std::vector<std::string>>();
        }

        if (j.contains("stages")) {
            for (const auto& [name, entry] : j["stages"].items()) {
                StageCommand cmd;
                // Start from the built-in command so partial overrides work
                auto it = stages.find(name);
                if (it != stages.end()) {
                    cmd = it->second;
                }
                if (entry.contains("command")) cmd.command = entry["command"].get<std::string>();
                if (entry.contains("args")) cmd.args = entry["args"].get<std::vector<std::string>>();
                if (entry.contains("input_flag")) cmd.input_flag = entry["input_flag"].get<std::string>();
                stages[name] = cmd;
            }
        }

        if (j.contains("llm")) {
            const auto& l = j["llm"];
            if (l.contains("priority_order")) {
                if (l["priority_order"].is_string()) {
                    llm.priority_order = parse_priority_list(l["priority_order"].get<std::string>());
                } else {
                    llm.priority_order = l["priority_order"].get<std::vector<std::string>>();
                }
            }
            if (l.contains("local_fallback")) llm.local_fallback = l["local_fallback"].get<std::string>();
            if (l.contains("cache_capacity")) llm.cache_capacity = l["cache_capacity"].get<size_t>();
            if (l.contains("cache_prefix_chars")) llm.cache_prefix_chars = l["cache_prefix_chars"].get<size_t>();
            if (l.contains("credential_cooldown_seconds")) {
                llm.credential_cooldown_seconds = l["credential_cooldown_seconds"].get<int>();
            }
            if (l.contains("local_endpoint")) llm.local_endpoint = l["local_endpoint"].get<std::string>();
            if (l.contains("providers")) {
                if (!l["providers"].is_array()) {
                    throw ConfigError("llm.providers must be an array");
                }
                llm.providers = l["providers"];
            }
        }

        if (j.contains("local_models")) {
            const auto& m = j["local_models"];
            if (m.contains("command")) local_models.command = m["command"].get<std::string>();
            if (m.contains("idle_timeout_seconds")) local_models.idle_timeout_seconds = m["idle_timeout_seconds"].get<int>();
            if (m.contains("max_concurrent")) local_models.max_concurrent = m["max_concurrent"].get<int>();
            if (m.contains("poll_attempts")) local_models.poll_attempts = m["poll_attempts"].get<int>();
            if (m.contains("poll_interval_seconds")) local_models.poll_interval_seconds = m["poll_interval_seconds"].get<int>();
            if (m.contains("sweep_interval_seconds")) local_models.sweep_interval_seconds = m["sweep_interval_seconds"].get<int>();
            if (m.contains("model_prefix")) local_models.model_prefix = m["model_prefix"].get<std::string>();
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError("Invalid config value: " + std::string(e.what()));
    }
}

void Config::apply_environment() {
    const char* order = getenv("LLM_PRIORITY_ORDER");
    if (order && order[0] != '\0') {
        llm.priority_order = parse_priority_list(order);
        dprintf(1, "LLM priority order from environment: %s", order);
    }

    const char* endpoint = getenv("DMR_ENDPOINT");
    if (endpoint && endpoint[0] != '\0') {
        llm.local_endpoint = endpoint;
    }
}

void Config::validate() const {
    if (port <= 0 || port > 65535) {
        throw ConfigError("port must be between 1 and 65535");
    }
    if (project_root.empty()) {
        throw ConfigError("project_root must not be empty");
    }
    if (max_retries < 0) {
        throw ConfigError("max_retries must not be negative");
    }
    if (context_file.find("{run_id}") == std::string::npos) {
        throw ConfigError("context_file must contain {run_id}");
    }
    for (const auto& gate : approval_gates) {
        if (gate != "start_design" && gate != "execute_plan") {
            throw ConfigError("Unknown approval gate: " + gate);
        }
    }
    for (const auto& name : {"requirements", "design", "validation"}) {
        auto it = stages.find(name);
        if (it == stages.end() || !it->second.configured()) {
            throw ConfigError(std::string("Stage '") + name + "' has no command");
        }
    }
    for (const auto& [name, cmd] : stages) {
        if (name != "requirements" && name != "design" && name != "validation" && name != "execution") {
            throw ConfigError("Unknown stage: " + name);
        }
    }
    if (llm.priority_order.empty()) {
        throw ConfigError("llm.priority_order must name at least one provider");
    }
    if (llm.cache_capacity == 0) {
        throw ConfigError("llm.cache_capacity must be at least 1");
    }
    if (local_models.max_concurrent < 1) {
        throw ConfigError("local_models.max_concurrent must be at least 1");
    }
    if (local_models.poll_attempts < 1) {
        throw ConfigError("local_models.poll_attempts must be at least 1");
    }
    if (local_models.idle_timeout_seconds <= 0 || local_models.sweep_interval_seconds <= 0) {
        throw ConfigError("local_models timeouts must be positive");
    }

    dprintf(1, "Configuration validation passed");
}
