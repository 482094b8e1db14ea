#pragma once

#include <string>
#include <map>
#include <vector>
#include <stdexcept>
#include <nlohmann/json.hpp>

#include "workers/stage_command.h"

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

class Config {
public:
    Config();

    // Load configuration from $XDG_CONFIG_HOME/dirgen/config.json
    void load();

    // Load from an in-memory JSON document (same keys as the file)
    void load_json(const nlohmann::json& j);

    // Apply LLM_PRIORITY_ORDER and DMR_ENDPOINT
    void apply_environment();

    // Validation
    void validate() const;

    // Get user's home directory (HOME env var first, then getpwuid)
    static std::string get_home_directory();

    // Get XDG config home for dirgen ($XDG_CONFIG_HOME/dirgen or ~/.config/dirgen)
    static std::string get_config_dir();

    // Get default config path (XDG-compliant)
    static std::string get_default_config_path();

    // Set custom config file path (for command-line override)
    void set_config_path(const std::string& config_path) { custom_config_path_ = config_path; }

    // Split "gemini, local" into {"gemini","local"}
    static std::vector<std::string> parse_priority_list(const std::string& value);

    // Server
    std::string host;
    int port;
    std::string project_root;
    std::string log_file;
    std::string callback_url;

    // Workflow
    int max_retries;
    std::string input_dir;
    std::string context_file;                 // "{run_id}" is substituted
    std::vector<std::string> approval_gates;  // "start_design", "execute_plan"
    std::map<std::string, StageCommand> stages;

    // Resilience layer
    struct Llm {
        std::vector<std::string> priority_order;
        std::string local_fallback;
        size_t cache_capacity;
        size_t cache_prefix_chars;
        int credential_cooldown_seconds;
        std::string local_endpoint;
        nlohmann::json providers = nlohmann::json::array();
    } llm;

    struct LocalModels {
        std::string command;
        int idle_timeout_seconds;
        int max_concurrent;
        int poll_attempts;
        int poll_interval_seconds;
        int sweep_interval_seconds;
        std::string model_prefix;
    } local_models;

    nlohmann::json json;  // Parsed config JSON

private:
    std::string get_config_path() const;
    void set_defaults();

    std::string custom_config_path_;
};
