#pragma once

#include <string>
#include <map>
#include <vector>
#include <nlohmann/json.hpp>

/// @brief Represents a single model provider definition
/// Read from the "llm.providers" array of the config file or from one JSON
/// file per provider in the providers directory.
class ProviderConfig {
public:
    std::string name;           // registry name used in the priority order
    std::string type;           // openai, groq, xai, anthropic, gemini, local
    std::string model;          // default model when a request names none
    int priority = 100;         // lower = listed first

    // API fields
    std::string base_url;
    std::string api_key;
    std::string api_key_env;    // env prefix for credential rotation (GEMINI -> GEMINI_API_KEY_1..9)
    std::map<std::string, std::string> extra_headers;
    bool ssl_verify = true;
    std::string ca_bundle_path;

    // Request parameters
    int timeout_seconds = 0;    // 0 = type default (60 cloud, 900 local)
    float temperature = 0.1f;
    int max_tokens = 4096;

    bool is_local() const { return type == "local"; }

    // Timeout to use, applying the type default
    int effective_timeout() const;

    // Default base URL and env prefix for the type
    static std::string default_base_url(const std::string& type);
    static std::string default_env_prefix(const std::string& type);

    // Load all providers from $XDG_CONFIG_HOME/dirgen/providers/
    static std::vector<ProviderConfig> load_providers();

    // Get providers directory path
    static std::string get_providers_dir();

    // Serialization
    nlohmann::json to_json() const;
    static ProviderConfig from_json(const nlohmann::json& j);
};
