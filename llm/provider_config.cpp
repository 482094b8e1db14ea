#include "dirgen.h"
#include "llm/provider_config.h"
#include "config.h"

#include <filesystem>
#include <fstream>
#include <algorithm>

namespace fs = std::filesystem;
using json = nlohmann::json;

int ProviderConfig::effective_timeout() const {
    if (timeout_seconds > 0) {
        return timeout_seconds;
    }
    return is_local() ? 900 : 60;
}

std::string ProviderConfig::default_base_url(const std::string& type) {
    if (type == "openai") return "https://api.openai.com/v1";
    if (type == "groq") return "https://api.groq.com/openai/v1";
    if (type == "xai") return "https://api.x.ai/v1";
    if (type == "anthropic") return "https://api.anthropic.com/v1";
    if (type == "gemini") return "https://generativelanguage.googleapis.com/v1beta";
    if (type == "local") return "http://localhost:12434/engines/v1";
    return "";
}

std::string ProviderConfig::default_env_prefix(const std::string& type) {
    if (type == "openai") return "OPENAI";
    if (type == "groq") return "GROQ";
    if (type == "xai") return "XAI";
    if (type == "anthropic") return "ANTHROPIC";
    if (type == "gemini") return "GEMINI";
    return "";
}

std::string ProviderConfig::get_providers_dir() {
    return Config::get_config_dir() + "/providers";
}

std::vector<ProviderConfig> ProviderConfig::load_providers() {
    std::vector<ProviderConfig> result;
    std::string providers_dir = get_providers_dir();

    if (!fs::exists(providers_dir)) {
        return result;
    }

    for (const auto& entry : fs::directory_iterator(providers_dir)) {
        if (entry.path().extension() != ".json") {
            continue;
        }
        try {
            std::ifstream file(entry.path());
            json j;
            file >> j;

            ProviderConfig p = ProviderConfig::from_json(j);
            if (p.name.empty()) {
                p.name = entry.path().stem().string();
            }
            result.push_back(std::move(p));
        } catch (const std::exception& e) {
            LOG_ERROR("Failed to load provider " + entry.path().string() + ": " + e.what());
        }
    }

    // Sort by priority (lower = first), then name for a stable listing
    std::sort(result.begin(), result.end(), [](const ProviderConfig& a, const ProviderConfig& b) {
        if (a.priority != b.priority) {
            return a.priority < b.priority;
        }
        return a.name < b.name;
    });

    return result;
}

ProviderConfig ProviderConfig::from_json(const json& j) {
    if (!j.is_object()) {
        throw ConfigError("Provider definition must be a JSON object");
    }

    ProviderConfig p;
    p.type = j.value("type", "");
    p.name = j.value("name", p.type);
    p.model = j.value("model", "");
    p.priority = j.value("priority", 100);

    p.base_url = j.value("base_url", default_base_url(p.type));
    p.api_key = j.value("api_key", "");
    p.api_key_env = j.value("api_key_env", default_env_prefix(p.type));
    p.ssl_verify = j.value("ssl_verify", true);
    p.ca_bundle_path = j.value("ca_bundle_path", "");

    if (j.contains("extra_headers") && j["extra_headers"].is_object()) {
        for (auto& [key, value] : j["extra_headers"].items()) {
            if (value.is_string()) {
                p.extra_headers[key] = value.get<std::string>();
            }
        }
    }

    p.timeout_seconds = j.value("timeout_seconds", 0);
    p.temperature = j.value("temperature", 0.1f);
    p.max_tokens = j.value("max_tokens", 4096);

    if (p.type.empty()) {
        throw ConfigError("Provider '" + p.name + "' has no type");
    }
    return p;
}

json ProviderConfig::to_json() const {
    json j;
    j["name"] = name;
    j["type"] = type;
    j["model"] = model;
    j["priority"] = priority;
    j["base_url"] = base_url;
    // Secrets never leave the process
    j["api_key_set"] = !api_key.empty();
    j["api_key_env"] = api_key_env;
    j["ssl_verify"] = ssl_verify;
    if (!ca_bundle_path.empty()) {
        j["ca_bundle_path"] = ca_bundle_path;
    }
    if (!extra_headers.empty()) {
        j["extra_headers"] = extra_headers;
    }
    j["timeout_seconds"] = effective_timeout();
    j["temperature"] = temperature;
    j["max_tokens"] = max_tokens;
    return j;
}
