#include "dirgen.h"
#include "llm/providers.h"
#include "llm/local_models.h"
#include "http_client.h"
#include "config.h"

#include <cstdlib>
#include <set>

using json = nlohmann::json;

namespace {

const char* const ANTHROPIC_API_VERSION = "2023-06-01";

void require_field(bool present, const std::string& provider, const std::string& what) {
    if (!present) {
        throw ProviderError("Malformed response from " + provider + ": missing " + what);
    }
}

} // namespace

// ---------------------------------------------------------------------------
// HttpProvider
// ---------------------------------------------------------------------------

HttpProvider::HttpProvider(ProviderConfig config) : config_(std::move(config)) {
}

std::string HttpProvider::describe_failure(const HttpResponse& response) {
    if (response.status_code == 0) {
        if (response.timed_out) {
            return "Request timed out: " + response.error_message;
        }
        return "Connection error: " + response.error_message;
    }

    std::string message;
    try {
        json error_json = json::parse(response.body);
        if (error_json.contains("error")) {
            const auto& error = error_json["error"];
            if (error.is_object() && error.contains("message") && error["message"].is_string()) {
                message = error["message"].get<std::string>();
            } else if (error.is_string()) {
                message = error.get<std::string>();
            }
        }
    } catch (const json::exception&) {
        message = dirgen::truncate(response.body, 300);
    }
    if (message.empty()) {
        message = response.body.empty() ? "no body" : dirgen::truncate(response.body, 300);
    }
    return "HTTP " + std::to_string(response.status_code) + ": " + message;
}

json HttpProvider::post_json(const std::string& url,
                             const json& body,
                             const std::map<std::string, std::string>& headers) const {
    HttpClient client;
    client.set_timeout(config_.effective_timeout());
    client.set_ssl_verify(config_.ssl_verify);
    if (!config_.ca_bundle_path.empty()) {
        client.set_ca_bundle(config_.ca_bundle_path);
    }

    std::map<std::string, std::string> all_headers = config_.extra_headers;
    all_headers["Content-Type"] = "application/json";
    for (const auto& [key, value] : headers) {
        all_headers[key] = value;
    }

    HttpResponse response = client.post(url, body.dump(), all_headers);
    if (!response.is_success()) {
        throw ProviderError(config_.name + ": " + describe_failure(response));
    }

    try {
        return json::parse(response.body);
    } catch (const json::exception& e) {
        throw ProviderError(config_.name + ": invalid JSON in response: " + e.what());
    }
}

std::string HttpProvider::pick_model(const std::string& model_id) const {
    if (!config_.model.empty()) {
        return config_.model;
    }
    if (model_id.empty()) {
        throw ProviderError("No model configured for provider " + config_.name);
    }
    return model_id;
}

std::string HttpProvider::resolve_api_key() const {
    if (!config_.api_key.empty()) {
        return config_.api_key;
    }
    if (!config_.api_key_env.empty()) {
        const char* value = getenv((config_.api_key_env + "_API_KEY").c_str());
        if (value && value[0] != '\0') {
            return value;
        }
    }
    throw ProviderError("API key not configured for " + config_.name);
}

// ---------------------------------------------------------------------------
// OpenAICompatProvider
// ---------------------------------------------------------------------------

OpenAICompatProvider::OpenAICompatProvider(ProviderConfig config) : HttpProvider(std::move(config)) {
}

json OpenAICompatProvider::build_request(const std::string& model,
                                         const std::string& system_prompt,
                                         const std::string& user_prompt,
                                         float temperature, int max_tokens) {
    json messages = json::array();
    if (!system_prompt.empty()) {
        messages.push_back({{"role", "system"}, {"content", system_prompt}});
    }
    messages.push_back({{"role", "user"}, {"content", user_prompt}});

    json request = {
        {"model", model},
        {"messages", messages},
        {"temperature", temperature}
    };
    if (max_tokens > 0) {
        request["max_tokens"] = max_tokens;
    }
    return request;
}

std::string OpenAICompatProvider::extract_text(const json& reply) {
    require_field(reply.contains("choices") && reply["choices"].is_array() && !reply["choices"].empty(),
                  "chat completion", "choices");
    const auto& message = reply["choices"][0].value("message", json::object());
    require_field(message.contains("content") && message["content"].is_string(),
                  "chat completion", "message content");
    return message["content"].get<std::string>();
}

std::string OpenAICompatProvider::complete(const std::string& model_id,
                                           const std::string& system_prompt,
                                           const std::string& user_prompt) {
    std::string api_key = resolve_api_key();
    std::string model = pick_model(model_id);

    json request = build_request(model, system_prompt, user_prompt, config_.temperature, config_.max_tokens);
    dprintf(1, "%s request to model %s", config_.name.c_str(), model.c_str());

    json reply = post_json(config_.base_url + "/chat/completions", request,
                           {{"Authorization", "Bearer " + api_key}});
    return extract_text(reply);
}

// ---------------------------------------------------------------------------
// AnthropicProvider
// ---------------------------------------------------------------------------

AnthropicProvider::AnthropicProvider(ProviderConfig config) : HttpProvider(std::move(config)) {
}

std::string AnthropicProvider::extract_text(const json& reply) {
    require_field(reply.contains("content") && reply["content"].is_array() && !reply["content"].empty(),
                  "anthropic", "content");
    const auto& block = reply["content"][0];
    require_field(block.contains("text") && block["text"].is_string(), "anthropic", "content text");
    return block["text"].get<std::string>();
}

std::string AnthropicProvider::complete(const std::string& model_id,
                                        const std::string& system_prompt,
                                        const std::string& user_prompt) {
    std::string api_key = resolve_api_key();
    std::string model = pick_model(model_id);

    json request = {
        {"model", model},
        {"max_tokens", config_.max_tokens > 0 ? config_.max_tokens : 4096},
        {"temperature", config_.temperature},
        {"messages", json::array({{{"role", "user"}, {"content", user_prompt}}})}
    };
    // System prompt goes in its own field, not in messages
    if (!system_prompt.empty()) {
        request["system"] = system_prompt;
    }

    json reply = post_json(config_.base_url + "/messages", request,
                           {{"x-api-key", api_key}, {"anthropic-version", ANTHROPIC_API_VERSION}});
    return extract_text(reply);
}

// ---------------------------------------------------------------------------
// GeminiProvider
// ---------------------------------------------------------------------------

GeminiProvider::GeminiProvider(ProviderConfig config, std::shared_ptr<CredentialPool> credentials)
    : HttpProvider(std::move(config)), credentials_(std::move(credentials)) {
    if (config_.model.empty()) {
        config_.model = "gemini-2.0-flash";
    }
}

json GeminiProvider::build_request(const std::string& system_prompt,
                                   const std::string& user_prompt,
                                   float temperature, int max_tokens) {
    std::string content = system_prompt.empty() ? user_prompt : system_prompt + "\n\n" + user_prompt;
    return json{
        {"contents", json::array({{{"parts", json::array({{{"text", content}}})}}})},
        {"generationConfig", {
            {"temperature", temperature},
            {"maxOutputTokens", max_tokens}
        }}
    };
}

std::string GeminiProvider::extract_text(const json& reply) {
    require_field(reply.contains("candidates") && reply["candidates"].is_array() && !reply["candidates"].empty(),
                  "gemini", "candidates");
    const auto& content = reply["candidates"][0].value("content", json::object());
    require_field(content.contains("parts") && content["parts"].is_array() && !content["parts"].empty(),
                  "gemini", "content parts");
    const auto& part = content["parts"][0];
    require_field(part.contains("text") && part["text"].is_string(), "gemini", "part text");
    return part["text"].get<std::string>();
}

std::string GeminiProvider::complete(const std::string& model_id,
                                     const std::string& system_prompt,
                                     const std::string& user_prompt) {
    if (!credentials_) {
        throw ProviderError("API key not configured for " + config_.name);
    }

    ProviderCredential credential = credentials_->current();
    std::string model = pick_model(model_id);
    std::string url = config_.base_url + "/models/" + model + ":generateContent";

    json request = build_request(system_prompt, user_prompt, config_.temperature,
                                 config_.max_tokens > 0 ? config_.max_tokens : 4096);
    dprintf(1, "%s request to model %s with credential %s",
            config_.name.c_str(), model.c_str(), credential.id.c_str());

    try {
        json reply = post_json(url, request, {{"X-goog-api-key", credential.secret}});
        std::string text = extract_text(reply);
        credentials_->report(credential.id, true);
        return text;
    } catch (const ProviderError& e) {
        credentials_->report(credential.id, false, e.what());
        throw;
    }
}

// ---------------------------------------------------------------------------
// LocalProvider
// ---------------------------------------------------------------------------

LocalProvider::LocalProvider(ProviderConfig config, std::string endpoint, LocalModelManager* models)
    : HttpProvider(std::move(config)), endpoint_(std::move(endpoint)), models_(models) {
}

std::string LocalProvider::complete(const std::string& model_id,
                                    const std::string& system_prompt,
                                    const std::string& user_prompt) {
    // The request's model id wins: workers name the local model they want
    std::string model = model_id.empty() ? config_.model : model_id;
    if (model.empty()) {
        throw ProviderError("No model configured for provider " + config_.name);
    }

    if (models_ && models_->manages(model) && !models_->ensure_running(model)) {
        throw ProviderError("Could not start local model: " + model);
    }

    json request = OpenAICompatProvider::build_request(model, system_prompt, user_prompt,
                                                       config_.temperature, config_.max_tokens);
    json reply = post_json(endpoint_, request, {});
    return OpenAICompatProvider::extract_text(reply);
}

// ---------------------------------------------------------------------------
// Factory
// ---------------------------------------------------------------------------

std::shared_ptr<LLMProvider> create_provider(const ProviderConfig& definition,
                                             const Config& config,
                                             LocalModelManager* models,
                                             ProviderSet& set) {
    const std::string& type = definition.type;

    if (type == "openai" || type == "groq" || type == "xai") {
        return std::make_shared<OpenAICompatProvider>(definition);
    }
    if (type == "anthropic") {
        return std::make_shared<AnthropicProvider>(definition);
    }
    if (type == "gemini") {
        std::shared_ptr<CredentialPool> pool;
        auto cooldown = std::chrono::seconds(config.llm.credential_cooldown_seconds);
        try {
            if (!definition.api_key.empty()) {
                pool = std::make_shared<CredentialPool>(
                    definition.name,
                    std::vector<std::pair<std::string, std::string>>{{"key_single", definition.api_key}},
                    cooldown);
            } else {
                pool = CredentialPool::from_environment(definition.name, definition.api_key_env, cooldown);
            }
        } catch (const ProviderError& e) {
            LOG_WARN(std::string(e.what()) + "; " + definition.name + " calls will fail until keys are set");
        }
        if (pool) {
            set.credential_pools[definition.name] = pool;
        }
        return std::make_shared<GeminiProvider>(definition, pool);
    }
    if (type == "local") {
        std::string endpoint = config.llm.local_endpoint;
        if (definition.base_url != ProviderConfig::default_base_url("local")) {
            endpoint = definition.base_url + "/chat/completions";
        }
        return std::make_shared<LocalProvider>(definition, endpoint, models);
    }

    throw ConfigError("Unknown provider type '" + type + "' for provider " + definition.name);
}

ProviderSet build_providers(const Config& config, LocalModelManager* models) {
    ProviderSet set;
    std::set<std::string> names;

    auto add = [&](const ProviderConfig& definition) {
        if (!names.insert(definition.name).second) {
            dprintf(1, "Provider %s already defined, skipping", definition.name.c_str());
            return;
        }
        set.providers.push_back(create_provider(definition, config, models, set));
        set.definitions.push_back(definition);
    };

    for (const auto& entry : config.llm.providers) {
        add(ProviderConfig::from_json(entry));
    }
    for (const auto& definition : ProviderConfig::load_providers()) {
        add(definition);
    }

    // Names in the priority order that were not defined get their type's defaults
    std::vector<std::string> wanted = config.llm.priority_order;
    wanted.push_back(config.llm.local_fallback);
    for (const auto& name : wanted) {
        if (names.count(name) || ProviderConfig::default_base_url(name).empty()) {
            continue;
        }
        add(ProviderConfig::from_json(json{{"type", name}, {"name", name}}));
    }

    LOG_INFO("Configured " + std::to_string(set.providers.size()) + " LLM provider(s)");
    return set;
}
