#pragma once

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>

#include "llm/llm_provider.h"
#include "llm/provider_config.h"
#include "llm/credential_pool.h"

class Config;
class LocalModelManager;
struct HttpResponse;

/// @brief Shared plumbing for providers reached over HTTP
class HttpProvider : public LLMProvider {
public:
    explicit HttpProvider(ProviderConfig config);

    std::string name() const override { return config_.name; }
    const ProviderConfig& config() const { return config_; }

protected:
    /// @brief POST a JSON body and return the parsed JSON reply
    /// @throws ProviderError carrying "HTTP <code>: <message>" or a transport error
    nlohmann::json post_json(const std::string& url,
                             const nlohmann::json& body,
                             const std::map<std::string, std::string>& headers) const;

    /// @brief Configured model, falling back to the request's model id
    std::string pick_model(const std::string& model_id) const;

    /// @brief Configured key or <PREFIX>_API_KEY from the environment
    std::string resolve_api_key() const;

    /// @brief Error text for a failed HTTP response
    static std::string describe_failure(const HttpResponse& response);

    ProviderConfig config_;
};

/// @brief OpenAI chat-completions wire format (openai, groq, xai)
class OpenAICompatProvider : public HttpProvider {
public:
    explicit OpenAICompatProvider(ProviderConfig config);

    std::string complete(const std::string& model_id,
                         const std::string& system_prompt,
                         const std::string& user_prompt) override;

    /// @brief Request body for one system+user exchange
    static nlohmann::json build_request(const std::string& model,
                                        const std::string& system_prompt,
                                        const std::string& user_prompt,
                                        float temperature, int max_tokens);

    /// @brief choices[0].message.content
    static std::string extract_text(const nlohmann::json& reply);
};

/// @brief Anthropic messages API
class AnthropicProvider : public HttpProvider {
public:
    explicit AnthropicProvider(ProviderConfig config);

    std::string complete(const std::string& model_id,
                         const std::string& system_prompt,
                         const std::string& user_prompt) override;

    static std::string extract_text(const nlohmann::json& reply);
};

/// @brief Gemini generateContent, with keys drawn from a CredentialPool
class GeminiProvider : public HttpProvider {
public:
    GeminiProvider(ProviderConfig config, std::shared_ptr<CredentialPool> credentials);

    std::string complete(const std::string& model_id,
                         const std::string& system_prompt,
                         const std::string& user_prompt) override;

    std::shared_ptr<CredentialPool> credentials() const { return credentials_; }

    /// @brief Gemini has no system role; the system prompt is prepended to the user turn
    static nlohmann::json build_request(const std::string& system_prompt,
                                        const std::string& user_prompt,
                                        float temperature, int max_tokens);

    /// @brief candidates[0].content.parts[0].text
    static std::string extract_text(const nlohmann::json& reply);

private:
    std::shared_ptr<CredentialPool> credentials_;
};

/// @brief Self-hosted model runner speaking the OpenAI wire format
/// Local model ids are brought up through the lifecycle manager first.
class LocalProvider : public HttpProvider {
public:
    LocalProvider(ProviderConfig config, std::string endpoint, LocalModelManager* models);

    bool is_local() const override { return true; }

    std::string complete(const std::string& model_id,
                         const std::string& system_prompt,
                         const std::string& user_prompt) override;

private:
    std::string endpoint_;
    LocalModelManager* models_;
};

/// @brief Everything the failover engine and the API need from the provider set
struct ProviderSet {
    std::vector<std::shared_ptr<LLMProvider>> providers;
    std::map<std::string, std::shared_ptr<CredentialPool>> credential_pools;
    std::vector<ProviderConfig> definitions;
};

/// @brief Create one provider from its definition
/// @throws ConfigError for an unknown type
std::shared_ptr<LLMProvider> create_provider(const ProviderConfig& definition,
                                             const Config& config,
                                             LocalModelManager* models,
                                             ProviderSet& set);

/// @brief Build providers from llm.providers, the providers directory and
/// type defaults for any priority-order name left undefined
ProviderSet build_providers(const Config& config, LocalModelManager* models);
