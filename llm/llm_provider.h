#pragma once

#include <string>
#include <optional>
#include <stdexcept>

/// @brief Raised by a provider when one completion attempt fails
/// The failover engine classifies it by message text, never by type.
class ProviderError : public std::runtime_error {
public:
    explicit ProviderError(const std::string& message) : std::runtime_error(message) {}
};

/// @brief Raised when every candidate provider has failed
class ProviderExhaustedError : public std::runtime_error {
public:
    explicit ProviderExhaustedError(const std::string& message) : std::runtime_error(message) {}
};

/// @brief What a completion is for; drives ordering and cacheability
enum class TaskClass {
    Planning,
    ComplexGeneration,
    Architecture,
    Verification,
    Validation,
    SimpleGeneration,
    General
};

std::string to_string(TaskClass task);
std::optional<TaskClass> parse_task_class(const std::string& name);

/// @brief Verification, validation and simple generation answers are reused
bool is_cacheable(TaskClass task);

/// @brief Kinds of provider failure, by message text
enum class ProviderFailure {
    RateLimit,
    Credential,
    Connectivity,
    Other
};

ProviderFailure classify_provider_error(const std::string& message);

/// @brief Narrow rate-limit check used by the credential pool
bool is_credential_rate_limit(const std::string& message);

/// @brief Broader rate-limit check used by the failover breaker
bool is_rate_limit_error(const std::string& message);

/// @brief One language-model backend
class LLMProvider {
public:
    virtual ~LLMProvider() = default;

    /// @brief Registry name ("gemini", "local", ...)
    virtual std::string name() const = 0;

    /// @brief True for the self-hosted backend
    virtual bool is_local() const { return false; }

    /// @brief Run one completion
    /// @throws ProviderError on any failure, including timeouts
    virtual std::string complete(const std::string& model_id,
                                 const std::string& system_prompt,
                                 const std::string& user_prompt) = 0;
};
