#include "dirgen.h"
#include "llm/llm_provider.h"

#include <map>

namespace {

const std::map<TaskClass, std::string> task_names = {
    {TaskClass::Planning, "planning"},
    {TaskClass::ComplexGeneration, "complex_generation"},
    {TaskClass::Architecture, "architecture"},
    {TaskClass::Verification, "verification"},
    {TaskClass::Validation, "validation"},
    {TaskClass::SimpleGeneration, "simple_generation"},
    {TaskClass::General, "general"}
};

const char* const CREDENTIAL_RATE_LIMIT_MARKERS[] = {
    "rate limit", "too many requests", "quota exceeded", "429"
};

// Superset used by the failover breaker, including localized (Spanish) messages
const char* const RATE_LIMIT_MARKERS[] = {
    "rate limit", "too many requests", "quota exceeded", "429",
    "demasiadas peticiones", "límite excedido", "quota_exceeded",
    "rate_limit_exceeded", "usage_limit"
};

const char* const CONNECTIVITY_MARKERS[] = {
    "timeout", "timed out", "connection", "network"
};

template<size_t N>
bool contains_any(const std::string& haystack, const char* const (&needles)[N]) {
    for (const char* needle : needles) {
        if (haystack.find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

} // namespace

std::string to_string(TaskClass task) {
    return task_names.at(task);
}

std::optional<TaskClass> parse_task_class(const std::string& name) {
    std::string lower = dirgen::to_lower(name);
    for (const auto& [task, n] : task_names) {
        if (n == lower) {
            return task;
        }
    }
    return std::nullopt;
}

bool is_cacheable(TaskClass task) {
    return task == TaskClass::Verification ||
           task == TaskClass::Validation ||
           task == TaskClass::SimpleGeneration;
}

bool is_credential_rate_limit(const std::string& message) {
    return contains_any(dirgen::to_lower(message), CREDENTIAL_RATE_LIMIT_MARKERS);
}

bool is_rate_limit_error(const std::string& message) {
    return contains_any(dirgen::to_lower(message), RATE_LIMIT_MARKERS);
}

ProviderFailure classify_provider_error(const std::string& message) {
    std::string lower = dirgen::to_lower(message);
    if (contains_any(lower, RATE_LIMIT_MARKERS)) {
        return ProviderFailure::RateLimit;
    }
    if (lower.find("api") != std::string::npos && lower.find("key") != std::string::npos) {
        return ProviderFailure::Credential;
    }
    if (contains_any(lower, CONNECTIVITY_MARKERS)) {
        return ProviderFailure::Connectivity;
    }
    return ProviderFailure::Other;
}
