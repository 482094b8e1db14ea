#pragma once

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>

#include "llm/llm_provider.h"
#include "llm/response_cache.h"

/// @brief One call surface over several interchangeable model backends
/// Candidates are tried in priority order (reordered per task class) until
/// one answers. A rate-limit failure on a cloud provider triggers one
/// immediate attempt on the local fallback before the loop moves on. No
/// single failure is fatal; only exhausting every candidate raises.
class FailoverEngine {
public:
    struct Options {
        std::vector<std::string> priority_order{"gemini", "local"};
        std::string local_fallback = "local";
    };

    FailoverEngine(std::vector<std::shared_ptr<LLMProvider>> providers,
                   Options options,
                   std::shared_ptr<ResponseCache> cache);

    /// @brief Answer a prompt pair with the first provider that succeeds
    /// @throws ProviderExhaustedError when every candidate failed
    std::string ask(const std::string& model_id,
                    const std::string& system_prompt,
                    const std::string& user_prompt,
                    TaskClass task,
                    bool use_cache = true);

    /// @brief Provider names in the order ask() will try them for task
    std::vector<std::string> order_for(TaskClass task) const;

    bool has_provider(const std::string& name) const;
    std::vector<std::string> provider_names() const;

    nlohmann::json stats() const;

private:
    std::shared_ptr<LLMProvider> find(const std::string& name) const;

    std::map<std::string, std::shared_ptr<LLMProvider>> providers_;
    Options options_;
    std::shared_ptr<ResponseCache> cache_;

    mutable std::mutex stats_mutex_;
    uint64_t requests_ = 0;
    uint64_t cache_hits_ = 0;
    uint64_t rate_limits_ = 0;
    uint64_t emergency_fallbacks_ = 0;
    uint64_t exhausted_ = 0;
    std::map<std::string, uint64_t> successes_;
    std::map<std::string, uint64_t> failures_;
};
