#include "dirgen.h"
#include "llm/failover.h"

#include <algorithm>
#include <set>

using json = nlohmann::json;

FailoverEngine::FailoverEngine(std::vector<std::shared_ptr<LLMProvider>> providers,
                               Options options,
                               std::shared_ptr<ResponseCache> cache)
    : options_(std::move(options)), cache_(std::move(cache)) {
    for (auto& provider : providers) {
        if (!provider) {
            continue;
        }
        std::string name = provider->name();
        if (providers_.count(name)) {
            LOG_WARN("Duplicate provider '" + name + "', keeping the first");
            continue;
        }
        providers_[name] = std::move(provider);
    }

    std::string order;
    for (const auto& name : options_.priority_order) {
        if (!order.empty()) order += ", ";
        order += name;
        if (!providers_.count(name)) {
            LOG_WARN("Provider '" + name + "' is in the priority order but not configured");
        }
    }
    LOG_INFO("LLM failover order: " + order);
}

std::shared_ptr<LLMProvider> FailoverEngine::find(const std::string& name) const {
    auto it = providers_.find(name);
    return it == providers_.end() ? nullptr : it->second;
}

bool FailoverEngine::has_provider(const std::string& name) const {
    return providers_.count(name) > 0;
}

std::vector<std::string> FailoverEngine::provider_names() const {
    std::vector<std::string> names;
    for (const auto& [name, provider] : providers_) {
        names.push_back(name);
    }
    return names;
}

std::vector<std::string> FailoverEngine::order_for(TaskClass task) const {
    const auto& base = options_.priority_order;

    switch (task) {
        case TaskClass::SimpleGeneration: {
            // Local first, then the rest of the base order
            std::vector<std::string> order{options_.local_fallback};
            for (const auto& name : base) {
                if (name != options_.local_fallback) {
                    order.push_back(name);
                }
            }
            return order;
        }
        case TaskClass::Planning:
        case TaskClass::ComplexGeneration:
        case TaskClass::Architecture:
        default:
            return base;
    }
}

std::string FailoverEngine::ask(const std::string& model_id,
                                const std::string& system_prompt,
                                const std::string& user_prompt,
                                TaskClass task,
                                bool use_cache) {
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        requests_++;
    }

    bool cacheable = use_cache && cache_ && is_cacheable(task);
    std::string cache_key;
    if (cacheable) {
        cache_key = cache_->make_key(system_prompt, user_prompt);
        auto hit = cache_->get(cache_key);
        if (hit) {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            cache_hits_++;
            dprintf(1, "Cache hit for %s request", to_string(task).c_str());
            return *hit;
        }
    }

    auto order = order_for(task);
    std::set<std::string> attempted;
    bool rate_limited = false;
    std::string last_error = "no provider configured";

    // Returns true and fills result on success; records the failure otherwise
    auto attempt = [&](const std::string& name, std::string& result) -> bool {
        auto provider = find(name);
        if (!provider) {
            last_error = "Provider '" + name + "' is not configured";
            return false;
        }
        attempted.insert(name);
        try {
            result = provider->complete(model_id, system_prompt, user_prompt);
            std::lock_guard<std::mutex> lock(stats_mutex_);
            successes_[name]++;
            return true;
        } catch (const std::exception& e) {
            last_error = e.what();
            std::lock_guard<std::mutex> lock(stats_mutex_);
            failures_[name]++;
            return false;
        }
    };

    auto finish = [&](const std::string& name, const std::string& result) {
        if (cacheable) {
            cache_->put(cache_key, result);
        }
        LOG_INFO("LLM request (" + to_string(task) + ") answered by " + name);
        return result;
    };

    for (const auto& name : order) {
        if (attempted.count(name)) {
            continue;
        }

        std::string result;
        if (attempt(name, result)) {
            return finish(name, result);
        }

        switch (classify_provider_error(last_error)) {
            case ProviderFailure::RateLimit: {
                rate_limited = true;
                {
                    std::lock_guard<std::mutex> lock(stats_mutex_);
                    rate_limits_++;
                }
                LOG_WARN("Rate limit on provider " + name + ": " + dirgen::truncate(last_error, 200));

                const std::string& fallback = options_.local_fallback;
                if (name != fallback && !attempted.count(fallback) && find(fallback)) {
                    LOG_WARN("Trying " + fallback + " as emergency fallback after rate limit on " + name);
                    {
                        std::lock_guard<std::mutex> lock(stats_mutex_);
                        emergency_fallbacks_++;
                    }
                    if (attempt(fallback, result)) {
                        return finish(fallback, result);
                    }
                    LOG_WARN("Emergency fallback " + fallback + " failed: " + dirgen::truncate(last_error, 200));
                }
                break;
            }
            case ProviderFailure::Credential:
                LOG_WARN("Credential error on provider " + name + ": " + dirgen::truncate(last_error, 200));
                break;
            case ProviderFailure::Connectivity:
                LOG_WARN("Connectivity error on provider " + name + ": " + dirgen::truncate(last_error, 200));
                break;
            case ProviderFailure::Other:
                LOG_WARN("Provider " + name + " failed: " + dirgen::truncate(last_error, 200));
                break;
        }
    }

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        exhausted_++;
    }

    std::string message = "All providers failed for task '" + to_string(task) + "'. ";
    if (rate_limited) {
        message += "Rate limits detected on one or more providers. ";
    }
    message += "Last error: " + last_error;
    LOG_ERROR(message);
    throw ProviderExhaustedError(message);
}

json FailoverEngine::stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    json per_provider = json::object();
    for (const auto& [name, provider] : providers_) {
        auto s = successes_.find(name);
        auto f = failures_.find(name);
        per_provider[name] = {
            {"local", provider->is_local()},
            {"successes", s == successes_.end() ? 0 : s->second},
            {"failures", f == failures_.end() ? 0 : f->second}
        };
    }
    json result = {
        {"requests", requests_},
        {"cache_hits", cache_hits_},
        {"rate_limits", rate_limits_},
        {"emergency_fallbacks", emergency_fallbacks_},
        {"exhausted", exhausted_},
        {"priority_order", options_.priority_order},
        {"local_fallback", options_.local_fallback},
        {"providers", per_provider}
    };
    if (cache_) {
        result["cache"] = cache_->stats();
    }
    return result;
}
