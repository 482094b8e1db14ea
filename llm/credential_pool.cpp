#include "dirgen.h"
#include "llm/credential_pool.h"
#include "llm/llm_provider.h"

#include <algorithm>
#include <cstdlib>

using json = nlohmann::json;

CredentialPool::CredentialPool(const std::string& provider,
                               const std::vector<std::pair<std::string, std::string>>& credentials,
                               std::chrono::seconds cooldown)
    : provider_(provider), cooldown_(cooldown), started_at_(Clock::now()) {
    if (credentials.empty()) {
        throw ProviderError("No credentials configured for " + provider);
    }
    for (const auto& [id, secret] : credentials) {
        ProviderCredential cred;
        cred.id = id;
        cred.secret = secret;
        credentials_.push_back(std::move(cred));
    }
    LOG_INFO("Credential pool for " + provider_ + " initialized with " +
             std::to_string(credentials_.size()) + " key(s)");
}

std::unique_ptr<CredentialPool> CredentialPool::from_environment(const std::string& provider,
                                                                 const std::string& env_prefix,
                                                                 std::chrono::seconds cooldown) {
    std::vector<std::pair<std::string, std::string>> found;

    for (int i = 1; i <= 9; i++) {
        std::string var = env_prefix + "_API_KEY_" + std::to_string(i);
        const char* value = getenv(var.c_str());
        // "..." is the placeholder in example env files
        if (value && value[0] != '\0' && std::string(value).rfind("...", 0) != 0) {
            found.emplace_back("key_" + std::to_string(i), value);
        }
    }

    if (found.empty()) {
        const char* single = getenv((env_prefix + "_API_KEY").c_str());
        if (single && single[0] != '\0') {
            found.emplace_back("key_single", single);
        }
    }

    if (found.empty()) {
        throw ProviderError("No API keys found for " + provider + " (set " + env_prefix +
                            "_API_KEY or " + env_prefix + "_API_KEY_1..9)");
    }
    return std::make_unique<CredentialPool>(provider, found, cooldown);
}

ProviderCredential CredentialPool::current() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (credentials_.size() == 1) {
        return credentials_.front();
    }

    auto now = clock_();
    std::vector<size_t> available;
    for (size_t i = 0; i < credentials_.size(); i++) {
        if (credentials_[i].available(now)) {
            available.push_back(i);
        }
    }

    if (available.empty()) {
        LOG_WARN("All " + provider_ + " keys are cooling down, using the one that recovers first");
        auto best = std::min_element(credentials_.begin(), credentials_.end(),
            [](const ProviderCredential& a, const ProviderCredential& b) {
                auto ta = a.cooldown_until.value_or(Clock::time_point::min());
                auto tb = b.cooldown_until.value_or(Clock::time_point::min());
                return ta < tb;
            });
        return *best;
    }

    if (next_index_ >= available.size()) {
        next_index_ = 0;
    }
    const ProviderCredential& selected = credentials_[available[next_index_]];
    next_index_ = (next_index_ + 1) % available.size();

    dprintf(2, "Using %s credential %s", provider_.c_str(), selected.id.c_str());
    return selected;
}

void CredentialPool::report(const std::string& id, bool success, const std::string& error_text) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = std::find_if(credentials_.begin(), credentials_.end(),
                           [&id](const ProviderCredential& c) { return c.id == id; });
    if (it == credentials_.end()) {
        LOG_WARN("Result reported for unknown " + provider_ + " credential: " + id);
        return;
    }

    auto now = clock_();
    it->last_used = now;
    it->total_requests++;

    if (success) {
        it->successful_requests++;
        it->consecutive_failures = 0;
        return;
    }

    it->consecutive_failures++;
    if (is_credential_rate_limit(error_text)) {
        it->cooldown_until = now + cooldown_;
        LOG_WARN("Rate limit on " + provider_ + " credential " + it->id + ", cooling down for " +
                 std::to_string(cooldown_.count()) + "s");
    } else {
        LOG_WARN("Error on " + provider_ + " credential " + it->id + ": " + dirgen::truncate(error_text, 100));
    }
}

void CredentialPool::reset(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& cred : credentials_) {
        if (id.empty() || cred.id == id) {
            cred.cooldown_until.reset();
            cred.consecutive_failures = 0;
            cred.active = true;
        }
    }
    LOG_INFO("Reset " + provider_ + " credential state: " + (id.empty() ? std::string("all") : id));
}

size_t CredentialPool::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return credentials_.size();
}

size_t CredentialPool::available_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = clock_();
    return std::count_if(credentials_.begin(), credentials_.end(),
                         [now](const ProviderCredential& c) { return c.available(now); });
}

json CredentialPool::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = clock_();

    uint64_t total = 0;
    uint64_t successful = 0;
    size_t available = 0;
    json details = json::object();

    for (const auto& cred : credentials_) {
        total += cred.total_requests;
        successful += cred.successful_requests;
        if (cred.available(now)) {
            available++;
        }
        details[cred.id] = {
            {"total_requests", cred.total_requests},
            {"successful_requests", cred.successful_requests},
            {"success_rate", cred.success_rate()},
            {"consecutive_failures", cred.consecutive_failures},
            {"is_available", cred.available(now)},
            {"last_used", cred.last_used ? json(dirgen::format_iso_time(*cred.last_used)) : json(nullptr)},
            {"rate_limit_until", cred.cooldown_until ? json(dirgen::format_iso_time(*cred.cooldown_until)) : json(nullptr)}
        };
    }

    auto uptime = std::chrono::duration_cast<std::chrono::seconds>(Clock::now() - started_at_).count();
    return json{
        {"provider", provider_},
        {"total_keys", credentials_.size()},
        {"available_keys", available},
        {"total_requests", total},
        {"successful_requests", successful},
        {"overall_success_rate", total == 0 ? 1.0 : static_cast<double>(successful) / total},
        {"uptime_minutes", uptime / 60.0},
        {"key_details", details}
    };
}
