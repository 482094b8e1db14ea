#pragma once

#include <string>
#include <vector>
#include <mutex>
#include <memory>
#include <chrono>
#include <optional>
#include <nlohmann/json.hpp>

/// @brief One secret for a provider plus its health bookkeeping
struct ProviderCredential {
    using Clock = std::chrono::system_clock;

    std::string id;
    std::string secret;
    bool active = true;
    std::optional<Clock::time_point> last_used;
    int consecutive_failures = 0;
    std::optional<Clock::time_point> cooldown_until;
    uint64_t total_requests = 0;
    uint64_t successful_requests = 0;

    bool in_cooldown(Clock::time_point now) const {
        return cooldown_until && now < *cooldown_until;
    }
    bool available(Clock::time_point now) const {
        return active && !in_cooldown(now);
    }
    double success_rate() const {
        return total_requests == 0 ? 1.0 : static_cast<double>(successful_requests) / total_requests;
    }
};

/// @brief Round-robin rotation over equivalent credentials of one provider
/// All selection and reporting happens under one lock. A rate-limited
/// credential is skipped for the cooldown window while any other is
/// available; when none is, the one whose cooldown ends first is used.
class CredentialPool {
public:
    using Clock = ProviderCredential::Clock;
    using ClockFn = Clock::time_point (*)();

    /// @param provider Name used in log lines
    /// @param credentials (id, secret) pairs, at least one
    CredentialPool(const std::string& provider,
                   const std::vector<std::pair<std::string, std::string>>& credentials,
                   std::chrono::seconds cooldown = std::chrono::minutes(5));

    /// @brief Load PREFIX_API_KEY_1..9, falling back to PREFIX_API_KEY
    /// @throws ProviderError if no key is set
    static std::unique_ptr<CredentialPool> from_environment(const std::string& provider,
                                                            const std::string& env_prefix,
                                                            std::chrono::seconds cooldown);

    /// @brief Pick the credential for the next request
    ProviderCredential current();

    /// @brief Record the outcome of a request made with credential id
    void report(const std::string& id, bool success, const std::string& error_text = "");

    /// @brief Clear cooldown and failures for one id, or all when empty
    void reset(const std::string& id = "");

    size_t size() const;
    size_t available_count() const;
    nlohmann::json stats() const;

    /// @brief Replace the clock (tests)
    void set_clock(ClockFn clock) { clock_ = clock; }

private:
    std::string provider_;
    std::vector<ProviderCredential> credentials_;
    std::chrono::seconds cooldown_;
    size_t next_index_ = 0;
    Clock::time_point started_at_;
    ClockFn clock_ = &Clock::now;
    mutable std::mutex mutex_;
};
