#pragma once

#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <atomic>
#include <memory>
#include <thread>
#include <chrono>
#include <optional>
#include <condition_variable>
#include <nlohmann/json.hpp>

/// @brief The execution environment that hosts local model backends
/// Kept behind an interface so the lifecycle manager can run against a fake.
class ModelRuntime {
public:
    virtual ~ModelRuntime() = default;

    /// @brief Ids of the backends currently loaded
    virtual std::vector<std::string> list_running() = 0;

    /// @brief Begin loading a backend without waiting for it
    /// @return launcher handle for abort_start()
    /// @throws ProcessLaunchError if the launcher cannot be started
    virtual int start(const std::string& model_id) = 0;

    /// @brief Kill a launcher returned by start()
    virtual void abort_start(int handle) = 0;

    /// @brief Unload a backend
    /// @return true if it was unloaded
    virtual bool stop(const std::string& model_id) = 0;
};

/// @brief ModelRuntime backed by the `docker model` CLI
class DockerModelRuntime : public ModelRuntime {
public:
    explicit DockerModelRuntime(const std::string& command = "docker");

    std::vector<std::string> list_running() override;
    int start(const std::string& model_id) override;
    void abort_start(int handle) override;
    bool stop(const std::string& model_id) override;

    /// @brief Model names from `model ps` output (header line skipped)
    static std::vector<std::string> parse_ps_output(const std::string& output);

private:
    std::string command_;
};

enum class BackendState {
    Unmanaged,
    Starting,
    Running,
    Stopped
};

std::string to_string(BackendState state);

/// @brief Concurrency-capped lifecycle for local model backends
/// Start/stop decisions and the ceiling check happen under one mutex. A
/// starting backend holds its slot in the Starting state while the lock is
/// released for the readiness poll, so other models stay usable meanwhile.
/// Leases of stopped backends are kept in the Stopped state so a re-request
/// goes back through Starting.
class LocalModelManager {
public:
    using Clock = std::chrono::steady_clock;

    struct Options {
        std::chrono::milliseconds idle_timeout{std::chrono::seconds(300)};
        int max_concurrent = 2;
        int poll_attempts = 12;
        std::chrono::milliseconds poll_interval{std::chrono::seconds(5)};
        std::chrono::milliseconds sweep_interval{std::chrono::seconds(30)};
        std::string model_prefix = "ai/";
    };

    LocalModelManager(std::unique_ptr<ModelRuntime> runtime, Options options);
    ~LocalModelManager();

    LocalModelManager(const LocalModelManager&) = delete;
    LocalModelManager& operator=(const LocalModelManager&) = delete;

    /// @brief Make sure model_id is loaded, starting it if needed
    /// Evicts the least recently used managed backend when at the ceiling.
    /// Concurrent calls for a model that is starting wait for that start.
    /// @return false if the id is not a local model, no slot could be freed,
    /// or it did not come up
    bool ensure_running(const std::string& model_id);

    /// @brief True if model_id carries the local model prefix
    bool manages(const std::string& model_id) const;

    /// @brief Stop every Running lease idle longer than the timeout
    /// @return number of backends stopped
    size_t sweep_idle();
    size_t sweep_idle(Clock::time_point now);

    /// @brief Stop the sweeper and every managed backend
    void force_stop_all();

    /// @brief Background idle sweep
    void start();
    void stop();
    bool sweeper_running() const { return sweeper_running_; }

    BackendState state(const std::string& model_id) const;
    size_t running_count() const;
    nlohmann::json stats();

private:
    struct ModelLease {
        BackendState state = BackendState::Unmanaged;
        Clock::time_point started_at{};
        Clock::time_point last_used{};
        uint64_t use_tick = 0;
        uint64_t invocations = 0;
        int launcher = -1;
    };

    void touch(ModelLease& lease);
    size_t running_count_locked() const;
    size_t occupied_count_locked() const;
    bool evict_least_recent_locked();
    bool stop_locked(const std::string& model_id, const std::string& reason);
    void sweeper_loop();

    std::unique_ptr<ModelRuntime> runtime_;
    Options options_;

    mutable std::mutex mutex_;
    std::map<std::string, ModelLease> leases_;
    std::condition_variable state_changed_;
    uint64_t tick_ = 0;

    std::thread sweeper_;
    std::mutex sweeper_mutex_;
    std::condition_variable sweeper_cv_;
    std::atomic<bool> sweeper_running_{false};
};
