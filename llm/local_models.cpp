#include "dirgen.h"
#include "llm/local_models.h"
#include "workers/process_util.h"

#include <algorithm>
#include <sstream>

using json = nlohmann::json;

// ---------------------------------------------------------------------------
// DockerModelRuntime
// ---------------------------------------------------------------------------

DockerModelRuntime::DockerModelRuntime(const std::string& command) : command_(command) {
}

std::vector<std::string> DockerModelRuntime::parse_ps_output(const std::string& output) {
    std::vector<std::string> models;
    std::istringstream stream(output);
    std::string line;
    bool header = true;

    while (std::getline(stream, line)) {
        if (header) {
            header = false;
            continue;
        }
        // MODEL NAME  BACKEND  MODE  LAST USED
        std::istringstream columns(line);
        std::string name;
        if (columns >> name) {
            models.push_back(name);
        }
    }
    return models;
}

std::vector<std::string> DockerModelRuntime::list_running() {
    CommandResult result = process::run_command({command_, "model", "ps"}, std::chrono::seconds(10));
    if (result.timed_out) {
        LOG_WARN("Timed out listing local models");
        return {};
    }
    if (!result.success()) {
        LOG_WARN("'" + command_ + " model ps' failed: " + dirgen::truncate(result.stderr_output, 200));
        return {};
    }
    return parse_ps_output(result.stdout_output);
}

int DockerModelRuntime::start(const std::string& model_id) {
    // `model run` needs a prompt to load the model; the answer is discarded
    process::SpawnOptions options;
    options.quiet = true;
    return process::spawn({command_, "model", "run", model_id, "Hello"}, options);
}

void DockerModelRuntime::abort_start(int handle) {
    process::terminate(handle, std::chrono::seconds(5));
}

bool DockerModelRuntime::stop(const std::string& model_id) {
    CommandResult result = process::run_command({command_, "model", "unload", model_id}, std::chrono::seconds(15));
    if (!result.success()) {
        std::string error = result.stderr_output.empty() ? result.stdout_output : result.stderr_output;
        LOG_WARN("Problem unloading " + model_id + ": " +
                 (result.timed_out ? std::string("timed out") : dirgen::truncate(error, 200)));
        return false;
    }
    return true;
}

// ---------------------------------------------------------------------------
// LocalModelManager
// ---------------------------------------------------------------------------

std::string to_string(BackendState state) {
    switch (state) {
        case BackendState::Unmanaged: return "unmanaged";
        case BackendState::Starting:  return "starting";
        case BackendState::Running:   return "running";
        case BackendState::Stopped:   return "stopped";
    }
    return "unknown";
}

LocalModelManager::LocalModelManager(std::unique_ptr<ModelRuntime> runtime, Options options)
    : runtime_(std::move(runtime)), options_(std::move(options)) {
    LOG_INFO("Local model manager: idle timeout " +
             std::to_string(std::chrono::duration_cast<std::chrono::seconds>(options_.idle_timeout).count()) +
             "s, max concurrent " + std::to_string(options_.max_concurrent));
}

LocalModelManager::~LocalModelManager() {
    stop();
}

void LocalModelManager::touch(ModelLease& lease) {
    lease.last_used = Clock::now();
    lease.use_tick = ++tick_;
    lease.invocations++;
}

size_t LocalModelManager::running_count_locked() const {
    return std::count_if(leases_.begin(), leases_.end(),
                         [](const auto& entry) { return entry.second.state == BackendState::Running; });
}

size_t LocalModelManager::occupied_count_locked() const {
    return std::count_if(leases_.begin(), leases_.end(), [](const auto& entry) {
        return entry.second.state == BackendState::Running || entry.second.state == BackendState::Starting;
    });
}

size_t LocalModelManager::running_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_count_locked();
}

BackendState LocalModelManager::state(const std::string& model_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = leases_.find(model_id);
    return it == leases_.end() ? BackendState::Unmanaged : it->second.state;
}

bool LocalModelManager::manages(const std::string& model_id) const {
    return !model_id.empty() && model_id.rfind(options_.model_prefix, 0) == 0;
}

bool LocalModelManager::ensure_running(const std::string& model_id) {
    if (!manages(model_id)) {
        LOG_WARN("Not a local model id: " + model_id);
        return false;
    }

    std::unique_lock<std::mutex> lock(mutex_);
    // One start per model at a time; later callers wait for its outcome
    state_changed_.wait(lock, [&] {
        auto it = leases_.find(model_id);
        return it == leases_.end() || it->second.state != BackendState::Starting;
    });
    ModelLease& lease = leases_[model_id];

    auto running = runtime_->list_running();
    if (std::find(running.begin(), running.end(), model_id) != running.end()) {
        if (lease.state != BackendState::Running) {
            lease.state = BackendState::Running;
            lease.started_at = Clock::now();
        }
        touch(lease);
        return true;
    }

    if (lease.state == BackendState::Running) {
        // Unloaded behind our back
        LOG_WARN("Local model " + model_id + " is no longer loaded");
        lease.state = BackendState::Stopped;
    }

    if (occupied_count_locked() >= static_cast<size_t>(options_.max_concurrent)) {
        LOG_WARN("Local model ceiling reached (" + std::to_string(options_.max_concurrent) + ")");
        if (!evict_least_recent_locked()) {
            LOG_ERROR("No room to start local model " + model_id);
            return false;
        }
    }

    LOG_INFO("Starting local model " + model_id);
    auto started = Clock::now();
    int launcher = -1;
    try {
        launcher = runtime_->start(model_id);
    } catch (const std::exception& e) {
        LOG_ERROR("Could not start local model " + model_id + ": " + e.what());
        lease.state = BackendState::Stopped;
        lease.launcher = -1;
        return false;
    }
    // Starting holds the slot while the lock is released for polling
    lease.state = BackendState::Starting;
    lease.launcher = launcher;
    lock.unlock();

    bool up = false;
    for (int attempt = 1; attempt <= options_.poll_attempts; attempt++) {
        running = runtime_->list_running();
        if (std::find(running.begin(), running.end(), model_id) != running.end()) {
            up = true;
            break;
        }
        if (attempt < options_.poll_attempts) {
            dprintf(1, "Waiting for %s (attempt %d/%d)", model_id.c_str(), attempt, options_.poll_attempts);
            std::this_thread::sleep_for(options_.poll_interval);
        }
    }

    lock.lock();
    if (lease.state != BackendState::Starting) {
        // force_stop_all() got there first
        LOG_WARN("Start of local model " + model_id + " was cancelled");
        state_changed_.notify_all();
        return false;
    }

    if (up) {
        lease.state = BackendState::Running;
        lease.started_at = Clock::now();
        touch(lease);
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started).count();
        LOG_INFO("Local model " + model_id + " is up after " + std::to_string(elapsed) + "ms");
    } else {
        LOG_ERROR("Local model " + model_id + " did not come up after " +
                  std::to_string(options_.poll_attempts) + " checks");
        runtime_->abort_start(lease.launcher);
        lease.launcher = -1;
        lease.state = BackendState::Stopped;
    }
    state_changed_.notify_all();
    return up;
}

bool LocalModelManager::evict_least_recent_locked() {
    auto victim = leases_.end();
    for (auto it = leases_.begin(); it != leases_.end(); ++it) {
        if (it->second.state != BackendState::Running) {
            continue;
        }
        if (victim == leases_.end() || it->second.use_tick < victim->second.use_tick) {
            victim = it;
        }
    }
    if (victim == leases_.end()) {
        LOG_WARN("No managed local model to evict");
        return false;
    }
    if (!stop_locked(victim->first, "making room for another model")) {
        LOG_WARN("Could not evict local model " + victim->first);
        return false;
    }
    return true;
}

bool LocalModelManager::stop_locked(const std::string& model_id, const std::string& reason) {
    auto it = leases_.find(model_id);
    if (it == leases_.end()) {
        return false;
    }
    ModelLease& lease = it->second;
    LOG_INFO("Stopping local model " + model_id + " (" + reason + ")");

    if (lease.launcher > 0) {
        runtime_->abort_start(lease.launcher);
        lease.launcher = -1;
    }
    if (!runtime_->stop(model_id)) {
        return false;
    }
    lease.state = BackendState::Stopped;
    return true;
}

size_t LocalModelManager::sweep_idle() {
    return sweep_idle(Clock::now());
}

size_t LocalModelManager::sweep_idle(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> idle;
    for (const auto& [id, lease] : leases_) {
        if (lease.state == BackendState::Running && now - lease.last_used > options_.idle_timeout) {
            idle.push_back(id);
        }
    }

    size_t stopped = 0;
    for (const auto& id : idle) {
        if (stop_locked(id, "idle timeout")) {
            stopped++;
        }
    }
    if (stopped > 0) {
        LOG_INFO("Idle sweep stopped " + std::to_string(stopped) + " local model(s)");
    }
    return stopped;
}

void LocalModelManager::start() {
    std::lock_guard<std::mutex> lock(sweeper_mutex_);
    if (sweeper_running_) {
        return;
    }
    sweeper_running_ = true;
    sweeper_ = std::thread(&LocalModelManager::sweeper_loop, this);
    dprintf(1, "Local model sweeper started");
}

void LocalModelManager::stop() {
    {
        std::lock_guard<std::mutex> lock(sweeper_mutex_);
        if (!sweeper_running_) {
            return;
        }
        sweeper_running_ = false;
    }
    sweeper_cv_.notify_all();
    if (sweeper_.joinable()) {
        sweeper_.join();
    }
    dprintf(1, "Local model sweeper stopped");
}

void LocalModelManager::sweeper_loop() {
    std::unique_lock<std::mutex> lock(sweeper_mutex_);
    while (sweeper_running_) {
        sweeper_cv_.wait_for(lock, options_.sweep_interval, [this] { return !sweeper_running_; });
        if (!sweeper_running_) {
            break;
        }
        lock.unlock();
        try {
            sweep_idle();
        } catch (const std::exception& e) {
            LOG_ERROR(std::string("Idle sweep failed: ") + e.what());
        }
        lock.lock();
    }
}

void LocalModelManager::force_stop_all() {
    stop();

    std::lock_guard<std::mutex> lock(mutex_);
    LOG_INFO("Stopping all managed local models");
    for (auto& [id, lease] : leases_) {
        if (lease.state == BackendState::Running || lease.state == BackendState::Starting) {
            if (!stop_locked(id, "shutdown")) {
                LOG_WARN("Local model " + id + " may still be loaded");
            }
        }
    }
    state_changed_.notify_all();
}

json LocalModelManager::stats() {
    auto running = runtime_->list_running();
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = Clock::now();

    json details = json::object();
    json managed = json::array();
    for (const auto& [id, lease] : leases_) {
        managed.push_back(id);
        details[id] = {
            {"state", to_string(lease.state)},
            {"invocations", lease.invocations},
            {"idle_seconds", std::chrono::duration_cast<std::chrono::seconds>(now - lease.last_used).count()}
        };
    }

    return json{
        {"running_models", running},
        {"active_count", running.size()},
        {"managed_running", running_count_locked()},
        {"max_concurrent", options_.max_concurrent},
        {"managed_models", managed},
        {"cleanup_active", sweeper_running_.load()},
        {"model_details", details}
    };
}
