#include "dirgen.h"
#include "workers/supervisor.h"

using json = nlohmann::json;

int PosixProcessSpawner::spawn(const std::vector<std::string>& argv,
                               const std::map<std::string, std::string>& env,
                               const std::string& working_dir) {
    process::SpawnOptions options;
    options.env = env;
    options.working_dir = working_dir;
    return static_cast<int>(process::spawn(argv, options));
}

std::optional<int> PosixProcessSpawner::poll_exit(int pid) {
    return process::try_reap(static_cast<pid_t>(pid));
}

json WorkerInvocation::to_json() const {
    return json{
        {"run_id", run_id},
        {"stage", to_string(stage)},
        {"pid", pid},
        {"started_at", dirgen::format_iso_time(started_at)},
        {"command", process::join_command(argv)}
    };
}

WorkerSupervisor::WorkerSupervisor(std::unique_ptr<ProcessSpawner> spawner,
                                   std::map<Stage, StageCommand> commands,
                                   Options options)
    : spawner_(std::move(spawner))
    , commands_(std::move(commands))
    , options_(std::move(options)) {
}

WorkerSupervisor::~WorkerSupervisor() {
    stop();
}

bool WorkerSupervisor::has_stage(Stage stage) const {
    auto it = commands_.find(stage);
    return it != commands_.end() && it->second.configured();
}

std::vector<std::string> WorkerSupervisor::build_command(const std::string& run_id, Stage stage,
                                                         const std::string& input_path,
                                                         const std::optional<std::string>& feedback) const {
    auto it = commands_.find(stage);
    if (it == commands_.end() || !it->second.configured()) {
        throw ProcessLaunchError("No command configured for stage " + to_string(stage));
    }
    const StageCommand& cmd = it->second;

    std::vector<std::string> argv;
    argv.push_back(cmd.command);
    argv.insert(argv.end(), cmd.args.begin(), cmd.args.end());
    argv.push_back("--run-id");
    argv.push_back(run_id);
    argv.push_back(cmd.input_flag);
    argv.push_back(input_path);
    if (feedback && !feedback->empty()) {
        argv.push_back("--feedback");
        argv.push_back(*feedback);
    }
    return argv;
}

WorkerInvocation WorkerSupervisor::launch(const std::string& run_id, Stage stage,
                                          const std::string& input_path,
                                          const std::optional<std::string>& feedback) {
    WorkerInvocation inv;
    inv.run_id = run_id;
    inv.stage = stage;
    inv.argv = build_command(run_id, stage, input_path, feedback);

    std::map<std::string, std::string> env = {
        {"DIRGEN_RUN_ID", run_id}
    };
    if (!options_.callback_url.empty()) {
        env["DIRGEN_API_URL"] = options_.callback_url;
    }

    inv.pid = spawner_->spawn(inv.argv, env, options_.working_dir);
    inv.started_at = std::chrono::system_clock::now();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        Key key{run_id, stage};
        auto it = active_.find(key);
        if (it != active_.end()) {
            dprintf(1, "Replacing %s worker record for run %s (old pid %d)",
                    to_string(stage).c_str(), run_id.c_str(), it->second.pid);
            orphans_.push_back(it->second);
        }
        active_[key] = inv;
    }

    LOG_INFO("Launched " + to_string(stage) + " worker for run " + run_id +
             " (pid " + std::to_string(inv.pid) + ")");
    return inv;
}

void WorkerSupervisor::set_exit_handler(ExitHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    exit_handler_ = std::move(handler);
}

size_t WorkerSupervisor::reap() {
    std::vector<std::pair<WorkerInvocation, int>> exited;
    size_t reaped = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = active_.begin(); it != active_.end(); ) {
            auto exit_code = spawner_->poll_exit(it->second.pid);
            if (exit_code) {
                LOG_INFO(to_string(it->second.stage) + " worker for run " + it->second.run_id +
                         " exited with code " + std::to_string(*exit_code));
                exited.emplace_back(it->second, *exit_code);
                it = active_.erase(it);
                reaped++;
            } else {
                ++it;
            }
        }
        for (auto it = orphans_.begin(); it != orphans_.end(); ) {
            auto exit_code = spawner_->poll_exit(it->pid);
            if (exit_code) {
                dprintf(1, "Untracked %s worker for run %s (pid %d) exited with code %d",
                        to_string(it->stage).c_str(), it->run_id.c_str(), it->pid, *exit_code);
                it = orphans_.erase(it);
                reaped++;
            } else {
                ++it;
            }
        }
    }

    if (!exited.empty()) {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        if (exit_handler_) {
            for (const auto& [worker, exit_code] : exited) {
                try {
                    exit_handler_(worker, exit_code);
                } catch (const std::exception& e) {
                    LOG_ERROR("Exit handling for " + to_string(worker.stage) + " worker of run " +
                              worker.run_id + " failed: " + e.what());
                }
            }
        }
    }
    return reaped;
}

void WorkerSupervisor::forget_run(const std::string& run_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = active_.begin(); it != active_.end(); ) {
        if (it->first.first == run_id) {
            orphans_.push_back(it->second);
            it = active_.erase(it);
        } else {
            ++it;
        }
    }
}

size_t WorkerSupervisor::orphan_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return orphans_.size();
}

bool WorkerSupervisor::is_active(const std::string& run_id, Stage stage) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_.count(Key{run_id, stage}) > 0;
}

std::optional<WorkerInvocation> WorkerSupervisor::find(const std::string& run_id, Stage stage) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = active_.find(Key{run_id, stage});
    if (it == active_.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t WorkerSupervisor::active_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_.size();
}

json WorkerSupervisor::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    json workers = json::array();
    for (const auto& [key, inv] : active_) {
        workers.push_back(inv.to_json());
    }
    return json{{"active", active_.size()}, {"orphans", orphans_.size()}, {"workers", workers}};
}

void WorkerSupervisor::start() {
    if (reaper_thread_.joinable()) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(reaper_mutex_);
        stopping_ = false;
    }
    reaper_thread_ = std::thread(&WorkerSupervisor::reaper_loop, this);
}

void WorkerSupervisor::stop() {
    {
        std::lock_guard<std::mutex> lock(reaper_mutex_);
        stopping_ = true;
    }
    reaper_cv_.notify_all();
    if (reaper_thread_.joinable()) {
        reaper_thread_.join();
    }
}

void WorkerSupervisor::reaper_loop() {
    std::unique_lock<std::mutex> lock(reaper_mutex_);
    while (!stopping_) {
        reaper_cv_.wait_for(lock, options_.reap_interval, [this] { return stopping_; });
        if (stopping_) {
            break;
        }
        lock.unlock();
        reap();
        lock.lock();
    }
}
