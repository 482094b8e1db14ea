#pragma once

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <atomic>
#include <condition_variable>
#include <optional>
#include <chrono>
#include <functional>
#include <nlohmann/json.hpp>

#include "run/run_state.h"
#include "workers/stage_command.h"
#include "workers/process_util.h"

/// @brief OS process operations used by the supervisor
/// Tests substitute a fake so no real worker executables are needed.
class ProcessSpawner {
public:
    virtual ~ProcessSpawner() = default;

    /// @brief Start a process without waiting
    /// @throws ProcessLaunchError if it cannot be started
    virtual int spawn(const std::vector<std::string>& argv,
                      const std::map<std::string, std::string>& env,
                      const std::string& working_dir) = 0;

    /// @brief Non-blocking exit check; reaps the process when it has exited
    virtual std::optional<int> poll_exit(int pid) = 0;
};

class PosixProcessSpawner : public ProcessSpawner {
public:
    int spawn(const std::vector<std::string>& argv,
              const std::map<std::string, std::string>& env,
              const std::string& working_dir) override;
    std::optional<int> poll_exit(int pid) override;
};

/// @brief One spawned stage worker
struct WorkerInvocation {
    std::string run_id;
    Stage stage = Stage::Requirements;
    int pid = -1;
    std::chrono::system_clock::time_point started_at;
    std::vector<std::string> argv;

    nlohmann::json to_json() const;
};

/// @brief Launches one subprocess per (run, stage) and tracks its handle
/// Launching never waits for the worker; workers report back over HTTP.
/// Worker output is not interpreted here. Exited workers are reaped by a
/// background thread and passed to the exit handler. Records that are
/// replaced or forgotten while the process still runs become orphans, which
/// are reaped the same way but not reported.
class WorkerSupervisor {
public:
    using ExitHandler = std::function<void(const WorkerInvocation& worker, int exit_code)>;

    struct Options {
        std::string working_dir;   // cwd for workers (the project root)
        std::string callback_url;  // exported as DIRGEN_API_URL
        std::chrono::milliseconds reap_interval{1000};
    };

    WorkerSupervisor(std::unique_ptr<ProcessSpawner> spawner,
                     std::map<Stage, StageCommand> commands,
                     Options options);
    ~WorkerSupervisor();

    WorkerSupervisor(const WorkerSupervisor&) = delete;
    WorkerSupervisor& operator=(const WorkerSupervisor&) = delete;

    /// @brief True if a command is configured for the stage
    bool has_stage(Stage stage) const;

    /// @brief Full argv for a stage invocation
    std::vector<std::string> build_command(const std::string& run_id, Stage stage,
                                           const std::string& input_path,
                                           const std::optional<std::string>& feedback) const;

    /// @brief Spawn the stage worker and register it under (run_id, stage)
    /// A previous record for the same key is replaced.
    /// @throws ProcessLaunchError if the stage has no command or spawn fails
    WorkerInvocation launch(const std::string& run_id, Stage stage,
                            const std::string& input_path,
                            const std::optional<std::string>& feedback = std::nullopt);

    /// @brief Called from reap() for every tracked worker that exited
    /// Runs without the supervisor lock held; blocks until a running call
    /// finishes, so clearing it is safe before the handler's owner goes away.
    void set_exit_handler(ExitHandler handler);

    /// @brief Reap exited workers and orphans, reporting tracked workers
    /// @return number of processes reaped
    size_t reap();

    /// @brief Drop every record of a terminated run (workers are not killed)
    /// Still-running workers are kept as orphans until they exit.
    void forget_run(const std::string& run_id);

    /// @brief Processes no longer tracked that have not exited yet
    size_t orphan_count() const;

    bool is_active(const std::string& run_id, Stage stage) const;
    std::optional<WorkerInvocation> find(const std::string& run_id, Stage stage) const;
    size_t active_count() const;
    nlohmann::json status() const;

    /// @brief Start/stop the background reaper thread
    void start();
    void stop();

private:
    using Key = std::pair<std::string, Stage>;

    void reaper_loop();

    std::unique_ptr<ProcessSpawner> spawner_;
    std::map<Stage, StageCommand> commands_;
    Options options_;

    mutable std::mutex mutex_;
    std::map<Key, WorkerInvocation> active_;
    std::vector<WorkerInvocation> orphans_;

    std::mutex handler_mutex_;
    ExitHandler exit_handler_;

    std::thread reaper_thread_;
    std::mutex reaper_mutex_;
    std::condition_variable reaper_cv_;
    bool stopping_ = false;
};
