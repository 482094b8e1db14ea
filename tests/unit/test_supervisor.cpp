#include <gtest/gtest.h>
#include "workers/supervisor.h"
#include "temp_dir.h"

#include <set>
#include <algorithm>
#include <vector>
#include <thread>
#include <cerrno>
#include <sys/wait.h>

namespace {

class FakeSpawner : public ProcessSpawner {
public:
    int spawn(const std::vector<std::string>& argv,
              const std::map<std::string, std::string>& env,
              const std::string& working_dir) override {
        if (fail) {
            throw ProcessLaunchError("fork failed");
        }
        last_argv = argv;
        last_env = env;
        last_dir = working_dir;
        return next_pid++;
    }

    std::optional<int> poll_exit(int pid) override {
        auto it = exited.find(pid);
        if (it != exited.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    std::vector<std::string> last_argv;
    std::map<std::string, std::string> last_env;
    std::string last_dir;
    std::map<int, int> exited;  // pid -> exit code
    bool fail = false;
    int next_pid = 500;
};

} // namespace

class SupervisorTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto fake = std::make_unique<FakeSpawner>();
        spawner = fake.get();

        std::map<Stage, StageCommand> commands = {
            {Stage::Requirements, StageCommand{"python3", {"agents/req.py"}, "--svad-path"}},
            {Stage::Design, StageCommand{"python3", {"agents/plan.py"}, "--pcce-path"}}
        };
        WorkerSupervisor::Options options;
        options.working_dir = "/srv/project";
        options.callback_url = "http://127.0.0.1:8000";
        options.reap_interval = std::chrono::milliseconds(10);
        supervisor = std::make_unique<WorkerSupervisor>(std::move(fake), commands, options);
    }

    FakeSpawner* spawner = nullptr;
    std::unique_ptr<WorkerSupervisor> supervisor;
};

TEST_F(SupervisorTest, BuildCommand) {
    auto argv = supervisor->build_command("run-1", Stage::Requirements, "temp/in.md", std::nullopt);
    EXPECT_EQ(argv, (std::vector<std::string>{
        "python3", "agents/req.py", "--run-id", "run-1", "--svad-path", "temp/in.md"}));

    auto with_feedback = supervisor->build_command("run-1", Stage::Design, "ctx.yml", std::string("Attempt 1/3"));
    ASSERT_GE(with_feedback.size(), 2u);
    EXPECT_EQ(with_feedback[with_feedback.size() - 2], "--feedback");
    EXPECT_EQ(with_feedback.back(), "Attempt 1/3");
}

TEST_F(SupervisorTest, UnconfiguredStage) {
    EXPECT_FALSE(supervisor->has_stage(Stage::Execution));
    EXPECT_THROW(supervisor->launch("run-1", Stage::Execution, "ctx.yml"), ProcessLaunchError);
}

TEST_F(SupervisorTest, LaunchRegistersWorker) {
    WorkerInvocation inv = supervisor->launch("run-1", Stage::Requirements, "temp/in.md");

    EXPECT_EQ(inv.pid, 500);
    EXPECT_EQ(spawner->last_dir, "/srv/project");
    EXPECT_EQ(spawner->last_env.at("DIRGEN_RUN_ID"), "run-1");
    EXPECT_EQ(spawner->last_env.at("DIRGEN_API_URL"), "http://127.0.0.1:8000");
    EXPECT_TRUE(supervisor->is_active("run-1", Stage::Requirements));
    EXPECT_EQ(supervisor->find("run-1", Stage::Requirements)->pid, 500);
}

TEST_F(SupervisorTest, RelaunchReplacesRecord) {
    supervisor->launch("run-1", Stage::Design, "ctx.yml");
    supervisor->launch("run-1", Stage::Design, "ctx.yml", std::string("retry"));

    EXPECT_EQ(supervisor->active_count(), 1u);
    EXPECT_EQ(supervisor->find("run-1", Stage::Design)->pid, 501);

    // The replaced worker is still reaped once it exits
    EXPECT_EQ(supervisor->orphan_count(), 1u);
    spawner->exited[500] = 0;
    EXPECT_EQ(supervisor->reap(), 1u);
    EXPECT_EQ(supervisor->orphan_count(), 0u);
    EXPECT_TRUE(supervisor->is_active("run-1", Stage::Design));
}

TEST_F(SupervisorTest, SpawnFailureRegistersNothing) {
    spawner->fail = true;
    EXPECT_THROW(supervisor->launch("run-1", Stage::Requirements, "in.md"), ProcessLaunchError);
    EXPECT_EQ(supervisor->active_count(), 0u);
}

TEST_F(SupervisorTest, ReapDropsExited) {
    supervisor->launch("run-1", Stage::Requirements, "in.md");
    supervisor->launch("run-2", Stage::Requirements, "in.md");
    spawner->exited[500] = 0;

    EXPECT_EQ(supervisor->reap(), 1u);
    EXPECT_FALSE(supervisor->is_active("run-1", Stage::Requirements));
    EXPECT_TRUE(supervisor->is_active("run-2", Stage::Requirements));
}

TEST_F(SupervisorTest, ForgetRun) {
    supervisor->launch("run-1", Stage::Requirements, "in.md");
    supervisor->launch("run-1", Stage::Design, "ctx.yml");
    supervisor->launch("run-2", Stage::Design, "ctx.yml");

    supervisor->forget_run("run-1");
    EXPECT_EQ(supervisor->active_count(), 1u);
    EXPECT_EQ(supervisor->orphan_count(), 2u);
    EXPECT_EQ(supervisor->status()["workers"][0]["run_id"], "run-2");

    spawner->exited[500] = 0;
    spawner->exited[501] = 0;
    EXPECT_EQ(supervisor->reap(), 2u);
    EXPECT_EQ(supervisor->orphan_count(), 0u);
}

TEST_F(SupervisorTest, ExitHandlerSeesTrackedWorkersOnly) {
    std::vector<std::pair<std::string, int>> reported;
    supervisor->set_exit_handler([&](const WorkerInvocation& worker, int exit_code) {
        reported.emplace_back(worker.run_id + "/" + to_string(worker.stage), exit_code);
    });

    supervisor->launch("run-1", Stage::Design, "ctx.yml");                       // 500, replaced
    supervisor->launch("run-1", Stage::Design, "ctx.yml", std::string("retry"));  // 501
    supervisor->launch("run-2", Stage::Requirements, "in.md");                    // 502
    spawner->exited[500] = 1;
    spawner->exited[501] = 2;
    spawner->exited[502] = 0;

    EXPECT_EQ(supervisor->reap(), 3u);
    ASSERT_EQ(reported.size(), 2u);
    std::sort(reported.begin(), reported.end());
    EXPECT_EQ(reported[0], (std::pair<std::string, int>{"run-1/design", 2}));
    EXPECT_EQ(reported[1], (std::pair<std::string, int>{"run-2/requirements", 0}));

    supervisor->set_exit_handler(nullptr);
}

TEST_F(SupervisorTest, ExitHandlerErrorsDoNotStopReaping) {
    supervisor->set_exit_handler([](const WorkerInvocation&, int) {
        throw std::runtime_error("handler failed");
    });
    supervisor->launch("run-1", Stage::Requirements, "in.md");
    spawner->exited[500] = 3;

    EXPECT_NO_THROW(supervisor->reap());
    EXPECT_EQ(supervisor->active_count(), 0u);
    supervisor->set_exit_handler(nullptr);
}

TEST_F(SupervisorTest, BackgroundReaper) {
    supervisor->launch("run-1", Stage::Requirements, "in.md");
    spawner->exited[500] = 0;
    supervisor->start();

    for (int i = 0; i < 100 && supervisor->active_count() > 0; i++) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    supervisor->stop();
    EXPECT_EQ(supervisor->active_count(), 0u);
}

// Real processes, no fakes
TEST(PosixSupervisorTest, ReplacedAndForgottenWorkersAreReaped) {
    std::map<Stage, StageCommand> commands = {
        {Stage::Requirements, StageCommand{"true", {}, "--input-path"}},
        {Stage::Design, StageCommand{"true", {}, "--input-path"}}
    };
    WorkerSupervisor::Options options;
    options.reap_interval = std::chrono::milliseconds(20);
    WorkerSupervisor supervisor(std::make_unique<PosixProcessSpawner>(), commands, options);

    int replaced = supervisor.launch("run-1", Stage::Design, "ctx.yml").pid;
    int tracked = supervisor.launch("run-1", Stage::Design, "ctx.yml", std::string("retry")).pid;
    int forgotten = supervisor.launch("run-2", Stage::Requirements, "in.md").pid;
    supervisor.forget_run("run-2");

    supervisor.start();
    for (int i = 0; i < 250 && (supervisor.active_count() > 0 || supervisor.orphan_count() > 0); i++) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    supervisor.stop();

    EXPECT_EQ(supervisor.active_count(), 0u);
    EXPECT_EQ(supervisor.orphan_count(), 0u);

    // Every child has been waited for, so none is left as a zombie
    for (int pid : {replaced, tracked, forgotten}) {
        int status = 0;
        errno = 0;
        EXPECT_EQ(waitpid(pid, &status, WNOHANG), -1) << "pid " << pid;
        EXPECT_EQ(errno, ECHILD) << "pid " << pid;
    }
}

TEST(ProcessUtilTest, RunCommandCapturesOutput) {
    CommandResult result = process::run_command({"sh", "-c", "echo out; echo err >&2; exit 3"},
                                                std::chrono::seconds(5));
    EXPECT_EQ(result.exit_code, 3);
    EXPECT_EQ(result.stdout_output, "out\n");
    EXPECT_EQ(result.stderr_output, "err\n");
    EXPECT_FALSE(result.success());
}

TEST(ProcessUtilTest, RunCommandTimesOut) {
    CommandResult result = process::run_command({"sleep", "5"}, std::chrono::seconds(1));
    EXPECT_TRUE(result.timed_out);
}

TEST(ProcessUtilTest, SpawnMissingExecutableThrows) {
    EXPECT_THROW(process::spawn({"/nonexistent/dirgen-worker"}), ProcessLaunchError);
}

TEST(ProcessUtilTest, SpawnAndReap) {
    test_helpers::TempDir dir;
    process::SpawnOptions options;
    options.working_dir = dir.path();
    options.env["DIRGEN_MARK"] = "42";
    pid_t pid = process::spawn({"sh", "-c", "echo $DIRGEN_MARK > mark.txt"}, options);

    std::optional<int> code;
    for (int i = 0; i < 200 && !code; i++) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        code = process::try_reap(pid);
    }
    ASSERT_TRUE(code.has_value());
    EXPECT_EQ(*code, 0);
    EXPECT_TRUE(dir.exists("mark.txt"));
}

TEST(ProcessUtilTest, JoinCommandQuotes) {
    EXPECT_EQ(process::join_command({"python3", "agent.py", "--feedback", "two words"}),
              "python3 agent.py --feedback \"two words\"");
}
