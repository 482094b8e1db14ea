#include <gtest/gtest.h>
#include "llm/local_models.h"

#include <set>
#include <map>
#include <mutex>
#include <atomic>
#include <thread>
#include <algorithm>

namespace {

// In-memory runtime; models come up on the poll after start(), or after
// `delay` more polls when one is set
class FakeRuntime : public ModelRuntime {
public:
    std::vector<std::string> list_running() override {
        std::lock_guard<std::mutex> lock(mutex);
        list_calls++;
        for (auto it = pending.begin(); it != pending.end(); ) {
            if (--it->second <= 0) {
                loaded.insert(it->first);
                it = pending.erase(it);
            } else {
                ++it;
            }
        }
        return std::vector<std::string>(loaded.begin(), loaded.end());
    }

    int start(const std::string& model_id) override {
        std::lock_guard<std::mutex> lock(mutex);
        started.push_back(model_id);
        if (broken.count(model_id)) {
            // never comes up
        } else if (delay.count(model_id)) {
            pending[model_id] = delay[model_id];
        } else {
            loaded.insert(model_id);
        }
        return 4000 + static_cast<int>(started.size());
    }

    void abort_start(int handle) override {
        std::lock_guard<std::mutex> lock(mutex);
        aborted.push_back(handle);
    }

    bool stop(const std::string& model_id) override {
        std::lock_guard<std::mutex> lock(mutex);
        stopped.push_back(model_id);
        if (stop_fails.count(model_id)) {
            return false;
        }
        loaded.erase(model_id);
        return true;
    }

    size_t start_count(const std::string& model_id) {
        std::lock_guard<std::mutex> lock(mutex);
        return std::count(started.begin(), started.end(), model_id);
    }

    std::mutex mutex;
    std::set<std::string> loaded;
    std::set<std::string> broken;
    std::set<std::string> stop_fails;
    std::map<std::string, int> delay;
    std::map<std::string, int> pending;
    std::vector<std::string> started;
    std::vector<std::string> stopped;
    std::vector<int> aborted;
    int list_calls = 0;
};

} // namespace

class LocalModelsTest : public ::testing::Test {
protected:
    void SetUp() override {
        make_manager(3, std::chrono::milliseconds(1));
    }

    void make_manager(int poll_attempts, std::chrono::milliseconds poll_interval) {
        manager.reset();
        auto fake = std::make_unique<FakeRuntime>();
        runtime = fake.get();

        LocalModelManager::Options options;
        options.idle_timeout = std::chrono::seconds(300);
        options.max_concurrent = 2;
        options.poll_attempts = poll_attempts;
        options.poll_interval = poll_interval;
        options.sweep_interval = std::chrono::milliseconds(5);
        manager = std::make_unique<LocalModelManager>(std::move(fake), options);
    }

    FakeRuntime* runtime = nullptr;
    std::unique_ptr<LocalModelManager> manager;
};

// =============================================================================
// Start and reuse
// =============================================================================

TEST_F(LocalModelsTest, OnlyPrefixedIdsAreManaged) {
    EXPECT_TRUE(manager->manages("ai/gemma3"));
    EXPECT_FALSE(manager->manages("gemini-2.0-flash"));
    EXPECT_FALSE(manager->ensure_running("gemini-2.0-flash"));
    EXPECT_TRUE(runtime->started.empty());
}

TEST_F(LocalModelsTest, StartsOnFirstUse) {
    EXPECT_EQ(manager->state("ai/gemma3"), BackendState::Unmanaged);
    EXPECT_TRUE(manager->ensure_running("ai/gemma3"));
    EXPECT_EQ(manager->state("ai/gemma3"), BackendState::Running);
    EXPECT_EQ(runtime->started.size(), 1u);
}

TEST_F(LocalModelsTest, AlreadyLoadedIsNotRestarted) {
    manager->ensure_running("ai/gemma3");
    manager->ensure_running("ai/gemma3");
    EXPECT_EQ(runtime->started.size(), 1u);
    EXPECT_EQ(manager->stats()["model_details"]["ai/gemma3"]["invocations"], 2);
}

TEST_F(LocalModelsTest, AdoptsModelLoadedElsewhere) {
    runtime->loaded.insert("ai/llama3");
    EXPECT_TRUE(manager->ensure_running("ai/llama3"));
    EXPECT_TRUE(runtime->started.empty());
    EXPECT_EQ(manager->state("ai/llama3"), BackendState::Running);
}

TEST_F(LocalModelsTest, FailedStartIsAborted) {
    runtime->broken.insert("ai/broken");
    EXPECT_FALSE(manager->ensure_running("ai/broken"));
    EXPECT_EQ(manager->state("ai/broken"), BackendState::Stopped);
    ASSERT_EQ(runtime->aborted.size(), 1u);
    EXPECT_EQ(runtime->aborted[0], 4001);
}

// =============================================================================
// Concurrency ceiling
// =============================================================================

TEST_F(LocalModelsTest, ThirdModelEvictsLeastRecentlyUsed) {
    manager->ensure_running("ai/a");
    manager->ensure_running("ai/b");
    manager->ensure_running("ai/a");  // b is now the least recently used

    EXPECT_TRUE(manager->ensure_running("ai/c"));

    EXPECT_EQ(runtime->stopped, (std::vector<std::string>{"ai/b"}));
    EXPECT_EQ(manager->state("ai/b"), BackendState::Stopped);
    EXPECT_EQ(manager->state("ai/a"), BackendState::Running);
    EXPECT_EQ(manager->running_count(), 2u);
}

TEST_F(LocalModelsTest, StoppedModelRestartsOnRequest) {
    manager->ensure_running("ai/a");
    manager->ensure_running("ai/b");
    manager->ensure_running("ai/c");  // evicts a

    EXPECT_TRUE(manager->ensure_running("ai/a"));
    EXPECT_EQ(manager->state("ai/a"), BackendState::Running);
    EXPECT_EQ(runtime->started.size(), 4u);
    EXPECT_LE(manager->running_count(), 2u);
}

TEST_F(LocalModelsTest, FailedEvictionDoesNotExceedCeiling) {
    manager->ensure_running("ai/a");
    manager->ensure_running("ai/b");
    runtime->stop_fails = {"ai/a", "ai/b"};

    EXPECT_FALSE(manager->ensure_running("ai/c"));
    EXPECT_EQ(runtime->start_count("ai/c"), 0u);
    EXPECT_EQ(manager->running_count(), 2u);
    EXPECT_EQ(manager->state("ai/c"), BackendState::Unmanaged);
}

// =============================================================================
// Concurrent callers
// =============================================================================

TEST_F(LocalModelsTest, RunningModelUsableWhileAnotherStarts) {
    make_manager(5, std::chrono::milliseconds(200));
    runtime->broken.insert("ai/slow");
    runtime->loaded.insert("ai/ready");

    std::thread starter([this]() {
        EXPECT_FALSE(manager->ensure_running("ai/slow"));
    });
    for (int i = 0; i < 200 && runtime->start_count("ai/slow") == 0; i++) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    EXPECT_EQ(runtime->start_count("ai/slow"), 1u);
    EXPECT_EQ(manager->state("ai/slow"), BackendState::Starting);

    auto begin = std::chrono::steady_clock::now();
    EXPECT_TRUE(manager->ensure_running("ai/ready"));
    auto waited = std::chrono::steady_clock::now() - begin;
    EXPECT_LT(waited, std::chrono::milliseconds(300));

    starter.join();
    EXPECT_EQ(manager->state("ai/slow"), BackendState::Stopped);
}

TEST_F(LocalModelsTest, ConcurrentRequestsStartModelOnce) {
    make_manager(10, std::chrono::milliseconds(10));
    runtime->delay["ai/gemma3"] = 3;

    std::vector<std::thread> threads;
    std::atomic<int> ready{0};
    for (int i = 0; i < 4; i++) {
        threads.emplace_back([&]() {
            if (manager->ensure_running("ai/gemma3")) {
                ready++;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(ready, 4);
    EXPECT_EQ(runtime->start_count("ai/gemma3"), 1u);
    EXPECT_EQ(manager->state("ai/gemma3"), BackendState::Running);
}

// =============================================================================
// Idle sweep
// =============================================================================

TEST_F(LocalModelsTest, SweepStopsIdleModels) {
    manager->ensure_running("ai/a");
    EXPECT_EQ(manager->sweep_idle(), 0u);

    auto later = LocalModelManager::Clock::now() + std::chrono::hours(1);
    EXPECT_EQ(manager->sweep_idle(later), 1u);
    EXPECT_EQ(manager->state("ai/a"), BackendState::Stopped);
    EXPECT_TRUE(runtime->loaded.empty());
}

TEST_F(LocalModelsTest, SweeperThreadLifecycle) {
    EXPECT_FALSE(manager->sweeper_running());
    manager->start();
    EXPECT_TRUE(manager->sweeper_running());
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    manager->stop();
    EXPECT_FALSE(manager->sweeper_running());
}

TEST_F(LocalModelsTest, ForceStopAll) {
    manager->ensure_running("ai/a");
    manager->ensure_running("ai/b");
    manager->start();

    manager->force_stop_all();
    EXPECT_FALSE(manager->sweeper_running());
    EXPECT_EQ(manager->running_count(), 0u);
    EXPECT_TRUE(runtime->loaded.empty());
}

// =============================================================================
// docker model ps parsing
// =============================================================================

TEST(DockerModelRuntimeTest, ParsePsOutput) {
    std::string output =
        "MODEL NAME       BACKEND    MODE        LAST USED\n"
        "ai/gemma3        llama.cpp  completion  2 minutes ago\n"
        "ai/smollm2:360M  llama.cpp  completion  now\n"
        "\n";
    EXPECT_EQ(DockerModelRuntime::parse_ps_output(output),
              (std::vector<std::string>{"ai/gemma3", "ai/smollm2:360M"}));
    EXPECT_TRUE(DockerModelRuntime::parse_ps_output("MODEL NAME BACKEND\n").empty());
    EXPECT_TRUE(DockerModelRuntime::parse_ps_output("").empty());
}

TEST(DockerModelRuntimeTest, StateNames) {
    EXPECT_EQ(to_string(BackendState::Starting), "starting");
    EXPECT_EQ(to_string(BackendState::Stopped), "stopped");
}
