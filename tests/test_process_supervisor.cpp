#include <gtest/gtest.h>
#include <dock/error_types.h>
#include <dock/model_store.h>
#include <dock/process_supervisor.h>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <sstream>
#include <thread>
#include "test_helpers.h"

using namespace dock;
using namespace dock::testing;

namespace {

bool process_exists(pid_t pid) {
    return kill(pid, 0) == 0 || errno != ESRCH;
}

} // namespace

class ProcessSupervisorTest : public ::testing::Test {
protected:
    void SetUp() override {
        setenv("DOCK_WORKER_BIN", FAKE_SERVICE_PATH, 1);
        setenv("FAKE_SERVICE_MODE", "healthy", 1);
        setenv("FAKE_SERVICE_PID_FILE", (dir_ / "pids").c_str(), 1);

        store_ = std::make_unique<ModelStore>(dir_.path());
        model_ = make_model("tiny-chat", "http://127.0.0.1/tiny.gguf", "tiny.gguf");
        write_file(store_->weights_path(model_), "weights");
    }

    void TearDown() override {
        unsetenv("DOCK_WORKER_BIN");
        unsetenv("FAKE_SERVICE_MODE");
        unsetenv("FAKE_SERVICE_PID_FILE");
        unsetenv("FAKE_SERVICE_DELAY_MS");
    }

    static SupervisorOptions fast_options(int attempts = 30, int interval_ms = 100) {
        SupervisorOptions options;
        options.health_check_attempts = attempts;
        options.health_check_interval = std::chrono::milliseconds(interval_ms);
        options.stop_grace_period = std::chrono::milliseconds(2000);
        return options;
    }

    std::vector<pid_t> spawned_pids() {
        std::vector<pid_t> pids;
        std::istringstream in(read_file(dir_ / "pids"));
        pid_t pid;
        while (in >> pid) {
            pids.push_back(pid);
        }
        return pids;
    }

    TempDir dir_;
    std::unique_ptr<ModelStore> store_;
    ModelDescriptor model_;
};

TEST_F(ProcessSupervisorTest, LaunchReturnsPortOnceHealthy) {
    ProcessSupervisor supervisor(*store_, fast_options());
    EXPECT_EQ(supervisor.state(), ServiceState::IDLE);

    int port = supervisor.launch(model_);
    EXPECT_GT(port, 0);
    EXPECT_EQ(supervisor.port(), port);
    EXPECT_EQ(supervisor.state(), ServiceState::RUNNING);
    EXPECT_EQ(supervisor.running_model(), "tiny-chat");
    EXPECT_TRUE(supervisor.check_health());
    EXPECT_TRUE(process_exists(supervisor.pid()));
}

TEST_F(ProcessSupervisorTest, MissingWeightsIsNotFound) {
    ProcessSupervisor supervisor(*store_, fast_options());
    ModelDescriptor other = make_model("other", "http://127.0.0.1/other.gguf", "other.gguf");

    EXPECT_THROW(supervisor.launch(other), NotFoundException);
    EXPECT_EQ(supervisor.state(), ServiceState::FAILED);
    EXPECT_TRUE(spawned_pids().empty());
}

TEST_F(ProcessSupervisorTest, RelaunchLeavesExactlyOneProcess) {
    ProcessSupervisor supervisor(*store_, fast_options());

    for (int i = 0; i < 3; ++i) {
        supervisor.launch(model_);
    }

    auto pids = spawned_pids();
    ASSERT_EQ(pids.size(), 3u);
    EXPECT_FALSE(process_exists(pids[0]));
    EXPECT_FALSE(process_exists(pids[1]));
    EXPECT_TRUE(process_exists(pids[2]));
    EXPECT_EQ(supervisor.pid(), pids[2]);
}

TEST_F(ProcessSupervisorTest, NeverHealthyTimesOutAfterFullBudget) {
    setenv("FAKE_SERVICE_MODE", "unhealthy", 1);
    ProcessSupervisor supervisor(*store_, fast_options(5, 100));

    auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(supervisor.launch(model_), HealthCheckTimeoutException);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    EXPECT_GE(elapsed.count(), 500);
    EXPECT_LT(elapsed.count(), 2500);
    EXPECT_EQ(supervisor.state(), ServiceState::FAILED);
    EXPECT_EQ(supervisor.port(), 0);

    auto pids = spawned_pids();
    ASSERT_EQ(pids.size(), 1u);
    EXPECT_FALSE(process_exists(pids[0]));
}

TEST_F(ProcessSupervisorTest, SilentServiceTimesOut) {
    setenv("FAKE_SERVICE_MODE", "silent", 1);
    ProcessSupervisor supervisor(*store_, fast_options(3, 100));

    EXPECT_THROW(supervisor.launch(model_), HealthCheckTimeoutException);

    auto pids = spawned_pids();
    ASSERT_EQ(pids.size(), 1u);
    EXPECT_FALSE(process_exists(pids[0]));
}

TEST_F(ProcessSupervisorTest, SlowStartupBecomesReady) {
    setenv("FAKE_SERVICE_MODE", "slow", 1);
    setenv("FAKE_SERVICE_DELAY_MS", "300", 1);
    ProcessSupervisor supervisor(*store_, fast_options(30, 100));

    EXPECT_GT(supervisor.launch(model_), 0);
    EXPECT_EQ(supervisor.state(), ServiceState::RUNNING);
}

TEST_F(ProcessSupervisorTest, ExitDuringStartupFailsEarly) {
    setenv("FAKE_SERVICE_MODE", "crash", 1);
    ProcessSupervisor supervisor(*store_, fast_options(30, 100));

    auto start = std::chrono::steady_clock::now();
    try {
        supervisor.launch(model_);
        FAIL() << "expected ProcessSpawnException";
    } catch (const ProcessSpawnException& e) {
        EXPECT_NE(std::string(e.what()).find("code 3"), std::string::npos);
    }
    auto elapsed = std::chrono::steady_clock::now() - start;
    EXPECT_LT(elapsed, std::chrono::milliseconds(3000));
    EXPECT_EQ(supervisor.state(), ServiceState::FAILED);
}

TEST_F(ProcessSupervisorTest, DetectsCrashAfterRunning) {
    ProcessSupervisor supervisor(*store_, fast_options());
    supervisor.launch(model_);
    pid_t pid = supervisor.pid();
    ASSERT_GT(pid, 0);

    kill(pid, SIGKILL);
    std::this_thread::sleep_for(std::chrono::milliseconds(200));

    EXPECT_EQ(supervisor.state(), ServiceState::STOPPED);
    EXPECT_EQ(supervisor.port(), 0);
    EXPECT_EQ(supervisor.running_model(), "");
    EXPECT_FALSE(supervisor.check_health());
}

TEST_F(ProcessSupervisorTest, StopTerminatesService) {
    ProcessSupervisor supervisor(*store_, fast_options());
    supervisor.launch(model_);
    pid_t pid = supervisor.pid();

    supervisor.stop();
    EXPECT_EQ(supervisor.state(), ServiceState::STOPPED);
    EXPECT_FALSE(process_exists(pid));

    // Idempotent
    supervisor.stop();
    EXPECT_EQ(supervisor.state(), ServiceState::STOPPED);
}

TEST_F(ProcessSupervisorTest, DestroyingSupervisorTerminatesService) {
    pid_t pid = 0;
    {
        ProcessSupervisor supervisor(*store_, fast_options());
        supervisor.launch(model_);
        pid = supervisor.pid();
        ASSERT_TRUE(process_exists(pid));
    }
    EXPECT_FALSE(process_exists(pid));
}

TEST_F(ProcessSupervisorTest, MissingBackendBinaryIsSpawnError) {
    ModelDescriptor speech = make_model("whisper-test", "http://127.0.0.1/ggml.bin", "ggml.bin", {},
                                        TaskType::SPEECH_TO_TEXT);
    write_file(store_->weights_path(speech), "weights");

    const char* old_path = std::getenv("PATH");
    std::string saved_path = old_path ? old_path : "";
    setenv("PATH", dir_.path().c_str(), 1);
    unsetenv("DOCK_WHISPERCPP_BIN");

    ProcessSupervisor supervisor(*store_, fast_options());
    EXPECT_THROW(supervisor.launch(speech), ProcessSpawnException);

    setenv("PATH", saved_path.c_str(), 1);
}

TEST(ChoosePortTest, ReturnsUsablePorts) {
    int a = ProcessSupervisor::choose_port();
    int b = ProcessSupervisor::choose_port();
    EXPECT_GT(a, 0);
    EXPECT_GT(b, 0);
    EXPECT_LT(a, 65536);
}
