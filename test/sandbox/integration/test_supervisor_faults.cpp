/***
 * Name: test_supervisor_faults
 * Purpose: Drive the supervisor with a misbehaving worker: crashes without
 *          a result, garbage on the channel, a hung worker whose own
 *          child must die with its process group, and the worker's start
 *          directory.
 */
#include <gtest/gtest.h>

#include <scriptdeck/sandbox/supervisor.hpp>
#include <scriptdeck/core/utils.hpp>

#include <cerrno>
#include <chrono>
#include <thread>
#include <csignal>
#include <cstdlib>
#include <sys/types.h>
#include <unistd.h>

using namespace scriptdeck;

namespace {

SupervisorConfig fake_config() {
    SupervisorConfig c;
    c.worker_path = SCRIPTDECK_FAKE_WORKER_PATH;
    c.grace_ms = 500;
    return c;
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

// Gone, or a zombie waiting for init
bool process_dead(pid_t pid) {
    if (kill(pid, 0) != 0 && errno == ESRCH) return true;
    std::string stat;
    if (!read_file("/proc/" + std::to_string(pid) + "/stat", stat)) return true;
    size_t paren = stat.rfind(')');
    return paren != std::string::npos && paren + 2 < stat.size() && stat[paren + 2] == 'Z';
}

} // namespace

TEST(SupervisorFaults, WellBehavedFakeWorkerSucceeds) {
    SandboxSupervisor supervisor(fake_config());
    ExecutionResult r = supervisor.execute("anything", "", 5);
    EXPECT_TRUE(r.succeeded) << r.error_message;
    EXPECT_EQ(r.outcome, ExecutionOutcome::COMPLETED);
}

TEST(SupervisorFaults, WorkerStartsInFilesystemRoot) {
    char cwd[4096];
    ASSERT_NE(getcwd(cwd, sizeof(cwd)), nullptr);
    SandboxSupervisor supervisor(fake_config());
    ExecutionResult r = supervisor.execute("report-cwd", "", 5);
    ASSERT_TRUE(r.succeeded) << r.error_message;
    EXPECT_EQ(r.stdout_text, "/\n");
    if (std::string(cwd) != "/") {
        EXPECT_FALSE(contains(r.stdout_text, cwd));
    }
}

TEST(SupervisorFaults, CrashWithoutResultKeepsPartialOutput) {
    SandboxSupervisor supervisor(fake_config());
    ExecutionResult r = supervisor.execute("crash-after-output", "", 5);
    EXPECT_FALSE(r.succeeded);
    EXPECT_EQ(r.outcome, ExecutionOutcome::CRASHED_WITHOUT_RESULT);
    EXPECT_EQ(r.error_message, NO_RESULT_MESSAGE);
    EXPECT_EQ(r.stdout_text, "partial output\n");
    EXPECT_TRUE(contains(r.stderr_text, "signal 11")) << r.stderr_text;
    EXPECT_LT(r.elapsed_seconds, 5.0);
}

TEST(SupervisorFaults, QuietExitReportsStatus) {
    SandboxSupervisor supervisor(fake_config());
    ExecutionResult r = supervisor.execute("exit-quietly", "", 5);
    EXPECT_FALSE(r.succeeded);
    EXPECT_EQ(r.outcome, ExecutionOutcome::CRASHED_WITHOUT_RESULT);
    EXPECT_TRUE(contains(r.stderr_text, "status 3")) << r.stderr_text;
}

TEST(SupervisorFaults, GarbageOnChannelIsCrash) {
    SandboxSupervisor supervisor(fake_config());
    ExecutionResult r = supervisor.execute("garbage", "", 5);
    EXPECT_FALSE(r.succeeded);
    EXPECT_EQ(r.outcome, ExecutionOutcome::CRASHED_WITHOUT_RESULT);
    EXPECT_TRUE(contains(r.stderr_text, "result channel corrupted")) << r.stderr_text;
}

TEST(SupervisorFaults, TimeoutKillsWholeProcessGroup) {
    SandboxSupervisor supervisor(fake_config());
    ExecutionResult r = supervisor.execute("hang-with-grandchild", "", 1);
    EXPECT_FALSE(r.succeeded);
    EXPECT_EQ(r.outcome, ExecutionOutcome::TIMED_OUT);
    EXPECT_EQ(r.error_message, TIMEOUT_MESSAGE);

    ASSERT_TRUE(starts_with(r.stdout_text, "grandchild ")) << r.stdout_text;
    pid_t grandchild = static_cast<pid_t>(atoi(r.stdout_text.c_str() + 11));
    ASSERT_GT(grandchild, 0);

    bool dead = false;
    for (int i = 0; i < 60 && !dead; ++i) {
        dead = process_dead(grandchild);
        if (!dead) std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    EXPECT_TRUE(dead) << "grandchild " << grandchild << " survived the timeout";
}
