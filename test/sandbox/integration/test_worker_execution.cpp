/***
 * Name: test_worker_execution
 * Purpose: Run scripts end to end through the supervisor and the real
 *          scriptdeck-worker: output capture, entry point, stdin emulation,
 *          import denial, deadlines and isolation between runs.
 */
#include <gtest/gtest.h>

#include <scriptdeck/sandbox/supervisor.hpp>

#include <chrono>
#include <thread>

using namespace scriptdeck;

namespace {

SupervisorConfig worker_config() {
    SupervisorConfig c;
    c.worker_path = SCRIPTDECK_WORKER_PATH;
    c.default_timeout_seconds = 10;
    c.max_timeout_seconds = 30;
    return c;
}

double seconds_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

class WorkerExecution : public ::testing::Test {
protected:
    WorkerExecution() : supervisor(worker_config()) {}

    ExecutionResult run(const std::string& source, const std::string& input = "", int timeout = 10) {
        return supervisor.execute(source, input, timeout);
    }

    SandboxSupervisor supervisor;
};

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

TEST_F(WorkerExecution, PrintsAndReturnsFromMain) {
    ExecutionResult r = run("def main():\n    print(\"hi\")\n    return 42\n");
    ASSERT_TRUE(r.succeeded) << r.error_message << "\n" << r.stderr_text;
    EXPECT_EQ(r.stdout_text, "hi\n");
    ASSERT_TRUE(r.has_return_value);
    EXPECT_EQ(r.return_value, 42);
    EXPECT_TRUE(r.error_message.empty());
    EXPECT_EQ(r.outcome, ExecutionOutcome::COMPLETED);
}

TEST_F(WorkerExecution, ModuleLevelCodeWithoutMain) {
    ExecutionResult r = run("total = sum(range(5))\nprint(total)\n");
    ASSERT_TRUE(r.succeeded) << r.error_message;
    EXPECT_EQ(r.stdout_text, "10\n");
    EXPECT_FALSE(r.has_return_value);
}

TEST_F(WorkerExecution, ReturnValueConversion) {
    ExecutionResult r = run(
        "def main():\n"
        "    return {\"n\": None, \"l\": [1, 2.5, \"x\"], \"t\": (True,), \"big\": 2**80, \"o\": object}\n");
    ASSERT_TRUE(r.succeeded) << r.error_message;
    EXPECT_TRUE(r.return_value["n"].is_null());
    EXPECT_EQ(r.return_value["l"][1], 2.5);
    EXPECT_EQ(r.return_value["t"][0], true);
    EXPECT_EQ(r.return_value["big"], "1208925819614629174706176");
    EXPECT_EQ(r.return_value["o"], "<class 'object'>");
}

TEST_F(WorkerExecution, MainGuardDoesNotRunTwice) {
    ExecutionResult r = run(
        "def main():\n    print('once')\n\nif __name__ == '__main__':\n    main()\n");
    ASSERT_TRUE(r.succeeded);
    EXPECT_EQ(r.stdout_text, "once\n");
}

TEST_F(WorkerExecution, MainWithRequiredArgumentsIsNotCalled) {
    ExecutionResult r = run("def main(x):\n    print('called')\n");
    ASSERT_TRUE(r.succeeded);
    EXPECT_EQ(r.stdout_text, "");
    EXPECT_FALSE(r.has_return_value);
}

TEST_F(WorkerExecution, StdinIsEchoed) {
    ExecutionResult r = run("name = input('Name: ')\nprint('Hello, ' + name)\n", "Ada\n");
    ASSERT_TRUE(r.succeeded) << r.error_message;
    EXPECT_EQ(r.stdout_text, "Name: Ada\nHello, Ada\n");
}

TEST_F(WorkerExecution, ReadingPastInputRaisesEOFError) {
    ExecutionResult r = run("a = input()\nprint(a)\nb = input('more? ')\n", "only");
    EXPECT_FALSE(r.succeeded);
    EXPECT_EQ(r.stdout_text, "only\nonly\nmore? ");
    EXPECT_TRUE(contains(r.error_message, "EOFError")) << r.error_message;
    EXPECT_TRUE(contains(r.error_message, "EOF when reading a line"));
}

TEST_F(WorkerExecution, EOFErrorCanBeCaught) {
    ExecutionResult r = run(
        "try:\n    input()\nexcept EOFError:\n    print('no input')\n");
    ASSERT_TRUE(r.succeeded);
    EXPECT_EQ(r.stdout_text, "no input\n");
}

TEST_F(WorkerExecution, DeniedImportKeepsEarlierOutput) {
    ExecutionResult r = run("print('before')\nimport os\nprint('after')\n");
    EXPECT_FALSE(r.succeeded);
    EXPECT_EQ(r.stdout_text, "before\n");
    EXPECT_TRUE(contains(r.error_message, "Import of 'os' is not allowed")) << r.error_message;
    EXPECT_TRUE(contains(r.stderr_text, "Traceback"));
}

TEST_F(WorkerExecution, SocketImportDenied) {
    ExecutionResult r = run("import socket\n");
    EXPECT_FALSE(r.succeeded);
    EXPECT_TRUE(contains(r.error_message, "socket")) << r.error_message;
}

TEST_F(WorkerExecution, FromImportOfDeniedNameDenied) {
    ExecutionResult r = run("from importlib import import_module\n");
    EXPECT_FALSE(r.succeeded);
    ExecutionResult r2 = run("from json import _default_encoder\n");
    EXPECT_FALSE(r2.succeeded);
}

TEST_F(WorkerExecution, AllowedModulesImport) {
    ExecutionResult r = run("import math\nimport random\nprint(math.floor(random.random() * 0))\n");
    ASSERT_TRUE(r.succeeded) << r.error_message << "\n" << r.stderr_text;
    EXPECT_EQ(r.stdout_text, "0\n");
}

TEST_F(WorkerExecution, DangerousBuiltinsMissing) {
    const char* sources[] = {"open('/etc/passwd')\n", "eval('1')\n", "exec('x=1')\n",
                             "__import__('os')\n", "getattr(1, 'real')\n"};
    for (size_t i = 0; i < sizeof(sources) / sizeof(sources[0]); ++i) {
        ExecutionResult r = run(sources[i]);
        EXPECT_FALSE(r.succeeded) << sources[i];
    }
}

TEST_F(WorkerExecution, RuntimeErrorReported) {
    ExecutionResult r = run("print('x')\n1/0\n");
    EXPECT_FALSE(r.succeeded);
    EXPECT_EQ(r.error_message, "ZeroDivisionError: division by zero");
    EXPECT_TRUE(contains(r.stderr_text, "ZeroDivisionError"));
    EXPECT_EQ(r.stdout_text, "x\n");
}

TEST_F(WorkerExecution, SyntaxErrorReported) {
    ExecutionResult r = run("def broken(:\n");
    EXPECT_FALSE(r.succeeded);
    EXPECT_TRUE(contains(r.error_message, "SyntaxError")) << r.error_message;
}

TEST_F(WorkerExecution, ClassesWork) {
    ExecutionResult r = run(
        "class Point:\n"
        "    def __init__(self, x):\n"
        "        self.x = x\n"
        "    @property\n"
        "    def double(self):\n"
        "        return self.x * 2\n"
        "def main():\n"
        "    return Point(21).double\n");
    ASSERT_TRUE(r.succeeded) << r.error_message;
    EXPECT_EQ(r.return_value, 42);
}

TEST_F(WorkerExecution, ObjectBaseClassIsAvailable) {
    ExecutionResult r = run(
        "class A(object):\n"
        "    pass\n"
        "print(isinstance(A(), object))\n"
        "print(issubclass(A, object))\n");
    ASSERT_TRUE(r.succeeded) << r.error_message;
    EXPECT_EQ(r.stdout_text, "True\nTrue\n");
}

TEST_F(WorkerExecution, SystemExitCanBeCaught) {
    ExecutionResult r = run(
        "try:\n"
        "    raise SystemExit(3)\n"
        "except SystemExit as e:\n"
        "    print(e.code)\n");
    ASSERT_TRUE(r.succeeded) << r.error_message;
    EXPECT_EQ(r.stdout_text, "3\n");
}

TEST_F(WorkerExecution, UncaughtSystemExitIsAFailure) {
    ExecutionResult r = run("raise SystemExit(3)\n");
    EXPECT_FALSE(r.succeeded);
    EXPECT_EQ(r.error_message, "SystemExit: 3");
}

TEST_F(WorkerExecution, InfiniteLoopTimesOut) {
    std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();
    ExecutionResult r = run("while True:\n    pass\n", "", 1);
    double wall = seconds_since(start);

    EXPECT_FALSE(r.succeeded);
    EXPECT_EQ(r.error_message, "Timeout exceeded");
    EXPECT_EQ(r.outcome, ExecutionOutcome::TIMED_OUT);
    EXPECT_TRUE(contains(r.stderr_text, "Timeout exceeded"));
    EXPECT_LT(wall, 1.0 + supervisor.config().grace_ms / 1000.0 + 1.0);
}

TEST_F(WorkerExecution, SleepingScriptTimesOut) {
    ExecutionResult r = run("import time\nprint('start')\ntime.sleep(5)\n", "", 1);
    EXPECT_FALSE(r.succeeded);
    EXPECT_EQ(r.error_message, "Timeout exceeded");
    EXPECT_EQ(r.stdout_text, "start\n");
}

TEST_F(WorkerExecution, OutputIsTruncated) {
    SupervisorConfig c = worker_config();
    c.limits.max_output_bytes = 100;
    SandboxSupervisor small(c);
    ExecutionResult r = small.execute("for i in range(1000):\n    print('line', i)\n", "", 10);
    ASSERT_TRUE(r.succeeded) << r.error_message;
    EXPECT_TRUE(contains(r.stdout_text, "[output truncated]"));
    EXPECT_LT(r.stdout_text.size(), 200u);
}

TEST_F(WorkerExecution, RepeatedRunsAreIndependent) {
    const char* source = "counter = 0\ndef main():\n    global counter\n    counter += 1\n    print(counter)\n    return counter\n";
    ExecutionResult a = run(source);
    ExecutionResult b = run(source);
    ASSERT_TRUE(a.succeeded);
    ASSERT_TRUE(b.succeeded);
    EXPECT_EQ(a.stdout_text, "1\n");
    EXPECT_EQ(b.stdout_text, a.stdout_text);
    EXPECT_EQ(b.return_value, a.return_value);
}

TEST_F(WorkerExecution, ConcurrentRunsDoNotMix) {
    const int count = 4;
    std::vector<ExecutionResult> results(count);
    std::vector<std::thread> threads;
    for (int i = 0; i < count; ++i) {
        threads.push_back(std::thread([this, i, &results]() {
            std::string id = std::to_string(i);
            results[i] = run("for _ in range(50):\n    print('" + id + "')\n");
        }));
    }
    for (size_t i = 0; i < threads.size(); ++i) threads[i].join();

    for (int i = 0; i < count; ++i) {
        ASSERT_TRUE(results[i].succeeded) << results[i].error_message;
        std::string expected;
        for (int n = 0; n < 50; ++n) expected += std::to_string(i) + "\n";
        EXPECT_EQ(results[i].stdout_text, expected);
    }
}
