/***
 * Name: test_saved_scripts
 * Purpose: Save scripts through the facade and run them with the real
 *          worker.
 */
#include <gtest/gtest.h>

#include <scriptdeck/storage/script_runner.hpp>
#include "support/temp_dir.hpp"

using namespace scriptdeck;

namespace {

SupervisorConfig worker_config() {
    SupervisorConfig c;
    c.worker_path = SCRIPTDECK_WORKER_PATH;
    return c;
}

} // namespace

TEST(SavedScripts, SaveThenExecute) {
    scriptdeck::testing::TempDir dir;
    ScriptStore store;
    ASSERT_TRUE(store.open(dir.file("scripts.db"), dir.file("scripts")));
    SandboxSupervisor supervisor(worker_config());
    ScriptRunner runner(store, supervisor);

    ASSERT_TRUE(runner.create_collection("Math").success);
    ASSERT_TRUE(runner.save("Squares", "def main():\n    n = int(input())\n    return [i * i for i in range(n)]\n",
                            "Math", "", std::vector<std::string>()).success);

    ExecutionResult r = runner.execute_saved("Squares", "Math", "4\n", 10);
    ASSERT_TRUE(r.succeeded) << r.error_message << "\n" << r.stderr_text;
    EXPECT_EQ(r.stdout_text, "4\n");
    ASSERT_TRUE(r.has_return_value);
    EXPECT_EQ(r.return_value, Json::parse("[0, 1, 4, 9]"));
}

TEST(SavedScripts, ExecuteDirectSourceThroughFacade) {
    scriptdeck::testing::TempDir dir;
    ScriptStore store;
    ASSERT_TRUE(store.open(dir.file("scripts.db"), dir.file("scripts")));
    SandboxSupervisor supervisor(worker_config());
    ScriptRunner runner(store, supervisor);

    ExecutionResult r = runner.execute("print('direct')\n");
    ASSERT_TRUE(r.succeeded) << r.error_message;
    EXPECT_EQ(r.stdout_text, "direct\n");
}
