/***
 * Name: test_commands
 * Purpose: Option parsing and the storage-side CLI commands, driven
 *          through string streams.
 */
#include <gtest/gtest.h>

#include <scriptdeck/core/commands.hpp>
#include <scriptdeck/core/utils.hpp>
#include "support/temp_dir.hpp"

#include <sstream>

using namespace scriptdeck;

namespace {

std::vector<std::string> argv_of(const char* a, const char* b = nullptr, const char* c = nullptr,
                                 const char* d = nullptr, const char* e = nullptr) {
    std::vector<std::string> v;
    const char* all[] = {a, b, c, d, e};
    for (size_t i = 0; i < 5 && all[i]; ++i) v.push_back(all[i]);
    return v;
}

class CommandsTest : public ::testing::Test {
protected:
    CommandsTest() : supervisor(SupervisorConfig()), runner(store, supervisor) {}

    void SetUp() override {
        ASSERT_TRUE(store.open(dir.file("scripts.db"), dir.file("scripts")));
    }

    int call(CommandHandler handler, const std::vector<std::string>& argv) {
        out.str("");
        err.str("");
        CommandArgs args;
        std::string error;
        EXPECT_TRUE(parse_command_args(argv, args, error)) << error;
        CommandContext ctx(runner, out, err);
        return handler(ctx, args);
    }

    scriptdeck::testing::TempDir dir;
    ScriptStore store;
    SandboxSupervisor supervisor;
    ScriptRunner runner;
    std::ostringstream out;
    std::ostringstream err;
};

} // namespace

TEST(CommandArgs, ParsesOptionsAnywhere) {
    CommandArgs args;
    std::string error;
    std::vector<std::string> argv = argv_of("--json", "Math", "--tag", "x", "Fib");
    ASSERT_TRUE(parse_command_args(argv, args, error));
    EXPECT_TRUE(args.json);
    ASSERT_EQ(args.positional.size(), 2u);
    EXPECT_EQ(args.positional[1], "Fib");
    ASSERT_EQ(args.tags.size(), 1u);
}

TEST(CommandArgs, StdinAndTimeout) {
    CommandArgs args;
    std::string error;
    ASSERT_TRUE(parse_command_args(argv_of("-", "--stdin", "a\nb", "--timeout", "7"), args, error));
    EXPECT_EQ(args.positional[0], "-");
    EXPECT_TRUE(args.has_stdin);
    EXPECT_EQ(args.stdin_text, "a\nb");
    EXPECT_EQ(args.timeout_seconds, 7);
}

TEST(CommandArgs, RejectsMalformedOptions) {
    CommandArgs args;
    std::string error;
    EXPECT_FALSE(parse_command_args(argv_of("--timeout", "0"), args, error));
    EXPECT_FALSE(parse_command_args(argv_of("--timeout", "5s"), args, error));
    EXPECT_FALSE(parse_command_args(argv_of("--timeout"), args, error));
    EXPECT_FALSE(parse_command_args(argv_of("--bogus"), args, error));

    CommandArgs both;
    EXPECT_FALSE(parse_command_args(argv_of("--stdin", "x", "--stdin-file", "f"), both, error));
}

TEST(CommandRegistry, KnowsEveryCommand) {
    const char* names[] = {"run", "exec", "save", "show", "delete", "list", "search",
                           "collections", "create-collection", "delete-collection"};
    for (size_t i = 0; i < sizeof(names) / sizeof(names[0]); ++i) {
        EXPECT_NE(find_command(names[i]), nullptr) << names[i];
    }
    EXPECT_EQ(find_command("frobnicate"), nullptr);
}

TEST_F(CommandsTest, SaveShowListDelete) {
    std::string file = dir.file("hello.py");
    ASSERT_TRUE(write_file_atomic(file, "print('hi')\n"));

    EXPECT_EQ(call(commands::cmd_create_collection, argv_of("Demo")), EXIT_OK);
    EXPECT_EQ(call(commands::cmd_save, argv_of("Demo", "Hello", file.c_str(), "--tag", "greet")), EXIT_OK);

    EXPECT_EQ(call(commands::cmd_show, argv_of("Demo", "Hello")), EXIT_OK);
    EXPECT_NE(out.str().find("print('hi')"), std::string::npos);
    EXPECT_NE(out.str().find("tags: greet"), std::string::npos);

    EXPECT_EQ(call(commands::cmd_list, argv_of("Demo")), EXIT_OK);
    EXPECT_EQ(out.str(), "Demo/Hello [greet]\n");

    EXPECT_EQ(call(commands::cmd_list, argv_of("Demo", "--json")), EXIT_OK);
    Json listed = Json::parse(out.str());
    ASSERT_EQ(listed.size(), 1u);
    EXPECT_EQ(listed[0]["filename"], "Hello.py");

    EXPECT_EQ(call(commands::cmd_search, argv_of("GREE")), EXIT_OK);
    EXPECT_NE(out.str().find("Demo/Hello"), std::string::npos);

    EXPECT_EQ(call(commands::cmd_delete, argv_of("Demo", "Hello")), EXIT_OK);
    EXPECT_EQ(call(commands::cmd_show, argv_of("Demo", "Hello")), EXIT_FAILED);
    EXPECT_NE(err.str().find("not found"), std::string::npos);
}

TEST_F(CommandsTest, CollectionsCommands) {
    EXPECT_EQ(call(commands::cmd_create_collection, argv_of("Work")), EXIT_OK);
    EXPECT_EQ(call(commands::cmd_collections, argv_of("--json")), EXIT_OK);
    Json names = Json::parse(out.str());
    ASSERT_EQ(names.size(), 2u);
    EXPECT_EQ(names[1], "Work");

    EXPECT_EQ(call(commands::cmd_delete_collection, argv_of("Uncategorized")), EXIT_FAILED);
    EXPECT_EQ(call(commands::cmd_delete_collection, argv_of("Work")), EXIT_OK);
    EXPECT_EQ(call(commands::cmd_list, argv_of("Work")), EXIT_FAILED);
}

TEST_F(CommandsTest, SaveFromMissingFileFails) {
    EXPECT_EQ(call(commands::cmd_save, argv_of("Uncategorized", "x", dir.file("nope.py").c_str())),
              EXIT_FAILED);
    EXPECT_TRUE(runner.list("Uncategorized").empty());
}
