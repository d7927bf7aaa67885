/***
 * Name: test_capabilities
 * Purpose: Verify built-in and import decisions of the capability allowlist.
 */
#include <gtest/gtest.h>

#include <scriptdeck/sandbox/capabilities.hpp>

using namespace scriptdeck;

namespace {
const CapabilityAllowlist& allowlist() { return CapabilityAllowlist::instance(); }
std::vector<std::string> none() { return std::vector<std::string>(); }
}

TEST(CapabilityAllowlist, CommonBuiltinsAllowed) {
    const char* names[] = {"print", "len", "range", "sum", "sorted", "int", "str",
                           "dict", "isinstance", "ValueError", "EOFError", "__build_class__",
                           "object"};
    for (size_t i = 0; i < sizeof(names) / sizeof(names[0]); ++i) {
        EXPECT_TRUE(allowlist().resolve_builtin(names[i])) << names[i];
    }
}

TEST(CapabilityAllowlist, FullExceptionHierarchyAllowed) {
    const char* names[] = {"BaseException", "SystemExit", "KeyboardInterrupt", "GeneratorExit",
                           "StopAsyncIteration", "UnicodeDecodeError", "UnicodeEncodeError"};
    for (size_t i = 0; i < sizeof(names) / sizeof(names[0]); ++i) {
        EXPECT_TRUE(allowlist().resolve_builtin(names[i])) << names[i];
    }
}

TEST(CapabilityAllowlist, DangerousBuiltinsNotAllowed) {
    const char* names[] = {"open", "eval", "exec", "compile", "__import__", "globals",
                           "locals", "vars", "getattr", "setattr", "delattr", "breakpoint",
                           "exit", "quit", "memoryview", "input"};
    for (size_t i = 0; i < sizeof(names) / sizeof(names[0]); ++i) {
        EXPECT_FALSE(allowlist().resolve_builtin(names[i])) << names[i];
    }
}

TEST(CapabilityAllowlist, BuiltinOrderIsStable) {
    const std::vector<std::string>& order = allowlist().builtins();
    ASSERT_FALSE(order.empty());
    EXPECT_EQ(order.front(), "print");
    for (size_t i = 0; i < order.size(); ++i) {
        EXPECT_TRUE(allowlist().resolve_builtin(order[i]));
    }
}

TEST(CapabilityAllowlist, SafeModulesAllowed) {
    EXPECT_TRUE(allowlist().resolve_import("math", none()).allowed);
    EXPECT_TRUE(allowlist().resolve_import("random", none()).allowed);
    EXPECT_TRUE(allowlist().resolve_import("json", none()).allowed);
    EXPECT_TRUE(allowlist().resolve_import("collections.abc", none()).allowed);
}

TEST(CapabilityAllowlist, DeniedModuleCarriesMessage) {
    ImportDecision d = allowlist().resolve_import("socket", none());
    EXPECT_FALSE(d.allowed);
    EXPECT_EQ(d.denied_name, "socket");
    EXPECT_EQ(d.reason, "Import of 'socket' is not allowed for security reasons");
}

TEST(CapabilityAllowlist, SubmoduleOfDeniedPackageDenied) {
    EXPECT_FALSE(allowlist().resolve_import("os.path", none()).allowed);
    EXPECT_FALSE(allowlist().resolve_import("urllib.request", none()).allowed);
    EXPECT_FALSE(allowlist().resolve_import("importlib.util", none()).allowed);
}

TEST(CapabilityAllowlist, PrivateModulesDenied) {
    EXPECT_FALSE(allowlist().resolve_import("_io", none()).allowed);
    EXPECT_FALSE(allowlist().resolve_import("_posixsubprocess", none()).allowed);
    EXPECT_FALSE(allowlist().resolve_import("", none()).allowed);
}

TEST(CapabilityAllowlist, DeniedImportedNameRejected) {
    std::vector<std::string> names;
    names.push_back("sqrt");
    names.push_back("os");
    ImportDecision d = allowlist().resolve_import("math", names);
    EXPECT_FALSE(d.allowed);
    EXPECT_EQ(d.denied_name, "os");

    std::vector<std::string> priv(1, "_inst");
    EXPECT_FALSE(allowlist().resolve_import("random", priv).allowed);

    std::vector<std::string> star(1, "*");
    EXPECT_TRUE(allowlist().resolve_import("math", star).allowed);
}

TEST(CapabilityAllowlist, RelativeImportDenied) {
    ImportDecision d = allowlist().resolve_import("helpers", none(), 1);
    EXPECT_FALSE(d.allowed);
    EXPECT_NE(d.reason.find("Relative import"), std::string::npos);
}
