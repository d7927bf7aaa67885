/***
 * Name: test_script_runner
 * Purpose: Name sanitization, CRUD, search and collection rules of the
 *          script runner facade. Execution is covered by the integration
 *          suites; here the supervisor points at a missing worker.
 */
#include <gtest/gtest.h>

#include <scriptdeck/storage/script_runner.hpp>
#include <scriptdeck/core/utils.hpp>
#include "support/temp_dir.hpp"

#include <chrono>
#include <thread>

using namespace scriptdeck;

namespace {

SupervisorConfig no_worker() {
    SupervisorConfig c;
    c.worker_path = "/nonexistent/scriptdeck-worker";
    return c;
}

class ScriptRunnerTest : public ::testing::Test {
protected:
    ScriptRunnerTest() : supervisor(no_worker()), runner(store, supervisor) {}

    void SetUp() override {
        ASSERT_TRUE(store.open(dir.file("scripts.db"), dir.file("scripts")));
    }

    std::vector<std::string> tags(const char* a, const char* b = nullptr) {
        std::vector<std::string> t(1, a);
        if (b) t.push_back(b);
        return t;
    }

    scriptdeck::testing::TempDir dir;
    ScriptStore store;
    SandboxSupervisor supervisor;
    ScriptRunner runner;
};

} // namespace

TEST(ScriptRunnerNames, SanitizeKeepsSafeCharacters) {
    EXPECT_EQ(ScriptRunner::sanitize_name("Hello World!"), "HelloWorld");
    EXPECT_EQ(ScriptRunner::sanitize_name("../../evil"), "evil");
    EXPECT_EQ(ScriptRunner::sanitize_name("a-b_c.9"), "a-b_c9");
    EXPECT_EQ(ScriptRunner::sanitize_name("../.."), "");
    EXPECT_EQ(ScriptRunner::sanitize_name("\xc3\xa9t\xc3\xa9"), "t");
}

TEST_F(ScriptRunnerTest, SaveAndLoad) {
    ScriptOpResult r = runner.save("Hello World", "print('hi')\n", "Uncategorized", "greets", tags("demo"));
    ASSERT_TRUE(r.success) << r.error;
    EXPECT_TRUE(file_exists(dir.file("scripts/Uncategorized/HelloWorld.py")));

    LoadedScript s;
    ASSERT_TRUE(runner.load("Hello World", "Uncategorized", s).success);
    EXPECT_EQ(s.code, "print('hi')\n");
    EXPECT_EQ(s.metadata.name, "Hello World");
    EXPECT_EQ(s.metadata.filename, "HelloWorld.py");
    EXPECT_EQ(s.metadata.description, "greets");
    EXPECT_EQ(s.metadata.content_hash, sha256_hex("print('hi')\n"));
}

TEST_F(ScriptRunnerTest, TraversalNameStaysInCollection) {
    ASSERT_TRUE(runner.create_collection("Security").success);
    ASSERT_TRUE(runner.save("../../evil", "x = 1\n", "Security", "", std::vector<std::string>()).success);

    EXPECT_TRUE(file_exists(dir.file("scripts/Security/evil.py")));
    EXPECT_FALSE(file_exists(dir.file("evil.py")));
    EXPECT_FALSE(file_exists(dir.file("scripts/evil.py")));
    EXPECT_FALSE(file_exists(join_path(dir.path(), "../evil.py")));
}

TEST_F(ScriptRunnerTest, EmptySanitizedNameRejectedBeforeStorage) {
    ScriptOpResult r = runner.save("!!!", "x", "Nowhere", "", std::vector<std::string>());
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error_kind, ScriptErrorKind::NAME_REJECTED);
    EXPECT_FALSE(is_directory(dir.file("scripts/Nowhere")));
}

TEST_F(ScriptRunnerTest, SaveNeedsExistingCollection) {
    ScriptOpResult r = runner.save("a", "x", "Missing", "", std::vector<std::string>());
    EXPECT_EQ(r.error_kind, ScriptErrorKind::COLLECTION_NOT_FOUND);
    r = runner.save("a", "x", "bad/name", "", std::vector<std::string>());
    EXPECT_EQ(r.error_kind, ScriptErrorKind::INVALID_COLLECTION_NAME);
}

TEST_F(ScriptRunnerTest, UnknownCollectionsDoNotAccumulateLocks) {
    LoadedScript s;
    for (int i = 0; i < 50; ++i) {
        std::string missing = "Missing" + std::to_string(i);
        EXPECT_EQ(runner.save("a", "x", missing, "", std::vector<std::string>()).error_kind,
                  ScriptErrorKind::COLLECTION_NOT_FOUND);
        EXPECT_EQ(runner.load("a", "bad/" + missing, s).error_kind,
                  ScriptErrorKind::INVALID_COLLECTION_NAME);
        EXPECT_EQ(runner.remove("a", missing).error_kind, ScriptErrorKind::COLLECTION_NOT_FOUND);
        EXPECT_TRUE(runner.list("../" + missing).empty());
    }
    EXPECT_EQ(runner.lock_count(), 0u);
}

TEST_F(ScriptRunnerTest, DeletingCollectionReleasesItsLock) {
    ASSERT_TRUE(runner.create_collection("Scratch").success);
    ASSERT_TRUE(runner.save("a", "x", "Scratch", "", std::vector<std::string>()).success);
    EXPECT_EQ(runner.lock_count(), 1u);

    ASSERT_TRUE(runner.delete_collection("Scratch").success);
    EXPECT_EQ(runner.lock_count(), 0u);
    EXPECT_EQ(runner.delete_collection("Scratch").error_kind, ScriptErrorKind::COLLECTION_NOT_FOUND);
    EXPECT_EQ(runner.lock_count(), 0u);
}

TEST_F(ScriptRunnerTest, UpdatePreservesCreatedAt) {
    ASSERT_TRUE(runner.save("job", "v1", "Uncategorized", "", std::vector<std::string>()).success);
    LoadedScript first;
    ASSERT_TRUE(runner.load("job", "Uncategorized", first).success);

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    ASSERT_TRUE(runner.save("job", "v2", "Uncategorized", "new", std::vector<std::string>()).success);
    LoadedScript second;
    ASSERT_TRUE(runner.load("job", "Uncategorized", second).success);

    EXPECT_EQ(second.code, "v2");
    EXPECT_EQ(second.metadata.created_at, first.metadata.created_at);
    EXPECT_GT(second.metadata.modified_at, first.metadata.modified_at);
    EXPECT_EQ(runner.list("Uncategorized").size(), 1u);
}

TEST_F(ScriptRunnerTest, RemoveAndNotFound) {
    ASSERT_TRUE(runner.save("gone", "x", "Uncategorized", "", std::vector<std::string>()).success);
    ASSERT_TRUE(runner.remove("gone", "Uncategorized").success);
    EXPECT_FALSE(file_exists(dir.file("scripts/Uncategorized/gone.py")));

    LoadedScript s;
    EXPECT_EQ(runner.load("gone", "Uncategorized", s).error_kind, ScriptErrorKind::SCRIPT_NOT_FOUND);
    EXPECT_EQ(runner.remove("gone", "Uncategorized").error_kind, ScriptErrorKind::SCRIPT_NOT_FOUND);
}

TEST_F(ScriptRunnerTest, SearchMatchesNameOrTagIgnoringCase) {
    ASSERT_TRUE(runner.create_collection("Math").success);
    ASSERT_TRUE(runner.save("Fibonacci", "x", "Math", "", tags("sequence")).success);
    ASSERT_TRUE(runner.save("Primes", "x", "Math", "", tags("Number Theory", "sieve")).success);
    ASSERT_TRUE(runner.save("Greeter", "x", "Uncategorized", "", tags("demo")).success);

    std::vector<ScriptMetadata> hits = runner.search("FIB");
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].name, "Fibonacci");

    hits = runner.search("theory");
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].name, "Primes");

    EXPECT_TRUE(runner.search("nothing-like-this").empty());
    EXPECT_EQ(runner.list_all().size(), 3u);
}

TEST_F(ScriptRunnerTest, CollectionLifecycle) {
    ASSERT_TRUE(runner.create_collection("Work").success);
    EXPECT_EQ(runner.create_collection("Work").error_kind, ScriptErrorKind::COLLECTION_EXISTS);
    EXPECT_EQ(runner.create_collection(" bad").error_kind, ScriptErrorKind::INVALID_COLLECTION_NAME);

    ASSERT_TRUE(runner.save("w", "x", "Work", "", std::vector<std::string>()).success);
    ASSERT_TRUE(runner.delete_collection("Work").success);
    EXPECT_EQ(runner.delete_collection("Work").error_kind, ScriptErrorKind::COLLECTION_NOT_FOUND);

    std::vector<std::string> names = runner.list_collections();
    ASSERT_EQ(names.size(), 1u);
    EXPECT_EQ(names[0], "Uncategorized");
}

TEST_F(ScriptRunnerTest, DefaultCollectionProtected) {
    ScriptOpResult r = runner.delete_collection("Uncategorized");
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error_kind, ScriptErrorKind::PROTECTED_COLLECTION);
    EXPECT_TRUE(store.has_collection("Uncategorized"));
}

TEST_F(ScriptRunnerTest, ExecuteSavedMissingScript) {
    ExecutionResult r = runner.execute_saved("absent", "Uncategorized", "", 5);
    EXPECT_FALSE(r.succeeded);
    EXPECT_EQ(r.error_message, "Script not found");
}

TEST_F(ScriptRunnerTest, ConcurrentSavesIntoOneCollection) {
    const int threads = 8;
    const int per_thread = 10;
    std::vector<std::thread> workers;
    std::vector<int> failures(threads, 0);
    for (int t = 0; t < threads; ++t) {
        workers.push_back(std::thread([this, t, per_thread, &failures]() {
            for (int i = 0; i < per_thread; ++i) {
                std::string name = "s" + std::to_string(t) + "_" + std::to_string(i);
                if (!runner.save(name, "print(" + std::to_string(i) + ")", "Uncategorized", "",
                                 std::vector<std::string>()).success) {
                    ++failures[t];
                }
            }
        }));
    }
    for (size_t i = 0; i < workers.size(); ++i) workers[i].join();

    for (int t = 0; t < threads; ++t) EXPECT_EQ(failures[t], 0);
    EXPECT_EQ(runner.list("Uncategorized").size(), static_cast<size_t>(threads * per_thread));
}

TEST(ScriptErrorKind, Names) {
    EXPECT_STREQ(error_kind_name(ScriptErrorKind::NAME_REJECTED), "NAME_REJECTED");
    EXPECT_STREQ(error_kind_name(ScriptErrorKind::STORAGE_FAILED), "STORAGE_FAILED");
}
