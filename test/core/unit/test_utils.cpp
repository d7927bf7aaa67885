/***
 * Name: test_utils
 * Purpose: String, path, file and hashing helpers.
 */
#include <gtest/gtest.h>

#include <scriptdeck/core/utils.hpp>
#include "support/temp_dir.hpp"

using namespace scriptdeck;

TEST(Utils, CaseAndPrefix) {
    EXPECT_EQ(to_lower("MiXeD"), "mixed");
    EXPECT_TRUE(starts_with("scriptdeck", "script"));
    EXPECT_FALSE(starts_with("sc", "script"));
}

TEST(Utils, SplitAndJoin) {
    std::vector<std::string> parts = split("a.b.c", '.');
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(join(parts, "/"), "a/b/c");
    EXPECT_EQ(join(std::vector<std::string>(), ","), "");
}

TEST(Utils, TruncateSafeKeepsUtf8Whole) {
    std::string s = "ab\xc3\xa9";   // "abé"
    EXPECT_EQ(truncate_safe(s, 3), "ab");
    EXPECT_EQ(truncate_safe(s, 4), s);
    EXPECT_EQ(truncate_safe("abc", 0), "");
}

TEST(Utils, JoinPath) {
    EXPECT_EQ(join_path("/a", "b"), "/a/b");
    EXPECT_EQ(join_path("/a/", "/b"), "/a/b");
    EXPECT_EQ(join_path("", "b"), "b");
}

TEST(Utils, ExpandHome) {
    EXPECT_EQ(expand_home("~"), home_dir());
    EXPECT_EQ(expand_home("~/x/y"), join_path(home_dir(), "x/y"));
    EXPECT_EQ(expand_home("/abs/~/p"), "/abs/~/p");
    EXPECT_EQ(expand_home("~other"), "~other");
}

TEST(Utils, DirectoriesAndAtomicWrites) {
    scriptdeck::testing::TempDir dir;
    std::string nested = dir.file("x/y/z");
    ASSERT_TRUE(ensure_directory(nested));
    EXPECT_TRUE(is_directory(nested));

    std::string path = join_path(nested, "f.txt");
    ASSERT_TRUE(write_file_atomic(path, "first"));
    ASSERT_TRUE(write_file_atomic(path, "second"));
    std::string content;
    ASSERT_TRUE(read_file(path, content));
    EXPECT_EQ(content, "second");

    EXPECT_TRUE(remove_tree(dir.file("x")));
    EXPECT_FALSE(file_exists(path));
    EXPECT_TRUE(remove_tree(dir.file("never-existed")));
}

TEST(Utils, Sha256) {
    EXPECT_EQ(sha256_hex(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(sha256_hex("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(Utils, UuidShape) {
    std::string a = generate_uuid();
    std::string b = generate_uuid();
    ASSERT_EQ(a.size(), 36u);
    EXPECT_EQ(a[14], '4');
    EXPECT_NE(a, b);
}

TEST(Utils, FormatTimestamp) {
    EXPECT_EQ(format_timestamp(0), "1970-01-01T00:00:00Z");
}
