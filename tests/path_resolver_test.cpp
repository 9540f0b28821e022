#include "fake_runtime.hpp"
#include "session/path_resolver.hpp"

#include <fstream>

#include <gtest/gtest.h>

namespace fs = std::filesystem;
using sandkeep::session::PathResolver;
using sandkeep::test_support::TempDir;

TEST(path_resolver, joins_relative_paths_under_root_and_cwd) {
    TempDir dir;
    fs::create_directories(dir.Path() / "sub");
    const auto resolved = PathResolver::Resolve(dir.Path(), "sub", "notes/a.txt");
    ASSERT_TRUE(resolved.has_value());
    EXPECT_EQ(*resolved, dir.Path() / "sub" / "notes" / "a.txt");
}

TEST(path_resolver, leading_slash_stays_inside_root) {
    TempDir dir;
    const auto resolved = PathResolver::Resolve(dir.Path(), ".", "/etc/passwd");
    ASSERT_TRUE(resolved.has_value());
    EXPECT_EQ(*resolved, dir.Path() / "etc" / "passwd");
}

TEST(path_resolver, backslashes_are_separators) {
    TempDir dir;
    const auto resolved = PathResolver::Resolve(dir.Path(), ".", "a\\b.txt");
    ASSERT_TRUE(resolved.has_value());
    EXPECT_EQ(*resolved, dir.Path() / "a" / "b.txt");
}

TEST(path_resolver, parent_traversal_out_of_root_is_rejected) {
    TempDir dir;
    fs::create_directories(dir.Path() / "box" / "sub");
    const auto root = dir.Path() / "box";
    EXPECT_FALSE(PathResolver::Resolve(root, ".", "../outside").has_value());
    EXPECT_FALSE(PathResolver::Resolve(root, "sub", "../../outside").has_value());
    EXPECT_FALSE(PathResolver::Resolve(root, ".", "sub/../../../etc/passwd").has_value());

    const auto back_to_root = PathResolver::Resolve(root, "sub", "..");
    ASSERT_TRUE(back_to_root.has_value());
    EXPECT_EQ(*back_to_root, root);
}

TEST(path_resolver, symlink_pointing_outside_is_rejected) {
    TempDir dir;
    const auto root = dir.Path() / "box";
    const auto outside = dir.Path() / "secret";
    fs::create_directories(root);
    fs::create_directories(outside);
    fs::create_directory_symlink(outside, root / "link");

    EXPECT_FALSE(PathResolver::Resolve(root, ".", "link").has_value());
    EXPECT_FALSE(PathResolver::Resolve(root, ".", "link/file.txt").has_value());
}

TEST(path_resolver, symlink_behind_a_missing_parent_step_is_rejected) {
    TempDir dir;
    const auto root = dir.Path() / "box";
    const auto outside = dir.Path() / "outside";
    fs::create_directories(root);
    fs::create_directories(outside);
    fs::create_directory_symlink(outside, root / "link");

    EXPECT_FALSE(PathResolver::Resolve(root, ".", "nope/../link/pwned.txt").has_value());
    EXPECT_FALSE(PathResolver::Resolve(root, "nope", "../link/pwned.txt").has_value());
    EXPECT_FALSE(PathResolver::ResolveDirectory(root, ".", "nope/../link").has_value());

    const auto folded = PathResolver::Resolve(root, ".", "nope/../kept.txt");
    ASSERT_TRUE(folded.has_value());
    EXPECT_EQ(*folded, fs::canonical(root) / "kept.txt");
}

TEST(path_resolver, sibling_with_common_prefix_is_not_contained) {
    EXPECT_FALSE(PathResolver::IsContained("/base/12", "/base/123"));
    EXPECT_FALSE(PathResolver::IsContained("/base/12", "/base"));
    EXPECT_TRUE(PathResolver::IsContained("/base/12", "/base/12/x"));
    EXPECT_TRUE(PathResolver::IsContained("/base/12", "/base/12"));
    EXPECT_TRUE(PathResolver::IsContained("/base/12/", "/base/12"));
}

TEST(path_resolver, sibling_directory_is_rejected) {
    TempDir dir;
    fs::create_directories(dir.Path() / "12");
    fs::create_directories(dir.Path() / "123");
    EXPECT_FALSE(PathResolver::Resolve(dir.Path() / "12", ".", "../123/file").has_value());
}

TEST(path_resolver, missing_root_resolves_to_nothing) {
    TempDir dir;
    EXPECT_FALSE(PathResolver::Resolve(dir.Path() / "absent", ".", "a.txt").has_value());
}

TEST(path_resolver, resolve_directory_reports_root_relative_targets) {
    TempDir dir;
    fs::create_directories(dir.Path() / "a" / "b");
    { std::ofstream(dir.Path() / "file.txt") << "x"; }

    EXPECT_EQ(PathResolver::ResolveDirectory(dir.Path(), ".", "a/b"), std::optional<std::string>("a/b"));
    EXPECT_EQ(PathResolver::ResolveDirectory(dir.Path(), ".", "/"), std::optional<std::string>("."));
    EXPECT_EQ(PathResolver::ResolveDirectory(dir.Path(), "a/b", "../.."), std::optional<std::string>("."));
    EXPECT_FALSE(PathResolver::ResolveDirectory(dir.Path(), ".", "file.txt").has_value());
    EXPECT_FALSE(PathResolver::ResolveDirectory(dir.Path(), ".", "missing").has_value());
    EXPECT_FALSE(PathResolver::ResolveDirectory(dir.Path(), ".", "..").has_value());
}

TEST(path_resolver, normalize_trims_and_strips_leading_separators) {
    EXPECT_EQ(PathResolver::Normalize("  //a/b "), "a/b");
    EXPECT_EQ(PathResolver::Normalize("\\\\x\\y"), "x/y");
    EXPECT_EQ(PathResolver::Normalize("/"), "");
}
