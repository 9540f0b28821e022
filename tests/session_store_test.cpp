#include "fake_runtime.hpp"
#include "session/session_store.hpp"

#include <fstream>

#include <gtest/gtest.h>

namespace fs = std::filesystem;
using sandkeep::session::CreateStatus;
using sandkeep::session::FileOpStatus;
using sandkeep::session::SessionStore;
using sandkeep::test_support::TempDir;

namespace {

constexpr long long kRetention = 100;

class SessionStoreTest : public ::testing::Test {
protected:
    SessionStoreTest()
        : store_(dir_.Path() / "sandboxes", kRetention, [this] { return now_; }) {}

    TempDir dir_;
    double now_ = 1000.0;
    SessionStore store_;
};

}  // namespace

TEST_F(SessionStoreTest, create_then_create_again_reports_existing) {
    EXPECT_EQ(store_.Create("42"), CreateStatus::kCreated);
    EXPECT_EQ(store_.Create("42"), CreateStatus::kAlreadyExists);
    EXPECT_TRUE(fs::is_directory(store_.RootPath("42")));
    EXPECT_TRUE(fs::is_regular_file(store_.RootPath("42") / SessionStore::kMetaFileName));

    const auto meta = store_.LoadMeta("42");
    ASSERT_TRUE(meta.has_value());
    EXPECT_DOUBLE_EQ(meta->created_at, 1000.0);
    EXPECT_DOUBLE_EQ(meta->last_used, 1000.0);
    EXPECT_EQ(meta->cwd, ".");
}

TEST_F(SessionStoreTest, unknown_owner_has_no_session) {
    EXPECT_FALSE(store_.Ensure("7"));
    EXPECT_EQ(store_.WriteFile("7", "a.txt", "x"), FileOpStatus::kNoSession);
    EXPECT_FALSE(store_.List("7").has_value());
}

TEST_F(SessionStoreTest, owner_ids_that_could_leave_the_base_are_refused) {
    EXPECT_EQ(store_.Create(""), CreateStatus::kFailed);
    EXPECT_EQ(store_.Create("."), CreateStatus::kFailed);
    EXPECT_EQ(store_.Create(".."), CreateStatus::kFailed);
    EXPECT_EQ(store_.Create("../evil"), CreateStatus::kFailed);
    EXPECT_EQ(store_.Create("a\\b"), CreateStatus::kFailed);
    EXPECT_FALSE(fs::exists(dir_.Path() / "evil"));
}

TEST_F(SessionStoreTest, idle_session_expires_lazily) {
    ASSERT_EQ(store_.Create("42"), CreateStatus::kCreated);
    ASSERT_TRUE(store_.WriteFile("42", "data.txt", "payload") == FileOpStatus::kOk);

    now_ += kRetention;
    EXPECT_TRUE(store_.Ensure("42"));

    now_ += 1.5;
    EXPECT_FALSE(store_.Ensure("42"));
    EXPECT_FALSE(fs::exists(store_.RootPath("42")));
    EXPECT_EQ(store_.Create("42"), CreateStatus::kCreated);
}

TEST_F(SessionStoreTest, touch_extends_the_lifetime) {
    ASSERT_EQ(store_.Create("42"), CreateStatus::kCreated);
    now_ += 60;
    store_.Touch("42");
    now_ += 60;
    EXPECT_TRUE(store_.Ensure("42"));
    EXPECT_DOUBLE_EQ(store_.LoadMeta("42")->last_used, 1060.0);
}

TEST_F(SessionStoreTest, unreadable_metadata_makes_the_session_unusable) {
    ASSERT_EQ(store_.Create("42"), CreateStatus::kCreated);
    sandkeep::test_support::WriteText(store_.RootPath("42") / SessionStore::kMetaFileName, "{not json");
    EXPECT_FALSE(store_.Ensure("42"));
    EXPECT_EQ(store_.Create("42"), CreateStatus::kCreated);
    EXPECT_TRUE(store_.Ensure("42"));
}

TEST_F(SessionStoreTest, delete_removes_nested_tree_and_is_idempotent) {
    ASSERT_EQ(store_.Create("42"), CreateStatus::kCreated);
    ASSERT_EQ(store_.WriteFile("42", "a/b/c/deep.txt", "x"), FileOpStatus::kOk);
    ASSERT_EQ(store_.WriteFile("42", "top.txt", "y"), FileOpStatus::kOk);
    fs::create_symlink(store_.RootPath("42") / "top.txt", store_.RootPath("42") / "a" / "link");

    EXPECT_TRUE(store_.Delete("42"));
    EXPECT_FALSE(fs::exists(store_.RootPath("42")));
    EXPECT_FALSE(store_.Delete("42"));
    EXPECT_FALSE(store_.Ensure("42"));
}

TEST_F(SessionStoreTest, delete_does_not_follow_symlinks_out_of_the_session) {
    const auto outside = dir_.Path() / "keep";
    fs::create_directories(outside);
    sandkeep::test_support::WriteText(outside / "precious.txt", "keep me");

    ASSERT_EQ(store_.Create("42"), CreateStatus::kCreated);
    fs::create_directory_symlink(outside, store_.RootPath("42") / "escape");

    EXPECT_TRUE(store_.Delete("42"));
    EXPECT_TRUE(fs::exists(outside / "precious.txt"));
}

TEST_F(SessionStoreTest, cwd_navigation_is_root_relative_and_validated) {
    ASSERT_EQ(store_.Create("42"), CreateStatus::kCreated);
    ASSERT_EQ(store_.WriteFile("42", "sub/inner/a.txt", "x"), FileOpStatus::kOk);

    EXPECT_TRUE(store_.SetCwd("42", "sub"));
    EXPECT_EQ(store_.CurrentCwd("42"), "sub");
    EXPECT_TRUE(store_.SetCwd("42", "sub/inner"));
    EXPECT_EQ(store_.CurrentCwd("42"), "sub/inner");

    EXPECT_FALSE(store_.SetCwd("42", "../.."));
    EXPECT_FALSE(store_.SetCwd("42", "missing"));
    EXPECT_FALSE(store_.SetCwd("42", "sub/inner/a.txt"));
    EXPECT_EQ(store_.CurrentCwd("42"), "sub/inner");

    EXPECT_TRUE(store_.SetCwd("42", "/"));
    EXPECT_EQ(store_.CurrentCwd("42"), ".");
}

TEST_F(SessionStoreTest, write_lands_in_the_current_directory) {
    ASSERT_EQ(store_.Create("42"), CreateStatus::kCreated);
    ASSERT_EQ(store_.WriteFile("42", "sub/keep.txt", ""), FileOpStatus::kOk);
    ASSERT_TRUE(store_.SetCwd("42", "sub"));

    fs::path written;
    EXPECT_EQ(store_.WriteFile("42", "b.txt", "hello\nworld", &written), FileOpStatus::kOk);
    EXPECT_EQ(written, fs::canonical(store_.RootPath("42")) / "sub" / "b.txt");
    EXPECT_EQ(store_.ReadFile("42", "b.txt"), std::optional<std::string>("hello\nworld"));
    EXPECT_EQ(store_.WriteFile("42", "../up.txt", "u"), FileOpStatus::kOk);
    EXPECT_TRUE(fs::exists(store_.RootPath("42") / "up.txt"));
}

TEST_F(SessionStoreTest, write_refuses_escapes_directories_and_metadata) {
    ASSERT_EQ(store_.Create("42"), CreateStatus::kCreated);
    ASSERT_EQ(store_.WriteFile("42", "dir/a.txt", "x"), FileOpStatus::kOk);

    EXPECT_EQ(store_.WriteFile("42", "../../escape.txt", "x"), FileOpStatus::kPathEscape);
    EXPECT_EQ(store_.WriteFile("42", "dir", "x"), FileOpStatus::kDirectoryConflict);
    EXPECT_EQ(store_.WriteFile("42", SessionStore::kMetaFileName, "{}"), FileOpStatus::kPathEscape);
    EXPECT_TRUE(store_.Ensure("42"));
}

TEST_F(SessionStoreTest, listing_sorts_directories_first_then_names_case_insensitively) {
    ASSERT_EQ(store_.Create("42"), CreateStatus::kCreated);
    ASSERT_EQ(store_.WriteFile("42", "B.txt", "12345"), FileOpStatus::kOk);
    ASSERT_EQ(store_.WriteFile("42", "a.txt", "1"), FileOpStatus::kOk);
    ASSERT_EQ(store_.WriteFile("42", "zdir/x", ""), FileOpStatus::kOk);
    ASSERT_EQ(store_.WriteFile("42", "Adir/x", ""), FileOpStatus::kOk);

    const auto listing = store_.List("42");
    ASSERT_TRUE(listing.has_value());
    EXPECT_EQ(listing->cwd, ".");
    ASSERT_EQ(listing->entries.size(), 4u);
    EXPECT_EQ(listing->entries[0].name, "Adir");
    EXPECT_TRUE(listing->entries[0].is_dir);
    EXPECT_EQ(listing->entries[1].name, "zdir");
    EXPECT_EQ(listing->entries[2].name, "a.txt");
    EXPECT_EQ(listing->entries[2].size, 1u);
    EXPECT_EQ(listing->entries[3].name, "B.txt");
    EXPECT_EQ(listing->entries[3].size, 5u);
}

TEST_F(SessionStoreTest, remove_distinguishes_files_directories_and_missing_paths) {
    ASSERT_EQ(store_.Create("42"), CreateStatus::kCreated);
    ASSERT_EQ(store_.WriteFile("42", "f.txt", "x"), FileOpStatus::kOk);
    ASSERT_EQ(store_.WriteFile("42", "d/e/g.txt", "x"), FileOpStatus::kOk);

    EXPECT_EQ(store_.Remove("42", "f.txt", false), FileOpStatus::kOk);
    EXPECT_FALSE(fs::exists(store_.RootPath("42") / "f.txt"));
    EXPECT_EQ(store_.Remove("42", "f.txt", false), FileOpStatus::kNotFound);
    EXPECT_EQ(store_.Remove("42", "d", false), FileOpStatus::kNeedsRecursive);
    EXPECT_EQ(store_.Remove("42", "d", true), FileOpStatus::kOk);
    EXPECT_FALSE(fs::exists(store_.RootPath("42") / "d"));
    EXPECT_EQ(store_.Remove("42", "../..", true), FileOpStatus::kPathEscape);
    EXPECT_EQ(store_.Remove("42", "/", true), FileOpStatus::kPathEscape);
    EXPECT_EQ(store_.Remove("42", SessionStore::kMetaFileName, false), FileOpStatus::kPathEscape);
    EXPECT_TRUE(store_.Ensure("42"));
}

TEST_F(SessionStoreTest, write_and_remove_cannot_follow_a_symlink_behind_a_missing_step) {
    const auto outside = dir_.Path() / "outside";
    fs::create_directories(outside);
    sandkeep::test_support::WriteText(outside / "victim.txt", "keep me");

    ASSERT_EQ(store_.Create("42"), CreateStatus::kCreated);
    fs::create_directory_symlink(outside, store_.RootPath("42") / "link");

    EXPECT_EQ(store_.WriteFile("42", "nope/../link/pwned.txt", "x"), FileOpStatus::kPathEscape);
    EXPECT_FALSE(fs::exists(outside / "pwned.txt"));
    EXPECT_EQ(store_.Remove("42", "nope/../link/victim.txt", false), FileOpStatus::kPathEscape);
    EXPECT_TRUE(fs::exists(outside / "victim.txt"));
    EXPECT_FALSE(store_.ReadFile("42", "nope/../link/victim.txt").has_value());
    EXPECT_FALSE(store_.SetCwd("42", "nope/../link"));
    EXPECT_EQ(store_.CurrentCwd("42"), ".");
}

TEST_F(SessionStoreTest, tampered_cwd_in_metadata_falls_back_to_the_root) {
    ASSERT_EQ(store_.Create("42"), CreateStatus::kCreated);
    sandkeep::test_support::WriteText(
        store_.RootPath("42") / SessionStore::kMetaFileName,
        R"({"created_at": 1000, "last_used": 1000, "cwd": "../x"})");

    EXPECT_EQ(store_.CurrentCwd("42"), ".");
    EXPECT_EQ(store_.WriteFile("42", "a.txt", "x"), FileOpStatus::kOk);
    EXPECT_TRUE(fs::exists(store_.RootPath("42") / "a.txt"));
}

TEST_F(SessionStoreTest, last_used_in_the_future_counts_as_expired) {
    ASSERT_EQ(store_.Create("42"), CreateStatus::kCreated);
    sandkeep::test_support::WriteText(
        store_.RootPath("42") / SessionStore::kMetaFileName,
        R"({"created_at": 1000, "last_used": 1e12, "cwd": "."})");

    EXPECT_FALSE(store_.Ensure("42"));
    EXPECT_FALSE(fs::exists(store_.RootPath("42")));
}

TEST(session_store, remove_tree_handles_files_and_missing_paths) {
    TempDir dir;
    const auto root = dir.Path() / "tree";
    fs::create_directories(root / "x" / "y");
    sandkeep::test_support::WriteText(root / "x" / "y" / "z.txt", "z");
    sandkeep::test_support::WriteText(root / "x" / "w.txt", "w");

    EXPECT_TRUE(SessionStore::RemoveTree(root));
    EXPECT_FALSE(fs::exists(root));
    EXPECT_FALSE(SessionStore::RemoveTree(dir.Path() / "never-existed"));
}
