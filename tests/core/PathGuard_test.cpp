#include <gtest/gtest.h>
#include "core/PathGuard.hpp"
#include <filesystem>
#include <fstream>

using namespace mcpkit;
namespace fs = std::filesystem;

class PathGuardTest : public ::testing::Test {
protected:
    fs::path test_dir_;
    fs::path allowed_;
    fs::path sibling_;

    void SetUp() override {
        // Create temporary test directory structure
        test_dir_ = fs::temp_directory_path() / "mcpkit_path_guard_test";
        fs::remove_all(test_dir_);
        fs::create_directories(test_dir_);
        test_dir_ = fs::canonical(test_dir_);

        allowed_ = test_dir_ / "allowed";
        sibling_ = test_dir_ / "allowed_sibling";
        fs::create_directories(allowed_ / "subdir");
        fs::create_directories(sibling_);

        create_file(allowed_ / "file.txt", "inside");
        create_file(sibling_ / "secret.txt", "outside");
    }

    void TearDown() override {
        fs::remove_all(test_dir_);
    }

    void create_file(const fs::path& path, const std::string& content) {
        std::ofstream file(path);
        file << content;
        file.close();
    }
};

TEST_F(PathGuardTest, AcceptsPathsInsideAllowedDirectory) {
    PathGuard guard({allowed_.string()});

    EXPECT_EQ(guard.validate((allowed_ / "file.txt").string()), allowed_ / "file.txt");
    EXPECT_EQ(guard.validate(allowed_.string()), allowed_);
    EXPECT_TRUE(guard.is_allowed((allowed_ / "subdir").string()));
}

TEST_F(PathGuardTest, AcceptsNotYetExistingPaths) {
    PathGuard guard({allowed_.string()});

    auto result = guard.validate((allowed_ / "new_dir" / "new_file.txt").string());
    EXPECT_EQ(result, allowed_ / "new_dir" / "new_file.txt");
}

TEST_F(PathGuardTest, RejectsPathsOutsideAllowedDirectory) {
    PathGuard guard({allowed_.string()});

    EXPECT_THROW(guard.validate((test_dir_ / "other.txt").string()), AccessDenied);
    EXPECT_FALSE(guard.is_allowed("/"));
}

TEST_F(PathGuardTest, RejectsSiblingWithSharedPrefix) {
    PathGuard guard({allowed_.string()});

    // "allowed_sibling" starts with "allowed" but is a different directory
    EXPECT_THROW(guard.validate((sibling_ / "secret.txt").string()), AccessDenied);
}

TEST_F(PathGuardTest, RejectsParentTraversal) {
    PathGuard guard({allowed_.string()});

    std::string escape = (allowed_ / "subdir" / ".." / ".." / "allowed_sibling" / "secret.txt").string();
    EXPECT_THROW(guard.validate(escape), AccessDenied);
}

TEST_F(PathGuardTest, RejectsSymlinkEscapingAllowedDirectory) {
    std::error_code ec;
    fs::create_directory_symlink(sibling_, allowed_ / "link", ec);
    if (ec) {
        GTEST_SKIP() << "Symlinks not supported: " << ec.message();
    }

    PathGuard guard({allowed_.string()});
    EXPECT_THROW(guard.validate((allowed_ / "link" / "secret.txt").string()), AccessDenied);
}

TEST_F(PathGuardTest, TrailingSeparatorOnRootIsIgnored) {
    PathGuard guard({allowed_.string() + "/"});

    EXPECT_TRUE(guard.is_allowed((allowed_ / "file.txt").string()));
    EXPECT_EQ(guard.allowed_directories().front(), allowed_);
}

TEST_F(PathGuardTest, MultipleRoots) {
    PathGuard guard({allowed_.string(), sibling_.string()});

    EXPECT_TRUE(guard.is_allowed((allowed_ / "file.txt").string()));
    EXPECT_TRUE(guard.is_allowed((sibling_ / "secret.txt").string()));
    EXPECT_FALSE(guard.is_allowed((test_dir_ / "third").string()));
    EXPECT_EQ(guard.allowed_directories().size(), 2u);
}

TEST_F(PathGuardTest, InvalidConstruction) {
    EXPECT_THROW(PathGuard(std::vector<std::string>{}), std::invalid_argument);
    EXPECT_THROW(PathGuard({""}), std::invalid_argument);
}

TEST_F(PathGuardTest, EmptyPathIsInvalid) {
    PathGuard guard({allowed_.string()});

    EXPECT_THROW(guard.validate(""), std::invalid_argument);
    EXPECT_FALSE(guard.is_allowed(""));
}
