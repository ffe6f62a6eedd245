/**
 * @file test_transfersafety.cpp
 * @brief Unit tests for the TransferSafety class
 *
 * This file contains Google Test unit tests that verify the checks run
 * before a copy/move job: self-transfer detection, system path and home
 * directory protection for moves, virtual filesystem detection and mount
 * point parsing.
 *
 * @see TransferSafety
 */

#include <gtest/gtest.h>
#include "pathutils.hpp"
#include "testhelpers.hpp"
#include "transfersafety.hpp"
#include <cstdlib>
#include <filesystem>
#include <optional>

namespace fs = std::filesystem;

using Status = TransferSafety::TransferStatus;

/**
 * @class TransferSafetyTest
 * @brief Test fixture for TransferSafety unit tests
 *
 * Provides a source tree and a destination directory:
 * - src/a/sub/
 * - src/a/file.txt
 * - dst/
 *
 * HOME is saved and restored because some tests point it into the tree.
 */
class TransferSafetyTest : public ::testing::Test {
protected:
    fs::path test_dir;
    std::optional<std::string> saved_home;

    void SetUp() override {
        test_dir = makeTestDir("transfersafety");
        createDir(test_dir / "src" / "a" / "sub");
        createFile(test_dir / "src" / "a" / "file.txt", 10);
        createDir(test_dir / "dst");

        if (const char* home = std::getenv("HOME")) {
            saved_home = home;
        }
    }

    void TearDown() override {
        if (saved_home) {
            ::setenv("HOME", saved_home->c_str(), 1);
        } else {
            ::unsetenv("HOME");
        }

        std::error_code ec;
        fs::remove_all(test_dir, ec);
    }

    std::string path(const std::string& relative) const {
        return (test_dir / relative).string();
    }
};

/**
 * @test AllowsNormalTransfer
 * @brief A directory copied or moved into an unrelated directory passes
 */
TEST_F(TransferSafetyTest, AllowsNormalTransfer) {
    EXPECT_EQ(TransferSafety::checkSource(path("src/a"), path("dst"),
                                          TransferMode::Copy),
              Status::Allowed);
    EXPECT_EQ(TransferSafety::checkSource(path("src/a"), path("dst"),
                                          TransferMode::Move),
              Status::Allowed);

    auto check = TransferSafety::checkTransfer(
        {path("src/a"), path("src/a/file.txt")}, path("dst"),
        TransferMode::Copy);
    EXPECT_FALSE(check.blocked());
}

/**
 * @test DetectsTargetIsSource
 * @brief Copying a directory onto itself or into its own parent is refused
 *
 * The second case matters because the item would land on its own path.
 */
TEST_F(TransferSafetyTest, DetectsTargetIsSource) {
    EXPECT_EQ(TransferSafety::checkSource(path("src/a"), path("src/a"),
                                          TransferMode::Copy),
              Status::TargetIsSource);
    EXPECT_EQ(TransferSafety::checkSource(path("src/a/file.txt"), path("src/a"),
                                          TransferMode::Copy),
              Status::TargetIsSource);
}

/**
 * @test DetectsTargetInsideSource
 * @brief A destination below the source is refused, also through a symlink
 */
TEST_F(TransferSafetyTest, DetectsTargetInsideSource) {
    EXPECT_EQ(TransferSafety::checkSource(path("src/a"), path("src/a/sub"),
                                          TransferMode::Copy),
              Status::TargetInsideSource);

    fs::create_directory_symlink(test_dir / "src" / "a" / "sub",
                                 test_dir / "shortcut");
    EXPECT_EQ(TransferSafety::checkSource(path("src/a"), path("shortcut"),
                                          TransferMode::Move),
              Status::TargetInsideSource);
}

/**
 * @test DoesNotConfuseNamePrefixes
 * @brief "src/ab" is not inside "src/a"
 */
TEST_F(TransferSafetyTest, DoesNotConfuseNamePrefixes) {
    createDir(test_dir / "src" / "ab");

    EXPECT_EQ(TransferSafety::checkSource(path("src/a"), path("src/ab"),
                                          TransferMode::Copy),
              Status::Allowed);
}

/**
 * @test DetectsMissingSource
 */
TEST_F(TransferSafetyTest, DetectsMissingSource) {
    EXPECT_EQ(TransferSafety::checkSource(path("src/vanished"), path("dst"),
                                          TransferMode::Copy),
              Status::SourceMissing);
}

/**
 * @test FirstBlockingSourceWins
 * @brief checkTransfer reports the first offending source with its path
 */
TEST_F(TransferSafetyTest, FirstBlockingSourceWins) {
    auto check = TransferSafety::checkTransfer(
        {path("src/a/file.txt"), path("src/gone"), path("dst")}, path("dst"),
        TransferMode::Copy);

    EXPECT_TRUE(check.blocked());
    EXPECT_EQ(check.status, Status::SourceMissing);
    EXPECT_EQ(check.path, path("src/gone"));
}

/**
 * @test BlocksMovingSystemPaths
 * @brief System directories may be copied but never moved
 */
TEST_F(TransferSafetyTest, BlocksMovingSystemPaths) {
    EXPECT_EQ(TransferSafety::checkSource("/etc", path("dst"),
                                          TransferMode::Move),
              Status::BlockedSystemPath);
    EXPECT_EQ(TransferSafety::checkSource("/usr", path("dst"),
                                          TransferMode::Move),
              Status::BlockedSystemPath);
    EXPECT_EQ(TransferSafety::checkSource("/etc", path("dst"),
                                          TransferMode::Copy),
              Status::Allowed);
}

/**
 * @test BlocksMovingUserHome
 * @brief The directory named by HOME may not be moved away
 */
TEST_F(TransferSafetyTest, BlocksMovingUserHome) {
    createDir(test_dir / "home");
    ::setenv("HOME", path("home").c_str(), 1);

    EXPECT_EQ(TransferSafety::checkSource(path("home"), path("dst"),
                                          TransferMode::Move),
              Status::BlockedHome);
    EXPECT_EQ(TransferSafety::checkSource(path("home"), path("dst"),
                                          TransferMode::Copy),
              Status::Allowed);
}

/**
 * @test DetectsVirtualFilesystems
 * @brief Sources on procfs or sysfs are refused for copy and move
 */
TEST_F(TransferSafetyTest, DetectsVirtualFilesystems) {
    EXPECT_TRUE(TransferSafety::isVirtualFilesystem("/proc/self"));
    EXPECT_TRUE(TransferSafety::isVirtualFilesystem("/sys/class"));
    EXPECT_FALSE(TransferSafety::isVirtualFilesystem(path("src")));

    EXPECT_EQ(TransferSafety::checkSource("/proc/self", path("dst"),
                                          TransferMode::Copy),
              Status::BlockedVirtualFS);
}

/**
 * @test ComputesItemTarget
 * @brief Items land below the destination under their own name
 */
TEST_F(TransferSafetyTest, ComputesItemTarget) {
    EXPECT_EQ(TransferSafety::itemTarget("/data/a/foo", "/data/b"),
              "/data/b/foo");
    EXPECT_EQ(TransferSafety::itemTarget("/data/a/foo/", "/data/b/"),
              "/data/b/foo");
    EXPECT_EQ(TransferSafety::itemTarget("/data/a/bar.txt", "/data/b"),
              "/data/b/bar.txt");
}

/**
 * @test GetsMountPoints
 * @brief /proc/mounts is parsed and the root filesystem is present
 */
TEST_F(TransferSafetyTest, GetsMountPoints) {
    auto mounts = TransferSafety::getMountPoints();

    EXPECT_FALSE(mounts.empty());

    bool has_root = false;
    for (const auto& mount : mounts) {
        if (mount.mountpoint == "/") {
            has_root = true;
            EXPECT_TRUE(mount.is_root);
            break;
        }
    }
    EXPECT_TRUE(has_root);
    EXPECT_TRUE(TransferSafety::isMountPoint("/"));
}

/**
 * @test StatusMessages
 * @brief Messages name the reason and the path
 */
TEST_F(TransferSafetyTest, StatusMessages) {
    auto msg = TransferSafety::getStatusMessage(Status::BlockedSystemPath, "/etc");
    EXPECT_NE(msg.find("system"), std::string::npos);
    EXPECT_NE(msg.find("/etc"), std::string::npos);

    msg = TransferSafety::getStatusMessage(Status::TargetInsideSource, "/data/a");
    EXPECT_NE(msg.find("inside"), std::string::npos);
    EXPECT_NE(msg.find("/data/a"), std::string::npos);
}

/**
 * @test WarningDoesNotBlock
 * @brief Removable media only warns
 */
TEST_F(TransferSafetyTest, WarningDoesNotBlock) {
    TransferSafety::TransferCheck warning{Status::WarningRemovableMedia, "/media/usb"};
    EXPECT_FALSE(warning.blocked());

    TransferSafety::TransferCheck refused{Status::TargetIsSource, "/data/a"};
    EXPECT_TRUE(refused.blocked());
}

/**
 * @test IsSystemPath
 */
TEST_F(TransferSafetyTest, IsSystemPath) {
    EXPECT_TRUE(TransferSafety::isSystemPath("/"));
    EXPECT_TRUE(TransferSafety::isSystemPath("/etc"));
    EXPECT_FALSE(TransferSafety::isSystemPath("/etc/ssh"));
    EXPECT_FALSE(TransferSafety::isSystemPath("/home/user/test"));
}
