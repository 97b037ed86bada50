#include <gtest/gtest.h>
#include "FakeTools.hpp"
#include "models/MediaTypes.hpp"
#include "utils/TempDirectory.hpp"
#include <filesystem>

namespace fs = std::filesystem;
using namespace MediaBot;

class TempDirectoryTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        root_ = fs::temp_directory_path() / "mediabot_tempdir_test";
        fs::remove_all(root_);
        fs::create_directories(root_);
    }

    void TearDown() override
    {
        fs::remove_all(root_);
    }

    fs::path root_;
};

TEST_F(TempDirectoryTest, CreatesUniqueDirectoriesWithPrefix)
{
    auto first = TempDirectory::create("mediabot-extract-", root_.string());
    auto second = TempDirectory::create("mediabot-extract-", root_.string());

    EXPECT_TRUE(fs::is_directory(first->path()));
    EXPECT_TRUE(fs::is_directory(second->path()));
    EXPECT_NE(first->path().string(), second->path().string());
    EXPECT_EQ(first->path().parent_path().string(), root_.string());
    EXPECT_EQ(first->path().filename().string().rfind("mediabot-extract-", 0), 0u);
}

TEST_F(TempDirectoryTest, CleanupRemovesTreeAndIsIdempotent)
{
    auto dir = TempDirectory::create("mediabot-extract-", root_.string());
    Testing::writeFile(dir->file("chunks/chunk_0.mp3"), "data");
    const fs::path path = dir->path();

    dir->cleanup();
    EXPECT_FALSE(fs::exists(path));
    EXPECT_TRUE(dir->isCleanedUp());

    EXPECT_NO_THROW(dir->cleanup());
    EXPECT_FALSE(fs::exists(path));
}

TEST_F(TempDirectoryTest, ReleasingLastOwnerRemovesDirectory)
{
    fs::path path;
    {
        auto dir = TempDirectory::create("mediabot-extract-", root_.string());
        path = dir->path();
        Testing::writeFile(dir->file("video.mp4"), "x");
    }
    EXPECT_FALSE(fs::exists(path));
}

TEST_F(TempDirectoryTest, CleanupExtractResultTwiceIsSafe)
{
    ExtractResult result;
    result.tempDir = TempDirectory::create("mediabot-extract-", root_.string());
    const fs::path path = result.tempDir->path();

    cleanupExtractResult(result);
    EXPECT_FALSE(fs::exists(path));
    EXPECT_NO_THROW(cleanupExtractResult(result));

    ExtractResult empty;
    EXPECT_NO_THROW(cleanupExtractResult(empty));
}

TEST_F(TempDirectoryTest, CleanupToleratesDirectoryRemovedExternally)
{
    auto dir = TempDirectory::create("mediabot-extract-", root_.string());
    fs::remove_all(dir->path());
    EXPECT_NO_THROW(dir->cleanup());
}

TEST_F(TempDirectoryTest, UnwritableRootThrows)
{
    EXPECT_THROW(TempDirectory::create("x-", "/proc/mediabot-no-such-dir"), std::runtime_error);
}
