#include <gtest/gtest.h>
#include "core/detection_config.hpp"
#include "core/file_utils.hpp"
#include "test_base.hpp"
#include <stdexcept>

class FileUtilsTest : public TestBase
{
protected:
    void SetUp() override
    {
        TestBase::SetUp();

        // Create test directory structure
        createDummyFile("b.mp4", "12345");
        createDummyFile("a.MKV", "123");
        createDummyFile("notes.txt");
        createDummyFile("noext");
        createDummyFile("sub/c.avi", "1");
        createDummyFile("sub/deeper/d.webm", "1");
        createDummyFile("duplicates/archived.mp4", "1");
    }

    const std::vector<std::string> extensions_ = DetectionConfig().video_extensions;
};

TEST_F(FileUtilsTest, ExtensionIsLowerCaseWithoutDot)
{
    EXPECT_EQ(FileUtils::getFileExtension("/x/y/Movie.MP4"), "mp4");
    EXPECT_EQ(FileUtils::getFileExtension("archive.tar.gz"), "gz");
    EXPECT_EQ(FileUtils::getFileExtension("README"), "");
}

TEST_F(FileUtilsTest, RecognisesVideoFiles)
{
    EXPECT_TRUE(FileUtils::isVideoFile("clip.mov", extensions_));
    EXPECT_TRUE(FileUtils::isVideoFile("CLIP.MOV", extensions_));
    EXPECT_FALSE(FileUtils::isVideoFile("clip.jpg", extensions_));
    EXPECT_FALSE(FileUtils::isVideoFile("clip", extensions_));
}

TEST_F(FileUtilsTest, ValidDirectory)
{
    EXPECT_TRUE(FileUtils::isValidDirectory(getTestFilesDir()));
    EXPECT_FALSE(FileUtils::isValidDirectory(getTestFilesDir() + "/b.mp4"));
    EXPECT_FALSE(FileUtils::isValidDirectory(getTestFilesDir() + "/missing"));
}

TEST_F(FileUtilsTest, DiscoverNonRecursive)
{
    std::vector<VideoAsset> assets = FileUtils::discoverVideoAssets(getTestFilesDir(), false, extensions_);

    ASSERT_EQ(assets.size(), 2u);
    // Sorted by path: "a.MKV" before "b.mp4"
    EXPECT_EQ(assets[0].id, "a.MKV");
    EXPECT_EQ(assets[0].container_format, "mkv");
    EXPECT_EQ(assets[0].size_bytes, 3u);
    EXPECT_EQ(assets[0].discovery_index, 0u);
    EXPECT_GT(assets[0].modified_time, 0);
    EXPECT_EQ(assets[1].id, "b.mp4");
    EXPECT_EQ(assets[1].size_bytes, 5u);
    EXPECT_EQ(assets[1].discovery_index, 1u);
}

TEST_F(FileUtilsTest, DiscoverRecursive)
{
    std::vector<VideoAsset> assets = FileUtils::discoverVideoAssets(getTestFilesDir(), true, extensions_);

    std::vector<std::string> ids;
    for (const auto &asset : assets)
    {
        ids.push_back(asset.id);
    }
    EXPECT_EQ(ids, (std::vector<std::string>{"a.MKV", "b.mp4", "duplicates/archived.mp4", "sub/c.avi", "sub/deeper/d.webm"}));
    for (size_t i = 0; i < assets.size(); ++i)
    {
        EXPECT_EQ(assets[i].discovery_index, i);
    }
}

TEST_F(FileUtilsTest, DiscoverSkipsArchiveDirectory)
{
    std::string archive = getTestFilesDir() + "/duplicates";
    std::vector<VideoAsset> assets = FileUtils::discoverVideoAssets(getTestFilesDir(), true, extensions_, archive);

    ASSERT_EQ(assets.size(), 4u);
    for (const auto &asset : assets)
    {
        EXPECT_EQ(asset.id.find("duplicates/"), std::string::npos);
    }
}

TEST_F(FileUtilsTest, DiscoverInvalidDirectoryThrows)
{
    EXPECT_THROW(FileUtils::discoverVideoAssets(getTestFilesDir() + "/missing", true, extensions_), std::runtime_error);
}
