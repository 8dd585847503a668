#include <gtest/gtest.h>
#include "core/archive_coordinator.hpp"
#include "test_base.hpp"
#include <fstream>
#include <sstream>

class ArchiveCoordinatorTest : public TestBase
{
protected:
    VideoAsset makeAsset(const std::string &name, size_t index, size_t size = 100)
    {
        std::string path = createDummyFile("input/" + name, std::string(size, 'x'));
        return VideoAsset(name, path, size, "mp4", index);
    }

    static DuplicateGroup makeGroup(const std::string &canonical, const std::vector<std::string> &members, double score = 0.98)
    {
        DuplicateGroup group;
        group.canonical_id = canonical;
        group.member_ids = members;
        for (const auto &id : members)
        {
            group.link_scores[id] = score;
        }
        return group;
    }

    std::string archiveRoot() const { return getTestFilesDir() + "/archive"; }

    static std::string readFile(const std::string &path)
    {
        std::ifstream in(path);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }
};

TEST_F(ArchiveCoordinatorTest, MovesDuplicatesAndKeepsCanonical)
{
    std::vector<VideoAsset> assets = {makeAsset("keep.mp4", 0, 500), makeAsset("dup.mp4", 1, 100)};
    std::vector<DuplicateGroup> groups = {makeGroup("keep.mp4", {"keep.mp4", "dup.mp4"})};

    DetectionConfig config;
    ArchiveCoordinator coordinator(archiveRoot(), config);
    RunContext context;
    coordinator.archive(groups, assets, context);

    EXPECT_EQ(context.failureCount(), 0u);
    EXPECT_TRUE(fs::exists(assets[0].path));
    EXPECT_FALSE(fs::exists(assets[1].path));

    fs::path expected = fs::path(archiveRoot()) / "duplicates" / "dup.mp4";
    EXPECT_TRUE(fs::exists(expected));
    EXPECT_EQ(coordinator.archiveDirectory(), fs::path(archiveRoot()) / "duplicates");

    std::vector<ArchiveRecord> records = context.archiveRecords();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].duplicate_id, "dup.mp4");
    EXPECT_EQ(records[0].original_id, "keep.mp4");
    EXPECT_EQ(records[0].source_path, assets[1].path);
    EXPECT_EQ(records[0].destination_path, expected.string());
    EXPECT_DOUBLE_EQ(records[0].similarity, 0.98);
    EXPECT_FALSE(records[0].dry_run);
}

TEST_F(ArchiveCoordinatorTest, WritesInfoSidecar)
{
    std::vector<VideoAsset> assets = {makeAsset("keep.mp4", 0, 500), makeAsset("dup.mp4", 1, 100)};
    std::vector<DuplicateGroup> groups = {makeGroup("keep.mp4", {"keep.mp4", "dup.mp4"}, 0.97)};

    DetectionConfig config;
    ArchiveCoordinator coordinator(archiveRoot(), config);
    RunContext context;
    coordinator.archive(groups, assets, context);

    std::string info_path = (coordinator.archiveDirectory() / "dup.mp4.txt").string();
    ASSERT_TRUE(fs::exists(info_path));
    std::string info = readFile(info_path);
    EXPECT_NE(info.find("Original file: " + assets[0].path), std::string::npos);
    EXPECT_NE(info.find("Archived on: "), std::string::npos);
    EXPECT_NE(info.find("Similarity: 0.97"), std::string::npos);
}

TEST_F(ArchiveCoordinatorTest, SidecarCanBeDisabled)
{
    std::vector<VideoAsset> assets = {makeAsset("keep.mp4", 0, 500), makeAsset("dup.mp4", 1, 100)};
    std::vector<DuplicateGroup> groups = {makeGroup("keep.mp4", {"keep.mp4", "dup.mp4"})};

    DetectionConfig config;
    config.write_info_sidecar = false;
    ArchiveCoordinator coordinator(archiveRoot(), config);
    RunContext context;
    coordinator.archive(groups, assets, context);

    EXPECT_TRUE(fs::exists(coordinator.archiveDirectory() / "dup.mp4"));
    EXPECT_FALSE(fs::exists(coordinator.archiveDirectory() / "dup.mp4.txt"));
}

TEST_F(ArchiveCoordinatorTest, NameCollisionsGetSuffix)
{
    std::vector<VideoAsset> assets = {makeAsset("keep.mp4", 0, 500)};
    // Same file name in two different source directories
    std::string first = createDummyFile("input/one/clip.mp4", "1");
    std::string second = createDummyFile("input/two/clip.mp4", "2");
    assets.emplace_back("one/clip.mp4", first, 1, "mp4", 1);
    assets.emplace_back("two/clip.mp4", second, 1, "mp4", 2);

    // A file of that name is already in the archive from an earlier run
    DetectionConfig config;
    ArchiveCoordinator coordinator(archiveRoot(), config);
    fs::create_directories(coordinator.archiveDirectory());
    std::ofstream(coordinator.archiveDirectory() / "clip.mp4") << "old";

    std::vector<DuplicateGroup> groups = {makeGroup("keep.mp4", {"keep.mp4", "one/clip.mp4", "two/clip.mp4"})};
    RunContext context;
    coordinator.archive(groups, assets, context);

    EXPECT_EQ(context.failureCount(), 0u);
    EXPECT_EQ(readFile((coordinator.archiveDirectory() / "clip.mp4").string()), "old");
    EXPECT_TRUE(fs::exists(coordinator.archiveDirectory() / "clip_1.mp4"));
    EXPECT_TRUE(fs::exists(coordinator.archiveDirectory() / "clip_2.mp4"));
    EXPECT_EQ(context.archiveRecords().size(), 2u);
}

TEST_F(ArchiveCoordinatorTest, UniqueDestinationHonoursReservations)
{
    fs::path dir = fs::path(getTestFilesDir()) / "reserve";
    fs::create_directories(dir);

    std::set<std::string> reserved;
    EXPECT_EQ(ArchiveCoordinator::uniqueDestination(dir, "a.mp4", reserved), dir / "a.mp4");

    reserved.insert((dir / "a.mp4").string());
    reserved.insert((dir / "a_1.mp4").string());
    EXPECT_EQ(ArchiveCoordinator::uniqueDestination(dir, "a.mp4", reserved), dir / "a_2.mp4");
}

TEST_F(ArchiveCoordinatorTest, VanishedSourceFailsButBatchContinues)
{
    std::vector<VideoAsset> assets = {makeAsset("keep.mp4", 0, 500), makeAsset("gone.mp4", 1), makeAsset("dup.mp4", 2)};
    fs::remove(assets[1].path);

    std::vector<DuplicateGroup> groups = {makeGroup("keep.mp4", {"keep.mp4", "gone.mp4", "dup.mp4"})};
    DetectionConfig config;
    ArchiveCoordinator coordinator(archiveRoot(), config);
    RunContext context;
    coordinator.archive(groups, assets, context);

    std::vector<ProcessingFailure> failures = context.failures();
    ASSERT_EQ(failures.size(), 1u);
    EXPECT_EQ(failures[0].asset_id, "gone.mp4");
    EXPECT_EQ(failures[0].kind, FailureKind::RELOCATION_ERROR);

    EXPECT_TRUE(fs::exists(coordinator.archiveDirectory() / "dup.mp4"));
    EXPECT_EQ(context.archiveRecords().size(), 1u);
}

TEST_F(ArchiveCoordinatorTest, MissingOriginalLeavesDuplicatesInPlace)
{
    std::vector<VideoAsset> assets = {makeAsset("keep.mp4", 0, 500), makeAsset("dup.mp4", 1)};
    fs::remove(assets[0].path);

    std::vector<DuplicateGroup> groups = {makeGroup("keep.mp4", {"keep.mp4", "dup.mp4"})};
    DetectionConfig config;
    ArchiveCoordinator coordinator(archiveRoot(), config);
    RunContext context;
    coordinator.archive(groups, assets, context);

    EXPECT_TRUE(fs::exists(assets[1].path));
    EXPECT_TRUE(context.archiveRecords().empty());
    std::vector<ProcessingFailure> failures = context.failures();
    ASSERT_EQ(failures.size(), 1u);
    EXPECT_EQ(failures[0].asset_id, "dup.mp4");
    EXPECT_EQ(failures[0].kind, FailureKind::RELOCATION_ERROR);
}

TEST_F(ArchiveCoordinatorTest, DryRunTouchesNothing)
{
    std::vector<VideoAsset> assets = {makeAsset("keep.mp4", 0, 500), makeAsset("dup.mp4", 1)};
    std::vector<DuplicateGroup> groups = {makeGroup("keep.mp4", {"keep.mp4", "dup.mp4"})};

    DetectionConfig config;
    config.dry_run = true;
    ArchiveCoordinator coordinator(archiveRoot(), config);
    RunContext context;
    coordinator.archive(groups, assets, context);

    EXPECT_TRUE(fs::exists(assets[1].path));
    EXPECT_FALSE(fs::exists(coordinator.archiveDirectory()));

    std::vector<ArchiveRecord> records = context.archiveRecords();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_TRUE(records[0].dry_run);
    EXPECT_EQ(records[0].destination_path, (coordinator.archiveDirectory() / "dup.mp4").string());
}

TEST_F(ArchiveCoordinatorTest, RefusesToArchiveCanonical)
{
    VideoAsset keep = makeAsset("keep.mp4", 0);
    DetectionConfig config;
    ArchiveCoordinator coordinator(archiveRoot(), config);

    RelocationResult result = coordinator.relocate(keep, keep, 1.0);
    EXPECT_FALSE(result.success);
    EXPECT_TRUE(fs::exists(keep.path));
}

TEST_F(ArchiveCoordinatorTest, MoveFileReportsMissingSource)
{
    std::string error;
    EXPECT_FALSE(ArchiveCoordinator::moveFile(fs::path(getTestFilesDir()) / "absent.mp4",
                                              fs::path(getTestFilesDir()) / "target.mp4", error));
    EXPECT_FALSE(error.empty());
}

TEST_F(ArchiveCoordinatorTest, RecordsFollowGroupAndMemberOrder)
{
    // Every duplicate is named clip.mp4, so the collision suffix also reveals the order
    std::vector<VideoAsset> assets;
    std::vector<DuplicateGroup> groups;
    std::vector<std::string> expected_ids;
    for (int g = 0; g < 12; ++g)
    {
        std::string dir = std::string(g < 10 ? "g0" : "g") + std::to_string(g);
        std::string keep = dir + "/keep.mp4";
        std::string first = dir + "/a/clip.mp4";
        std::string second = dir + "/b/clip.mp4";
        assets.push_back(makeAsset(keep, assets.size()));
        assets.push_back(makeAsset(first, assets.size()));
        assets.push_back(makeAsset(second, assets.size()));
        groups.push_back(makeGroup(keep, {keep, first, second}));
        expected_ids.push_back(first);
        expected_ids.push_back(second);
    }

    DetectionConfig config;
    config.max_threads = 8;
    ArchiveCoordinator coordinator(archiveRoot(), config);
    RunContext context;
    coordinator.archive(groups, assets, context);

    EXPECT_EQ(context.failureCount(), 0u);
    std::vector<ArchiveRecord> records = context.archiveRecords();
    ASSERT_EQ(records.size(), expected_ids.size());
    for (size_t i = 0; i < records.size(); ++i)
    {
        EXPECT_EQ(records[i].duplicate_id, expected_ids[i]);
        std::string expected_name = i == 0 ? "clip.mp4" : "clip_" + std::to_string(i) + ".mp4";
        EXPECT_EQ(fs::path(records[i].destination_path).filename().string(), expected_name);
    }
}

TEST_F(ArchiveCoordinatorTest, FailuresFollowGroupOrder)
{
    std::vector<VideoAsset> assets;
    std::vector<DuplicateGroup> groups;
    for (int g = 0; g < 6; ++g)
    {
        std::string keep = "keep" + std::to_string(g) + ".mp4";
        std::string dup = "dup" + std::to_string(g) + ".mp4";
        assets.push_back(makeAsset(keep, assets.size()));
        assets.push_back(makeAsset(dup, assets.size()));
        groups.push_back(makeGroup(keep, {keep, dup}));
    }
    // The source of every other duplicate disappears before archiving
    for (int g = 0; g < 6; g += 2)
    {
        fs::remove(assets[2 * g + 1].path);
    }

    DetectionConfig config;
    config.max_threads = 4;
    ArchiveCoordinator coordinator(archiveRoot(), config);
    RunContext context;
    coordinator.archive(groups, assets, context);

    std::vector<ProcessingFailure> failures = context.failures();
    ASSERT_EQ(failures.size(), 3u);
    EXPECT_EQ(failures[0].asset_id, "dup0.mp4");
    EXPECT_EQ(failures[1].asset_id, "dup2.mp4");
    EXPECT_EQ(failures[2].asset_id, "dup4.mp4");

    std::vector<ArchiveRecord> records = context.archiveRecords();
    ASSERT_EQ(records.size(), 3u);
    EXPECT_EQ(records[0].duplicate_id, "dup1.mp4");
    EXPECT_EQ(records[1].duplicate_id, "dup3.mp4");
    EXPECT_EQ(records[2].duplicate_id, "dup5.mp4");
}
