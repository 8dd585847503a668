#pragma once

#include <filesystem>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>
#include "core/detection_config.hpp"
#include "core/duplicate_resolver.hpp"
#include "core/run_context.hpp"
#include "core/video_asset.hpp"

namespace fs = std::filesystem;

/**
 * @brief Outcome of relocating one duplicate
 */
struct RelocationResult
{
    bool success;
    std::string error_message;
    std::string destination_path;
    ArchiveRecord record; // filled on success

    RelocationResult() : success(false) {}
    RelocationResult(bool s, const std::string &msg = "", const std::string &dest = "")
        : success(s), error_message(msg), destination_path(dest) {}
};

/**
 * @brief Moves the non-canonical members of each group under the archive root
 *
 * This is the only component that changes the filesystem and it must run after
 * every group of the run has been resolved. Failures are recorded per file in
 * the run context; the rest of the batch continues. Destination names are
 * assigned in group order before any file moves, and records and failures
 * reach the context in group and member order whatever the thread count.
 */
class ArchiveCoordinator
{
public:
    /**
     * @param destination_root Archive root supplied by the caller
     * @param config Run configuration (subdirectory, sidecar, dry run, thread bound)
     */
    ArchiveCoordinator(const std::string &destination_root, const DetectionConfig &config);

    /**
     * @brief Archive every duplicate of every group
     * @param groups Resolved groups of this run
     * @param assets All assets of this run, looked up by id
     * @param context Receives one ArchiveRecord per relocation and one failure per failed file,
     *                in group order and then member order
     */
    void archive(const std::vector<DuplicateGroup> &groups, const std::vector<VideoAsset> &assets, RunContext &context);

    /**
     * @brief Relocate a single duplicate whose original has already been checked
     *
     * The caller records result.record or result.error_message.
     */
    RelocationResult relocate(const VideoAsset &duplicate, const VideoAsset &original, double similarity);

    /**
     * @brief Directory the duplicates land in
     */
    fs::path archiveDirectory() const { return archive_dir_; }

    /**
     * @brief First free "<stem>_<n><ext>" variant of filename inside dir
     * @param reserved Names already handed out but possibly not yet on disk
     */
    static fs::path uniqueDestination(const fs::path &dir, const std::string &filename, const std::set<std::string> &reserved);

    /**
     * @brief Move a file, falling back to copy + remove across filesystems
     * @param error Receives a description on failure
     */
    static bool moveFile(const fs::path &from, const fs::path &to, std::string &error);

private:
    using AssetIndex = std::unordered_map<std::string, const VideoAsset *>;

    struct PlannedMove
    {
        const VideoAsset *duplicate;
        double similarity;
        fs::path destination;
    };

    // Everything one group contributes to the run, kept apart until the merge
    struct GroupOutcome
    {
        const VideoAsset *original = nullptr;
        std::vector<PlannedMove> moves;
        std::vector<ArchiveRecord> records;
        std::vector<ProcessingFailure> failures;
    };

    GroupOutcome planGroup(const DuplicateGroup &group, const AssetIndex &index);
    void executeGroup(GroupOutcome &outcome) const;
    fs::path reserveDestination(const std::string &filename);
    RelocationResult moveTo(const VideoAsset &duplicate, const VideoAsset &original, double similarity,
                            const fs::path &destination) const;
    void writeInfoSidecar(const fs::path &destination, const ArchiveRecord &record) const;

    fs::path archive_dir_;
    bool write_info_sidecar_;
    bool dry_run_;
    int max_threads_;

    // Guards name reservation
    std::mutex destination_mutex_;
    std::set<std::string> reserved_;
};
