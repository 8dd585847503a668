#include "core/archive_coordinator.hpp"
#include "logging/logger.hpp"
#include <fstream>
#include <system_error>
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>

ArchiveCoordinator::ArchiveCoordinator(const std::string &destination_root, const DetectionConfig &config)
    : archive_dir_(fs::path(destination_root) / config.archive_subdir),
      write_info_sidecar_(config.write_info_sidecar),
      dry_run_(config.dry_run),
      max_threads_(config.max_threads)
{
}

void ArchiveCoordinator::archive(const std::vector<DuplicateGroup> &groups, const std::vector<VideoAsset> &assets, RunContext &context)
{
    if (groups.empty())
    {
        Logger::info("No duplicate groups to archive");
        return;
    }

    if (!dry_run_)
    {
        std::error_code ec;
        fs::create_directories(archive_dir_, ec);
        if (ec)
        {
            // Each relocation reports its own failure below
            Logger::error("Could not create archive directory " + archive_dir_.string() + ": " + ec.message());
        }
    }

    AssetIndex index;
    index.reserve(assets.size());
    for (const auto &asset : assets)
    {
        index.emplace(asset.id, &asset);
    }

    Logger::info(std::string(dry_run_ ? "Dry run: " : "") + "Archiving duplicates of " + std::to_string(groups.size()) +
                 " groups into " + archive_dir_.string());

    // Names are handed out in group order so collisions resolve the same way on every run
    std::vector<GroupOutcome> outcomes;
    outcomes.reserve(groups.size());
    for (const auto &group : groups)
    {
        outcomes.push_back(planGroup(group, index));
    }

    tbb::task_arena arena(max_threads_);
    arena.execute([&]()
                  { tbb::parallel_for(tbb::blocked_range<size_t>(0, outcomes.size()),
                                      [&](const tbb::blocked_range<size_t> &range)
                                      {
                                          for (size_t i = range.begin(); i != range.end(); ++i)
                                          {
                                              executeGroup(outcomes[i]);
                                          }
                                      }); });

    for (const auto &outcome : outcomes)
    {
        for (const auto &record : outcome.records)
        {
            context.addArchiveRecord(record);
        }
        for (const auto &failure : outcome.failures)
        {
            context.addFailure(failure);
        }
    }
}

ArchiveCoordinator::GroupOutcome ArchiveCoordinator::planGroup(const DuplicateGroup &group, const AssetIndex &index)
{
    GroupOutcome outcome;

    auto canonical_it = index.find(group.canonical_id);
    if (canonical_it == index.end())
    {
        for (const auto &id : group.duplicateIds())
        {
            outcome.failures.emplace_back(id, FailureKind::RELOCATION_ERROR, "Original " + group.canonical_id + " is not a known asset");
        }
        return outcome;
    }
    outcome.original = canonical_it->second;

    std::error_code ec;
    if (!dry_run_ && !fs::exists(outcome.original->path, ec))
    {
        // Never archive the last remaining copies of a group
        for (const auto &id : group.duplicateIds())
        {
            outcome.failures.emplace_back(id, FailureKind::RELOCATION_ERROR,
                                          "Original no longer exists, duplicate left in place: " + outcome.original->path);
        }
        Logger::error("Original of group vanished before archiving: " + outcome.original->path);
        outcome.original = nullptr;
        return outcome;
    }

    for (const auto &id : group.duplicateIds())
    {
        auto it = index.find(id);
        if (it == index.end())
        {
            outcome.failures.emplace_back(id, FailureKind::RELOCATION_ERROR, "Unknown asset id");
            continue;
        }
        const VideoAsset &duplicate = *it->second;
        if (duplicate.id == outcome.original->id || duplicate.path == outcome.original->path)
        {
            outcome.failures.emplace_back(id, FailureKind::RELOCATION_ERROR, "Refusing to archive the canonical member: " + duplicate.path);
            continue;
        }

        double similarity = 0.0;
        auto score_it = group.link_scores.find(id);
        if (score_it != group.link_scores.end())
        {
            similarity = score_it->second;
        }

        PlannedMove move;
        move.duplicate = &duplicate;
        move.similarity = similarity;
        move.destination = reserveDestination(fs::path(duplicate.path).filename().string());
        outcome.moves.push_back(move);
    }
    return outcome;
}

void ArchiveCoordinator::executeGroup(GroupOutcome &outcome) const
{
    for (const auto &move : outcome.moves)
    {
        RelocationResult result = moveTo(*move.duplicate, *outcome.original, move.similarity, move.destination);
        if (result.success)
        {
            outcome.records.push_back(result.record);
        }
        else
        {
            outcome.failures.emplace_back(move.duplicate->id, FailureKind::RELOCATION_ERROR, result.error_message);
        }
    }
}

fs::path ArchiveCoordinator::reserveDestination(const std::string &filename)
{
    std::lock_guard<std::mutex> lock(destination_mutex_);
    fs::path destination = uniqueDestination(archive_dir_, filename, reserved_);
    reserved_.insert(destination.string());
    return destination;
}

RelocationResult ArchiveCoordinator::relocate(const VideoAsset &duplicate, const VideoAsset &original, double similarity)
{
    if (duplicate.id == original.id || duplicate.path == original.path)
    {
        return RelocationResult(false, "Refusing to archive the canonical member: " + duplicate.path);
    }
    return moveTo(duplicate, original, similarity, reserveDestination(fs::path(duplicate.path).filename().string()));
}

RelocationResult ArchiveCoordinator::moveTo(const VideoAsset &duplicate, const VideoAsset &original, double similarity,
                                            const fs::path &destination) const
{
    std::error_code ec;
    fs::path source(duplicate.path);
    if (!fs::exists(source, ec))
    {
        return RelocationResult(false, "Source file vanished: " + duplicate.path);
    }

    if (!dry_run_)
    {
        std::string error;
        if (!moveFile(source, destination, error))
        {
            Logger::error("Failed to archive " + duplicate.path + ": " + error);
            return RelocationResult(false, error);
        }
    }

    ArchiveRecord record;
    record.duplicate_id = duplicate.id;
    record.original_id = original.id;
    record.source_path = duplicate.path;
    record.destination_path = destination.string();
    record.original_path = original.path;
    record.archived_at = std::chrono::system_clock::now();
    record.similarity = similarity;
    record.dry_run = dry_run_;

    if (write_info_sidecar_ && !dry_run_)
    {
        writeInfoSidecar(destination, record);
    }

    Logger::info(std::string(dry_run_ ? "Would archive" : "Archived") + " duplicate:\nOriginal: " + original.path +
                 "\nDuplicate: " + duplicate.path + " -> " + destination.string());

    RelocationResult result(true, "", destination.string());
    result.record = record;
    return result;
}

fs::path ArchiveCoordinator::uniqueDestination(const fs::path &dir, const std::string &filename, const std::set<std::string> &reserved)
{
    fs::path candidate = dir / filename;
    std::error_code ec;
    if (!fs::exists(candidate, ec) && reserved.count(candidate.string()) == 0)
    {
        return candidate;
    }

    fs::path name(filename);
    std::string stem = name.stem().string();
    std::string extension = name.extension().string();
    for (int n = 1;; ++n)
    {
        candidate = dir / (stem + "_" + std::to_string(n) + extension);
        if (!fs::exists(candidate, ec) && reserved.count(candidate.string()) == 0)
        {
            return candidate;
        }
    }
}

bool ArchiveCoordinator::moveFile(const fs::path &from, const fs::path &to, std::string &error)
{
    std::error_code ec;
    fs::rename(from, to, ec);
    if (!ec)
    {
        return true;
    }

    if (ec != std::errc::cross_device_link)
    {
        error = "Could not move " + from.string() + " to " + to.string() + ": " + ec.message();
        return false;
    }

    // Different filesystems: copy, then drop the source
    std::error_code copy_ec;
    fs::copy_file(from, to, fs::copy_options::none, copy_ec);
    if (copy_ec)
    {
        std::error_code cleanup_ec;
        fs::remove(to, cleanup_ec);
        error = "Could not copy " + from.string() + " to " + to.string() + ": " + copy_ec.message();
        return false;
    }

    std::error_code remove_ec;
    fs::remove(from, remove_ec);
    if (remove_ec)
    {
        std::error_code cleanup_ec;
        fs::remove(to, cleanup_ec);
        error = "Copied but could not remove source " + from.string() + ": " + remove_ec.message();
        return false;
    }
    return true;
}

void ArchiveCoordinator::writeInfoSidecar(const fs::path &destination, const ArchiveRecord &record) const
{
    fs::path info_file = destination;
    info_file += ".txt";

    std::ofstream out(info_file);
    if (!out.is_open())
    {
        Logger::warn("Could not write archive info file: " + info_file.string());
        return;
    }
    out << "Original file: " << record.original_path << "\n";
    out << "Archived on: " << record.archivedAtString() << "\n";
    out << "Similarity: " << record.similarity << "\n";
}
