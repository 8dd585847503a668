#include "core/report_writer.hpp"
#include "logging/logger.hpp"
#include <fstream>
#include <sstream>

using json = nlohmann::json;

json ReportWriter::toJson(const DetectionReport &report)
{
    json document;
    document["run_id"] = report.run_id;
    document["status"] = DetectionReport::statusName(report.status());
    document["assets_total"] = report.assets_total;
    document["assets_signed"] = report.assets_signed;
    document["pairs_compared"] = report.pairs_compared;
    document["pairs_skipped"] = report.pairs_skipped;

    json groups = json::array();
    for (const auto &group : report.groups)
    {
        json members = json::array();
        for (const auto &id : group.member_ids)
        {
            json member = {{"id", id}, {"canonical", id == group.canonical_id}};
            auto score = group.link_scores.find(id);
            if (score != group.link_scores.end())
            {
                member["similarity"] = score->second;
            }
            members.push_back(member);
        }
        groups.push_back({{"canonical_id", group.canonical_id}, {"members", members}});
    }
    document["groups"] = groups;

    json records = json::array();
    for (const auto &record : report.archive_records)
    {
        records.push_back({{"duplicate_id", record.duplicate_id},
                           {"original_id", record.original_id},
                           {"source_path", record.source_path},
                           {"destination_path", record.destination_path},
                           {"original_path", record.original_path},
                           {"archived_at", record.archivedAtString()},
                           {"similarity", record.similarity},
                           {"dry_run", record.dry_run}});
    }
    document["archived"] = records;

    json failures = json::array();
    for (const auto &failure : report.failures)
    {
        failures.push_back({{"asset_id", failure.asset_id},
                            {"kind", failureKindName(failure.kind)},
                            {"message", failure.message}});
    }
    document["failures"] = failures;

    json duplicate_pairs = json::array();
    for (const auto &comparison : report.comparisons)
    {
        if (!comparison.is_duplicate)
            continue;
        duplicate_pairs.push_back({{"asset_a", comparison.asset_a},
                                   {"asset_b", comparison.asset_b},
                                   {"score", comparison.score},
                                   {"aligned_pairs", comparison.aligned_pairs}});
    }
    document["duplicate_pairs"] = duplicate_pairs;

    return document;
}

json ReportWriter::toJson(const DetectionReport &report, const DetectionConfig &config)
{
    json document = toJson(report);
    document["config"] = {{"similarity_threshold", config.similarity_threshold},
                          {"sample_rate", config.sample_rate},
                          {"dedup_mode", DedupModes::getModeName(config.dedup_mode)},
                          {"algorithm", DedupModes::getAlgorithmName(config.dedup_mode)},
                          {"max_threads", config.max_threads},
                          {"canonical_policy", config.canonical_policy},
                          {"prefilter_enabled", config.prefilter_enabled},
                          {"dry_run", config.dry_run}};
    return document;
}

bool ReportWriter::writeJsonFile(const json &document, const std::string &file_path)
{
    std::ofstream out(file_path);
    if (!out.is_open())
    {
        Logger::error("Could not open report file for writing: " + file_path);
        return false;
    }
    out << document.dump(2) << "\n";
    if (!out.good())
    {
        Logger::error("Failed writing report file: " + file_path);
        return false;
    }
    Logger::info("Report written to: " + file_path);
    return true;
}

std::string ReportWriter::summary(const DetectionReport &report)
{
    size_t duplicates = 0;
    for (const auto &group : report.groups)
    {
        duplicates += group.size() - 1;
    }

    std::ostringstream ss;
    ss << "Run " << report.run_id << ": " << DetectionReport::statusName(report.status()) << "\n"
       << "  videos: " << report.assets_total << " (" << report.assets_signed << " signed)\n"
       << "  pairs compared: " << report.pairs_compared << ", skipped: " << report.pairs_skipped << "\n"
       << "  duplicate groups: " << report.groups.size() << " (" << duplicates << " duplicates)\n"
       << "  archived: " << report.archive_records.size() << "\n"
       << "  failures: " << report.failures.size();
    for (const auto &failure : report.failures)
    {
        ss << "\n    " << failureKindName(failure.kind) << " [" << failure.asset_id << "]: " << failure.message;
    }
    return ss.str();
}
