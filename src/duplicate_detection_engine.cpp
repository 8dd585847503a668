#include "core/duplicate_detection_engine.hpp"
#include "logging/logger.hpp"
#include <unordered_set>
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>

DuplicateDetectionEngine::DuplicateDetectionEngine(const DetectionConfig &config, FrameSourceFactory factory)
    : config_(validated(config)),
      builder_(std::move(factory)),
      comparator_(config_.similarity_threshold),
      filter_(CandidateFilter::fromConfig(config_)),
      resolver_(makeCanonicalPolicy(config_.canonical_policy))
{
}

DetectionConfig DuplicateDetectionEngine::validated(const DetectionConfig &config)
{
    validateConfig(config);
    return config;
}

void DuplicateDetectionEngine::validateConfig(const DetectionConfig &config)
{
    std::vector<std::string> problems = config.validate();
    if (problems.empty())
    {
        return;
    }

    std::string message = "Invalid detection configuration:";
    for (const auto &problem : problems)
    {
        Logger::error("Invalid configuration: " + problem);
        message += " " + problem + ";";
    }
    throw ConfigError(message);
}

void DuplicateDetectionEngine::setCanonicalPolicy(std::shared_ptr<const CanonicalPolicy> policy)
{
    resolver_ = DuplicateResolver(std::move(policy));
}

std::vector<SignatureResult> DuplicateDetectionEngine::buildSignatures(const std::vector<VideoAsset> &assets) const
{
    std::vector<SignatureResult> results(assets.size());

    tbb::task_arena arena(config_.max_threads);
    arena.execute([&]()
                  { tbb::parallel_for(tbb::blocked_range<size_t>(0, assets.size()),
                                      [&](const tbb::blocked_range<size_t> &range)
                                      {
                                          for (size_t i = range.begin(); i != range.end(); ++i)
                                          {
                                              try
                                              {
                                                  results[i] = builder_.build(assets[i], config_);
                                              }
                                              catch (const std::exception &e)
                                              {
                                                  results[i] = SignatureResult(false, FailureKind::DECODE_ERROR,
                                                                               std::string("Unexpected error while building signature: ") + e.what());
                                              }
                                          }
                                      }); });

    return results;
}

std::vector<ComparisonResult> DuplicateDetectionEngine::compareSignatures(const std::vector<VideoSignature> &signatures, size_t &skipped) const
{
    std::vector<std::pair<size_t, size_t>> candidates;
    skipped = 0;
    for (const auto &pair : SignatureComparator::enumeratePairs(signatures.size()))
    {
        if (filter_.shouldCompare(signatures[pair.first], signatures[pair.second]))
        {
            candidates.push_back(pair);
        }
        else
        {
            ++skipped;
        }
    }

    if (filter_.enabled())
    {
        Logger::info("Duration pre-filter kept " + std::to_string(candidates.size()) + " pairs, skipped " + std::to_string(skipped) +
                     " (tolerance " + std::to_string(filter_.toleranceSeconds()) + "s)");
    }

    std::vector<ComparisonResult> results(candidates.size());
    tbb::task_arena arena(config_.max_threads);
    arena.execute([&]()
                  { tbb::parallel_for(tbb::blocked_range<size_t>(0, candidates.size()),
                                      [&](const tbb::blocked_range<size_t> &range)
                                      {
                                          for (size_t i = range.begin(); i != range.end(); ++i)
                                          {
                                              const VideoSignature &a = signatures[candidates[i].first];
                                              const VideoSignature &b = signatures[candidates[i].second];
                                              try
                                              {
                                                  results[i] = comparator_.compare(a, b);
                                              }
                                              catch (const std::exception &e)
                                              {
                                                  ComparisonResult failed;
                                                  failed.asset_a = a.asset_id;
                                                  failed.asset_b = b.asset_id;
                                                  failed.error_message = e.what();
                                                  results[i] = failed;
                                              }
                                          }
                                      }); });

    return results;
}

DetectionReport DuplicateDetectionEngine::run(const std::vector<VideoAsset> &assets, const std::string &destination_root)
{
    if (destination_root.empty())
    {
        throw ConfigError("Archive destination root must not be empty");
    }

    RunContext context;
    DetectionReport report;
    report.run_id = context.runId();

    // Asset ids must be unique within a run
    std::vector<VideoAsset> unique_assets;
    std::unordered_set<std::string> seen_ids;
    for (const auto &asset : assets)
    {
        if (!seen_ids.insert(asset.id).second)
        {
            Logger::warn("Skipping asset with duplicate id: " + asset.id + " (" + asset.path + ")");
            continue;
        }
        unique_assets.push_back(asset);
    }
    report.assets_total = unique_assets.size();

    Logger::info("Starting detection run " + context.runId() + " over " + std::to_string(unique_assets.size()) +
                 " videos with threshold=" + std::to_string(config_.similarity_threshold) +
                 ", sample_rate=" + std::to_string(config_.sample_rate) +
                 ", mode=" + DedupModes::getModeName(config_.dedup_mode));

    Logger::info("Generating video signatures...");
    std::vector<SignatureResult> built = buildSignatures(unique_assets);

    std::vector<VideoSignature> signatures;
    signatures.reserve(built.size());
    for (size_t i = 0; i < built.size(); ++i)
    {
        if (built[i].success)
        {
            signatures.push_back(std::move(built[i].signature));
        }
        else
        {
            Logger::error("Error processing " + unique_assets[i].path + ": " + built[i].error_message);
            context.addFailure(ProcessingFailure(unique_assets[i].id, built[i].failure_kind, built[i].error_message));
        }
    }
    report.assets_signed = signatures.size();

    Logger::info("Comparing videos for duplicates...");
    std::vector<ComparisonResult> comparisons = compareSignatures(signatures, report.pairs_skipped);
    report.pairs_compared = comparisons.size();
    for (auto &comparison : comparisons)
    {
        if (comparison.success)
        {
            report.comparisons.push_back(comparison);
        }
        else
        {
            context.addFailure(ProcessingFailure(comparison.asset_a + " <-> " + comparison.asset_b,
                                                 comparison.failure_kind, comparison.error_message));
        }
    }

    report.groups = resolver_.resolve(unique_assets, report.comparisons);

    ArchiveCoordinator coordinator(destination_root, config_);
    coordinator.archive(report.groups, unique_assets, context);

    report.archive_records = context.archiveRecords();
    report.failures = context.failures();

    if (report.groups.empty())
    {
        Logger::info("No duplicates found!");
    }
    else
    {
        Logger::info("Duplicate detection and archiving completed: " + std::to_string(report.groups.size()) + " groups, " +
                     std::to_string(report.archive_records.size()) + " files archived");
    }
    if (!report.failures.empty())
    {
        Logger::warn("Processing incomplete: " + std::to_string(report.failures.size()) + " failures recorded");
    }

    return report;
}
