#pragma once

#include <memory>
#include <string>
#include <vector>
#include "core/archive_coordinator.hpp"
#include "core/detection_config.hpp"
#include "core/duplicate_resolver.hpp"
#include "core/frame_sampler.hpp"
#include "core/run_context.hpp"
#include "core/signature_builder.hpp"
#include "core/signature_comparator.hpp"

/**
 * @brief Runs the full detection pipeline over a list of assets
 *
 * Phases, each finished before the next starts:
 * 1. signatures are built in parallel, one task per asset
 * 2. candidate pairs are compared in parallel over the finished signatures
 * 3. duplicate verdicts are resolved into groups on the calling thread
 * 4. duplicates are archived
 *
 * Per-asset and per-pair failures are collected in the report; only an invalid
 * configuration stops a run, and it does so before any file is opened.
 */
class DuplicateDetectionEngine
{
public:
    /**
     * @throws ConfigError if the configuration does not validate
     */
    explicit DuplicateDetectionEngine(const DetectionConfig &config, FrameSourceFactory factory = FFmpegFrameSampler::open);

    /**
     * @brief Detect duplicates among assets and archive them under destination_root
     * @throws ConfigError if destination_root is empty
     */
    DetectionReport run(const std::vector<VideoAsset> &assets, const std::string &destination_root);

    /**
     * @brief Phase 1: one result per asset, in input order
     */
    std::vector<SignatureResult> buildSignatures(const std::vector<VideoAsset> &assets) const;

    /**
     * @brief Phase 2: compare every candidate pair of signatures
     * @param skipped Receives the number of pairs the pre-filter skipped
     */
    std::vector<ComparisonResult> compareSignatures(const std::vector<VideoSignature> &signatures, size_t &skipped) const;

    /**
     * @brief Substitute the canonical member policy
     */
    void setCanonicalPolicy(std::shared_ptr<const CanonicalPolicy> policy);

    const DetectionConfig &config() const { return config_; }

    /**
     * @throws ConfigError listing every problem found
     */
    static void validateConfig(const DetectionConfig &config);

private:
    static DetectionConfig validated(const DetectionConfig &config);

    DetectionConfig config_;
    SignatureBuilder builder_;
    SignatureComparator comparator_;
    CandidateFilter filter_;
    DuplicateResolver resolver_;
};
