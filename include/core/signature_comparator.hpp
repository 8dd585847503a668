#pragma once

#include <string>
#include <utility>
#include <vector>
#include "core/detection_config.hpp"
#include "core/video_signature.hpp"

/**
 * @brief Similarity of one unordered pair of assets
 */
struct ComparisonResult
{
    std::string asset_a;
    std::string asset_b;
    double score;
    bool is_duplicate;
    size_t aligned_pairs;
    bool success;
    FailureKind failure_kind; // meaningful only when success is false
    std::string error_message;

    ComparisonResult() : score(0.0), is_duplicate(false), aligned_pairs(0), success(false), failure_kind(FailureKind::INSUFFICIENT_DATA) {}
};

/**
 * @brief Scores two signatures and classifies the pair against a threshold
 *
 * The shorter fingerprint sequence drives the alignment: each of its entries
 * is paired with the entry of the longer sequence at the nearest relative
 * timestamp. The score is the mean normalized Hamming similarity of the
 * aligned pairs. compare(a, b) and compare(b, a) return the same score.
 */
class SignatureComparator
{
public:
    explicit SignatureComparator(double threshold = 0.95);

    ComparisonResult compare(const VideoSignature &a, const VideoSignature &b) const;

    double threshold() const { return threshold_; }

    /**
     * @brief For every entry of driver, the index of the nearest entry of other by relative position
     */
    static std::vector<size_t> alignByRelativeTimestamp(const VideoSignature &driver, const VideoSignature &other);

    /**
     * @brief All unordered index pairs (i, j) with i < j
     */
    static std::vector<std::pair<size_t, size_t>> enumeratePairs(size_t count);

    static bool meetsThreshold(double score, double threshold) { return score >= threshold; }

private:
    static bool drivesAlignment(const VideoSignature &a, const VideoSignature &b);

    double threshold_;
};

/**
 * @brief Cheap duration check that can skip a pair before full alignment
 *
 * Disabled by default. Pairs with an unknown duration are always compared.
 */
class CandidateFilter
{
public:
    CandidateFilter(bool enabled, double tolerance_seconds)
        : enabled_(enabled), tolerance_seconds_(tolerance_seconds) {}

    static CandidateFilter fromConfig(const DetectionConfig &config)
    {
        return CandidateFilter(config.prefilter_enabled, config.effectiveDurationTolerance());
    }

    bool shouldCompare(const VideoSignature &a, const VideoSignature &b) const;

    bool enabled() const { return enabled_; }
    double toleranceSeconds() const { return tolerance_seconds_; }

private:
    bool enabled_;
    double tolerance_seconds_;
};
