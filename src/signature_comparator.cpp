#include "core/signature_comparator.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cmath>
#include <tuple>

SignatureComparator::SignatureComparator(double threshold)
    : threshold_(threshold)
{
}

bool SignatureComparator::drivesAlignment(const VideoSignature &a, const VideoSignature &b)
{
    // Total order on the pair so both argument orders pick the same driver
    return std::make_tuple(a.fingerprints.size(), a.asset_id, a.content_hash) <=
           std::make_tuple(b.fingerprints.size(), b.asset_id, b.content_hash);
}

std::vector<size_t> SignatureComparator::alignByRelativeTimestamp(const VideoSignature &driver, const VideoSignature &other)
{
    std::vector<double> other_positions(other.fingerprints.size());
    for (size_t j = 0; j < other_positions.size(); ++j)
    {
        other_positions[j] = other.relativePosition(j);
    }

    std::vector<size_t> mapping;
    mapping.reserve(driver.fingerprints.size());
    for (size_t i = 0; i < driver.fingerprints.size(); ++i)
    {
        double position = driver.relativePosition(i);
        auto it = std::lower_bound(other_positions.begin(), other_positions.end(), position);
        size_t j = static_cast<size_t>(it - other_positions.begin());
        if (j == other_positions.size())
        {
            j = other_positions.size() - 1;
        }
        else if (j > 0 && position - other_positions[j - 1] <= other_positions[j] - position)
        {
            // Ties go to the earlier fingerprint
            j = j - 1;
        }
        mapping.push_back(j);
    }
    return mapping;
}

ComparisonResult SignatureComparator::compare(const VideoSignature &a, const VideoSignature &b) const
{
    ComparisonResult result;
    result.asset_a = a.asset_id;
    result.asset_b = b.asset_id;

    if (a.asset_id == b.asset_id)
    {
        result.success = true;
        result.score = 1.0;
        result.aligned_pairs = a.fingerprints.size();
        result.is_duplicate = meetsThreshold(result.score, threshold_);
        return result;
    }

    if (a.bit_width != b.bit_width)
    {
        result.error_message = "Fingerprint widths differ (" + std::to_string(a.bit_width) + " vs " + std::to_string(b.bit_width) + ")";
        return result;
    }

    const VideoSignature &driver = drivesAlignment(a, b) ? a : b;
    const VideoSignature &other = (&driver == &a) ? b : a;

    result.aligned_pairs = driver.fingerprints.size();
    if (result.aligned_pairs < 2 || other.fingerprints.empty())
    {
        result.error_message = "Only " + std::to_string(result.aligned_pairs) + " aligned fingerprint(s), at least 2 required";
        return result;
    }

    result.success = true;

    // Identical fingerprints at identical positions need no per-frame work
    if (!a.content_hash.empty() && a.content_hash == b.content_hash && a.fingerprints.size() == b.fingerprints.size() &&
        a.timestamps == b.timestamps && a.duration_seconds == b.duration_seconds)
    {
        result.score = 1.0;
        result.is_duplicate = meetsThreshold(result.score, threshold_);
        return result;
    }

    std::vector<size_t> mapping = alignByRelativeTimestamp(driver, other);
    double total = 0.0;
    for (size_t i = 0; i < mapping.size(); ++i)
    {
        total += driver.fingerprints[i].similarity(other.fingerprints[mapping[i]]);
    }

    double score = total / static_cast<double>(mapping.size());
    result.score = std::min(1.0, std::max(0.0, score));
    result.is_duplicate = meetsThreshold(result.score, threshold_);

    Logger::trace("Compared " + a.asset_id + " <-> " + b.asset_id + ": score " + std::to_string(result.score) +
                  " over " + std::to_string(result.aligned_pairs) + " aligned frames");
    return result;
}

std::vector<std::pair<size_t, size_t>> SignatureComparator::enumeratePairs(size_t count)
{
    std::vector<std::pair<size_t, size_t>> pairs;
    if (count < 2)
    {
        return pairs;
    }
    pairs.reserve(count * (count - 1) / 2);
    for (size_t i = 0; i < count; ++i)
    {
        for (size_t j = i + 1; j < count; ++j)
        {
            pairs.emplace_back(i, j);
        }
    }
    return pairs;
}

bool CandidateFilter::shouldCompare(const VideoSignature &a, const VideoSignature &b) const
{
    if (!enabled_)
    {
        return true;
    }
    if (a.duration_seconds <= 0.0 || b.duration_seconds <= 0.0)
    {
        return true;
    }
    return std::fabs(a.duration_seconds - b.duration_seconds) <= tolerance_seconds_;
}
