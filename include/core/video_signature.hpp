#pragma once

#include <string>
#include <vector>
#include "core/perceptual_hasher.hpp"
#include "core/dedup_errors.hpp"

/**
 * @brief Ordered per-frame fingerprints of one video plus sampling metadata
 *
 * fingerprints[i] was taken at timestamps[i]; order is temporal and significant.
 */
struct VideoSignature
{
    std::string asset_id;
    std::vector<Fingerprint> fingerprints;
    std::vector<double> timestamps;
    double sample_rate;      // effective rate after clamping
    size_t frame_count;      // number of fingerprints
    double duration_seconds; // 0 if the container did not report one
    int bit_width;
    std::string content_hash; // SHA-256 over the concatenated fingerprint bytes

    VideoSignature() : sample_rate(0.0), frame_count(0), duration_seconds(0.0), bit_width(0) {}

    bool empty() const { return fingerprints.empty(); }

    /**
     * @brief Position of fingerprint i within the video, in [0, 1]
     */
    double relativePosition(size_t i) const
    {
        if (duration_seconds > 0.0 && i < timestamps.size())
        {
            double position = timestamps[i] / duration_seconds;
            return position < 0.0 ? 0.0 : (position > 1.0 ? 1.0 : position);
        }
        if (fingerprints.size() > 1)
        {
            return static_cast<double>(i) / static_cast<double>(fingerprints.size() - 1);
        }
        return 0.0;
    }
};

/**
 * @brief Outcome of building one signature
 */
struct SignatureResult
{
    bool success;
    FailureKind failure_kind;
    std::string error_message;
    VideoSignature signature;

    SignatureResult() : success(false), failure_kind(FailureKind::DECODE_ERROR) {}
    SignatureResult(bool s, FailureKind kind = FailureKind::DECODE_ERROR, const std::string &msg = "")
        : success(s), failure_kind(kind), error_message(msg) {}
};
