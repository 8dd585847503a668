#pragma once

#include <string>
#include <vector>
#include "core/detection_config.hpp"
#include "core/frame_sampler.hpp"
#include "core/video_asset.hpp"
#include "core/video_signature.hpp"

/**
 * @brief Drives the sampler and hasher over one video to produce its signature
 *
 * Independent across assets and safe to run concurrently; each call owns its
 * own frame source.
 */
class SignatureBuilder
{
public:
    /**
     * @param factory Frame source factory; defaults to the FFmpeg sampler
     */
    explicit SignatureBuilder(FrameSourceFactory factory = FFmpegFrameSampler::open);

    /**
     * @brief Build the signature of one asset
     *
     * Never throws: decode problems come back as DECODE_ERROR and a video that
     * yields no hashable frame as EMPTY_SIGNATURE.
     */
    SignatureResult build(const VideoAsset &asset, const DetectionConfig &config) const;

    /**
     * @brief Build a signature from an already opened frame source
     */
    static SignatureResult buildFromSource(const std::string &asset_id, FrameSource &source, DedupMode mode);

    /**
     * @brief SHA-256 of a byte buffer as lowercase hex
     */
    static std::string generateHash(const std::vector<uint8_t> &data);

private:
    FrameSourceFactory factory_;
};
