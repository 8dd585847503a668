#include "core/signature_builder.hpp"
#include "logging/logger.hpp"
#include <iomanip>
#include <sstream>
#include <openssl/sha.h>

SignatureBuilder::SignatureBuilder(FrameSourceFactory factory)
    : factory_(std::move(factory))
{
}

SignatureResult SignatureBuilder::build(const VideoAsset &asset, const DetectionConfig &config) const
{
    Logger::debug("Building " + DedupModes::getAlgorithmName(config.dedup_mode) + " signature for: " + asset.path);

    std::unique_ptr<FrameSource> source;
    try
    {
        source = factory_(asset, config.sample_rate);
    }
    catch (const DecodeError &e)
    {
        Logger::warn("Decode failure for " + asset.id + ": " + e.what());
        return SignatureResult(false, FailureKind::DECODE_ERROR, e.what());
    }
    catch (const std::exception &e)
    {
        Logger::warn("Could not open " + asset.id + ": " + e.what());
        return SignatureResult(false, FailureKind::DECODE_ERROR, std::string("Could not open video: ") + e.what());
    }

    if (!source)
    {
        return SignatureResult(false, FailureKind::DECODE_ERROR, "No frame source available for: " + asset.path);
    }

    return buildFromSource(asset.id, *source, config.dedup_mode);
}

SignatureResult SignatureBuilder::buildFromSource(const std::string &asset_id, FrameSource &source, DedupMode mode)
{
    VideoSignature signature;
    signature.asset_id = asset_id;
    signature.bit_width = DedupModes::getHashBits(mode);

    int hash_failures = 0;
    try
    {
        VideoFrame frame;
        while (source.nextFrame(frame))
        {
            try
            {
                signature.fingerprints.push_back(PerceptualHasher::compute(frame.image, mode));
                signature.timestamps.push_back(frame.timestamp_seconds);
            }
            catch (const cv::Exception &e)
            {
                ++hash_failures;
                Logger::debug("OpenCV error hashing frame " + std::to_string(frame.sequence_index) + " of " + asset_id + ": " + e.what());
            }
            catch (const std::invalid_argument &e)
            {
                ++hash_failures;
                Logger::debug("Skipping frame " + std::to_string(frame.sequence_index) + " of " + asset_id + ": " + e.what());
            }
        }
    }
    catch (const std::exception &e)
    {
        if (signature.fingerprints.empty())
        {
            return SignatureResult(false, FailureKind::DECODE_ERROR, std::string("Decoding failed: ") + e.what());
        }
        // Keep the frames sampled before the failure
        Logger::warn("Decoding of " + asset_id + " stopped early after " + std::to_string(signature.fingerprints.size()) +
                     " frames: " + e.what());
    }

    if (signature.fingerprints.empty())
    {
        return SignatureResult(false, FailureKind::EMPTY_SIGNATURE,
                               "No frames could be sampled (zero duration or fully corrupt file): " + asset_id);
    }

    signature.frame_count = signature.fingerprints.size();
    signature.sample_rate = source.effectiveSampleRate();
    signature.duration_seconds = source.durationSeconds();

    std::vector<uint8_t> concatenated;
    concatenated.reserve(signature.frame_count * static_cast<size_t>(signature.bit_width / 8));
    for (const auto &fingerprint : signature.fingerprints)
    {
        concatenated.insert(concatenated.end(), fingerprint.bits.begin(), fingerprint.bits.end());
    }
    signature.content_hash = generateHash(concatenated);

    if (source.skippedTimestamps() > 0 || hash_failures > 0)
    {
        Logger::info("Signature for " + asset_id + " skipped " + std::to_string(source.skippedTimestamps()) +
                     " undecodable timestamps and " + std::to_string(hash_failures) + " unhashable frames");
    }
    Logger::debug("Generated " + std::to_string(signature.frame_count) + "-frame signature for " + asset_id);

    SignatureResult result(true);
    result.signature = std::move(signature);
    return result;
}

std::string SignatureBuilder::generateHash(const std::vector<uint8_t> &data)
{
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(data.data(), data.size(), hash);

    std::stringstream ss;
    for (int i = 0; i < SHA256_DIGEST_LENGTH; i++)
    {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return ss.str();
}
