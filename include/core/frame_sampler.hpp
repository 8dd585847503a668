#pragma once

#include <functional>
#include <memory>
#include <string>
#include "core/video_asset.hpp"
#include "core/dedup_errors.hpp"
#include "core/external_library_wrappers.hpp"

/**
 * @brief Lazy, time-ordered stream of sampled frames for one video
 *
 * A source yields frames at timestamps 0, 1/R, 2/R, ... up to the video's
 * duration. Frames are decoded on demand; nothing is materialized up front.
 */
class FrameSource
{
public:
    virtual ~FrameSource() = default;

    /**
     * @brief Decode the next sampled frame
     * @param frame Receives the frame on success
     * @return false once the sequence is exhausted
     */
    virtual bool nextFrame(VideoFrame &frame) = 0;

    /**
     * @brief Restart the sequence from timestamp 0
     */
    virtual void rewind() = 0;

    /**
     * @brief Video duration in seconds, 0 if unknown
     */
    virtual double durationSeconds() const = 0;

    /**
     * @brief Sample rate actually used after clamping to the source frame rate
     */
    virtual double effectiveSampleRate() const = 0;

    /**
     * @brief Number of sample timestamps that failed to decode so far
     */
    virtual int skippedTimestamps() const = 0;
};

/**
 * @brief Creates the frame source for an asset
 * @throws DecodeError if the asset cannot be opened
 */
using FrameSourceFactory = std::function<std::unique_ptr<FrameSource>(const VideoAsset &asset, double sample_rate)>;

/**
 * @brief FFmpeg-backed frame source
 *
 * Seeks to the keyframe before each sample timestamp when the gap is large,
 * otherwise decodes forward, and converts the first frame at or after the
 * timestamp to BGR24.
 */
class FFmpegFrameSampler : public FrameSource
{
public:
    /**
     * @brief Open a video container for sampling
     * @param file_path Path to the video file
     * @param sample_rate Requested frames per second of sampling, must be >= 1
     * @throws std::invalid_argument if sample_rate is not a positive finite number
     * @throws DecodeError if the container cannot be opened or has no decodable video stream
     */
    FFmpegFrameSampler(const std::string &file_path, double sample_rate);
    ~FFmpegFrameSampler() override = default;

    FFmpegFrameSampler(const FFmpegFrameSampler &) = delete;
    FFmpegFrameSampler &operator=(const FFmpegFrameSampler &) = delete;

    bool nextFrame(VideoFrame &frame) override;
    void rewind() override;
    double durationSeconds() const override { return duration_seconds_; }
    double effectiveSampleRate() const override { return sample_rate_; }
    int skippedTimestamps() const override { return skipped_; }

    double sourceFrameRate() const { return source_fps_; }

    /**
     * @brief Default factory used by the signature builder
     */
    static std::unique_ptr<FrameSource> open(const VideoAsset &asset, double sample_rate);

    /**
     * @brief Clamp a requested sample rate to the source frame rate
     * @param requested Requested rate
     * @param source_fps Source frame rate, <= 0 if unknown
     */
    static double clampSampleRate(double requested, double source_fps);

private:
    bool decodeAt(double target_seconds, VideoFrame &frame);
    bool receiveUntil(int64_t target_pts, bool &reached_eof);
    bool seekTo(double target_seconds);
    bool convertCurrentFrame(VideoFrame &frame);

    std::string file_path_;
    AVFormatContextRAII format_ctx_;
    AVCodecContextRAII codec_ctx_;
    AVFrameRAII frame_;
    AVPacketRAII packet_;
    SwsContextRAII sws_ctx_;
    int sws_width_ = 0;
    int sws_height_ = 0;
    int sws_format_ = -1;

    int stream_index_ = -1;
    double time_base_ = 0.0;
    int64_t start_pts_ = 0;
    double duration_seconds_ = 0.0;
    double source_fps_ = 0.0;
    double sample_rate_ = 1.0;
    int64_t frame_tolerance_pts_ = 0;

    int64_t next_index_ = 0;
    int64_t last_index_ = 0;
    double last_decoded_seconds_ = -1.0;
    bool eof_ = false;
    bool draining_ = false;
    bool have_frame_ = false;
    int skipped_ = 0;

    // Frames decoded since the last seek, the clock for streams without timestamps
    int64_t decoded_frames_ = 0;
    bool missing_pts_ = false;
};
