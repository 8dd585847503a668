#include "core/frame_sampler.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cmath>
#include <mutex>
#include <stdexcept>

extern "C"
{
#include <libavutil/error.h>
#include <libavutil/log.h>
#include <libavutil/pixfmt.h>
}

namespace
{
    // Forward decoding is cheaper than seeking for short gaps between samples
    constexpr double kSeekGapSeconds = 2.0;

    // Absorbs rounding in duration * rate so a 3 s clip at 1 fps ends at index 2
    constexpr double kIndexEpsilon = 1e-6;

    std::string avErrorString(int code)
    {
        char err_buf[AV_ERROR_MAX_STRING_SIZE];
        av_strerror(code, err_buf, AV_ERROR_MAX_STRING_SIZE);
        return std::string(err_buf);
    }

    void quietFFmpegLogging()
    {
        static std::once_flag once;
        std::call_once(once, []()
                       { av_log_set_level(AV_LOG_ERROR); });
    }
}

FFmpegFrameSampler::FFmpegFrameSampler(const std::string &file_path, double sample_rate)
    : file_path_(file_path)
{
    if (!std::isfinite(sample_rate) || sample_rate <= 0.0)
    {
        throw std::invalid_argument("Sample rate must be a positive finite number, got " + std::to_string(sample_rate));
    }
    quietFFmpegLogging();

    int open_result = avformat_open_input(format_ctx_.address(), file_path.c_str(), nullptr, nullptr);
    if (open_result < 0)
    {
        throw DecodeError("Could not open video file (possibly corrupted or unsupported format): " + file_path + " - " + avErrorString(open_result));
    }

    int stream_info_result = avformat_find_stream_info(format_ctx_.get(), nullptr);
    if (stream_info_result < 0)
    {
        throw DecodeError("Could not find stream information (file may be corrupted): " + file_path + " - " + avErrorString(stream_info_result));
    }

    stream_index_ = av_find_best_stream(format_ctx_.get(), AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
    if (stream_index_ < 0)
    {
        throw DecodeError("No video stream found: " + file_path);
    }

    AVStream *video_stream = format_ctx_.get()->streams[stream_index_];
    AVCodecParameters *codec_params = video_stream->codecpar;
    const AVCodec *codec = avcodec_find_decoder(codec_params->codec_id);
    if (!codec)
    {
        throw DecodeError("Unsupported video codec: " + file_path);
    }

    codec_ctx_.set(avcodec_alloc_context3(codec));
    if (!codec_ctx_)
    {
        throw DecodeError("Could not allocate decoder context: " + file_path);
    }
    if (avcodec_parameters_to_context(codec_ctx_.get(), codec_params) < 0)
    {
        throw DecodeError("Could not copy codec parameters: " + file_path);
    }
    if (avcodec_open2(codec_ctx_.get(), codec, nullptr) < 0)
    {
        throw DecodeError("Could not open decoder: " + file_path);
    }

    frame_.set(av_frame_alloc());
    packet_.set(av_packet_alloc());
    if (!frame_ || !packet_)
    {
        throw DecodeError("Could not allocate frame or packet: " + file_path);
    }

    time_base_ = av_q2d(video_stream->time_base);
    if (time_base_ <= 0.0)
    {
        time_base_ = 1.0 / AV_TIME_BASE;
    }
    start_pts_ = video_stream->start_time != AV_NOPTS_VALUE ? video_stream->start_time : 0;

    if (video_stream->duration > 0 && video_stream->time_base.num > 0 && video_stream->time_base.den > 0)
    {
        duration_seconds_ = static_cast<double>(video_stream->duration) * video_stream->time_base.num /
                            video_stream->time_base.den;
    }
    else if (format_ctx_.get()->duration > 0)
    {
        duration_seconds_ = static_cast<double>(format_ctx_.get()->duration) / AV_TIME_BASE;
    }

    AVRational guessed = av_guess_frame_rate(format_ctx_.get(), video_stream, nullptr);
    source_fps_ = guessed.num > 0 && guessed.den > 0 ? av_q2d(guessed) : av_q2d(video_stream->r_frame_rate);
    sample_rate_ = clampSampleRate(sample_rate, source_fps_);
    if (sample_rate_ < sample_rate)
    {
        Logger::debug("Sample rate " + std::to_string(sample_rate) + " clamped to source frame rate " +
                      std::to_string(source_fps_) + " for " + file_path);
    }

    // Half a source frame either side of a sample timestamp counts as a hit
    if (source_fps_ > 0.0 && time_base_ > 0.0)
    {
        frame_tolerance_pts_ = static_cast<int64_t>(0.5 / (source_fps_ * time_base_));
    }

    // Sample timestamps k/R strictly before the end of the video; unknown duration samples until EOF
    last_index_ = duration_seconds_ > 0.0
                      ? std::max<int64_t>(0, static_cast<int64_t>(std::ceil(duration_seconds_ * sample_rate_ - kIndexEpsilon)) - 1)
                      : -1;

    Logger::debug("Video info - " + file_path + " duration: " + std::to_string(duration_seconds_) +
                  "s, FPS: " + std::to_string(source_fps_) + ", sample rate: " + std::to_string(sample_rate_));
}

std::unique_ptr<FrameSource> FFmpegFrameSampler::open(const VideoAsset &asset, double sample_rate)
{
    return std::make_unique<FFmpegFrameSampler>(asset.path, sample_rate);
}

double FFmpegFrameSampler::clampSampleRate(double requested, double source_fps)
{
    if (source_fps > 0.0 && requested > source_fps)
    {
        return source_fps;
    }
    return requested;
}

bool FFmpegFrameSampler::nextFrame(VideoFrame &frame)
{
    while (!eof_ && (last_index_ < 0 || next_index_ <= last_index_))
    {
        int64_t index = next_index_++;
        double target_seconds = static_cast<double>(index) / sample_rate_;
        if (decodeAt(target_seconds, frame))
        {
            frame.sequence_index = index;
            frame.timestamp_seconds = target_seconds;
            return true;
        }
        if (!eof_ || last_index_ >= 0)
        {
            ++skipped_;
            Logger::trace("Skipped undecodable timestamp " + std::to_string(target_seconds) + "s in " + file_path_);
        }
    }
    return false;
}

void FFmpegFrameSampler::rewind()
{
    next_index_ = 0;
    skipped_ = 0;
    if (!seekTo(0.0))
    {
        Logger::warn("Could not rewind " + file_path_ + " to the first frame");
    }
}

bool FFmpegFrameSampler::decodeAt(double target_seconds, VideoFrame &frame)
{
    // The frame held from the previous sample may already cover this timestamp
    if (have_frame_ && last_decoded_seconds_ >= target_seconds)
    {
        return convertCurrentFrame(frame);
    }

    bool backward = target_seconds < last_decoded_seconds_;
    bool long_gap = target_seconds - last_decoded_seconds_ > kSeekGapSeconds;
    if (last_decoded_seconds_ >= 0.0 && (backward || (long_gap && !missing_pts_)))
    {
        // Without timestamps only the start of the stream is a known position
        if (!seekTo(missing_pts_ ? 0.0 : target_seconds) && backward)
        {
            return false;
        }
    }

    int64_t target_pts = start_pts_ + static_cast<int64_t>(std::llround(target_seconds / time_base_));
    bool reached_eof = false;
    if (!receiveUntil(target_pts, reached_eof))
    {
        if (reached_eof)
        {
            eof_ = true;
        }
        return false;
    }
    return convertCurrentFrame(frame);
}

bool FFmpegFrameSampler::receiveUntil(int64_t target_pts, bool &reached_eof)
{
    while (true)
    {
        int response = avcodec_receive_frame(codec_ctx_.get(), frame_.get());
        if (response == 0)
        {
            int64_t pts = frame_.get()->best_effort_timestamp;
            if (pts == AV_NOPTS_VALUE)
            {
                pts = frame_.get()->pts;
            }
            have_frame_ = true;
            int64_t frame_number = decoded_frames_++;
            if (pts == AV_NOPTS_VALUE)
            {
                if (!missing_pts_)
                {
                    missing_pts_ = true;
                    Logger::warn("No frame timestamps in " + file_path_ +
                                 (source_fps_ > 0.0 ? ", positions estimated from the frame count"
                                                    : " and no frame rate, frames sampled in decode order"));
                }
                if (source_fps_ <= 0.0)
                {
                    last_decoded_seconds_ = std::max(0.0, last_decoded_seconds_);
                    return true;
                }
                last_decoded_seconds_ = static_cast<double>(frame_number) / source_fps_;
                if (frame_.get()->flags & AV_FRAME_FLAG_CORRUPT)
                {
                    continue;
                }
                double target_seconds = static_cast<double>(target_pts - start_pts_) * time_base_;
                if (last_decoded_seconds_ + 0.5 / source_fps_ >= target_seconds)
                {
                    return true;
                }
                continue;
            }
            last_decoded_seconds_ = static_cast<double>(pts - start_pts_) * time_base_;
            if (frame_.get()->flags & AV_FRAME_FLAG_CORRUPT)
            {
                continue;
            }
            if (pts + frame_tolerance_pts_ >= target_pts)
            {
                return true;
            }
            continue;
        }

        if (response == AVERROR_EOF)
        {
            reached_eof = true;
            have_frame_ = false;
            return false;
        }

        if (response != AVERROR(EAGAIN))
        {
            Logger::debug("Decoder error in " + file_path_ + ": " + avErrorString(response));
            have_frame_ = false;
            return false;
        }

        if (draining_)
        {
            reached_eof = true;
            have_frame_ = false;
            return false;
        }

        // Decoder needs more input
        int read_result = av_read_frame(format_ctx_.get(), packet_.get());
        if (read_result < 0)
        {
            draining_ = true;
            avcodec_send_packet(codec_ctx_.get(), nullptr);
            continue;
        }
        if (packet_.get()->stream_index == stream_index_)
        {
            int send_result = avcodec_send_packet(codec_ctx_.get(), packet_.get());
            if (send_result < 0 && send_result != AVERROR(EAGAIN))
            {
                Logger::trace("Dropped undecodable packet in " + file_path_ + ": " + avErrorString(send_result));
            }
        }
        av_packet_unref(packet_.get());
    }
}

bool FFmpegFrameSampler::seekTo(double target_seconds)
{
    int64_t seek_target = start_pts_ + static_cast<int64_t>(std::llround(target_seconds / time_base_));
    int result = av_seek_frame(format_ctx_.get(), stream_index_, seek_target, AVSEEK_FLAG_BACKWARD);
    if (result < 0)
    {
        Logger::debug("Seek to " + std::to_string(target_seconds) + "s failed in " + file_path_ + ": " + avErrorString(result));
        return false;
    }
    avcodec_flush_buffers(codec_ctx_.get());
    draining_ = false;
    eof_ = false;
    have_frame_ = false;
    last_decoded_seconds_ = -1.0;
    decoded_frames_ = 0;
    return true;
}

bool FFmpegFrameSampler::convertCurrentFrame(VideoFrame &frame)
{
    AVFrame *decoded = frame_.get();
    int width = decoded->width;
    int height = decoded->height;
    if (width <= 0 || height <= 0)
    {
        return false;
    }

    if (!sws_ctx_ || width != sws_width_ || height != sws_height_ || decoded->format != sws_format_)
    {
        sws_ctx_.set(sws_getContext(width, height, static_cast<AVPixelFormat>(decoded->format),
                                    width, height, AV_PIX_FMT_BGR24,
                                    SWS_BILINEAR, nullptr, nullptr, nullptr));
        if (!sws_ctx_)
        {
            Logger::warn("Could not create scaler context for " + file_path_);
            return false;
        }
        sws_width_ = width;
        sws_height_ = height;
        sws_format_ = decoded->format;
    }

    frame.image.create(height, width, CV_8UC3);
    uint8_t *dst_data[4] = {frame.image.data, nullptr, nullptr, nullptr};
    int dst_linesize[4] = {static_cast<int>(frame.image.step[0]), 0, 0, 0};
    sws_scale(sws_ctx_.get(), decoded->data, decoded->linesize, 0, height, dst_data, dst_linesize);
    return true;
}
