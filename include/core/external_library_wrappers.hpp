#pragma once

extern "C"
{
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/frame.h>
#include <libswscale/swscale.h>
}

// Release functions for the FFmpeg objects the frame sampler holds
struct AVFormatInputCloser
{
    void operator()(AVFormatContext **ctx) const { avformat_close_input(ctx); }
};

struct AVCodecContextFreer
{
    void operator()(AVCodecContext **ctx) const { avcodec_free_context(ctx); }
};

struct AVFrameFreer
{
    void operator()(AVFrame **frame) const { av_frame_free(frame); }
};

struct AVPacketFreer
{
    void operator()(AVPacket **packet) const { av_packet_free(packet); }
};

struct SwsContextFreer
{
    void operator()(SwsContext **ctx) const
    {
        sws_freeContext(*ctx);
        *ctx = nullptr;
    }
};

/**
 * @brief Owning handle for an FFmpeg object released through a pointer-to-pointer API
 *
 * address() is for allocation calls such as avformat_open_input that write the
 * new object through an out-parameter.
 */
template <typename T, typename Release>
class FFmpegHandle
{
private:
    T *ptr_;

public:
    FFmpegHandle() : ptr_(nullptr) {}
    explicit FFmpegHandle(T *existing) : ptr_(existing) {}
    ~FFmpegHandle() { reset(); }

    T *get() const { return ptr_; }
    T **address() { return &ptr_; }
    explicit operator bool() const { return ptr_ != nullptr; }

    void set(T *new_ptr)
    {
        reset();
        ptr_ = new_ptr;
    }

    void reset()
    {
        if (ptr_)
            Release()(&ptr_);
        ptr_ = nullptr;
    }

    // Disable copy
    FFmpegHandle(const FFmpegHandle &) = delete;
    FFmpegHandle &operator=(const FFmpegHandle &) = delete;

    // Allow move
    FFmpegHandle(FFmpegHandle &&other) noexcept : ptr_(other.ptr_)
    {
        other.ptr_ = nullptr;
    }

    FFmpegHandle &operator=(FFmpegHandle &&other) noexcept
    {
        if (this != &other)
        {
            reset();
            ptr_ = other.ptr_;
            other.ptr_ = nullptr;
        }
        return *this;
    }
};

using AVFormatContextRAII = FFmpegHandle<AVFormatContext, AVFormatInputCloser>;
using AVCodecContextRAII = FFmpegHandle<AVCodecContext, AVCodecContextFreer>;
using AVFrameRAII = FFmpegHandle<AVFrame, AVFrameFreer>;
using AVPacketRAII = FFmpegHandle<AVPacket, AVPacketFreer>;
using SwsContextRAII = FFmpegHandle<SwsContext, SwsContextFreer>;
