#pragma once

#include <cstdint>
#include <ctime>
#include <string>
#include <opencv2/core.hpp>

/**
 * @brief One input video as discovered by the calling application
 *
 * The engine only references assets; the caller owns the list.
 */
struct VideoAsset
{
    std::string id;               // unique within a run, usually the file name or relative path
    std::string path;             // location on disk
    uint64_t size_bytes;          // file size in bytes
    std::string container_format; // lowercase extension tag, e.g. "mp4"
    size_t discovery_index;       // position in the caller's enumeration order
    std::time_t modified_time;    // last modification time, 0 if unknown

    VideoAsset() : size_bytes(0), discovery_index(0), modified_time(0) {}
    VideoAsset(const std::string &i, const std::string &p, uint64_t size, const std::string &format = "",
               size_t index = 0, std::time_t mtime = 0)
        : id(i), path(p), size_bytes(size), container_format(format), discovery_index(index), modified_time(mtime) {}
};

/**
 * @brief A decoded raster sample; lives only inside the sampling/hashing pipeline
 */
struct VideoFrame
{
    cv::Mat image;            // 8-bit BGR (or grayscale) pixels
    double timestamp_seconds; // presentation time within the video
    int64_t sequence_index;   // k for the k-th sampled timestamp

    VideoFrame() : timestamp_seconds(0.0), sequence_index(0) {}
};
