#pragma once

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include "core/frame_sampler.hpp"
#include "core/video_asset.hpp"
#include "logging/logger.hpp"

/**
 * @brief Description of a fake video served by SyntheticFrameSource
 *
 * Frame k of a video is a set of flat rectangles drawn from seed and k, laid
 * out on a 20 px grid of a 640x640 canvas so that any width dividing 640
 * evenly yields the same luminance grid after area resampling.
 */
struct SyntheticVideo
{
    int seed = 1;
    int frame_count = 10;     // frames produced at sample rate 1
    double duration = 10.0;   // reported duration, 0 for unknown
    int width = 640;          // square frames; 640, 320 and 160 keep the grid aligned
    int brightness = 0;       // added to every pixel
    bool fail_to_open = false; // factory throws DecodeError
};

/**
 * @brief Render frame k of the scene identified by seed
 */
inline cv::Mat makeSceneFrame(int seed, int k, int width = 640, int brightness = 0)
{
    const int canvas = 640;
    const int cell = 20;
    cv::RNG rng(static_cast<uint64_t>(seed) * 7919u + static_cast<uint64_t>(k) * 104729u + 17u);

    cv::Mat image(canvas, canvas, CV_8UC3, cv::Scalar::all(rng.uniform(40, 120)));
    for (int r = 0; r < 8; r++)
    {
        int x = rng.uniform(0, canvas / cell) * cell;
        int y = rng.uniform(0, canvas / cell) * cell;
        int w = rng.uniform(2, 12) * cell;
        int h = rng.uniform(2, 12) * cell;
        cv::Scalar color(rng.uniform(40, 200), rng.uniform(40, 200), rng.uniform(40, 200));
        cv::rectangle(image, cv::Rect(x, y, w, h) & cv::Rect(0, 0, canvas, canvas), color, cv::FILLED);
    }

    if (brightness != 0)
    {
        image += cv::Scalar::all(brightness);
    }
    if (width != canvas)
    {
        cv::Mat scaled;
        cv::resize(image, scaled, cv::Size(width, width), 0, 0, cv::INTER_AREA);
        return scaled;
    }
    return image;
}

/**
 * @brief In-memory frame source producing makeSceneFrame images
 */
class SyntheticFrameSource : public FrameSource
{
public:
    SyntheticFrameSource(const SyntheticVideo &video, double sample_rate)
        : video_(video), sample_rate_(sample_rate) {}

    bool nextFrame(VideoFrame &frame) override
    {
        if (next_ >= video_.frame_count)
            return false;
        frame.image = makeSceneFrame(video_.seed, next_, video_.width, video_.brightness);
        frame.timestamp_seconds = next_ / sample_rate_;
        frame.sequence_index = next_;
        ++next_;
        return true;
    }

    void rewind() override { next_ = 0; }
    double durationSeconds() const override { return video_.duration; }
    double effectiveSampleRate() const override { return sample_rate_; }
    int skippedTimestamps() const override { return 0; }

private:
    SyntheticVideo video_;
    double sample_rate_;
    int next_ = 0;
};

/**
 * @brief Maps asset paths to synthetic videos; unknown paths fail to decode
 */
class SyntheticLibrary
{
public:
    void add(const std::string &path, const SyntheticVideo &video)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        videos_[path] = video;
    }

    FrameSourceFactory factory()
    {
        return [this](const VideoAsset &asset, double sample_rate) -> std::unique_ptr<FrameSource>
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = videos_.find(asset.path);
            if (it == videos_.end() || it->second.fail_to_open)
            {
                throw DecodeError("Could not open video file: " + asset.path);
            }
            return std::make_unique<SyntheticFrameSource>(it->second, sample_rate);
        };
    }

private:
    std::mutex mutex_;
    std::map<std::string, SyntheticVideo> videos_;
};

/**
 * @brief Base fixture providing a scratch directory per test
 */
class TestBase : public ::testing::Test
{
protected:
    void SetUp() override
    {
        Logger::init("WARN");

        const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_files_dir_ = std::filesystem::temp_directory_path() /
                          ("video_dedup_test_" + std::string(info->test_suite_name()) + "_" + info->name());
        std::filesystem::remove_all(test_files_dir_);
        std::filesystem::create_directories(test_files_dir_);
    }

    void TearDown() override
    {
        std::error_code ec;
        std::filesystem::remove_all(test_files_dir_, ec);
    }

    // Helper to create a dummy file for tests; returns its full path
    std::string createDummyFile(const std::string &filename, const std::string &content = "dummy content")
    {
        std::filesystem::path file_path = test_files_dir_ / filename;
        std::filesystem::create_directories(file_path.parent_path());
        std::ofstream ofs(file_path, std::ios::binary);
        ofs << content;
        ofs.close();
        return file_path.string();
    }

    /**
     * @brief Create a file on disk backed by a synthetic video and return its asset
     */
    VideoAsset addVideo(SyntheticLibrary &library, const std::string &filename, const SyntheticVideo &video,
                        size_t discovery_index, size_t size_bytes = 1000)
    {
        std::string path = createDummyFile(filename, std::string(size_bytes, 'v'));
        library.add(path, video);
        return VideoAsset(filename, path, size_bytes, "mp4", discovery_index);
    }

    std::string getTestFilesDir() const { return test_files_dir_.string(); }

private:
    std::filesystem::path test_files_dir_;
};
