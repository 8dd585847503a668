#include <gtest/gtest.h>
#include "core/signature_builder.hpp"
#include "test_base.hpp"

class SignatureBuilderTest : public TestBase
{
};

TEST_F(SignatureBuilderTest, BuildsOneFingerprintPerSample)
{
    SyntheticLibrary library;
    SyntheticVideo video;
    video.seed = 3;
    video.frame_count = 6;
    video.duration = 6.0;
    VideoAsset asset = addVideo(library, "clip.mp4", video, 0);

    DetectionConfig config;
    SignatureBuilder builder(library.factory());
    SignatureResult result = builder.build(asset, config);

    ASSERT_TRUE(result.success) << result.error_message;
    const VideoSignature &signature = result.signature;
    EXPECT_EQ(signature.asset_id, "clip.mp4");
    EXPECT_EQ(signature.frame_count, 6u);
    EXPECT_EQ(signature.fingerprints.size(), signature.timestamps.size());
    EXPECT_EQ(signature.bit_width, 64);
    EXPECT_DOUBLE_EQ(signature.duration_seconds, 6.0);
    EXPECT_DOUBLE_EQ(signature.sample_rate, 1.0);
    EXPECT_EQ(signature.content_hash.size(), 64u);
    for (size_t i = 1; i < signature.timestamps.size(); ++i)
    {
        EXPECT_LT(signature.timestamps[i - 1], signature.timestamps[i]);
    }
}

TEST_F(SignatureBuilderTest, QualityModeUsesWideFingerprints)
{
    SyntheticLibrary library;
    VideoAsset asset = addVideo(library, "clip.mp4", SyntheticVideo(), 0);

    DetectionConfig config;
    config.dedup_mode = DedupMode::QUALITY;
    SignatureResult result = SignatureBuilder(library.factory()).build(asset, config);

    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.signature.bit_width, 256);
    EXPECT_EQ(result.signature.fingerprints.front().bit_width, 256);
}

TEST_F(SignatureBuilderTest, SameContentSameHash)
{
    SyntheticLibrary library;
    SyntheticVideo video;
    video.seed = 9;
    VideoAsset first = addVideo(library, "first.mp4", video, 0);
    VideoAsset second = addVideo(library, "second.mp4", video, 1);

    DetectionConfig config;
    SignatureBuilder builder(library.factory());
    SignatureResult a = builder.build(first, config);
    SignatureResult b = builder.build(second, config);

    ASSERT_TRUE(a.success);
    ASSERT_TRUE(b.success);
    EXPECT_EQ(a.signature.content_hash, b.signature.content_hash);
}

TEST_F(SignatureBuilderTest, ZeroFramesIsEmptySignature)
{
    SyntheticLibrary library;
    SyntheticVideo video;
    video.frame_count = 0;
    video.duration = 0.0;
    VideoAsset asset = addVideo(library, "empty.mp4", video, 0);

    SignatureResult result = SignatureBuilder(library.factory()).build(asset, DetectionConfig());
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.failure_kind, FailureKind::EMPTY_SIGNATURE);
}

TEST_F(SignatureBuilderTest, OpenFailureIsDecodeError)
{
    SyntheticLibrary library;
    SyntheticVideo video;
    video.fail_to_open = true;
    VideoAsset asset = addVideo(library, "broken.mp4", video, 0);

    SignatureResult result = SignatureBuilder(library.factory()).build(asset, DetectionConfig());
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.failure_kind, FailureKind::DECODE_ERROR);
    EXPECT_FALSE(result.error_message.empty());
}

TEST_F(SignatureBuilderTest, GarbageFileIsDecodeErrorWithFFmpeg)
{
    std::string path = createDummyFile("garbage.mp4", "this is not a video container at all");
    VideoAsset asset("garbage.mp4", path, 37, "mp4", 0);

    SignatureResult result = SignatureBuilder().build(asset, DetectionConfig());
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.failure_kind, FailureKind::DECODE_ERROR);
}

TEST_F(SignatureBuilderTest, MissingFileIsDecodeErrorWithFFmpeg)
{
    VideoAsset asset("missing.mp4", getTestFilesDir() + "/missing.mp4", 0, "mp4", 0);

    SignatureResult result = SignatureBuilder().build(asset, DetectionConfig());
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.failure_kind, FailureKind::DECODE_ERROR);
}

TEST_F(SignatureBuilderTest, HashIsSha256Hex)
{
    // SHA-256 of the empty input
    EXPECT_EQ(SignatureBuilder::generateHash({}),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_F(SignatureBuilderTest, FrameSamplerRejectsUnreadableInput)
{
    std::string path = createDummyFile("noise.mkv", std::string(4096, '\x5a'));
    EXPECT_THROW(FFmpegFrameSampler(path, 1.0), DecodeError);
    EXPECT_THROW(FFmpegFrameSampler(getTestFilesDir() + "/nope.mkv", 1.0), DecodeError);
}

TEST_F(SignatureBuilderTest, SampleRateClampedToSourceFrameRate)
{
    EXPECT_DOUBLE_EQ(FFmpegFrameSampler::clampSampleRate(1.0, 30.0), 1.0);
    EXPECT_DOUBLE_EQ(FFmpegFrameSampler::clampSampleRate(60.0, 24.0), 24.0);
    EXPECT_DOUBLE_EQ(FFmpegFrameSampler::clampSampleRate(5.0, 0.0), 5.0);
}

TEST_F(SignatureBuilderTest, RewindRestartsSequence)
{
    SyntheticVideo video;
    video.frame_count = 3;
    SyntheticFrameSource source(video, 1.0);

    SignatureResult first = SignatureBuilder::buildFromSource("a", source, DedupMode::BALANCED);
    source.rewind();
    SignatureResult second = SignatureBuilder::buildFromSource("a", source, DedupMode::BALANCED);

    ASSERT_TRUE(first.success);
    ASSERT_TRUE(second.success);
    EXPECT_EQ(first.signature.content_hash, second.signature.content_hash);
}
