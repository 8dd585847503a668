#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include "core/dedup_modes.hpp"

/**
 * @brief Fixed-width perceptual fingerprint of one frame
 *
 * Bits are packed most-significant-first into bytes; bit_width is always a
 * multiple of 8.
 */
struct Fingerprint
{
    std::vector<uint8_t> bits;
    int bit_width;

    Fingerprint() : bit_width(0) {}
    explicit Fingerprint(int width) : bits(static_cast<size_t>(width / 8), 0), bit_width(width) {}

    void setBit(int index);
    bool testBit(int index) const;

    /**
     * @brief Number of differing bits
     * @throws std::invalid_argument if the widths differ
     */
    int hammingDistance(const Fingerprint &other) const;

    /**
     * @brief Normalized Hamming similarity, 1 - distance / bit_width
     */
    double similarity(const Fingerprint &other) const;

    std::string toHex() const;
    static Fingerprint fromHex(const std::string &hex);

    bool operator==(const Fingerprint &other) const { return bit_width == other.bit_width && bits == other.bits; }
    bool operator!=(const Fingerprint &other) const { return !(*this == other); }
};

/**
 * @brief Converts decoded frames into perceptual fingerprints
 *
 * All hashes work on a small luminance grid so they tolerate rescaling,
 * re-encoding noise and moderate brightness or contrast changes.
 */
class PerceptualHasher
{
public:
    /**
     * @brief Fingerprint a frame with the hash selected by the mode
     * @param frame 8-bit grayscale, BGR or BGRA image
     * @param mode Hashing profile
     * @throws std::invalid_argument if the frame is empty
     */
    static Fingerprint compute(const cv::Mat &frame, DedupMode mode);

    /**
     * @brief 64-bit difference hash: sign of the horizontal gradient on a 9x8 grid
     */
    static Fingerprint differenceHash(const cv::Mat &gray);

    /**
     * @brief DCT hash: low-frequency block of a grid_size x grid_size DCT against its median
     * @param gray Luminance image
     * @param grid_size Side of the resampled grid, must be even
     * @param block_size Side of the low-frequency block; the hash has block_size^2 bits
     */
    static Fingerprint dctHash(const cv::Mat &gray, int grid_size, int block_size);

    /**
     * @brief 8-bit single-channel luminance version of a frame
     */
    static cv::Mat toLuminance(const cv::Mat &frame);
};
