#include "core/perceptual_hasher.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <opencv2/imgproc.hpp>

void Fingerprint::setBit(int index)
{
    bits[static_cast<size_t>(index / 8)] |= static_cast<uint8_t>(1 << (7 - index % 8));
}

bool Fingerprint::testBit(int index) const
{
    return (bits[static_cast<size_t>(index / 8)] >> (7 - index % 8)) & 1;
}

int Fingerprint::hammingDistance(const Fingerprint &other) const
{
    if (bit_width != other.bit_width || bits.size() != other.bits.size())
    {
        throw std::invalid_argument("Cannot compare fingerprints of width " + std::to_string(bit_width) +
                                    " and " + std::to_string(other.bit_width));
    }

    int distance = 0;
    for (size_t i = 0; i < bits.size(); ++i)
    {
        distance += __builtin_popcount(static_cast<unsigned int>(bits[i] ^ other.bits[i]));
    }
    return distance;
}

double Fingerprint::similarity(const Fingerprint &other) const
{
    if (bit_width == 0)
    {
        return 0.0;
    }
    return 1.0 - static_cast<double>(hammingDistance(other)) / bit_width;
}

std::string Fingerprint::toHex() const
{
    std::stringstream ss;
    for (uint8_t byte : bits)
    {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
    }
    return ss.str();
}

Fingerprint Fingerprint::fromHex(const std::string &hex)
{
    if (hex.size() % 2 != 0)
    {
        throw std::invalid_argument("Fingerprint hex string has odd length");
    }

    Fingerprint fingerprint(static_cast<int>(hex.size() * 4));
    for (size_t i = 0; i < fingerprint.bits.size(); ++i)
    {
        fingerprint.bits[i] = static_cast<uint8_t>(std::stoi(hex.substr(i * 2, 2), nullptr, 16));
    }
    return fingerprint;
}

cv::Mat PerceptualHasher::toLuminance(const cv::Mat &frame)
{
    cv::Mat source = frame;
    if (frame.depth() != CV_8U)
    {
        frame.convertTo(source, CV_MAKETYPE(CV_8U, frame.channels()));
    }

    cv::Mat gray;
    switch (source.channels())
    {
    case 1:
        gray = source;
        break;
    case 3:
        cv::cvtColor(source, gray, cv::COLOR_BGR2GRAY);
        break;
    case 4:
        cv::cvtColor(source, gray, cv::COLOR_BGRA2GRAY);
        break;
    default:
        throw std::invalid_argument("Unsupported channel count: " + std::to_string(source.channels()));
    }
    return gray;
}

Fingerprint PerceptualHasher::compute(const cv::Mat &frame, DedupMode mode)
{
    if (frame.empty())
    {
        throw std::invalid_argument("Cannot fingerprint an empty frame");
    }

    cv::Mat gray = toLuminance(frame);
    switch (mode)
    {
    case DedupMode::FAST:
        return differenceHash(gray);
    case DedupMode::QUALITY:
        return dctHash(gray, 64, 16);
    case DedupMode::BALANCED:
    default:
        return dctHash(gray, 32, 8);
    }
}

Fingerprint PerceptualHasher::differenceHash(const cv::Mat &gray)
{
    // Compare each cell with its right neighbour: 8 rows x 8 comparisons
    cv::Mat resized;
    cv::resize(gray, resized, cv::Size(9, 8), 0, 0, cv::INTER_AREA);

    Fingerprint fingerprint(64);
    int bit = 0;
    for (int y = 0; y < 8; y++)
    {
        for (int x = 0; x < 8; x++)
        {
            if (resized.at<uint8_t>(y, x) > resized.at<uint8_t>(y, x + 1))
            {
                fingerprint.setBit(bit);
            }
            bit++;
        }
    }
    return fingerprint;
}

Fingerprint PerceptualHasher::dctHash(const cv::Mat &gray, int grid_size, int block_size)
{
    if (grid_size % 2 != 0 || block_size > grid_size || (block_size * block_size) % 8 != 0)
    {
        throw std::invalid_argument("Invalid DCT hash geometry " + std::to_string(grid_size) + "/" + std::to_string(block_size));
    }

    cv::Mat resized;
    cv::resize(gray, resized, cv::Size(grid_size, grid_size), 0, 0, cv::INTER_AREA);

    cv::Mat float_image;
    resized.convertTo(float_image, CV_32F);

    cv::Mat dct_image;
    cv::dct(float_image, dct_image);

    cv::Mat low_freq = dct_image(cv::Rect(0, 0, block_size, block_size));

    // Median of the AC coefficients; the DC term only tracks overall brightness
    std::vector<float> ac_values;
    ac_values.reserve(static_cast<size_t>(block_size * block_size - 1));
    for (int y = 0; y < block_size; y++)
    {
        for (int x = 0; x < block_size; x++)
        {
            if (x == 0 && y == 0)
                continue;
            ac_values.push_back(low_freq.at<float>(y, x));
        }
    }
    std::nth_element(ac_values.begin(), ac_values.begin() + ac_values.size() / 2, ac_values.end());
    float median = ac_values[ac_values.size() / 2];

    Fingerprint fingerprint(block_size * block_size);
    int bit = 0;
    for (int y = 0; y < block_size; y++)
    {
        for (int x = 0; x < block_size; x++)
        {
            if (low_freq.at<float>(y, x) > median)
            {
                fingerprint.setBit(bit);
            }
            bit++;
        }
    }
    return fingerprint;
}
