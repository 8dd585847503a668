#pragma once

#include <string>

/**
 * @brief Fingerprinting profiles for different speed/robustness trade-offs
 *
 * Every sampled frame is reduced to a fixed-width bit vector. The mode decides
 * which perceptual hash produces it and therefore the fingerprint width.
 */
enum class DedupMode
{
    FAST,     // 64-bit dHash on a 9x8 luminance grid
    BALANCED, // 64-bit pHash from the 8x8 low-frequency DCT block of a 32x32 grid
    QUALITY   // 256-bit pHash from the 16x16 low-frequency DCT block of a 64x64 grid
};

class DedupModes
{
public:
    /**
     * @brief Get the mode name as string
     * @param mode The deduplication mode
     * @return String representation of the mode
     */
    static std::string getModeName(DedupMode mode)
    {
        switch (mode)
        {
        case DedupMode::FAST:
            return "FAST";
        case DedupMode::BALANCED:
            return "BALANCED";
        case DedupMode::QUALITY:
            return "QUALITY";
        default:
            return "UNKNOWN";
        }
    }

    /**
     * @brief Get the name of the perceptual hash used by a mode
     */
    static std::string getAlgorithmName(DedupMode mode)
    {
        switch (mode)
        {
        case DedupMode::FAST:
            return "dHash-64";
        case DedupMode::BALANCED:
            return "pHash-64";
        case DedupMode::QUALITY:
            return "pHash-256";
        default:
            return "unknown";
        }
    }

    /**
     * @brief Width in bits of the fingerprints a mode produces
     */
    static int getHashBits(DedupMode mode)
    {
        return mode == DedupMode::QUALITY ? 256 : 64;
    }

    /**
     * @brief Check whether a string names a mode (case-insensitive for the canonical spellings)
     */
    static bool isValidModeName(const std::string &mode_str)
    {
        return mode_str == "FAST" || mode_str == "fast" ||
               mode_str == "BALANCED" || mode_str == "balanced" ||
               mode_str == "QUALITY" || mode_str == "quality";
    }

    /**
     * @brief Convert string to DedupMode enum
     * @param mode_str String representation of the mode
     * @return DedupMode enum value
     */
    static DedupMode fromString(const std::string &mode_str)
    {
        if (mode_str == "FAST" || mode_str == "fast")
            return DedupMode::FAST;
        else if (mode_str == "BALANCED" || mode_str == "balanced")
            return DedupMode::BALANCED;
        else if (mode_str == "QUALITY" || mode_str == "quality")
            return DedupMode::QUALITY;
        else
            return DedupMode::BALANCED; // Default to balanced
    }
};
