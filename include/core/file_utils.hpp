#pragma once

#include <filesystem>
#include <functional>
#include <string>
#include <vector>
#include "core/video_asset.hpp"

namespace fs = std::filesystem;

/**
 * @brief File utilities used to turn a directory into a list of video assets
 */
class FileUtils
{
public:
    /**
     * @brief Enumerate the video files below dir_path as assets
     *
     * Assets come back sorted by path; discovery_index follows that order and
     * the id is the path relative to dir_path.
     *
     * @param dir_path Directory to scan
     * @param recursive Whether to descend into subdirectories
     * @param extensions Lower-case extensions without the dot
     * @param skip_dir Directory excluded from the scan (typically the archive), may be empty
     * @throws std::runtime_error if dir_path is not a directory
     */
    static std::vector<VideoAsset> discoverVideoAssets(const std::string &dir_path, bool recursive,
                                                       const std::vector<std::string> &extensions,
                                                       const std::string &skip_dir = "");

    /**
     * Scans a directory recursively and calls the provided function for each file
     * @param dir_path Directory path to scan
     * @param onNext Function to call for each file found
     * @param skip_dir Directory whose contents are not reported, may be empty
     */
    static void scanDirectoryRecursively(const std::string &dir_path, std::function<void(const std::string &)> onNext,
                                         const std::string &skip_dir = "");

    /**
     * Validates if a path is a valid directory
     * @param path Path to validate
     * @return true if path is a valid directory, false otherwise
     */
    static bool isValidDirectory(const std::string &path);

    /**
     * @brief Lower-case extension without the leading dot, "" if there is none
     */
    static std::string getFileExtension(const std::string &file_path);

    static bool isVideoFile(const std::string &file_path, const std::vector<std::string> &extensions);
};
