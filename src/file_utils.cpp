#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <stdexcept>

namespace
{
    bool isSameOrInside(const fs::path &candidate, const fs::path &dir)
    {
        if (dir.empty())
            return false;
        std::error_code ec;
        fs::path a = fs::weakly_canonical(candidate, ec);
        if (ec)
            return false;
        fs::path b = fs::weakly_canonical(dir, ec);
        if (ec)
            return false;
        auto mismatch = std::mismatch(b.begin(), b.end(), a.begin(), a.end());
        return mismatch.first == b.end();
    }

    std::time_t toTimeT(fs::file_time_type file_time)
    {
        auto system_time = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
            file_time - fs::file_time_type::clock::now() + std::chrono::system_clock::now());
        return std::chrono::system_clock::to_time_t(system_time);
    }
}

bool FileUtils::isValidDirectory(const std::string &path)
{
    try
    {
        fs::path dir_path(path);
        return fs::exists(dir_path) && fs::is_directory(dir_path);
    }
    catch (const std::exception &e)
    {
        return false;
    }
}

std::string FileUtils::getFileExtension(const std::string &file_path)
{
    std::string extension = fs::path(file_path).extension().string();
    if (extension.empty())
        return "";
    extension = extension.substr(1);
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char c)
                   { return static_cast<char>(std::tolower(c)); });
    return extension;
}

bool FileUtils::isVideoFile(const std::string &file_path, const std::vector<std::string> &extensions)
{
    std::string extension = getFileExtension(file_path);
    if (extension.empty())
        return false;
    return std::find(extensions.begin(), extensions.end(), extension) != extensions.end();
}

void FileUtils::scanDirectoryRecursively(const std::string &dir_path,
                                         std::function<void(const std::string &)> onNext,
                                         const std::string &skip_dir)
{
    std::function<void(const fs::path &)> scanDirectory = [&](const fs::path &current_path)
    {
        try
        {
            for (const auto &entry : fs::directory_iterator(current_path))
            {
                try
                {
                    if (entry.is_regular_file())
                    {
                        onNext(entry.path().string());
                    }
                    else if (entry.is_directory())
                    {
                        if (!skip_dir.empty() && isSameOrInside(entry.path(), skip_dir))
                        {
                            Logger::debug("Skipping directory: " + entry.path().string());
                            continue;
                        }
                        scanDirectory(entry.path());
                    }
                }
                catch (const fs::filesystem_error &e)
                {
                    Logger::warn("Skipping entry due to permission error: " + entry.path().string() + " - " + e.what());
                    continue;
                }
            }
        }
        catch (const fs::filesystem_error &e)
        {
            Logger::warn("Error accessing directory " + current_path.string() + ": " + e.what());
        }
    };
    scanDirectory(fs::path(dir_path));
}

std::vector<VideoAsset> FileUtils::discoverVideoAssets(const std::string &dir_path, bool recursive,
                                                       const std::vector<std::string> &extensions,
                                                       const std::string &skip_dir)
{
    if (!isValidDirectory(dir_path))
    {
        throw std::runtime_error("Invalid directory path: " + dir_path);
    }

    std::vector<std::string> paths;
    auto collect = [&](const std::string &path)
    {
        if (isVideoFile(path, extensions))
        {
            paths.push_back(path);
        }
    };

    if (recursive)
    {
        scanDirectoryRecursively(dir_path, collect, skip_dir);
    }
    else
    {
        try
        {
            for (const auto &entry : fs::directory_iterator(dir_path))
            {
                if (entry.is_regular_file())
                {
                    collect(entry.path().string());
                }
            }
        }
        catch (const fs::filesystem_error &e)
        {
            Logger::warn("Error listing files in directory " + dir_path + ": " + e.what());
        }
    }

    std::sort(paths.begin(), paths.end());

    std::vector<VideoAsset> assets;
    assets.reserve(paths.size());
    for (const auto &path : paths)
    {
        std::error_code ec;
        uintmax_t size = fs::file_size(path, ec);
        if (ec)
        {
            Logger::warn("Skipping unreadable file " + path + ": " + ec.message());
            continue;
        }
        std::time_t mtime = 0;
        fs::file_time_type write_time = fs::last_write_time(path, ec);
        if (!ec)
        {
            mtime = toTimeT(write_time);
        }

        std::string id = fs::path(path).lexically_relative(dir_path).generic_string();
        if (id.empty())
        {
            id = path;
        }
        assets.emplace_back(id, path, static_cast<uint64_t>(size), getFileExtension(path), assets.size(), mtime);
    }

    Logger::info("Found " + std::to_string(assets.size()) + " video files in " + dir_path);
    return assets;
}
