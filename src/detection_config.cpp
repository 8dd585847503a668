#include "core/detection_config.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>

namespace
{
    const std::vector<std::string> kCanonicalPolicies = {"largest_file", "oldest_file", "earliest_discovered"};

    // Present keys must convert; YAML::BadConversion otherwise
    template <typename T>
    void readKey(const YAML::Node &node, const char *key, T &value)
    {
        if (node[key])
        {
            value = node[key].as<T>();
        }
    }
}

std::vector<std::string> DetectionConfig::validate() const
{
    std::vector<std::string> problems;

    if (!std::isfinite(similarity_threshold) || !(similarity_threshold > 0.0 && similarity_threshold <= 1.0))
    {
        problems.push_back("similarity_threshold must be in (0, 1], got " + std::to_string(similarity_threshold));
    }
    if (!std::isfinite(sample_rate) || !(sample_rate >= 1.0))
    {
        problems.push_back("sample_rate must be >= 1 frame per second, got " + std::to_string(sample_rate));
    }
    if (max_threads < 1 || max_threads > 64)
    {
        problems.push_back("max_threads must be in [1-64], got " + std::to_string(max_threads));
    }
    if (std::find(kCanonicalPolicies.begin(), kCanonicalPolicies.end(), canonical_policy) == kCanonicalPolicies.end())
    {
        problems.push_back("Unknown canonical_policy: " + canonical_policy);
    }
    if (!std::isfinite(duration_tolerance_seconds) || duration_tolerance_seconds < 0.0)
    {
        problems.push_back("duration_tolerance_seconds must be a finite, non-negative number");
    }
    if (archive_subdir.empty() || archive_subdir.front() == '/' || archive_subdir.find("..") != std::string::npos)
    {
        problems.push_back("archive_subdir must stay under the archive root: " + archive_subdir);
    }
    if (!Logger::isValidLevel(log_level))
    {
        problems.push_back("Invalid log level: " + log_level);
    }
    if (video_extensions.empty())
    {
        problems.push_back("At least one video extension must be enabled");
    }

    return problems;
}

double DetectionConfig::effectiveDurationTolerance() const
{
    if (duration_tolerance_seconds > 0.0)
        return duration_tolerance_seconds;
    double two_samples = sample_rate > 0.0 ? 2.0 / sample_rate : 2.0;
    return std::max(1.0, two_samples);
}

DetectionConfig DetectionConfig::fromYaml(const YAML::Node &node)
{
    DetectionConfig config;
    if (!node || !node.IsMap())
    {
        return config;
    }

    readKey(node, "similarity_threshold", config.similarity_threshold);
    readKey(node, "sample_rate", config.sample_rate);
    if (node["dedup_mode"])
    {
        std::string mode = node["dedup_mode"].as<std::string>();
        if (!DedupModes::isValidModeName(mode))
        {
            Logger::warn("Invalid dedup mode: " + mode + ", using BALANCED");
        }
        config.dedup_mode = DedupModes::fromString(mode);
    }
    readKey(node, "log_level", config.log_level);

    if (const YAML::Node threading = node["threading"])
    {
        readKey(threading, "max_processing_threads", config.max_threads);
    }

    if (const YAML::Node resolution = node["resolution"])
    {
        readKey(resolution, "canonical_policy", config.canonical_policy);
    }

    if (const YAML::Node prefilter = node["prefilter"])
    {
        readKey(prefilter, "enabled", config.prefilter_enabled);
        readKey(prefilter, "duration_tolerance_seconds", config.duration_tolerance_seconds);
    }

    if (const YAML::Node archive = node["archive"])
    {
        readKey(archive, "subdir", config.archive_subdir);
        readKey(archive, "write_info_sidecar", config.write_info_sidecar);
        readKey(archive, "dry_run", config.dry_run);
    }

    if (node["categories"] && node["categories"]["video"])
    {
        std::vector<std::string> exts;
        for (const auto &file_type : node["categories"]["video"])
        {
            if (file_type.second.as<bool>())
            {
                std::string ext = file_type.first.as<std::string>();
                std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);
                exts.push_back(ext);
            }
        }
        config.video_extensions = exts;
    }

    return config;
}

DetectionConfig DetectionConfig::fromYamlFile(const std::string &file_path)
{
    YAML::Node node = YAML::LoadFile(file_path);
    Logger::info("Configuration loaded from: " + file_path);
    return fromYaml(node);
}

YAML::Node DetectionConfig::toYaml() const
{
    YAML::Node node;
    node["similarity_threshold"] = similarity_threshold;
    node["sample_rate"] = sample_rate;
    node["dedup_mode"] = DedupModes::getModeName(dedup_mode);
    node["log_level"] = log_level;
    node["threading"]["max_processing_threads"] = max_threads;
    node["resolution"]["canonical_policy"] = canonical_policy;
    node["prefilter"]["enabled"] = prefilter_enabled;
    node["prefilter"]["duration_tolerance_seconds"] = duration_tolerance_seconds;
    node["archive"]["subdir"] = archive_subdir;
    node["archive"]["write_info_sidecar"] = write_info_sidecar;
    node["archive"]["dry_run"] = dry_run;
    for (const auto &ext : video_extensions)
    {
        node["categories"]["video"][ext] = true;
    }
    return node;
}

bool DetectionConfig::saveToFile(const std::string &file_path) const
{
    try
    {
        std::ofstream file(file_path);
        if (!file.is_open())
        {
            Logger::error("Could not open config file for writing: " + file_path);
            return false;
        }
        file << toYaml();
        Logger::info("Configuration saved to: " + file_path);
        return true;
    }
    catch (const std::exception &e)
    {
        Logger::error("Error saving config: " + std::string(e.what()));
        return false;
    }
}
