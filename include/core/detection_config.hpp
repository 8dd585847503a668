#pragma once

#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>
#include "core/dedup_modes.hpp"

/**
 * @brief Per-run configuration of the duplicate detection engine
 *
 * Supplied by the caller for every run; nothing here is process-wide.
 */
struct DetectionConfig
{
    double similarity_threshold = 0.95; // T, range (0, 1]
    double sample_rate = 1.0;           // R, frames per second of fingerprinting work, >= 1
    DedupMode dedup_mode = DedupMode::BALANCED;
    int max_threads = 4; // bound on concurrent decode/compare tasks, 1..64
    std::string canonical_policy = "largest_file";

    // Duration pre-filter; off unless the caller opts in
    bool prefilter_enabled = false;
    double duration_tolerance_seconds = 0.0; // 0 means max(1s, 2/R)

    std::string archive_subdir = "duplicates";
    bool write_info_sidecar = true;
    bool dry_run = false;

    std::string log_level = "INFO";
    std::vector<std::string> video_extensions = {"mp4", "avi", "mov", "mkv", "flv", "wmv", "webm", "m4v", "mpg", "mpeg"};

    /**
     * @brief Check every field and describe each problem found
     * @return Empty when the configuration is usable
     */
    std::vector<std::string> validate() const;

    /**
     * @brief Tolerance the duration pre-filter applies when enabled
     */
    double effectiveDurationTolerance() const;

    /**
     * @brief Build a configuration from a YAML document; missing keys keep their defaults
     * @throws YAML::Exception on malformed values
     */
    static DetectionConfig fromYaml(const YAML::Node &node);

    /**
     * @brief Load a configuration file
     * @throws YAML::Exception if the file cannot be read or parsed
     */
    static DetectionConfig fromYamlFile(const std::string &file_path);

    YAML::Node toYaml() const;

    bool saveToFile(const std::string &file_path) const;
};
