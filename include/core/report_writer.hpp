#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "core/detection_config.hpp"
#include "core/run_context.hpp"

/**
 * @brief Serializes a DetectionReport for callers and for the report file
 */
class ReportWriter
{
public:
    static nlohmann::json toJson(const DetectionReport &report);

    /**
     * @brief Same as toJson(report), with the effective configuration embedded under "config"
     */
    static nlohmann::json toJson(const DetectionReport &report, const DetectionConfig &config);

    /**
     * @brief Write the report as indented JSON
     * @return false if the file could not be written
     */
    static bool writeJsonFile(const nlohmann::json &document, const std::string &file_path);

    /**
     * @brief Human-readable summary lines, logged at the end of a CLI run
     */
    static std::string summary(const DetectionReport &report);
};
