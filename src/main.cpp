#include "core/detection_config.hpp"
#include "core/duplicate_detection_engine.hpp"
#include "core/file_utils.hpp"
#include "core/report_writer.hpp"
#include "logging/logger.hpp"
#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>

namespace
{
    const int EXIT_OK = 0;
    const int EXIT_INCOMPLETE = 1;
    const int EXIT_USAGE = 2;

    void printUsage(const char *program)
    {
        std::cout << "Video Dedup - near-duplicate video detection" << std::endl;
        std::cout << "Usage: " << program << " --input_dir DIR --output_dir DIR [options]" << std::endl;
        std::cout << "Options:" << std::endl;
        std::cout << "  --input_dir DIR     Directory containing the videos to check" << std::endl;
        std::cout << "  --output_dir DIR    Directory receiving duplicates/, the log and report.json" << std::endl;
        std::cout << "  --threshold T       Similarity threshold in (0, 1] (default 0.95)" << std::endl;
        std::cout << "  --sample_rate R     Frames sampled per second, >= 1 (default 1)" << std::endl;
        std::cout << "  --mode M            FAST, BALANCED or QUALITY (default BALANCED)" << std::endl;
        std::cout << "  --threads N         Maximum worker threads, 1..64 (default 4)" << std::endl;
        std::cout << "  --policy P          largest_file, oldest_file or earliest_discovered" << std::endl;
        std::cout << "  --config FILE       YAML configuration; command line options override it" << std::endl;
        std::cout << "  --dry-run           Report what would be archived without moving files" << std::endl;
        std::cout << "  --no-recursive      Do not descend into subdirectories of the input" << std::endl;
        std::cout << "  --log-level L       TRACE, DEBUG, INFO, WARN or ERROR" << std::endl;
        std::cout << "  --help, -h          Show this help message" << std::endl;
    }

    struct CommandLine
    {
        std::string input_dir;
        std::string output_dir;
        std::string config_file;
        bool recursive = true;
        bool show_help = false;

        // Overrides applied on top of the configuration file
        std::string threshold;
        std::string sample_rate;
        std::string mode;
        std::string threads;
        std::string policy;
        std::string log_level;
        bool dry_run = false;
    };

    bool parseCommandLine(int argc, char *argv[], CommandLine &cmd, std::string &error)
    {
        for (int i = 1; i < argc; i++)
        {
            std::string arg = argv[i];
            if (arg == "--help" || arg == "-h")
            {
                cmd.show_help = true;
                return true;
            }
            if (arg == "--dry-run")
            {
                cmd.dry_run = true;
                continue;
            }
            if (arg == "--no-recursive")
            {
                cmd.recursive = false;
                continue;
            }

            std::string *target = nullptr;
            if (arg == "--input_dir")
                target = &cmd.input_dir;
            else if (arg == "--output_dir")
                target = &cmd.output_dir;
            else if (arg == "--threshold")
                target = &cmd.threshold;
            else if (arg == "--sample_rate")
                target = &cmd.sample_rate;
            else if (arg == "--mode")
                target = &cmd.mode;
            else if (arg == "--threads")
                target = &cmd.threads;
            else if (arg == "--policy")
                target = &cmd.policy;
            else if (arg == "--config")
                target = &cmd.config_file;
            else if (arg == "--log-level")
                target = &cmd.log_level;

            if (!target)
            {
                error = "Unknown option: " + arg;
                return false;
            }
            if (i + 1 >= argc)
            {
                error = "Missing value for " + arg;
                return false;
            }
            *target = argv[++i];
        }

        if (cmd.input_dir.empty() || cmd.output_dir.empty())
        {
            error = "--input_dir and --output_dir are required";
            return false;
        }
        return true;
    }

    bool parseNumber(const std::string &text, double &value)
    {
        try
        {
            size_t consumed = 0;
            value = std::stod(text, &consumed);
            return consumed == text.size();
        }
        catch (const std::exception &)
        {
            return false;
        }
    }

    bool applyOverrides(const CommandLine &cmd, DetectionConfig &config, std::string &error)
    {
        double number = 0.0;
        if (!cmd.threshold.empty())
        {
            if (!parseNumber(cmd.threshold, number))
            {
                error = "Invalid threshold: " + cmd.threshold;
                return false;
            }
            config.similarity_threshold = number;
        }
        if (!cmd.sample_rate.empty())
        {
            if (!parseNumber(cmd.sample_rate, number))
            {
                error = "Invalid sample rate: " + cmd.sample_rate;
                return false;
            }
            config.sample_rate = number;
        }
        if (!cmd.threads.empty())
        {
            if (!parseNumber(cmd.threads, number) || number != static_cast<int>(number))
            {
                error = "Invalid thread count: " + cmd.threads;
                return false;
            }
            config.max_threads = static_cast<int>(number);
        }
        if (!cmd.mode.empty())
        {
            if (!DedupModes::isValidModeName(cmd.mode))
            {
                error = "Invalid mode: " + cmd.mode;
                return false;
            }
            config.dedup_mode = DedupModes::fromString(cmd.mode);
        }
        if (!cmd.policy.empty())
            config.canonical_policy = cmd.policy;
        if (!cmd.log_level.empty())
            config.log_level = cmd.log_level;
        if (cmd.dry_run)
            config.dry_run = true;
        return true;
    }
}

int main(int argc, char *argv[])
{
    CommandLine cmd;
    std::string error;
    if (!parseCommandLine(argc, argv, cmd, error))
    {
        std::cerr << "Error: " << error << std::endl;
        std::cerr << "Use --help or -h for more options." << std::endl;
        return EXIT_USAGE;
    }
    if (cmd.show_help)
    {
        printUsage(argv[0]);
        return EXIT_OK;
    }

    DetectionConfig config;
    if (!cmd.config_file.empty())
    {
        try
        {
            config = DetectionConfig::fromYamlFile(cmd.config_file);
        }
        catch (const std::exception &e)
        {
            std::cerr << "Error: could not load configuration " << cmd.config_file << ": " << e.what() << std::endl;
            return EXIT_USAGE;
        }
    }
    if (!applyOverrides(cmd, config, error))
    {
        std::cerr << "Error: " << error << std::endl;
        return EXIT_USAGE;
    }

    Logger::init(config.log_level);

    if (!FileUtils::isValidDirectory(cmd.input_dir))
    {
        Logger::error("Input directory does not exist: " + cmd.input_dir);
        return EXIT_USAGE;
    }

    std::error_code ec;
    std::filesystem::create_directories(cmd.output_dir, ec);
    if (ec)
    {
        Logger::error("Could not create output directory " + cmd.output_dir + ": " + ec.message());
        return EXIT_USAGE;
    }

    std::string log_file = (std::filesystem::path(cmd.output_dir) /
                            ("duplicate_detection_" +
                             RunContext::formatTimestamp(std::chrono::system_clock::now(), "%Y%m%d_%H%M%S") + ".log"))
                               .string();
    Logger::addFileSink(log_file);

    try
    {
        DuplicateDetectionEngine engine(config);

        std::string archive_dir = (std::filesystem::path(cmd.output_dir) / config.archive_subdir).string();
        std::vector<VideoAsset> assets =
            FileUtils::discoverVideoAssets(cmd.input_dir, cmd.recursive, config.video_extensions, archive_dir);
        if (assets.empty())
        {
            Logger::warn("No video files found in " + cmd.input_dir);
        }

        DetectionReport report = engine.run(assets, cmd.output_dir);

        std::string report_file = (std::filesystem::path(cmd.output_dir) / "report.json").string();
        if (!ReportWriter::writeJsonFile(ReportWriter::toJson(report, config), report_file))
        {
            Logger::warn("Report file could not be written; summary follows");
        }
        Logger::info(ReportWriter::summary(report));

        return report.status() == RunStatus::INCOMPLETE ? EXIT_INCOMPLETE : EXIT_OK;
    }
    catch (const ConfigError &e)
    {
        Logger::error(std::string("Configuration error: ") + e.what());
        return EXIT_USAGE;
    }
    catch (const std::exception &e)
    {
        Logger::error(std::string("Fatal error: ") + e.what());
        return EXIT_USAGE;
    }
}
