/**
 * @file CommandLineInterface.cpp
 * @brief Command line interface implementation for the checkup export tool
 */

#include "CommandLineInterface.hpp"
#include "version.h"
#include <iostream>
#include <sstream>

namespace qreport {

bool CommandLineInterface::parse_arguments(int argc, char* argv[]) {
    SimpleCommandLineParser parser("qreport-export",
        "Export an industrial inspection checkup as a Word document, a text report,\n"
        "a photo folder, or a combined package of all three.");

    // Input
    parser.add_option("checkup", "i", "Checkup JSON file to export");
    parser.add_option("config", "c", "Path to JSON configuration file");
    parser.add_option("create-config", "", "Write a default configuration file");

    // Export options
    parser.add_option("formats", "f", "Export formats");
    parser.add_option("output-dir", "o", "Exports root directory");
    parser.add_option("naming", "", "Photo naming strategy");
    parser.add_option("quality", "", "Photo quality tier");
    parser.add_option("photo-width", "", "Target photo width in pixels");
    parser.add_option("max-photos", "", "Photos per module in the document");
    parser.add_flag("no-photos", "", "Leave photos out of the document");
    parser.add_flag("no-notes", "", "Leave item notes out of the reports");
    parser.add_flag("no-photo-index", "", "Do not write the photo index");
    parser.add_flag("no-timestamp", "", "Export directory without date prefix");
    parser.add_flag("manifest", "", "Write export_manifest.json");
    parser.add_flag("estimate-only", "", "Print the size/time estimate and exit");

    // Maintenance
    parser.add_option("cleanup-days", "", "Delete exports older than N days");

    // Logging
    parser.add_option("log-level", "l", "Log level or facility configuration");
    parser.add_option("log-file", "", "Append log output to a file");
    parser.add_flag("quiet", "q", "Errors only");
    parser.add_flag("version", "", "Show version information");

    if (!parser.parse(argc, argv)) {
        if (parser.help_requested()) {
            action_ = CliAction::EXIT;
            return true;
        }
        return false;
    }

    if (parser.get_flag("version")) {
        std::cout << "qreport-export v" << QREPORT_VERSION_STRING << std::endl;
        std::cout << "Checkup report export: DOCX, text, photo folder and combined package" << std::endl;
        std::cout << "Built with GDAL and nlohmann::json" << std::endl;
        std::cout << "Copyright (c) 2026 The QReport Authors" << std::endl;
        action_ = CliAction::EXIT;
        return true;
    }

    if (auto config_path = parser.get("create-config")) {
        if (!create_default_config_file(config_path.value())) {
            std::cerr << "Error: Could not write configuration file: " << config_path.value() << std::endl;
            return false;
        }
        std::cout << "Created default configuration file: " << config_path.value() << std::endl;
        action_ = CliAction::EXIT;
        return true;
    }

    ConfigurationManager config = ConfigurationManager::defaults();
    if (auto config_file = parser.get("config")) {
        if (!config.load_from_file(config_file.value())) {
            std::cerr << "Failed to load configuration file: " << config_file.value() << std::endl;
            return false;
        }
    }
    apply_configuration(config);

    if (!apply_options(parser)) {
        return false;
    }

    if (parser.get("cleanup-days")) {
        action_ = CliAction::CLEANUP;
        return true;
    }

    if (auto checkup = parser.get("checkup")) {
        checkup_file_ = checkup.value();
    } else if (!parser.get_positional().empty()) {
        checkup_file_ = parser.get_positional().front();
    } else {
        std::cerr << "Error: No checkup file given (use --checkup FILE, or --help)" << std::endl;
        return false;
    }

    action_ = parser.get_flag("estimate-only") ? CliAction::ESTIMATE : CliAction::EXPORT;
    return true;
}

void CommandLineInterface::apply_configuration(const ConfigurationManager& config) {
    options_ = config.to_export_options();
    exports_root_ = config.exports_root();
    large_export_threshold_bytes_ =
        static_cast<std::uint64_t>(config.get_int("large_export_threshold_mb", 100)) * 1024 * 1024;
    cleanup_days_ = config.get_int("cleanup_older_than_days", cleanup_days_);
    log_config_ = config.get_string("log_level", log_config_);
}

bool CommandLineInterface::apply_options(const SimpleCommandLineParser& parser) {
    if (auto formats = parser.get("formats")) {
        std::vector<std::string> unknown;
        options_.formats = ConfigurationManager::parse_formats(formats.value(), &unknown);
        for (const auto& token : unknown) {
            std::cerr << "Error: Unknown export format '" << token << "'" << std::endl;
            std::cerr << "Supported formats: document, text, photos, combined" << std::endl;
        }
        if (!unknown.empty()) {
            return false;
        }
    }

    if (auto naming = parser.get("naming")) {
        auto strategy = parse_naming_strategy(naming.value());
        if (!strategy) {
            std::cerr << "Error: Unknown naming strategy '" << naming.value()
                      << "' (structured, sequential, timestamp)" << std::endl;
            return false;
        }
        options_.naming_strategy = *strategy;
    }

    if (auto quality = parser.get("quality")) {
        auto tier = parse_photo_quality(quality.value());
        if (!tier) {
            std::cerr << "Error: Unknown photo quality '" << quality.value()
                      << "' (original, optimized, compressed)" << std::endl;
            return false;
        }
        options_.photo_quality = *tier;
    }

    if (parser.get("photo-width")) {
        auto width = parser.get_as<int>("photo-width");
        if (!width || *width <= 0) {
            std::cerr << "Error: --photo-width must be a positive number" << std::endl;
            return false;
        }
        options_.photo_max_width = *width;
    }

    if (parser.get("max-photos")) {
        auto max_photos = parser.get_as<int>("max-photos");
        if (!max_photos || *max_photos < 0) {
            std::cerr << "Error: --max-photos must be zero or more" << std::endl;
            return false;
        }
        options_.max_photos_per_module = *max_photos;
    }

    if (parser.get("cleanup-days")) {
        auto days = parser.get_as<int>("cleanup-days");
        if (!days || *days < 0) {
            std::cerr << "Error: --cleanup-days must be zero or more" << std::endl;
            return false;
        }
        cleanup_days_ = *days;
    }

    if (parser.get_flag("no-photos")) options_.include_photos = false;
    if (parser.get_flag("no-notes")) options_.include_notes = false;
    if (parser.get_flag("no-photo-index")) options_.generate_photo_index = false;
    if (parser.get_flag("no-timestamp")) options_.create_timestamped_directory = false;
    if (parser.get_flag("manifest")) options_.write_manifest = true;

    if (auto output_dir = parser.get("output-dir")) {
        exports_root_ = output_dir.value();
    }

    if (auto log_level = parser.get("log-level")) {
        log_config_ = log_level.value();
    }
    if (parser.get_flag("quiet")) {
        log_config_ = "1";
    }
    if (auto log_file = parser.get("log-file")) {
        log_file_ = log_file.value();
    }

    return true;
}

bool CommandLineInterface::create_default_config_file(const std::string& filename) {
    return ConfigurationManager::defaults().save_to_file(filename);
}

void CommandLineInterface::print_config() const {
    std::cout << "\n=== Export Configuration ===\n";
    std::cout << "Checkup file: " << checkup_file_ << "\n";
    std::cout << "Exports root: " << exports_root_ << "\n";
    std::cout << "Formats: " << ConfigurationManager::join_formats(options_.formats) << "\n";
    std::cout << "Photo naming: " << to_string(options_.naming_strategy) << "\n";
    std::cout << "Photo quality: " << to_string(options_.photo_quality)
              << " (max width " << options_.photo_max_width << "px)\n";
    std::cout << "Photos in document: " << (options_.include_photos ? "yes" : "no")
              << ", max " << options_.max_photos_per_module << " per module\n";
    std::cout << "Notes: " << (options_.include_notes ? "yes" : "no") << "\n";
    std::cout << "Photo index: " << (options_.generate_photo_index ? "yes" : "no") << "\n";
    std::cout << "Timestamped directory: " << (options_.create_timestamped_directory ? "yes" : "no") << "\n";
    std::cout << "Manifest: " << (options_.write_manifest ? "yes" : "no") << "\n";
    std::cout << "============================\n\n";
}

} // namespace qreport
