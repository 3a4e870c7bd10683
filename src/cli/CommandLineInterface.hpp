/**
 * @file CommandLineInterface.hpp
 * @brief Command line interface for the checkup export tool
 */

#pragma once

#include "qreport_export.hpp"
#include "SimpleCommandLineParser.hpp"
#include "ConfigurationManager.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace qreport {

/**
 * @brief What the tool was asked to do
 */
enum class CliAction {
    EXPORT,         // Run the export
    ESTIMATE,       // Print the estimate and exit
    CLEANUP,        // Delete old exports and exit
    EXIT            // Help, version or create-config handled; nothing else to do
};

/**
 * @brief Parses arguments and merges them over the configuration file
 *
 * Precedence: command-line flags, then the --config file, then defaults.
 */
class CommandLineInterface {
public:
    CommandLineInterface() = default;

    /**
     * @brief Parse command line arguments
     * @return true if parsing was successful, false on a usage error
     */
    bool parse_arguments(int argc, char* argv[]);

    CliAction action() const { return action_; }
    const ExportOptions& export_options() const { return options_; }
    const std::string& checkup_file() const { return checkup_file_; }
    const std::string& exports_root() const { return exports_root_; }
    std::uint64_t large_export_threshold_bytes() const { return large_export_threshold_bytes_; }
    int cleanup_days() const { return cleanup_days_; }
    const std::string& log_config() const { return log_config_; }
    const std::optional<std::string>& log_file() const { return log_file_; }

    /**
     * @brief Print the effective export configuration
     */
    void print_config() const;

private:
    CliAction action_ = CliAction::EXPORT;
    ExportOptions options_;
    std::string checkup_file_;
    std::string exports_root_ = "exports";
    std::uint64_t large_export_threshold_bytes_ = 100ULL * 1024 * 1024;
    int cleanup_days_ = 30;
    std::string log_config_ = "3";
    std::optional<std::string> log_file_;

    void apply_configuration(const ConfigurationManager& config);
    bool apply_options(const SimpleCommandLineParser& parser);
    bool create_default_config_file(const std::string& filename);
};

} // namespace qreport
