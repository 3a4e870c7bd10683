/**
 * @file main.cpp
 * @brief Main entry point for the checkup export tool
 *
 * Loads a stored checkup, maps it to a snapshot and exports it in the
 * requested formats, printing progress as each stage completes.
 *
 * Copyright (c) 2026 The QReport Authors
 * Portions copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "qreport_export.hpp"
#include "TextFormatter.hpp"
#include "core/ExportMaintenance.hpp"
#include "core/Logger.hpp"
#include "core/SnapshotMapper.hpp"
#include "cli/CheckupFileLoader.hpp"
#include "cli/CommandLineInterface.hpp"
#include "cli/ExportOrchestrator.hpp"
#include <iostream>
#include <set>

using namespace qreport;

/**
 * @brief Print the size/time estimate
 */
void print_estimate(const EstimationReport& report) {
    std::cout << "\n=== Export Estimate ===\n";
    for (const auto& [format, estimation] : report.formats) {
        std::cout << to_string(format) << ": "
                  << TextFormatter::format_file_size(estimation.size_bytes) << ", "
                  << estimation.file_count << " file(s), ~"
                  << TextFormatter::format_duration(std::chrono::milliseconds(estimation.time_ms)) << "\n";
    }
    std::cout << "Total: " << TextFormatter::format_file_size(report.total_size_bytes) << ", ~"
              << TextFormatter::format_duration(std::chrono::milliseconds(report.total_time_ms)) << "\n";
    for (const auto& warning : report.warnings) {
        std::cout << "Warning: " << warning << "\n";
    }
    std::cout << "=======================\n";
}

/**
 * @brief Print each artifact once, as the progress snapshots report it
 */
class ProgressPrinter {
public:
    void operator()(const MultiFormatExportResult& progress) {
        for (auto format : {ExportFormat::DOCUMENT, ExportFormat::TEXT,
                            ExportFormat::PHOTO_FOLDER, ExportFormat::COMBINED_PACKAGE}) {
            if (reported_.count(format)) continue;

            if (const auto& artifact = progress.artifact_for(format)) {
                std::cout << "  [done]   " << to_string(format) << ": " << artifact->name
                          << " (" << TextFormatter::format_file_size(artifact->size_bytes) << ")\n";
                reported_.insert(format);
            } else if (auto error = progress.format_errors.find(format); error != progress.format_errors.end()) {
                std::cout << "  [failed] " << to_string(format) << ": " << error->second << "\n";
                reported_.insert(format);
            }
        }
    }

private:
    std::set<ExportFormat> reported_;
};

/**
 * @brief Print the final result
 */
void print_result(const MultiFormatExportResult& result) {
    std::cout << "\n=== Export Result ===\n";
    std::cout << "Outcome: " << to_string(result.outcome) << "\n";
    for (const auto& message : result.validation_messages) {
        std::cout << "  - " << message << "\n";
    }
    if (!result.export_directory.empty()) {
        std::cout << "Directory: " << result.export_directory << "\n";
    }
    const auto& stats = result.statistics;
    std::cout << "Modules: " << stats.sections_processed
              << ", checks: " << stats.check_items_processed
              << ", photos exported: " << stats.photos_exported << "/" << stats.photos_processed
              << ", spare parts: " << stats.spare_parts_included << "\n";
    std::cout << "Size: " << TextFormatter::format_file_size(stats.data_processed_bytes)
              << " in " << stats.processing_time_formatted() << "\n";
    std::cout << "=====================\n";
}

int exit_code_for(ExportOutcome outcome) {
    switch (outcome) {
        case ExportOutcome::SUCCESS: return 0;
        case ExportOutcome::PARTIAL: return 2;
        case ExportOutcome::CANCELLED: return 3;
        case ExportOutcome::VALIDATION_FAILED:
        case ExportOutcome::INSUFFICIENT_STORAGE: return 1;
    }
    return 1;
}

/**
 * @brief Main entry point
 */
int main(int argc, char* argv[]) {
    try {
        CommandLineInterface cli;
        if (!cli.parse_arguments(argc, argv)) {
            return 1;
        }
        if (cli.action() == CliAction::EXIT) {
            return 0;
        }

        Logger::parseLogConfig(cli.log_config());
        if (cli.log_file()) {
            Logger::setGlobalLogFile(cli.log_file());
        }
        Logger logger("main");

        if (cli.action() == CliAction::CLEANUP) {
            ExportMaintenance maintenance;
            int removed = maintenance.cleanup_old_exports(cli.exports_root(), cli.cleanup_days());
            removed += maintenance.cleanup_temporary_exports(cli.exports_root());
            std::cout << "Removed " << removed << " export(s) from " << cli.exports_root() << "\n";
            return 0;
        }

        CheckupFileLoader loader;
        CheckupSnapshot snapshot = SnapshotMapper::from_records(loader.load(cli.checkup_file()));

        ExportOrchestrator::Options orchestrator_options;
        orchestrator_options.exports_root = cli.exports_root();
        orchestrator_options.large_export_threshold_bytes = cli.large_export_threshold_bytes();
        ExportOrchestrator orchestrator(orchestrator_options);

        const bool verbose = Logger::getFacilityLevel("main") >= LogLevel::INFO;
        if (verbose) {
            std::cout << "QReport checkup export\n";
            cli.print_config();
        }

        if (cli.action() == CliAction::ESTIMATE) {
            print_estimate(orchestrator.estimate(snapshot, cli.export_options()));
            return 0;
        }

        std::cout << "Exporting checkup " << snapshot.checkup_id << " ("
                  << snapshot.header.client_company << ")...\n";

        ProgressPrinter printer;
        MultiFormatExportResult result = orchestrator.export_checkup(
            snapshot, cli.export_options(),
            [&printer](const MultiFormatExportResult& progress) { printer(progress); });

        print_result(result);
        logger.flush();
        return exit_code_for(result.outcome);

    } catch (const CheckupFileError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
