/**
 * @file ExportOrchestrator.cpp
 * @brief Implementation of export orchestration
 *
 * Copyright (c) 2026 The QReport Authors
 * Portions copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "ExportOrchestrator.hpp"
#include "TextFormatter.hpp"
#include "../core/ExportMaintenance.hpp"
#include "../core/ExportTracker.hpp"
#include "../export/ExportNaming.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>

namespace qreport {

namespace fs = std::filesystem;
using json = nlohmann::json;

ExportOrchestrator::ExportOrchestrator()
    : ExportOrchestrator(Options()) {
}

ExportOrchestrator::ExportOrchestrator(const Options& options)
    : ExportOrchestrator(options, create_format_generators()) {
}

ExportOrchestrator::ExportOrchestrator(const Options& options, FormatGeneratorMap generators)
    : options_(options),
      generators_(std::move(generators)),
      estimator_(estimator_options(options)),
      logger_("ExportOrchestrator") {
    logger_.detailed("Export orchestrator initialized, exports root: " + options_.exports_root);
}

ExportOrchestrator::~ExportOrchestrator() = default;

SizeTimeEstimator::Options ExportOrchestrator::estimator_options(const Options& options) {
    SizeTimeEstimator::Options estimator;
    estimator.large_export_threshold_bytes = options.large_export_threshold_bytes;
    return estimator;
}

std::vector<ExportFormat> ExportOrchestrator::ordered_formats(const ExportOptions& options) {
    std::vector<ExportFormat> ordered;
    for (auto format : {ExportFormat::DOCUMENT, ExportFormat::TEXT,
                        ExportFormat::PHOTO_FOLDER, ExportFormat::COMBINED_PACKAGE}) {
        if (options.requests(format)) {
            ordered.push_back(format);
        }
    }
    return ordered;
}

EstimationReport ExportOrchestrator::estimate(const CheckupSnapshot& snapshot, const ExportOptions& options) const {
    return estimator_.estimate(snapshot, options);
}

void ExportOrchestrator::calculate_statistics(const CheckupSnapshot& snapshot, MultiFormatExportResult& result) {
    auto& stats = result.statistics;
    stats.sections_processed = static_cast<int>(snapshot.modules.size());
    stats.check_items_processed = snapshot.total_item_count();
    stats.photos_processed = snapshot.total_photo_count();
    stats.spare_parts_included = static_cast<int>(snapshot.spare_parts.size());
    stats.data_processed_bytes = result.total_size_bytes();

    stats.photos_exported = 0;
    if (result.photo_folder) {
        stats.photos_exported = result.photo_folder->file_count;
    } else if (result.combined_package && !result.export_directory.empty()) {
        // Count the JPEGs the package put into its FOTO folder
        const fs::path folder = fs::path(result.export_directory) / PhotoExportManager::PHOTO_FOLDER_NAME;
        std::error_code ec;
        for (fs::directory_iterator it(folder, ec), end; !ec && it != end; it.increment(ec)) {
            if (it->path().extension() == ".jpg") ++stats.photos_exported;
        }
    }
}

std::string ExportOrchestrator::build_manifest(const CheckupSnapshot& snapshot,
                                               const MultiFormatExportResult& result) {
    json manifest;
    manifest["checkupId"] = snapshot.checkup_id;
    manifest["createdAt"] = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    json formats = json::array();
    for (auto format : {ExportFormat::DOCUMENT, ExportFormat::TEXT,
                        ExportFormat::PHOTO_FOLDER, ExportFormat::COMBINED_PACKAGE}) {
        if (result.artifact_for(format)) {
            formats.push_back(to_string(format));
        }
    }
    manifest["formats"] = formats;

    manifest["sizeBytes"] = result.total_size_bytes();
    manifest["fileCount"] = result.export_directory.empty()
                                ? 0 : ExportMaintenance::file_count(result.export_directory);
    manifest["hasPhotos"] = result.statistics.photos_exported > 0;

    std::string status = "COMPLETED";
    if (result.outcome == ExportOutcome::CANCELLED) {
        status = "CANCELLED";
    } else if (result.outcome != ExportOutcome::SUCCESS) {
        status = "PARTIAL";
    }
    manifest["status"] = status;

    return manifest.dump(2);
}

void ExportOrchestrator::write_manifest(const CheckupSnapshot& snapshot,
                                        const MultiFormatExportResult& result) const {
    const fs::path path = fs::path(result.export_directory) / MANIFEST_FILE_NAME;
    try {
        const std::string content = build_manifest(snapshot, result);
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << content;
        out.close();
        if (!out) {
            logger_.warning("Failed to write " + path.string());
            return;
        }
        logger_.detailed("Manifest written: " + path.string());
    } catch (const json::exception& e) {
        logger_.warning("Manifest not written: " + std::string(e.what()));
    }
}

MultiFormatExportResult ExportOrchestrator::export_checkup(const CheckupSnapshot& snapshot,
                                                           const ExportOptions& options,
                                                           const ProgressCallback& on_progress,
                                                           const CancellationToken* cancellation) const {
    ExportTracker tracker;
    MultiFormatExportResult result;

    auto emit = [&]() {
        result.statistics.processing_time = tracker.elapsed();
        if (on_progress) {
            const MultiFormatExportResult copy = result;
            on_progress(copy);
        }
    };

    auto finish = [&](ExportOutcome outcome) {
        result.outcome = outcome;
        result.finished = true;
        if (!result.export_directory.empty()) {
            calculate_statistics(snapshot, result);
        }
        if (options.write_manifest && !result.export_directory.empty()) {
            tracker.startStage("manifest");
            write_manifest(snapshot, result);
            tracker.completeStage("manifest");
        }
        emit();
        tracker.logSummary();
        return result;
    };

    logger_.info("Starting export of checkup " + snapshot.checkup_id);

    // Validation
    tracker.startStage("validate");
    ValidationResult validation = validator_.validate(snapshot, options);
    if (validation.has_errors()) {
        tracker.completeStage("validate", false, "invalid checkup");
        logger_.error(validation.format_error_message());
        result.validation_messages = validation.messages();
        return finish(ExportOutcome::VALIDATION_FAILED);
    }
    tracker.completeStage("validate");

    // Storage pre-flight
    tracker.startStage("storage");
    EstimationReport estimation = estimator_.estimate(snapshot, options);
    for (const auto& warning : estimation.warnings) {
        logger_.warning(warning);
    }
    if (options_.check_storage && !storage_.has_space_for(options_.exports_root, estimation.total_size_bytes)) {
        const std::string message = "Insufficient storage: about " +
                                    TextFormatter::format_file_size(estimation.total_size_bytes) +
                                    " required in " + options_.exports_root;
        tracker.completeStage("storage", false, message);
        logger_.error(message);
        result.validation_messages.push_back(message);
        return finish(ExportOutcome::INSUFFICIENT_STORAGE);
    }
    tracker.completeStage("storage");

    const std::vector<ExportFormat> formats = ordered_formats(options);

    // Export directory
    tracker.startStage("directory");
    const fs::path directory = fs::path(options_.exports_root) /
                               ExportNaming::directory_name(snapshot, options.create_timestamped_directory);
    std::error_code ec;
    fs::create_directories(directory, ec);
    if (ec) {
        const std::string message = "Cannot create export directory " + directory.string() + ": " + ec.message();
        tracker.completeStage("directory", false, message);
        logger_.error(message);
        for (auto format : formats) {
            result.format_errors[format] = message;
        }
        return finish(ExportOutcome::PARTIAL);
    }
    result.export_directory = directory.string();
    tracker.completeStage("directory");
    logger_.detailed("Export directory: " + result.export_directory);
    emit();

    // Formats
    for (auto format : formats) {
        if (cancellation && cancellation->is_cancelled()) {
            logger_.info("Export cancelled before " + to_string(format));
            return finish(ExportOutcome::CANCELLED);
        }

        const std::string stage = to_string(format);
        tracker.startStage(stage);

        auto generator = generators_.find(format);
        if (generator == generators_.end() || !generator->second) {
            const std::string message = "No generator registered for " + stage;
            logger_.error(message);
            result.format_errors[format] = message;
            tracker.completeStage(stage, false, message);
            emit();
            continue;
        }

        try {
            ExportedArtifact artifact = generator->second->generate(snapshot, options, result.export_directory,
                                                                    cancellation);
            tracker.trackArtifact(artifact);

            switch (format) {
                case ExportFormat::DOCUMENT: result.document = artifact; break;
                case ExportFormat::TEXT: result.text = artifact; break;
                case ExportFormat::PHOTO_FOLDER: result.photo_folder = artifact; break;
                case ExportFormat::COMBINED_PACKAGE: result.combined_package = artifact; break;
            }

            if (!result.is_complete(format)) {
                std::string missing;
                for (auto part : {ExportFormat::DOCUMENT, ExportFormat::TEXT, ExportFormat::PHOTO_FOLDER}) {
                    if (std::find(artifact.components.begin(), artifact.components.end(), part) ==
                        artifact.components.end()) {
                        missing += (missing.empty() ? "" : ", ") + to_string(part);
                    }
                }
                result.format_errors[format] = "Package incomplete, missing: " + missing;
                logger_.warning(result.format_errors[format]);
                tracker.completeStage(stage, false, result.format_errors[format]);
            } else {
                tracker.completeStage(stage);
                logger_.info("Exported " + stage + ": " + artifact.name + " (" +
                             TextFormatter::format_file_size(artifact.size_bytes) + ")");
            }
        } catch (const ExportCancelledError&) {
            tracker.completeStage(stage, false, "cancelled");
            logger_.info("Export cancelled during " + stage);
            return finish(ExportOutcome::CANCELLED);
        } catch (const std::exception& e) {
            logger_.error("Format " + stage + " failed: " + e.what());
            result.format_errors[format] = e.what();
            tracker.completeStage(stage, false, e.what());
        }

        calculate_statistics(snapshot, result);
        emit();
    }

    bool all_complete = std::all_of(formats.begin(), formats.end(),
                                    [&result](ExportFormat format) { return result.is_complete(format); });

    MultiFormatExportResult final_result = finish(all_complete ? ExportOutcome::SUCCESS : ExportOutcome::PARTIAL);
    logger_.info("Export " + to_string(final_result.outcome) + ": " +
                 std::to_string(final_result.artifact_count()) + " artifact(s) in " +
                 final_result.statistics.processing_time_formatted());
    return final_result;
}

} // namespace qreport
