/**
 * @file SizeTimeEstimator.cpp
 * @brief Implementation of the export cost model
 */

#include "SizeTimeEstimator.hpp"
#include "TextFormatter.hpp"
#include <algorithm>

namespace qreport {

SizeTimeEstimator::SizeTimeEstimator()
    : options_(), logger_("SizeTimeEstimator") {
}

SizeTimeEstimator::SizeTimeEstimator(const Options& options)
    : options_(options), logger_("SizeTimeEstimator") {
}

std::uint64_t SizeTimeEstimator::text_content_length(const CheckupSnapshot& snapshot) {
    std::uint64_t chars = 0;
    for (const auto& module : snapshot.modules) {
        for (const auto& item : module.items) {
            chars += item.description.size() + item.notes.size();
        }
    }
    for (const auto& part : snapshot.spare_parts) {
        chars += part.description.size() + part.notes.size();
    }
    return chars;
}

FormatEstimation SizeTimeEstimator::estimate_document(const CheckupSnapshot& snapshot,
                                                      const ExportOptions& options) const {
    FormatEstimation estimation;
    estimation.format = ExportFormat::DOCUMENT;

    std::uint64_t photo_bytes = 0;
    if (options.include_photos) {
        photo_bytes = static_cast<std::uint64_t>(snapshot.total_photo_count()) * DOCUMENT_BYTES_PER_PHOTO;
    }
    estimation.size_bytes = DOCUMENT_BASE_BYTES + photo_bytes;
    estimation.time_ms = DOCUMENT_BASE_MS + photo_bytes / DOCUMENT_PHOTO_BYTES_PER_MS;
    estimation.file_count = 1;
    return estimation;
}

FormatEstimation SizeTimeEstimator::estimate_text(const CheckupSnapshot& snapshot) const {
    FormatEstimation estimation;
    estimation.format = ExportFormat::TEXT;
    estimation.size_bytes = std::max(text_content_length(snapshot) * 2, TEXT_MIN_BYTES);
    estimation.time_ms = TEXT_MS;
    estimation.file_count = 1;
    return estimation;
}

FormatEstimation SizeTimeEstimator::estimate_photo_folder(const CheckupSnapshot& snapshot,
                                                          const ExportOptions& options) const {
    FormatEstimation estimation;
    estimation.format = ExportFormat::PHOTO_FOLDER;

    const auto photos = static_cast<std::uint64_t>(snapshot.total_photo_count());
    estimation.size_bytes = photos * PHOTO_BYTES;
    estimation.time_ms = photos * PHOTO_MS;
    estimation.file_count = static_cast<int>(photos) + (options.generate_photo_index ? 1 : 0);
    return estimation;
}

FormatEstimation SizeTimeEstimator::estimate_combined(const CheckupSnapshot& snapshot,
                                                      const ExportOptions& options) const {
    FormatEstimation document = estimate_document(snapshot, options);
    FormatEstimation text = estimate_text(snapshot);
    FormatEstimation photos = estimate_photo_folder(snapshot, options);

    FormatEstimation estimation;
    estimation.format = ExportFormat::COMBINED_PACKAGE;
    estimation.size_bytes = document.size_bytes + text.size_bytes + photos.size_bytes +
                            PACKAGE_INDEX_BYTES + PACKAGE_DIRECTORY_BYTES;
    estimation.time_ms = document.time_ms + text.time_ms + photos.time_ms + PACKAGE_EXTRA_MS;
    estimation.file_count = snapshot.total_photo_count() + 3;
    return estimation;
}

FormatEstimation SizeTimeEstimator::estimate_format(const CheckupSnapshot& snapshot,
                                                    const ExportOptions& options,
                                                    ExportFormat format) const {
    switch (format) {
        case ExportFormat::DOCUMENT:
            return estimate_document(snapshot, options);
        case ExportFormat::TEXT:
            return estimate_text(snapshot);
        case ExportFormat::PHOTO_FOLDER:
            return estimate_photo_folder(snapshot, options);
        case ExportFormat::COMBINED_PACKAGE:
            return estimate_combined(snapshot, options);
    }
    return FormatEstimation{};
}

EstimationReport SizeTimeEstimator::estimate(const CheckupSnapshot& snapshot,
                                             const ExportOptions& options) const {
    EstimationReport report;

    for (auto format : options.formats) {
        if (report.formats.count(format) > 0) continue;
        FormatEstimation estimation = estimate_format(snapshot, options, format);
        report.total_size_bytes += estimation.size_bytes;
        report.total_time_ms += estimation.time_ms;
        report.formats[format] = estimation;
    }

    if (report.total_size_bytes > options_.large_export_threshold_bytes) {
        report.warnings.push_back("Large export: estimated size " +
                                  TextFormatter::format_file_size(report.total_size_bytes));
    }
    if (report.total_time_ms > options_.slow_export_threshold_ms) {
        report.warnings.push_back("Long export: estimated duration " +
                                  TextFormatter::format_duration(std::chrono::milliseconds(report.total_time_ms)));
    }

    logger_.debug("Estimate: " + TextFormatter::format_file_size(report.total_size_bytes) + ", " +
                  std::to_string(report.total_time_ms) + " ms, " +
                  std::to_string(report.warnings.size()) + " warning(s)");
    return report;
}

} // namespace qreport
