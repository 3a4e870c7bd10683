#pragma once

/**
 * @file qreport_export.hpp
 * @brief Main header for the QReport checkup export pipeline
 *
 * Data model shared by every stage of the export: the read-only checkup
 * snapshot, the export options, and the artifacts and results produced by
 * the generators and the orchestrator.
 *
 * Copyright (c) 2026 The QReport Authors
 * Portions copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace qreport {

using Timestamp = std::chrono::system_clock::time_point;

// ============================================================================
// Checkup domain types
// ============================================================================

enum class CheckItemStatus { OK, NOK, NA, PENDING };

enum class CriticalityLevel { CRITICAL, IMPORTANT, ROUTINE, NA };

enum class SparePartUrgency { CRITICAL, IMPORTANT, ROUTINE };

/**
 * @brief One photo attached to a check item
 */
struct Photo {
    std::string id;
    std::string file_path;      // Absolute or working-directory relative source path
    std::string file_name;      // Original file name as captured
    std::string caption;
    Timestamp taken_at{};
};

/**
 * @brief A single inspection point
 */
struct CheckItem {
    std::string id;
    std::string description;
    CheckItemStatus status = CheckItemStatus::PENDING;
    CriticalityLevel criticality = CriticalityLevel::ROUTINE;
    std::string notes;
    std::vector<Photo> photos;
};

/**
 * @brief Named category grouping related check items
 */
struct CheckupModule {
    std::string key;            // Stable identifier, e.g. "SAFETY"
    std::string display_name;   // Human readable title
    std::vector<CheckItem> items;
};

struct SparePart {
    std::string part_number;
    std::string description;
    int quantity = 1;
    SparePartUrgency urgency = SparePartUrgency::ROUTINE;
    std::string notes;
    std::optional<double> estimated_cost;
};

/**
 * @brief Client, technician and equipment identity of a checkup
 */
struct CheckupHeader {
    std::string client_company;
    std::string contact_person;
    std::string site;
    std::string address;
    std::string technician_name;
    std::string technician_company;
    std::string equipment_type;     // Island type display name
    std::string serial_number;
    std::string model;
    int operating_hours = 0;
    std::string notes;
};

/**
 * @brief Precomputed aggregate counts over all check items
 */
struct CheckupStatistics {
    int total_modules = 0;
    int total_items = 0;
    int ok_items = 0;
    int nok_items = 0;
    int na_items = 0;
    int pending_items = 0;
    int critical_issues = 0;
    int important_issues = 0;
    int total_photos = 0;
    int modules_with_issues = 0;

    /**
     * @brief Percentage of items that are no longer pending
     */
    double completion_percentage() const {
        if (total_items == 0) return 0.0;
        return (total_items - pending_items) * 100.0 / total_items;
    }

    double ok_percentage() const {
        return total_items > 0 ? ok_items * 100.0 / total_items : 0.0;
    }

    double nok_percentage() const {
        return total_items > 0 ? nok_items * 100.0 / total_items : 0.0;
    }

    double na_percentage() const {
        return total_items > 0 ? na_items * 100.0 / total_items : 0.0;
    }
};

/**
 * @brief Immutable read-only view of one inspection session
 *
 * Built once at the persistence boundary (see SnapshotMapper) and only read
 * by the export subsystem.
 */
struct CheckupSnapshot {
    std::string checkup_id;
    CheckupHeader header;
    std::string status_label;
    Timestamp created_at{};
    std::optional<Timestamp> completed_at;
    std::vector<CheckupModule> modules;
    std::vector<SparePart> spare_parts;
    CheckupStatistics statistics;
    Timestamp generated_at{};

    /**
     * @brief Total number of photos across all modules and items
     */
    int total_photo_count() const {
        int count = 0;
        for (const auto& module : modules) {
            for (const auto& item : module.items) {
                count += static_cast<int>(item.photos.size());
            }
        }
        return count;
    }

    int total_item_count() const {
        int count = 0;
        for (const auto& module : modules) {
            count += static_cast<int>(module.items.size());
        }
        return count;
    }
};

// ============================================================================
// Export configuration
// ============================================================================

enum class ExportFormat {
    DOCUMENT,
    TEXT,
    PHOTO_FOLDER,
    COMBINED_PACKAGE
};

enum class PhotoNamingStrategy {
    STRUCTURED,   // 01_section_item_caption.jpg
    SEQUENTIAL,   // foto_001.jpg
    TIMESTAMP     // 20251022_143052_001.jpg
};

enum class PhotoQuality {
    ORIGINAL,     // Verbatim copy
    OPTIMIZED,    // Re-encode, keeps most detail
    COMPRESSED    // Re-encode, materially smaller
};

/**
 * @brief Immutable configuration for one export request
 */
struct ExportOptions {
    std::vector<ExportFormat> formats;
    bool include_photos;
    bool include_notes;
    PhotoNamingStrategy naming_strategy;
    PhotoQuality photo_quality;
    int photo_max_width;
    bool generate_photo_index;
    bool create_timestamped_directory;
    int max_photos_per_module;
    bool write_manifest;

    ExportOptions()
        : formats{ExportFormat::DOCUMENT},
          include_photos(true),
          include_notes(true),
          naming_strategy(PhotoNamingStrategy::STRUCTURED),
          photo_quality(PhotoQuality::OPTIMIZED),
          photo_max_width(800),
          generate_photo_index(true),
          create_timestamped_directory(true),
          max_photos_per_module(4),
          write_manifest(false) {}

    bool requests(ExportFormat format) const {
        for (auto f : formats) {
            if (f == format) return true;
        }
        return false;
    }

    /**
     * @brief Check option consistency
     * @return Problems found, empty when the options are usable
     */
    std::vector<std::string> validate() const {
        std::vector<std::string> problems;
        if (formats.empty()) {
            problems.push_back("At least one export format must be selected");
        }
        if (photo_max_width <= 0) {
            problems.push_back("Photo max width must be positive");
        }
        if (max_photos_per_module < 0) {
            problems.push_back("Photos per module cannot be negative");
        }
        return problems;
    }
};

// ============================================================================
// Export results
// ============================================================================

/**
 * @brief Position of one photo inside the checkup tree
 */
struct PhotoContext {
    int section_index = 0;              // 0-based module index
    std::string section_title;
    std::string item_id;
    std::string item_title;
    int item_index = 0;                 // 0-based index within the module
    CheckItemStatus item_status = CheckItemStatus::PENDING;
    CriticalityLevel item_criticality = CriticalityLevel::ROUTINE;
    int photo_index_in_item = 0;        // 0-based ordinal
};

struct ExportedPhoto {
    Photo original;
    PhotoContext context;
    std::string file_name;
    std::string file_path;
    std::uintmax_t size_bytes = 0;
};

struct PhotoExportResult {
    std::vector<ExportedPhoto> exported_photos;
    int total_files = 0;
    std::uintmax_t total_size_bytes = 0;
    std::string folder_path;
    std::optional<std::string> index_file_path;
};

/**
 * @brief One written output file or folder
 */
struct ExportedArtifact {
    std::string path;
    std::string name;
    std::uintmax_t size_bytes = 0;
    ExportFormat format = ExportFormat::DOCUMENT;
    int file_count = 1;
    std::vector<ExportFormat> components;   // Combined package only
};

struct FormatEstimation {
    ExportFormat format = ExportFormat::DOCUMENT;
    std::uint64_t size_bytes = 0;
    std::uint64_t time_ms = 0;
    int file_count = 1;
};

/**
 * @brief Advisory size/time prediction for an export request
 */
struct EstimationReport {
    std::map<ExportFormat, FormatEstimation> formats;
    std::uint64_t total_size_bytes = 0;
    std::uint64_t total_time_ms = 0;
    std::vector<std::string> warnings;
};

struct ExportStatistics {
    int sections_processed = 0;
    int check_items_processed = 0;
    int photos_processed = 0;
    int photos_exported = 0;
    int spare_parts_included = 0;
    std::uintmax_t data_processed_bytes = 0;
    std::chrono::milliseconds processing_time{0};

    std::string processing_time_formatted() const;
};

enum class ExportOutcome {
    SUCCESS,                // Every requested format completed
    PARTIAL,                // At least one format missing or incomplete
    VALIDATION_FAILED,
    INSUFFICIENT_STORAGE,
    CANCELLED
};

/**
 * @brief Snapshot of a multi-format export, emitted after every stage
 */
struct MultiFormatExportResult {
    std::string export_directory;
    std::optional<ExportedArtifact> document;
    std::optional<ExportedArtifact> text;
    std::optional<ExportedArtifact> photo_folder;
    std::optional<ExportedArtifact> combined_package;
    ExportStatistics statistics;
    ExportOutcome outcome = ExportOutcome::SUCCESS;
    std::vector<std::string> validation_messages;
    std::map<ExportFormat, std::string> format_errors;
    bool finished = false;

    const std::optional<ExportedArtifact>& artifact_for(ExportFormat format) const;

    /**
     * @brief Whether a requested format produced everything it promises
     *
     * The combined package is only complete when the document, text and
     * photo folder components were all produced.
     */
    bool is_complete(ExportFormat format) const;

    int artifact_count() const;
    std::uintmax_t total_size_bytes() const;
};

// ============================================================================
// Errors
// ============================================================================

enum class ExportErrorCode {
    VALIDATION_FAILED,
    INSUFFICIENT_STORAGE,
    DIRECTORY_CREATE_FAILED,
    DOCUMENT_GENERATION_ERROR,
    TEXT_GENERATION_ERROR,
    PHOTO_EXPORT_FAILED,
    PHOTO_PROCESSING_FAILED,
    FILE_WRITE_FAILED,
    CANCELLED
};

class ExportError : public std::runtime_error {
public:
    ExportError(ExportErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ExportErrorCode code() const { return code_; }

private:
    ExportErrorCode code_;
};

class PhotoProcessingError : public ExportError {
public:
    explicit PhotoProcessingError(const std::string& message)
        : ExportError(ExportErrorCode::PHOTO_PROCESSING_FAILED, message) {}
};

class ExportCancelledError : public ExportError {
public:
    ExportCancelledError()
        : ExportError(ExportErrorCode::CANCELLED, "Export cancelled") {}
};

// ============================================================================
// Display helpers
// ============================================================================

std::string to_string(CheckItemStatus status);
std::string to_string(CriticalityLevel criticality);
std::string to_string(SparePartUrgency urgency);
std::string to_string(ExportFormat format);
std::string to_string(PhotoNamingStrategy strategy);
std::string to_string(PhotoQuality quality);
std::string to_string(ExportOutcome outcome);

std::optional<ExportFormat> parse_export_format(const std::string& text);
std::optional<PhotoNamingStrategy> parse_naming_strategy(const std::string& text);
std::optional<PhotoQuality> parse_photo_quality(const std::string& text);
std::optional<CheckItemStatus> parse_check_item_status(const std::string& text);
std::optional<CriticalityLevel> parse_criticality(const std::string& text);
std::optional<SparePartUrgency> parse_urgency(const std::string& text);

/**
 * @brief File extension for single-file formats (".docx", ".txt"), empty otherwise
 */
std::string file_extension(ExportFormat format);

} // namespace qreport
