/**
 * @file ExportModel.cpp
 * @brief Display helpers and result queries for the export data model
 */

#include "qreport_export.hpp"
#include <algorithm>
#include <cctype>

namespace qreport {

namespace {

std::string normalize_token(const std::string& text) {
    std::string token;
    token.reserve(text.size());
    for (char c : text) {
        if (c == '-' || c == ' ') {
            token += '_';
        } else {
            token += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
    }
    return token;
}

} // namespace

std::string ExportStatistics::processing_time_formatted() const {
    auto ms = processing_time.count();
    if (ms < 1000) {
        return std::to_string(ms) + "ms";
    } else if (ms < 60000) {
        auto tenths = (ms % 1000) / 100;
        return std::to_string(ms / 1000) + "." + std::to_string(tenths) + "s";
    }
    auto minutes = ms / 60000;
    auto seconds = (ms % 60000) / 1000;
    return std::to_string(minutes) + "m" + std::to_string(seconds) + "s";
}

const std::optional<ExportedArtifact>& MultiFormatExportResult::artifact_for(ExportFormat format) const {
    switch (format) {
        case ExportFormat::DOCUMENT:
            return document;
        case ExportFormat::TEXT:
            return text;
        case ExportFormat::PHOTO_FOLDER:
            return photo_folder;
        case ExportFormat::COMBINED_PACKAGE:
        default:
            return combined_package;
    }
}

bool MultiFormatExportResult::is_complete(ExportFormat format) const {
    const auto& artifact = artifact_for(format);
    if (!artifact.has_value()) {
        return false;
    }
    if (format != ExportFormat::COMBINED_PACKAGE) {
        return true;
    }

    const auto& parts = artifact->components;
    for (auto required : {ExportFormat::DOCUMENT, ExportFormat::TEXT, ExportFormat::PHOTO_FOLDER}) {
        if (std::find(parts.begin(), parts.end(), required) == parts.end()) {
            return false;
        }
    }
    return true;
}

int MultiFormatExportResult::artifact_count() const {
    int count = 0;
    if (document) ++count;
    if (text) ++count;
    if (photo_folder) ++count;
    if (combined_package) ++count;
    return count;
}

std::uintmax_t MultiFormatExportResult::total_size_bytes() const {
    // A combined package shares its directory with the standalone formats,
    // so its size already contains theirs.
    if (combined_package) {
        return combined_package->size_bytes;
    }
    std::uintmax_t total = 0;
    if (document) total += document->size_bytes;
    if (text) total += text->size_bytes;
    if (photo_folder) total += photo_folder->size_bytes;
    return total;
}

std::string to_string(CheckItemStatus status) {
    switch (status) {
        case CheckItemStatus::OK: return "OK";
        case CheckItemStatus::NOK: return "NOK";
        case CheckItemStatus::NA: return "N/A";
        case CheckItemStatus::PENDING: return "PENDING";
    }
    return "UNKNOWN";
}

std::string to_string(CriticalityLevel criticality) {
    switch (criticality) {
        case CriticalityLevel::CRITICAL: return "CRITICAL";
        case CriticalityLevel::IMPORTANT: return "IMPORTANT";
        case CriticalityLevel::ROUTINE: return "ROUTINE";
        case CriticalityLevel::NA: return "N/A";
    }
    return "UNKNOWN";
}

std::string to_string(SparePartUrgency urgency) {
    switch (urgency) {
        case SparePartUrgency::CRITICAL: return "CRITICAL";
        case SparePartUrgency::IMPORTANT: return "IMPORTANT";
        case SparePartUrgency::ROUTINE: return "ROUTINE";
    }
    return "UNKNOWN";
}

std::string to_string(ExportFormat format) {
    switch (format) {
        case ExportFormat::DOCUMENT: return "document";
        case ExportFormat::TEXT: return "text";
        case ExportFormat::PHOTO_FOLDER: return "photos";
        case ExportFormat::COMBINED_PACKAGE: return "combined";
    }
    return "unknown";
}

std::string to_string(PhotoNamingStrategy strategy) {
    switch (strategy) {
        case PhotoNamingStrategy::STRUCTURED: return "structured";
        case PhotoNamingStrategy::SEQUENTIAL: return "sequential";
        case PhotoNamingStrategy::TIMESTAMP: return "timestamp";
    }
    return "unknown";
}

std::string to_string(PhotoQuality quality) {
    switch (quality) {
        case PhotoQuality::ORIGINAL: return "original";
        case PhotoQuality::OPTIMIZED: return "optimized";
        case PhotoQuality::COMPRESSED: return "compressed";
    }
    return "unknown";
}

std::string to_string(ExportOutcome outcome) {
    switch (outcome) {
        case ExportOutcome::SUCCESS: return "SUCCESS";
        case ExportOutcome::PARTIAL: return "PARTIAL";
        case ExportOutcome::VALIDATION_FAILED: return "VALIDATION_FAILED";
        case ExportOutcome::INSUFFICIENT_STORAGE: return "INSUFFICIENT_STORAGE";
        case ExportOutcome::CANCELLED: return "CANCELLED";
    }
    return "UNKNOWN";
}

std::optional<ExportFormat> parse_export_format(const std::string& text) {
    std::string token = normalize_token(text);
    if (token == "DOCUMENT" || token == "DOCX" || token == "WORD") return ExportFormat::DOCUMENT;
    if (token == "TEXT" || token == "TXT") return ExportFormat::TEXT;
    if (token == "PHOTOS" || token == "PHOTO_FOLDER" || token == "FOTO") return ExportFormat::PHOTO_FOLDER;
    if (token == "COMBINED" || token == "COMBINED_PACKAGE" || token == "PACKAGE") return ExportFormat::COMBINED_PACKAGE;
    return std::nullopt;
}

std::optional<PhotoNamingStrategy> parse_naming_strategy(const std::string& text) {
    std::string token = normalize_token(text);
    if (token == "STRUCTURED") return PhotoNamingStrategy::STRUCTURED;
    if (token == "SEQUENTIAL") return PhotoNamingStrategy::SEQUENTIAL;
    if (token == "TIMESTAMP") return PhotoNamingStrategy::TIMESTAMP;
    return std::nullopt;
}

std::optional<PhotoQuality> parse_photo_quality(const std::string& text) {
    std::string token = normalize_token(text);
    if (token == "ORIGINAL" || token == "VERBATIM") return PhotoQuality::ORIGINAL;
    if (token == "OPTIMIZED") return PhotoQuality::OPTIMIZED;
    if (token == "COMPRESSED") return PhotoQuality::COMPRESSED;
    return std::nullopt;
}

std::optional<CheckItemStatus> parse_check_item_status(const std::string& text) {
    std::string token = normalize_token(text);
    if (token == "OK") return CheckItemStatus::OK;
    if (token == "NOK") return CheckItemStatus::NOK;
    if (token == "NA" || token == "N/A") return CheckItemStatus::NA;
    if (token == "PENDING") return CheckItemStatus::PENDING;
    return std::nullopt;
}

std::optional<CriticalityLevel> parse_criticality(const std::string& text) {
    std::string token = normalize_token(text);
    if (token == "CRITICAL") return CriticalityLevel::CRITICAL;
    if (token == "IMPORTANT") return CriticalityLevel::IMPORTANT;
    if (token == "ROUTINE") return CriticalityLevel::ROUTINE;
    if (token == "NA" || token == "N/A") return CriticalityLevel::NA;
    return std::nullopt;
}

std::optional<SparePartUrgency> parse_urgency(const std::string& text) {
    std::string token = normalize_token(text);
    if (token == "CRITICAL") return SparePartUrgency::CRITICAL;
    if (token == "IMPORTANT") return SparePartUrgency::IMPORTANT;
    if (token == "ROUTINE") return SparePartUrgency::ROUTINE;
    return std::nullopt;
}

std::string file_extension(ExportFormat format) {
    switch (format) {
        case ExportFormat::DOCUMENT: return ".docx";
        case ExportFormat::TEXT: return ".txt";
        default: return "";
    }
}

} // namespace qreport
