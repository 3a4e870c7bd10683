/**
 * @file ExportMaintenance.cpp
 * @brief Implementation of export housekeeping
 */

#include "ExportMaintenance.hpp"
#include <chrono>
#include <filesystem>
#include <vector>

namespace qreport {

namespace fs = std::filesystem;

ExportMaintenance::ExportMaintenance()
    : logger_("ExportMaintenance") {
}

int ExportMaintenance::cleanup_old_exports(const std::string& exports_root, int older_than_days) const {
    std::error_code ec;
    if (!fs::is_directory(exports_root, ec)) {
        logger_.detailed("No exports root at " + exports_root + ", nothing to clean");
        return 0;
    }

    const auto cutoff = fs::file_time_type::clock::now() - std::chrono::hours(24) * older_than_days;

    std::vector<fs::path> expired;
    for (fs::directory_iterator it(exports_root, ec), end; !ec && it != end; it.increment(ec)) {
        const std::string name = it->path().filename().string();

        std::error_code entry_ec;
        if (!it->is_directory(entry_ec) || name.find(EXPORT_NAME_MARKER) == std::string::npos) {
            continue;
        }

        auto modified = fs::last_write_time(it->path(), entry_ec);
        if (entry_ec) {
            logger_.warning("Cannot read modification time of " + name + ": " + entry_ec.message());
            continue;
        }
        if (modified < cutoff) {
            expired.push_back(it->path());
        }
    }
    if (ec) {
        logger_.error("Error scanning " + exports_root + ": " + ec.message());
    }

    int deleted = 0;
    for (const auto& entry : expired) {
        std::error_code entry_ec;
        fs::remove_all(entry, entry_ec);
        if (entry_ec) {
            logger_.warning("Failed to delete old export " + entry.filename().string() + ": " + entry_ec.message());
            continue;
        }
        ++deleted;
        logger_.detailed("Deleted old export: " + entry.filename().string());
    }

    logger_.info("Cleaned up " + std::to_string(deleted) + " old exports (older than " +
                 std::to_string(older_than_days) + " days)");
    return deleted;
}

int ExportMaintenance::cleanup_temporary_exports(const std::string& exports_root) const {
    std::error_code ec;
    if (!fs::is_directory(exports_root, ec)) {
        return 0;
    }

    std::vector<fs::path> temporary;
    for (fs::directory_iterator it(exports_root, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->path().filename().string().rfind(TEMP_PREFIX, 0) == 0) {
            temporary.push_back(it->path());
        }
    }
    if (ec) {
        logger_.error("Error scanning " + exports_root + ": " + ec.message());
    }

    int deleted = 0;
    for (const auto& entry : temporary) {
        std::error_code entry_ec;
        fs::remove_all(entry, entry_ec);
        if (entry_ec) {
            logger_.warning("Failed to delete temporary export " + entry.filename().string() + ": " +
                            entry_ec.message());
            continue;
        }
        ++deleted;
        logger_.debug("Deleted temporary export: " + entry.filename().string());
    }

    logger_.detailed("Cleaned up " + std::to_string(deleted) + " temporary exports");
    return deleted;
}

std::uintmax_t ExportMaintenance::directory_size(const std::string& path) {
    std::error_code ec;
    if (fs::is_regular_file(path, ec)) {
        auto size = fs::file_size(path, ec);
        return ec ? 0 : size;
    }

    std::uintmax_t total = 0;
    for (fs::recursive_directory_iterator it(path, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code entry_ec;
        if (it->is_regular_file(entry_ec)) {
            auto size = it->file_size(entry_ec);
            if (!entry_ec) total += size;
        }
    }
    return total;
}

int ExportMaintenance::file_count(const std::string& path) {
    std::error_code ec;
    if (fs::is_regular_file(path, ec)) {
        return 1;
    }

    int count = 0;
    for (fs::recursive_directory_iterator it(path, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code entry_ec;
        if (it->is_regular_file(entry_ec)) ++count;
    }
    return count;
}

} // namespace qreport
