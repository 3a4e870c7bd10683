/**
 * @file ExportMaintenance.hpp
 * @brief Housekeeping over the exports root
 */

#pragma once

#include "Logger.hpp"
#include <cstdint>
#include <string>

namespace qreport {

/**
 * @brief Age-based and temporary-entry cleanup, directory measurements
 *
 * Sweeps delete entry by entry; an entry that cannot be removed is logged
 * and skipped, and only successful deletions are counted.
 */
class ExportMaintenance {
public:
    static constexpr const char* EXPORT_NAME_MARKER = "Checkup_";
    static constexpr const char* TEMP_PREFIX = "temp_";

    ExportMaintenance();

    /**
     * @brief Delete export directories last written more than older_than_days ago
     * @return Number of directories deleted
     */
    int cleanup_old_exports(const std::string& exports_root, int older_than_days) const;

    /**
     * @brief Delete leftover temp_* entries directly under the root
     * @return Number of entries deleted
     */
    int cleanup_temporary_exports(const std::string& exports_root) const;

    /**
     * @brief Sum of regular file sizes below path (recursive); a file's own size for a file
     */
    static std::uintmax_t directory_size(const std::string& path);

    /**
     * @brief Number of regular files below path (recursive)
     */
    static int file_count(const std::string& path);

private:
    Logger logger_;
};

} // namespace qreport
