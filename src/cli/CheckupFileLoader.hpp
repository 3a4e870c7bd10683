/**
 * @file CheckupFileLoader.hpp
 * @brief Reads a stored checkup record set from a JSON file
 */

#pragma once

#include "../core/SnapshotMapper.hpp"
#include "../core/Logger.hpp"
#include <stdexcept>
#include <string>

namespace qreport {

class CheckupFileError : public std::runtime_error {
public:
    explicit CheckupFileError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief JSON checkup file reader
 *
 * Layout:
 * @code
 * {
 *   "checkup": { "id": "...", "status": "COMPLETED", "createdAt": 1729600000000,
 *                "completedAt": 1729603600000,
 *                "header": { "clientCompany": "...", "technicianName": "...", ... } },
 *   "items":   [ { "id", "moduleKey", "moduleName", "description", "status",
 *                  "criticality", "notes", "orderIndex" } ],
 *   "photos":  [ { "id", "checkItemId", "filePath", "fileName", "caption",
 *                  "takenAt", "orderIndex" } ],
 *   "spareParts": [ { "partNumber", "description", "quantity", "urgency",
 *                     "notes", "estimatedCost" } ]
 * }
 * @endcode
 *
 * Timestamps are epoch milliseconds or "YYYY-MM-DDTHH:MM:SS" (UTC).
 * Relative photo paths are resolved against the checkup file's directory.
 */
class CheckupFileLoader {
public:
    CheckupFileLoader();

    /**
     * @brief Load and parse a checkup file
     * @throws CheckupFileError if the file is unreadable or malformed
     */
    CheckupRecordSet load(const std::string& filename) const;

    /**
     * @brief Parse checkup JSON text
     * @param base_directory Directory relative photo paths are resolved against
     * @throws CheckupFileError if the text is malformed
     */
    CheckupRecordSet parse(const std::string& content, const std::string& base_directory = "") const;

private:
    Logger logger_;
};

} // namespace qreport
