/**
 * @file ExportNaming.hpp
 * @brief Export directory and report file names derived from a checkup
 */

#pragma once

#include "qreport_export.hpp"
#include <string>

namespace qreport {

/**
 * @brief Naming rules for the export destination
 *
 * Directory:  [yyyyMMdd_HHmmss_]Checkup_<client>_<id8>
 * Files:      Checkup_<client>_<id8>.docx / .txt
 */
class ExportNaming {
public:
    static constexpr size_t MAX_CLIENT_LENGTH = 20;
    static constexpr size_t CHECKUP_ID_PREFIX = 8;

    /**
     * @brief Keep ASCII alphanumerics only, at most 20 of them
     */
    static std::string sanitize_client_name(const std::string& client_name);

    /**
     * @brief "Checkup_<client>_<id8>"
     */
    static std::string base_name(const CheckupSnapshot& snapshot);

    static std::string directory_name(const CheckupSnapshot& snapshot, bool timestamped,
                                      Timestamp now = std::chrono::system_clock::now());

    /**
     * @brief Report file name for single-file formats
     */
    static std::string file_name(const CheckupSnapshot& snapshot, ExportFormat format);
};

} // namespace qreport
