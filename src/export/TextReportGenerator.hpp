/**
 * @file TextReportGenerator.hpp
 * @brief Plain-text checkup report
 */

#pragma once

#include "qreport_export.hpp"
#include "TextFormatter.hpp"
#include "../core/Logger.hpp"
#include <sstream>
#include <string>
#include <utility>

namespace qreport {

/**
 * @brief Renders a checkup as an 80-column plain-text report
 *
 * Sections: header, general information, executive summary, check
 * details per module, spare parts by urgency, conclusions and footer.
 * Pure string generation; writing the file is the caller's job.
 */
class TextReportGenerator {
public:
    TextReportGenerator();
    explicit TextReportGenerator(const TextFormatter::Config& layout);

    std::string generate(const CheckupSnapshot& snapshot, const ExportOptions& options) const;

    /**
     * @brief Recommended interval until the next checkup, with its reason
     * @return (days, reason)
     */
    static std::pair<int, std::string> next_checkup_interval(const CheckupStatistics& statistics);

private:
    TextFormatter formatter_;
    Logger logger_;

    void write_header(std::ostringstream& out, const CheckupSnapshot& snapshot) const;
    void write_general_info(std::ostringstream& out, const CheckupSnapshot& snapshot) const;
    void write_executive_summary(std::ostringstream& out, const CheckupSnapshot& snapshot) const;
    void write_check_details(std::ostringstream& out, const CheckupSnapshot& snapshot,
                             const ExportOptions& options) const;
    void write_check_item(std::ostringstream& out, const CheckItem& item, int number,
                          const ExportOptions& options) const;
    void write_spare_parts(std::ostringstream& out, const CheckupSnapshot& snapshot) const;
    void write_conclusions(std::ostringstream& out, const CheckupSnapshot& snapshot) const;
    void write_footer(std::ostringstream& out, const CheckupSnapshot& snapshot) const;

    std::string section_banner(const std::string& title) const;
    static std::string overall_status(const CheckupStatistics& statistics);
    static std::string recommended_action(const CheckItem& item);
};

} // namespace qreport
