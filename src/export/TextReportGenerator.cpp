/**
 * @file TextReportGenerator.cpp
 * @brief Implementation of the plain-text checkup report
 */

#include "TextReportGenerator.hpp"
#include "version.h"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <vector>

namespace qreport {

namespace {

constexpr int KEY_WIDTH = 22;
constexpr double HIGH_NOK_PERCENTAGE = 10.0;
constexpr double ELEVATED_NOK_PERCENTAGE = 15.0;
constexpr double EXCELLENT_OK_PERCENTAGE = 95.0;
constexpr int MANY_PHOTOS = 50;

std::string percent(double value) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.1f%%", value);
    return buffer;
}

std::string money(double value) {
    char buffer[48];
    std::snprintf(buffer, sizeof(buffer), "EUR %.2f", value);
    return buffer;
}

std::string upper(std::string text) {
    for (auto& c : text) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return text;
}

std::string or_dash(const std::string& text) {
    return text.empty() ? "-" : text;
}

int module_issue_count(const CheckupModule& module) {
    return static_cast<int>(std::count_if(module.items.begin(), module.items.end(),
        [](const CheckItem& item) { return item.status == CheckItemStatus::NOK; }));
}

} // namespace

TextReportGenerator::TextReportGenerator()
    : formatter_(), logger_("TextReportGenerator") {
}

TextReportGenerator::TextReportGenerator(const TextFormatter::Config& layout)
    : formatter_(layout), logger_("TextReportGenerator") {
}

std::string TextReportGenerator::generate(const CheckupSnapshot& snapshot,
                                          const ExportOptions& options) const {
    logger_.detailed("Generating text report for checkup " + snapshot.checkup_id);

    std::ostringstream out;
    write_header(out, snapshot);
    write_general_info(out, snapshot);
    write_executive_summary(out, snapshot);
    write_check_details(out, snapshot, options);
    if (!snapshot.spare_parts.empty()) {
        write_spare_parts(out, snapshot);
    }
    write_conclusions(out, snapshot);
    write_footer(out, snapshot);

    std::string report = out.str();
    logger_.debug("Text report length: " + std::to_string(report.size()) + " bytes");
    return report;
}

std::string TextReportGenerator::section_banner(const std::string& title) const {
    std::string text = title + "\n" + formatter_.rule('-', TextFormatter::display_width(title)) + "\n";
    return text;
}

void TextReportGenerator::write_header(std::ostringstream& out, const CheckupSnapshot& snapshot) const {
    std::string title = "REPORT CHECKUP";
    if (!snapshot.header.equipment_type.empty()) {
        title += " " + upper(snapshot.header.equipment_type);
    }

    out << formatter_.rule('=') << "\n";
    out << formatter_.center_text(title) << "\n";
    out << formatter_.center_text(snapshot.header.client_company) << "\n";
    out << formatter_.rule('=') << "\n\n";
}

void TextReportGenerator::write_general_info(std::ostringstream& out, const CheckupSnapshot& snapshot) const {
    const auto& header = snapshot.header;
    out << section_banner("GENERAL INFORMATION");

    out << formatter_.key_value("Client", header.client_company, KEY_WIDTH) << "\n";
    if (!header.contact_person.empty()) {
        out << formatter_.key_value("Contact", header.contact_person, KEY_WIDTH) << "\n";
    }
    if (!header.site.empty()) {
        out << formatter_.key_value("Site", header.site, KEY_WIDTH) << "\n";
    }
    if (!header.address.empty()) {
        out << formatter_.key_value("Address", header.address, KEY_WIDTH) << "\n";
    }
    out << formatter_.key_value("Island type", or_dash(header.equipment_type), KEY_WIDTH) << "\n";
    out << formatter_.key_value("Serial number", or_dash(header.serial_number), KEY_WIDTH) << "\n";
    if (!header.model.empty()) {
        out << formatter_.key_value("Model", header.model, KEY_WIDTH) << "\n";
    }
    if (header.operating_hours > 0) {
        out << formatter_.key_value("Operating hours", std::to_string(header.operating_hours) + " h", KEY_WIDTH) << "\n";
    }
    out << formatter_.key_value("Checkup date",
                                TextFormatter::format_timestamp(snapshot.created_at, "%d/%m/%Y"), KEY_WIDTH) << "\n";
    out << formatter_.key_value("Technician", header.technician_name, KEY_WIDTH) << "\n";
    if (!header.technician_company.empty()) {
        out << formatter_.key_value("Company", header.technician_company, KEY_WIDTH) << "\n";
    }
    out << formatter_.key_value("Start time",
                                TextFormatter::format_timestamp(snapshot.created_at, "%H:%M"), KEY_WIDTH) << "\n";
    if (snapshot.completed_at) {
        out << formatter_.key_value("End time",
                                    TextFormatter::format_timestamp(*snapshot.completed_at, "%H:%M"), KEY_WIDTH) << "\n";
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            *snapshot.completed_at - snapshot.created_at);
        if (duration.count() > 0) {
            out << formatter_.key_value("Duration", TextFormatter::format_duration(duration), KEY_WIDTH) << "\n";
        }
    }
    out << formatter_.key_value("Status", or_dash(snapshot.status_label), KEY_WIDTH) << "\n";

    if (!header.notes.empty()) {
        out << "\nNotes:\n";
        for (const auto& line : formatter_.wrap_text(header.notes, formatter_.config().line_width - 2)) {
            out << "  " << line << "\n";
        }
    }
    out << "\n";
}

std::string TextReportGenerator::overall_status(const CheckupStatistics& statistics) {
    if (statistics.critical_issues > 0) {
        return "ATTENTION REQUIRED - critical issues found";
    }
    if (statistics.nok_items > 0) {
        return "ISSUES FOUND - maintenance recommended";
    }
    if (statistics.pending_items > 0) {
        return "IN PROGRESS - checks still pending";
    }
    return "GOOD - no issues found";
}

void TextReportGenerator::write_executive_summary(std::ostringstream& out,
                                                  const CheckupSnapshot& snapshot) const {
    const auto& stats = snapshot.statistics;
    out << section_banner("EXECUTIVE SUMMARY");

    out << formatter_.key_value("Overall status", overall_status(stats), KEY_WIDTH) << "\n\n";

    out << formatter_.key_value("Total checks", std::to_string(stats.total_items), KEY_WIDTH) << "\n";
    out << formatter_.key_value("OK", std::to_string(stats.ok_items) + " (" + percent(stats.ok_percentage()) + ")",
                                KEY_WIDTH) << "\n";
    out << formatter_.key_value("NOK", std::to_string(stats.nok_items) + " (" + percent(stats.nok_percentage()) + ")",
                                KEY_WIDTH) << "\n";
    out << formatter_.key_value("N/A", std::to_string(stats.na_items) + " (" + percent(stats.na_percentage()) + ")",
                                KEY_WIDTH) << "\n";
    out << formatter_.key_value("Pending", std::to_string(stats.pending_items), KEY_WIDTH) << "\n";
    out << formatter_.key_value("Critical issues", std::to_string(stats.critical_issues), KEY_WIDTH) << "\n";
    out << formatter_.key_value("Important issues", std::to_string(stats.important_issues), KEY_WIDTH) << "\n";
    out << formatter_.key_value("Photos captured", std::to_string(snapshot.total_photo_count()), KEY_WIDTH) << "\n";
    out << formatter_.key_value("Modules with issues",
                                std::to_string(stats.modules_with_issues) + "/" + std::to_string(stats.total_modules),
                                KEY_WIDTH) << "\n";

    if (stats.critical_issues > 0) {
        out << "\n!! WARNING: " << stats.critical_issues
            << " critical issue(s) require immediate attention\n";
    }

    int completed = stats.total_items - stats.pending_items;
    out << "\nCompletion: " << formatter_.create_progress_bar(completed, stats.total_items) << "\n\n";
}

void TextReportGenerator::write_check_details(std::ostringstream& out, const CheckupSnapshot& snapshot,
                                              const ExportOptions& options) const {
    out << formatter_.rule('=') << "\n";
    out << formatter_.center_text("CHECK DETAILS") << "\n";
    out << formatter_.rule('=') << "\n\n";

    for (size_t m = 0; m < snapshot.modules.size(); ++m) {
        const auto& module = snapshot.modules[m];
        const std::string title = "MODULO " + std::to_string(m + 1) + ": " + upper(module.display_name);
        out << section_banner(title);

        int issues = module_issue_count(module);
        int photos = 0;
        for (const auto& item : module.items) {
            photos += static_cast<int>(item.photos.size());
        }
        out << "Checks: " << module.items.size() << " | Issues: " << issues
            << " | Photos: " << photos << "\n\n";

        for (size_t i = 0; i < module.items.size(); ++i) {
            write_check_item(out, module.items[i], static_cast<int>(i + 1), options);
        }
        out << "\n";
    }
}

std::string TextReportGenerator::recommended_action(const CheckItem& item) {
    if (item.status != CheckItemStatus::NOK) {
        return "";
    }
    switch (item.criticality) {
        case CriticalityLevel::CRITICAL:
            return "Immediate intervention required";
        case CriticalityLevel::IMPORTANT:
            return "Schedule intervention within 30 days";
        case CriticalityLevel::ROUTINE:
            return "Check at next scheduled maintenance";
        case CriticalityLevel::NA:
            break;
    }
    return "Evaluate during next visit";
}

void TextReportGenerator::write_check_item(std::ostringstream& out, const CheckItem& item, int number,
                                           const ExportOptions& options) const {
    const int indent = 6;
    const int width = formatter_.config().line_width - indent;

    auto lines = formatter_.wrap_text(item.description, width);
    for (size_t l = 0; l < lines.size(); ++l) {
        if (l == 0) {
            std::string prefix = std::to_string(number) + ".";
            out << "  " << formatter_.left_align(prefix, indent - 2) << lines[l] << "\n";
        } else {
            out << std::string(indent, ' ') << lines[l] << "\n";
        }
    }

    out << std::string(indent, ' ') << "Status: " << to_string(item.status)
        << " | Criticality: " << to_string(item.criticality) << "\n";

    if (options.include_notes && !item.notes.empty()) {
        auto note_lines = formatter_.wrap_text(item.notes, width - 7);
        for (size_t l = 0; l < note_lines.size(); ++l) {
            out << std::string(indent, ' ') << (l == 0 ? "Notes: " : "       ") << note_lines[l] << "\n";
        }
    }

    if (!item.photos.empty()) {
        out << std::string(indent, ' ') << "Photos: " << item.photos.size() << " attached\n";
    }

    std::string action = recommended_action(item);
    if (!action.empty()) {
        out << std::string(indent, ' ') << "-> " << action << "\n";
    }
    out << "\n";
}

void TextReportGenerator::write_spare_parts(std::ostringstream& out, const CheckupSnapshot& snapshot) const {
    out << formatter_.rule('=') << "\n";
    out << formatter_.center_text("SPARE PARTS") << "\n";
    out << formatter_.rule('=') << "\n\n";

    double total_cost = 0.0;
    bool any_cost = false;

    for (auto urgency : {SparePartUrgency::CRITICAL, SparePartUrgency::IMPORTANT, SparePartUrgency::ROUTINE}) {
        std::vector<const SparePart*> group;
        for (const auto& part : snapshot.spare_parts) {
            if (part.urgency == urgency) group.push_back(&part);
        }
        if (group.empty()) continue;

        out << section_banner("URGENCY " + to_string(urgency) + " (" + std::to_string(group.size()) + ")");
        for (const SparePart* part : group) {
            out << "  [" << or_dash(part->part_number) << "] " << part->description << "\n";
            out << "      Quantity: " << part->quantity << "\n";
            if (part->estimated_cost) {
                out << "      Estimated cost: " << money(*part->estimated_cost * part->quantity) << "\n";
                total_cost += *part->estimated_cost * part->quantity;
                any_cost = true;
            }
            if (!part->notes.empty()) {
                out << "      Notes: " << part->notes << "\n";
            }
        }
        out << "\n";
    }

    out << formatter_.key_value("Total parts", std::to_string(snapshot.spare_parts.size()), KEY_WIDTH) << "\n";
    if (any_cost) {
        out << formatter_.key_value("Estimated total", money(total_cost), KEY_WIDTH) << "\n";
    }
    out << "\n";
}

std::pair<int, std::string> TextReportGenerator::next_checkup_interval(const CheckupStatistics& statistics) {
    if (statistics.critical_issues > 0) {
        return {14, "critical issues found"};
    }
    if (statistics.nok_percentage() > ELEVATED_NOK_PERCENTAGE) {
        return {30, "high number of non-conformities"};
    }
    if (statistics.ok_percentage() >= EXCELLENT_OK_PERCENTAGE) {
        return {180, "equipment in excellent condition"};
    }
    return {90, "standard maintenance interval"};
}

void TextReportGenerator::write_conclusions(std::ostringstream& out, const CheckupSnapshot& snapshot) const {
    const auto& stats = snapshot.statistics;

    out << formatter_.rule('=') << "\n";
    out << formatter_.center_text("CONCLUSIONS AND RECOMMENDATIONS") << "\n";
    out << formatter_.rule('=') << "\n\n";

    std::vector<std::string> immediate;
    if (stats.critical_issues > 0) {
        immediate.push_back("Resolve " + std::to_string(stats.critical_issues) + " critical issue(s) before restarting");
    }
    int critical_parts = static_cast<int>(std::count_if(snapshot.spare_parts.begin(), snapshot.spare_parts.end(),
        [](const SparePart& part) { return part.urgency == SparePartUrgency::CRITICAL; }));
    if (critical_parts > 0) {
        immediate.push_back("Replace immediately " + std::to_string(critical_parts) + " critical component(s)");
    }
    if (!immediate.empty()) {
        out << "IMMEDIATE ACTIONS:\n" << formatter_.bullet_list(immediate, 2) << "\n";
    }

    std::vector<std::string> general;
    if (stats.nok_percentage() > HIGH_NOK_PERCENTAGE) {
        general.push_back("Plan a preventive maintenance program");
    }
    if (stats.pending_items > 0) {
        general.push_back("Complete the " + std::to_string(stats.pending_items) + " pending check(s)");
    }
    if (snapshot.total_photo_count() > MANY_PHOTOS) {
        general.push_back("Archive the photo documentation for future reference");
    }
    if (general.empty()) {
        general.push_back("Continue with the scheduled maintenance plan");
    }
    out << "GENERAL RECOMMENDATIONS:\n" << formatter_.bullet_list(general, 2) << "\n";

    auto [days, reason] = next_checkup_interval(stats);
    Timestamp base = snapshot.completed_at.value_or(snapshot.generated_at);
    Timestamp next = base + std::chrono::hours(24 * days);
    out << "NEXT CHECKUP:\n";
    out << "  " << formatter_.key_value("Suggested date", TextFormatter::format_timestamp(next, "%d/%m/%Y"), KEY_WIDTH - 2)
        << "\n";
    out << "  " << formatter_.key_value("Reason", reason, KEY_WIDTH - 2) << "\n\n";

    out << "TECHNICAL VALIDATION:\n";
    out << "  " << formatter_.key_value("Technician", snapshot.header.technician_name, KEY_WIDTH - 2) << "\n";
    out << "  " << formatter_.key_value("Date",
                                        TextFormatter::format_timestamp(base, "%d/%m/%Y"), KEY_WIDTH - 2) << "\n";
    out << "  " << formatter_.key_value("Signature", std::string(30, '_'), KEY_WIDTH - 2) << "\n\n";
}

void TextReportGenerator::write_footer(std::ostringstream& out, const CheckupSnapshot& snapshot) const {
    const auto& stats = snapshot.statistics;
    out << formatter_.rule('=') << "\n";
    out << "Generated by QReport " << QREPORT_VERSION_STRING << " on "
        << TextFormatter::format_timestamp(snapshot.generated_at) << "\n";
    out << "Client: " << snapshot.header.client_company
        << " | Technician: " << snapshot.header.technician_name << "\n";
    out << "Modules: " << snapshot.modules.size()
        << " | Checks: " << stats.total_items
        << " | Photos: " << snapshot.total_photo_count()
        << " | Spare parts: " << snapshot.spare_parts.size() << "\n";
    out << formatter_.rule('=') << "\n";
}

} // namespace qreport
