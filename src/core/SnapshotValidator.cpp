/**
 * @file SnapshotValidator.cpp
 * @brief Implementation of export pre-condition checks
 */

#include "SnapshotValidator.hpp"
#include <cctype>
#include <sstream>

namespace qreport {

namespace {

bool is_blank(const std::string& text) {
    for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

} // namespace

std::vector<std::string> ValidationResult::messages() const {
    std::vector<std::string> lines;
    lines.reserve(issues.size());
    for (const auto& issue : issues) {
        lines.push_back(issue.description);
    }
    return lines;
}

std::string ValidationResult::format_error_message() const {
    if (is_valid || issues.empty()) {
        return "";
    }

    std::ostringstream oss;
    oss << "\nERROR: Checkup cannot be exported:\n\n";

    for (size_t i = 0; i < issues.size(); ++i) {
        const auto& issue = issues[i];

        oss << "Problem " << (i + 1) << ": " << issue.description << "\n";

        if (!issue.involved_fields.empty()) {
            oss << "  Fields:\n";
            for (const auto& field : issue.involved_fields) {
                oss << "    " << field << "\n";
            }
        }

        if (!issue.suggestions.empty()) {
            oss << "  Suggested solutions:\n";
            for (size_t j = 0; j < issue.suggestions.size(); ++j) {
                oss << "    " << (j + 1) << ". " << issue.suggestions[j] << "\n";
            }
        }

        if (i < issues.size() - 1) {
            oss << "\n";
        }
    }

    return oss.str();
}

ValidationResult SnapshotValidator::validate(const CheckupSnapshot& snapshot, const ExportOptions& options) const {
    ValidationResult result;

    auto add = [&result](std::optional<ValidationIssue> issue) {
        if (issue) {
            result.issues.push_back(*issue);
        }
    };

    add(check_equipment_type(snapshot));
    add(check_client(snapshot));
    add(check_technician(snapshot));
    add(check_has_modules(snapshot));

    for (auto& issue : check_modules(snapshot)) {
        result.issues.push_back(issue);
    }
    for (auto& issue : check_options(options)) {
        result.issues.push_back(issue);
    }

    result.is_valid = result.issues.empty();
    return result;
}

std::optional<ValidationIssue> SnapshotValidator::check_equipment_type(const CheckupSnapshot& snapshot) const {
    if (!is_blank(snapshot.header.equipment_type)) {
        return std::nullopt;
    }
    ValidationIssue issue;
    issue.description = "Island type is missing";
    issue.involved_fields = {"header.equipment_type"};
    issue.suggestions = {"Associate the checkup with an island before exporting"};
    return issue;
}

std::optional<ValidationIssue> SnapshotValidator::check_client(const CheckupSnapshot& snapshot) const {
    if (!is_blank(snapshot.header.client_company)) {
        return std::nullopt;
    }
    ValidationIssue issue;
    issue.description = "Client name is missing";
    issue.involved_fields = {"header.client_company"};
    issue.suggestions = {"Set the client company of the checkup"};
    return issue;
}

std::optional<ValidationIssue> SnapshotValidator::check_technician(const CheckupSnapshot& snapshot) const {
    if (!is_blank(snapshot.header.technician_name)) {
        return std::nullopt;
    }
    ValidationIssue issue;
    issue.description = "Technician name is missing";
    issue.involved_fields = {"header.technician_name"};
    issue.suggestions = {"Record the technician who performed the checkup"};
    return issue;
}

std::optional<ValidationIssue> SnapshotValidator::check_has_modules(const CheckupSnapshot& snapshot) const {
    if (!snapshot.modules.empty()) {
        return std::nullopt;
    }
    ValidationIssue issue;
    issue.description = "Checkup has no modules";
    issue.involved_fields = {"modules"};
    issue.suggestions = {"Add at least one module with check items"};
    return issue;
}

std::vector<ValidationIssue> SnapshotValidator::check_modules(const CheckupSnapshot& snapshot) const {
    std::vector<ValidationIssue> issues;

    for (size_t m = 0; m < snapshot.modules.size(); ++m) {
        const auto& module = snapshot.modules[m];
        const std::string field = "modules[" + std::to_string(m) + "]";

        if (is_blank(module.display_name)) {
            ValidationIssue issue;
            issue.description = "Module " + std::to_string(m + 1) + " has no title";
            issue.involved_fields = {field + ".display_name"};
            issue.suggestions = {"Give every module a display name"};
            issues.push_back(issue);
        }

        if (module.items.empty()) {
            ValidationIssue issue;
            std::string label = is_blank(module.display_name) ? std::to_string(m + 1) : module.display_name;
            issue.description = "Module " + label + " has no check items";
            issue.involved_fields = {field + ".items"};
            issue.suggestions = {"Remove the empty module", "Add its check items"};
            issues.push_back(issue);
        }
    }

    return issues;
}

std::vector<ValidationIssue> SnapshotValidator::check_options(const ExportOptions& options) const {
    std::vector<ValidationIssue> issues;
    for (const auto& problem : options.validate()) {
        ValidationIssue issue;
        issue.description = problem;
        issue.involved_fields = {"options"};
        issues.push_back(issue);
    }
    return issues;
}

} // namespace qreport
