/**
 * @file SnapshotValidator.hpp
 * @brief Export pre-conditions on a checkup snapshot and its options
 *
 * Every check runs, so one pass reports all problems at once, each with
 * the fields involved and how to resolve it.
 */

#pragma once

#include "qreport_export.hpp"
#include <optional>
#include <string>
#include <vector>

namespace qreport {

/**
 * @brief One reason the checkup cannot be exported
 */
struct ValidationIssue {
    std::string description;
    std::vector<std::string> involved_fields;
    std::vector<std::string> suggestions;
};

struct ValidationResult {
    bool is_valid;
    std::vector<ValidationIssue> issues;

    ValidationResult() : is_valid(true) {}

    bool has_errors() const { return !is_valid; }

    /**
     * @brief One line per issue, suitable for MultiFormatExportResult
     */
    std::vector<std::string> messages() const;

    std::string format_error_message() const;
};

/**
 * @brief Checks a snapshot and options before any file is written
 */
class SnapshotValidator {
public:
    SnapshotValidator() = default;

    ValidationResult validate(const CheckupSnapshot& snapshot, const ExportOptions& options) const;

private:
    std::optional<ValidationIssue> check_equipment_type(const CheckupSnapshot& snapshot) const;
    std::optional<ValidationIssue> check_client(const CheckupSnapshot& snapshot) const;
    std::optional<ValidationIssue> check_technician(const CheckupSnapshot& snapshot) const;
    std::optional<ValidationIssue> check_has_modules(const CheckupSnapshot& snapshot) const;

    /**
     * @brief Every module needs a title and at least one item
     */
    std::vector<ValidationIssue> check_modules(const CheckupSnapshot& snapshot) const;

    std::vector<ValidationIssue> check_options(const ExportOptions& options) const;
};

} // namespace qreport
