/**
 * @file DocumentReportGenerator.cpp
 * @brief Implementation of the Word checkup report
 */

#include "DocumentReportGenerator.hpp"
#include "PhotoExportManager.hpp"
#include "TextFormatter.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <utility>

namespace qreport {

namespace fs = std::filesystem;

namespace {

std::string percent(double value) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.1f%%", value);
    return buffer;
}

std::string upper(std::string text) {
    for (auto& c : text) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return text;
}

/**
 * @brief Removes the temporary media folder when the build scope ends
 */
class MediaFolderGuard {
public:
    MediaFolderGuard(fs::path folder, const Logger& logger) : folder_(std::move(folder)), logger_(logger) {}

    ~MediaFolderGuard() {
        std::error_code ec;
        fs::remove_all(folder_, ec);
        if (ec) {
            logger_.warning("Could not remove " + folder_.string() + ": " + ec.message());
        }
    }

    MediaFolderGuard(const MediaFolderGuard&) = delete;
    MediaFolderGuard& operator=(const MediaFolderGuard&) = delete;

private:
    fs::path folder_;
    const Logger& logger_;
};

} // namespace

DocumentReportGenerator::DocumentReportGenerator()
    : logger_("DocumentReportGenerator") {
}

std::string DocumentReportGenerator::status_color(CheckItemStatus status) {
    switch (status) {
        case CheckItemStatus::OK: return "00B050";
        case CheckItemStatus::NOK: return "FF0000";
        case CheckItemStatus::PENDING: return "FFC000";
        case CheckItemStatus::NA: return "000000";
    }
    return "000000";
}

CheckupSnapshot DocumentReportGenerator::limit_photos(const CheckupSnapshot& snapshot, int max_per_module) {
    CheckupSnapshot limited = snapshot;
    for (auto& module : limited.modules) {
        int remaining = std::max(0, max_per_module);
        for (auto& item : module.items) {
            int keep = std::min(remaining, static_cast<int>(item.photos.size()));
            item.photos.resize(static_cast<size_t>(keep));
            remaining -= keep;
        }
    }
    return limited;
}

std::map<int, std::vector<DocumentReportGenerator::EmbeddedPhoto>> DocumentReportGenerator::prepare_photos(
    const CheckupSnapshot& snapshot, const ExportOptions& options,
    const std::string& working_directory, const CancellationToken* cancellation) const {

    std::map<int, std::vector<EmbeddedPhoto>> by_module;

    CheckupSnapshot limited = limit_photos(snapshot, options.max_photos_per_module);
    if (limited.total_photo_count() == 0) {
        return by_module;
    }

    fs::path media = fs::path(working_directory) / MEDIA_FOLDER_NAME;
    MediaFolderGuard guard(media, logger_);

    PhotoExportManager::Options photo_options;
    photo_options.naming_strategy = PhotoNamingStrategy::SEQUENTIAL;
    photo_options.quality = options.photo_quality;
    photo_options.photo_max_width = options.photo_max_width;
    photo_options.generate_index = false;

    PhotoExportManager manager(photo_options);
    PhotoExportResult exported = manager.export_photos(limited, media.string(), cancellation);

    for (const auto& photo : exported.exported_photos) {
        std::ifstream in(photo.file_path, std::ios::binary);
        if (!in) {
            logger_.warning("Cannot read exported photo " + photo.file_path + ", not embedded");
            continue;
        }

        EmbeddedPhoto embedded;
        embedded.name = photo.file_name;
        embedded.data.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
        if (!photo.original.caption.empty()) {
            embedded.caption = photo.original.caption;
        } else {
            embedded.caption = "Photo " + std::to_string(photo.context.photo_index_in_item + 1) +
                               " - " + photo.context.item_title;
        }
        by_module[photo.context.section_index].push_back(std::move(embedded));
    }

    logger_.detailed("Prepared " + std::to_string(exported.total_files) + " photos for the document");
    return by_module;
}

void DocumentReportGenerator::add_section_title(DocxDocument& doc, const std::string& title) {
    DocxParagraph& p = doc.add_paragraph();
    p.spacing_before = 600;
    p.spacing_after = 200;
    p.add_run(title, true, 16, COLOR_PRIMARY);
}

void DocumentReportGenerator::add_header_row(DocxTable& table, const std::vector<std::string>& headers) {
    auto& row = table.add_row();
    for (const auto& header : headers) {
        DocxTableCell cell;
        cell.text = header;
        cell.bold = true;
        cell.text_color = COLOR_WHITE;
        cell.fill = COLOR_PRIMARY;
        row.push_back(cell);
    }
}

void DocumentReportGenerator::add_title(DocxDocument& doc, const CheckupSnapshot& snapshot) const {
    DocxParagraph& title = doc.add_paragraph(ParagraphAlignment::CENTER);
    title.spacing_after = 200;
    title.add_run("REPORT CHECKUP " + upper(snapshot.header.equipment_type), true, 18, COLOR_PRIMARY);

    DocxParagraph& client = doc.add_paragraph(ParagraphAlignment::CENTER);
    client.spacing_after = 100;
    client.add_run(snapshot.header.client_company, false, 14, COLOR_SUBTITLE);

    DocxParagraph& date = doc.add_paragraph(ParagraphAlignment::CENTER);
    date.spacing_after = 400;
    date.add_run(TextFormatter::format_timestamp(snapshot.created_at, "%d/%m/%Y"), false, 12, COLOR_SUBTITLE);
}

void DocumentReportGenerator::add_information_table(DocxDocument& doc, const CheckupSnapshot& snapshot) const {
    const auto& header = snapshot.header;
    add_section_title(doc, "GENERAL INFORMATION");

    std::vector<std::pair<std::string, std::string>> rows = {
        {"Client", header.client_company},
        {"Site", header.site},
        {"Island type", header.equipment_type},
        {"Serial number", header.serial_number},
        {"Model", header.model},
        {"Operating hours", header.operating_hours > 0 ? std::to_string(header.operating_hours) + " h" : ""},
        {"Technician", header.technician_name},
        {"Company", header.technician_company},
        {"Checkup date", TextFormatter::format_timestamp(snapshot.created_at)},
        {"Status", snapshot.status_label},
        {"Completion", percent(snapshot.statistics.completion_percentage())},
    };

    DocxTable& table = doc.add_table();
    for (const auto& [key, value] : rows) {
        if (value.empty()) continue;

        auto& row = table.add_row();
        DocxTableCell key_cell;
        key_cell.text = key;
        key_cell.bold = true;
        key_cell.text_color = COLOR_PRIMARY;
        key_cell.fill = COLOR_KEY_FILL;
        row.push_back(key_cell);

        DocxTableCell value_cell;
        value_cell.text = value;
        row.push_back(value_cell);
    }
}

void DocumentReportGenerator::add_executive_summary(DocxDocument& doc, const CheckupSnapshot& snapshot) const {
    const auto& stats = snapshot.statistics;
    add_section_title(doc, "EXECUTIVE SUMMARY");

    std::vector<std::string> lines = {
        "Total checks: " + std::to_string(stats.total_items),
        "OK: " + std::to_string(stats.ok_items) + " (" + percent(stats.ok_percentage()) + ")",
        "NOK: " + std::to_string(stats.nok_items) + " (" + percent(stats.nok_percentage()) + ")",
        "Critical issues: " + std::to_string(stats.critical_issues),
        "Photos: " + std::to_string(snapshot.total_photo_count()),
        "Modules checked: " + std::to_string(snapshot.modules.size()),
    };

    for (const auto& line : lines) {
        DocxParagraph& p = doc.add_paragraph();
        p.spacing_after = 60;
        p.add_run("• " + line);
    }

    if (stats.critical_issues > 0) {
        DocxParagraph& warning = doc.add_paragraph();
        warning.spacing_before = 200;
        warning.add_run(std::to_string(stats.critical_issues) + " critical issue(s) require immediate attention",
                        true, 0, status_color(CheckItemStatus::NOK));
    }
}

void DocumentReportGenerator::add_module(DocxDocument& doc, const CheckupModule& module,
                                         const ExportOptions& options,
                                         const std::vector<EmbeddedPhoto>* photos) const {
    DocxParagraph& title = doc.add_paragraph();
    title.spacing_before = 400;
    title.spacing_after = 100;
    title.add_run("MODULO: " + upper(module.display_name), true, 14, COLOR_MODULE);

    DocxTable& table = doc.add_table();
    add_header_row(table, {"Description", "Status", "Criticality", "Notes"});

    for (const auto& item : module.items) {
        auto& row = table.add_row();

        DocxTableCell description;
        description.text = item.description;
        row.push_back(description);

        DocxTableCell status;
        status.text = to_string(item.status);
        status.bold = true;
        status.text_color = status_color(item.status);
        row.push_back(status);

        DocxTableCell criticality;
        criticality.text = to_string(item.criticality);
        row.push_back(criticality);

        DocxTableCell notes;
        if (options.include_notes) {
            notes.text = item.notes;
        }
        row.push_back(notes);
    }

    if (photos == nullptr || photos->empty()) {
        return;
    }

    DocxParagraph& heading = doc.add_paragraph();
    heading.spacing_before = 200;
    heading.add_run("Photo evidence:", true);

    for (const auto& photo : *photos) {
        doc.add_image(photo.name, photo.data, PHOTO_WIDTH_PT);

        DocxParagraph& caption = doc.add_paragraph(ParagraphAlignment::CENTER);
        caption.spacing_after = 200;
        caption.add_run(photo.caption, false, 10);
        caption.runs.back().italic = true;
    }
}

void DocumentReportGenerator::add_spare_parts(DocxDocument& doc, const CheckupSnapshot& snapshot) const {
    add_section_title(doc, "SPARE PARTS");

    DocxTable& table = doc.add_table();
    add_header_row(table, {"Code", "Description", "Quantity", "Urgency", "Notes"});

    for (const auto& part : snapshot.spare_parts) {
        auto& row = table.add_row();
        row.push_back({part.part_number});
        row.push_back({part.description});
        row.push_back({std::to_string(part.quantity)});

        DocxTableCell urgency;
        urgency.text = to_string(part.urgency);
        if (part.urgency == SparePartUrgency::CRITICAL) {
            urgency.bold = true;
            urgency.text_color = status_color(CheckItemStatus::NOK);
        }
        row.push_back(urgency);
        row.push_back({part.notes});
    }
}

void DocumentReportGenerator::add_footer(DocxDocument& doc, const CheckupSnapshot& snapshot) const {
    DocxParagraph& footer = doc.add_paragraph(ParagraphAlignment::CENTER);
    footer.spacing_before = 800;

    std::string text = "Technician: " + snapshot.header.technician_name;
    if (!snapshot.header.technician_company.empty()) {
        text += " - " + snapshot.header.technician_company;
    }
    if (snapshot.completed_at) {
        text += "\nCompleted: " + TextFormatter::format_timestamp(*snapshot.completed_at);
    }
    text += "\nReport generated automatically by QReport on " +
            TextFormatter::format_timestamp(snapshot.generated_at);

    footer.add_run(text, false, 10);
    footer.runs.back().italic = true;
}

DocxDocument DocumentReportGenerator::build(const CheckupSnapshot& snapshot, const ExportOptions& options,
                                            const std::string& working_directory,
                                            const CancellationToken* cancellation) const {
    DocxDocument doc("Checkup " + snapshot.header.client_company);

    std::map<int, std::vector<EmbeddedPhoto>> photos;
    if (options.include_photos && options.max_photos_per_module > 0) {
        photos = prepare_photos(snapshot, options, working_directory, cancellation);
    }

    add_title(doc, snapshot);
    add_information_table(doc, snapshot);
    add_executive_summary(doc, snapshot);

    add_section_title(doc, "CHECK DETAILS");
    for (size_t m = 0; m < snapshot.modules.size(); ++m) {
        auto it = photos.find(static_cast<int>(m));
        add_module(doc, snapshot.modules[m], options, it != photos.end() ? &it->second : nullptr);
    }

    if (!snapshot.spare_parts.empty()) {
        add_spare_parts(doc, snapshot);
    }
    add_footer(doc, snapshot);

    logger_.detailed("Document built: " + std::to_string(doc.table_count()) + " tables, " +
                     std::to_string(doc.image_count()) + " images");
    return doc;
}

void DocumentReportGenerator::generate(const CheckupSnapshot& snapshot, const ExportOptions& options,
                                       const std::string& output_path,
                                       const CancellationToken* cancellation) const {
    fs::path working = fs::path(output_path).parent_path();
    if (working.empty()) {
        working = ".";
    }

    DocxDocument doc = build(snapshot, options, working.string(), cancellation);
    doc.save(output_path);
    logger_.info("Document written: " + output_path);
}

} // namespace qreport
