/**
 * @file DocumentReportGenerator.hpp
 * @brief Word (.docx) checkup report
 *
 * Copyright (c) 2026 The QReport Authors
 * Licensed under the MIT License.
 */

#pragma once

#include "qreport_export.hpp"
#include "DocxWriter.hpp"
#include "../core/CancellationToken.hpp"
#include "../core/Logger.hpp"
#include <map>
#include <string>
#include <vector>

namespace qreport {

/**
 * @brief Builds the checkup report as an OOXML document
 *
 * Layout: title block, information table, executive summary, one table
 * per module followed by its photos, spare parts table and footer.
 *
 * Photos go through PhotoExportManager into a temporary media folder
 * beside the output file (sequential names, the export's quality tier),
 * are embedded from there, and the folder is removed afterwards.
 */
class DocumentReportGenerator {
public:
    static constexpr const char* MEDIA_FOLDER_NAME = "temp_document_media";
    static constexpr double PHOTO_WIDTH_PT = 300.0;

    static constexpr const char* COLOR_PRIMARY = "1F4E79";
    static constexpr const char* COLOR_MODULE = "2F5597";
    static constexpr const char* COLOR_SUBTITLE = "5B5B5B";
    static constexpr const char* COLOR_KEY_FILL = "F2F2F2";
    static constexpr const char* COLOR_WHITE = "FFFFFF";

    DocumentReportGenerator();

    /**
     * @brief Build the document model
     * @param working_directory Parent of the temporary media folder
     * @throws ExportError if the photo media cannot be prepared
     * @throws ExportCancelledError if cancelled while exporting photos
     */
    DocxDocument build(const CheckupSnapshot& snapshot, const ExportOptions& options,
                       const std::string& working_directory,
                       const CancellationToken* cancellation = nullptr) const;

    /**
     * @brief Build the document and save it to output_path
     *
     * The media folder is created beside output_path.
     */
    void generate(const CheckupSnapshot& snapshot, const ExportOptions& options,
                  const std::string& output_path,
                  const CancellationToken* cancellation = nullptr) const;

    /**
     * @brief Copy of the snapshot keeping the first max_per_module photos of each module
     */
    static CheckupSnapshot limit_photos(const CheckupSnapshot& snapshot, int max_per_module);

    /**
     * @brief RRGGBB text color for a status cell
     */
    static std::string status_color(CheckItemStatus status);

private:
    Logger logger_;

    struct EmbeddedPhoto {
        std::string name;
        std::string caption;
        std::string data;
    };

    std::map<int, std::vector<EmbeddedPhoto>> prepare_photos(const CheckupSnapshot& snapshot,
                                                             const ExportOptions& options,
                                                             const std::string& working_directory,
                                                             const CancellationToken* cancellation) const;

    void add_title(DocxDocument& doc, const CheckupSnapshot& snapshot) const;
    void add_information_table(DocxDocument& doc, const CheckupSnapshot& snapshot) const;
    void add_executive_summary(DocxDocument& doc, const CheckupSnapshot& snapshot) const;
    void add_module(DocxDocument& doc, const CheckupModule& module, const ExportOptions& options,
                    const std::vector<EmbeddedPhoto>* photos) const;
    void add_spare_parts(DocxDocument& doc, const CheckupSnapshot& snapshot) const;
    void add_footer(DocxDocument& doc, const CheckupSnapshot& snapshot) const;

    static void add_section_title(DocxDocument& doc, const std::string& title);
    static void add_header_row(DocxTable& table, const std::vector<std::string>& headers);
};

} // namespace qreport
