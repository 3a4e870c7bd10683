/**
 * @file DocxWriter.hpp
 * @brief In-memory WordprocessingML document model and .docx serializer
 *
 * Supports the subset the report needs: paragraphs of formatted runs,
 * tables with shaded header cells and colored text, and inline JPEG
 * pictures. Saved as a ZIP package through ZipArchiveWriter.
 *
 * Copyright (c) 2026 The QReport Authors
 * Licensed under the MIT License.
 */

#pragma once

#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace qreport {

enum class ParagraphAlignment {
    LEFT,
    CENTER,
    RIGHT
};

/**
 * @brief A run of uniformly formatted text
 *
 * Newlines in text become line breaks inside the paragraph.
 */
struct DocxRun {
    std::string text;
    bool bold = false;
    bool italic = false;
    int font_size_pt = 0;       ///< 0 keeps the document default
    std::string color;          ///< RRGGBB hex, empty for automatic
};

struct DocxParagraph {
    std::vector<DocxRun> runs;
    ParagraphAlignment alignment = ParagraphAlignment::LEFT;
    int spacing_before = 0;             ///< Twentieths of a point
    int spacing_after = 0;              ///< Twentieths of a point
    std::optional<size_t> image_index;  ///< Inline picture, index into the document's images

    DocxParagraph& add_run(const std::string& text, bool bold = false, int font_size_pt = 0,
                           const std::string& color = "");
};

struct DocxTableCell {
    std::string text;
    bool bold = false;
    std::string text_color;     ///< RRGGBB hex, empty for automatic
    std::string fill;           ///< RRGGBB hex cell shading, empty for none
};

struct DocxTable {
    std::vector<std::vector<DocxTableCell>> rows;

    std::vector<DocxTableCell>& add_row() {
        rows.emplace_back();
        return rows.back();
    }

    size_t column_count() const;
};

/**
 * @brief Document under construction
 *
 * Block references returned by the add_* methods stay valid while
 * further blocks are appended.
 */
class DocxDocument {
public:
    static constexpr std::int64_t EMU_PER_POINT = 12700;

    explicit DocxDocument(const std::string& title = "", const std::string& creator = "QReport");

    DocxParagraph& add_paragraph(ParagraphAlignment alignment = ParagraphAlignment::LEFT);
    DocxTable& add_table();

    /**
     * @brief Append a centered paragraph holding one inline JPEG picture
     * @param name Name recorded in the drawing properties
     * @param jpeg_data Raw JPEG bytes
     * @param width_pt Displayed width; height follows the image aspect ratio
     */
    void add_image(const std::string& name, std::string jpeg_data, double width_pt = 300.0);

    size_t paragraph_count() const;
    size_t table_count() const;
    size_t image_count() const { return images_.size(); }
    const std::string& title() const { return title_; }

    /**
     * @brief Serialize word/document.xml
     */
    std::string document_xml() const;

    /**
     * @brief Write the complete .docx package
     * @throws ExportError on I/O failure
     */
    void save(const std::string& path) const;

    /**
     * @brief Pixel size from the SOFn marker of a JPEG stream
     */
    static std::optional<std::pair<int, int>> jpeg_dimensions(const std::string& data);

    static std::string escape_xml(const std::string& text);

private:
    struct Image {
        std::string name;
        std::string data;
        std::int64_t width_emu = 0;
        std::int64_t height_emu = 0;
    };

    using Block = std::variant<DocxParagraph, DocxTable>;

    std::string title_;
    std::string creator_;
    std::deque<Block> blocks_;
    std::vector<Image> images_;

    std::string content_types_xml() const;
    std::string package_rels_xml() const;
    std::string document_rels_xml() const;
    std::string core_properties_xml() const;

    void write_paragraph(std::string& out, const DocxParagraph& paragraph) const;
    void write_table(std::string& out, const DocxTable& table) const;
    void write_image_run(std::string& out, size_t index) const;
    static void write_run(std::string& out, const DocxRun& run);
};

} // namespace qreport
