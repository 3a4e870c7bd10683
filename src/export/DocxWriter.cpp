/**
 * @file DocxWriter.cpp
 * @brief WordprocessingML serialization
 */

#include "DocxWriter.hpp"
#include "ZipArchiveWriter.hpp"
#include "TextFormatter.hpp"
#include <algorithm>
#include <chrono>
#include <sstream>

namespace qreport {

namespace {

const char* WORD_NAMESPACES =
    "xmlns:w=\"http://schemas.openxmlformats.org/wordprocessingml/2006/main\" "
    "xmlns:r=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships\" "
    "xmlns:wp=\"http://schemas.openxmlformats.org/drawingml/2006/wordprocessingDrawing\" "
    "xmlns:a=\"http://schemas.openxmlformats.org/drawingml/2006/main\" "
    "xmlns:pic=\"http://schemas.openxmlformats.org/drawingml/2006/picture\"";

const char* XML_DECLARATION = "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n";

// Usable text width of an A4 page with 1 inch margins, in twips
constexpr int TEXT_WIDTH_TWIPS = 9026;

const char* alignment_value(ParagraphAlignment alignment) {
    switch (alignment) {
        case ParagraphAlignment::CENTER: return "center";
        case ParagraphAlignment::RIGHT: return "right";
        case ParagraphAlignment::LEFT:
        default: return "left";
    }
}

std::string image_relationship_id(size_t index) {
    return "rIdImage" + std::to_string(index + 1);
}

std::string image_part_name(size_t index) {
    return "image" + std::to_string(index + 1) + ".jpeg";
}

} // namespace

DocxParagraph& DocxParagraph::add_run(const std::string& text, bool bold, int font_size_pt,
                                      const std::string& color) {
    DocxRun run;
    run.text = text;
    run.bold = bold;
    run.font_size_pt = font_size_pt;
    run.color = color;
    runs.push_back(run);
    return *this;
}

size_t DocxTable::column_count() const {
    size_t columns = 0;
    for (const auto& row : rows) {
        columns = std::max(columns, row.size());
    }
    return columns;
}

DocxDocument::DocxDocument(const std::string& title, const std::string& creator)
    : title_(title), creator_(creator) {
}

DocxParagraph& DocxDocument::add_paragraph(ParagraphAlignment alignment) {
    DocxParagraph paragraph;
    paragraph.alignment = alignment;
    blocks_.emplace_back(paragraph);
    return std::get<DocxParagraph>(blocks_.back());
}

DocxTable& DocxDocument::add_table() {
    blocks_.emplace_back(DocxTable{});
    return std::get<DocxTable>(blocks_.back());
}

void DocxDocument::add_image(const std::string& name, std::string jpeg_data, double width_pt) {
    Image image;
    image.name = name;

    double aspect = 2.0 / 3.0;
    if (auto dims = jpeg_dimensions(jpeg_data)) {
        if (dims->first > 0 && dims->second > 0) {
            aspect = static_cast<double>(dims->second) / dims->first;
        }
    }
    image.width_emu = static_cast<std::int64_t>(width_pt * EMU_PER_POINT);
    image.height_emu = static_cast<std::int64_t>(width_pt * aspect * EMU_PER_POINT);
    image.data = std::move(jpeg_data);
    images_.push_back(std::move(image));

    DocxParagraph& paragraph = add_paragraph(ParagraphAlignment::CENTER);
    paragraph.image_index = images_.size() - 1;
}

size_t DocxDocument::paragraph_count() const {
    return static_cast<size_t>(std::count_if(blocks_.begin(), blocks_.end(), [](const Block& block) {
        return std::holds_alternative<DocxParagraph>(block);
    }));
}

size_t DocxDocument::table_count() const {
    return blocks_.size() - paragraph_count();
}

std::optional<std::pair<int, int>> DocxDocument::jpeg_dimensions(const std::string& data) {
    auto byte = [&data](size_t i) { return static_cast<unsigned char>(data[i]); };

    if (data.size() < 4 || byte(0) != 0xFF || byte(1) != 0xD8) {
        return std::nullopt;
    }

    size_t pos = 2;
    while (pos + 4 <= data.size()) {
        if (byte(pos) != 0xFF) {
            ++pos;
            continue;
        }
        unsigned char marker = byte(pos + 1);
        if (marker == 0xFF) {
            ++pos;
            continue;
        }
        // Standalone markers carry no length
        if (marker == 0x01 || (marker >= 0xD0 && marker <= 0xD9)) {
            pos += 2;
            continue;
        }

        size_t length = (static_cast<size_t>(byte(pos + 2)) << 8) | byte(pos + 3);
        bool is_sof = marker >= 0xC0 && marker <= 0xCF &&
                      marker != 0xC4 && marker != 0xC8 && marker != 0xCC;
        if (is_sof) {
            if (pos + 9 > data.size()) {
                return std::nullopt;
            }
            int height = (byte(pos + 5) << 8) | byte(pos + 6);
            int width = (byte(pos + 7) << 8) | byte(pos + 8);
            return std::make_pair(width, height);
        }
        pos += 2 + length;
    }
    return std::nullopt;
}

std::string DocxDocument::escape_xml(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&apos;"; break;
            default:
                // Control characters other than tab/newline are not valid XML 1.0
                if (static_cast<unsigned char>(c) >= 0x20 || c == '\t' || c == '\n') {
                    out += c;
                }
        }
    }
    return out;
}

void DocxDocument::write_run(std::string& out, const DocxRun& run) {
    out += "<w:r>";

    std::string properties;
    if (run.bold) properties += "<w:b/>";
    if (run.italic) properties += "<w:i/>";
    if (!run.color.empty()) properties += "<w:color w:val=\"" + run.color + "\"/>";
    if (run.font_size_pt > 0) {
        properties += "<w:sz w:val=\"" + std::to_string(run.font_size_pt * 2) + "\"/>";
    }
    if (!properties.empty()) {
        out += "<w:rPr>" + properties + "</w:rPr>";
    }

    std::istringstream lines(run.text);
    std::string line;
    bool first = true;
    while (std::getline(lines, line)) {
        if (!first) out += "<w:br/>";
        out += "<w:t xml:space=\"preserve\">" + escape_xml(line) + "</w:t>";
        first = false;
    }
    if (first) {
        out += "<w:t xml:space=\"preserve\"></w:t>";
    }

    out += "</w:r>";
}

void DocxDocument::write_image_run(std::string& out, size_t index) const {
    const Image& image = images_.at(index);
    const std::string cx = std::to_string(image.width_emu);
    const std::string cy = std::to_string(image.height_emu);
    const std::string id = std::to_string(index + 1);

    out += "<w:r><w:drawing><wp:inline distT=\"0\" distB=\"0\" distL=\"0\" distR=\"0\">";
    out += "<wp:extent cx=\"" + cx + "\" cy=\"" + cy + "\"/>";
    out += "<wp:docPr id=\"" + id + "\" name=\"" + escape_xml(image.name) + "\"/>";
    out += "<a:graphic><a:graphicData uri=\"http://schemas.openxmlformats.org/drawingml/2006/picture\">";
    out += "<pic:pic><pic:nvPicPr><pic:cNvPr id=\"" + id + "\" name=\"" + image_part_name(index) + "\"/>";
    out += "<pic:cNvPicPr/></pic:nvPicPr>";
    out += "<pic:blipFill><a:blip r:embed=\"" + image_relationship_id(index) + "\"/>";
    out += "<a:stretch><a:fillRect/></a:stretch></pic:blipFill>";
    out += "<pic:spPr><a:xfrm><a:off x=\"0\" y=\"0\"/><a:ext cx=\"" + cx + "\" cy=\"" + cy + "\"/></a:xfrm>";
    out += "<a:prstGeom prst=\"rect\"><a:avLst/></a:prstGeom></pic:spPr>";
    out += "</pic:pic></a:graphicData></a:graphic></wp:inline></w:drawing></w:r>";
}

void DocxDocument::write_paragraph(std::string& out, const DocxParagraph& paragraph) const {
    out += "<w:p><w:pPr>";
    if (paragraph.spacing_before > 0 || paragraph.spacing_after > 0) {
        out += "<w:spacing w:before=\"" + std::to_string(paragraph.spacing_before) +
               "\" w:after=\"" + std::to_string(paragraph.spacing_after) + "\"/>";
    }
    out += "<w:jc w:val=\"" + std::string(alignment_value(paragraph.alignment)) + "\"/>";
    out += "</w:pPr>";

    for (const auto& run : paragraph.runs) {
        write_run(out, run);
    }
    if (paragraph.image_index) {
        write_image_run(out, *paragraph.image_index);
    }

    out += "</w:p>";
}

void DocxDocument::write_table(std::string& out, const DocxTable& table) const {
    const size_t columns = std::max<size_t>(1, table.column_count());
    const std::string column_width = std::to_string(TEXT_WIDTH_TWIPS / static_cast<int>(columns));

    out += "<w:tbl><w:tblPr><w:tblW w:w=\"5000\" w:type=\"pct\"/><w:tblBorders>";
    for (const char* side : {"top", "left", "bottom", "right", "insideH", "insideV"}) {
        out += std::string("<w:") + side + " w:val=\"single\" w:sz=\"4\" w:space=\"0\" w:color=\"BFBFBF\"/>";
    }
    out += "</w:tblBorders></w:tblPr><w:tblGrid>";
    for (size_t c = 0; c < columns; ++c) {
        out += "<w:gridCol w:w=\"" + column_width + "\"/>";
    }
    out += "</w:tblGrid>";

    for (const auto& row : table.rows) {
        out += "<w:tr>";
        for (size_t c = 0; c < columns; ++c) {
            DocxTableCell cell = c < row.size() ? row[c] : DocxTableCell{};

            out += "<w:tc><w:tcPr><w:tcW w:w=\"" + column_width + "\" w:type=\"dxa\"/>";
            if (!cell.fill.empty()) {
                out += "<w:shd w:val=\"clear\" w:color=\"auto\" w:fill=\"" + cell.fill + "\"/>";
            }
            out += "</w:tcPr><w:p>";

            DocxRun run;
            run.text = cell.text;
            run.bold = cell.bold;
            run.color = cell.text_color;
            write_run(out, run);

            out += "</w:p></w:tc>";
        }
        out += "</w:tr>";
    }

    out += "</w:tbl>";
    // Word merges adjacent tables unless a paragraph separates them
    out += "<w:p/>";
}

std::string DocxDocument::document_xml() const {
    std::string out = XML_DECLARATION;
    out += "<w:document " + std::string(WORD_NAMESPACES) + "><w:body>";

    for (const auto& block : blocks_) {
        if (const auto* paragraph = std::get_if<DocxParagraph>(&block)) {
            write_paragraph(out, *paragraph);
        } else {
            write_table(out, std::get<DocxTable>(block));
        }
    }

    out += "<w:sectPr><w:pgSz w:w=\"11906\" w:h=\"16838\"/>";
    out += "<w:pgMar w:top=\"1440\" w:right=\"1440\" w:bottom=\"1440\" w:left=\"1440\" "
           "w:header=\"708\" w:footer=\"708\" w:gutter=\"0\"/></w:sectPr>";
    out += "</w:body></w:document>";
    return out;
}

std::string DocxDocument::content_types_xml() const {
    std::string out = XML_DECLARATION;
    out += "<Types xmlns=\"http://schemas.openxmlformats.org/package/2006/content-types\">";
    out += "<Default Extension=\"rels\" ContentType=\"application/vnd.openxmlformats-package.relationships+xml\"/>";
    out += "<Default Extension=\"xml\" ContentType=\"application/xml\"/>";
    out += "<Default Extension=\"jpeg\" ContentType=\"image/jpeg\"/>";
    out += "<Override PartName=\"/word/document.xml\" "
           "ContentType=\"application/vnd.openxmlformats-officedocument.wordprocessingml.document.main+xml\"/>";
    out += "<Override PartName=\"/docProps/core.xml\" "
           "ContentType=\"application/vnd.openxmlformats-package.core-properties+xml\"/>";
    out += "</Types>";
    return out;
}

std::string DocxDocument::package_rels_xml() const {
    std::string out = XML_DECLARATION;
    out += "<Relationships xmlns=\"http://schemas.openxmlformats.org/package/2006/relationships\">";
    out += "<Relationship Id=\"rId1\" "
           "Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/officeDocument\" "
           "Target=\"word/document.xml\"/>";
    out += "<Relationship Id=\"rId2\" "
           "Type=\"http://schemas.openxmlformats.org/package/2006/relationships/metadata/core-properties\" "
           "Target=\"docProps/core.xml\"/>";
    out += "</Relationships>";
    return out;
}

std::string DocxDocument::document_rels_xml() const {
    std::string out = XML_DECLARATION;
    out += "<Relationships xmlns=\"http://schemas.openxmlformats.org/package/2006/relationships\">";
    for (size_t i = 0; i < images_.size(); ++i) {
        out += "<Relationship Id=\"" + image_relationship_id(i) + "\" "
               "Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/image\" "
               "Target=\"media/" + image_part_name(i) + "\"/>";
    }
    out += "</Relationships>";
    return out;
}

std::string DocxDocument::core_properties_xml() const {
    std::string created = TextFormatter::format_timestamp(std::chrono::system_clock::now(), "%Y-%m-%dT%H:%M:%S");

    std::string out = XML_DECLARATION;
    out += "<cp:coreProperties "
           "xmlns:cp=\"http://schemas.openxmlformats.org/package/2006/metadata/core-properties\" "
           "xmlns:dc=\"http://purl.org/dc/elements/1.1/\" "
           "xmlns:dcterms=\"http://purl.org/dc/terms/\" "
           "xmlns:xsi=\"http://www.w3.org/2001/XMLSchema-instance\">";
    out += "<dc:title>" + escape_xml(title_) + "</dc:title>";
    out += "<dc:creator>" + escape_xml(creator_) + "</dc:creator>";
    out += "<dcterms:created xsi:type=\"dcterms:W3CDTF\">" + created + "</dcterms:created>";
    out += "</cp:coreProperties>";
    return out;
}

void DocxDocument::save(const std::string& path) const {
    ZipArchiveWriter zip;
    zip.add_entry("[Content_Types].xml", content_types_xml());
    zip.add_entry("_rels/.rels", package_rels_xml());
    zip.add_entry("docProps/core.xml", core_properties_xml());
    zip.add_entry("word/document.xml", document_xml());
    zip.add_entry("word/_rels/document.xml.rels", document_rels_xml());
    for (size_t i = 0; i < images_.size(); ++i) {
        zip.add_entry("word/media/" + image_part_name(i), images_[i].data, ZipArchiveWriter::Method::STORE);
    }
    zip.write(path);
}

} // namespace qreport
