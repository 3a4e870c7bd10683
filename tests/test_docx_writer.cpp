/**
 * @file test_docx_writer.cpp
 * @brief Tests for the OOXML document model and the ZIP writer
 */

#include <catch2/catch.hpp>

#include "TestFixtures.hpp"
#include "export/DocxWriter.hpp"
#include "export/ZipArchiveWriter.hpp"
#include <zlib.h>
#include <cstdint>

using namespace qreport;
using namespace qreport::test;

namespace {

std::uint16_t read_u16(const std::string& bytes, size_t offset) {
    return static_cast<std::uint16_t>(static_cast<unsigned char>(bytes[offset]) |
                                      (static_cast<unsigned char>(bytes[offset + 1]) << 8));
}

std::string inflate_raw(const std::string& compressed, size_t expected_size) {
    std::string out(expected_size, '\0');
    z_stream stream{};
    REQUIRE(inflateInit2(&stream, -MAX_WBITS) == Z_OK);
    stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(compressed.data()));
    stream.avail_in = static_cast<uInt>(compressed.size());
    stream.next_out = reinterpret_cast<Bytef*>(out.data());
    stream.avail_out = static_cast<uInt>(out.size());
    const int status = inflate(&stream, Z_FINISH);
    inflateEnd(&stream);
    REQUIRE(status == Z_STREAM_END);
    return out;
}

} // namespace

TEST_CASE("CRC-32 matches the reference check value", "[zip]") {
    const std::string data = "123456789";
    REQUIRE(ZipArchiveWriter::crc32(data.data(), data.size()) == 0xCBF43926U);
    REQUIRE(ZipArchiveWriter::crc32("", 0) == 0U);
}

TEST_CASE("ZIP archive layout", "[zip]") {
    TempDirectory dir;
    const auto path = dir.path() / "archive.zip";

    ZipArchiveWriter zip;
    zip.add_entry("hello.txt", "Hello, world", ZipArchiveWriter::Method::STORE);
    zip.add_entry("nested/data.bin", std::string("\x00\x01\x02", 3));
    REQUIRE(zip.entry_count() == 2);
    REQUIRE(zip.has_entry("nested/data.bin"));
    zip.write(path.string());

    std::string bytes = read_file(path);
    REQUIRE(bytes.compare(0, 4, "PK\x03\x04") == 0);
    REQUIRE(bytes.find("Hello, world") != std::string::npos);
    REQUIRE(bytes.find("PK\x01\x02") != std::string::npos);
    REQUIRE(bytes.find("PK\x05\x06") == bytes.size() - 22);
    REQUIRE(read_u16(bytes, 8) == 0);

    SECTION("second entry is deflated") {
        const size_t second = bytes.find("PK\x03\x04", 4);
        REQUIRE(second != std::string::npos);
        REQUIRE(read_u16(bytes, second + 8) == 8);
    }

    SECTION("duplicate and empty names are rejected") {
        REQUIRE_THROWS_AS(zip.add_entry("hello.txt", "again"), ExportError);
        REQUIRE_THROWS_AS(zip.add_entry("", "x"), ExportError);
    }

    SECTION("missing source files are reported") {
        REQUIRE_THROWS_AS(zip.add_file("missing.txt", (dir.path() / "nope.txt").string()), ExportError);
    }
}

TEST_CASE("Raw deflate round-trips through zlib", "[zip]") {
    std::string text;
    for (int i = 0; i < 200; ++i) {
        text += "<w:p><w:r><w:t>Check item " + std::to_string(i % 7) + "</w:t></w:r></w:p>";
    }

    const std::string compressed = ZipArchiveWriter::deflate_raw(text);
    REQUIRE(compressed.size() < text.size() / 4);
    REQUIRE(inflate_raw(compressed, text.size()) == text);
    REQUIRE(ZipArchiveWriter::deflate_raw("").size() > 0);
}

TEST_CASE("Document XML carries runs, tables and escapes text", "[docx]") {
    DocxDocument doc("Test");
    doc.add_paragraph(ParagraphAlignment::CENTER).add_run("Tom & Jerry <3>", true, 16, "1F4E79");

    DocxTable& table = doc.add_table();
    auto& header = table.add_row();
    header.push_back({"Status", true, "FFFFFF", "1F4E79"});
    header.push_back({"Notes", true, "FFFFFF", "1F4E79"});
    auto& row = table.add_row();
    row.push_back({"NOK", true, "FF0000", ""});

    REQUIRE(doc.paragraph_count() == 1);
    REQUIRE(doc.table_count() == 1);
    REQUIRE(table.column_count() == 2);

    std::string xml = doc.document_xml();
    REQUIRE(xml.find("Tom &amp; Jerry &lt;3&gt;") != std::string::npos);
    REQUIRE(xml.find("<w:jc w:val=\"center\"/>") != std::string::npos);
    REQUIRE(xml.find("<w:b/>") != std::string::npos);
    REQUIRE(xml.find("<w:sz w:val=\"32\"/>") != std::string::npos);
    REQUIRE(xml.find("<w:color w:val=\"FF0000\"/>") != std::string::npos);
    REQUIRE(xml.find("w:fill=\"1F4E79\"") != std::string::npos);
}

TEST_CASE("Images are sized from the JPEG header", "[docx]") {
    REQUIRE(DocxDocument::jpeg_dimensions(fake_jpeg(640, 480)) == std::make_pair(640, 480));
    REQUIRE_FALSE(DocxDocument::jpeg_dimensions("not a jpeg").has_value());

    DocxDocument doc;
    doc.add_image("photo", fake_jpeg(400, 200), 300.0);
    REQUIRE(doc.image_count() == 1);

    std::string xml = doc.document_xml();
    const auto cx = std::to_string(300 * DocxDocument::EMU_PER_POINT);
    const auto cy = std::to_string(150 * DocxDocument::EMU_PER_POINT);
    REQUIRE(xml.find("<wp:extent cx=\"" + cx + "\" cy=\"" + cy + "\"/>") != std::string::npos);
}

TEST_CASE("Saved documents contain the OOXML parts", "[docx]") {
    TempDirectory dir;
    const auto path = dir.path() / "report.docx";

    DocxDocument doc("Report");
    doc.add_paragraph().add_run("Body");
    doc.add_image("photo", fake_jpeg(), 200.0);
    doc.save(path.string());

    std::string bytes = read_file(path);
    for (const char* part : {"[Content_Types].xml", "_rels/.rels", "word/document.xml",
                             "word/_rels/document.xml.rels", "word/media/image1.jpeg"}) {
        INFO(part);
        REQUIRE(bytes.find(part) != std::string::npos);
    }
}
