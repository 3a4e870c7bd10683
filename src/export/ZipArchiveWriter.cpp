/**
 * @file ZipArchiveWriter.cpp
 * @brief Implementation of the ZIP writer
 */

#include "ZipArchiveWriter.hpp"
#include "qreport_export.hpp"
#include <zlib.h>
#include <algorithm>
#include <array>
#include <fstream>
#include <iterator>

namespace qreport {

namespace {

constexpr std::uint32_t LOCAL_FILE_HEADER_SIGNATURE = 0x04034b50U;
constexpr std::uint32_t CENTRAL_DIRECTORY_SIGNATURE = 0x02014b50U;
constexpr std::uint32_t END_OF_CENTRAL_DIRECTORY_SIGNATURE = 0x06054b50U;
constexpr std::uint16_t ZIP_VERSION = 20;
constexpr std::uint16_t DOS_DATE_1980_01_01 = 0x0021;
constexpr std::uint64_t ZIP32_LIMIT = 0xFFFFFFFFULL;

void write_u16(std::ofstream& out, std::uint16_t value) {
    const std::array<char, 2> bytes = {
        static_cast<char>(value & 0xFFU),
        static_cast<char>((value >> 8) & 0xFFU),
    };
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
}

void write_u32(std::ofstream& out, std::uint32_t value) {
    const std::array<char, 4> bytes = {
        static_cast<char>(value & 0xFFU),
        static_cast<char>((value >> 8) & 0xFFU),
        static_cast<char>((value >> 16) & 0xFFU),
        static_cast<char>((value >> 24) & 0xFFU),
    };
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
}

std::uint32_t stream_offset(std::ofstream& out) {
    const std::streamoff offset = out.tellp();
    if (offset < 0 || static_cast<std::uint64_t>(offset) > ZIP32_LIMIT) {
        throw ExportError(ExportErrorCode::FILE_WRITE_FAILED, "Zip offset overflow");
    }
    return static_cast<std::uint32_t>(offset);
}

} // namespace

std::uint32_t ZipArchiveWriter::crc32(const char* data, std::size_t size) {
    uLong crc = ::crc32(0L, Z_NULL, 0);
    // zlib takes uInt lengths; feed large buffers in slices
    while (size > 0) {
        const uInt chunk = static_cast<uInt>(std::min<std::size_t>(size, 1U << 30));
        crc = ::crc32(crc, reinterpret_cast<const Bytef*>(data), chunk);
        data += chunk;
        size -= chunk;
    }
    return static_cast<std::uint32_t>(crc);
}

std::string ZipArchiveWriter::deflate_raw(const std::string& data) {
    z_stream stream{};
    // Negative window bits: raw deflate without header or trailer
    if (deflateInit2(&stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        throw ExportError(ExportErrorCode::FILE_WRITE_FAILED, "zlib deflateInit2 failed");
    }

    std::string compressed;
    compressed.resize(deflateBound(&stream, static_cast<uLong>(data.size())));

    stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    stream.avail_in = static_cast<uInt>(data.size());
    stream.next_out = reinterpret_cast<Bytef*>(compressed.data());
    stream.avail_out = static_cast<uInt>(compressed.size());

    const int status = deflate(&stream, Z_FINISH);
    const uLong written = stream.total_out;
    deflateEnd(&stream);

    if (status != Z_STREAM_END) {
        throw ExportError(ExportErrorCode::FILE_WRITE_FAILED,
                          "zlib deflate failed with status " + std::to_string(status));
    }
    compressed.resize(written);
    return compressed;
}

bool ZipArchiveWriter::has_entry(const std::string& name) const {
    for (const auto& entry : entries_) {
        if (entry.name == name) return true;
    }
    return false;
}

void ZipArchiveWriter::add_entry(const std::string& name, const std::string& data, Method method) {
    if (name.empty() || name.size() > 0xFFFFU) {
        throw ExportError(ExportErrorCode::FILE_WRITE_FAILED, "Invalid zip entry name: '" + name + "'");
    }
    if (has_entry(name)) {
        throw ExportError(ExportErrorCode::FILE_WRITE_FAILED, "Duplicate zip entry: " + name);
    }
    // Single-call deflate needs the input to fit zlib's 32-bit counters too
    if (data.size() > ZIP32_LIMIT) {
        throw ExportError(ExportErrorCode::FILE_WRITE_FAILED, "Zip entry too large: " + name);
    }

    Entry entry;
    entry.name = name;
    entry.method = method;
    entry.crc32 = crc32(data.data(), data.size());
    entry.uncompressed_size = static_cast<std::uint32_t>(data.size());
    entry.payload = method == Method::DEFLATE ? deflate_raw(data) : data;
    entries_.push_back(std::move(entry));
}

void ZipArchiveWriter::add_file(const std::string& name, const std::string& path, Method method) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw ExportError(ExportErrorCode::FILE_WRITE_FAILED, "Cannot read file for zip entry: " + path);
    }
    std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw ExportError(ExportErrorCode::FILE_WRITE_FAILED, "Failed reading " + path);
    }
    add_entry(name, data, method);
}

void ZipArchiveWriter::write(const std::string& path) const {
    if (entries_.size() > 0xFFFFU) {
        throw ExportError(ExportErrorCode::FILE_WRITE_FAILED, "Too many entries for zip32");
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw ExportError(ExportErrorCode::FILE_WRITE_FAILED, "Cannot open archive for writing: " + path);
    }

    std::vector<std::uint32_t> offsets;
    offsets.reserve(entries_.size());

    // Local file headers + data
    for (const auto& entry : entries_) {
        offsets.push_back(stream_offset(out));
        const auto compressed_size = static_cast<std::uint32_t>(entry.payload.size());

        write_u32(out, LOCAL_FILE_HEADER_SIGNATURE);
        write_u16(out, ZIP_VERSION);
        write_u16(out, 0);                      // general purpose flags
        write_u16(out, static_cast<std::uint16_t>(entry.method));
        write_u16(out, 0);                      // mod time
        write_u16(out, DOS_DATE_1980_01_01);    // mod date
        write_u32(out, entry.crc32);
        write_u32(out, compressed_size);
        write_u32(out, entry.uncompressed_size);
        write_u16(out, static_cast<std::uint16_t>(entry.name.size()));
        write_u16(out, 0);                      // extra length
        out.write(entry.name.data(), static_cast<std::streamsize>(entry.name.size()));
        out.write(entry.payload.data(), static_cast<std::streamsize>(entry.payload.size()));
        if (!out) {
            throw ExportError(ExportErrorCode::FILE_WRITE_FAILED, "Failed writing zip entry " + entry.name);
        }
    }

    const std::uint32_t central_offset = stream_offset(out);

    for (size_t i = 0; i < entries_.size(); ++i) {
        const auto& entry = entries_[i];
        write_u32(out, CENTRAL_DIRECTORY_SIGNATURE);
        write_u16(out, ZIP_VERSION);            // made by
        write_u16(out, ZIP_VERSION);            // needed
        write_u16(out, 0);
        write_u16(out, static_cast<std::uint16_t>(entry.method));
        write_u16(out, 0);
        write_u16(out, DOS_DATE_1980_01_01);
        write_u32(out, entry.crc32);
        write_u32(out, static_cast<std::uint32_t>(entry.payload.size()));
        write_u32(out, entry.uncompressed_size);
        write_u16(out, static_cast<std::uint16_t>(entry.name.size()));
        write_u16(out, 0);                      // extra length
        write_u16(out, 0);                      // comment length
        write_u16(out, 0);                      // disk start
        write_u16(out, 0);                      // internal attributes
        write_u32(out, 0);                      // external attributes
        write_u32(out, offsets[i]);
        out.write(entry.name.data(), static_cast<std::streamsize>(entry.name.size()));
    }

    const std::uint32_t central_end = stream_offset(out);

    write_u32(out, END_OF_CENTRAL_DIRECTORY_SIGNATURE);
    write_u16(out, 0);
    write_u16(out, 0);
    write_u16(out, static_cast<std::uint16_t>(entries_.size()));
    write_u16(out, static_cast<std::uint16_t>(entries_.size()));
    write_u32(out, central_end - central_offset);
    write_u32(out, central_offset);
    write_u16(out, 0);                          // comment length

    out.close();
    if (!out) {
        throw ExportError(ExportErrorCode::FILE_WRITE_FAILED, "Failed finalizing archive " + path);
    }
}

} // namespace qreport
