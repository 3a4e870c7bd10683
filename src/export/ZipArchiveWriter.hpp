/**
 * @file ZipArchiveWriter.hpp
 * @brief Minimal ZIP writer for OOXML packages, deflate through zlib
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace qreport {

/**
 * @brief Collects named entries in memory and writes them as a zip32 archive
 *
 * Entries are written in insertion order. Names use forward slashes and
 * must be unique. Already-compressed payloads (JPEG media) should be
 * added with Method::STORE.
 */
class ZipArchiveWriter {
public:
    enum class Method : std::uint16_t {
        STORE = 0,
        DEFLATE = 8
    };

    ZipArchiveWriter() = default;

    /**
     * @brief Add an entry from memory
     * @throws ExportError if the name is empty, duplicated or too long,
     *         or if zlib fails to compress it
     */
    void add_entry(const std::string& name, const std::string& data, Method method = Method::DEFLATE);

    /**
     * @brief Add an entry with the content of a file on disk
     * @throws ExportError if the file cannot be read
     */
    void add_file(const std::string& name, const std::string& path, Method method = Method::STORE);

    /**
     * @brief Write the archive
     * @throws ExportError with FILE_WRITE_FAILED on I/O failure or zip32 overflow
     */
    void write(const std::string& path) const;

    size_t entry_count() const { return entries_.size(); }
    bool has_entry(const std::string& name) const;

    /**
     * @brief CRC-32 as stored in zip headers (zlib's crc32)
     */
    static std::uint32_t crc32(const char* data, std::size_t size);

    /**
     * @brief Raw deflate stream (no zlib or gzip wrapper), as zip method 8 expects
     * @throws ExportError if zlib reports an error
     */
    static std::string deflate_raw(const std::string& data);

private:
    struct Entry {
        std::string name;
        std::string payload;            // As written: compressed for DEFLATE
        std::uint32_t crc32 = 0;
        std::uint32_t uncompressed_size = 0;
        Method method = Method::STORE;
    };

    std::vector<Entry> entries_;
};

} // namespace qreport
