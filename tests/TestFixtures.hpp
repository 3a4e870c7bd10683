/**
 * @file TestFixtures.hpp
 * @brief Shared helpers for the export tests
 */

#pragma once

#include "qreport_export.hpp"
#include <filesystem>
#include <initializer_list>
#include <string>

namespace qreport::test {

/**
 * @brief Unique scratch directory, removed on destruction
 */
class TempDirectory {
public:
    TempDirectory();
    ~TempDirectory();

    const std::filesystem::path& path() const { return path_; }
    std::string str() const { return path_.string(); }

private:
    std::filesystem::path path_;

    TempDirectory(const TempDirectory&) = delete;
    TempDirectory& operator=(const TempDirectory&) = delete;
};

/**
 * @brief Minimal JPEG byte stream: SOI, SOF0 with the given size, EOI
 *
 * Enough for dimension sniffing and verbatim copies; not decodable.
 */
std::string fake_jpeg(int width = 640, int height = 480);

/**
 * @brief Write fake_jpeg() to path and return the path
 */
std::string write_fake_jpeg(const std::filesystem::path& path);

/**
 * @brief Write a decodable RGB JPEG through the GDAL MEM and JPEG drivers
 *
 * The raster holds a textured pattern so encoder quality affects file size.
 */
std::string write_decodable_jpeg(const std::filesystem::path& path, int width, int height);

/**
 * @brief Pixel width of a raster file as GDAL reads it, or -1 if it cannot be opened
 */
int raster_width(const std::filesystem::path& path);

/**
 * @brief Two modules, three items, two photos (files written under photo_dir)
 *
 * Module 1 "Safety Systems": emergency stop (OK, 1 photo), light curtain
 * (NOK, CRITICAL, 1 photo). Module 2 "Hydraulics": pump pressure (OK).
 * One spare part.
 */
CheckupSnapshot sample_snapshot(const std::filesystem::path& photo_dir);

/**
 * @brief Options for tests: verbatim photo copies, no timestamped directory
 */
ExportOptions test_options(std::initializer_list<ExportFormat> formats);

std::string read_file(const std::filesystem::path& path);

int count_files(const std::filesystem::path& directory, const std::string& extension);

} // namespace qreport::test
