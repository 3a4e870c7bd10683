/**
 * @file PhotoProcessor.hpp
 * @brief Quality-tier processing of single photos using GDAL
 *
 * ORIGINAL copies the source verbatim and keeps its modification time.
 * OPTIMIZED and COMPRESSED re-encode through the GDAL JPEG driver, downsizing
 * through a MEM dataset when the source is wider than the tier's width.
 */

#pragma once

#include "qreport_export.hpp"
#include "../core/Logger.hpp"
#include <cstdint>
#include <string>

class GDALDataset;

namespace qreport {

class PhotoProcessor {
public:
    struct Options {
        PhotoQuality quality;
        int max_width;           // Target width in pixels for OPTIMIZED

        Options()
            : quality(PhotoQuality::OPTIMIZED),
              max_width(800) {}
    };

    PhotoProcessor();
    explicit PhotoProcessor(const Options& options);

    /**
     * @brief Produce target from source according to the quality tier
     * @return Size of the written file in bytes
     * @throws PhotoProcessingError if the source is missing, cannot be decoded
     *         by GDAL, or nothing could be written
     *
     * When a decodable source fails to resample or encode, it is copied
     * verbatim instead.
     */
    std::uintmax_t process(const std::string& source_path, const std::string& target_path) const;

    const Options& options() const { return options_; }

private:
    Options options_;
    Logger logger_;

    std::uintmax_t copy_verbatim(const std::string& source_path, const std::string& target_path) const;

    /**
     * @brief Re-encode as JPEG, downsizing to target_width when wider
     * @return true if the JPEG driver wrote the target
     * @throws PhotoProcessingError if GDAL cannot decode the source
     */
    bool reencode_jpeg(const std::string& source_path, const std::string& target_path,
                       int target_width, int quality) const;

    /**
     * @brief Resample a dataset into a new MEM dataset of the given size
     * @return Owned dataset, or nullptr on failure
     */
    GDALDataset* resample_to(GDALDataset* source, int width, int height) const;
};

} // namespace qreport
