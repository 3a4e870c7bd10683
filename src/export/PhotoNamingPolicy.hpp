/**
 * @file PhotoNamingPolicy.hpp
 * @brief Output file names and processing parameters for exported photos
 *
 * Copyright (c) 2026 The QReport Authors
 * Licensed under the MIT License.
 */

#pragma once

#include "qreport_export.hpp"
#include <cstddef>
#include <string>

namespace qreport {

/**
 * @brief Pure naming and quality rules for exported photos
 *
 * Names are computed only from the photo, its position in the checkup tree
 * and its global traversal index, so the same snapshot always yields the
 * same folder layout.
 */
class PhotoNamingPolicy {
public:
    static constexpr std::size_t MAX_FILE_NAME_LENGTH = 80;
    static constexpr const char* EXTENSION = ".jpg";

    /**
     * @brief Compute the exported file name of one photo
     * @param context Position of the photo in the checkup tree
     * @param global_index 0-based position in the flattened photo list
     * @param strategy Naming strategy
     * @param photo The photo itself (caption, capture time)
     * @return File name including the .jpg extension
     */
    static std::string file_name(const PhotoContext& context,
                                 int global_index,
                                 PhotoNamingStrategy strategy,
                                 const Photo& photo);

    /**
     * @brief Variant of file_name carrying a counter suffix ("_2", "_3", ...)
     *
     * The stem is shortened so the result stays within MAX_FILE_NAME_LENGTH.
     */
    static std::string with_counter(const std::string& file_name, int counter);

    /**
     * @brief Lower-case, hyphenate spaces, strip anything outside [a-z0-9-]
     *
     * Runs of hyphens collapse to one and leading/trailing hyphens are removed.
     */
    static std::string normalize_segment(const std::string& text);

    /**
     * @brief JPEG encoder quality for a tier (100, 85, 70)
     */
    static int encoder_quality(PhotoQuality quality);

    /**
     * @brief Width photos are downsized to, or 0 when the tier keeps the source
     */
    static int target_width(PhotoQuality quality, int photo_max_width);

private:
    static std::string structured_name(const PhotoContext& context, const Photo& photo);
    static std::string zero_padded(int value, int width);
};

} // namespace qreport
