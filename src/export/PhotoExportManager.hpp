/**
 * @file PhotoExportManager.hpp
 * @brief Exports every photo of a checkup into a FOTO folder
 *
 * Copyright (c) 2026 The QReport Authors
 * Licensed under the MIT License.
 */

#pragma once

#include "qreport_export.hpp"
#include "PhotoProcessor.hpp"
#include "../core/CancellationToken.hpp"
#include "../core/Logger.hpp"
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace qreport {

/**
 * @brief Walks module -> item -> photo, names and processes each photo
 *
 * Failures are isolated per photo: a photo that cannot be processed is
 * logged and skipped, and the remaining photos are still exported. The
 * optional INDICE_FOTO.txt index is best-effort.
 */
class PhotoExportManager {
public:
    static constexpr const char* PHOTO_FOLDER_NAME = "FOTO";
    static constexpr const char* INDEX_FILE_NAME = "INDICE_FOTO.txt";

    struct Options {
        PhotoNamingStrategy naming_strategy;
        PhotoQuality quality;
        int photo_max_width;
        bool generate_index;

        Options()
            : naming_strategy(PhotoNamingStrategy::STRUCTURED),
              quality(PhotoQuality::OPTIMIZED),
              photo_max_width(800),
              generate_index(true) {}
    };

    PhotoExportManager();
    explicit PhotoExportManager(const Options& options);

    /**
     * @brief Export all photos of the snapshot into target_directory/FOTO
     * @param snapshot Checkup to export
     * @param target_directory Parent directory of the FOTO folder
     * @param cancellation Optional token checked before each photo
     * @return Exported photos in traversal order
     * @throws ExportError if the FOTO folder cannot be created
     * @throws ExportCancelledError if cancelled between photos
     */
    PhotoExportResult export_photos(const CheckupSnapshot& snapshot,
                                    const std::string& target_directory,
                                    const CancellationToken* cancellation = nullptr) const;

    /**
     * @brief Flatten the checkup tree into (context, photo) pairs in traversal order
     */
    static std::vector<std::pair<PhotoContext, Photo>> collect_photos(const CheckupSnapshot& snapshot);

    /**
     * @brief Render the content of INDICE_FOTO.txt
     */
    static std::string build_index(const CheckupSnapshot& snapshot,
                                   const std::vector<ExportedPhoto>& photos);

    const Options& options() const { return options_; }

private:
    Options options_;
    PhotoProcessor processor_;
    Logger logger_;

    std::string create_photo_folder(const std::string& target_directory) const;

    std::optional<std::string> write_index(const std::string& folder,
                                           const CheckupSnapshot& snapshot,
                                           const std::vector<ExportedPhoto>& photos) const;

    static PhotoProcessor::Options processor_options(const Options& options);
};

} // namespace qreport
