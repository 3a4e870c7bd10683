/**
 * @file PhotoProcessor.cpp
 * @brief Implementation of quality-tier photo processing
 */

#include "PhotoProcessor.hpp"
#include "PhotoNamingPolicy.hpp"
#include <gdal_priv.h>
#include <cpl_conv.h>
#include <cpl_string.h>
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <optional>
#include <vector>

namespace qreport {

namespace fs = std::filesystem;

PhotoProcessor::PhotoProcessor()
    : options_(), logger_("PhotoProcessor") {
    GDALAllRegister();
}

PhotoProcessor::PhotoProcessor(const Options& options)
    : options_(options), logger_("PhotoProcessor") {
    GDALAllRegister();
}

std::uintmax_t PhotoProcessor::process(const std::string& source_path,
                                       const std::string& target_path) const {
    std::error_code ec;
    if (!fs::is_regular_file(source_path, ec)) {
        throw PhotoProcessingError("Source photo not found: " + source_path);
    }

    if (options_.quality == PhotoQuality::ORIGINAL) {
        return copy_verbatim(source_path, target_path);
    }

    int width = PhotoNamingPolicy::target_width(options_.quality, options_.max_width);
    int quality = PhotoNamingPolicy::encoder_quality(options_.quality);

    if (reencode_jpeg(source_path, target_path, width, quality)) {
        std::uintmax_t size = fs::file_size(target_path, ec);
        if (!ec) {
            return size;
        }
    }

    // Decodable source whose resample or encode step failed
    logger_.warning("Re-encoding failed, copying original: " + source_path);
    return copy_verbatim(source_path, target_path);
}

std::uintmax_t PhotoProcessor::copy_verbatim(const std::string& source_path,
                                             const std::string& target_path) const {
    std::error_code ec;
    fs::copy_file(source_path, target_path, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        throw PhotoProcessingError("Cannot copy " + source_path + ": " + ec.message());
    }

    auto modified = fs::last_write_time(source_path, ec);
    if (!ec) {
        fs::last_write_time(target_path, modified, ec);
        if (ec) {
            logger_.debug("Could not preserve modification time of " + target_path);
        }
    }

    std::uintmax_t size = fs::file_size(target_path, ec);
    if (ec) {
        throw PhotoProcessingError("Cannot stat " + target_path + ": " + ec.message());
    }
    return size;
}

GDALDataset* PhotoProcessor::resample_to(GDALDataset* source, int width, int height) const {
    GDALDriver* mem_driver = GetGDALDriverManager()->GetDriverByName("MEM");
    if (!mem_driver) {
        logger_.error("MEM driver not available");
        return nullptr;
    }

    int bands = source->GetRasterCount();
    GDALDataset* resized = mem_driver->Create("", width, height, bands, GDT_Byte, nullptr);
    if (!resized) {
        logger_.error("Failed to create MEM dataset");
        return nullptr;
    }

    const int src_width = source->GetRasterXSize();
    const int src_height = source->GetRasterYSize();
    std::vector<uint8_t> buffer(static_cast<size_t>(width) * height);

    GDALRasterIOExtraArg extra;
    INIT_RASTERIO_EXTRA_ARG(extra);
    extra.eResampleAlg = GRIORA_Bilinear;

    for (int band = 1; band <= bands; ++band) {
        CPLErr err = source->GetRasterBand(band)->RasterIO(GF_Read, 0, 0, src_width, src_height,
                                                           buffer.data(), width, height,
                                                           GDT_Byte, 0, 0, &extra);
        if (err == CE_None) {
            err = resized->GetRasterBand(band)->RasterIO(GF_Write, 0, 0, width, height,
                                                         buffer.data(), width, height,
                                                         GDT_Byte, 0, 0);
        }
        if (err != CE_None) {
            logger_.error("Failed to resample raster band " + std::to_string(band));
            GDALClose(resized);
            return nullptr;
        }
    }

    return resized;
}

bool PhotoProcessor::reencode_jpeg(const std::string& source_path, const std::string& target_path,
                                   int target_width, int quality) const {
    GDALDataset* source = static_cast<GDALDataset*>(GDALOpen(source_path.c_str(), GA_ReadOnly));
    if (!source) {
        throw PhotoProcessingError("Cannot decode photo: " + source_path);
    }

    const int width = source->GetRasterXSize();
    const int height = source->GetRasterYSize();
    if (source->GetRasterCount() <= 0 || width <= 0 || height <= 0) {
        GDALClose(source);
        throw PhotoProcessingError("Photo has no raster data: " + source_path);
    }

    GDALDataset* resized = nullptr;
    if (target_width > 0 && width > target_width) {
        int new_height = std::max(1, static_cast<int>(std::lround(
            static_cast<double>(height) * target_width / width)));
        resized = resample_to(source, target_width, new_height);
        if (!resized) {
            GDALClose(source);
            return false;
        }
        logger_.trace("Resized " + std::to_string(width) + "x" + std::to_string(height) +
                      " -> " + std::to_string(target_width) + "x" + std::to_string(new_height));
    }

    GDALDriver* jpeg_driver = GetGDALDriverManager()->GetDriverByName("JPEG");
    if (!jpeg_driver) {
        logger_.error("JPEG driver not available");
        if (resized) GDALClose(resized);
        GDALClose(source);
        return false;
    }

    char** creation_options = nullptr;
    creation_options = CSLSetNameValue(creation_options, "QUALITY", std::to_string(quality).c_str());

    // Keep .aux.xml side files out of the photo folder
    const char* pam_value = CPLGetThreadLocalConfigOption("GDAL_PAM_ENABLED", nullptr);
    std::optional<std::string> old_pam_setting;
    if (pam_value) old_pam_setting = std::string(pam_value);
    CPLSetThreadLocalConfigOption("GDAL_PAM_ENABLED", "NO");

    GDALDataset* jpeg_dataset = jpeg_driver->CreateCopy(
        target_path.c_str(),
        resized ? resized : source,
        FALSE,
        creation_options,
        nullptr,
        nullptr
    );

    CPLSetThreadLocalConfigOption("GDAL_PAM_ENABLED", old_pam_setting ? old_pam_setting->c_str() : nullptr);
    CSLDestroy(creation_options);

    if (resized) GDALClose(resized);
    GDALClose(source);

    if (!jpeg_dataset) {
        logger_.debug("JPEG driver failed for " + target_path);
        return false;
    }

    GDALClose(jpeg_dataset);
    return true;
}

} // namespace qreport
