/**
 * @file PhotoExportManager.cpp
 * @brief Implementation of the FOTO folder export
 */

#include "PhotoExportManager.hpp"
#include "PhotoNamingPolicy.hpp"
#include "TextFormatter.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>

namespace qreport {

namespace fs = std::filesystem;

PhotoExportManager::PhotoExportManager()
    : options_(), processor_(processor_options(options_)), logger_("PhotoExportManager") {
}

PhotoExportManager::PhotoExportManager(const Options& options)
    : options_(options), processor_(processor_options(options)), logger_("PhotoExportManager") {
}

PhotoProcessor::Options PhotoExportManager::processor_options(const Options& options) {
    PhotoProcessor::Options processor;
    processor.quality = options.quality;
    processor.max_width = options.photo_max_width;
    return processor;
}

std::vector<std::pair<PhotoContext, Photo>> PhotoExportManager::collect_photos(
    const CheckupSnapshot& snapshot) {

    std::vector<std::pair<PhotoContext, Photo>> photos;

    for (size_t m = 0; m < snapshot.modules.size(); ++m) {
        const auto& module = snapshot.modules[m];

        for (size_t i = 0; i < module.items.size(); ++i) {
            const auto& item = module.items[i];

            for (size_t p = 0; p < item.photos.size(); ++p) {
                PhotoContext context;
                context.section_index = static_cast<int>(m);
                context.section_title = module.display_name;
                context.item_id = item.id;
                context.item_title = item.description;
                context.item_index = static_cast<int>(i);
                context.item_status = item.status;
                context.item_criticality = item.criticality;
                context.photo_index_in_item = static_cast<int>(p);
                photos.emplace_back(context, item.photos[p]);
            }
        }
    }

    return photos;
}

std::string PhotoExportManager::create_photo_folder(const std::string& target_directory) const {
    fs::path folder = fs::path(target_directory) / PHOTO_FOLDER_NAME;

    std::error_code ec;
    fs::create_directories(folder, ec);
    if (ec) {
        throw ExportError(ExportErrorCode::PHOTO_EXPORT_FAILED,
                          "Cannot create photo folder " + folder.string() + ": " + ec.message());
    }
    return folder.string();
}

PhotoExportResult PhotoExportManager::export_photos(const CheckupSnapshot& snapshot,
                                                    const std::string& target_directory,
                                                    const CancellationToken* cancellation) const {
    PhotoExportResult result;
    result.folder_path = create_photo_folder(target_directory);

    auto photos = collect_photos(snapshot);
    logger_.detailed("Photos to export: " + std::to_string(photos.size()) +
                     " (" + to_string(options_.naming_strategy) + ", " +
                     to_string(options_.quality) + ")");

    if (photos.empty()) {
        return result;
    }

    std::set<std::string> used_names;

    for (size_t index = 0; index < photos.size(); ++index) {
        CancellationToken::check(cancellation);

        const auto& [context, photo] = photos[index];
        // Numbered by photos written so far, so a skipped photo leaves no gap
        std::string file_name = PhotoNamingPolicy::file_name(
            context, static_cast<int>(result.exported_photos.size()), options_.naming_strategy, photo);
        if (used_names.count(file_name) > 0) {
            const std::string base_name = file_name;
            int counter = 2;
            do {
                file_name = PhotoNamingPolicy::with_counter(base_name, counter++);
            } while (used_names.count(file_name) > 0);
            logger_.detailed("Name clash on " + base_name + ", using " + file_name);
        }
        std::string target_path = (fs::path(result.folder_path) / file_name).string();

        try {
            ExportedPhoto exported;
            exported.original = photo;
            exported.context = context;
            exported.file_name = file_name;
            exported.file_path = target_path;
            exported.size_bytes = processor_.process(photo.file_path, target_path);

            result.total_size_bytes += exported.size_bytes;
            result.exported_photos.push_back(std::move(exported));
            used_names.insert(file_name);
            logger_.trace("Exported photo: " + file_name);
        } catch (const ExportError& e) {
            logger_.warning("Skipping photo " + photo.file_name + ": " + e.what());
        } catch (const fs::filesystem_error& e) {
            logger_.warning("Skipping photo " + photo.file_name + ": " + e.what());
        }
    }

    result.total_files = static_cast<int>(result.exported_photos.size());

    if (options_.generate_index) {
        result.index_file_path = write_index(result.folder_path, snapshot, result.exported_photos);
    }

    logger_.info("Exported " + std::to_string(result.total_files) + "/" +
                 std::to_string(photos.size()) + " photos (" +
                 TextFormatter::format_file_size(result.total_size_bytes) + ")");
    return result;
}

std::optional<std::string> PhotoExportManager::write_index(const std::string& folder,
                                                           const CheckupSnapshot& snapshot,
                                                           const std::vector<ExportedPhoto>& photos) const {
    try {
        fs::path index_path = fs::path(folder) / INDEX_FILE_NAME;
        std::ofstream out(index_path);
        if (!out) {
            logger_.warning("Cannot open photo index for writing: " + index_path.string());
            return std::nullopt;
        }

        out << build_index(snapshot, photos);
        out.close();
        if (!out) {
            logger_.warning("Failed writing photo index: " + index_path.string());
            return std::nullopt;
        }
        return index_path.string();
    } catch (const std::exception& e) {
        logger_.warning(std::string("Photo index not generated: ") + e.what());
        return std::nullopt;
    }
}

std::string PhotoExportManager::build_index(const CheckupSnapshot& snapshot,
                                            const std::vector<ExportedPhoto>& photos) {
    std::ostringstream out;

    out << "# PHOTO INDEX - " << snapshot.header.equipment_type << "\n";
    out << "# Generated: " << TextFormatter::format_timestamp(std::chrono::system_clock::now()) << "\n";
    out << "# Client: " << snapshot.header.client_company << "\n";
    out << "# Technician: " << snapshot.header.technician_name << "\n";
    out << "#\n";
    out << "# Format: [FILE_NAME] -> [MODULE] -> [CHECK_ITEM] -> [STATUS]\n";
    out << std::string(80, '=') << "\n\n";

    std::set<int> modules;
    std::set<std::pair<int, int>> items;
    std::uintmax_t total_size = 0;

    // Photos arrive in traversal order, so groups are contiguous
    int current_module = -1;
    int current_item = -1;
    for (const auto& photo : photos) {
        const auto& ctx = photo.context;

        if (ctx.section_index != current_module) {
            if (current_module >= 0) {
                out << "\n";
            }
            out << "MODULO " << (ctx.section_index + 1) << ": " << ctx.section_title << "\n";
            out << std::string(50, '-') << "\n";
            current_module = ctx.section_index;
            current_item = -1;
        }

        if (ctx.item_index != current_item) {
            out << "\n";
            out << "  Check Item: " << ctx.item_title << "\n";
            out << "  Status: " << to_string(ctx.item_status)
                << " | Criticality: " << to_string(ctx.item_criticality) << "\n";
            out << "  Photos:\n";
            current_item = ctx.item_index;
        }

        out << "    - " << photo.file_name << "\n";
        if (!photo.original.caption.empty()) {
            out << "      Caption: " << photo.original.caption << "\n";
        }
        out << "      Size: " << TextFormatter::format_file_size(photo.size_bytes) << "\n";
        out << "\n";

        modules.insert(ctx.section_index);
        items.emplace(ctx.section_index, ctx.item_index);
        total_size += photo.size_bytes;
    }

    out << "\n" << std::string(80, '=') << "\n";
    out << "SUMMARY:\n";
    out << "Total photos: " << photos.size() << "\n";
    out << "Modules: " << modules.size() << "\n";
    out << "Check items with photos: " << items.size() << "\n";
    out << "Total size: " << TextFormatter::format_file_size(total_size) << "\n";

    return out.str();
}

} // namespace qreport
