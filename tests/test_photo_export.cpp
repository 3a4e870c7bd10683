/**
 * @file test_photo_export.cpp
 * @brief Tests for the photo folder export
 */

#include <catch2/catch.hpp>

#include "TestFixtures.hpp"
#include "export/PhotoExportManager.hpp"
#include "export/PhotoNamingPolicy.hpp"
#include "export/PhotoProcessor.hpp"
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <set>

using namespace qreport;
using namespace qreport::test;
namespace fs = std::filesystem;

namespace {

PhotoExportManager::Options verbatim(PhotoNamingStrategy strategy, bool index = true) {
    PhotoExportManager::Options options;
    options.naming_strategy = strategy;
    options.quality = PhotoQuality::ORIGINAL;
    options.generate_index = index;
    return options;
}

/**
 * @brief One module with `count` photos spread over two items
 */
CheckupSnapshot snapshot_with_photos(const fs::path& photo_dir, int count) {
    CheckupSnapshot snapshot;
    snapshot.checkup_id = "photos-test";
    snapshot.header.equipment_type = "Press";

    CheckupModule module;
    module.key = "MECHANICS";
    module.display_name = "Mechanics";
    module.items.resize(2);
    module.items[0].id = "first";
    module.items[0].description = "Guides";
    module.items[1].id = "second";
    module.items[1].description = "Bearings";

    for (int i = 0; i < count; ++i) {
        Photo photo;
        photo.id = "p" + std::to_string(i);
        photo.file_name = "IMG_" + std::to_string(i) + ".jpg";
        photo.file_path = write_fake_jpeg(photo_dir / photo.file_name);
        module.items[i % 2].photos.push_back(photo);
    }

    snapshot.modules.push_back(module);
    return snapshot;
}

} // namespace

TEST_CASE("Photos are copied into the FOTO folder", "[photos]") {
    TempDirectory source;
    TempDirectory target;
    auto snapshot = snapshot_with_photos(source.path(), 4);

    PhotoExportManager manager(verbatim(PhotoNamingStrategy::STRUCTURED));
    PhotoExportResult result = manager.export_photos(snapshot, target.str());

    const fs::path folder = target.path() / PhotoExportManager::PHOTO_FOLDER_NAME;
    REQUIRE(result.folder_path == folder.string());
    REQUIRE(result.total_files == 4);
    REQUIRE(count_files(folder, ".jpg") == 4);
    REQUIRE(result.total_size_bytes == 4 * fake_jpeg().size());

    REQUIRE(result.index_file_path.has_value());
    std::string index = read_file(*result.index_file_path);
    REQUIRE(index.find("MODULO 1: Mechanics") != std::string::npos);
    for (const auto& photo : result.exported_photos) {
        REQUIRE(index.find(photo.file_name) != std::string::npos);
    }
}

TEST_CASE("Sequential names are dense and follow tree order", "[photos]") {
    TempDirectory source;
    TempDirectory target;
    auto snapshot = snapshot_with_photos(source.path(), 5);

    PhotoExportManager manager(verbatim(PhotoNamingStrategy::SEQUENTIAL, false));
    PhotoExportResult result = manager.export_photos(snapshot, target.str());

    REQUIRE(result.total_files == 5);
    REQUIRE_FALSE(result.index_file_path.has_value());

    // Item order first: photos 0, 2, 4 belong to the first item
    const char* expected_sources[] = {"IMG_0.jpg", "IMG_2.jpg", "IMG_4.jpg", "IMG_1.jpg", "IMG_3.jpg"};
    for (int i = 0; i < 5; ++i) {
        char expected[16];
        std::snprintf(expected, sizeof(expected), "foto_%03d.jpg", i + 1);
        REQUIRE(result.exported_photos[i].file_name == expected);
        REQUIRE(result.exported_photos[i].original.file_name == expected_sources[i]);
        REQUIRE(fs::exists(fs::path(result.folder_path) / expected));
    }
}

TEST_CASE("A missing source photo is skipped", "[photos]") {
    TempDirectory source;
    TempDirectory target;
    auto snapshot = snapshot_with_photos(source.path(), 4);
    fs::remove(snapshot.modules[0].items[1].photos[0].file_path);

    PhotoExportManager manager(verbatim(PhotoNamingStrategy::SEQUENTIAL));
    PhotoExportResult result = manager.export_photos(snapshot, target.str());

    REQUIRE(result.total_files == 3);
    REQUIRE(result.exported_photos.size() == 3);
    REQUIRE(count_files(result.folder_path, ".jpg") == 3);
    REQUIRE(result.exported_photos.back().file_name == "foto_003.jpg");
}

TEST_CASE("A checkup without photos yields an empty folder", "[photos]") {
    TempDirectory source;
    TempDirectory target;
    auto snapshot = snapshot_with_photos(source.path(), 0);

    PhotoExportManager manager(verbatim(PhotoNamingStrategy::STRUCTURED));
    PhotoExportResult result = manager.export_photos(snapshot, target.str());

    REQUIRE(result.total_files == 0);
    REQUIRE(result.exported_photos.empty());
    REQUIRE(fs::is_directory(result.folder_path));
    REQUIRE_FALSE(result.index_file_path.has_value());
}

TEST_CASE("Cancellation stops the photo loop", "[photos]") {
    TempDirectory source;
    TempDirectory target;
    auto snapshot = snapshot_with_photos(source.path(), 3);

    CancellationToken token;
    token.cancel();

    PhotoExportManager manager(verbatim(PhotoNamingStrategy::STRUCTURED));
    REQUIRE_THROWS_AS(manager.export_photos(snapshot, target.str(), &token), ExportCancelledError);
}

TEST_CASE("Photo collection carries context", "[photos]") {
    TempDirectory source;
    auto snapshot = snapshot_with_photos(source.path(), 3);

    auto photos = PhotoExportManager::collect_photos(snapshot);
    REQUIRE(photos.size() == 3);
    REQUIRE(photos[0].first.section_title == "Mechanics");
    REQUIRE(photos[0].first.item_title == "Guides");
    REQUIRE(photos[1].first.photo_index_in_item == 1);
    REQUIRE(photos[2].first.item_index == 1);
    REQUIRE(photos[2].first.item_title == "Bearings");
}

TEST_CASE("Photos sharing a caption get distinct names", "[photos]") {
    TempDirectory source;
    TempDirectory target;

    CheckupSnapshot snapshot;
    snapshot.checkup_id = "caption-clash";
    CheckupModule module;
    module.key = "SAFETY";
    module.display_name = "Safety";
    module.items.resize(1);
    module.items[0].id = "estop";
    module.items[0].description = "Emergency stop";
    for (int i = 0; i < 3; ++i) {
        Photo photo;
        photo.id = "p" + std::to_string(i);
        photo.caption = "Detail";
        photo.file_name = "IMG_" + std::to_string(i) + ".jpg";
        photo.file_path = write_fake_jpeg(source.path() / photo.file_name);
        module.items[0].photos.push_back(photo);
    }
    snapshot.modules.push_back(module);

    PhotoExportManager manager(verbatim(PhotoNamingStrategy::STRUCTURED));
    PhotoExportResult result = manager.export_photos(snapshot, target.str());

    REQUIRE(result.total_files == 3);
    REQUIRE(count_files(result.folder_path, ".jpg") == 3);
    REQUIRE(result.exported_photos[0].file_name == "01_safety_emergency-stop_detail.jpg");
    REQUIRE(result.exported_photos[1].file_name == "01_safety_emergency-stop_detail_2.jpg");
    REQUIRE(result.exported_photos[2].file_name == "01_safety_emergency-stop_detail_3.jpg");
}

TEST_CASE("Names truncated to the same prefix stay unique and short", "[photos]") {
    TempDirectory source;
    TempDirectory target;

    CheckupSnapshot snapshot;
    snapshot.checkup_id = "long-captions";
    CheckupModule module;
    module.key = "ELECTRICAL";
    module.display_name = "Electrical cabinet";
    module.items.resize(1);
    module.items[0].id = "wiring";
    module.items[0].description = "Terminal block wiring";
    const std::string long_caption(120, 'a');
    for (int i = 0; i < 2; ++i) {
        Photo photo;
        photo.id = "p" + std::to_string(i);
        photo.caption = long_caption + std::to_string(i);
        photo.file_name = "IMG_" + std::to_string(i) + ".jpg";
        photo.file_path = write_fake_jpeg(source.path() / photo.file_name);
        module.items[0].photos.push_back(photo);
    }
    snapshot.modules.push_back(module);

    PhotoExportManager manager(verbatim(PhotoNamingStrategy::STRUCTURED, false));
    PhotoExportResult result = manager.export_photos(snapshot, target.str());

    REQUIRE(result.total_files == 2);
    REQUIRE(count_files(result.folder_path, ".jpg") == 2);
    std::set<std::string> names;
    for (const auto& photo : result.exported_photos) {
        REQUIRE(photo.file_name.size() <= PhotoNamingPolicy::MAX_FILE_NAME_LENGTH);
        names.insert(photo.file_name);
    }
    REQUIRE(names.size() == 2);
    REQUIRE(result.exported_photos[1].file_name.find("_2.jpg") != std::string::npos);
}

TEST_CASE("An undecodable source is skipped when re-encoding", "[photos]") {
    TempDirectory source;
    TempDirectory target;
    auto snapshot = snapshot_with_photos(source.path(), 0);

    Photo broken;
    broken.id = "broken";
    broken.file_name = "broken.jpg";
    broken.file_path = (source.path() / "broken.jpg").string();
    {
        std::ofstream out(broken.file_path, std::ios::binary);
        out << "this is not an image";
    }
    snapshot.modules[0].items[0].photos.push_back(broken);

    PhotoExportManager::Options options;
    options.naming_strategy = PhotoNamingStrategy::SEQUENTIAL;
    options.quality = PhotoQuality::OPTIMIZED;
    PhotoExportManager manager(options);
    PhotoExportResult result = manager.export_photos(snapshot, target.str());

    REQUIRE(result.total_files == 0);
    REQUIRE(result.exported_photos.empty());
    REQUIRE(count_files(result.folder_path, ".jpg") == 0);

    SECTION("the processor reports it directly") {
        PhotoProcessor processor;
        REQUIRE_THROWS_AS(processor.process(broken.file_path, (target.path() / "out.jpg").string()),
                          PhotoProcessingError);
        REQUIRE_FALSE(fs::exists(target.path() / "out.jpg"));
    }
}

TEST_CASE("Re-encoding tiers downsize and compress", "[photos]") {
    TempDirectory source;
    TempDirectory target;
    const std::string original = write_decodable_jpeg(source.path() / "wide.jpg", 1600, 1200);

    PhotoProcessor::Options optimized_options;
    optimized_options.quality = PhotoQuality::OPTIMIZED;
    optimized_options.max_width = 800;
    PhotoProcessor optimized(optimized_options);

    PhotoProcessor::Options compressed_options = optimized_options;
    compressed_options.quality = PhotoQuality::COMPRESSED;
    PhotoProcessor compressed(compressed_options);

    const fs::path optimized_path = target.path() / "optimized.jpg";
    const fs::path compressed_path = target.path() / "compressed.jpg";
    std::uintmax_t optimized_size = optimized.process(original, optimized_path.string());
    std::uintmax_t compressed_size = compressed.process(original, compressed_path.string());

    REQUIRE(raster_width(optimized_path) == 800);
    REQUIRE(raster_width(compressed_path) <= 600);
    REQUIRE(raster_width(compressed_path) > 0);
    REQUIRE(optimized_size == fs::file_size(optimized_path));
    REQUIRE(compressed_size < optimized_size);
    REQUIRE(optimized_size < fs::file_size(original));
    REQUIRE_FALSE(fs::exists(target.path() / "optimized.jpg.aux.xml"));

    SECTION("a narrow source keeps its width") {
        const std::string narrow = write_decodable_jpeg(source.path() / "narrow.jpg", 320, 240);
        const fs::path narrow_out = target.path() / "narrow_out.jpg";
        optimized.process(narrow, narrow_out.string());
        REQUIRE(raster_width(narrow_out) == 320);
    }
}
