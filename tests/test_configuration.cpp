/**
 * @file test_configuration.cpp
 * @brief Tests for the JSON configuration file
 */

#include <catch2/catch.hpp>

#include "TestFixtures.hpp"
#include "cli/ConfigurationManager.hpp"
#include <nlohmann/json.hpp>
#include <fstream>

using namespace qreport;
using namespace qreport::test;
using json = nlohmann::json;

TEST_CASE("Default configuration", "[config]") {
    ConfigurationManager config = ConfigurationManager::defaults();

    REQUIRE(config.exports_root() == "exports");
    REQUIRE(config.get_int("cleanup_older_than_days") == 30);
    REQUIRE(config.get_int("large_export_threshold_mb") == 100);

    ExportOptions options = config.to_export_options();
    REQUIRE(options.formats == std::vector<ExportFormat>{ExportFormat::DOCUMENT, ExportFormat::TEXT});
    REQUIRE(options.naming_strategy == PhotoNamingStrategy::STRUCTURED);
    REQUIRE(options.photo_quality == PhotoQuality::OPTIMIZED);
    REQUIRE(options.photo_max_width == 800);
    REQUIRE(options.max_photos_per_module == 4);
    REQUIRE(options.include_photos);
    REQUIRE(options.create_timestamped_directory);
    REQUIRE_FALSE(options.write_manifest);
}

TEST_CASE("Configuration survives a save and load", "[config]") {
    TempDirectory dir;
    const std::string path = (dir.path() / "qreport.json").string();

    ConfigurationManager original = ConfigurationManager::defaults();
    ExportOptions options;
    options.formats = {ExportFormat::PHOTO_FOLDER, ExportFormat::COMBINED_PACKAGE};
    options.naming_strategy = PhotoNamingStrategy::SEQUENTIAL;
    options.photo_quality = PhotoQuality::COMPRESSED;
    options.photo_max_width = 1024;
    options.include_notes = false;
    options.write_manifest = true;
    original.from_export_options(options);
    original.set_value("exports_root", "/srv/checkups");
    REQUIRE(original.save_to_file(path));

    SECTION("typed JSON values are written") {
        std::ifstream in(path);
        json saved = json::parse(in);
        REQUIRE(saved["photo_max_width"] == 1024);
        REQUIRE(saved["include_notes"] == false);
        REQUIRE(saved["formats"] == "photos,combined");
    }

    SECTION("loaded options match") {
        ConfigurationManager loaded;
        REQUIRE(loaded.load_from_file(path));
        REQUIRE(loaded.exports_root() == "/srv/checkups");

        ExportOptions restored = loaded.to_export_options();
        REQUIRE(restored.formats == options.formats);
        REQUIRE(restored.naming_strategy == PhotoNamingStrategy::SEQUENTIAL);
        REQUIRE(restored.photo_quality == PhotoQuality::COMPRESSED);
        REQUIRE(restored.photo_max_width == 1024);
        REQUIRE_FALSE(restored.include_notes);
        REQUIRE(restored.write_manifest);
    }
}

TEST_CASE("Formats may be given as a JSON array", "[config]") {
    TempDirectory dir;
    const auto path = dir.path() / "array.json";
    {
        std::ofstream out(path);
        out << R"({"formats": ["text", "photos"], "photo_max_width": 640, "include_photos": false})";
    }

    ConfigurationManager config;
    REQUIRE(config.load_from_file(path.string()));

    ExportOptions options = config.to_export_options();
    REQUIRE(options.formats == std::vector<ExportFormat>{ExportFormat::TEXT, ExportFormat::PHOTO_FOLDER});
    REQUIRE(options.photo_max_width == 640);
    REQUIRE_FALSE(options.include_photos);
}

TEST_CASE("Unreadable configuration files are rejected", "[config]") {
    TempDirectory dir;
    ConfigurationManager config;

    REQUIRE_FALSE(config.load_from_file((dir.path() / "missing.json").string()));

    const auto malformed = dir.path() / "malformed.json";
    {
        std::ofstream out(malformed);
        out << "{ \"formats\": ";
    }
    REQUIRE_FALSE(config.load_from_file(malformed.string()));

    const auto not_object = dir.path() / "list.json";
    {
        std::ofstream out(not_object);
        out << "[1, 2, 3]";
    }
    REQUIRE_FALSE(config.load_from_file(not_object.string()));
}

TEST_CASE("Format lists are parsed leniently", "[config]") {
    std::vector<std::string> unknown;
    auto formats = ConfigurationManager::parse_formats(" docx, TXT ,pdf,,document,package", &unknown);

    REQUIRE(formats == std::vector<ExportFormat>{ExportFormat::DOCUMENT, ExportFormat::TEXT,
                                                 ExportFormat::COMBINED_PACKAGE});
    REQUIRE(unknown == std::vector<std::string>{"pdf"});
    REQUIRE(ConfigurationManager::join_formats(formats) == "document,text,combined");
}

TEST_CASE("Malformed numbers fall back to defaults", "[config]") {
    ConfigurationManager config;
    config.set_value("photo_max_width", "wide");
    config.set_value("include_photos", "no");

    REQUIRE(config.get_int("photo_max_width", 800) == 800);
    REQUIRE_FALSE(config.get_bool("include_photos", true));
    REQUIRE(config.get_bool("absent", true));
}
