/**
 * @file test_checkup_file_loader.cpp
 * @brief Tests for checkup files and command-line parsing
 */

#include <catch2/catch.hpp>

#include "TestFixtures.hpp"
#include "cli/CheckupFileLoader.hpp"
#include "cli/CommandLineInterface.hpp"
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <string>
#include <vector>

using namespace qreport;
using namespace qreport::test;
namespace fs = std::filesystem;

namespace {

const char* CHECKUP_JSON = R"({
  "checkup": {
    "id": "9f8e7d6c-5b4a-3210-fedc-ba9876543210",
    "status": "COMPLETED",
    "createdAt": 1729600000000,
    "completedAt": "2024-10-22T14:30:00",
    "header": {
      "clientCompany": "Officine Meccaniche",
      "site": "Plant 2",
      "technicianName": "Giulia Bianchi",
      "equipmentType": "Palletizer",
      "serialNumber": "PL-0042",
      "operatingHours": 12500
    }
  },
  "items": [
    { "id": "i1", "moduleKey": "SAFETY_SYSTEMS", "description": "Fence interlock",
      "status": "NOK", "criticality": "CRITICAL", "notes": "Switch loose", "orderIndex": 0 },
    { "id": "i2", "moduleKey": "SAFETY_SYSTEMS", "moduleName": "Safety", "description": "Beacon",
      "status": "N/A", "orderIndex": 1 }
  ],
  "photos": [
    { "id": "p1", "checkItemId": "i1", "filePath": "photos/interlock.jpg", "caption": "Loose switch" },
    { "id": "p2", "checkItemId": "i1", "filePath": "/abs/beacon.jpg", "fileName": "beacon.jpg", "orderIndex": 5 }
  ],
  "spareParts": [
    { "partNumber": "SW-11", "description": "Safety switch", "quantity": 2,
      "urgency": "IMPORTANT", "estimatedCost": 42.5 }
  ]
})";

/**
 * @brief argv storage for CommandLineInterface::parse_arguments
 */
class Arguments {
public:
    Arguments(std::initializer_list<std::string> args) : storage_(args) {
        for (auto& arg : storage_) {
            pointers_.push_back(arg.data());
        }
        pointers_.push_back(nullptr);
    }

    int argc() const { return static_cast<int>(storage_.size()); }
    char** argv() { return pointers_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<char*> pointers_;
};

} // namespace

TEST_CASE("Checkup files are parsed into records", "[loader]") {
    CheckupFileLoader loader;
    CheckupRecordSet records = loader.parse(CHECKUP_JSON, "/data/checkups");

    REQUIRE(records.checkup.id == "9f8e7d6c-5b4a-3210-fedc-ba9876543210");
    REQUIRE(records.checkup.status == "COMPLETED");
    REQUIRE(records.checkup.header.client_company == "Officine Meccaniche");
    REQUIRE(records.checkup.header.technician_name == "Giulia Bianchi");
    REQUIRE(records.checkup.header.operating_hours == 12500);

    SECTION("timestamps in both notations") {
        using std::chrono::system_clock;
        REQUIRE(system_clock::to_time_t(records.checkup.created_at) == 1729600000);
        REQUIRE(records.checkup.completed_at.has_value());
        REQUIRE(system_clock::to_time_t(*records.checkup.completed_at) == 1729607400);
    }

    SECTION("items with enums and defaults") {
        REQUIRE(records.items.size() == 2);
        REQUIRE(records.items[0].status == CheckItemStatus::NOK);
        REQUIRE(records.items[0].criticality == CriticalityLevel::CRITICAL);
        REQUIRE(records.items[1].status == CheckItemStatus::NA);
        REQUIRE(records.items[1].criticality == CriticalityLevel::ROUTINE);
        REQUIRE(records.items[1].module_name == "Safety");
    }

    SECTION("photo paths and names") {
        REQUIRE(records.photos[0].file_path == (fs::path("/data/checkups") / "photos/interlock.jpg").string());
        REQUIRE(records.photos[0].file_name == "interlock.jpg");
        REQUIRE(records.photos[0].order_index == 0);
        REQUIRE(records.photos[1].file_path == "/abs/beacon.jpg");
        REQUIRE(records.photos[1].order_index == 5);
    }

    SECTION("spare parts") {
        REQUIRE(records.spare_parts.size() == 1);
        REQUIRE(records.spare_parts[0].quantity == 2);
        REQUIRE(records.spare_parts[0].urgency == SparePartUrgency::IMPORTANT);
        REQUIRE(records.spare_parts[0].estimated_cost == Approx(42.5));
    }
}

TEST_CASE("Malformed checkup files are rejected", "[loader]") {
    CheckupFileLoader loader;

    REQUIRE_THROWS_AS(loader.parse("{ not json"), CheckupFileError);
    REQUIRE_THROWS_AS(loader.parse(R"({"items": []})"), CheckupFileError);
    REQUIRE_THROWS_AS(loader.parse(R"({"checkup": {"id": 17}})"), CheckupFileError);
    REQUIRE_THROWS_WITH(
        loader.parse(R"({"checkup": {"id": "x"}, "items": [{"id": "i", "status": "BROKEN"}]})"),
        Catch::Contains("Unknown value for 'status'"));
    REQUIRE_THROWS_WITH(loader.parse(R"({"checkup": {"id": "x", "createdAt": "yesterday"}})"),
                        Catch::Contains("Invalid timestamp"));
    REQUIRE_THROWS_AS(loader.load("/nonexistent/checkup.json"), CheckupFileError);
}

TEST_CASE("Loading from disk resolves photos beside the file", "[loader]") {
    TempDirectory dir;
    const fs::path file = dir.path() / "checkup.json";
    {
        std::ofstream out(file);
        out << CHECKUP_JSON;
    }

    CheckupFileLoader loader;
    CheckupRecordSet records = loader.load(file.string());
    REQUIRE(records.photos[0].file_path == (dir.path() / "photos/interlock.jpg").string());
}

TEST_CASE("Command-line options override the configuration file", "[cli]") {
    TempDirectory dir;
    const std::string config_path = (dir.path() / "config.json").string();
    {
        std::ofstream out(config_path);
        out << R"({"formats": "text", "photo_max_width": 640, "exports_root": "/srv/exports", "log_level": "4"})";
    }

    Arguments args{"qreport-export", "--config", config_path, "--formats", "document,photos",
                   "--naming", "sequential", "--no-timestamp", "--manifest", "checkup.json"};

    CommandLineInterface cli;
    REQUIRE(cli.parse_arguments(args.argc(), args.argv()));
    REQUIRE(cli.action() == CliAction::EXPORT);
    REQUIRE(cli.checkup_file() == "checkup.json");
    REQUIRE(cli.exports_root() == "/srv/exports");
    REQUIRE(cli.log_config() == "4");

    const ExportOptions& options = cli.export_options();
    REQUIRE(options.formats == std::vector<ExportFormat>{ExportFormat::DOCUMENT, ExportFormat::PHOTO_FOLDER});
    REQUIRE(options.naming_strategy == PhotoNamingStrategy::SEQUENTIAL);
    REQUIRE(options.photo_max_width == 640);
    REQUIRE_FALSE(options.create_timestamped_directory);
    REQUIRE(options.write_manifest);
}

TEST_CASE("Command-line actions and usage errors", "[cli]") {
    CommandLineInterface cli;

    SECTION("estimate only") {
        Arguments args{"qreport-export", "-i", "c.json", "--estimate-only", "--quiet"};
        REQUIRE(cli.parse_arguments(args.argc(), args.argv()));
        REQUIRE(cli.action() == CliAction::ESTIMATE);
        REQUIRE(cli.log_config() == "1");
    }

    SECTION("cleanup needs no checkup file") {
        Arguments args{"qreport-export", "--cleanup-days", "7", "-o", "/tmp/exports"};
        REQUIRE(cli.parse_arguments(args.argc(), args.argv()));
        REQUIRE(cli.action() == CliAction::CLEANUP);
        REQUIRE(cli.cleanup_days() == 7);
        REQUIRE(cli.exports_root() == "/tmp/exports");
    }

    SECTION("help exits cleanly") {
        Arguments args{"qreport-export", "--help"};
        REQUIRE(cli.parse_arguments(args.argc(), args.argv()));
        REQUIRE(cli.action() == CliAction::EXIT);
    }

    SECTION("unknown format") {
        Arguments args{"qreport-export", "--formats", "document,pdf", "c.json"};
        REQUIRE_FALSE(cli.parse_arguments(args.argc(), args.argv()));
    }

    SECTION("non-positive photo width") {
        Arguments args{"qreport-export", "--photo-width", "0", "c.json"};
        REQUIRE_FALSE(cli.parse_arguments(args.argc(), args.argv()));
    }

    SECTION("missing checkup file") {
        Arguments args{"qreport-export", "--formats", "text"};
        REQUIRE_FALSE(cli.parse_arguments(args.argc(), args.argv()));
    }
}
