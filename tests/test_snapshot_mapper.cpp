/**
 * @file test_snapshot_mapper.cpp
 * @brief Tests for building snapshots from stored records
 */

#include <catch2/catch.hpp>

#include "core/SnapshotMapper.hpp"

using namespace qreport;

namespace {

CheckItemRecord item_record(const std::string& id, const std::string& module_key, int order,
                            CheckItemStatus status = CheckItemStatus::OK,
                            CriticalityLevel criticality = CriticalityLevel::ROUTINE) {
    CheckItemRecord item;
    item.id = id;
    item.module_key = module_key;
    item.description = "Check " + id;
    item.order_index = order;
    item.status = status;
    item.criticality = criticality;
    return item;
}

PhotoRecord photo_record(const std::string& id, const std::string& item_id, int order) {
    PhotoRecord photo;
    photo.id = id;
    photo.check_item_id = item_id;
    photo.file_path = "/data/photos/" + id + ".jpg";
    photo.file_name = id + ".jpg";
    photo.order_index = order;
    return photo;
}

} // namespace

TEST_CASE("Module keys become display names", "[mapper]") {
    REQUIRE(SnapshotMapper::display_name_for_key("SAFETY_SYSTEMS") == "Safety Systems");
    REQUIRE(SnapshotMapper::display_name_for_key("hydraulics") == "Hydraulics");
    REQUIRE(SnapshotMapper::display_name_for_key("ROBOT__ARM_") == "Robot Arm");
    REQUIRE(SnapshotMapper::display_name_for_key("").empty());
}

TEST_CASE("Items are grouped by module in first-appearance order", "[mapper]") {
    CheckupRecordSet records;
    records.checkup.id = "c-1";
    records.checkup.status = "COMPLETED";
    records.items = {
        item_record("b2", "HYDRAULICS", 2),
        item_record("a1", "SAFETY", 1),
        item_record("b1", "HYDRAULICS", 1),
        item_record("a0", "SAFETY", 0),
    };
    records.items[1].module_name = "Safety Systems";

    CheckupSnapshot snapshot = SnapshotMapper::from_records(records);

    REQUIRE(snapshot.checkup_id == "c-1");
    REQUIRE(snapshot.status_label == "COMPLETED");
    REQUIRE(snapshot.modules.size() == 2);

    REQUIRE(snapshot.modules[0].key == "HYDRAULICS");
    REQUIRE(snapshot.modules[0].display_name == "Hydraulics");
    REQUIRE(snapshot.modules[0].items[0].id == "b1");
    REQUIRE(snapshot.modules[0].items[1].id == "b2");

    SECTION("the first record of a module names it") {
        REQUIRE(snapshot.modules[1].display_name == "Safety Systems");
    }

    SECTION("items follow order_index within the module") {
        REQUIRE(snapshot.modules[1].items[0].id == "a0");
        REQUIRE(snapshot.modules[1].items[1].id == "a1");
    }
}

TEST_CASE("Photos are attached to their items", "[mapper]") {
    CheckupRecordSet records;
    records.checkup.id = "c-2";
    records.items = {item_record("i1", "MOD", 0), item_record("i2", "MOD", 1)};
    records.photos = {
        photo_record("p3", "i1", 3),
        photo_record("p1", "i1", 1),
        photo_record("p2", "i2", 0),
        photo_record("orphan", "deleted-item", 0),
    };

    CheckupSnapshot snapshot = SnapshotMapper::from_records(records);
    const auto& items = snapshot.modules[0].items;

    REQUIRE(items[0].photos.size() == 2);
    REQUIRE(items[0].photos[0].id == "p1");
    REQUIRE(items[0].photos[1].id == "p3");
    REQUIRE(items[0].photos[0].file_path == "/data/photos/p1.jpg");
    REQUIRE(items[1].photos.size() == 1);
    REQUIRE(snapshot.total_photo_count() == 3);
}

TEST_CASE("Statistics are computed while mapping", "[mapper]") {
    CheckupRecordSet records;
    records.checkup.id = "c-3";
    records.items = {
        item_record("1", "A", 0, CheckItemStatus::OK),
        item_record("2", "A", 1, CheckItemStatus::NOK, CriticalityLevel::CRITICAL),
        item_record("3", "B", 0, CheckItemStatus::NOK, CriticalityLevel::IMPORTANT),
        item_record("4", "B", 1, CheckItemStatus::NA),
        item_record("5", "C", 0, CheckItemStatus::PENDING, CriticalityLevel::CRITICAL),
    };
    records.photos = {photo_record("p", "2", 0)};

    const auto now = std::chrono::system_clock::now();
    CheckupSnapshot snapshot = SnapshotMapper::from_records(records, now);
    const auto& stats = snapshot.statistics;

    REQUIRE(snapshot.generated_at == now);
    REQUIRE(stats.total_modules == 3);
    REQUIRE(stats.total_items == 5);
    REQUIRE(stats.ok_items == 1);
    REQUIRE(stats.nok_items == 2);
    REQUIRE(stats.na_items == 1);
    REQUIRE(stats.pending_items == 1);
    REQUIRE(stats.critical_issues == 1);
    REQUIRE(stats.important_issues == 1);
    REQUIRE(stats.modules_with_issues == 2);
    REQUIRE(stats.total_photos == 1);
    REQUIRE(stats.completion_percentage() == Approx(80.0));
    REQUIRE(stats.ok_percentage() == Approx(20.0));
}

TEST_CASE("A checkup without items maps to no modules", "[mapper]") {
    CheckupRecordSet records;
    records.checkup.id = "empty";

    CheckupSnapshot snapshot = SnapshotMapper::from_records(records);
    REQUIRE(snapshot.modules.empty());
    REQUIRE(snapshot.statistics.total_items == 0);
    REQUIRE(snapshot.statistics.completion_percentage() == 0.0);
}
