/**
 * @file test_size_time_estimator.cpp
 * @brief Tests for export size and duration estimates
 */

#include <catch2/catch.hpp>

#include "TestFixtures.hpp"
#include "export/SizeTimeEstimator.hpp"
#include <cstdint>
#include <string>

using namespace qreport;
using namespace qreport::test;

namespace {

CheckupSnapshot snapshot_with_photo_count(int photos) {
    CheckupSnapshot snapshot;
    CheckupModule module;
    module.display_name = "Module";
    CheckItem item;
    item.description = "Item";
    item.photos.resize(photos);
    module.items.push_back(item);
    snapshot.modules.push_back(module);
    return snapshot;
}

} // namespace

TEST_CASE("Per-format estimates", "[estimator]") {
    SizeTimeEstimator estimator;
    auto snapshot = snapshot_with_photo_count(3);
    ExportOptions options;

    auto document = estimator.estimate_document(snapshot, options);
    REQUIRE(document.size_bytes == 500000 + 3 * 200000);
    REQUIRE(document.time_ms == 3000 + 6);

    auto text = estimator.estimate_text(snapshot);
    REQUIRE(text.size_bytes == SizeTimeEstimator::TEXT_MIN_BYTES);
    REQUIRE(text.time_ms == 1000);

    auto photos = estimator.estimate_photo_folder(snapshot, options);
    REQUIRE(photos.size_bytes == 3 * 2000000);
    REQUIRE(photos.file_count == 4);

    auto combined = estimator.estimate_combined(snapshot, options);
    REQUIRE(combined.size_bytes == document.size_bytes + text.size_bytes + photos.size_bytes + 15000);
    REQUIRE(combined.time_ms == document.time_ms + text.time_ms + photos.time_ms + 2000);
    REQUIRE(combined.file_count == 6);

    SECTION("photos left out of the document do not count") {
        options.include_photos = false;
        REQUIRE(estimator.estimate_document(snapshot, options).size_bytes == 500000);
    }
}

TEST_CASE("Estimates grow with the photo count", "[estimator]") {
    SizeTimeEstimator estimator;
    ExportOptions options;
    options.formats = {ExportFormat::DOCUMENT, ExportFormat::PHOTO_FOLDER, ExportFormat::COMBINED_PACKAGE};

    EstimationReport previous = estimator.estimate(snapshot_with_photo_count(0), options);
    for (int photos = 1; photos <= 40; photos += 3) {
        EstimationReport current = estimator.estimate(snapshot_with_photo_count(photos), options);
        INFO("photos: " << photos);
        REQUIRE(current.total_size_bytes > previous.total_size_bytes);
        REQUIRE(current.total_time_ms >= previous.total_time_ms);
        previous = current;
    }
}

TEST_CASE("Text estimate follows content length", "[estimator]") {
    TempDirectory photos;
    auto snapshot = sample_snapshot(photos.path());
    snapshot.modules[0].items[0].notes = std::string(20000, 'n');

    SizeTimeEstimator estimator;
    auto text = estimator.estimate_text(snapshot);
    REQUIRE(text.size_bytes == SizeTimeEstimator::text_content_length(snapshot) * 2);
    REQUIRE(text.size_bytes > SizeTimeEstimator::TEXT_MIN_BYTES);
}

TEST_CASE("Large and slow exports are flagged", "[estimator]") {
    auto snapshot = snapshot_with_photo_count(200);
    ExportOptions options;
    options.formats = {ExportFormat::PHOTO_FOLDER, ExportFormat::PHOTO_FOLDER};

    SizeTimeEstimator estimator;
    EstimationReport report = estimator.estimate(snapshot, options);
    REQUIRE(report.formats.size() == 1);
    REQUIRE(report.total_size_bytes == 200ULL * 2000000);
    REQUIRE(report.warnings.size() == 2);
    REQUIRE(report.warnings[0].rfind("Large export", 0) == 0);
    REQUIRE(report.warnings[1].rfind("Long export", 0) == 0);

    SizeTimeEstimator::Options relaxed;
    relaxed.large_export_threshold_bytes = 1ULL << 40;
    relaxed.slow_export_threshold_ms = 1000000;
    REQUIRE(SizeTimeEstimator(relaxed).estimate(snapshot, options).warnings.empty());
}

TEST_CASE("Spare parts never shrink the text estimate", "[estimator]") {
    TempDirectory photos;
    SizeTimeEstimator estimator;

    auto check_growth = [&estimator](CheckupSnapshot snapshot) {
        std::uint64_t previous = estimator.estimate_text(snapshot).size_bytes;
        for (int i = 0; i < 100; ++i) {
            SparePart part;
            part.part_number = "SP-" + std::to_string(i);
            part.description = "Replacement seal kit for hydraulic cylinder " + std::to_string(i);
            part.notes = "Order with gasket set";
            snapshot.spare_parts.push_back(part);

            std::uint64_t current = estimator.estimate_text(snapshot).size_bytes;
            INFO("spare parts: " << snapshot.spare_parts.size());
            REQUIRE(current >= previous);
            previous = current;
        }
        return previous;
    };

    SECTION("starting below the minimum size") {
        auto snapshot = snapshot_with_photo_count(0);
        REQUIRE(estimator.estimate_text(snapshot).size_bytes == SizeTimeEstimator::TEXT_MIN_BYTES);
        REQUIRE(check_growth(snapshot) > SizeTimeEstimator::TEXT_MIN_BYTES);
    }

    SECTION("starting above the minimum size") {
        auto snapshot = sample_snapshot(photos.path());
        snapshot.modules[0].items[0].notes = std::string(20000, 'n');
        const std::uint64_t start = estimator.estimate_text(snapshot).size_bytes;
        REQUIRE(start > SizeTimeEstimator::TEXT_MIN_BYTES);
        REQUIRE(check_growth(snapshot) > start);
    }
}
