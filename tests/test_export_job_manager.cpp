/**
 * @file test_export_job_manager.cpp
 * @brief Tests for background export jobs
 */

#include <catch2/catch.hpp>

#include "TestFixtures.hpp"
#include "cli/ExportJobManager.hpp"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <thread>

using namespace qreport;
using namespace qreport::test;
namespace fs = std::filesystem;

namespace {

/**
 * @brief Text generator whose first run blocks until its job is cancelled
 */
class GatedGenerator : public FormatGenerator {
public:
    explicit GatedGenerator(std::atomic<int>& calls) : calls_(calls) {}

    ExportFormat format() const override { return ExportFormat::TEXT; }

    ExportedArtifact generate(const CheckupSnapshot& snapshot, const ExportOptions& options,
                              const std::string& directory,
                              const CancellationToken* cancellation) const override {
        if (calls_++ == 0) {
            const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
            while (std::chrono::steady_clock::now() < deadline) {
                CancellationToken::check(cancellation);
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
            }
            throw ExportError(ExportErrorCode::TEXT_GENERATION_ERROR, "never cancelled");
        }
        return text_.generate(snapshot, options, directory, cancellation);
    }

private:
    std::atomic<int>& calls_;
    TextFormatGenerator text_;
};

ExportOrchestrator::Options job_options(const TempDirectory& root) {
    ExportOrchestrator::Options options;
    options.exports_root = root.str();
    options.check_storage = false;
    return options;
}

void wait_until_started(const ExportJobStatus& status) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (status.latest_result().export_directory.empty() &&
           std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
}

} // namespace

TEST_CASE("A submitted job runs to completion", "[jobs]") {
    TempDirectory photos;
    TempDirectory root;
    auto snapshot = sample_snapshot(photos.path());

    ExportOrchestrator orchestrator(job_options(root));
    ExportJobManager manager(orchestrator);

    std::atomic<int> progress_calls{0};
    auto status = manager.submit(snapshot, test_options({ExportFormat::TEXT, ExportFormat::PHOTO_FOLDER}),
                                 [&progress_calls](const MultiFormatExportResult&) { ++progress_calls; });
    manager.wait(snapshot.checkup_id);

    REQUIRE(status->completed);
    REQUIRE_FALSE(status->failed);
    REQUIRE_FALSE(manager.is_running(snapshot.checkup_id));
    REQUIRE(manager.active_job_count() == 0);
    REQUIRE(progress_calls > 0);

    MultiFormatExportResult result = status->latest_result();
    REQUIRE(result.finished);
    REQUIRE(result.outcome == ExportOutcome::SUCCESS);
    REQUIRE(fs::exists(result.text->path));
}

TEST_CASE("Resubmitting a checkup cancels its running job", "[jobs]") {
    TempDirectory photos;
    TempDirectory root;
    auto snapshot = sample_snapshot(photos.path());

    std::atomic<int> calls{0};
    FormatGeneratorMap generators;
    generators[ExportFormat::TEXT] = std::make_unique<GatedGenerator>(calls);
    ExportOrchestrator orchestrator(job_options(root), std::move(generators));
    ExportJobManager manager(orchestrator);

    auto first = manager.submit(snapshot, test_options({ExportFormat::TEXT}));
    wait_until_started(*first);
    REQUIRE(manager.is_running(snapshot.checkup_id));

    auto second = manager.submit(snapshot, test_options({ExportFormat::TEXT}));

    // The first job was joined before the second started
    REQUIRE(first->completed);
    REQUIRE(first->latest_result().outcome == ExportOutcome::CANCELLED);
    REQUIRE(second->id != first->id);

    manager.wait(snapshot.checkup_id);
    REQUIRE(second->latest_result().outcome == ExportOutcome::SUCCESS);
    REQUIRE(calls == 2);
}

TEST_CASE("Cancelling a job by checkup id", "[jobs]") {
    TempDirectory photos;
    TempDirectory root;
    auto snapshot = sample_snapshot(photos.path());

    std::atomic<int> calls{0};
    FormatGeneratorMap generators;
    generators[ExportFormat::TEXT] = std::make_unique<GatedGenerator>(calls);
    ExportOrchestrator orchestrator(job_options(root), std::move(generators));
    ExportJobManager manager(orchestrator);

    REQUIRE_FALSE(manager.cancel("unknown-checkup"));

    auto status = manager.submit(snapshot, test_options({ExportFormat::TEXT}));
    wait_until_started(*status);

    REQUIRE(manager.cancel(snapshot.checkup_id));
    manager.wait_all();

    REQUIRE(status->completed);
    REQUIRE_FALSE(status->failed);
    REQUIRE(status->latest_result().outcome == ExportOutcome::CANCELLED);
    REQUIRE(manager.active_job_count() == 0);
}

TEST_CASE("Jobs for different checkups run side by side", "[jobs]") {
    TempDirectory photos;
    TempDirectory root;
    auto first = sample_snapshot(photos.path());
    auto second = sample_snapshot(photos.path());
    second.checkup_id = "ffffffff-0000-1111-2222-333333333333";

    ExportOrchestrator orchestrator(job_options(root));
    {
        ExportJobManager manager(orchestrator);
        manager.submit(first, test_options({ExportFormat::TEXT}));
        manager.submit(second, test_options({ExportFormat::TEXT}));
        manager.wait_all();
        REQUIRE(manager.active_job_count() == 0);
    }

    REQUIRE(fs::exists(root.path() / "Checkup_AcmeRoboticsSpA_a1b2c3d4"));
    REQUIRE(fs::exists(root.path() / "Checkup_AcmeRoboticsSpA_ffffffff"));
}
