/**
 * @file ExportOrchestrator.hpp
 * @brief Runs a checkup export end to end
 *
 * Validates the request, checks storage, prepares the export directory,
 * dispatches each requested format to its generator and reports progress
 * after every stage. A failing format never stops the others.
 *
 * Copyright (c) 2026 The QReport Authors
 * Portions copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "qreport_export.hpp"
#include "../core/CancellationToken.hpp"
#include "../core/Logger.hpp"
#include "../core/SnapshotValidator.hpp"
#include "../core/StorageInspector.hpp"
#include "../export/FormatGenerators.hpp"
#include "../export/SizeTimeEstimator.hpp"
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace qreport {

/**
 * @brief Receives a copy of the result after each stage
 *
 * The last call has finished == true.
 */
using ProgressCallback = std::function<void(const MultiFormatExportResult&)>;

class ExportOrchestrator {
public:
    static constexpr const char* MANIFEST_FILE_NAME = "export_manifest.json";

    struct Options {
        std::string exports_root;
        std::uint64_t large_export_threshold_bytes;
        bool check_storage;

        Options()
            : exports_root("exports"),
              large_export_threshold_bytes(100ULL * 1024 * 1024),
              check_storage(true) {}
    };

    ExportOrchestrator();
    explicit ExportOrchestrator(const Options& options);

    /**
     * @brief Constructor with a custom generator table
     */
    ExportOrchestrator(const Options& options, FormatGeneratorMap generators);

    ~ExportOrchestrator();

    /**
     * @brief Export the snapshot in every requested format
     *
     * Validation and storage failures are reported through the outcome;
     * in both cases nothing is written.
     *
     * @param on_progress Optional callback, invoked after each stage
     * @param cancellation Optional token, checked before each format and each photo
     */
    MultiFormatExportResult export_checkup(const CheckupSnapshot& snapshot,
                                           const ExportOptions& options,
                                           const ProgressCallback& on_progress = nullptr,
                                           const CancellationToken* cancellation = nullptr) const;

    EstimationReport estimate(const CheckupSnapshot& snapshot, const ExportOptions& options) const;

    /**
     * @brief Requested formats in dispatch order, duplicates removed
     */
    static std::vector<ExportFormat> ordered_formats(const ExportOptions& options);

    /**
     * @brief Fill result.statistics from the snapshot and the produced artifacts
     */
    static void calculate_statistics(const CheckupSnapshot& snapshot, MultiFormatExportResult& result);

    /**
     * @brief JSON content of export_manifest.json
     */
    static std::string build_manifest(const CheckupSnapshot& snapshot, const MultiFormatExportResult& result);

    const Options& options() const { return options_; }

private:
    Options options_;
    FormatGeneratorMap generators_;
    SnapshotValidator validator_;
    StorageInspector storage_;
    SizeTimeEstimator estimator_;
    Logger logger_;

    void write_manifest(const CheckupSnapshot& snapshot, const MultiFormatExportResult& result) const;

    static SizeTimeEstimator::Options estimator_options(const Options& options);

    ExportOrchestrator(const ExportOrchestrator&) = delete;
    ExportOrchestrator& operator=(const ExportOrchestrator&) = delete;
};

} // namespace qreport
