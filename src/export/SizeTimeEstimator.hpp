/**
 * @file SizeTimeEstimator.hpp
 * @brief Heuristic size and duration prediction per export format
 */

#pragma once

#include "qreport_export.hpp"
#include "../core/Logger.hpp"
#include <cstdint>

namespace qreport {

/**
 * @brief Advisory cost model for an export request
 *
 * Feeds the storage pre-flight and user-facing warnings only.
 */
class SizeTimeEstimator {
public:
    static constexpr std::uint64_t DOCUMENT_BASE_BYTES = 500000;
    static constexpr std::uint64_t DOCUMENT_BYTES_PER_PHOTO = 200000;
    static constexpr std::uint64_t DOCUMENT_BASE_MS = 3000;
    static constexpr std::uint64_t DOCUMENT_PHOTO_BYTES_PER_MS = 100000;
    static constexpr std::uint64_t TEXT_MIN_BYTES = 10000;
    static constexpr std::uint64_t TEXT_MS = 1000;
    static constexpr std::uint64_t PHOTO_BYTES = 2000000;
    static constexpr std::uint64_t PHOTO_MS = 500;
    static constexpr std::uint64_t PACKAGE_INDEX_BYTES = 10000;
    static constexpr std::uint64_t PACKAGE_DIRECTORY_BYTES = 5000;
    static constexpr std::uint64_t PACKAGE_EXTRA_MS = 2000;

    struct Options {
        std::uint64_t large_export_threshold_bytes;
        std::uint64_t slow_export_threshold_ms;

        Options()
            : large_export_threshold_bytes(100ULL * 1024 * 1024),
              slow_export_threshold_ms(60000) {}
    };

    SizeTimeEstimator();
    explicit SizeTimeEstimator(const Options& options);

    /**
     * @brief Estimate every requested format plus totals and warnings
     */
    EstimationReport estimate(const CheckupSnapshot& snapshot, const ExportOptions& options) const;

    FormatEstimation estimate_format(const CheckupSnapshot& snapshot, const ExportOptions& options,
                                     ExportFormat format) const;

    FormatEstimation estimate_document(const CheckupSnapshot& snapshot, const ExportOptions& options) const;
    FormatEstimation estimate_text(const CheckupSnapshot& snapshot) const;
    FormatEstimation estimate_photo_folder(const CheckupSnapshot& snapshot, const ExportOptions& options) const;
    FormatEstimation estimate_combined(const CheckupSnapshot& snapshot, const ExportOptions& options) const;

    /**
     * @brief Characters of free text that end up in the text report
     */
    static std::uint64_t text_content_length(const CheckupSnapshot& snapshot);

private:
    Options options_;
    Logger logger_;
};

} // namespace qreport
