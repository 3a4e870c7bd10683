/**
 * @file FormatGenerators.hpp
 * @brief One generator per export format behind a common interface
 *
 * Copyright (c) 2026 The QReport Authors
 * Licensed under the MIT License.
 */

#pragma once

#include "qreport_export.hpp"
#include "DocumentReportGenerator.hpp"
#include "PhotoExportManager.hpp"
#include "TextReportGenerator.hpp"
#include "../core/CancellationToken.hpp"
#include "../core/Logger.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace qreport {

/**
 * @brief Produces one export format into an export directory
 *
 * Implementations throw ExportError on failure and ExportCancelledError
 * when the token is cancelled; the orchestrator isolates both per format.
 */
class FormatGenerator {
public:
    virtual ~FormatGenerator() = default;

    virtual ExportFormat format() const = 0;

    virtual ExportedArtifact generate(const CheckupSnapshot& snapshot,
                                      const ExportOptions& options,
                                      const std::string& export_directory,
                                      const CancellationToken* cancellation) const = 0;
};

class DocumentFormatGenerator : public FormatGenerator {
public:
    ExportFormat format() const override { return ExportFormat::DOCUMENT; }

    ExportedArtifact generate(const CheckupSnapshot& snapshot, const ExportOptions& options,
                              const std::string& export_directory,
                              const CancellationToken* cancellation) const override;

private:
    DocumentReportGenerator generator_;
};

class TextFormatGenerator : public FormatGenerator {
public:
    TextFormatGenerator();

    ExportFormat format() const override { return ExportFormat::TEXT; }

    ExportedArtifact generate(const CheckupSnapshot& snapshot, const ExportOptions& options,
                              const std::string& export_directory,
                              const CancellationToken* cancellation) const override;

private:
    TextReportGenerator generator_;
    Logger logger_;
};

/**
 * @brief FOTO folder with every photo of the checkup
 *
 * The artifact's file_count is the number of photos actually exported.
 */
class PhotoFolderFormatGenerator : public FormatGenerator {
public:
    ExportFormat format() const override { return ExportFormat::PHOTO_FOLDER; }

    ExportedArtifact generate(const CheckupSnapshot& snapshot, const ExportOptions& options,
                              const std::string& export_directory,
                              const CancellationToken* cancellation) const override;
};

/**
 * @brief Document, text and photo folder side by side plus INDICE_PACKAGE.txt
 *
 * A failing component is logged and left out; the artifact's components
 * list only the formats that were produced.
 */
class CombinedPackageGenerator : public FormatGenerator {
public:
    static constexpr const char* INDEX_FILE_NAME = "INDICE_PACKAGE.txt";

    CombinedPackageGenerator();
    CombinedPackageGenerator(std::unique_ptr<FormatGenerator> document,
                             std::unique_ptr<FormatGenerator> text,
                             std::unique_ptr<FormatGenerator> photos);

    ExportFormat format() const override { return ExportFormat::COMBINED_PACKAGE; }

    ExportedArtifact generate(const CheckupSnapshot& snapshot, const ExportOptions& options,
                              const std::string& export_directory,
                              const CancellationToken* cancellation) const override;

    /**
     * @brief Render INDICE_PACKAGE.txt for the produced components
     */
    static std::string build_package_index(const CheckupSnapshot& snapshot,
                                           const std::vector<ExportedArtifact>& parts);

private:
    std::unique_ptr<FormatGenerator> document_;
    std::unique_ptr<FormatGenerator> text_;
    std::unique_ptr<FormatGenerator> photos_;
    Logger logger_;
};

using FormatGeneratorMap = std::map<ExportFormat, std::unique_ptr<FormatGenerator>>;

/**
 * @brief Lookup table with the standard generator for every format
 */
FormatGeneratorMap create_format_generators();

} // namespace qreport
