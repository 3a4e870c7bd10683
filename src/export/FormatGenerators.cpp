/**
 * @file FormatGenerators.cpp
 * @brief Implementation of the per-format generators
 */

#include "FormatGenerators.hpp"
#include "ExportNaming.hpp"
#include "TextFormatter.hpp"
#include "../core/ExportMaintenance.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace qreport {

namespace fs = std::filesystem;

namespace {

const ExportedArtifact* find_part(const std::vector<ExportedArtifact>& parts, ExportFormat format) {
    for (const auto& part : parts) {
        if (part.format == format) return &part;
    }
    return nullptr;
}

} // namespace

// ============================================================================
// Document
// ============================================================================

ExportedArtifact DocumentFormatGenerator::generate(const CheckupSnapshot& snapshot,
                                                   const ExportOptions& options,
                                                   const std::string& export_directory,
                                                   const CancellationToken* cancellation) const {
    CancellationToken::check(cancellation);

    const std::string name = ExportNaming::file_name(snapshot, ExportFormat::DOCUMENT);
    const fs::path path = fs::path(export_directory) / name;

    try {
        generator_.generate(snapshot, options, path.string(), cancellation);
    } catch (const ExportCancelledError&) {
        throw;
    } catch (const ExportError& e) {
        throw ExportError(ExportErrorCode::DOCUMENT_GENERATION_ERROR,
                          "Document generation failed: " + std::string(e.what()));
    } catch (const fs::filesystem_error& e) {
        throw ExportError(ExportErrorCode::DOCUMENT_GENERATION_ERROR,
                          "Document generation failed: " + std::string(e.what()));
    }

    ExportedArtifact artifact;
    artifact.path = path.string();
    artifact.name = name;
    artifact.format = ExportFormat::DOCUMENT;
    artifact.size_bytes = ExportMaintenance::directory_size(artifact.path);
    artifact.file_count = 1;
    return artifact;
}

// ============================================================================
// Text
// ============================================================================

TextFormatGenerator::TextFormatGenerator()
    : generator_(), logger_("TextFormatGenerator") {
}

ExportedArtifact TextFormatGenerator::generate(const CheckupSnapshot& snapshot,
                                               const ExportOptions& options,
                                               const std::string& export_directory,
                                               const CancellationToken* cancellation) const {
    CancellationToken::check(cancellation);

    const std::string name = ExportNaming::file_name(snapshot, ExportFormat::TEXT);
    const fs::path path = fs::path(export_directory) / name;

    const std::string content = generator_.generate(snapshot, options);

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw ExportError(ExportErrorCode::TEXT_GENERATION_ERROR, "Cannot open " + path.string() + " for writing");
    }
    out << content;
    out.close();
    if (!out) {
        throw ExportError(ExportErrorCode::TEXT_GENERATION_ERROR, "Failed writing " + path.string());
    }

    logger_.info("Text report written: " + path.string());

    ExportedArtifact artifact;
    artifact.path = path.string();
    artifact.name = name;
    artifact.format = ExportFormat::TEXT;
    artifact.size_bytes = content.size();
    artifact.file_count = 1;
    return artifact;
}

// ============================================================================
// Photo folder
// ============================================================================

ExportedArtifact PhotoFolderFormatGenerator::generate(const CheckupSnapshot& snapshot,
                                                      const ExportOptions& options,
                                                      const std::string& export_directory,
                                                      const CancellationToken* cancellation) const {
    CancellationToken::check(cancellation);

    PhotoExportManager::Options photo_options;
    photo_options.naming_strategy = options.naming_strategy;
    photo_options.quality = options.photo_quality;
    photo_options.photo_max_width = options.photo_max_width;
    photo_options.generate_index = options.generate_photo_index;

    PhotoExportManager manager(photo_options);
    PhotoExportResult result = manager.export_photos(snapshot, export_directory, cancellation);

    ExportedArtifact artifact;
    artifact.path = result.folder_path;
    artifact.name = std::string(PhotoExportManager::PHOTO_FOLDER_NAME) + "/";
    artifact.format = ExportFormat::PHOTO_FOLDER;
    artifact.size_bytes = ExportMaintenance::directory_size(result.folder_path);
    artifact.file_count = result.total_files;
    return artifact;
}

// ============================================================================
// Combined package
// ============================================================================

CombinedPackageGenerator::CombinedPackageGenerator()
    : CombinedPackageGenerator(std::make_unique<DocumentFormatGenerator>(),
                               std::make_unique<TextFormatGenerator>(),
                               std::make_unique<PhotoFolderFormatGenerator>()) {
}

CombinedPackageGenerator::CombinedPackageGenerator(std::unique_ptr<FormatGenerator> document,
                                                   std::unique_ptr<FormatGenerator> text,
                                                   std::unique_ptr<FormatGenerator> photos)
    : document_(std::move(document)),
      text_(std::move(text)),
      photos_(std::move(photos)),
      logger_("CombinedPackageGenerator") {
}

ExportedArtifact CombinedPackageGenerator::generate(const CheckupSnapshot& snapshot,
                                                    const ExportOptions& options,
                                                    const std::string& export_directory,
                                                    const CancellationToken* cancellation) const {
    std::vector<ExportedArtifact> parts;

    for (const FormatGenerator* component : {document_.get(), text_.get(), photos_.get()}) {
        if (!component) continue;
        CancellationToken::check(cancellation);
        try {
            parts.push_back(component->generate(snapshot, options, export_directory, cancellation));
        } catch (const ExportCancelledError&) {
            throw;
        } catch (const std::exception& e) {
            logger_.error("Package component " + to_string(component->format()) + " failed: " + e.what());
        }
    }

    const fs::path index_path = fs::path(export_directory) / INDEX_FILE_NAME;
    try {
        std::ofstream out(index_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw ExportError(ExportErrorCode::FILE_WRITE_FAILED, "Cannot open " + index_path.string());
        }
        out << build_package_index(snapshot, parts);
        out.close();
        if (!out) {
            throw ExportError(ExportErrorCode::FILE_WRITE_FAILED, "Failed writing " + index_path.string());
        }
    } catch (const std::exception& e) {
        logger_.warning("Package index not written: " + std::string(e.what()));
    }

    ExportedArtifact artifact;
    artifact.path = export_directory;
    artifact.name = fs::path(export_directory).filename().string();
    artifact.format = ExportFormat::COMBINED_PACKAGE;
    artifact.size_bytes = ExportMaintenance::directory_size(export_directory);
    artifact.file_count = ExportMaintenance::file_count(export_directory);
    for (const auto& part : parts) {
        artifact.components.push_back(part.format);
    }

    logger_.info("Package assembled with " + std::to_string(parts.size()) + "/3 components");
    return artifact;
}

std::string CombinedPackageGenerator::build_package_index(const CheckupSnapshot& snapshot,
                                                          const std::vector<ExportedArtifact>& parts) {
    TextFormatter formatter;
    std::ostringstream out;

    out << formatter.rule('=') << "\n";
    out << formatter.center_text("QREPORT EXPORT PACKAGE") << "\n";
    out << formatter.rule('=') << "\n\n";

    out << formatter.key_value("Checkup", snapshot.checkup_id) << "\n";
    out << formatter.key_value("Client", snapshot.header.client_company) << "\n";
    out << formatter.key_value("Technician", snapshot.header.technician_name) << "\n";
    out << formatter.key_value("Generated", TextFormatter::format_timestamp(snapshot.generated_at)) << "\n\n";

    out << "CONTENTS\n" << formatter.rule('-', 8) << "\n";

    auto describe_file = [&](ExportFormat format, const std::string& label, const std::string& type) {
        const ExportedArtifact* part = find_part(parts, format);
        if (part) {
            out << formatter.key_value(label, part->name + " (" + type + ", " +
                                       TextFormatter::format_file_size(part->size_bytes) + ")") << "\n";
        } else {
            out << formatter.key_value(label, "not generated") << "\n";
        }
    };
    describe_file(ExportFormat::DOCUMENT, "Document report", "Word document");
    describe_file(ExportFormat::TEXT, "Text report", "plain text");

    const ExportedArtifact* photos = find_part(parts, ExportFormat::PHOTO_FOLDER);
    if (photos) {
        out << formatter.key_value("Photo folder", photos->name + " (" + std::to_string(photos->file_count) +
                                   " photos, " + TextFormatter::format_file_size(photos->size_bytes) + ")") << "\n";
        for (size_t m = 0; m < snapshot.modules.size(); ++m) {
            int count = 0;
            for (const auto& item : snapshot.modules[m].items) {
                count += static_cast<int>(item.photos.size());
            }
            if (count == 0) continue;
            out << "    MODULO " << (m + 1) << ": " << snapshot.modules[m].display_name
                << " - " << count << " photo(s)\n";
        }
    } else {
        out << formatter.key_value("Photo folder", "not generated") << "\n";
    }

    out << "\nSTATISTICS\n" << formatter.rule('-', 10) << "\n";
    out << formatter.key_value("Modules", std::to_string(snapshot.modules.size())) << "\n";
    out << formatter.key_value("Check items", std::to_string(snapshot.total_item_count())) << "\n";
    out << formatter.key_value("Photos", std::to_string(snapshot.total_photo_count())) << "\n";
    out << formatter.key_value("Spare parts", std::to_string(snapshot.spare_parts.size())) << "\n";
    out << formatter.key_value("Issues (NOK)", std::to_string(snapshot.statistics.nok_items)) << "\n";
    out << formatter.key_value("Critical issues", std::to_string(snapshot.statistics.critical_issues)) << "\n";
    out << formatter.rule('=') << "\n";

    return out.str();
}

// ============================================================================
// Registry
// ============================================================================

FormatGeneratorMap create_format_generators() {
    FormatGeneratorMap generators;
    generators[ExportFormat::DOCUMENT] = std::make_unique<DocumentFormatGenerator>();
    generators[ExportFormat::TEXT] = std::make_unique<TextFormatGenerator>();
    generators[ExportFormat::PHOTO_FOLDER] = std::make_unique<PhotoFolderFormatGenerator>();
    generators[ExportFormat::COMBINED_PACKAGE] = std::make_unique<CombinedPackageGenerator>();
    return generators;
}

} // namespace qreport
