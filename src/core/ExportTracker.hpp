/**
 * @file ExportTracker.hpp
 * @brief Stage timing and artifact bookkeeping for one export run
 *
 * Copyright (c) 2026 The QReport Authors
 * Portions copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "qreport_export.hpp"
#include "Logger.hpp"
#include <chrono>
#include <string>
#include <unordered_map>
#include <vector>

namespace qreport {

/**
 * @brief One pipeline stage (validation, storage, a format, the manifest)
 */
struct ExportStage {
    std::string stage_name;
    std::chrono::steady_clock::time_point start_time;
    std::chrono::steady_clock::time_point end_time;
    bool completed = false;
    bool successful = false;
    std::string error_message;
    std::unordered_map<std::string, std::string> stage_data;

    explicit ExportStage(const std::string& name)
        : stage_name(name), start_time(std::chrono::steady_clock::now()) {}

    void complete(bool success = true, const std::string& error = "") {
        end_time = std::chrono::steady_clock::now();
        completed = true;
        successful = success;
        error_message = error;
    }

    std::chrono::milliseconds duration() const {
        if (!completed) return std::chrono::milliseconds(0);
        return std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);
    }
};

/**
 * @brief Records stages and written artifacts of an export
 *
 * Usage:
 *   tracker.startStage("text");
 *   ... generate ...
 *   tracker.completeStage("text", ok, error);
 *   tracker.trackArtifact(artifact);
 */
class ExportTracker {
public:
    ExportTracker();

    void startStage(const std::string& stage_name);
    void completeStage(const std::string& stage_name, bool successful = true, const std::string& error = "");
    void addStageData(const std::string& stage_name, const std::string& key, const std::string& value);

    void trackArtifact(const ExportedArtifact& artifact);

    /**
     * @brief Time since construction
     */
    std::chrono::milliseconds elapsed() const;

    std::string getPipelineStatus() const;
    std::string getTimingReport() const;
    std::string getCurrentStage() const;
    std::string getArtifactSummary() const;

    size_t getCompletedStageCount() const;
    size_t getFailedStageCount() const;
    const std::vector<ExportStage>& getStages() const { return stages_; }
    const std::vector<ExportedArtifact>& getArtifacts() const { return artifacts_; }

    /**
     * @brief Log the timing report and each stage at DETAILED
     */
    void logSummary() const;

private:
    std::vector<ExportStage> stages_;
    std::vector<ExportedArtifact> artifacts_;
    std::chrono::steady_clock::time_point tracking_start_time_;
    Logger logger_;

    ExportStage* findStage(const std::string& stage_name);
};

} // namespace qreport
