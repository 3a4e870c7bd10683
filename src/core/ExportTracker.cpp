/**
 * @file ExportTracker.cpp
 * @brief Implementation of export stage tracking
 */

#include "ExportTracker.hpp"
#include "TextFormatter.hpp"
#include <algorithm>
#include <sstream>

namespace qreport {

ExportTracker::ExportTracker()
    : tracking_start_time_(std::chrono::steady_clock::now()), logger_("ExportTracker") {
}

void ExportTracker::startStage(const std::string& stage_name) {
    stages_.emplace_back(stage_name);
    logger_.debug("[STAGE START] " + stage_name);
}

void ExportTracker::completeStage(const std::string& stage_name, bool successful, const std::string& error) {
    ExportStage* stage = findStage(stage_name);
    if (!stage) {
        logger_.debug("completeStage for unknown stage " + stage_name);
        return;
    }

    stage->complete(successful, error);

    std::string message = "[STAGE COMPLETE] " + stage_name +
                          " (" + TextFormatter::format_duration(stage->duration()) + ")";
    if (!successful) {
        message += " [FAILED: " + error + "]";
    }
    logger_.debug(message);
}

void ExportTracker::addStageData(const std::string& stage_name, const std::string& key, const std::string& value) {
    ExportStage* stage = findStage(stage_name);
    if (stage) {
        stage->stage_data[key] = value;
    }
}

void ExportTracker::trackArtifact(const ExportedArtifact& artifact) {
    artifacts_.push_back(artifact);
    logger_.trace("Tracked artifact " + artifact.name + " (" +
                  TextFormatter::format_file_size(artifact.size_bytes) + ")");
}

std::chrono::milliseconds ExportTracker::elapsed() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - tracking_start_time_);
}

std::string ExportTracker::getPipelineStatus() const {
    std::ostringstream oss;
    oss << "Stages: " << getCompletedStageCount() << "/" << stages_.size() << " completed";
    size_t failed = getFailedStageCount();
    if (failed > 0) {
        oss << ", " << failed << " failed";
    }
    return oss.str();
}

std::string ExportTracker::getTimingReport() const {
    std::ostringstream oss;
    oss << "Total time: " << TextFormatter::format_duration(elapsed());

    if (!stages_.empty()) {
        std::chrono::milliseconds stage_time(0);
        for (const auto& stage : stages_) {
            stage_time += stage.duration();
        }
        oss << ", Stage time: " << TextFormatter::format_duration(stage_time);
    }

    return oss.str();
}

std::string ExportTracker::getCurrentStage() const {
    if (stages_.empty()) {
        return "No stages";
    }

    const auto& current = stages_.back();
    if (current.completed) {
        return "All stages completed";
    }
    return "Current stage: " + current.stage_name;
}

std::string ExportTracker::getArtifactSummary() const {
    std::uintmax_t total = 0;
    for (const auto& artifact : artifacts_) {
        total += artifact.size_bytes;
    }
    return std::to_string(artifacts_.size()) + " artifact(s), " + TextFormatter::format_file_size(total);
}

size_t ExportTracker::getCompletedStageCount() const {
    return static_cast<size_t>(std::count_if(stages_.begin(), stages_.end(),
        [](const ExportStage& stage) { return stage.completed; }));
}

size_t ExportTracker::getFailedStageCount() const {
    return static_cast<size_t>(std::count_if(stages_.begin(), stages_.end(),
        [](const ExportStage& stage) { return stage.completed && !stage.successful; }));
}

void ExportTracker::logSummary() const {
    logger_.detailed(getPipelineStatus() + "; " + getTimingReport());
    for (const auto& stage : stages_) {
        std::string line = "  " + stage.stage_name + ": " +
                           (stage.completed ? (stage.successful ? "ok" : "failed") : "incomplete") +
                           " (" + TextFormatter::format_duration(stage.duration()) + ")";
        if (!stage.error_message.empty()) {
            line += " - " + stage.error_message;
        }
        logger_.detailed(line);
    }
}

ExportStage* ExportTracker::findStage(const std::string& stage_name) {
    // Most recent stage with that name
    for (auto it = stages_.rbegin(); it != stages_.rend(); ++it) {
        if (it->stage_name == stage_name) {
            return &(*it);
        }
    }
    return nullptr;
}

} // namespace qreport
