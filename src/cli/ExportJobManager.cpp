/**
 * @file ExportJobManager.cpp
 * @brief Implementation of background export jobs
 */

#include "ExportJobManager.hpp"
#include <vector>

namespace qreport {

ExportJobManager::ExportJobManager(const ExportOrchestrator& orchestrator)
    : orchestrator_(orchestrator), logger_("ExportJobManager") {
}

ExportJobManager::~ExportJobManager() {
    std::lock_guard<std::mutex> submit_lock(submit_mutex_);
    std::map<std::string, Job> jobs;
    {
        std::lock_guard<std::mutex> lock(jobs_mutex_);
        jobs.swap(jobs_);
    }
    for (auto& [checkup_id, job] : jobs) {
        job.status->token.cancel();
    }
    for (auto& [checkup_id, job] : jobs) {
        join(job);
    }
}

void ExportJobManager::join(Job& job) {
    if (job.worker.joinable()) {
        job.worker.join();
    }
}

std::shared_ptr<ExportJobStatus> ExportJobManager::submit(const CheckupSnapshot& snapshot,
                                                          const ExportOptions& options,
                                                          ProgressCallback on_progress) {
    std::lock_guard<std::mutex> submit_lock(submit_mutex_);

    // Replace any job already running for this checkup
    Job previous;
    {
        std::lock_guard<std::mutex> lock(jobs_mutex_);
        auto it = jobs_.find(snapshot.checkup_id);
        if (it != jobs_.end()) {
            previous = std::move(it->second);
            jobs_.erase(it);
        }
    }
    if (previous.status) {
        if (!previous.status->completed) {
            logger_.info("Cancelling previous export job " + std::to_string(previous.status->id) +
                         " for checkup " + snapshot.checkup_id);
        }
        previous.status->token.cancel();
        join(previous);
    }

    auto status = std::make_shared<ExportJobStatus>();
    status->id = next_id_++;
    status->checkup_id = snapshot.checkup_id;

    Job job;
    job.status = status;
    job.worker = std::thread([this, status, snapshot, options, on_progress]() {
        try {
            MultiFormatExportResult result = orchestrator_.export_checkup(
                snapshot, options,
                [status, &on_progress](const MultiFormatExportResult& progress) {
                    {
                        std::lock_guard<std::mutex> lock(status->mutex_);
                        status->latest_ = progress;
                    }
                    if (on_progress) {
                        on_progress(progress);
                    }
                },
                &status->token);

            std::lock_guard<std::mutex> lock(status->mutex_);
            status->latest_ = result;
        } catch (const std::exception& e) {
            logger_.error("Export job " + std::to_string(status->id) + " failed: " + e.what());
            std::lock_guard<std::mutex> lock(status->mutex_);
            status->error_message_ = e.what();
            status->failed = true;
        }
        status->completed = true;
    });

    logger_.detailed("Submitted export job " + std::to_string(status->id) + " for checkup " + snapshot.checkup_id);

    std::lock_guard<std::mutex> lock(jobs_mutex_);
    jobs_[snapshot.checkup_id] = std::move(job);
    return status;
}

bool ExportJobManager::cancel(const std::string& checkup_id) {
    std::lock_guard<std::mutex> lock(jobs_mutex_);
    auto it = jobs_.find(checkup_id);
    if (it == jobs_.end()) {
        return false;
    }
    it->second.status->token.cancel();
    return true;
}

void ExportJobManager::wait(const std::string& checkup_id) {
    std::lock_guard<std::mutex> submit_lock(submit_mutex_);
    Job* job = nullptr;
    {
        std::lock_guard<std::mutex> lock(jobs_mutex_);
        auto it = jobs_.find(checkup_id);
        if (it != jobs_.end()) {
            job = &it->second;
        }
    }
    // Entries are only erased under submit_mutex_, which we hold
    if (job) {
        join(*job);
    }
}

void ExportJobManager::wait_all() {
    std::lock_guard<std::mutex> submit_lock(submit_mutex_);
    std::vector<Job*> jobs;
    {
        std::lock_guard<std::mutex> lock(jobs_mutex_);
        for (auto& [checkup_id, job] : jobs_) {
            jobs.push_back(&job);
        }
    }
    for (Job* job : jobs) {
        join(*job);
    }
}

bool ExportJobManager::is_running(const std::string& checkup_id) const {
    std::lock_guard<std::mutex> lock(jobs_mutex_);
    auto it = jobs_.find(checkup_id);
    return it != jobs_.end() && !it->second.status->completed;
}

size_t ExportJobManager::active_job_count() const {
    std::lock_guard<std::mutex> lock(jobs_mutex_);
    size_t count = 0;
    for (const auto& [checkup_id, job] : jobs_) {
        if (!job.status->completed) ++count;
    }
    return count;
}

} // namespace qreport
