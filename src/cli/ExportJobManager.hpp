/**
 * @file ExportJobManager.hpp
 * @brief Background export jobs, at most one per checkup
 */

#pragma once

#include "ExportOrchestrator.hpp"
#include "../core/CancellationToken.hpp"
#include "../core/Logger.hpp"
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace qreport {

/**
 * @brief Shared view of one background export
 */
struct ExportJobStatus {
    int id = 0;
    std::string checkup_id;
    CancellationToken token;
    std::atomic<bool> completed{false};
    std::atomic<bool> failed{false};

    MultiFormatExportResult latest_result() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return latest_;
    }

    std::string error_message() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return error_message_;
    }

private:
    friend class ExportJobManager;

    mutable std::mutex mutex_;
    MultiFormatExportResult latest_;
    std::string error_message_;
};

/**
 * @brief Runs exports on worker threads
 *
 * Submitting a checkup that already has a job cancels that job and joins
 * it before the new one starts, so two jobs never write into the same
 * export directory. The destructor cancels and joins everything.
 */
class ExportJobManager {
public:
    explicit ExportJobManager(const ExportOrchestrator& orchestrator);
    ~ExportJobManager();

    std::shared_ptr<ExportJobStatus> submit(const CheckupSnapshot& snapshot,
                                            const ExportOptions& options,
                                            ProgressCallback on_progress = nullptr);

    /**
     * @brief Request cancellation of the checkup's job
     * @return false when no job is known for the checkup
     */
    bool cancel(const std::string& checkup_id);

    /**
     * @brief Block until the checkup's job has finished
     */
    void wait(const std::string& checkup_id);

    void wait_all();

    bool is_running(const std::string& checkup_id) const;
    size_t active_job_count() const;

private:
    struct Job {
        std::shared_ptr<ExportJobStatus> status;
        std::thread worker;
    };

    const ExportOrchestrator& orchestrator_;
    std::map<std::string, Job> jobs_;
    mutable std::mutex jobs_mutex_;
    std::mutex submit_mutex_;
    std::atomic<int> next_id_{1};
    Logger logger_;

    static void join(Job& job);

    ExportJobManager(const ExportJobManager&) = delete;
    ExportJobManager& operator=(const ExportJobManager&) = delete;
};

} // namespace qreport
