/**
 * @file job_registry.hpp
 * @brief In-memory store of job records with retention sweeping
 *
 * The registry owns every job record for the lifetime of the process. It
 * enforces the status state machine: once a record reaches a terminal state
 * its result and completion time are never mutated again. Completed records
 * are deleted after a retention window by Sweep(), optionally driven by a
 * background sweeper thread.
 *
 * @date 2025
 */

#pragma once

#include "chaosbox/core/job.hpp"
#include "chaosbox/core/clock.hpp"

#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace chaosbox {
namespace core {

/**
 * @class JobRegistry
 * @brief Thread-safe job store
 *
 * **Usage Example**:
 * @code
 * SystemClock clock;
 * JobRegistry registry(clock);
 * registry.StartSweeper();   // long-lived hosts only; nothing expires otherwise
 *
 * Job job = registry.Create("python", "print(1+1)", Scenario{});
 * registry.MarkRunning(job.id);
 * registry.AppendLog(job.id, "Job execution started.");
 *
 * JobResult result;
 * result.output = "2";
 * result.success = true;
 * registry.Finish(job.id, JobStatus::COMPLETED, result);
 * @endcode
 *
 * **Thread Safety**: All public methods lock a single mutex.
 */
class JobRegistry {
public:
    static constexpr std::chrono::seconds kDefaultRetention{3600};
    static constexpr const char* kUserCancelMessage = "Job was cancelled by user.";

    /**
     * @brief Construct registry
     * @param clock Time source (must outlive the registry)
     * @param retention Age after completion at which records are swept
     */
    explicit JobRegistry(const Clock& clock,
                         std::chrono::seconds retention = kDefaultRetention);

    ~JobRegistry();

    JobRegistry(const JobRegistry&) = delete;
    JobRegistry& operator=(const JobRegistry&) = delete;

    // ========================================================================
    // Record Management
    // ========================================================================

    /**
     * @brief Create a queued job with a fresh UUID
     * @return Snapshot of the new record
     */
    Job Create(const std::string& language, const std::string& code,
               const Scenario& scenario);

    /**
     * @brief Get a snapshot of a job
     * @throws NotFoundError if the id is unknown
     */
    Job Get(const std::string& id) const;

    /// Snapshot of a job, nullopt if unknown
    std::optional<Job> Find(const std::string& id) const;

    /**
     * @brief List jobs ordered by creation time
     * @param status Optional status filter
     */
    std::vector<JobSummary> List(std::optional<JobStatus> status = std::nullopt) const;

    /// Number of stored records
    std::size_t Size() const;

    // ========================================================================
    // State Transitions
    // ========================================================================

    /**
     * @brief Append a timestamped line to a job's log
     *
     * Unknown ids are ignored.
     */
    void AppendLog(const std::string& id, const std::string& message);

    /**
     * @brief Move a job from QUEUED to RUNNING
     * @return false if the job is unknown or not queued
     */
    bool MarkRunning(const std::string& id);

    /**
     * @brief Move a non-terminal job to a terminal state
     *
     * Sets result and completion time exactly once.
     *
     * @return false if the job is unknown or already terminal
     */
    bool Finish(const std::string& id, JobStatus status, const JobResult& result);

    /**
     * @brief Cancel a non-terminal job
     * @param id Job id
     * @param reason Error message stored in the result
     * @return Snapshot after cancellation
     * @throws NotFoundError if the id is unknown
     * @throws InvalidStateError if the job is already terminal
     */
    Job Cancel(const std::string& id, const std::string& reason = kUserCancelMessage);

    // ========================================================================
    // Retention
    // ========================================================================

    /**
     * @brief Delete records completed more than one retention window ago
     * @return Number of deleted records
     */
    std::size_t Sweep();

    /**
     * @brief Run Sweep() periodically on a background thread
     * @param interval Sweep period (defaults to the retention window)
     */
    void StartSweeper(std::optional<std::chrono::milliseconds> interval = std::nullopt);

    /// Stop the background sweeper and join it
    void StopSweeper();

    std::chrono::seconds Retention() const { return retention_; }

private:
    const Clock& clock_;                     ///< Time source
    std::chrono::seconds retention_;         ///< Retention window

    mutable std::mutex mutex_;               ///< Guards jobs_ and creation_order_
    std::map<std::string, Job> jobs_;        ///< Records by id
    std::vector<std::string> creation_order_;  ///< Ids in creation order

    // Sweeper
    std::thread sweeper_;
    std::mutex sweeper_mutex_;
    std::condition_variable sweeper_cv_;
    bool sweeper_stop_{false};

    std::string FormatLogLine(const std::string& message) const;
    void SweeperLoop(std::chrono::milliseconds interval);
};

} // namespace core
} // namespace chaosbox
