/**
 * @file job_registry.cpp
 * @brief Implementation of the in-memory job store
 *
 * **Status State Machine**:
 * ```
 * QUEUED ──► RUNNING ──► COMPLETED
 *   │          │  └────► FAILED
 *   │          └───────► CANCELLED
 *   ├──────────────────► CANCELLED
 *   └──────────────────► FAILED
 * ```
 *
 * @date 2025
 */

#include "chaosbox/core/job_registry.hpp"
#include "chaosbox/core/errors.hpp"
#include "chaosbox/utils/hash_utils.hpp"
#include "chaosbox/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace chaosbox {
namespace core {

// ============================================================================
// CONSTRUCTOR / DESTRUCTOR
// ============================================================================

JobRegistry::JobRegistry(const Clock& clock, std::chrono::seconds retention)
    : clock_(clock), retention_(retention) {
    spdlog::debug("Job registry created (retention: {}s)", retention_.count());
}

JobRegistry::~JobRegistry() {
    StopSweeper();
}

// ============================================================================
// RECORD MANAGEMENT
// ============================================================================

Job JobRegistry::Create(const std::string& language, const std::string& code,
                        const Scenario& scenario) {
    Job job;
    job.language = language;
    job.code = code;
    job.scenario = scenario;
    job.status = JobStatus::QUEUED;

    std::lock_guard<std::mutex> lock(mutex_);

    do {
        job.id = utils::HashUtils::GenerateUuid();
    } while (jobs_.count(job.id) > 0);

    job.created_at = clock_.Now();
    job.logs.push_back(FormatLogLine("Job created and queued."));

    jobs_.emplace(job.id, job);
    creation_order_.push_back(job.id);

    spdlog::info("Job {} created ({})", job.id, language);
    spdlog::debug("Job {} source: {} bytes, sha256 {}", job.id, code.size(),
                  utils::HashUtils::Sha256(code));
    return job;
}

Job JobRegistry::Get(const std::string& id) const {
    auto job = Find(id);
    if (!job) {
        throw NotFoundError("Job not found: " + id);
    }
    return *job;
}

std::optional<Job> JobRegistry::Find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<JobSummary> JobRegistry::List(std::optional<JobStatus> status) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<JobSummary> summaries;
    summaries.reserve(creation_order_.size());

    for (const auto& id : creation_order_) {
        const Job& job = jobs_.at(id);
        if (status && job.status != *status) {
            continue;
        }
        summaries.push_back(JobSummary{job.id, job.status, job.created_at, job.completed_at});
    }

    return summaries;
}

std::size_t JobRegistry::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size();
}

// ============================================================================
// STATE TRANSITIONS
// ============================================================================

void JobRegistry::AppendLog(const std::string& id, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        return;
    }
    it->second.logs.push_back(FormatLogLine(message));
}

bool JobRegistry::MarkRunning(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = jobs_.find(id);
    if (it == jobs_.end() || it->second.status != JobStatus::QUEUED) {
        return false;
    }

    it->second.status = JobStatus::RUNNING;
    spdlog::debug("Job {} running", id);
    return true;
}

bool JobRegistry::Finish(const std::string& id, JobStatus status, const JobResult& result) {
    if (!IsTerminal(status)) {
        throw InvalidStateError("Finish requires a terminal status, got " + ToString(status));
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        return false;
    }

    Job& job = it->second;
    if (IsTerminal(job.status)) {
        spdlog::debug("Job {} already {}; ignoring transition to {}",
                      id, ToString(job.status), ToString(status));
        return false;
    }

    job.status = status;
    job.result = result;
    job.completed_at = clock_.Now();

    spdlog::info("Job {} {}", id, ToString(status));
    return true;
}

Job JobRegistry::Cancel(const std::string& id, const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        throw NotFoundError("Job not found: " + id);
    }

    Job& job = it->second;
    if (IsTerminal(job.status)) {
        throw InvalidStateError("Job " + id + " is already " + ToString(job.status) +
                                " and cannot be cancelled");
    }

    job.status = JobStatus::CANCELLED;
    job.completed_at = clock_.Now();

    JobResult result;
    result.error = reason;
    job.result = result;

    job.logs.push_back(FormatLogLine(reason));

    spdlog::info("Job {} cancelled", id);
    return job;
}

// ============================================================================
// RETENTION
// ============================================================================

std::size_t JobRegistry::Sweep() {
    std::lock_guard<std::mutex> lock(mutex_);

    const TimePoint cutoff = clock_.Now() - retention_;
    std::size_t removed = 0;

    for (auto it = jobs_.begin(); it != jobs_.end();) {
        const auto& completed_at = it->second.completed_at;
        if (completed_at && *completed_at < cutoff) {
            it = jobs_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }

    if (removed > 0) {
        creation_order_.erase(
            std::remove_if(creation_order_.begin(), creation_order_.end(),
                           [this](const std::string& id) { return jobs_.count(id) == 0; }),
            creation_order_.end());
        spdlog::info("Swept {} expired job(s)", removed);
    }

    return removed;
}

void JobRegistry::StartSweeper(std::optional<std::chrono::milliseconds> interval) {
    if (sweeper_.joinable()) {
        spdlog::warn("Sweeper already running");
        return;
    }

    auto period = interval.value_or(
        std::chrono::duration_cast<std::chrono::milliseconds>(retention_));

    {
        std::lock_guard<std::mutex> lock(sweeper_mutex_);
        sweeper_stop_ = false;
    }

    sweeper_ = std::thread(&JobRegistry::SweeperLoop, this, period);
    spdlog::debug("Sweeper started (interval: {}ms)", period.count());
}

void JobRegistry::StopSweeper() {
    {
        std::lock_guard<std::mutex> lock(sweeper_mutex_);
        sweeper_stop_ = true;
    }
    sweeper_cv_.notify_all();

    if (sweeper_.joinable()) {
        sweeper_.join();
        spdlog::debug("Sweeper stopped");
    }
}

// ============================================================================
// PRIVATE HELPER METHODS
// ============================================================================

std::string JobRegistry::FormatLogLine(const std::string& message) const {
    return "[" + utils::StringUtils::FormatTimestamp(clock_.Now()) + "] " + message;
}

void JobRegistry::SweeperLoop(std::chrono::milliseconds interval) {
    std::unique_lock<std::mutex> lock(sweeper_mutex_);

    while (!sweeper_stop_) {
        if (sweeper_cv_.wait_for(lock, interval, [this] { return sweeper_stop_; })) {
            break;
        }

        lock.unlock();
        Sweep();
        lock.lock();
    }
}

} // namespace core
} // namespace chaosbox
