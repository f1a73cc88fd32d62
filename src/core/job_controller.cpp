/**
 * @file job_controller.cpp
 * @brief Job task orchestration
 *
 * @date 2025
 */

#include "chaosbox/core/job_controller.hpp"
#include "chaosbox/core/errors.hpp"

#include <spdlog/spdlog.h>

#include <vector>

namespace chaosbox {
namespace core {

JobLifecycleController::JobLifecycleController(JobRegistry& registry,
                                               sandbox::ContainerExecutor& executor,
                                               utils::OutputSanitizer sanitizer)
    : registry_(registry), executor_(executor), sanitizer_(std::move(sanitizer)) {
}

JobLifecycleController::~JobLifecycleController() {
    Shutdown();
}

// ============================================================================
// SUBMISSION / CANCELLATION
// ============================================================================

std::string JobLifecycleController::Submit(const std::string& language,
                                           const std::string& code,
                                           const Scenario& scenario) {
    {
        std::lock_guard<std::mutex> lock(handles_mutex_);
        if (shutting_down_) {
            throw InvalidStateError("Service is shutting down");
        }
    }

    ReapFinished();

    Job job = registry_.Create(language, code, scenario);
    auto cancel = std::make_shared<CancellationToken>();

    {
        // Shutdown may have started while the record was being created
        std::lock_guard<std::mutex> lock(handles_mutex_);
        if (!shutting_down_) {
            std::shared_future<void> task =
                std::async(std::launch::async,
                           [this, id = job.id, cancel]() { RunJob(id, cancel); })
                    .share();
            handles_[job.id] = JobHandle{cancel, task};
            return job.id;
        }
    }

    registry_.Cancel(job.id, kShutdownCancelMessage);
    throw InvalidStateError("Service is shutting down");
}

Job JobLifecycleController::Cancel(const std::string& id) {
    Job job = registry_.Cancel(id);

    std::lock_guard<std::mutex> lock(handles_mutex_);
    auto it = handles_.find(id);
    if (it != handles_.end()) {
        it->second.cancel->Cancel();
    }

    return job;
}

bool JobLifecycleController::Wait(const std::string& id, std::chrono::milliseconds timeout) {
    std::shared_future<void> task;
    {
        std::lock_guard<std::mutex> lock(handles_mutex_);
        auto it = handles_.find(id);
        if (it == handles_.end()) {
            return true;
        }
        task = it->second.task;
    }

    return task.wait_for(timeout) == std::future_status::ready;
}

void JobLifecycleController::Shutdown() {
    std::vector<std::pair<std::string, JobHandle>> outstanding;
    {
        std::lock_guard<std::mutex> lock(handles_mutex_);
        shutting_down_ = true;
        outstanding.assign(handles_.begin(), handles_.end());
    }

    if (!outstanding.empty()) {
        spdlog::info("Shutting down; waiting for {} job task(s)", outstanding.size());
    }

    for (auto& [id, handle] : outstanding) {
        auto job = registry_.Find(id);
        if (job && !IsTerminal(job->status)) {
            try {
                registry_.Cancel(id, kShutdownCancelMessage);
            } catch (const InvalidStateError&) {
                // Finished between Find and Cancel
            } catch (const NotFoundError&) {
                // Swept
            }
        }
        handle.cancel->Cancel();
    }

    for (auto& [id, handle] : outstanding) {
        handle.task.wait();
    }

    std::lock_guard<std::mutex> lock(handles_mutex_);
    handles_.clear();
}

std::size_t JobLifecycleController::ActiveTasks() const {
    std::lock_guard<std::mutex> lock(handles_mutex_);
    return handles_.size();
}

// ============================================================================
// TASK BODY
// ============================================================================

void JobLifecycleController::RunJob(const std::string& id, const CancellationTokenPtr& cancel) {
    if (cancel && cancel->IsCancelled()) {
        return;
    }
    if (!registry_.MarkRunning(id)) {
        // Cancelled (or removed) before the task got scheduled
        spdlog::debug("Job {} not queued; task exits", id);
        return;
    }
    registry_.AppendLog(id, "Job execution started.");

    try {
        Job job = registry_.Get(id);
        Language language = RequireLanguage(job.language);

        sandbox::ExecutionRequest request;
        request.job_id = id;
        request.language = job.language;
        request.source = injector_.Inject(job.code, job.scenario, language);
        request.scenario = job.scenario;
        request.cancel = cancel;

        sandbox::ExecutionResult execution = executor_.Run(request);

        if (execution.cancelled) {
            registry_.AppendLog(id, "Execution stopped after cancellation.");
            return;
        }

        std::string output = sanitizer_.Sanitize(execution.output);

        if (execution.timed_out) {
            registry_.AppendLog(id, sanitizer_.TimeoutNotice());
        } else if (execution.exit_code != 0) {
            registry_.AppendLog(id, "Process exited with code " +
                                        std::to_string(execution.exit_code) + ".");
        }

        JobResult result;
        result.output = output;
        result.success = execution.success;
        result.exit_code = execution.exit_code;

        if (registry_.Finish(id, JobStatus::COMPLETED, result)) {
            registry_.AppendLog(id, "Execution completed.");
        }
    } catch (const std::exception& e) {
        spdlog::error("Job {} failed: {}", id, e.what());

        JobResult result;
        result.error = e.what();
        result.success = false;

        if (registry_.Finish(id, JobStatus::FAILED, result)) {
            registry_.AppendLog(id, std::string("Execution failed: ") + e.what());
        }
    }
}

// ============================================================================
// PRIVATE HELPER METHODS
// ============================================================================

void JobLifecycleController::ReapFinished() {
    std::lock_guard<std::mutex> lock(handles_mutex_);

    for (auto it = handles_.begin(); it != handles_.end();) {
        if (it->second.task.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
            it = handles_.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace core
} // namespace chaosbox
