/**
 * @file job_controller.hpp
 * @brief Drives jobs through their lifecycle on per-job tasks
 *
 * **Job Pipeline**:
 * ```
 * Submit ─► registry (queued) ─► task ─► running ─► inject ─► execute ─► sanitize ─► completed
 *                                          │                    │
 *                                          └──── any error ─────┴──► failed
 * Cancel ─► registry (cancelled) ─► token ─► container killed
 * ```
 *
 * @date 2025
 */

#pragma once

#include "chaosbox/core/cancellation.hpp"
#include "chaosbox/core/job.hpp"
#include "chaosbox/core/job_registry.hpp"
#include "chaosbox/sandbox/container_executor.hpp"
#include "chaosbox/scenario/scenario_injector.hpp"
#include "chaosbox/utils/output_sanitizer.hpp"

#include <chrono>
#include <future>
#include <map>
#include <mutex>
#include <string>

namespace chaosbox {
namespace core {

/**
 * @class JobLifecycleController
 * @brief Owns per-job tasks and their cancellation handles
 *
 * **Usage Example**:
 * @code
 * JobLifecycleController controller(registry, executor);
 *
 * std::string id = controller.Submit("python", "print(1+1)", Scenario{});
 * controller.Wait(id, std::chrono::seconds(30));
 *
 * Job job = registry.Get(id);   // completed, result.output == "2"
 * @endcode
 *
 * There is no admission control: every submission gets its own task.
 *
 * **Thread Safety**: All public methods are thread-safe.
 */
class JobLifecycleController {
public:
    static constexpr const char* kShutdownCancelMessage = "Job was cancelled during shutdown.";

    /**
     * @param registry Job store (must outlive the controller)
     * @param executor Container executor (must outlive the controller)
     * @param sanitizer Output sanitizer
     */
    JobLifecycleController(JobRegistry& registry,
                           sandbox::ContainerExecutor& executor,
                           utils::OutputSanitizer sanitizer = utils::OutputSanitizer{});

    /// Calls Shutdown()
    ~JobLifecycleController();

    JobLifecycleController(const JobLifecycleController&) = delete;
    JobLifecycleController& operator=(const JobLifecycleController&) = delete;

    /**
     * @brief Create a job and start its task
     * @return Job id
     */
    std::string Submit(const std::string& language, const std::string& code,
                       const Scenario& scenario);

    /**
     * @brief Cancel a job and kill its container
     * @return Snapshot after cancellation
     * @throws NotFoundError, InvalidStateError
     */
    Job Cancel(const std::string& id);

    /**
     * @brief Block until a job's task has finished
     * @return true if the task finished (or was never started by this
     *         controller), false on timeout
     */
    bool Wait(const std::string& id, std::chrono::milliseconds timeout);

    /// Cancel every outstanding job and join all tasks
    void Shutdown();

    /// Number of tasks not yet reaped
    std::size_t ActiveTasks() const;

    /// Task body; public for synchronous use in tests and the CLI
    void RunJob(const std::string& id, const CancellationTokenPtr& cancel);

private:
    /**
     * @struct JobHandle
     * @brief Task bookkeeping for one job
     */
    struct JobHandle {
        CancellationTokenPtr cancel;        ///< Shared with the task
        std::shared_future<void> task;      ///< Completion of the task
    };

    JobRegistry& registry_;
    sandbox::ContainerExecutor& executor_;
    scenario::ScenarioInjector injector_;
    utils::OutputSanitizer sanitizer_;

    mutable std::mutex handles_mutex_;
    std::map<std::string, JobHandle> handles_;
    bool shutting_down_{false};

    void ReapFinished();
};

} // namespace core
} // namespace chaosbox
