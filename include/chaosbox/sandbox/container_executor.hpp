/**
 * @file container_executor.hpp
 * @brief Runs one snippet inside a resource-capped container
 *
 * The executor stages the source into a private temp directory, provisions a
 * fault proxy when the scenario needs one, runs the container attached under
 * hard memory/CPU/wall-clock ceilings, and tears everything down on every
 * path.
 *
 * **Execution Flow**:
 * ```
 * ┌──────────────┐   ┌─────────────┐   ┌───────────────┐   ┌─────────────┐
 * │ Resolve      │──►│ Stage       │──►│ Provision     │──►│ Create      │
 * │ profile      │   │ source      │   │ proxy (opt.)  │   │ container   │
 * └──────────────┘   └─────────────┘   └───────────────┘   └──────┬──────┘
 *                                                                 │
 *        ┌────────────────────────────────────────────────────────┘
 *        ▼
 * ┌──────────────┐   ┌─────────────────────────────────────────────┐
 * │ Start        │──►│ Cleanup: remove container, temp dir, proxy  │
 * │ attached     │   │ (reverse acquisition order, exactly once)   │
 * │ + watchdog   │   └─────────────────────────────────────────────┘
 * └──────────────┘
 * ```
 *
 * @date 2025
 */

#pragma once

#include "chaosbox/core/cancellation.hpp"
#include "chaosbox/core/job.hpp"
#include "chaosbox/network/network_fault_controller.hpp"
#include "chaosbox/utils/container_utils.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace chaosbox {
namespace sandbox {

// Resource ceilings applied to every container
constexpr std::uint64_t kMemoryLimitBytes = 128ULL * 1024 * 1024;   ///< 128 MiB
constexpr std::int64_t kCpuPeriodUs = 100000;                        ///< CFS period
constexpr std::int64_t kCpuQuotaUs = 50000;                          ///< 0.5 core
constexpr std::chrono::seconds kWallClockLimit{10};                  ///< Per run
constexpr int kPidsLimit = 64;                                       ///< Process ceiling
constexpr const char* kTimeoutSentinel = "[Timeout]";                ///< Appended on timeout

/**
 * @struct RuntimeProfile
 * @brief How to run one language
 */
struct RuntimeProfile {
    core::Language language;
    std::string image;                  ///< Container image
    std::string file_name;              ///< Staged file name
    std::vector<std::string> command;   ///< Command run inside the container
};

/**
 * @struct ExecutorConfig
 * @brief Executor settings
 */
struct ExecutorConfig {
    std::string python_image{"python-sandbox:latest"};   ///< Python image
    std::string javascript_image{"node:20-slim"};        ///< Node.js image
    std::filesystem::path temp_root{
        std::filesystem::temp_directory_path() / "chaosbox"};  ///< Staging root
    std::chrono::milliseconds wall_clock_limit{kWallClockLimit};  ///< Kill deadline
    std::string container_prefix{"chaosbox_job_"};       ///< Container name prefix
};

/// Output chunk observer
using OutputObserver = std::function<void(const std::string&)>;

/**
 * @struct ExecutionRequest
 * @brief One run
 */
struct ExecutionRequest {
    std::string job_id;                    ///< Owning job
    std::string language;                  ///< Requested language
    std::string source;                    ///< Source after injection
    core::Scenario scenario;               ///< For network faults
    core::CancellationTokenPtr cancel;     ///< Optional cancellation
    OutputObserver on_output;              ///< Optional live output
};

/**
 * @struct ExecutionResult
 * @brief Outcome of one run
 */
struct ExecutionResult {
    std::string output;       ///< Raw combined stdout/stderr
    bool success{false};      ///< Exited on its own (any exit code)
    bool timed_out{false};    ///< Killed by the wall-clock watchdog
    bool cancelled{false};    ///< Killed or skipped due to cancellation
    int exit_code{0};         ///< Container exit status
};

/**
 * @class ContainerExecutor
 * @brief Isolated snippet execution
 *
 * **Usage Example**:
 * @code
 * utils::DockerClient docker;
 * network::ToxiproxyClient toxiproxy;
 * network::NetworkFaultController faults(toxiproxy);
 * ContainerExecutor executor(docker, &faults);
 *
 * ExecutionRequest request;
 * request.job_id = job.id;
 * request.language = "python";
 * request.source = "print(1+1)";
 *
 * ExecutionResult result = executor.Run(request);
 * @endcode
 *
 * Timeouts and cancellations are results, not errors. Setup failures throw
 * core::ExecutionFailure; unknown languages throw
 * core::UnsupportedLanguageError before anything is provisioned.
 *
 * **Thread Safety**: Run() may be called concurrently for different jobs.
 */
class ContainerExecutor {
public:
    /**
     * @param runtime Container runtime (must outlive the executor)
     * @param faults Proxy controller, nullptr to reject network scenarios
     * @param config Executor settings
     */
    ContainerExecutor(utils::ContainerRuntime& runtime,
                      network::NetworkFaultController* faults,
                      ExecutorConfig config = ExecutorConfig{});

    /**
     * @brief Run a snippet to completion, timeout or cancellation
     * @throws core::UnsupportedLanguageError
     * @throws core::ExecutionFailure
     * @throws core::ProxyProvisioningError
     */
    ExecutionResult Run(const ExecutionRequest& request);

    /// Runtime profile for a language
    RuntimeProfile ProfileFor(core::Language language) const;

    /// Container configuration for a profile (exposed for tests)
    utils::ContainerConfig BuildContainerConfig(
        const RuntimeProfile& profile,
        const std::string& container_name,
        const std::filesystem::path& code_dir,
        const network::ProxyHandle* proxy) const;

private:
    utils::ContainerRuntime& runtime_;
    network::NetworkFaultController* faults_;
    ExecutorConfig config_;
};

} // namespace sandbox
} // namespace chaosbox
