/**
 * @file container_executor.cpp
 * @brief Container run with watchdog, cancellation and guaranteed cleanup
 *
 * **Timeout Management**:
 * - A watchdog thread wakes every 50ms while the container is attached
 * - Deadline reached: kill the container, append the timeout sentinel
 * - Cancellation token set: kill the container, report cancelled
 *
 * Resources are held by RAII owners declared in acquisition order (temp dir,
 * proxy lease, container guard), so they are released in reverse order on
 * every exit path.
 *
 * @date 2025
 */

#include "chaosbox/sandbox/container_executor.hpp"
#include "chaosbox/core/errors.hpp"
#include "chaosbox/utils/hash_utils.hpp"
#include "chaosbox/utils/temp_dir.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <thread>

namespace chaosbox {
namespace sandbox {

namespace {

constexpr std::chrono::milliseconds kWatchdogSlice{50};
constexpr int kMaxKillAttempts = 3;   ///< Then fall back to forced removal

/// Force-removes a created container on scope exit
class ContainerGuard {
public:
    ContainerGuard(utils::ContainerRuntime& runtime, std::string container_id)
        : runtime_(runtime), container_id_(std::move(container_id)) {}

    ~ContainerGuard() {
        try {
            runtime_.RemoveContainer(container_id_, true);
        } catch (const std::exception& e) {
            spdlog::warn("Container cleanup failed for {}: {}", container_id_, e.what());
        }
    }

    ContainerGuard(const ContainerGuard&) = delete;
    ContainerGuard& operator=(const ContainerGuard&) = delete;

    const std::string& Id() const { return container_id_; }

private:
    utils::ContainerRuntime& runtime_;
    std::string container_id_;
};

} // anonymous namespace

// ============================================================================
// CONSTRUCTOR
// ============================================================================

ContainerExecutor::ContainerExecutor(utils::ContainerRuntime& runtime,
                                     network::NetworkFaultController* faults,
                                     ExecutorConfig config)
    : runtime_(runtime), faults_(faults), config_(std::move(config)) {
    spdlog::debug("Container executor ready (python: {}, javascript: {}, limit: {}ms)",
                  config_.python_image, config_.javascript_image,
                  config_.wall_clock_limit.count());
}

// ============================================================================
// PROFILES
// ============================================================================

RuntimeProfile ContainerExecutor::ProfileFor(core::Language language) const {
    switch (language) {
        case core::Language::PYTHON:
            return RuntimeProfile{language, config_.python_image, "usercode.py",
                                  {"python", "/code/usercode.py"}};
        case core::Language::JAVASCRIPT:
            return RuntimeProfile{language, config_.javascript_image, "usercode.js",
                                  {"node", "/code/usercode.js"}};
        default:
            throw core::UnsupportedLanguageError(core::ToString(language));
    }
}

utils::ContainerConfig ContainerExecutor::BuildContainerConfig(
    const RuntimeProfile& profile,
    const std::string& container_name,
    const std::filesystem::path& code_dir,
    const network::ProxyHandle* proxy) const {

    utils::ContainerBuilder builder;
    builder.WithName(container_name)
        .WithImage(profile.image)
        .WithCommand(profile.command)
        .WithMemoryLimit(kMemoryLimitBytes)
        .WithCpuQuota(kCpuPeriodUs, kCpuQuotaUs)
        .WithPidsLimit(kPidsLimit)
        .WithMount(code_dir, "/code", true)
        .WithWorkingDir("/code");

    if (proxy) {
        builder.WithEnvironment(network::NetworkFaultController::ProxyEnvironment(*proxy));
        // host.docker.internal is not predefined on Linux engines
        builder.WithExtraHost(proxy->advertised_host + ":host-gateway");
    }

    return builder.Build();
}

// ============================================================================
// EXECUTION
// ============================================================================

ExecutionResult ContainerExecutor::Run(const ExecutionRequest& request) {
    RuntimeProfile profile = ProfileFor(core::RequireLanguage(request.language));

    ExecutionResult result;

    if (request.cancel && request.cancel->IsCancelled()) {
        spdlog::info("Job {} cancelled before execution; skipping", request.job_id);
        result.cancelled = true;
        return result;
    }

    // Stage source
    std::optional<utils::ScopedTempDir> staging;
    try {
        staging.emplace(config_.temp_root, "chaosbox_" + request.job_id + "_");
        staging->WriteFile(profile.file_name, request.source);
    } catch (const std::filesystem::filesystem_error& e) {
        throw core::ExecutionFailure(std::string("Failed to stage source: ") + e.what());
    }

    // Network faults
    network::ProxyLease lease;
    if (request.scenario.RequestsNetworkFaults()) {
        if (!faults_) {
            throw core::ExecutionFailure(
                "Scenario requests network faults but no proxy controller is configured");
        }
        lease = faults_->Acquire(request.job_id, request.scenario);
    }

    std::string container_name = config_.container_prefix + request.job_id + "_" +
                                 utils::HashUtils::ToHex(
                                     utils::HashUtils::RandomBytes(4).data(), 4);

    auto container_config = BuildContainerConfig(profile, container_name, staging->Path(),
                                                 lease.Active() ? &lease.Handle() : nullptr);

    std::string container_id = runtime_.CreateContainer(container_config);
    if (container_id.empty()) {
        throw core::ExecutionFailure("Failed to create container from image " + profile.image);
    }
    ContainerGuard guard(runtime_, container_id);

    // Watchdog
    std::mutex watchdog_mutex;
    std::condition_variable watchdog_cv;
    bool finished = false;
    std::atomic<bool> timed_out{false};
    std::atomic<bool> cancelled{false};

    const auto deadline = std::chrono::steady_clock::now() + config_.wall_clock_limit;

    std::thread watchdog([&]() {
        std::unique_lock<std::mutex> lock(watchdog_mutex);
        int kill_attempts = 0;

        while (!finished) {
            watchdog_cv.wait_for(lock, kWatchdogSlice);
            if (finished) {
                break;
            }

            if (!timed_out.load() && !cancelled.load()) {
                if (request.cancel && request.cancel->IsCancelled()) {
                    cancelled.store(true);
                    spdlog::info("Job {} cancelled, killing container", request.job_id);
                } else if (std::chrono::steady_clock::now() >= deadline) {
                    timed_out.store(true);
                    spdlog::warn("⏱ Timeout reached ({}ms) for job {}, killing container",
                                 config_.wall_clock_limit.count(), request.job_id);
                } else {
                    continue;
                }
            }

            // Retried every slice until one attempt succeeds
            lock.unlock();
            bool stopped = false;
            try {
                ++kill_attempts;
                if (kill_attempts <= kMaxKillAttempts) {
                    stopped = runtime_.KillContainer(container_id);
                } else {
                    stopped = runtime_.RemoveContainer(container_id, true);
                }
            } catch (const std::exception& e) {
                spdlog::error("Failed to stop container {}: {}", container_id, e.what());
            }
            if (!stopped) {
                spdlog::warn("Stop attempt {} for container {} failed", kill_attempts,
                             container_id.substr(0, 12));
            }
            lock.lock();

            if (stopped) {
                break;
            }
        }
    });

    auto stop_watchdog = [&]() {
        {
            std::lock_guard<std::mutex> lock(watchdog_mutex);
            finished = true;
        }
        watchdog_cv.notify_all();
        watchdog.join();
    };

    int exit_code = -1;
    try {
        exit_code = runtime_.StartAttached(container_id, [&](const std::string& chunk) {
            result.output += chunk;
            if (request.on_output) {
                request.on_output(chunk);
            }
        });
    } catch (const std::exception&) {
        stop_watchdog();
        throw;
    }
    stop_watchdog();

    result.exit_code = exit_code;

    if (timed_out.load()) {
        result.timed_out = true;
        result.success = false;
        result.output += std::string("\n") + kTimeoutSentinel;
        return result;
    }

    if (cancelled.load()) {
        result.cancelled = true;
        result.success = false;
        return result;
    }

    if (exit_code < 0) {
        throw core::ExecutionFailure("Failed to attach to container " +
                                     container_id.substr(0, 12));
    }

    result.success = true;
    spdlog::info("Job {} container exited with code {}", request.job_id, exit_code);
    return result;
}

} // namespace sandbox
} // namespace chaosbox
