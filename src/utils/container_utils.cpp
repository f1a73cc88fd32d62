/**
 * @file container_utils.cpp
 * @brief docker CLI implementation of the container runtime
 *
 * **Container Lifecycle**:
 * ```
 * docker create → docker start -a → (docker kill) → docker rm --force
 * ```
 *
 * **Hardening applied to every container**:
 * - Capability dropping (--cap-drop ALL)
 * - No new privileges (--security-opt no-new-privileges)
 * - Memory ceiling with swap disabled (--memory == --memory-swap)
 * - CFS quota accounting (--cpu-period / --cpu-quota)
 * - Process limit (--pids-limit)
 * - Source mounted read-only
 *
 * @date 2025
 */

#include "chaosbox/utils/container_utils.hpp"

#include <spdlog/spdlog.h>

namespace chaosbox {
namespace utils {

// ============================================================================
// CONSTRUCTOR
// ============================================================================

DockerClient::DockerClient(std::string docker_binary)
    : docker_binary_(std::move(docker_binary)) {
    spdlog::debug("Docker client using binary: {}", docker_binary_);
}

// ============================================================================
// RUNTIME AVAILABILITY
// ============================================================================

bool DockerClient::IsAvailable() const {
    auto result = ExecuteDockerCommand({"version", "--format", "{{.Server.Version}}"});
    if (!result.Succeeded()) {
        spdlog::error("Docker is not available: {}", result.output);
        return false;
    }

    spdlog::debug("Docker server version: {}", result.output);
    return true;
}

// ============================================================================
// CONTAINER LIFECYCLE MANAGEMENT
// ============================================================================

std::string DockerClient::CreateContainer(const ContainerConfig& config) {
    spdlog::info("Creating container: {}", config.name);

    if (config.image.empty()) {
        spdlog::error("Container image not specified");
        return "";
    }

    auto result = ExecuteDockerCommand(BuildCreateArgs(config));

    if (result.Succeeded()) {
        // Extract container ID from output
        std::string container_id = result.output;
        container_id.erase(container_id.find_last_not_of(" \n\r\t") + 1);
        auto last_line = container_id.find_last_of('\n');
        if (last_line != std::string::npos) {
            container_id = container_id.substr(last_line + 1);
        }

        spdlog::info("✓ Container created: {}", container_id.substr(0, 12));
        return container_id;
    }

    spdlog::error("Failed to create container: {}", result.output);
    return "";
}

int DockerClient::StartAttached(const std::string& container_id,
                                const OutputCallback& on_output) {
    spdlog::debug("Starting container attached: {}", container_id);

    std::vector<std::string> args = {docker_binary_, "start", "--attach", container_id};
    return StreamCommand(args, on_output);
}

bool DockerClient::KillContainer(const std::string& container_id) {
    spdlog::info("Killing container: {}", container_id.substr(0, 12));

    auto result = ExecuteDockerCommand({"kill", container_id});
    if (!result.Succeeded()) {
        // Already exited containers cannot be killed; not an error for callers
        spdlog::debug("docker kill returned {}: {}", result.exit_code, result.output);
    }
    return result.Succeeded();
}

bool DockerClient::RemoveContainer(const std::string& container_id, bool force) {
    spdlog::debug("Removing container: {} (force: {})", container_id.substr(0, 12), force);

    std::vector<std::string> args = {"rm"};
    if (force) {
        args.push_back("--force");
    }
    args.push_back(container_id);

    auto result = ExecuteDockerCommand(args);
    if (result.Succeeded()) {
        return true;
    }

    spdlog::warn("Failed to remove container {}: {}", container_id.substr(0, 12), result.output);
    return false;
}

// ============================================================================
// PRIVATE HELPER METHODS
// ============================================================================

CommandResult DockerClient::ExecuteDockerCommand(const std::vector<std::string>& args) const {
    std::vector<std::string> full_args;
    full_args.reserve(args.size() + 1);
    full_args.push_back(docker_binary_);
    full_args.insert(full_args.end(), args.begin(), args.end());

    return ExecuteCommand(full_args);
}

std::vector<std::string> DockerClient::BuildCreateArgs(const ContainerConfig& config) {
    std::vector<std::string> args;

    args.push_back("create");

    // Container name
    if (!config.name.empty()) {
        args.push_back("--name");
        args.push_back(config.name);
    }

    // Memory limit (swap disabled by matching memory-swap)
    if (config.memory_limit_bytes > 0) {
        args.push_back("--memory");
        args.push_back(std::to_string(config.memory_limit_bytes) + "b");
        args.push_back("--memory-swap");
        args.push_back(std::to_string(config.memory_limit_bytes) + "b");
    }

    // CPU limit
    if (config.cpu_period_us > 0 && config.cpu_quota_us > 0) {
        args.push_back("--cpu-period");
        args.push_back(std::to_string(config.cpu_period_us));
        args.push_back("--cpu-quota");
        args.push_back(std::to_string(config.cpu_quota_us));
    }

    // Process limit
    if (config.pids_limit > 0) {
        args.push_back("--pids-limit");
        args.push_back(std::to_string(config.pids_limit));
    }

    // Security: Drop capabilities
    for (const auto& cap : config.capabilities_drop) {
        args.push_back("--cap-drop");
        args.push_back(cap);
    }

    for (const auto& opt : config.security_options) {
        args.push_back("--security-opt");
        args.push_back(opt);
    }

    // Volume mounts
    for (const auto& mount : config.mounts) {
        args.push_back("-v");
        args.push_back(mount.host_path.string() + ":" + mount.container_path.string() +
                       (mount.read_only ? ":ro" : ""));
    }

    // Environment variables
    for (const auto& [key, value] : config.environment_vars) {
        args.push_back("-e");
        args.push_back(key + "=" + value);
    }

    for (const auto& host : config.extra_hosts) {
        args.push_back("--add-host");
        args.push_back(host);
    }

    // Working directory
    if (!config.working_dir.empty()) {
        args.push_back("-w");
        args.push_back(config.working_dir.string());
    }

    // Image (must be last before command)
    args.push_back(config.image);
    args.insert(args.end(), config.command.begin(), config.command.end());

    return args;
}

// ============================================================================
// CONTAINER BUILDER IMPLEMENTATION (FLUENT API)
// ============================================================================

ContainerBuilder& ContainerBuilder::WithName(const std::string& name) {
    config_.name = name;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithImage(const std::string& image) {
    config_.image = image;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithCommand(const std::vector<std::string>& command) {
    config_.command = command;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithMemoryLimit(std::uint64_t bytes) {
    config_.memory_limit_bytes = bytes;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithCpuQuota(std::int64_t period_us, std::int64_t quota_us) {
    config_.cpu_period_us = period_us;
    config_.cpu_quota_us = quota_us;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithPidsLimit(int limit) {
    config_.pids_limit = limit;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithMount(const std::filesystem::path& host,
                                              const std::filesystem::path& container,
                                              bool read_only) {
    config_.mounts.push_back(BindMount{host, container, read_only});
    return *this;
}

ContainerBuilder& ContainerBuilder::WithEnvironment(const std::string& key,
                                                    const std::string& value) {
    config_.environment_vars[key] = value;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithEnvironment(
    const std::map<std::string, std::string>& vars) {
    for (const auto& [key, value] : vars) {
        config_.environment_vars[key] = value;
    }
    return *this;
}

ContainerBuilder& ContainerBuilder::WithExtraHost(const std::string& entry) {
    config_.extra_hosts.push_back(entry);
    return *this;
}

ContainerBuilder& ContainerBuilder::WithWorkingDir(const std::filesystem::path& dir) {
    config_.working_dir = dir;
    return *this;
}

ContainerConfig ContainerBuilder::Build() const {
    return config_;
}

} // namespace utils
} // namespace chaosbox
