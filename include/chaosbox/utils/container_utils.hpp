/**
 * @file container_utils.hpp
 * @brief Container runtime abstraction and docker CLI implementation
 *
 * Defines the narrow container lifecycle the executor needs (create, start
 * attached, kill, remove) behind the ContainerRuntime interface, with a
 * docker CLI backed implementation and a fluent builder for container
 * configurations.
 *
 * @date 2025
 */

#pragma once

#include "chaosbox/utils/command_runner.hpp"

#include <string>
#include <vector>
#include <map>
#include <filesystem>
#include <cstdint>

namespace chaosbox {
namespace utils {

/**
 * @struct BindMount
 * @brief Host directory exposed inside the container
 */
struct BindMount {
    std::filesystem::path host_path;       ///< Host directory
    std::filesystem::path container_path;  ///< Mount point inside container
    bool read_only{true};                  ///< Mount read-only
};

/**
 * @struct ContainerConfig
 * @brief Complete container configuration
 */
struct ContainerConfig {
    // Basic Settings
    std::string name;                      ///< Container name
    std::string image;                     ///< Image reference
    std::vector<std::string> command;      ///< Command and arguments

    // Resource Limits
    std::uint64_t memory_limit_bytes{0};   ///< Memory ceiling (0 = unlimited)
    std::int64_t cpu_period_us{0};         ///< CFS period (0 = unset)
    std::int64_t cpu_quota_us{0};          ///< CFS quota per period (0 = unset)
    int pids_limit{0};                     ///< Process limit (0 = unlimited)

    // Security Settings
    std::vector<std::string> capabilities_drop{"ALL"};           ///< Dropped capabilities
    std::vector<std::string> security_options{"no-new-privileges"};  ///< --security-opt values

    // Filesystem / Environment
    std::vector<BindMount> mounts;                       ///< Bind mounts
    std::map<std::string, std::string> environment_vars; ///< Environment variables
    std::vector<std::string> extra_hosts;                ///< --add-host entries (host:ip)
    std::filesystem::path working_dir;                   ///< Working directory (empty = image default)
};

/**
 * @class ContainerRuntime
 * @brief Minimal container lifecycle used by the sandbox executor
 *
 * Implementations must allow KillContainer() to be called from another
 * thread while StartAttached() is blocked.
 */
class ContainerRuntime {
public:
    virtual ~ContainerRuntime() = default;

    /**
     * @brief Check that the runtime is installed and reachable
     * @return true if containers can be created
     */
    virtual bool IsAvailable() const = 0;

    /**
     * @brief Create (but do not start) a container
     * @param config Container configuration
     * @return Container ID, empty on failure
     */
    virtual std::string CreateContainer(const ContainerConfig& config) = 0;

    /**
     * @brief Start a created container and stream its combined output
     *
     * Blocks until the container exits or is killed.
     *
     * @param container_id Container ID
     * @param on_output Output chunk callback
     * @return Container exit code, -1 if attaching failed
     */
    virtual int StartAttached(const std::string& container_id,
                              const OutputCallback& on_output) = 0;

    /**
     * @brief Kill a running container (SIGKILL)
     * @param container_id Container ID
     * @return true if the runtime accepted the kill
     */
    virtual bool KillContainer(const std::string& container_id) = 0;

    /**
     * @brief Remove a container
     * @param container_id Container ID
     * @param force Kill first if still running
     * @return true if removed
     */
    virtual bool RemoveContainer(const std::string& container_id, bool force) = 0;
};

/**
 * @class DockerClient
 * @brief ContainerRuntime backed by the docker CLI
 *
 * Every operation shells out to the docker binary; no daemon socket or
 * client library is linked.
 *
 * **Usage Example**:
 * @code
 * DockerClient docker;
 *
 * auto config = ContainerBuilder()
 *     .WithName("chaosbox_job_1234")
 *     .WithImage("python-sandbox:latest")
 *     .WithCommand({"python", "/code/usercode.py"})
 *     .WithMemoryLimit(128 * 1024 * 1024)
 *     .WithCpuQuota(100000, 50000)
 *     .WithMount("/tmp/chaosbox_job_1234", "/code", true)
 *     .Build();
 *
 * std::string id = docker.CreateContainer(config);
 * int exit_code = docker.StartAttached(id, [](const std::string& chunk) {
 *     std::cout << chunk;
 * });
 * docker.RemoveContainer(id, true);
 * @endcode
 *
 * **Thread Safety**: Stateless; safe to share across jobs.
 */
class DockerClient : public ContainerRuntime {
public:
    /**
     * @brief Construct client for a docker binary
     * @param docker_binary Binary name or path (resolved through PATH)
     */
    explicit DockerClient(std::string docker_binary = "docker");

    bool IsAvailable() const override;
    std::string CreateContainer(const ContainerConfig& config) override;
    int StartAttached(const std::string& container_id,
                      const OutputCallback& on_output) override;
    bool KillContainer(const std::string& container_id) override;
    bool RemoveContainer(const std::string& container_id, bool force) override;

    /**
     * @brief Build `docker create` arguments for a configuration
     * @param config Container configuration
     * @return Argument vector (without the docker binary)
     */
    static std::vector<std::string> BuildCreateArgs(const ContainerConfig& config);

private:
    std::string docker_binary_;  ///< Docker executable

    CommandResult ExecuteDockerCommand(const std::vector<std::string>& args) const;
};

/**
 * @class ContainerBuilder
 * @brief Fluent API for building container configurations
 */
class ContainerBuilder {
public:
    ContainerBuilder& WithName(const std::string& name);
    ContainerBuilder& WithImage(const std::string& image);
    ContainerBuilder& WithCommand(const std::vector<std::string>& command);
    ContainerBuilder& WithMemoryLimit(std::uint64_t bytes);
    ContainerBuilder& WithCpuQuota(std::int64_t period_us, std::int64_t quota_us);
    ContainerBuilder& WithPidsLimit(int limit);
    ContainerBuilder& WithMount(const std::filesystem::path& host,
                                const std::filesystem::path& container,
                                bool read_only = true);
    ContainerBuilder& WithEnvironment(const std::string& key,
                                      const std::string& value);
    ContainerBuilder& WithEnvironment(const std::map<std::string, std::string>& vars);
    ContainerBuilder& WithExtraHost(const std::string& entry);
    ContainerBuilder& WithWorkingDir(const std::filesystem::path& dir);

    ContainerConfig Build() const;

private:
    ContainerConfig config_;  ///< Configuration being built
};

} // namespace utils
} // namespace chaosbox
