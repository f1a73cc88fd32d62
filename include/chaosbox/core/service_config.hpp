/**
 * @file service_config.hpp
 * @brief Service configuration loaded from JSON
 *
 * **Example configuration file**:
 * ```json
 * {
 *   "images": { "python": "python-sandbox:latest", "javascript": "node:20-slim" },
 *   "temp_root": "/tmp/chaosbox",
 *   "docker_binary": "docker",
 *   "toxiproxy": {
 *     "api_url": "http://localhost:8474",
 *     "listen_host": "0.0.0.0",
 *     "advertised_host": "host.docker.internal",
 *     "port_range": [20000, 20999],
 *     "default_upstream": "httpbin.org:80"
 *   },
 *   "retention_seconds": 3600,
 *   "verbose": false
 * }
 * ```
 *
 * Every key is optional; unknown keys are ignored.
 *
 * @date 2025
 */

#pragma once

#include "chaosbox/network/network_fault_controller.hpp"
#include "chaosbox/sandbox/container_executor.hpp"

#include <chrono>
#include <filesystem>
#include <string>

namespace chaosbox {
namespace core {

/**
 * @struct ServiceConfig
 * @brief All runtime settings of the service
 */
struct ServiceConfig {
    sandbox::ExecutorConfig executor;            ///< Images, staging root, limits
    network::NetworkFaultConfig network;         ///< Proxy placement
    std::string toxiproxy_api_url{"http://localhost:8474"};  ///< Toxiproxy API
    std::string docker_binary{"docker"};         ///< docker CLI
    std::chrono::seconds retention{3600};        ///< Completed-job retention
    bool verbose{false};                         ///< Debug logging

    /**
     * @brief Load configuration from a JSON file
     * @throws ValidationError if the file is unreadable, malformed or has
     *         ill-typed values
     */
    static ServiceConfig FromFile(const std::filesystem::path& path);

    /**
     * @brief Load configuration from JSON text
     * @throws ValidationError
     */
    static ServiceConfig FromJsonString(const std::string& text);

    /// Serialize to pretty-printed JSON
    std::string ToJsonString() const;

    /**
     * @brief Check values for consistency
     * @throws ValidationError
     */
    void Validate() const;
};

} // namespace core
} // namespace chaosbox
