/**
 * @file network_fault_controller.hpp
 * @brief Per-job fault-injecting proxy provisioning
 *
 * When a scenario asks for network faults, the job's container is pointed at
 * a dedicated Toxiproxy proxy through HTTP_PROXY/HTTPS_PROXY. Each job gets
 * its own proxy name and an exclusive listen port leased from a configured
 * range, so concurrent faulted jobs never share a listen address.
 *
 * **Provisioning sequence**:
 * ```
 * lease port ─► delete stale proxy ─► create proxy ─► latency ─► bandwidth ─► timeout
 *                                         │ any failure
 *                                         ▼
 *                              delete proxy + release port
 * ```
 *
 * @date 2025
 */

#pragma once

#include "chaosbox/core/job.hpp"
#include "chaosbox/network/toxiproxy_client.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>

namespace chaosbox {
namespace network {

/**
 * @struct NetworkFaultConfig
 * @brief Proxy placement settings
 */
struct NetworkFaultConfig {
    std::string listen_host{"0.0.0.0"};                   ///< Proxy bind address
    std::string advertised_host{"host.docker.internal"};  ///< Address containers dial
    int port_range_start{20000};                          ///< First leasable port
    int port_range_end{20999};                            ///< Last leasable port (inclusive)
    std::string default_upstream{"httpbin.org:80"};       ///< Upstream when unset
    std::string proxy_prefix{"chaosbox_proxy_"};          ///< Proxy name prefix
};

/**
 * @struct ProxyHandle
 * @brief A provisioned proxy owned by one job
 */
struct ProxyHandle {
    std::string job_id;            ///< Owning job
    std::string name;              ///< Proxy name
    std::string listen_host;       ///< Bind address
    int listen_port{0};            ///< Leased port
    std::string advertised_host;   ///< Host containers use

    /// http://<advertised_host>:<listen_port>
    std::string ProxyUrl() const;
};

class NetworkFaultController;

/**
 * @class ProxyLease
 * @brief Move-only owner of a provisioned proxy
 *
 * Destruction tears the proxy down exactly once.
 */
class ProxyLease {
public:
    ProxyLease() = default;
    ProxyLease(NetworkFaultController& controller, ProxyHandle handle);
    ~ProxyLease();

    ProxyLease(ProxyLease&& other) noexcept;
    ProxyLease& operator=(ProxyLease&& other) noexcept;

    ProxyLease(const ProxyLease&) = delete;
    ProxyLease& operator=(const ProxyLease&) = delete;

    bool Active() const { return controller_ != nullptr; }
    const ProxyHandle& Handle() const { return handle_; }

    /// Tear down now; later calls and destruction are no-ops
    void Release() noexcept;

private:
    NetworkFaultController* controller_{nullptr};
    ProxyHandle handle_;
};

/**
 * @class NetworkFaultController
 * @brief Creates and destroys per-job proxies
 *
 * **Usage Example**:
 * @code
 * ToxiproxyClient api("http://localhost:8474");
 * NetworkFaultController controller(api);
 *
 * core::Scenario scenario;
 * scenario.network_latency_ms = 300;
 *
 * ProxyLease lease = controller.Acquire(job_id, scenario);
 * auto env = NetworkFaultController::ProxyEnvironment(lease.Handle());
 * // ... run container with env ...
 * // lease destructor deletes the proxy and frees the port
 * @endcode
 *
 * **Thread Safety**: Port and ownership tables are mutex protected; proxy
 * API calls run outside the lock.
 */
class NetworkFaultController {
public:
    /**
     * @param api Proxy control plane (must outlive the controller)
     * @param config Placement settings
     */
    explicit NetworkFaultController(ProxyApi& api,
                                    NetworkFaultConfig config = NetworkFaultConfig{});

    NetworkFaultController(const NetworkFaultController&) = delete;
    NetworkFaultController& operator=(const NetworkFaultController&) = delete;

    /**
     * @brief Provision a proxy with the scenario's toxics
     * @param job_id Owning job
     * @param scenario Requested faults
     * @return Handle of the live proxy
     * @throws core::ProxyProvisioningError if no port is free, the job already
     *         owns a proxy, or the proxy API fails
     */
    ProxyHandle Provision(const std::string& job_id, const core::Scenario& scenario);

    /**
     * @brief Delete a proxy and release its port
     *
     * Deletion errors are logged, never thrown.
     */
    void Teardown(const ProxyHandle& handle) noexcept;

    /// Provision() wrapped in a ProxyLease
    ProxyLease Acquire(const std::string& job_id, const core::Scenario& scenario);

    /// Number of proxies currently owned by jobs
    std::size_t LiveProxyCount() const;

    /**
     * @brief Delete prefixed proxies no live job owns
     *
     * Run once at startup to clear proxies left by a previous process.
     *
     * @return Number of proxies deleted
     */
    std::size_t PurgeStaleProxies();

    /// Proxy name for a job
    std::string ProxyName(const std::string& job_id) const;

    /// HTTP_PROXY / HTTPS_PROXY variables for a handle
    static std::map<std::string, std::string> ProxyEnvironment(const ProxyHandle& handle);

private:
    ProxyApi& api_;
    NetworkFaultConfig config_;

    mutable std::mutex mutex_;
    std::map<std::string, int> live_;     ///< job id → leased port
    std::set<int> leased_ports_;          ///< Ports in use
    int next_port_;                       ///< Round-robin cursor

    std::optional<int> LeasePort(const std::string& job_id);
    void ReleasePort(const std::string& job_id) noexcept;
    void AttachToxics(const std::string& proxy_name, const core::Scenario& scenario);
};

} // namespace network
} // namespace chaosbox
