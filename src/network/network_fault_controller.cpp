/**
 * @file network_fault_controller.cpp
 * @brief Per-job proxy provisioning and teardown
 *
 * @date 2025
 */

#include "chaosbox/network/network_fault_controller.hpp"
#include "chaosbox/core/errors.hpp"
#include "chaosbox/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

namespace chaosbox {
namespace network {

std::string ProxyHandle::ProxyUrl() const {
    return "http://" + advertised_host + ":" + std::to_string(listen_port);
}

// ============================================================================
// PROXY LEASE
// ============================================================================

ProxyLease::ProxyLease(NetworkFaultController& controller, ProxyHandle handle)
    : controller_(&controller), handle_(std::move(handle)) {
}

ProxyLease::~ProxyLease() {
    Release();
}

ProxyLease::ProxyLease(ProxyLease&& other) noexcept
    : controller_(other.controller_), handle_(std::move(other.handle_)) {
    other.controller_ = nullptr;
}

ProxyLease& ProxyLease::operator=(ProxyLease&& other) noexcept {
    if (this != &other) {
        Release();
        controller_ = other.controller_;
        handle_ = std::move(other.handle_);
        other.controller_ = nullptr;
    }
    return *this;
}

void ProxyLease::Release() noexcept {
    if (controller_) {
        controller_->Teardown(handle_);
        controller_ = nullptr;
    }
}

// ============================================================================
// CONTROLLER
// ============================================================================

NetworkFaultController::NetworkFaultController(ProxyApi& api, NetworkFaultConfig config)
    : api_(api), config_(std::move(config)), next_port_(config_.port_range_start) {
    if (config_.port_range_end < config_.port_range_start) {
        throw core::ValidationError("Invalid proxy port range " +
                                    std::to_string(config_.port_range_start) + "-" +
                                    std::to_string(config_.port_range_end));
    }
}

std::string NetworkFaultController::ProxyName(const std::string& job_id) const {
    return config_.proxy_prefix + job_id;
}

ProxyHandle NetworkFaultController::Provision(const std::string& job_id,
                                              const core::Scenario& scenario) {
    ProxyHandle handle;
    handle.job_id = job_id;
    handle.name = ProxyName(job_id);
    handle.listen_host = config_.listen_host;
    handle.advertised_host = config_.advertised_host;

    auto port = LeasePort(job_id);
    if (!port) {
        throw core::ProxyProvisioningError("No free proxy port in range " +
                                           std::to_string(config_.port_range_start) + "-" +
                                           std::to_string(config_.port_range_end));
    }
    handle.listen_port = *port;

    // Leftover from a crashed run; absence is the normal case
    try {
        if (api_.DeleteProxy(handle.name)) {
            spdlog::warn("Removed stale proxy {}", handle.name);
        }
    } catch (const std::exception& e) {
        spdlog::debug("Stale proxy check for {} failed: {}", handle.name, e.what());
    }

    std::string upstream = scenario.upstream && !scenario.upstream->empty()
                               ? *scenario.upstream
                               : config_.default_upstream;
    std::string listen = handle.listen_host + ":" + std::to_string(handle.listen_port);

    try {
        api_.CreateProxy(handle.name, listen, upstream);
    } catch (const std::exception& e) {
        spdlog::error("Proxy creation failed for job {}: {}", job_id, e.what());
        ReleasePort(job_id);
        throw core::ProxyProvisioningError(e.what());
    }

    try {
        AttachToxics(handle.name, scenario);
    } catch (const std::exception& e) {
        spdlog::error("Toxic setup failed for job {}: {}", job_id, e.what());
        Teardown(handle);
        throw core::ProxyProvisioningError(e.what());
    }

    spdlog::info("Network faults active for job {} via {}", job_id, handle.ProxyUrl());
    return handle;
}

void NetworkFaultController::Teardown(const ProxyHandle& handle) noexcept {
    try {
        if (!api_.DeleteProxy(handle.name)) {
            spdlog::warn("Proxy {} was not deleted cleanly", handle.name);
        }
    } catch (const std::exception& e) {
        spdlog::warn("Proxy teardown failed for {}: {}", handle.name, e.what());
    }

    ReleasePort(handle.job_id);
    spdlog::debug("Proxy {} released (port {})", handle.name, handle.listen_port);
}

ProxyLease NetworkFaultController::Acquire(const std::string& job_id,
                                           const core::Scenario& scenario) {
    return ProxyLease(*this, Provision(job_id, scenario));
}

std::size_t NetworkFaultController::LiveProxyCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return live_.size();
}

std::size_t NetworkFaultController::PurgeStaleProxies() {
    std::set<std::string> owned;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : live_) {
            owned.insert(ProxyName(entry.first));
        }
    }

    std::size_t purged = 0;
    for (const auto& name : api_.ListProxies()) {
        if (!utils::StringUtils::StartsWith(name, config_.proxy_prefix) || owned.count(name) > 0) {
            continue;
        }
        try {
            if (api_.DeleteProxy(name)) {
                ++purged;
            }
        } catch (const std::exception& e) {
            spdlog::warn("Failed to purge stale proxy {}: {}", name, e.what());
        }
    }

    if (purged > 0) {
        spdlog::info("Purged {} stale proxies", purged);
    }
    return purged;
}

std::map<std::string, std::string> NetworkFaultController::ProxyEnvironment(
    const ProxyHandle& handle) {
    std::string url = handle.ProxyUrl();
    return {
        {"HTTP_PROXY", url},
        {"HTTPS_PROXY", url}
    };
}

// ============================================================================
// PRIVATE HELPER METHODS
// ============================================================================

std::optional<int> NetworkFaultController::LeasePort(const std::string& job_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (live_.count(job_id) > 0) {
        throw core::ProxyProvisioningError("Job " + job_id + " already owns a proxy");
    }

    const int range = config_.port_range_end - config_.port_range_start + 1;
    for (int attempt = 0; attempt < range; ++attempt) {
        int candidate = next_port_;
        next_port_ = candidate >= config_.port_range_end ? config_.port_range_start
                                                         : candidate + 1;

        if (leased_ports_.count(candidate) == 0) {
            leased_ports_.insert(candidate);
            live_[job_id] = candidate;
            return candidate;
        }
    }

    return std::nullopt;
}

void NetworkFaultController::ReleasePort(const std::string& job_id) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = live_.find(job_id);
    if (it == live_.end()) {
        return;
    }
    leased_ports_.erase(it->second);
    live_.erase(it);
}

void NetworkFaultController::AttachToxics(const std::string& proxy_name,
                                          const core::Scenario& scenario) {
    if (scenario.network_latency_ms && *scenario.network_latency_ms > 0) {
        ToxicSpec toxic;
        toxic.type = "latency";
        toxic.name = "latency";
        toxic.attributes["latency"] = *scenario.network_latency_ms;
        api_.AddToxic(proxy_name, toxic);
    }

    if (scenario.bandwidth_kbps && *scenario.bandwidth_kbps > 0) {
        ToxicSpec toxic;
        toxic.type = "bandwidth";
        toxic.name = "bandwidth";
        toxic.attributes["rate"] = *scenario.bandwidth_kbps;
        api_.AddToxic(proxy_name, toxic);
    }

    if (scenario.timeout_ms && *scenario.timeout_ms > 0) {
        ToxicSpec toxic;
        toxic.type = "timeout";
        toxic.name = "timeout";
        toxic.attributes["timeout"] = *scenario.timeout_ms;
        api_.AddToxic(proxy_name, toxic);
    }
}

} // namespace network
} // namespace chaosbox
