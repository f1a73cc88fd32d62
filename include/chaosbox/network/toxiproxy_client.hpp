/**
 * @file toxiproxy_client.hpp
 * @brief Control-plane client for the Toxiproxy fault-injection proxy
 *
 * Toxiproxy exposes an HTTP API (default port 8474) for creating TCP proxies
 * and attaching "toxics" (latency, bandwidth, timeout, ...) to them. The
 * ProxyApi interface covers the subset chaosbox needs; ToxiproxyClient talks
 * to a live server through the curl binary.
 *
 * @date 2025
 */

#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace chaosbox {
namespace network {

/**
 * @struct ToxicSpec
 * @brief One toxic to attach to a proxy
 */
struct ToxicSpec {
    std::string type;                                  ///< latency, bandwidth, timeout
    std::string name;                                  ///< Unique name within the proxy
    std::string stream{"downstream"};                  ///< downstream or upstream
    double toxicity{1.0};                              ///< Probability the toxic applies
    std::map<std::string, std::int64_t> attributes;    ///< Type-specific attributes
};

/**
 * @class ProxyApi
 * @brief Abstract proxy control plane
 */
class ProxyApi {
public:
    virtual ~ProxyApi() = default;

    /**
     * @brief Create and enable a proxy
     * @param name Proxy name
     * @param listen Listen address (host:port)
     * @param upstream Upstream address (host:port)
     * @throws core::ProxyProvisioningError on failure
     */
    virtual void CreateProxy(const std::string& name, const std::string& listen,
                             const std::string& upstream) = 0;

    /**
     * @brief Attach a toxic to an existing proxy
     * @throws core::ProxyProvisioningError on failure
     */
    virtual void AddToxic(const std::string& proxy_name, const ToxicSpec& toxic) = 0;

    /**
     * @brief Delete a proxy and its toxics
     * @return false if the proxy did not exist or the call failed
     */
    virtual bool DeleteProxy(const std::string& name) = 0;

    /// Names of all proxies known to the server
    virtual std::vector<std::string> ListProxies() = 0;
};

/**
 * @class ToxiproxyClient
 * @brief ProxyApi over the Toxiproxy HTTP API
 *
 * **Endpoints used**:
 * - `POST   /proxies`                  create proxy
 * - `POST   /proxies/{name}/toxics`    add toxic
 * - `DELETE /proxies/{name}`           delete proxy
 * - `GET    /proxies`                  list proxies
 *
 * **Thread Safety**: Stateless per call; safe to share.
 */
class ToxiproxyClient : public ProxyApi {
public:
    static constexpr const char* kDefaultApiUrl = "http://localhost:8474";

    /**
     * @param api_url Base URL of the Toxiproxy API
     * @param curl_binary curl executable
     */
    explicit ToxiproxyClient(std::string api_url = kDefaultApiUrl,
                             std::string curl_binary = "curl");

    void CreateProxy(const std::string& name, const std::string& listen,
                     const std::string& upstream) override;
    void AddToxic(const std::string& proxy_name, const ToxicSpec& toxic) override;
    bool DeleteProxy(const std::string& name) override;
    std::vector<std::string> ListProxies() override;

    const std::string& ApiUrl() const { return api_url_; }

private:
    /**
     * @struct HttpResponse
     * @brief Status and body of one API call
     */
    struct HttpResponse {
        int status_code{0};   ///< HTTP status (0 if curl failed)
        std::string body;     ///< Response body
    };

    std::string api_url_;      ///< API base URL, no trailing slash
    std::string curl_binary_;  ///< curl executable

    HttpResponse Request(const std::string& method, const std::string& path,
                         const std::string& body = "") const;
};

} // namespace network
} // namespace chaosbox
