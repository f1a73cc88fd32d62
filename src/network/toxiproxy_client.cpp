/**
 * @file toxiproxy_client.cpp
 * @brief Toxiproxy HTTP API over curl
 *
 * Each call runs `curl -sS -X <method> ... -w '\n%{http_code}' <url>`; the
 * status code is read from the last output line.
 *
 * @date 2025
 */

#include "chaosbox/network/toxiproxy_client.hpp"
#include "chaosbox/core/errors.hpp"
#include "chaosbox/utils/command_runner.hpp"
#include "chaosbox/utils/string_utils.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace chaosbox {
namespace network {

using utils::StringUtils;

ToxiproxyClient::ToxiproxyClient(std::string api_url, std::string curl_binary)
    : api_url_(std::move(api_url)), curl_binary_(std::move(curl_binary)) {
    while (!api_url_.empty() && api_url_.back() == '/') {
        api_url_.pop_back();
    }
}

// ============================================================================
// PROXY OPERATIONS
// ============================================================================

void ToxiproxyClient::CreateProxy(const std::string& name, const std::string& listen,
                                  const std::string& upstream) {
    json body = {
        {"name", name},
        {"listen", listen},
        {"upstream", upstream},
        {"enabled", true}
    };

    auto response = Request("POST", "/proxies", body.dump());
    if (response.status_code != 201 && response.status_code != 200) {
        throw core::ProxyProvisioningError(
            "Failed to create proxy " + name + " (HTTP " +
            std::to_string(response.status_code) + "): " + StringUtils::Trim(response.body));
    }

    spdlog::info("Proxy {} listening on {} → {}", name, listen, upstream);
}

void ToxiproxyClient::AddToxic(const std::string& proxy_name, const ToxicSpec& toxic) {
    json attributes = json::object();
    for (const auto& [key, value] : toxic.attributes) {
        attributes[key] = value;
    }

    json body = {
        {"name", toxic.name.empty() ? toxic.type : toxic.name},
        {"type", toxic.type},
        {"stream", toxic.stream},
        {"toxicity", toxic.toxicity},
        {"attributes", attributes}
    };

    auto response = Request("POST", "/proxies/" + proxy_name + "/toxics", body.dump());
    if (response.status_code != 200 && response.status_code != 201) {
        throw core::ProxyProvisioningError(
            "Failed to add " + toxic.type + " toxic to " + proxy_name + " (HTTP " +
            std::to_string(response.status_code) + "): " + StringUtils::Trim(response.body));
    }

    spdlog::debug("Toxic {} added to {}: {}", toxic.type, proxy_name, attributes.dump());
}

bool ToxiproxyClient::DeleteProxy(const std::string& name) {
    auto response = Request("DELETE", "/proxies/" + name);

    if (response.status_code == 204 || response.status_code == 200) {
        spdlog::debug("Proxy {} deleted", name);
        return true;
    }

    if (response.status_code == 404) {
        spdlog::debug("Proxy {} did not exist", name);
    } else {
        spdlog::warn("Failed to delete proxy {} (HTTP {}): {}", name, response.status_code,
                     StringUtils::Trim(response.body));
    }
    return false;
}

std::vector<std::string> ToxiproxyClient::ListProxies() {
    auto response = Request("GET", "/proxies");
    if (response.status_code != 200) {
        spdlog::warn("Failed to list proxies (HTTP {})", response.status_code);
        return {};
    }

    std::vector<std::string> names;
    try {
        json proxies = json::parse(response.body);
        // The API returns an object keyed by proxy name
        for (auto it = proxies.begin(); it != proxies.end(); ++it) {
            names.push_back(it.key());
        }
    } catch (const json::exception& e) {
        spdlog::warn("Malformed proxy listing: {}", e.what());
    }

    return names;
}

// ============================================================================
// PRIVATE HELPER METHODS
// ============================================================================

ToxiproxyClient::HttpResponse ToxiproxyClient::Request(const std::string& method,
                                                       const std::string& path,
                                                       const std::string& body) const {
    std::vector<std::string> args = {
        curl_binary_, "-sS",
        "-X", method,
        "-w", "\n%{http_code}"
    };

    if (!body.empty()) {
        args.insert(args.end(), {"-H", "Content-Type: application/json", "-d", body});
    }
    args.push_back(api_url_ + path);

    auto result = utils::ExecuteCommand(args);

    HttpResponse response;
    if (!result.Succeeded()) {
        spdlog::error("Toxiproxy request {} {} failed: {}", method, path,
                      StringUtils::Trim(result.output));
        response.body = result.output;
        return response;
    }

    auto newline = result.output.find_last_of('\n');
    std::string status_line = newline == std::string::npos
                                  ? result.output
                                  : result.output.substr(newline + 1);
    response.body = newline == std::string::npos ? "" : result.output.substr(0, newline);

    try {
        response.status_code = std::stoi(StringUtils::Trim(status_line));
    } catch (const std::exception&) {
        spdlog::error("Unexpected curl output for {} {}: {}", method, path, status_line);
        response.status_code = 0;
    }

    return response;
}

} // namespace network
} // namespace chaosbox
