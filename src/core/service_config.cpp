/**
 * @file service_config.cpp
 * @brief JSON configuration loading
 *
 * @date 2025
 */

#include "chaosbox/core/service_config.hpp"
#include "chaosbox/core/errors.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace chaosbox {
namespace core {

namespace {

template <typename T>
void ReadValue(const json& object, const char* key, T& target, const std::string& context) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return;
    }
    try {
        target = it->get<T>();
    } catch (const json::exception&) {
        throw ValidationError("Invalid type for " + context + key + ": " + it->dump());
    }
}

const json& RequireObject(const json& value, const std::string& name) {
    if (!value.is_object()) {
        throw ValidationError(name + " must be a JSON object");
    }
    return value;
}

} // anonymous namespace

ServiceConfig ServiceConfig::FromFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw ValidationError("Cannot open configuration file: " + path.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    spdlog::info("Loading configuration from {}", path.string());
    return FromJsonString(buffer.str());
}

ServiceConfig ServiceConfig::FromJsonString(const std::string& text) {
    json root;
    try {
        root = json::parse(text);
    } catch (const json::parse_error& e) {
        throw ValidationError(std::string("Malformed configuration: ") + e.what());
    }
    RequireObject(root, "configuration");

    ServiceConfig config;

    if (root.contains("images")) {
        const json& images = RequireObject(root["images"], "images");
        ReadValue(images, "python", config.executor.python_image, "images.");
        ReadValue(images, "javascript", config.executor.javascript_image, "images.");
    }

    std::string temp_root;
    ReadValue(root, "temp_root", temp_root, "");
    if (!temp_root.empty()) {
        config.executor.temp_root = temp_root;
    }

    ReadValue(root, "docker_binary", config.docker_binary, "");

    if (root.contains("toxiproxy")) {
        const json& proxy = RequireObject(root["toxiproxy"], "toxiproxy");
        ReadValue(proxy, "api_url", config.toxiproxy_api_url, "toxiproxy.");
        ReadValue(proxy, "listen_host", config.network.listen_host, "toxiproxy.");
        ReadValue(proxy, "advertised_host", config.network.advertised_host, "toxiproxy.");
        ReadValue(proxy, "default_upstream", config.network.default_upstream, "toxiproxy.");

        std::vector<int> range;
        ReadValue(proxy, "port_range", range, "toxiproxy.");
        if (!range.empty()) {
            if (range.size() != 2) {
                throw ValidationError("toxiproxy.port_range must be [start, end]");
            }
            config.network.port_range_start = range[0];
            config.network.port_range_end = range[1];
        }
    }

    std::int64_t retention_seconds = config.retention.count();
    ReadValue(root, "retention_seconds", retention_seconds, "");
    config.retention = std::chrono::seconds(retention_seconds);

    ReadValue(root, "verbose", config.verbose, "");

    config.Validate();
    return config;
}

std::string ServiceConfig::ToJsonString() const {
    json root = {
        {"images", {
            {"python", executor.python_image},
            {"javascript", executor.javascript_image}
        }},
        {"temp_root", executor.temp_root.string()},
        {"docker_binary", docker_binary},
        {"toxiproxy", {
            {"api_url", toxiproxy_api_url},
            {"listen_host", network.listen_host},
            {"advertised_host", network.advertised_host},
            {"port_range", {network.port_range_start, network.port_range_end}},
            {"default_upstream", network.default_upstream}
        }},
        {"retention_seconds", retention.count()},
        {"verbose", verbose}
    };
    return root.dump(2);
}

void ServiceConfig::Validate() const {
    if (executor.python_image.empty() || executor.javascript_image.empty()) {
        throw ValidationError("Container images must not be empty");
    }
    if (network.port_range_start < 1 || network.port_range_end > 65535 ||
        network.port_range_end < network.port_range_start) {
        throw ValidationError("Invalid proxy port range " +
                              std::to_string(network.port_range_start) + "-" +
                              std::to_string(network.port_range_end));
    }
    if (retention.count() <= 0) {
        throw ValidationError("retention_seconds must be positive");
    }
    if (docker_binary.empty()) {
        throw ValidationError("docker_binary must not be empty");
    }
}

} // namespace core
} // namespace chaosbox
