/**
 * @file main.cpp
 * @brief chaosbox - Command-line driver
 *
 * Submits one snippet with an optional fault scenario to the sandbox, waits
 * for the job to reach a terminal state, and prints the job's logs and
 * result document as JSON.
 *
 * @date 2025
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <nlohmann/json.hpp>

#include "chaosbox/api/job_api.hpp"
#include "chaosbox/core/errors.hpp"
#include "chaosbox/core/job_controller.hpp"
#include "chaosbox/core/job_registry.hpp"
#include "chaosbox/core/service_config.hpp"
#include "chaosbox/network/network_fault_controller.hpp"
#include "chaosbox/network/toxiproxy_client.hpp"
#include "chaosbox/sandbox/container_executor.hpp"
#include "chaosbox/utils/container_utils.hpp"

#include <chrono>
#include <fstream>
#include <iostream>
#include <sstream>

using json = nlohmann::json;

namespace {

std::string ReadFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw chaosbox::core::ValidationError("Cannot read file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

} // anonymous namespace

/*******************************************************************************
 * Main Application Entry Point
 ******************************************************************************/

int main(int argc, char** argv) {
    CLI::App app{"chaosbox - run code snippets in a fault-injecting sandbox"};

    std::string code_path;
    std::string language;
    std::string scenario_path;
    std::string config_path;
    bool verbose = false;
    bool print_config = false;
    int wait_seconds = 60;

    std::string python_image;
    std::string javascript_image;
    std::string toxiproxy_url;
    std::string docker_binary;

    app.add_option("code", code_path, "Source file to execute")
        ->check(CLI::ExistingFile);
    app.add_option("-l,--language", language, "Snippet language (python, javascript, node)");
    app.add_option("-s,--scenario", scenario_path, "Scenario JSON file")
        ->check(CLI::ExistingFile);
    app.add_option("-c,--config", config_path, "Service configuration JSON file")
        ->check(CLI::ExistingFile);
    app.add_option("--wait", wait_seconds, "Seconds to wait for the job to finish")
        ->default_val(60);

    app.add_option("--python-image", python_image, "Override the python image");
    app.add_option("--javascript-image", javascript_image, "Override the javascript image");
    app.add_option("--toxiproxy-url", toxiproxy_url, "Override the Toxiproxy API URL");
    app.add_option("--docker", docker_binary, "Override the docker binary");

    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");
    app.add_flag("--print-config", print_config, "Print the effective configuration and exit");

    CLI11_PARSE(app, argc, argv);

    // Logs go to stderr so stdout carries only the result document
    spdlog::set_default_logger(spdlog::stderr_color_mt("chaosbox"));
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);

    try {
        // Configuration: file first, then command-line overrides
        chaosbox::core::ServiceConfig config;
        if (!config_path.empty()) {
            config = chaosbox::core::ServiceConfig::FromFile(config_path);
        }
        if (!python_image.empty()) config.executor.python_image = python_image;
        if (!javascript_image.empty()) config.executor.javascript_image = javascript_image;
        if (!toxiproxy_url.empty()) config.toxiproxy_api_url = toxiproxy_url;
        if (!docker_binary.empty()) config.docker_binary = docker_binary;
        config.Validate();

        if (config.verbose && !verbose) {
            spdlog::set_level(spdlog::level::debug);
        }

        if (print_config) {
            std::cout << config.ToJsonString() << std::endl;
            return 0;
        }

        if (code_path.empty() || language.empty()) {
            spdlog::error("A code file and --language are required");
            return 1;
        }

        json request = {
            {"language", language},
            {"code", ReadFile(code_path)},
            {"scenario", json::object()}
        };
        if (!scenario_path.empty()) {
            try {
                request["scenario"] = json::parse(ReadFile(scenario_path));
            } catch (const json::parse_error& e) {
                spdlog::error("Malformed scenario file {}: {}", scenario_path, e.what());
                return 1;
            }
        }

        // Wire the service
        chaosbox::utils::DockerClient docker(config.docker_binary);
        if (!docker.IsAvailable()) {
            spdlog::error("Docker is not available; is the daemon running?");
            return 1;
        }

        chaosbox::network::ToxiproxyClient toxiproxy(config.toxiproxy_api_url);
        chaosbox::network::NetworkFaultController faults(toxiproxy, config.network);
        faults.PurgeStaleProxies();
        chaosbox::sandbox::ContainerExecutor executor(docker, &faults, config.executor);

        chaosbox::core::SystemClock clock;
        chaosbox::core::JobRegistry registry(clock, config.retention);
        chaosbox::core::JobLifecycleController controller(registry, executor);
        chaosbox::api::JobApi api(registry, controller);

        auto submitted = api.SubmitJob(request);
        if (submitted.status_code != 200) {
            std::cout << submitted.body.dump(2) << std::endl;
            return 1;
        }

        std::string job_id = submitted.body["jobId"].get<std::string>();
        spdlog::info("Submitted job {}", job_id);

        if (!controller.Wait(job_id, std::chrono::seconds(wait_seconds))) {
            spdlog::warn("Job {} still running after {}s; cancelling", job_id, wait_seconds);
            auto cancelled = api.CancelJob(job_id);
            if (cancelled.status_code != 200) {
                spdlog::warn("Cancel rejected: {}", cancelled.body.dump());
            }
            controller.Wait(job_id, std::chrono::seconds(wait_seconds));
        }

        auto logs = api.GetLogs(job_id);
        std::cout << logs.body.dump(2) << std::endl;

        return logs.body["status"] == "completed" ? 0 : 1;

    } catch (const chaosbox::core::ChaosboxError& e) {
        spdlog::error("{}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
