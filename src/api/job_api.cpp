/**
 * @file job_api.cpp
 * @brief Job API request handling and JSON conversion
 *
 * @date 2025
 */

#include "chaosbox/api/job_api.hpp"
#include "chaosbox/core/errors.hpp"
#include "chaosbox/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <cstdint>
#include <limits>

namespace chaosbox {
namespace api {

namespace {

void ReadInteger(const json& object, const char* key, std::optional<std::int64_t>& target) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return;
    }
    // Floats and out-of-range values are rejected rather than converted
    if (!it->is_number_integer()) {
        throw core::ValidationError(std::string("scenario.") + key + " must be an integer");
    }
    if (it->is_number_unsigned() &&
        it->get<std::uint64_t>() >
            static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        throw core::ValidationError(std::string("scenario.") + key + " is out of range");
    }
    std::int64_t value = it->get<std::int64_t>();
    if (value < 0) {
        throw core::ValidationError(std::string("scenario.") + key + " must not be negative");
    }
    target = value;
}

void ReadFlag(const json& object, const char* key, bool& target) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return;
    }
    if (!it->is_boolean()) {
        throw core::ValidationError(std::string("scenario.") + key + " must be a boolean");
    }
    target = it->get<bool>();
}

} // anonymous namespace

// ============================================================================
// JSON CONVERSION
// ============================================================================

core::Scenario ScenarioFromJson(const json& value) {
    core::Scenario scenario;
    if (value.is_null()) {
        return scenario;
    }
    if (!value.is_object()) {
        throw core::ValidationError("scenario must be an object");
    }

    ReadInteger(value, "networkLatencyMs", scenario.network_latency_ms);
    ReadInteger(value, "bandwidthKbps", scenario.bandwidth_kbps);
    ReadInteger(value, "timeoutMs", scenario.timeout_ms);

    auto upstream = value.find("upstream");
    if (upstream != value.end() && !upstream->is_null()) {
        if (!upstream->is_string()) {
            throw core::ValidationError("scenario.upstream must be a string");
        }
        scenario.upstream = upstream->get<std::string>();
    }

    ReadInteger(value, "artificialDelayMs", scenario.artificial_delay_ms);
    ReadFlag(value, "simulateCrash", scenario.simulate_crash);
    ReadFlag(value, "simulateHighCpu", scenario.simulate_high_cpu);
    ReadFlag(value, "simulateMemoryLeak", scenario.simulate_memory_leak);

    return scenario;
}

json ScenarioToJson(const core::Scenario& scenario) {
    json j = json::object();

    if (scenario.network_latency_ms) j["networkLatencyMs"] = *scenario.network_latency_ms;
    if (scenario.bandwidth_kbps) j["bandwidthKbps"] = *scenario.bandwidth_kbps;
    if (scenario.timeout_ms) j["timeoutMs"] = *scenario.timeout_ms;
    if (scenario.upstream) j["upstream"] = *scenario.upstream;
    if (scenario.artificial_delay_ms) j["artificialDelayMs"] = *scenario.artificial_delay_ms;
    if (scenario.simulate_crash) j["simulateCrash"] = true;
    if (scenario.simulate_high_cpu) j["simulateHighCpu"] = true;
    if (scenario.simulate_memory_leak) j["simulateMemoryLeak"] = true;

    return j;
}

json ResultToJson(const core::JobResult& result) {
    json j = json::object();

    if (result.error) {
        j["error"] = *result.error;
        return j;
    }

    j["output"] = result.output.value_or("");
    j["success"] = result.success;
    if (result.exit_code) {
        j["exitCode"] = *result.exit_code;
    }
    return j;
}

json TimestampToJson(const std::optional<core::TimePoint>& time) {
    if (!time) {
        return nullptr;
    }
    return utils::StringUtils::FormatTimestamp(*time);
}

json SummaryToJson(const core::JobSummary& summary) {
    return {
        {"jobId", summary.id},
        {"status", core::ToString(summary.status)},
        {"createdAt", TimestampToJson(summary.created_at)},
        {"completedAt", TimestampToJson(summary.completed_at)}
    };
}

// ============================================================================
// JOB API
// ============================================================================

JobApi::JobApi(core::JobRegistry& registry, core::JobLifecycleController& controller)
    : registry_(registry), controller_(controller) {
}

ApiResponse JobApi::SubmitJob(const json& request) {
    try {
        if (!request.is_object()) {
            throw core::ValidationError("Request body must be a JSON object");
        }

        auto language = request.find("language");
        if (language == request.end() || !language->is_string() ||
            language->get<std::string>().empty()) {
            throw core::ValidationError("language is required and must be a string");
        }

        auto code = request.find("code");
        if (code == request.end() || !code->is_string() || code->get<std::string>().empty()) {
            throw core::ValidationError("code is required and must be a string");
        }

        auto scenario_it = request.find("scenario");
        if (scenario_it == request.end() || !scenario_it->is_object()) {
            throw core::ValidationError("scenario is required and must be an object");
        }
        core::Scenario scenario = ScenarioFromJson(*scenario_it);

        std::string id = controller_.Submit(language->get<std::string>(),
                                            code->get<std::string>(), scenario);

        return ApiResponse{200, {{"jobId", id}, {"status", "queued"}}};
    } catch (const core::ValidationError& e) {
        return Error(400, e.what());
    } catch (const core::InvalidStateError& e) {
        return Error(503, e.what());
    } catch (const std::exception& e) {
        spdlog::error("Job submission failed: {}", e.what());
        return Error(500, e.what());
    }
}

ApiResponse JobApi::SubmitJob(const std::string& request_body) {
    json request;
    try {
        request = json::parse(request_body);
    } catch (const json::parse_error& e) {
        return Error(400, std::string("Malformed JSON: ") + e.what());
    }
    return SubmitJob(request);
}

ApiResponse JobApi::GetLogs(const std::string& id) const {
    auto job = registry_.Find(id);
    if (!job) {
        return Error(404, "Job not found");
    }

    return ApiResponse{200, {
        {"jobId", job->id},
        {"status", core::ToString(job->status)},
        {"logs", job->logs},
        {"result", job->result ? ResultToJson(*job->result) : json(nullptr)}
    }};
}

ApiResponse JobApi::GetStatus(const std::string& id) const {
    auto job = registry_.Find(id);
    if (!job) {
        return Error(404, "Job not found");
    }

    return ApiResponse{200, SummaryToJson(core::JobSummary{
        job->id, job->status, job->created_at, job->completed_at})};
}

ApiResponse JobApi::CancelJob(const std::string& id) {
    try {
        core::Job job = controller_.Cancel(id);
        return ApiResponse{200, {{"jobId", job.id}, {"status", core::ToString(job.status)}}};
    } catch (const core::NotFoundError&) {
        return Error(404, "Job not found");
    } catch (const core::InvalidStateError& e) {
        return Error(400, e.what());
    }
}

ApiResponse JobApi::ListJobs(const std::optional<std::string>& status) const {
    std::optional<core::JobStatus> filter;
    if (status && !status->empty()) {
        filter = core::ParseJobStatus(utils::StringUtils::ToLower(*status));
        if (!filter) {
            return Error(400, "Unknown status filter: " + *status);
        }
    }

    json jobs = json::array();
    for (const auto& summary : registry_.List(filter)) {
        jobs.push_back(SummaryToJson(summary));
    }
    return ApiResponse{200, jobs};
}

ApiResponse JobApi::Error(int status_code, const std::string& message) {
    return ApiResponse{status_code, {{"error", message}}};
}

} // namespace api
} // namespace chaosbox
