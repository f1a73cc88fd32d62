/**
 * @file job_api.hpp
 * @brief Transport-neutral job API (status code + JSON body)
 *
 * Maps the service operations to HTTP-style responses so any routing layer
 * only needs to forward requests and write the returned status and body.
 *
 * | Operation | Success                                   | Errors          |
 * |-----------|-------------------------------------------|-----------------|
 * | SubmitJob | 200 {jobId, status:"queued"}              | 400             |
 * | GetLogs   | 200 {jobId, status, logs, result}         | 404             |
 * | GetStatus | 200 {jobId, status, createdAt, completedAt} | 404           |
 * | CancelJob | 200 {jobId, status:"cancelled"}           | 404, 400        |
 * | ListJobs  | 200 [{jobId, status, createdAt, completedAt}] | 400         |
 *
 * @date 2025
 */

#pragma once

#include "chaosbox/core/job.hpp"
#include "chaosbox/core/job_controller.hpp"
#include "chaosbox/core/job_registry.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace chaosbox {
namespace api {

using json = nlohmann::json;

/**
 * @struct ApiResponse
 * @brief Status code and JSON body
 */
struct ApiResponse {
    int status_code{200};
    json body;
};

// ============================================================================
// JSON conversion
// ============================================================================

/**
 * @brief Parse a scenario object
 *
 * Unknown keys are ignored; null values count as unset.
 *
 * @throws core::ValidationError on non-object input or ill-typed fields
 */
core::Scenario ScenarioFromJson(const json& value);

/// Scenario as JSON (unset fields omitted)
json ScenarioToJson(const core::Scenario& scenario);

/// Result as JSON ({output, success, exitCode?} or {error})
json ResultToJson(const core::JobResult& result);

/// ISO-8601 UTC timestamp, or null
json TimestampToJson(const std::optional<core::TimePoint>& time);

/// {jobId, status, createdAt, completedAt}
json SummaryToJson(const core::JobSummary& summary);

/**
 * @class JobApi
 * @brief Request handling facade over the controller and registry
 *
 * Never throws for request-level problems; every failure becomes an error
 * response with an `{error}` body.
 */
class JobApi {
public:
    JobApi(core::JobRegistry& registry, core::JobLifecycleController& controller);

    /**
     * @brief Submit a job
     * @param request {language, code, scenario}
     */
    ApiResponse SubmitJob(const json& request);

    /// Parse a raw request body and submit
    ApiResponse SubmitJob(const std::string& request_body);

    ApiResponse GetLogs(const std::string& id) const;
    ApiResponse GetStatus(const std::string& id) const;
    ApiResponse CancelJob(const std::string& id);

    /**
     * @brief List jobs
     * @param status Optional status filter (queued, running, ...)
     */
    ApiResponse ListJobs(const std::optional<std::string>& status = std::nullopt) const;

private:
    core::JobRegistry& registry_;
    core::JobLifecycleController& controller_;

    static ApiResponse Error(int status_code, const std::string& message);
};

} // namespace api
} // namespace chaosbox
