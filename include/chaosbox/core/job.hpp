/**
 * @file job.hpp
 * @brief Job record, scenario and result types
 *
 * A job is one submitted snippet moving through the lifecycle
 * QUEUED → RUNNING → {COMPLETED, FAILED}, with CANCELLED reachable from any
 * non-terminal state. The scenario describes the faults injected around the
 * snippet.
 *
 * @date 2025
 */

#pragma once

#include "chaosbox/core/clock.hpp"

#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace chaosbox {
namespace core {

/**
 * @enum JobStatus
 * @brief Lifecycle state of a job
 */
enum class JobStatus {
    QUEUED,      ///< Accepted, task not yet started
    RUNNING,     ///< Task is executing the snippet
    COMPLETED,   ///< Snippet ran to completion (any exit code) or timed out
    FAILED,      ///< Setup or execution error
    CANCELLED    ///< Cancelled by a caller or during shutdown
};

/**
 * @enum Language
 * @brief Supported snippet languages
 */
enum class Language {
    PYTHON,
    JAVASCRIPT
};

std::string ToString(JobStatus status);
std::string ToString(Language language);

/**
 * @brief Parse a lower-case status name
 * @return Status, or nullopt for unknown names
 */
std::optional<JobStatus> ParseJobStatus(const std::string& name);

/// true for COMPLETED, FAILED and CANCELLED
bool IsTerminal(JobStatus status);

/**
 * @brief Parse a requested language
 *
 * Accepts "python", "javascript" and the alias "node" (case-insensitive).
 *
 * @return Language, or nullopt if unsupported
 */
std::optional<Language> ParseLanguage(const std::string& name);

/**
 * @brief Parse a requested language or throw
 * @throws UnsupportedLanguageError
 */
Language RequireLanguage(const std::string& name);

/**
 * @struct Scenario
 * @brief Faults to inject into one job
 *
 * Field order is significant: injected code fragments are rendered in
 * declaration order.
 */
struct Scenario {
    // Network faults (served by the per-job proxy)
    std::optional<std::int64_t> network_latency_ms;   ///< Added latency per request
    std::optional<std::int64_t> bandwidth_kbps;       ///< Bandwidth ceiling
    std::optional<std::int64_t> timeout_ms;           ///< Connection stall before close
    std::optional<std::string> upstream;              ///< Proxy target host:port

    // Code-level faults
    std::optional<std::int64_t> artificial_delay_ms;  ///< Sleep before user code
    bool simulate_crash{false};                       ///< Exit with status 1 after user code
    bool simulate_high_cpu{false};                    ///< Concurrent busy loop
    bool simulate_memory_leak{false};                 ///< Unbounded allocation

    /// true if a proxy must be provisioned for this scenario
    bool RequestsNetworkFaults() const;

    /// true if no field is set
    bool Empty() const;
};

/**
 * @struct JobResult
 * @brief Terminal outcome of a job
 *
 * Successful runs carry output; failures and cancellations carry error.
 */
struct JobResult {
    std::optional<std::string> output;   ///< Sanitized program output
    std::optional<std::string> error;    ///< Failure or cancellation message
    bool success{false};                 ///< Ran to completion without timing out
    std::optional<int> exit_code;        ///< Program exit status, if it ran
};

/**
 * @struct Job
 * @brief Snapshot of a job record
 */
struct Job {
    std::string id;                          ///< UUID v4
    JobStatus status{JobStatus::QUEUED};     ///< Current state
    std::string language;                    ///< Language as submitted
    std::string code;                        ///< Source as submitted
    Scenario scenario;                       ///< Requested faults
    std::vector<std::string> logs;           ///< Timestamped log lines
    std::optional<JobResult> result;         ///< Set once terminal
    TimePoint created_at;                    ///< Submission time
    std::optional<TimePoint> completed_at;   ///< Set once terminal
};

/**
 * @struct JobSummary
 * @brief Listing entry without code, logs or result
 */
struct JobSummary {
    std::string id;
    JobStatus status{JobStatus::QUEUED};
    TimePoint created_at;
    std::optional<TimePoint> completed_at;
};

} // namespace core
} // namespace chaosbox
