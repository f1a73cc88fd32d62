/**
 * @file job.cpp
 * @brief Job enum conversions and scenario predicates
 *
 * @date 2025
 */

#include "chaosbox/core/job.hpp"
#include "chaosbox/core/errors.hpp"
#include "chaosbox/utils/string_utils.hpp"

namespace chaosbox {
namespace core {

std::string ToString(JobStatus status) {
    switch (status) {
        case JobStatus::QUEUED: return "queued";
        case JobStatus::RUNNING: return "running";
        case JobStatus::COMPLETED: return "completed";
        case JobStatus::FAILED: return "failed";
        case JobStatus::CANCELLED: return "cancelled";
        default: return "unknown";
    }
}

std::string ToString(Language language) {
    switch (language) {
        case Language::PYTHON: return "python";
        case Language::JAVASCRIPT: return "javascript";
        default: return "unknown";
    }
}

std::optional<JobStatus> ParseJobStatus(const std::string& name) {
    for (auto status : {JobStatus::QUEUED, JobStatus::RUNNING, JobStatus::COMPLETED,
                        JobStatus::FAILED, JobStatus::CANCELLED}) {
        if (ToString(status) == name) {
            return status;
        }
    }
    return std::nullopt;
}

bool IsTerminal(JobStatus status) {
    return status == JobStatus::COMPLETED ||
           status == JobStatus::FAILED ||
           status == JobStatus::CANCELLED;
}

std::optional<Language> ParseLanguage(const std::string& name) {
    std::string lower = utils::StringUtils::ToLower(utils::StringUtils::Trim(name));

    if (lower == "python") {
        return Language::PYTHON;
    }
    if (lower == "javascript" || lower == "node") {
        return Language::JAVASCRIPT;
    }
    return std::nullopt;
}

Language RequireLanguage(const std::string& name) {
    auto language = ParseLanguage(name);
    if (!language) {
        throw UnsupportedLanguageError(name);
    }
    return *language;
}

// ============================================================================
// SCENARIO
// ============================================================================

bool Scenario::RequestsNetworkFaults() const {
    auto positive = [](const std::optional<std::int64_t>& value) {
        return value.has_value() && *value > 0;
    };

    return positive(network_latency_ms) ||
           positive(bandwidth_kbps) ||
           positive(timeout_ms) ||
           (upstream.has_value() && !upstream->empty());
}

bool Scenario::Empty() const {
    return !network_latency_ms && !bandwidth_kbps && !timeout_ms && !upstream &&
           !artificial_delay_ms && !simulate_crash && !simulate_high_cpu &&
           !simulate_memory_leak;
}

} // namespace core
} // namespace chaosbox
