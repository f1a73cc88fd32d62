/**
 * @file output_sanitizer.hpp
 * @brief Normalization and redaction of captured program output
 *
 * Container output arrives as a raw byte stream mixing stream-multiplexing
 * control bytes, package manager chatter and program output. The sanitizer
 * reduces it to what the submitter wants to read.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <string>

namespace chaosbox {
namespace utils {

/**
 * @class OutputSanitizer
 * @brief Idempotent output cleanup
 *
 * **Steps** (in order):
 * 1. Strip \\x00, \\x01, \\x02 and pip "running as root" warnings
 * 2. If logging-module lines (`INFO:root:`) are present, keep only their
 *    message bodies plus the timeout sentinel line
 * 3. Prepend the timeout notice when the sentinel is present
 * 4. Redact a truncated httpbin `"origin"` document
 * 5. Trim surrounding whitespace
 *
 * Sanitize(Sanitize(x)) == Sanitize(x) for every input.
 */
class OutputSanitizer {
public:
    static constexpr const char* kTimeoutSentinel = "[Timeout]";
    static constexpr const char* kLogPrefix = "INFO:root:";
    static constexpr const char* kPipRootWarning = "WARNING: Running pip as the 'root' user";
    static constexpr const char* kRedactedOrigin = "{ \"origin\": \"[IP address]\" }";

    /**
     * @param wall_clock_limit Limit quoted in the timeout notice
     */
    explicit OutputSanitizer(std::chrono::seconds wall_clock_limit = std::chrono::seconds(10));

    /**
     * @brief Sanitize captured output
     * @param raw Raw combined stdout/stderr
     * @return Cleaned text
     */
    std::string Sanitize(const std::string& raw) const;

    /// "Execution timed out after N seconds."
    std::string TimeoutNotice() const;

private:
    std::chrono::seconds wall_clock_limit_;

    std::string StripNoise(const std::string& text) const;
    std::string ExtractLogBodies(const std::string& text) const;
    std::string AddTimeoutNotice(const std::string& text) const;
    std::string RedactOrigin(const std::string& text) const;

    static bool IsNoiseLine(const std::string& line);
};

} // namespace utils
} // namespace chaosbox
