/**
 * @file output_sanitizer.cpp
 * @brief Implementation of output cleanup steps
 *
 * @date 2025
 */

#include "chaosbox/utils/output_sanitizer.hpp"
#include "chaosbox/utils/string_utils.hpp"

#include <string_view>
#include <vector>

namespace chaosbox {
namespace utils {

namespace {

const std::string kControlChars("\x00\x01\x02", 3);

} // anonymous namespace

OutputSanitizer::OutputSanitizer(std::chrono::seconds wall_clock_limit)
    : wall_clock_limit_(wall_clock_limit) {
}

std::string OutputSanitizer::Sanitize(const std::string& raw) const {
    std::string text = StripNoise(raw);
    text = ExtractLogBodies(text);
    text = AddTimeoutNotice(text);
    text = RedactOrigin(text);
    return StringUtils::Trim(text);
}

std::string OutputSanitizer::TimeoutNotice() const {
    return "Execution timed out after " + std::to_string(wall_clock_limit_.count()) +
           " seconds.";
}

// ============================================================================
// CLEANUP STEPS
// ============================================================================

std::string OutputSanitizer::StripNoise(const std::string& text) const {
    std::string stripped = StringUtils::RemoveChars(text, kControlChars);

    std::vector<std::string> kept;
    for (auto& line : StringUtils::SplitLines(stripped)) {
        if (!IsNoiseLine(line)) {
            kept.push_back(std::move(line));
        }
    }

    return StringUtils::Join(kept, "\n");
}

std::string OutputSanitizer::ExtractLogBodies(const std::string& text) const {
    auto lines = StringUtils::SplitLines(text);

    bool has_log_lines = false;
    for (const auto& line : lines) {
        if (StringUtils::StartsWith(StringUtils::TrimLeft(line), kLogPrefix)) {
            has_log_lines = true;
            break;
        }
    }
    if (!has_log_lines) {
        return text;
    }

    const std::string prefix(kLogPrefix);
    std::vector<std::string> kept;

    for (const auto& line : lines) {
        std::string body = StringUtils::TrimLeft(line);
        if (StringUtils::StartsWith(body, prefix)) {
            // Nested logger output can stack the prefix
            while (StringUtils::StartsWith(body, prefix)) {
                body = StringUtils::TrimLeft(body.substr(prefix.size()));
            }
            if (!IsNoiseLine(body)) {
                kept.push_back(body);
            }
        } else if (StringUtils::Contains(line, kTimeoutSentinel)) {
            kept.push_back(line);
        }
    }

    return StringUtils::Join(kept, "\n");
}

std::string OutputSanitizer::AddTimeoutNotice(const std::string& text) const {
    if (!StringUtils::Contains(text, kTimeoutSentinel)) {
        return text;
    }

    std::string notice = TimeoutNotice();
    if (StringUtils::StartsWith(StringUtils::Trim(text), notice)) {
        return text;
    }

    return notice + "\n" + text;
}

std::string OutputSanitizer::RedactOrigin(const std::string& text) const {
    auto open = text.find('{');
    if (open == std::string::npos || text.find('}') != std::string::npos) {
        return text;
    }

    std::string_view fragment(text);
    fragment.remove_prefix(open);
    if (fragment.find("\"origin\"") == std::string_view::npos) {
        return text;
    }

    return text.substr(0, open) + kRedactedOrigin;
}

bool OutputSanitizer::IsNoiseLine(const std::string& line) {
    return StringUtils::StartsWith(StringUtils::TrimLeft(line), kPipRootWarning);
}

} // namespace utils
} // namespace chaosbox
