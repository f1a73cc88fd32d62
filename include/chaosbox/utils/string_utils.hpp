/**
 * @file string_utils.hpp
 * @brief String helpers shared by the sanitizer, injector and API layers
 *
 * Small, allocation-friendly helpers for trimming, splitting, joining and
 * replacing text, plus the timestamp formatting used for job log lines and
 * API documents.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <chrono>

namespace chaosbox {
namespace utils {

/**
 * @class StringUtils
 * @brief Stateless string utilities
 *
 * All methods are static - no instantiation required.
 *
 * **Usage Example**:
 * @code
 * auto lines = StringUtils::SplitLines(captured_output);
 * for (auto& line : lines) {
 *     line = StringUtils::TrimLeft(line);
 * }
 * std::string text = StringUtils::Join(lines, "\n");
 *
 * // "2026-10-18T09:15:02.417Z"
 * std::string stamp = StringUtils::FormatTimestamp(std::chrono::system_clock::now());
 * @endcode
 */
class StringUtils {
public:
    /***************************************************************************
     * Basic Manipulation
     ***************************************************************************/

    /**
     * @brief Remove leading and trailing whitespace
     * @param str Input string
     * @return Trimmed copy
     */
    static std::string Trim(const std::string& str);

    /**
     * @brief Remove leading whitespace only
     * @param str Input string
     * @return Copy without leading whitespace
     */
    static std::string TrimLeft(const std::string& str);

    /**
     * @brief Convert to lowercase (ASCII)
     * @param str Input string
     * @return Lowercase copy
     */
    static std::string ToLower(const std::string& str);

    /**
     * @brief Split text into lines
     *
     * Splits on '\n'. Empty lines are preserved, a trailing newline does not
     * produce a trailing empty element, and a '\r' before the newline is kept.
     *
     * @param str Input text
     * @return Lines in order
     */
    static std::vector<std::string> SplitLines(const std::string& str);

    /**
     * @brief Join strings with delimiter
     * @param strings Strings to join
     * @param delimiter Separator
     * @return Joined string
     */
    static std::string Join(const std::vector<std::string>& strings,
                            const std::string& delimiter);

    /**
     * @brief Remove every occurrence of the given characters
     * @param str Input string
     * @param chars Characters to remove
     * @return Filtered copy
     */
    static std::string RemoveChars(const std::string& str, const std::string& chars);

    static bool StartsWith(const std::string& str, const std::string& prefix);
    static bool Contains(const std::string& str, const std::string& substring);

    /***************************************************************************
     * Time Formatting
     ***************************************************************************/

    /**
     * @brief Format time point as ISO-8601 UTC with millisecond precision
     *
     * Output is lexicographically sortable: "2026-10-18T09:15:02.417Z".
     *
     * @param time Time point to format
     * @return Formatted timestamp
     */
    static std::string FormatTimestamp(std::chrono::system_clock::time_point time);
};

} // namespace utils
} // namespace chaosbox
