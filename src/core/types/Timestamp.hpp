#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace signfleet::core {

/**
 * @brief Formats a time point as RFC 3339 UTC with a nanosecond fraction.
 * @param tp Time point to format.
 * @return String such as "2026-01-02T03:04:05.123456789Z".
 */
std::string formatTimestamp(const std::chrono::system_clock::time_point& tp);

/**
 * @brief Parses an RFC 3339 timestamp.
 *
 * Accepts "Z" or a numeric offset, any fraction length, or no fraction.
 *
 * @param text Text to parse.
 * @return The time point, or nullopt if the text is empty or malformed.
 */
std::optional<std::chrono::system_clock::time_point> parseTimestamp(const std::string& text);

} // namespace signfleet::core
