/**
 * @file TimeParsing.hpp
 * @brief Conversions from timestamp text to system_clock time points.
 */

#pragma once
#include <optional>
#include <string>
#include "domain/DateRange.hpp"

namespace chatstamp::infrastructure {

/**
 * @class TimeParsing
 * @brief Stateless helpers around strptime/mktime/timegm.
 *
 * All functions return std::nullopt instead of throwing; callers drop
 * samples that do not parse.
 */
class TimeParsing {
public:
    /**
     * @brief Parses text in the local time zone with a strptime format.
     *
     * The whole string must be consumed and the calendar date must exist
     * ("Feb 30" is rejected rather than normalized).
     */
    static std::optional<domain::DateSample> ParseLocal(const std::string& text, const char* format);

    /**
     * @brief Strict internet date-time with fractional seconds and a zone:
     * 2024-11-28T11:46:34.120Z or 2024-11-28T11:46:34.5-05:00.
     */
    static std::optional<domain::DateSample> ParseInternetDateTime(const std::string& text);

    /** @brief Local "YYYY-MM-DD HH:MM:SS" rendering, for log lines. */
    static std::string FormatLocal(const domain::DateSample& sample);
};

} // namespace chatstamp::infrastructure
