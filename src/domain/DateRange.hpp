/**
 * @file DateRange.hpp
 * @brief Message timestamps found in a file and their span.
 */

#pragma once
#include <algorithm>
#include <chrono>
#include <optional>
#include <vector>

namespace chatstamp::domain {

/** @brief One parsed point in time taken from file content. */
using DateSample = std::chrono::system_clock::time_point;

/**
 * @struct DateRange
 * @brief First and last message time of a file.
 */
struct DateRange {
    DateSample first;
    DateSample last;
};

/**
 * @brief Sorts the samples and takes both ends.
 * @return std::nullopt for an empty sequence.
 */
inline std::optional<DateRange> MakeDateRange(std::vector<DateSample> samples) {
    if (samples.empty()) return std::nullopt;
    std::sort(samples.begin(), samples.end());
    return DateRange{samples.front(), samples.back()};
}

} // namespace chatstamp::domain
