/**
 * @file DateExtractor.hpp
 * @brief Pattern-based extraction of message timestamps from export content.
 */

#pragma once
#include <functional>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <vector>
#include "domain/DateRange.hpp"
#include "domain/ExportFile.hpp"

namespace chatstamp::infrastructure {

/**
 * @struct DatePattern
 * @brief A compiled regex plus the parser for its captures.
 */
struct DatePattern {
    using Parser = std::function<std::optional<domain::DateSample>(const std::smatch&)>;

    std::string name;
    std::regex regex;
    bool lineAnchored = false; ///< Matched once per line, from the line start.
    Parser parse;

    /**
     * @brief Compiles the source expression.
     * @throws domain::ConfigurationError if the expression is invalid.
     */
    static DatePattern Compile(const std::string& name,
                               const std::string& source,
                               std::regex::flag_type flags,
                               bool lineAnchored,
                               Parser parse);

    /** @brief Parsed samples of every match, in discovery order. Unparsable matches are dropped. */
    std::vector<domain::DateSample> collect(const std::string& content) const;
};

/**
 * @class DateExtractionStrategy
 * @brief Turns file content into an ordered sequence of date samples.
 */
class DateExtractionStrategy {
public:
    virtual ~DateExtractionStrategy() = default;
    virtual std::vector<domain::DateSample> extract(const std::string& content) const = 0;
};

/**
 * @class FirstMatchingPattern
 * @brief Tries patterns in priority order and stops at the first one that yields samples.
 */
class FirstMatchingPattern : public DateExtractionStrategy {
public:
    explicit FirstMatchingPattern(std::vector<DatePattern> patterns);
    std::vector<domain::DateSample> extract(const std::string& content) const override;

private:
    std::vector<DatePattern> m_patterns;
};

/**
 * @class AllPatternsUnion
 * @brief Applies every pattern and concatenates all of their samples.
 */
class AllPatternsUnion : public DateExtractionStrategy {
public:
    explicit AllPatternsUnion(std::vector<DatePattern> patterns);
    std::vector<domain::DateSample> extract(const std::string& content) const override;

private:
    std::vector<DatePattern> m_patterns;
};

/**
 * @class DateExtractor
 * @brief Picks the strategy for a file's format.
 *
 * Plain text uses FirstMatchingPattern over, in order: a line-leading
 * "Nov 28, 2024 11:46:34 AM", the same anywhere in a line, a bracketed ISO
 * date-time and a bare ISO date-time. Hypertext uses AllPatternsUnion over
 * datetime="..." attributes, class="timestamp" element text, ISO date-times
 * in text and "Nov 28, 2024 at 11:46:34 AM".
 */
class DateExtractor {
public:
    DateExtractor(std::unique_ptr<DateExtractionStrategy> plainText,
                  std::unique_ptr<DateExtractionStrategy> hypertext);

    /**
     * @brief Compiles the built-in patterns.
     * @throws domain::ConfigurationError if any pattern fails to compile.
     */
    static DateExtractor CreateDefault();

    std::vector<domain::DateSample> extract(const std::string& content, domain::ExportFormat format) const;

    /** @brief std::nullopt when the content yields no samples. */
    std::optional<domain::DateRange> extractRange(const std::string& content, domain::ExportFormat format) const;

private:
    std::unique_ptr<DateExtractionStrategy> m_plainText;
    std::unique_ptr<DateExtractionStrategy> m_hypertext;
};

} // namespace chatstamp::infrastructure
