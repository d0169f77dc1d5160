/**
 * @file DateExtractor.cpp
 * @brief Implementation of the date extraction strategies.
 */

#include "infrastructure/DateExtractor.hpp"
#include "infrastructure/TimeParsing.hpp"
#include "domain/Errors.hpp"
#include <algorithm>
#include <sstream>

namespace chatstamp::infrastructure {

namespace {

constexpr const char* kMonthDayYear12h = "%b %d, %Y %I:%M:%S %p";
constexpr const char* kMonthDayYearAt12h = "%b %d, %Y at %I:%M:%S %p";
constexpr const char* kIsoSpace = "%Y-%m-%d %H:%M:%S";
constexpr const char* kIsoT = "%Y-%m-%dT%H:%M:%S";

std::string Trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

/** Date in capture 1, time in capture 2, parsed joined by one space. */
DatePattern::Parser DateAndTime(const char* format) {
    return [format](const std::smatch& m) -> std::optional<domain::DateSample> {
        if (m.size() < 3) return std::nullopt;
        return TimeParsing::ParseLocal(m[1].str() + " " + m[2].str(), format);
    };
}

// Repetitions stay bounded: std::regex recurses once per matched character.

std::vector<DatePattern> PlainTextPatterns() {
    std::vector<DatePattern> patterns;
    patterns.push_back(DatePattern::Compile(
        "line-leading month day year",
        R"(^(\w{3} \d{1,2}, \d{4})\s{1,8}(\d{1,2}:\d{2}:\d{2} [AP]M))",
        std::regex::ECMAScript, true, DateAndTime(kMonthDayYear12h)));
    patterns.push_back(DatePattern::Compile(
        "month day year",
        R"((\w{3} \d{1,2}, \d{4})\s{1,8}(\d{1,2}:\d{2}:\d{2} [AP]M))",
        std::regex::ECMAScript, false, DateAndTime(kMonthDayYear12h)));
    patterns.push_back(DatePattern::Compile(
        "bracketed iso",
        R"(\[(\d{4}-\d{2}-\d{2})[, ]{1,4}(\d{2}:\d{2}:\d{2})\])",
        std::regex::ECMAScript, false, DateAndTime(kIsoSpace)));
    patterns.push_back(DatePattern::Compile(
        "iso",
        R"((\d{4}-\d{2}-\d{2}) (\d{2}:\d{2}:\d{2}))",
        std::regex::ECMAScript, false, DateAndTime(kIsoSpace)));
    return patterns;
}

std::vector<DatePattern> HypertextPatterns() {
    const auto flags = std::regex::ECMAScript | std::regex::icase;
    std::vector<DatePattern> patterns;

    patterns.push_back(DatePattern::Compile(
        "datetime attribute",
        R"re(datetime="([^"]{1,64})")re",
        flags, false,
        [](const std::smatch& m) -> std::optional<domain::DateSample> {
            const std::string value = m[1].str();
            if (auto sample = TimeParsing::ParseInternetDateTime(value)) {
                return sample;
            }
            return TimeParsing::ParseLocal(value, kIsoT);
        }));

    patterns.push_back(DatePattern::Compile(
        "timestamp element",
        R"(class="timestamp"[^>]{0,256}>([^<]{1,128})<)",
        flags, false,
        [](const std::smatch& m) -> std::optional<domain::DateSample> {
            return TimeParsing::ParseLocal(Trim(m[1].str()), kMonthDayYearAt12h);
        }));

    patterns.push_back(DatePattern::Compile(
        "iso text",
        R"((\d{4}-\d{2}-\d{2}[T ]\d{2}:\d{2}:\d{2}))",
        flags, false,
        [](const std::smatch& m) -> std::optional<domain::DateSample> {
            std::string value = m[1].str();
            std::replace(value.begin(), value.end(), 'T', ' ');
            std::replace(value.begin(), value.end(), 't', ' ');
            return TimeParsing::ParseLocal(value, kIsoSpace);
        }));

    patterns.push_back(DatePattern::Compile(
        "month day year at",
        R"((\w{3} \d{1,2}, \d{4}) at (\d{1,2}:\d{2}:\d{2} [AP]M))",
        flags, false, DateAndTime(kMonthDayYear12h)));

    return patterns;
}

} // namespace

DatePattern DatePattern::Compile(const std::string& name,
                                 const std::string& source,
                                 std::regex::flag_type flags,
                                 bool lineAnchored,
                                 Parser parse) {
    DatePattern pattern;
    pattern.name = name;
    pattern.lineAnchored = lineAnchored;
    pattern.parse = std::move(parse);
    try {
        pattern.regex = std::regex(source, flags);
    } catch (const std::regex_error& e) {
        throw domain::ConfigurationError("Invalid date pattern '" + name + "': " + e.what());
    }
    return pattern;
}

std::vector<domain::DateSample> DatePattern::collect(const std::string& content) const {
    std::vector<domain::DateSample> samples;

    auto take = [&](const std::smatch& m) {
        if (auto sample = parse(m)) {
            samples.push_back(*sample);
        }
    };

    if (lineAnchored) {
        std::istringstream stream(content);
        std::string line;
        while (std::getline(stream, line)) {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            std::smatch m;
            if (std::regex_search(line, m, regex)) {
                take(m);
            }
        }
        return samples;
    }

    for (auto it = std::sregex_iterator(content.begin(), content.end(), regex); it != std::sregex_iterator(); ++it) {
        take(*it);
    }
    return samples;
}

FirstMatchingPattern::FirstMatchingPattern(std::vector<DatePattern> patterns)
    : m_patterns(std::move(patterns)) {}

std::vector<domain::DateSample> FirstMatchingPattern::extract(const std::string& content) const {
    for (const auto& pattern : m_patterns) {
        auto samples = pattern.collect(content);
        if (!samples.empty()) {
            return samples;
        }
    }
    return {};
}

AllPatternsUnion::AllPatternsUnion(std::vector<DatePattern> patterns)
    : m_patterns(std::move(patterns)) {}

std::vector<domain::DateSample> AllPatternsUnion::extract(const std::string& content) const {
    std::vector<domain::DateSample> samples;
    for (const auto& pattern : m_patterns) {
        auto found = pattern.collect(content);
        samples.insert(samples.end(), found.begin(), found.end());
    }
    return samples;
}

DateExtractor::DateExtractor(std::unique_ptr<DateExtractionStrategy> plainText,
                             std::unique_ptr<DateExtractionStrategy> hypertext)
    : m_plainText(std::move(plainText)), m_hypertext(std::move(hypertext)) {}

DateExtractor DateExtractor::CreateDefault() {
    return DateExtractor(std::make_unique<FirstMatchingPattern>(PlainTextPatterns()),
                         std::make_unique<AllPatternsUnion>(HypertextPatterns()));
}

std::vector<domain::DateSample> DateExtractor::extract(const std::string& content, domain::ExportFormat format) const {
    if (format == domain::ExportFormat::Hypertext) {
        return m_hypertext->extract(content);
    }
    return m_plainText->extract(content);
}

std::optional<domain::DateRange> DateExtractor::extractRange(const std::string& content, domain::ExportFormat format) const {
    return domain::MakeDateRange(extract(content, format));
}

} // namespace chatstamp::infrastructure
