/**
 * @file ExportFile.cpp
 * @brief Extension classification helpers.
 */

#include "domain/ExportFile.hpp"
#include <algorithm>
#include <cctype>

namespace chatstamp::domain {

std::optional<ExportFormat> FormatFromExtension(std::string extension) {
    if (!extension.empty() && extension.front() == '.') extension.erase(0, 1);
    std::transform(extension.begin(), extension.end(), extension.begin(), [](unsigned char c){ return std::tolower(c); });

    if (extension == "txt") return ExportFormat::PlainText;
    if (extension == "html") return ExportFormat::Hypertext;
    return std::nullopt;
}

std::optional<ExportFormat> FormatFromName(const std::string& name) {
    if (name == "txt") return ExportFormat::PlainText;
    if (name == "html") return ExportFormat::Hypertext;
    return std::nullopt;
}

const char* ToString(ExportFormat format) {
    return format == ExportFormat::Hypertext ? "html" : "txt";
}

} // namespace chatstamp::domain
