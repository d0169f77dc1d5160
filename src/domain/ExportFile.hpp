/**
 * @file ExportFile.hpp
 * @brief Domain entity for one conversation file written by the exporter.
 */

#pragma once
#include <optional>
#include <string>
#include <utility>

namespace chatstamp::domain {

/**
 * @enum ExportFormat
 * @brief The two encodings the exporter writes.
 */
enum class ExportFormat {
    PlainText, ///< .txt
    Hypertext  ///< .html
};

/**
 * @brief Classifies an extension (with or without the dot, any case).
 * @return std::nullopt for anything other than txt/html.
 */
std::optional<ExportFormat> FormatFromExtension(std::string extension);

/** @brief Exact "txt" or "html", as accepted on the command line. */
std::optional<ExportFormat> FormatFromName(const std::string& name);

/** @brief "txt" or "html", as passed to the exporter. */
const char* ToString(ExportFormat format);

/**
 * @class ExportFile
 * @brief A regular file found directly in the export directory.
 */
class ExportFile {
public:
    std::string path;     ///< Full path as listed.
    std::string filename; ///< Basename including extension.
    ExportFormat format;  ///< Classified from the extension.

    ExportFile() : format(ExportFormat::PlainText) {}
    ExportFile(std::string p, std::string name, ExportFormat f)
        : path(std::move(p)), filename(std::move(name)), format(f) {}
};

} // namespace chatstamp::domain
