/**
 * @file ExportFileScanner.cpp
 * @brief Implementation of the ExportFileScanner.
 */

#include "infrastructure/ExportFileScanner.hpp"
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace chatstamp::infrastructure {

ExportFileScanner::ExportFileScanner(const std::string& exportPath)
    : m_exportPath(exportPath) {}

std::vector<domain::ExportFile> ExportFileScanner::scan() const {
    std::vector<domain::ExportFile> files;

    if (!fs::is_directory(m_exportPath)) {
        throw fs::filesystem_error("Export directory not found", fs::path(m_exportPath),
                                   std::make_error_code(std::errc::no_such_file_or_directory));
    }

    for (const auto& entry : fs::directory_iterator(m_exportPath)) {
        if (!entry.is_regular_file()) continue;

        auto format = domain::FormatFromExtension(entry.path().extension().string());
        if (!format) continue;

        files.emplace_back(entry.path().string(), entry.path().filename().string(), *format);
    }

    return files;
}

} // namespace chatstamp::infrastructure
