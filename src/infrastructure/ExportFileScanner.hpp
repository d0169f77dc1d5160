/**
 * @file ExportFileScanner.hpp
 * @brief Scanner for conversation files in the export directory.
 */

#pragma once
#include <string>
#include <vector>
#include "domain/ExportFile.hpp"

namespace chatstamp::infrastructure {

/**
 * @class ExportFileScanner
 * @brief Lists .txt and .html files directly inside the export directory.
 */
class ExportFileScanner {
public:
    explicit ExportFileScanner(const std::string& exportPath);

    /**
     * @brief Snapshot of the directory in listing order.
     * @throws std::filesystem::filesystem_error if the directory is missing or unreadable.
     */
    std::vector<domain::ExportFile> scan() const;

    const std::string& exportPath() const { return m_exportPath; }

private:
    std::string m_exportPath;
};

} // namespace chatstamp::infrastructure
