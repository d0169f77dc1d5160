/**
 * @file TimestampService.hpp
 * @brief Stamps export files with the dates of their first and last message.
 */

#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "domain/DateRange.hpp"
#include "domain/ExportFile.hpp"
#include "domain/FileMetadataWriter.hpp"
#include "infrastructure/DateExtractor.hpp"

namespace chatstamp::application {

class TimestampService {
public:
    struct TimestampResult {
        int filesScanned = 0;
        int updated = 0;
        int withoutDates = 0; ///< Files with no parsable date, left untouched.
        std::vector<std::string> errors;
    };

    /**
     * @param extractor Must outlive the service.
     */
    TimestampService(const infrastructure::DateExtractor& extractor,
                     std::shared_ptr<domain::FileMetadataWriter> writer,
                     bool verbose);

    /**
     * @brief Reads, extracts and stamps each file. Read and write failures are recorded, not thrown.
     */
    TimestampResult updateAll(const std::vector<domain::ExportFile>& files);

    /**
     * @brief Date range of a single file's content.
     * @throws std::runtime_error if the file cannot be read.
     */
    std::optional<domain::DateRange> rangeFor(const domain::ExportFile& file) const;

private:
    const infrastructure::DateExtractor& m_extractor;
    std::shared_ptr<domain::FileMetadataWriter> m_writer;
    bool m_verbose;
};

} // namespace chatstamp::application
