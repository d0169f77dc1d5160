/**
 * @file FileMetadataWriter.hpp
 * @brief Interface for stamping a file with its message date range.
 */

#pragma once
#include <string>
#include "domain/DateRange.hpp"

namespace chatstamp::domain {

class FileMetadataWriter {
public:
    virtual ~FileMetadataWriter() = default;

    /**
     * @brief Creation time := range.first, modification time := range.last.
     * @throws std::filesystem::filesystem_error when the attributes cannot be written.
     */
    virtual void apply(const std::string& path, const DateRange& range) = 0;
};

} // namespace chatstamp::domain
