/**
 * @file FileTimestampWriter.hpp
 * @brief POSIX implementation of FileMetadataWriter.
 */

#pragma once
#include "domain/FileMetadataWriter.hpp"

namespace chatstamp::infrastructure {

/**
 * @class FileTimestampWriter
 * @brief Writes both timestamps with a single utimensat call.
 *
 * Linux has no settable creation time, so the first message time goes to
 * the access time. On macOS the creation time is written as well.
 */
class FileTimestampWriter : public domain::FileMetadataWriter {
public:
    void apply(const std::string& path, const domain::DateRange& range) override;
};

} // namespace chatstamp::infrastructure
