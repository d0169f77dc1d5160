/**
 * @file FileTimestampWriter.cpp
 * @brief Implementation of FileTimestampWriter.
 */

#include "infrastructure/FileTimestampWriter.hpp"
#include <cerrno>
#include <chrono>
#include <filesystem>
#include <system_error>
#include <fcntl.h>
#include <sys/stat.h>

#if defined(__APPLE__)
#include <sys/attr.h>
#include <unistd.h>
#endif

namespace chatstamp::infrastructure {

namespace {

timespec ToTimespec(const domain::DateSample& sample) {
    using namespace std::chrono;
    auto since = sample.time_since_epoch();
    auto secs = duration_cast<seconds>(since);
    if (secs > since) secs -= seconds(1);
    timespec ts;
    ts.tv_sec = static_cast<time_t>(secs.count());
    ts.tv_nsec = static_cast<long>(duration_cast<nanoseconds>(since - secs).count());
    return ts;
}

[[noreturn]] void ThrowErrno(const char* what, const std::string& path) {
    throw std::filesystem::filesystem_error(what, std::filesystem::path(path),
                                            std::error_code(errno, std::generic_category()));
}

} // namespace

void FileTimestampWriter::apply(const std::string& path, const domain::DateRange& range) {
    timespec times[2];
    times[0] = ToTimespec(range.first); // atime
    times[1] = ToTimespec(range.last);  // mtime

    if (utimensat(AT_FDCWD, path.c_str(), times, 0) != 0) {
        ThrowErrno("utimensat", path);
    }

#if defined(__APPLE__)
    struct attrlist attrs = {};
    attrs.bitmapcount = ATTR_BIT_MAP_COUNT;
    attrs.commonattr = ATTR_CMN_CRTIME;
    timespec created = times[0];
    if (setattrlist(path.c_str(), &attrs, &created, sizeof(created), 0) != 0) {
        ThrowErrno("setattrlist", path);
    }
#endif
}

} // namespace chatstamp::infrastructure
