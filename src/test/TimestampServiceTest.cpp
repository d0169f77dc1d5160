#include <cassert>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <system_error>
#include <vector>
#include <sys/stat.h>

#include "application/TimestampService.hpp"
#include "infrastructure/DateExtractor.hpp"
#include "infrastructure/FileTimestampWriter.hpp"

using namespace chatstamp::domain;
using chatstamp::application::TimestampService;
using chatstamp::infrastructure::DateExtractor;
using chatstamp::infrastructure::FileTimestampWriter;

namespace fs = std::filesystem;

namespace {

std::time_t LocalSeconds(int year, int month, int day, int hour, int minute, int second) {
    std::tm tm = {};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    tm.tm_isdst = -1;
    return std::mktime(&tm);
}

ExportFile Write(const fs::path& dir, const std::string& name, ExportFormat format, const std::string& content) {
    std::ofstream out(dir / name);
    out << content;
    return ExportFile((dir / name).string(), name, format);
}

class RecordingWriter : public FileMetadataWriter {
public:
    void apply(const std::string& path, const DateRange& range) override {
        paths.push_back(path);
        ranges.push_back(range);
    }

    std::vector<std::string> paths;
    std::vector<DateRange> ranges;
};

class FailingWriter : public FileMetadataWriter {
public:
    void apply(const std::string& path, const DateRange&) override {
        throw fs::filesystem_error("utimensat", path, std::make_error_code(std::errc::permission_denied));
    }
};

const char* kConversation =
    "Nov 28, 2024 11:46:34 AM\n"
    "Alice\n"
    "Lunch?\n"
    "\n"
    "Nov 29, 2024 2:19:59 PM\n"
    "Me\n"
    "Sure\n";

void TestRealWriter(const DateExtractor& extractor, const fs::path& dir) {
    std::vector<ExportFile> files = {
        Write(dir, "Alice.txt", ExportFormat::PlainText, kConversation),
        Write(dir, "Bob.html", ExportFormat::Hypertext,
              "<span class=\"timestamp\">Jan 02, 2023 at 09:00:00 AM</span>"
              "<span class=\"timestamp\">Jan 05, 2023 at 06:30:00 PM</span>"),
    };

    TimestampService service(extractor, std::make_shared<FileTimestampWriter>(), false);
    auto result = service.updateAll(files);
    assert(result.filesScanned == 2);
    assert(result.updated == 2);
    assert(result.errors.empty());

    struct stat st {};
    assert(::stat(files[0].path.c_str(), &st) == 0);
    assert(st.st_mtime == LocalSeconds(2024, 11, 29, 14, 19, 59));
    assert(st.st_atime == LocalSeconds(2024, 11, 28, 11, 46, 34));

    assert(::stat(files[1].path.c_str(), &st) == 0);
    assert(st.st_mtime == LocalSeconds(2023, 1, 5, 18, 30, 0));
    assert(st.st_atime == LocalSeconds(2023, 1, 2, 9, 0, 0));

    // Direct writer failure on a missing path.
    bool threw = false;
    try {
        FileTimestampWriter().apply((dir / "absent.txt").string(),
                                    DateRange{std::chrono::system_clock::now(), std::chrono::system_clock::now()});
    } catch (const fs::filesystem_error&) {
        threw = true;
    }
    assert(threw);
}

void TestSkipsAndErrors(const DateExtractor& extractor, const fs::path& dir) {
    std::vector<ExportFile> files = {
        Write(dir, "Quiet.txt", ExportFormat::PlainText, "nothing dated in here\n"),
        ExportFile((dir / "Gone.txt").string(), "Gone.txt", ExportFormat::PlainText),
        Write(dir, "Carol.txt", ExportFormat::PlainText, kConversation),
    };

    auto recorder = std::make_shared<RecordingWriter>();
    TimestampService service(extractor, recorder, false);
    auto result = service.updateAll(files);

    assert(result.filesScanned == 3);
    assert(result.withoutDates == 1);
    assert(result.errors.size() == 1);
    assert(result.updated == 1);
    assert(recorder->paths.size() == 1);
    assert(recorder->paths[0] == files[2].path);
    assert(std::chrono::system_clock::to_time_t(recorder->ranges[0].first) == LocalSeconds(2024, 11, 28, 11, 46, 34));
    assert(std::chrono::system_clock::to_time_t(recorder->ranges[0].last) == LocalSeconds(2024, 11, 29, 14, 19, 59));

    bool threw = false;
    try {
        service.rangeFor(files[1]);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
    assert(!service.rangeFor(files[0]).has_value());

    // Writer failures are recorded per file and the pass continues.
    TimestampService failing(extractor, std::make_shared<FailingWriter>(), false);
    auto failed = failing.updateAll({files[2], files[0]});
    assert(failed.updated == 0);
    assert(failed.errors.size() == 1);
    assert(failed.withoutDates == 1);
}

} // namespace

int main() {
    std::cout << "[Test] Starting TimestampService Test..." << std::endl;

    const fs::path dir = fs::temp_directory_path() / "chatstamp_timestamp_test";
    fs::remove_all(dir);
    fs::create_directories(dir);

    const DateExtractor extractor = DateExtractor::CreateDefault();
    TestRealWriter(extractor, dir);
    TestSkipsAndErrors(extractor, dir);

    fs::remove_all(dir);
    std::cout << "[PASS] TimestampService Test." << std::endl;
    return 0;
}
