/**
 * @file TimestampService.cpp
 * @brief Implementation of TimestampService.
 */

#include "application/TimestampService.hpp"
#include "infrastructure/TimeParsing.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace chatstamp::application {

using infrastructure::TimeParsing;

TimestampService::TimestampService(const infrastructure::DateExtractor& extractor,
                                   std::shared_ptr<domain::FileMetadataWriter> writer,
                                   bool verbose)
    : m_extractor(extractor), m_writer(std::move(writer)), m_verbose(verbose) {}

std::optional<domain::DateRange> TimestampService::rangeFor(const domain::ExportFile& file) const {
    std::ifstream in(file.path, std::ios::binary);
    if (!in.is_open()) {
        throw std::runtime_error("Cannot open " + file.path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        throw std::runtime_error("Read failed for " + file.path);
    }

    auto samples = m_extractor.extract(buffer.str(), file.format);
    if (m_verbose) {
        std::cout << "    Found " << samples.size() << " timestamps" << std::endl;
    }
    return domain::MakeDateRange(std::move(samples));
}

TimestampService::TimestampResult TimestampService::updateAll(const std::vector<domain::ExportFile>& files) {
    TimestampResult result;
    result.filesScanned = static_cast<int>(files.size());

    if (m_verbose) {
        std::cout << "[Timestamps] Found " << files.size() << " export files to process" << std::endl;
    }

    for (const auto& file : files) {
        if (m_verbose) {
            std::cout << "[Timestamps] Processing " << file.filename << "..." << std::endl;
        }

        std::optional<domain::DateRange> range;
        try {
            range = rangeFor(file);
        } catch (const std::exception& e) {
            std::cerr << "[Timestamps] Error reading " << file.filename << ": " << e.what() << std::endl;
            result.errors.push_back(file.filename + ": " + e.what());
            continue;
        }

        if (!range) {
            ++result.withoutDates;
            if (m_verbose) {
                std::cout << "    No dates found in " << file.filename << std::endl;
            }
            continue;
        }

        try {
            m_writer->apply(file.path, *range);
        } catch (const std::filesystem::filesystem_error& e) {
            std::cerr << "[Timestamps] Error updating timestamps for " << file.filename << ": " << e.what() << std::endl;
            result.errors.push_back(file.filename + ": " + e.what());
            continue;
        }

        ++result.updated;
        if (m_verbose) {
            std::cout << "    Updated " << file.filename << ":" << std::endl;
            std::cout << "      Created:  " << TimeParsing::FormatLocal(range->first) << std::endl;
            std::cout << "      Modified: " << TimeParsing::FormatLocal(range->last) << std::endl;
        }
    }

    return result;
}

} // namespace chatstamp::application
