/**
 * @file ExportRunner.cpp
 * @brief Argument list shared by ExportRunner implementations.
 */

#include "domain/ExportRunner.hpp"

namespace chatstamp::domain {

std::vector<std::string> BuildExporterArguments(const RunConfig& config) {
    std::vector<std::string> args = {
        "-f", ToString(config.format),
        "-c", ToString(config.copyMethod),
        "-o", config.outputDirectory,
    };
    if (config.databasePath) {
        args.push_back("-p");
        args.push_back(*config.databasePath);
    }
    if (config.attachmentRoot) {
        args.push_back("-r");
        args.push_back(*config.attachmentRoot);
    }
    if (config.startDate) {
        args.push_back("-s");
        args.push_back(*config.startDate);
    }
    if (config.endDate) {
        args.push_back("-e");
        args.push_back(*config.endDate);
    }
    return args;
}

} // namespace chatstamp::domain
