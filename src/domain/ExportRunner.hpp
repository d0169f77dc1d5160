/**
 * @file ExportRunner.hpp
 * @brief Interface to the external process that writes the export files.
 */

#pragma once
#include <string>
#include <vector>
#include "domain/RunConfig.hpp"

namespace chatstamp::domain {

/**
 * @class ExportRunner
 * @brief Runs the exporter once, synchronously.
 */
class ExportRunner {
public:
    virtual ~ExportRunner() = default;

    /**
     * @brief Runs the export described by the config.
     * @return Combined stdout and stderr of the process.
     * @throws SubprocessError if the process cannot start or exits non-zero.
     */
    virtual std::string run(const RunConfig& config) = 0;
};

/**
 * @brief Exporter flags for a config: -f, -c, -o and the optional -p, -r, -s, -e.
 */
std::vector<std::string> BuildExporterArguments(const RunConfig& config);

} // namespace chatstamp::domain
