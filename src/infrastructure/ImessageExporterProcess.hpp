#pragma once

#include "domain/ExportRunner.hpp"
#include <string>
#include <vector>

namespace chatstamp::infrastructure {

/**
 * @class ImessageExporterProcess
 * @brief Runs imessage-exporter through the shell with stderr merged into stdout.
 */
class ImessageExporterProcess : public domain::ExportRunner {
public:
    explicit ImessageExporterProcess(const std::string& executable);
    ~ImessageExporterProcess() override = default;

    std::string run(const domain::RunConfig& config) override;

    /** @brief Full shell command line, with every argument single-quoted. */
    std::string buildCommand(const std::vector<std::string>& arguments) const;

private:
    std::string m_executable;
};

} // namespace chatstamp::infrastructure
