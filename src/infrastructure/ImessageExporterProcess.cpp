/**
 * @file ImessageExporterProcess.cpp
 * @brief Implementation of ImessageExporterProcess.
 */

#include "infrastructure/ImessageExporterProcess.hpp"
#include "domain/Errors.hpp"

#include <cstdio>
#include <iostream>
#include <sstream>
#include <sys/wait.h>

namespace chatstamp::infrastructure {

namespace {

std::string ShellQuote(const std::string& arg) {
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted.push_back(c);
        }
    }
    quoted += "'";
    return quoted;
}

} // namespace

ImessageExporterProcess::ImessageExporterProcess(const std::string& executable)
    : m_executable(executable)
{}

std::string ImessageExporterProcess::buildCommand(const std::vector<std::string>& arguments) const {
    std::stringstream cmd;
    cmd << ShellQuote(m_executable);
    for (const auto& arg : arguments) {
        cmd << " " << ShellQuote(arg);
    }
    cmd << " 2>&1";
    return cmd.str();
}

std::string ImessageExporterProcess::run(const domain::RunConfig& config) {
    const std::string command = buildCommand(domain::BuildExporterArguments(config));
    if (config.verbose) {
        std::cout << "[Exporter] Running: " << command << std::endl;
    }

    FILE* pipe = popen(command.c_str(), "r");
    if (!pipe) {
        throw domain::SubprocessError("Could not start " + m_executable);
    }

    std::string output;
    char buffer[256];
    while (fgets(buffer, sizeof(buffer), pipe) != nullptr) {
        output.append(buffer);
    }
    int status = pclose(pipe);

    if (!output.empty()) {
        std::cout << "[Exporter] Output:\n" << output << std::endl;
    }

    if (status == -1) {
        throw domain::SubprocessError("Lost track of " + m_executable + " while waiting for it to exit");
    }
    if (!WIFEXITED(status)) {
        throw domain::SubprocessError(m_executable + " terminated abnormally");
    }

    int exitCode = WEXITSTATUS(status);
    if (exitCode == 127) {
        throw domain::SubprocessError(m_executable + " not found. Make sure it is installed and in your PATH "
                                      "(https://github.com/ReagentX/imessage-exporter)", exitCode);
    }
    if (exitCode != 0) {
        throw domain::SubprocessError("Export failed with exit code: " + std::to_string(exitCode), exitCode);
    }

    std::cout << "[Exporter] Export completed successfully" << std::endl;
    return output;
}

} // namespace chatstamp::infrastructure
