/**
 * @file CommandLine.hpp
 * @brief Parsing of command-line flags into RunConfig overrides.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>
#include "domain/RunConfig.hpp"

namespace chatstamp::app {

/**
 * @struct CommandLineOptions
 * @brief Flags exactly as given; unset members leave the settings file value in place.
 */
struct CommandLineOptions {
    bool helpRequested = false;
    std::optional<std::string> configPath;

    std::optional<std::string> outputDirectory;
    std::optional<domain::ExportFormat> format;
    std::optional<domain::CopyMethod> copyMethod;
    std::optional<std::string> databasePath;
    std::optional<std::string> attachmentRoot;
    std::optional<std::string> startDate;
    std::optional<std::string> endDate;
    std::optional<std::string> contactsPath;
    std::optional<std::string> exporter;
    bool noRename = false;
    bool dryRun = false;
    bool verbose = false;

    /** @brief Overlays the flags that were given onto the config. */
    void applyTo(domain::RunConfig& config) const;
};

class CommandLine {
public:
    /**
     * @brief Parses arguments (without the program name).
     * @throws domain::ArgumentError on unknown flags, missing values or invalid values.
     */
    static CommandLineOptions Parse(const std::vector<std::string>& args);

    static std::string Usage(const std::string& program);
};

} // namespace chatstamp::app
