/**
 * @file CommandLine.cpp
 * @brief Implementation of CommandLine.
 */

#include "app/CommandLine.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/TimeParsing.hpp"
#include <sstream>

namespace chatstamp::app {

namespace {

using infrastructure::PathUtils;

std::string ValidDate(const std::string& flag, const std::string& value) {
    if (value.size() != 10 || !infrastructure::TimeParsing::ParseLocal(value, "%Y-%m-%d")) {
        throw domain::ArgumentError(flag + " requires a date argument (YYYY-MM-DD), got '" + value + "'");
    }
    return value;
}

} // namespace

void CommandLineOptions::applyTo(domain::RunConfig& config) const {
    if (outputDirectory) config.outputDirectory = *outputDirectory;
    if (format) config.format = *format;
    if (copyMethod) config.copyMethod = *copyMethod;
    if (databasePath) config.databasePath = databasePath;
    if (attachmentRoot) config.attachmentRoot = attachmentRoot;
    if (startDate) config.startDate = startDate;
    if (endDate) config.endDate = endDate;
    if (contactsPath) config.contactsPath = contactsPath;
    if (exporter) config.exporter = *exporter;
    if (noRename) config.renameFiles = false;
    if (dryRun) config.dryRun = true;
    if (verbose) config.verbose = true;
}

CommandLineOptions CommandLine::Parse(const std::vector<std::string>& args) {
    CommandLineOptions options;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        auto value = [&](const std::string& what) -> std::string {
            if (i + 1 >= args.size()) {
                throw domain::ArgumentError(arg + " requires " + what);
            }
            return args[++i];
        };

        if (arg == "-h" || arg == "--help") {
            options.helpRequested = true;
            return options;
        } else if (arg == "-o" || arg == "--output") {
            options.outputDirectory = PathUtils::ExpandUser(value("a directory argument"));
        } else if (arg == "-f" || arg == "--format") {
            auto format = domain::FormatFromName(value("an argument (txt or html)"));
            if (!format) throw domain::ArgumentError("format must be 'txt' or 'html'");
            options.format = format;
        } else if (arg == "-c" || arg == "--copy-method") {
            auto method = domain::CopyMethodFromString(value("an argument"));
            if (!method) throw domain::ArgumentError("copy-method must be one of: disabled, clone, basic, full");
            options.copyMethod = method;
        } else if (arg == "-p" || arg == "--db-path") {
            options.databasePath = PathUtils::ExpandUser(value("a path argument"));
        } else if (arg == "-r" || arg == "--attachment-root") {
            options.attachmentRoot = PathUtils::ExpandUser(value("a path argument"));
        } else if (arg == "-s" || arg == "--start-date") {
            options.startDate = ValidDate(arg, value("a date argument (YYYY-MM-DD)"));
        } else if (arg == "-e" || arg == "--end-date") {
            options.endDate = ValidDate(arg, value("a date argument (YYYY-MM-DD)"));
        } else if (arg == "--contacts") {
            options.contactsPath = PathUtils::ExpandUser(value("a file argument"));
        } else if (arg == "--config") {
            options.configPath = PathUtils::ExpandUser(value("a file argument"));
        } else if (arg == "--exporter") {
            options.exporter = value("an executable argument");
        } else if (arg == "--no-rename") {
            options.noRename = true;
        } else if (arg == "--dry-run") {
            options.dryRun = true;
        } else if (arg == "--verbose") {
            options.verbose = true;
        } else {
            throw domain::ArgumentError("Unknown argument '" + arg + "'");
        }
    }

    return options;
}

std::string CommandLine::Usage(const std::string& program) {
    std::stringstream ss;
    ss << "Usage: " << program << " [options]\n"
       << "\n"
       << "Options:\n"
       << "  -o, --output DIR           Output directory (default: ./imessage_export)\n"
       << "  -f, --format FORMAT        Export format: txt or html (default: txt)\n"
       << "  -c, --copy-method METHOD   Attachment copy method: disabled, clone, basic, full (default: disabled)\n"
       << "  -p, --db-path PATH         Custom iMessage database path\n"
       << "  -r, --attachment-root PATH Custom attachment root path\n"
       << "  -s, --start-date DATE      Start date (YYYY-MM-DD)\n"
       << "  -e, --end-date DATE        End date (YYYY-MM-DD)\n"
       << "      --contacts FILE        Address book to resolve names from (.json or .vcf)\n"
       << "      --config FILE          Settings file (default: $XDG_CONFIG_HOME/chatstamp/settings.json)\n"
       << "      --exporter BIN         Exporter executable (default: imessage-exporter)\n"
       << "      --no-rename            Skip contact name renaming\n"
       << "      --dry-run              Show what would be done without making changes\n"
       << "      --verbose              Show detailed output\n"
       << "  -h, --help                 Show this help message\n"
       << "\n"
       << "Examples:\n"
       << "  " << program << " --contacts ~/contacts.vcf\n"
       << "  " << program << " -f html -c basic -o ~/Documents/messages\n"
       << "  " << program << " --dry-run --verbose\n"
       << "  " << program << " -s 2023-01-01 -e 2023-12-31\n";
    return ss.str();
}

} // namespace chatstamp::app
