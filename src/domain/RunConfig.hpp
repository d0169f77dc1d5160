/**
 * @file RunConfig.hpp
 * @brief Effective settings of one run after defaults, settings file and flags.
 */

#pragma once
#include <optional>
#include <string>
#include "domain/ExportFile.hpp"

namespace chatstamp::domain {

/**
 * @enum CopyMethod
 * @brief Attachment handling requested from the exporter.
 */
enum class CopyMethod {
    Disabled,
    Clone,
    Basic,
    Full
};

std::optional<CopyMethod> CopyMethodFromString(const std::string& value);
const char* ToString(CopyMethod method);

struct RunConfig {
    std::string outputDirectory = "./imessage_export";
    ExportFormat format = ExportFormat::PlainText;
    CopyMethod copyMethod = CopyMethod::Disabled;
    std::optional<std::string> databasePath;
    std::optional<std::string> attachmentRoot;
    std::optional<std::string> startDate;
    std::optional<std::string> endDate;
    std::optional<std::string> contactsPath; ///< .json or .vcf address book.
    std::string exporter = "imessage-exporter";
    bool renameFiles = true;
    bool dryRun = false;
    bool verbose = false;
};

} // namespace chatstamp::domain
