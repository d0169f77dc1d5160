/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"
#include "domain/Errors.hpp"
#include <fstream>
#include <nlohmann/json.hpp>

namespace chatstamp::infrastructure {

namespace {

std::string RequireString(const nlohmann::json& j, const char* key, const std::filesystem::path& source) {
    const auto& node = j.at(key);
    if (!node.is_string()) {
        throw domain::ConfigurationError(source.string() + ": '" + key + "' must be a string");
    }
    return node.get<std::string>();
}

} // namespace

bool ConfigLoader::ApplySettingsFile(const std::filesystem::path& settingsPath, domain::RunConfig& config) {
    if (!std::filesystem::exists(settingsPath)) {
        return false;
    }

    nlohmann::json j;
    try {
        std::ifstream f(settingsPath);
        if (!f.is_open()) {
            throw domain::ConfigurationError("Cannot open " + settingsPath.string());
        }
        f >> j;
    } catch (const nlohmann::json::exception& e) {
        throw domain::ConfigurationError("Error reading " + settingsPath.string() + ": " + e.what());
    }

    if (!j.is_object()) {
        throw domain::ConfigurationError(settingsPath.string() + " must contain a JSON object");
    }

    if (j.contains("output_dir")) {
        config.outputDirectory = PathUtils::ExpandUser(RequireString(j, "output_dir", settingsPath));
    }
    if (j.contains("format")) {
        auto format = domain::FormatFromName(RequireString(j, "format", settingsPath));
        if (!format) {
            throw domain::ConfigurationError(settingsPath.string() + ": format must be 'txt' or 'html'");
        }
        config.format = *format;
    }
    if (j.contains("copy_method")) {
        auto method = domain::CopyMethodFromString(RequireString(j, "copy_method", settingsPath));
        if (!method) {
            throw domain::ConfigurationError(settingsPath.string() +
                                             ": copy_method must be one of: disabled, clone, basic, full");
        }
        config.copyMethod = *method;
    }
    if (j.contains("exporter")) {
        config.exporter = RequireString(j, "exporter", settingsPath);
    }
    if (j.contains("contacts")) {
        config.contactsPath = PathUtils::ExpandUser(RequireString(j, "contacts", settingsPath));
    }

    return true;
}

} // namespace chatstamp::infrastructure
