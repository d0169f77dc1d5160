/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading the optional settings.json.
 *
 * Settings sit between the built-in defaults and the command line: a value
 * present in the file replaces the default, a flag replaces both.
 */

#pragma once

#include <filesystem>
#include "domain/RunConfig.hpp"

namespace chatstamp::infrastructure {

class ConfigLoader {
public:
    /**
     * @brief Overlays the keys of a settings file onto the config.
     *
     * Recognised keys: "output_dir", "format", "copy_method", "exporter", "contacts".
     * Unknown keys are ignored.
     *
     * @return false if the file does not exist (config untouched).
     * @throws domain::ConfigurationError on malformed JSON or an invalid value.
     */
    static bool ApplySettingsFile(const std::filesystem::path& settingsPath, domain::RunConfig& config);
};

} // namespace chatstamp::infrastructure
