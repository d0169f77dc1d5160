/**
 * @file Errors.hpp
 * @brief Exception types for failures that stop a run.
 *
 * Per-file problems (a failed move, a failed attribute write, an unparsable
 * date) are not exceptions at service boundaries; they are logged and counted
 * by the services that meet them.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace chatstamp::domain {

/**
 * @class ArgumentError
 * @brief Bad or missing command-line value, unknown flag, invalid enum value.
 */
class ArgumentError : public std::invalid_argument {
public:
    explicit ArgumentError(const std::string& message) : std::invalid_argument(message) {}
};

/**
 * @class SubprocessError
 * @brief The export collaborator could not be started or exited non-zero.
 */
class SubprocessError : public std::runtime_error {
public:
    SubprocessError(const std::string& message, int exitCode = -1)
        : std::runtime_error(message), m_exitCode(exitCode) {}

    int exitCode() const { return m_exitCode; }

private:
    int m_exitCode;
};

/**
 * @class ConfigurationError
 * @brief Unreadable settings file, invalid setting, or a pattern that fails to compile.
 */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace chatstamp::domain
