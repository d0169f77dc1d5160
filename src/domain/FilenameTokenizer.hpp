/**
 * @file FilenameTokenizer.hpp
 * @brief Splits an export filename into contact identifiers.
 */

#pragma once
#include <string>
#include <vector>
#include "domain/Identifier.hpp"

namespace chatstamp::domain {

/**
 * @class FilenameTokenizer
 * @brief Turns "John, +14155551234, jane@x.com.txt" into lookup keys.
 *
 * The stem is split on commas. A part containing a digit is a phone and
 * contributes all of its variants; otherwise a part containing '@' is an
 * email; anything else (typically a name already resolved) is discarded.
 */
class FilenameTokenizer {
public:
    static std::vector<Identifier> tokenize(const std::string& filename);

    /** @brief Lowercases and trims an email address. */
    static std::string normalizeEmail(const std::string& email);

    /** @brief Strips spaces and tabs from both ends. */
    static std::string trim(const std::string& text);
};

} // namespace chatstamp::domain
