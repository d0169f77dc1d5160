/**
 * @file Identifier.hpp
 * @brief Value type for a phone or email token.
 */

#pragma once
#include <string>

namespace chatstamp::domain {

enum class IdentifierKind {
    Phone,
    Email
};

/**
 * @struct Identifier
 * @brief A single lookup key extracted from a filename or a contact record.
 */
struct Identifier {
    std::string value;   ///< Exact key used against the ContactIndex.
    IdentifierKind kind; ///< Phone variants and emails share one key space.

    bool operator==(const Identifier& other) const {
        return value == other.value && kind == other.kind;
    }
};

} // namespace chatstamp::domain
