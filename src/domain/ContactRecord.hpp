/**
 * @file ContactRecord.hpp
 * @brief A single entry as exposed by a contact store.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>

namespace chatstamp::domain {

/**
 * @struct ContactRecord
 * @brief Name parts plus every phone and email attached to one contact.
 */
struct ContactRecord {
    std::string givenName;
    std::string familyName;
    std::string organizationName;
    std::vector<std::string> phoneNumbers;
    std::vector<std::string> emailAddresses;

    /**
     * @brief "Given Family", falling back to the organization.
     * @return std::nullopt when the record carries no usable name.
     */
    std::optional<std::string> displayName() const {
        std::string name = givenName;
        if (!familyName.empty()) {
            if (!name.empty()) name += " ";
            name += familyName;
        }
        if (!name.empty()) return name;
        if (!organizationName.empty()) return organizationName;
        return std::nullopt;
    }
};

} // namespace chatstamp::domain
