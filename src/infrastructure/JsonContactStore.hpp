/**
 * @file JsonContactStore.hpp
 * @brief ContactStore backed by a JSON address book file.
 */

#pragma once
#include <string>
#include "domain/ContactStore.hpp"

namespace chatstamp::infrastructure {

/**
 * @class JsonContactStore
 * @brief Reads records from a JSON array, or from the "contacts" array of an object.
 *
 * Record keys: "given_name", "family_name", "organization", "phones", "emails".
 * Missing keys are treated as empty.
 */
class JsonContactStore : public domain::ContactStore {
public:
    explicit JsonContactStore(const std::string& path);

    /** @brief Granted when the file exists and can be opened for reading. */
    domain::AuthorizationStatus requestAuthorization() override;

    /** @throws std::runtime_error on unreadable or malformed JSON. */
    void enumerate(const Visitor& visitor) override;

    std::string describe() const override { return "JSON contacts " + m_path; }

private:
    std::string m_path;
};

} // namespace chatstamp::infrastructure
