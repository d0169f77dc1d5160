/**
 * @file VCardContactStore.hpp
 * @brief ContactStore backed by a vCard (.vcf) address book export.
 */

#pragma once
#include <string>
#include "domain/ContactStore.hpp"

namespace chatstamp::infrastructure {

/**
 * @class VCardContactStore
 * @brief Reads N, FN, ORG, TEL and EMAIL from BEGIN:VCARD/END:VCARD blocks.
 *
 * Folded lines are joined, property parameters (";TYPE=CELL") and group
 * prefixes ("item1.") are ignored. FN is used as the given name only when
 * the card has no N property.
 */
class VCardContactStore : public domain::ContactStore {
public:
    explicit VCardContactStore(const std::string& path);

    domain::AuthorizationStatus requestAuthorization() override;

    /** @throws std::runtime_error if the file cannot be opened. */
    void enumerate(const Visitor& visitor) override;

    std::string describe() const override { return "vCard contacts " + m_path; }

private:
    std::string m_path;
};

} // namespace chatstamp::infrastructure
