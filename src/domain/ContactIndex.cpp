/**
 * @file ContactIndex.cpp
 * @brief Implementation of ContactIndex and ContactIndexBuilder.
 */

#include "domain/ContactIndex.hpp"
#include "domain/FilenameTokenizer.hpp"
#include "domain/PhoneVariants.hpp"

namespace chatstamp::domain {

std::optional<std::string> ContactIndex::lookup(const std::string& identifier) const {
    auto it = m_entries.find(identifier);
    if (it == m_entries.end()) return std::nullopt;
    return it->second;
}

void ContactIndexBuilder::add(const ContactRecord& record) {
    ++m_stats.contactsSeen;

    auto name = record.displayName();
    if (!name) {
        ++m_stats.contactsSkipped;
        return;
    }

    for (const auto& phone : record.phoneNumbers) {
        for (const auto& variant : PhoneVariantGenerator::generate(phone)) {
            m_entries[variant] = *name;
            ++m_stats.phoneKeys;
        }
    }

    for (const auto& email : record.emailAddresses) {
        std::string key = FilenameTokenizer::normalizeEmail(email);
        if (key.empty()) continue;
        m_entries[key] = *name;
        ++m_stats.emailKeys;
    }
}

ContactIndex ContactIndexBuilder::build() {
    ContactIndex index(std::move(m_entries));
    m_entries.clear();
    return index;
}

} // namespace chatstamp::domain
