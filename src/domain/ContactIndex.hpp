/**
 * @file ContactIndex.hpp
 * @brief Read-only mapping from identifier to contact display name.
 */

#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <unordered_map>
#include "domain/ContactRecord.hpp"

namespace chatstamp::domain {

/**
 * @class ContactIndex
 * @brief Immutable once built. Construct through ContactIndexBuilder.
 */
class ContactIndex {
public:
    using Map = std::unordered_map<std::string, std::string>;

    ContactIndex() = default;
    explicit ContactIndex(Map entries) : m_entries(std::move(entries)) {}

    std::optional<std::string> lookup(const std::string& identifier) const;

    bool empty() const { return m_entries.empty(); }
    std::size_t size() const { return m_entries.size(); }
    const Map& entries() const { return m_entries; }

private:
    Map m_entries;
};

/**
 * @class ContactIndexBuilder
 * @brief Accumulates contact records; later keys overwrite earlier ones.
 */
class ContactIndexBuilder {
public:
    struct Stats {
        int contactsSeen = 0;    ///< Every record offered, named or not.
        int contactsSkipped = 0; ///< Records without any usable name.
        int phoneKeys = 0;       ///< Phone variant registrations (with repeats).
        int emailKeys = 0;       ///< Email registrations (with repeats).
    };

    /** @brief Registers every phone variant and lowercased email of the record. */
    void add(const ContactRecord& record);

    /** @brief Hands the accumulated map to an immutable ContactIndex. */
    ContactIndex build();

    const Stats& stats() const { return m_stats; }

private:
    ContactIndex::Map m_entries;
    Stats m_stats;
};

} // namespace chatstamp::domain
