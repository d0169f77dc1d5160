/**
 * @file ContactIndexService.hpp
 * @brief Builds the ContactIndex from a contact store, once per run.
 */

#pragma once
#include <memory>
#include "domain/ContactIndex.hpp"
#include "domain/ContactStore.hpp"

namespace chatstamp::application {

/**
 * @class ContactIndexService
 * @brief Authorization, enumeration and index construction.
 *
 * Denied access, a missing store or an enumeration failure never abort the
 * run: the result is an empty (or partial) index and renaming degrades.
 */
class ContactIndexService {
public:
    ContactIndexService(std::shared_ptr<domain::ContactStore> store, bool verbose);

    domain::ContactIndex load();

    /** @brief Counters from the most recent load(). */
    const domain::ContactIndexBuilder::Stats& stats() const { return m_stats; }

private:
    std::shared_ptr<domain::ContactStore> m_store;
    bool m_verbose;
    domain::ContactIndexBuilder::Stats m_stats;

    void logSample(const domain::ContactIndex& index) const;
};

} // namespace chatstamp::application
