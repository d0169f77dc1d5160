/**
 * @file ContactIndexService.cpp
 * @brief Implementation of ContactIndexService.
 */

#include "application/ContactIndexService.hpp"
#include <iostream>
#include <stdexcept>

namespace chatstamp::application {

ContactIndexService::ContactIndexService(std::shared_ptr<domain::ContactStore> store, bool verbose)
    : m_store(std::move(store)), m_verbose(verbose) {}

domain::ContactIndex ContactIndexService::load() {
    m_stats = {};

    if (!m_store) {
        std::cerr << "[Contacts] No contact store configured (use --contacts FILE)." << std::endl;
        return {};
    }

    if (m_store->requestAuthorization() != domain::AuthorizationStatus::Granted) {
        std::cerr << "[Contacts] Access to " << m_store->describe() << " not authorized." << std::endl;
        return {};
    }

    domain::ContactIndexBuilder builder;
    try {
        m_store->enumerate([&builder](const domain::ContactRecord& record) {
            builder.add(record);
        });
    } catch (const std::exception& e) {
        std::cerr << "[Contacts] Error fetching contacts: " << e.what() << std::endl;
    }

    m_stats = builder.stats();
    domain::ContactIndex index = builder.build();

    if (m_verbose) {
        std::cout << "[Contacts] Loaded " << m_stats.contactsSeen << " contacts" << std::endl;
        std::cout << "[Contacts] Mapped " << m_stats.phoneKeys << " phone numbers" << std::endl;
        std::cout << "[Contacts] Mapped " << m_stats.emailKeys << " email addresses" << std::endl;
        std::cout << "[Contacts] Total contact identifiers: " << index.size() << std::endl;
        logSample(index);
    }
    return index;
}

void ContactIndexService::logSample(const domain::ContactIndex& index) const {
    if (index.empty()) return;

    std::cout << "[Contacts] Sample contacts loaded:" << std::endl;
    int shown = 0;
    for (const auto& [identifier, name] : index.entries()) {
        if (shown == 5) break;
        std::cout << "  " << identifier << " -> " << name << std::endl;
        ++shown;
    }
    if (index.size() > 5) {
        std::cout << "  ... and " << (index.size() - 5) << " more" << std::endl;
    }
}

} // namespace chatstamp::application
