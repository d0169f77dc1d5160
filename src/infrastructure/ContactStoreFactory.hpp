#pragma once

#include <memory>
#include <optional>
#include <string>
#include "domain/ContactStore.hpp"

namespace chatstamp::infrastructure {

class ContactStoreFactory {
public:
    /**
     * @brief Picks the store by extension: .vcf/.vcard read as vCard, anything else as JSON.
     * @return nullptr when no path is configured.
     */
    static std::shared_ptr<domain::ContactStore> Create(const std::optional<std::string>& path);
};

} // namespace chatstamp::infrastructure
