/**
 * @file ContactStoreFactory.cpp
 * @brief Implementation of ContactStoreFactory.
 */

#include "infrastructure/ContactStoreFactory.hpp"
#include "infrastructure/JsonContactStore.hpp"
#include "infrastructure/VCardContactStore.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>

namespace chatstamp::infrastructure {

std::shared_ptr<domain::ContactStore> ContactStoreFactory::Create(const std::optional<std::string>& path) {
    if (!path || path->empty()) {
        return nullptr;
    }

    std::string ext = std::filesystem::path(*path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c){ return std::tolower(c); });

    if (ext == ".vcf" || ext == ".vcard") {
        return std::make_shared<VCardContactStore>(*path);
    }
    return std::make_shared<JsonContactStore>(*path);
}

} // namespace chatstamp::infrastructure
