/**
 * @file JsonContactStore.cpp
 * @brief Implementation of JsonContactStore.
 */

#include "infrastructure/JsonContactStore.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace chatstamp::infrastructure {

namespace {

std::vector<std::string> StringList(const nlohmann::json& record, const char* key) {
    std::vector<std::string> values;
    if (!record.contains(key)) return values;

    const auto& node = record.at(key);
    if (node.is_string()) {
        values.push_back(node.get<std::string>());
    } else if (node.is_array()) {
        for (const auto& item : node) {
            if (item.is_string()) values.push_back(item.get<std::string>());
        }
    }
    return values;
}

} // namespace

JsonContactStore::JsonContactStore(const std::string& path)
    : m_path(path) {}

domain::AuthorizationStatus JsonContactStore::requestAuthorization() {
    if (!std::filesystem::is_regular_file(m_path)) {
        return domain::AuthorizationStatus::Denied;
    }
    std::ifstream f(m_path);
    return f.is_open() ? domain::AuthorizationStatus::Granted : domain::AuthorizationStatus::Denied;
}

void JsonContactStore::enumerate(const Visitor& visitor) {
    std::ifstream f(m_path);
    if (!f.is_open()) {
        throw std::runtime_error("Cannot open contacts file: " + m_path);
    }

    nlohmann::json j;
    try {
        f >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Malformed contacts file " + m_path + ": " + e.what());
    }

    const nlohmann::json* records = &j;
    if (j.is_object() && j.contains("contacts")) {
        records = &j.at("contacts");
    }
    if (!records->is_array()) {
        throw std::runtime_error("Contacts file " + m_path + " does not hold a list of contacts");
    }

    for (const auto& item : *records) {
        if (!item.is_object()) continue;

        domain::ContactRecord record;
        record.givenName = item.value("given_name", "");
        record.familyName = item.value("family_name", "");
        record.organizationName = item.value("organization", "");
        record.phoneNumbers = StringList(item, "phones");
        record.emailAddresses = StringList(item, "emails");
        visitor(record);
    }
}

} // namespace chatstamp::infrastructure
