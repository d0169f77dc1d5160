/**
 * @file VCardContactStore.cpp
 * @brief Implementation of VCardContactStore.
 */

#include "infrastructure/VCardContactStore.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <vector>

namespace chatstamp::infrastructure {

namespace {

std::string ToUpper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::toupper(c); });
    return s;
}

/** Splits a structured value on unescaped ';' and resolves \; \, \\ \n. */
std::vector<std::string> SplitComponents(const std::string& value) {
    std::vector<std::string> parts(1);
    for (size_t i = 0; i < value.size(); ++i) {
        char c = value[i];
        if (c == '\\' && i + 1 < value.size()) {
            char next = value[++i];
            parts.back().push_back(next == 'n' || next == 'N' ? ' ' : next);
        } else if (c == ';') {
            parts.emplace_back();
        } else {
            parts.back().push_back(c);
        }
    }
    return parts;
}

std::string Unescape(const std::string& value) {
    auto parts = SplitComponents(value);
    std::string joined = parts.front();
    for (size_t i = 1; i < parts.size(); ++i) joined += ";" + parts[i];
    return joined;
}

/** Physical lines with RFC 6350 folding undone. */
std::vector<std::string> UnfoldLines(std::istream& in) {
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (!line.empty() && (line.front() == ' ' || line.front() == '\t') && !lines.empty()) {
            lines.back() += line.substr(1);
        } else {
            lines.push_back(line);
        }
    }
    return lines;
}

} // namespace

VCardContactStore::VCardContactStore(const std::string& path)
    : m_path(path) {}

domain::AuthorizationStatus VCardContactStore::requestAuthorization() {
    if (!std::filesystem::is_regular_file(m_path)) {
        return domain::AuthorizationStatus::Denied;
    }
    std::ifstream f(m_path);
    return f.is_open() ? domain::AuthorizationStatus::Granted : domain::AuthorizationStatus::Denied;
}

void VCardContactStore::enumerate(const Visitor& visitor) {
    std::ifstream f(m_path);
    if (!f.is_open()) {
        throw std::runtime_error("Cannot open contacts file: " + m_path);
    }

    domain::ContactRecord record;
    std::string formattedName;
    bool inCard = false;
    bool hasStructuredName = false;

    for (const auto& line : UnfoldLines(f)) {
        const auto colon = line.find(':');
        if (colon == std::string::npos) continue;

        std::string property = ToUpper(line.substr(0, colon));
        const std::string value = line.substr(colon + 1);

        const auto semicolon = property.find(';');
        if (semicolon != std::string::npos) property.erase(semicolon);
        const auto dot = property.find('.');
        if (dot != std::string::npos) property.erase(0, dot + 1);

        if (property == "BEGIN" && ToUpper(value) == "VCARD") {
            record = domain::ContactRecord{};
            formattedName.clear();
            hasStructuredName = false;
            inCard = true;
            continue;
        }
        if (!inCard) continue;

        if (property == "END" && ToUpper(value) == "VCARD") {
            if (!hasStructuredName) record.givenName = formattedName;
            visitor(record);
            inCard = false;
        } else if (property == "N") {
            auto parts = SplitComponents(value);
            record.familyName = parts.size() > 0 ? parts[0] : "";
            record.givenName = parts.size() > 1 ? parts[1] : "";
            hasStructuredName = !record.familyName.empty() || !record.givenName.empty();
        } else if (property == "FN") {
            formattedName = Unescape(value);
        } else if (property == "ORG") {
            record.organizationName = SplitComponents(value).front();
        } else if (property == "TEL") {
            std::string number = value;
            if (ToUpper(number.substr(0, 4)) == "TEL:") number.erase(0, 4);
            if (!number.empty()) record.phoneNumbers.push_back(number);
        } else if (property == "EMAIL") {
            if (!value.empty()) record.emailAddresses.push_back(Unescape(value));
        }
    }
}

} // namespace chatstamp::infrastructure
