/**
 * @file FilenameTokenizer.cpp
 * @brief Implementation of FilenameTokenizer.
 */

#include "domain/FilenameTokenizer.hpp"
#include "domain/PhoneVariants.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <sstream>

namespace chatstamp::domain {

std::string FilenameTokenizer::trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t");
    if (first == std::string::npos) return "";
    const auto last = text.find_last_not_of(" \t");
    return text.substr(first, last - first + 1);
}

std::string FilenameTokenizer::normalizeEmail(const std::string& email) {
    std::string lowered = email;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c){ return std::tolower(c); });
    return trim(lowered);
}

std::vector<Identifier> FilenameTokenizer::tokenize(const std::string& filename) {
    std::vector<Identifier> identifiers;
    const std::string stem = std::filesystem::path(filename).stem().string();

    std::stringstream ss(stem);
    std::string part;
    while (std::getline(ss, part, ',')) {
        part = trim(part);

        bool hasDigit = std::any_of(part.begin(), part.end(), [](unsigned char c) { return std::isdigit(c); });
        if (hasDigit) {
            for (auto& variant : PhoneVariantGenerator::generate(part)) {
                identifiers.push_back({std::move(variant), IdentifierKind::Phone});
            }
        } else if (part.find('@') != std::string::npos) {
            identifiers.push_back({normalizeEmail(part), IdentifierKind::Email});
        }
    }
    return identifiers;
}

} // namespace chatstamp::domain
