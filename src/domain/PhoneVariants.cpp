/**
 * @file PhoneVariants.cpp
 * @brief Implementation of PhoneVariantGenerator.
 */

#include "domain/PhoneVariants.hpp"
#include <algorithm>
#include <cctype>

namespace chatstamp::domain {

namespace {

bool AllDigits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
}

bool StartsWith(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

std::string PhoneVariantGenerator::clean(const std::string& raw) {
    std::string cleaned;
    cleaned.reserve(raw.size());
    for (unsigned char c : raw) {
        if (std::isdigit(c)) {
            cleaned.push_back(static_cast<char>(c));
        } else if (c == '+' && cleaned.empty()) {
            cleaned.push_back('+');
        }
    }
    return cleaned;
}

std::vector<std::string> PhoneVariantGenerator::generate(const std::string& raw) {
    const std::string cleaned = clean(raw);
    std::vector<std::string> variants;

    if (cleaned.size() == 12 && StartsWith(cleaned, "+1")) {
        const std::string national = cleaned.substr(2);
        variants = {cleaned, national, "1" + national};
    } else if (cleaned.size() == 11 && StartsWith(cleaned, "1")) {
        variants = {"+" + cleaned, cleaned, cleaned.substr(1)};
    } else if (cleaned.size() == 10 && AllDigits(cleaned)) {
        variants = {"+1" + cleaned, "1" + cleaned, cleaned};
    } else if (StartsWith(cleaned, "+")) {
        variants = {cleaned};
    }

    if (std::find(variants.begin(), variants.end(), raw) == variants.end()) {
        variants.push_back(raw);
    }

    variants.erase(std::remove_if(variants.begin(), variants.end(),
                                  [](const std::string& v) { return v.empty(); }),
                   variants.end());
    return variants;
}

} // namespace chatstamp::domain
