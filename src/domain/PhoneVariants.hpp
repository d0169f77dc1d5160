/**
 * @file PhoneVariants.hpp
 * @brief Expansion of a phone number into the textual forms it may appear as.
 */

#pragma once
#include <string>
#include <vector>

namespace chatstamp::domain {

/**
 * @class PhoneVariantGenerator
 * @brief Pure function object producing the ordered VariantSet of a phone string.
 *
 * North American numbers expand to the +1, 1 and bare ten-digit forms.
 * Other numbers with a leading '+' are kept as-is. The untouched input is
 * appended when it differs from every generated form.
 */
class PhoneVariantGenerator {
public:
    static std::vector<std::string> generate(const std::string& raw);

    /**
     * @brief Keeps digits plus a '+' that precedes every digit.
     * @return "+14155551234" for "+1 (415) 555-1234".
     */
    static std::string clean(const std::string& raw);
};

} // namespace chatstamp::domain
