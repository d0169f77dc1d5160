#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "domain/PhoneVariants.hpp"

using chatstamp::domain::PhoneVariantGenerator;
using Variants = std::vector<std::string>;

int main() {
    std::cout << "[Test] Starting PhoneVariantGenerator Test..." << std::endl;

    // Ten bare digits.
    assert((PhoneVariantGenerator::generate("4155551234") == Variants{"+14155551234", "14155551234", "4155551234"}));
    assert((PhoneVariantGenerator::generate("2125550000") == Variants{"+12125550000", "12125550000", "2125550000"}));

    // +1 and eleven digits.
    assert((PhoneVariantGenerator::generate("+14155551234") == Variants{"+14155551234", "4155551234", "14155551234"}));
    assert((PhoneVariantGenerator::generate("14155551234") == Variants{"+14155551234", "14155551234", "4155551234"}));

    // Punctuated input keeps the original as the last variant.
    assert((PhoneVariantGenerator::generate("(415) 555-1234") ==
            Variants{"+14155551234", "14155551234", "4155551234", "(415) 555-1234"}));
    assert((PhoneVariantGenerator::generate("+1 415-555-1234") ==
            Variants{"+14155551234", "4155551234", "14155551234", "+1 415-555-1234"}));

    // International numbers stay as they are.
    assert((PhoneVariantGenerator::generate("+442079460958") == Variants{"+442079460958"}));
    assert((PhoneVariantGenerator::generate("+44 20 7946 0958") == Variants{"+442079460958", "+44 20 7946 0958"}));

    // Nothing recognisable: only the untouched input survives.
    assert((PhoneVariantGenerator::generate("12345") == Variants{"12345"}));
    assert((PhoneVariantGenerator::generate("Alice (1)") == Variants{"Alice (1)"}));
    assert(PhoneVariantGenerator::generate("").empty());

    // Only a '+' ahead of the digits is kept.
    assert(PhoneVariantGenerator::clean("+1 (415) 555-1234") == "+14155551234");
    assert(PhoneVariantGenerator::clean("415+555+1234") == "4155551234");

    // Deterministic.
    assert(PhoneVariantGenerator::generate("(415) 555-1234") == PhoneVariantGenerator::generate("(415) 555-1234"));

    std::cout << "[PASS] PhoneVariantGenerator Test." << std::endl;
    return 0;
}
