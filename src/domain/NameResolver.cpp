/**
 * @file NameResolver.cpp
 * @brief Implementation of NameResolver.
 */

#include "domain/NameResolver.hpp"
#include <algorithm>

namespace chatstamp::domain {

std::vector<std::string> NameResolver::resolve(const std::vector<Identifier>& identifiers,
                                               const ContactIndex& index,
                                               const MatchObserver& observer) {
    std::vector<std::string> matchedNames;
    for (const auto& identifier : identifiers) {
        auto name = index.lookup(identifier.value);
        if (observer) observer(identifier, name);
        if (!name) continue;

        if (std::find(matchedNames.begin(), matchedNames.end(), *name) == matchedNames.end()) {
            matchedNames.push_back(*name);
        }
    }
    return matchedNames;
}

} // namespace chatstamp::domain
