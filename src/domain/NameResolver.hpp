/**
 * @file NameResolver.hpp
 * @brief Matches filename identifiers against the contact index.
 */

#pragma once
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "domain/ContactIndex.hpp"
#include "domain/Identifier.hpp"

namespace chatstamp::domain {

class NameResolver {
public:
    /** @brief Called once per identifier with the hit, or std::nullopt on a miss. */
    using MatchObserver = std::function<void(const Identifier&, const std::optional<std::string>&)>;

    /**
     * @brief Resolves identifiers to display names.
     * @return Names in first-matched order, without duplicates. Empty means "no rename".
     */
    static std::vector<std::string> resolve(const std::vector<Identifier>& identifiers,
                                            const ContactIndex& index,
                                            const MatchObserver& observer = nullptr);
};

} // namespace chatstamp::domain
