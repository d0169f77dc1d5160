/**
 * @file ContactStore.hpp
 * @brief Interface to the address book the contact names come from.
 */

#pragma once

#include <functional>
#include "domain/ContactRecord.hpp"

namespace chatstamp::domain {

enum class AuthorizationStatus {
    Granted,
    Denied
};

/**
 * @class ContactStore
 * @brief Abstract read-only contact source.
 */
class ContactStore {
public:
    virtual ~ContactStore() = default;

    using Visitor = std::function<void(const ContactRecord&)>;

    /**
     * @brief Asks for read access. Blocks until the store answers.
     */
    virtual AuthorizationStatus requestAuthorization() = 0;

    /**
     * @brief Invokes the visitor once per record, in store order.
     * @throws std::runtime_error if the store cannot be read.
     */
    virtual void enumerate(const Visitor& visitor) = 0;

    /** @brief Human readable description, used in log lines. */
    virtual std::string describe() const = 0;
};

} // namespace chatstamp::domain
