#include <algorithm>
#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "domain/FilenameTokenizer.hpp"

using namespace chatstamp::domain;

namespace {

std::vector<std::string> ValuesOfKind(const std::vector<Identifier>& ids, IdentifierKind kind) {
    std::vector<std::string> values;
    for (const auto& id : ids) {
        if (id.kind == kind) values.push_back(id.value);
    }
    return values;
}

} // namespace

int main() {
    std::cout << "[Test] Starting FilenameTokenizer Test..." << std::endl;

    auto ids = FilenameTokenizer::tokenize("John, +14155551234, jane@x.com.txt");
    auto phones = ValuesOfKind(ids, IdentifierKind::Phone);
    auto emails = ValuesOfKind(ids, IdentifierKind::Email);
    assert((emails == std::vector<std::string>{"jane@x.com"}));
    assert((phones == std::vector<std::string>{"+14155551234", "4155551234", "14155551234"}));
    // Source order: phone part first, then the email part.
    assert(ids.size() == 4);
    assert(ids.back().kind == IdentifierKind::Email);

    // Emails are lowercased and trimmed.
    ids = FilenameTokenizer::tokenize("  Jane@Example.COM .html");
    assert(ids.size() == 1);
    assert(ids[0].value == "jane@example.com");
    assert(ids[0].kind == IdentifierKind::Email);

    // A part containing a digit is a phone even if it also has '@'.
    ids = FilenameTokenizer::tokenize("user2@example.com.txt");
    assert(!ids.empty());
    assert(ids[0].kind == IdentifierKind::Phone);

    // Plain names carry no identifiers.
    assert(FilenameTokenizer::tokenize("Alice Smith.txt").empty());
    assert(FilenameTokenizer::tokenize("Alice, Bob.html").empty());

    // Group chats keep duplicates in source order.
    ids = FilenameTokenizer::tokenize("4155551234, 4155551234.txt");
    assert(ids.size() == 6);
    assert(ids[0].value == ids[3].value);

    assert(FilenameTokenizer::trim(" \t a b \t") == "a b");
    assert(FilenameTokenizer::normalizeEmail(" X@Y.Z ") == "x@y.z");

    std::cout << "[PASS] FilenameTokenizer Test." << std::endl;
    return 0;
}
