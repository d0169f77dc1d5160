#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "application/ContactIndexService.hpp"
#include "domain/ContactIndex.hpp"
#include "domain/FilenameTokenizer.hpp"
#include "domain/NameResolver.hpp"
#include "infrastructure/ContactStoreFactory.hpp"
#include "infrastructure/JsonContactStore.hpp"
#include "infrastructure/VCardContactStore.hpp"

using namespace chatstamp::domain;
using namespace chatstamp::infrastructure;
using chatstamp::application::ContactIndexService;

namespace fs = std::filesystem;

namespace {

void WriteFile(const fs::path& path, const std::string& content) {
    std::ofstream out(path);
    out << content;
}

ContactRecord Person(const std::string& given, const std::string& family,
                     std::vector<std::string> phones, std::vector<std::string> emails = {}) {
    ContactRecord record;
    record.givenName = given;
    record.familyName = family;
    record.phoneNumbers = std::move(phones);
    record.emailAddresses = std::move(emails);
    return record;
}

void TestBuilder() {
    ContactIndexBuilder builder;
    builder.add(Person("Alice", "Smith", {"(415) 555-1234"}, {"Alice@Example.com"}));

    ContactRecord company;
    company.organizationName = "Acme Dental";
    company.phoneNumbers = {"+44 20 7946 0958"};
    builder.add(company);

    ContactRecord nameless;
    nameless.phoneNumbers = {"2125550000"};
    builder.add(nameless);

    // Later registration wins for a shared key.
    builder.add(Person("", "Jones", {"+1 415 555 1234"}));

    assert(builder.stats().contactsSeen == 4);
    assert(builder.stats().contactsSkipped == 1);
    assert(builder.stats().emailKeys == 1);

    ContactIndex index = builder.build();
    assert(index.lookup("4155551234") == std::optional<std::string>("Jones"));
    assert(index.lookup("+14155551234") == std::optional<std::string>("Jones"));
    assert(index.lookup("(415) 555-1234") == std::optional<std::string>("Alice Smith"));
    assert(index.lookup("alice@example.com") == std::optional<std::string>("Alice Smith"));
    assert(!index.lookup("Alice@Example.com"));
    assert(index.lookup("+442079460958") == std::optional<std::string>("Acme Dental"));
    assert(!index.lookup("2125550000"));
}

void TestResolver() {
    ContactIndexBuilder builder;
    builder.add(Person("Alice", "", {"4155551234"}));
    builder.add(Person("Bob", "", {}, {"bob@example.com"}));
    const ContactIndex index = builder.build();

    auto ids = FilenameTokenizer::tokenize("4155551234, Bob@Example.com, +14155551234, 9998887777.txt");

    int hits = 0;
    int misses = 0;
    auto names = NameResolver::resolve(ids, index, [&](const Identifier&, const std::optional<std::string>& name) {
        if (name) ++hits; else ++misses;
    });

    assert((names == std::vector<std::string>{"Alice", "Bob"}));
    assert(hits == 7);   // 3 + 1 + 3
    assert(misses == 3); // the unknown number's variants
    assert(NameResolver::resolve({}, index).empty());
    assert(NameResolver::resolve(FilenameTokenizer::tokenize("5550001111.txt"), index).empty());
}

void TestJsonStore(const fs::path& root) {
    const fs::path file = root / "contacts.json";
    WriteFile(file, R"([
        {"given_name": "Alice", "family_name": "Smith", "phones": ["+1 (415) 555-1234"], "emails": ["ALICE@example.com"]},
        {"organization": "Acme", "phones": "2125550000"},
        {"phones": ["3125550000"]}
    ])");

    JsonContactStore store(file.string());
    assert(store.requestAuthorization() == AuthorizationStatus::Granted);

    ContactIndexService service(std::make_shared<JsonContactStore>(file.string()), false);
    auto index = service.load();
    assert(service.stats().contactsSeen == 3);
    assert(service.stats().contactsSkipped == 1);
    assert(index.lookup("4155551234") == std::optional<std::string>("Alice Smith"));
    assert(index.lookup("alice@example.com") == std::optional<std::string>("Alice Smith"));
    assert(index.lookup("+12125550000") == std::optional<std::string>("Acme"));

    // Object form with a "contacts" array.
    const fs::path wrapped = root / "wrapped.json";
    WriteFile(wrapped, R"({"contacts": [{"given_name": "Bob", "emails": ["bob@example.com"]}]})");
    auto wrappedIndex = ContactIndexService(std::make_shared<JsonContactStore>(wrapped.string()), false).load();
    assert(wrappedIndex.lookup("bob@example.com") == std::optional<std::string>("Bob"));

    // Malformed content degrades to an empty index.
    const fs::path broken = root / "broken.json";
    WriteFile(broken, "{ not json");
    assert(ContactIndexService(std::make_shared<JsonContactStore>(broken.string()), false).load().empty());

    // Missing file: access denied, empty index.
    JsonContactStore missing((root / "missing.json").string());
    assert(missing.requestAuthorization() == AuthorizationStatus::Denied);
    assert(ContactIndexService(std::make_shared<JsonContactStore>((root / "missing.json").string()), false).load().empty());

    // No store configured at all.
    assert(ContactIndexService(nullptr, false).load().empty());
}

void TestVCardStore(const fs::path& root) {
    const fs::path file = root / "contacts.vcf";
    WriteFile(file,
              "BEGIN:VCARD\r\n"
              "VERSION:3.0\r\n"
              "N:Smith;Alice;;;\r\n"
              "FN:Alice Smith\r\n"
              "item1.TEL;TYPE=CELL:+1 (415) 555-\r\n"
              " 1234\r\n"
              "EMAIL;TYPE=INTERNET:Alice@Example.com\r\n"
              "END:VCARD\r\n"
              "BEGIN:VCARD\r\n"
              "VERSION:4.0\r\n"
              "FN:Dr. Who\r\n"
              "TEL;VALUE=uri:tel:+442079460958\r\n"
              "END:VCARD\r\n"
              "BEGIN:VCARD\r\n"
              "ORG:Acme\\, Inc.;Sales\r\n"
              "TEL:2125550000\r\n"
              "END:VCARD\r\n");

    auto store = ContactStoreFactory::Create(file.string());
    assert(store != nullptr);
    assert(store->requestAuthorization() == AuthorizationStatus::Granted);

    std::vector<ContactRecord> records;
    store->enumerate([&records](const ContactRecord& r) { records.push_back(r); });
    assert(records.size() == 3);
    assert(records[0].givenName == "Alice");
    assert(records[0].familyName == "Smith");
    assert(records[0].phoneNumbers.size() == 1);
    assert(records[0].phoneNumbers[0] == "+1 (415) 555-1234");
    assert(records[1].displayName() == std::optional<std::string>("Dr. Who"));
    assert(records[1].phoneNumbers[0] == "+442079460958");
    assert(records[2].displayName() == std::optional<std::string>("Acme, Inc."));

    auto index = ContactIndexService(store, false).load();
    assert(index.lookup("14155551234") == std::optional<std::string>("Alice Smith"));
    assert(index.lookup("alice@example.com") == std::optional<std::string>("Alice Smith"));
    assert(index.lookup("+442079460958") == std::optional<std::string>("Dr. Who"));
    assert(index.lookup("2125550000") == std::optional<std::string>("Acme, Inc."));

    assert(ContactStoreFactory::Create(std::nullopt) == nullptr);
    assert(ContactStoreFactory::Create(std::string("")) == nullptr);
}

} // namespace

int main() {
    std::cout << "[Test] Starting ContactIndex Test..." << std::endl;

    const fs::path root = fs::temp_directory_path() / "chatstamp_contact_index_test";
    fs::remove_all(root);
    fs::create_directories(root);

    TestBuilder();
    TestResolver();
    TestJsonStore(root);
    TestVCardStore(root);

    fs::remove_all(root);
    std::cout << "[PASS] ContactIndex Test." << std::endl;
    return 0;
}
