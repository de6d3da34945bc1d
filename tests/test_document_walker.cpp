#include <catch2/catch_test_macros.hpp>
#include "anonymizer/anonymization_session.hpp"
#include "anonymizer/document_walker.hpp"
#include "mocks/mock_random_source.hpp"

#include <algorithm>
#include <memory>
#include <string>

using namespace devscrub;
using devscrub::testing::ScriptedRandomSource;

namespace {

// Same keys in the same order, same array lengths, same node kinds
bool same_shape(const Document& a, const Document& b) {
    if (a.type() != b.type()) {
        // A rewritten scalar may only change between strings
        return a.is_string() && b.is_string();
    }
    if (a.is_object()) {
        if (a.size() != b.size()) return false;
        auto ia = a.begin();
        auto ib = b.begin();
        for (; ia != a.end(); ++ia, ++ib) {
            if (ia.key() != ib.key()) return false;
            if (!same_shape(ia.value(), ib.value())) return false;
        }
        return true;
    }
    if (a.is_array()) {
        if (a.size() != b.size()) return false;
        for (size_t i = 0; i < a.size(); ++i) {
            if (!same_shape(a[i], b[i])) return false;
        }
    }
    return true;
}

} // anonymous namespace

// ============================================================================
// DocumentWalker
// ============================================================================

TEST_CASE("DocumentWalker: preserves structure and key order", "[document_walker]") {
    const auto doc = document::parse(R"({
        "zeta": {"ssid": "Home", "mac_address": "00:11:22:33:44:55"},
        "alpha": [1, "two", {"ip": "8.8.8.8"}, [true, null]],
        "middle": 3.5,
        "nested": {"a": {"b": {"c": {"d": "192.168.1.50"}}}}
    })");

    AnonymizerOptions options;
    options.seed = 1;
    AnonymizationSession session(options);
    const auto out = session.anonymize(doc);

    CHECK(same_shape(doc, out));
    auto it = out.begin();
    CHECK(it.key() == "zeta");
    ++it;
    CHECK(it.key() == "alpha");
    CHECK(out["alpha"].size() == 4);
    CHECK(out["alpha"][3].size() == 2);
    CHECK(out["middle"] == 3.5);
}

TEST_CASE("DocumentWalker: array elements are content-scanned", "[document_walker]") {
    ScriptedRandomSource random({0xAB, 0xCD, 0xEF, 5, 6, 7});
    ReplacementStore store;
    AnonymizerOptions options;
    ReplacementRules rules(random, store, options);
    ValuePolicy policy(rules, "JW000000000000");
    DocumentWalker walker(policy);

    const auto doc = document::parse(R"({
        "clients": ["00:11:22:33:44:55", "idle"],
        "dns_servers": ["8.8.8.8", 53],
        "ip": "8.8.8.8"
    })");
    const auto out = walker.walk(doc);

    CHECK(out["clients"][0] == "00:11:22:AB:CD:EF");
    CHECK(out["clients"][1] == "idle");
    CHECK(out["dns_servers"][0] == "10.5.6.7");
    CHECK(out["dns_servers"][1] == 53);
    // Keyed and unkeyed occurrences share one replacement
    CHECK(out["ip"] == out["dns_servers"][0]);
}

TEST_CASE("DocumentWalker: root scalar is content-scanned", "[document_walker]") {
    ScriptedRandomSource random({0x01, 0x02, 0x03});
    ReplacementStore store;
    AnonymizerOptions options;
    ReplacementRules rules(random, store, options);
    ValuePolicy policy(rules, "JW000000000000");
    DocumentWalker walker(policy);

    CHECK(walker.walk(Document("00:11:22:33:44:55")) == "00:11:22:01:02:03");
    CHECK(walker.walk(Document(42)) == 42);
    CHECK(walker.walk(Document(nullptr)).is_null());
    CHECK(walker.stats().strings_visited == 1);
    CHECK(walker.stats().strings_changed == 1);
}

TEST_CASE("DocumentWalker: nested arrays of addresses are rewritten", "[document_walker]") {
    AnonymizerOptions options;
    options.seed = 7;
    AnonymizationSession session(options);
    const auto out = session.anonymize(document::parse(
        R"([["2001:db8:aaaa:bbbb:cccc:dddd:eeee:ffff"], "gw 8.8.8.8"])"));

    CHECK(out[0][0] != "2001:db8:aaaa:bbbb:cccc:dddd:eeee:ffff");
    CHECK(out[0][0].get<std::string>().substr(0, 5) == "2001:");
    CHECK(out[1].get<std::string>().find("8.8.8.8") == std::string::npos);
    CHECK(out[1].get<std::string>().substr(0, 6) == "gw 10.");
}

TEST_CASE("DocumentWalker: objects inside arrays are rewritten", "[document_walker]") {
    ScriptedRandomSource random({5, 6, 7});
    ReplacementStore store;
    AnonymizerOptions options;
    ReplacementRules rules(random, store, options);
    ValuePolicy policy(rules, "JW000000000000");
    DocumentWalker walker(policy);

    const auto doc = document::parse(R"({"hosts": [{"ip": "8.8.8.8"}, {"ip": "8.8.8.8"}]})");
    const auto out = walker.walk(doc);
    CHECK(out["hosts"][0]["ip"] == "10.5.6.7");
    CHECK(out["hosts"][1]["ip"] == "10.5.6.7");
}

TEST_CASE("DocumentWalker: counts visited and changed strings", "[document_walker]") {
    ScriptedRandomSource random({5, 6, 7});
    ReplacementStore store;
    AnonymizerOptions options;
    ReplacementRules rules(random, store, options);
    ValuePolicy policy(rules, "JW000000000000");
    DocumentWalker walker(policy);

    const auto doc = document::parse(
        R"({"ip": "8.8.8.8", "version": "1.0", "status": "ok", "count": 4, "list": ["x"]})");
    (void)walker.walk(doc);
    CHECK(walker.stats().strings_visited == 4);
    CHECK(walker.stats().strings_changed == 1);
}

TEST_CASE("DocumentWalker: input document is not modified", "[document_walker]") {
    const auto doc = document::parse(R"({"mac": "00:11:22:33:44:55", "serial_number": "S1"})");
    const Document copy = doc;

    AnonymizerOptions options;
    options.seed = 3;
    AnonymizationSession session(options);
    const auto out = session.anonymize(doc);

    CHECK(doc == copy);
    CHECK(out != doc);
}

// ============================================================================
// AnonymizationSession
// ============================================================================

TEST_CASE("AnonymizationSession: end-to-end SSID, BSSID, MAC and version", "[session]") {
    const auto doc = document::parse(R"({
        "status": {"ssid": "HomeNet-5G", "bssid": "00:11:22:33:44:55"},
        "mac_address": "00:11:22:33:44:55",
        "version": "1.0.3"
    })");

    AnonymizationSession session(AnonymizerOptions{});
    const auto out = session.anonymize(doc);

    const auto& names = default_ssid_placeholders();
    const auto ssid = out["status"]["ssid"].get<std::string>();
    CHECK(std::find(names.begin(), names.end(), ssid) != names.end());

    const auto bssid = out["status"]["bssid"].get<std::string>();
    const auto mac = out["mac_address"].get<std::string>();
    CHECK(bssid == mac);
    CHECK(mac.substr(0, 8) == "00:11:22");
    CHECK(mac.size() == 17);

    CHECK(out["version"] == "1.0.3");
}

TEST_CASE("AnonymizationSession: serial collapses across documents", "[session]") {
    AnonymizerOptions options;
    options.seed = 11;
    AnonymizationSession session(options);

    const auto a = session.anonymize(document::parse(R"({"serial_number": "AAA111"})"));
    const auto b = session.anonymize(document::parse(R"({"serial_number": "BBB222"})"));

    const auto serial = a["serial_number"].get<std::string>();
    CHECK(serial == b["serial_number"].get<std::string>());
    CHECK(serial == session.fake_serial());
    CHECK(serial.size() == 14);
    CHECK(serial.substr(0, 2) == "JW");
    CHECK(std::all_of(serial.begin() + 2, serial.end(), [](char c) { return c >= '0' && c <= '9'; }));
}

TEST_CASE("AnonymizationSession: identical values anonymize identically", "[session]") {
    AnonymizationSession session(AnonymizerOptions{});
    const auto out = session.anonymize(document::parse(R"({
        "wan": {"gateway": "8.8.4.4", "dns": "2001:db8:aaaa:bbbb:cccc:dddd:eeee:ffff"},
        "lan": {"upstream": "8.8.4.4", "dns6": "2001:db8:aaaa:bbbb:cccc:dddd:eeee:ffff"}
    })"));
    CHECK(out["wan"]["gateway"] == out["lan"]["upstream"]);
    CHECK(out["wan"]["dns"] == out["lan"]["dns6"]);
    CHECK(out["wan"]["gateway"] != "8.8.4.4");
}

TEST_CASE("AnonymizationSession: passwords are never memoized", "[session]") {
    AnonymizerOptions options;
    options.seed = 5;
    AnonymizationSession session(options);
    const auto out = session.anonymize(document::parse(
        R"({"password": "hunter2", "admin": {"password": "hunter2"}})"));
    CHECK(out["password"] != out["admin"]["password"]);
    CHECK(out["password"].get<std::string>().size() == 12);
    CHECK(session.store().size() == 0);
}

TEST_CASE("AnonymizationSession: sessions are independent unless sharing a store", "[session]") {
    const auto doc = document::parse(R"({"ip": "8.8.8.8"})");

    auto shared = std::make_shared<ReplacementStore>();
    AnonymizationSession first(AnonymizerOptions{}, shared,
                               std::make_unique<ScriptedRandomSource>(std::vector<uint32_t>{0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 5, 6, 7}));
    AnonymizationSession second(AnonymizerOptions{}, shared,
                                std::make_unique<ScriptedRandomSource>(std::vector<uint32_t>{0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 9, 9, 9}));
    AnonymizationSession isolated(AnonymizerOptions{}, nullptr,
                                  std::make_unique<ScriptedRandomSource>(std::vector<uint32_t>{0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 9, 9, 9}));

    CHECK(first.anonymize(doc)["ip"] == "10.5.6.7");
    CHECK(second.anonymize(doc)["ip"] == "10.5.6.7");
    CHECK(isolated.anonymize(doc)["ip"] == "10.9.9.9");
}

TEST_CASE("AnonymizationSession: same seed gives the same output", "[session]") {
    const auto doc = document::parse(R"({
        "ssid": "Home", "password": "x", "serial_number": "S",
        "hosts": [{"mac": "00:11:22:33:44:55", "ip": "8.8.8.8"}]
    })");

    AnonymizerOptions options;
    options.seed = 1234;
    AnonymizationSession a(options);
    AnonymizationSession b(options);
    CHECK(a.anonymize(doc) == b.anonymize(doc));
}

TEST_CASE("AnonymizationSession: stats accumulate across documents", "[session]") {
    AnonymizerOptions options;
    options.seed = 9;
    AnonymizationSession session(options);
    (void)session.anonymize(document::parse(R"({"ip": "8.8.8.8"})"));
    (void)session.anonymize(document::parse(R"({"ip": "8.8.8.8", "note": "hi"})"));
    CHECK(session.stats().strings_visited == 3);
    CHECK(session.stats().strings_changed == 2);
    CHECK(session.store().size() == 1);
}
