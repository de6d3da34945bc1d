#include <catch2/catch_test_macros.hpp>
#include "anonymizer/pattern_matchers.hpp"

using namespace devscrub;

// ============================================================================
// MAC scanner
// ============================================================================

TEST_CASE("Matchers: MAC with colon delimiter", "[matchers]") {
    const auto spans = matchers::find_mac_addresses("00:11:22:33:44:55");
    REQUIRE(spans.size() == 1);
    CHECK(spans[0].start == 0);
    CHECK(spans[0].end == 17);
    CHECK(spans[0].text == "00:11:22:33:44:55");
}

TEST_CASE("Matchers: MAC with dash delimiter and mixed case", "[matchers]") {
    const auto spans = matchers::find_mac_addresses("wan aA-bB-cC-dD-eE-fF up");
    REQUIRE(spans.size() == 1);
    CHECK(spans[0].start == 4);
    CHECK(spans[0].text == "aA-bB-cC-dD-eE-fF");
}

TEST_CASE("Matchers: MAC delimiter must be consistent", "[matchers]") {
    CHECK(matchers::find_mac_addresses("00:11-22:33:44:55").empty());
    CHECK(matchers::find_mac_addresses("00-11-22-33-44:55").empty());
}

TEST_CASE("Matchers: MAC rejects non-hex and short groups", "[matchers]") {
    CHECK(matchers::find_mac_addresses("00:11:22:33:44:5G").empty());
    CHECK(matchers::find_mac_addresses("0:11:22:33:44:55").empty());
    CHECK(matchers::find_mac_addresses("00:11:22:33:44").empty());
}

TEST_CASE("Matchers: MAC respects word boundaries", "[matchers]") {
    CHECK(matchers::find_mac_addresses("x00:11:22:33:44:55").empty());
    CHECK(matchers::find_mac_addresses("00:11:22:33:44:55x").empty());
    CHECK(matchers::find_mac_addresses("00:11:22:33:44:556").empty());
    CHECK(matchers::find_mac_addresses("(00:11:22:33:44:55)").size() == 1);
}

TEST_CASE("Matchers: multiple MACs in one string", "[matchers]") {
    const auto spans = matchers::find_mac_addresses(
        "a=00:11:22:33:44:55, b=66-77-88-99-AA-BB");
    REQUIRE(spans.size() == 2);
    CHECK(spans[0].text == "00:11:22:33:44:55");
    CHECK(spans[1].text == "66-77-88-99-AA-BB");
    CHECK(spans[0].end <= spans[1].start);
}

// ============================================================================
// IPv4 scanner
// ============================================================================

TEST_CASE("Matchers: IPv4 in free text", "[matchers]") {
    const auto spans = matchers::find_ipv4_addresses("gateway 192.168.0.1 via 8.8.8.8");
    REQUIRE(spans.size() == 2);
    CHECK(spans[0].text == "192.168.0.1");
    CHECK(spans[0].start == 8);
    CHECK(spans[1].text == "8.8.8.8");
}

TEST_CASE("Matchers: IPv4 scanner is syntactic only", "[matchers]") {
    // Out-of-range octets still match; the rule rejects them later
    const auto spans = matchers::find_ipv4_addresses("999.1.1.1");
    REQUIRE(spans.size() == 1);
    CHECK(spans[0].text == "999.1.1.1");
}

TEST_CASE("Matchers: IPv4 rejects long runs and missing octets", "[matchers]") {
    CHECK(matchers::find_ipv4_addresses("1234.1.1.1").empty());
    CHECK(matchers::find_ipv4_addresses("1.2.3").empty());
    CHECK(matchers::find_ipv4_addresses("v1.2.3.4").empty());
    CHECK(matchers::find_ipv4_addresses("1.2.3.4a").empty());
}

TEST_CASE("Matchers: version-like dotted text matches IPv4 shape", "[matchers]") {
    const auto spans = matchers::find_ipv4_addresses("fw 1.0.3.12 build");
    REQUIRE(spans.size() == 1);
    CHECK(spans[0].text == "1.0.3.12");
}

// ============================================================================
// IPv6 scanner
// ============================================================================

TEST_CASE("Matchers: full eight-group IPv6", "[matchers]") {
    const auto spans = matchers::find_ipv6_addresses(
        "addr 2001:0db8:0000:0001:0000:0000:0000:0001 end");
    REQUIRE(spans.size() == 1);
    CHECK(spans[0].text == "2001:0db8:0000:0001:0000:0000:0000:0001");
}

TEST_CASE("Matchers: IPv6 scanner takes the longest run", "[matchers]") {
    const auto spans = matchers::find_ipv6_addresses("fe80:1:2:3:4:5:6:7");
    REQUIRE(spans.size() == 1);
    CHECK(spans[0].text == "fe80:1:2:3:4:5:6:7");
}

TEST_CASE("Matchers: IPv6 stops at eight groups", "[matchers]") {
    // The trailing ":9" is a lone group and cannot start a new match
    const auto spans = matchers::find_ipv6_addresses("1:2:3:4:5:6:7:8:9");
    REQUIRE(spans.size() == 1);
    CHECK(spans[0].text == "1:2:3:4:5:6:7:8");
}

TEST_CASE("Matchers: IPv6 shrinks to the last group on a word boundary", "[matchers]") {
    const auto spans = matchers::find_ipv6_addresses("ab:cd:efgh");
    REQUIRE(spans.size() == 1);
    CHECK(spans[0].text == "ab:cd");
}

TEST_CASE("Matchers: single hex group is not an IPv6 candidate", "[matchers]") {
    CHECK(matchers::find_ipv6_addresses("deadbeef").empty());
    CHECK(matchers::find_ipv6_addresses("cafe").empty());
}

// ============================================================================
// replace_spans
// ============================================================================

TEST_CASE("Matchers: replace_spans rewrites each span in place", "[matchers]") {
    const std::string text = "a 1.1.1.1 b 2.2.2.2 c";
    const auto spans = matchers::find_ipv4_addresses(text);
    const auto out = replace_spans(text, spans, [](std::string_view m) {
        return "<" + std::string(m) + ">";
    });
    CHECK(out == "a <1.1.1.1> b <2.2.2.2> c");
}

TEST_CASE("Matchers: replace_spans continues past unchanged matches", "[matchers]") {
    const std::string text = "127.0.0.1 and 8.8.8.8";
    const auto spans = matchers::find_ipv4_addresses(text);
    int calls = 0;
    const auto out = replace_spans(text, spans, [&](std::string_view m) {
        ++calls;
        return m == "8.8.8.8" ? std::string("X") : std::string(m);
    });
    CHECK(calls == 2);
    CHECK(out == "127.0.0.1 and X");
}

TEST_CASE("Matchers: replace_spans with no spans is identity", "[matchers]") {
    const std::string text = "nothing to see";
    CHECK(replace_spans(text, {}, [](std::string_view) { return std::string("!"); }) == text);
}
