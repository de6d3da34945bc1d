#include "anonymizer/value_policy.hpp"
#include "anonymizer/pattern_matchers.hpp"
#include "core/utils.hpp"

namespace devscrub {

namespace {

bool contains(std::string_view haystack, std::string_view needle) {
    return haystack.find(needle) != std::string_view::npos;
}

} // anonymous namespace

ValuePolicy::ValuePolicy(ReplacementRules& rules, std::string fake_serial)
    : rules_(rules), fake_serial_(std::move(fake_serial)) {}

RuleKind ValuePolicy::classify(std::string_view key, const Document& value) {
    if (!value.is_string()) return RuleKind::PASSTHROUGH;

    const auto& text = value.get_ref<const std::string&>();
    if (text.empty()) return RuleKind::PASSTHROUGH;

    const std::string lower = utils::to_lower(key);

    if (contains(lower, "version")) return RuleKind::KEEP_VERSION;
    if (contains(lower, "ssid_reference")) return RuleKind::KEEP_SSID_REFERENCE;
    if (contains(lower, "prefix") && contains(text, ":")) return RuleKind::KEEP_IPV6_PREFIX;
    if (lower == "serial_number") return RuleKind::SERIAL_NUMBER;
    if (contains(lower, "password") || contains(lower, "passphrase")) return RuleKind::PASSWORD;
    if (lower == "ssid") return RuleKind::SSID;
    if (lower == "bssid") return RuleKind::BSSID;
    return RuleKind::CONTENT_SCAN;
}

Document ValuePolicy::apply(std::string_view key, const Document& value) {
    const RuleKind kind = classify(key, value);

    switch (kind) {
        case RuleKind::PASSTHROUGH:
        case RuleKind::KEEP_VERSION:
        case RuleKind::KEEP_SSID_REFERENCE:
        case RuleKind::KEEP_IPV6_PREFIX:
            return value;

        case RuleKind::SERIAL_NUMBER:
            return fake_serial_;

        case RuleKind::PASSWORD:
            return rules_.password();

        case RuleKind::SSID:
            return rules_.ssid(value.get_ref<const std::string&>());

        case RuleKind::BSSID:
            return scan_mac_only(value.get_ref<const std::string&>());

        case RuleKind::CONTENT_SCAN:
            return scan_content(value.get_ref<const std::string&>());
    }
    return value;
}

// ============================================================================
// Free-text scanning
// ============================================================================

std::string ValuePolicy::scan_mac_only(std::string_view text) {
    return replace_spans(text, matchers::find_mac_addresses(text),
        [this](std::string_view m) { return rules_.mac(m); });
}

std::string ValuePolicy::scan_content(std::string_view text) {
    // Each pass rescans the previous pass's output
    std::string result = scan_mac_only(text);

    result = replace_spans(result, matchers::find_ipv4_addresses(result),
        [this](std::string_view m) { return rules_.ipv4(m); });

    result = replace_spans(result, matchers::find_ipv6_addresses(result),
        [this](std::string_view m) { return rules_.ipv6(m); });

    return result;
}

} // namespace devscrub
