#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <cstdint>
#include <cstddef>

namespace devscrub {

// ============================================================================
// Value Policy Rules
// ============================================================================

/**
 * @brief Rule chosen for one (key, value) pair, in precedence order
 */
enum class RuleKind {
    PASSTHROUGH,        // non-string or empty value
    KEEP_VERSION,       // key contains "version"
    KEEP_SSID_REFERENCE,// key contains "ssid_reference"
    KEEP_IPV6_PREFIX,   // key contains "prefix" and value contains ':'
    SERIAL_NUMBER,      // key == "serial_number"
    PASSWORD,           // key contains "password" or "passphrase"
    SSID,               // key == "ssid"
    BSSID,              // key == "bssid"
    CONTENT_SCAN        // MAC -> IPv4 -> IPv6 scan over the text
};

[[nodiscard]] inline constexpr std::string_view rule_kind_name(RuleKind kind) {
    switch (kind) {
        case RuleKind::PASSTHROUGH:         return "passthrough";
        case RuleKind::KEEP_VERSION:        return "keep_version";
        case RuleKind::KEEP_SSID_REFERENCE: return "keep_ssid_reference";
        case RuleKind::KEEP_IPV6_PREFIX:    return "keep_ipv6_prefix";
        case RuleKind::SERIAL_NUMBER:       return "serial_number";
        case RuleKind::PASSWORD:            return "password";
        case RuleKind::SSID:                return "ssid";
        case RuleKind::BSSID:               return "bssid";
        case RuleKind::CONTENT_SCAN:        return "content_scan";
    }
    return "content_scan";
}

// ============================================================================
// Anonymization Options
// ============================================================================

inline const std::vector<std::string>& default_ssid_placeholders() {
    static const std::vector<std::string> kPlaceholders = {
        "Tell my WiFi love her",
        "Pretty Fly for a Wi-Fi",
        "The LAN Before Time",
        "Searching...",
        "Get off my LAN",
    };
    return kPlaceholders;
}

struct AnonymizerOptions {
    std::string serial_prefix = "JW";       // two ASCII letters
    size_t serial_digits = 12;
    size_t password_length = 12;
    std::vector<std::string> ssid_placeholders = default_ssid_placeholders();
    std::optional<uint64_t> seed;           // set => reproducible run
};

// ============================================================================
// Run Statistics
// ============================================================================

struct WalkStats {
    size_t strings_visited = 0;     // string scalars handed to the policy
    size_t strings_changed = 0;     // of those, how many came back different
};

struct RunSummary {
    std::string input_path;
    std::string output_path;
    WalkStats walk;
    size_t store_entries = 0;
};

} // namespace devscrub
