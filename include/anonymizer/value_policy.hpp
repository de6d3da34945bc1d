#pragma once

#include "core/document.hpp"
#include "core/types.hpp"
#include "anonymizer/replacement_rules.hpp"

#include <string>
#include <string_view>

namespace devscrub {

/**
 * @brief Key-aware rule selection for one (key, value) pair
 *
 * Precedence (first match wins, keys compared lower-cased):
 * 1. key contains "version"                      -> unchanged
 * 2. key contains "ssid_reference"               -> unchanged
 * 3. key contains "prefix" and value has ':'     -> unchanged
 * 4. key == "serial_number"                      -> session fake serial
 * 5. key contains "password" or "passphrase"     -> fresh random password
 * 6. key == "ssid"                               -> SSID placeholder
 * 7. key == "bssid"                              -> MAC scan only
 * 8. anything else                               -> MAC, IPv4, IPv6 scan
 *
 * Non-string values and empty strings are always PASSTHROUGH.
 */
class ValuePolicy {
public:
    ValuePolicy(ReplacementRules& rules, std::string fake_serial);

    [[nodiscard]] static RuleKind classify(std::string_view key, const Document& value);

    /**
     * @brief Produce the anonymized value for `value` stored under `key`
     *
     * Never fails on content: candidates that do not validate are left as
     * they are.
     */
    [[nodiscard]] Document apply(std::string_view key, const Document& value);

    /// MAC, then IPv4, then IPv6 replacement over free text.
    [[nodiscard]] std::string scan_content(std::string_view text);

    /// MAC replacement only.
    [[nodiscard]] std::string scan_mac_only(std::string_view text);

    [[nodiscard]] const std::string& fake_serial() const { return fake_serial_; }

private:
    ReplacementRules& rules_;
    std::string fake_serial_;
};

} // namespace devscrub
