#pragma once

#include "core/random_source.hpp"
#include "core/types.hpp"
#include "anonymizer/replacement_store.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace devscrub {

/**
 * @brief Per-type replacement rules
 *
 * - MAC:      keep the OUI (first three octets), randomize the rest, keep
 *             the delimiter, uppercase the result
 * - IPv4:     loopback / unspecified / 255.* untouched; 192.168.x.y keeps
 *             its /24 and randomizes y unless y is 0, 1 or 255; anything
 *             else maps into 10.0.0.0/8
 * - IPv6:     keep the first group and every 0000/0001 group, randomize the
 *             rest, emit canonical compressed text
 * - SSID:     pick a placeholder name (the built-in set when none are
 *             configured)
 * - password: fresh alphanumeric string every call, never memoized
 *
 * MAC, IPv4, IPv6 and SSID results go through the replacement store, so a
 * repeated original gets the same replacement for the life of the store.
 * Addresses are keyed in normalized form: MACs lowercased, IPv4 in plain
 * dotted-quad, IPv6 as eight four-digit groups. SSIDs are keyed verbatim.
 * A candidate that fails validation is returned unchanged.
 */
class ReplacementRules {
public:
    ReplacementRules(IRandomSource& random, ReplacementStore& store,
                     const AnonymizerOptions& options);

    [[nodiscard]] std::string mac(std::string_view original);
    [[nodiscard]] std::string ipv4(std::string_view original);
    [[nodiscard]] std::string ipv6(std::string_view original);
    [[nodiscard]] std::string ssid(std::string_view original);
    [[nodiscard]] std::string password();

    /// "<prefix><digits>"; called once per session.
    [[nodiscard]] std::string make_serial_number();

private:
    [[nodiscard]] std::string random_mac(std::string_view original);
    [[nodiscard]] std::string random_ipv4(uint32_t original);
    [[nodiscard]] std::string random_ipv6(const std::array<uint16_t, 8>& groups);

    IRandomSource& random_;
    ReplacementStore& store_;
    const AnonymizerOptions& options_;
};

} // namespace devscrub
