#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace devscrub {

class IpAddress {
public:
    using Ipv6Groups = std::array<uint16_t, 8>;

    /// Dotted-quad to host-order integer; every octet must be 0-255.
    static bool parse_ipv4(std::string_view ip, uint32_t& out);
    [[nodiscard]] static std::string format_ipv4(uint32_t ip);

    [[nodiscard]] static bool is_loopback(uint32_t ip) { return (ip >> 24) == 127; }
    [[nodiscard]] static bool is_unspecified(uint32_t ip) { return ip == 0; }

    /**
     * @brief Parse full or "::"-compressed IPv6 text into eight groups
     *
     * Groups are 1-4 hex digits, case-insensitive. At most one "::" is
     * allowed and it must stand for at least one zero group. Embedded IPv4
     * tails and zone ids are not accepted.
     */
    static bool parse_ipv6(std::string_view ip, Ipv6Groups& out);

    /// RFC 5952 text: lowercase, no leading zeros, longest zero run (>= 2) as "::".
    [[nodiscard]] static std::string format_ipv6(const Ipv6Groups& groups);

    /// Eight four-digit lowercase groups, e.g. "2001:0db8:0000:...".
    [[nodiscard]] static std::string explode_ipv6(const Ipv6Groups& groups);
};

} // namespace devscrub
