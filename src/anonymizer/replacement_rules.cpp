#include "anonymizer/replacement_rules.hpp"
#include "anonymizer/ip_address.hpp"
#include "core/utils.hpp"

#include <format>

namespace devscrub {

namespace {

constexpr std::string_view kPasswordAlphabet =
    "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";

constexpr uint32_t kPrivatePrefix = (192u << 24) | (168u << 16);

bool keeps_last_octet(uint32_t octet) {
    return octet == 0 || octet == 1 || octet == 255;
}

} // anonymous namespace

ReplacementRules::ReplacementRules(IRandomSource& random, ReplacementStore& store,
                                   const AnonymizerOptions& options)
    : random_(random), store_(store), options_(options) {}

// ============================================================================
// MAC
// ============================================================================

std::string ReplacementRules::mac(std::string_view original) {
    // Hex case does not split one address into two entries
    return store_.get_or_create(utils::to_lower(original), [&] { return random_mac(original); });
}

std::string ReplacementRules::random_mac(std::string_view original) {
    // Matcher guarantees "hh?hh?hh?hh?hh?hh" with one delimiter
    const char delimiter = original[2];

    std::string result(original.substr(0, 9));
    for (int i = 0; i < 3; ++i) {
        result += std::format("{:02x}", random_.uniform(0, 255));
        if (i < 2) result += delimiter;
    }
    return utils::to_upper(result);
}

// ============================================================================
// IPv4
// ============================================================================

std::string ReplacementRules::ipv4(std::string_view original) {
    uint32_t ip = 0;
    if (!IpAddress::parse_ipv4(original, ip)) {
        return std::string(original);
    }
    if (IpAddress::is_loopback(ip) || IpAddress::is_unspecified(ip) || (ip >> 24) == 255) {
        return std::string(original);
    }
    return store_.get_or_create(IpAddress::format_ipv4(ip), [&] { return random_ipv4(ip); });
}

std::string ReplacementRules::random_ipv4(uint32_t original) {
    const uint32_t last = original & 0xFF;

    if ((original & 0xFFFF0000u) == kPrivatePrefix) {
        if (keeps_last_octet(last)) {
            return IpAddress::format_ipv4(original);
        }
        return IpAddress::format_ipv4((original & 0xFFFFFF00u) | random_.uniform(2, 254));
    }

    const uint32_t b = random_.uniform(0, 255);
    const uint32_t c = random_.uniform(0, 255);
    const uint32_t d = keeps_last_octet(last) ? last : random_.uniform(2, 254);
    return IpAddress::format_ipv4((10u << 24) | (b << 16) | (c << 8) | d);
}

// ============================================================================
// IPv6
// ============================================================================

std::string ReplacementRules::ipv6(std::string_view original) {
    IpAddress::Ipv6Groups groups{};
    if (!IpAddress::parse_ipv6(original, groups)) {
        return std::string(original);
    }
    // "2001:db8::1" and "2001:0DB8:0:0:0:0:0:1" share one entry
    return store_.get_or_create(IpAddress::explode_ipv6(groups), [&] { return random_ipv6(groups); });
}

std::string ReplacementRules::random_ipv6(const std::array<uint16_t, 8>& groups) {
    IpAddress::Ipv6Groups result = groups;
    for (size_t i = 1; i < result.size(); ++i) {
        if (result[i] == 0x0000 || result[i] == 0x0001) continue;
        result[i] = static_cast<uint16_t>(random_.uniform(0, 0xFFFF));
    }
    return IpAddress::format_ipv6(result);
}

// ============================================================================
// SSID / password / serial
// ============================================================================

std::string ReplacementRules::ssid(std::string_view original) {
    const auto& names = options_.ssid_placeholders.empty()
        ? default_ssid_placeholders() : options_.ssid_placeholders;

    return store_.get_or_create(original, [&] {
        return names[random_.uniform(0, static_cast<uint32_t>(names.size() - 1))];
    });
}

std::string ReplacementRules::password() {
    std::string result;
    result.reserve(options_.password_length);
    for (size_t i = 0; i < options_.password_length; ++i) {
        result += kPasswordAlphabet[random_.uniform(0, static_cast<uint32_t>(kPasswordAlphabet.size() - 1))];
    }
    return result;
}

std::string ReplacementRules::make_serial_number() {
    std::string result = options_.serial_prefix;
    for (size_t i = 0; i < options_.serial_digits; ++i) {
        result += static_cast<char>('0' + random_.uniform(0, 9));
    }
    return result;
}

} // namespace devscrub
