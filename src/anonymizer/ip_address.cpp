#include "anonymizer/ip_address.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cstddef>
#include <format>
#include <vector>

namespace devscrub {

namespace {

bool parse_hex_group(std::string_view group, uint16_t& out) {
    if (group.empty() || group.size() > 4) return false;
    uint32_t val = 0;
    for (const char c : group) {
        if (!utils::is_hex_digit(c)) return false;
        const char lower = static_cast<char>(c | 0x20);
        val = val * 16 + static_cast<uint32_t>(lower <= '9' ? c - '0' : lower - 'a' + 10);
    }
    out = static_cast<uint16_t>(val);
    return true;
}

// Split "a:b:c" into groups. An empty input yields no groups; any empty
// group (leading, trailing or doubled ':') is a failure.
bool parse_group_list(std::string_view text, std::vector<uint16_t>& out) {
    if (text.empty()) return true;

    size_t start = 0;
    while (true) {
        const size_t colon = text.find(':', start);
        const auto part = text.substr(start, colon == std::string_view::npos
                                                 ? std::string_view::npos
                                                 : colon - start);
        uint16_t group = 0;
        if (!parse_hex_group(part, group)) return false;
        out.push_back(group);
        if (colon == std::string_view::npos) break;
        start = colon + 1;
    }
    return true;
}

} // anonymous namespace

bool IpAddress::parse_ipv4(std::string_view ip, uint32_t& out) {
    uint32_t octets[4]{};
    size_t octet_idx = 0;
    uint32_t val = 0;
    bool has_digit = false;

    for (size_t i = 0; i <= ip.size(); ++i) {
        if (i == ip.size() || ip[i] == '.') {
            if (!has_digit || val > 255 || octet_idx > 3) return false;
            octets[octet_idx++] = val;
            val = 0;
            has_digit = false;
        } else if (ip[i] >= '0' && ip[i] <= '9') {
            val = val * 10 + static_cast<uint32_t>(ip[i] - '0');
            if (val > 255) return false;
            has_digit = true;
        } else {
            return false;
        }
    }
    if (octet_idx != 4) return false;
    out = (octets[0] << 24) | (octets[1] << 16) | (octets[2] << 8) | octets[3];
    return true;
}

std::string IpAddress::format_ipv4(uint32_t ip) {
    return std::format("{}.{}.{}.{}",
        (ip >> 24) & 0xFF, (ip >> 16) & 0xFF, (ip >> 8) & 0xFF, ip & 0xFF);
}

bool IpAddress::parse_ipv6(std::string_view ip, Ipv6Groups& out) {
    if (ip.empty()) return false;

    std::vector<uint16_t> head;
    std::vector<uint16_t> tail;

    const size_t gap = ip.find("::");
    if (gap == std::string_view::npos) {
        if (!parse_group_list(ip, head) || head.size() != 8) return false;
        std::copy(head.begin(), head.end(), out.begin());
        return true;
    }

    if (ip.find("::", gap + 1) != std::string_view::npos) return false;

    if (!parse_group_list(ip.substr(0, gap), head)) return false;
    if (!parse_group_list(ip.substr(gap + 2), tail)) return false;
    if (head.size() + tail.size() > 7) return false;

    out.fill(0);
    std::copy(head.begin(), head.end(), out.begin());
    std::copy(tail.begin(), tail.end(), out.end() - static_cast<std::ptrdiff_t>(tail.size()));
    return true;
}

std::string IpAddress::format_ipv6(const Ipv6Groups& groups) {
    // Locate the longest run of zero groups; ties keep the first run
    int best_start = -1;
    int best_len = 0;
    for (int i = 0; i < 8;) {
        if (groups[i] != 0) {
            ++i;
            continue;
        }
        int j = i;
        while (j < 8 && groups[j] == 0) ++j;
        if (j - i > best_len) {
            best_start = i;
            best_len = j - i;
        }
        i = j;
    }
    if (best_len < 2) best_start = -1;

    std::string result;
    for (int i = 0; i < 8; ++i) {
        if (i == best_start) {
            result += "::";
            i += best_len - 1;
            continue;
        }
        if (!result.empty() && result.back() != ':') result += ':';
        result += std::format("{:x}", groups[i]);
    }
    return result;
}

std::string IpAddress::explode_ipv6(const Ipv6Groups& groups) {
    std::string result;
    result.reserve(39);
    for (size_t i = 0; i < groups.size(); ++i) {
        if (i > 0) result += ':';
        result += std::format("{:04x}", groups[i]);
    }
    return result;
}

} // namespace devscrub
