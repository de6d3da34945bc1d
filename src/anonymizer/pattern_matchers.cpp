#include "anonymizer/pattern_matchers.hpp"
#include "core/utils.hpp"

namespace devscrub {

namespace {

constexpr size_t kMacLength = 17;         // "aa:bb:cc:dd:ee:ff"
constexpr size_t kMaxIpv6Groups = 8;
constexpr size_t kMinIpv6Groups = 2;

bool starts_word(std::string_view text, size_t pos) {
    return pos == 0 || !matchers::is_word_char(text[pos - 1]);
}

bool ends_word(std::string_view text, size_t pos) {
    return pos >= text.size() || !matchers::is_word_char(text[pos]);
}

size_t match_mac_at(std::string_view text, size_t pos) {
    if (text.size() - pos < kMacLength) return 0;

    const char delimiter = text[pos + 2];
    if (delimiter != ':' && delimiter != '-') return 0;

    for (size_t group = 0; group < 6; ++group) {
        const size_t at = pos + group * 3;
        if (!utils::is_hex_digit(text[at]) || !utils::is_hex_digit(text[at + 1])) {
            return 0;
        }
        if (group < 5 && text[at + 2] != delimiter) {
            return 0;
        }
    }

    return ends_word(text, pos + kMacLength) ? kMacLength : 0;
}

size_t match_ipv4_at(std::string_view text, size_t pos) {
    size_t i = pos;
    for (int octet = 0; octet < 4; ++octet) {
        const size_t run_start = i;
        while (i < text.size() && utils::is_dec_digit(text[i])) ++i;

        const size_t run = i - run_start;
        if (run == 0 || run > 3) return 0;

        if (octet < 3) {
            if (i >= text.size() || text[i] != '.') return 0;
            ++i;
        }
    }
    return ends_word(text, i) ? i - pos : 0;
}

size_t match_ipv6_at(std::string_view text, size_t pos) {
    // End offsets of consecutive hex groups, each joined to the next by ':'
    size_t group_ends[kMaxIpv6Groups];
    size_t groups = 0;

    size_t i = pos;
    while (groups < kMaxIpv6Groups) {
        const size_t run_start = i;
        while (i < text.size() && utils::is_hex_digit(text[i])) ++i;

        const size_t run = i - run_start;
        if (run == 0 || run > 4) break;

        group_ends[groups++] = i;
        if (i >= text.size() || text[i] != ':') break;
        ++i;
    }

    // Longest prefix whose last group ends on a word boundary. Every group
    // but the last is followed by ':', so only the final one can fail.
    while (groups >= kMinIpv6Groups) {
        if (ends_word(text, group_ends[groups - 1])) {
            return group_ends[groups - 1] - pos;
        }
        --groups;
    }
    return 0;
}

template<typename MatchAt>
std::vector<MatchSpan> scan(std::string_view text, MatchAt match_at) {
    std::vector<MatchSpan> spans;
    size_t pos = 0;
    while (pos < text.size()) {
        if (starts_word(text, pos)) {
            if (const size_t len = match_at(text, pos); len > 0) {
                spans.push_back({pos, pos + len, text.substr(pos, len)});
                pos += len;
                continue;
            }
        }
        ++pos;
    }
    return spans;
}

} // anonymous namespace

namespace matchers {

std::vector<MatchSpan> find_mac_addresses(std::string_view text) {
    return scan(text, match_mac_at);
}

std::vector<MatchSpan> find_ipv4_addresses(std::string_view text) {
    return scan(text, match_ipv4_at);
}

std::vector<MatchSpan> find_ipv6_addresses(std::string_view text) {
    return scan(text, match_ipv6_at);
}

} // namespace matchers

std::string replace_spans(
    std::string_view text,
    const std::vector<MatchSpan>& spans,
    const SpanRewriter& rewrite) {

    if (spans.empty()) return std::string(text);

    std::string result;
    result.reserve(text.size());

    size_t cursor = 0;
    for (const auto& span : spans) {
        result.append(text.substr(cursor, span.start - cursor));
        result.append(rewrite(span.text));
        cursor = span.end;
    }
    result.append(text.substr(cursor));
    return result;
}

} // namespace devscrub
