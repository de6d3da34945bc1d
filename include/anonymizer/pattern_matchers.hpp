#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace devscrub {

/**
 * @brief One recognized substring: [start, end) offsets into the scanned text
 *
 * `text` views into the caller's buffer and is only valid while it lives.
 */
struct MatchSpan {
    size_t start = 0;
    size_t end = 0;
    std::string_view text;
};

/**
 * @brief Hand-written scanners for addresses embedded in free text
 *
 * Each finder returns non-overlapping spans, left to right, with the first
 * match winning at each position. Matches respect word boundaries: they
 * start at the beginning of the text or after a non-word character and end
 * at the end of the text or before a non-word character (word characters
 * are ASCII letters, digits and '_').
 *
 * The finders are purely syntactic. Semantic checks (octet range, IPv6
 * parse) belong to the replacement rules, which return a candidate
 * unchanged when it does not validate.
 */
namespace matchers {

/// Six two-digit hex groups joined by one consistent ':' or '-' delimiter.
[[nodiscard]] std::vector<MatchSpan> find_mac_addresses(std::string_view text);

/// Four '.'-separated runs of 1-3 decimal digits.
[[nodiscard]] std::vector<MatchSpan> find_ipv4_addresses(std::string_view text);

/// Two to eight 1-4 digit hex groups joined by single ':' (longest run wins).
[[nodiscard]] std::vector<MatchSpan> find_ipv6_addresses(std::string_view text);

[[nodiscard]] constexpr bool is_word_char(char c) noexcept {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9') || c == '_';
}

} // namespace matchers

using SpanRewriter = std::function<std::string(std::string_view match)>;

/**
 * @brief Rebuild `text` with every span replaced by rewrite(span.text)
 *
 * Spans must be sorted and non-overlapping, as produced by the finders.
 */
[[nodiscard]] std::string replace_spans(
    std::string_view text,
    const std::vector<MatchSpan>& spans,
    const SpanRewriter& rewrite);

} // namespace devscrub
