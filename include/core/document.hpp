#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace devscrub {

/**
 * @brief In-memory device-state document
 *
 * ordered_json keeps object keys in insertion order, so a document that is
 * parsed, rewritten and dumped comes back with the same key layout.
 */
using Document = nlohmann::ordered_json;

namespace document {

/**
 * @brief Parse UTF-8 JSON text into a Document
 * @throws nlohmann::json::parse_error on malformed input
 */
[[nodiscard]] inline Document parse(std::string_view text) {
    return Document::parse(text.begin(), text.end());
}

/**
 * @brief Serialize with stable indentation and a trailing newline
 *
 * Non-ASCII characters are written verbatim; invalid UTF-8 sequences are
 * replaced rather than aborting the dump.
 */
[[nodiscard]] inline std::string dump(const Document& doc, int indent = 4) {
    std::string out = doc.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
    out.push_back('\n');
    return out;
}

} // namespace document

} // namespace devscrub
