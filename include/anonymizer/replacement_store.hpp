#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace devscrub {

/**
 * @brief Run-scoped memo of original value -> anonymized replacement
 *
 * The first replacement recorded for an original is the one every later
 * lookup returns. Entries are never removed; a store lives exactly as long
 * as the session (or sessions) that share it.
 *
 * One store holds every memoized type (MAC, IPv4, IPv6, SSID). Keys are
 * compared exactly; callers normalize them first.
 */
class ReplacementStore {
public:
    /**
     * @brief Return the stored replacement, creating it with make() on first sight
     *
     * make() runs at most once per distinct original.
     */
    const std::string& get_or_create(std::string_view original,
                                     const std::function<std::string()>& make);

    [[nodiscard]] size_t size() const { return entries_.size(); }
    [[nodiscard]] size_t hits() const { return hits_; }
    [[nodiscard]] size_t misses() const { return misses_; }

private:
    std::unordered_map<std::string, std::string> entries_;
    size_t hits_ = 0;
    size_t misses_ = 0;
};

} // namespace devscrub
