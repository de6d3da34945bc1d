#include "anonymizer/replacement_store.hpp"

namespace devscrub {

const std::string& ReplacementStore::get_or_create(
    std::string_view original,
    const std::function<std::string()>& make) {

    std::string key(original);
    if (const auto it = entries_.find(key); it != entries_.end()) {
        ++hits_;
        return it->second;
    }

    ++misses_;
    std::string replacement = make();
    return entries_.emplace(std::move(key), std::move(replacement)).first->second;
}

} // namespace devscrub
