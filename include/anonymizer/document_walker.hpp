#pragma once

#include "core/document.hpp"
#include "core/types.hpp"
#include "anonymizer/value_policy.hpp"

#include <string_view>

namespace devscrub {

/**
 * @brief Depth-first, post-order rewrite of a whole document
 *
 * Containers are walked first; every scalar then goes to the value policy.
 * Object members carry their own key. Array elements and a scalar at the
 * root have no key, so the policy scans their content.
 *
 * The result is a new tree with identical shape: same keys in the same
 * order, same array lengths, same depth. The input is not modified.
 */
class DocumentWalker {
public:
    explicit DocumentWalker(ValuePolicy& policy) : policy_(policy) {}

    [[nodiscard]] Document walk(const Document& node);

    [[nodiscard]] const WalkStats& stats() const { return stats_; }

private:
    Document visit(std::string_view key, const Document& node);
    Document walk_object(const Document& node);
    Document walk_array(const Document& node);

    ValuePolicy& policy_;
    WalkStats stats_;
};

} // namespace devscrub
