#include "anonymizer/document_walker.hpp"

namespace devscrub {

Document DocumentWalker::walk(const Document& node) {
    return visit({}, node);
}

Document DocumentWalker::visit(std::string_view key, const Document& node) {
    if (node.is_object()) return walk_object(node);
    if (node.is_array()) return walk_array(node);
    if (!node.is_string()) return policy_.apply(key, node);

    ++stats_.strings_visited;
    Document replaced = policy_.apply(key, node);
    if (replaced != node) ++stats_.strings_changed;
    return replaced;
}

Document DocumentWalker::walk_object(const Document& node) {
    Document out = Document::object();
    for (auto it = node.begin(); it != node.end(); ++it) {
        const std::string& key = it.key();
        out[key] = visit(key, it.value());
    }
    return out;
}

Document DocumentWalker::walk_array(const Document& node) {
    Document out = Document::array();
    for (const auto& element : node) {
        // No key: scalars fall through to the content scan
        out.push_back(visit({}, element));
    }
    return out;
}

} // namespace devscrub
