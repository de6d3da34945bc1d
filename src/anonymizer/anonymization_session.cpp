#include "anonymizer/anonymization_session.hpp"
#include "anonymizer/document_walker.hpp"
#include "core/utils.hpp"

#include <format>

namespace devscrub {

AnonymizationSession::AnonymizationSession(
    AnonymizerOptions options,
    std::shared_ptr<ReplacementStore> store,
    std::unique_ptr<IRandomSource> random)
    : options_(std::move(options)),
      random_(random ? std::move(random) : make_random_source(options_.seed)),
      store_(store ? std::move(store) : std::make_shared<ReplacementStore>()),
      rules_(*random_, *store_, options_),
      policy_(rules_, rules_.make_serial_number()) {}

Document AnonymizationSession::anonymize(const Document& doc) {
    DocumentWalker walker(policy_);
    Document result = walker.walk(doc);

    stats_.strings_visited += walker.stats().strings_visited;
    stats_.strings_changed += walker.stats().strings_changed;

    utils::log::debug(std::format(
        "Walked document: {} strings visited, {} changed; store size={} hits={} misses={}",
        walker.stats().strings_visited, walker.stats().strings_changed,
        store_->size(), store_->hits(), store_->misses()));
    return result;
}

} // namespace devscrub
