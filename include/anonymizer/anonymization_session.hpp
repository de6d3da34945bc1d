#pragma once

#include "core/document.hpp"
#include "core/random_source.hpp"
#include "core/types.hpp"
#include "anonymizer/replacement_rules.hpp"
#include "anonymizer/replacement_store.hpp"
#include "anonymizer/value_policy.hpp"

#include <memory>
#include <string>

namespace devscrub {

/**
 * @brief One anonymization run: a store, a random source and a fake serial
 *
 * Every document passed to anonymize() on the same session shares the
 * replacement store and the fake serial number, so an address seen in two
 * documents maps to the same replacement. Separate sessions are independent
 * unless the caller hands them the same store.
 *
 * Not thread-safe.
 */
class AnonymizationSession {
public:
    /**
     * @param options Rule parameters; `options.seed` picks the random source
     * @param store   Shared store, or nullptr for a fresh one
     * @param random  Random source override (tests), or nullptr
     */
    explicit AnonymizationSession(
        AnonymizerOptions options,
        std::shared_ptr<ReplacementStore> store = nullptr,
        std::unique_ptr<IRandomSource> random = nullptr);

    AnonymizationSession(const AnonymizationSession&) = delete;
    AnonymizationSession& operator=(const AnonymizationSession&) = delete;

    /**
     * @brief Anonymize a whole document, returning a new tree
     * @throws std::runtime_error if the random source fails
     */
    [[nodiscard]] Document anonymize(const Document& doc);

    [[nodiscard]] const ReplacementStore& store() const { return *store_; }
    [[nodiscard]] const std::string& fake_serial() const { return policy_.fake_serial(); }

    /// Totals across every anonymize() call on this session.
    [[nodiscard]] const WalkStats& stats() const { return stats_; }

private:
    AnonymizerOptions options_;
    std::unique_ptr<IRandomSource> random_;
    std::shared_ptr<ReplacementStore> store_;
    ReplacementRules rules_;
    ValuePolicy policy_;
    WalkStats stats_;
};

} // namespace devscrub
