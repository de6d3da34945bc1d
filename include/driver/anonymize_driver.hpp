#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <string>

namespace devscrub {

/**
 * @brief File-level entry point: load, anonymize, write atomically
 *
 * Each run() gets its own session, so replacements are consistent within a
 * run and independent across runs (unless options carry a fixed seed).
 *
 * Output is written to a new "<output>.<pid>.<n>.tmp" sibling and renamed
 * over the destination. Existing files are never used as the temporary. On
 * any failure the temporary file is removed and the destination is left as
 * it was.
 */
class AnonymizeDriver {
public:
    explicit AnonymizeDriver(AnonymizerOptions options, int indent = 4);

    /**
     * @brief Anonymize `input_path` into `output_path`
     * @param output_path Destination; empty selects default_output_path()
     * @return Run summary, or one of INPUT_NOT_FOUND, MALFORMED_INPUT,
     *         OUTPUT_WRITE_FAILED, UNEXPECTED_FAILURE
     */
    [[nodiscard]] Result<RunSummary> run(const std::string& input_path,
                                         const std::string& output_path = "") const;

    /// "capture.json" -> "capture.anonymized.json", "capture" -> "capture.anonymized"
    [[nodiscard]] static std::string default_output_path(const std::string& input_path);

private:
    AnonymizerOptions options_;
    int indent_;
};

} // namespace devscrub
