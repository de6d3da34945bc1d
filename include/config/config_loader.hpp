#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace devscrub {

// ============================================================================
// Logging Config
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
};

// ============================================================================
// Anonymizer Config (mirrors [anonymizer])
// ============================================================================

struct AnonymizerConfig {
    std::string serial_prefix = "JW";
    int64_t password_length = 12;
    std::vector<std::string> ssid_placeholders = default_ssid_placeholders();
    std::optional<int64_t> seed;
};

// ============================================================================
// Output Config
// ============================================================================

struct OutputConfig {
    int64_t indent = 4;
};

// ============================================================================
// DevscrubConfig - Complete parsed configuration
// ============================================================================

struct DevscrubConfig {
    LoggingConfig logging;
    AnonymizerConfig anonymizer;
    OutputConfig output;

    /// Validated anonymizer settings in the form the engine consumes.
    [[nodiscard]] AnonymizerOptions anonymizer_options() const;
};

// ============================================================================
// ConfigLoader - Extract typed config from TOML
// ============================================================================

class ConfigLoader {
public:
    using LoadResult = Result<DevscrubConfig>;

    /**
     * @brief Load config from a TOML file
     * @param config_path Path to devscrub.toml
     * @return Parsed config, or CONFIG_ERROR with every problem found
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load config from TOML text
     * @param toml_content TOML content
     * @return Parsed config, or CONFIG_ERROR with every problem found
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Check ranges and shapes; returns one message per problem
     *
     * Also used on the merged result after command-line overrides.
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const DevscrubConfig& config);

    /**
     * @brief Expand ${VAR} references from the environment
     *
     * Unset variables expand to an empty string.
     * @throws std::runtime_error on an unclosed "${"
     */
    [[nodiscard]] static std::string expand_env_vars(const std::string& input);

    static LoadResult validate_and_return(DevscrubConfig config,
                                          std::vector<std::string> errors = {});
};

} // namespace devscrub
