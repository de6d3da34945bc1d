#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <toml++/toml.hpp>

#include <cstdlib>
#include <format>
#include <stdexcept>

namespace devscrub {

// ============================================================================
// TOML Parsing Helpers (env expansion, typed reads)
// ============================================================================

namespace {

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto&& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = ConfigLoader::expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            auto expanded = ConfigLoader::expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_env_vars_recursive(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------
// A key that is present with the wrong type is reported, not defaulted.

void read_string(const toml::table& tbl, std::string_view section, std::string_view key,
                 std::string& out, std::vector<std::string>& errors) {
    const auto node = tbl[key];
    if (!node) return;
    if (const auto v = node.value<std::string>()) {
        out = *v;
    } else {
        errors.push_back(std::format("{}.{} must be a string", section, key));
    }
}

void read_int(const toml::table& tbl, std::string_view section, std::string_view key,
              int64_t& out, std::vector<std::string>& errors) {
    const auto node = tbl[key];
    if (!node) return;
    if (node.is_integer()) {
        out = node.as_integer()->get();
    } else {
        errors.push_back(std::format("{}.{} must be an integer", section, key));
    }
}

void read_string_array(const toml::table& tbl, std::string_view section, std::string_view key,
                       std::vector<std::string>& out, std::vector<std::string>& errors) {
    const auto node = tbl[key];
    if (!node) return;
    const auto* arr = node.as_array();
    if (!arr) {
        errors.push_back(std::format("{}.{} must be an array of strings", section, key));
        return;
    }

    std::vector<std::string> result;
    result.reserve(arr->size());
    for (size_t i = 0; i < arr->size(); ++i) {
        if (const auto* s = (*arr)[i].as_string()) {
            result.emplace_back(s->get());
        } else {
            errors.push_back(std::format("{}.{}[{}] must be a string", section, key, i));
        }
    }
    out = std::move(result);
}

LoggingConfig extract_logging(const toml::table& root, std::vector<std::string>& errors) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    read_string(*logging, "logging", "level", cfg.level, errors);
    return cfg;
}

AnonymizerConfig extract_anonymizer(const toml::table& root, std::vector<std::string>& errors) {
    AnonymizerConfig cfg;
    const auto* anonymizer = root["anonymizer"].as_table();
    if (!anonymizer) return cfg;
    const auto& a = *anonymizer;

    read_string(a, "anonymizer", "serial_prefix", cfg.serial_prefix, errors);
    read_int(a, "anonymizer", "password_length", cfg.password_length, errors);
    read_string_array(a, "anonymizer", "ssid_placeholders", cfg.ssid_placeholders, errors);

    if (a["seed"]) {
        int64_t seed = 0;
        const size_t before = errors.size();
        read_int(a, "anonymizer", "seed", seed, errors);
        if (errors.size() == before) cfg.seed = seed;
    }
    return cfg;
}

OutputConfig extract_output(const toml::table& root, std::vector<std::string>& errors) {
    OutputConfig cfg;
    const auto* output = root["output"].as_table();
    if (!output) return cfg;

    read_int(*output, "output", "indent", cfg.indent, errors);
    return cfg;
}

DevscrubConfig extract_all_sections(const toml::table& tbl, std::vector<std::string>& errors) {
    DevscrubConfig config;
    config.logging = extract_logging(tbl, errors);
    config.anonymizer = extract_anonymizer(tbl, errors);
    config.output = extract_output(tbl, errors);
    return config;
}

bool is_ascii_letter(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

} // anonymous namespace

// ============================================================================
// DevscrubConfig
// ============================================================================

AnonymizerOptions DevscrubConfig::anonymizer_options() const {
    AnonymizerOptions options;
    options.serial_prefix = anonymizer.serial_prefix;
    options.password_length = static_cast<size_t>(anonymizer.password_length);
    options.ssid_placeholders = anonymizer.ssid_placeholders;
    if (anonymizer.seed) {
        options.seed = static_cast<uint64_t>(*anonymizer.seed);
    }
    return options;
}

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

std::string ConfigLoader::expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(DevscrubConfig config,
                                                           std::vector<std::string> errors) {
    auto validation = validate_config(config);
    errors.insert(errors.end(), validation.begin(), validation.end());

    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return LoadResult::error(ErrorCategory::CONFIG_ERROR, std::move(combined));
    }
    return LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        std::vector<std::string> errors;
        auto config = extract_all_sections(tbl, errors);
        return validate_and_return(std::move(config), std::move(errors));
    } catch (const std::exception& e) {
        return LoadResult::error(ErrorCategory::CONFIG_ERROR,
            std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        std::vector<std::string> errors;
        auto config = extract_all_sections(tbl, errors);
        return validate_and_return(std::move(config), std::move(errors));
    } catch (const std::exception& e) {
        return LoadResult::error(ErrorCategory::CONFIG_ERROR,
            std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const DevscrubConfig& config) {
    std::vector<std::string> errors;

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format(
            "logging.level must be one of debug, info, warn, error; got '{}'",
            config.logging.level));
    }

    const auto& anon = config.anonymizer;
    if (anon.serial_prefix.size() != 2 ||
        !is_ascii_letter(anon.serial_prefix[0]) || !is_ascii_letter(anon.serial_prefix[1])) {
        errors.push_back(std::format(
            "anonymizer.serial_prefix must be exactly two ASCII letters, got '{}'",
            anon.serial_prefix));
    }

    if (!utils::in_range<1, 256>(anon.password_length)) {
        errors.push_back(std::format(
            "anonymizer.password_length must be 1-256, got {}", anon.password_length));
    }

    if (anon.ssid_placeholders.empty()) {
        errors.push_back("anonymizer.ssid_placeholders must not be empty");
    }
    for (size_t i = 0; i < anon.ssid_placeholders.size(); ++i) {
        if (anon.ssid_placeholders[i].empty()) {
            errors.push_back(std::format("anonymizer.ssid_placeholders[{}] must not be empty", i));
        }
    }

    if (anon.seed && *anon.seed < 0) {
        errors.push_back(std::format("anonymizer.seed must be >= 0, got {}", *anon.seed));
    }

    if (!utils::in_range<0, 16>(config.output.indent)) {
        errors.push_back(std::format("output.indent must be 0-16, got {}", config.output.indent));
    }

    return errors;
}

} // namespace devscrub
