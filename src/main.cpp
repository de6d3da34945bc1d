#include "core/utils.hpp"
#include "config/config_loader.hpp"
#include "driver/anonymize_driver.hpp"

#include <cstdint>
#include <cstdlib>
#include <format>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using namespace devscrub;

namespace {

constexpr std::string_view kVersion = "devscrub 1.0.0";

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

void print_usage(std::ostream& out) {
    out << "Usage: devscrub [--config FILE] [--seed N] [--indent N] [--log-level LEVEL]\n"
           "                INPUT [OUTPUT]\n"
           "       devscrub --help | --version\n"
           "\n"
           "Anonymize a JSON device-state capture. OUTPUT defaults to INPUT with\n"
           "'.anonymized' inserted before the extension.\n"
           "\n"
           "  --config FILE      TOML configuration file\n"
           "  --seed N           fix the random sequence (reproducible output)\n"
           "  --indent N         output indentation, 0-16 (default 4)\n"
           "  --log-level LEVEL  debug | info | warn | error\n";
}

struct CliArgs {
    std::optional<std::string> config_file;
    std::optional<int64_t> seed;
    std::optional<int64_t> indent;
    std::optional<std::string> log_level;
    std::vector<std::string> positional;
    bool help = false;
    bool version = false;
};

/**
 * @brief Parse argv; returns an error message on bad usage
 */
std::optional<std::string> parse_args(int argc, char* argv[], CliArgs& args) {
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];

        auto next_value = [&]() -> std::optional<std::string> {
            if (i + 1 >= argc) return std::nullopt;
            return std::string(argv[++i]);
        };

        if (arg == "--help" || arg == "-h") {
            args.help = true;
        } else if (arg == "--version") {
            args.version = true;
        } else if (arg == "--config" || arg == "--seed" || arg == "--indent" || arg == "--log-level") {
            const auto value = next_value();
            if (!value) return std::format("{} requires a value", arg);

            if (arg == "--config") {
                args.config_file = *value;
            } else if (arg == "--log-level") {
                args.log_level = *value;
            } else {
                const auto number = utils::try_parse_int<int64_t>(*value);
                if (!number) return std::format("{} expects an integer, got '{}'", arg, *value);
                if (arg == "--seed") args.seed = *number;
                else args.indent = *number;
            }
        } else if (arg.size() > 1 && arg.front() == '-') {
            return std::format("Unknown option: {}", arg);
        } else {
            args.positional.emplace_back(arg);
        }
    }

    if (args.help || args.version) return std::nullopt;
    if (args.positional.empty()) return std::string("Missing INPUT");
    if (args.positional.size() > 2) return std::string("Too many arguments");
    return std::nullopt;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CliArgs args;
    if (const auto usage_error = parse_args(argc, argv, args)) {
        std::cerr << "devscrub: " << *usage_error << "\n\n";
        print_usage(std::cerr);
        return kExitUsage;
    }
    if (args.help) {
        print_usage(std::cout);
        return kExitOk;
    }
    if (args.version) {
        std::cout << kVersion << "\n";
        return kExitOk;
    }

    // Configuration: file first, then command-line overrides
    DevscrubConfig config;
    if (args.config_file) {
        auto loaded = ConfigLoader::load_from_file(*args.config_file);
        if (loaded.is_error()) {
            utils::log::error(loaded.error_message());
            return kExitUsage;
        }
        config = std::move(loaded.value());
    }
    if (args.seed) config.anonymizer.seed = *args.seed;
    if (args.indent) config.output.indent = *args.indent;
    if (args.log_level) config.logging.level = *args.log_level;

    auto validated = ConfigLoader::validate_and_return(std::move(config));
    if (validated.is_error()) {
        utils::log::error(validated.error_message());
        return kExitUsage;
    }
    const DevscrubConfig& cfg = validated.value();

    if (const auto level = utils::log::parse_level(cfg.logging.level)) {
        utils::log::set_min_level(*level);
    }
    if (cfg.anonymizer.seed) {
        utils::log::warn(std::format(
            "Using fixed seed {}: replacements are reproducible across runs",
            *cfg.anonymizer.seed));
    }

    const std::string& input = args.positional[0];
    const std::string output = args.positional.size() > 1 ? args.positional[1] : "";

    utils::Timer timer;
    const AnonymizeDriver driver(cfg.anonymizer_options(), static_cast<int>(cfg.output.indent));
    const auto result = driver.run(input, output);
    if (result.is_error()) {
        utils::log::error(std::format("{}: {}",
            error_category_name(result.error_category()), result.error_message()));
        return kExitFailure;
    }

    utils::log::debug(std::format("Finished in {} ms", timer.elapsed_ms().count()));
    return kExitOk;
}
