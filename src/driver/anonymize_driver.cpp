#include "driver/anonymize_driver.hpp"
#include "anonymizer/anonymization_session.hpp"
#include "core/document.hpp"
#include "core/utils.hpp"

#include <unistd.h>

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace devscrub {

namespace fs = std::filesystem;

namespace {

bool same_file(const std::string& a, const std::string& b) {
    std::error_code ec;
    const auto ca = fs::weakly_canonical(a, ec);
    if (ec) return a == b;
    const auto cb = fs::weakly_canonical(b, ec);
    if (ec) return a == b;
    return ca == cb;
}

std::atomic<uint64_t> g_tmp_counter{0};

/// Sibling of `path` that no existing file uses: "<path>.<pid>.<n>.tmp"
std::string unique_tmp_path(const std::string& path) {
    std::error_code ec;
    while (true) {
        std::string candidate = std::format("{}.{}.{}.tmp", path,
            static_cast<long>(::getpid()), g_tmp_counter.fetch_add(1));
        if (!fs::exists(candidate, ec)) return candidate;
    }
}

/**
 * @brief Write `content` to a fresh temporary sibling, then rename it over `path`
 * @return Empty string on success, otherwise the failure reason
 */
std::string write_atomically(const std::string& path, const std::string& content) {
    const std::string tmp_path = unique_tmp_path(path);
    std::error_code ec;

    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return std::format("cannot create {}", tmp_path);
        }
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.flush();
        if (!out) {
            out.close();
            fs::remove(tmp_path, ec);
            return std::format("write to {} failed", tmp_path);
        }
    }

    fs::rename(tmp_path, path, ec);
    if (ec) {
        std::error_code remove_ec;
        fs::remove(tmp_path, remove_ec);
        return std::format("rename {} -> {} failed: {}", tmp_path, path, ec.message());
    }
    return {};
}

} // anonymous namespace

AnonymizeDriver::AnonymizeDriver(AnonymizerOptions options, int indent)
    : options_(std::move(options)), indent_(indent) {}

std::string AnonymizeDriver::default_output_path(const std::string& input_path) {
    const fs::path input(input_path);
    fs::path output = input.parent_path();
    output /= input.stem().string() + ".anonymized" + input.extension().string();
    return output.string();
}

Result<RunSummary> AnonymizeDriver::run(const std::string& input_path,
                                        const std::string& output_path) const {
    const std::string destination =
        output_path.empty() ? default_output_path(input_path) : output_path;

    // Load
    std::error_code ec;
    if (!fs::is_regular_file(input_path, ec)) {
        return Result<RunSummary>::error(ErrorCategory::INPUT_NOT_FOUND,
            std::format("Input file not found: {}", input_path));
    }

    std::ifstream in(input_path, std::ios::binary);
    if (!in.is_open()) {
        return Result<RunSummary>::error(ErrorCategory::INPUT_NOT_FOUND,
            std::format("Cannot open input file: {}", input_path));
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    if (same_file(input_path, destination)) {
        return Result<RunSummary>::error(ErrorCategory::OUTPUT_WRITE_FAILED,
            std::format("Refusing to overwrite input file: {}", destination));
    }

    try {
        const Document doc = document::parse(buffer.str());

        AnonymizationSession session(options_);
        const Document anonymized = session.anonymize(doc);

        // Write
        const std::string err = write_atomically(destination, document::dump(anonymized, indent_));
        if (!err.empty()) {
            return Result<RunSummary>::error(ErrorCategory::OUTPUT_WRITE_FAILED,
                std::format("Failed to write output: {}", err));
        }

        RunSummary summary;
        summary.input_path = input_path;
        summary.output_path = destination;
        summary.walk = session.stats();
        summary.store_entries = session.store().size();

        utils::log::info(std::format("Anonymized data written to {}", destination));
        utils::log::info(std::format("{} strings visited, {} changed, {} distinct replacements",
            summary.walk.strings_visited, summary.walk.strings_changed, summary.store_entries));
        return Result<RunSummary>::ok(std::move(summary));

    } catch (const nlohmann::json::parse_error& e) {
        return Result<RunSummary>::error(ErrorCategory::MALFORMED_INPUT,
            std::format("Malformed JSON in {} at byte {}: {}", input_path, e.byte, e.what()));
    } catch (const std::exception& e) {
        return Result<RunSummary>::error(ErrorCategory::UNEXPECTED_FAILURE,
            std::format("Anonymization failed: {}", e.what()));
    }
}

} // namespace devscrub
