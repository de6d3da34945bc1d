#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <random>

namespace devscrub {

/**
 * @brief Source of random integers for the anonymization rules
 *
 * Every random draw made while anonymizing a document goes through this
 * interface, so tests can script exact values and a fixed seed can make a
 * run reproducible.
 */
class IRandomSource {
public:
    virtual ~IRandomSource() = default;

    /// Uniformly distributed integer in [lo, hi] (inclusive). Requires lo <= hi.
    [[nodiscard]] virtual uint32_t uniform(uint32_t lo, uint32_t hi) = 0;
};

/**
 * @brief Production source backed by OpenSSL's CSPRNG (RAND_bytes)
 *
 * Uses rejection sampling so every value in the range is equally likely.
 * Throws std::runtime_error if RAND_bytes reports failure.
 */
class OpenSslRandomSource : public IRandomSource {
public:
    [[nodiscard]] uint32_t uniform(uint32_t lo, uint32_t hi) override;

private:
    static uint32_t next_u32();
};

/**
 * @brief Deterministic source for --seed runs
 */
class SeededRandomSource : public IRandomSource {
public:
    explicit SeededRandomSource(uint64_t seed) : gen_(seed) {}

    [[nodiscard]] uint32_t uniform(uint32_t lo, uint32_t hi) override;

private:
    std::mt19937_64 gen_;
};

/**
 * @brief Seeded source when a seed is given, OpenSSL source otherwise
 */
[[nodiscard]] std::unique_ptr<IRandomSource> make_random_source(std::optional<uint64_t> seed);

} // namespace devscrub
