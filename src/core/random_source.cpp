#include "core/random_source.hpp"

#include <openssl/rand.h>

#include <stdexcept>

namespace devscrub {

uint32_t OpenSslRandomSource::next_u32() {
    unsigned char bytes[4];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    return (static_cast<uint32_t>(bytes[0]) << 24) |
           (static_cast<uint32_t>(bytes[1]) << 16) |
           (static_cast<uint32_t>(bytes[2]) << 8) |
           static_cast<uint32_t>(bytes[3]);
}

uint32_t OpenSslRandomSource::uniform(uint32_t lo, uint32_t hi) {
    if (lo >= hi) return lo;

    const uint64_t span = static_cast<uint64_t>(hi) - lo + 1;
    if (span > UINT32_MAX) {
        return next_u32();
    }

    // Largest multiple of span that fits in 32 bits; draws above it are
    // rejected to keep the modulo unbiased.
    const uint64_t limit = (uint64_t{1} << 32) - ((uint64_t{1} << 32) % span);
    uint32_t draw = 0;
    do {
        draw = next_u32();
    } while (draw >= limit);

    return lo + static_cast<uint32_t>(draw % span);
}

uint32_t SeededRandomSource::uniform(uint32_t lo, uint32_t hi) {
    if (lo >= hi) return lo;
    std::uniform_int_distribution<uint32_t> dist(lo, hi);
    return dist(gen_);
}

std::unique_ptr<IRandomSource> make_random_source(std::optional<uint64_t> seed) {
    if (seed) {
        return std::make_unique<SeededRandomSource>(*seed);
    }
    return std::make_unique<OpenSslRandomSource>();
}

} // namespace devscrub
