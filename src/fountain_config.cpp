#include "fountain_config.hpp"
#include "fountain_errors.hpp"
#include <cmath>
#include <string>

void check_chunk_bits(long long chunk_bits) {
    if (chunk_bits <= 0)
        throw InvalidConfiguration("chunk size must be positive, got " + std::to_string(chunk_bits));
    if (chunk_bits % 2 != 0)
        throw InvalidConfiguration("chunk size must be a whole number of symbols (even bit count), got " +
                                   std::to_string(chunk_bits));
}

void FountainConfig::validate() const {
    check_chunk_bits(chunk_bits);

    if (!(redundancy >= 1.0) || !std::isfinite(redundancy))
        throw InvalidConfiguration("redundancy must be >= 1.0");
    if (seed_symbols <= 0 || seed_symbols > MAX_SEED_SYMBOLS)
        throw InvalidConfiguration("seed field must be 1.." + std::to_string(MAX_SEED_SYMBOLS) +
                                   " symbols, got " + std::to_string(seed_symbols));
    if (threads <= 0 || threads > MAX_ENCODER_THREADS)
        throw InvalidConfiguration("thread count must be 1.." + std::to_string(MAX_ENCODER_THREADS));
}

std::size_t FountainConfig::droplet_count(std::size_t chunk_count) const {
    auto n = static_cast<std::size_t>(std::ceil(static_cast<double>(chunk_count) * redundancy));
    return n < chunk_count ? chunk_count : n;
}
