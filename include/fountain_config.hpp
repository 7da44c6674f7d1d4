#pragma once

#include "logging.hpp"
#include <cstddef>

constexpr int DEFAULT_CHUNK_BITS = 32;
constexpr double DEFAULT_REDUNDANCY = 3.0;
constexpr int DEFAULT_SEED_SYMBOLS = 16;   // 32-bit seed field
constexpr int MAX_SEED_SYMBOLS = 32;       // seeds are at most 64 bits wide
constexpr int MAX_ENCODER_THREADS = 64;

struct FountainConfig {
    int chunk_bits = DEFAULT_CHUNK_BITS;
    double redundancy = DEFAULT_REDUNDANCY; // droplets = chunk_count * redundancy
    int seed_symbols = DEFAULT_SEED_SYMBOLS;
    bool strict = false;                    // check degree-0 residuals against resolved chunks
    int threads = 1;
    LogLevel log_level = LogLevel::Info;

    void validate() const;

    // Droplet count for a message of chunk_count chunks, never below chunk_count
    std::size_t droplet_count(std::size_t chunk_count) const;
};

// Shared by every entry point that accepts a chunk size
void check_chunk_bits(long long chunk_bits);
