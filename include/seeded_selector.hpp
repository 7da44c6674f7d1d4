#pragma once
#include "degree_table.hpp"
#include <cstdint>
#include <cstddef>
#include <vector>

// SplitMix64: pinned here so encoder and decoder builds draw identical streams
class SplitMix64 {
public:
    explicit SplitMix64(uint64_t seed) : state_(seed) {}

    uint64_t next();
    uint64_t uniform(uint64_t bound); // unbiased value in [0, bound)

private:
    uint64_t state_;
};

struct SourceSelection {
    std::size_t degree = 0;
    std::vector<uint32_t> indices; // distinct, ascending
};

// Degree and source chunk indices of droplet `seed`. Pure in (seed, table.chunk_count()).
SourceSelection select_sources(uint32_t seed, const DegreeTable& table);
SourceSelection select_sources(uint32_t seed, std::size_t chunk_count);
