#include "seeded_selector.hpp"
#include "fountain_errors.hpp"
#include <set>
#include <string>

uint64_t SplitMix64::next() {
    state_ += 0x9E3779B97F4A7C15ULL;
    uint64_t z = state_;
    z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
    z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
    return z ^ (z >> 31);
}

uint64_t SplitMix64::uniform(uint64_t bound) {
    if (bound == 0) throw InvalidConfiguration("uniform draw with empty range");
    // Reject the low (2^64 mod bound) values so the modulo is unbiased
    const uint64_t threshold = (0 - bound) % bound;
    for (;;) {
        uint64_t r = next();
        if (r >= threshold) return r % bound;
    }
}

SourceSelection select_sources(uint32_t seed, const DegreeTable& table) {
    const std::size_t chunk_count = table.chunk_count();
    SplitMix64 rng(seed);

    SourceSelection sel;
    sel.degree = table.degree_for(static_cast<uint32_t>(rng.next() >> (64 - DegreeTable::VALUE_BITS)));
    if (sel.degree < 1 || sel.degree > chunk_count)
        throw InvalidConfiguration("seed " + std::to_string(seed) + " produced degree " +
                                   std::to_string(sel.degree) + " for " +
                                   std::to_string(chunk_count) + " chunks");

    // Floyd's sampling: exactly `degree` distinct draws, no retries on collision
    std::set<uint32_t> chosen;
    for (std::size_t j = chunk_count - sel.degree; j < chunk_count; ++j) {
        auto t = static_cast<uint32_t>(rng.uniform(j + 1));
        if (!chosen.insert(t).second)
            chosen.insert(static_cast<uint32_t>(j));
    }

    sel.indices.assign(chosen.begin(), chosen.end());
    return sel;
}

SourceSelection select_sources(uint32_t seed, std::size_t chunk_count) {
    return select_sources(seed, DegreeTable(chunk_count));
}
