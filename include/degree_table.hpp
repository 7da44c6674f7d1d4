#ifndef DNAFOUNTAIN_DEGREE_TABLE_HPP
#define DNAFOUNTAIN_DEGREE_TABLE_HPP

#include <cstdint>
#include <cstddef>
#include <vector>

/*
    Degree distribution for one chunk count K, as cumulative thresholds on a
    2^20 scale. Degree 1 takes 1/min(K, 4) of the mass so that short
    messages peel early. Degrees 2..K follow the ideal soliton tail
    1/(d(d-1)) rescaled into the remainder:

        cdf[d] = P1 + (2^20 - P1) * K * (d - 1) / (d * (K - 1)),  cdf[K] = 2^20

    Everything is integer arithmetic, so every build produces the same table.
*/
class DegreeTable {
public:
    static constexpr uint32_t VALUE_BITS = 20;
    static constexpr uint32_t VALUE_RANGE = 1u << VALUE_BITS;
    static constexpr uint32_t DEGREE_ONE_DIVISOR = 4;
    static constexpr std::size_t MAX_CHUNK_COUNT = std::size_t(1) << 21; // keeps cdf math inside 64 bits

    explicit DegreeTable(std::size_t chunk_count);

    std::size_t chunk_count() const { return chunk_count_; }

    // value is reduced to its low VALUE_BITS bits. Result is in [1, chunk_count].
    std::size_t degree_for(uint32_t value) const;

    // Mass of degree d out of VALUE_RANGE
    uint32_t weight(std::size_t degree) const;

private:
    std::size_t chunk_count_;
    std::vector<uint32_t> cdf_; // cdf_[d] = first value mapping above degree d
};

// One-shot lookup without keeping a table around
std::size_t degree_for(uint32_t value, std::size_t chunk_count);

#endif // DNAFOUNTAIN_DEGREE_TABLE_HPP
