#include "degree_table.hpp"
#include "fountain_errors.hpp"
#include <algorithm>

DegreeTable::DegreeTable(std::size_t chunk_count) : chunk_count_(chunk_count) {
    if (chunk_count == 0)
        throw InvalidConfiguration("degree table needs at least one chunk");
    if (chunk_count > MAX_CHUNK_COUNT)
        throw InvalidConfiguration(std::to_string(chunk_count) + " chunks exceed the table limit of " +
                                   std::to_string(MAX_CHUNK_COUNT));

    const uint64_t K = chunk_count;
    const uint64_t p1 = K == 1 ? VALUE_RANGE : VALUE_RANGE / std::min<uint64_t>(K, DEGREE_ONE_DIVISOR);
    const uint64_t rest = VALUE_RANGE - p1;

    cdf_.resize(K + 1);
    cdf_[0] = 0;
    for (uint64_t d = 1; d < K; ++d)
        cdf_[d] = static_cast<uint32_t>(p1 + rest * K * (d - 1) / (d * (K - 1)));
    cdf_[K] = VALUE_RANGE;
}

std::size_t DegreeTable::degree_for(uint32_t value) const {
    value &= VALUE_RANGE - 1;
    // First degree whose cumulative threshold lies above value
    auto it = std::upper_bound(cdf_.begin() + 1, cdf_.end(), value);
    auto degree = static_cast<std::size_t>(it - cdf_.begin());

    if (degree < 1 || degree > chunk_count_)
        throw InvalidConfiguration("degree " + std::to_string(degree) + " outside [1, " +
                                   std::to_string(chunk_count_) + "]");
    return degree;
}

uint32_t DegreeTable::weight(std::size_t degree) const {
    if (degree < 1 || degree > chunk_count_) return 0;
    return cdf_[degree] - cdf_[degree - 1];
}

std::size_t degree_for(uint32_t value, std::size_t chunk_count) {
    return DegreeTable(chunk_count).degree_for(value);
}
