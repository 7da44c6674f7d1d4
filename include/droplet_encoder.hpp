#pragma once
#include "droplet.hpp"
#include "degree_table.hpp"
#include <vector>
#include <cstdint>
#include <cstddef>

// XOR the chunks picked by `seed`. Same chunks and seed always give the same record.
DropletRecord encode_droplet(const std::vector<BitBuffer>& chunks, uint32_t seed);

// Owns the chunk set of one session. Any seed can be requested any number of times.
class DropletEncoder {
public:
    explicit DropletEncoder(std::vector<BitBuffer> chunks);

    static DropletEncoder from_message(const std::vector<uint8_t>& message, int chunk_bits);

    std::size_t chunk_count() const { return chunks_.size(); }
    std::size_t chunk_bits() const { return chunks_.front().size(); }

    DropletRecord droplet(uint32_t seed) const;

    // Seeds first_seed .. first_seed + count - 1, in order
    std::vector<DropletRecord> generate(uint32_t first_seed, std::size_t count) const;

    // Same output as generate(), seed range split across worker threads
    std::vector<DropletRecord> generate_parallel(uint32_t first_seed, std::size_t count,
                                                 int threads) const;

private:
    std::vector<BitBuffer> chunks_;
    DegreeTable table_;
};
