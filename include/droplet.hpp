#pragma once
#include "bit_buffer.hpp"
#include <cstdint>
#include <string>

// Binary droplet: payload is the XOR of the chunks picked by seed
struct DropletRecord {
    uint32_t seed = 0;
    BitBuffer payload;
};

// Droplet as it travels outside the codec, payload rendered over {A,C,G,T}
struct EncodedDroplet {
    uint32_t seed = 0;
    std::string symbols;

    bool operator==(const EncodedDroplet& other) const {
        return seed == other.seed && symbols == other.symbols;
    }
};
