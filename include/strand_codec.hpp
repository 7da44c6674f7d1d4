#pragma once
#include "droplet.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// Strand layout (all symbols from SYMBOL_ALPHABET):
// [0 .. seed_symbols)            seed, big endian, 2 bits per symbol
// [seed_symbols .. +chunk_bits/2) payload symbols

// Out-of-band parameters a decoder needs besides the strands
struct SessionInfo {
    int chunk_bits = 0;
    std::size_t chunk_count = 0;
    std::size_t message_bytes = 0;

    // "#dnafountain chunk_bits=8 chunk_count=4 bytes=4"
    std::string to_header() const;
};

// Throws InvalidConfiguration on a malformed or inconsistent header
SessionInfo parse_session_header(const std::string& line);

std::string seed_to_symbols(uint32_t seed, int seed_symbols);
uint32_t seed_from_symbols(const std::string& symbols);

std::string strand_from_droplet(const EncodedDroplet& droplet, int seed_symbols);
EncodedDroplet droplet_from_strand(const std::string& strand, int seed_symbols, int chunk_bits);

// All strands back to back, the single-string form of a droplet stream
std::string join_strands(const std::vector<EncodedDroplet>& droplets, int seed_symbols);

// Inverse of join_strands; a trailing partial strand is skipped with a warning
std::vector<EncodedDroplet> split_strands(const std::string& text, int seed_symbols, int chunk_bits);
