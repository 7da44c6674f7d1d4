#pragma once
#include "droplet.hpp"
#include "strand_codec.hpp"
#include "fountain_config.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

EncodedDroplet to_encoded(const DropletRecord& droplet);
DropletRecord from_encoded(const EncodedDroplet& droplet);

// Droplets for seeds 0 .. droplet_count - 1. An empty message gives no droplets.
std::vector<EncodedDroplet> encode(const std::vector<uint8_t>& message, int chunk_bits,
                                   std::size_t droplet_count);

// Chunk size is taken from the droplets' symbol length.
// Throws InsufficientDroplets when the droplets do not cover every chunk.
std::vector<uint8_t> decode(const std::vector<EncodedDroplet>& droplets, std::size_t chunk_count,
                            std::size_t original_byte_length, bool strict = false);

struct EncodedMessage {
    SessionInfo session;
    std::vector<EncodedDroplet> droplets;
};

// Droplet count and threading taken from config
EncodedMessage encode_message(const std::vector<uint8_t>& message, const FountainConfig& config);
std::vector<uint8_t> decode_message(const EncodedMessage& encoded, bool strict = false);
