#pragma once
#include "bit_buffer.hpp"
#include <vector>
#include <cstdint>
#include <cstddef>

// ceil(message_bytes * 8 / chunk_bits)
std::size_t chunk_count_for(std::size_t message_bytes, int chunk_bits);

// Slice message bits into chunk_bits-sized chunks, last one zero padded
std::vector<BitBuffer> slice_message(const std::vector<uint8_t>& message, int chunk_bits);

// Concatenate chunks in index order and cut back to the original byte length.
// original_byte_length travels out of band, it is the only way to drop the padding.
std::vector<uint8_t> reassemble_message(const std::vector<BitBuffer>& chunks,
                                        std::size_t original_byte_length);
