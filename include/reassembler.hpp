#pragma once
#include "peeling_decoder.hpp"
#include <vector>
#include <cstdint>
#include <cstddef>

// Message of a solved session. Throws DecodeIncomplete if the decoder is not Solved.
std::vector<uint8_t> finish_message(const PeelingDecoder& decoder, std::size_t original_byte_length);
