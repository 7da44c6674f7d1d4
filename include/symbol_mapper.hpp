#pragma once
#include "bit_buffer.hpp"
#include <string>

// Bit pairs are read MSB-first: 00 -> A, 01 -> C, 10 -> G, 11 -> T.
// Case-sensitive; this table is the wire contract between encoder and decoder builds.
constexpr char SYMBOL_ALPHABET[4] = {'A', 'C', 'G', 'T'};

// Requires an even number of bits
std::string to_symbols(const BitBuffer& bits);

// Exact inverse. Throws InvalidSymbol on anything outside the alphabet.
BitBuffer to_bits(const std::string& symbols);

// 0..3 for a valid symbol, -1 otherwise
int symbol_value(char symbol);
