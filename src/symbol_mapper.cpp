#include "symbol_mapper.hpp"
#include "fountain_errors.hpp"

int symbol_value(char symbol) {
    switch (symbol) {
        case 'A': return 0;
        case 'C': return 1;
        case 'G': return 2;
        case 'T': return 3;
        default: return -1;
    }
}

std::string to_symbols(const BitBuffer& bits) {
    if (bits.size() % 2 != 0)
        throw InvalidConfiguration("symbol mapping needs an even bit count, got " +
                                   std::to_string(bits.size()));

    std::string out;
    out.reserve(bits.size() / 2);
    for (std::size_t i = 0; i < bits.size(); i += 2) {
        int v = (bits.get(i) ? 2 : 0) | (bits.get(i + 1) ? 1 : 0);
        out.push_back(SYMBOL_ALPHABET[v]);
    }
    return out;
}

BitBuffer to_bits(const std::string& symbols) {
    BitBuffer out(symbols.size() * 2);
    for (std::size_t i = 0; i < symbols.size(); ++i) {
        int v = symbol_value(symbols[i]);
        if (v < 0) throw InvalidSymbol(symbols[i], i);
        out.set(2 * i, (v & 2) != 0);
        out.set(2 * i + 1, (v & 1) != 0);
    }
    return out;
}
