#include "strand_codec.hpp"
#include "symbol_mapper.hpp"
#include "slicer.hpp"
#include "fountain_config.hpp"
#include "fountain_errors.hpp"
#include "logging.hpp"
#include <iostream>
#include <limits>
#include <sstream>

static constexpr const char* HEADER_TAG = "#dnafountain";

std::string SessionInfo::to_header() const {
    std::ostringstream os;
    os << HEADER_TAG << " chunk_bits=" << chunk_bits << " chunk_count=" << chunk_count
       << " bytes=" << message_bytes;
    return os.str();
}

static unsigned long long parse_field(const std::string& token, const std::string& key) {
    std::string prefix = key + "=";
    if (token.compare(0, prefix.size(), prefix) != 0)
        throw InvalidConfiguration("expected '" + key + "=' in session header, got '" + token + "'");

    std::string digits = token.substr(prefix.size());
    if (digits.empty() || digits.find_first_not_of("0123456789") != std::string::npos)
        throw InvalidConfiguration("session header field '" + key + "' is not a number");
    try {
        return std::stoull(digits);
    } catch (const std::out_of_range&) {
        throw InvalidConfiguration("session header field '" + key + "' out of range");
    }
}

SessionInfo parse_session_header(const std::string& line) {
    std::istringstream is(line);
    std::string tag, bits_tok, count_tok, bytes_tok, extra;
    if (!(is >> tag >> bits_tok >> count_tok >> bytes_tok) || tag != HEADER_TAG || (is >> extra))
        throw InvalidConfiguration("malformed session header: '" + line + "'");

    unsigned long long bits = parse_field(bits_tok, "chunk_bits");
    if (bits > static_cast<unsigned long long>(std::numeric_limits<int>::max()))
        throw InvalidConfiguration("chunk_bits out of range in session header");

    SessionInfo info;
    info.chunk_bits = static_cast<int>(bits);
    info.chunk_count = parse_field(count_tok, "chunk_count");
    info.message_bytes = parse_field(bytes_tok, "bytes");

    if (chunk_count_for(info.message_bytes, info.chunk_bits) != info.chunk_count)
        throw InvalidConfiguration("session header says " + std::to_string(info.chunk_count) +
                                   " chunks but " + std::to_string(info.message_bytes) + " bytes at " +
                                   std::to_string(info.chunk_bits) + " bits need " +
                                   std::to_string(chunk_count_for(info.message_bytes, info.chunk_bits)));
    return info;
}

std::string seed_to_symbols(uint32_t seed, int seed_symbols) {
    if (seed_symbols <= 0 || seed_symbols > MAX_SEED_SYMBOLS)
        throw InvalidConfiguration("seed field of " + std::to_string(seed_symbols) + " symbols");
    if (seed_symbols < 16 && (static_cast<uint64_t>(seed) >> (2 * seed_symbols)) != 0)
        throw InvalidConfiguration("seed " + std::to_string(seed) + " does not fit in " +
                                   std::to_string(seed_symbols) + " symbols");

    std::string out(seed_symbols, SYMBOL_ALPHABET[0]);
    uint64_t v = seed;
    for (int i = seed_symbols - 1; i >= 0 && v != 0; --i) {
        out[i] = SYMBOL_ALPHABET[v & 3];
        v >>= 2;
    }
    return out;
}

uint32_t seed_from_symbols(const std::string& symbols) {
    uint64_t v = 0;
    for (std::size_t i = 0; i < symbols.size(); ++i) {
        int s = symbol_value(symbols[i]);
        if (s < 0) throw InvalidSymbol(symbols[i], i);
        if (v > (std::numeric_limits<uint32_t>::max() >> 2))
            throw InvalidConfiguration("seed field '" + symbols + "' exceeds 32 bits");
        v = (v << 2) | static_cast<uint64_t>(s);
    }
    return static_cast<uint32_t>(v);
}

std::string strand_from_droplet(const EncodedDroplet& droplet, int seed_symbols) {
    return seed_to_symbols(droplet.seed, seed_symbols) + droplet.symbols;
}

EncodedDroplet droplet_from_strand(const std::string& strand, int seed_symbols, int chunk_bits) {
    check_chunk_bits(chunk_bits);
    std::size_t expected = static_cast<std::size_t>(seed_symbols) + chunk_bits / 2;
    if (seed_symbols <= 0 || strand.size() != expected)
        throw InvalidConfiguration("strand of " + std::to_string(strand.size()) +
                                   " symbols, expected " + std::to_string(expected));

    EncodedDroplet d;
    d.seed = seed_from_symbols(strand.substr(0, seed_symbols));
    d.symbols = strand.substr(seed_symbols);
    for (std::size_t i = 0; i < d.symbols.size(); ++i) {
        if (symbol_value(d.symbols[i]) < 0) throw InvalidSymbol(d.symbols[i], seed_symbols + i);
    }
    return d;
}

std::string join_strands(const std::vector<EncodedDroplet>& droplets, int seed_symbols) {
    std::string out;
    for (const auto& d : droplets)
        out += strand_from_droplet(d, seed_symbols);
    return out;
}

std::vector<EncodedDroplet> split_strands(const std::string& text, int seed_symbols, int chunk_bits) {
    check_chunk_bits(chunk_bits);
    if (seed_symbols <= 0)
        throw InvalidConfiguration("seed field of " + std::to_string(seed_symbols) + " symbols");

    std::size_t segment = static_cast<std::size_t>(seed_symbols) + chunk_bits / 2;
    std::vector<EncodedDroplet> out;
    out.reserve(text.size() / segment);

    std::size_t offset = 0;
    for (; offset + segment <= text.size(); offset += segment)
        out.push_back(droplet_from_strand(text.substr(offset, segment), seed_symbols, chunk_bits));

    if (offset < text.size() && log_enabled(LogLevel::Warning)) {
        std::cerr << "[strand] Ignoring trailing partial strand of " << (text.size() - offset)
                  << " symbols" << std::endl;
    }
    return out;
}
