#include "fountain.hpp"
#include "droplet_encoder.hpp"
#include "peeling_decoder.hpp"
#include "reassembler.hpp"
#include "symbol_mapper.hpp"
#include "slicer.hpp"
#include "fountain_errors.hpp"
#include "logging.hpp"
#include <iostream>
#include <limits>

EncodedDroplet to_encoded(const DropletRecord& droplet) {
    EncodedDroplet e;
    e.seed = droplet.seed;
    e.symbols = to_symbols(droplet.payload);
    return e;
}

DropletRecord from_encoded(const EncodedDroplet& droplet) {
    DropletRecord d;
    d.seed = droplet.seed;
    d.payload = to_bits(droplet.symbols);
    return d;
}

static std::vector<EncodedDroplet> encode_range(const std::vector<uint8_t>& message, int chunk_bits,
                                                std::size_t droplet_count, int threads) {
    check_chunk_bits(chunk_bits);
    std::vector<EncodedDroplet> out;
    if (message.empty() || droplet_count == 0) return out;

    DropletEncoder encoder = DropletEncoder::from_message(message, chunk_bits);
    std::vector<DropletRecord> records = threads > 1
        ? encoder.generate_parallel(0, droplet_count, threads)
        : encoder.generate(0, droplet_count);

    out.reserve(records.size());
    for (const auto& r : records) out.push_back(to_encoded(r));

    if (log_enabled(LogLevel::Info)) {
        std::cerr << "[encoder] " << message.size() << " bytes -> " << encoder.chunk_count()
                  << " chunks of " << chunk_bits << " bits -> " << out.size() << " droplets" << std::endl;
    }
    return out;
}

std::vector<EncodedDroplet> encode(const std::vector<uint8_t>& message, int chunk_bits,
                                   std::size_t droplet_count) {
    return encode_range(message, chunk_bits, droplet_count, 1);
}

std::vector<uint8_t> decode(const std::vector<EncodedDroplet>& droplets, std::size_t chunk_count,
                            std::size_t original_byte_length, bool strict) {
    if (chunk_count == 0) {
        if (original_byte_length != 0)
            throw InvalidConfiguration("zero chunks cannot hold " + std::to_string(original_byte_length) +
                                       " bytes");
        return {};
    }
    if (droplets.empty()) throw InsufficientDroplets(chunk_count, chunk_count);

    std::size_t chunk_bits = droplets.front().symbols.size() * 2;
    if (chunk_bits == 0 || chunk_bits > static_cast<std::size_t>(std::numeric_limits<int>::max()))
        throw InvalidConfiguration("droplet " + std::to_string(droplets.front().seed) +
                                   " has an unusable payload length");
    if (chunk_count_for(original_byte_length, static_cast<int>(chunk_bits)) != chunk_count)
        throw InvalidConfiguration(std::to_string(chunk_count) + " chunks of " + std::to_string(chunk_bits) +
                                   " bits do not match a " + std::to_string(original_byte_length) +
                                   " byte message");

    PeelingDecoder decoder(chunk_count, chunk_bits, strict);
    for (const auto& d : droplets) {
        if (!decoder.add_droplet(from_encoded(d))) continue;
        // Strict sessions keep checking the rest against the solution
        if (decoder.solved() && !strict) break;
    }

    if (decoder.finish() != DecodeState::Solved)
        throw InsufficientDroplets(decoder.unresolved_count(), chunk_count);
    return finish_message(decoder, original_byte_length);
}

EncodedMessage encode_message(const std::vector<uint8_t>& message, const FountainConfig& config) {
    config.validate();

    EncodedMessage out;
    out.session.chunk_bits = config.chunk_bits;
    out.session.message_bytes = message.size();
    out.session.chunk_count = chunk_count_for(message.size(), config.chunk_bits);
    out.droplets = encode_range(message, config.chunk_bits,
                                config.droplet_count(out.session.chunk_count), config.threads);
    return out;
}

std::vector<uint8_t> decode_message(const EncodedMessage& encoded, bool strict) {
    for (const auto& d : encoded.droplets) {
        if (d.symbols.size() * 2 != static_cast<std::size_t>(encoded.session.chunk_bits))
            throw InvalidConfiguration("droplet " + std::to_string(d.seed) + " has " +
                                       std::to_string(d.symbols.size()) + " symbols, session uses " +
                                       std::to_string(encoded.session.chunk_bits) + " bit chunks");
    }
    return decode(encoded.droplets, encoded.session.chunk_count, encoded.session.message_bytes, strict);
}
