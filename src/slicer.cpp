#include "slicer.hpp"
#include "fountain_config.hpp"
#include "fountain_errors.hpp"

std::size_t chunk_count_for(std::size_t message_bytes, int chunk_bits) {
    check_chunk_bits(chunk_bits);
    std::size_t bits = message_bytes * 8;
    return (bits + chunk_bits - 1) / chunk_bits;
}

std::vector<BitBuffer> slice_message(const std::vector<uint8_t>& message, int chunk_bits) {
    std::vector<BitBuffer> chunks;
    std::size_t total_chunks = chunk_count_for(message.size(), chunk_bits);
    if (total_chunks == 0) return chunks;

    BitBuffer bits = BitBuffer::from_bytes(message);
    chunks.reserve(total_chunks);
    for (std::size_t i = 0; i < total_chunks; ++i)
        chunks.push_back(bits.slice(i * chunk_bits, chunk_bits));

    return chunks;
}

std::vector<uint8_t> reassemble_message(const std::vector<BitBuffer>& chunks,
                                        std::size_t original_byte_length) {
    BitBuffer joined;
    for (const auto& c : chunks) joined.append(c);

    if (joined.size() < original_byte_length * 8)
        throw InvalidConfiguration("chunks hold " + std::to_string(joined.size()) +
                                   " bits, fewer than the " + std::to_string(original_byte_length) +
                                   " byte message");
    return joined.to_bytes(original_byte_length);
}
