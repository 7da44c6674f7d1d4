#include "self_test.hpp"
#include "fountain.hpp"
#include "strand_codec.hpp"
#include "fountain_errors.hpp"
#include "logging.hpp"
#include <cstdint>
#include <iostream>

const std::vector<std::string>& sample_messages() {
    static const std::vector<std::string> samples = {
        "01000001101011110000010110100101",
        "01010011110001001110011001001001",
        "01111000010010100110110001001110",
        "10001101110111100111000000111100",
        "11111110110010010001010110011110",
        "10001000100001011011111011101011",
        "01011010010100001110000110110110",
        "11101000111011000001001101001100",
        "01101110000100001110000001110101",
        "00100110011110010110101100100010",
        "10001010111101010000001001001011",
        "01010111010110011011001101010010",
    };
    return samples;
}

static std::vector<uint8_t> bits_to_bytes(const std::string& bits) {
    std::vector<uint8_t> out((bits.size() + 7) / 8, 0);
    for (std::size_t i = 0; i < bits.size(); ++i) {
        if (bits[i] == '1') out[i / 8] |= static_cast<uint8_t>(0x80 >> (i % 8));
    }
    return out;
}

static std::string bytes_to_bits(const std::vector<uint8_t>& bytes) {
    std::string out;
    for (uint8_t b : bytes) {
        for (int i = 7; i >= 0; --i) out.push_back(((b >> i) & 1) ? '1' : '0');
    }
    return out;
}

bool run_self_test(int chunk_bits, std::ostream& out) {
    out << "[TEST] Initializing fountain with chunk_bits=" << chunk_bits << "..." << std::endl;

    FountainConfig config;
    config.chunk_bits = chunk_bits;

    bool passed = true;
    for (const auto& sample : sample_messages()) {
        out << "[TEST] Testing binary message: " << sample << std::endl;

        if (sample.size() % 8 != 0) {
            out << "[ERROR] Message is not a whole number of bytes, skipping." << std::endl;
            continue;
        }
        std::vector<uint8_t> message = bits_to_bytes(sample);

        try {
            EncodedMessage encoded = encode_message(message, config);
            std::string decoded = bytes_to_bits(decode_message(encoded));
            out << "[TEST] Decoded  (droplets): " << decoded << std::endl;
            if (decoded != sample) {
                out << "[ERROR] Decoding failed for this message (droplets)." << std::endl;
                passed = false;
                break;
            }

            std::string strand = join_strands(encoded.droplets, config.seed_symbols);
            out << "[TEST] Full strand: " << strand << std::endl;

            EncodedMessage reparsed;
            reparsed.session = encoded.session;
            reparsed.droplets = split_strands(strand, config.seed_symbols, chunk_bits);
            std::string decoded_full = bytes_to_bits(decode_message(reparsed));
            out << "[TEST] Decoded (full strand): " << decoded_full << std::endl;
            if (decoded_full != sample) {
                out << "[ERROR] Decoding failed for this message (full strand)." << std::endl;
                passed = false;
                break;
            }
        } catch (const FountainError& e) {
            out << "[ERROR] " << e.what() << std::endl;
            passed = false;
            break;
        }
    }

    out << (passed ? "[TEST] All tests passed!" : "[TEST] Some tests failed.") << std::endl;
    return passed;
}
