#define BOOST_TEST_MODULE fountain_tests
#include <boost/test/unit_test.hpp>

#include "fountain.hpp"
#include "slicer.hpp"
#include "fountain_errors.hpp"
#include <cstdint>
#include <string>
#include <vector>

static std::vector<uint8_t> bytes_of(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

BOOST_AUTO_TEST_SUITE(fountain_suite)

BOOST_AUTO_TEST_CASE(four_byte_scenario) {
    const std::vector<uint8_t> msg = {0x0F, 0xF0, 0xAA, 0x55};
    auto droplets = encode(msg, 8, 10);
    BOOST_TEST(droplets.size() == 10u);
    BOOST_TEST(droplets[0].symbols == "GGGG");
    BOOST_TEST(droplets[3].symbols == "TTAA");
    BOOST_TEST(decode(droplets, 4, msg.size()) == msg);
}

BOOST_AUTO_TEST_CASE(roundtrip_various_chunk_sizes) {
    const auto msg = bytes_of("hello fountain");
    for (int bits : {6, 8, 32}) {
        std::size_t k = chunk_count_for(msg.size(), bits);
        auto droplets = encode(msg, bits, k * 3);
        BOOST_TEST(decode(droplets, k, msg.size()) == msg);
    }
}

BOOST_AUTO_TEST_CASE(roundtrip_binary_payload) {
    std::vector<uint8_t> msg(1000);
    uint32_t x = 2463534242u;
    for (auto& b : msg) {
        x ^= x << 13; x ^= x >> 17; x ^= x << 5;
        b = static_cast<uint8_t>(x);
    }
    auto droplets = encode(msg, 64, 125 * 3);
    BOOST_TEST(decode(droplets, 125, msg.size()) == msg);
}

BOOST_AUTO_TEST_CASE(encoding_is_deterministic) {
    const auto msg = bytes_of("deterministic droplets");
    BOOST_CHECK(encode(msg, 16, 30) == encode(msg, 16, 30));
    auto first = encode(msg, 16, 10);
    auto longer = encode(msg, 16, 30);
    for (std::size_t i = 0; i < first.size(); ++i) BOOST_CHECK(first[i] == longer[i]);
}

BOOST_AUTO_TEST_CASE(zero_droplets_insufficient) {
    BOOST_CHECK_EXCEPTION(decode({}, 4, 4), InsufficientDroplets,
                          [](const InsufficientDroplets& e) { return e.unresolved() == 4; });
}

BOOST_AUTO_TEST_CASE(stalled_stream_reports_unresolved) {
    const std::vector<uint8_t> msg = {0x0F, 0xF0, 0xAA, 0x55};
    auto all = encode(msg, 8, 3);
    std::vector<EncodedDroplet> chain = {all[1], all[2]}; // {1,2} and {2,3}: nothing peels
    BOOST_CHECK_EXCEPTION(decode(chain, 4, 4), InsufficientDroplets,
                          [](const InsufficientDroplets& e) { return e.unresolved() == 4; });

    // More droplets from the same seed sequence finish the job
    BOOST_TEST(decode(encode(msg, 8, 10), 4, 4) == msg);
}

BOOST_AUTO_TEST_CASE(duplicate_droplets_same_message) {
    const auto msg = bytes_of("duplicates");
    auto droplets = encode(msg, 8, 30);
    auto doubled = droplets;
    doubled.push_back(droplets[4]);
    doubled.insert(doubled.begin(), droplets[7]);
    BOOST_TEST(decode(doubled, 10, msg.size()) == decode(droplets, 10, msg.size()));
}

BOOST_AUTO_TEST_CASE(empty_message) {
    BOOST_TEST(encode({}, 8, 10).empty());
    BOOST_TEST(decode({}, 0, 0).empty());
    BOOST_CHECK_THROW(decode({}, 0, 3), InvalidConfiguration);
}

BOOST_AUTO_TEST_CASE(mismatched_session_parameters) {
    const std::vector<uint8_t> msg = {0x0F, 0xF0, 0xAA, 0x55};
    auto droplets = encode(msg, 8, 10);
    BOOST_CHECK_THROW(decode(droplets, 5, 4), InvalidConfiguration);
    BOOST_CHECK_THROW(decode(droplets, 4, 9), InvalidConfiguration);

    droplets[2].symbols += "AC";
    BOOST_CHECK_THROW(decode(droplets, 4, 4), InvalidConfiguration);
}

BOOST_AUTO_TEST_CASE(corrupt_symbol_surfaces) {
    const std::vector<uint8_t> msg = {0x0F, 0xF0, 0xAA, 0x55};
    auto droplets = encode(msg, 8, 10);
    droplets[0].symbols[1] = 'U';
    BOOST_CHECK_THROW(decode(droplets, 4, 4), InvalidSymbol);
}

BOOST_AUTO_TEST_CASE(invalid_chunk_size) {
    BOOST_CHECK_THROW(encode({1, 2}, 0, 4), InvalidConfiguration);
    BOOST_CHECK_THROW(encode({1, 2}, 3, 4), InvalidConfiguration);
}

BOOST_AUTO_TEST_CASE(config_driven_roundtrip) {
    FountainConfig config;
    config.chunk_bits = 8;
    config.threads = 4;
    const auto msg = bytes_of("hello fountain");

    EncodedMessage encoded = encode_message(msg, config);
    BOOST_TEST(encoded.session.chunk_count == 14u);
    BOOST_TEST(encoded.session.message_bytes == msg.size());
    BOOST_TEST(encoded.droplets.size() == 42u);
    BOOST_CHECK(encoded.droplets == encode(msg, 8, 42));
    BOOST_TEST(decode_message(encoded, true) == msg);
}

BOOST_AUTO_TEST_SUITE_END()
