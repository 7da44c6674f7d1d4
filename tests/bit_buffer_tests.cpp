#define BOOST_TEST_MODULE bit_buffer_tests
#include <boost/test/unit_test.hpp>

#include "bit_buffer.hpp"
#include "fountain_errors.hpp"
#include <vector>
#include <cstdint>

BOOST_AUTO_TEST_SUITE(bit_buffer_suite)

BOOST_AUTO_TEST_CASE(from_bytes_is_msb_first) {
    BitBuffer b = BitBuffer::from_bytes({0x0F, 0x81});
    BOOST_TEST(b.size() == 16u);
    BOOST_TEST(b.to_string() == "0000111110000001");
    BOOST_TEST(b.get(4));
    BOOST_TEST(!b.get(3));
}

BOOST_AUTO_TEST_CASE(slice_pads_past_end_with_zero) {
    BitBuffer b = BitBuffer::from_bytes({0xAB});
    BOOST_TEST(b.slice(4, 4).to_string() == "1011");
    BOOST_TEST(b.slice(6, 6).to_string() == "110000");
    BOOST_TEST(b.slice(8, 4).to_string() == "0000");
    BOOST_TEST(b.slice(0, 8).bytes() == std::vector<uint8_t>{0xAB});
}

BOOST_AUTO_TEST_CASE(append_unaligned_keeps_tail_zero) {
    BitBuffer a = BitBuffer::from_bytes({0xFF}).slice(0, 6);
    a.append(BitBuffer::from_bytes({0xFF}).slice(0, 6));
    BOOST_TEST(a.size() == 12u);
    BOOST_TEST(a.bytes() == (std::vector<uint8_t>{0xFF, 0xF0}));
}

BOOST_AUTO_TEST_CASE(xor_matches_bytewise_xor) {
    BitBuffer a = BitBuffer::from_bytes({0x0F, 0xF0, 0xAA});
    BitBuffer b = BitBuffer::from_bytes({0xFF, 0x0F, 0xAA});
    a.xor_with(b);
    BOOST_TEST(a.bytes() == (std::vector<uint8_t>{0xF0, 0xFF, 0x00}));
    a.xor_with(a);
    BOOST_TEST(a.is_zero());
}

BOOST_AUTO_TEST_CASE(xor_rejects_length_mismatch) {
    BitBuffer a(8);
    BitBuffer b(10);
    BOOST_CHECK_THROW(a.xor_with(b), InvalidConfiguration);
}

BOOST_AUTO_TEST_CASE(to_bytes_truncates_and_extends) {
    BitBuffer b = BitBuffer::from_bytes({1, 2, 3});
    BOOST_TEST(b.to_bytes(2) == (std::vector<uint8_t>{1, 2}));
    BOOST_TEST(b.to_bytes(4) == (std::vector<uint8_t>{1, 2, 3, 0}));
}

BOOST_AUTO_TEST_CASE(out_of_range_access_throws) {
    BitBuffer b(3);
    BOOST_CHECK_THROW(b.get(3), std::out_of_range);
    BOOST_CHECK_THROW(b.set(5, true), std::out_of_range);
}

BOOST_AUTO_TEST_SUITE_END()
