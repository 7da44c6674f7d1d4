#pragma once
#include <vector>
#include <cstdint>
#include <cstddef>
#include <string>

// Fixed-length bit string packed MSB-first. Bits past size() in the last byte are always zero.
class BitBuffer {
public:
    BitBuffer() = default;
    explicit BitBuffer(std::size_t bit_count);

    static BitBuffer from_bytes(const std::vector<uint8_t>& bytes);

    std::size_t size() const { return bits_; }
    bool empty() const { return bits_ == 0; }

    bool get(std::size_t index) const;
    void set(std::size_t index, bool value);
    void push_back(bool value);
    void append(const BitBuffer& other);

    // Copy of [offset, offset + count). Positions past the end read as zero.
    BitBuffer slice(std::size_t offset, std::size_t count) const;

    // this ^= other; both must have the same length
    void xor_with(const BitBuffer& other);
    bool is_zero() const;

    const std::vector<uint8_t>& bytes() const { return bytes_; }

    // First byte_count bytes of the packed form, zero-extended if shorter
    std::vector<uint8_t> to_bytes(std::size_t byte_count) const;

    std::string to_string() const; // "0110..."

    bool operator==(const BitBuffer& other) const {
        return bits_ == other.bits_ && bytes_ == other.bytes_;
    }
    bool operator!=(const BitBuffer& other) const { return !(*this == other); }

private:
    std::vector<uint8_t> bytes_;
    std::size_t bits_ = 0;
};
