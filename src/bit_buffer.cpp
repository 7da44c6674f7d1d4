#include "bit_buffer.hpp"
#include "fountain_errors.hpp"
#include <galois.h>
#include <algorithm>
#include <climits>

BitBuffer::BitBuffer(std::size_t bit_count)
    : bytes_((bit_count + 7) / 8, 0), bits_(bit_count) {}

BitBuffer BitBuffer::from_bytes(const std::vector<uint8_t>& bytes) {
    BitBuffer buf;
    buf.bytes_ = bytes;
    buf.bits_ = bytes.size() * 8;
    return buf;
}

bool BitBuffer::get(std::size_t index) const {
    if (index >= bits_) throw std::out_of_range("BitBuffer::get index out of range");
    return (bytes_[index / 8] >> (7 - index % 8)) & 1;
}

void BitBuffer::set(std::size_t index, bool value) {
    if (index >= bits_) throw std::out_of_range("BitBuffer::set index out of range");
    uint8_t mask = static_cast<uint8_t>(0x80 >> (index % 8));
    if (value)
        bytes_[index / 8] |= mask;
    else
        bytes_[index / 8] &= static_cast<uint8_t>(~mask);
}

void BitBuffer::push_back(bool value) {
    if (bits_ % 8 == 0) bytes_.push_back(0);
    ++bits_;
    set(bits_ - 1, value);
}

void BitBuffer::append(const BitBuffer& other) {
    if (bits_ % 8 == 0) {
        // Byte aligned: copy whole bytes, other's tail bits are already zero
        bytes_.insert(bytes_.end(), other.bytes_.begin(), other.bytes_.end());
        bits_ += other.bits_;
        return;
    }
    bytes_.reserve((bits_ + other.bits_ + 7) / 8);
    for (std::size_t i = 0; i < other.bits_; ++i)
        push_back(other.get(i));
}

BitBuffer BitBuffer::slice(std::size_t offset, std::size_t count) const {
    BitBuffer out(count);
    if (offset >= bits_) return out;

    std::size_t available = std::min(count, bits_ - offset);
    if (offset % 8 == 0) {
        std::size_t whole = available / 8;
        std::copy(bytes_.begin() + offset / 8, bytes_.begin() + offset / 8 + whole, out.bytes_.begin());
        for (std::size_t i = whole * 8; i < available; ++i)
            out.set(i, get(offset + i));
        return out;
    }
    for (std::size_t i = 0; i < available; ++i)
        out.set(i, get(offset + i));
    return out;
}

void BitBuffer::xor_with(const BitBuffer& other) {
    if (other.bits_ != bits_)
        throw InvalidConfiguration("cannot XOR bit strings of length " + std::to_string(bits_) +
                                   " and " + std::to_string(other.bits_));
    if (bytes_.empty()) return;
    if (bytes_.size() > static_cast<std::size_t>(INT_MAX))
        throw InvalidConfiguration("payload too large for region XOR");

    galois_region_xor(reinterpret_cast<char*>(const_cast<uint8_t*>(other.bytes_.data())),
                      reinterpret_cast<char*>(bytes_.data()),
                      static_cast<int>(bytes_.size()));
}

bool BitBuffer::is_zero() const {
    return std::all_of(bytes_.begin(), bytes_.end(), [](uint8_t b) { return b == 0; });
}

std::vector<uint8_t> BitBuffer::to_bytes(std::size_t byte_count) const {
    std::vector<uint8_t> out(byte_count, 0);
    std::copy_n(bytes_.begin(), std::min(byte_count, bytes_.size()), out.begin());
    return out;
}

std::string BitBuffer::to_string() const {
    std::string s;
    s.reserve(bits_);
    for (std::size_t i = 0; i < bits_; ++i)
        s.push_back(get(i) ? '1' : '0');
    return s;
}
