#ifndef DNAFOUNTAIN_FOUNTAIN_ERRORS_HPP
#define DNAFOUNTAIN_FOUNTAIN_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <cstddef>

class FountainError : public std::runtime_error {
public:
    explicit FountainError(const std::string& what) : std::runtime_error(what) {}
};

// Setup bug: bad chunk size, degree out of range, mismatched session parameters
class InvalidConfiguration : public FountainError {
public:
    explicit InvalidConfiguration(const std::string& what)
        : FountainError("invalid configuration: " + what) {}
};

class InvalidSymbol : public FountainError {
public:
    InvalidSymbol(char symbol, std::size_t position)
        : FountainError("invalid symbol '" + std::string(1, symbol) + "' at position " +
                        std::to_string(position)),
          symbol_(symbol), position_(position) {}

    char symbol() const { return symbol_; }
    std::size_t position() const { return position_; }

private:
    char symbol_;
    std::size_t position_;
};

class IntegrityMismatch : public FountainError {
public:
    explicit IntegrityMismatch(unsigned seed)
        : FountainError("droplet " + std::to_string(seed) +
                        " contradicts already resolved chunks"),
          seed_(seed) {}

    unsigned seed() const { return seed_; }

private:
    unsigned seed_;
};

// Expected outcome: the caller can regenerate more droplets and retry
class InsufficientDroplets : public FountainError {
public:
    InsufficientDroplets(std::size_t unresolved, std::size_t chunk_count)
        : FountainError("decoding stalled with " + std::to_string(unresolved) + " of " +
                        std::to_string(chunk_count) + " chunks unresolved"),
          unresolved_(unresolved) {}

    std::size_t unresolved() const { return unresolved_; }

private:
    std::size_t unresolved_;
};

class DecodeIncomplete : public FountainError {
public:
    DecodeIncomplete()
        : FountainError("reassembly requested before all chunks were resolved") {}
};

#endif // DNAFOUNTAIN_FOUNTAIN_ERRORS_HPP
