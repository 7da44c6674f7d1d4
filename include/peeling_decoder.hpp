#ifndef DNAFOUNTAIN_PEELING_DECODER_HPP
#define DNAFOUNTAIN_PEELING_DECODER_HPP

#include "droplet.hpp"
#include "degree_table.hpp"
#include <cstdint>
#include <cstddef>
#include <deque>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

enum class DecodeState { Collecting, Solved, Stalled };

const char* decode_state_name(DecodeState state);

/*
    One decoding session. Every droplet is expanded to its source set and
    reduced by the chunks already known; droplets left with a single unknown
    source go on a ready queue. Draining the queue resolves chunks, which in
    turn reduces every droplet that references them.

    Invariant: a live droplet's payload is the XOR of the true values of the
    sources still in its residual set.
*/
class PeelingDecoder {
public:
    PeelingDecoder(std::size_t chunk_count, std::size_t chunk_bits, bool strict = false);

    // false if this seed was already seen (nothing changes).
    // Throws InvalidConfiguration on a payload of the wrong length,
    // IntegrityMismatch in strict mode when the droplet contradicts known chunks.
    // A contradiction leaves the session corrupt: it settles on Stalled and
    // every later droplet throws IntegrityMismatch for the offending seed.
    bool add_droplet(const DropletRecord& droplet);
    bool add_symbols(uint32_t seed, const std::string& symbols);

    // No more droplets coming: settles on Solved or Stalled
    DecodeState finish();

    DecodeState state() const { return state_; }
    bool solved() const { return state_ == DecodeState::Solved; }
    bool corrupt() const { return corrupt_; }

    std::size_t chunk_count() const { return chunk_count_; }
    std::size_t chunk_bits() const { return chunk_bits_; }
    std::size_t resolved_count() const { return resolved_count_; }
    std::size_t unresolved_count() const { return chunk_count_ - resolved_count_; }
    std::size_t droplets_seen() const { return seen_seeds_.size(); }
    std::size_t live_droplets() const { return live_count_; }
    bool is_resolved(std::size_t index) const { return resolved_.at(index); }

    // Throws DecodeIncomplete unless solved
    const std::vector<BitBuffer>& chunks() const;

private:
    struct LiveDroplet {
        uint32_t seed = 0;
        std::vector<uint32_t> residual;
        BitBuffer payload;
        bool alive = true;
    };

    void resolve(uint32_t index, const BitBuffer& value);
    void retire(std::size_t slot);
    void drain_ready();
    [[noreturn]] void fail(uint32_t seed);

    std::size_t chunk_count_;
    std::size_t chunk_bits_;
    bool strict_;
    std::optional<DegreeTable> table_; // absent for an empty message

    std::vector<BitBuffer> chunks_;
    std::vector<bool> resolved_;
    std::size_t resolved_count_ = 0;

    std::vector<LiveDroplet> droplets_;           // arena, indexed by slot
    std::vector<std::vector<std::size_t>> refs_;  // chunk index -> slots that still need it
    std::deque<std::size_t> ready_;               // slots with residual degree 1
    std::size_t live_count_ = 0;

    std::unordered_set<uint32_t> seen_seeds_;
    DecodeState state_ = DecodeState::Collecting;
    bool corrupt_ = false;
    uint32_t mismatch_seed_ = 0;
};

#endif // DNAFOUNTAIN_PEELING_DECODER_HPP
