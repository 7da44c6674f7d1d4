#include "peeling_decoder.hpp"
#include "seeded_selector.hpp"
#include "symbol_mapper.hpp"
#include "fountain_errors.hpp"
#include "logging.hpp"
#include <algorithm>
#include <iostream>

const char* decode_state_name(DecodeState state) {
    switch (state) {
        case DecodeState::Collecting: return "collecting";
        case DecodeState::Solved: return "solved";
        case DecodeState::Stalled: return "stalled";
    }
    return "unknown";
}

PeelingDecoder::PeelingDecoder(std::size_t chunk_count, std::size_t chunk_bits, bool strict)
    : chunk_count_(chunk_count), chunk_bits_(chunk_bits), strict_(strict),
      chunks_(chunk_count), resolved_(chunk_count, false), refs_(chunk_count) {
    if (chunk_bits == 0 || chunk_bits % 2 != 0)
        throw InvalidConfiguration("chunk size must be a positive even bit count, got " +
                                   std::to_string(chunk_bits));
    if (chunk_count > 0)
        table_.emplace(chunk_count);
    else
        state_ = DecodeState::Solved;
}

bool PeelingDecoder::add_symbols(uint32_t seed, const std::string& symbols) {
    DropletRecord d;
    d.seed = seed;
    d.payload = to_bits(symbols);
    return add_droplet(d);
}

bool PeelingDecoder::add_droplet(const DropletRecord& droplet) {
    if (corrupt_) throw IntegrityMismatch(mismatch_seed_);
    if (droplet.payload.size() != chunk_bits_)
        throw InvalidConfiguration("droplet " + std::to_string(droplet.seed) + " carries " +
                                   std::to_string(droplet.payload.size()) + " bits, session uses " +
                                   std::to_string(chunk_bits_));

    if (!seen_seeds_.insert(droplet.seed).second) {
        if (log_enabled(LogLevel::Debug))
            std::cerr << "[decoder] Duplicate droplet " << droplet.seed << " skipped" << std::endl;
        return false;
    }
    if (chunk_count_ == 0) return true;

    SourceSelection sel = select_sources(droplet.seed, *table_);

    // Reduce by everything already known
    LiveDroplet live;
    live.seed = droplet.seed;
    live.payload = droplet.payload;
    for (uint32_t idx : sel.indices) {
        if (resolved_[idx])
            live.payload.xor_with(chunks_[idx]);
        else
            live.residual.push_back(idx);
    }

    if (live.residual.empty()) {
        // Carries nothing new; in strict mode it must agree with what we have
        if (strict_ && !live.payload.is_zero()) fail(droplet.seed);
        if (log_enabled(LogLevel::Debug))
            std::cerr << "[decoder] Droplet " << droplet.seed << " fully covered, dropped" << std::endl;
        return true;
    }

    if (state_ == DecodeState::Stalled) state_ = DecodeState::Collecting;

    std::size_t slot = droplets_.size();
    for (uint32_t idx : live.residual) refs_[idx].push_back(slot);
    bool ready = live.residual.size() == 1;
    droplets_.push_back(std::move(live));
    ++live_count_;

    if (ready) {
        ready_.push_back(slot);
        drain_ready();
    }
    return true;
}

void PeelingDecoder::drain_ready() {
    while (!ready_.empty()) {
        std::size_t slot = ready_.front();
        ready_.pop_front();

        LiveDroplet& d = droplets_[slot];
        if (!d.alive) continue;

        // Another droplet resolved our last source while we were queued
        if (d.residual.empty()) {
            if (strict_ && !d.payload.is_zero()) fail(d.seed);
            retire(slot);
            continue;
        }

        uint32_t index = d.residual.front();
        BitBuffer value = std::move(d.payload);
        retire(slot);
        resolve(index, value);
    }

    if (resolved_count_ == chunk_count_ && state_ != DecodeState::Solved) {
        state_ = DecodeState::Solved;
        if (log_enabled(LogLevel::Info))
            std::cerr << "[decoder] Solved " << chunk_count_ << " chunks from "
                      << seen_seeds_.size() << " droplets" << std::endl;

        // Whatever is left can only confirm known values
        for (std::size_t slot = 0; slot < droplets_.size(); ++slot) {
            if (droplets_[slot].alive) retire(slot);
        }
    }
}

void PeelingDecoder::resolve(uint32_t index, const BitBuffer& value) {
    chunks_[index] = value;
    resolved_[index] = true;
    ++resolved_count_;

    if (log_enabled(LogLevel::Debug))
        std::cerr << "[decoder] Chunk " << index << " resolved (" << resolved_count_ << "/"
                  << chunk_count_ << ")" << std::endl;

    for (std::size_t slot : refs_[index]) {
        LiveDroplet& d = droplets_[slot];
        if (!d.alive) continue;

        auto it = std::find(d.residual.begin(), d.residual.end(), index);
        if (it == d.residual.end()) continue;
        d.residual.erase(it);
        d.payload.xor_with(value);

        if (d.residual.size() == 1) {
            ready_.push_back(slot);
        } else if (d.residual.empty()) {
            if (strict_ && !d.payload.is_zero()) fail(d.seed);
            retire(slot);
        }
    }
    refs_[index].clear();
}

// Partial reductions are not unwound; the session is closed instead
void PeelingDecoder::fail(uint32_t seed) {
    corrupt_ = true;
    mismatch_seed_ = seed;
    state_ = DecodeState::Stalled;
    ready_.clear();
    if (log_enabled(LogLevel::Error))
        std::cerr << "[decoder] Droplet " << seed << " contradicts resolved chunks, session closed"
                  << std::endl;
    throw IntegrityMismatch(seed);
}

void PeelingDecoder::retire(std::size_t slot) {
    LiveDroplet& d = droplets_[slot];
    if (!d.alive) return;
    d.alive = false;
    d.residual.clear();
    d.payload = BitBuffer();
    --live_count_;
}

DecodeState PeelingDecoder::finish() {
    if (state_ == DecodeState::Solved || corrupt_) return state_;

    state_ = DecodeState::Stalled;
    if (log_enabled(LogLevel::Warning))
        std::cerr << "[decoder] Stalled: " << unresolved_count() << " of " << chunk_count_
                  << " chunks unresolved after " << seen_seeds_.size() << " droplets" << std::endl;
    return state_;
}

const std::vector<BitBuffer>& PeelingDecoder::chunks() const {
    if (state_ != DecodeState::Solved) throw DecodeIncomplete();
    return chunks_;
}
