#include "droplet_encoder.hpp"
#include "seeded_selector.hpp"
#include "slicer.hpp"
#include "fountain_errors.hpp"
#include "logging.hpp"
#include <algorithm>
#include <exception>
#include <iostream>
#include <limits>
#include <thread>

static std::size_t checked_chunk_count(const std::vector<BitBuffer>& chunks) {
    if (chunks.empty())
        throw InvalidConfiguration("droplet encoder needs at least one chunk");

    std::size_t bits = chunks.front().size();
    if (bits == 0)
        throw InvalidConfiguration("chunks must not be empty");
    for (const auto& c : chunks) {
        if (c.size() != bits)
            throw InvalidConfiguration("chunks of different sizes: " + std::to_string(bits) +
                                       " and " + std::to_string(c.size()) + " bits");
    }
    return chunks.size();
}

static DropletRecord combine(const std::vector<BitBuffer>& chunks, const DegreeTable& table,
                             uint32_t seed) {
    SourceSelection sel = select_sources(seed, table);

    DropletRecord d;
    d.seed = seed;
    d.payload = BitBuffer(chunks.front().size());
    for (uint32_t idx : sel.indices)
        d.payload.xor_with(chunks[idx]);
    return d;
}

static void check_seed_range(uint32_t first_seed, std::size_t count) {
    if (count == 0) return;
    if (count - 1 > static_cast<std::size_t>(std::numeric_limits<uint32_t>::max() - first_seed))
        throw InvalidConfiguration("seed range starting at " + std::to_string(first_seed) +
                                   " with " + std::to_string(count) + " droplets overflows 32 bits");
}

DropletRecord encode_droplet(const std::vector<BitBuffer>& chunks, uint32_t seed) {
    checked_chunk_count(chunks);
    return combine(chunks, DegreeTable(chunks.size()), seed);
}

DropletEncoder::DropletEncoder(std::vector<BitBuffer> chunks)
    : chunks_(std::move(chunks)), table_(checked_chunk_count(chunks_)) {}

DropletEncoder DropletEncoder::from_message(const std::vector<uint8_t>& message, int chunk_bits) {
    return DropletEncoder(slice_message(message, chunk_bits));
}

DropletRecord DropletEncoder::droplet(uint32_t seed) const {
    return combine(chunks_, table_, seed);
}

std::vector<DropletRecord> DropletEncoder::generate(uint32_t first_seed, std::size_t count) const {
    check_seed_range(first_seed, count);

    std::vector<DropletRecord> out;
    out.reserve(count);
    for (std::size_t i = 0; i < count; ++i)
        out.push_back(droplet(static_cast<uint32_t>(first_seed + i)));

    if (log_enabled(LogLevel::Debug)) {
        std::cerr << "[encoder] " << count << " droplets from seed " << first_seed
                  << " over " << chunks_.size() << " chunks" << std::endl;
    }
    return out;
}

std::vector<DropletRecord> DropletEncoder::generate_parallel(uint32_t first_seed, std::size_t count,
                                                             int threads) const {
    if (threads <= 0)
        throw InvalidConfiguration("thread count must be positive");
    check_seed_range(first_seed, count);

    std::size_t workers = std::min<std::size_t>(static_cast<std::size_t>(threads), count);
    if (workers <= 1) return generate(first_seed, count);

    std::vector<DropletRecord> out(count);
    std::vector<std::exception_ptr> errors(workers);
    std::vector<std::thread> pool;
    pool.reserve(workers);

    // Each worker fills a disjoint stripe of `out`
    try {
        for (std::size_t w = 0; w < workers; ++w) {
            pool.emplace_back([this, &out, &errors, first_seed, count, workers, w]() {
                try {
                    for (std::size_t i = w; i < count; i += workers)
                        out[i] = droplet(static_cast<uint32_t>(first_seed + i));
                } catch (...) {
                    errors[w] = std::current_exception();
                }
            });
        }
    } catch (...) {
        // Thread creation failed: wait for the workers already running
        for (auto& t : pool) t.join();
        throw;
    }
    for (auto& t : pool) t.join();

    for (const auto& e : errors) {
        if (e) std::rethrow_exception(e);
    }

    if (log_enabled(LogLevel::Debug)) {
        std::cerr << "[encoder] " << count << " droplets from seed " << first_seed
                  << " on " << workers << " threads" << std::endl;
    }
    return out;
}
