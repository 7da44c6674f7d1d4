#pragma once

#include "peeling_decoder.hpp"
#include "strand_codec.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <unordered_set>
#include <vector>

// Routes droplets of many independent sessions to their own decoders and
// hands each message out as soon as its session is solved.
class DropletCollector {
public:
    using MessageReadyCallback = std::function<void(uint32_t session_id, const std::vector<uint8_t>&)>;
    using SessionDroppedCallback = std::function<void(uint32_t session_id, std::size_t unresolved)>;

    // max_droplets: per-session budget before a session is given up
    DropletCollector(MessageReadyCallback on_ready, std::size_t max_droplets,
                     SessionDroppedCallback on_dropped = nullptr);

    // false if the id is already open or already completed
    bool open_session(uint32_t session_id, const SessionInfo& info, bool strict = false);

    // false when the droplet was not used: unknown/finished session or duplicate seed.
    // A droplet that contradicts a strict session drops that session through
    // the dropped callback.
    bool handle(uint32_t session_id, const EncodedDroplet& droplet);

    // Give up on a session now; reports it through the dropped callback
    void close_session(uint32_t session_id);

    std::size_t open_sessions() const;
    bool completed(uint32_t session_id) const;

private:
    struct Session {
        SessionInfo info;
        std::unique_ptr<PeelingDecoder> decoder;
    };

    mutable std::mutex mutex_;
    std::unordered_map<uint32_t, Session> sessions_;
    std::unordered_set<uint32_t> completed_;

    MessageReadyCallback on_ready_;
    SessionDroppedCallback on_dropped_;
    std::size_t max_droplets_;
};
