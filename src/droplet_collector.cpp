#include "droplet_collector.hpp"
#include "reassembler.hpp"
#include "fountain.hpp"
#include "fountain_errors.hpp"
#include "logging.hpp"
#include <iostream>

DropletCollector::DropletCollector(MessageReadyCallback on_ready, std::size_t max_droplets,
                                   SessionDroppedCallback on_dropped)
    : on_ready_(std::move(on_ready)), on_dropped_(std::move(on_dropped)), max_droplets_(max_droplets) {
    if (!on_ready_) throw InvalidConfiguration("collector needs a message callback");
    if (max_droplets_ == 0) throw InvalidConfiguration("collector droplet budget must be positive");
}

bool DropletCollector::open_session(uint32_t session_id, const SessionInfo& info, bool strict) {
    check_chunk_bits(info.chunk_bits);
    std::vector<uint8_t> message;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (sessions_.count(session_id) || completed_.count(session_id)) return false;

        Session s;
        s.info = info;
        s.decoder = std::make_unique<PeelingDecoder>(info.chunk_count, info.chunk_bits, strict);

        // An empty message is solved before any droplet arrives
        if (!s.decoder->solved()) {
            sessions_.emplace(session_id, std::move(s));
            if (log_enabled(LogLevel::Debug))
                std::cerr << "[collector] Session " << session_id << " opened (" << info.chunk_count
                          << " chunks)" << std::endl;
            return true;
        }
        message = finish_message(*s.decoder, info.message_bytes);
        completed_.insert(session_id);
    }
    on_ready_(session_id, message);
    return true;
}

bool DropletCollector::handle(uint32_t session_id, const EncodedDroplet& droplet) {
    std::vector<uint8_t> message;
    std::size_t unresolved = 0;
    bool used = false;
    bool ready = false;
    bool dropped = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end()) {
            if (!completed_.count(session_id) && log_enabled(LogLevel::Warning))
                std::cerr << "[collector] Droplet " << droplet.seed << " for unknown session "
                          << session_id << std::endl;
            return false;
        }

        Session& s = it->second;
        try {
            used = s.decoder->add_droplet(from_encoded(droplet));
        } catch (const IntegrityMismatch& e) {
            // A corrupt decoder can never produce a trustworthy message
            unresolved = s.decoder->unresolved_count();
            if (log_enabled(LogLevel::Warning))
                std::cerr << "[collector] Dropping session " << session_id << ": droplet "
                          << e.seed() << " contradicts its chunks" << std::endl;
            sessions_.erase(it);
            dropped = true;
        }
        if (dropped) {
            // reported below, outside the lock
        } else if (!used) {
            return false;
        } else if (s.decoder->solved()) {
            message = finish_message(*s.decoder, s.info.message_bytes);
            completed_.insert(session_id);
            sessions_.erase(it);
            ready = true;
        } else if (s.decoder->droplets_seen() >= max_droplets_) {
            s.decoder->finish();
            unresolved = s.decoder->unresolved_count();
            if (log_enabled(LogLevel::Warning))
                std::cerr << "[collector] Dropping session " << session_id << " after "
                          << s.decoder->droplets_seen() << " droplets (" << unresolved
                          << " chunks unresolved)" << std::endl;
            sessions_.erase(it);
            dropped = true;
        }
    }

    if (ready) on_ready_(session_id, message);
    if (dropped && on_dropped_) on_dropped_(session_id, unresolved);
    return used;
}

void DropletCollector::close_session(uint32_t session_id) {
    std::size_t unresolved = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end()) return;
        it->second.decoder->finish();
        unresolved = it->second.decoder->unresolved_count();
        sessions_.erase(it);
    }
    if (on_dropped_) on_dropped_(session_id, unresolved);
}

std::size_t DropletCollector::open_sessions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

bool DropletCollector::completed(uint32_t session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return completed_.count(session_id) != 0;
}
