#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <string_view>

enum class TransferStatus { Waiting, Active, Paused, Complete, Error, Removed };

enum class TransferKind { Http, Torrent, Metalink };

// Case-insensitive; anything unrecognised maps to Error.
TransferStatus parse_status(std::string_view s);
const char*    status_name(TransferStatus s); // "ACTIVE", "WAITING", ...
const char*    kind_name(TransferKind k);     // "HTTP/HTTPS", "BitTorrent", "Metalink"

// Fixed-capacity sliding window of rate samples, oldest first.
class RateHistory {
public:
    static constexpr size_t CAPACITY = 60;

    void push(uint64_t sample) {
        samples_.push_back(sample);
        while (samples_.size() > CAPACITY)
            samples_.pop_front();
    }

    std::optional<uint64_t> latest() const {
        if (samples_.empty())
            return std::nullopt;
        return samples_.back();
    }

    size_t size() const { return samples_.size(); }
    bool   empty() const { return samples_.empty(); }

    auto begin() const { return samples_.begin(); }
    auto end() const { return samples_.end(); }
    uint64_t operator[](size_t i) const { return samples_[i]; }

private:
    std::deque<uint64_t> samples_;
};

struct Transfer {
    std::string                id;
    std::optional<std::string> source_url; // only for locally added transfers
    std::string                name;
    std::optional<std::string> file_path;
    TransferStatus             status = TransferStatus::Waiting;
    TransferKind               kind   = TransferKind::Http;

    uint64_t total_bytes     = 0;
    uint64_t completed_bytes = 0;
    uint64_t download_rate   = 0;
    uint64_t upload_rate     = 0;

    RateHistory rate_history;
    RateHistory upload_rate_history;

    uint32_t                   connections = 0;
    std::optional<std::string> error_message;

    // BitTorrent only
    uint32_t                   seed_count  = 0;
    uint32_t                   peer_count  = 0;
    std::optional<std::string> piece_bitfield; // hex, one bit per piece
    uint32_t                   piece_count = 0;

    std::chrono::steady_clock::time_point added_at = std::chrono::steady_clock::now();

    // Always derived from the byte counts, never taken from the daemon.
    double progress() const {
        if (total_bytes == 0)
            return 0.0;
        return static_cast<double>(completed_bytes) / static_cast<double>(total_bytes);
    }
};

// Classification shared by the aggregate stats and the list tabs.
inline bool is_active(const Transfer& t) { return t.status == TransferStatus::Active; }
inline bool is_queued(const Transfer& t) {
    return t.status == TransferStatus::Waiting || t.status == TransferStatus::Paused;
}
inline bool is_stopped(const Transfer& t) {
    return t.status == TransferStatus::Complete || t.status == TransferStatus::Error;
}

struct GlobalStats {
    uint64_t download_rate = 0;
    uint64_t upload_rate   = 0;
    uint32_t num_active    = 0;
    uint32_t num_waiting   = 0;
    uint32_t num_stopped   = 0;
    uint32_t num_total     = 0;
};
