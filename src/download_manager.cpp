#include "download_manager.hpp"

#include "errors.hpp"
#include "format.hpp"

#include <cctype>
#include <filesystem>

#include <spdlog/spdlog.h>

static const char* partition_name(Partition p) {
    switch (p) {
    case Partition::Active: return "active";
    case Partition::Waiting: return "waiting";
    case Partition::Stopped: return "stopped";
    }
    return "?";
}

// Used when the daemon leaves the status field out.
static TransferStatus partition_status(Partition p) {
    switch (p) {
    case Partition::Active: return TransferStatus::Active;
    case Partition::Waiting: return TransferStatus::Waiting;
    case Partition::Stopped: return TransferStatus::Complete;
    }
    return TransferStatus::Waiting;
}

static std::string basename_of(const std::string& path) {
    const auto slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

DownloadManager::DownloadManager(DownloadBackend& backend, ManagerOptions options)
    : backend_(backend), options_(options) {}

DownloadManager::~DownloadManager() { stop(); }

// ============================================================================
// Reconciliation
// ============================================================================
void DownloadManager::merge(Partition partition, const TransferSnapshot& snap) {
    const TransferStatus status =
        snap.status.empty() ? partition_status(partition) : parse_status(snap.status);

    auto it = table_.find(snap.id);
    if (it == table_.end()) {
        Transfer t;
        t.id   = snap.id;
        t.name = "Unknown";
        if (!snap.first_file_path.empty()) {
            t.file_path = snap.first_file_path;
            if (auto base = basename_of(snap.first_file_path); !base.empty())
                t.name = base;
        }
        t.kind = snap.is_torrent ? TransferKind::Torrent : TransferKind::Http;
        it     = table_.emplace(snap.id, std::move(t)).first;
        spdlog::debug("discovered {} ({}) in {} list", snap.id, it->second.name,
                      partition_name(partition));
    } else if (!snap.first_file_path.empty()) {
        Transfer& t = it->second;
        t.file_path = snap.first_file_path;
        if (auto base = basename_of(snap.first_file_path); !base.empty())
            t.name = base;
    }

    // Daemon-observable fields only; source_url is never touched here.
    Transfer& t       = it->second;
    t.status          = status;
    t.total_bytes     = snap.total_bytes;
    t.completed_bytes = snap.completed_bytes;
    t.download_rate   = snap.download_rate;
    t.upload_rate     = snap.upload_rate;
    t.connections     = snap.connections;
    t.error_message   = snap.error_message;
    if (snap.is_torrent)
        t.kind = TransferKind::Torrent;
    t.seed_count     = snap.seed_count;
    t.peer_count     = snap.is_torrent ? snap.connections : 0;
    t.piece_bitfield = snap.bitfield;
    t.piece_count    = snap.piece_count;

    t.rate_history.push(snap.download_rate);
    t.upload_rate_history.push(snap.upload_rate);
}

void DownloadManager::recompute_stats() {
    GlobalStats s;
    {
        std::lock_guard lock(table_mtx_);
        s.num_total = static_cast<uint32_t>(table_.size());
        for (const auto& [id, t] : table_) {
            if (is_active(t)) {
                ++s.num_active;
                s.download_rate += t.rate_history.latest().value_or(0);
                s.upload_rate += t.upload_rate_history.latest().value_or(0);
            } else if (is_queued(t)) {
                ++s.num_waiting;
            } else if (is_stopped(t)) {
                ++s.num_stopped;
            }
        }
    }
    std::lock_guard lock(stats_mtx_);
    stats_ = s;
}

void DownloadManager::reconcile() {
    struct Batch {
        Partition                     partition;
        std::vector<TransferSnapshot> snapshots;
    };
    std::vector<Batch> batches;
    std::string        error;

    for (Partition p : {Partition::Active, Partition::Waiting, Partition::Stopped}) {
        try {
            batches.push_back({p, backend_.query(p, 0, options_.page_size)});
        } catch (const Error& e) {
            spdlog::warn("tell {} failed: {}", partition_name(p), e.what());
            error = e.what();
        }
    }

    {
        // Holding the tombstone lock across the merge orders every pass
        // strictly before or after a concurrent remove()'s tombstone insert.
        std::scoped_lock lock(table_mtx_, tombstone_mtx_);
        for (const auto& batch : batches) {
            for (const auto& snap : batch.snapshots) {
                if (snap.id.empty() || tombstones_.contains(snap.id))
                    continue;
                merge(batch.partition, snap);
            }
        }
    }

    recompute_stats();

    std::lock_guard lock(stats_mtx_);
    last_poll_error_ = std::move(error);
}

void DownloadManager::start(std::chrono::milliseconds interval,
                            std::function<void()> on_update) {
    if (running_.exchange(true))
        return;
    poll_thread_ = std::thread([this, interval, on_update = std::move(on_update)] {
        while (running_) {
            try {
                reconcile();
            } catch (const std::exception& e) {
                spdlog::error("reconcile failed: {}", e.what());
            }
            if (on_update)
                on_update();

            // Sleep in small increments so stop() returns promptly
            const auto deadline = std::chrono::steady_clock::now() + interval;
            while (running_ && std::chrono::steady_clock::now() < deadline)
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });
}

void DownloadManager::stop() {
    running_ = false;
    if (poll_thread_.joinable())
        poll_thread_.join();
}

// ============================================================================
// Mutations
// ============================================================================
std::string DownloadManager::add(const std::string& raw) {
    std::string source = raw;
    while (!source.empty() && std::isspace(static_cast<unsigned char>(source.front())))
        source.erase(source.begin());
    while (!source.empty() && std::isspace(static_cast<unsigned char>(source.back())))
        source.pop_back();
    if (source.empty())
        throw Error("Nothing to add");

    SubmitKind   submit = SubmitKind::Uri;
    TransferKind kind   = TransferKind::Http;
    if (source.starts_with("magnet:")) {
        kind = TransferKind::Torrent;
    } else if (source.ends_with(".torrent")) {
        submit = SubmitKind::TorrentFile;
        kind   = TransferKind::Torrent;
    } else if (source.ends_with(".metalink") || source.ends_with(".meta4")) {
        submit = SubmitKind::MetalinkFile;
        kind   = TransferKind::Metalink;
    }

    const std::string id = backend_.submit(submit, source);
    spdlog::info("added {} as {}", source, id);

    std::lock_guard lock(table_mtx_);
    auto [it, inserted] = table_.try_emplace(id);
    Transfer& t         = it->second;
    if (inserted) {
        t.id     = id;
        t.name   = display_name_for(source);
        t.kind   = kind;
        t.status = TransferStatus::Waiting;
    }
    // A poll may have discovered the id first; the source is still ours.
    t.source_url = source;
    return id;
}

void DownloadManager::remove(const std::string& id) {
    {
        std::lock_guard lock(tombstone_mtx_);
        tombstones_.insert(id);
    }
    {
        std::lock_guard lock(table_mtx_);
        table_.erase(id);
    }
    spdlog::info("removed {}", id);

    // Local state is authoritative from here on; daemon residue is tolerated.
    try {
        backend_.mutate(MutateOp::ForceRemove, id);
    } catch (const Error& e) {
        spdlog::debug("forceRemove {} ignored: {}", id, e.what());
    }
    std::this_thread::sleep_for(options_.settle_delay);
    try {
        backend_.mutate(MutateOp::RemoveResult, id);
    } catch (const Error& e) {
        spdlog::debug("removeDownloadResult {} ignored: {}", id, e.what());
    }

    recompute_stats();
}

std::string DownloadManager::delete_file(const std::string& id) {
    const auto entry = get(id);
    if (!entry)
        throw NotFound(id);

    remove(id);

    if (!entry->file_path)
        return "Removed from list: " + entry->name + " (no file on disk)";

    std::error_code ec;
    const bool      deleted = std::filesystem::remove(*entry->file_path, ec);
    if (!deleted && !ec)
        ec = std::make_error_code(std::errc::no_such_file_or_directory);
    if (ec) {
        spdlog::warn("delete {} failed: {}", *entry->file_path, ec.message());
        throw FileDeleteError("Failed to delete file " + entry->name + ": " + ec.message());
    }
    spdlog::info("deleted {}", *entry->file_path);
    return "Deleted file: " + entry->name;
}

std::string DownloadManager::retry(const std::string& id) {
    const auto entry = get(id);
    if (!entry)
        throw NotFound(id);
    if (!entry->source_url)
        throw NoUrlAvailable(id);

    remove(id);
    return add(*entry->source_url);
}

size_t DownloadManager::purge_completed() {
    std::vector<std::string> ids;
    {
        std::lock_guard lock(table_mtx_);
        for (const auto& [id, t] : table_) {
            if (is_stopped(t))
                ids.push_back(id);
        }
    }

    for (const auto& id : ids)
        remove(id);

    try {
        backend_.purge_results();
    } catch (const Error& e) {
        spdlog::debug("purgeDownloadResult ignored: {}", e.what());
    }
    spdlog::info("purged {} finished transfers", ids.size());
    return ids.size();
}

void DownloadManager::pause(const std::string& id) {
    backend_.mutate(MutateOp::Pause, id);
    spdlog::info("paused {}", id);
}

void DownloadManager::resume(const std::string& id) {
    backend_.mutate(MutateOp::Resume, id);
    spdlog::info("resumed {}", id);
}

void DownloadManager::pause_all() {
    backend_.pause_all();
    spdlog::info("paused all transfers");
}

void DownloadManager::resume_all() {
    backend_.resume_all();
    spdlog::info("resumed all transfers");
}

void DownloadManager::move_up(const std::string& id) { backend_.move(id, -1); }

void DownloadManager::move_down(const std::string& id) { backend_.move(id, 1); }

SpeedLimits DownloadManager::speed_limits() { return backend_.get_limits(); }

void DownloadManager::set_speed_limits(const SpeedLimits& limits) {
    backend_.set_limits(limits);
    spdlog::info("speed limits set to {} down, {} up", format_speed_limit(limits.download),
                 format_speed_limit(limits.upload));
}

void DownloadManager::set_download_limit(uint64_t bytes_per_sec) {
    SpeedLimits limits = backend_.get_limits();
    limits.download    = bytes_per_sec;
    set_speed_limits(limits);
}

void DownloadManager::set_upload_limit(uint64_t bytes_per_sec) {
    SpeedLimits limits = backend_.get_limits();
    limits.upload      = bytes_per_sec;
    set_speed_limits(limits);
}

// ============================================================================
// Snapshot accessors
// ============================================================================
std::vector<Transfer> DownloadManager::select(bool (*pred)(const Transfer&)) const {
    std::lock_guard       lock(table_mtx_);
    std::vector<Transfer> out;
    out.reserve(table_.size());
    for (const auto& [id, t] : table_) {
        if (!pred || pred(t))
            out.push_back(t);
    }
    return out;
}

std::vector<Transfer> DownloadManager::all() const { return select(nullptr); }

std::vector<Transfer> DownloadManager::active() const { return select(&is_active); }

std::vector<Transfer> DownloadManager::queued() const { return select(&is_queued); }

std::vector<Transfer> DownloadManager::completed() const { return select(&is_stopped); }

std::optional<Transfer> DownloadManager::get(const std::string& id) const {
    std::lock_guard lock(table_mtx_);
    auto            it = table_.find(id);
    if (it == table_.end())
        return std::nullopt;
    return it->second;
}

GlobalStats DownloadManager::stats() const {
    std::lock_guard lock(stats_mtx_);
    return stats_;
}

bool DownloadManager::is_tombstoned(const std::string& id) const {
    std::lock_guard lock(tombstone_mtx_);
    return tombstones_.contains(id);
}

std::string DownloadManager::last_poll_error() const {
    std::lock_guard lock(stats_mtx_);
    return last_poll_error_;
}
