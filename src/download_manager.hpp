#pragma once

#include "backend.hpp"
#include "transfer.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

struct ManagerOptions {
    int page_size = 100; // per tellWaiting / tellStopped call
    // Pause between forceRemove and removeDownloadResult. aria2 gives no
    // acknowledgment that the transfer has left the active set, so this is a
    // guess; a slow daemon may still reject the purge and leave a result entry.
    std::chrono::milliseconds settle_delay{100};
};

// Canonical local table of transfers, kept in step with the daemon by
// reconcile(). Ids removed through remove() are tombstoned and never come
// back, whatever the daemon keeps reporting.
//
// The table, the tombstone set and the stats each have their own mutex;
// accessors return copies so callers never hold a lock.
class DownloadManager {
public:
    explicit DownloadManager(DownloadBackend& backend, ManagerOptions options = {});
    ~DownloadManager();

    DownloadManager(const DownloadManager&)            = delete;
    DownloadManager& operator=(const DownloadManager&) = delete;

    // One polling pass: fetch all three partitions, merge, recompute stats.
    void reconcile();

    // Background polling every interval until stop(). on_update runs on the
    // polling thread after each pass.
    void start(std::chrono::milliseconds interval, std::function<void()> on_update = nullptr);
    void stop();

    // Returns the daemon-assigned id of the new transfer.
    std::string add(const std::string& source);
    void        remove(const std::string& id);
    // Removes the transfer, then deletes its file. Not transactional: the
    // entry stays removed when the file cannot be deleted (FileDeleteError).
    std::string delete_file(const std::string& id);
    // Removes the transfer and re-adds its source; returns the new id.
    std::string retry(const std::string& id);
    size_t      purge_completed();

    void pause(const std::string& id);
    void resume(const std::string& id);
    void pause_all();
    void resume_all();
    void move_up(const std::string& id);
    void move_down(const std::string& id);

    SpeedLimits speed_limits();
    void        set_speed_limits(const SpeedLimits& limits);
    void        set_download_limit(uint64_t bytes_per_sec);
    void        set_upload_limit(uint64_t bytes_per_sec);

    std::vector<Transfer>   all() const;
    std::vector<Transfer>   active() const;
    std::vector<Transfer>   queued() const;
    std::vector<Transfer>   completed() const;
    std::optional<Transfer> get(const std::string& id) const;
    GlobalStats             stats() const;
    bool                    is_tombstoned(const std::string& id) const;

    // Empty after a pass in which every partition query succeeded.
    std::string last_poll_error() const;

private:
    DownloadBackend& backend_;
    ManagerOptions   options_;

    mutable std::mutex                        table_mtx_;
    std::unordered_map<std::string, Transfer> table_;

    mutable std::mutex              tombstone_mtx_;
    std::unordered_set<std::string> tombstones_;

    mutable std::mutex stats_mtx_;
    GlobalStats        stats_;
    std::string        last_poll_error_;

    std::atomic<bool> running_{false};
    std::thread       poll_thread_;

    void merge(Partition partition, const TransferSnapshot& snap);
    void recompute_stats();
    std::vector<Transfer> select(bool (*pred)(const Transfer&)) const;
};
