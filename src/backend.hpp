#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// The daemon's three transfer-list buckets, queried separately.
enum class Partition { Active, Waiting, Stopped };

enum class SubmitKind { Uri, TorrentFile, MetalinkFile };

enum class MutateOp { Pause, Resume, Remove, ForceRemove, RemoveResult };

// One transfer as reported by the daemon, numbers already decoded.
struct TransferSnapshot {
    std::string                id;
    std::string                status; // as reported, e.g. "active"
    uint64_t                   total_bytes     = 0;
    uint64_t                   completed_bytes = 0;
    uint64_t                   download_rate   = 0;
    uint64_t                   upload_rate     = 0;
    uint32_t                   connections     = 0;
    std::optional<std::string> error_code;
    std::optional<std::string> error_message;
    std::string                first_file_path; // empty when no file records
    bool                       is_torrent  = false;
    uint32_t                   seed_count  = 0;
    std::optional<std::string> bitfield;
    uint32_t                   piece_count = 0;
};

struct SpeedLimits {
    uint64_t download = 0; // bytes/s, 0 = unlimited
    uint64_t upload   = 0;
};

// Typed access to the download daemon. DownloadManager only talks to the
// daemon through this interface.
class DownloadBackend {
public:
    virtual ~DownloadBackend() = default;

    virtual std::string                   submit(SubmitKind kind, const std::string& payload) = 0;
    virtual std::vector<TransferSnapshot> query(Partition partition, int offset, int num) = 0;
    virtual void                          mutate(MutateOp op, const std::string& id)  = 0;
    virtual void                          move(const std::string& id, int delta)      = 0;
    virtual void                          pause_all()                                 = 0;
    virtual void                          resume_all()                                = 0;
    virtual void                          purge_results()                             = 0;
    virtual SpeedLimits                   get_limits()                                = 0;
    virtual void                          set_limits(const SpeedLimits& limits)       = 0;
};
