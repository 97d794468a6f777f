#pragma once

#include "backend.hpp"
#include "rpc_client.hpp"

#include <sys/types.h>

#include <chrono>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

inline constexpr int  ARIA2_RPC_PORT   = 6800;
inline constexpr char ARIA2_RPC_SECRET[] = "aria_tui_secret";

struct DaemonConfig {
    RpcConfig                 rpc{"127.0.0.1", ARIA2_RPC_PORT, "/jsonrpc", ARIA2_RPC_SECRET, 10};
    std::string               executable   = "aria2c";
    std::chrono::milliseconds start_budget = std::chrono::seconds(5);
};

// Decodes one tellActive/tellWaiting/tellStopped/tellStatus entry.
TransferSnapshot parse_snapshot(const json& entry);

// Platform download directory: XDG user dir, then ~/Downloads, then ./Downloads.
std::filesystem::path resolve_download_dir();

// Fixed aria2c command line; not configurable at runtime.
std::vector<std::string> daemon_arguments(const std::filesystem::path& download_dir,
                                          const std::string& secret, int port);

// Owned handle on an aria2c daemon: probes it, spawns it when nothing is
// listening, and guarantees the spawned process is reaped on shutdown().
class Aria2Daemon : public DownloadBackend {
public:
    explicit Aria2Daemon(DaemonConfig config = {});
    ~Aria2Daemon() override;

    Aria2Daemon(const Aria2Daemon&)            = delete;
    Aria2Daemon& operator=(const Aria2Daemon&) = delete;

    void ensure_available();
    void shutdown();

    // Pid of the aria2c this handle spawned, or -1 when it owns none.
    pid_t child_pid() const;

    std::string                   submit(SubmitKind kind, const std::string& payload) override;
    std::vector<TransferSnapshot> query(Partition partition, int offset, int num) override;
    void                          mutate(MutateOp op, const std::string& id) override;
    void                          move(const std::string& id, int delta) override;
    void                          pause_all() override;
    void                          resume_all() override;
    void                          purge_results() override;
    SpeedLimits                   get_limits() override;
    void                          set_limits(const SpeedLimits& limits) override;

    TransferSnapshot status(const std::string& id);
    json             files(const std::string& id);
    json             global_stat();
    std::string      version();

private:
    DaemonConfig config_;
    RpcClient    rpc_;
    mutable std::mutex process_mtx_;
    pid_t              child_     = -1;
    bool               shut_down_ = false;

    bool probe();
    void spawn();
    void reap_child(); // caller holds process_mtx_
};
