#include "aria2_daemon.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iterator>
#include <thread>

#include <spdlog/spdlog.h>

// Every partition query asks for the same keys so responses have a fixed shape.
static json status_keys() {
    return json{"gid",         "status",     "totalLength", "completedLength", "downloadSpeed",
                "uploadSpeed", "connections", "numSeeders", "errorCode",       "errorMessage",
                "files",       "bittorrent", "bitfield",    "numPieces"};
}

// One-element params array. Brace-initializing from a single json would be
// read as a copy.
static json single(json v) {
    json a = json::array();
    a.push_back(std::move(v));
    return a;
}

// aria2 sends every number as a decimal string.
static uint64_t number_field(const json& entry, const std::string& key) {
    const json& v = entry[key];
    if (v.is_number())
        return v.get<uint64_t>();
    if (!v.is_string())
        return 0;
    const std::string s = v.get<std::string>();
    char*             end = nullptr;
    errno                 = 0;
    unsigned long long n  = std::strtoull(s.c_str(), &end, 10);
    if (s.empty() || errno != 0 || end != s.c_str() + s.size())
        return 0;
    return static_cast<uint64_t>(n);
}

static std::optional<std::string> optional_string(const json& entry, const std::string& key) {
    const json& v = entry[key];
    if (!v.is_string())
        return std::nullopt;
    return v.get<std::string>();
}

TransferSnapshot parse_snapshot(const json& entry) {
    TransferSnapshot s;
    s.id              = entry.value("gid", "");
    s.status          = entry.value("status", "");
    s.total_bytes     = number_field(entry, "totalLength");
    s.completed_bytes = number_field(entry, "completedLength");
    s.download_rate   = number_field(entry, "downloadSpeed");
    s.upload_rate     = number_field(entry, "uploadSpeed");
    s.connections     = static_cast<uint32_t>(number_field(entry, "connections"));
    s.error_code      = optional_string(entry, "errorCode");
    s.error_message   = optional_string(entry, "errorMessage");

    const json& files = entry["files"];
    if (files.is_array() && !files.empty())
        s.first_file_path = files[size_t{0}].value("path", "");

    s.is_torrent  = entry["bittorrent"].is_object();
    s.seed_count  = static_cast<uint32_t>(number_field(entry, "numSeeders"));
    s.bitfield    = optional_string(entry, "bitfield");
    s.piece_count = static_cast<uint32_t>(number_field(entry, "numPieces"));
    return s;
}

// ---------------------------------------------------------------------------
// Download directory
// ---------------------------------------------------------------------------

// Reads XDG_DOWNLOAD_DIR="$HOME/..." from user-dirs.dirs.
static std::optional<std::filesystem::path> xdg_user_download_dir(const std::string& home) {
    std::filesystem::path config_home;
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
        config_home = xdg;
    else if (!home.empty())
        config_home = std::filesystem::path(home) / ".config";
    else
        return std::nullopt;

    std::ifstream f(config_home / "user-dirs.dirs");
    std::string   line;
    while (std::getline(f, line)) {
        const std::string key = "XDG_DOWNLOAD_DIR=";
        if (line.rfind(key, 0) != 0)
            continue;
        std::string v = line.substr(key.size());
        if (v.size() >= 2 && v.front() == '"' && v.back() == '"')
            v = v.substr(1, v.size() - 2);
        if (v.rfind("$HOME", 0) == 0)
            v = home + v.substr(5);
        if (v.empty() || v == home)
            return std::nullopt;
        return std::filesystem::path(v);
    }
    return std::nullopt;
}

std::filesystem::path resolve_download_dir() {
    const char*       home_env = std::getenv("HOME");
    const std::string home     = home_env ? home_env : "";

    if (const char* env = std::getenv("XDG_DOWNLOAD_DIR"); env && *env)
        return env;
    if (auto dir = xdg_user_download_dir(home))
        return *dir;
    if (!home.empty())
        return std::filesystem::path(home) / "Downloads";
    return "./Downloads";
}

std::vector<std::string> daemon_arguments(const std::filesystem::path& download_dir,
                                          const std::string& secret, int port) {
    return {
        "--enable-rpc",
        "--rpc-listen-all=false",
        "--rpc-listen-port=" + std::to_string(port),
        "--rpc-secret=" + secret,
        "--dir=" + download_dir.string(),
        "--continue=true",
        "--max-connection-per-server=16",
        "--min-split-size=1M",
        "--split=16",
        "--max-concurrent-downloads=5",
        "--disable-ipv6=false",
        "--seed-time=0",
        "--bt-max-peers=50",
        "--follow-torrent=true",
        "--enable-dht=true",
        "--bt-enable-lpd=true",
        "--enable-peer-exchange=true",
        "--auto-file-renaming=false",
        "--allow-overwrite=true",
        "--summary-interval=0",
    };
}

// ---------------------------------------------------------------------------
// Process lifecycle
// ---------------------------------------------------------------------------
Aria2Daemon::Aria2Daemon(DaemonConfig config) : config_(std::move(config)), rpc_(config_.rpc) {}

Aria2Daemon::~Aria2Daemon() { shutdown(); }

bool Aria2Daemon::probe() {
    try {
        rpc_.call("aria2.getVersion");
        return true;
    } catch (const TransportError&) {
        return false;
    }
}

void Aria2Daemon::reap_child() {
    if (child_ <= 0)
        return;
    kill(child_, SIGKILL);
    waitpid(child_, nullptr, 0);
    spdlog::info("reaped aria2c (pid {})", child_);
    child_ = -1;
}

pid_t Aria2Daemon::child_pid() const {
    std::lock_guard lock(process_mtx_);
    return child_;
}

void Aria2Daemon::spawn() {
    {
        // A child left over from an earlier attempt that never answered.
        std::lock_guard lock(process_mtx_);
        reap_child();
    }

    const auto dir = resolve_download_dir();
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec)
        throw StartupError("Cannot create download directory " + dir.string() + ": " +
                           ec.message());

    std::vector<std::string> argv_storage;
    argv_storage.push_back(config_.executable);
    for (auto& a : daemon_arguments(dir, config_.rpc.secret, config_.rpc.port))
        argv_storage.push_back(std::move(a));

    std::vector<char*> argv_ptrs;
    argv_ptrs.reserve(argv_storage.size() + 1);
    for (auto& value : argv_storage)
        argv_ptrs.push_back(value.data());
    argv_ptrs.push_back(nullptr);

    // exec failure is reported back through a close-on-exec pipe.
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) < 0)
        throw StartupError("pipe2() failed: " + std::string(strerror(errno)));

    pid_t pid = fork();
    if (pid < 0) {
        close(fds[0]);
        close(fds[1]);
        throw StartupError("fork() failed: " + std::string(strerror(errno)));
    }
    if (pid == 0) {
        close(fds[0]);
        const int dev_null = open("/dev/null", O_RDWR);
        if (dev_null >= 0) {
            dup2(dev_null, STDIN_FILENO);
            dup2(dev_null, STDOUT_FILENO);
            dup2(dev_null, STDERR_FILENO);
            if (dev_null > STDERR_FILENO)
                close(dev_null);
        }
        execvp(argv_ptrs.front(), argv_ptrs.data());
        const int exec_errno = errno;
        (void)!write(fds[1], &exec_errno, sizeof(exec_errno));
        _exit(127);
    }

    close(fds[1]);
    int     exec_errno = 0;
    ssize_t n          = read(fds[0], &exec_errno, sizeof(exec_errno));
    close(fds[0]);
    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        waitpid(pid, nullptr, 0);
        throw StartupError("Cannot start " + config_.executable + ": " + strerror(exec_errno));
    }

    std::lock_guard lock(process_mtx_);
    child_     = pid;
    shut_down_ = false;
    spdlog::info("spawned {} (pid {}), downloads go to {}", config_.executable, pid,
                 dir.string());
}

void Aria2Daemon::ensure_available() {
    try {
        if (probe()) {
            spdlog::debug("aria2 already listening on port {}", config_.rpc.port);
            return;
        }
    } catch (const RpcError& e) {
        // Something answers on the port but rejects us, usually a foreign
        // aria2 with another secret. Spawning would only fail to bind.
        throw StartupError("aria2 on port " + std::to_string(config_.rpc.port) +
                           " rejected the probe: " + e.what());
    }

    spawn();

    const auto deadline = std::chrono::steady_clock::now() + config_.start_budget;
    while (std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        try {
            if (probe()) {
                spdlog::info("aria2 reachable on port {}", config_.rpc.port);
                return;
            }
        } catch (const RpcError& e) {
            throw StartupError("aria2 rejected the probe: " + std::string(e.what()));
        }
    }
    throw StartupError("aria2c did not become reachable on port " +
                       std::to_string(config_.rpc.port));
}

void Aria2Daemon::shutdown() {
    std::lock_guard lock(process_mtx_);
    if (shut_down_)
        return;
    shut_down_ = true;

    try {
        rpc_.call("aria2.shutdown");
    } catch (const Error& e) {
        spdlog::debug("aria2.shutdown failed: {}", e.what());
    }

    reap_child();
}

// ---------------------------------------------------------------------------
// RPC surface
// ---------------------------------------------------------------------------
static std::string read_binary_file(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f)
        throw Error("Cannot read " + path);
    return std::string(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
}

static std::string gid_from(const json& result) {
    if (result.is_string())
        return result.get<std::string>();
    // addMetalink returns one GID per described file.
    if (result.is_array() && !result.empty() && result[size_t{0}].is_string())
        return result[size_t{0}].get<std::string>();
    throw RpcError("daemon returned no GID");
}

std::string Aria2Daemon::submit(SubmitKind kind, const std::string& payload) {
    json result;
    switch (kind) {
    case SubmitKind::Uri:
        result = rpc_.call("aria2.addUri", single(single(payload)));
        break;
    case SubmitKind::TorrentFile:
        result = rpc_.call("aria2.addTorrent",
                           json{RpcClient::base64_encode(read_binary_file(payload))});
        break;
    case SubmitKind::MetalinkFile:
        result = rpc_.call("aria2.addMetalink",
                           json{RpcClient::base64_encode(read_binary_file(payload))});
        break;
    }
    return gid_from(result);
}

std::vector<TransferSnapshot> Aria2Daemon::query(Partition partition, int offset, int num) {
    json result;
    switch (partition) {
    case Partition::Active:
        result = rpc_.call("aria2.tellActive", single(status_keys()));
        break;
    case Partition::Waiting:
        result = rpc_.call("aria2.tellWaiting", json{offset, num, status_keys()});
        break;
    case Partition::Stopped:
        result = rpc_.call("aria2.tellStopped", json{offset, num, status_keys()});
        break;
    }

    std::vector<TransferSnapshot> out;
    if (!result.is_array())
        return out;
    out.reserve(result.size());
    for (const auto& entry : result)
        out.push_back(parse_snapshot(entry));
    return out;
}

void Aria2Daemon::mutate(MutateOp op, const std::string& id) {
    const char* method = "";
    switch (op) {
    case MutateOp::Pause: method = "aria2.pause"; break;
    case MutateOp::Resume: method = "aria2.unpause"; break;
    case MutateOp::Remove: method = "aria2.remove"; break;
    case MutateOp::ForceRemove: method = "aria2.forceRemove"; break;
    case MutateOp::RemoveResult: method = "aria2.removeDownloadResult"; break;
    }
    rpc_.call(method, json{id});
}

void Aria2Daemon::move(const std::string& id, int delta) {
    rpc_.call("aria2.changePosition", json{id, delta, "POS_CUR"});
}

void Aria2Daemon::pause_all() { rpc_.call("aria2.pauseAll"); }

void Aria2Daemon::resume_all() { rpc_.call("aria2.unpauseAll"); }

void Aria2Daemon::purge_results() { rpc_.call("aria2.purgeDownloadResult"); }

SpeedLimits Aria2Daemon::get_limits() {
    json        options = rpc_.call("aria2.getGlobalOption");
    SpeedLimits limits;
    limits.download = number_field(options, "max-overall-download-limit");
    limits.upload   = number_field(options, "max-overall-upload-limit");
    return limits;
}

void Aria2Daemon::set_limits(const SpeedLimits& limits) {
    json options = {
        {"max-overall-download-limit", std::to_string(limits.download)},
        {"max-overall-upload-limit", std::to_string(limits.upload)},
    };
    rpc_.call("aria2.changeGlobalOption", single(options));
}

TransferSnapshot Aria2Daemon::status(const std::string& id) {
    return parse_snapshot(rpc_.call("aria2.tellStatus", json{id, status_keys()}));
}

json Aria2Daemon::files(const std::string& id) { return rpc_.call("aria2.getFiles", json{id}); }

json Aria2Daemon::global_stat() { return rpc_.call("aria2.getGlobalStat"); }

std::string Aria2Daemon::version() { return rpc_.call("aria2.getVersion").value("version", ""); }
