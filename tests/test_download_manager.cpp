#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "download_manager.hpp"
#include "errors.hpp"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

using Catch::Matchers::ContainsSubstring;

// ============================================================================
// In-memory daemon
// ============================================================================
class FakeBackend : public DownloadBackend {
public:
    std::vector<TransferSnapshot> active, waiting, stopped;
    std::vector<std::string>      calls;
    std::vector<SubmitKind>       submitted;
    SpeedLimits                   limits;
    bool                          fail_waiting      = false;
    bool                          fail_cleanup      = false;
    // Runs at the start of every query(), outside the fake's lock.
    std::function<void(Partition)> on_query;

    std::string submit(SubmitKind kind, const std::string& payload) override {
        std::lock_guard lock(mtx_);
        submitted.push_back(kind);
        calls.push_back("submit " + payload);
        return "gid" + std::to_string(++next_id_);
    }

    std::vector<TransferSnapshot> query(Partition partition, int, int) override {
        if (on_query)
            on_query(partition);
        std::lock_guard lock(mtx_);
        switch (partition) {
        case Partition::Active: return active;
        case Partition::Waiting:
            if (fail_waiting)
                throw TransportError("connection refused");
            return waiting;
        case Partition::Stopped: return stopped;
        }
        return {};
    }

    void mutate(MutateOp op, const std::string& id) override {
        std::lock_guard lock(mtx_);
        calls.push_back(op_name(op) + " " + id);
        if (fail_cleanup && (op == MutateOp::ForceRemove || op == MutateOp::RemoveResult))
            throw RpcError("GID " + id + " is not found");
    }

    void move(const std::string& id, int delta) override {
        std::lock_guard lock(mtx_);
        calls.push_back("move " + id + " " + std::to_string(delta));
    }

    void pause_all() override { record("pauseAll"); }
    void resume_all() override { record("unpauseAll"); }
    void purge_results() override { record("purgeDownloadResult"); }

    SpeedLimits get_limits() override {
        std::lock_guard lock(mtx_);
        return limits;
    }
    void set_limits(const SpeedLimits& l) override {
        std::lock_guard lock(mtx_);
        limits = l;
    }

    std::vector<std::string> recorded() {
        std::lock_guard lock(mtx_);
        return calls;
    }

private:
    std::mutex mtx_;
    int        next_id_ = 0;

    void record(const std::string& what) {
        std::lock_guard lock(mtx_);
        calls.push_back(what);
    }

    static std::string op_name(MutateOp op) {
        switch (op) {
        case MutateOp::Pause: return "pause";
        case MutateOp::Resume: return "unpause";
        case MutateOp::Remove: return "remove";
        case MutateOp::ForceRemove: return "forceRemove";
        case MutateOp::RemoveResult: return "removeDownloadResult";
        }
        return "?";
    }
};

static TransferSnapshot snap(const std::string& id, const std::string& status,
                             uint64_t rate = 0, uint64_t total = 0, uint64_t done = 0) {
    TransferSnapshot s;
    s.id              = id;
    s.status          = status;
    s.download_rate   = rate;
    s.total_bytes     = total;
    s.completed_bytes = done;
    return s;
}

static ManagerOptions fast() {
    ManagerOptions o;
    o.settle_delay = std::chrono::milliseconds(0);
    return o;
}

// ============================================================================
// Reconciliation
// ============================================================================

TEST_CASE("reconcile discovers daemon transfers") {
    FakeBackend backend;
    auto        s     = snap("a1", "active", 2048, 1000, 250);
    s.first_file_path = "/home/u/Downloads/ubuntu.iso";
    backend.active.push_back(s);

    auto t       = snap("t1", "waiting");
    t.is_torrent = true;
    backend.waiting.push_back(t);

    DownloadManager mgr(backend, fast());
    mgr.reconcile();

    auto a = mgr.get("a1");
    REQUIRE(a);
    CHECK(a->name == "ubuntu.iso");
    CHECK(a->file_path == "/home/u/Downloads/ubuntu.iso");
    CHECK(a->kind == TransferKind::Http);
    CHECK(a->status == TransferStatus::Active);
    CHECK(a->progress() == 0.25);
    CHECK_FALSE(a->source_url.has_value());

    auto tor = mgr.get("t1");
    REQUIRE(tor);
    CHECK(tor->name == "Unknown");
    CHECK(tor->kind == TransferKind::Torrent);
    CHECK(tor->status == TransferStatus::Waiting);
}

TEST_CASE("missing status falls back to the partition") {
    FakeBackend backend;
    backend.stopped.push_back(snap("s1", ""));

    DownloadManager mgr(backend, fast());
    mgr.reconcile();
    CHECK(mgr.get("s1")->status == TransferStatus::Complete);
}

TEST_CASE("aggregate stats follow the status classification") {
    FakeBackend backend;
    backend.active.push_back(snap("a", "active", 1048576));
    backend.stopped.push_back(snap("c", "complete"));
    backend.waiting.push_back(snap("w", "waiting"));

    DownloadManager mgr(backend, fast());
    mgr.reconcile();

    const auto stats = mgr.stats();
    CHECK(stats.num_active == 1);
    CHECK(stats.num_stopped == 1);
    CHECK(stats.num_waiting == 1);
    CHECK(stats.num_total == 3);
    CHECK(stats.download_rate == 1048576);

    CHECK(mgr.active().size() == 1);
    CHECK(mgr.queued().size() == 1);
    CHECK(mgr.completed().size() == 1);
    CHECK(mgr.all().size() == 3);
}

TEST_CASE("rate history is capped at 60 samples, oldest first") {
    FakeBackend     backend;
    DownloadManager mgr(backend, fast());

    for (uint64_t i = 1; i <= 75; ++i) {
        backend.active = {snap("a", "active", i * 100)};
        mgr.reconcile();
    }

    auto t = mgr.get("a");
    REQUIRE(t);
    REQUIRE(t->rate_history.size() == 60);
    CHECK(t->rate_history[0] == 1600);
    CHECK(t->rate_history[59] == 7500);
    CHECK(t->download_rate == 7500);
    for (size_t i = 1; i < t->rate_history.size(); ++i)
        CHECK(t->rate_history[i] > t->rate_history[i - 1]);
}

TEST_CASE("progress tracks byte counts across passes") {
    FakeBackend     backend;
    DownloadManager mgr(backend, fast());

    backend.active = {snap("a", "active", 0, 400, 100)};
    mgr.reconcile();
    CHECK(mgr.get("a")->progress() == 0.25);

    backend.active = {snap("a", "active", 0, 400, 400)};
    mgr.reconcile();
    CHECK(mgr.get("a")->progress() == 1.0);
}

TEST_CASE("a failed partition query is reported and the rest still merge") {
    FakeBackend backend;
    backend.active.push_back(snap("a", "active"));
    backend.waiting.push_back(snap("w", "waiting"));
    backend.fail_waiting = true;

    DownloadManager mgr(backend, fast());
    mgr.reconcile();

    CHECK(mgr.get("a"));
    CHECK_FALSE(mgr.get("w"));
    CHECK_THAT(mgr.last_poll_error(), ContainsSubstring("connection refused"));

    backend.fail_waiting = false;
    mgr.reconcile();
    CHECK(mgr.get("w"));
    CHECK(mgr.last_poll_error().empty());
}

// ============================================================================
// Tombstones
// ============================================================================

TEST_CASE("removed ids never return while the daemon still reports them") {
    FakeBackend backend;
    backend.active.push_back(snap("a", "active"));

    DownloadManager mgr(backend, fast());
    mgr.reconcile();
    REQUIRE(mgr.get("a"));

    mgr.remove("a");
    CHECK_FALSE(mgr.get("a"));
    CHECK(mgr.is_tombstoned("a"));

    for (int i = 0; i < 3; ++i)
        mgr.reconcile();
    CHECK_FALSE(mgr.get("a"));
    CHECK(mgr.stats().num_total == 0);

    const auto calls = backend.recorded();
    REQUIRE(calls.size() == 2);
    CHECK(calls[0] == "forceRemove a");
    CHECK(calls[1] == "removeDownloadResult a");
}

TEST_CASE("remove succeeds when daemon cleanup fails") {
    FakeBackend backend;
    backend.active.push_back(snap("a", "active"));
    backend.fail_cleanup = true;

    DownloadManager mgr(backend, fast());
    mgr.reconcile();

    REQUIRE_NOTHROW(mgr.remove("a"));
    CHECK_FALSE(mgr.get("a"));
    CHECK(mgr.is_tombstoned("a"));
}

TEST_CASE("remove during an in-flight reconcile is not undone") {
    FakeBackend backend;
    backend.active.push_back(snap("a", "active"));

    DownloadManager mgr(backend, fast());
    mgr.reconcile();

    // The active partition has already been fetched (still listing "a")
    // when the user removes it.
    bool removed = false;
    backend.on_query = [&](Partition p) {
        if (p == Partition::Stopped && !removed) {
            removed = true;
            mgr.remove("a");
        }
    };
    mgr.reconcile();

    REQUIRE(removed);
    CHECK_FALSE(mgr.get("a"));
}

TEST_CASE("concurrent remove and reconcile leave no removed id behind") {
    FakeBackend backend;
    for (int i = 0; i < 50; ++i)
        backend.active.push_back(snap("g" + std::to_string(i), "active", 1024));

    DownloadManager mgr(backend, fast());
    mgr.reconcile();

    std::atomic<bool> done{false};
    std::thread       poller([&] {
        while (!done)
            mgr.reconcile();
    });
    for (int i = 0; i < 50; i += 2)
        mgr.remove("g" + std::to_string(i));
    done = true;
    poller.join();
    mgr.reconcile();

    for (int i = 0; i < 50; ++i) {
        const std::string id = "g" + std::to_string(i);
        if (i % 2 == 0)
            CHECK_FALSE(mgr.get(id));
        else
            CHECK(mgr.get(id));
    }
    CHECK(mgr.stats().num_active == 25);
}

// ============================================================================
// Add
// ============================================================================

TEST_CASE("adding a magnet link creates a provisional torrent entry") {
    FakeBackend     backend;
    DownloadManager mgr(backend, fast());

    const std::string id = mgr.add("magnet:?xt=urn:btih:abc&dn=MyFile");
    auto              t  = mgr.get(id);
    REQUIRE(t);
    CHECK(t->name == "MyFile");
    CHECK(t->kind == TransferKind::Torrent);
    CHECK(t->status == TransferStatus::Waiting);
    CHECK(t->progress() == 0.0);
    CHECK(t->source_url == "magnet:?xt=urn:btih:abc&dn=MyFile");
    CHECK(backend.submitted.back() == SubmitKind::Uri);
}

TEST_CASE("add classifies torrent and metalink files") {
    FakeBackend     backend;
    DownloadManager mgr(backend, fast());

    auto t = mgr.get(mgr.add("/tmp/debian.torrent"));
    CHECK(backend.submitted.back() == SubmitKind::TorrentFile);
    CHECK(t->kind == TransferKind::Torrent);
    CHECK(t->name == "debian.torrent");

    auto m = mgr.get(mgr.add("  /tmp/set.meta4  "));
    CHECK(backend.submitted.back() == SubmitKind::MetalinkFile);
    CHECK(m->kind == TransferKind::Metalink);
    CHECK(m->source_url == "/tmp/set.meta4");

    auto h = mgr.get(mgr.add("https://example.com/file.zip"));
    CHECK(backend.submitted.back() == SubmitKind::Uri);
    CHECK(h->kind == TransferKind::Http);
    CHECK(h->name == "file.zip");
}

TEST_CASE("add rejects blank input") {
    FakeBackend     backend;
    DownloadManager mgr(backend, fast());
    CHECK_THROWS_AS(mgr.add("   "), Error);
    CHECK(backend.submitted.empty());
}

TEST_CASE("reconcile keeps the source of a locally added transfer") {
    FakeBackend     backend;
    DownloadManager mgr(backend, fast());

    const std::string id = mgr.add("https://example.com/dl?id=7");
    auto              s  = snap(id, "active", 10, 100, 10);
    s.first_file_path    = "/home/u/Downloads/report.pdf";
    backend.active.push_back(s);
    mgr.reconcile();

    auto t = mgr.get(id);
    REQUIRE(t);
    CHECK(t->name == "report.pdf");
    CHECK(t->source_url == "https://example.com/dl?id=7");
    CHECK(t->status == TransferStatus::Active);
}

// ============================================================================
// Retry / delete / purge
// ============================================================================

TEST_CASE("retry replaces the transfer with a fresh one from the same source") {
    FakeBackend     backend;
    DownloadManager mgr(backend, fast());

    const std::string old_id = mgr.add("http://example.com/big.iso");
    backend.stopped          = {snap(old_id, "error", 0, 1000, 400)};
    mgr.reconcile();
    REQUIRE(mgr.get(old_id)->progress() == 0.4);

    const std::string new_id = mgr.retry(old_id);
    CHECK(new_id != old_id);
    CHECK_FALSE(mgr.get(old_id));
    CHECK(mgr.is_tombstoned(old_id));

    auto t = mgr.get(new_id);
    REQUIRE(t);
    CHECK(t->source_url == "http://example.com/big.iso");
    CHECK(t->progress() == 0.0);
}

TEST_CASE("retry without a source or id fails") {
    FakeBackend backend;
    backend.stopped.push_back(snap("x", "error"));

    DownloadManager mgr(backend, fast());
    mgr.reconcile();

    CHECK_THROWS_AS(mgr.retry("x"), NoUrlAvailable);
    CHECK(mgr.get("x"));
    CHECK_THROWS_AS(mgr.retry("nope"), NotFound);
}

TEST_CASE("delete_file removes the entry and the file") {
    const auto path = std::filesystem::temp_directory_path() /
                      ("aria_tui_delete_" + std::to_string(::getpid()) + ".bin");
    std::ofstream(path) << "payload";
    REQUIRE(std::filesystem::exists(path));

    FakeBackend backend;
    auto        s     = snap("c", "complete", 0, 7, 7);
    s.first_file_path = path.string();
    backend.stopped.push_back(s);

    DownloadManager mgr(backend, fast());
    mgr.reconcile();

    CHECK(mgr.delete_file("c") == "Deleted file: " + path.filename().string());
    CHECK_FALSE(std::filesystem::exists(path));
    CHECK_FALSE(mgr.get("c"));
}

TEST_CASE("delete_file on a missing file still removes the entry") {
    FakeBackend backend;
    auto        s     = snap("c", "complete");
    s.first_file_path = "/nonexistent/aria-tui/never-there.bin";
    backend.stopped.push_back(s);

    DownloadManager mgr(backend, fast());
    mgr.reconcile();

    CHECK_THROWS_AS(mgr.delete_file("c"), FileDeleteError);
    CHECK_FALSE(mgr.get("c"));
    CHECK(mgr.is_tombstoned("c"));
}

TEST_CASE("delete_file without a path only removes the entry") {
    FakeBackend     backend;
    DownloadManager mgr(backend, fast());

    const std::string id = mgr.add("magnet:?xt=urn:btih:abc&dn=Pending");
    CHECK(mgr.delete_file(id) == "Removed from list: Pending (no file on disk)");
    CHECK_FALSE(mgr.get(id));
    CHECK_THROWS_AS(mgr.delete_file(id), NotFound);
}

TEST_CASE("purge_completed drops finished and failed transfers") {
    FakeBackend backend;
    backend.active.push_back(snap("a", "active"));
    backend.stopped.push_back(snap("c", "complete"));
    backend.stopped.push_back(snap("e", "error"));

    DownloadManager mgr(backend, fast());
    mgr.reconcile();

    CHECK(mgr.purge_completed() == 2);
    CHECK(mgr.all().size() == 1);
    CHECK(mgr.get("a"));

    mgr.reconcile();
    CHECK(mgr.all().size() == 1);
    CHECK(backend.recorded().back() == "purgeDownloadResult");
}

// ============================================================================
// Pass-through operations
// ============================================================================

TEST_CASE("queue and pause operations reach the daemon") {
    FakeBackend     backend;
    DownloadManager mgr(backend, fast());

    mgr.pause("a");
    mgr.resume("a");
    mgr.move_up("b");
    mgr.move_down("b");
    mgr.pause_all();
    mgr.resume_all();

    CHECK(backend.recorded() == std::vector<std::string>{
                                    "pause a",
                                    "unpause a",
                                    "move b -1",
                                    "move b 1",
                                    "pauseAll",
                                    "unpauseAll",
                                });
}

TEST_CASE("setting one speed limit keeps the other") {
    FakeBackend backend;
    backend.limits = {0, 65536};

    DownloadManager mgr(backend, fast());
    mgr.set_download_limit(1048576);
    CHECK(mgr.speed_limits().download == 1048576);
    CHECK(mgr.speed_limits().upload == 65536);

    mgr.set_upload_limit(0);
    CHECK(mgr.speed_limits().download == 1048576);
    CHECK(mgr.speed_limits().upload == 0);
}

TEST_CASE("background polling notifies and stops") {
    FakeBackend backend;
    backend.active.push_back(snap("a", "active"));

    DownloadManager  mgr(backend, fast());
    std::atomic<int> updates{0};
    mgr.start(std::chrono::milliseconds(10), [&] { ++updates; });

    for (int i = 0; i < 100 && updates == 0; ++i)
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    mgr.stop();

    CHECK(updates.load() > 0);
    CHECK(mgr.get("a"));
}
