#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <ftxui/component/component.hpp>
#include <ftxui/component/component_base.hpp>
#include <ftxui/component/event.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/dom/elements.hpp>
#include <ftxui/screen/color.hpp>

#include <spdlog/spdlog.h>

#include "action_queue.hpp"
#include "aria2_daemon.hpp"
#include "download_manager.hpp"
#include "errors.hpp"
#include "format.hpp"
#include "log.hpp"
#include "transfer_list.hpp"

using namespace ftxui;

#ifndef ARIA_TUI_VERSION
#define ARIA_TUI_VERSION "dev"
#endif

// ============================================================================
// UI state (owned by the UI thread; the action thread writes the message)
// ============================================================================
enum class Prompt { None, Add, DownloadLimit, UploadLimit, Search, ConfirmDelete };

struct UiState {
    int         tab       = 0;
    int         selected  = 0;
    SortOrder   sort      = SortOrder::Name;
    bool        ascending = true;
    Prompt      prompt    = Prompt::None;
    std::string input;
    std::string search;     // name filter applied to every tab
    std::string pending_id; // target of ConfirmDelete
};

struct StatusLine {
    std::string text;
    bool        is_error = false;
};

static const std::vector<std::string> TAB_LABELS = {"Active", "Queue", "Completed"};

// ============================================================================
// Rendering helpers
// ============================================================================
static Color status_color(TransferStatus s) {
    switch (s) {
    case TransferStatus::Active: return Color::Green;
    case TransferStatus::Waiting: return Color::Yellow;
    case TransferStatus::Paused: return Color::GrayLight;
    case TransferStatus::Complete: return Color::Cyan;
    case TransferStatus::Error: return Color::Red;
    case TransferStatus::Removed: return Color::GrayDark;
    }
    return Color::Default;
}

// One block character per sample, scaled to the window's peak.
static std::string sparkline(const RateHistory& history) {
    static const char* bars[] = {"▁", "▂", "▃", "▄", "▅", "▆", "▇", "█"};
    uint64_t           peak   = 0;
    for (uint64_t v : history)
        peak = std::max(peak, v);
    std::string out;
    for (uint64_t v : history) {
        size_t level = peak == 0 ? 0 : static_cast<size_t>((v * 7) / peak);
        out += bars[level];
    }
    return out;
}

static std::string fmt_age(int64_t secs) {
    if (secs < 60)
        return std::to_string(secs) + "s";
    if (secs < 3600)
        return std::to_string(secs / 60) + "m " + std::to_string(secs % 60) + "s";
    return std::to_string(secs / 3600) + "h " + std::to_string((secs % 3600) / 60) + "m";
}

// Set bits in aria2's hex piece bitfield.
static Element label_value(const std::string& lbl, const std::string& val,
                           Color val_color = Color::Default) {
    return hbox({
        text(lbl) | color(Color::GrayDark),
        text(val) | color(val_color) | bold,
    });
}

static Element render_row(const Transfer& t, bool selected) {
    const double progress = t.progress();
    auto         row      = hbox({
        text(" " + truncate_text(t.name, 36)) | size(WIDTH, EQUAL, 38),
        gauge(static_cast<float>(progress)) | size(WIDTH, EQUAL, 20) |
            color(progress >= 1.0 ? Color::Green : Color::Cyan),
        text(" " + std::to_string(static_cast<int>(progress * 100)) + "%") |
            size(WIDTH, EQUAL, 6),
        text(format_size(t.completed_bytes) + " / " + format_size(t.total_bytes)) |
            size(WIDTH, EQUAL, 24),
        text(format_rate(t.download_rate)) | size(WIDTH, EQUAL, 13),
        filler(),
        text(std::string(status_name(t.status)) + " ") | color(status_color(t.status)) | bold,
    });
    return selected ? row | inverted : row;
}

static Element render_details(const Transfer& t) {
    Elements rows = {
        label_value("  Name        : ", t.name),
        label_value("  GID         : ", t.id),
        label_value("  Type        : ", kind_name(t.kind)),
        label_value("  Status      : ", status_name(t.status), status_color(t.status)),
        label_value("  Size        : ",
                    format_size(t.completed_bytes) + " / " + format_size(t.total_bytes)),
        label_value("  Down / Up   : ",
                    format_rate(t.download_rate) + " / " + format_rate(t.upload_rate)),
        label_value("  Connections : ", std::to_string(t.connections)),
        label_value("  Tracked for : ",
                    fmt_age(std::chrono::duration_cast<std::chrono::seconds>(
                                std::chrono::steady_clock::now() - t.added_at)
                                .count())),
    };
    if (t.file_path)
        rows.push_back(label_value("  Path        : ", *t.file_path));
    if (t.source_url)
        rows.push_back(label_value("  Source      : ", truncate_text(*t.source_url, 80)));
    if (t.kind == TransferKind::Torrent) {
        rows.push_back(label_value("  Seeds/Peers : ", std::to_string(t.seed_count) + " / " +
                                                           std::to_string(t.peer_count)));
        const uint32_t done = t.piece_bitfield ? count_set_bits_hex(*t.piece_bitfield) : 0;
        rows.push_back(label_value("  Pieces      : ", std::to_string(std::min(done, t.piece_count)) +
                                                           " / " + std::to_string(t.piece_count)));
    }
    if (t.error_message && !t.error_message->empty())
        rows.push_back(label_value("  Error       : ", *t.error_message, Color::Red));
    rows.push_back(hbox({
        text("  Rate        : ") | color(Color::GrayDark),
        text(sparkline(t.rate_history)) | color(Color::Green),
    }));

    Elements content;
    content.push_back(text(" Details ") | bold | color(Color::Gold1));
    for (auto& r : rows)
        content.push_back(std::move(r));
    return vbox(std::move(content)) | border;
}

static const char* prompt_label(Prompt p) {
    switch (p) {
    case Prompt::Add: return " Add URL / magnet / .torrent / .metalink: ";
    case Prompt::DownloadLimit: return " Download limit (e.g. 5m, 500k, 0 = unlimited): ";
    case Prompt::UploadLimit: return " Upload limit (e.g. 1m, 0 = unlimited): ";
    case Prompt::Search: return " Search: ";
    case Prompt::ConfirmDelete: return " Delete file from disk? [y/N] ";
    case Prompt::None: break;
    }
    return "";
}

// ============================================================================
// Application entry point (split so main() itself is exception-free)
// ============================================================================
static int run(int argc, char* argv[]) {
    int                      refresh_secs = 1;
    std::string              log_file;
    bool                     verbose = false;
    std::vector<std::string> initial_sources;

    for (int i = 1; i < argc; ++i) {
        std::string arg  = argv[i];
        auto        next = [&]() -> std::string {
            if (i + 1 < argc)
                return argv[++i];
            throw std::runtime_error("missing value for " + arg);
        };
        if (arg == "--refresh" || arg == "-r")
            refresh_secs = std::max(1, std::stoi(next()));
        else if (arg == "--log-file" || arg == "-l")
            log_file = next();
        else if (arg == "--verbose")
            verbose = true;
        else if (arg == "--version" || arg == "-v") {
            std::puts("aria-tui " ARIA_TUI_VERSION);
            return 0;
        } else if (arg == "--help" || arg == "-h") {
            // clang-format off
            std::puts(
                "aria-tui - Terminal UI for the aria2 download daemon\n"
                "\n"
                "Usage: aria-tui [options] [URL | magnet | file.torrent | file.metalink]...\n"
                "\n"
                "aria2c is started on port 6800 when no daemon is listening there.\n"
                "\n"
                "Options:\n"
                "  -r, --refresh <secs>   Poll interval          (default: 1)\n"
                "  -l, --log-file <path>  Log file               (default: ~/.local/state/aria-tui/aria-tui.log)\n"
                "      --verbose          Debug logging\n"
                "  -v, --version          Print version and exit\n"
                "  -h, --help             Show this help\n"
                "\n"
                "Keyboard:\n"
                "  Tab / Left / Right     Switch tabs\n"
                "  Up / Down              Select transfer\n"
                "  a                      Add download\n"
                "  p                      Pause / resume selected\n"
                "  P / R                  Pause all / resume all\n"
                "  d                      Remove selected\n"
                "  D                      Remove selected and delete its file\n"
                "  r                      Retry selected\n"
                "  c                      Purge completed and failed\n"
                "  + / -                  Move selected up / down the queue\n"
                "  s / o                  Cycle sort column / reverse order\n"
                "  /                      Filter by name (empty clears)\n"
                "  l / u                  Set download / upload limit\n"
                "  q / Escape             Quit\n"
            );
            // clang-format on
            return 0;
        } else if (!arg.empty() && arg.front() == '-') {
            throw std::runtime_error("unknown option " + arg);
        } else {
            initial_sources.push_back(arg);
        }
    }

    init_logging(log_file.empty() ? default_log_path() : std::filesystem::path(log_file),
                 verbose);
    spdlog::info("aria-tui {} starting", ARIA_TUI_VERSION);

    Aria2Daemon daemon;
    daemon.ensure_available();

    DownloadManager manager(daemon);

    UiState    ui;
    StatusLine status{"Connected to aria2 " + daemon.version(), false};
    std::mutex status_mtx;

    for (const auto& src : initial_sources) {
        try {
            manager.add(src);
        } catch (const Error& e) {
            status = {"Failed to add " + src + ": " + e.what(), true};
        }
    }

    auto screen = ScreenInteractive::Fullscreen();

    // Mutations run off the UI thread, one at a time in posting order;
    // remove() alone sleeps for the settle delay.
    ActionQueue actions([&](const std::string& message, bool is_error) {
        {
            std::lock_guard lock(status_mtx);
            status = {message, is_error};
        }
        screen.PostEvent(Event::Custom);
    });
    // status_mtx is held across post() so a fast completion cannot be
    // overwritten by the queued notice.
    auto run_action = [&](ActionQueue::Action action) {
        std::lock_guard lock(status_mtx);
        const size_t    ahead = actions.post(std::move(action));
        if (ahead > 0)
            status = {"Queued behind " + std::to_string(ahead) + " pending action(s)", false};
    };

    // Current tab's rows, filtered and sorted exactly as rendered.
    auto visible_rows = [&]() {
        auto rows = filter_by_search(filter_by_tab(manager.all(), static_cast<ListTab>(ui.tab)),
                                     ui.search);
        sort_transfers(rows, ui.sort, ui.ascending);
        return rows;
    };
    auto selected_transfer = [&]() -> std::optional<Transfer> {
        auto rows = visible_rows();
        if (rows.empty())
            return std::nullopt;
        return rows[static_cast<size_t>(std::clamp(ui.selected, 0, (int)rows.size() - 1))];
    };

    auto renderer = Renderer([&]() -> Element {
        const auto  transfers = manager.all();
        const auto  stats     = manager.stats();
        const auto  poll_err  = manager.last_poll_error();
        auto        rows      = visible_rows();
        StatusLine  msg;
        {
            std::lock_guard lock(status_mtx);
            msg = status;
        }

        if (!rows.empty())
            ui.selected = std::clamp(ui.selected, 0, (int)rows.size() - 1);
        else
            ui.selected = 0;

        Elements tabs;
        for (int i = 0; i < (int)TAB_LABELS.size(); ++i) {
            if (i > 0)
                tabs.push_back(text("│") | automerge);
            auto e = text(" " + TAB_LABELS[i] + " (" +
                          std::to_string(count_in_tab(transfers, static_cast<ListTab>(i))) + ") ");
            tabs.push_back(i == ui.tab ? e | bold | inverted : e | dim);
        }

        Elements list;
        if (rows.empty()) {
            list.push_back(text("  No transfers") | color(Color::GrayDark));
        } else {
            for (size_t i = 0; i < rows.size(); ++i)
                list.push_back(render_row(rows[i], (int)i == ui.selected));
        }

        Element details = rows.empty() ? text("")
                                       : render_details(rows[static_cast<size_t>(ui.selected)]);

        Element bottom;
        if (ui.prompt != Prompt::None) {
            bottom = hbox({
                text(prompt_label(ui.prompt)) | color(Color::Yellow) | bold,
                text(ui.input) | color(Color::White),
                text("│") | color(Color::White),
                filler(),
                text(" [Enter] confirm  [Esc] cancel ") | color(Color::GrayDark),
            });
        } else if (!poll_err.empty()) {
            bottom = hbox({
                text(" ERROR ") | bgcolor(Color::Red) | color(Color::White) | bold,
                text(" " + poll_err) | color(Color::Red),
            });
        } else {
            bottom = hbox({
                text(" " + msg.text) | color(msg.is_error ? Color::Red : Color::GrayDark),
                filler(),
                text(" [a]dd [p]ause [d]el [r]etry [c]lear [s]ort [/]search [q]uit ") |
                    color(Color::GrayDark),
            });
        }

        return vbox({
            hbox({
                text(" aria-tui ") | bold | color(Color::Gold1),
                text(" 127.0.0.1:" + std::to_string(ARIA2_RPC_PORT) + " ") |
                    color(Color::GrayDark),
                filler(),
                text(" ↓ " + format_rate(stats.download_rate)) | color(Color::Green) | bold,
                text("  ↑ " + format_rate(stats.upload_rate) + " ") | color(Color::Cyan) | bold,
            }) | border,
            hbox({
                hbox(std::move(tabs)) | flex,
                ui.search.empty() ? text("")
                                  : text(" /" + ui.search + " (" + std::to_string(rows.size()) +
                                         ") ") |
                                        color(Color::Yellow),
                separatorLight(),
                text(std::string(" sort: ") + sort_order_name(ui.sort) +
                     (ui.ascending ? " ▲ " : " ▼ ")) |
                    color(Color::GrayDark),
            }) | border,
            vbox(std::move(list)) | yframe | flex | border,
            details,
            bottom | border,
        });
    });

    auto submit_prompt = [&] {
        const Prompt      p     = ui.prompt;
        const std::string input = ui.input;
        ui.prompt               = Prompt::None;
        ui.input.clear();

        switch (p) {
        case Prompt::Add:
            run_action([&manager, input] { return "Added " + manager.add(input); });
            break;
        case Prompt::DownloadLimit:
        case Prompt::UploadLimit: {
            auto limit = parse_speed_limit(input);
            if (!limit) {
                std::lock_guard lock(status_mtx);
                status = {"Invalid speed limit: " + input, true};
                break;
            }
            const bool down = p == Prompt::DownloadLimit;
            run_action([&manager, down, bytes = *limit] {
                if (down)
                    manager.set_download_limit(bytes);
                else
                    manager.set_upload_limit(bytes);
                return std::string(down ? "Download" : "Upload") +
                       " limit: " + format_speed_limit(bytes);
            });
            break;
        }
        case Prompt::Search:
            ui.search   = input;
            ui.selected = 0;
            break;
        case Prompt::ConfirmDelete:
        case Prompt::None:
            break;
        }
    };

    auto event_handler = CatchEvent(renderer, [&](const Event& event) -> bool {
        // Poll refresh; never consumed as a keypress
        if (event == Event::Custom || event.is_mouse())
            return false;

        if (ui.prompt == Prompt::ConfirmDelete) {
            const std::string id = ui.pending_id;
            ui.prompt            = Prompt::None;
            if (event == Event::Character('y') || event == Event::Character('Y'))
                run_action([&manager, id] { return manager.delete_file(id); });
            return true;
        }
        if (ui.prompt != Prompt::None) {
            if (event == Event::Escape) {
                ui.prompt = Prompt::None;
                ui.input.clear();
                return true;
            }
            if (event == Event::Return) {
                submit_prompt();
                return true;
            }
            if (event == Event::Backspace) {
                if (!ui.input.empty())
                    ui.input.pop_back();
                return true;
            }
            if (event.is_character()) {
                ui.input += event.character();
                return true;
            }
            return true;
        }

        if (event == Event::Character('q') || event == Event::Escape) {
            screen.ExitLoopClosure()();
            return true;
        }
        if (event == Event::Tab || event == Event::ArrowRight) {
            ui.tab      = (ui.tab + 1) % (int)TAB_LABELS.size();
            ui.selected = 0;
            return true;
        }
        if (event == Event::TabReverse || event == Event::ArrowLeft) {
            ui.tab      = (ui.tab + (int)TAB_LABELS.size() - 1) % (int)TAB_LABELS.size();
            ui.selected = 0;
            return true;
        }
        if (event == Event::ArrowUp) {
            ui.selected = std::max(0, ui.selected - 1);
            return true;
        }
        if (event == Event::ArrowDown) {
            ui.selected++;
            return true;
        }
        if (event == Event::Character('a')) {
            ui.prompt = Prompt::Add;
            return true;
        }
        if (event == Event::Character('l')) {
            ui.prompt = Prompt::DownloadLimit;
            return true;
        }
        if (event == Event::Character('u')) {
            ui.prompt = Prompt::UploadLimit;
            return true;
        }
        if (event == Event::Character('/')) {
            ui.prompt = Prompt::Search;
            ui.input  = ui.search;
            return true;
        }
        if (event == Event::Character('s')) {
            ui.sort = next_sort_order(ui.sort);
            return true;
        }
        if (event == Event::Character('o')) {
            ui.ascending = !ui.ascending;
            return true;
        }
        if (event == Event::Character('P')) {
            run_action([&manager] {
                manager.pause_all();
                return std::string("Paused all");
            });
            return true;
        }
        if (event == Event::Character('R')) {
            run_action([&manager] {
                manager.resume_all();
                return std::string("Resumed all");
            });
            return true;
        }
        if (event == Event::Character('c')) {
            run_action([&manager] {
                return "Purged " + std::to_string(manager.purge_completed()) + " transfers";
            });
            return true;
        }

        auto sel = selected_transfer();
        if (!sel)
            return false;
        const std::string id   = sel->id;
        const std::string name = sel->name;

        if (event == Event::Character('p')) {
            const bool paused = sel->status == TransferStatus::Paused;
            run_action([&manager, id, name, paused] {
                if (paused)
                    manager.resume(id);
                else
                    manager.pause(id);
                return std::string(paused ? "Resumed " : "Paused ") + name;
            });
            return true;
        }
        if (event == Event::Character('d')) {
            run_action([&manager, id, name] {
                manager.remove(id);
                return "Removed " + name;
            });
            return true;
        }
        if (event == Event::Character('D')) {
            ui.prompt     = Prompt::ConfirmDelete;
            ui.pending_id = id;
            return true;
        }
        if (event == Event::Character('r')) {
            run_action([&manager, id, name] {
                const std::string new_id = manager.retry(id);
                return "Retrying " + name + " as " + new_id;
            });
            return true;
        }
        if (event == Event::Character('+')) {
            run_action([&manager, id, name] {
                manager.move_up(id);
                return "Moved up " + name;
            });
            return true;
        }
        if (event == Event::Character('-')) {
            run_action([&manager, id, name] {
                manager.move_down(id);
                return "Moved down " + name;
            });
            return true;
        }
        return false;
    });

    manager.start(std::chrono::seconds(refresh_secs), [&] { screen.PostEvent(Event::Custom); });

    screen.Loop(event_handler);

    actions.stop();
    manager.stop();
    daemon.shutdown();
    spdlog::info("aria-tui exiting");

    return 0;
}

int main(int argc, char* argv[]) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        std::fprintf(stderr, "aria-tui: %s\n", e.what());
        return 1;
    }
}
