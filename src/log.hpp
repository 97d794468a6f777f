#pragma once

#include <filesystem>

// The terminal belongs to the UI, so everything goes to a file. Before
// init_logging() runs, spdlog's default stderr logger is used.
void init_logging(const std::filesystem::path& file, bool verbose = false);

// $XDG_STATE_HOME/aria-tui/aria-tui.log, ~/.local/state/aria-tui/aria-tui.log
// or ./aria-tui.log.
std::filesystem::path default_log_path();
