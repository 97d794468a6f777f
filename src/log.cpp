#include "log.hpp"

#include <cstdlib>
#include <memory>
#include <system_error>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

std::filesystem::path default_log_path() {
    std::filesystem::path dir;
    if (const char* state = std::getenv("XDG_STATE_HOME"); state && *state)
        dir = std::filesystem::path(state) / "aria-tui";
    else if (const char* home = std::getenv("HOME"); home && *home)
        dir = std::filesystem::path(home) / ".local" / "state" / "aria-tui";
    else
        return "aria-tui.log";

    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec)
        return "aria-tui.log";
    return dir / "aria-tui.log";
}

void init_logging(const std::filesystem::path& file, bool verbose) {
    auto sink   = std::make_shared<spdlog::sinks::basic_file_sink_mt>(file.string());
    auto logger = std::make_shared<spdlog::logger>("aria-tui", std::move(sink));
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
    logger->set_level(verbose ? spdlog::level::debug : spdlog::level::info);
    logger->flush_on(spdlog::level::warn);

    spdlog::set_default_logger(std::move(logger));
}
