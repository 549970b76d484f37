#include <cstdio>
#include <exception>

#include <spdlog/spdlog.h>

#include "config.hpp"
#include "curses_terminal.hpp"
#include "dashboard.hpp"
#include "interval_store.hpp"
#include "log_file_store.hpp"
#include "logging.hpp"

int main() {
    using namespace worktime;

    const DashboardConfig cfg = load_config();
    init_logging(cfg);
    for (const auto& warning : cfg.warnings) {
        spdlog::warn("config: {}", warning);
    }
    LogFileStore store(cfg.log_path);
    spdlog::info("worktime-tui starting, log={}", store.path().string());
    CursesTerminal::install_signal_handlers();

    try {
        // The terminal is restored before any error below is reported.
        CursesTerminal terminal;
        DashboardApp app(terminal, store, cfg);
        app.run();
    } catch (const StoreError& e) {
        spdlog::critical("store error: {}", e.what());
        std::fprintf(stderr, "worktime-tui: %s\n", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::critical("fatal: {}", e.what());
        std::fprintf(stderr, "worktime-tui: %s\n", e.what());
        return 1;
    }

    spdlog::info("worktime-tui exited");
    spdlog::shutdown();
    return 0;
}
