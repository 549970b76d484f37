#pragma once

#include "config.hpp"

namespace worktime {

// Installs the default spdlog logger. ncurses owns the terminal, so records go
// to cfg.debug_log_path; if that file cannot be opened a null sink is used and
// the reason is printed on stderr. Returns false in that case.
bool init_logging(const DashboardConfig& cfg);

} // namespace worktime
