#pragma once

#include "terminal.hpp"

namespace worktime {

enum class Command {
    None,
    Quit,
    ScrollUp,
    ScrollDown,
    FocusNext,
    ToggleTopRange,
    Start,
    Stop,
    Reload,
    Redraw
};

// Idle-state key bindings.
Command command_for(const KeyEvent& key);

const char* key_help();

} // namespace worktime
