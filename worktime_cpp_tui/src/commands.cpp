#include "commands.hpp"

namespace worktime {

Command command_for(const KeyEvent& key) {
    switch (key.key) {
        case Key::Up: return Command::ScrollUp;
        case Key::Down: return Command::ScrollDown;
        case Key::Tab: return Command::FocusNext;
        case Key::Escape: return Command::Quit;
        case Key::Resize: return Command::Redraw;
        case Key::Char: break;
        default: return Command::None;
    }
    switch (key.ch) {
        case 'q':
        case 'Q':
            return Command::Quit;
        case 'k': return Command::ScrollUp;
        case 'j': return Command::ScrollDown;
        case 't':
        case 'T':
            return Command::ToggleTopRange;
        case 'n':
        case 'N':
            return Command::Start;
        case 'x':
        case 'X':
            return Command::Stop;
        case 'r':
        case 'R':
            return Command::Reload;
        default:
            return Command::None;
    }
}

const char* key_help() {
    return "n:start  x:stop  r:reload  j/k:scroll  tab:focus  t:top range  q:quit";
}

} // namespace worktime
