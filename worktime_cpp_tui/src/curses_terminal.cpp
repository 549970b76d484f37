#include "curses_terminal.hpp"

#include <algorithm>
#include <clocale>
#include <csignal>

#include <ncurses.h>

#include "text_util.hpp"

namespace worktime {

namespace {

volatile std::sig_atomic_t g_stop_requested = 0;

extern "C" void on_stop_signal(int) {
    g_stop_requested = 1;
}

StyleRegistry enter_curses_mode() {
    setlocale(LC_ALL, "");
    initscr();
    cbreak();
    noecho();
    keypad(stdscr, TRUE);
    curs_set(0);
    set_escdelay(25);
    return StyleRegistry::from_terminal();
}

chtype glyph_char(Glyph glyph) {
    switch (glyph) {
        case Glyph::UpperLeft: return ACS_ULCORNER;
        case Glyph::UpperRight: return ACS_URCORNER;
        case Glyph::LowerLeft: return ACS_LLCORNER;
        case Glyph::LowerRight: return ACS_LRCORNER;
        case Glyph::Horizontal: return ACS_HLINE;
        case Glyph::Vertical: return ACS_VLINE;
    }
    return ' ';
}

} // namespace

CursesTerminal::CursesTerminal() : styles_(enter_curses_mode()) {}

CursesTerminal::~CursesTerminal() {
    curs_set(1);
    endwin();
}

void CursesTerminal::install_signal_handlers() {
    std::signal(SIGINT, on_stop_signal);
    std::signal(SIGTERM, on_stop_signal);
}

bool CursesTerminal::stop_requested() const {
    return g_stop_requested != 0;
}

int CursesTerminal::rows() const {
    return getmaxy(stdscr);
}

int CursesTerminal::cols() const {
    return getmaxx(stdscr);
}

bool CursesTerminal::put_text(int y, int x, const std::string& text, Role role, bool bold) {
    const int h = rows();
    const int w = cols();
    if (y < 0 || y >= h || x < 0 || x >= w) {
        return false;
    }
    // Writing the bottom-right cell would scroll the screen.
    const int room = (y == h - 1) ? w - x - 1 : w - x;
    const std::string clipped = truncate_utf8_by_width(text, room);
    if (clipped.empty()) {
        return text.empty();
    }
    attr_t attr = static_cast<attr_t>(styles_.attr(role));
    if (bold) {
        attr |= A_BOLD;
    }
    attron(attr);
    const int rc = mvaddnstr(y, x, clipped.c_str(), static_cast<int>(clipped.size()));
    attroff(attr);
    return rc != ERR;
}

bool CursesTerminal::put_glyph(int y, int x, Glyph glyph, Role role) {
    const int h = rows();
    const int w = cols();
    if (y < 0 || y >= h || x < 0 || x >= w || (y == h - 1 && x == w - 1)) {
        return false;
    }
    return mvaddch(y, x, glyph_char(glyph) | static_cast<attr_t>(styles_.attr(role))) != ERR;
}

std::optional<KeyEvent> CursesTerminal::read_key(std::chrono::milliseconds wait) {
    wtimeout(stdscr, static_cast<int>(wait.count()));
    const int ch = getch();
    if (ch == ERR) {
        return std::nullopt;
    }
    return translate(ch);
}

KeyEvent CursesTerminal::wait_key() {
    wtimeout(stdscr, -1);
    while (true) {
        const int ch = getch();
        if (ch != ERR) {
            return translate(ch);
        }
        if (stop_requested()) {
            return {Key::Escape, 0};
        }
    }
}

void CursesTerminal::begin_frame() {
    werase(stdscr);
}

void CursesTerminal::end_frame() {
    wrefresh(stdscr);
}

void CursesTerminal::show_cursor(int y, int x) {
    curs_set(1);
    wmove(stdscr, std::clamp(y, 0, std::max(0, rows() - 1)), std::clamp(x, 0, std::max(0, cols() - 1)));
}

void CursesTerminal::hide_cursor() {
    curs_set(0);
}

KeyEvent CursesTerminal::translate(int ch) {
    switch (ch) {
        case KEY_UP: return {Key::Up, 0};
        case KEY_DOWN: return {Key::Down, 0};
        case '\t': return {Key::Tab, 0};
        case '\n':
        case '\r':
        case KEY_ENTER: return {Key::Enter, 0};
        case 27: return {Key::Escape, 0};
        case KEY_BACKSPACE:
        case 127:
        case 8: return {Key::Backspace, 0};
        case KEY_RESIZE: return {Key::Resize, 0};
        default: break;
    }
    if (ch >= 0 && ch <= 255) {
        return {Key::Char, static_cast<char>(ch)};
    }
    return {Key::Other, 0};
}

} // namespace worktime
