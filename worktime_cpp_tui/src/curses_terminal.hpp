#pragma once

#include "style.hpp"
#include "terminal.hpp"

namespace worktime {

// Owns curses mode for its lifetime: the constructor enters it, the destructor
// always returns the terminal to cooked mode with a visible cursor.
class CursesTerminal : public Terminal {
public:
    CursesTerminal();
    ~CursesTerminal() override;

    CursesTerminal(const CursesTerminal&)            = delete;
    CursesTerminal& operator=(const CursesTerminal&) = delete;

    int rows() const override;
    int cols() const override;

    bool put_text(int y, int x, const std::string& text, Role role, bool bold = false) override;
    bool put_glyph(int y, int x, Glyph glyph, Role role) override;

    std::optional<KeyEvent> read_key(std::chrono::milliseconds timeout) override;
    KeyEvent                wait_key() override;

    void begin_frame() override;
    void end_frame() override;

    void show_cursor(int y, int x) override;
    void hide_cursor() override;

    bool stop_requested() const override;

    // SIGINT/SIGTERM only raise a flag; the event loop exits on its next wake.
    static void install_signal_handlers();

private:
    StyleRegistry styles_;

    static KeyEvent translate(int ch);
};

} // namespace worktime
