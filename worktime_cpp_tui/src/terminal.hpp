#pragma once

#include <chrono>
#include <optional>

#include "canvas.hpp"

namespace worktime {

enum class Key {
    Char,
    Up,
    Down,
    Tab,
    Enter,
    Escape,
    Backspace,
    Resize,
    Other
};

struct KeyEvent {
    Key  key = Key::Other;
    char ch  = 0; // raw byte for Key::Char
};

inline KeyEvent char_key(char ch) { return {Key::Char, ch}; }

// Screen plus keyboard. One frame is begin_frame(), canvas writes, end_frame().
class Terminal : public Canvas {
public:
    // Empty when `timeout` elapses without a key.
    virtual std::optional<KeyEvent> read_key(std::chrono::milliseconds timeout) = 0;
    // Blocks until a key arrives.
    virtual KeyEvent wait_key() = 0;

    virtual void begin_frame() = 0;
    virtual void end_frame() = 0;

    virtual void show_cursor(int y, int x) = 0;
    virtual void hide_cursor() = 0;

    // Set when the process was asked to terminate (SIGINT, SIGTERM).
    virtual bool stop_requested() const { return false; }
};

} // namespace worktime
