#include "prompt.hpp"

#include <algorithm>

#include "panel.hpp"
#include "text_util.hpp"

namespace worktime {

LineEditor::Status LineEditor::feed(const KeyEvent& key) {
    if (status_ != Status::Editing) {
        return status_;
    }
    switch (key.key) {
        case Key::Escape:
            status_ = Status::Cancelled;
            break;
        case Key::Enter:
            status_ = Status::Confirmed;
            break;
        case Key::Backspace:
            pop_utf8_char(buffer_);
            break;
        case Key::Char: {
            const auto byte = static_cast<unsigned char>(key.ch);
            if (byte >= 0x20 && byte != 0x7f) {
                buffer_.push_back(key.ch);
            }
            break;
        }
        default:
            break;
    }
    return status_;
}

PromptResult LineEditor::result() const {
    if (status_ == Status::Cancelled) {
        return {"", true};
    }
    return {trimmed(buffer_), false};
}

PromptResult run_prompt(Terminal& terminal, const std::string& title,
                        const std::function<void()>& draw_background) {
    LineEditor editor;
    while (true) {
        const int rows = terminal.rows();
        const int cols = terminal.cols();
        const int box_w = std::min(std::max(0, cols), std::max(50, std::min(cols - 4, display_width_utf8(title) + 50)));
        const int box_h = 5;
        const Rect box{std::max((rows - box_h) / 2, 0), std::max((cols - box_w) / 2, 0), box_h, box_w};
        const int field_w = std::max(0, box_w - 4);

        terminal.begin_frame();
        if (draw_background) {
            draw_background();
        }
        for (int row = box.y; row < box.bottom(); ++row) {
            if (!terminal.put_text(row, box.x, std::string(static_cast<size_t>(box.w), ' '), Role::Text)) {
                break;
            }
        }
        draw_frame(terminal, box, title, Role::BorderFocused);

        // Keep the tail of a long line visible.
        std::string shown = editor.buffer();
        while (display_width_utf8(shown) > std::max(0, field_w - 1) && !shown.empty()) {
            shown.erase(0, 1);
            while (!shown.empty() && (static_cast<unsigned char>(shown.front()) & 0xC0) == 0x80) {
                shown.erase(0, 1);
            }
        }
        put_clipped(terminal, box.y + 2, box.x + 2, field_w, {shown, Role::Selection, false});
        terminal.show_cursor(box.y + 2, box.x + 2 + display_width_utf8(shown));
        terminal.end_frame();

        if (editor.feed(terminal.wait_key()) != LineEditor::Status::Editing) {
            break;
        }
    }
    terminal.hide_cursor();
    return editor.result();
}

} // namespace worktime
