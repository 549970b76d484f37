#include "panel.hpp"

#include "text_util.hpp"

namespace worktime {

Rect inner_rect(const Rect& frame) {
    if (frame.h < 3 || frame.w < 3) {
        return {frame.y + 1, frame.x + 1, 0, 0};
    }
    return {frame.y + 1, frame.x + 1, frame.h - 2, frame.w - 2};
}

bool draw_frame(Canvas& canvas, const Rect& frame, const std::string& title, Role border) {
    if (frame.h < 2 || frame.w < 2) {
        return false;
    }
    const int top = frame.y;
    const int bottom = frame.y + frame.h - 1;
    const int left = frame.x;
    const int right = frame.x + frame.w - 1;

    for (int col = left + 1; col < right; ++col) {
        if (!canvas.put_glyph(top, col, Glyph::Horizontal, border) ||
            !canvas.put_glyph(bottom, col, Glyph::Horizontal, border)) {
            return false;
        }
    }
    for (int row = top + 1; row < bottom; ++row) {
        if (!canvas.put_glyph(row, left, Glyph::Vertical, border) ||
            !canvas.put_glyph(row, right, Glyph::Vertical, border)) {
            return false;
        }
    }
    if (!canvas.put_glyph(top, left, Glyph::UpperLeft, border) ||
        !canvas.put_glyph(top, right, Glyph::UpperRight, border) ||
        !canvas.put_glyph(bottom, left, Glyph::LowerLeft, border) ||
        !canvas.put_glyph(bottom, right, Glyph::LowerRight, border)) {
        return false;
    }

    if (!title.empty() && frame.w >= 5) {
        const std::string t = truncate_utf8_by_width(" " + title + " ", frame.w - 4);
        return canvas.put_text(top, left + 2, t, border, true);
    }
    return true;
}

bool put_clipped(Canvas& canvas, int y, int x, int width, const PanelLine& line) {
    if (width <= 0) {
        return true;
    }
    return canvas.put_text(y, x, pad_right_display(line.text, width), line.role, line.bold);
}

void draw_lines(Canvas& canvas, const Rect& frame, const PanelLines& lines) {
    const Rect inner = inner_rect(frame);
    for (int i = 0; i < inner.h && i < static_cast<int>(lines.size()); ++i) {
        if (!put_clipped(canvas, inner.y + i, inner.x, inner.w, lines[i])) {
            return;
        }
    }
}

void draw_wrapped(Canvas& canvas, const Rect& frame, const PanelLines& lines) {
    const Rect inner = inner_rect(frame);
    if (inner.h <= 0 || inner.w <= 0) {
        return;
    }
    int row = 0;
    for (const auto& line : lines) {
        for (const auto& segment : wrap_words(line.text, inner.w)) {
            if (row >= inner.h) {
                return;
            }
            if (!put_clipped(canvas, inner.y + row, inner.x, inner.w, {segment, line.role, line.bold})) {
                return;
            }
            ++row;
        }
    }
}

} // namespace worktime
