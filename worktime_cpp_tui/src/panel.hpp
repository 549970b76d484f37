#pragma once

#include <string>
#include <vector>

#include "canvas.hpp"
#include "layout.hpp"

namespace worktime {

struct PanelLine {
    std::string text;
    Role        role = Role::Text;
    bool        bold = false;
};

using PanelLines = std::vector<PanelLine>;

// Area inside the frame; empty when the frame has no interior.
Rect inner_rect(const Rect& frame);

// Returns false when nothing (or only part of the frame) could be drawn.
bool draw_frame(Canvas& canvas, const Rect& frame, const std::string& title, Role border = Role::Border);

// One line per inner row, padded or cut to the inner width. Lines past the
// inner height are dropped.
void draw_lines(Canvas& canvas, const Rect& frame, const PanelLines& lines);

// Like draw_lines, but long lines are word-wrapped first.
void draw_wrapped(Canvas& canvas, const Rect& frame, const PanelLines& lines);

// Writes `line` at (y, x) padded/cut to exactly `width` columns.
bool put_clipped(Canvas& canvas, int y, int x, int width, const PanelLine& line);

} // namespace worktime
