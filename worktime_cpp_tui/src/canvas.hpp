#pragma once

#include <string>

namespace worktime {

// Semantic colour roles; the terminal maps them once at startup.
enum class Role {
    Text,
    Dim,
    Accent,
    Border,
    BorderFocused,
    Selection,
    Error,
    Success,
    RunningBadge,
    IdleBadge,
    IdleText,
};

inline constexpr int kRoleCount = static_cast<int>(Role::IdleText) + 1;

enum class Glyph {
    UpperLeft,
    UpperRight,
    LowerLeft,
    LowerRight,
    Horizontal,
    Vertical,
};

// A character grid. Writes that fall outside the grid, or that the backend
// rejects, return false and leave the grid untouched.
class Canvas {
public:
    virtual ~Canvas() = default;

    virtual int rows() const = 0;
    virtual int cols() const = 0;

    virtual bool put_text(int y, int x, const std::string& text, Role role, bool bold = false) = 0;
    virtual bool put_glyph(int y, int x, Glyph glyph, Role role) = 0;
};

} // namespace worktime
