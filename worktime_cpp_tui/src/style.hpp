#pragma once

#include <array>
#include <cstddef>

#include "canvas.hpp"

namespace worktime {

// Curses attribute bits (attr_t), kept out of the header so ncurses macros do
// not leak into includers.
using AttrBits = unsigned long;

// Role -> curses attribute table. Built once after initscr(), then only read.
class StyleRegistry {
public:
    static StyleRegistry from_terminal();

    AttrBits attr(Role role) const { return attrs_[static_cast<size_t>(role)]; }

private:
    explicit StyleRegistry(const std::array<AttrBits, kRoleCount>& attrs) : attrs_(attrs) {}

    std::array<AttrBits, kRoleCount> attrs_;
};

} // namespace worktime
