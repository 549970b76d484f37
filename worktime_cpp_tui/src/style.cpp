#include "style.hpp"

#include <ncurses.h>

namespace worktime {

namespace {

enum Pair : short {
    kPairText = 1,
    kPairAccent,
    kPairSuccess,
    kPairAmber,
    kPairError,
    kPairBorder,
    kPairDim,
    kPairSelection,
    kPairRunningBadge,
    kPairIdleBadge,
};

void set(std::array<AttrBits, kRoleCount>& attrs, Role role, AttrBits value) {
    attrs[static_cast<size_t>(role)] = value;
}

} // namespace

StyleRegistry StyleRegistry::from_terminal() {
    std::array<AttrBits, kRoleCount> attrs{};

    if (!has_colors()) {
        set(attrs, Role::Text, A_NORMAL);
        set(attrs, Role::Dim, A_DIM);
        set(attrs, Role::Accent, A_BOLD);
        set(attrs, Role::Border, A_NORMAL);
        set(attrs, Role::BorderFocused, A_BOLD);
        set(attrs, Role::Selection, A_REVERSE);
        set(attrs, Role::Error, A_BOLD);
        set(attrs, Role::Success, A_NORMAL);
        set(attrs, Role::RunningBadge, A_REVERSE | A_BOLD);
        set(attrs, Role::IdleBadge, A_REVERSE);
        set(attrs, Role::IdleText, A_BOLD);
        return StyleRegistry(attrs);
    }

    start_color();
    use_default_colors();
    if (COLORS >= 256) {
        // Muted palette: cool accents over the terminal's own background.
        init_pair(kPairText, 252, -1);
        init_pair(kPairAccent, 110, -1);
        init_pair(kPairSuccess, 108, -1);
        init_pair(kPairAmber, 179, -1);
        init_pair(kPairError, 174, -1);
        init_pair(kPairBorder, 109, -1);
        init_pair(kPairDim, 244, -1);
        init_pair(kPairSelection, 252, 24);
        init_pair(kPairRunningBadge, 16, 108);
        init_pair(kPairIdleBadge, 16, 179);
    } else {
        init_pair(kPairText, COLOR_WHITE, -1);
        init_pair(kPairAccent, COLOR_CYAN, -1);
        init_pair(kPairSuccess, COLOR_GREEN, -1);
        init_pair(kPairAmber, COLOR_YELLOW, -1);
        init_pair(kPairError, COLOR_RED, -1);
        init_pair(kPairBorder, COLOR_BLUE, -1);
        init_pair(kPairDim, COLOR_WHITE, -1);
        init_pair(kPairSelection, COLOR_BLACK, COLOR_CYAN);
        init_pair(kPairRunningBadge, COLOR_BLACK, COLOR_GREEN);
        init_pair(kPairIdleBadge, COLOR_BLACK, COLOR_YELLOW);
    }

    set(attrs, Role::Text, COLOR_PAIR(kPairText));
    set(attrs, Role::Dim, COLOR_PAIR(kPairDim) | A_DIM);
    set(attrs, Role::Accent, COLOR_PAIR(kPairAccent));
    set(attrs, Role::Border, COLOR_PAIR(kPairBorder));
    set(attrs, Role::BorderFocused, COLOR_PAIR(kPairAccent) | A_BOLD);
    set(attrs, Role::Selection, COLOR_PAIR(kPairSelection));
    set(attrs, Role::Error, COLOR_PAIR(kPairError));
    set(attrs, Role::Success, COLOR_PAIR(kPairSuccess));
    set(attrs, Role::RunningBadge, COLOR_PAIR(kPairRunningBadge) | A_BOLD);
    set(attrs, Role::IdleBadge, COLOR_PAIR(kPairIdleBadge) | A_BOLD);
    set(attrs, Role::IdleText, COLOR_PAIR(kPairAmber));
    return StyleRegistry(attrs);
}

} // namespace worktime
