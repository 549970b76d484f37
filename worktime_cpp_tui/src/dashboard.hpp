#pragma once

#include <functional>
#include <optional>
#include <string>

#include "aggregator.hpp"
#include "commands.hpp"
#include "config.hpp"
#include "interval_store.hpp"
#include "layout.hpp"
#include "panel.hpp"
#include "prompt.hpp"
#include "scroll_state.hpp"
#include "terminal.hpp"

namespace worktime {

using Clock = std::function<Instant()>;

enum class NoticeKind {
    Neutral,
    Success,
    Error
};

struct Notification {
    std::string text;
    NoticeKind  kind = NoticeKind::Neutral;
    Instant     posted;
};

enum class TopRange {
    Day,
    Week
};

class DashboardApp {
public:
    DashboardApp(Terminal& terminal, IntervalStore& store, DashboardConfig cfg, Clock clock = now_instant);

    // Loads the store, then runs until quit or a stop signal. StoreError
    // propagates to the caller.
    void run();

    const Intervals&                   entries() const { return entries_; }
    const FocusState&                  focus() const { return focus_; }
    const std::optional<Notification>& notification() const { return notification_; }
    TopRange                           top_range() const { return top_range_; }

private:
    enum class LoopState {
        Idle,
        Prompting,
        Finished
    };

    Terminal&       terminal_;
    IntervalStore&  store_;
    DashboardConfig cfg_;
    Clock           clock_;

    Intervals                   entries_;
    FocusState                  focus_;
    TopRange                    top_range_ = TopRange::Week;
    std::optional<Notification> notification_;

    // Returns false on quit.
    bool apply(Command cmd);

    void reload_entries();
    void finish_start(const PromptResult& result);
    void add_finished(const Intervals& current, const Interval& added, Instant now);
    void stop_entry();

    void notify(const std::string& text, NoticeKind kind);
    void expire_notification(Instant now);

    void draw();
    void draw_panels(Instant now);
    void draw_status(const Rect& frame, const Window& day, Instant now);
    void draw_range_list(ScrollPanel panel, const Rect& frame, const std::string& title,
                         const std::vector<RangeRow>& rows, const char* time_fmt, const std::string& empty_text);
    void draw_top(const Rect& frame, const Window& day, const Window& week, Instant now);
    void draw_current(const Rect& frame, Instant now);
    void draw_targets(const Rect& frame, const Window& day, const Window& week, Instant now);
    void draw_footer(const Rect& frame, Instant now);
    void draw_scrolled(ScrollPanel panel, const Rect& frame, const PanelLines& lines);

    std::string panel_title(const std::string& base, ScrollPanel panel) const;
    Role        border_for(ScrollPanel panel) const;
};

} // namespace worktime
