#include "dashboard.hpp"

#include <algorithm>
#include <utility>

#include <spdlog/spdlog.h>

#include "civil_time.hpp"
#include "panel.hpp"
#include "text_util.hpp"
#include "time_override.hpp"
#include "time_window.hpp"

namespace worktime {

namespace {

constexpr const char* kStartPromptTitle = "Start entry (@HH:MM [@HH:MM] optional)";

Role role_for(NoticeKind kind) {
    switch (kind) {
        case NoticeKind::Success: return Role::Success;
        case NoticeKind::Error: return Role::Error;
        case NoticeKind::Neutral: return Role::Text;
    }
    return Role::Text;
}

std::string target_line(const std::string& scope, Duration worked, Duration target) {
    if (worked < target) {
        return "Remaining " + scope + ": " + format_hhmm(target - worked) + " to hit " + format_hhmm(target);
    }
    return "Target " + scope + " reached: +" + format_hhmm(worked - target) + " over " + format_hhmm(target);
}

} // namespace

DashboardApp::DashboardApp(Terminal& terminal, IntervalStore& store, DashboardConfig cfg, Clock clock)
    : terminal_(terminal), store_(store), cfg_(std::move(cfg)), clock_(std::move(clock)) {}

void DashboardApp::run() {
    reload_entries();
    spdlog::info("dashboard started with {} entries", entries_.size());

    LoopState state = LoopState::Idle;
    while (state != LoopState::Finished) {
        if (terminal_.stop_requested()) {
            spdlog::info("stop requested");
            break;
        }
        switch (state) {
            case LoopState::Idle: {
                expire_notification(clock_());
                draw();
                const auto key = terminal_.read_key(cfg_.tick_interval);
                if (!key) {
                    break; // tick
                }
                const Command cmd = command_for(*key);
                if (cmd == Command::Start) {
                    state = LoopState::Prompting;
                } else if (!apply(cmd)) {
                    state = LoopState::Finished;
                }
                break;
            }
            case LoopState::Prompting: {
                const PromptResult result =
                    run_prompt(terminal_, kStartPromptTitle, [this] { draw_panels(clock_()); });
                finish_start(result);
                state = LoopState::Idle;
                break;
            }
            case LoopState::Finished:
                break;
        }
    }
}

bool DashboardApp::apply(Command cmd) {
    switch (cmd) {
        case Command::Quit:
            return false;
        case Command::ScrollUp:
            focus_.scroll(-1);
            break;
        case Command::ScrollDown:
            focus_.scroll(1);
            break;
        case Command::FocusNext:
            focus_.focus_next();
            spdlog::debug("focus -> {}", scroll_panel_name(focus_.focused()));
            break;
        case Command::ToggleTopRange:
            top_range_ = top_range_ == TopRange::Day ? TopRange::Week : TopRange::Day;
            focus_.reset(ScrollPanel::Top);
            break;
        case Command::Stop:
            stop_entry();
            break;
        case Command::Reload:
            reload_entries();
            notify("Reloaded log.", NoticeKind::Neutral);
            break;
        case Command::Start:
        case Command::Redraw:
        case Command::None:
            break;
    }
    return true;
}

void DashboardApp::reload_entries() {
    entries_ = store_.read_all();
    spdlog::debug("loaded {} entries", entries_.size());
}

void DashboardApp::finish_start(const PromptResult& result) {
    if (result.cancelled) {
        notify("Start cancelled.", NoticeKind::Neutral);
        return;
    }
    if (result.text.empty()) {
        notify("Please enter a description.", NoticeKind::Error);
        return;
    }
    const Intervals current = store_.read_all();
    if (find_open(current)) {
        notify("An entry is already running.", NoticeKind::Error);
        return;
    }
    const Instant now = clock_();
    const StartRequest req = parse_start_request(result.text, now);
    if (!req.error.empty()) {
        notify(req.error, NoticeKind::Error);
        return;
    }
    if (req.label.empty()) {
        notify("Please enter a description.", NoticeKind::Error);
        return;
    }
    if (req.start && req.end) {
        add_finished(current, {*req.start, *req.end, req.label}, now);
        return;
    }

    const Interval started{req.start.value_or(now), std::nullopt, req.label};
    store_.append(started);
    spdlog::info("started '{}' at {}", started.label, format_iso_utc(started.start));
    reload_entries();
    notify("Started: " + started.label, NoticeKind::Success);
}

void DashboardApp::add_finished(const Intervals& current, const Interval& added, Instant now) {
    if (const auto hit = check_overlap(current, added, now)) {
        notify("Overlaps " + format_hhmm(hit->overlap) + " with: " + hit->existing.label, NoticeKind::Error);
        return;
    }
    store_.append(added);
    spdlog::info("added '{}' {} -> {}", added.label, format_iso_utc(added.start), format_iso_utc(*added.end));
    reload_entries();
    notify("Added: " + added.label + " (" + format_hhmm(*added.end - added.start) + ")", NoticeKind::Success);
}

void DashboardApp::stop_entry() {
    Intervals current = store_.read_all();
    const auto idx = find_open(current);
    if (!idx) {
        notify("No active entry to stop.", NoticeKind::Error);
        return;
    }
    Interval& open = current[*idx];
    Instant end = clock_();
    if (end <= open.start) {
        end = open.start + std::chrono::minutes(1);
    }
    open.end = end;
    store_.write_all(current);
    spdlog::info("stopped '{}' after {}", open.label, format_hhmm(end - open.start));
    reload_entries();
    notify("Stopped: " + open.label, NoticeKind::Success);
}

void DashboardApp::notify(const std::string& text, NoticeKind kind) {
    notification_ = Notification{text, kind, clock_()};
    if (kind == NoticeKind::Error) {
        spdlog::warn("{}", text);
    }
}

void DashboardApp::expire_notification(Instant now) {
    if (!notification_ || cfg_.notice_ttl <= Duration::zero()) {
        return;
    }
    if (now - notification_->posted >= cfg_.notice_ttl) {
        notification_.reset();
    }
}

void DashboardApp::draw() {
    terminal_.begin_frame();
    draw_panels(clock_());
    terminal_.end_frame();
}

void DashboardApp::draw_panels(Instant now) {
    const DashboardLayout layout = compute_dashboard_layout(terminal_.rows(), terminal_.cols());
    const Window day = day_window(now);
    const Window week = week_window(now, cfg_.week_start);

    draw_status(layout.status, day, now);
    draw_range_list(ScrollPanel::Day, layout.day, "[2]-Day entries", rows_for_range(entries_, day, now), "%H:%M",
                    "No entries yet today.");
    draw_range_list(ScrollPanel::Week, layout.week, "[3]-Week entries", rows_for_range(entries_, week, now),
                    "%a %H:%M", "No entries this week yet.");
    draw_top(layout.top, day, week, now);
    draw_current(layout.current, now);
    draw_targets(layout.targets, day, week, now);
    draw_footer(layout.footer, now);
}

void DashboardApp::draw_status(const Rect& frame, const Window& day, Instant now) {
    if (!draw_frame(terminal_, frame, "[1]-Status")) {
        return;
    }
    const Rect inner = inner_rect(frame);
    if (inner.h <= 0 || inner.w <= 0) {
        return;
    }
    const auto open = find_open(entries_);
    const std::string badge = open ? " WORKING " : " IDLE ";
    const int badge_w = std::min(inner.w, display_width_utf8(badge));
    if (!put_clipped(terminal_, inner.y, inner.x, badge_w,
                     {badge, open ? Role::RunningBadge : Role::IdleBadge, true})) {
        return;
    }
    PanelLine detail;
    if (open) {
        detail = {" " + format_hhmm(entries_[*open].duration(now)), Role::Text, true};
    } else {
        detail = {" today " + format_hhmm(total(entries_, day, now)), Role::IdleText, false};
    }
    put_clipped(terminal_, inner.y, inner.x + badge_w, inner.w - badge_w, detail);
}

void DashboardApp::draw_range_list(ScrollPanel panel, const Rect& frame, const std::string& title,
                                   const std::vector<RangeRow>& rows, const char* time_fmt,
                                   const std::string& empty_text) {
    if (!draw_frame(terminal_, frame, panel_title(title, panel), border_for(panel))) {
        return;
    }
    if (rows.empty()) {
        focus_.clamp(panel, 0, inner_rect(frame).h);
        draw_lines(terminal_, frame, {{empty_text, Role::Dim, false}});
        return;
    }
    PanelLines lines;
    lines.reserve(rows.size());
    for (const auto& row : rows) {
        std::string text = format_local(row.start, time_fmt) + "-" + format_local(row.end, "%H:%M") + " " +
                           format_hhmm(row.duration) + " " + row.label;
        lines.push_back({std::move(text), row.running ? Role::Success : Role::Text, row.running});
    }
    draw_scrolled(panel, frame, lines);
}

void DashboardApp::draw_top(const Rect& frame, const Window& day, const Window& week, Instant now) {
    const bool by_tags = cfg_.top_grouping == TopGrouping::Tag;
    const bool today = top_range_ == TopRange::Day;
    const std::string title =
        std::string(by_tags ? "[4]-Top tags" : "[4]-Top tasks") + (today ? " (today)" : " (week)");
    if (!draw_frame(terminal_, frame, panel_title(title, ScrollPanel::Top), border_for(ScrollPanel::Top))) {
        return;
    }
    const Window& window = today ? day : week;
    const auto ranked = by_tags ? by_tag(entries_, window, now, cfg_.top_limit)
                                : by_task(entries_, window, now, cfg_.top_limit);
    if (ranked.empty()) {
        focus_.clamp(ScrollPanel::Top, 0, inner_rect(frame).h);
        draw_lines(terminal_, frame, {{"No tracked time yet.", Role::Dim, false}});
        return;
    }
    PanelLines lines;
    lines.reserve(ranked.size());
    for (const auto& item : ranked) {
        lines.push_back({format_hhmm(item.duration) + " " + item.key, Role::Text, false});
    }
    draw_scrolled(ScrollPanel::Top, frame, lines);
}

void DashboardApp::draw_current(const Rect& frame, Instant now) {
    if (!draw_frame(terminal_, frame, "[0]-Current task")) {
        return;
    }
    PanelLines lines;
    const auto open = find_open(entries_);
    if (open) {
        const Interval& entry = entries_[*open];
        std::string tags;
        for (const auto& tag : entry.tags_or_untagged()) {
            tags += (tags.empty() ? "" : ", ") + tag;
        }
        lines.push_back({"Task: " + entry.label, Role::Accent, true});
        lines.push_back({"Start: " + format_local(entry.start, "%Y-%m-%d %H:%M"), Role::Text, false});
        lines.push_back({"Elapsed: " + format_hhmm(entry.duration(now)), Role::Text, false});
        lines.push_back({"Tags: " + tags, Role::Dim, false});
    } else {
        lines.push_back({"No active task.", Role::Dim, false});
        if (const Interval* closed = last_closed(entries_)) {
            lines.push_back({"", Role::Text, false});
            lines.push_back({"Last: " + closed->label, Role::Text, false});
            lines.push_back({"Ended: " + format_local(*closed->end, "%Y-%m-%d %H:%M"), Role::Text, false});
            lines.push_back({"Length: " + format_hhmm(closed->duration(*closed->end)), Role::Text, false});
        }
    }
    draw_wrapped(terminal_, frame, lines);
}

void DashboardApp::draw_targets(const Rect& frame, const Window& day, const Window& week, Instant now) {
    if (!draw_frame(terminal_, frame, "Targets")) {
        return;
    }
    const Duration today = total(entries_, day, now);
    const Duration this_week = total(entries_, week, now);
    PanelLines lines = {
        {"Worked today: " + format_hhmm(today) + " | week: " + format_hhmm(this_week), Role::Accent, false},
        {target_line("today", today, cfg_.day_target), today >= cfg_.day_target ? Role::Success : Role::Text, false},
        {target_line("week", this_week, cfg_.week_target), this_week >= cfg_.week_target ? Role::Success : Role::Text,
         false},
    };
    if (notification_) {
        lines.push_back({notification_->text, role_for(notification_->kind), notification_->kind == NoticeKind::Error});
    }
    draw_wrapped(terminal_, frame, lines);
}

void DashboardApp::draw_footer(const Rect& frame, Instant now) {
    if (frame.h <= 0 || frame.w <= 2) {
        return;
    }
    const int width = frame.w - 2;
    if (!put_clipped(terminal_, frame.y, frame.x + 1, width, {key_help(), Role::Dim, false})) {
        return;
    }
    if (frame.h < 2) {
        return;
    }
    const std::string clock = format_local(now, "%a %Y-%m-%d %H:%M:%S");
    const std::string info = std::to_string(entries_.size()) + " entries";
    put_clipped(terminal_, frame.y + 1, frame.x + 1, width,
                {pad_right_display(info, std::max(0, width - display_width_utf8(clock))) + clock, Role::Dim, false});
}

void DashboardApp::draw_scrolled(ScrollPanel panel, const Rect& frame, const PanelLines& lines) {
    const int viewport = inner_rect(frame).h;
    const int offset = focus_.clamp(panel, static_cast<int>(lines.size()), viewport);
    const PanelLines visible(lines.begin() + offset, lines.end());
    draw_lines(terminal_, frame, visible);
}

std::string DashboardApp::panel_title(const std::string& base, ScrollPanel panel) const {
    return focus_.is_focused(panel) ? base + " (scroll)" : base;
}

Role DashboardApp::border_for(ScrollPanel panel) const {
    return focus_.is_focused(panel) ? Role::BorderFocused : Role::Border;
}

} // namespace worktime
