#pragma once

#include <functional>
#include <string>

#include "terminal.hpp"

namespace worktime {

struct PromptResult {
    std::string text;
    bool        cancelled = false;
};

// Line buffer behind the modal prompt.
class LineEditor {
public:
    enum class Status {
        Editing,
        Confirmed,
        Cancelled
    };

    Status feed(const KeyEvent& key);

    const std::string& buffer() const { return buffer_; }
    Status             status() const { return status_; }

    // Trimmed text on confirm, empty text on cancel.
    PromptResult result() const;

private:
    std::string buffer_;
    Status      status_ = Status::Editing;
};

// Modal text entry. Reads keys without a timeout until Enter or Escape;
// `draw_background` repaints whatever sits under the prompt box each keystroke.
PromptResult run_prompt(Terminal& terminal, const std::string& title,
                        const std::function<void()>& draw_background);

} // namespace worktime
