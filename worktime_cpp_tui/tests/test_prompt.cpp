#include <catch2/catch_test_macros.hpp>

#include "prompt.hpp"
#include "test_support.hpp"

using namespace worktime;
using worktime::testing::FakeTerminal;

namespace {

LineEditor::Status type(LineEditor& editor, const std::string& text) {
    LineEditor::Status status = editor.status();
    for (char ch : text) {
        status = editor.feed(char_key(ch));
    }
    return status;
}

} // namespace

// ============================================================================
// LineEditor
// ============================================================================

TEST_CASE("typing then Enter confirms the trimmed text") {
    LineEditor editor;
    CHECK(type(editor, "  Fix bug  ") == LineEditor::Status::Editing);
    CHECK(editor.buffer() == "  Fix bug  ");
    CHECK(editor.feed({Key::Enter, 0}) == LineEditor::Status::Confirmed);

    const PromptResult r = editor.result();
    CHECK(!r.cancelled);
    CHECK(r.text == "Fix bug");
}

TEST_CASE("Escape cancels with empty text") {
    LineEditor editor;
    type(editor, "Fix bug");
    CHECK(editor.feed({Key::Escape, 0}) == LineEditor::Status::Cancelled);

    const PromptResult r = editor.result();
    CHECK(r.cancelled);
    CHECK(r.text.empty());
}

TEST_CASE("Backspace removes one character") {
    LineEditor editor;
    type(editor, "abc");
    editor.feed({Key::Backspace, 0});
    CHECK(editor.buffer() == "ab");

    SECTION("on an empty buffer it is a no-op") {
        LineEditor empty;
        empty.feed({Key::Backspace, 0});
        CHECK(empty.buffer().empty());
        CHECK(empty.status() == LineEditor::Status::Editing);
    }
}

TEST_CASE("Backspace removes a whole UTF-8 character") {
    LineEditor editor;
    type(editor, "caf\xC3\xA9");
    editor.feed({Key::Backspace, 0});
    CHECK(editor.buffer() == "caf");
}

TEST_CASE("control characters and navigation keys are ignored") {
    LineEditor editor;
    editor.feed(char_key('\x01'));
    editor.feed({Key::Up, 0});
    editor.feed({Key::Tab, 0});
    editor.feed({Key::Resize, 0});
    CHECK(editor.buffer().empty());
    CHECK(editor.status() == LineEditor::Status::Editing);
}

TEST_CASE("keys after confirmation change nothing") {
    LineEditor editor;
    type(editor, "done");
    editor.feed({Key::Enter, 0});
    editor.feed(char_key('x'));
    editor.feed({Key::Escape, 0});
    CHECK(editor.status() == LineEditor::Status::Confirmed);
    CHECK(editor.result().text == "done");
}

TEST_CASE("Enter on whitespace confirms empty text") {
    LineEditor editor;
    type(editor, "   ");
    editor.feed({Key::Enter, 0});
    CHECK(!editor.result().cancelled);
    CHECK(editor.result().text.empty());
}

// ============================================================================
// run_prompt
// ============================================================================

TEST_CASE("prompt Fix bug then Escape is cancelled") {
    FakeTerminal term(24, 80);
    term.push_text("Fix bug");
    term.push_key({Key::Escape, 0});

    int background_draws = 0;
    const PromptResult r = run_prompt(term, "Start", [&] { ++background_draws; });

    CHECK(r.cancelled);
    CHECK(r.text.empty());
    CHECK(background_draws == 8);
    CHECK(term.waits() == 8);
    CHECK(!term.cursor_visible());
}

TEST_CASE("prompt draws a centred box with the typed text") {
    FakeTerminal term(24, 80);
    term.push_text("Fix bug");
    term.push_key({Key::Enter, 0});

    const PromptResult r = run_prompt(term, "Start", nullptr);
    CHECK(!r.cancelled);
    CHECK(r.text == "Fix bug");

    // Box is 55 wide and 5 high, centred on a 24x80 screen.
    const auto& screen = term.screen();
    CHECK(screen.row(9).substr(12, 9) == "+- Start ");
    CHECK(screen.row(11).substr(14, 7) == "Fix bug");
    CHECK(screen.role_at(9, 12) == Role::BorderFocused);
    CHECK(screen.role_at(11, 14) == Role::Selection);
    CHECK(term.cursor_y() == 11);
    CHECK(term.cursor_x() == 21);
}

TEST_CASE("prompt keeps the tail of a long buffer visible") {
    FakeTerminal term(10, 30);
    const std::string text = "0123456789abcdefghijklmnopqrstuvwxyz";
    term.push_text(text);
    term.push_key({Key::Enter, 0});

    const PromptResult r = run_prompt(term, "T", nullptr);
    CHECK(r.text == text);
    // Only the tail of the buffer fits in the field.
    CHECK(term.screen().contains("uvwxy"));
    CHECK(!term.screen().contains("0123"));
}
