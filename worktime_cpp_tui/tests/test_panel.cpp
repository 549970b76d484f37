#include <catch2/catch_test_macros.hpp>

#include "panel.hpp"
#include "test_support.hpp"

using namespace worktime;
using worktime::testing::TextCanvas;

// ============================================================================
// draw_frame
// ============================================================================

TEST_CASE("frame draws corners, edges and title") {
    TextCanvas canvas(5, 20);
    REQUIRE(draw_frame(canvas, {0, 0, 4, 20}, "Status"));

    CHECK(canvas.row(0) == "+- Status ---------+");
    CHECK(canvas.row(1) == "|                  |");
    CHECK(canvas.row(3) == "+------------------+");
    CHECK(canvas.row(4) == std::string(20, ' '));
    CHECK(canvas.role_at(0, 0) == Role::Border);
}

TEST_CASE("frame title is truncated to fit") {
    TextCanvas canvas(3, 10);
    REQUIRE(draw_frame(canvas, {0, 0, 3, 10}, "A very long title"));
    CHECK(canvas.row(0) == "+- A ver-+");
}

TEST_CASE("focused frame uses the given border role") {
    TextCanvas canvas(3, 10);
    REQUIRE(draw_frame(canvas, {0, 0, 3, 10}, "", Role::BorderFocused));
    CHECK(canvas.role_at(0, 0) == Role::BorderFocused);
    CHECK(canvas.role_at(1, 9) == Role::BorderFocused);
}

TEST_CASE("frame smaller than 2x2 draws nothing") {
    TextCanvas canvas(5, 5);
    CHECK(!draw_frame(canvas, {0, 0, 1, 5}, "x"));
    CHECK(!draw_frame(canvas, {0, 0, 5, 1}, "x"));
    for (int y = 0; y < 5; ++y) {
        CHECK(canvas.row(y) == "     ");
    }
}

TEST_CASE("frame past the screen edge is refused, not thrown") {
    TextCanvas canvas(4, 10);
    CHECK(!draw_frame(canvas, {2, 0, 5, 10}, "x"));
    CHECK(canvas.refused() > 0);
}

// ============================================================================
// draw_lines / draw_wrapped
// ============================================================================

TEST_CASE("lines are padded to the inner width and cut to the inner height") {
    TextCanvas canvas(4, 10);
    draw_frame(canvas, {0, 0, 4, 10}, "");
    draw_lines(canvas, {0, 0, 4, 10}, {{"one"}, {"a line that is too long"}, {"dropped"}});

    CHECK(canvas.row(1) == "|one     |");
    CHECK(canvas.row(2) == "|a line t|");
    CHECK(!canvas.contains("dropped"));
}

TEST_CASE("line roles reach the canvas") {
    TextCanvas canvas(3, 10);
    draw_lines(canvas, {0, 0, 3, 10}, {{"err", Role::Error, true}});
    CHECK(canvas.role_at(1, 1) == Role::Error);
}

TEST_CASE("wrapped lines break on words") {
    TextCanvas canvas(6, 14);
    draw_frame(canvas, {0, 0, 6, 14}, "");
    draw_wrapped(canvas, {0, 0, 6, 14}, {{"Task: write the docs"}, {""}, {"Tags: x"}});

    CHECK(canvas.row(1) == "|Task: write |");
    CHECK(canvas.row(2) == "|the docs    |");
    CHECK(canvas.row(3) == "|            |");
    CHECK(canvas.row(4) == "|Tags: x     |");
}

TEST_CASE("wrapped output stops at the inner height") {
    TextCanvas canvas(4, 8);
    draw_frame(canvas, {0, 0, 4, 8}, "");
    draw_wrapped(canvas, {0, 0, 4, 8}, {{"aaa bbb ccc ddd eee"}});
    CHECK(canvas.row(1) == "|aaa   |");
    CHECK(canvas.row(2) == "|bbb   |");
    CHECK(!canvas.contains("ccc"));
}

TEST_CASE("inner_rect of a tiny frame is empty") {
    const Rect inner = inner_rect({0, 0, 2, 10});
    CHECK(inner.h == 0);
    CHECK(inner.w == 0);

    const Rect roomy = inner_rect({1, 2, 5, 10});
    CHECK(roomy.y == 2);
    CHECK(roomy.x == 3);
    CHECK(roomy.h == 3);
    CHECK(roomy.w == 8);
}

TEST_CASE("put_clipped with no width writes nothing") {
    TextCanvas canvas(1, 5);
    CHECK(put_clipped(canvas, 0, 0, 0, {"abc"}));
    CHECK(canvas.row(0) == "     ");
}
