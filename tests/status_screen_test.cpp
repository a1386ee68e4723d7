#include "test_harness.hpp"
#include <main/display/status_screen.hpp>

// Inclusive pixel rectangle queries over the rendered frame
static int countLit(const StatusScreen& screen, int x0, int y0, int x1, int y1)
{
    int lit = 0;
    for (int y = y0; y <= y1; ++y)
    {
        for (int x = x0; x <= x1; ++x)
        {
            if (screen.pixel(x, y))
            {
                ++lit;
            }
        }
    }
    return lit;
}

static int firstLitColumn(const StatusScreen& screen, int x0, int y0, int x1, int y1)
{
    for (int x = x0; x <= x1; ++x)
    {
        if (countLit(screen, x, y0, x, y1) > 0)
        {
            return x;
        }
    }
    return -1;
}

static void test_panel_geometry()
{
    StatusScreen small(32);
    EXPECT_EQ_INT(small.width(), 128);
    EXPECT_EQ_INT(small.height(), 32);
    EXPECT_EQ_INT(small.bufferSize(), 512);
    EXPECT_TRUE(small.buffer() != nullptr);

    StatusScreen tall(64);
    EXPECT_EQ_INT(tall.height(), 64);
    EXPECT_EQ_INT(tall.bufferSize(), 1024);
}

static void test_pixel_out_of_range()
{
    StatusScreen screen(32);
    screen.renderSplash();
    EXPECT_FALSE(screen.pixel(-1, 0));
    EXPECT_FALSE(screen.pixel(128, 0));
    EXPECT_FALSE(screen.pixel(0, 32));
}

static void test_splash_frame_and_interior()
{
    StatusScreen screen(32);
    screen.renderSplash();

    // 5 px white frame on all four sides
    EXPECT_EQ_INT(countLit(screen, 0, 0, 127, 4), 128 * 5);
    EXPECT_EQ_INT(countLit(screen, 0, 27, 127, 31), 128 * 5);
    EXPECT_EQ_INT(countLit(screen, 0, 5, 4, 26), 5 * 22);
    EXPECT_EQ_INT(countLit(screen, 123, 5, 127, 26), 5 * 22);

    // Black interior left of the title, above and below it
    EXPECT_EQ_INT(countLit(screen, 5, 5, 19, 26), 0);
    EXPECT_EQ_INT(countLit(screen, 5, 5, 122, 8), 0);
    EXPECT_EQ_INT(countLit(screen, 5, 23, 122, 26), 0);
    // 15 glyphs of 6 px end before x=110
    EXPECT_EQ_INT(countLit(screen, 111, 5, 122, 26), 0);
}

static void test_splash_title_position()
{
    StatusScreen screen(32);
    screen.renderSplash();

    EXPECT_EQ_INT(StatusScreen::textCentre(32), 15);
    EXPECT_TRUE(countLit(screen, 20, 9, 110, 21) > 60);

    const int first = firstLitColumn(screen, 5, 9, 122, 21);
    EXPECT_TRUE(first >= 20 && first <= 22);

    // Rows above and below the centre line both carry glyph pixels
    EXPECT_TRUE(countLit(screen, 20, 10, 110, 14) > 0);
    EXPECT_TRUE(countLit(screen, 20, 15, 110, 19) > 0);
}

static void test_rerender_replaces_previous_frame()
{
    StatusScreen screen(32);
    screen.renderSplash("XXXXXXXXXXXXXXX", 5, 20);
    screen.renderSplash(nullptr, 5, 20);
    EXPECT_EQ_INT(countLit(screen, 5, 5, 122, 26), 0);
    EXPECT_TRUE(screen.pixel(0, 0));
}

int main()
{
    test_panel_geometry();
    test_pixel_out_of_range();
    test_splash_frame_and_interior();
    test_splash_title_position();
    test_rerender_replaces_previous_frame();
    return test_result("status_screen_test");
}
