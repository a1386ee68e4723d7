#ifndef STATUS_SCREEN_HPP
#define STATUS_SCREEN_HPP

#include <cstddef>
#include <cstdint>
#include <u8g2.h>

// Static splash drawn with u8g2 into its full-frame buffer: white frame of
// `border` pixels, black interior, title vertically centred starting at
// `text_x`. The buffer is in SSD1306 page order (one byte per 8-pixel
// column, LSB on top, pages of width bytes) and is pushed to the panel by
// Ssd1306Display. u8g2 never talks to the bus itself.
//
// u8g2 keeps one static frame buffer per panel geometry, so instances of
// the same height share it.
class StatusScreen {
public:
    static constexpr const char* kTitle = "Plant Watch 2.0";
    static constexpr int kBorder = 5;
    static constexpr int kTextX = 20;

    // 128x64 when panel_height is 64, otherwise 128x32
    explicit StatusScreen(uint16_t panel_height);

    void renderSplash(const char* title = kTitle, int border = kBorder, int text_x = kTextX);

    uint16_t width() const;
    uint16_t height() const;
    const uint8_t* buffer() const;
    std::size_t bufferSize() const;

    // False outside the panel
    bool pixel(int x, int y) const;

    // Row the title's vertical centre sits on
    static int textCentre(int panel_height) { return panel_height / 2 - 1; }

private:
    u8g2_t u8g2;
};

#endif // STATUS_SCREEN_HPP
