#include <main/display/status_screen.hpp>

StatusScreen::StatusScreen(uint16_t panel_height) : u8g2{} {
    // Rasterise only: no byte transport, no GPIO or delay handling
    if (panel_height == 64) {
        u8g2_Setup_ssd1306_i2c_128x64_noname_f(&u8g2, U8G2_R0, u8x8_byte_empty, u8x8_dummy_cb);
    } else {
        u8g2_Setup_ssd1306_i2c_128x32_univision_f(&u8g2, U8G2_R0, u8x8_byte_empty, u8x8_dummy_cb);
    }
    u8g2_ClearBuffer(&u8g2);
}

uint16_t StatusScreen::width() const {
    return static_cast<uint16_t>(u8g2_GetBufferTileWidth(&u8g2) * 8U);
}

uint16_t StatusScreen::height() const {
    return static_cast<uint16_t>(u8g2_GetBufferTileHeight(&u8g2) * 8U);
}

const uint8_t* StatusScreen::buffer() const {
    return u8g2_GetBufferPtr(&u8g2);
}

std::size_t StatusScreen::bufferSize() const {
    return static_cast<std::size_t>(width()) * (height() / 8U);
}

bool StatusScreen::pixel(int x, int y) const {
    if (x < 0 || y < 0 || x >= width() || y >= height()) {
        return false;
    }
    const std::size_t index = static_cast<std::size_t>(y / 8) * width() + static_cast<std::size_t>(x);
    return (buffer()[index] & (1U << (y % 8))) != 0;
}

void StatusScreen::renderSplash(const char* title, int border, int text_x) {
    const int w = width();
    const int h = height();

    u8g2_ClearBuffer(&u8g2);
    u8g2_SetDrawColor(&u8g2, 1);
    u8g2_DrawBox(&u8g2, 0, 0, static_cast<u8g2_uint_t>(w), static_cast<u8g2_uint_t>(h));
    if (border >= 0 && border * 2 < w && border * 2 < h) {
        u8g2_SetDrawColor(&u8g2, 0);
        u8g2_DrawBox(&u8g2,
                     static_cast<u8g2_uint_t>(border), static_cast<u8g2_uint_t>(border),
                     static_cast<u8g2_uint_t>(w - border * 2), static_cast<u8g2_uint_t>(h - border * 2));
    }
    if (title == nullptr) {
        return;
    }

    u8g2_SetDrawColor(&u8g2, 1);
    u8g2_SetFontMode(&u8g2, 1);
    u8g2_SetFont(&u8g2, u8g2_font_6x10_tf);
    u8g2_SetFontPosCenter(&u8g2);
    (void)u8g2_DrawStr(&u8g2, static_cast<u8g2_uint_t>(text_x), static_cast<u8g2_uint_t>(textCentre(h)), title);
}
