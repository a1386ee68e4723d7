#ifndef SSD1306_DISPLAY_HPP
#define SSD1306_DISPLAY_HPP

#include <cstddef>
#include <cstdint>
#include <driver/gpio.h>
#include <main/hardware/i2c_bus.hpp>

// Driver for SSD1306 monochrome OLED panels over I2C (128x32 / 128x64).
// The panel is written from a page-ordered buffer whose layout matches GDDRAM.
class Ssd1306Display {
public:
	Ssd1306Display(I2cBus& bus,
	               uint8_t addr_7bit,
	               uint16_t width,
	               uint16_t height,
	               gpio_num_t reset_gpio);

	// Pulse reset and run the panel init sequence
	bool init();

	// Copy a page-ordered frame to the panel; bytes beyond the panel are ignored
	bool show(const uint8_t* frame, size_t len);

private:
	bool command(uint8_t cmd);
	bool commands(const uint8_t* cmds, size_t len);
	void pulseReset();

	I2cBus& bus;
	uint8_t addr;
	uint16_t width;
	uint16_t height;
	gpio_num_t reset_gpio;
	bool inited;
};

#endif // SSD1306_DISPLAY_HPP
