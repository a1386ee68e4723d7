#include <main/hardware/ssd1306_display.hpp>
#include <main/utils/logger.hpp>
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>
#include <cstring>

// Fundamental commands
static constexpr uint8_t SSD1306_SET_CONTRAST        = 0x81;
static constexpr uint8_t SSD1306_DISPLAY_ALL_ON_RES  = 0xA4;
static constexpr uint8_t SSD1306_NORMAL_DISPLAY      = 0xA6;
static constexpr uint8_t SSD1306_DISPLAY_OFF         = 0xAE;
static constexpr uint8_t SSD1306_DISPLAY_ON          = 0xAF;
// Addressing
static constexpr uint8_t SSD1306_MEMORY_MODE         = 0x20;
static constexpr uint8_t SSD1306_COLUMN_ADDR         = 0x21;
static constexpr uint8_t SSD1306_PAGE_ADDR           = 0x22;
// Hardware configuration
static constexpr uint8_t SSD1306_SET_START_LINE      = 0x40;
static constexpr uint8_t SSD1306_SEG_REMAP           = 0xA0;
static constexpr uint8_t SSD1306_SET_MULTIPLEX       = 0xA8;
static constexpr uint8_t SSD1306_COM_SCAN_DEC        = 0xC8;
static constexpr uint8_t SSD1306_SET_DISPLAY_OFFSET  = 0xD3;
static constexpr uint8_t SSD1306_SET_COM_PINS        = 0xDA;
// Timing and driving
static constexpr uint8_t SSD1306_SET_CLOCK_DIV       = 0xD5;
static constexpr uint8_t SSD1306_SET_PRECHARGE       = 0xD9;
static constexpr uint8_t SSD1306_SET_VCOM_DETECT     = 0xDB;
static constexpr uint8_t SSD1306_CHARGE_PUMP         = 0x8D;
static constexpr uint8_t SSD1306_DEACTIVATE_SCROLL   = 0x2E;

// I2C control bytes: Co=0, D/C# selects command stream or GDDRAM data
static constexpr uint8_t SSD1306_CTRL_COMMAND        = 0x00;
static constexpr uint8_t SSD1306_CTRL_DATA           = 0x40;

// GDDRAM bytes sent per I2C transaction
static constexpr size_t DATA_CHUNK = 32;

static const char* TAG = "SSD1306";

Ssd1306Display::Ssd1306Display(I2cBus& bus_in,
                               uint8_t addr_7bit_in,
                               uint16_t width_in,
                               uint16_t height_in,
                               gpio_num_t reset_gpio_in)
	: bus(bus_in),
	  addr(addr_7bit_in),
	  width(width_in),
	  height(height_in),
	  reset_gpio(reset_gpio_in),
	  inited(false) {}

bool Ssd1306Display::command(uint8_t cmd) {
	uint8_t buf[2] = { SSD1306_CTRL_COMMAND, cmd };
	return bus.write(addr, buf, sizeof(buf));
}

bool Ssd1306Display::commands(const uint8_t* cmds, size_t len) {
	for (size_t i = 0; i < len; ++i) {
		if (!command(cmds[i])) return false;
	}
	return true;
}

void Ssd1306Display::pulseReset() {
	if (reset_gpio == GPIO_NUM_NC) return;
	gpio_reset_pin(reset_gpio);
	gpio_set_direction(reset_gpio, GPIO_MODE_OUTPUT);
	gpio_set_level(reset_gpio, 1);
	vTaskDelay(pdMS_TO_TICKS(1));
	gpio_set_level(reset_gpio, 0);
	vTaskDelay(pdMS_TO_TICKS(10));
	gpio_set_level(reset_gpio, 1);
	vTaskDelay(pdMS_TO_TICKS(10));
}

bool Ssd1306Display::init() {
	pulseReset();

	// COM pin layout: sequential for 32-row panels, alternative for 64-row
	const uint8_t com_pins = (height == 64) ? 0x12 : 0x02;
	const uint8_t init_seq[] = {
		SSD1306_DISPLAY_OFF,
		SSD1306_SET_CLOCK_DIV, 0x80,
		SSD1306_SET_MULTIPLEX, static_cast<uint8_t>(height - 1),
		SSD1306_SET_DISPLAY_OFFSET, 0x00,
		SSD1306_SET_START_LINE | 0x00,
		SSD1306_CHARGE_PUMP, 0x14,      // internal VCC
		SSD1306_MEMORY_MODE, 0x00,      // horizontal addressing
		SSD1306_SEG_REMAP | 0x01,
		SSD1306_COM_SCAN_DEC,
		SSD1306_SET_COM_PINS, com_pins,
		SSD1306_SET_CONTRAST, 0x8F,
		SSD1306_SET_PRECHARGE, 0xF1,
		SSD1306_SET_VCOM_DETECT, 0x40,
		SSD1306_DISPLAY_ALL_ON_RES,
		SSD1306_NORMAL_DISPLAY,
		SSD1306_DEACTIVATE_SCROLL,
		SSD1306_DISPLAY_ON,
	};
	if (!commands(init_seq, sizeof(init_seq))) {
		LOG_ERROR(TAG, "No SSD1306 response at 0x%02X", addr);
		return false;
	}
	inited = true;
	LOG_INFO(TAG, "SSD1306 %ux%u initialized", width, height);
	return true;
}

bool Ssd1306Display::show(const uint8_t* frame, size_t len) {
	if (!inited || frame == nullptr) return false;
	const uint8_t pages = static_cast<uint8_t>((height + 7) / 8);
	const uint8_t window[] = {
		SSD1306_COLUMN_ADDR, 0x00, static_cast<uint8_t>(width - 1),
		SSD1306_PAGE_ADDR, 0x00, static_cast<uint8_t>(pages - 1),
	};
	if (!commands(window, sizeof(window))) return false;

	size_t total = len;
	const size_t panel_bytes = static_cast<size_t>(width) * pages;
	if (total > panel_bytes) total = panel_bytes;
	uint8_t chunk[DATA_CHUNK + 1];
	chunk[0] = SSD1306_CTRL_DATA;
	for (size_t offset = 0; offset < total; offset += DATA_CHUNK) {
		size_t n = total - offset;
		if (n > DATA_CHUNK) n = DATA_CHUNK;
		std::memcpy(&chunk[1], frame + offset, n);
		if (!bus.write(addr, chunk, n + 1)) {
			LOG_WARN(TAG, "GDDRAM write failed at offset %u", static_cast<unsigned>(offset));
			return false;
		}
	}
	return true;
}
