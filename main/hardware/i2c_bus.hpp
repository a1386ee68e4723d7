#ifndef I2C_BUS_HPP
#define I2C_BUS_HPP

#include <cstddef>
#include <cstdint>
#include <driver/i2c.h>
#include <driver/gpio.h>

// I2C master shared by the soil sensor, light sensor and OLED.
// Static memory only; transactions are blocking with a fixed timeout.
class I2cBus {
public:
	I2cBus(i2c_port_t port,
	       gpio_num_t sda,
	       gpio_num_t scl,
	       uint32_t clk_hz,
	       uint32_t timeout_ms);

	// Install the driver (idempotent)
	bool init();

	bool write(uint8_t addr7, const uint8_t* data, size_t len);
	bool read(uint8_t addr7, uint8_t* out, size_t len);
	// Write then read with a repeated start
	bool writeRead(uint8_t addr7, const uint8_t* wdata, size_t wlen, uint8_t* out, size_t rlen);

	// True if a device ACKs its address
	bool probe(uint8_t addr7);

	// Log every responding address
	void scan();

private:
	bool execute(i2c_cmd_handle_t cmd, uint8_t addr7, const char* what);

	i2c_port_t port;
	gpio_num_t sda;
	gpio_num_t scl;
	uint32_t clk_hz;
	uint32_t timeout_ms;
	bool ready;
};

#endif // I2C_BUS_HPP
