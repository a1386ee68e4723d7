#include <main/hardware/i2c_bus.hpp>
#include <main/utils/logger.hpp>
#include <freertos/FreeRTOS.h>

static const char* TAG = "I2C_BUS";

// Static buffer for command links; large enough for one framed transfer
static uint8_t s_link_buffer[I2C_LINK_RECOMMENDED_SIZE(4)];

I2cBus::I2cBus(i2c_port_t port_in,
               gpio_num_t sda_in,
               gpio_num_t scl_in,
               uint32_t clk_hz_in,
               uint32_t timeout_ms_in)
	: port(port_in),
	  sda(sda_in),
	  scl(scl_in),
	  clk_hz(clk_hz_in),
	  timeout_ms(timeout_ms_in),
	  ready(false) {}

bool I2cBus::init() {
	if (ready) return true;
	i2c_config_t cfg{};
	cfg.mode = I2C_MODE_MASTER;
	cfg.sda_io_num = sda;
	cfg.sda_pullup_en = GPIO_PULLUP_ENABLE;
	cfg.scl_io_num = scl;
	cfg.scl_pullup_en = GPIO_PULLUP_ENABLE;
	cfg.master.clk_speed = clk_hz;
	cfg.clk_flags = 0;
	esp_err_t err = i2c_param_config(port, &cfg);
	if (err != ESP_OK) {
		LOG_ERROR(TAG, "i2c_param_config failed: %d", err);
		return false;
	}
	err = i2c_driver_install(port, I2C_MODE_MASTER, 0, 0, 0);
	if (err != ESP_OK && err != ESP_ERR_INVALID_STATE) {
		LOG_ERROR(TAG, "i2c_driver_install failed: %d", err);
		return false;
	}
	ready = true;
	LOG_INFO(TAG, "I2C port=%d SDA=%d SCL=%d %lu Hz",
	         static_cast<int>(port), static_cast<int>(sda), static_cast<int>(scl),
	         static_cast<unsigned long>(clk_hz));
	return true;
}

bool I2cBus::execute(i2c_cmd_handle_t cmd, uint8_t addr7, const char* what) {
	esp_err_t err = i2c_master_cmd_begin(port, cmd, pdMS_TO_TICKS(timeout_ms));
	i2c_cmd_link_delete_static(cmd);
	if (err != ESP_OK) {
		LOG_WARN(TAG, "I2C %s 0x%02X failed: %d", what, addr7, err);
		return false;
	}
	return true;
}

bool I2cBus::write(uint8_t addr7, const uint8_t* data, size_t len) {
	if (!ready) return false;
	i2c_cmd_handle_t cmd = i2c_cmd_link_create_static(s_link_buffer, sizeof(s_link_buffer));
	if (cmd == nullptr) return false;
	esp_err_t err = i2c_master_start(cmd);
	err |= i2c_master_write_byte(cmd, static_cast<uint8_t>((addr7 << 1) | I2C_MASTER_WRITE), true);
	if (len > 0) {
		err |= i2c_master_write(cmd, data, len, true);
	}
	err |= i2c_master_stop(cmd);
	if (err != ESP_OK) {
		i2c_cmd_link_delete_static(cmd);
		return false;
	}
	return execute(cmd, addr7, "write to");
}

bool I2cBus::read(uint8_t addr7, uint8_t* out, size_t len) {
	if (!ready || out == nullptr || len == 0) return false;
	i2c_cmd_handle_t cmd = i2c_cmd_link_create_static(s_link_buffer, sizeof(s_link_buffer));
	if (cmd == nullptr) return false;
	esp_err_t err = i2c_master_start(cmd);
	err |= i2c_master_write_byte(cmd, static_cast<uint8_t>((addr7 << 1) | I2C_MASTER_READ), true);
	err |= i2c_master_read(cmd, out, len, I2C_MASTER_LAST_NACK);
	err |= i2c_master_stop(cmd);
	if (err != ESP_OK) {
		i2c_cmd_link_delete_static(cmd);
		return false;
	}
	return execute(cmd, addr7, "read from");
}

bool I2cBus::writeRead(uint8_t addr7, const uint8_t* wdata, size_t wlen, uint8_t* out, size_t rlen) {
	if (!ready || out == nullptr || rlen == 0) return false;
	i2c_cmd_handle_t cmd = i2c_cmd_link_create_static(s_link_buffer, sizeof(s_link_buffer));
	if (cmd == nullptr) return false;
	esp_err_t err = i2c_master_start(cmd);
	err |= i2c_master_write_byte(cmd, static_cast<uint8_t>((addr7 << 1) | I2C_MASTER_WRITE), true);
	err |= i2c_master_write(cmd, wdata, wlen, true);
	err |= i2c_master_start(cmd);
	err |= i2c_master_write_byte(cmd, static_cast<uint8_t>((addr7 << 1) | I2C_MASTER_READ), true);
	err |= i2c_master_read(cmd, out, rlen, I2C_MASTER_LAST_NACK);
	err |= i2c_master_stop(cmd);
	if (err != ESP_OK) {
		i2c_cmd_link_delete_static(cmd);
		return false;
	}
	return execute(cmd, addr7, "write/read");
}

bool I2cBus::probe(uint8_t addr7) {
	if (!ready) return false;
	i2c_cmd_handle_t cmd = i2c_cmd_link_create_static(s_link_buffer, sizeof(s_link_buffer));
	if (cmd == nullptr) return false;
	esp_err_t err = i2c_master_start(cmd);
	err |= i2c_master_write_byte(cmd, static_cast<uint8_t>((addr7 << 1) | I2C_MASTER_WRITE), true);
	err |= i2c_master_stop(cmd);
	if (err == ESP_OK) {
		err = i2c_master_cmd_begin(port, cmd, pdMS_TO_TICKS(50));
	}
	i2c_cmd_link_delete_static(cmd);
	return err == ESP_OK;
}

void I2cBus::scan() {
	if (!ready) return;
	for (uint8_t addr = 0x03; addr <= 0x77; ++addr) {
		if (probe(addr)) {
			LOG_INFO(TAG, "I2C device ACK at 0x%02X", addr);
		}
	}
}
