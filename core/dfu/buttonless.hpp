#pragma once

#include <string>

#include "config_store.hpp"
#include "dfu_transport.hpp"

// Buttonless DFU service: asks the application to reboot into the bootloader
class ButtonlessTrigger {
private:
	static inline const uint8_t ENTER_BOOTLOADER = 0x01;
	static inline const uint8_t RESPONSE = 0x20;
	static inline const uint8_t SUCCESS = 0x01;

	DFUTransport &m_transport;
	ButtonlessConfig m_config;

	DFUCharacteristic characteristic() {
		return m_config.with_bonds ? DFUCharacteristic::BUTTONLESS_WITH_BONDS : DFUCharacteristic::BUTTONLESS;
	}

public:
	ButtonlessTrigger(DFUTransport &transport, const ButtonlessConfig &config) : m_transport(transport), m_config(config) {}

	// Writes the enter bootloader opcode on a connected transport.  The device reboots
	// as a result so no indication is waited for.
	void trigger();

	// Where the bootloader of the device will advertise once it has rebooted
	std::string bootloader_identifier(const std::string& identifier);

	// Triggers the device at identifier and connects to its bootloader
	void enter_bootloader(const std::string& identifier);
};
