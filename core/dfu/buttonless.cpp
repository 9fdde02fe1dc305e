#include "buttonless.hpp"
#include "ble_address.hpp"
#include "platform.hpp"
#include "binascii.hpp"
#include "error.hpp"
#include "debug.hpp"


void ButtonlessTrigger::trigger() {
	m_transport.subscribe(characteristic());
	m_transport.write(characteristic(), { ENTER_BOOTLOADER }, true);

	// An indication already queued is checked; an absent one is the normal case
	try {
		std::vector<uint8_t> response = m_transport.wait_notification(characteristic(), 0);
		DEBUG_TRACE("ButtonlessTrigger: <- %s", Binascii::hexlify(response).c_str());
		if (response.size() < 3 || response[0] != RESPONSE || response[1] != ENTER_BOOTLOADER || response[2] != SUCCESS) {
			DEBUG_ERROR("ButtonlessTrigger: device refused bootloader entry");
			throw DFU_TRIGGER_FAILED;
		}
	} catch (ErrorCode e) {
		if (e != TRANSPORT_TIMEOUT && e != TRANSPORT_NOT_CONNECTED)
			throw;
	}

	DEBUG_INFO("ButtonlessTrigger: bootloader entry requested on %s", dfu_characteristic_str(characteristic()));
}

std::string ButtonlessTrigger::bootloader_identifier(const std::string& identifier) {
	if (BLEAddress::is_address(identifier)) {
		// Bonded devices keep their address in the bootloader
		if (m_config.with_bonds)
			return identifier;
		return BLEAddress::parse(identifier).bootloader_address().to_string();
	}
	return m_config.bootloader_name;
}

void ButtonlessTrigger::enter_bootloader(const std::string& identifier) {
	std::string target = bootloader_identifier(identifier);

	DEBUG_INFO("ButtonlessTrigger: connecting to application %s", identifier.c_str());
	m_transport.connect(identifier);
	trigger();
	m_transport.disconnect();

	for (unsigned int attempt = 1; attempt <= m_config.reconnect_attempts; attempt++) {
		if (m_config.reconnect_delay_ms)
			Platform::delay_ms(m_config.reconnect_delay_ms);
		try {
			DEBUG_INFO("ButtonlessTrigger: connecting to bootloader %s (%u/%u)", target.c_str(), attempt, m_config.reconnect_attempts);
			m_transport.connect(target);
			return;
		} catch (ErrorCode e) {
			DEBUG_WARN("ButtonlessTrigger: %s", error_code_str(e));
		}
	}

	DEBUG_ERROR("ButtonlessTrigger: bootloader %s not reachable", target.c_str());
	throw TRANSPORT_CONNECT_FAILED;
}
