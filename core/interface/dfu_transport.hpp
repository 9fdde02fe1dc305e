#pragma once

#include <cstdint>
#include <string>
#include <vector>

enum class DFUCharacteristic {
	CONTROL_POINT,          // 8EC90001-F315-4F60-9FB8-838830DAEA50
	DATA_POINT,             // 8EC90002-F315-4F60-9FB8-838830DAEA50
	BUTTONLESS,             // 8EC90003-F315-4F60-9FB8-838830DAEA50
	BUTTONLESS_WITH_BONDS   // 8EC90004-F315-4F60-9FB8-838830DAEA50
};

static inline const char *dfu_characteristic_str(DFUCharacteristic c) {
	switch (c) {
	case DFUCharacteristic::CONTROL_POINT: return "CONTROL_POINT";
	case DFUCharacteristic::DATA_POINT: return "DATA_POINT";
	case DFUCharacteristic::BUTTONLESS: return "BUTTONLESS";
	case DFUCharacteristic::BUTTONLESS_WITH_BONDS: return "BUTTONLESS_WITH_BONDS";
	default: return "UNKNOWN";
	}
}

// GATT link to a DFU peripheral.  All operations block; failures are thrown as
// TRANSPORT_* error codes.
class DFUTransport {
public:
	virtual ~DFUTransport() {}

	// Identifier is a MAC address "AA:BB:CC:DD:EE:FF" or an advertised local name
	virtual void connect(const std::string& identifier) = 0;
	virtual void disconnect() = 0;
	virtual bool is_connected() = 0;

	// Enables notifications (or indications) on the characteristic
	virtual void subscribe(DFUCharacteristic characteristic) = 0;

	// Writes without response are fragmented by the transport to fit the link MTU
	virtual void write(DFUCharacteristic characteristic, const std::vector<uint8_t>& data, bool with_response) = 0;

	// Waits for the next notification on the characteristic; throws TRANSPORT_TIMEOUT
	virtual std::vector<uint8_t> wait_notification(DFUCharacteristic characteristic, unsigned int timeout_ms) = 0;

	// Discards any queued notifications on the characteristic
	virtual void flush_notifications(DFUCharacteristic characteristic) = 0;
};
