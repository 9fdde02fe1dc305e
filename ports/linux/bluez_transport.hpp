#pragma once

#include <cstdint>
#include <deque>
#include <map>
#include <string>
#include <vector>

#include "dfu_transport.hpp"
#include "config_store.hpp"

// DFUTransport over a BlueZ L2CAP socket on the ATT fixed channel.  The GATT client is
// just enough for the DFU service: MTU exchange, characteristic and descriptor discovery,
// writes and notification/indication delivery.
class BlueZTransport : public DFUTransport {
private:
	static inline const uint16_t ATT_CID = 4;
	static inline const uint16_t ATT_DEFAULT_MTU = 23;

	enum AttOpcode : uint8_t {
		ATT_ERROR_RSP = 0x01,
		ATT_EXCHANGE_MTU_REQ = 0x02,
		ATT_EXCHANGE_MTU_RSP = 0x03,
		ATT_FIND_INFORMATION_REQ = 0x04,
		ATT_FIND_INFORMATION_RSP = 0x05,
		ATT_READ_BY_TYPE_REQ = 0x08,
		ATT_READ_BY_TYPE_RSP = 0x09,
		ATT_WRITE_REQ = 0x12,
		ATT_WRITE_RSP = 0x13,
		ATT_HANDLE_VALUE_NTF = 0x1B,
		ATT_HANDLE_VALUE_IND = 0x1D,
		ATT_HANDLE_VALUE_CFM = 0x1E,
		ATT_WRITE_CMD = 0x52
	};

	struct Characteristic {
		uint16_t declaration_handle;
		uint16_t value_handle;
		uint16_t cccd_handle;
		uint8_t  properties;
	};

	BLEConfig m_config;
	int m_socket;
	uint16_t m_mtu;
	std::map<DFUCharacteristic, Characteristic> m_characteristics;
	std::map<uint16_t, std::deque<std::vector<uint8_t>>> m_notifications;

	std::string resolve_name(const std::string& name, uint8_t& address_type);
	void open_channel(const std::string& address, uint8_t address_type);
	void close_channel();
	void exchange_mtu();
	void discover_characteristics();
	void discover_descriptors();

	void send_pdu(const std::vector<uint8_t>& pdu);
	bool receive_pdu(std::vector<uint8_t>& pdu, int timeout_ms);
	bool dispatch_pdu(const std::vector<uint8_t>& pdu);
	std::vector<uint8_t> transact(const std::vector<uint8_t>& request, uint8_t response_opcode, unsigned int timeout_ms);
	const Characteristic& lookup(DFUCharacteristic characteristic);

public:
	BlueZTransport(const BLEConfig &config);
	~BlueZTransport();

	void connect(const std::string& identifier) override;
	void disconnect() override;
	bool is_connected() override { return m_socket >= 0; }
	void subscribe(DFUCharacteristic characteristic) override;
	void write(DFUCharacteristic characteristic, const std::vector<uint8_t>& data, bool with_response) override;
	std::vector<uint8_t> wait_notification(DFUCharacteristic characteristic, unsigned int timeout_ms) override;
	void flush_notifications(DFUCharacteristic characteristic) override;

	uint16_t mtu() { return m_mtu; }
};
