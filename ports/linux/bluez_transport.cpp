#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <sys/socket.h>

#include <bluetooth/bluetooth.h>
#include <bluetooth/hci.h>
#include <bluetooth/hci_lib.h>
#include <bluetooth/l2cap.h>

#include "bluez_transport.hpp"
#include "ble_address.hpp"
#include "platform.hpp"
#include "binascii.hpp"
#include "error.hpp"
#include "debug.hpp"

// 8EC9xxxx-F315-4F60-9FB8-838830DAEA50 in ATT (little endian) byte order; bytes 12..13 hold xxxx
static const uint8_t dfu_uuid_base[16] = {
	0x50, 0xEA, 0xDA, 0x30, 0x88, 0x83, 0xB8, 0x9F, 0x60, 0x4F, 0x15, 0xF3, 0x00, 0x00, 0xC9, 0x8E
};

static const uint16_t GATT_CHARACTERISTIC_UUID = 0x2803;
static const uint16_t GATT_CCCD_UUID = 0x2902;
static const uint8_t  GATT_PROPERTY_NOTIFY = 0x10;
static const uint8_t  GATT_PROPERTY_INDICATE = 0x20;
static const uint8_t  ATT_ATTRIBUTE_NOT_FOUND = 0x0A;

static bool dfu_characteristic_from_uuid(const uint8_t *uuid, DFUCharacteristic& characteristic) {
	if (std::memcmp(uuid, dfu_uuid_base, 12) != 0 || uuid[14] != dfu_uuid_base[14] || uuid[15] != dfu_uuid_base[15] || uuid[13] != 0x00)
		return false;
	switch (uuid[12]) {
	case 0x01: characteristic = DFUCharacteristic::CONTROL_POINT; return true;
	case 0x02: characteristic = DFUCharacteristic::DATA_POINT; return true;
	case 0x03: characteristic = DFUCharacteristic::BUTTONLESS; return true;
	case 0x04: characteristic = DFUCharacteristic::BUTTONLESS_WITH_BONDS; return true;
	default: return false;
	}
}

static uint16_t read_u16(const std::vector<uint8_t>& data, size_t pos) {
	return static_cast<uint16_t>(data[pos] | (data[pos + 1] << 8));
}

static void append_u16(std::vector<uint8_t>& data, uint16_t value) {
	data.push_back(value & 0xFF);
	data.push_back(value >> 8);
}


BlueZTransport::BlueZTransport(const BLEConfig &config) : m_config(config), m_socket(-1), m_mtu(ATT_DEFAULT_MTU) {
}

BlueZTransport::~BlueZTransport() {
	close_channel();
}

std::string BlueZTransport::resolve_name(const std::string& name, uint8_t& address_type) {
	int dd = hci_open_dev(m_config.hci_device);
	if (dd < 0) {
		DEBUG_ERROR("BlueZTransport: hci%u not available: %s", m_config.hci_device, strerror(errno));
		throw TRANSPORT_ADAPTER_ERROR;
	}

	if (hci_le_set_scan_parameters(dd, 0x01, htobs(0x0010), htobs(0x0010), LE_PUBLIC_ADDRESS, 0x00, 1000) < 0 ||
		hci_le_set_scan_enable(dd, 0x01, 0x00, 1000) < 0) {
		DEBUG_ERROR("BlueZTransport: failed to start LE scan: %s", strerror(errno));
		hci_close_dev(dd);
		throw TRANSPORT_ADAPTER_ERROR;
	}

	struct hci_filter filter;
	hci_filter_clear(&filter);
	hci_filter_set_ptype(HCI_EVENT_PKT, &filter);
	hci_filter_set_event(EVT_LE_META_EVENT, &filter);
	setsockopt(dd, SOL_HCI, HCI_FILTER, &filter, sizeof(filter));

	DEBUG_INFO("BlueZTransport: scanning for \"%s\"", name.c_str());

	std::string found;
	uint64_t deadline = Platform::uptime_ms() + m_config.scan_timeout_ms;

	while (found.empty() && Platform::uptime_ms() < deadline) {
		struct pollfd pfd = { dd, POLLIN, 0 };
		if (poll(&pfd, 1, static_cast<int>(deadline - Platform::uptime_ms())) <= 0)
			continue;

		uint8_t buffer[HCI_MAX_EVENT_SIZE];
		ssize_t length = read(dd, buffer, sizeof(buffer));
		if (length < (ssize_t)(1 + HCI_EVENT_HDR_SIZE + 2))
			continue;

		evt_le_meta_event *meta = reinterpret_cast<evt_le_meta_event *>(buffer + 1 + HCI_EVENT_HDR_SIZE);
		if (meta->subevent != EVT_LE_ADVERTISING_REPORT)
			continue;

		uint8_t num_reports = meta->data[0];
		uint8_t *report = meta->data + 1;
		uint8_t *end = buffer + length;

		for (unsigned int i = 0; i < num_reports && found.empty() && report + LE_ADVERTISING_INFO_SIZE <= end; i++) {
			le_advertising_info *info = reinterpret_cast<le_advertising_info *>(report);
			if (report + LE_ADVERTISING_INFO_SIZE + info->length > end)
				break;

			// Walk the AD structures for a shortened or complete local name
			for (unsigned int pos = 0; pos + 1 < info->length; pos += info->data[pos] + 1) {
				uint8_t ad_length = info->data[pos];
				uint8_t ad_type = info->data[pos + 1];
				if (ad_length == 0 || pos + 1 + ad_length > info->length)
					break;
				if ((ad_type == 0x08 || ad_type == 0x09) &&
					name == std::string(reinterpret_cast<const char *>(&info->data[pos + 2]), ad_length - 1)) {
					char address[18];
					ba2str(&info->bdaddr, address);
					found = address;
					address_type = info->bdaddr_type ? BDADDR_LE_RANDOM : BDADDR_LE_PUBLIC;
					break;
				}
			}

			report += LE_ADVERTISING_INFO_SIZE + info->length + 1;
		}
	}

	hci_le_set_scan_enable(dd, 0x00, 0x00, 1000);
	hci_close_dev(dd);

	if (found.empty()) {
		DEBUG_ERROR("BlueZTransport: no device advertising \"%s\"", name.c_str());
		throw TRANSPORT_DEVICE_NOT_FOUND;
	}

	DEBUG_INFO("BlueZTransport: \"%s\" is %s", name.c_str(), found.c_str());
	return found;
}

void BlueZTransport::open_channel(const std::string& address, uint8_t address_type) {
	bdaddr_t local;
	if (hci_devba(m_config.hci_device, &local) < 0) {
		DEBUG_ERROR("BlueZTransport: hci%u not available", m_config.hci_device);
		throw TRANSPORT_ADAPTER_ERROR;
	}

	int s = socket(AF_BLUETOOTH, SOCK_SEQPACKET, BTPROTO_L2CAP);
	if (s < 0) {
		DEBUG_ERROR("BlueZTransport: socket: %s", strerror(errno));
		throw TRANSPORT_ADAPTER_ERROR;
	}

	struct sockaddr_l2 src;
	std::memset(&src, 0, sizeof(src));
	src.l2_family = AF_BLUETOOTH;
	src.l2_cid = htobs(ATT_CID);
	src.l2_bdaddr_type = BDADDR_LE_PUBLIC;
	bacpy(&src.l2_bdaddr, &local);

	if (bind(s, reinterpret_cast<struct sockaddr *>(&src), sizeof(src)) < 0) {
		DEBUG_ERROR("BlueZTransport: bind: %s", strerror(errno));
		::close(s);
		throw TRANSPORT_ADAPTER_ERROR;
	}

	struct sockaddr_l2 dst;
	std::memset(&dst, 0, sizeof(dst));
	dst.l2_family = AF_BLUETOOTH;
	dst.l2_cid = htobs(ATT_CID);
	dst.l2_bdaddr_type = address_type;
	str2ba(address.c_str(), &dst.l2_bdaddr);

	// Non-blocking connect so that the connect timeout applies
	int flags = fcntl(s, F_GETFL, 0);
	fcntl(s, F_SETFL, flags | O_NONBLOCK);

	int status = ::connect(s, reinterpret_cast<struct sockaddr *>(&dst), sizeof(dst));
	if (status < 0 && errno == EINPROGRESS) {
		struct pollfd pfd = { s, POLLOUT, 0 };
		if (poll(&pfd, 1, static_cast<int>(m_config.connect_timeout_ms)) == 1) {
			int error = 0;
			socklen_t error_length = sizeof(error);
			getsockopt(s, SOL_SOCKET, SO_ERROR, &error, &error_length);
			status = error ? -1 : 0;
			errno = error ? error : ETIMEDOUT;
		} else {
			errno = ETIMEDOUT;
		}
	}

	if (status < 0) {
		DEBUG_ERROR("BlueZTransport: connect %s: %s", address.c_str(), strerror(errno));
		::close(s);
		throw TRANSPORT_CONNECT_FAILED;
	}

	fcntl(s, F_SETFL, flags);
	m_socket = s;
	m_mtu = ATT_DEFAULT_MTU;
}

void BlueZTransport::close_channel() {
	if (m_socket >= 0) {
		::close(m_socket);
		m_socket = -1;
	}
	m_characteristics.clear();
	m_notifications.clear();
}

void BlueZTransport::send_pdu(const std::vector<uint8_t>& pdu) {
	if (m_socket < 0)
		throw TRANSPORT_NOT_CONNECTED;
	if (send(m_socket, pdu.data(), pdu.size(), 0) != (ssize_t)pdu.size()) {
		DEBUG_ERROR("BlueZTransport: send: %s", strerror(errno));
		if (errno == ENOTCONN || errno == ECONNRESET) {
			close_channel();
			throw TRANSPORT_NOT_CONNECTED;
		}
		throw TRANSPORT_WRITE_FAILED;
	}
}

// Returns false on timeout
bool BlueZTransport::receive_pdu(std::vector<uint8_t>& pdu, int timeout_ms) {
	if (m_socket < 0)
		throw TRANSPORT_NOT_CONNECTED;

	struct pollfd pfd = { m_socket, POLLIN, 0 };
	int status = poll(&pfd, 1, timeout_ms);
	if (status == 0)
		return false;

	if (status > 0 && (pfd.revents & POLLIN)) {
		pdu.resize(std::max<size_t>(m_mtu, 512));
		ssize_t length = recv(m_socket, pdu.data(), pdu.size(), 0);
		if (length > 0) {
			pdu.resize(length);
			return true;
		}
	}

	DEBUG_ERROR("BlueZTransport: link lost");
	close_channel();
	throw TRANSPORT_NOT_CONNECTED;
}

// Queues notifications and indications; returns true if the PDU was one
bool BlueZTransport::dispatch_pdu(const std::vector<uint8_t>& pdu) {
	if (pdu.size() < 3 || (pdu[0] != ATT_HANDLE_VALUE_NTF && pdu[0] != ATT_HANDLE_VALUE_IND))
		return false;

	uint16_t handle = read_u16(pdu, 1);
	m_notifications[handle].emplace_back(pdu.begin() + 3, pdu.end());

	if (pdu[0] == ATT_HANDLE_VALUE_IND)
		send_pdu({ ATT_HANDLE_VALUE_CFM });

	return true;
}

std::vector<uint8_t> BlueZTransport::transact(const std::vector<uint8_t>& request, uint8_t response_opcode, unsigned int timeout_ms) {
	send_pdu(request);

	uint64_t deadline = Platform::uptime_ms() + timeout_ms;
	std::vector<uint8_t> pdu;

	while (true) {
		uint64_t now = Platform::uptime_ms();
		if (now >= deadline || !receive_pdu(pdu, static_cast<int>(deadline - now)))
			throw TRANSPORT_TIMEOUT;

		if (dispatch_pdu(pdu))
			continue;
		if (!pdu.empty() && (pdu[0] == response_opcode || (pdu[0] == ATT_ERROR_RSP && pdu.size() >= 5 && pdu[1] == request[0])))
			return pdu;

		DEBUG_TRACE("BlueZTransport: ignoring %s", Binascii::hexlify(pdu).c_str());
	}
}

void BlueZTransport::exchange_mtu() {
	std::vector<uint8_t> request = { ATT_EXCHANGE_MTU_REQ };
	append_u16(request, static_cast<uint16_t>(m_config.mtu));

	std::vector<uint8_t> response = transact(request, ATT_EXCHANGE_MTU_RSP, m_config.connect_timeout_ms);
	if (response[0] == ATT_EXCHANGE_MTU_RSP && response.size() >= 3)
		m_mtu = std::max(ATT_DEFAULT_MTU, std::min(static_cast<uint16_t>(m_config.mtu), read_u16(response, 1)));

	DEBUG_INFO("BlueZTransport: ATT MTU %u", m_mtu);
}

void BlueZTransport::discover_characteristics() {
	uint16_t start = 0x0001;

	while (start != 0) {
		std::vector<uint8_t> request = { ATT_READ_BY_TYPE_REQ };
		append_u16(request, start);
		append_u16(request, 0xFFFF);
		append_u16(request, GATT_CHARACTERISTIC_UUID);

		std::vector<uint8_t> response = transact(request, ATT_READ_BY_TYPE_RSP, m_config.connect_timeout_ms);
		if (response[0] == ATT_ERROR_RSP) {
			if (response[4] != ATT_ATTRIBUTE_NOT_FOUND) {
				DEBUG_ERROR("BlueZTransport: discovery failed with ATT error %02x", response[4]);
				throw TRANSPORT_CHARACTERISTIC_NOT_FOUND;
			}
			break;
		}

		// Each entry: declaration handle, properties, value handle, uuid
		size_t entry_length = response.size() >= 2 ? response[1] : 0;
		if (entry_length < 7)
			break;

		uint16_t last_handle = 0;
		for (size_t pos = 2; pos + entry_length <= response.size(); pos += entry_length) {
			Characteristic c;
			c.declaration_handle = read_u16(response, pos);
			c.properties = response[pos + 2];
			c.value_handle = read_u16(response, pos + 3);
			c.cccd_handle = 0;
			last_handle = c.declaration_handle;

			DFUCharacteristic id;
			if (entry_length == 21 && dfu_characteristic_from_uuid(&response[pos + 5], id)) {
				DEBUG_TRACE("BlueZTransport: %s at handle %04x", dfu_characteristic_str(id), c.value_handle);
				m_characteristics[id] = c;
			}
		}

		start = (last_handle == 0xFFFF || last_handle == 0) ? 0 : last_handle + 1;
	}
}

void BlueZTransport::discover_descriptors() {
	std::vector<uint16_t> declarations;
	for (auto const &c : m_characteristics)
		declarations.push_back(c.second.declaration_handle);
	std::sort(declarations.begin(), declarations.end());

	for (auto &entry : m_characteristics) {
		Characteristic &c = entry.second;
		if (!(c.properties & (GATT_PROPERTY_NOTIFY | GATT_PROPERTY_INDICATE)))
			continue;

		// Descriptors lie between the value and the next declaration
		uint16_t end = 0xFFFF;
		auto next = std::upper_bound(declarations.begin(), declarations.end(), c.declaration_handle);
		if (next != declarations.end())
			end = *next - 1;

		uint16_t start = c.value_handle + 1;
		while (start <= end && start != 0 && c.cccd_handle == 0) {
			std::vector<uint8_t> request = { ATT_FIND_INFORMATION_REQ };
			append_u16(request, start);
			append_u16(request, end);

			std::vector<uint8_t> response = transact(request, ATT_FIND_INFORMATION_RSP, m_config.connect_timeout_ms);
			if (response[0] == ATT_ERROR_RSP || response.size() < 6)
				break;

			// Format 1 is 16-bit uuids
			size_t entry_length = response[1] == 0x01 ? 4 : 18;
			uint16_t last_handle = 0;
			for (size_t pos = 2; pos + entry_length <= response.size(); pos += entry_length) {
				last_handle = read_u16(response, pos);
				if (entry_length == 4 && read_u16(response, pos + 2) == GATT_CCCD_UUID) {
					c.cccd_handle = last_handle;
					break;
				}
			}
			if (last_handle == 0 || last_handle == 0xFFFF)
				break;
			start = last_handle + 1;
		}
	}
}

void BlueZTransport::connect(const std::string& identifier) {
	close_channel();

	std::string address;
	uint8_t address_type = (m_config.address_type == BaseAddressType::PUBLIC) ? BDADDR_LE_PUBLIC : BDADDR_LE_RANDOM;

	if (BLEAddress::is_address(identifier))
		address = BLEAddress::parse(identifier).to_string();
	else
		address = resolve_name(identifier, address_type);

	DEBUG_INFO("BlueZTransport: connecting to %s", address.c_str());
	open_channel(address, address_type);

	try {
		exchange_mtu();
		discover_characteristics();
		discover_descriptors();
	} catch (ErrorCode e) {
		DEBUG_ERROR("BlueZTransport: service discovery failed: %s", error_code_str(e));
		close_channel();
		throw TRANSPORT_CONNECT_FAILED;
	}

	DEBUG_INFO("BlueZTransport: connected with %zu DFU characteristics", m_characteristics.size());
}

void BlueZTransport::disconnect() {
	if (m_socket >= 0)
		DEBUG_INFO("BlueZTransport: disconnecting");
	close_channel();
}

const BlueZTransport::Characteristic& BlueZTransport::lookup(DFUCharacteristic characteristic) {
	if (m_socket < 0)
		throw TRANSPORT_NOT_CONNECTED;
	auto it = m_characteristics.find(characteristic);
	if (it == m_characteristics.end()) {
		DEBUG_ERROR("BlueZTransport: %s not found", dfu_characteristic_str(characteristic));
		throw TRANSPORT_CHARACTERISTIC_NOT_FOUND;
	}
	return it->second;
}

void BlueZTransport::subscribe(DFUCharacteristic characteristic) {
	const Characteristic &c = lookup(characteristic);
	if (c.cccd_handle == 0) {
		DEBUG_ERROR("BlueZTransport: %s has no client configuration descriptor", dfu_characteristic_str(characteristic));
		throw TRANSPORT_SUBSCRIBE_FAILED;
	}

	std::vector<uint8_t> request = { ATT_WRITE_REQ };
	append_u16(request, c.cccd_handle);
	append_u16(request, (c.properties & GATT_PROPERTY_NOTIFY) ? 0x0001 : 0x0002);

	std::vector<uint8_t> response = transact(request, ATT_WRITE_RSP, m_config.connect_timeout_ms);
	if (response[0] != ATT_WRITE_RSP) {
		DEBUG_ERROR("BlueZTransport: subscribe to %s failed with ATT error %02x", dfu_characteristic_str(characteristic), response[4]);
		throw TRANSPORT_SUBSCRIBE_FAILED;
	}
}

void BlueZTransport::write(DFUCharacteristic characteristic, const std::vector<uint8_t>& data, bool with_response) {
	const Characteristic &c = lookup(characteristic);
	size_t max_value = m_mtu - 3;

	if (with_response) {
		if (data.size() > max_value) {
			DEBUG_ERROR("BlueZTransport: %zu bytes exceeds ATT MTU", data.size());
			throw TRANSPORT_WRITE_FAILED;
		}
		std::vector<uint8_t> request = { ATT_WRITE_REQ };
		append_u16(request, c.value_handle);
		request.insert(request.end(), data.begin(), data.end());

		std::vector<uint8_t> response = transact(request, ATT_WRITE_RSP, m_config.connect_timeout_ms);
		if (response[0] != ATT_WRITE_RSP) {
			DEBUG_ERROR("BlueZTransport: write to %s failed with ATT error %02x", dfu_characteristic_str(characteristic), response[4]);
			throw TRANSPORT_WRITE_FAILED;
		}
		return;
	}

	for (size_t pos = 0; pos < data.size(); pos += max_value) {
		size_t length = std::min(max_value, data.size() - pos);
		std::vector<uint8_t> command = { ATT_WRITE_CMD };
		append_u16(command, c.value_handle);
		command.insert(command.end(), data.begin() + pos, data.begin() + pos + length);
		send_pdu(command);
	}
}

std::vector<uint8_t> BlueZTransport::wait_notification(DFUCharacteristic characteristic, unsigned int timeout_ms) {
	uint16_t handle = lookup(characteristic).value_handle;
	uint64_t deadline = Platform::uptime_ms() + timeout_ms;

	while (true) {
		auto &queue = m_notifications[handle];
		if (!queue.empty()) {
			std::vector<uint8_t> value = queue.front();
			queue.pop_front();
			return value;
		}

		uint64_t now = Platform::uptime_ms();
		std::vector<uint8_t> pdu;
		if (!receive_pdu(pdu, now >= deadline ? 0 : static_cast<int>(deadline - now))) {
			if (now >= deadline)
				throw TRANSPORT_TIMEOUT;
			continue;
		}

		if (!dispatch_pdu(pdu))
			DEBUG_TRACE("BlueZTransport: ignoring %s", Binascii::hexlify(pdu).c_str());
	}
}

void BlueZTransport::flush_notifications(DFUCharacteristic characteristic) {
	uint16_t handle = lookup(characteristic).value_handle;
	std::vector<uint8_t> pdu;
	while (receive_pdu(pdu, 0))
		dispatch_pdu(pdu);
	m_notifications[handle].clear();
}
