#pragma once

#include <array>
#include <cctype>
#include <cstdint>
#include <cstdio>
#include <string>

#include "error.hpp"

// 48-bit BLE device address held most significant octet first, as written "AA:BB:CC:DD:EE:FF"
class BLEAddress {
private:
	std::array<uint8_t, 6> m_octets;

public:
	BLEAddress() : m_octets{} {}
	BLEAddress(const std::array<uint8_t, 6>& octets) : m_octets(octets) {}

	static bool is_address(const std::string& text) {
		if (text.size() != 17)
			return false;
		for (unsigned int i = 0; i < text.size(); i++) {
			if ((i % 3) == 2) {
				if (text[i] != ':')
					return false;
			} else if (!std::isxdigit(static_cast<unsigned char>(text[i]))) {
				return false;
			}
		}
		return true;
	}

	static BLEAddress parse(const std::string& text) {
		if (!is_address(text))
			throw ErrorCode::TRANSPORT_INVALID_ADDRESS;
		std::array<uint8_t, 6> octets;
		for (unsigned int i = 0; i < 6; i++)
			octets[i] = static_cast<uint8_t>(std::stoul(text.substr(i * 3, 2), nullptr, 16));
		return BLEAddress(octets);
	}

	// The buttonless DFU service advertises the bootloader at the application address with the
	// least significant octet incremented; there is no carry into the next octet.
	BLEAddress bootloader_address() const {
		BLEAddress next(*this);
		next.m_octets[5] = static_cast<uint8_t>(m_octets[5] + 1);
		return next;
	}

	const std::array<uint8_t, 6>& octets() const { return m_octets; }

	std::string to_string() const {
		char buffer[18];
		std::snprintf(buffer, sizeof(buffer), "%02X:%02X:%02X:%02X:%02X:%02X",
				m_octets[0], m_octets[1], m_octets[2], m_octets[3], m_octets[4], m_octets[5]);
		return std::string(buffer);
	}

	bool operator==(const BLEAddress& other) const { return m_octets == other.m_octets; }
	bool operator!=(const BLEAddress& other) const { return m_octets != other.m_octets; }
};
