#pragma once

#include <cstdint>
#include <cstddef>

// IEEE 802.3 CRC32 (reflected polynomial 0xEDB88320) as used by the nRF DFU bootloader
class CRC32 {
private:
	static constexpr uint32_t POLYNOMIAL = 0xEDB88320;

public:
	// Runs the CRC register over the buffer starting from the supplied register value.  The
	// result is post-inverted so that an initial value of 0xFFFFFFFF yields the standard CRC32.
	static void checksum(const uint8_t *data, size_t length, uint32_t &crc) {
		uint32_t reg = crc;
		for (size_t i = 0; i < length; i++) {
			reg ^= data[i];
			for (unsigned int bit = 0; bit < 8; bit++)
				reg = (reg >> 1) ^ (POLYNOMIAL & (0U - (reg & 1U)));
		}
		crc = reg ^ 0xFFFFFFFF;
	}

	// Continues a finished CRC32 value with more data i.e., update(update(0, a), b) == update(0, a + b)
	static uint32_t update(uint32_t crc, const uint8_t *data, size_t length) {
		crc ^= 0xFFFFFFFF;
		checksum(data, length, crc);
		return crc;
	}
};
