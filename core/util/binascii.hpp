#pragma once

#include <cctype>
#include <cstdint>
#include <string>
#include <vector>

class Binascii {
public:
	static std::string hexlify(const uint8_t *input, size_t length) {
	    static const char hex_digits[] = "0123456789ABCDEF";

	    std::string output;
	    output.reserve(length * 2);
	    for (size_t i = 0; i < length; i++)
	    {
	        output.push_back(hex_digits[input[i] >> 4]);
	        output.push_back(hex_digits[input[i] & 0xF]);
	    }
	    return output;
	}

	static std::string hexlify(const std::vector<uint8_t>& input) {
		return hexlify(input.data(), input.size());
	}

	// Accepts upper or lower case digits; an odd length input yields an empty buffer
	static std::vector<uint8_t> unhexlify(const std::string& buffer) {
	    unsigned int length = buffer.size();
	    unsigned int i = 0;
	    char high, low;

	    std::vector<uint8_t> output;
	    if (length % 2) return output;

	    output.reserve(buffer.size() / 2);

	    while (length)
	    {
	    	high = std::toupper(buffer[i++]);
	    	high = high >= 'A' ? high - '7' : high - '0';
	    	low = std::toupper(buffer[i++]);
	    	low = low >= 'A' ? low - '7' : low - '0';
	    	output.push_back((high << 4) | (low & 0xF));
	    	length -= 2;
	    }

	    return output;
	}
};
