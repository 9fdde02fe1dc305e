#include "CppUTest/TestHarness.h"
#include "CppUTestExt/MockSupport.h"

#include <iostream>
#include "crc32.hpp"

using namespace std::literals::string_literals;


TEST_GROUP(CRC32)
{
};

TEST(CRC32, SimpleCRC32Test)
{
	// Refer to https://crccalc.com/?crc=123456789&method=crc32&datatype=ascii&outtype=hex
	// for the reference output vector
	CRC32 c;
	std::string data = "123456789";
	uint32_t crc = 0xFFFFFFFF;
	c.checksum((uint8_t *)data.c_str(), data.size(), crc);
	CHECK_EQUAL(0xCBF43926, crc);
}

TEST(CRC32, UpdateFromZeroIsStandardCRC32)
{
	std::string data = "123456789";
	CHECK_EQUAL(0xCBF43926, CRC32::update(0, (const uint8_t *)data.c_str(), data.size()));
	CHECK_EQUAL(0, CRC32::update(0, nullptr, 0));
}

TEST(CRC32, ChunkedUpdateMatchesSinglePass)
{
	std::vector<uint8_t> data(10000);
	for (unsigned int i = 0; i < data.size(); i++)
		data[i] = (uint8_t)((i * 7) ^ (i >> 3));

	uint32_t single = CRC32::update(0, data.data(), data.size());

	for (size_t chunk : { 1U, 20U, 244U, 4096U, 9999U }) {
		uint32_t crc = 0;
		for (size_t pos = 0; pos < data.size(); pos += chunk)
			crc = CRC32::update(crc, &data[pos], std::min(chunk, data.size() - pos));
		CHECK_EQUAL(single, crc);
	}
}
