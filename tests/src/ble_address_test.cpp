#include "CppUTest/TestHarness.h"

#include "ble_address.hpp"

using namespace std::literals::string_literals;

TEST_GROUP(BLEAddress)
{
};

TEST(BLEAddress, RecognisesAddressesAndNames)
{
	CHECK_TRUE(BLEAddress::is_address("C1:02:A3:44:B5:F6"));
	CHECK_TRUE(BLEAddress::is_address("c1:02:a3:44:b5:f6"));
	CHECK_FALSE(BLEAddress::is_address("DfuTarg"));
	CHECK_FALSE(BLEAddress::is_address("C1:02:A3:44:B5"));
	CHECK_FALSE(BLEAddress::is_address("C1-02-A3-44-B5-F6"));
	CHECK_THROWS(ErrorCode, BLEAddress::parse("InfiniTime"));
}

TEST(BLEAddress, BootloaderAddressIncrementsLastOctet)
{
	BLEAddress address = BLEAddress::parse("c1:02:a3:44:b5:f6");
	CHECK_EQUAL("C1:02:A3:44:B5:F6"s, address.to_string());
	CHECK_EQUAL("C1:02:A3:44:B5:F7"s, address.bootloader_address().to_string());
}

TEST(BLEAddress, BootloaderAddressDoesNotCarry)
{
	BLEAddress address = BLEAddress::parse("C1:02:A3:44:B5:FF");
	CHECK_EQUAL("C1:02:A3:44:B5:00"s, address.bootloader_address().to_string());
	CHECK(address != address.bootloader_address());
}
