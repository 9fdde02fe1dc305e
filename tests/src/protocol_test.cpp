#include "dfu_protocol.hpp"
#include "param_codec.hpp"
#include "debug.hpp"
#include "CppUTest/TestHarness.h"
#include "CppUTestExt/MockSupport.h"

using namespace std::literals::string_literals;


TEST_GROUP(DFUProtocol)
{
	void setup() {
	}
	void teardown() {
	}
};

TEST(DFUProtocol, EncodeRequests)
{
	CHECK(std::vector<uint8_t>({ 0x01, 0x01, 0x8D, 0x00, 0x00, 0x00 }) == DFUEncoder::encode_create(DFUObjectType::COMMAND, 141));
	CHECK(std::vector<uint8_t>({ 0x01, 0x02, 0xC0, 0xD4, 0x01, 0x00 }) == DFUEncoder::encode_create(DFUObjectType::DATA, 120000));
	CHECK(std::vector<uint8_t>({ 0x02, 0x0A, 0x00 }) == DFUEncoder::encode_set_prn(10));
	CHECK(std::vector<uint8_t>({ 0x03 }) == DFUEncoder::encode_crc_get());
	CHECK(std::vector<uint8_t>({ 0x04 }) == DFUEncoder::encode_execute());
	CHECK(std::vector<uint8_t>({ 0x06, 0x02 }) == DFUEncoder::encode_select(DFUObjectType::DATA));
	CHECK(std::vector<uint8_t>({ 0x09, 0x33 }) == DFUEncoder::encode_ping(0x33));
	CHECK(std::vector<uint8_t>({ 0x0C }) == DFUEncoder::encode_abort());
}

TEST(DFUProtocol, DecodeSelectResponse)
{
	std::vector<uint8_t> pdu = Binascii::unhexlify("600601" "00100000" "00200000" "78563412");
	DFUResponse response = DFUDecoder::decode(pdu);
	CHECK(DFUOpCode::OBJECT_SELECT == response.opcode);
	CHECK(DFUResultCode::SUCCESS == response.result);

	DFUSelectResponse select = DFUDecoder::decode_select(response);
	CHECK_EQUAL(4096U, select.max_size);
	CHECK_EQUAL(8192U, select.offset);
	CHECK_EQUAL(0x12345678U, select.crc);
}

TEST(DFUProtocol, DecodeCrcResponse)
{
	DFUCrcResponse crc = DFUDecoder::decode_crc(DFUDecoder::decode(Binascii::unhexlify("600301" "C0D40100" "EFBEADDE")));
	CHECK_EQUAL(120000U, crc.offset);
	CHECK_EQUAL(0xDEADBEEFU, crc.crc);
}

TEST(DFUProtocol, DecodeExtendedError)
{
	DFUResponse response = DFUDecoder::decode({ 0x60, 0x04, 0x0B, 0x07 });
	CHECK(DFUOpCode::OBJECT_EXECUTE == response.opcode);
	CHECK(DFUResultCode::EXT_ERROR == response.result);
	CHECK(DFUExtError::SD_VERSION_FAILURE == response.ext_error);
	CHECK_TRUE(response.payload.empty());
	STRCMP_EQUAL("SD_VERSION_FAILURE", dfu_ext_error_str(response.ext_error));
}

TEST(DFUProtocol, MalformedResponsesAreRejected)
{
	CHECK_THROWS(ErrorCode, DFUDecoder::decode({ 0x60, 0x04 }));
	CHECK_THROWS(ErrorCode, DFUDecoder::decode({ 0x10, 0x04, 0x01 }));
	CHECK_THROWS(ErrorCode, DFUDecoder::decode_select(DFUDecoder::decode({ 0x60, 0x06, 0x01, 0x00, 0x10 })));
}


TEST_GROUP(ParamCodec)
{
};

TEST(ParamCodec, LookupByNameOrKey)
{
	CHECK(ParamID::DFU_PRN == ParamDecoder::lookup("DFU_PRN"));
	CHECK(ParamID::DFU_PRN == ParamDecoder::lookup("DFP01"));
	CHECK(ParamID::BOOTLOADER_NAME == ParamDecoder::lookup("BTP02"));
	CHECK_THROWS(ErrorCode, ParamDecoder::lookup("ARGOS_DECID"));
}

TEST(ParamCodec, DecodeAssignments)
{
	ParamValue pv = ParamDecoder::decode("DFU_PRN=10");
	CHECK(ParamID::DFU_PRN == pv.param);
	CHECK_EQUAL(10U, std::get<unsigned int>(pv.value));

	pv = ParamDecoder::decode("DFP10=SEGMENTED");
	CHECK(BaseObjectMode::SEGMENTED == std::get<BaseObjectMode>(pv.value));

	pv = ParamDecoder::decode("BLE_ADDRESS_TYPE=PUBLIC");
	CHECK(BaseAddressType::PUBLIC == std::get<BaseAddressType>(pv.value));

	pv = ParamDecoder::decode("BUTTONLESS_WITH_BONDS=true");
	CHECK_TRUE(std::get<bool>(pv.value));

	pv = ParamDecoder::decode("BOOTLOADER_NAME=InfiniTimeDFU");
	CHECK_EQUAL("InfiniTimeDFU"s, std::get<std::string>(pv.value));
}

TEST(ParamCodec, RangeChecks)
{
	CHECK_THROWS(ErrorCode, ParamDecoder::decode("BLE_MTU=10"));
	CHECK_THROWS(ErrorCode, ParamDecoder::decode("DFU_PRN=-1"));
	CHECK_THROWS(ErrorCode, ParamDecoder::decode("DFU_OBJECT_MODE=PAGED"));
	CHECK_THROWS(ErrorCode, ParamDecoder::decode("DFU_PRN"));
	CHECK_THROWS(ErrorCode, ParamDecoder::decode("=10"));
}

TEST(ParamCodec, EncodeAssignments)
{
	CHECK_EQUAL("DFU_OBJECT_MODE=SEGMENTED"s, ParamEncoder::encode(ParamID::DFU_OBJECT_MODE, BaseObjectMode::SEGMENTED));
	CHECK_EQUAL("DFU_MAX_RETRIES=5"s, ParamEncoder::encode(ParamID::DFU_MAX_RETRIES, 5U));
	CHECK_EQUAL("DFU_PING_ON_START=1"s, ParamEncoder::encode(ParamID::DFU_PING_ON_START, true));
}
