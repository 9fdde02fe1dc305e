#include "dfu_target.hpp"
#include "fake_dfu_bootloader.hpp"
#include "mock_dfu_transport.hpp"
#include "error.hpp"

#include "CppUTest/TestHarness.h"
#include "CppUTestExt/MockSupport.h"


TEST_GROUP(DFUTarget)
{
	FakeDFUBootloader *bootloader;
	DFUTarget *target;

	void setup() {
		bootloader = new FakeDFUBootloader;
		target = new DFUTarget(*bootloader, 500, 3, 10000);
		bootloader->connect("AA:BB:CC:DD:EE:FF");
		bootloader->subscribe(DFUCharacteristic::CONTROL_POINT);
	}

	void teardown() {
		delete target;
		delete bootloader;
	}
};


TEST(DFUTarget, SelectReportsObjectState)
{
	bootloader->command_max_size = 512;
	DFUSelectResponse select = target->select(DFUObjectType::COMMAND);
	CHECK_EQUAL(512U, select.max_size);
	CHECK_EQUAL(0U, select.offset);
	CHECK_EQUAL(0U, select.crc);

	std::vector<uint8_t> command = { 0x12, 0x8A, 0x01, 0x0A, 0x44 };
	bootloader->preload_command(command, false);
	select = target->select(DFUObjectType::COMMAND);
	CHECK_EQUAL(5U, select.offset);
	CHECK_EQUAL(CRC32::update(0, command.data(), command.size()), select.crc);
}

TEST(DFUTarget, CommandObjectLifecycle)
{
	std::vector<uint8_t> command = { 0x01, 0x02, 0x03, 0x04 };

	target->create(DFUObjectType::COMMAND, command.size());
	bootloader->write(DFUCharacteristic::DATA_POINT, command, false);

	DFUCrcResponse crc = target->get_crc();
	CHECK_EQUAL(4U, crc.offset);
	CHECK_EQUAL(CRC32::update(0, command.data(), command.size()), crc.crc);

	target->execute();
	CHECK_TRUE(bootloader->is_command_executed());
	CHECK_EQUAL(1U, bootloader->requests(DFUOpCode::OBJECT_EXECUTE));
}

TEST(DFUTarget, SetPrnIsSentToPeripheral)
{
	target->set_prn(12);
	CHECK_EQUAL(12U, bootloader->prn);
}

TEST(DFUTarget, PingEchoesId)
{
	CHECK_EQUAL(0x5A, target->ping(0x5A));
	CHECK_EQUAL(1, target->protocol_version());
	CHECK_EQUAL(247, target->mtu());
}

TEST(DFUTarget, RejectionIsTargetErrorWithReason)
{
	bootloader->reject(DFUOpCode::OBJECT_CREATE, DFUResultCode::EXT_ERROR, DFUExtError::INIT_COMMAND_INVALID);

	try {
		target->create(DFUObjectType::COMMAND, 16);
		FAIL("expected DFU_TARGET_ERROR");
	} catch (ErrorCode e) {
		CHECK_EQUAL(DFU_TARGET_ERROR, e);
	}

	CHECK(DFUResultCode::EXT_ERROR == target->last_result());
	CHECK(DFUExtError::INIT_COMMAND_INVALID == target->last_ext_error());

	// Rejections are final so there is no resend
	CHECK_EQUAL(1U, bootloader->requests(DFUOpCode::OBJECT_CREATE));
}

TEST(DFUTarget, DataCreateBeforeCommandExecuteIsNotPermitted)
{
	try {
		target->create(DFUObjectType::DATA, 4096);
		FAIL("expected DFU_TARGET_ERROR");
	} catch (ErrorCode e) {
		CHECK_EQUAL(DFU_TARGET_ERROR, e);
	}
	CHECK(DFUResultCode::OPERATION_NOT_PERMITTED == target->last_result());
	CHECK(DFUExtError::NO_ERROR == target->last_ext_error());
}

TEST(DFUTarget, MissingResponseIsResent)
{
	bootloader->silence(DFUOpCode::CRC_GET, 2);
	target->get_crc();
	CHECK_EQUAL(3U, bootloader->requests(DFUOpCode::CRC_GET));
}

TEST(DFUTarget, MissingResponsesExhaustRetries)
{
	bootloader->silence(DFUOpCode::OBJECT_SELECT, 10);
	try {
		target->select(DFUObjectType::DATA);
		FAIL("expected TRANSPORT_TIMEOUT");
	} catch (ErrorCode e) {
		CHECK_EQUAL(TRANSPORT_TIMEOUT, e);
	}
	CHECK_EQUAL(4U, bootloader->requests(DFUOpCode::OBJECT_SELECT));
}

TEST(DFUTarget, ExecuteIsNeverResent)
{
	bootloader->silence(DFUOpCode::OBJECT_EXECUTE);
	CHECK_THROWS(ErrorCode, target->execute());
	CHECK_EQUAL(1U, bootloader->requests(DFUOpCode::OBJECT_EXECUTE));
}

TEST(DFUTarget, NotConnectedIsNotRetried)
{
	bootloader->disconnect();
	try {
		target->get_crc();
		FAIL("expected TRANSPORT_NOT_CONNECTED");
	} catch (ErrorCode e) {
		CHECK_EQUAL(TRANSPORT_NOT_CONNECTED, e);
	}
}


TEST_GROUP(DFUTargetWire)
{
	MockDFUTransport *transport;
	DFUTarget *target;

	void setup() {
		transport = new MockDFUTransport;
		target = new DFUTarget(*transport, 500, 0, 10000);
	}

	void teardown() {
		mock().checkExpectations();
		mock().clear();
		delete target;
		delete transport;
	}

	void expect_request(const std::vector<uint8_t>& pdu) {
		mock().expectOneCall("flush_notifications").withParameter("characteristic", (int)DFUCharacteristic::CONTROL_POINT);
		mock().expectOneCall("write").withParameter("characteristic", (int)DFUCharacteristic::CONTROL_POINT)
			.withMemoryBufferParameter("data", pdu.data(), pdu.size())
			.withParameter("with_response", true);
	}
};


TEST(DFUTargetWire, CreateIsEncodedLittleEndian)
{
	std::vector<uint8_t> response = { 0x60, 0x01, 0x01 };
	expect_request({ 0x01, 0x02, 0x00, 0x10, 0x00, 0x00 });
	mock().expectOneCall("wait_notification").withParameter("characteristic", (int)DFUCharacteristic::CONTROL_POINT)
		.andReturnValue((const void *)&response);

	target->create(DFUObjectType::DATA, 4096);
}

TEST(DFUTargetWire, LateResponseIsDiscarded)
{
	std::vector<uint8_t> stale = { 0x60, 0x06, 0x01, 0x00, 0x10, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00 };
	std::vector<uint8_t> response = { 0x60, 0x03, 0x01, 0x00, 0x02, 0x00, 0x00, 0x78, 0x56, 0x34, 0x12 };
	expect_request({ 0x03 });
	mock().expectOneCall("wait_notification").withParameter("characteristic", (int)DFUCharacteristic::CONTROL_POINT)
		.andReturnValue((const void *)&stale);
	mock().expectOneCall("wait_notification").withParameter("characteristic", (int)DFUCharacteristic::CONTROL_POINT)
		.andReturnValue((const void *)&response);

	DFUCrcResponse crc = target->get_crc();
	CHECK_EQUAL(512U, crc.offset);
	CHECK_EQUAL(0x12345678U, crc.crc);
}

TEST(DFUTargetWire, ReceiptNotificationBehindSentDataIsSkipped)
{
	std::vector<uint8_t> receipt = { 0x60, 0x03, 0x01, 0x00, 0x10, 0x00, 0x00, 0x11, 0x11, 0x11, 0x11 };
	std::vector<uint8_t> response = { 0x60, 0x03, 0x01, 0x00, 0x20, 0x00, 0x00, 0x22, 0x22, 0x22, 0x22 };
	expect_request({ 0x03 });
	mock().expectOneCall("wait_notification").withParameter("characteristic", (int)DFUCharacteristic::CONTROL_POINT)
		.andReturnValue((const void *)&receipt);
	mock().expectOneCall("wait_notification").withParameter("characteristic", (int)DFUCharacteristic::CONTROL_POINT)
		.andReturnValue((const void *)&response);

	DFUCrcResponse crc = target->get_crc(8192);
	CHECK_EQUAL(8192U, crc.offset);
	CHECK_EQUAL(0x22222222U, crc.crc);
}

TEST(DFUTargetWire, CrcBehindSentDataStandsWhenNothingFollows)
{
	std::vector<uint8_t> response = { 0x60, 0x03, 0x01, 0x00, 0x10, 0x00, 0x00, 0x11, 0x11, 0x11, 0x11 };
	expect_request({ 0x03 });
	mock().expectOneCall("wait_notification").withParameter("characteristic", (int)DFUCharacteristic::CONTROL_POINT)
		.andReturnValue((const void *)&response);
	// No return value is a timeout
	mock().expectOneCall("wait_notification").withParameter("characteristic", (int)DFUCharacteristic::CONTROL_POINT);

	DFUCrcResponse crc = target->get_crc(8192);
	CHECK_EQUAL(4096U, crc.offset);
	CHECK_EQUAL(0x11111111U, crc.crc);
}

TEST(DFUTargetWire, MalformedResponseIsInvalid)
{
	std::vector<uint8_t> response = { 0x20, 0x03 };
	expect_request({ 0x03 });
	mock().expectOneCall("wait_notification").withParameter("characteristic", (int)DFUCharacteristic::CONTROL_POINT)
		.andReturnValue((const void *)&response);

	try {
		target->get_crc();
		FAIL("expected DFU_INVALID_RESPONSE");
	} catch (ErrorCode e) {
		CHECK_EQUAL(DFU_INVALID_RESPONSE, e);
	}
}

TEST(DFUTargetWire, PingWithWrongEchoIsInvalid)
{
	std::vector<uint8_t> response = { 0x60, 0x09, 0x01, 0x07 };
	expect_request({ 0x09, 0x03 });
	mock().expectOneCall("wait_notification").withParameter("characteristic", (int)DFUCharacteristic::CONTROL_POINT)
		.andReturnValue((const void *)&response);

	CHECK_THROWS(ErrorCode, target->ping(3));
}
