#include "dfu_session.hpp"
#include "debug.hpp"

#include "fake_dfu_bootloader.hpp"
#include "fake_config_store.hpp"
#include "fake_logger.hpp"
#include "mock_dfu_transport.hpp"

#include "CppUTest/TestHarness.h"
#include "CppUTestExt/MockSupport.h"


static std::vector<uint8_t> make_blob(size_t size, uint8_t seed) {
	std::vector<uint8_t> blob(size);
	for (size_t i = 0; i < size; i++)
		blob[i] = (uint8_t)((i * 3) ^ seed);
	return blob;
}

static Image make_image(BaseImageKind kind, size_t size, uint8_t seed) {
	Image image;
	image.kind = kind;
	image.init_packet = make_blob(64, seed);
	image.firmware = make_blob(size, seed + 1);
	return image;
}


TEST_GROUP(DFUSession)
{
	FakeConfigurationStore *config_store;
	FakeDFUBootloader *bootloader;
	FakeLog *system_log;
	DFUConfig config;
	FirmwarePackage package;

	void setup() {
		config_store = new FakeConfigurationStore;
		config_store->init();
		config_store->get_dfu_configuration(config);

		bootloader = new FakeDFUBootloader;
		bootloader->connect("AA:BB:CC:DD:EE:FF");

		system_log = new FakeLog("SystemLog");
		DebugLogger::system_log = system_log;

		package.images.clear();
		package.images.push_back(make_image(BaseImageKind::APPLICATION, 12000, 0x10));
	}

	void teardown() {
		mock().checkExpectations();
		mock().clear();
		DebugLogger::system_log = nullptr;
		delete system_log;
		delete bootloader;
		delete config_store;
	}

	bool last_result(DFUResultLogEntry& result) {
		for (int i = (int)system_log->num_entries() - 1; i >= 0; i--) {
			system_log->read(&result, i);
			if (result.header.log_type == LOG_DFU_RESULT)
				return true;
		}
		return false;
	}
};


TEST(DFUSession, CheckModeNames)
{
	DFUMode mode;
	CHECK_TRUE(dfu_mode_from_str("sdbl", mode));
	CHECK(DFUMode::SOFTDEVICE_BOOTLOADER == mode);
	CHECK_TRUE(dfu_mode_from_str("app", mode));
	CHECK(DFUMode::APPLICATION == mode);
	CHECK_FALSE(dfu_mode_from_str("application", mode));
	STRCMP_EQUAL("bl", dfu_mode_str(DFUMode::BOOTLOADER));
}

TEST(DFUSession, CheckUnmatchedModeSendsNothing)
{
	// Any call on the mock transport is unexpected
	MockDFUTransport transport;
	DFUSession session(transport, config);

	try {
		session.run(DFUMode::SOFTDEVICE_BOOTLOADER, package);
		FAIL("expected DFU_NO_MATCHING_IMAGE");
	} catch (ErrorCode e) {
		CHECK_EQUAL(DFU_NO_MATCHING_IMAGE, e);
	}
}

TEST(DFUSession, CheckSelectImagesByKind)
{
	package.images.insert(package.images.begin(), make_image(BaseImageKind::SOFTDEVICE_BOOTLOADER, 2000, 0x20));

	auto images = DFUSession::select_images(DFUMode::APPLICATION, package);
	CHECK_EQUAL(1U, images.size());
	CHECK(BaseImageKind::APPLICATION == images[0]->kind);

	images = DFUSession::select_images(DFUMode::SOFTDEVICE_BOOTLOADER, package);
	CHECK_EQUAL(1U, images.size());
	CHECK(BaseImageKind::SOFTDEVICE_BOOTLOADER == images[0]->kind);

	CHECK_THROWS(ErrorCode, DFUSession::select_images(DFUMode::SOFTDEVICE, package));
}

TEST(DFUSession, CheckApplicationUpdate)
{
	std::vector<DFUProgressLogEntry> progress;
	DFUSession session(*bootloader, config);
	session.set_progress_handler([&progress](const DFUProgressLogEntry& entry) {
		progress.push_back(entry);
	});

	session.run(DFUMode::APPLICATION, package);

	CHECK(package.images[0].firmware == bootloader->firmware());
	CHECK_EQUAL(0U, bootloader->requests(DFUOpCode::ABORT));
	CHECK_EQUAL(0U, bootloader->requests(DFUOpCode::PING));
	CHECK_FALSE(progress.empty());
	CHECK_EQUAL(12000U, progress.back().offset);
	CHECK(DFUObjectKind::FIRMWARE == progress.back().object_kind);

	DFUResultLogEntry result;
	CHECK_TRUE(last_result(result));
	CHECK(DFUResultEvent::SUCCESS == result.event);
	CHECK_EQUAL(0, result.error_code);
}

TEST(DFUSession, CheckDefaultConfigurationFitsObjectSizeLimit)
{
	bootloader->is_object_size_enforced = true;
	DFUSession session(*bootloader, config);

	session.run(DFUMode::APPLICATION, package);

	CHECK(package.images[0].firmware == bootloader->firmware());
	CHECK_EQUAL(3U, bootloader->data_creates());
	CHECK_EQUAL(3U, bootloader->data_executes());
}

TEST(DFUSession, CheckPingOnStart)
{
	config.ping_on_start = true;
	DFUSession session(*bootloader, config);

	session.run(DFUMode::APPLICATION, package);

	CHECK_EQUAL(1U, bootloader->requests(DFUOpCode::PING));
}

TEST(DFUSession, CheckCancelSendsAbort)
{
	DFUSession session(*bootloader, config);
	bootloader->on_data_write = [&session](unsigned int index) {
		if (index == 2)
			session.cancel();
	};

	try {
		session.run(DFUMode::APPLICATION, package);
		FAIL("expected DFU_CANCELLED");
	} catch (ErrorCode e) {
		CHECK_EQUAL(DFU_CANCELLED, e);
	}

	CHECK_TRUE(session.is_cancelled());
	CHECK_EQUAL(1U, bootloader->requests(DFUOpCode::ABORT));
	// The second object is written but never executed
	CHECK_EQUAL(1U, bootloader->data_executes());
	CHECK_EQUAL(2U, bootloader->data_creates());

	DFUResultLogEntry result;
	CHECK_TRUE(last_result(result));
	CHECK(DFUResultEvent::ABORT == result.event);
	CHECK_EQUAL(DFU_CANCELLED, result.error_code);
}

TEST(DFUSession, CheckTargetRejectionIsReported)
{
	bootloader->reject(DFUOpCode::OBJECT_EXECUTE, DFUResultCode::EXT_ERROR, DFUExtError::FW_VERSION_FAILURE);
	DFUSession session(*bootloader, config);

	try {
		session.run(DFUMode::APPLICATION, package);
		FAIL("expected DFU_TARGET_ERROR");
	} catch (ErrorCode e) {
		CHECK_EQUAL(DFU_TARGET_ERROR, e);
	}

	CHECK(DFUResultCode::EXT_ERROR == session.target_result());
	CHECK(DFUExtError::FW_VERSION_FAILURE == session.target_ext_error());
	CHECK_EQUAL(0U, bootloader->requests(DFUOpCode::ABORT));

	DFUResultLogEntry result;
	CHECK_TRUE(last_result(result));
	CHECK(DFUResultEvent::FAIL == result.event);
	CHECK_EQUAL(DFU_TARGET_ERROR, result.error_code);
	CHECK_EQUAL((uint8_t)DFUExtError::FW_VERSION_FAILURE, result.target_ext_error);
}

TEST(DFUSession, CheckLostLinkIsNotAborted)
{
	DFUSession session(*bootloader, config);
	bootloader->on_data_write = [this](unsigned int index) {
		if (index == 2)
			bootloader->disconnect();
	};

	try {
		session.run(DFUMode::APPLICATION, package);
		FAIL("expected TRANSPORT_NOT_CONNECTED");
	} catch (ErrorCode e) {
		CHECK_EQUAL(TRANSPORT_NOT_CONNECTED, e);
	}
	CHECK_EQUAL(0U, bootloader->requests(DFUOpCode::ABORT));
}

TEST(DFUSession, CheckSoftDeviceBootloaderUpdate)
{
	Image sd_bl = make_image(BaseImageKind::SOFTDEVICE_BOOTLOADER, 9000, 0x30);
	package.images.insert(package.images.begin(), sd_bl);
	DFUSession session(*bootloader, config);

	session.run(DFUMode::SOFTDEVICE_BOOTLOADER, package);

	CHECK(sd_bl.firmware == bootloader->firmware());
	CHECK(sd_bl.init_packet == bootloader->command());
}
