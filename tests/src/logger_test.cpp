#include <cstdio>
#include <string>
#include <unistd.h>

#include "file_log.hpp"
#include "sys_log.hpp"
#include "debug.hpp"

#include "fake_logger.hpp"

#include "CppUTest/TestHarness.h"
#include "CppUTestExt/MockSupport.h"


static std::string read_text_file(const std::string& path) {
	std::string text;
	FILE *f = std::fopen(path.c_str(), "r");
	if (!f)
		return text;
	char buffer[256];
	size_t n;
	while ((n = std::fread(buffer, 1, sizeof(buffer), f)) > 0)
		text.append(buffer, n);
	std::fclose(f);
	return text;
}

static unsigned int count_lines(const std::string& text) {
	unsigned int lines = 0;
	for (auto c : text)
		if (c == '\n')
			lines++;
	return lines;
}


TEST_GROUP(Logger)
{
	std::string path;
	SysLogFormatter formatter;
	FileLog *file_log;

	void setup() {
		char temp[] = "/tmp/nrfdfu_log_XXXXXX";
		int fd = mkstemp(temp);
		if (fd >= 0)
			close(fd);
		path = temp;
		std::remove(path.c_str());

		file_log = new FileLog(path.c_str());
		file_log->set_log_formatter(&formatter);
	}

	void teardown() {
		LoggerManager::set_log_level(LOG_LEVEL_DEBUG);
		delete file_log;
		std::remove(path.c_str());
	}
};


TEST(Logger, CanCreateAndWriteToLogFile)
{
	CHECK_FALSE(file_log->is_ready());
	LoggerManager::create();
	CHECK_TRUE(file_log->is_ready());
	CHECK_EQUAL(0, file_log->num_entries());

	file_log->info("connected to %s", "AA:BB:CC:DD:EE:FF");
	file_log->warn("retry %u", 2);
	CHECK_EQUAL(2, file_log->num_entries());

	// Should not re-create the file
	LoggerManager::create();
	CHECK_EQUAL(2, file_log->num_entries());

	std::string text = read_text_file(path);
	CHECK_EQUAL(3, count_lines(text));
	CHECK_TRUE(text.rfind("log_datetime,log_level,message\r\n", 0) == 0);
	CHECK_TRUE(text.find(",INFO,connected to AA:BB:CC:DD:EE:FF\r\n") != std::string::npos);
	CHECK_TRUE(text.find(",WARN,retry 2\r\n") != std::string::npos);
}

TEST(Logger, TruncateRestartsLogFile)
{
	file_log->create();
	file_log->error("first");
	file_log->truncate();
	file_log->error("second");

	std::string text = read_text_file(path);
	CHECK_EQUAL(2, count_lines(text));
	CHECK_TRUE(text.find("first") == std::string::npos);
	CHECK_EQUAL(1, file_log->num_entries());
}

TEST(Logger, LogLevelFiltersMessages)
{
	file_log->create();
	LoggerManager::set_log_level(LOG_LEVEL_WARN);

	file_log->trace("trace");
	file_log->info("info");
	file_log->warn("warn");
	file_log->error("error");

	CHECK_EQUAL(2, file_log->num_entries());
}

TEST(Logger, DFUEntriesAreFormatted)
{
	file_log->create();

	DFUProgressLogEntry progress;
	Logger::sync_datetime(progress.header);
	progress.header.log_type = LOG_DFU_PROGRESS;
	progress.image_kind = BaseImageKind::APPLICATION;
	progress.object_kind = DFUObjectKind::FIRMWARE;
	progress.offset = 4096;
	progress.total = 120000;
	progress.crc32 = 0xCBF43926;
	file_log->write(&progress);

	DFUResultLogEntry result;
	Logger::sync_datetime(result.header);
	result.header.log_type = LOG_DFU_RESULT;
	result.event = DFUResultEvent::FAIL;
	result.error_code = DFU_TARGET_ERROR;
	result.target_result = 0x0B;
	result.target_ext_error = 0x0C;
	file_log->write(&result);

	std::string text = read_text_file(path);
	CHECK_TRUE(text.find(",PROGRESS,application firmware 4096/120000 cbf43926\r\n") != std::string::npos);
	CHECK_TRUE(text.find(",RESULT,result 1 error 201 target 11/12\r\n") != std::string::npos);
}

TEST(Logger, EntriesReachAttachedSystemLog)
{
	FakeLog *fake_log = new FakeLog("SystemLog");
	DebugLogger::system_log = fake_log;

	DFUStateLogEntry entry;
	Logger::sync_datetime(entry.header);
	entry.header.log_type = LOG_DFU_STATE;
	entry.event = DFUStateEvent::STREAMING;
	entry.object_kind = DFUObjectKind::FIRMWARE;
	DebugLogger::write_entry(&entry);

	CHECK_EQUAL(1, fake_log->num_entries());
	DFUStateLogEntry read_back;
	fake_log->read(&read_back);
	CHECK(DFUStateEvent::STREAMING == read_back.event);

	CHECK(LoggerManager::find_by_name("SystemLog") == fake_log);

	DebugLogger::system_log = nullptr;
	delete fake_log;
	CHECK(LoggerManager::find_by_name("SystemLog") == nullptr);
}
