#ifndef __CONSOLE_LOG_HPP_
#define __CONSOLE_LOG_HPP_

#include "logger.hpp"
#include "messages.hpp"
#include "firmware_package.hpp"


class ConsoleLog : public Logger {

public:
	ConsoleLog() : Logger("Console") {}

private:
	static const char *object_kind_str(DFUObjectKind kind) {
		return kind == DFUObjectKind::INIT_PACKET ? "init" : "firmware";
	}

	void debug_formatter(const char *level, LogHeader *header, const char *msg) {
		printf("%02u/%02u/%04u %02u:%02u:%02u [%s]\t%s\r\n", header->day, header->month, header->year, header->hours, header->minutes, header->seconds, level, msg);
	}
	void progress_formatter(const DFUProgressLogEntry *entry) {
		const char *name = log_type_name[entry->header.log_type];
		printf("[%s]\t%s %s: %u/%u crc: %08x\r\n", name, image_kind_str(entry->image_kind), object_kind_str(entry->object_kind),
				(unsigned int)entry->offset, (unsigned int)entry->total, (unsigned int)entry->crc32);
	}
	void state_formatter(const DFUStateLogEntry *entry) {
		const char *name = log_type_name[entry->header.log_type];
		printf("[%s]\tnew_state: %d object: %s\r\n", name, static_cast<int>(entry->event), object_kind_str(entry->object_kind));
	}
	void result_formatter(const DFUResultLogEntry *entry) {
		const char *name = log_type_name[entry->header.log_type];
		printf("[%s]\tresult: %d error: %d target_result: %u target_ext_error: %u\r\n", name, static_cast<int>(entry->event),
				(int)entry->error_code, entry->target_result, entry->target_ext_error);
	}

public:
	void create() override {}
	void truncate() override {}
	bool is_ready() override { return true; }
	unsigned int num_entries() override {return 0;}
	void read(void *, int) override { }
	void write(void *entry) override {
		LogEntry *p = (LogEntry *)entry;
		switch (p->header.log_type) {
		case LOG_ERROR:
		case LOG_WARN:
		case LOG_INFO:
		case LOG_TRACE:
			debug_formatter(log_type_name[p->header.log_type], &p->header, (const char * )p->data);
			break;
		case LOG_DFU_PROGRESS:
			progress_formatter((const DFUProgressLogEntry *)entry);
			break;
		case LOG_DFU_STATE:
			state_formatter((const DFUStateLogEntry *)entry);
			break;
		case LOG_DFU_RESULT:
			result_formatter((const DFUResultLogEntry *)entry);
			break;
		default:
			break;
		}
	}
};

#endif // __CONSOLE_LOG_HPP_
