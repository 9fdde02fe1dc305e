#pragma once

#include <string>
#include "logger.hpp"
#include "firmware_package.hpp"


class SysLogFormatter : public LogFormatter {
public:
	const std::string header() override {
		return "log_datetime,log_level,message\r\n";
	}
	const std::string log_entry(const LogEntry& e) override {
		char entry[512], d1[32], msg[256];

		snprintf(d1, sizeof(d1), "%02u/%02u/%04u %02u:%02u:%02u",
				e.header.day, e.header.month, e.header.year, e.header.hours, e.header.minutes, e.header.seconds);

		switch (e.header.log_type) {
		case LOG_DFU_PROGRESS: {
			const DFUProgressLogEntry *p = reinterpret_cast<const DFUProgressLogEntry *>(&e);
			snprintf(msg, sizeof(msg), "%s %s %u/%u %08x", image_kind_str(p->image_kind),
					p->object_kind == DFUObjectKind::INIT_PACKET ? "init" : "firmware",
					(unsigned int)p->offset, (unsigned int)p->total, (unsigned int)p->crc32);
			break;
		}
		case LOG_DFU_STATE: {
			const DFUStateLogEntry *p = reinterpret_cast<const DFUStateLogEntry *>(&e);
			snprintf(msg, sizeof(msg), "state %d", static_cast<int>(p->event));
			break;
		}
		case LOG_DFU_RESULT: {
			const DFUResultLogEntry *p = reinterpret_cast<const DFUResultLogEntry *>(&e);
			snprintf(msg, sizeof(msg), "result %d error %d target %u/%u", static_cast<int>(p->event),
					(int)p->error_code, p->target_result, p->target_ext_error);
			break;
		}
		default:
			snprintf(msg, sizeof(msg), "%s", reinterpret_cast<const char *>(e.data));
			break;
		}

		snprintf(entry, sizeof(entry), "%s,%s,%s\r\n",
				d1,
				log_level_str(e.header.log_type),
				msg);
		return std::string(entry);
	}
};
