#ifndef __MESSAGES_HPP_
#define __MESSAGES_HPP_

#include <stdint.h>
#include "base_types.hpp"

#define MAX_LOG_PAYLOAD    120

static constexpr const char *log_type_name[8] = {
	"DFU_PROGRESS",
	"DFU_STATE",
	"DFU_RESULT",
	"ERROR",
	"WARN",
	"INFO",
	"TRACE"
};

enum LogType : uint8_t {
	LOG_DFU_PROGRESS,
	LOG_DFU_STATE,
	LOG_DFU_RESULT,
	LOG_ERROR,
	LOG_WARN,
	LOG_INFO,
	LOG_TRACE
};

struct __attribute__((packed)) LogHeader {
	uint8_t  day;
	uint8_t  month;
	uint16_t year;
	uint8_t  hours;
	uint8_t  minutes;
	uint8_t  seconds;
	LogType  log_type;
	uint16_t payload_size;
};

struct LogEntry {
	LogHeader header;
	union {
		uint8_t data[MAX_LOG_PAYLOAD];
	};
};

enum class DFUObjectKind : uint8_t { INIT_PACKET, FIRMWARE };

struct __attribute__((packed)) DFUProgressLogEntry {
	LogHeader header;
	union {
		struct {
			BaseImageKind image_kind;
			DFUObjectKind object_kind;
			uint32_t      offset;
			uint32_t      total;
			uint32_t      crc32;
		};
		uint8_t data[MAX_LOG_PAYLOAD];
	};
};

enum class DFUStateEvent : uint8_t { IDLE, SELECTING, CREATING, STREAMING, CRC_CHECKING, RETRYING, EXECUTING, COMPLETED, ERROR };

struct __attribute__((packed)) DFUStateLogEntry {
	LogHeader header;
	union {
		struct {
			DFUStateEvent event;
			DFUObjectKind object_kind;
		};
		uint8_t data[MAX_LOG_PAYLOAD];
	};
};

enum class DFUResultEvent : uint8_t { SUCCESS, FAIL, ABORT };

struct __attribute__((packed)) DFUResultLogEntry {
	LogHeader header;
	union {
		struct {
			DFUResultEvent event;
			int            error_code;
			uint8_t        target_result;
			uint8_t        target_ext_error;
		};
		uint8_t data[MAX_LOG_PAYLOAD];
	};
};

#endif // __MESSAGES_HPP_
