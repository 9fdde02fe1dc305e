#pragma once

#include <cstdint>
#include <vector>

#include "error.hpp"
#include "debug.hpp"
#include "binascii.hpp"

// Opcodes, result codes and object types as defined by the nRF5 SDK secure bootloader
// (components/libraries/bootloader/dfu/nrf_dfu_req_handler.h)

enum class DFUOpCode : uint8_t {
	PROTOCOL_VERSION = 0x00,
	OBJECT_CREATE = 0x01,
	RECEIPT_NOTIF_SET = 0x02,
	CRC_GET = 0x03,
	OBJECT_EXECUTE = 0x04,
	OBJECT_SELECT = 0x06,
	MTU_GET = 0x07,
	OBJECT_WRITE = 0x08,
	PING = 0x09,
	HARDWARE_VERSION = 0x0A,
	FIRMWARE_VERSION = 0x0B,
	ABORT = 0x0C,
	RESPONSE = 0x60
};

enum class DFUResultCode : uint8_t {
	INVALID = 0x00,
	SUCCESS = 0x01,
	OP_CODE_NOT_SUPPORTED = 0x02,
	INVALID_PARAMETER = 0x03,
	INSUFFICIENT_RESOURCES = 0x04,
	INVALID_OBJECT = 0x05,
	UNSUPPORTED_TYPE = 0x07,
	OPERATION_NOT_PERMITTED = 0x08,
	OPERATION_FAILED = 0x0A,
	EXT_ERROR = 0x0B
};

// Follows an EXT_ERROR result code
enum class DFUExtError : uint8_t {
	NO_ERROR = 0x00,
	INVALID_ERROR_CODE = 0x01,
	WRONG_COMMAND_FORMAT = 0x02,
	UNKNOWN_COMMAND = 0x03,
	INIT_COMMAND_INVALID = 0x04,
	FW_VERSION_FAILURE = 0x05,
	HW_VERSION_FAILURE = 0x06,
	SD_VERSION_FAILURE = 0x07,
	SIGNATURE_MISSING = 0x08,
	WRONG_HASH_TYPE = 0x09,
	HASH_FAILED = 0x0A,
	WRONG_SIGNATURE_TYPE = 0x0B,
	VERIFICATION_FAILED = 0x0C,
	INSUFFICIENT_SPACE = 0x0D
};

enum class DFUObjectType : uint8_t {
	INVALID = 0x00,
	COMMAND = 0x01,
	DATA = 0x02
};

struct DFUResponse {
	DFUOpCode opcode;
	DFUResultCode result;
	DFUExtError ext_error;
	std::vector<uint8_t> payload;
};

struct DFUSelectResponse {
	uint32_t max_size;
	uint32_t offset;
	uint32_t crc;
};

struct DFUCrcResponse {
	uint32_t offset;
	uint32_t crc;
};

static inline const char *dfu_opcode_str(DFUOpCode opcode) {
	switch (opcode) {
	case DFUOpCode::PROTOCOL_VERSION: return "PROTOCOL_VERSION";
	case DFUOpCode::OBJECT_CREATE: return "CREATE";
	case DFUOpCode::RECEIPT_NOTIF_SET: return "SET_PRN";
	case DFUOpCode::CRC_GET: return "CRC_GET";
	case DFUOpCode::OBJECT_EXECUTE: return "EXECUTE";
	case DFUOpCode::OBJECT_SELECT: return "SELECT";
	case DFUOpCode::MTU_GET: return "MTU_GET";
	case DFUOpCode::OBJECT_WRITE: return "WRITE";
	case DFUOpCode::PING: return "PING";
	case DFUOpCode::HARDWARE_VERSION: return "HW_VERSION";
	case DFUOpCode::FIRMWARE_VERSION: return "FW_VERSION";
	case DFUOpCode::ABORT: return "ABORT";
	case DFUOpCode::RESPONSE: return "RESPONSE";
	default: return "UNKNOWN";
	}
}

static inline const char *dfu_result_str(DFUResultCode result) {
	switch (result) {
	case DFUResultCode::INVALID: return "INVALID";
	case DFUResultCode::SUCCESS: return "SUCCESS";
	case DFUResultCode::OP_CODE_NOT_SUPPORTED: return "OP_CODE_NOT_SUPPORTED";
	case DFUResultCode::INVALID_PARAMETER: return "INVALID_PARAMETER";
	case DFUResultCode::INSUFFICIENT_RESOURCES: return "INSUFFICIENT_RESOURCES";
	case DFUResultCode::INVALID_OBJECT: return "INVALID_OBJECT";
	case DFUResultCode::UNSUPPORTED_TYPE: return "UNSUPPORTED_TYPE";
	case DFUResultCode::OPERATION_NOT_PERMITTED: return "OPERATION_NOT_PERMITTED";
	case DFUResultCode::OPERATION_FAILED: return "OPERATION_FAILED";
	case DFUResultCode::EXT_ERROR: return "EXT_ERROR";
	default: return "UNKNOWN";
	}
}

static inline const char *dfu_ext_error_str(DFUExtError ext_error) {
	switch (ext_error) {
	case DFUExtError::NO_ERROR: return "NO_ERROR";
	case DFUExtError::INVALID_ERROR_CODE: return "INVALID_ERROR_CODE";
	case DFUExtError::WRONG_COMMAND_FORMAT: return "WRONG_COMMAND_FORMAT";
	case DFUExtError::UNKNOWN_COMMAND: return "UNKNOWN_COMMAND";
	case DFUExtError::INIT_COMMAND_INVALID: return "INIT_COMMAND_INVALID";
	case DFUExtError::FW_VERSION_FAILURE: return "FW_VERSION_FAILURE";
	case DFUExtError::HW_VERSION_FAILURE: return "HW_VERSION_FAILURE";
	case DFUExtError::SD_VERSION_FAILURE: return "SD_VERSION_FAILURE";
	case DFUExtError::SIGNATURE_MISSING: return "SIGNATURE_MISSING";
	case DFUExtError::WRONG_HASH_TYPE: return "WRONG_HASH_TYPE";
	case DFUExtError::HASH_FAILED: return "HASH_FAILED";
	case DFUExtError::WRONG_SIGNATURE_TYPE: return "WRONG_SIGNATURE_TYPE";
	case DFUExtError::VERIFICATION_FAILED: return "VERIFICATION_FAILED";
	case DFUExtError::INSUFFICIENT_SPACE: return "INSUFFICIENT_SPACE";
	default: return "UNKNOWN";
	}
}


class DFUEncoder {
private:
	static inline void append_u16(std::vector<uint8_t>& output, uint16_t value) {
		output.push_back(value & 0xFF);
		output.push_back((value >> 8) & 0xFF);
	}
	static inline void append_u32(std::vector<uint8_t>& output, uint32_t value) {
		for (unsigned int i = 0; i < 4; i++)
			output.push_back((value >> (8 * i)) & 0xFF);
	}
	static inline std::vector<uint8_t> request(DFUOpCode opcode) {
		return { static_cast<uint8_t>(opcode) };
	}

public:
	static std::vector<uint8_t> encode_protocol_version() {
		return request(DFUOpCode::PROTOCOL_VERSION);
	}
	static std::vector<uint8_t> encode_create(DFUObjectType type, uint32_t size) {
		auto output = request(DFUOpCode::OBJECT_CREATE);
		output.push_back(static_cast<uint8_t>(type));
		append_u32(output, size);
		return output;
	}
	static std::vector<uint8_t> encode_set_prn(uint16_t prn) {
		auto output = request(DFUOpCode::RECEIPT_NOTIF_SET);
		append_u16(output, prn);
		return output;
	}
	static std::vector<uint8_t> encode_crc_get() {
		return request(DFUOpCode::CRC_GET);
	}
	static std::vector<uint8_t> encode_execute() {
		return request(DFUOpCode::OBJECT_EXECUTE);
	}
	static std::vector<uint8_t> encode_select(DFUObjectType type) {
		auto output = request(DFUOpCode::OBJECT_SELECT);
		output.push_back(static_cast<uint8_t>(type));
		return output;
	}
	static std::vector<uint8_t> encode_mtu_get() {
		return request(DFUOpCode::MTU_GET);
	}
	static std::vector<uint8_t> encode_ping(uint8_t id) {
		auto output = request(DFUOpCode::PING);
		output.push_back(id);
		return output;
	}
	static std::vector<uint8_t> encode_abort() {
		return request(DFUOpCode::ABORT);
	}
};


class DFUDecoder {
public:
	static uint16_t decode_u16(const std::vector<uint8_t>& data, unsigned int pos) {
		if (data.size() < pos + 2)
			throw DFU_INVALID_RESPONSE;
		return data[pos] | (data[pos + 1] << 8);
	}

	static uint32_t decode_u32(const std::vector<uint8_t>& data, unsigned int pos) {
		if (data.size() < pos + 4)
			throw DFU_INVALID_RESPONSE;
		return (uint32_t)data[pos] | ((uint32_t)data[pos + 1] << 8) |
			   ((uint32_t)data[pos + 2] << 16) | ((uint32_t)data[pos + 3] << 24);
	}

	// Splits a control point notification into its header fields and return payload:
	//
	// <0x60><REQUEST_OPCODE><RESULT>[<EXT_ERROR>|<PAYLOAD...>]
	static DFUResponse decode(const std::vector<uint8_t>& pdu) {
		if (pdu.size() < 3) {
			DEBUG_ERROR("DFUDecoder: response too short: %s", Binascii::hexlify(pdu).c_str());
			throw DFU_INVALID_RESPONSE;
		}
		if (pdu[0] != static_cast<uint8_t>(DFUOpCode::RESPONSE)) {
			DEBUG_ERROR("DFUDecoder: bad response header: %s", Binascii::hexlify(pdu).c_str());
			throw DFU_INVALID_RESPONSE;
		}

		DFUResponse response;
		response.opcode = static_cast<DFUOpCode>(pdu[1]);
		response.result = static_cast<DFUResultCode>(pdu[2]);
		response.ext_error = DFUExtError::NO_ERROR;
		if (response.result == DFUResultCode::EXT_ERROR && pdu.size() > 3)
			response.ext_error = static_cast<DFUExtError>(pdu[3]);
		else if (response.result == DFUResultCode::SUCCESS)
			response.payload.assign(pdu.begin() + 3, pdu.end());

		return response;
	}

	static DFUSelectResponse decode_select(const DFUResponse& response) {
		DFUSelectResponse select;
		select.max_size = decode_u32(response.payload, 0);
		select.offset = decode_u32(response.payload, 4);
		select.crc = decode_u32(response.payload, 8);
		return select;
	}

	static DFUCrcResponse decode_crc(const DFUResponse& response) {
		DFUCrcResponse crc;
		crc.offset = decode_u32(response.payload, 0);
		crc.crc = decode_u32(response.payload, 4);
		return crc;
	}

	static uint16_t decode_mtu(const DFUResponse& response) {
		return decode_u16(response.payload, 0);
	}

	static uint8_t decode_ping(const DFUResponse& response) {
		if (response.payload.empty())
			throw DFU_INVALID_RESPONSE;
		return response.payload[0];
	}

	static uint8_t decode_protocol_version(const DFUResponse& response) {
		if (response.payload.empty())
			throw DFU_INVALID_RESPONSE;
		return response.payload[0];
	}
};
