#pragma once

enum ErrorCode : int {
	// Firmware package
	PACKAGE_FILE_NOT_FOUND = 1,
	PACKAGE_BAD_ARCHIVE,
	PACKAGE_MALFORMED_MANIFEST,
	PACKAGE_MISSING_MEMBER,
	PACKAGE_SIZE_MISMATCH,
	PACKAGE_UNSUPPORTED_IMAGE_KIND,

	// BLE transport
	TRANSPORT_ADAPTER_ERROR = 100,
	TRANSPORT_INVALID_ADDRESS,
	TRANSPORT_DEVICE_NOT_FOUND,
	TRANSPORT_CONNECT_FAILED,
	TRANSPORT_NOT_CONNECTED,
	TRANSPORT_CHARACTERISTIC_NOT_FOUND,
	TRANSPORT_SUBSCRIBE_FAILED,
	TRANSPORT_WRITE_FAILED,
	TRANSPORT_TIMEOUT,

	// DFU protocol
	DFU_INVALID_RESPONSE = 200,
	DFU_TARGET_ERROR,
	DFU_CRC_MISMATCH,
	DFU_OBJECT_TOO_LARGE,
	DFU_TRANSFER_ABORTED,
	DFU_NO_MATCHING_IMAGE,
	DFU_INVALID_STATE,
	DFU_CANCELLED,
	DFU_TRIGGER_FAILED,

	// Configuration
	CONFIG_UNKNOWN_PARAM = 300,
	CONFIG_VALUE_OUT_OF_RANGE,
	CONFIG_FILE_ERROR,
	CONFIG_STORE_CORRUPTED,
};

static inline const char *error_code_str(ErrorCode e) {

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wswitch-enum"

	switch (e) {
	case ErrorCode::PACKAGE_FILE_NOT_FOUND: return "PACKAGE_FILE_NOT_FOUND";
	case ErrorCode::PACKAGE_BAD_ARCHIVE: return "PACKAGE_BAD_ARCHIVE";
	case ErrorCode::PACKAGE_MALFORMED_MANIFEST: return "PACKAGE_MALFORMED_MANIFEST";
	case ErrorCode::PACKAGE_MISSING_MEMBER: return "PACKAGE_MISSING_MEMBER";
	case ErrorCode::PACKAGE_SIZE_MISMATCH: return "PACKAGE_SIZE_MISMATCH";
	case ErrorCode::PACKAGE_UNSUPPORTED_IMAGE_KIND: return "PACKAGE_UNSUPPORTED_IMAGE_KIND";
	case ErrorCode::TRANSPORT_ADAPTER_ERROR: return "TRANSPORT_ADAPTER_ERROR";
	case ErrorCode::TRANSPORT_INVALID_ADDRESS: return "TRANSPORT_INVALID_ADDRESS";
	case ErrorCode::TRANSPORT_DEVICE_NOT_FOUND: return "TRANSPORT_DEVICE_NOT_FOUND";
	case ErrorCode::TRANSPORT_CONNECT_FAILED: return "TRANSPORT_CONNECT_FAILED";
	case ErrorCode::TRANSPORT_NOT_CONNECTED: return "TRANSPORT_NOT_CONNECTED";
	case ErrorCode::TRANSPORT_CHARACTERISTIC_NOT_FOUND: return "TRANSPORT_CHARACTERISTIC_NOT_FOUND";
	case ErrorCode::TRANSPORT_SUBSCRIBE_FAILED: return "TRANSPORT_SUBSCRIBE_FAILED";
	case ErrorCode::TRANSPORT_WRITE_FAILED: return "TRANSPORT_WRITE_FAILED";
	case ErrorCode::TRANSPORT_TIMEOUT: return "TRANSPORT_TIMEOUT";
	case ErrorCode::DFU_INVALID_RESPONSE: return "DFU_INVALID_RESPONSE";
	case ErrorCode::DFU_TARGET_ERROR: return "DFU_TARGET_ERROR";
	case ErrorCode::DFU_CRC_MISMATCH: return "DFU_CRC_MISMATCH";
	case ErrorCode::DFU_OBJECT_TOO_LARGE: return "DFU_OBJECT_TOO_LARGE";
	case ErrorCode::DFU_TRANSFER_ABORTED: return "DFU_TRANSFER_ABORTED";
	case ErrorCode::DFU_NO_MATCHING_IMAGE: return "DFU_NO_MATCHING_IMAGE";
	case ErrorCode::DFU_INVALID_STATE: return "DFU_INVALID_STATE";
	case ErrorCode::DFU_CANCELLED: return "DFU_CANCELLED";
	case ErrorCode::DFU_TRIGGER_FAILED: return "DFU_TRIGGER_FAILED";
	case ErrorCode::CONFIG_UNKNOWN_PARAM: return "CONFIG_UNKNOWN_PARAM";
	case ErrorCode::CONFIG_VALUE_OUT_OF_RANGE: return "CONFIG_VALUE_OUT_OF_RANGE";
	case ErrorCode::CONFIG_FILE_ERROR: return "CONFIG_FILE_ERROR";
	case ErrorCode::CONFIG_STORE_CORRUPTED: return "CONFIG_STORE_CORRUPTED";
	default: return "UNKNOWN";
	}

#pragma GCC diagnostic pop

}

// Transient link failures are retried by the object transfer engine
static inline bool is_transient_error(ErrorCode e) {
	return e == ErrorCode::TRANSPORT_WRITE_FAILED || e == ErrorCode::TRANSPORT_TIMEOUT;
}
