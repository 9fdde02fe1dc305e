#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <variant>

#define BASE_TEXT_MAX_LENGTH  128
#define KEY_LENGTH            5

enum class ParamID {
	DFU_PRN,
	DFU_TARGET_PRN,
	DFU_MAX_RETRIES,
	DFU_BACKOFF_MS,
	DFU_BACKOFF_FACTOR,
	DFU_BACKOFF_MAX_MS,
	DFU_CONTROL_TIMEOUT_MS,
	DFU_CONTROL_RETRIES,
	DFU_EXECUTE_TIMEOUT_MS,
	DFU_OBJECT_MODE,
	DFU_PING_ON_START,
	BLE_HCI_DEVICE,
	BLE_MTU,
	BLE_ADDRESS_TYPE,
	BLE_SCAN_TIMEOUT_MS,
	BLE_CONNECT_TIMEOUT_MS,
	BUTTONLESS_WITH_BONDS,
	BOOTLOADER_NAME,
	RECONNECT_ATTEMPTS,
	RECONNECT_DELAY_MS,
	LOG_LEVEL,
	__PARAM_SIZE
};

enum class BaseEncoding {
	DECIMAL,
	UINT,
	TEXT,
	BOOLEAN,
	OBJECTMODE,
	ADDRESSTYPE
};

// How a firmware image is laid out in peripheral objects
enum class BaseObjectMode : unsigned int {
	SINGLE,     // One data object holding the whole image
	SEGMENTED   // Data objects of the peripheral's maximum object size, each executed in turn
};

enum class BaseAddressType : unsigned int {
	PUBLIC,
	RANDOM
};

enum class BaseImageKind : uint8_t {
	APPLICATION,
	SOFTDEVICE,
	BOOTLOADER,
	SOFTDEVICE_BOOTLOADER
};

using BaseKey = std::string;
using BaseName = std::string;
using BaseConstraint = std::variant<unsigned int, int, double, std::string>;

// !!! Do not change the ordering of variants and also make sure std::string is the first entry !!!
using BaseType = std::variant<std::string, unsigned int, int, double, bool, BaseObjectMode, BaseAddressType>;

struct BaseMap {
	BaseName 	   name;
	BaseKey  	   key;
	BaseEncoding   encoding;
	BaseConstraint min_value;
	BaseConstraint max_value;
	std::vector<BaseConstraint> permitted_values;
	bool           is_implemented;
	bool           is_writable;
};
