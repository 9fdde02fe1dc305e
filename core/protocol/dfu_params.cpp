#include "dfu_params.hpp"

const BaseMap param_map[] = {
	{ "DFU_PRN", "DFP01", BaseEncoding::UINT, 0U, 0xFFFFU, {}, true, true },
	{ "DFU_TARGET_PRN", "DFP02", BaseEncoding::UINT, 0U, 0xFFFFU, {}, true, true },
	{ "DFU_MAX_RETRIES", "DFP03", BaseEncoding::UINT, 0U, 100U, {}, true, true },
	{ "DFU_BACKOFF_MS", "DFP04", BaseEncoding::UINT, 0U, 60000U, {}, true, true },
	{ "DFU_BACKOFF_FACTOR", "DFP05", BaseEncoding::UINT, 1U, 10U, {}, true, true },
	{ "DFU_BACKOFF_MAX_MS", "DFP06", BaseEncoding::UINT, 0U, 600000U, {}, true, true },
	{ "DFU_CONTROL_TIMEOUT_MS", "DFP07", BaseEncoding::UINT, 10U, 60000U, {}, true, true },
	{ "DFU_CONTROL_RETRIES", "DFP08", BaseEncoding::UINT, 1U, 100U, {}, true, true },
	{ "DFU_EXECUTE_TIMEOUT_MS", "DFP09", BaseEncoding::UINT, 100U, 600000U, {}, true, true },
	{ "DFU_OBJECT_MODE", "DFP10", BaseEncoding::OBJECTMODE, 0U, 0U, { 0U, 1U }, true, true },
	{ "DFU_PING_ON_START", "DFP11", BaseEncoding::BOOLEAN, 0, 0, {}, true, true },
	{ "BLE_HCI_DEVICE", "BLP01", BaseEncoding::UINT, 0U, 15U, {}, true, true },
	{ "BLE_MTU", "BLP02", BaseEncoding::UINT, 23U, 517U, {}, true, true },
	{ "BLE_ADDRESS_TYPE", "BLP03", BaseEncoding::ADDRESSTYPE, 0U, 0U, { 0U, 1U }, true, true },
	{ "BLE_SCAN_TIMEOUT_MS", "BLP04", BaseEncoding::UINT, 100U, 600000U, {}, true, true },
	{ "BLE_CONNECT_TIMEOUT_MS", "BLP05", BaseEncoding::UINT, 100U, 600000U, {}, true, true },
	{ "BUTTONLESS_WITH_BONDS", "BTP01", BaseEncoding::BOOLEAN, 0, 0, {}, true, true },
	{ "BOOTLOADER_NAME", "BTP02", BaseEncoding::TEXT, "", "", {}, true, true },
	{ "RECONNECT_ATTEMPTS", "BTP03", BaseEncoding::UINT, 1U, 100U, {}, true, true },
	{ "RECONNECT_DELAY_MS", "BTP04", BaseEncoding::UINT, 0U, 600000U, {}, true, true },
	{ "LOG_LEVEL", "LGP01", BaseEncoding::UINT, 0U, 4U, {}, true, true },
};

const size_t param_map_size = sizeof(param_map) / sizeof(param_map[0]);
