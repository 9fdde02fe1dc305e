#pragma once

#include <array>
#include <string>
#include <type_traits>

#include "base_types.hpp"
#include "dfu_params.hpp"
#include "param_codec.hpp"
#include "retry_policy.hpp"
#include "error.hpp"
#include "debug.hpp"

#define MAX_CONFIG_ITEMS  (unsigned int)ParamID::__PARAM_SIZE

using namespace std::string_literals;

struct DFUConfig {
	unsigned int prn;
	unsigned int target_prn;
	RetryPolicy retry_policy;
	unsigned int control_timeout_ms;
	unsigned int control_retries;
	unsigned int execute_timeout_ms;
	BaseObjectMode object_mode;
	bool ping_on_start;
};

struct BLEConfig {
	unsigned int hci_device;
	unsigned int mtu;
	BaseAddressType address_type;
	unsigned int scan_timeout_ms;
	unsigned int connect_timeout_ms;
};

struct ButtonlessConfig {
	bool with_bonds;
	std::string bootloader_name;
	unsigned int reconnect_attempts;
	unsigned int reconnect_delay_ms;
};


class ConfigurationStore {

protected:
	static inline const std::array<BaseType,MAX_CONFIG_ITEMS> default_params { {
		/* DFU_PRN */ 0U,
		/* DFU_TARGET_PRN */ 0U,
		/* DFU_MAX_RETRIES */ 3U,
		/* DFU_BACKOFF_MS */ 500U,
		/* DFU_BACKOFF_FACTOR */ 2U,
		/* DFU_BACKOFF_MAX_MS */ 4000U,
		/* DFU_CONTROL_TIMEOUT_MS */ 500U,
		/* DFU_CONTROL_RETRIES */ 3U,
		/* DFU_EXECUTE_TIMEOUT_MS */ 10000U,
		/* DFU_OBJECT_MODE */ BaseObjectMode::SEGMENTED,
		/* DFU_PING_ON_START */ (bool)false,
		/* BLE_HCI_DEVICE */ 0U,
		/* BLE_MTU */ 247U,
		/* BLE_ADDRESS_TYPE */ BaseAddressType::RANDOM,
		/* BLE_SCAN_TIMEOUT_MS */ 10000U,
		/* BLE_CONNECT_TIMEOUT_MS */ 5000U,
		/* BUTTONLESS_WITH_BONDS */ (bool)false,
		/* BOOTLOADER_NAME */ "DfuTarg"s,
		/* RECONNECT_ATTEMPTS */ 3U,
		/* RECONNECT_DELAY_MS */ 1000U,
		/* LOG_LEVEL */ 3U,
	}};

	std::array<BaseType, MAX_CONFIG_ITEMS> m_params;
	virtual void serialize_config() = 0;

public:
	virtual ~ConfigurationStore() {}
	virtual void init() = 0;
	virtual bool is_valid() = 0;
	virtual void factory_reset() = 0;

	template <typename T>
	T& read_param(ParamID param_id) {
		if (!is_valid())
			throw CONFIG_STORE_CORRUPTED;
		try {
			if constexpr (std::is_same<T, BaseType>::value) {
				return m_params.at((unsigned)param_id);
			}
			else {
				return std::get<T>(m_params.at((unsigned)param_id));
			}
		} catch (std::exception&) {
			throw CONFIG_STORE_CORRUPTED;
		}
	}

	template<typename T>
	void write_param(ParamID param_id, T& value) {
		if (!is_valid())
			throw CONFIG_STORE_CORRUPTED;
		try {
			m_params.at((unsigned)param_id) = value;
		} catch (std::exception&) {
			throw CONFIG_STORE_CORRUPTED;
		}
	}

	// Applies a "<NAME|KEY>=<value>" assignment after range checking it
	void write_param(const std::string& assignment) {
		ParamValue pv = ParamDecoder::decode(assignment);
		DEBUG_TRACE("ConfigurationStore::write_param: %s", ParamEncoder::encode(pv.param, pv.value).c_str());
		write_param(pv.param, pv.value);
	}

	void save_params() {
		serialize_config();
	}

	void get_dfu_configuration(DFUConfig& dfu_config) {
		dfu_config.prn = read_param<unsigned int>(ParamID::DFU_PRN);
		dfu_config.target_prn = read_param<unsigned int>(ParamID::DFU_TARGET_PRN);
		dfu_config.retry_policy.max_retries = read_param<unsigned int>(ParamID::DFU_MAX_RETRIES);
		dfu_config.retry_policy.backoff_ms = read_param<unsigned int>(ParamID::DFU_BACKOFF_MS);
		dfu_config.retry_policy.backoff_factor = read_param<unsigned int>(ParamID::DFU_BACKOFF_FACTOR);
		dfu_config.retry_policy.backoff_max_ms = read_param<unsigned int>(ParamID::DFU_BACKOFF_MAX_MS);
		dfu_config.control_timeout_ms = read_param<unsigned int>(ParamID::DFU_CONTROL_TIMEOUT_MS);
		dfu_config.control_retries = read_param<unsigned int>(ParamID::DFU_CONTROL_RETRIES);
		dfu_config.execute_timeout_ms = read_param<unsigned int>(ParamID::DFU_EXECUTE_TIMEOUT_MS);
		dfu_config.object_mode = read_param<BaseObjectMode>(ParamID::DFU_OBJECT_MODE);
		dfu_config.ping_on_start = read_param<bool>(ParamID::DFU_PING_ON_START);
	}

	void get_ble_configuration(BLEConfig& ble_config) {
		ble_config.hci_device = read_param<unsigned int>(ParamID::BLE_HCI_DEVICE);
		ble_config.mtu = read_param<unsigned int>(ParamID::BLE_MTU);
		ble_config.address_type = read_param<BaseAddressType>(ParamID::BLE_ADDRESS_TYPE);
		ble_config.scan_timeout_ms = read_param<unsigned int>(ParamID::BLE_SCAN_TIMEOUT_MS);
		ble_config.connect_timeout_ms = read_param<unsigned int>(ParamID::BLE_CONNECT_TIMEOUT_MS);
	}

	void get_buttonless_configuration(ButtonlessConfig& buttonless_config) {
		buttonless_config.with_bonds = read_param<bool>(ParamID::BUTTONLESS_WITH_BONDS);
		buttonless_config.bootloader_name = read_param<std::string>(ParamID::BOOTLOADER_NAME);
		buttonless_config.reconnect_attempts = read_param<unsigned int>(ParamID::RECONNECT_ATTEMPTS);
		buttonless_config.reconnect_delay_ms = read_param<unsigned int>(ParamID::RECONNECT_DELAY_MS);
	}
};
