#ifndef __CONFIG_STORE_FILE_HPP_
#define __CONFIG_STORE_FILE_HPP_

#include <cstdio>
#include <string>
#include "config_store.hpp"
#include "param_codec.hpp"
#include "debug.hpp"


// Configuration held in a host text file.  Serialization format is one entry per line:
//
// <NAME|KEY>=<value>
//
// Blank lines and lines starting with '#' are ignored.  An empty path gives a store
// that only holds defaults and run-time overrides.
class FileConfigurationStore : public ConfigurationStore {

private:
	std::string m_path;
	bool m_is_config_valid;

	static std::string trim(const std::string& s) {
		auto start = s.find_first_not_of(" \t\r\n");
		if (start == std::string::npos)
			return "";
		auto end = s.find_last_not_of(" \t\r\n");
		return s.substr(start, end - start + 1);
	}

	void deserialize_config() {
		DEBUG_TRACE("FileConfigurationStore::deserialize_config: %s", m_path.c_str());

		FILE *f = std::fopen(m_path.c_str(), "r");
		if (!f) {
			DEBUG_WARN("FileConfigurationStore: %s not found; using defaults", m_path.c_str());
			return;
		}

		char line[BASE_TEXT_MAX_LENGTH * 2];
		unsigned int line_number = 0;
		while (std::fgets(line, sizeof(line), f)) {
			line_number++;
			std::string entry = trim(line);
			if (entry.empty() || entry[0] == '#')
				continue;
			try {
				ParamValue pv = ParamDecoder::decode(entry);
				m_params.at((unsigned int)pv.param) = pv.value;
			} catch (ErrorCode e) {
				DEBUG_WARN("FileConfigurationStore: %s:%u rejected (%s)", m_path.c_str(), line_number, error_code_str(e));
			}
		}
		std::fclose(f);
	}

protected:
	void serialize_config() override {
		if (m_path.empty())
			return;

		DEBUG_TRACE("FileConfigurationStore::serialize_config: %s", m_path.c_str());

		FILE *f = std::fopen(m_path.c_str(), "w");
		if (!f) {
			DEBUG_ERROR("FileConfigurationStore: can't write %s", m_path.c_str());
			throw CONFIG_FILE_ERROR;
		}

		bool ok = true;
		for (unsigned int i = 0; i < MAX_CONFIG_ITEMS; i++) {
			if (!param_map[i].is_implemented || !param_map[i].is_writable)
				continue;
			std::string entry = ParamEncoder::encode(static_cast<ParamID>(i), m_params.at(i)) + "\n";
			if (std::fputs(entry.c_str(), f) < 0)
				ok = false;
		}

		if (std::fclose(f) != 0 || !ok)
			throw CONFIG_FILE_ERROR;
	}

public:
	FileConfigurationStore(const std::string& path = "") : m_path(path), m_is_config_valid(false) {}

	void init() override {
		m_params = default_params;
		if (!m_path.empty())
			deserialize_config();
		m_is_config_valid = true;
	}

	bool is_valid() override {
		return m_is_config_valid;
	}

	void factory_reset() override {
		m_params = default_params;
		m_is_config_valid = true;
		serialize_config();
	}

	const std::string& path() const {
		return m_path;
	}
};

#endif // __CONFIG_STORE_FILE_HPP_
