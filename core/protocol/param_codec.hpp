#pragma once

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <string>

#include "base_types.hpp"
#include "dfu_params.hpp"
#include "error.hpp"
#include "debug.hpp"

// Text form of configuration parameters as used by configuration files and the
// command line i.e., "<NAME|KEY>=<value>"
class ParamEncoder {
public:
	static std::string encode(const unsigned int& value) {
		return std::to_string(value);
	}
	static std::string encode(const int& value) {
		return std::to_string(value);
	}
	static std::string encode(const double& value) {
		char buff[32];
		snprintf(buff, sizeof(buff), "%g", value);
		return std::string(buff);
	}
	static std::string encode(const bool& value) {
		return value ? "1" : "0";
	}
	static std::string encode(const std::string& value) {
		return value;
	}
	static std::string encode(const BaseObjectMode& value) {
		return value == BaseObjectMode::SEGMENTED ? "SEGMENTED" : "SINGLE";
	}
	static std::string encode(const BaseAddressType& value) {
		return value == BaseAddressType::PUBLIC ? "PUBLIC" : "RANDOM";
	}
	static std::string encode(const BaseType& value) {
		return std::visit([](auto&& arg) -> std::string { return encode(arg); }, value);
	}
	static std::string encode(ParamID param_id, const BaseType& value) {
		return param_map[(unsigned int)param_id].name + "=" + encode(value);
	}
};

class ParamDecoder {
private:
	static void validate(const BaseMap &arg_map, const unsigned int& value) {
		const auto min_value = std::get<unsigned int>(arg_map.min_value);
		const auto max_value = std::get<unsigned int>(arg_map.max_value);
		if ((min_value != 0 || max_value != 0) &&
			(value < min_value || value > max_value)) {
			DEBUG_ERROR("parameter \"%s\" (%u) value out of min/max range (%u/%u)", arg_map.name.c_str(), value, min_value, max_value);
			throw CONFIG_VALUE_OUT_OF_RANGE;
		}
		if (!arg_map.permitted_values.empty() &&
			std::find_if(arg_map.permitted_values.begin(), arg_map.permitted_values.end(), [value](const BaseConstraint x){
				return std::get<unsigned int>(x) == value;
			}) == arg_map.permitted_values.end()) {
			DEBUG_ERROR("parameter \"%s\" not in permitted list", arg_map.name.c_str());
			throw CONFIG_VALUE_OUT_OF_RANGE;
		}
	}

	static void validate(const BaseMap &arg_map, const int& value) {
		const auto min_value = std::get<int>(arg_map.min_value);
		const auto max_value = std::get<int>(arg_map.max_value);
		if ((min_value != 0 || max_value != 0) &&
			(value < min_value || value > max_value)) {
			DEBUG_ERROR("parameter \"%s\" (%d) value out of min/max range (%d/%d)", arg_map.name.c_str(), value, min_value, max_value);
			throw CONFIG_VALUE_OUT_OF_RANGE;
		}
	}

	static void validate(const BaseMap &arg_map, const std::string& value) {
		if (value.length() > BASE_TEXT_MAX_LENGTH) {
			DEBUG_ERROR("parameter \"%s\" string length %u is out of bounds", arg_map.name.c_str(), (unsigned int)value.length());
			throw CONFIG_VALUE_OUT_OF_RANGE;
		}
	}

	static unsigned int decode_uint(const std::string& s) {
		if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos) {
			DEBUG_ERROR("CONFIG_VALUE_OUT_OF_RANGE in %s(%s)", __FUNCTION__, s.c_str());
			throw CONFIG_VALUE_OUT_OF_RANGE;
		}
		unsigned long value = std::strtoul(s.c_str(), nullptr, 10);
		if (value > 0xFFFFFFFFUL)
			throw CONFIG_VALUE_OUT_OF_RANGE;
		return static_cast<unsigned int>(value);
	}

	static int decode_int(const std::string& s) {
		char *end = nullptr;
		long value = std::strtol(s.c_str(), &end, 10);
		if (s.empty() || *end != '\0') {
			DEBUG_ERROR("CONFIG_VALUE_OUT_OF_RANGE in %s(%s)", __FUNCTION__, s.c_str());
			throw CONFIG_VALUE_OUT_OF_RANGE;
		}
		return static_cast<int>(value);
	}

	static bool decode_bool(const std::string& s) {
		if (s == "1" || s == "true" || s == "TRUE") {
			return true;
		} else if (s == "0" || s == "false" || s == "FALSE") {
			return false;
		} else {
			DEBUG_ERROR("CONFIG_VALUE_OUT_OF_RANGE in %s(%s)", __FUNCTION__, s.c_str());
			throw CONFIG_VALUE_OUT_OF_RANGE;
		}
	}

	static BaseObjectMode decode_object_mode(const std::string& s) {
		if (s == "0" || s == "SINGLE") {
			return BaseObjectMode::SINGLE;
		} else if (s == "1" || s == "SEGMENTED") {
			return BaseObjectMode::SEGMENTED;
		} else {
			DEBUG_ERROR("CONFIG_VALUE_OUT_OF_RANGE in %s(%s)", __FUNCTION__, s.c_str());
			throw CONFIG_VALUE_OUT_OF_RANGE;
		}
	}

	static BaseAddressType decode_address_type(const std::string& s) {
		if (s == "0" || s == "PUBLIC") {
			return BaseAddressType::PUBLIC;
		} else if (s == "1" || s == "RANDOM") {
			return BaseAddressType::RANDOM;
		} else {
			DEBUG_ERROR("CONFIG_VALUE_OUT_OF_RANGE in %s(%s)", __FUNCTION__, s.c_str());
			throw CONFIG_VALUE_OUT_OF_RANGE;
		}
	}

public:
	// Accepts either the parameter name or its 5 character key
	static ParamID lookup(const std::string& name_or_key) {
		for (unsigned int i = 0; i < param_map_size; i++) {
			if (param_map[i].key == name_or_key || param_map[i].name == name_or_key)
				return static_cast<ParamID>(i);
		}
		DEBUG_ERROR("CONFIG_UNKNOWN_PARAM, \"%s\"", name_or_key.c_str());
		throw CONFIG_UNKNOWN_PARAM;
	}

	static BaseType decode(ParamID param_id, const std::string& s) {
		const BaseMap& arg_map = param_map[(unsigned int)param_id];

		switch (arg_map.encoding) {
		case BaseEncoding::UINT:
		{
			unsigned int value = decode_uint(s);
			validate(arg_map, value);
			return value;
		}
		case BaseEncoding::DECIMAL:
		{
			int value = decode_int(s);
			validate(arg_map, value);
			return value;
		}
		case BaseEncoding::TEXT:
			validate(arg_map, s);
			return s;
		case BaseEncoding::BOOLEAN:
			return decode_bool(s);
		case BaseEncoding::OBJECTMODE:
			return decode_object_mode(s);
		case BaseEncoding::ADDRESSTYPE:
			return decode_address_type(s);
		default:
			throw CONFIG_VALUE_OUT_OF_RANGE;
		}
	}

	// Decodes a "<NAME|KEY>=<value>" assignment
	static ParamValue decode(const std::string& assignment) {
		auto pos = assignment.find('=');
		if (pos == std::string::npos || pos == 0) {
			DEBUG_ERROR("ParamDecoder: malformed assignment \"%s\"", assignment.c_str());
			throw CONFIG_VALUE_OUT_OF_RANGE;
		}
		ParamValue pv;
		pv.param = lookup(assignment.substr(0, pos));
		if (!param_map[(unsigned int)pv.param].is_writable)
			throw CONFIG_VALUE_OUT_OF_RANGE;
		pv.value = decode(pv.param, assignment.substr(pos + 1));
		return pv;
	}
};
