#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "firmware_package.hpp"

using PackageMembers = std::map<std::string, std::vector<uint8_t>>;

// Builds a FirmwarePackage from the raw members of an nrfutil DFU package.  The
// members must include "manifest.json":
//
// { "manifest": { "<kind>": { "bin_file": "...", "dat_file": "...",
//                             "info_read_only_metadata": { "sd_size": n, "bl_size": n, "app_size": n } } } }
class PackageLoader {
public:
	static inline const char *MANIFEST_NAME = "manifest.json";

	static FirmwarePackage load(const PackageMembers& members);

private:
	static bool lookup_kind(const std::string& key, BaseImageKind& kind);
	static unsigned int flash_order(BaseImageKind kind);
	static const std::vector<uint8_t>& member(const PackageMembers& members, const std::string& name);
};
