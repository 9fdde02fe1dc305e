#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "package_loader.hpp"

// Reads the members of a DFU package .zip file
class PackageArchive {
public:
	static std::vector<uint8_t> read_file(const std::string& path);
	static PackageMembers extract(const std::vector<uint8_t>& zip_data);

	static PackageMembers open(const std::string& path) {
		return extract(read_file(path));
	}
};
