#include <cstdio>
#include <cstring>

#include "miniz.h"

#include "package_archive.hpp"
#include "error.hpp"
#include "debug.hpp"


std::vector<uint8_t> PackageArchive::read_file(const std::string& path) {
	FILE *f = std::fopen(path.c_str(), "rb");
	if (!f) {
		DEBUG_ERROR("PackageArchive: can't open %s", path.c_str());
		throw PACKAGE_FILE_NOT_FOUND;
	}

	std::vector<uint8_t> data;
	uint8_t buffer[4096];
	size_t n;
	while ((n = std::fread(buffer, 1, sizeof(buffer), f)) > 0)
		data.insert(data.end(), buffer, buffer + n);

	bool failed = std::ferror(f) != 0;
	std::fclose(f);
	if (failed) {
		DEBUG_ERROR("PackageArchive: read error on %s", path.c_str());
		throw PACKAGE_BAD_ARCHIVE;
	}

	DEBUG_TRACE("PackageArchive::read_file: %s is %zu bytes", path.c_str(), data.size());
	return data;
}

PackageMembers PackageArchive::extract(const std::vector<uint8_t>& zip_data) {
	mz_zip_archive zip;
	std::memset(&zip, 0, sizeof(zip));

	if (zip_data.empty() || !mz_zip_reader_init_mem(&zip, zip_data.data(), zip_data.size(), 0)) {
		DEBUG_ERROR("PackageArchive: not a zip archive");
		throw PACKAGE_BAD_ARCHIVE;
	}

	PackageMembers members;
	mz_uint num_files = mz_zip_reader_get_num_files(&zip);

	for (mz_uint i = 0; i < num_files; i++) {
		mz_zip_archive_file_stat stat;
		if (!mz_zip_reader_file_stat(&zip, i, &stat)) {
			mz_zip_reader_end(&zip);
			throw PACKAGE_BAD_ARCHIVE;
		}

		if (mz_zip_reader_is_file_a_directory(&zip, i))
			continue;

		std::vector<uint8_t> data(static_cast<size_t>(stat.m_uncomp_size));
		if (!data.empty() && !mz_zip_reader_extract_to_mem(&zip, i, data.data(), data.size(), 0)) {
			DEBUG_ERROR("PackageArchive: failed to extract %s", stat.m_filename);
			mz_zip_reader_end(&zip);
			throw PACKAGE_BAD_ARCHIVE;
		}

		DEBUG_TRACE("PackageArchive::extract: %s (%zu bytes)", stat.m_filename, data.size());
		members.emplace(std::string(stat.m_filename), std::move(data));
	}

	mz_zip_reader_end(&zip);
	return members;
}
