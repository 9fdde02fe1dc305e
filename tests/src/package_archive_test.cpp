#include <cstdio>
#include <cstring>
#include <string>
#include <vector>
#include <unistd.h>

#include "miniz.h"

#include "package_archive.hpp"
#include "error.hpp"

#include "CppUTest/TestHarness.h"


static std::vector<uint8_t> build_zip(const PackageMembers& members) {
	mz_zip_archive zip;
	std::memset(&zip, 0, sizeof(zip));
	mz_zip_writer_init_heap(&zip, 0, 0);

	for (auto const &it : members)
		mz_zip_writer_add_mem(&zip, it.first.c_str(), it.second.data(), it.second.size(), MZ_DEFAULT_COMPRESSION);

	void *buffer = nullptr;
	size_t size = 0;
	mz_zip_writer_finalize_heap_archive(&zip, &buffer, &size);
	std::vector<uint8_t> zip_data((uint8_t *)buffer, (uint8_t *)buffer + size);
	mz_zip_writer_end(&zip);
	mz_free(buffer);
	return zip_data;
}

static std::string to_string(const std::vector<uint8_t>& data) {
	return std::string(data.begin(), data.end());
}


TEST_GROUP(PackageArchive)
{
	PackageMembers members;

	void setup() {
		std::string manifest = R"({ "manifest": { "application": { "bin_file": "app.bin", "dat_file": "app.dat" } } })";
		members["manifest.json"] = std::vector<uint8_t>(manifest.begin(), manifest.end());
		members["app.bin"] = std::vector<uint8_t>(20000);
		for (size_t i = 0; i < members["app.bin"].size(); i++)
			members["app.bin"][i] = (uint8_t)(i * 7);
		members["app.dat"] = std::vector<uint8_t>(141, 0x5A);
	}
};


TEST(PackageArchive, ExtractsAllMembers)
{
	PackageMembers extracted = PackageArchive::extract(build_zip(members));

	CHECK_EQUAL(3U, extracted.size());
	CHECK(members["app.bin"] == extracted["app.bin"]);
	CHECK(members["app.dat"] == extracted["app.dat"]);
	STRCMP_EQUAL(to_string(members["manifest.json"]).c_str(), to_string(extracted["manifest.json"]).c_str());
}

TEST(PackageArchive, ExtractedMembersLoadAsPackage)
{
	FirmwarePackage package = PackageLoader::load(PackageArchive::extract(build_zip(members)));
	CHECK_EQUAL(1U, package.images.size());
	CHECK(members["app.bin"] == package.images[0].firmware);
}

TEST(PackageArchive, NonZipDataIsRejected)
{
	std::vector<uint8_t> junk(256, 0xAB);
	try {
		PackageArchive::extract(junk);
		FAIL("expected PACKAGE_BAD_ARCHIVE");
	} catch (ErrorCode e) {
		CHECK_EQUAL(PACKAGE_BAD_ARCHIVE, e);
	}

	CHECK_THROWS(ErrorCode, PackageArchive::extract(std::vector<uint8_t>()));
}

TEST(PackageArchive, OpenReadsPackageFile)
{
	char path[] = "/tmp/nrfdfu_package_XXXXXX";
	int fd = mkstemp(path);
	CHECK_TRUE(fd >= 0);
	std::vector<uint8_t> zip_data = build_zip(members);
	CHECK_EQUAL((ssize_t)zip_data.size(), write(fd, zip_data.data(), zip_data.size()));
	close(fd);

	PackageMembers extracted = PackageArchive::open(path);
	std::remove(path);

	CHECK(members["app.dat"] == extracted["app.dat"]);
}

TEST(PackageArchive, MissingFileIsRejected)
{
	try {
		PackageArchive::open("/tmp/nrfdfu_no_such_package.zip");
		FAIL("expected PACKAGE_FILE_NOT_FOUND");
	} catch (ErrorCode e) {
		CHECK_EQUAL(PACKAGE_FILE_NOT_FOUND, e);
	}
}
