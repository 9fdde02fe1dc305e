#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <memory>

#include "cJSON.h"

#include "package_loader.hpp"
#include "error.hpp"
#include "debug.hpp"

using JSONHandle = std::unique_ptr<cJSON, decltype(&cJSON_Delete)>;


bool PackageLoader::lookup_kind(const std::string& key, BaseImageKind& kind) {
	if (key == "application")
		kind = BaseImageKind::APPLICATION;
	else if (key == "softdevice")
		kind = BaseImageKind::SOFTDEVICE;
	else if (key == "bootloader")
		kind = BaseImageKind::BOOTLOADER;
	else if (key == "softdevice_bootloader")
		kind = BaseImageKind::SOFTDEVICE_BOOTLOADER;
	else
		return false;
	return true;
}

// SoftDevice and bootloader must be in place before the application that depends on them
unsigned int PackageLoader::flash_order(BaseImageKind kind) {
	switch (kind) {
	case BaseImageKind::SOFTDEVICE_BOOTLOADER: return 0;
	case BaseImageKind::SOFTDEVICE: return 1;
	case BaseImageKind::BOOTLOADER: return 2;
	case BaseImageKind::APPLICATION:
	default:
		return 3;
	}
}

const std::vector<uint8_t>& PackageLoader::member(const PackageMembers& members, const std::string& name) {
	auto it = members.find(name);
	if (it == members.end()) {
		DEBUG_ERROR("PackageLoader: missing member \"%s\"", name.c_str());
		throw PACKAGE_MISSING_MEMBER;
	}
	return it->second;
}

static std::string read_string(const cJSON *object, const char *name) {
	const cJSON *item = cJSON_GetObjectItemCaseSensitive(object, name);
	if (!cJSON_IsString(item) || item->valuestring == nullptr || *item->valuestring == '\0') {
		DEBUG_ERROR("PackageLoader: \"%s\" missing from manifest entry", name);
		throw PACKAGE_MALFORMED_MANIFEST;
	}
	return std::string(item->valuestring);
}

// Returns true if the metadata declares the size; a non-numeric value is malformed
static bool read_size(const cJSON *metadata, const char *name, size_t& size) {
	const cJSON *item = cJSON_GetObjectItemCaseSensitive(metadata, name);
	if (item == nullptr)
		return false;
	// Sizes are whole numbers that fit the 32 bit fields of the object protocol
	if (!cJSON_IsNumber(item) || item->valuedouble < 0 || item->valuedouble > UINT32_MAX ||
		std::floor(item->valuedouble) != item->valuedouble) {
		DEBUG_ERROR("PackageLoader: \"%s\" is not a size", name);
		throw PACKAGE_MALFORMED_MANIFEST;
	}
	size = static_cast<size_t>(item->valuedouble);
	return true;
}

FirmwarePackage PackageLoader::load(const PackageMembers& members) {
	auto const &manifest_bytes = member(members, MANIFEST_NAME);

	JSONHandle root(cJSON_ParseWithLength(reinterpret_cast<const char *>(manifest_bytes.data()), manifest_bytes.size()), &cJSON_Delete);
	if (!root || !cJSON_IsObject(root.get())) {
		DEBUG_ERROR("PackageLoader: manifest is not valid JSON");
		throw PACKAGE_MALFORMED_MANIFEST;
	}

	const cJSON *manifest = cJSON_GetObjectItemCaseSensitive(root.get(), "manifest");
	if (!cJSON_IsObject(manifest)) {
		DEBUG_ERROR("PackageLoader: no \"manifest\" object");
		throw PACKAGE_MALFORMED_MANIFEST;
	}

	FirmwarePackage package;
	const cJSON *entry = nullptr;
	cJSON_ArrayForEach(entry, manifest) {
		std::string key(entry->string ? entry->string : "");

		// Scalars such as "dfu_version" describe the package rather than an image
		if (!cJSON_IsObject(entry)) {
			if (key == "dfu_version" && cJSON_IsNumber(entry)) {
				char version[16];
				snprintf(version, sizeof(version), "%g", entry->valuedouble);
				package.dfu_version = version;
			}
			continue;
		}

		Image image;
		if (!lookup_kind(key, image.kind)) {
			DEBUG_ERROR("PackageLoader: unsupported image kind \"%s\"", key.c_str());
			throw PACKAGE_UNSUPPORTED_IMAGE_KIND;
		}

		if (package.find(image.kind)) {
			DEBUG_ERROR("PackageLoader: duplicate image kind \"%s\"", key.c_str());
			throw PACKAGE_MALFORMED_MANIFEST;
		}

		image.bin_file = read_string(entry, "bin_file");
		image.dat_file = read_string(entry, "dat_file");
		image.firmware = member(members, image.bin_file);
		image.init_packet = member(members, image.dat_file);

		if (image.firmware.empty() || image.init_packet.empty()) {
			DEBUG_ERROR("PackageLoader: %s has an empty member", key.c_str());
			throw PACKAGE_SIZE_MISMATCH;
		}

		const cJSON *metadata = cJSON_GetObjectItemCaseSensitive(entry, "info_read_only_metadata");
		if (cJSON_IsObject(metadata)) {
			size_t sd_size = 0, bl_size = 0, app_size = 0;
			bool has_sd = read_size(metadata, "sd_size", sd_size);
			bool has_bl = read_size(metadata, "bl_size", bl_size);
			bool has_app = read_size(metadata, "app_size", app_size);
			size_t declared = 0;
			bool is_declared = false;

			switch (image.kind) {
			case BaseImageKind::SOFTDEVICE_BOOTLOADER:
				is_declared = has_sd || has_bl;
				declared = sd_size + bl_size;
				break;
			case BaseImageKind::SOFTDEVICE:
				is_declared = has_sd;
				declared = sd_size;
				break;
			case BaseImageKind::BOOTLOADER:
				is_declared = has_bl;
				declared = bl_size;
				break;
			case BaseImageKind::APPLICATION:
				is_declared = has_app;
				declared = app_size;
				break;
			}

			if (is_declared && declared != image.firmware.size()) {
				DEBUG_ERROR("PackageLoader: %s declares %zu bytes but %s has %zu",
						key.c_str(), declared, image.bin_file.c_str(), image.firmware.size());
				throw PACKAGE_SIZE_MISMATCH;
			}
		}

		DEBUG_TRACE("PackageLoader: %s init=%zu firmware=%zu", key.c_str(), image.init_packet.size(), image.firmware.size());
		package.images.push_back(std::move(image));
	}

	if (package.images.empty()) {
		DEBUG_ERROR("PackageLoader: manifest declares no images");
		throw PACKAGE_MALFORMED_MANIFEST;
	}

	std::stable_sort(package.images.begin(), package.images.end(), [](const Image& a, const Image& b) {
		return flash_order(a.kind) < flash_order(b.kind);
	});

	return package;
}
