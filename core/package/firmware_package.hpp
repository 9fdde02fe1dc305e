#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "base_types.hpp"

static inline const char *image_kind_str(BaseImageKind kind) {
	switch (kind) {
	case BaseImageKind::APPLICATION: return "application";
	case BaseImageKind::SOFTDEVICE: return "softdevice";
	case BaseImageKind::BOOTLOADER: return "bootloader";
	case BaseImageKind::SOFTDEVICE_BOOTLOADER: return "softdevice_bootloader";
	default: return "unknown";
	}
}

struct Image {
	BaseImageKind        kind;
	std::vector<uint8_t> init_packet;  // Signed init command (.dat)
	std::vector<uint8_t> firmware;     // Raw image (.bin)
	std::string          dat_file;
	std::string          bin_file;
};

// Images are held in flash order; the package is immutable once loaded
struct FirmwarePackage {
	std::vector<Image> images;
	std::string        dfu_version;

	const Image *find(BaseImageKind kind) const {
		for (auto const &image : images)
			if (image.kind == kind)
				return &image;
		return nullptr;
	}

	size_t total_size() const {
		size_t total = 0;
		for (auto const &image : images)
			total += image.init_packet.size() + image.firmware.size();
		return total;
	}
};
