#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "config_store.hpp"
#include "dfu_transport.hpp"
#include "dfu_target.hpp"
#include "object_transfer.hpp"
#include "firmware_package.hpp"
#include "dfu_sm.hpp"

enum class DFUMode {
	APPLICATION,
	SOFTDEVICE,
	BOOTLOADER,
	SOFTDEVICE_BOOTLOADER
};

static inline const char *dfu_mode_str(DFUMode mode) {
	switch (mode) {
	case DFUMode::APPLICATION: return "app";
	case DFUMode::SOFTDEVICE: return "sd";
	case DFUMode::BOOTLOADER: return "bl";
	case DFUMode::SOFTDEVICE_BOOTLOADER: return "sdbl";
	default: return "unknown";
	}
}

static inline bool dfu_mode_from_str(const std::string& text, DFUMode& mode) {
	for (auto m : { DFUMode::APPLICATION, DFUMode::SOFTDEVICE, DFUMode::BOOTLOADER, DFUMode::SOFTDEVICE_BOOTLOADER }) {
		if (text == dfu_mode_str(m)) {
			mode = m;
			return true;
		}
	}
	return false;
}

// Runs the images of a package selected by mode through the control point state machine,
// one at a time, over a connected transport
class DFUSession {
private:
	DFUTransport &m_transport;
	DFUConfig m_config;
	DFUTarget m_target;
	ObjectTransfer m_engine;
	DFUProgressHandler m_progress_handler;
	size_t m_total_bytes;
	size_t m_completed_bytes;
	uint64_t m_start_time;
	uint64_t m_end_time;

	void on_progress(const DFUProgressLogEntry& entry);
	void log_result(DFUResultEvent event, int error_code);

public:
	DFUSession(DFUTransport &transport, const DFUConfig &config);

	// Images matching the mode in flash order; throws DFU_NO_MATCHING_IMAGE when there are none
	static std::vector<const Image *> select_images(DFUMode mode, const FirmwarePackage &package);

	void run(DFUMode mode, const FirmwarePackage &package);

	// Safe to call from a signal handler
	void cancel() { m_engine.cancel(); }
	bool is_cancelled() { return m_engine.is_cancelled(); }

	void set_progress_handler(DFUProgressHandler handler) { m_progress_handler = handler; }
	DFUResultCode target_result() { return m_target.last_result(); }
	DFUExtError target_ext_error() { return m_target.last_ext_error(); }
	uint64_t elapsed_ms() { return m_end_time - m_start_time; }
};
