#include "dfu_session.hpp"
#include "platform.hpp"
#include "debug.hpp"


static BaseImageKind image_kind_for_mode(DFUMode mode) {
	switch (mode) {
	case DFUMode::SOFTDEVICE: return BaseImageKind::SOFTDEVICE;
	case DFUMode::BOOTLOADER: return BaseImageKind::BOOTLOADER;
	case DFUMode::SOFTDEVICE_BOOTLOADER: return BaseImageKind::SOFTDEVICE_BOOTLOADER;
	case DFUMode::APPLICATION:
	default:
		return BaseImageKind::APPLICATION;
	}
}

DFUSession::DFUSession(DFUTransport &transport, const DFUConfig &config) :
	m_transport(transport),
	m_config(config),
	m_target(transport, config.control_timeout_ms, config.control_retries, config.execute_timeout_ms),
	m_engine(transport, m_target, config.retry_policy),
	m_total_bytes(0),
	m_completed_bytes(0),
	m_start_time(0),
	m_end_time(0) {
}

std::vector<const Image *> DFUSession::select_images(DFUMode mode, const FirmwarePackage &package) {
	std::vector<const Image *> images;
	BaseImageKind kind = image_kind_for_mode(mode);

	for (auto const &image : package.images)
		if (image.kind == kind)
			images.push_back(&image);

	if (images.empty()) {
		DEBUG_ERROR("DFUSession: package has no %s image for mode %s", image_kind_str(kind), dfu_mode_str(mode));
		throw DFU_NO_MATCHING_IMAGE;
	}

	return images;
}

void DFUSession::on_progress(const DFUProgressLogEntry& entry) {
	if (entry.object_kind == DFUObjectKind::FIRMWARE && m_total_bytes) {
		size_t done = m_completed_bytes + entry.offset;
		DEBUG_INFO("DFUSession: %s %u%% (%zu/%zu bytes)", image_kind_str(entry.image_kind),
				(unsigned int)((done * 100) / m_total_bytes), done, m_total_bytes);
	}
	if (m_progress_handler)
		m_progress_handler(entry);
}

void DFUSession::log_result(DFUResultEvent event, int error_code) {
	DFUResultLogEntry entry;
	Logger::sync_datetime(entry.header);
	entry.header.log_type = LOG_DFU_RESULT;
	entry.header.payload_size = sizeof(entry.event) + sizeof(entry.error_code) + sizeof(entry.target_result) + sizeof(entry.target_ext_error);
	entry.event = event;
	entry.error_code = error_code;
	entry.target_result = static_cast<uint8_t>(m_target.last_result());
	entry.target_ext_error = static_cast<uint8_t>(m_target.last_ext_error());
	DebugLogger::write_entry(&entry);
}

void DFUSession::run(DFUMode mode, const FirmwarePackage &package) {

	// Nothing is sent unless the package can satisfy the mode
	std::vector<const Image *> images = select_images(mode, package);

	m_total_bytes = 0;
	m_completed_bytes = 0;
	for (auto image : images)
		m_total_bytes += image->firmware.size();

	m_start_time = Platform::uptime_ms();
	m_end_time = m_start_time;

	DFUControlPoint::configure(m_target, m_engine, m_config.prn, static_cast<uint16_t>(m_config.target_prn), m_config.object_mode);
	DFUControlPoint::set_progress_handler([this](const DFUProgressLogEntry& entry) { on_progress(entry); });
	DFUControlPoint::begin_session();

	try {
		m_transport.subscribe(DFUCharacteristic::CONTROL_POINT);

		if (m_config.ping_on_start)
			m_target.ping(1);

		for (auto image : images) {
			if (m_engine.is_cancelled())
				throw DFU_CANCELLED;
			DEBUG_INFO("DFUSession: sending %s", image_kind_str(image->kind));
			DFUControlPoint::run(*image);
			m_completed_bytes += image->firmware.size();
		}
	} catch (ErrorCode e) {
		m_end_time = Platform::uptime_ms();
		DFUControlPoint::set_progress_handler(nullptr);

		if (e == DFU_CANCELLED) {
			if (m_transport.is_connected()) {
				try {
					m_target.abort();
				} catch (ErrorCode abort_error) {
					DEBUG_WARN("DFUSession: abort failed: %s", error_code_str(abort_error));
				}
			}
			log_result(DFUResultEvent::ABORT, e);
		} else {
			log_result(DFUResultEvent::FAIL, e);
		}
		throw;
	}

	m_end_time = Platform::uptime_ms();
	DFUControlPoint::set_progress_handler(nullptr);
	DEBUG_INFO("DFUSession: %s update complete in %llu ms", dfu_mode_str(mode), (unsigned long long)(m_end_time - m_start_time));
	log_result(DFUResultEvent::SUCCESS, 0);
}
