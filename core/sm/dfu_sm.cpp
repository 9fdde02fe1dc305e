#include <algorithm>

#include "dfu_sm.hpp"
#include "crc32.hpp"
#include "debug.hpp"

FSM_INITIAL_STATE(DFUControlPoint, DFUIdle);

using fsm_handle = DFUControlPoint;


// Feeds ObjectTransfer progress back into the state machine
class DFUTransferEvents : public TransferObserver {
public:
	void on_chunk_written(const TransferState& state, uint32_t sent_offset) override {
		DFUChunkWrittenEvent e;
		e.offset = sent_offset;
		e.total = state.total_size;
		fsm_handle::dispatch(e);
	}
	void on_checkpoint_request(const TransferState&) override {
		fsm_handle::dispatch(DFUCheckpointRequestEvent());
	}
	void on_checkpoint_result(const TransferState&, const DFUCrcResponse& reported, bool verified) override {
		DFUCheckpointResultEvent e;
		e.offset = reported.offset;
		e.crc = reported.crc;
		e.verified = verified;
		fsm_handle::dispatch(e);
	}
	void on_retry(const TransferState&, unsigned int attempt, ErrorCode cause) override {
		DFURetryEvent e;
		e.attempt = attempt;
		e.cause = cause;
		fsm_handle::dispatch(e);
	}
};

static DFUTransferEvents transfer_events;


void DFUControlPoint::configure(DFUTarget &target, ObjectTransfer &engine, unsigned int prn, uint16_t target_prn, BaseObjectMode object_mode) {
	m_target = &target;
	m_engine = &engine;
	m_prn = prn;
	m_target_prn = target_prn;
	m_object_mode = object_mode;
	m_is_prn_configured = false;
	engine.set_observer(&transfer_events);
}

void DFUControlPoint::run(const Image &image) {
	if (!m_target || !m_engine) {
		DEBUG_ERROR("DFUControlPoint: not configured");
		throw DFU_INVALID_STATE;
	}

	m_image = &image;
	m_phase = DFUObjectKind::INIT_PACKET;
	m_attempts = 0;
	m_error = DFU_INVALID_STATE;

	start();

	while (!is_in_state<DFUCompleted>() && !is_in_state<DFUError>()) {
		try {
			// Cancellation lands before the next request goes out
			if (m_engine->is_cancelled())
				throw DFU_CANCELLED;
			dispatch(DFUStepEvent());
		} catch (ErrorCode e) {
			DFUErrorEvent event;
			event.error_code = e;
			dispatch(event);
		}
	}

	if (is_in_state<DFUError>())
		throw m_error;
}

DFUObjectType DFUControlPoint::object_type() {
	return m_phase == DFUObjectKind::INIT_PACKET ? DFUObjectType::COMMAND : DFUObjectType::DATA;
}

const std::vector<uint8_t>& DFUControlPoint::blob() {
	return m_phase == DFUObjectKind::INIT_PACKET ? m_image->init_packet : m_image->firmware;
}

void DFUControlPoint::log_state(DFUStateEvent event) {
	DFUStateLogEntry entry;
	Logger::sync_datetime(entry.header);
	entry.header.log_type = LOG_DFU_STATE;
	entry.header.payload_size = sizeof(entry.event) + sizeof(entry.object_kind);
	entry.event = event;
	entry.object_kind = m_phase;
	DebugLogger::write_entry(&entry);
}

void DFUControlPoint::report_progress() {
	DFUProgressLogEntry entry;
	Logger::sync_datetime(entry.header);
	entry.header.log_type = LOG_DFU_PROGRESS;
	entry.header.payload_size = sizeof(entry.image_kind) + sizeof(entry.object_kind) + 3 * sizeof(uint32_t);
	entry.image_kind = m_image->kind;
	entry.object_kind = m_phase;
	entry.offset = m_offset;
	entry.total = static_cast<uint32_t>(blob().size());
	entry.crc32 = m_crc;
	DebugLogger::write_entry(&entry);
	if (m_progress_handler)
		m_progress_handler(entry);
}

// Transfer callbacks arriving in a state that does not expect them
void DFUControlPoint::react(DFUChunkWrittenEvent const &) {
	DEBUG_ERROR("DFUControlPoint: unexpected chunk written event");
	throw DFU_INVALID_STATE;
}

void DFUControlPoint::react(DFUCheckpointRequestEvent const &) {
	DEBUG_ERROR("DFUControlPoint: unexpected checkpoint request event");
	throw DFU_INVALID_STATE;
}

void DFUControlPoint::react(DFUCheckpointResultEvent const &) {
	DEBUG_ERROR("DFUControlPoint: unexpected checkpoint result event");
	throw DFU_INVALID_STATE;
}

void DFUControlPoint::react(DFURetryEvent const &) {
	DEBUG_ERROR("DFUControlPoint: unexpected retry event");
	throw DFU_INVALID_STATE;
}

void DFUControlPoint::react(DFUErrorEvent const &event) {
	DEBUG_ERROR("DFUControlPoint: %s", error_code_str(event.error_code));
	m_error = event.error_code;
	transit<DFUError>();
}


void DFUIdle::entry() {
	log_state(DFUStateEvent::IDLE);
}

void DFUIdle::react(DFUStepEvent const &) {
	DEBUG_INFO("DFUControlPoint: %s init %zu bytes firmware %zu bytes", image_kind_str(m_image->kind),
			m_image->init_packet.size(), m_image->firmware.size());
	transit<DFUSelecting>();
}


void DFUSelecting::entry() {
	log_state(DFUStateEvent::SELECTING);
}

void DFUSelecting::react(DFUStepEvent const &) {
	m_select = m_target->select(object_type());
	DEBUG_TRACE("DFUSelecting: max_size=%u offset=%u crc=%08x", m_select.max_size, m_select.offset, m_select.crc);

	if (m_select.max_size == 0) {
		DEBUG_ERROR("DFUSelecting: peripheral reported a zero object size");
		throw DFU_INVALID_RESPONSE;
	}

	if (m_phase == DFUObjectKind::INIT_PACKET)
		select_init_packet();
	else
		select_firmware();
}

void DFUSelecting::select_init_packet() {
	const std::vector<uint8_t>& data = blob();
	uint32_t size = static_cast<uint32_t>(data.size());

	if (size > m_select.max_size) {
		DEBUG_ERROR("DFUSelecting: init packet %u bytes exceeds object size %u", size, m_select.max_size);
		throw DFU_OBJECT_TOO_LARGE;
	}

	m_object_start = 0;
	m_object_end = size;

	if (m_select.offset == 0 || m_select.offset > size ||
		CRC32::update(0, data.data(), m_select.offset) != m_select.crc) {
		transit<DFUCreating>();
		return;
	}

	DEBUG_INFO("DFUSelecting: resuming init packet at offset %u", m_select.offset);
	m_offset = m_select.offset;
	m_crc = m_select.crc;
	transit<DFUStreaming>();
}

void DFUSelecting::select_firmware() {
	const std::vector<uint8_t>& data = blob();
	uint32_t size = static_cast<uint32_t>(data.size());
	uint32_t offset = m_select.offset;

	if (offset == 0 || offset > size) {
		m_object_start = 0;
		m_object_end = (m_object_mode == BaseObjectMode::SEGMENTED) ? std::min(m_select.max_size, size) : size;
		transit<DFUCreating>();
		return;
	}

	bool is_crc_verified = CRC32::update(0, data.data(), offset) == m_select.crc;

	if (m_object_mode == BaseObjectMode::SINGLE) {
		m_object_start = 0;
		m_object_end = size;
		if (!is_crc_verified) {
			transit<DFUCreating>();
			return;
		}
		DEBUG_INFO("DFUSelecting: resuming firmware at offset %u", offset);
		m_offset = offset;
		m_crc = m_select.crc;
		transit<DFUStreaming>();
		return;
	}

	uint32_t remainder = offset % m_select.max_size;

	if (!is_crc_verified) {
		// Drop the object holding the corrupted data and recreate it
		offset -= (remainder == 0) ? m_select.max_size : remainder;
		DEBUG_WARN("DFUSelecting: firmware crc mismatch, restarting object at offset %u", offset);
		m_object_start = offset;
		m_object_end = std::min(offset + m_select.max_size, size);
		transit<DFUCreating>();
		return;
	}

	m_offset = offset;
	m_crc = m_select.crc;

	if (remainder != 0) {
		DEBUG_INFO("DFUSelecting: resuming firmware object at offset %u", offset);
		m_object_start = offset - remainder;
		m_object_end = std::min(m_object_start + m_select.max_size, size);
		transit<DFUStreaming>();
	} else {
		// Last object is complete but may not have been executed
		DEBUG_INFO("DFUSelecting: firmware object complete at offset %u", offset);
		m_object_start = offset - m_select.max_size;
		m_object_end = offset;
		transit<DFUExecuting>();
	}
}


void DFUCreating::entry() {
	log_state(DFUStateEvent::CREATING);
}

void DFUCreating::react(DFUStepEvent const &) {
	const std::vector<uint8_t>& data = blob();
	m_target->create(object_type(), m_object_end - m_object_start);
	m_offset = m_object_start;
	m_crc = CRC32::update(0, data.data(), m_object_start);
	transit<DFUStreaming>();
}


void DFUStreaming::entry() {
	log_state(DFUStateEvent::STREAMING);
}

void DFUStreaming::react(DFUStepEvent const &) {
	if (!m_is_prn_configured) {
		m_target->set_prn(m_target_prn);
		m_is_prn_configured = true;
	}

	try {
		TransferState state = m_engine->transfer(object_type(), blob(), m_select.max_size, m_prn, m_offset, m_crc, m_object_end);
		m_offset = state.offset;
		m_crc = state.crc;
		transit<DFUExecuting>();
	} catch (ErrorCode e) {
		if (e != DFU_CRC_MISMATCH)
			throw;
		m_attempts++;
		if (m_engine->retry_policy().exhausted(m_attempts)) {
			DEBUG_ERROR("DFUStreaming: object could not be verified after %u attempts", m_attempts);
			throw DFU_TRANSFER_ABORTED;
		}
		DEBUG_WARN("DFUStreaming: object integrity lost, selecting again (%u)", m_attempts);
		transit<DFUSelecting>();
	}
}

void DFUStreaming::react(DFUChunkWrittenEvent const &event) {
	DEBUG_TRACE("DFUStreaming: %u/%u", event.offset, event.total);
}

void DFUStreaming::react(DFUCheckpointRequestEvent const &) {
	transit<DFUCrcChecking>();
}

void DFUStreaming::react(DFURetryEvent const &) {
	transit<DFURetrying>();
}


void DFUCrcChecking::entry() {
	log_state(DFUStateEvent::CRC_CHECKING);
}

void DFUCrcChecking::react(DFUCheckpointResultEvent const &event) {
	if (!event.verified) {
		DEBUG_WARN("DFUCrcChecking: peripheral at %u/%08x", event.offset, event.crc);
		return;
	}
	m_offset = event.offset;
	m_crc = event.crc;
	report_progress();
	transit<DFUStreaming>();
}

void DFUCrcChecking::react(DFURetryEvent const &) {
	transit<DFURetrying>();
}


void DFURetrying::entry() {
	log_state(DFUStateEvent::RETRYING);
}

void DFURetrying::react(DFUChunkWrittenEvent const &) {
	transit<DFUStreaming>();
}

void DFURetrying::react(DFUCheckpointRequestEvent const &) {
	transit<DFUCrcChecking>();
}

void DFURetrying::react(DFURetryEvent const &event) {
	DEBUG_WARN("DFURetrying: retry %u after %s", event.attempt, error_code_str(event.cause));
}


void DFUExecuting::entry() {
	log_state(DFUStateEvent::EXECUTING);
}

void DFUExecuting::react(DFUStepEvent const &) {
	m_target->execute();
	m_attempts = 0;
	report_progress();

	if (m_phase == DFUObjectKind::INIT_PACKET) {
		m_phase = DFUObjectKind::FIRMWARE;
		transit<DFUSelecting>();
		return;
	}

	uint32_t size = static_cast<uint32_t>(blob().size());
	if (m_object_mode == BaseObjectMode::SEGMENTED && m_object_end < size) {
		m_object_start = m_object_end;
		m_object_end = std::min(m_object_start + m_select.max_size, size);
		transit<DFUCreating>();
		return;
	}

	transit<DFUCompleted>();
}


void DFUCompleted::entry() {
	DEBUG_INFO("DFUControlPoint: %s complete", image_kind_str(m_image->kind));
	log_state(DFUStateEvent::COMPLETED);
}


void DFUError::entry() {
	log_state(DFUStateEvent::ERROR);
}
