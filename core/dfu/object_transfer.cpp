#include <algorithm>

#include "object_transfer.hpp"
#include "crc32.hpp"
#include "platform.hpp"
#include "debug.hpp"


ObjectTransfer::ObjectTransfer(DFUTransport &transport, DFUTarget &target, const RetryPolicy& retry_policy) :
	m_transport(transport),
	m_target(target),
	m_retry_policy(retry_policy),
	m_observer(nullptr),
	m_cancelled(false),
	m_state() {
}

void ObjectTransfer::check_cancelled() {
	if (m_cancelled) {
		DEBUG_WARN("ObjectTransfer: cancelled at offset %u", m_state.offset);
		throw DFU_CANCELLED;
	}
}

// Moves the confirmed state to the point the peripheral reports, provided the
// peripheral's CRC agrees with our data up to that point
void ObjectTransfer::rewind(const std::vector<uint8_t>& data, const DFUCrcResponse& reported) {
	if (reported.offset > m_state.total_size) {
		DEBUG_ERROR("ObjectTransfer: reported offset %u is beyond object end %u", reported.offset, m_state.total_size);
		throw DFU_CRC_MISMATCH;
	}

	uint32_t expected_crc = CRC32::update(0, data.data(), reported.offset);
	if (expected_crc != reported.crc) {
		DEBUG_ERROR("ObjectTransfer: reported crc %08x at offset %u does not match data (%08x)",
				reported.crc, reported.offset, expected_crc);
		throw DFU_CRC_MISMATCH;
	}

	DEBUG_INFO("ObjectTransfer: resuming from verified offset %u", reported.offset);
	m_state.offset = reported.offset;
	m_state.crc = reported.crc;
}

TransferState ObjectTransfer::transfer(DFUObjectType type, const std::vector<uint8_t>& data, uint32_t max_object_size,
		unsigned int prn, uint32_t offset, uint32_t crc) {
	return transfer(type, data, max_object_size, prn, offset, crc, static_cast<uint32_t>(data.size()));
}

TransferState ObjectTransfer::transfer(DFUObjectType type, const std::vector<uint8_t>& data, uint32_t max_object_size,
		unsigned int prn, uint32_t offset, uint32_t crc, uint32_t end) {

	if (max_object_size == 0) {
		DEBUG_ERROR("ObjectTransfer: peripheral reported a zero object size");
		throw DFU_INVALID_RESPONSE;
	}

	if (end > data.size() || offset > end) {
		DEBUG_ERROR("ObjectTransfer: bad object range %u..%u of %zu", offset, end, data.size());
		throw DFU_INVALID_STATE;
	}

	m_state.total_size = end;
	m_state.offset = offset;
	m_state.max_object_size = max_object_size;
	m_state.prn = prn;
	m_state.crc = crc;

	DEBUG_TRACE("ObjectTransfer::transfer: type=%u offset=%u end=%u max_size=%u prn=%u",
			(unsigned int)type, offset, end, max_object_size, prn);

	uint32_t sent_offset = offset;
	uint32_t sent_crc = crc;
	unsigned int window = 0;
	unsigned int failures = 0;
	bool is_reconcile_required = false;

	while (m_state.offset < end || is_reconcile_required) {
		try {
			if (is_reconcile_required) {
				// The link failed so where the peripheral got to is unknown
				is_reconcile_required = false;
				if (m_observer)
					m_observer->on_checkpoint_request(m_state);
				DFUCrcResponse reported = m_target.get_crc();
				rewind(data, reported);
				if (m_observer)
					m_observer->on_checkpoint_result(m_state, reported, true);
				sent_offset = m_state.offset;
				sent_crc = m_state.crc;
				window = 0;
				continue;
			}

			while (sent_offset < end) {
				check_cancelled();
				uint32_t length = std::min(max_object_size, end - sent_offset);
				std::vector<uint8_t> chunk(data.begin() + sent_offset, data.begin() + sent_offset + length);
				m_transport.write(DFUCharacteristic::DATA_POINT, chunk, false);
				sent_crc = CRC32::update(sent_crc, chunk.data(), chunk.size());
				sent_offset += length;
				window++;
				if (m_observer)
					m_observer->on_chunk_written(m_state, sent_offset);
				if (prn == 0 || window >= prn)
					break;
			}

			if (m_observer)
				m_observer->on_checkpoint_request(m_state);
			DFUCrcResponse reported = m_target.get_crc(sent_offset);

			if (reported.offset == sent_offset && reported.crc == sent_crc) {
				m_state.offset = sent_offset;
				m_state.crc = sent_crc;
				window = 0;
				failures = 0;
				if (m_observer)
					m_observer->on_checkpoint_result(m_state, reported, true);
				continue;
			}

			DEBUG_WARN("ObjectTransfer: checkpoint mismatch sent=%u/%08x reported=%u/%08x",
					sent_offset, sent_crc, reported.offset, reported.crc);
			if (m_observer)
				m_observer->on_checkpoint_result(m_state, reported, false);

			failures++;
			if (m_retry_policy.exhausted(failures)) {
				DEBUG_ERROR("ObjectTransfer: retries exhausted at offset %u", m_state.offset);
				throw DFU_TRANSFER_ABORTED;
			}
			if (m_observer)
				m_observer->on_retry(m_state, failures, DFU_CRC_MISMATCH);

			rewind(data, reported);
			sent_offset = m_state.offset;
			sent_crc = m_state.crc;
			window = 0;

		} catch (ErrorCode e) {
			if (!is_transient_error(e))
				throw;

			failures++;
			if (m_retry_policy.exhausted(failures)) {
				DEBUG_ERROR("ObjectTransfer: retries exhausted at offset %u (%s)", m_state.offset, error_code_str(e));
				throw DFU_TRANSFER_ABORTED;
			}

			DEBUG_WARN("ObjectTransfer: %s at offset %u, retry %u/%u", error_code_str(e), sent_offset, failures, m_retry_policy.max_retries);
			if (m_observer)
				m_observer->on_retry(m_state, failures, e);

			unsigned int delay = m_retry_policy.delay_ms(failures);
			if (delay)
				Platform::delay_ms(delay);

			is_reconcile_required = true;
		}
	}

	return m_state;
}
