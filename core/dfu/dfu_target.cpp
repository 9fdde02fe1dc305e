#include "dfu_target.hpp"
#include "error.hpp"
#include "debug.hpp"
#include "binascii.hpp"


DFUTarget::DFUTarget(DFUTransport &transport, unsigned int control_timeout_ms, unsigned int control_retries, unsigned int execute_timeout_ms) :
	m_transport(transport),
	m_control_timeout_ms(control_timeout_ms),
	m_control_retries(control_retries),
	m_execute_timeout_ms(execute_timeout_ms),
	m_last_result(DFUResultCode::SUCCESS),
	m_last_ext_error(DFUExtError::NO_ERROR) {
}

DFUResponse DFUTarget::await_response(DFUOpCode opcode, unsigned int timeout_ms) {
	while (true) {
		std::vector<uint8_t> pdu = m_transport.wait_notification(DFUCharacteristic::CONTROL_POINT, timeout_ms);
		DEBUG_TRACE("DFUTarget: <- %s", Binascii::hexlify(pdu).c_str());

		DFUResponse response = DFUDecoder::decode(pdu);

		// A late response to an earlier timed out request is dropped
		if (response.opcode != opcode) {
			DEBUG_WARN("DFUTarget: discarding %s response while waiting for %s",
					dfu_opcode_str(response.opcode), dfu_opcode_str(opcode));
			continue;
		}

		if (response.result != DFUResultCode::SUCCESS) {
			m_last_result = response.result;
			m_last_ext_error = response.ext_error;
			DEBUG_ERROR("DFUTarget: %s rejected: %s (%s)", dfu_opcode_str(opcode),
					dfu_result_str(response.result), dfu_ext_error_str(response.ext_error));
			throw DFU_TARGET_ERROR;
		}

		return response;
	}
}

DFUResponse DFUTarget::request(const std::vector<uint8_t>& pdu, unsigned int timeout_ms, unsigned int attempts) {
	DFUOpCode opcode = static_cast<DFUOpCode>(pdu[0]);

	for (unsigned int attempt = 1; ; attempt++) {
		m_transport.flush_notifications(DFUCharacteristic::CONTROL_POINT);
		DEBUG_TRACE("DFUTarget: -> %s", Binascii::hexlify(pdu).c_str());
		m_transport.write(DFUCharacteristic::CONTROL_POINT, pdu, true);
		try {
			return await_response(opcode, timeout_ms);
		} catch (ErrorCode e) {
			if (e != TRANSPORT_TIMEOUT || attempt >= attempts)
				throw;
			DEBUG_WARN("DFUTarget: no response to %s, retrying (%u/%u)", dfu_opcode_str(opcode), attempt, attempts);
		}
	}
}

uint8_t DFUTarget::protocol_version() {
	return DFUDecoder::decode_protocol_version(request(DFUEncoder::encode_protocol_version(), m_control_timeout_ms, m_control_retries + 1));
}

uint8_t DFUTarget::ping(uint8_t id) {
	uint8_t echo = DFUDecoder::decode_ping(request(DFUEncoder::encode_ping(id), m_control_timeout_ms, m_control_retries + 1));
	if (echo != id) {
		DEBUG_ERROR("DFUTarget::ping: sent id %u but got %u", id, echo);
		throw DFU_INVALID_RESPONSE;
	}
	return echo;
}

uint16_t DFUTarget::mtu() {
	return DFUDecoder::decode_mtu(request(DFUEncoder::encode_mtu_get(), m_control_timeout_ms, m_control_retries + 1));
}

void DFUTarget::set_prn(uint16_t prn) {
	DEBUG_TRACE("DFUTarget::set_prn: %u", prn);
	request(DFUEncoder::encode_set_prn(prn), m_control_timeout_ms, m_control_retries + 1);
}

DFUSelectResponse DFUTarget::select(DFUObjectType type) {
	auto select = DFUDecoder::decode_select(request(DFUEncoder::encode_select(type), m_control_timeout_ms, m_control_retries + 1));
	DEBUG_TRACE("DFUTarget::select: type=%u max_size=%u offset=%u crc=%08x",
			(unsigned int)type, select.max_size, select.offset, select.crc);
	return select;
}

void DFUTarget::create(DFUObjectType type, uint32_t size) {
	DEBUG_TRACE("DFUTarget::create: type=%u size=%u", (unsigned int)type, size);
	request(DFUEncoder::encode_create(type, size), m_control_timeout_ms, m_control_retries + 1);
}

DFUCrcResponse DFUTarget::get_crc() {
	auto crc = DFUDecoder::decode_crc(request(DFUEncoder::encode_crc_get(), m_control_timeout_ms, m_control_retries + 1));
	DEBUG_TRACE("DFUTarget::get_crc: offset=%u crc=%08x", crc.offset, crc.crc);
	return crc;
}

DFUCrcResponse DFUTarget::get_crc(uint32_t sent_offset) {
	DFUCrcResponse crc = get_crc();

	// Packet receipt notifications share the CRC_GET response format and can
	// arrive between the flush and the answer to this request
	while (crc.offset < sent_offset) {
		try {
			crc = DFUDecoder::decode_crc(await_response(DFUOpCode::CRC_GET, m_control_timeout_ms));
			DEBUG_WARN("DFUTarget::get_crc: skipped receipt notification, now offset=%u crc=%08x", crc.offset, crc.crc);
		} catch (ErrorCode e) {
			if (e != TRANSPORT_TIMEOUT)
				throw;
			break;
		}
	}
	return crc;
}

// Execute commits flash so it is sent once and given the long timeout
void DFUTarget::execute() {
	DEBUG_TRACE("DFUTarget::execute");
	request(DFUEncoder::encode_execute(), m_execute_timeout_ms, 1);
}

void DFUTarget::abort() {
	DEBUG_TRACE("DFUTarget::abort");
	request(DFUEncoder::encode_abort(), m_control_timeout_ms, 1);
}
