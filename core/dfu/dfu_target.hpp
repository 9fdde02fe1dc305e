#pragma once

#include <cstdint>
#include <vector>

#include "dfu_transport.hpp"
#include "dfu_protocol.hpp"

// Client side of the DFU control point.  One request is outstanding at a time: each
// request is written with response and completed by the matching notification.
class DFUTarget {
private:
	DFUTransport &m_transport;
	unsigned int m_control_timeout_ms;
	unsigned int m_control_retries;
	unsigned int m_execute_timeout_ms;
	DFUResultCode m_last_result;
	DFUExtError m_last_ext_error;

	DFUResponse request(const std::vector<uint8_t>& pdu, unsigned int timeout_ms, unsigned int attempts);
	DFUResponse await_response(DFUOpCode opcode, unsigned int timeout_ms);

public:
	DFUTarget(DFUTransport &transport, unsigned int control_timeout_ms, unsigned int control_retries, unsigned int execute_timeout_ms);

	uint8_t protocol_version();
	uint8_t ping(uint8_t id);
	uint16_t mtu();
	void set_prn(uint16_t prn);
	DFUSelectResponse select(DFUObjectType type);
	void create(DFUObjectType type, uint32_t size);
	DFUCrcResponse get_crc();
	// As get_crc() but skips receipt notifications behind sent_offset when a newer CRC follows
	DFUCrcResponse get_crc(uint32_t sent_offset);
	void execute();
	void abort();

	// Result of the last response that failed, for reporting the peripheral's reason
	DFUResultCode last_result() { return m_last_result; }
	DFUExtError last_ext_error() { return m_last_ext_error; }
};
