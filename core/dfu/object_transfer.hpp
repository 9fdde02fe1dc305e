#pragma once

#include <atomic>
#include <cstdint>
#include <vector>

#include "dfu_transport.hpp"
#include "dfu_target.hpp"
#include "retry_policy.hpp"
#include "error.hpp"

// Progress of one object.  Offsets are positions in the blob being sent and
// crc always covers blob[0, offset) as last confirmed by the peripheral.
struct TransferState {
	uint32_t     total_size;
	uint32_t     offset;
	uint32_t     max_object_size;
	unsigned int prn;
	uint32_t     crc;
};

class TransferObserver {
public:
	virtual ~TransferObserver() {}
	virtual void on_chunk_written(const TransferState& state, uint32_t sent_offset) = 0;
	virtual void on_checkpoint_request(const TransferState& state) = 0;
	virtual void on_checkpoint_result(const TransferState& state, const DFUCrcResponse& reported, bool verified) = 0;
	virtual void on_retry(const TransferState& state, unsigned int attempt, ErrorCode cause) = 0;
};

class ObjectTransfer {
private:
	DFUTransport &m_transport;
	DFUTarget &m_target;
	RetryPolicy m_retry_policy;
	TransferObserver *m_observer;
	std::atomic<bool> m_cancelled;
	TransferState m_state;

	void rewind(const std::vector<uint8_t>& data, const DFUCrcResponse& reported);
	void check_cancelled();

public:
	ObjectTransfer(DFUTransport &transport, DFUTarget &target, const RetryPolicy& retry_policy);

	void set_observer(TransferObserver *observer) { m_observer = observer; }
	const TransferState& state() { return m_state; }
	const RetryPolicy& retry_policy() { return m_retry_policy; }

	// Writes data[offset, data.size()) to the data point; (offset, crc) must be a pair the
	// peripheral has confirmed.  Returns the final confirmed state.
	TransferState transfer(DFUObjectType type, const std::vector<uint8_t>& data, uint32_t max_object_size,
			unsigned int prn, uint32_t offset, uint32_t crc);

	// As above but stops at end, for objects that hold part of the blob
	TransferState transfer(DFUObjectType type, const std::vector<uint8_t>& data, uint32_t max_object_size,
			unsigned int prn, uint32_t offset, uint32_t crc, uint32_t end);

	// Safe to call from a signal handler; the transfer stops before its next chunk
	void cancel() { m_cancelled = true; }
	void clear_cancel() { m_cancelled = false; }
	bool is_cancelled() { return m_cancelled; }
};
