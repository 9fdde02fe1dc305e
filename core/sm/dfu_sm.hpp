#pragma once

#include <functional>

#include "tinyfsm.hpp"
#include "error.hpp"
#include "base_types.hpp"
#include "messages.hpp"
#include "dfu_protocol.hpp"
#include "dfu_target.hpp"
#include "object_transfer.hpp"
#include "firmware_package.hpp"

struct DFUStepEvent                 : tinyfsm::Event { };
struct DFUChunkWrittenEvent         : tinyfsm::Event { uint32_t offset; uint32_t total; };
struct DFUCheckpointRequestEvent    : tinyfsm::Event { };
struct DFUCheckpointResultEvent     : tinyfsm::Event { uint32_t offset; uint32_t crc; bool verified; };
struct DFURetryEvent                : tinyfsm::Event { unsigned int attempt; ErrorCode cause; };
struct DFUErrorEvent                : tinyfsm::Event { ErrorCode error_code; };

using DFUProgressHandler = std::function<void(const DFUProgressLogEntry&)>;


// Per image opcode sequence: each DFUStepEvent performs the action of the
// current state.  Streaming hands over to the ObjectTransfer engine whose
// callbacks are fed back in as events.
class DFUControlPoint : public tinyfsm::Fsm<DFUControlPoint>
{
protected:
	static inline DFUTarget *m_target = nullptr;
	static inline ObjectTransfer *m_engine = nullptr;
	static inline const Image *m_image = nullptr;
	static inline DFUObjectKind m_phase = DFUObjectKind::INIT_PACKET;
	static inline DFUSelectResponse m_select = {};
	static inline uint32_t m_offset = 0;
	static inline uint32_t m_crc = 0;
	static inline uint32_t m_object_start = 0;
	static inline uint32_t m_object_end = 0;
	static inline unsigned int m_attempts = 0;
	static inline bool m_is_prn_configured = false;
	static inline unsigned int m_prn = 0;
	static inline uint16_t m_target_prn = 0;
	static inline BaseObjectMode m_object_mode = BaseObjectMode::SINGLE;
	static inline ErrorCode m_error = DFU_INVALID_STATE;
	static inline DFUProgressHandler m_progress_handler;

	static DFUObjectType object_type();
	static const std::vector<uint8_t>& blob();
	static void log_state(DFUStateEvent event);
	static void report_progress();

public:
	void react(tinyfsm::Event const &) { }
	virtual void react(DFUStepEvent const &) { }
	virtual void react(DFUChunkWrittenEvent const &);
	virtual void react(DFUCheckpointRequestEvent const &);
	virtual void react(DFUCheckpointResultEvent const &);
	virtual void react(DFURetryEvent const &);
	virtual void react(DFUErrorEvent const &event);
	virtual void entry(void) { }
	virtual void exit(void) { }

	static void configure(DFUTarget &target, ObjectTransfer &engine, unsigned int prn, uint16_t target_prn, BaseObjectMode object_mode);
	static void set_progress_handler(DFUProgressHandler handler) { m_progress_handler = handler; }

	// SetPRN is sent once per session
	static void begin_session() { m_is_prn_configured = false; }

	// Runs the init packet then the firmware of an image through to Completed, or throws
	static void run(const Image &image);
};


class DFUIdle : public DFUControlPoint
{
public:
	void react(DFUStepEvent const &) override;
	void entry() override;
};

class DFUSelecting : public DFUControlPoint
{
private:
	void select_init_packet();
	void select_firmware();
public:
	void react(DFUStepEvent const &) override;
	void entry() override;
};

class DFUCreating : public DFUControlPoint
{
public:
	void react(DFUStepEvent const &) override;
	void entry() override;
};

class DFUStreaming : public DFUControlPoint
{
public:
	void react(DFUStepEvent const &) override;
	void react(DFUChunkWrittenEvent const &) override;
	void react(DFUCheckpointRequestEvent const &) override;
	void react(DFURetryEvent const &) override;
	void entry() override;
};

class DFUCrcChecking : public DFUControlPoint
{
public:
	void react(DFUCheckpointResultEvent const &event) override;
	void react(DFURetryEvent const &) override;
	void entry() override;
};

class DFURetrying : public DFUControlPoint
{
public:
	void react(DFUChunkWrittenEvent const &) override;
	void react(DFUCheckpointRequestEvent const &) override;
	void react(DFURetryEvent const &) override;
	void entry() override;
};

class DFUExecuting : public DFUControlPoint
{
public:
	void react(DFUStepEvent const &) override;
	void entry() override;
};

class DFUCompleted : public DFUControlPoint
{
public:
	void react(DFUErrorEvent const &) override { }
	void entry() override;
};

class DFUError : public DFUControlPoint
{
public:
	void react(DFUErrorEvent const &) override { }
	void entry() override;
};
