// Behavioral burst read port for the frame buffer memory (memory clock
// domain).
//
// Request channel: the master raises mem_req with address, zero-based
// length and id, and holds them until mem_grant pulses. The model grants
// GRANT_LATENCY cycles after it first sees the request, except during a
// periodic refresh window, in which it holds grants off.
//
// Data channel: accepted bursts queue in order. Data for a burst starts
// READ_LATENCY cycles after its grant (or as soon as the previous burst has
// drained, if later) and streams one 16-byte beat per cycle with rvalid;
// rlast marks the final beat.
//
// Bus contract, enforced with ProtocolError:
//   - a burst must not cross a 4096-byte page
//   - a request must not be withdrawn before it is granted
//
// Timing constants are those of a 100 MHz SDR SDRAM behind a simple
// controller: tRCD = 2, CL = 3, 6-cycle refresh every 781 cycles.
//
// References:
//   fetch_controller.hpp -- request master
//   elastic_buffer.hpp   -- data sink
//   frame_memory.hpp     -- backing store

#pragma once

#include "frame_memory.hpp"
#include "video_mode.hpp"

#include <cstdint>
#include <deque>

/// Request channel states.
enum class BusState : uint8_t {
    IDLE,      ///< Waiting for mem_req
    ARBITRATE, ///< Request seen, grant pending
    REFRESH,   ///< Refresh in progress, grants held off
};

/// Burst read port model.
class MemoryBusModel {
public:
    /// Cycles from first seeing mem_req to mem_grant.
    static constexpr int GRANT_LATENCY = 2;

    /// Cycles from grant to the first data beat (tRCD + CL).
    static constexpr int READ_LATENCY = 5;

    /// Refresh interval in clock cycles.
    static constexpr int REFRESH_INTERVAL = 781;

    /// Refresh duration in clock cycles.
    static constexpr int REFRESH_DURATION = 6;

    // -- Input signals (set by the testbench / top level before eval) --

    uint8_t  mem_req       = 0; ///< Burst read request
    uint32_t mem_addr      = 0; ///< Byte address of the first beat
    uint8_t  mem_burst_len = 0; ///< Zero-based length (beats - 1)
    uint8_t  mem_burst_id  = 0; ///< Transaction id

    // -- Output signals (driven by the model after eval) --

    uint8_t mem_grant = 0; ///< One-cycle acceptance of mem_req
    uint8_t rvalid    = 0; ///< rdata holds a beat
    Beat    rdata{};       ///< Read data beat
    uint8_t rid       = 0; ///< Id of the burst rdata belongs to
    uint8_t rlast     = 0; ///< Final beat of a burst

    /// @param memory  Backing store; must outlive the model.
    explicit MemoryBusModel(const FrameMemory& memory);

    /// Evaluate one memory clock edge.
    ///
    /// @throws ProtocolError on a contract violation.
    void eval();

    /// Reset all internal state (state machine, queue, counters, outputs).
    void reset();

    BusState current_state() const {
        return state_;
    }

    /// Number of accepted bursts still delivering data.
    size_t bursts_in_flight() const {
        return queue_.size();
    }

    uint64_t bursts_accepted() const {
        return bursts_accepted_;
    }

    uint64_t beats_returned() const {
        return beats_returned_;
    }

private:
    struct Burst {
        uint32_t addr;
        uint32_t beats;
        uint8_t  id;
        uint64_t data_cycle; ///< First cycle data may be returned
        uint32_t sent = 0;
    };

    void accept();

    const FrameMemory& memory_;

    BusState state_ = BusState::IDLE;
    int delay_counter_   = 0;
    int refresh_counter_ = 0;
    uint64_t cycle_      = 0;

    std::deque<Burst> queue_;

    uint64_t bursts_accepted_ = 0;
    uint64_t beats_returned_  = 0;
};
