// Scanline fetch controller (memory clock domain).
//
// Turns a synchronised fetch request ("read N 16-byte beats from A") into
// one or two burst reads that never cross a 4096-byte page, and resets the
// line buffer before each new scanline is fetched.
//
// State sequence:
//
//   IDLE --req edge--> AWAIT_BUF_RESET_ASSERT --wr_rst_busy-->
//   AWAIT_BUF_RESET_CLEAR --!wr_rst_busy && !rd_rst_busy-->
//     ISSUE_SIMPLE      --> AWAIT_GRANT --grant--> IDLE
//     ISSUE_SPLIT_FIRST --> AWAIT_GRANT --grant--> ISSUE_SPLIT_REMAINDER
//                                        --> AWAIT_GRANT --grant--> IDLE
//
// buf_rst is raised when the request is captured and dropped as soon as the
// buffer reports it has entered reset. The first burst is not issued until
// the buffer reports that both of its sides have left reset.
//
// Burst arithmetic (plan_bursts):
//   last_byte          = address + words * 16 - 1
//   bytes_to_boundary  = 4096 - (address mod 4096)
//   split when address[31:12] != last_byte[31:12]
//     first:     address,                     len = bytes_to_boundary / 16 - 1
//     remainder: address + bytes_to_boundary, len = (words*16 - bytes_to_boundary) / 16 - 1
//   otherwise
//     single:    address,                     len = words - 1
//
// Fatal conditions:
//   ConfigError   words == 0, bytes_to_boundary not a multiple of 16 on a
//                 split, any burst longer than 256 beats
//   ProtocolError mem_grant while no request is outstanding
//
// References:
//   cdc_toggle.hpp       -- request synchroniser
//   video_timing.hpp     -- request producer
//   elastic_buffer.hpp   -- buffer reset handshake
//   memory_bus_model.hpp -- burst consumer

#pragma once

#include "cdc_toggle.hpp"
#include "video_mode.hpp"

#include <cstdint>

/// Result of splitting a fetch request at page boundaries.
struct BurstPlan {
    BurstDescriptor first;     ///< Always valid
    BurstDescriptor remainder; ///< Valid only when split is set
    bool split = false;

    /// Number of descriptors in the plan (1 or 2).
    int count() const {
        return split ? 2 : 1;
    }
};

/// Burst id used for every scanline read, so returns stay in issue order.
static constexpr uint8_t FETCH_BURST_ID = 0;

/// Byte address of the last byte covered by a request.
inline constexpr uint32_t last_byte_address(const FetchRequest& req) {
    return req.address + static_cast<uint32_t>(req.words) * BEAT_BYTES - 1;
}

/// Bytes from addr up to (not including) the next page boundary.
inline constexpr uint32_t bytes_to_page_boundary(uint32_t addr) {
    return PAGE_BYTES - (addr % PAGE_BYTES);
}

/// Split a request into page-contained bursts.
///
/// @throws ConfigError on a zero-length request, a boundary distance that
///         is not a whole number of beats, or a burst over 256 beats.
BurstPlan plan_bursts(const FetchRequest& req);

/// Same as plan_bursts(req), with last_byte and bytes_to_boundary supplied
/// from registers computed on an earlier cycle.
BurstPlan plan_bursts(const FetchRequest& req, uint32_t last_byte, uint32_t bytes_to_boundary);

/// Fetch controller state machine states.
enum class FetchState : uint8_t {
    IDLE,                   ///< Waiting for a request edge
    AWAIT_BUF_RESET_ASSERT, ///< buf_rst high, waiting for the buffer to enter reset
    AWAIT_BUF_RESET_CLEAR,  ///< buf_rst low, waiting for the buffer to leave reset
    ISSUE_SIMPLE,           ///< Drive the single burst
    ISSUE_SPLIT_FIRST,      ///< Drive the burst up to the page boundary
    AWAIT_GRANT,            ///< mem_req held until mem_grant
    ISSUE_SPLIT_REMAINDER,  ///< Drive the burst after the page boundary
};

/// Printable state name.
const char* to_string(FetchState state);

/// Scanline fetch controller.
class FetchController {
public:
    // -- Input signals (memory domain) --

    uint8_t  req_toggle      = 0; ///< Raw fetch toggle from the pixel domain
    uint32_t req_addr        = 0; ///< Fetch payload: start address
    uint16_t req_words       = 0; ///< Fetch payload: length in beats
    uint8_t  buf_wr_rst_busy = 0; ///< Buffer has entered reset
    uint8_t  buf_rd_rst_busy = 0; ///< Buffer read side still clearing
    uint8_t  mem_grant       = 0; ///< Bus accepted the outstanding request

    // -- Output signals --

    uint8_t  buf_rst       = 0; ///< Line buffer reset request
    uint8_t  mem_req       = 0; ///< Burst read request
    uint32_t mem_addr      = 0; ///< Burst start address
    uint8_t  mem_burst_len = 0; ///< Zero-based burst length (beats - 1)
    uint8_t  mem_burst_id  = 0; ///< Burst id

    FetchController();

    /// Evaluate one memory clock edge.
    ///
    /// @throws ConfigError or ProtocolError; the controller then stays
    ///         halted until reset().
    void eval();

    void reset();

    FetchState current_state() const {
        return state_;
    }

    bool halted() const {
        return halted_;
    }

    /// Request most recently captured in IDLE.
    const FetchRequest& captured() const {
        return captured_;
    }

    uint64_t requests_seen() const {
        return requests_seen_;
    }

    /// Request edges that arrived while a previous request was in flight.
    uint64_t requests_dropped() const {
        return requests_dropped_;
    }

    uint64_t bursts_issued() const {
        return bursts_issued_;
    }

    uint64_t splits() const {
        return splits_;
    }

private:
    void issue(const BurstDescriptor& burst);
    [[noreturn]] void fail_protocol(const char* what);

    FetchState state_ = FetchState::IDLE;
    bool halted_ = false;

    ToggleSynchronizer req_sync_;

    FetchRequest captured_;
    uint32_t last_byte_         = 0;
    uint32_t bytes_to_boundary_ = 0;
    BurstPlan plan_;
    bool remainder_pending_ = false;

    uint64_t requests_seen_    = 0;
    uint64_t requests_dropped_ = 0;
    uint64_t bursts_issued_    = 0;
    uint64_t splits_           = 0;
};
