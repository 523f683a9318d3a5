// Line buffer: asynchronous FIFO of 16-byte beats between the memory clock
// domain (write side) and the pixel clock domain (read side).
//
// First-word-fall-through on the read side: rd_data shows the head entry
// whenever empty is low, and rd_en pops it.
//
// Pointers carry one extra wrap bit and cross domains as Gray code through
// two-flop synchronisers, so each side sees a conservative (late) copy of
// the other side's pointer.
//
// Reset handshake (rst is driven from the memory domain):
//   - rising rst: write pointer cleared, wr_rst_busy and rd_rst_busy raised,
//     flush request toggled to the read side
//   - read side, on the flush edge: read pointer cleared, ack toggled back
//   - wr_rst_busy drops once rst is seen low again
//   - rd_rst_busy drops once the ack edge is recognised
// Writes while either busy bit is high are dropped.
//
// References:
//   cdc_toggle.hpp       -- flush request / acknowledge
//   fetch_controller.hpp -- reset handshake master
//   scanout.hpp          -- read side consumer

#pragma once

#include "cdc_toggle.hpp"
#include "video_mode.hpp"

#include <array>
#include <cstdint>
#include <vector>

/// Line buffer model.
class ElasticBuffer {
public:
    /// Default depth: one full 8192-byte line.
    static constexpr uint32_t DEFAULT_DEPTH = 512;

    /// Depth of the Gray pointer synchronisers.
    static constexpr int PTR_SYNC_STAGES = 2;

    // -- Write side inputs (memory domain) --

    uint8_t rst   = 0; ///< Reset request
    uint8_t wr_en = 0; ///< Write strobe
    Beat    wr_data{}; ///< Write data

    // -- Write side outputs --

    uint8_t full        = 0; ///< No room for another beat
    uint8_t wr_rst_busy = 0; ///< Reset entered, rst still high
    uint8_t rd_rst_busy = 0; ///< Read side has not acknowledged the flush

    // -- Read side inputs (pixel domain) --

    uint8_t rd_en = 0; ///< Pop the head entry

    // -- Read side outputs --

    uint8_t empty = 1; ///< No entry visible to the read side
    Beat    rd_data{}; ///< Head entry (valid when empty is low)

    /// @param depth  Number of beats; must be a power of two.
    explicit ElasticBuffer(uint32_t depth = DEFAULT_DEPTH);

    /// Evaluate one memory clock edge.
    void eval_write();

    /// Evaluate one pixel clock edge.
    void eval_read();

    void reset();

    uint32_t depth() const {
        return depth_;
    }

    /// Beats dropped because the buffer was full.
    uint64_t overflows() const {
        return overflows_;
    }

    /// Beats dropped because the buffer was in reset.
    uint64_t dropped_in_reset() const {
        return dropped_in_reset_;
    }

    /// Number of completed reset handshakes.
    uint64_t resets() const {
        return resets_;
    }

private:
    static uint32_t to_gray(uint32_t bin) {
        return bin ^ (bin >> 1);
    }

    static uint32_t from_gray(uint32_t gray) {
        uint32_t bin = gray;
        for (uint32_t shift = 1; shift < 32; shift <<= 1) {
            bin ^= bin >> shift;
        }
        return bin;
    }

    uint32_t depth_;
    uint32_t ptr_mask_; ///< Pointer range mask (2 * depth - 1)
    std::vector<Beat> mem_;

    // Write domain registers
    uint32_t wr_ptr_      = 0;
    uint32_t wr_ptr_gray_ = 0;
    std::array<uint32_t, PTR_SYNC_STAGES> rd_ptr_sync_{};
    uint8_t  rst_prev_ = 0;
    ToggleChannel<ToggleEvent> flush_req_;
    ToggleSynchronizer flush_ack_sync_;

    // Read domain registers
    uint32_t rd_ptr_      = 0;
    uint32_t rd_ptr_gray_ = 0;
    std::array<uint32_t, PTR_SYNC_STAGES> wr_ptr_sync_{};
    ToggleSynchronizer flush_req_sync_;
    ToggleChannel<ToggleEvent> flush_ack_;

    uint64_t overflows_        = 0;
    uint64_t dropped_in_reset_ = 0;
    uint64_t resets_           = 0;
};
