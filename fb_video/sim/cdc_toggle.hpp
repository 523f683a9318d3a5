// Toggle handshake for single events crossing between clock domains.
//
// The producer never pulses. It flips a level (ToggleChannel) once per event
// and leaves the associated payload stable until the next event. The
// consumer runs that level through a three-stage shift register clocked in
// its own domain (ToggleSynchronizer) and recognises the event on the one
// cycle where the last two stages disagree.
//
// Stage 1 absorbs metastability, stages 2 and 3 form the edge detector.
// Counting the consumer edge that first samples the new level as edge 1,
// the event is reported on edge 3, whatever the clock ratio. Consecutive
// flips must be spaced by more than that to be reported separately; the
// timing generator raises at most one fetch per scanline and the host
// cannot write the load toggle faster than a register write.
//
// Used by:
//   register_bank.hpp   -- load_mode producer (payload: shadow VideoMode)
//   video_timing.hpp    -- load_mode consumer, fetch request producer
//   fetch_controller.hpp -- fetch request consumer
//   elastic_buffer.hpp  -- reset request/acknowledge between its two sides

#pragma once

#include <array>
#include <cstdint>

/// Producer half of a toggle handshake.
///
/// Owned and written exclusively by the producing domain.
template <typename Payload>
struct ToggleChannel {
    uint8_t level = 0;  ///< Toggle level read (asynchronously) by the consumer
    Payload payload{};  ///< Data valid from the flip until the next flip

    /// Publish a new payload and flip the level in the same producer tick.
    void signal(const Payload& p) {
        payload = p;
        flip();
    }

    /// Flip the level without touching the payload.
    void flip() {
        level ^= 1;
    }

    void reset() {
        level = 0;
        payload = Payload{};
    }
};

/// Producer half carrying no payload.
struct ToggleEvent {};

/// Consumer half of a toggle handshake.
///
/// Owned by the consuming domain; eval() is called once per consumer clock
/// edge with the producer's current level.
class ToggleSynchronizer {
public:
    /// Depth of the synchronising shift register.
    static constexpr int STAGES = 3;

    /// Sample the producer level on a consumer clock edge.
    ///
    /// @param toggle_in  Raw producer level (asynchronous to this domain).
    /// @return true on exactly one edge per producer flip.
    bool eval(uint8_t toggle_in) {
        // The edge is decoded from the registered stages as they stood
        // before this clock edge, then the shift register advances.
        bool edge = stages_[STAGES - 2] != stages_[STAGES - 1];
        for (int i = STAGES - 1; i > 0; i--) {
            stages_[i] = stages_[i - 1];
        }
        stages_[0] = toggle_in & 1;
        return edge;
    }

    /// Synchronised level (last stage).
    uint8_t level() const {
        return stages_[STAGES - 1];
    }

    void reset() {
        stages_.fill(0);
    }

private:
    std::array<uint8_t, STAGES> stages_{};
};
