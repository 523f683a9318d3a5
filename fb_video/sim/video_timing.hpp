// Video timing generator (pixel clock domain).
//
// Free-running horizontal/vertical counter pair. Derives blank and sync
// outputs from the active parameter set and, once per displayed line, raises
// a fetch request for the next line through a toggle channel.
//
// Per pixel clock edge:
//   1. Counters advance. h wraps to 0 after reaching h.total; v advances on
//      each h wrap and wraps to 0 after reaching v.total.
//   2. A load_mode edge (seen through a 3-stage synchroniser) copies the
//      whole shadow set into the active set and recomputes the rounded
//      pitch.
//   3. Blank, sync and the fetch trigger are decoded from the new counter
//      values and the active set:
//        blank   unless start < count <= start + width
//        sync    when count > total - sync, output = polarity ^ !sync
//        fetch   when h == h.start + h.width + 1 and
//                v.start <= v < v.start + v.width
//
// A fetch raised at the end of line v loads the line displayed next, which
// is line index (v - v.start) of the frame buffer:
//   address = base_addr + (v - v.start) * rounded_pitch
//   words   = rounded_pitch / 16
//
// References:
//   cdc_toggle.hpp       -- load_mode synchroniser, fetch channel
//   register_bank.hpp    -- load_mode producer
//   fetch_controller.hpp -- fetch consumer

#pragma once

#include "cdc_toggle.hpp"
#include "video_mode.hpp"

#include <cstdint>

/// Round a pitch up to the next multiple of BEAT_BYTES.
inline constexpr uint32_t round_pitch(uint16_t pitch) {
    return (static_cast<uint32_t>(pitch) + (BEAT_BYTES - 1)) & ~(BEAT_BYTES - 1);
}

/// True when count lies in the display window (start, start + width].
inline constexpr bool in_display(uint32_t count, uint32_t start, uint32_t width) {
    return count > start && count <= start + width;
}

/// True for the last `sync` counter positions before the wrap at `total`.
inline constexpr bool in_sync(uint32_t count, uint32_t total, uint32_t sync) {
    return static_cast<int64_t>(count) > static_cast<int64_t>(total) - static_cast<int64_t>(sync);
}

/// Sync pin level for a sync enable and a polarity bit (1 = active-high).
inline constexpr uint8_t sync_level(bool enable, uint8_t polarity) {
    return static_cast<uint8_t>((polarity & 1) ^ (enable ? 0 : 1));
}

/// Video timing generator.
class VideoTiming {
public:
    // -- Input signals (pixel domain) --

    uint8_t   load_mode = 0; ///< Raw load_mode toggle from the config domain
    VideoMode shadow;        ///< Shadow set published by the register bank

    // -- Output signals --

    uint16_t h_count = 0; ///< Horizontal position
    uint16_t v_count = 0; ///< Vertical position
    uint8_t  h_blank = 1; ///< Horizontal blank
    uint8_t  v_blank = 1; ///< Vertical blank
    uint8_t  h_sync  = 0; ///< Horizontal sync pin level
    uint8_t  v_sync  = 0; ///< Vertical sync pin level

    /// Fetch request toggle and payload, read by the memory domain.
    ToggleChannel<FetchRequest> fetch;

    VideoTiming();

    /// Evaluate one pixel clock edge.
    void eval();

    /// Power-on state: default active set, counters pending wrap, no fetch.
    void reset();

    /// Parameter set currently driving the outputs.
    const VideoMode& active() const {
        return active_;
    }

    /// Active pitch rounded up to a multiple of 16 bytes.
    uint32_t rounded_pitch() const {
        return rounded_pitch_;
    }

    /// True while both blanks are low.
    bool display_enable() const {
        return !h_blank && !v_blank;
    }

    /// Number of completed frames (vertical wraps after the first) since reset.
    uint64_t frame_count() const {
        return frame_count_;
    }

    /// Number of fetch requests raised since reset.
    uint64_t fetch_count() const {
        return fetch_count_;
    }

    /// Number of active-set reloads since reset.
    uint64_t reload_count() const {
        return reload_count_;
    }

private:
    void update_outputs();

    VideoMode active_;
    uint32_t rounded_pitch_ = 0;
    bool parked_ = true; ///< Counters still on their reset sentinel

    ToggleSynchronizer load_sync_;

    uint64_t frame_count_  = 0;
    uint64_t fetch_count_  = 0;
    uint64_t reload_count_ = 0;
};
