// 1 bpp scanout serializer (pixel clock domain).
//
// While both blanks are low, each pixel clock takes the next bit of the
// current line buffer beat: byte 0 first, most significant bit first within
// a byte. The beat is popped from the buffer on its first pixel. Outside
// the display window the bit position is parked at 0, so every line starts
// on a fresh beat.
//
// An empty buffer at a beat boundary produces a beat of zero pixels and is
// counted as an underflow.
//
// References:
//   elastic_buffer.hpp -- beat source
//   video_timing.hpp   -- blank inputs

#pragma once

#include "video_mode.hpp"

#include <cstdint>

/// Pixels per 16-byte beat at 1 bpp.
static constexpr uint32_t PIXELS_PER_BEAT = BEAT_BYTES * 8;

/// Bit `index` of a beat in scanout order.
inline uint8_t beat_pixel(const Beat& beat, uint32_t index) {
    return static_cast<uint8_t>((beat[index / 8] >> (7 - (index % 8))) & 1);
}

/// Scanout serializer.
class Scanout {
public:
    // -- Input signals (pixel domain) --

    uint8_t h_blank   = 1;
    uint8_t v_blank   = 1;
    uint8_t buf_empty = 1;
    Beat    buf_data{};

    // -- Output signals --

    uint8_t buf_rd_en      = 0; ///< Pop the line buffer head this cycle
    uint8_t pixel          = 0; ///< Pixel value (0 or 1)
    uint8_t display_enable = 0; ///< pixel is inside the display window

    Scanout();

    /// Evaluate one pixel clock edge.
    void eval();

    void reset();

    uint64_t underflows() const {
        return underflows_;
    }

    uint64_t beats_consumed() const {
        return beats_consumed_;
    }

private:
    Beat     current_{};
    uint32_t bit_index_ = 0;

    uint64_t underflows_     = 0;
    uint64_t beats_consumed_ = 0;
};
