// Shared data types for the video core.
//
//   VideoMode      -- timing parameter set; exists as a shadow copy in the
//                     register bank and an active copy in the timing
//                     generator.
//   FetchRequest   -- one scanline fetch, produced by the timing generator
//                     and carried across to the memory domain.
//   BurstDescriptor -- one page-contained burst read derived from a
//                     FetchRequest by the fetch controller.
//
// References:
//   register_bank.hpp    -- register packing of VideoMode fields
//   video_timing.hpp     -- active set, fetch request producer
//   fetch_controller.hpp -- burst descriptor producer

#pragma once

#include <array>
#include <cstdint>

/// Bytes per memory beat (one FIFO entry, one "word" of a fetch request).
static constexpr uint32_t BEAT_BYTES = 16;

/// Bursts must never cross an address boundary of this size.
static constexpr uint32_t PAGE_BYTES = 4096;

/// Maximum burst length in beats.
static constexpr uint32_t MAX_BURST_BEATS = 256;

/// One memory beat: a line buffer entry.
using Beat = std::array<uint8_t, BEAT_BYTES>;

/// Line pitch register width in bits.
static constexpr int PITCH_BITS = 13;

/// One axis (horizontal or vertical) of a timing parameter set.
///
/// The display window is the half-open-on-the-left interval
/// (start, start + width]; sync covers the last `sync` positions before the
/// counter wraps at `total`.
struct AxisTiming {
    uint16_t start = 0; ///< Display-start offset (last blank position before display)
    uint16_t width = 0; ///< Display width in pixels or lines
    uint16_t sync  = 0; ///< Sync pulse width
    uint16_t total = 0; ///< Counter wraps to 0 after reaching this value

    bool operator==(const AxisTiming&) const = default;
};

/// Timing parameter set.
struct VideoMode {
    AxisTiming h;
    AxisTiming v;
    uint8_t  polarity     = 0; ///< bit 0: hsync active-high, bit 1: vsync active-high
    uint8_t  pixel_format = 0; ///< Stored only; scanout is fixed at 1 bpp
    uint32_t base_addr    = 0; ///< Display base byte address
    uint16_t pitch        = 0; ///< Line pitch in bytes (13 bits)

    bool operator==(const VideoMode&) const = default;
};

/// Power-on timing: VGA 640x480 @ 60 Hz, negative syncs, 1 bpp, 80-byte pitch.
///
///   horizontal: 48 back porch | 640 display | 16 front porch | 96 sync
///   vertical:   33 back porch | 480 display | 10 front porch |  2 sync
inline constexpr VideoMode default_video_mode() {
    return VideoMode{
        .h = {.start = 47, .width = 640, .sync = 96, .total = 799},
        .v = {.start = 32, .width = 480, .sync = 2, .total = 524},
        .polarity = 0,
        .pixel_format = 0,
        .base_addr = 0,
        .pitch = 80,
    };
}

/// One scanline fetch.
struct FetchRequest {
    uint32_t address = 0; ///< Byte address of the first byte of the line
    uint16_t words   = 0; ///< Length in 16-byte beats

    bool operator==(const FetchRequest&) const = default;
};

/// One burst read command.
struct BurstDescriptor {
    uint32_t address = 0; ///< Byte address of the first beat
    uint16_t len     = 0; ///< Zero-based length: beats - 1 (0..255)
    uint8_t  id      = 0; ///< Transaction id

    /// Number of beats this descriptor transfers.
    uint32_t beats() const {
        return static_cast<uint32_t>(len) + 1;
    }

    /// Number of bytes this descriptor transfers.
    uint32_t bytes() const {
        return beats() * BEAT_BYTES;
    }

    bool operator==(const BurstDescriptor&) const = default;
};
