// Frame buffer backing store.
//
// Flat byte array standing in for the external memory behind the burst
// read port. Holds no timing; MemoryBusModel adds that. Hosts (tests, the
// harness, Lua scripts in the interactive sim) preload frame buffer
// contents through the write helpers.
//
// At 1 bpp a line of W pixels occupies W / 8 bytes, most significant bit =
// leftmost pixel.

#pragma once

#include "video_mode.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

/// Flat frame buffer memory.
class FrameMemory {
public:
    /// Default size: 16 MB.
    static constexpr uint32_t DEFAULT_BYTES = 16 * 1024 * 1024;

    /// Construct a zero-filled memory of `num_bytes` bytes.
    explicit FrameMemory(uint32_t num_bytes = DEFAULT_BYTES);

    // Non-copyable.
    FrameMemory(const FrameMemory&) = delete;
    FrameMemory& operator=(const FrameMemory&) = delete;

    /// Read one byte. Returns 0 for out-of-range addresses.
    uint8_t read_byte(uint32_t addr) const;

    /// Write one byte. Silently ignores out-of-range addresses.
    void write_byte(uint32_t addr, uint8_t data);

    /// Read the 16 bytes starting at addr (one bus beat).
    Beat read_beat(uint32_t addr) const;

    /// Copy raw bytes into memory starting at base.
    void upload_raw(uint32_t base, std::span<const uint8_t> data);

    /// Set `size` bytes starting at base to `value`.
    void fill(uint32_t base, uint32_t size, uint8_t value);

    /// Write a 1 bpp bitmap line by line at the given pitch.
    ///
    /// @param base    Byte address of line 0.
    /// @param pitch   Bytes between line starts.
    /// @param width   Pixels per line.
    /// @param height  Number of lines.
    /// @param pixel   Callback (x, y) -> bool giving each pixel.
    template <typename PixelFn>
    void draw_1bpp(uint32_t base, uint32_t pitch, uint32_t width, uint32_t height, PixelFn pixel) {
        for (uint32_t y = 0; y < height; y++) {
            for (uint32_t x = 0; x < width; x++) {
                uint32_t addr = base + y * pitch + x / 8;
                auto mask = static_cast<uint8_t>(0x80 >> (x % 8));
                uint8_t b = read_byte(addr);
                write_byte(addr, static_cast<uint8_t>(pixel(x, y) ? (b | mask) : (b & ~mask)));
            }
        }
    }

    /// Total size in bytes.
    uint32_t size() const {
        return static_cast<uint32_t>(mem_.size());
    }

private:
    std::vector<uint8_t> mem_;
};
