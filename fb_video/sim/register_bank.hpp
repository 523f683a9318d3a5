// Host-facing configuration register bank (config-bus clock domain).
//
// Holds the shadow timing parameter set and the load_mode toggle. The host
// writes shadow registers at any cadence; nothing reaches the display until
// the host writes LOAD_MODE, which flips the toggle. The timing generator
// picks the edge up through its own synchroniser and copies the whole
// shadow set in one step.
//
// Register map (byte offsets, 32-bit registers, byte-enabled writes):
//
//   | Offset | Name        | [31:16]          | [15:0]                    |
//   |--------|-------------|------------------|---------------------------|
//   | 0x000  | H_DISPLAY   | width            | start                     |
//   | 0x004  | H_SYNC      | total            | sync                      |
//   | 0x008  | V_DISPLAY   | width            | start                     |
//   | 0x00C  | V_SYNC      | total            | sync                      |
//   | 0x010  | FORMAT      | -                | [15:8] format, [1:0] pol  |
//   | 0x100  | BASE_ADDR   | base address [31:0]                          |
//   | 0x104  | PITCH       | -                | [12:0] pitch (bytes)      |
//   | 0x108  | LOAD_MODE   | write with byte 0 enabled flips the toggle   |
//
// Any other offset is a ConfigError.
//
// References:
//   video_mode.hpp   -- VideoMode field widths
//   video_timing.hpp -- consumer of load_mode

#pragma once

#include "cdc_toggle.hpp"
#include "video_mode.hpp"

#include <cstdint>

/// Register offsets.
static constexpr uint32_t REG_H_DISPLAY = 0x000;
static constexpr uint32_t REG_H_SYNC    = 0x004;
static constexpr uint32_t REG_V_DISPLAY = 0x008;
static constexpr uint32_t REG_V_SYNC    = 0x00C;
static constexpr uint32_t REG_FORMAT    = 0x010;
static constexpr uint32_t REG_BASE_ADDR = 0x100;
static constexpr uint32_t REG_PITCH     = 0x104;
static constexpr uint32_t REG_LOAD_MODE = 0x108;

/// Pack a {high, low} pair of 16-bit fields into one register value.
inline constexpr uint32_t pack_fields(uint16_t high, uint16_t low) {
    return (static_cast<uint32_t>(high) << 16) | low;
}

/// Configuration register bank.
class RegisterBank {
public:
    // -- Input signals (config-bus domain) --

    uint8_t  wr_en   = 0; ///< Write strobe
    uint32_t wr_addr = 0; ///< Byte offset of the register
    uint32_t wr_data = 0; ///< Write data
    uint8_t  wr_strb = 0; ///< Byte enables, bit n enables wr_data[8n+7:8n]
    uint8_t  rd_en   = 0; ///< Read strobe
    uint32_t rd_addr = 0; ///< Byte offset of the register

    // -- Output signals --

    uint32_t rd_data  = 0; ///< Read data, valid with rd_valid
    uint8_t  rd_valid = 0; ///< Read completed this cycle

    /// load_mode toggle; the payload always mirrors the shadow set.
    ToggleChannel<VideoMode> load_mode;

    RegisterBank();

    /// Evaluate one config-bus clock edge.
    ///
    /// @throws ConfigError for an unmapped wr_addr or rd_addr.
    void eval();

    /// Decode and apply one register write.
    ///
    /// @param addr  Byte offset.
    /// @param data  Write data.
    /// @param strb  Byte enables (0xF for a full-word write).
    /// @throws ConfigError for an unmapped address.
    void write(uint32_t addr, uint32_t data, uint8_t strb = 0xF);

    /// Decode one register read.
    /// @throws ConfigError for an unmapped address.
    uint32_t read(uint32_t addr) const;

    /// Current shadow parameter set.
    const VideoMode& shadow() const {
        return shadow_;
    }

    /// Restore power-on shadow values and clear the load toggle.
    void reset();

private:
    VideoMode shadow_;
};
