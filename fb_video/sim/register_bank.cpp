// Configuration register bank implementation.
//
// Writes are read-modify-write on the packed register image so that any
// combination of byte enables lands on the right fields.

#include "register_bank.hpp"

#include "video_error.hpp"

namespace {

/// Expand 4 byte-enable bits into a 32-bit mask.
uint32_t strb_mask(uint8_t strb) {
    uint32_t mask = 0;
    for (int i = 0; i < 4; i++) {
        if (strb & (1u << i)) {
            mask |= 0xFFu << (i * 8);
        }
    }
    return mask;
}

uint32_t merge(uint32_t old_value, uint32_t data, uint8_t strb) {
    uint32_t mask = strb_mask(strb);
    return (old_value & ~mask) | (data & mask);
}

[[noreturn]] void unmapped(const char* op, uint32_t addr) {
    throw ConfigError(std::string("register_bank: ") + op + " of unsupported address " +
                      hex32(addr));
}

} // namespace

RegisterBank::RegisterBank() {
    reset();
}

void RegisterBank::reset() {
    shadow_ = default_video_mode();
    load_mode.reset();
    load_mode.payload = shadow_;

    rd_data  = 0;
    rd_valid = 0;
}

void RegisterBank::eval() {
    rd_valid = 0;

    if (wr_en) {
        write(wr_addr, wr_data, wr_strb);
    }
    if (rd_en) {
        rd_data  = read(rd_addr);
        rd_valid = 1;
    }
}

uint32_t RegisterBank::read(uint32_t addr) const {
    switch (addr) {
        case REG_H_DISPLAY: return pack_fields(shadow_.h.width, shadow_.h.start);
        case REG_H_SYNC:    return pack_fields(shadow_.h.total, shadow_.h.sync);
        case REG_V_DISPLAY: return pack_fields(shadow_.v.width, shadow_.v.start);
        case REG_V_SYNC:    return pack_fields(shadow_.v.total, shadow_.v.sync);
        case REG_FORMAT:
            return (static_cast<uint32_t>(shadow_.pixel_format) << 8) | (shadow_.polarity & 0x3);
        case REG_BASE_ADDR: return shadow_.base_addr;
        case REG_PITCH:     return shadow_.pitch;
        case REG_LOAD_MODE: return load_mode.level;
        default:
            unmapped("read", addr);
    }
}

void RegisterBank::write(uint32_t addr, uint32_t data, uint8_t strb) {
    switch (addr) {
        case REG_H_DISPLAY: {
            uint32_t v = merge(read(addr), data, strb);
            shadow_.h.start = static_cast<uint16_t>(v);
            shadow_.h.width = static_cast<uint16_t>(v >> 16);
            break;
        }
        case REG_H_SYNC: {
            uint32_t v = merge(read(addr), data, strb);
            shadow_.h.sync  = static_cast<uint16_t>(v);
            shadow_.h.total = static_cast<uint16_t>(v >> 16);
            break;
        }
        case REG_V_DISPLAY: {
            uint32_t v = merge(read(addr), data, strb);
            shadow_.v.start = static_cast<uint16_t>(v);
            shadow_.v.width = static_cast<uint16_t>(v >> 16);
            break;
        }
        case REG_V_SYNC: {
            uint32_t v = merge(read(addr), data, strb);
            shadow_.v.sync  = static_cast<uint16_t>(v);
            shadow_.v.total = static_cast<uint16_t>(v >> 16);
            break;
        }
        case REG_FORMAT: {
            uint32_t v = merge(read(addr), data, strb);
            shadow_.polarity     = static_cast<uint8_t>(v & 0x3);
            shadow_.pixel_format = static_cast<uint8_t>(v >> 8);
            break;
        }
        case REG_BASE_ADDR:
            shadow_.base_addr = merge(shadow_.base_addr, data, strb);
            break;
        case REG_PITCH: {
            uint32_t v = merge(shadow_.pitch, data, strb);
            shadow_.pitch = static_cast<uint16_t>(v & ((1u << PITCH_BITS) - 1));
            break;
        }
        case REG_LOAD_MODE:
            if (strb & 0x1) {
                load_mode.flip();
            }
            break;
        default:
            unmapped("write", addr);
    }

    load_mode.payload = shadow_;
}
