// Frame buffer backing store implementation.

#include "frame_memory.hpp"

#include <algorithm>

FrameMemory::FrameMemory(uint32_t num_bytes) : mem_(num_bytes, 0) {}

uint8_t FrameMemory::read_byte(uint32_t addr) const {
    if (addr >= mem_.size()) {
        return 0;
    }
    return mem_[addr];
}

void FrameMemory::write_byte(uint32_t addr, uint8_t data) {
    if (addr >= mem_.size()) {
        return;
    }
    mem_[addr] = data;
}

Beat FrameMemory::read_beat(uint32_t addr) const {
    Beat beat{};
    for (uint32_t i = 0; i < BEAT_BYTES; i++) {
        beat[i] = read_byte(addr + i);
    }
    return beat;
}

void FrameMemory::upload_raw(uint32_t base, std::span<const uint8_t> data) {
    for (size_t i = 0; i < data.size(); i++) {
        write_byte(base + static_cast<uint32_t>(i), data[i]);
    }
}

void FrameMemory::fill(uint32_t base, uint32_t size, uint8_t value) {
    if (base >= mem_.size()) {
        return;
    }
    size_t end = std::min<size_t>(static_cast<size_t>(base) + size, mem_.size());
    std::fill(mem_.begin() + base, mem_.begin() + static_cast<std::ptrdiff_t>(end), value);
}
