// Behavioral burst read port implementation.

#include "memory_bus_model.hpp"

#include "video_error.hpp"

#include <string>

MemoryBusModel::MemoryBusModel(const FrameMemory& memory) : memory_(memory) {
    reset();
}

void MemoryBusModel::reset() {
    state_           = BusState::IDLE;
    delay_counter_   = 0;
    refresh_counter_ = 0;
    cycle_           = 0;
    queue_.clear();

    bursts_accepted_ = 0;
    beats_returned_  = 0;

    // Default output state
    mem_grant = 0;
    rvalid    = 0;
    rdata     = Beat{};
    rid       = 0;
    rlast     = 0;
}

void MemoryBusModel::accept() {
    uint32_t beats = static_cast<uint32_t>(mem_burst_len) + 1;
    uint32_t last  = mem_addr + beats * BEAT_BYTES - 1;

    if ((mem_addr / PAGE_BYTES) != (last / PAGE_BYTES)) {
        throw ProtocolError("memory_bus: burst " + hex32(mem_addr) + ".." + hex32(last) +
                            " crosses a " + std::to_string(PAGE_BYTES) + "-byte page");
    }

    queue_.push_back(Burst{
        .addr       = mem_addr,
        .beats      = beats,
        .id         = mem_burst_id,
        .data_cycle = cycle_ + READ_LATENCY,
    });
    mem_grant = 1;
    bursts_accepted_++;
}

void MemoryBusModel::eval() {
    // Clear single-cycle pulse outputs at the start of each cycle.
    mem_grant = 0;
    rvalid    = 0;
    rlast     = 0;

    cycle_++;

    // -- Refresh scheduling --
    // The refresh counter runs continuously. A due refresh starts the next
    // time the request channel is idle; a request already in arbitration is
    // granted first.
    refresh_counter_++;
    bool refresh_due = (refresh_counter_ >= REFRESH_INTERVAL);

    switch (state_) {
        case BusState::IDLE: {
            if (refresh_due) {
                state_           = BusState::REFRESH;
                delay_counter_   = REFRESH_DURATION;
                refresh_counter_ = 0;
                break;
            }
            if (mem_req) {
                state_         = BusState::ARBITRATE;
                delay_counter_ = GRANT_LATENCY;
            }
            break;
        }

        case BusState::ARBITRATE: {
            if (!mem_req) {
                throw ProtocolError("memory_bus: request withdrawn before grant");
            }
            delay_counter_--;
            if (delay_counter_ <= 0) {
                accept();
                state_ = BusState::IDLE;
            }
            break;
        }

        case BusState::REFRESH: {
            delay_counter_--;
            if (delay_counter_ <= 0) {
                state_ = BusState::IDLE;
            }
            break;
        }
    }

    // -- Data channel: one beat per cycle from the oldest burst --
    if (!queue_.empty() && cycle_ >= queue_.front().data_cycle) {
        Burst& burst = queue_.front();
        rdata  = memory_.read_beat(burst.addr + burst.sent * BEAT_BYTES);
        rid    = burst.id;
        rvalid = 1;
        burst.sent++;
        beats_returned_++;

        if (burst.sent == burst.beats) {
            rlast = 1;
            queue_.pop_front();
        }
    }
}
