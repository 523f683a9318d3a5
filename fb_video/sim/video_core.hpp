// Display output core: timing generator, fetch path and scanout wired
// together across three free-running clock domains.
//
//   config domain:  RegisterBank
//   pixel domain:   VideoTiming -> Scanout <- ElasticBuffer (read side)
//   memory domain:  FetchController -> MemoryBusModel -> ElasticBuffer (write side)
//
// Domains share nothing but toggle channels (load_mode, fetch request,
// buffer flush) and the line buffer's synchronised pointers. Each call to
// step() advances whichever domain has the earliest pending clock edge;
// edges that coincide are taken in the order config, pixel, memory.
//
// Within a domain tick every unit is evaluated once, after its input ports
// have been copied from the current outputs of the units feeding it.
//
// Host access goes through write_reg(), which queues a register write that
// the config domain applies on a later config edge, one write per edge.
//
// References:
//   register_bank.hpp, video_timing.hpp, fetch_controller.hpp,
//   memory_bus_model.hpp, elastic_buffer.hpp, scanout.hpp

#pragma once

#include "elastic_buffer.hpp"
#include "fetch_controller.hpp"
#include "frame_memory.hpp"
#include "memory_bus_model.hpp"
#include "register_bank.hpp"
#include "scanout.hpp"
#include "video_timing.hpp"

#include <array>
#include <cstdint>
#include <deque>
#include <functional>
#include <utility>

/// Clock domain identifiers, in tie-break order.
enum class Domain : uint8_t {
    CONFIG = 0,
    PIXEL  = 1,
    MEMORY = 2,
};

/// One free-running clock.
struct ClockDomain {
    const char* name = "";
    uint64_t period_ps    = 0; ///< Clock period in picoseconds
    uint64_t next_edge_ps = 0; ///< Time of the next rising edge
    uint64_t ticks        = 0; ///< Rising edges taken so far
};

/// Clock period in picoseconds for a frequency in MHz.
uint64_t period_ps_for_mhz(double mhz);

/// Construction-time configuration of the core.
struct VideoCoreConfig {
    double   config_mhz   = 50.0;   ///< Register bus clock
    double   pixel_mhz    = 25.175; ///< Pixel clock (VGA 640x480 @ 60 Hz)
    double   mem_mhz      = 100.0;  ///< Memory clock
    uint32_t memory_bytes = FrameMemory::DEFAULT_BYTES;
    uint32_t buffer_depth = ElasticBuffer::DEFAULT_DEPTH;
};

/// Video output pins for one pixel clock edge.
struct VideoOutput {
    uint8_t  hsync          = 0;
    uint8_t  vsync          = 0;
    uint8_t  hblank         = 1;
    uint8_t  vblank         = 1;
    uint8_t  pixel          = 0;
    uint8_t  display_enable = 0;
    uint16_t h_count        = 0;
    uint16_t v_count        = 0;
    int32_t  x              = 0; ///< Column within the display window
    int32_t  y              = 0; ///< Row within the display window
};

/// Diagnostic counters gathered from every unit.
struct VideoCoreStats {
    uint64_t frames           = 0;
    uint64_t mode_reloads     = 0;
    uint64_t fetch_requests   = 0;
    uint64_t requests_dropped = 0;
    uint64_t bursts           = 0;
    uint64_t splits           = 0;
    uint64_t beats            = 0;
    uint64_t buffer_resets    = 0;
    uint64_t overflows        = 0;
    uint64_t underflows       = 0;
};

/// Display output core.
class VideoCore {
public:
    using PixelCallback = std::function<void(const VideoOutput&)>;

    explicit VideoCore(const VideoCoreConfig& config = VideoCoreConfig{});

    // Non-copyable: the bus model holds a reference to the memory.
    VideoCore(const VideoCore&) = delete;
    VideoCore& operator=(const VideoCore&) = delete;

    /// Queue a host register write (applied on a later config edge).
    void write_reg(uint32_t addr, uint32_t data, uint8_t strb = 0xF);

    /// Queue a write to LOAD_MODE, committing the shadow set.
    void load_mode();

    /// Queue a full mode programming sequence followed by LOAD_MODE.
    void program_mode(const VideoMode& mode);

    /// True when every queued host write has been applied.
    bool host_idle() const {
        return host_queue_.empty();
    }

    /// Advance the domain with the earliest pending edge.
    ///
    /// @return false (without advancing) once the core has halted.
    /// @throws VideoError on the edge where a fatal condition is detected.
    bool step();

    /// Step until `count` more pixel edges have been taken.
    void run_pixel_ticks(uint64_t count);

    /// Step until the timing generator has wrapped `count` more frames.
    void run_frames(uint64_t count);

    /// Step until all queued host writes have been applied.
    void drain_host_writes();

    /// Reset every unit and every clock; memory contents are kept.
    void reset();

    bool halted() const {
        return halted_;
    }

    /// Simulation time of the most recent edge.
    uint64_t time_ps() const {
        return time_ps_;
    }

    const ClockDomain& clock(Domain d) const {
        return clocks_[static_cast<size_t>(d)];
    }

    /// Receive every pixel-domain output (optional).
    void set_pixel_callback(PixelCallback cb) {
        pixel_callback_ = std::move(cb);
    }

    const VideoOutput& output() const {
        return output_;
    }

    VideoCoreStats stats() const;

    FrameMemory& memory() {
        return memory_;
    }
    const RegisterBank& registers() const {
        return regs_;
    }
    const VideoTiming& timing() const {
        return timing_;
    }
    const FetchController& fetcher() const {
        return fetch_;
    }
    const MemoryBusModel& bus() const {
        return bus_;
    }
    const ElasticBuffer& buffer() const {
        return buffer_;
    }
    const Scanout& scanout() const {
        return scanout_;
    }

private:
    struct HostWrite {
        uint32_t addr;
        uint32_t data;
        uint8_t  strb;
    };

    void tick_config();
    void tick_pixel();
    void tick_memory();

    VideoCoreConfig config_;

    FrameMemory     memory_;
    RegisterBank    regs_;
    VideoTiming     timing_;
    FetchController fetch_;
    MemoryBusModel  bus_;
    ElasticBuffer   buffer_;
    Scanout         scanout_;

    std::array<ClockDomain, 3> clocks_;
    uint64_t time_ps_ = 0;
    bool halted_ = false;

    std::deque<HostWrite> host_queue_;
    VideoOutput output_;
    PixelCallback pixel_callback_;
};
