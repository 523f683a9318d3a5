// Display output core implementation.

#include "video_core.hpp"

#include "video_error.hpp"

#include <cmath>
#include <string>

uint64_t period_ps_for_mhz(double mhz) {
    if (!(mhz > 0.0)) {
        throw ConfigError("video_core: clock frequency must be positive, got " +
                          std::to_string(mhz) + " MHz");
    }
    auto period = static_cast<uint64_t>(std::llround(1.0e6 / mhz));
    return period == 0 ? 1 : period;
}

VideoCore::VideoCore(const VideoCoreConfig& config)
    : config_(config),
      memory_(config.memory_bytes),
      bus_(memory_),
      buffer_(config.buffer_depth) {
    reset();
}

void VideoCore::reset() {
    regs_.reset();
    timing_.reset();
    fetch_.reset();
    bus_.reset();
    buffer_.reset();
    scanout_.reset();

    clocks_[static_cast<size_t>(Domain::CONFIG)] = ClockDomain{
        .name = "config", .period_ps = period_ps_for_mhz(config_.config_mhz)};
    clocks_[static_cast<size_t>(Domain::PIXEL)] = ClockDomain{
        .name = "pixel", .period_ps = period_ps_for_mhz(config_.pixel_mhz)};
    clocks_[static_cast<size_t>(Domain::MEMORY)] = ClockDomain{
        .name = "memory", .period_ps = period_ps_for_mhz(config_.mem_mhz)};
    for (auto& clk : clocks_) {
        clk.next_edge_ps = clk.period_ps;
    }

    time_ps_ = 0;
    halted_  = false;
    host_queue_.clear();
    output_ = VideoOutput{};
}

void VideoCore::write_reg(uint32_t addr, uint32_t data, uint8_t strb) {
    host_queue_.push_back(HostWrite{.addr = addr, .data = data, .strb = strb});
}

void VideoCore::load_mode() {
    write_reg(REG_LOAD_MODE, 1, 0x1);
}

void VideoCore::program_mode(const VideoMode& mode) {
    write_reg(REG_H_DISPLAY, pack_fields(mode.h.width, mode.h.start));
    write_reg(REG_H_SYNC, pack_fields(mode.h.total, mode.h.sync));
    write_reg(REG_V_DISPLAY, pack_fields(mode.v.width, mode.v.start));
    write_reg(REG_V_SYNC, pack_fields(mode.v.total, mode.v.sync));
    write_reg(REG_FORMAT, (static_cast<uint32_t>(mode.pixel_format) << 8) | mode.polarity);
    write_reg(REG_BASE_ADDR, mode.base_addr);
    write_reg(REG_PITCH, mode.pitch);
    load_mode();
}

bool VideoCore::step() {
    if (halted_) {
        return false;
    }

    size_t next = 0;
    for (size_t i = 1; i < clocks_.size(); i++) {
        if (clocks_[i].next_edge_ps < clocks_[next].next_edge_ps) {
            next = i;
        }
    }

    ClockDomain& clk = clocks_[next];
    time_ps_ = clk.next_edge_ps;
    clk.next_edge_ps += clk.period_ps;
    clk.ticks++;

    try {
        switch (static_cast<Domain>(next)) {
            case Domain::CONFIG: tick_config(); break;
            case Domain::PIXEL:  tick_pixel();  break;
            case Domain::MEMORY: tick_memory(); break;
        }
    } catch (const VideoError&) {
        halted_ = true;
        throw;
    }
    return true;
}

void VideoCore::run_pixel_ticks(uint64_t count) {
    const ClockDomain& pix = clock(Domain::PIXEL);
    uint64_t target = pix.ticks + count;
    while (pix.ticks < target && step()) {
    }
}

void VideoCore::run_frames(uint64_t count) {
    uint64_t target = timing_.frame_count() + count;
    while (timing_.frame_count() < target && step()) {
    }
}

void VideoCore::drain_host_writes() {
    while (!host_queue_.empty() && step()) {
    }
}

void VideoCore::tick_config() {
    if (!host_queue_.empty()) {
        const HostWrite& w = host_queue_.front();
        regs_.wr_en   = 1;
        regs_.wr_addr = w.addr;
        regs_.wr_data = w.data;
        regs_.wr_strb = w.strb;
        host_queue_.pop_front();
    } else {
        regs_.wr_en = 0;
    }
    regs_.eval();
}

void VideoCore::tick_pixel() {
    timing_.load_mode = regs_.load_mode.level;
    timing_.shadow    = regs_.load_mode.payload;
    timing_.eval();

    scanout_.h_blank   = timing_.h_blank;
    scanout_.v_blank   = timing_.v_blank;
    scanout_.buf_empty = buffer_.empty;
    scanout_.buf_data  = buffer_.rd_data;
    scanout_.eval();

    buffer_.rd_en = scanout_.buf_rd_en;
    buffer_.eval_read();

    const VideoMode& mode = timing_.active();
    output_ = VideoOutput{
        .hsync          = timing_.h_sync,
        .vsync          = timing_.v_sync,
        .hblank         = timing_.h_blank,
        .vblank         = timing_.v_blank,
        .pixel          = scanout_.pixel,
        .display_enable = scanout_.display_enable,
        .h_count        = timing_.h_count,
        .v_count        = timing_.v_count,
        .x              = static_cast<int32_t>(timing_.h_count) - mode.h.start - 1,
        .y              = static_cast<int32_t>(timing_.v_count) - mode.v.start - 1,
    };

    if (pixel_callback_) {
        pixel_callback_(output_);
    }
}

void VideoCore::tick_memory() {
    bus_.mem_req       = fetch_.mem_req;
    bus_.mem_addr      = fetch_.mem_addr;
    bus_.mem_burst_len = fetch_.mem_burst_len;
    bus_.mem_burst_id  = fetch_.mem_burst_id;
    bus_.eval();

    buffer_.rst     = fetch_.buf_rst;
    buffer_.wr_en   = bus_.rvalid;
    buffer_.wr_data = bus_.rdata;
    buffer_.eval_write();

    fetch_.req_toggle      = timing_.fetch.level;
    fetch_.req_addr        = timing_.fetch.payload.address;
    fetch_.req_words       = timing_.fetch.payload.words;
    fetch_.buf_wr_rst_busy = buffer_.wr_rst_busy;
    fetch_.buf_rd_rst_busy = buffer_.rd_rst_busy;
    fetch_.mem_grant       = bus_.mem_grant;
    fetch_.eval();
}

VideoCoreStats VideoCore::stats() const {
    return VideoCoreStats{
        .frames           = timing_.frame_count(),
        .mode_reloads     = timing_.reload_count(),
        .fetch_requests   = fetch_.requests_seen(),
        .requests_dropped = fetch_.requests_dropped(),
        .bursts           = fetch_.bursts_issued(),
        .splits           = fetch_.splits(),
        .beats            = bus_.beats_returned(),
        .buffer_resets    = buffer_.resets(),
        .overflows        = buffer_.overflows(),
        .underflows       = scanout_.underflows(),
    };
}
