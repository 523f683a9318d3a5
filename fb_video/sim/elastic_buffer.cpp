// Line buffer implementation.

#include "elastic_buffer.hpp"

#include "video_error.hpp"

#include <string>

ElasticBuffer::ElasticBuffer(uint32_t depth)
    : depth_(depth), ptr_mask_(2 * depth - 1), mem_(depth) {
    if (depth == 0 || (depth & (depth - 1)) != 0) {
        throw ConfigError("elastic_buffer: depth " + std::to_string(depth) +
                          " is not a power of two");
    }
    reset();
}

void ElasticBuffer::reset() {
    wr_ptr_      = 0;
    wr_ptr_gray_ = 0;
    rd_ptr_sync_.fill(0);
    rst_prev_ = 0;
    flush_req_.reset();
    flush_ack_sync_.reset();

    rd_ptr_      = 0;
    rd_ptr_gray_ = 0;
    wr_ptr_sync_.fill(0);
    flush_req_sync_.reset();
    flush_ack_.reset();

    full        = 0;
    wr_rst_busy = 0;
    rd_rst_busy = 0;
    empty       = 1;
    rd_data     = Beat{};

    overflows_        = 0;
    dropped_in_reset_ = 0;
    resets_           = 0;
}

void ElasticBuffer::eval_write() {
    // Read pointer as seen from this domain.
    for (int i = PTR_SYNC_STAGES - 1; i > 0; i--) {
        rd_ptr_sync_[i] = rd_ptr_sync_[i - 1];
    }
    rd_ptr_sync_[0] = rd_ptr_gray_;

    bool ack_edge = flush_ack_sync_.eval(flush_ack_.level);

    if (rst && !rst_prev_) {
        wr_ptr_      = 0;
        wr_ptr_gray_ = 0;
        wr_rst_busy  = 1;
        rd_rst_busy  = 1;
        flush_req_.flip();
    } else if (!rst && wr_rst_busy) {
        wr_rst_busy = 0;
    }
    rst_prev_ = rst;

    if (ack_edge && rd_rst_busy) {
        rd_rst_busy = 0;
        resets_++;
    }

    if (wr_en) {
        if (wr_rst_busy || rd_rst_busy) {
            dropped_in_reset_++;
        } else if (full) {
            overflows_++;
        } else {
            mem_[wr_ptr_ & (depth_ - 1)] = wr_data;
            wr_ptr_      = (wr_ptr_ + 1) & ptr_mask_;
            wr_ptr_gray_ = to_gray(wr_ptr_);
        }
    }

    uint32_t rd_seen = from_gray(rd_ptr_sync_[PTR_SYNC_STAGES - 1]);
    full = ((wr_ptr_ - rd_seen) & ptr_mask_) == depth_ ? 1 : 0;
}

void ElasticBuffer::eval_read() {
    // Write pointer as seen from this domain.
    for (int i = PTR_SYNC_STAGES - 1; i > 0; i--) {
        wr_ptr_sync_[i] = wr_ptr_sync_[i - 1];
    }
    wr_ptr_sync_[0] = wr_ptr_gray_;

    if (flush_req_sync_.eval(flush_req_.level)) {
        rd_ptr_      = 0;
        rd_ptr_gray_ = 0;
        wr_ptr_sync_.fill(0);
        flush_ack_.flip();
    } else if (rd_en && !empty) {
        rd_ptr_      = (rd_ptr_ + 1) & ptr_mask_;
        rd_ptr_gray_ = to_gray(rd_ptr_);
    }

    uint32_t wr_seen = from_gray(wr_ptr_sync_[PTR_SYNC_STAGES - 1]);
    empty = (rd_ptr_ == wr_seen) ? 1 : 0;
    rd_data = empty ? Beat{} : mem_[rd_ptr_ & (depth_ - 1)];
}
