// Scanline fetch controller implementation.

#include "fetch_controller.hpp"

#include "video_error.hpp"

#include <string>

BurstPlan plan_bursts(const FetchRequest& req) {
    return plan_bursts(req, last_byte_address(req), bytes_to_page_boundary(req.address));
}

BurstPlan plan_bursts(const FetchRequest& req, uint32_t last_byte, uint32_t bytes_to_boundary) {
    if (req.words == 0) {
        throw ConfigError("fetch_controller: zero-length fetch at " + hex32(req.address) +
                          " (line pitch is 0)");
    }

    uint32_t total_bytes = static_cast<uint32_t>(req.words) * BEAT_BYTES;
    BurstPlan plan;

    if ((req.address >> 12) != (last_byte >> 12)) {
        if (bytes_to_boundary % BEAT_BYTES != 0) {
            throw ConfigError("fetch_controller: fetch at " + hex32(req.address) + " is " +
                              std::to_string(bytes_to_boundary) +
                              " bytes from a page boundary, not a whole number of beats");
        }

        uint32_t first_beats     = bytes_to_boundary / BEAT_BYTES;
        uint32_t remainder_bytes = total_bytes - bytes_to_boundary;
        uint32_t remainder_beats = remainder_bytes / BEAT_BYTES;

        if (first_beats > MAX_BURST_BEATS || remainder_beats > MAX_BURST_BEATS) {
            throw ConfigError("fetch_controller: split fetch at " + hex32(req.address) + " of " +
                              std::to_string(req.words) + " beats needs a " +
                              std::to_string(remainder_beats) + "-beat remainder burst (max " +
                              std::to_string(MAX_BURST_BEATS) + ")");
        }

        plan.split = true;
        plan.first = BurstDescriptor{
            .address = req.address,
            .len     = static_cast<uint16_t>(first_beats - 1),
            .id      = FETCH_BURST_ID,
        };
        plan.remainder = BurstDescriptor{
            .address = req.address + bytes_to_boundary,
            .len     = static_cast<uint16_t>(remainder_beats - 1),
            .id      = FETCH_BURST_ID,
        };
    } else {
        if (req.words > MAX_BURST_BEATS) {
            throw ConfigError("fetch_controller: fetch at " + hex32(req.address) + " of " +
                              std::to_string(req.words) + " beats exceeds the " +
                              std::to_string(MAX_BURST_BEATS) + "-beat burst limit");
        }
        plan.first = BurstDescriptor{
            .address = req.address,
            .len     = static_cast<uint16_t>(req.words - 1),
            .id      = FETCH_BURST_ID,
        };
    }

    return plan;
}

const char* to_string(FetchState state) {
    switch (state) {
        case FetchState::IDLE:                   return "IDLE";
        case FetchState::AWAIT_BUF_RESET_ASSERT: return "AWAIT_BUF_RESET_ASSERT";
        case FetchState::AWAIT_BUF_RESET_CLEAR:  return "AWAIT_BUF_RESET_CLEAR";
        case FetchState::ISSUE_SIMPLE:           return "ISSUE_SIMPLE";
        case FetchState::ISSUE_SPLIT_FIRST:      return "ISSUE_SPLIT_FIRST";
        case FetchState::AWAIT_GRANT:            return "AWAIT_GRANT";
        case FetchState::ISSUE_SPLIT_REMAINDER:  return "ISSUE_SPLIT_REMAINDER";
    }
    return "?";
}

FetchController::FetchController() {
    reset();
}

void FetchController::reset() {
    state_  = FetchState::IDLE;
    halted_ = false;

    req_sync_.reset();

    captured_          = FetchRequest{};
    last_byte_         = 0;
    bytes_to_boundary_ = 0;
    plan_              = BurstPlan{};
    remainder_pending_ = false;

    buf_rst       = 0;
    mem_req       = 0;
    mem_addr      = 0;
    mem_burst_len = 0;
    mem_burst_id  = 0;

    requests_seen_    = 0;
    requests_dropped_ = 0;
    bursts_issued_    = 0;
    splits_           = 0;
}

void FetchController::issue(const BurstDescriptor& burst) {
    mem_req       = 1;
    mem_addr      = burst.address;
    mem_burst_len = static_cast<uint8_t>(burst.len);
    mem_burst_id  = burst.id;
}

void FetchController::fail_protocol(const char* what) {
    throw ProtocolError(std::string("fetch_controller: ") + what + " in state " +
                        to_string(state_));
}

void FetchController::eval() {
    if (halted_) {
        return;
    }

    try {
        bool req_edge = req_sync_.eval(req_toggle);

        if (mem_grant && !mem_req) {
            fail_protocol("mem_grant with no outstanding request");
        }

        if (req_edge && state_ != FetchState::IDLE) {
            requests_dropped_++;
        }

        switch (state_) {
            case FetchState::IDLE: {
                if (req_edge) {
                    captured_ = FetchRequest{.address = req_addr, .words = req_words};
                    buf_rst   = 1;
                    requests_seen_++;
                    state_ = FetchState::AWAIT_BUF_RESET_ASSERT;
                }
                break;
            }

            case FetchState::AWAIT_BUF_RESET_ASSERT: {
                last_byte_         = last_byte_address(captured_);
                bytes_to_boundary_ = bytes_to_page_boundary(captured_.address);
                if (buf_wr_rst_busy) {
                    buf_rst = 0;
                    state_  = FetchState::AWAIT_BUF_RESET_CLEAR;
                }
                break;
            }

            case FetchState::AWAIT_BUF_RESET_CLEAR: {
                if (!buf_wr_rst_busy && !buf_rd_rst_busy) {
                    plan_ = plan_bursts(captured_, last_byte_, bytes_to_boundary_);
                    remainder_pending_ = plan_.split;
                    if (plan_.split) {
                        splits_++;
                        state_ = FetchState::ISSUE_SPLIT_FIRST;
                    } else {
                        state_ = FetchState::ISSUE_SIMPLE;
                    }
                }
                break;
            }

            case FetchState::ISSUE_SIMPLE:
            case FetchState::ISSUE_SPLIT_FIRST: {
                issue(plan_.first);
                state_ = FetchState::AWAIT_GRANT;
                break;
            }

            case FetchState::AWAIT_GRANT: {
                if (mem_grant) {
                    mem_req = 0;
                    bursts_issued_++;
                    state_ = remainder_pending_ ? FetchState::ISSUE_SPLIT_REMAINDER
                                                : FetchState::IDLE;
                }
                break;
            }

            case FetchState::ISSUE_SPLIT_REMAINDER: {
                remainder_pending_ = false;
                issue(plan_.remainder);
                state_ = FetchState::AWAIT_GRANT;
                break;
            }
        }
    } catch (const VideoError&) {
        halted_ = true;
        throw;
    }
}
