// Video timing generator implementation.

#include "video_timing.hpp"

VideoTiming::VideoTiming() {
    reset();
}

void VideoTiming::reset() {
    active_        = default_video_mode();
    rounded_pitch_ = round_pitch(active_.pitch);

    // Park both counters on their wrap value so the first edge lands on (0, 0).
    h_count = active_.h.total;
    v_count = active_.v.total;
    parked_  = true;

    load_sync_.reset();
    fetch.reset();

    frame_count_  = 0;
    fetch_count_  = 0;
    reload_count_ = 0;

    update_outputs();
}

void VideoTiming::eval() {
    // Counter update, decoded against the set that was active before this edge.
    if (h_count >= active_.h.total) {
        h_count = 0;
        if (v_count >= active_.v.total) {
            v_count = 0;
            if (!parked_) {
                frame_count_++;
            }
        } else {
            v_count++;
        }
    } else {
        h_count++;
    }
    parked_ = false;

    // Active-set reload on the synchronised load_mode edge. The whole
    // struct is replaced in one assignment.
    if (load_sync_.eval(load_mode)) {
        active_        = shadow;
        rounded_pitch_ = round_pitch(shadow.pitch);
        reload_count_++;
    }

    update_outputs();

    // Fetch trigger: first position after the last displayed pixel, on
    // lines whose successor is displayed.
    uint32_t fetch_pos = static_cast<uint32_t>(active_.h.start) + active_.h.width + 1;
    bool fetch_line = v_count >= active_.v.start &&
                      v_count < static_cast<uint32_t>(active_.v.start) + active_.v.width;

    if (h_count == fetch_pos && fetch_line) {
        uint32_t line = v_count - active_.v.start;
        FetchRequest req{
            .address = active_.base_addr + line * rounded_pitch_,
            .words   = static_cast<uint16_t>(rounded_pitch_ / BEAT_BYTES),
        };
        fetch.signal(req);
        fetch_count_++;
    }
}

void VideoTiming::update_outputs() {
    h_blank = in_display(h_count, active_.h.start, active_.h.width) ? 0 : 1;
    v_blank = in_display(v_count, active_.v.start, active_.v.width) ? 0 : 1;

    h_sync = sync_level(in_sync(h_count, active_.h.total, active_.h.sync), active_.polarity);
    v_sync = sync_level(in_sync(v_count, active_.v.total, active_.v.sync), active_.polarity >> 1);
}
