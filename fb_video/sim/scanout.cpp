// 1 bpp scanout serializer implementation.

#include "scanout.hpp"

Scanout::Scanout() {
    reset();
}

void Scanout::reset() {
    current_   = Beat{};
    bit_index_ = 0;

    buf_rd_en      = 0;
    pixel          = 0;
    display_enable = 0;

    underflows_     = 0;
    beats_consumed_ = 0;
}

void Scanout::eval() {
    buf_rd_en      = 0;
    display_enable = (!h_blank && !v_blank) ? 1 : 0;

    if (!display_enable) {
        bit_index_ = 0;
        pixel      = 0;
        return;
    }

    if (bit_index_ == 0) {
        if (buf_empty) {
            current_ = Beat{};
            underflows_++;
        } else {
            current_  = buf_data;
            buf_rd_en = 1;
            beats_consumed_++;
        }
    }

    pixel      = beat_pixel(current_, bit_index_);
    bit_index_ = (bit_index_ + 1) % PIXELS_PER_BEAT;
}
