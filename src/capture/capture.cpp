#include "capture.hpp"

static const t_crc_in cleared = {0, 0, 0, 0};

// Latches the raw inputs and hands back the snapshot taken on the previous
// step, which is what the update logic works on this step.
t_crc_in capture(t_capture &cap, t_crc_in din, t_crc_mode mode)
{
#pragma HLS INLINE
    t_crc_in cur = din;

    if (mode == MODE_SINGLE_WORD) {
        cur.eof = 0;
    }
    return cap.shift(cur);
}

t_crc_in capture_peek(t_capture &cap)
{
    return cap.read();
}

void capture_reset(t_capture &cap)
{
    unsigned i;

 CLEAR: for (i = 0; i < CRC_PIPE_DEPTH; i++) {
        cap.shift(cleared);
    }
}
