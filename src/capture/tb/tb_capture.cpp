#include <stdio.h>

#include "capture.hpp"

static int same(t_crc_in a, t_crc_in b){
    return (a.data == b.data) && (a.en == b.en) && (a.sof == b.sof) && (a.eof == b.eof);
}

static void show(const char* tag, t_crc_in w){
    printf("%s DATA 0x%08x, EN %d, SOF %d, EOF %d\n", tag, w.data.to_uint(),
           w.en.to_int(), w.sof.to_int(), w.eof.to_int());
}

int main()
{
    t_capture cap;
    t_crc_in cleared = {0, 0, 0, 0};
    t_crc_in w0 = {0x12345678, 1, 1, 0};
    t_crc_in w1 = {0x9abcdef0, 1, 0, 1};
    t_crc_in w2 = {0x0badf00d, 0, 1, 1};
    t_crc_in snap;

    capture_reset(cap);
    if (!same(capture_peek(cap), cleared)) {
        show("RESET", capture_peek(cap));
        return 1;
    }

    // Each step hands back what was presented on the step before.
    snap = capture(cap, w0, MODE_FRAME);
    if (!same(snap, cleared) || !same(capture_peek(cap), w0)) {
        show("STEP 0", snap);
        return 1;
    }
    snap = capture(cap, w1, MODE_FRAME);
    if (!same(snap, w0)) {
        show("STEP 1", snap);
        return 1;
    }
    snap = capture(cap, w2, MODE_FRAME);
    if (!same(snap, w1)) {
        show("STEP 2", snap);
        return 1;
    }

    // Reset drops the word in flight.
    capture_reset(cap);
    snap = capture(cap, w0, MODE_FRAME);
    if (!same(snap, cleared)) {
        show("AFTER RESET", snap);
        return 1;
    }

    // No end-of-frame input in single-word mode.
    capture(cap, w1, MODE_SINGLE_WORD);
    snap = capture_peek(cap);
    if ((snap.eof != 0) || (snap.data != w1.data) || (snap.en != 1)) {
        show("SINGLE WORD", snap);
        return 1;
    }

    printf("Capture tests passed\n");
    return 0;
}
