#include <stdio.h>

#include "engine.hpp"
#include "fcs.hpp"
#include "crc_ref.hpp"

#define check(cond, ...) do {                   \
        if (!(cond)) {                          \
            printf("FAIL %s: ", __func__);      \
            printf(__VA_ARGS__);                \
            printf("\n");                       \
            return 1;                           \
        }                                       \
    } while(0)

static const t_crc_in IDLE = {0, 0, 0, 0};

static t_crc_in word(ap_uint<32> data, int sof, int eof){
    t_crc_in w = {data, 1, sof, eof};
    return w;
}

static int test_golden_frame(){
    t_crc_engine eng;
    t_crc_out out;

    crc_init(&eng, CRC_CFG_FRAME_REV);
    out = crc_step(&eng, word(0x12345678, 1, 1));
    check(!out.valid, "valid on capture step");
    out = crc_step(&eng, IDLE);
    check(out.valid, "no valid one step after eof");
    check(out.crc == 0xaf6d87d2, "crc 0x%08x", out.crc.to_uint());

    crc_reset(&eng);
    crc_step(&eng, word(0x12345678, 1, 0));
    crc_step(&eng, word(0x9abcdef0, 0, 1));
    out = crc_step(&eng, IDLE);
    check(out.valid && (out.crc == 0x86829deb), "two-word crc 0x%08x", out.crc.to_uint());
    return 0;
}

static int test_latency(){
    t_crc_engine eng;
    t_crc_out out;
    ap_uint<32> acc = CRC32_SEED;

    crc_init(&eng, CRC_CFG_FRAME_REV);
    out = crc_step(&eng, word(0x11111111, 1, 0));
    check(!out.valid && (out.crc == (ap_uint<32>) ~acc), "accumulator moved on capture step");

    out = crc_step(&eng, word(0x22222222, 0, 0));
    crc32_rev(0x11111111, &acc);
    check(!out.valid && (out.crc == (ap_uint<32>) ~acc), "first word not folded one step later");

    out = crc_step(&eng, word(0x33333333, 0, 1));
    crc32_rev(0x22222222, &acc);
    check(!out.valid && (out.crc == (ap_uint<32>) ~acc), "second word not folded one step later");

    out = crc_step(&eng, IDLE);
    crc32_rev(0x33333333, &acc);
    check(out.valid && (out.crc == (ap_uint<32>) ~acc), "valid not exactly one step after eof");

    out = crc_step(&eng, IDLE);
    check(!out.valid, "valid held for more than one step");
    check(out.crc == (ap_uint<32>) ~acc, "idle step changed the accumulator");
    return 0;
}

static int test_back_to_back(){
    t_crc_engine eng;
    t_crc_out out;
    ap_uint<32> a[2] = {0xcafebabe, 0x01020304};
    ap_uint<32> b[1] = {0x12345678};
    ap_uint<32> c[3] = {0xffffffff, 0x00000000, 0xa5a5a5a5};

    crc_init(&eng, CRC_CFG_FRAME_REV);
    crc_step(&eng, word(a[0], 1, 0));
    crc_step(&eng, word(a[1], 0, 1));
    out = crc_step(&eng, word(b[0], 1, 1));
    check(out.valid && (out.crc == crc32_ref_frame(CRC_CFG_FRAME_REV, a, 2)), "frame A 0x%08x", out.crc.to_uint());
    out = crc_step(&eng, word(c[0], 1, 0));
    check(out.valid && (out.crc == crc32_ref_frame(CRC_CFG_FRAME_REV, b, 1)), "frame B 0x%08x", out.crc.to_uint());
    out = crc_step(&eng, word(c[1], 0, 0));
    check(!out.valid, "valid inside frame C");
    out = crc_step(&eng, word(c[2], 0, 1));
    check(!out.valid, "valid inside frame C");
    out = crc_step(&eng, IDLE);
    check(out.valid && (out.crc == crc32_ref_frame(CRC_CFG_FRAME_REV, c, 3)), "frame C 0x%08x", out.crc.to_uint());
    return 0;
}

static int test_reset(){
    t_crc_engine eng;
    t_crc_out out;

    crc_init(&eng, CRC_CFG_FRAME_REV);
    crc_step(&eng, word(0x12345678, 1, 0));
    crc_step(&eng, word(0x9abcdef0, 0, 1));

    // The eof word is still in the snapshot and must never complete.
    crc_reset(&eng);
    out = crc_output(&eng);
    check(!out.valid && (out.crc == (ap_uint<32>) ~((ap_uint<32>) CRC32_SEED)), "reset output 0x%08x", out.crc.to_uint());

    out = crc_step(&eng, word(0xdeadbeef, 0, 0));
    check(!out.valid, "valid after reset");
    check(out.crc == 0x00000000, "accumulator not at seed after reset: 0x%08x", out.crc.to_uint());

    // Reset between the eof step and its result.
    crc_reset(&eng);
    crc_step(&eng, word(0x12345678, 1, 1));
    crc_reset(&eng);
    out = crc_step(&eng, IDLE);
    check(!out.valid && (out.crc == 0x00000000), "pending result survived reset");
    return 0;
}

static int test_violation(){
    t_crc_engine eng;
    t_crc_out out;
    t_crc_in bad_sof = {0x0badf00d, 0, 1, 0};
    t_crc_in bad_eof = {0x0badf00d, 0, 0, 1};
    t_crc_in bad_both = {0x0badf00d, 0, 1, 1};
    ap_uint<32> held;

    crc_init(&eng, CRC_CFG_FRAME_REV);
    crc_step(&eng, word(0x12345678, 1, 0));
    out = crc_step(&eng, bad_sof);
    check(out.sof_err && !out.eof_err, "sof violation not reported");
    held = out.crc;
    out = crc_step(&eng, bad_eof);
    check(!out.sof_err && out.eof_err, "eof violation not reported");
    check(out.crc == held && !out.valid, "violation changed the accumulator");
    out = crc_step(&eng, bad_both);
    check(out.sof_err && out.eof_err, "double violation not reported");
    check(out.crc == held && !out.valid, "violation changed the accumulator");

    // The frame is still open and completes as if nothing happened.
    crc_step(&eng, word(0x9abcdef0, 0, 1));
    out = crc_step(&eng, IDLE);
    check(!out.sof_err && !out.eof_err, "spurious violation");
    check(out.valid && (out.crc == 0x86829deb), "frame after violation 0x%08x", out.crc.to_uint());

    // Reset holds the checks off.
    crc_reset(&eng);
    out = crc_step(&eng, word(0x00000000, 1, 1));
    check(!out.sof_err && !out.eof_err, "violation on legal word");
    return 0;
}

static int test_single_word(){
    t_crc_engine eng;
    t_crc_out out;
    t_crc_in bad_eof = {0x0badf00d, 0, 0, 1};

    crc_init(&eng, CRC_CFG_SINGLE_FWD);
    out = crc_step(&eng, word(0x12345678, 1, 0));
    check(!out.valid && (out.crc == CRC32_SEED), "single-word capture step");
    out = crc_step(&eng, word(0x00000000, 0, 0));
    check(out.valid && (out.crc == 0xdf8a8a2b), "single-word crc 0x%08x", out.crc.to_uint());
    out = crc_step(&eng, word(0xffffffff, 0, 0));
    check(out.valid, "no valid for second word");

    // Without a start flag the accumulator keeps running.
    ap_uint<32> acc = 0xdf8a8a2b;
    crc32_fwd(0x00000000, &acc);
    check(out.crc == acc, "running crc 0x%08x", out.crc.to_uint());

    // A start flag reseeds, and there is no eof to check.
    crc_step(&eng, word(0x12345678, 1, 0));
    out = crc_step(&eng, bad_eof);
    check(out.valid && (out.crc == 0xdf8a8a2b), "reseeded crc 0x%08x", out.crc.to_uint());
    check(!out.eof_err, "eof checked in single-word mode");
    out = crc_step(&eng, IDLE);
    check(!out.valid, "valid without enable");
    return 0;
}

static int test_open_frame(){
    t_crc_engine eng;
    t_crc_out out;
    ap_uint<32> w[3] = {0x11223344, 0x55667788, 0x99aabbcc};

    // Without eof the next word keeps folding into the same frame.
    crc_init(&eng, CRC_CFG_FRAME_REV);
    crc_step(&eng, word(w[0], 1, 0));
    crc_step(&eng, IDLE);
    crc_step(&eng, IDLE);
    out = crc_step(&eng, word(w[1], 0, 0));
    check(!out.valid, "valid on open frame");
    crc_step(&eng, word(w[2], 0, 1));
    out = crc_step(&eng, IDLE);
    check(out.valid && (out.crc == crc32_ref_frame(CRC_CFG_FRAME_REV, w, 3)), "open frame 0x%08x", out.crc.to_uint());
    return 0;
}

static int test_fcs_ok(){
    t_crc_engine eng;
    t_crc_out out;
    ap_uint<32> w[2] = {0xcafebabe, 0x01020304};
    ap_uint<32> fcs = crc32_ref_frame(CRC_CFG_FRAME_REV, w, 2);

    crc_init(&eng, CRC_CFG_FRAME_REV);
    crc_step(&eng, word(w[0], 1, 0));
    crc_step(&eng, word(w[1], 0, 0));
    crc_step(&eng, word(fcs, 0, 1));
    out = crc_step(&eng, IDLE);
    check(out.valid && out.fcs_ok, "good fcs rejected");
    check(out.crc == (ap_uint<32>) ~((ap_uint<32>) CRC32_RESIDUE_CPL), "residue 0x%08x", out.crc.to_uint());

    crc_step(&eng, word(w[0], 1, 0));
    crc_step(&eng, word(w[1], 0, 0));
    crc_step(&eng, word(fcs ^ 1, 0, 1));
    out = crc_step(&eng, IDLE);
    check(out.valid && !out.fcs_ok, "corrupt fcs accepted");
    return 0;
}

// Every pairing of polynomial form, mode and finalization, from a seed other
// than the Ethernet one.
static int test_configs(){
    t_crc_engine eng;
    t_crc_out out;
    t_poly_form polys[2] = {POLY_REVERSED, POLY_FORWARD};
    t_crc_mode modes[2] = {MODE_FRAME, MODE_SINGLE_WORD};
    t_crc_final finals[2] = {FINAL_COMPLEMENT, FINAL_IDENTITY};
    ap_uint<32> w[2] = {0xcafebabe, 0x01020304};
    int k;

    for (k = 0; k < 8; k++) {
        t_crc_cfg cfg = {polys[k / 4], 0x12345678, modes[(k / 2) % 2], finals[k % 2], 0};
        ap_uint<32> ref;
        ap_uint<32> fcs;

        crc_init(&eng, cfg);
        check(crc_output(&eng).crc == crc32_final(cfg.finalize, 0x12345678), "config %d seed not loaded", k);

        if (cfg.mode == MODE_FRAME) {
            ref = crc32_ref_frame(cfg, w, 2);
            crc_step(&eng, word(w[0], 1, 0));
            crc_step(&eng, word(w[1], 0, 1));
            out = crc_step(&eng, IDLE);
            check(out.valid && (out.crc == ref), "config %d crc 0x%08x, expected 0x%08x", k, out.crc.to_uint(), ref.to_uint());

            crc_step(&eng, word(w[0], 1, 0));
            crc_step(&eng, word(w[1], 0, 0));
            crc_step(&eng, word(ref, 0, 1));
            out = crc_step(&eng, IDLE);
            check(out.valid && out.fcs_ok, "config %d good fcs rejected, crc 0x%08x", k, out.crc.to_uint());
        } else {
            ref = crc32_ref_frame(cfg, &w[0], 1);
            fcs = crc32_ref_frame(cfg, &w[1], 1);
            crc_step(&eng, word(w[0], 1, 0));
            out = crc_step(&eng, word(w[1], 1, 0));
            check(out.valid && (out.crc == ref), "config %d crc 0x%08x, expected 0x%08x", k, out.crc.to_uint(), ref.to_uint());
            out = crc_step(&eng, word(fcs, 0, 0));
            check(out.valid && (out.crc == fcs), "config %d crc 0x%08x, expected 0x%08x", k, out.crc.to_uint(), fcs.to_uint());
            out = crc_step(&eng, IDLE);
            check(out.valid && out.fcs_ok, "config %d good fcs rejected, crc 0x%08x", k, out.crc.to_uint());
        }
    }

    // Seeded values worked out independently of the reference model
    t_crc_cfg rev = CRC_CFG_FRAME_REV;
    rev.seed = 0x12345678;
    crc_init(&eng, rev);
    crc_step(&eng, word(w[0], 1, 0));
    crc_step(&eng, word(w[1], 0, 1));
    out = crc_step(&eng, IDLE);
    check(out.valid && (out.crc == 0x46d50f7c), "seeded reversed crc 0x%08x", out.crc.to_uint());

    t_crc_cfg fwd = {POLY_FORWARD, 0x12345678, MODE_FRAME, FINAL_IDENTITY, 0};
    crc_init(&eng, fwd);
    crc_step(&eng, word(w[0], 1, 0));
    crc_step(&eng, word(w[1], 0, 1));
    out = crc_step(&eng, IDLE);
    check(out.valid && (out.crc == 0x45146a99), "seeded forward crc 0x%08x", out.crc.to_uint());
    return 0;
}

int main()
{
    if (test_golden_frame()) return 1;
    if (test_latency()) return 1;
    if (test_back_to_back()) return 1;
    if (test_reset()) return 1;
    if (test_violation()) return 1;
    if (test_single_word()) return 1;
    if (test_open_frame()) return 1;
    if (test_fcs_ok()) return 1;
    if (test_configs()) return 1;

    printf("Engine tests passed\n");
    return 0;
}
