#include "engine.hpp"
#include "fcs.hpp"

const t_crc_cfg CRC_CFG_SINGLE_FWD = {POLY_FORWARD, CRC32_SEED, MODE_SINGLE_WORD, FINAL_IDENTITY, 0};
const t_crc_cfg CRC_CFG_FRAME_REV = {POLY_REVERSED, CRC32_SEED, MODE_FRAME, FINAL_COMPLEMENT, 0};

void crc_init(t_crc_engine *eng, const t_crc_cfg &cfg)
{
    eng->cfg = cfg;
    crc_reset(eng);
}

// Takes effect immediately: whatever sits in the snapshot is dropped and the
// next step starts from the seed.
void crc_reset(t_crc_engine *eng)
{
    capture_reset(eng->snap);
    eng->crc = eng->cfg.seed;
    eng->valid = 0;
}

t_crc_out crc_output(const t_crc_engine *eng)
{
    t_crc_out out;

    out.crc = crc32_final(eng->cfg.finalize, eng->crc);
    out.valid = eng->valid;
    out.fcs_ok = eng->valid && (eng->crc == crc32_residue(eng->cfg.poly, eng->cfg.finalize));
    out.sof_err = 0;
    out.eof_err = 0;
    return out;
}

/*
 * One clock step. The snapshot captured on the previous step is folded into
 * the accumulator, then the raw inputs are latched for the next step. Valid
 * is registered together with the accumulator, so a word presented on step N
 * shows up in crc/valid on step N+1.
 */
t_crc_out crc_step(t_crc_engine *eng, t_crc_in din)
{
#pragma HLS LATENCY max=0 min=0
    ap_uint<1> sof_err = din.sof && !din.en;
    ap_uint<1> eof_err = (eng->cfg.mode == MODE_FRAME) && din.eof && !din.en;

    t_crc_in snap = capture(eng->snap, din, eng->cfg.mode);
    ap_uint<32> next = crc32_next(eng->cfg.poly, eng->cfg.seed, eng->crc,
                                  snap.data, snap.sof);

    if (snap.en) {
        eng->crc = next;
    }

    if (eng->cfg.mode == MODE_SINGLE_WORD) {
        eng->valid = snap.en;
    } else {
        eng->valid = snap.en && snap.eof;
    }

    t_crc_out out = crc_output(eng);
    out.sof_err = sof_err;
    out.eof_err = eof_err;
    return out;
}
