#include <stdio.h>
#include <time.h>
#include <stdlib.h>

#include "stream.hpp"
#include "fcs.hpp"
#include "crc_ref.hpp"

#define SEED   280

ap_uint<32> frm1[] = {0x12345678};
ap_uint<32> frm2[] = {0x12345678, 0x9abcdef0};
ap_uint<32> frm3[] = {0x00000000};
ap_uint<32> frm4[] = {0xffffffff, 0xcafebabe, 0x01020304, 0xdeadbeef};

typedef struct {
    ap_uint<32>* data;
    int len;
}t_frame;

#define frm_inst(f) {(f), sizeof(f) / sizeof(ap_uint<32>)}

t_frame frames[] = {
    frm_inst(frm1),
    frm_inst(frm2),
    frm_inst(frm3),
    frm_inst(frm4)
};

#define FRAMES_CNT (int) (sizeof(frames) / sizeof(t_frame))

static void write_frame(hls::stream<t_crc_in> &s, const t_frame &frm){
    int i;

    for (i = 0; i < frm.len; i++) {
        t_crc_in din = {frm.data[i], 1, (i == 0), (i == frm.len - 1)};
        s.write(din);
    }
}

static void show_status(const t_crc_status &st){
    printf("Status: words=%d, frames=%d, sof_err=%d, eof_err=%d, halted=%d\n",
           st.words.to_int(), st.frames.to_int(), st.sof_err.to_int(),
           st.eof_err.to_int(), st.halted.to_int());
}

// Back-to-back frames with a couple of illegal flags in between, non-strict.
static int test_frames(){
    t_crc_engine eng;
    hls::stream<t_crc_in> s_in;
    hls::stream<t_crc_result> m_res;
    t_crc_status status = {0, 0, 0, 0, 0, 0};
    t_crc_in bad_sof = {0x0badf00d, 0, 1, 0};
    t_crc_in bad_eof = {0x0badf00d, 0, 0, 1};
    int j;

    crc_init(&eng, CRC_CFG_FRAME_REV);

    for (j = 0; j < FRAMES_CNT; j++) {
        write_frame(s_in, frames[j]);
        if (j == 1) {
            s_in.write(bad_sof);
            s_in.write(bad_eof);
        }
    }

    ethcrc_stream(&eng, s_in, m_res, &status);
    show_status(status);

    if ((status.frames != FRAMES_CNT) || (status.sof_err != 1) || (status.eof_err != 1) || status.halted) {
        return 1;
    }
    if (status.words != 8 + 2) {        // data words and bad flags
        return 1;
    }

    for (j = 0; j < FRAMES_CNT; j++) {
        if (m_res.empty()) {
            printf("Missing result for frame %d\n", j);
            return 1;
        }
        t_crc_result res = m_res.read();
        ap_uint<32> exp = crc32_ref_frame(CRC_CFG_FRAME_REV, frames[j].data, frames[j].len);
        printf("FRAME %d, CRC 0x%08x, expected 0x%08x\n", res.frame.to_int(), res.crc.to_uint(), exp.to_uint());
        // A lone all-zero word is the FCS of the empty frame.
        if ((res.crc != exp) || (res.frame != j) || (res.fcs_ok != (j == 2))) {
            return 1;
        }
    }
    return !m_res.empty();
}

// Strict mode stops at the first violation and leaves the rest unread.
static int test_strict(){
    t_crc_engine eng;
    hls::stream<t_crc_in> s_in;
    hls::stream<t_crc_result> m_res;
    t_crc_status status = {0, 0, 0, 0, 0, 0};
    t_crc_cfg cfg = CRC_CFG_FRAME_REV;
    t_crc_in bad_eof = {0x0badf00d, 0, 0, 1};

    cfg.strict = 1;
    crc_init(&eng, cfg);

    write_frame(s_in, frames[0]);
    s_in.write(bad_eof);
    write_frame(s_in, frames[1]);

    ethcrc_stream(&eng, s_in, m_res, &status);
    show_status(status);

    if (!status.halted || (status.eof_err != 1) || (status.words != 2)) {
        return 1;
    }
    // frame 0 completed on the violating step itself
    if ((status.frames != 1) || (m_res.read().crc != 0xaf6d87d2)) {
        return 1;
    }
    if (s_in.size() != (unsigned) frames[1].len) {
        return 1;
    }

    // Resuming picks up where it stopped.
    status.halted = 0;
    ethcrc_stream(&eng, s_in, m_res, &status);
    show_status(status);
    if (status.halted || (status.frames != 2) || (m_res.read().crc != 0x86829deb)) {
        return 1;
    }
    return 0;
}

// A frame carrying its own FCS as the last word checks good.
static int test_fcs_check(){
    t_crc_engine eng;
    hls::stream<t_crc_in> s_in;
    hls::stream<t_crc_result> m_res;
    t_crc_status status = {0, 0, 0, 0, 0, 0};
    ap_uint<32> data[6];
    int i;

    srand(SEED);
    for (i = 0; i < 5; i++) {
        data[i] = rand32();
    }
    data[5] = crc32_ref_frame(CRC_CFG_FRAME_REV, data, 5);

    crc_init(&eng, CRC_CFG_FRAME_REV);
    t_frame good = {data, 6};
    write_frame(s_in, good);
    t_frame payload = {data, 5};
    write_frame(s_in, payload);

    ethcrc_stream(&eng, s_in, m_res, &status);
    t_crc_result r0 = m_res.read();
    t_crc_result r1 = m_res.read();
    printf("FCS_OK %d %d\n", r0.fcs_ok.to_int(), r1.fcs_ok.to_int());
    if (!r0.fcs_ok || r1.fcs_ok || (r1.crc != data[5])) {
        return 1;
    }
    if (r0.crc != (ap_uint<32>) ~((ap_uint<32>) CRC32_RESIDUE_CPL)) {
        return 1;
    }
    return 0;
}

// Forward single-word preset: one raw result per enabled word.
static int test_single_word(){
    t_crc_engine eng;
    hls::stream<t_crc_in> s_in;
    hls::stream<t_crc_result> m_res;
    t_crc_status status = {0, 0, 0, 0, 0, 0};
    t_crc_in w0 = {0x12345678, 1, 1, 0};
    t_crc_in w1 = {0x00000000, 1, 1, 0};
    t_crc_in w2 = {0xffffffff, 1, 1, 0};

    crc_init(&eng, CRC_CFG_SINGLE_FWD);
    s_in.write(w0);
    s_in.write(w1);
    s_in.write(w2);

    ethcrc_stream(&eng, s_in, m_res, &status);
    show_status(status);
    if (status.frames != 3) {
        return 1;
    }
    if (m_res.read().crc != 0xdf8a8a2b) return 1;
    if (m_res.read().crc != 0xc704dd7b) return 1;
    if (m_res.read().crc != 0x00000000) return 1;
    return 0;
}

// Frame counter sticks at its maximum while result indices roll over.
static int test_frame_wrap(){
    t_crc_engine eng;
    hls::stream<t_crc_in> s_in;
    hls::stream<t_crc_result> m_res;
    t_crc_status status = {0, 0xffff, 0xffff, 0, 0, 0};

    crc_init(&eng, CRC_CFG_FRAME_REV);
    write_frame(s_in, frames[0]);
    write_frame(s_in, frames[1]);

    ethcrc_stream(&eng, s_in, m_res, &status);
    show_status(status);
    if ((status.frames != 0xffff) || (status.frame_id != 1)) {
        return 1;
    }
    t_crc_result r0 = m_res.read();
    t_crc_result r1 = m_res.read();
    printf("FRAME IDS %d %d\n", r0.frame.to_int(), r1.frame.to_int());
    if ((r0.frame != 0xffff) || (r1.frame != 0) || (r1.crc != 0x86829deb)) {
        return 1;
    }
    return 0;
}

int main()
{
    if (test_frames()) {
        printf("Stream frame test failed\n");
        return 1;
    }
    if (test_strict()) {
        printf("Stream strict test failed\n");
        return 1;
    }
    if (test_fcs_check()) {
        printf("Stream FCS check failed\n");
        return 1;
    }
    if (test_single_word()) {
        printf("Stream single-word test failed\n");
        return 1;
    }

    if (test_frame_wrap()) {
        printf("Stream frame index test failed\n");
        return 1;
    }

    printf("Stream tests passed\n");
    return 0;
}
