#include "stream.hpp"

#include <stdio.h>

#define sat_inc(c) do { if (~(c) != 0) (c)++; } while(0)

static const t_crc_in idle = {0, 0, 0, 0};

static void emit(t_crc_out out, hls::stream<t_crc_result> &m_res, t_crc_status *status)
{
    if (out.valid) {
        t_crc_result res = {out.crc, out.fcs_ok, status->frame_id};
        m_res.write(res);
        status->frame_id++;
        sat_inc(status->frames);
#ifdef ETHCRC_TRACE
        printf("FRAME %d, CRC 0x%08x, FCS_OK %d\n", res.frame.to_int(), res.crc.to_uint(), res.fcs_ok.to_int());
#endif
    }
}

void ethcrc_stream(
                   t_crc_engine *eng,
                   hls::stream<t_crc_in> &s_in,
                   hls::stream<t_crc_result> &m_res,
                   t_crc_status *status
                   )
{
#pragma HLS INTERFACE axis port=s_in
#pragma HLS INTERFACE axis port=m_res
#pragma HLS data_pack variable=status
#pragma HLS INTERFACE ap_ovld port=status
    int i;
    t_crc_in din;
    t_crc_out out;

    status->halted = 0;

 MAIN: while (s_in.read_nb(din)) {
#pragma HLS PIPELINE II=1
        out = crc_step(eng, din);
        sat_inc(status->words);

        if (out.sof_err) {
            sat_inc(status->sof_err);
        }
        if (out.eof_err) {
            sat_inc(status->eof_err);
        }
#ifdef ETHCRC_TRACE
        printf("DATA 0x%08x, EN %d, SOF %d, EOF %d, CRC 0x%08x, VALID %d\n",
               din.data.to_uint(), din.en.to_int(), din.sof.to_int(), din.eof.to_int(),
               out.crc.to_uint(), out.valid.to_int());
        if (out.sof_err || out.eof_err) {
            printf("PROTOCOL VIOLATION: SOF_ERR %d, EOF_ERR %d\n", out.sof_err.to_int(), out.eof_err.to_int());
        }
#endif

        emit(out, m_res, status);

        if (eng->cfg.strict && (out.sof_err || out.eof_err)) {
            status->halted = 1;
            return;
        }
    }

 FLUSH: for (i = 0; i < CRC_PIPE_DEPTH; i++) {
        emit(crc_step(eng, idle), m_res, status);
    }
}
