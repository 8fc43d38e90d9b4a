#ifndef __STREAM_HPP__
#define __STREAM_HPP__

#include "engine.hpp"
#include "ap_int.h"
#include <hls_stream.h>

typedef struct{
    ap_uint<32>     crc;
    ap_uint<1>      fcs_ok;
    ap_uint<16>     frame;
}t_crc_result;

typedef struct{
    ap_uint<32>     words;
    ap_uint<16>     frames;     // saturates
    ap_uint<16>     frame_id;   // index of the next result, wraps
    ap_uint<16>     sof_err;
    ap_uint<16>     eof_err;
    ap_uint<1>      halted;
}t_crc_status;

void ethcrc_stream(t_crc_engine *eng, hls::stream<t_crc_in> &s_in,
                   hls::stream<t_crc_result> &m_res, t_crc_status *status);

#endif
