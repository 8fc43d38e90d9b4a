#ifndef __ETHCRC_HPP__
#define __ETHCRC_HPP__

#include "ap_int.h"
#include <hls_stream.h>

#define CRC32_POLY_FWD    0x04C11DB7
#define CRC32_POLY_REV    0xEDB88320
#define CRC32_SEED        0xffffffff

// Accumulator value after a frame followed by its own FCS word
#define CRC32_RESIDUE_CPL     0xDEBB20E3    // reversed, complemented
#define CRC32_RESIDUE_FWD_CPL 0xC704DD7B    // forward, complemented
#define CRC32_RESIDUE_ID      0x00000000    // either form, identity

#define CRC_PIPE_DEPTH    1

typedef enum {
    POLY_FORWARD,               // 0x04C11DB7, bit 31 first
    POLY_REVERSED               // 0xEDB88320, bit 0 first
}t_poly_form;

typedef enum {
    MODE_SINGLE_WORD,
    MODE_FRAME
}t_crc_mode;

typedef enum {
    FINAL_IDENTITY,
    FINAL_COMPLEMENT
}t_crc_final;

typedef struct{
    t_poly_form     poly;
    ap_uint<32>     seed;
    t_crc_mode      mode;
    t_crc_final     finalize;
    ap_uint<1>      strict;
}t_crc_cfg;

typedef struct{
    ap_uint<32>     data;
    ap_uint<1>      en;
    ap_uint<1>      sof;
    ap_uint<1>      eof;
}t_crc_in;

typedef struct{
    ap_uint<32>     crc;
    ap_uint<1>      valid;
    ap_uint<1>      fcs_ok;
    ap_uint<1>      sof_err;    // start-of-frame without enable
    ap_uint<1>      eof_err;    // end-of-frame without enable
}t_crc_out;

extern const t_crc_cfg CRC_CFG_SINGLE_FWD;
extern const t_crc_cfg CRC_CFG_FRAME_REV;

#endif
