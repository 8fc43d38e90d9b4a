#include "fcs.hpp"

void crc32_fwd(ap_uint<32> din, ap_uint<32> *crc_state){
#pragma HLS LATENCY max=0 min=0

	unsigned i;
	ap_uint<32> state = *crc_state;

 CRC32_FWD_LOOP: for (i = 0; i < 32; i++) {    // Bit 31 of the word enters first.
#pragma HLS UNROLL
        if (((state >> 31) & 1) != ((din >> (31 - i)) & 1)) {
            state = (state << 1) ^ CRC32_POLY_FWD;
        } else {
            state = state << 1;
        }
    }
    *crc_state = state;
}

void crc32_rev(ap_uint<32> din, ap_uint<32> *crc_state){
#pragma HLS LATENCY max=0 min=0

	unsigned i;
	ap_uint<32> state = *crc_state;

 CRC32_REV_LOOP: for (i = 0; i < 32; i++) {    // Bit 0 of the word enters first.
#pragma HLS UNROLL
        if ((state & 1) != ((din >> i) & 1)) {
            state = (state >> 1) ^ CRC32_POLY_REV;
        } else {
            state = state >> 1;
        }
    }
    *crc_state = state;
}

ap_uint<32> crc32_next(t_poly_form poly, ap_uint<32> seed, ap_uint<32> crc,
                       ap_uint<32> din, ap_uint<1> sof)
{
    ap_uint<32> state = sof ? seed : crc;

    if (poly == POLY_FORWARD) {
        crc32_fwd(din, &state);
    } else {
        crc32_rev(din, &state);
    }
    return state;
}

ap_uint<32> crc32_final(t_crc_final finalize, ap_uint<32> crc)
{
    if (finalize == FINAL_COMPLEMENT) {
        return ~crc;
    }
    return crc;
}

ap_uint<32> crc32_residue(t_poly_form poly, t_crc_final finalize)
{
    if (finalize == FINAL_IDENTITY) {
        return CRC32_RESIDUE_ID;
    }
    return (poly == POLY_FORWARD) ? CRC32_RESIDUE_FWD_CPL : CRC32_RESIDUE_CPL;
}

ap_uint<32> bit_reverse32(ap_uint<32> x)
{
    ap_uint<32> r = x;
    r.reverse();
    return r;
}
