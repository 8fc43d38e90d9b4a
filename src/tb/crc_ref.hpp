#ifndef __CRC_REF_HPP__
#define __CRC_REF_HPP__

#include "ethcrc.hpp"

#include <stdlib.h>

// Byte-serial reference models, one byte per call.

// Reflected CRC-32 (IEEE 802.3 / zlib), bit 0 of each byte first.
static inline void crc32_8b(ap_uint<8> din, ap_uint<32>* crc_state){
	unsigned j;

	*crc_state ^= din;
	CRC32_LOOP: for (j = 8; j > 0; j--) {    // Do eight times.
       ap_uint<32> mask = -(*crc_state & 1);
       *crc_state = (*crc_state >> 1) ^ (CRC32_POLY_REV & mask);
    }
}

// Non-reflected CRC-32, bit 7 of each byte first.
static inline void crc32_8b_msb(ap_uint<8> din, ap_uint<32>* crc_state){
	unsigned j;

	*crc_state ^= ((ap_uint<32>) din) << 24;
	CRC32_LOOP: for (j = 8; j > 0; j--) {
       ap_uint<32> mask = -((*crc_state >> 31) & 1);
       *crc_state = (*crc_state << 1) ^ (CRC32_POLY_FWD & mask);
    }
}

// Folds one word into the reference in the stream order of the given form:
// low byte first for the reflected CRC, high byte first for the forward one.
static inline void crc32_ref_word(t_poly_form poly, ap_uint<32> din, ap_uint<32>* crc_state){
    int i;

    for (i = 0; i < 4; i++) {
        if (poly == POLY_REVERSED) {
            crc32_8b((ap_uint<8>) (din >> (8*i)), crc_state);
        } else {
            crc32_8b_msb((ap_uint<8>) (din >> (8*(3 - i))), crc_state);
        }
    }
}

static inline ap_uint<32> crc32_ref_frame(const t_crc_cfg &cfg, const ap_uint<32>* words, int len){
    int i;
    ap_uint<32> state = cfg.seed;

    for (i = 0; i < len; i++) {
        crc32_ref_word(cfg.poly, words[i], &state);
    }
    return (cfg.finalize == FINAL_COMPLEMENT) ? (ap_uint<32>) ~state : state;
}

static inline ap_uint<32> rand32(){
    return ((ap_uint<32>) (rand() & 0xffff) << 16) | (rand() & 0xffff);
}

#endif
