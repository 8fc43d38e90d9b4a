#ifndef __FCS_HPP__
#define __FCS_HPP__

#include "ethcrc.hpp"

void crc32_fwd(ap_uint<32> din, ap_uint<32> *crc_state);
void crc32_rev(ap_uint<32> din, ap_uint<32> *crc_state);

ap_uint<32> crc32_next(t_poly_form poly, ap_uint<32> seed, ap_uint<32> crc,
                       ap_uint<32> din, ap_uint<1> sof);
ap_uint<32> crc32_final(t_crc_final finalize, ap_uint<32> crc);
ap_uint<32> crc32_residue(t_poly_form poly, t_crc_final finalize);
ap_uint<32> bit_reverse32(ap_uint<32> x);

#endif
