#ifndef __ENGINE_HPP__
#define __ENGINE_HPP__

#include "ethcrc.hpp"
#include "capture.hpp"

typedef struct{
    t_crc_cfg       cfg;
    t_capture       snap;
    ap_uint<32>     crc;
    ap_uint<1>      valid;
}t_crc_engine;

void crc_init(t_crc_engine *eng, const t_crc_cfg &cfg);
void crc_reset(t_crc_engine *eng);
t_crc_out crc_step(t_crc_engine *eng, t_crc_in din);
t_crc_out crc_output(const t_crc_engine *eng);

#endif
