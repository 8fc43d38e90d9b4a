#ifndef __CAPTURE_HPP__
#define __CAPTURE_HPP__

#include "ethcrc.hpp"
#include "ap_shift_reg.h"

typedef ap_shift_reg<t_crc_in, CRC_PIPE_DEPTH> t_capture;

t_crc_in capture(t_capture &cap, t_crc_in din, t_crc_mode mode);
t_crc_in capture_peek(t_capture &cap);
void capture_reset(t_capture &cap);

#endif
