// Q16.16 fixed-point activation functions
#ifndef MEDRV_ACTIVATION_H
#define MEDRV_ACTIVATION_H

#include <systemc.h>

enum activation_select {
    ACT_SIGMOID = 0,
    ACT_TANH    = 1
};

static const int32_t Q16_ONE = 0x10000;

// tanh by the rational approximation x(27 + x^2) / (27 + 9x^2),
// saturated to +/-1.0 beyond |x| = 3.0
sc_int<32> activation_tanh(sc_int<32> x);

// 0.5 + 0.5 * tanh(x / 2), saturated to 1.0 / 0 beyond |x| = 6.0
sc_int<32> activation_sigmoid(sc_int<32> x);

// Unknown selectors produce 0
sc_int<32> activation_compute(unsigned select, sc_int<32> x);

#endif
