#include "Activation.h"

sc_int<32> activation_tanh(sc_int<32> x) {
    int64_t v = x.to_int64();

    if (v >= 3 * (int64_t)Q16_ONE) return Q16_ONE;
    if (v <= -3 * (int64_t)Q16_ONE) return -Q16_ONE;

    int64_t x2  = (v * v) >> 16;                        // Q16.16
    int64_t num = v * (27 * (int64_t)Q16_ONE + x2);     // Q32.32
    int64_t den = 27 * (int64_t)Q16_ONE + 9 * x2;       // Q16.16
    return (int32_t)(num / den);
}

sc_int<32> activation_sigmoid(sc_int<32> x) {
    int64_t v = x.to_int64();

    if (v >= 6 * (int64_t)Q16_ONE) return Q16_ONE;
    if (v <= -6 * (int64_t)Q16_ONE) return 0;

    int64_t t = activation_tanh((int32_t)(v / 2)).to_int64();
    return (int32_t)(Q16_ONE / 2 + t / 2);
}

sc_int<32> activation_compute(unsigned select, sc_int<32> x) {
    switch (select) {
        case ACT_SIGMOID: return activation_sigmoid(x);
        case ACT_TANH:    return activation_tanh(x);
        default:          return 0;
    }
}
