// Single and double precision FPU datapath.
//
// The arithmetic intentionally mirrors the simplified hardware datapath and
// is NOT IEEE-754 compliant: add/sub never renormalise or round, divide does
// not normalise the quotient, and NaN/Inf operands get no special casing.
#ifndef MEDRV_IEEE754_H
#define MEDRV_IEEE754_H

#include <systemc.h>

enum fpu_op {
    FPU_ADD = 0x0,
    FPU_SUB = 0x1,
    FPU_MUL = 0x2,
    FPU_DIV = 0x3
};

static const uint32_t FP32_QNAN = 0x7FC00000u;
static const uint64_t FP64_QNAN = 0x7FF8000000000000ull;

struct ieee754_components {
    bool        sign;
    sc_uint<11> exponent;
    sc_uint<52> fraction;
    sc_uint<53> significand;    // fraction with the hidden bit when exponent != 0
    bool        is_zero;
};

struct fpu_result {
    sc_uint<64> bits;
    bool        invalid;        // divide by a zero significand

    fpu_result() : bits(0), invalid(false) {}
};

ieee754_components decompose_single(sc_uint<32> value);
ieee754_components decompose_double(sc_uint<64> value);

fpu_result fpu_single(fpu_op op, sc_uint<32> a, sc_uint<32> b);
fpu_result fpu_double(fpu_op op, sc_uint<64> a, sc_uint<64> b);

#endif
