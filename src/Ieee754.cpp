#include "Ieee754.h"

namespace {

template <int EXP_BITS, int FRAC_BITS>
struct fp_format {
    static const int      SIGN_POS = EXP_BITS + FRAC_BITS;
    static const int64_t  BIAS     = (1 << (EXP_BITS - 1)) - 1;
    static uint64_t exp_mask()  { return (1ull << EXP_BITS) - 1; }
    static uint64_t frac_mask() { return (1ull << FRAC_BITS) - 1; }
};

typedef fp_format<8, 23>  fp32;
typedef fp_format<11, 52> fp64;

template <typename F, int FRAC_BITS>
ieee754_components split(uint64_t value) {
    ieee754_components comp;
    uint64_t exp  = (value >> FRAC_BITS) & F::exp_mask();
    uint64_t frac = value & F::frac_mask();

    comp.sign        = (value >> F::SIGN_POS) & 1;
    comp.exponent    = exp;
    comp.fraction    = frac;
    comp.is_zero     = (exp == 0) && (frac == 0);
    comp.significand = (exp != 0) ? (frac | (1ull << FRAC_BITS)) : frac;
    return comp;
}

template <typename F, int FRAC_BITS>
uint64_t pack(bool sign, int64_t exp, uint64_t significand) {
    // exponent wraps to the field, significand keeps only the fraction bits
    return ((uint64_t)sign << F::SIGN_POS) |
           (((uint64_t)exp & F::exp_mask()) << FRAC_BITS) |
           (significand & F::frac_mask());
}

template <typename F, int FRAC_BITS>
fpu_result add_sub(uint64_t a, uint64_t b, bool subtract) {
    ieee754_components x = split<F, FRAC_BITS>(a);
    ieee754_components y = split<F, FRAC_BITS>(b);
    bool ysign = subtract ? !y.sign : y.sign;

    uint64_t mx = x.significand.to_uint64();
    uint64_t my = y.significand.to_uint64();
    int64_t  ex = x.exponent.to_int64();
    int64_t  ey = y.exponent.to_int64();
    int64_t  rexp;

    // align the smaller operand, keep the larger exponent
    if (ex >= ey) {
        int64_t shift = ex - ey;
        my = (shift >= 64) ? 0 : (my >> shift);
        rexp = ex;
    } else {
        int64_t shift = ey - ex;
        mx = (shift >= 64) ? 0 : (mx >> shift);
        rexp = ey;
    }

    uint64_t rmant;
    bool rsign;
    if (x.sign == ysign) {
        rmant = mx + my;
        rsign = x.sign;
    } else if (mx >= my) {
        rmant = mx - my;
        rsign = x.sign;
    } else {
        rmant = my - mx;
        rsign = ysign;
    }

    fpu_result r;
    r.bits = pack<F, FRAC_BITS>(rsign, rexp, rmant);
    return r;
}

template <typename F, int FRAC_BITS>
fpu_result multiply(uint64_t a, uint64_t b) {
    ieee754_components x = split<F, FRAC_BITS>(a);
    ieee754_components y = split<F, FRAC_BITS>(b);
    bool rsign = x.sign ^ y.sign;

    fpu_result r;
    if (x.is_zero || y.is_zero) {
        r.bits = (uint64_t)rsign << F::SIGN_POS;
        return r;
    }

    sc_biguint<128> product = sc_biguint<128>(x.significand.to_uint64()) *
                              sc_biguint<128>(y.significand.to_uint64());
    sc_biguint<128> mant = product >> FRAC_BITS;
    int64_t rexp = x.exponent.to_int64() + y.exponent.to_int64() - F::BIAS;

    if (mant[FRAC_BITS + 1]) {
        mant >>= 1;
        rexp += 1;
    }

    r.bits = pack<F, FRAC_BITS>(rsign, rexp, mant.to_uint64());
    return r;
}

template <typename F, int FRAC_BITS>
fpu_result divide(uint64_t a, uint64_t b, uint64_t qnan) {
    ieee754_components x = split<F, FRAC_BITS>(a);
    ieee754_components y = split<F, FRAC_BITS>(b);
    bool rsign = x.sign ^ y.sign;

    fpu_result r;
    if (y.significand == 0) {
        r.bits = qnan;
        r.invalid = true;
        return r;
    }
    if (x.is_zero) {
        r.bits = (uint64_t)rsign << F::SIGN_POS;
        return r;
    }

    sc_biguint<128> dividend = sc_biguint<128>(x.significand.to_uint64()) << FRAC_BITS;
    sc_biguint<128> quotient = dividend / sc_biguint<128>(y.significand.to_uint64());
    int64_t rexp = x.exponent.to_int64() - y.exponent.to_int64() + F::BIAS;

    r.bits = pack<F, FRAC_BITS>(rsign, rexp, quotient.to_uint64());
    return r;
}

template <typename F, int FRAC_BITS>
fpu_result dispatch(fpu_op op, uint64_t a, uint64_t b, uint64_t qnan) {
    switch (op) {
        case FPU_ADD: return add_sub<F, FRAC_BITS>(a, b, false);
        case FPU_SUB: return add_sub<F, FRAC_BITS>(a, b, true);
        case FPU_MUL: return multiply<F, FRAC_BITS>(a, b);
        case FPU_DIV: return divide<F, FRAC_BITS>(a, b, qnan);
    }
    return fpu_result();
}

} // namespace

ieee754_components decompose_single(sc_uint<32> value) {
    return split<fp32, 23>(value.to_uint64());
}

ieee754_components decompose_double(sc_uint<64> value) {
    return split<fp64, 52>(value.to_uint64());
}

fpu_result fpu_single(fpu_op op, sc_uint<32> a, sc_uint<32> b) {
    return dispatch<fp32, 23>(op, a.to_uint64(), b.to_uint64(), FP32_QNAN);
}

fpu_result fpu_double(fpu_op op, sc_uint<64> a, sc_uint<64> b) {
    return dispatch<fp64, 52>(op, a.to_uint64(), b.to_uint64(), FP64_QNAN);
}
