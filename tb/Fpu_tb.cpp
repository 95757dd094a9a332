#include <systemc.h>

#include "Ieee754.h"
#include "TestCommon.h"

int sc_main(int argc, char* argv[]) {
    (void)argc;
    (void)argv;

    cout << "\n=== Simplified FPU Test ===\n";
    cout << "Results follow the hardware datapath, not IEEE-754 rounding\n";

    section("Decompose");
    {
        ieee754_components c = decompose_single(floatToHex(1.5f));
        check(!c.sign && c.exponent == 127 && c.fraction == 0x400000 && c.significand == 0xC00000,
              "1.5f fields with hidden bit");
        c = decompose_single(0x00000001);
        check(c.exponent == 0 && c.significand == 1 && !c.is_zero, "denormal has no hidden bit");
        c = decompose_single(0x80000000);
        check(c.sign && c.is_zero, "negative zero");
        c = decompose_double(doubleToHex(-2.0));
        check(c.sign && c.exponent == 1024 && c.significand == (1ull << 52), "-2.0 double fields");
    }

    section("Single add / subtract");
    {
        check_eq(fpu_single(FPU_ADD, floatToHex(1.0f), floatToHex(0.5f)).bits, floatToHex(1.5f),
                 "1.0 + 0.5");
        check_eq(fpu_single(FPU_ADD, floatToHex(0.5f), floatToHex(1.0f)).bits, floatToHex(1.5f),
                 "0.5 + 1.0 aligns the smaller operand");
        check_eq(fpu_single(FPU_ADD, floatToHex(1.0f), floatToHex(1.0f)).bits, 0x3F800000,
                 "1.0 + 1.0 carry is not renormalised");
        check_eq(fpu_single(FPU_SUB, floatToHex(3.0f), floatToHex(2.0f)).bits, 0x40400000,
                 "3.0 - 2.0 keeps the larger exponent");
        check_eq(fpu_single(FPU_SUB, floatToHex(2.0f), floatToHex(2.0f)).bits, 0x40000000,
                 "x - x keeps the exponent");
        check_eq(fpu_single(FPU_ADD, floatToHex(-1.0f), floatToHex(0.5f)).bits, 0xBFC00000,
                 "-1.0 + 0.5 takes the sign of the larger magnitude");
        check_eq(fpu_single(FPU_SUB, floatToHex(0.5f), floatToHex(1.0f)).bits, 0xBFC00000,
                 "0.5 - 1.0");
    }

    section("Single multiply");
    {
        check_eq(fpu_single(FPU_MUL, floatToHex(2.0f), floatToHex(3.0f)).bits, floatToHex(6.0f),
                 "2.0 * 3.0");
        check_eq(fpu_single(FPU_MUL, floatToHex(1.5f), floatToHex(1.5f)).bits, floatToHex(2.25f),
                 "1.5 * 1.5 normalises once");
        check_eq(fpu_single(FPU_MUL, floatToHex(-2.0f), floatToHex(3.0f)).bits, floatToHex(-6.0f),
                 "sign is the xor of the inputs");
        check_eq(fpu_single(FPU_MUL, 0x00000000, floatToHex(5.0f)).bits, 0, "0 * 5.0");
    }

    section("Single divide");
    {
        fpu_result r = fpu_single(FPU_DIV, floatToHex(6.0f), floatToHex(2.0f));
        check(r.bits == floatToHex(3.0f) && !r.invalid, "6.0 / 2.0");
        check_eq(fpu_single(FPU_DIV, floatToHex(1.0f), floatToHex(2.0f)).bits, floatToHex(0.5f),
                 "1.0 / 2.0");
        check_eq(fpu_single(FPU_DIV, floatToHex(1.0f), floatToHex(1.5f)).bits, 0x3FD55555,
                 "1.0 / 1.5 quotient is not normalised");
        r = fpu_single(FPU_DIV, floatToHex(1.0f), 0x00000000);
        check(r.bits == FP32_QNAN && r.invalid, "divide by zero -> qNaN + invalid");
    }

    section("Double precision");
    {
        check_eq(fpu_double(FPU_ADD, doubleToHex(1.0), doubleToHex(0.25)).bits, doubleToHex(1.25),
                 "1.0 + 0.25");
        check_eq(fpu_double(FPU_MUL, doubleToHex(2.0), doubleToHex(3.0)).bits, doubleToHex(6.0),
                 "2.0 * 3.0");
        check_eq(fpu_double(FPU_DIV, doubleToHex(6.0), doubleToHex(2.0)).bits, doubleToHex(3.0),
                 "6.0 / 2.0");
        fpu_result r = fpu_double(FPU_DIV, doubleToHex(1.0), 0);
        check(r.bits == FP64_QNAN && r.invalid, "divide by zero -> qNaN + invalid");
    }

    return summary("FPU");
}
