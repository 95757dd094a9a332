#include <systemc.h>

#include "Alu.h"
#include "TestCommon.h"

int sc_main(int argc, char* argv[]) {
    (void)argc;
    (void)argv;

    cout << "\n=== Integer ALU / M extension Test ===\n";

    section("Add / subtract flags");
    {
        alu_result r = alu_compute(0x7FFFFFFF, 1, ALU_ADD);
        check_eq(r.result, 0x80000000, "0x7FFFFFFF + 1");
        check(r.overflow && !r.carry && r.sign && !r.zero, "signed overflow, no carry");

        r = alu_compute(0xFFFFFFFF, 1, ALU_ADD);
        check_eq(r.result, 0, "0xFFFFFFFF + 1 wraps");
        check(r.carry && r.zero && !r.overflow, "carry out and zero");

        r = alu_compute(0x80000000, 1, ALU_SUB);
        check_eq(r.result, 0x7FFFFFFF, "INT_MIN - 1");
        check(r.overflow && !r.sign, "subtract overflow");

        r = alu_compute(5, 5, ALU_SUB);
        check(r.zero && !r.overflow, "5 - 5 sets zero");
    }

    section("Shifts and compares");
    {
        check_eq(alu_compute(1, 35, ALU_SLL).result, 8, "SLL uses low five bits");
        check_eq(alu_compute(0x80000000, 4, ALU_SRL).result, 0x08000000, "SRL zero fills");
        check_eq(alu_compute(0x80000000, 4, ALU_SRA).result, 0xF8000000, "SRA sign extends");
        check_eq(alu_compute(0xFFFFFFFF, 1, ALU_SLT).result, 1, "SLT -1 < 1");
        check_eq(alu_compute(0xFFFFFFFF, 1, ALU_SLTU).result, 0, "SLTU 0xFFFFFFFF < 1");
        alu_result r = alu_compute(0xF0, 0x0F, ALU_OR);
        check(r.result == 0xFF && !r.carry && !r.overflow, "logic ops clear carry/overflow");
    }

    section("Multiply");
    {
        check_eq(alu_compute(6, 7, ALU_MUL).result, 42, "MUL 6 * 7");
        check_eq(alu_compute(0xFFFFFFFF, 0xFFFFFFFF, ALU_MULH).result, 0, "MULH -1 * -1");
        check_eq(alu_compute(0xFFFFFFFF, 0xFFFFFFFF, ALU_MULHU).result, 0xFFFFFFFE, "MULHU max * max");
        check_eq(alu_compute(0xFFFFFFFF, 2, ALU_MULHSU).result, 0xFFFFFFFF, "MULHSU -1 * 2");
        check_eq(alu_compute(0x80000000, 0x80000000, ALU_MULH).result, 0x40000000, "MULH INT_MIN^2");
    }

    section("Divide");
    {
        alu_result r = alu_compute(10, 0, ALU_DIV);
        check(r.result == 0xFFFFFFFF && r.div_by_zero, "DIV by zero -> all ones + flag");
        r = alu_compute(10, 0, ALU_DIVU);
        check(r.result == 0xFFFFFFFF && r.div_by_zero, "DIVU by zero -> all ones + flag");
        r = alu_compute(10, 0, ALU_REM);
        check(r.result == 10 && r.div_by_zero, "REM by zero -> dividend + flag");
        r = alu_compute(10, 0, ALU_REMU);
        check(r.result == 10 && r.div_by_zero, "REMU by zero -> dividend + flag");

        r = alu_compute(0x80000000, 0xFFFFFFFF, ALU_DIV);
        check(r.result == 0x80000000 && !r.div_by_zero, "INT_MIN / -1");
        check_eq(alu_compute(0x80000000, 0xFFFFFFFF, ALU_REM).result, 0, "INT_MIN % -1");

        check_eq(alu_compute((uint32_t)-7, 2, ALU_DIV).result, (uint32_t)-3, "-7 / 2 truncates");
        check_eq(alu_compute((uint32_t)-7, 2, ALU_REM).result, (uint32_t)-1, "-7 % 2");
        check_eq(alu_compute(0xFFFFFFFE, 3, ALU_DIVU).result, 0x55555554, "DIVU");
        check_eq(alu_compute(0xFFFFFFFE, 3, ALU_REMU).result, 2, "REMU");
    }

    section("Branch conditions");
    {
        check(branch_condition(0, alu_compute(4, 4, ALU_SUB)), "BEQ taken on equal");
        check(!branch_condition(1, alu_compute(4, 4, ALU_SUB)), "BNE not taken on equal");
        check(branch_condition(4, alu_compute((uint32_t)-1, 0, ALU_SLT)), "BLT -1 < 0");
        check(!branch_condition(6, alu_compute((uint32_t)-1, 0, ALU_SLTU)), "BLTU 0xFFFFFFFF < 0");
        check(branch_condition(5, alu_compute(3, 3, ALU_SLT)), "BGE 3 >= 3");
        check(branch_condition(7, alu_compute((uint32_t)-1, 0, ALU_SLTU)), "BGEU 0xFFFFFFFF >= 0");
    }

    return summary("ALU");
}
