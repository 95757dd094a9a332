#include "Alu.h"

alu_result alu_compute(sc_uint<32> a, sc_uint<32> b, alu_op op) {
    alu_result r;
    sc_uint<33> wide = 0;
    uint32_t ua = a.to_uint();
    uint32_t ub = b.to_uint();
    int32_t  sa = (int32_t)ua;
    int32_t  sb = (int32_t)ub;
    unsigned shamt = ub & 0x1F;

    switch (op) {
        case ALU_ADD:
            wide = (uint64_t)ua + (uint64_t)ub;
            r.result = wide.range(31, 0);
            r.carry = wide[32];
            r.overflow = (((ua ^ r.result.to_uint()) & (ub ^ r.result.to_uint())) >> 31) & 1;
            break;
        case ALU_SUB:
            wide = (uint64_t)ua - (uint64_t)ub;
            r.result = wide.range(31, 0);
            r.carry = wide[32];
            r.overflow = (((ua ^ ub) & (ua ^ r.result.to_uint())) >> 31) & 1;
            break;
        case ALU_SLL:  r.result = ua << shamt; break;
        case ALU_SRL:  r.result = ua >> shamt; break;
        case ALU_SRA:  r.result = (uint32_t)(sa >> shamt); break;
        case ALU_SLT:  r.result = (sa < sb) ? 1 : 0; break;
        case ALU_SLTU: r.result = (ua < ub) ? 1 : 0; break;
        case ALU_XOR:  r.result = ua ^ ub; break;
        case ALU_OR:   r.result = ua | ub; break;
        case ALU_AND:  r.result = ua & ub; break;
        case ALU_MUL:
            r.result = (uint32_t)((int64_t)sa * (int64_t)sb);
            break;
        case ALU_MULH:
            r.result = (uint32_t)((uint64_t)((int64_t)sa * (int64_t)sb) >> 32);
            break;
        case ALU_MULHSU:
            r.result = (uint32_t)((uint64_t)((int64_t)sa * (int64_t)ub) >> 32);
            break;
        case ALU_MULHU:
            r.result = (uint32_t)(((uint64_t)ua * (uint64_t)ub) >> 32);
            break;
        case ALU_DIV:
            if (ub == 0) {
                r.result = 0xFFFFFFFF;
                r.div_by_zero = true;
            } else if (ua == 0x80000000u && sb == -1) {
                r.result = 0x80000000u;
            } else {
                r.result = (uint32_t)(sa / sb);
            }
            break;
        case ALU_DIVU:
            if (ub == 0) {
                r.result = 0xFFFFFFFF;
                r.div_by_zero = true;
            } else {
                r.result = ua / ub;
            }
            break;
        case ALU_REM:
            if (ub == 0) {
                r.result = ua;
                r.div_by_zero = true;
            } else if (ua == 0x80000000u && sb == -1) {
                r.result = 0;
            } else {
                r.result = (uint32_t)(sa % sb);
            }
            break;
        case ALU_REMU:
            if (ub == 0) {
                r.result = ua;
                r.div_by_zero = true;
            } else {
                r.result = ua % ub;
            }
            break;
        case ALU_PASS_B:
            r.result = ub;
            break;
    }

    r.zero = (r.result == 0);
    r.sign = r.result[31];
    if (op != ALU_ADD && op != ALU_SUB) {
        r.carry = false;
        r.overflow = false;
    }
    return r;
}

bool branch_condition(sc_uint<3> funct3, const alu_result& cmp) {
    switch (funct3.to_uint()) {
        case 0x0: return cmp.zero;                 // BEQ
        case 0x1: return !cmp.zero;                // BNE
        case 0x4:                                  // BLT
        case 0x6: return cmp.result[0];            // BLTU
        case 0x5:                                  // BGE
        case 0x7: return !cmp.result[0];           // BGEU
        default:  return false;
    }
}
