// Integer ALU with the M extension
#ifndef MEDRV_ALU_H
#define MEDRV_ALU_H

#include <systemc.h>
#include "MedRvTypes.h"

struct alu_result {
    sc_uint<32> result;
    bool        carry;
    bool        overflow;
    bool        zero;
    bool        sign;
    bool        div_by_zero;

    alu_result() : result(0), carry(false), overflow(false), zero(true), sign(false), div_by_zero(false) {}
};

// Pure combinational ALU. carry/overflow are only meaningful for ADD and SUB.
alu_result alu_compute(sc_uint<32> a, sc_uint<32> b, alu_op op);

// Branch condition from funct3 and the ALU flags of the comparison
bool branch_condition(sc_uint<3> funct3, const alu_result& cmp);

#endif
