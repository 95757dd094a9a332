// Integer vector unit: 32 registers of MEDRV_VLEN 32-bit lanes
#ifndef MEDRV_VECTOR_UNIT_H
#define MEDRV_VECTOR_UNIT_H

#include <systemc.h>

#include "MedRvConfig.h"

// funct6 encodings
enum vector_op {
    VOP_ADD = 0x00,
    VOP_SUB = 0x02,
    VOP_AND = 0x09,
    VOP_OR  = 0x0A,
    VOP_MUL = 0x25
};

// funct3 operand source
enum vector_operand {
    VSRC_VV = 0x0,
    VSRC_VI = 0x3,
    VSRC_VX = 0x4
};

struct vreg {
    sc_uint<32> lane[MEDRV_VLEN];

    vreg() { for (unsigned i = 0; i < MEDRV_VLEN; ++i) lane[i] = 0; }

    static vreg broadcast(sc_uint<32> value) {
        vreg v;
        for (unsigned i = 0; i < MEDRV_VLEN; ++i) v.lane[i] = value;
        return v;
    }

    bool operator==(const vreg& o) const {
        for (unsigned i = 0; i < MEDRV_VLEN; ++i)
            if (lane[i] != o.lane[i]) return false;
        return true;
    }
};

// lane-wise vs2 op operand, valid = false for an unknown funct6
bool vector_compute(unsigned funct6, const vreg& vs2, const vreg& operand, vreg& vd);

class VectorRegisterFile {
public:
    VectorRegisterFile() {}

    const vreg& read(sc_uint<5> index) const { return regs[index.to_uint()]; }
    void write(sc_uint<5> index, const vreg& value) { regs[index.to_uint()] = value; }
    void reset() { for (unsigned i = 0; i < MEDRV_NUM_REGS; ++i) regs[i] = vreg(); }

private:
    vreg regs[MEDRV_NUM_REGS];
};

#endif
