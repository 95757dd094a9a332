// Architectural register files and the machine CSR subset
#ifndef MEDRV_REGISTER_FILE_H
#define MEDRV_REGISTER_FILE_H

#include <systemc.h>

#include "MedRvConfig.h"

// x0 reads zero and ignores writes
class RegisterFile {
public:
    RegisterFile() { reset(); }

    sc_uint<32> read(sc_uint<5> index) const {
        return index == 0 ? sc_uint<32>(0) : regs[index.to_uint()];
    }

    void write(sc_uint<5> index, sc_uint<32> value) {
        if (index != 0) regs[index.to_uint()] = value;
    }

    void reset() { for (unsigned i = 0; i < MEDRV_NUM_REGS; ++i) regs[i] = 0; }

private:
    sc_uint<32> regs[MEDRV_NUM_REGS];
};

// 64-bit registers; single precision lives in the low word
class FpRegisterFile {
public:
    FpRegisterFile() { reset(); }

    sc_uint<64> read(sc_uint<5> index) const { return regs[index.to_uint()]; }
    void write(sc_uint<5> index, sc_uint<64> value) { regs[index.to_uint()] = value; }
    void reset() { for (unsigned i = 0; i < MEDRV_NUM_REGS; ++i) regs[i] = 0; }

private:
    sc_uint<64> regs[MEDRV_NUM_REGS];
};

enum csr_address {
    CSR_MSTATUS = 0x300,
    CSR_MTVEC   = 0x305,
    CSR_MEPC    = 0x341,
    CSR_MCAUSE  = 0x342
};

enum csr_op {
    CSR_OP_WRITE = 1,   // funct3 low two bits
    CSR_OP_SET   = 2,
    CSR_OP_CLEAR = 3
};

// Unimplemented addresses read zero and drop writes
class CsrBank {
public:
    CsrBank() { reset(); }

    static bool implemented(sc_uint<12> addr);
    sc_uint<32> read(sc_uint<12> addr) const;
    void write(sc_uint<12> addr, sc_uint<32> value);

    // CSRRW/S/C: returns the old value, applies the update when requested
    sc_uint<32> read_modify_write(sc_uint<12> addr, csr_op op, sc_uint<32> operand, bool do_write);

    void reset();

private:
    sc_uint<32> mstatus, mtvec, mepc, mcause;
};

#endif
