#include "RegisterFile.h"

bool CsrBank::implemented(sc_uint<12> addr) {
    switch (addr.to_uint()) {
        case CSR_MSTATUS:
        case CSR_MTVEC:
        case CSR_MEPC:
        case CSR_MCAUSE:
            return true;
        default:
            return false;
    }
}

sc_uint<32> CsrBank::read(sc_uint<12> addr) const {
    switch (addr.to_uint()) {
        case CSR_MSTATUS: return mstatus;
        case CSR_MTVEC:   return mtvec;
        case CSR_MEPC:    return mepc;
        case CSR_MCAUSE:  return mcause;
        default:          return 0;
    }
}

void CsrBank::write(sc_uint<12> addr, sc_uint<32> value) {
    switch (addr.to_uint()) {
        case CSR_MSTATUS: mstatus = value; break;
        case CSR_MTVEC:   mtvec = value; break;
        case CSR_MEPC:    mepc = value; break;
        case CSR_MCAUSE:  mcause = value; break;
        default:          break;
    }
}

sc_uint<32> CsrBank::read_modify_write(sc_uint<12> addr, csr_op op, sc_uint<32> operand,
                                       bool do_write) {
    sc_uint<32> old = read(addr);
    if (!do_write) return old;

    switch (op) {
        case CSR_OP_WRITE: write(addr, operand); break;
        case CSR_OP_SET:   write(addr, old | operand); break;
        case CSR_OP_CLEAR: write(addr, old & ~operand); break;
    }
    return old;
}

void CsrBank::reset() {
    mstatus = 0;
    mtvec = 0;
    mepc = 0;
    mcause = 0;
}
