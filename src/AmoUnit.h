// Atomic read-modify-write on one aligned data word
#ifndef MEDRV_AMO_UNIT_H
#define MEDRV_AMO_UNIT_H

#include <systemc.h>

#include "MemoryImage.h"

// funct5 encodings
enum amo_op {
    AMO_ADD  = 0x00,
    AMO_SWAP = 0x01,
    AMO_OR   = 0x08,
    AMO_AND  = 0x0C
};

struct amo_result {
    sc_uint<32> old_value;
    bool        valid;

    amo_result() : old_value(0), valid(false) {}
};

// Returns the pre-operation value. Misaligned or out-of-range addresses
// leave memory untouched and return valid = false. aq/rl have no effect on
// a single in-order core.
amo_result amo_execute(dmem_if& mem, amo_op op, sc_uint<32> addr, sc_uint<32> operand,
                       bool aq, bool rl);

#endif
