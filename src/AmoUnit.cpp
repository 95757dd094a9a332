#include "AmoUnit.h"

amo_result amo_execute(dmem_if& mem, amo_op op, sc_uint<32> addr, sc_uint<32> operand,
                       bool aq, bool rl) {
    amo_result r;
    (void)aq;
    (void)rl;

    if (addr.range(1, 0) != 0 || !mem.in_range(addr, 4)) return r;

    sc_uint<32> old;
    if (!dmem_read_word(mem, addr, old)) return r;

    sc_uint<32> updated;
    switch (op) {
        case AMO_ADD:  updated = old + operand; break;
        case AMO_SWAP: updated = operand; break;
        case AMO_OR:   updated = old | operand; break;
        case AMO_AND:  updated = old & operand; break;
        default:       return r;
    }

    if (!dmem_write_word(mem, addr, updated)) return r;
    r.old_value = old;
    r.valid = true;
    return r;
}
