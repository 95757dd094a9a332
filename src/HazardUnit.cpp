#include "HazardUnit.h"
#include "Decoder.h"

static bool writes_register(const ControlSignals& ctrl, sc_uint<5> rd, reg_class cls, sc_uint<5> reg) {
    if (!ctrl.reg_write || cls == RC_NONE || ctrl.rd_class != cls || rd != reg) return false;
    return !(cls == RC_INT && reg == 0);
}

sc_uint<64> forward_operand(sc_uint<2> select, sc_uint<64> reg_value,
                            const ExMemReg& ex_mem, const MemWbReg& mem_wb) {
    switch (select.to_uint()) {
        case FWD_EX_MEM: return ex_mem.result;
        case FWD_MEM_WB: return mem_wb.result;
        default:         return reg_value;
    }
}

// EX/MEM wins over MEM/WB. EX/MEM only forwards values produced in EX,
// MEM/WB only values that are valid.
sc_uint<2> HazardUnit::select_for(sc_uint<5> reg, reg_class cls,
                                  const ExMemReg& ex, const MemWbReg& wb) const {
    if (ex.valid && !ex.ctrl.late_result && writes_register(ex.ctrl, ex.inst.rd, cls, reg))
        return FWD_EX_MEM;
    if (wb.valid && wb.result_valid && writes_register(wb.ctrl, wb.inst.rd, cls, reg))
        return FWD_MEM_WB;
    return FWD_NONE;
}

void HazardUnit::hazard_detect() {
    IfIdReg  fd = if_id.read();
    IdExReg  de = id_ex.read();
    ExMemReg em = ex_mem.read();
    MemWbReg mw = mem_wb.read();

    bool stall = false;
    if (fd.valid && de.valid && de.ctrl.late_result) {
        DecodedInstruction next = decode_instruction(fd.instruction);
        ControlSignals next_ctrl = control_for(next);
        if (writes_register(de.ctrl, de.inst.rd, next_ctrl.rs1_class, next.rs1) ||
            writes_register(de.ctrl, de.inst.rd, next_ctrl.rs2_class, next.rs2)) {
            stall = true;
        }
    }

    sc_uint<2> fwd_a = FWD_NONE, fwd_b = FWD_NONE;
    if (de.valid) {
        fwd_a = select_for(de.inst.rs1, de.ctrl.rs1_class, em, mw);
        fwd_b = select_for(de.inst.rs2, de.ctrl.rs2_class, em, mw);
    }

    load_use_stall.write(stall);
    forward_a.write(fwd_a);
    forward_b.write(fwd_b);
}
