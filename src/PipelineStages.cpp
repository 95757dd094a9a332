#include "PipelineStages.h"
#include "Alu.h"
#include "Ieee754.h"
#include "Activation.h"
#include "AmoUnit.h"
#include "Decoder.h"
#include "HazardUnit.h"

#include <sstream>

static sc_uint<32> low_word(sc_uint<64> value) {
    return value.range(31, 0);
}

// ======================================================================
// IF
// ======================================================================

IfIdReg FetchStage::fetch_at(sc_uint<32> addr) {
    IfIdReg r;
    imem_response response = imem->fetch(addr);
    r.pc = addr;
    r.instruction = response.ready ? response.instruction : sc_uint<32>(MEDRV_NOP);
    r.valid = true;
    return r;
}

void FetchStage::fetch_process() {
    if (reset.read()) {
        pc = reset_pc;
        if_id.write(IfIdReg());
    } else if (mem_busy.read()) {
        // hold
    } else if (redirect.read()) {
        sc_uint<32> target = redirect_target.read();
        if_id.write(fetch_at(target));
        pc = target + 4;
    } else if (stall.read()) {
        // hold
    } else if (halt_pending.read()) {
        if_id.write(IfIdReg());
    } else {
        if_id.write(fetch_at(pc));
        pc = pc + 4;
    }
    pc_out.write(pc);
}

// ======================================================================
// ID
// ======================================================================

// Register read with bypass of the value WB commits on this same edge
sc_uint<64> DecodeStage::read_operand(sc_uint<5> index, reg_class cls, const MemWbReg& wb) const {
    if (cls == RC_NONE) return 0;

    bool bypass = wb.valid && wb.result_valid && wb.ctrl.reg_write &&
                  wb.ctrl.rd_class == cls && wb.inst.rd == index;

    if (cls == RC_INT) {
        if (index == 0) return 0;
        if (bypass) return low_word(wb.result);
        return int_regs->read(index);
    }
    if (bypass) return wb.result;
    return fp_regs->read(index);
}

void DecodeStage::decode_process() {
    if (reset.read()) {
        id_ex.write(IdExReg());
        halt_pending.write(false);
        return;
    }

    if (mem_busy.read()) {
        // the producer in MEM/WB retires during the hold, capture its value now
        IdExReg held = id_ex.read();
        if (held.valid) {
            MemWbReg wb = mem_wb.read();
            bool refreshed = false;
            if (forward_a.read() == FWD_MEM_WB) {
                held.rs1_val = wb.result;
                refreshed = true;
            }
            if (forward_b.read() == FWD_MEM_WB) {
                held.rs2_val = wb.result;
                refreshed = true;
            }
            if (refreshed) id_ex.write(held);
        }
        return;
    }

    IfIdReg fd = if_id.read();
    if (redirect.read() || stall.read() || halt_pending.read() || !fd.valid) {
        id_ex.write(IdExReg());
        return;
    }

    IdExReg de;
    MemWbReg wb = mem_wb.read();
    de.pc      = fd.pc;
    de.inst    = decode_instruction(fd.instruction);
    de.ctrl    = control_for(de.inst);
    de.rs1_val = read_operand(de.inst.rs1, de.ctrl.rs1_class, wb);
    de.rs2_val = read_operand(de.inst.rs2, de.ctrl.rs2_class, wb);
    de.valid   = true;

    if (de.inst.iclass == IC_HALT) halt_pending.write(true);
    id_ex.write(de);
}

// ======================================================================
// EX
// ======================================================================

void ExecuteStage::operands(const IdExReg& de, sc_uint<64>& a, sc_uint<64>& b) {
    ExMemReg em = ex_mem.read();
    MemWbReg wb = mem_wb.read();
    a = forward_operand(forward_a.read(), de.rs1_val, em, wb);
    b = forward_operand(forward_b.read(), de.rs2_val, em, wb);
}

void ExecuteStage::exec_process() {
    if (reset.read()) {
        ex_mem.write(ExMemReg());
        return;
    }
    if (mem_busy.read()) return;

    IdExReg de = id_ex.read();
    if (!de.valid) {
        ex_mem.write(ExMemReg());
        return;
    }

    sc_uint<64> a, b;
    operands(de, a, b);

    ExMemReg em;
    em.pc    = de.pc;
    em.inst  = de.inst;
    em.ctrl  = de.ctrl;
    em.op_a  = a;
    em.op_b  = b;
    em.valid = true;

    switch (de.inst.iclass) {
        case IC_FPU: {
            fpu_op op = (fpu_op)de.ctrl.sub_op;
            fpu_result r = de.ctrl.fp_double ? fpu_double(op, a, b)
                                             : fpu_single(op, low_word(a), low_word(b));
            em.result = r.bits;
            if (r.invalid) em.status = em.status | STATUS_FP_INVALID;
            break;
        }
        case IC_ACT:
            em.result = (uint32_t)activation_compute(de.ctrl.sub_op,
                                                     (int32_t)low_word(a).to_uint()).to_int();
            break;
        case IC_JAL:
        case IC_JALR:
            em.result = sc_uint<32>(de.pc + 4);
            break;
        default: {
            sc_uint<32> alu_a = low_word(a);
            if (de.ctrl.a_src == A_PC) alu_a = de.pc;
            else if (de.ctrl.a_src == A_ZERO) alu_a = 0;
            sc_uint<32> alu_b = de.ctrl.alu_src ? sc_uint<32>((uint32_t)de.inst.imm.to_int())
                                                : low_word(b);
            alu_result r = alu_compute(alu_a, alu_b, de.ctrl.alu);
            em.result = r.result;
            if (r.div_by_zero) em.status = em.status | STATUS_DIV_BY_ZERO;
            break;
        }
    }

    ex_mem.write(em);
}

// Combinational branch resolution for the instruction currently in EX
void ExecuteStage::resolve_branch() {
    IdExReg de = id_ex.read();
    bool taken = false;
    sc_uint<32> target = 0;

    if (de.valid && (de.ctrl.branch || de.ctrl.jump || de.ctrl.jalr)) {
        sc_uint<64> a, b;
        operands(de, a, b);
        sc_uint<32> imm = (uint32_t)de.inst.imm.to_int();

        if (de.ctrl.jump) {
            taken = true;
            target = de.pc + imm;
        } else if (de.ctrl.jalr) {
            taken = true;
            target = (low_word(a) + imm) & ~sc_uint<32>(1);
        } else {
            alu_result cmp = alu_compute(low_word(a), low_word(b), de.ctrl.alu);
            if (branch_condition(de.inst.funct3, cmp)) {
                taken = true;
                target = de.pc + imm;
            }
        }
    }

    redirect.write(taken);
    redirect_target.write(target);
}

// ======================================================================
// MEM
// ======================================================================

static MemWbReg pass_through(const ExMemReg& em) {
    MemWbReg wb;
    wb.pc           = em.pc;
    wb.inst         = em.inst;
    wb.ctrl         = em.ctrl;
    wb.result       = em.result;
    wb.result_valid = true;
    wb.status       = em.status;
    wb.valid        = true;
    return wb;
}

static void reject(MemWbReg& wb) {
    wb.result = 0;
    wb.result_valid = false;
    wb.status = wb.status | STATUS_UNIT_REJECTED;

    std::ostringstream msg;
    msg << mnemonic_of(wb.inst) << " at pc 0x" << std::hex << wb.pc.to_uint() << " rejected";
    SC_REPORT_INFO_VERB(MEDRV_MSG_CORE, msg.str().c_str(), SC_HIGH);
}

void MemoryStage::busy_detect() {
    ExMemReg em = ex_mem.read();
    bool busy = em.valid && em.ctrl.multi_cycle &&
                !(unit_active.read() && unit_finishing.read());
    mem_busy.write(busy);
}

void MemoryStage::fault(const ExMemReg& em, MemWbReg& wb, const char* what) {
    wb.result = 0;
    wb.status = wb.status | STATUS_MEM_FAULT;

    std::ostringstream msg;
    msg << what << " fault at address 0x" << std::hex << low_word(em.result).to_uint()
        << " (pc 0x" << em.pc.to_uint() << ")";
    SC_REPORT_WARNING(MEDRV_MSG_MEMORY, msg.str().c_str());
}

void MemoryStage::do_load(const ExMemReg& em, MemWbReg& wb) {
    sc_uint<32> addr = low_word(em.result);
    unsigned lane = addr.range(1, 0).to_uint();
    sc_uint<32> word;

    switch (em.ctrl.width) {
        case MW_BYTE: {
            if (!dmem_read_word(data_memory(), addr & ~sc_uint<32>(3), word)) break;
            uint32_t v = (word.to_uint() >> (8 * lane)) & 0xFF;
            wb.result = em.ctrl.mem_unsigned ? v : (uint32_t)(int32_t)(int8_t)v;
            return;
        }
        case MW_HALF: {
            if (addr[0] || !dmem_read_word(data_memory(), addr & ~sc_uint<32>(3), word)) break;
            uint32_t v = (word.to_uint() >> (8 * lane)) & 0xFFFF;
            wb.result = em.ctrl.mem_unsigned ? v : (uint32_t)(int32_t)(int16_t)v;
            return;
        }
        case MW_WORD:
            if (lane != 0 || !dmem_read_word(data_memory(), addr, word)) break;
            wb.result = word;
            return;
        case MW_DOUBLE: {
            sc_uint<32> hi;
            if (lane != 0 || !data_memory().in_range(addr, 8)) break;
            if (!dmem_read_word(data_memory(), addr, word) ||
                !dmem_read_word(data_memory(), addr + 4, hi)) break;
            sc_uint<64> v;
            v.range(31, 0) = word;
            v.range(63, 32) = hi;
            wb.result = v;
            return;
        }
        case MW_NONE:
            break;
    }
    fault(em, wb, "load");
}

void MemoryStage::do_store(const ExMemReg& em, MemWbReg& wb) {
    sc_uint<32> addr = low_word(em.result);
    unsigned lane = addr.range(1, 0).to_uint();
    uint32_t data = low_word(em.op_b).to_uint();

    dmem_request request;
    request.addr = addr & ~sc_uint<32>(3);
    request.we = true;
    request.req = true;

    switch (em.ctrl.width) {
        case MW_BYTE:
            request.wdata = (data & 0xFF) << (8 * lane);
            request.byte_enable = 0x1 << lane;
            if (data_memory().access(request).ready) return;
            break;
        case MW_HALF:
            if (addr[0]) break;
            request.wdata = (data & 0xFFFF) << (8 * lane);
            request.byte_enable = 0x3 << lane;
            if (data_memory().access(request).ready) return;
            break;
        case MW_WORD:
            if (lane != 0) break;
            if (dmem_write_word(data_memory(), addr, data)) return;
            break;
        case MW_DOUBLE:
            if (lane != 0 || !data_memory().in_range(addr, 8)) break;
            if (dmem_write_word(data_memory(), addr, data) &&
                dmem_write_word(data_memory(), addr + 4, em.op_b.range(63, 32))) return;
            break;
        case MW_NONE:
            break;
    }
    fault(em, wb, "store");
}

void MemoryStage::do_amo(const ExMemReg& em, MemWbReg& wb) {
    amo_result r = amo_execute(data_memory(), (amo_op)em.ctrl.sub_op, low_word(em.result),
                               low_word(em.op_b), em.inst.raw[26], em.inst.raw[25]);
    if (!r.valid) {
        reject(wb);
        return;
    }
    wb.result = r.old_value;
}

void MemoryStage::do_csr(const ExMemReg& em, MemWbReg& wb) {
    sc_uint<12> addr = em.inst.raw.range(31, 20);
    unsigned funct3 = em.inst.funct3.to_uint();
    bool immediate = funct3 & 0x4;
    csr_op op = (csr_op)(funct3 & 0x3);

    sc_uint<32> operand = immediate ? sc_uint<32>(em.inst.rs1) : low_word(em.op_a);
    // CSRRS/CSRRC with x0 or a zero immediate only read
    bool do_write = (op == CSR_OP_WRITE) || em.inst.rs1 != 0;

    wb.result = csr.read_modify_write(addr, op, operand, do_write);
}

void MemoryStage::do_vector(const ExMemReg& em, MemWbReg& wb) {
    unsigned funct6 = em.inst.raw.range(31, 26).to_uint();
    vreg operand;

    switch (em.inst.funct3.to_uint()) {
        case VSRC_VV:
            operand = vregs.read(em.inst.rs1);
            break;
        case VSRC_VX:
            operand = vreg::broadcast(low_word(em.op_a));
            break;
        case VSRC_VI: {
            int32_t simm5 = ((int32_t)(em.inst.rs1.to_uint() << 27)) >> 27;
            operand = vreg::broadcast((uint32_t)simm5);
            break;
        }
        default:
            reject(wb);
            return;
    }

    vreg out;
    if (!vector_compute(funct6, vregs.read(em.inst.rs2), operand, out)) {
        reject(wb);
        return;
    }
    vregs.write(em.inst.rd, out);
}

void MemoryStage::do_vector_memory(const ExMemReg& em, MemWbReg& wb) {
    sc_uint<32> base = low_word(em.result);
    if (base.range(1, 0) != 0 || !data_memory().in_range(base, 4 * MEDRV_VLEN)) {
        fault(em, wb, em.inst.iclass == IC_VECTOR_LOAD ? "vector load" : "vector store");
        return;
    }

    if (em.inst.iclass == IC_VECTOR_LOAD) {
        vreg v;
        for (unsigned i = 0; i < MEDRV_VLEN; ++i)
            dmem_read_word(data_memory(), base + 4 * i, v.lane[i]);
        vregs.write(em.inst.rd, v);
    } else {
        const vreg& v = vregs.read(em.inst.rd);     // vs3
        for (unsigned i = 0; i < MEDRV_VLEN; ++i)
            dmem_write_word(data_memory(), base + 4 * i, v.lane[i]);
    }
}

void MemoryStage::do_channel(const ExMemReg& em, MemWbReg& wb) {
    sc_uint<32> index = low_word(em.op_a);
    bool ok;
    if (em.ctrl.sub_op == DMA_CHANNEL_READ) {
        sc_uint<32> value;
        ok = dma.channel_read(index, value);
        wb.result = value;
    } else {
        ok = dma.channel_write(index, low_word(em.op_b));
    }
    if (!ok) reject(wb);
}

MultiCycleUnit* MemoryStage::unit_for(inst_class iclass) {
    switch (iclass) {
        case IC_MATRIX: return &mmul;
        case IC_DOT:    return &dot;
        case IC_MAC:    return &mac;
        case IC_POOL:   return &pool;
        case IC_DMA:    return &dma;
        default:        return nullptr;
    }
}

void MemoryStage::start_unit(const ExMemReg& em) {
    sc_uint<32> a = low_word(em.op_a);
    sc_uint<32> b = low_word(em.op_b);

    switch (em.inst.iclass) {
        case IC_MATRIX:
            mmul.start(data_memory(), a);
            break;
        case IC_DOT:
            dot.start(data_memory(), a);
            break;
        case IC_MAC:
            if (em.ctrl.sub_op == MAC_READ)
                mac.start_read();
            else
                mac.start_mac((int32_t)a.to_uint(), (int32_t)b.to_uint(),
                              em.ctrl.sub_op == MAC_CLEAR_ACC, mac_latency);
            break;
        case IC_POOL:
            pool.start(data_memory(), a, em.ctrl.sub_op == POOL_AVG ? POOL_AVG : POOL_MAX);
            break;
        case IC_DMA:
            dma.start(data_memory(), em.ctrl.sub_op, a, b);
            break;
        default:
            break;
    }
}

sc_uint<32> MemoryStage::unit_result(inst_class iclass) const {
    switch (iclass) {
        case IC_MATRIX: return mmul.result();
        case IC_DOT:    return (uint32_t)(dot.sum().to_int64() & 0xFFFFFFFF);
        case IC_MAC:    return (uint32_t)mac.accumulator().to_int();
        case IC_POOL:   return pool.result();
        case IC_DMA:    return dma.result();
        default:        return 0;
    }
}

void MemoryStage::reset_units() {
    mmul.reset();
    mac.reset();
    dot.reset();
    pool.reset();
    dma.reset();
}

void MemoryStage::memory_process() {
    if (reset.read()) {
        mem_wb.write(MemWbReg());
        reset_units();
        csr.reset();
        vregs.reset();
        unit_active.write(false);
        unit_finishing.write(false);
        return;
    }

    ExMemReg em = ex_mem.read();
    if (!em.valid) {
        mem_wb.write(MemWbReg());
        return;
    }

    if (em.ctrl.multi_cycle) {
        MultiCycleUnit* unit = unit_for(em.inst.iclass);
        if (!unit) {
            MemWbReg wb = pass_through(em);
            reject(wb);
            mem_wb.write(wb);
            return;
        }

        if (!unit_active.read()) {
            start_unit(em);
            unit_active.write(true);
            unit_finishing.write(unit->finishing());
            mem_wb.write(MemWbReg());
            return;
        }

        unit->tick();
        if (!unit->done()) {
            unit_finishing.write(unit->finishing());
            mem_wb.write(MemWbReg());
            return;
        }

        MemWbReg wb = pass_through(em);
        if (unit->valid())
            wb.result = unit_result(em.inst.iclass);
        else
            reject(wb);
        unit->acknowledge();
        unit_active.write(false);
        unit_finishing.write(false);
        mem_wb.write(wb);
        return;
    }

    MemWbReg wb = pass_through(em);
    switch (em.inst.iclass) {
        case IC_LOAD:         do_load(em, wb); break;
        case IC_STORE:        do_store(em, wb); break;
        case IC_AMO:          do_amo(em, wb); break;
        case IC_CSR:          do_csr(em, wb); break;
        case IC_VECTOR:       do_vector(em, wb); break;
        case IC_VECTOR_LOAD:
        case IC_VECTOR_STORE: do_vector_memory(em, wb); break;
        case IC_DMA_CHANNEL:  do_channel(em, wb); break;
        default: break;
    }
    mem_wb.write(wb);
}

// ======================================================================
// WB
// ======================================================================

void WritebackStage::trace(const MemWbReg& wb) {
    std::ostringstream msg;
    msg << "retire pc=0x" << std::hex << wb.pc.to_uint() << " " << mnemonic_of(wb.inst);
    if (debug.reg_write)
        msg << " " << (wb.ctrl.rd_class == RC_FP ? "f" : "x") << std::dec << wb.inst.rd.to_uint()
            << " <= 0x" << std::hex << wb.result.to_uint64();
    if (wb.status != 0)
        msg << " status=0x" << wb.status.to_uint();
    SC_REPORT_INFO_VERB(MEDRV_MSG_CORE, msg.str().c_str(), SC_DEBUG);
}

void WritebackStage::writeback_process() {
    if (reset.read()) {
        debug = DebugSnapshot();
        return;
    }

    if (!debug.halted) ++debug.cycles;
    debug.retired   = false;
    debug.reg_write = false;
    debug.status    = 0;

    MemWbReg wb = mem_wb.read();
    if (!wb.valid) return;

    bool write = wb.ctrl.reg_write && wb.result_valid;
    if (write && wb.ctrl.rd_class == RC_INT) {
        int_regs->write(wb.inst.rd, low_word(wb.result));
        write = wb.inst.rd != 0;
    } else if (write && wb.ctrl.rd_class == RC_FP) {
        fp_regs->write(wb.inst.rd, wb.result);
    } else {
        write = false;
    }

    debug.retired          = true;
    debug.last_pc          = wb.pc;
    debug.last_instruction = wb.inst.raw;
    debug.rd               = wb.inst.rd;
    debug.rd_class         = wb.ctrl.rd_class;
    debug.rd_value         = write ? wb.result : sc_uint<64>(0);
    debug.reg_write        = write;
    debug.status           = wb.status;
    ++debug.retired_count;

    if (wb.inst.iclass == IC_HALT) debug.halted = true;
    if (trace_retire) trace(wb);
}
