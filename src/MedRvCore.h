// Top level of the 5-stage core: stages, hazard unit, memory and
// architectural state of one core instance
#ifndef MEDRV_CORE_H
#define MEDRV_CORE_H

#include <systemc.h>

#include "MedRvConfig.h"
#include "MedRvTypes.h"
#include "MemoryImage.h"
#include "RegisterFile.h"
#include "HazardUnit.h"
#include "PipelineStages.h"

SC_MODULE(MedRvCore) {
    sc_in<bool> clk;
    sc_in<bool> reset;

    FetchStage*     fetch_stage;
    DecodeStage*    decode_stage;
    ExecuteStage*   execute_stage;
    MemoryStage*    memory_stage;
    WritebackStage* writeback_stage;
    HazardUnit*     hazard_unit;
    MemoryImage*    memory;

    sc_signal<IfIdReg>  if_id;
    sc_signal<IdExReg>  id_ex;
    sc_signal<ExMemReg> ex_mem;
    sc_signal<MemWbReg> mem_wb;

    sc_signal<bool>        load_use_stall;
    sc_signal<bool>        mem_busy;
    sc_signal<bool>        redirect;
    sc_signal<sc_uint<32>> redirect_target;
    sc_signal<bool>        halt_pending;
    sc_signal<sc_uint<2>>  forward_a, forward_b;
    sc_signal<sc_uint<32>> fetch_pc;

    MedRvCore(sc_module_name name, const SimConfig& config);
    ~MedRvCore();

    RegisterFile&       int_regs() { return x_regs; }
    FpRegisterFile&     fp_regs() { return f_regs; }
    CsrBank&            csr() { return memory_stage->csr; }
    VectorRegisterFile& vregs() { return memory_stage->vregs; }
    MemoryImage&        mem() { return *memory; }

    DebugSnapshot debug() const;

private:
    RegisterFile   x_regs;
    FpRegisterFile f_regs;
};

#endif
