// IF, ID, EX, MEM and WB stages of the core.
//
// Every stage is a clocked SC_METHOD that reads the stage registers in
// front of it and writes the one behind it. Stage registers are sc_signals,
// so all stages see the values from before the edge. Hold conditions:
//   mem_busy        IF, ID, EX hold, MEM/WB receives bubbles
//   redirect        IF fetches the branch target, ID inserts a bubble
//   load_use_stall  IF and IF/ID hold, ID inserts a bubble
#ifndef MEDRV_PIPELINE_STAGES_H
#define MEDRV_PIPELINE_STAGES_H

#include <systemc.h>

#include "MedRvTypes.h"
#include "MemoryImage.h"
#include "RegisterFile.h"
#include "VectorUnit.h"
#include "MatrixUnits.h"
#include "PoolingUnit.h"
#include "DmaUnit.h"

SC_MODULE(FetchStage) {
    sc_in<bool>        clk;
    sc_in<bool>        reset;
    sc_in<bool>        stall;
    sc_in<bool>        mem_busy;
    sc_in<bool>        redirect;
    sc_in<sc_uint<32>> redirect_target;
    sc_in<bool>        halt_pending;

    sc_out<IfIdReg>     if_id;
    sc_out<sc_uint<32>> pc_out;

    sc_port<imem_if>   imem;

    void set_reset_pc(sc_uint<32> addr) { reset_pc = addr; }
    void fetch_process();

    SC_CTOR(FetchStage) : reset_pc(0), pc(0) {
        SC_METHOD(fetch_process);
        sensitive << clk.pos();
        dont_initialize();
    }

private:
    IfIdReg fetch_at(sc_uint<32> addr);

    sc_uint<32> reset_pc;
    sc_uint<32> pc;
};

SC_MODULE(DecodeStage) {
    sc_in<bool>        clk;
    sc_in<bool>        reset;
    sc_in<bool>        stall;
    sc_in<bool>        mem_busy;
    sc_in<bool>        redirect;
    sc_in<IfIdReg>     if_id;
    sc_in<MemWbReg>    mem_wb;
    sc_in<sc_uint<2>>  forward_a, forward_b;

    sc_out<IdExReg>    id_ex;
    sc_out<bool>       halt_pending;

    void set_register_files(const RegisterFile* x, const FpRegisterFile* f) {
        int_regs = x;
        fp_regs = f;
    }
    void decode_process();

    SC_CTOR(DecodeStage) : int_regs(nullptr), fp_regs(nullptr) {
        SC_METHOD(decode_process);
        sensitive << clk.pos();
        dont_initialize();
    }

private:
    sc_uint<64> read_operand(sc_uint<5> index, reg_class cls, const MemWbReg& wb) const;

    const RegisterFile*   int_regs;
    const FpRegisterFile* fp_regs;
};

SC_MODULE(ExecuteStage) {
    sc_in<bool>        clk;
    sc_in<bool>        reset;
    sc_in<bool>        mem_busy;
    sc_in<IdExReg>     id_ex;
    sc_in<MemWbReg>    mem_wb;
    sc_in<sc_uint<2>>  forward_a, forward_b;

    sc_out<ExMemReg>    ex_mem;
    sc_out<bool>        redirect;
    sc_out<sc_uint<32>> redirect_target;

    void exec_process();
    void resolve_branch();

    SC_CTOR(ExecuteStage) {
        SC_METHOD(exec_process);
        sensitive << clk.pos();
        dont_initialize();

        SC_METHOD(resolve_branch);
        sensitive << id_ex << ex_mem << mem_wb << forward_a << forward_b;
    }

private:
    void operands(const IdExReg& de, sc_uint<64>& a, sc_uint<64>& b);
};

SC_MODULE(MemoryStage) {
    sc_in<bool>      clk;
    sc_in<bool>      reset;
    sc_in<ExMemReg>  ex_mem;

    sc_out<MemWbReg> mem_wb;
    sc_out<bool>     mem_busy;

    sc_port<dmem_if> dmem;

    // MEM is the only writer of data memory, CSRs, vector registers and
    // custom unit state
    CsrBank            csr;
    VectorRegisterFile vregs;
    MatrixMultiplyUnit mmul;
    MacUnit            mac;
    DotProductUnit     dot;
    PoolingUnit        pool;
    DmaUnit            dma;

    void set_mac_latency(unsigned cycles) { mac_latency = cycles; }
    void memory_process();
    void busy_detect();

    SC_CTOR(MemoryStage)
        : unit_active("unit_active"), unit_finishing("unit_finishing"), mac_latency(2) {
        SC_METHOD(memory_process);
        sensitive << clk.pos();
        dont_initialize();

        SC_METHOD(busy_detect);
        sensitive << ex_mem << unit_active << unit_finishing;
    }

private:
    dmem_if& data_memory() { return *dmem[0]; }

    void do_load(const ExMemReg& em, MemWbReg& wb);
    void do_store(const ExMemReg& em, MemWbReg& wb);
    void do_amo(const ExMemReg& em, MemWbReg& wb);
    void do_csr(const ExMemReg& em, MemWbReg& wb);
    void do_vector(const ExMemReg& em, MemWbReg& wb);
    void do_vector_memory(const ExMemReg& em, MemWbReg& wb);
    void do_channel(const ExMemReg& em, MemWbReg& wb);
    void fault(const ExMemReg& em, MemWbReg& wb, const char* what);

    void start_unit(const ExMemReg& em);
    MultiCycleUnit* unit_for(inst_class iclass);
    sc_uint<32> unit_result(inst_class iclass) const;
    void reset_units();

    sc_signal<bool> unit_active;
    sc_signal<bool> unit_finishing;
    unsigned        mac_latency;
};

// Observable state for the cycle just completed
struct DebugSnapshot {
    sc_uint<32> fetch_pc;           // next fetch address
    bool        retired;            // an instruction left WB this cycle
    sc_uint<32> last_pc;            // last retired instruction
    sc_uint<32> last_instruction;
    sc_uint<5>  rd;
    reg_class   rd_class;
    sc_uint<64> rd_value;
    bool        reg_write;
    sc_uint<8>  status;
    uint64_t    cycles;
    uint64_t    retired_count;
    bool        halted;

    DebugSnapshot()
        : fetch_pc(0), retired(false), last_pc(0), last_instruction(0), rd(0),
          rd_class(RC_NONE), rd_value(0), reg_write(false), status(0), cycles(0),
          retired_count(0), halted(false) {}
};

SC_MODULE(WritebackStage) {
    sc_in<bool>        clk;
    sc_in<bool>        reset;
    sc_in<MemWbReg>    mem_wb;

    void set_register_files(RegisterFile* x, FpRegisterFile* f) {
        int_regs = x;
        fp_regs = f;
    }
    void set_trace(bool on) { trace_retire = on; }
    void writeback_process();

    const DebugSnapshot& snapshot() const { return debug; }

    SC_CTOR(WritebackStage)
        : int_regs(nullptr), fp_regs(nullptr), trace_retire(false) {
        SC_METHOD(writeback_process);
        sensitive << clk.pos();
        dont_initialize();
    }

private:
    void trace(const MemWbReg& wb);

    RegisterFile*   int_regs;
    FpRegisterFile* fp_regs;
    bool            trace_retire;
    DebugSnapshot   debug;
};

#endif
