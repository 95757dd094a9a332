// Decoded instruction, control bundle and pipeline stage registers
#ifndef MEDRV_TYPES_H
#define MEDRV_TYPES_H

#include <systemc.h>
#include <iostream>
#include <string>

#include "MedRvConfig.h"

enum inst_class {
    IC_NOP = 0,
    IC_ALU,
    IC_BRANCH,
    IC_JAL,
    IC_JALR,
    IC_LOAD,
    IC_STORE,
    IC_CSR,
    IC_HALT,
    IC_FPU,
    IC_AMO,
    IC_VECTOR,
    IC_VECTOR_LOAD,
    IC_VECTOR_STORE,
    IC_MATRIX,
    IC_DOT,
    IC_MAC,
    IC_ACT,
    IC_POOL,
    IC_DMA,
    IC_DMA_CHANNEL
};

enum alu_op {
    ALU_ADD = 0, ALU_SUB, ALU_SLL, ALU_SLT, ALU_SLTU, ALU_XOR,
    ALU_SRL, ALU_SRA, ALU_OR, ALU_AND,
    ALU_MUL, ALU_MULH, ALU_MULHSU, ALU_MULHU,
    ALU_DIV, ALU_DIVU, ALU_REM, ALU_REMU,
    ALU_PASS_B
};

enum alu_a_src { A_RS1 = 0, A_PC, A_ZERO };

enum reg_src_t { RS_NONE = 0, RS_ALU, RS_PC4, RS_MEM, RS_FPU, RS_ACT, RS_CSR, RS_UNIT };

enum reg_class { RC_NONE = 0, RC_INT, RC_FP };

enum mem_width { MW_NONE = 0, MW_BYTE, MW_HALF, MW_WORD, MW_DOUBLE };

enum imm_format { IMM_NONE = 0, IMM_I, IMM_S, IMM_B, IMM_U, IMM_J };

// Per-instruction status bits carried down the pipeline
enum status_flags {
    STATUS_DIV_BY_ZERO   = 0x1,
    STATUS_FP_INVALID    = 0x2,
    STATUS_UNIT_REJECTED = 0x4,
    STATUS_MEM_FAULT     = 0x8
};

struct DecodedInstruction {
    sc_uint<32> raw;
    sc_uint<7>  opcode;
    sc_uint<3>  funct3;
    sc_uint<7>  funct7;
    sc_uint<5>  rs1, rs2, rd;
    sc_int<32>  imm;
    inst_class  iclass;
    int         entry;      // decode table row, -1 for no-op

    DecodedInstruction()
        : raw(0), opcode(0), funct3(0), funct7(0), rs1(0), rs2(0), rd(0),
          imm(0), iclass(IC_NOP), entry(-1) {}

    bool operator==(const DecodedInstruction& o) const {
        return raw == o.raw && opcode == o.opcode && funct3 == o.funct3 &&
               funct7 == o.funct7 && rs1 == o.rs1 && rs2 == o.rs2 &&
               rd == o.rd && imm == o.imm && iclass == o.iclass && entry == o.entry;
    }
};

struct ControlSignals {
    bool        reg_write;
    bool        mem_read;
    bool        mem_write;
    bool        branch;
    bool        jump;
    bool        jalr;
    alu_op      alu;
    bool        alu_src;        // operand B from immediate
    alu_a_src   a_src;
    reg_src_t   reg_src;
    reg_class   rs1_class, rs2_class, rd_class;
    mem_width   width;
    bool        mem_unsigned;
    bool        late_result;    // value only exists after MEM
    bool        multi_cycle;
    bool        fp_double;
    unsigned    sub_op;

    ControlSignals()
        : reg_write(false), mem_read(false), mem_write(false), branch(false),
          jump(false), jalr(false), alu(ALU_ADD), alu_src(false), a_src(A_RS1),
          reg_src(RS_NONE), rs1_class(RC_NONE), rs2_class(RC_NONE), rd_class(RC_NONE),
          width(MW_NONE), mem_unsigned(false), late_result(false), multi_cycle(false),
          fp_double(false), sub_op(0) {}

    bool operator==(const ControlSignals& o) const {
        return reg_write == o.reg_write && mem_read == o.mem_read &&
               mem_write == o.mem_write && branch == o.branch && jump == o.jump &&
               jalr == o.jalr && alu == o.alu && alu_src == o.alu_src &&
               a_src == o.a_src && reg_src == o.reg_src && rs1_class == o.rs1_class &&
               rs2_class == o.rs2_class && rd_class == o.rd_class && width == o.width &&
               mem_unsigned == o.mem_unsigned && late_result == o.late_result &&
               multi_cycle == o.multi_cycle && fp_double == o.fp_double && sub_op == o.sub_op;
    }
};

// ---------------- pipeline stage registers ----------------

struct IfIdReg {
    sc_uint<32> pc;
    sc_uint<32> instruction;
    bool        valid;

    IfIdReg() : pc(0), instruction(MEDRV_NOP), valid(false) {}

    bool operator==(const IfIdReg& o) const {
        return pc == o.pc && instruction == o.instruction && valid == o.valid;
    }
};

struct IdExReg {
    sc_uint<32>        pc;
    DecodedInstruction inst;
    ControlSignals     ctrl;
    sc_uint<64>        rs1_val;
    sc_uint<64>        rs2_val;
    bool               valid;

    IdExReg() : pc(0), rs1_val(0), rs2_val(0), valid(false) {}

    bool operator==(const IdExReg& o) const {
        return pc == o.pc && inst == o.inst && ctrl == o.ctrl &&
               rs1_val == o.rs1_val && rs2_val == o.rs2_val && valid == o.valid;
    }
};

struct ExMemReg {
    sc_uint<32>        pc;
    DecodedInstruction inst;
    ControlSignals     ctrl;
    sc_uint<64>        result;     // ALU / link / FPU / activation value, or address
    sc_uint<64>        op_a;       // forwarded rs1 value
    sc_uint<64>        op_b;       // forwarded rs2 value (store data)
    sc_uint<8>         status;
    bool               valid;

    ExMemReg() : pc(0), result(0), op_a(0), op_b(0), status(0), valid(false) {}

    bool operator==(const ExMemReg& o) const {
        return pc == o.pc && inst == o.inst && ctrl == o.ctrl && result == o.result &&
               op_a == o.op_a && op_b == o.op_b && status == o.status && valid == o.valid;
    }
};

struct MemWbReg {
    sc_uint<32>        pc;
    DecodedInstruction inst;
    ControlSignals     ctrl;
    sc_uint<64>        result;
    bool               result_valid;
    sc_uint<8>         status;
    bool               valid;

    MemWbReg() : pc(0), result(0), result_valid(false), status(0), valid(false) {}

    bool operator==(const MemWbReg& o) const {
        return pc == o.pc && inst == o.inst && ctrl == o.ctrl && result == o.result &&
               result_valid == o.result_valid && status == o.status && valid == o.valid;
    }
};

// sc_signal<T> needs stream output and a trace hook for user types

inline std::ostream& operator<<(std::ostream& os, const IfIdReg& r) {
    os << "IF/ID{" << (r.valid ? "v" : "-") << " pc=0x" << std::hex << r.pc.to_uint()
       << " inst=0x" << r.instruction.to_uint() << std::dec << "}";
    return os;
}

inline std::ostream& operator<<(std::ostream& os, const IdExReg& r) {
    os << "ID/EX{" << (r.valid ? "v" : "-") << " pc=0x" << std::hex << r.pc.to_uint()
       << " inst=0x" << r.inst.raw.to_uint() << std::dec << " rd=" << r.inst.rd.to_uint() << "}";
    return os;
}

inline std::ostream& operator<<(std::ostream& os, const ExMemReg& r) {
    os << "EX/MEM{" << (r.valid ? "v" : "-") << " pc=0x" << std::hex << r.pc.to_uint()
       << " res=0x" << r.result.to_uint64() << std::dec << " rd=" << r.inst.rd.to_uint() << "}";
    return os;
}

inline std::ostream& operator<<(std::ostream& os, const MemWbReg& r) {
    os << "MEM/WB{" << (r.valid ? "v" : "-") << " pc=0x" << std::hex << r.pc.to_uint()
       << " res=0x" << r.result.to_uint64() << std::dec << " rd=" << r.inst.rd.to_uint() << "}";
    return os;
}

inline void sc_trace(sc_trace_file* tf, const IfIdReg& r, const std::string& name) {
    sc_trace(tf, r.valid, name + ".valid");
    sc_trace(tf, r.pc, name + ".pc");
    sc_trace(tf, r.instruction, name + ".instruction");
}

inline void sc_trace(sc_trace_file* tf, const IdExReg& r, const std::string& name) {
    sc_trace(tf, r.valid, name + ".valid");
    sc_trace(tf, r.pc, name + ".pc");
    sc_trace(tf, r.inst.raw, name + ".inst");
    sc_trace(tf, r.rs1_val, name + ".rs1_val");
    sc_trace(tf, r.rs2_val, name + ".rs2_val");
}

inline void sc_trace(sc_trace_file* tf, const ExMemReg& r, const std::string& name) {
    sc_trace(tf, r.valid, name + ".valid");
    sc_trace(tf, r.pc, name + ".pc");
    sc_trace(tf, r.inst.raw, name + ".inst");
    sc_trace(tf, r.result, name + ".result");
}

inline void sc_trace(sc_trace_file* tf, const MemWbReg& r, const std::string& name) {
    sc_trace(tf, r.valid, name + ".valid");
    sc_trace(tf, r.pc, name + ".pc");
    sc_trace(tf, r.inst.raw, name + ".inst");
    sc_trace(tf, r.result, name + ".result");
    sc_trace(tf, r.result_valid, name + ".result_valid");
}

#endif
