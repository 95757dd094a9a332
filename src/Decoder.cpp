#include "Decoder.h"

#include <vector>

static const uint32_t MASK_OPCODE = 0x0000007F;
static const uint32_t MASK_FUNCT3 = 0x0000707F;
static const uint32_t MASK_FUNCT7 = 0xFE00707F;
static const uint32_t MASK_OP_FP  = 0xFE00007F;   // rounding mode ignored
static const uint32_t MASK_AMO    = 0xF800707F;   // aq/rl free
static const uint32_t MASK_OP_V   = 0xFC00707F;   // vm free
static const uint32_t MASK_EXACT  = 0xFFFFFFFF;

static uint32_t enc(uint32_t opcode, uint32_t funct3 = 0, uint32_t funct7 = 0) {
    return opcode | (funct3 << 12) | (funct7 << 25);
}

// ---------------- control bundle builders ----------------

static ControlSignals ctrl_none() {
    return ControlSignals();
}

static ControlSignals ctrl_alu_r(alu_op op) {
    ControlSignals c;
    c.reg_write = true;
    c.alu = op;
    c.reg_src = RS_ALU;
    c.rs1_class = RC_INT;
    c.rs2_class = RC_INT;
    c.rd_class = RC_INT;
    return c;
}

static ControlSignals ctrl_alu_i(alu_op op) {
    ControlSignals c = ctrl_alu_r(op);
    c.alu_src = true;
    c.rs2_class = RC_NONE;
    return c;
}

static ControlSignals ctrl_upper(alu_a_src a) {
    ControlSignals c = ctrl_alu_i(ALU_ADD);
    c.a_src = a;
    c.rs1_class = RC_NONE;
    return c;
}

static ControlSignals ctrl_branch(alu_op compare) {
    ControlSignals c;
    c.branch = true;
    c.alu = compare;
    c.rs1_class = RC_INT;
    c.rs2_class = RC_INT;
    return c;
}

static ControlSignals ctrl_jal() {
    ControlSignals c;
    c.reg_write = true;
    c.jump = true;
    c.reg_src = RS_PC4;
    c.rd_class = RC_INT;
    return c;
}

static ControlSignals ctrl_jalr() {
    ControlSignals c = ctrl_jal();
    c.jump = false;
    c.jalr = true;
    c.alu_src = true;
    c.rs1_class = RC_INT;
    return c;
}

static ControlSignals ctrl_load(mem_width width, bool is_unsigned, reg_class rd) {
    ControlSignals c;
    c.reg_write = true;
    c.mem_read = true;
    c.alu_src = true;
    c.reg_src = RS_MEM;
    c.rs1_class = RC_INT;
    c.rd_class = rd;
    c.width = width;
    c.mem_unsigned = is_unsigned;
    c.late_result = true;
    return c;
}

static ControlSignals ctrl_store(mem_width width, reg_class data) {
    ControlSignals c;
    c.mem_write = true;
    c.alu_src = true;
    c.rs1_class = RC_INT;
    c.rs2_class = data;
    c.width = width;
    return c;
}

static ControlSignals ctrl_csr(bool immediate) {
    ControlSignals c;
    c.reg_write = true;
    c.reg_src = RS_CSR;
    c.rs1_class = immediate ? RC_NONE : RC_INT;
    c.rd_class = RC_INT;
    c.late_result = true;
    return c;
}

static ControlSignals ctrl_fpu(unsigned op, bool is_double) {
    ControlSignals c;
    c.reg_write = true;
    c.reg_src = RS_FPU;
    c.rs1_class = RC_FP;
    c.rs2_class = RC_FP;
    c.rd_class = RC_FP;
    c.fp_double = is_double;
    c.sub_op = op;
    return c;
}

static ControlSignals ctrl_amo(unsigned funct5) {
    ControlSignals c;
    c.reg_write = true;
    c.alu_src = true;           // address = rs1 + 0
    c.reg_src = RS_MEM;
    c.rs1_class = RC_INT;
    c.rs2_class = RC_INT;
    c.rd_class = RC_INT;
    c.width = MW_WORD;
    c.late_result = true;
    c.sub_op = funct5;
    return c;
}

static ControlSignals ctrl_vector(unsigned funct6, unsigned funct3) {
    ControlSignals c;
    c.rs1_class = (funct3 == 0x4) ? RC_INT : RC_NONE;   // .vx reads x[rs1]
    c.sub_op = funct6;
    return c;
}

static ControlSignals ctrl_vector_mem(bool store) {
    ControlSignals c;
    c.mem_read = !store;
    c.mem_write = store;
    c.alu_src = true;
    c.rs1_class = RC_INT;
    c.width = MW_WORD;
    return c;
}

// custom units that return a value in rd after MEM
static ControlSignals ctrl_unit(reg_class rs1, reg_class rs2, bool multi_cycle, unsigned op) {
    ControlSignals c;
    c.reg_write = true;
    c.alu_src = true;
    c.reg_src = RS_UNIT;
    c.rs1_class = rs1;
    c.rs2_class = rs2;
    c.rd_class = RC_INT;
    c.late_result = true;
    c.multi_cycle = multi_cycle;
    c.sub_op = op;
    return c;
}

static ControlSignals ctrl_act() {
    ControlSignals c;
    c.reg_write = true;
    c.reg_src = RS_ACT;
    c.rs1_class = RC_INT;
    c.rd_class = RC_INT;
    return c;
}

static ControlSignals ctrl_channel_write() {
    ControlSignals c;
    c.alu_src = true;
    c.rs1_class = RC_INT;
    c.rs2_class = RC_INT;
    c.sub_op = DMA_CHANNEL_WRITE;
    return c;
}

// ---------------- decode table ----------------

static decode_entry row(const char* mnemonic, uint32_t match, uint32_t mask,
                        inst_class iclass, imm_format format, const ControlSignals& ctrl) {
    decode_entry e;
    e.mnemonic = mnemonic;
    e.match = match;
    e.mask = mask;
    e.iclass = iclass;
    e.format = format;
    e.ctrl = ctrl;
    return e;
}

static std::vector<decode_entry> build_table() {
    std::vector<decode_entry> t;

    t.push_back(row("lui",   enc(OPC_LUI),   MASK_OPCODE, IC_ALU, IMM_U, ctrl_upper(A_ZERO)));
    t.push_back(row("auipc", enc(OPC_AUIPC), MASK_OPCODE, IC_ALU, IMM_U, ctrl_upper(A_PC)));
    t.push_back(row("jal",   enc(OPC_JAL),   MASK_OPCODE, IC_JAL, IMM_J, ctrl_jal()));
    t.push_back(row("jalr",  enc(OPC_JALR, 0), MASK_FUNCT3, IC_JALR, IMM_I, ctrl_jalr()));

    t.push_back(row("beq",  enc(OPC_BRANCH, 0), MASK_FUNCT3, IC_BRANCH, IMM_B, ctrl_branch(ALU_SUB)));
    t.push_back(row("bne",  enc(OPC_BRANCH, 1), MASK_FUNCT3, IC_BRANCH, IMM_B, ctrl_branch(ALU_SUB)));
    t.push_back(row("blt",  enc(OPC_BRANCH, 4), MASK_FUNCT3, IC_BRANCH, IMM_B, ctrl_branch(ALU_SLT)));
    t.push_back(row("bge",  enc(OPC_BRANCH, 5), MASK_FUNCT3, IC_BRANCH, IMM_B, ctrl_branch(ALU_SLT)));
    t.push_back(row("bltu", enc(OPC_BRANCH, 6), MASK_FUNCT3, IC_BRANCH, IMM_B, ctrl_branch(ALU_SLTU)));
    t.push_back(row("bgeu", enc(OPC_BRANCH, 7), MASK_FUNCT3, IC_BRANCH, IMM_B, ctrl_branch(ALU_SLTU)));

    t.push_back(row("lb",  enc(OPC_LOAD, 0), MASK_FUNCT3, IC_LOAD, IMM_I, ctrl_load(MW_BYTE, false, RC_INT)));
    t.push_back(row("lh",  enc(OPC_LOAD, 1), MASK_FUNCT3, IC_LOAD, IMM_I, ctrl_load(MW_HALF, false, RC_INT)));
    t.push_back(row("lw",  enc(OPC_LOAD, 2), MASK_FUNCT3, IC_LOAD, IMM_I, ctrl_load(MW_WORD, false, RC_INT)));
    t.push_back(row("lbu", enc(OPC_LOAD, 4), MASK_FUNCT3, IC_LOAD, IMM_I, ctrl_load(MW_BYTE, true, RC_INT)));
    t.push_back(row("lhu", enc(OPC_LOAD, 5), MASK_FUNCT3, IC_LOAD, IMM_I, ctrl_load(MW_HALF, true, RC_INT)));

    t.push_back(row("sb", enc(OPC_STORE, 0), MASK_FUNCT3, IC_STORE, IMM_S, ctrl_store(MW_BYTE, RC_INT)));
    t.push_back(row("sh", enc(OPC_STORE, 1), MASK_FUNCT3, IC_STORE, IMM_S, ctrl_store(MW_HALF, RC_INT)));
    t.push_back(row("sw", enc(OPC_STORE, 2), MASK_FUNCT3, IC_STORE, IMM_S, ctrl_store(MW_WORD, RC_INT)));

    t.push_back(row("addi",  enc(OPC_OP_IMM, 0), MASK_FUNCT3, IC_ALU, IMM_I, ctrl_alu_i(ALU_ADD)));
    t.push_back(row("slti",  enc(OPC_OP_IMM, 2), MASK_FUNCT3, IC_ALU, IMM_I, ctrl_alu_i(ALU_SLT)));
    t.push_back(row("sltiu", enc(OPC_OP_IMM, 3), MASK_FUNCT3, IC_ALU, IMM_I, ctrl_alu_i(ALU_SLTU)));
    t.push_back(row("xori",  enc(OPC_OP_IMM, 4), MASK_FUNCT3, IC_ALU, IMM_I, ctrl_alu_i(ALU_XOR)));
    t.push_back(row("ori",   enc(OPC_OP_IMM, 6), MASK_FUNCT3, IC_ALU, IMM_I, ctrl_alu_i(ALU_OR)));
    t.push_back(row("andi",  enc(OPC_OP_IMM, 7), MASK_FUNCT3, IC_ALU, IMM_I, ctrl_alu_i(ALU_AND)));
    t.push_back(row("slli",  enc(OPC_OP_IMM, 1, 0x00), MASK_FUNCT7, IC_ALU, IMM_I, ctrl_alu_i(ALU_SLL)));
    t.push_back(row("srli",  enc(OPC_OP_IMM, 5, 0x00), MASK_FUNCT7, IC_ALU, IMM_I, ctrl_alu_i(ALU_SRL)));
    t.push_back(row("srai",  enc(OPC_OP_IMM, 5, 0x20), MASK_FUNCT7, IC_ALU, IMM_I, ctrl_alu_i(ALU_SRA)));

    t.push_back(row("add",  enc(OPC_OP, 0, 0x00), MASK_FUNCT7, IC_ALU, IMM_NONE, ctrl_alu_r(ALU_ADD)));
    t.push_back(row("sub",  enc(OPC_OP, 0, 0x20), MASK_FUNCT7, IC_ALU, IMM_NONE, ctrl_alu_r(ALU_SUB)));
    t.push_back(row("sll",  enc(OPC_OP, 1, 0x00), MASK_FUNCT7, IC_ALU, IMM_NONE, ctrl_alu_r(ALU_SLL)));
    t.push_back(row("slt",  enc(OPC_OP, 2, 0x00), MASK_FUNCT7, IC_ALU, IMM_NONE, ctrl_alu_r(ALU_SLT)));
    t.push_back(row("sltu", enc(OPC_OP, 3, 0x00), MASK_FUNCT7, IC_ALU, IMM_NONE, ctrl_alu_r(ALU_SLTU)));
    t.push_back(row("xor",  enc(OPC_OP, 4, 0x00), MASK_FUNCT7, IC_ALU, IMM_NONE, ctrl_alu_r(ALU_XOR)));
    t.push_back(row("srl",  enc(OPC_OP, 5, 0x00), MASK_FUNCT7, IC_ALU, IMM_NONE, ctrl_alu_r(ALU_SRL)));
    t.push_back(row("sra",  enc(OPC_OP, 5, 0x20), MASK_FUNCT7, IC_ALU, IMM_NONE, ctrl_alu_r(ALU_SRA)));
    t.push_back(row("or",   enc(OPC_OP, 6, 0x00), MASK_FUNCT7, IC_ALU, IMM_NONE, ctrl_alu_r(ALU_OR)));
    t.push_back(row("and",  enc(OPC_OP, 7, 0x00), MASK_FUNCT7, IC_ALU, IMM_NONE, ctrl_alu_r(ALU_AND)));

    t.push_back(row("mul",    enc(OPC_OP, 0, 0x01), MASK_FUNCT7, IC_ALU, IMM_NONE, ctrl_alu_r(ALU_MUL)));
    t.push_back(row("mulh",   enc(OPC_OP, 1, 0x01), MASK_FUNCT7, IC_ALU, IMM_NONE, ctrl_alu_r(ALU_MULH)));
    t.push_back(row("mulhsu", enc(OPC_OP, 2, 0x01), MASK_FUNCT7, IC_ALU, IMM_NONE, ctrl_alu_r(ALU_MULHSU)));
    t.push_back(row("mulhu",  enc(OPC_OP, 3, 0x01), MASK_FUNCT7, IC_ALU, IMM_NONE, ctrl_alu_r(ALU_MULHU)));
    t.push_back(row("div",    enc(OPC_OP, 4, 0x01), MASK_FUNCT7, IC_ALU, IMM_NONE, ctrl_alu_r(ALU_DIV)));
    t.push_back(row("divu",   enc(OPC_OP, 5, 0x01), MASK_FUNCT7, IC_ALU, IMM_NONE, ctrl_alu_r(ALU_DIVU)));
    t.push_back(row("rem",    enc(OPC_OP, 6, 0x01), MASK_FUNCT7, IC_ALU, IMM_NONE, ctrl_alu_r(ALU_REM)));
    t.push_back(row("remu",   enc(OPC_OP, 7, 0x01), MASK_FUNCT7, IC_ALU, IMM_NONE, ctrl_alu_r(ALU_REMU)));

    t.push_back(row("fence",  enc(OPC_MISC_MEM), MASK_OPCODE, IC_NOP, IMM_NONE, ctrl_none()));
    t.push_back(row("ecall",  0x00000073, MASK_EXACT, IC_HALT, IMM_NONE, ctrl_none()));
    t.push_back(row("ebreak", 0x00100073, MASK_EXACT, IC_HALT, IMM_NONE, ctrl_none()));
    t.push_back(row("csrrw",  enc(OPC_SYSTEM, 1), MASK_FUNCT3, IC_CSR, IMM_I, ctrl_csr(false)));
    t.push_back(row("csrrs",  enc(OPC_SYSTEM, 2), MASK_FUNCT3, IC_CSR, IMM_I, ctrl_csr(false)));
    t.push_back(row("csrrc",  enc(OPC_SYSTEM, 3), MASK_FUNCT3, IC_CSR, IMM_I, ctrl_csr(false)));
    t.push_back(row("csrrwi", enc(OPC_SYSTEM, 5), MASK_FUNCT3, IC_CSR, IMM_I, ctrl_csr(true)));
    t.push_back(row("csrrsi", enc(OPC_SYSTEM, 6), MASK_FUNCT3, IC_CSR, IMM_I, ctrl_csr(true)));
    t.push_back(row("csrrci", enc(OPC_SYSTEM, 7), MASK_FUNCT3, IC_CSR, IMM_I, ctrl_csr(true)));

    t.push_back(row("flw", enc(OPC_LOAD_FP, 2),  MASK_FUNCT3, IC_LOAD,  IMM_I, ctrl_load(MW_WORD, true, RC_FP)));
    t.push_back(row("fld", enc(OPC_LOAD_FP, 3),  MASK_FUNCT3, IC_LOAD,  IMM_I, ctrl_load(MW_DOUBLE, true, RC_FP)));
    t.push_back(row("fsw", enc(OPC_STORE_FP, 2), MASK_FUNCT3, IC_STORE, IMM_S, ctrl_store(MW_WORD, RC_FP)));
    t.push_back(row("fsd", enc(OPC_STORE_FP, 3), MASK_FUNCT3, IC_STORE, IMM_S, ctrl_store(MW_DOUBLE, RC_FP)));

    t.push_back(row("fadd.s", enc(OPC_OP_FP, 0, 0x00), MASK_OP_FP, IC_FPU, IMM_NONE, ctrl_fpu(0, false)));
    t.push_back(row("fadd.d", enc(OPC_OP_FP, 0, 0x01), MASK_OP_FP, IC_FPU, IMM_NONE, ctrl_fpu(0, true)));
    t.push_back(row("fsub.s", enc(OPC_OP_FP, 0, 0x04), MASK_OP_FP, IC_FPU, IMM_NONE, ctrl_fpu(1, false)));
    t.push_back(row("fsub.d", enc(OPC_OP_FP, 0, 0x05), MASK_OP_FP, IC_FPU, IMM_NONE, ctrl_fpu(1, true)));
    t.push_back(row("fmul.s", enc(OPC_OP_FP, 0, 0x08), MASK_OP_FP, IC_FPU, IMM_NONE, ctrl_fpu(2, false)));
    t.push_back(row("fmul.d", enc(OPC_OP_FP, 0, 0x09), MASK_OP_FP, IC_FPU, IMM_NONE, ctrl_fpu(2, true)));
    t.push_back(row("fdiv.s", enc(OPC_OP_FP, 0, 0x0C), MASK_OP_FP, IC_FPU, IMM_NONE, ctrl_fpu(3, false)));
    t.push_back(row("fdiv.d", enc(OPC_OP_FP, 0, 0x0D), MASK_OP_FP, IC_FPU, IMM_NONE, ctrl_fpu(3, true)));

    t.push_back(row("amoadd.w",  enc(OPC_AMO, 2) | (0x00u << 27), MASK_AMO, IC_AMO, IMM_NONE, ctrl_amo(0x00)));
    t.push_back(row("amoswap.w", enc(OPC_AMO, 2) | (0x01u << 27), MASK_AMO, IC_AMO, IMM_NONE, ctrl_amo(0x01)));
    t.push_back(row("amoor.w",   enc(OPC_AMO, 2) | (0x08u << 27), MASK_AMO, IC_AMO, IMM_NONE, ctrl_amo(0x08)));
    t.push_back(row("amoand.w",  enc(OPC_AMO, 2) | (0x0Cu << 27), MASK_AMO, IC_AMO, IMM_NONE, ctrl_amo(0x0C)));

    static const struct { const char* name[3]; unsigned funct6; } vector_ops[] = {
        { { "vadd.vv", "vadd.vi", "vadd.vx" }, 0x00 },
        { { "vsub.vv", "vsub.vi", "vsub.vx" }, 0x02 },
        { { "vand.vv", "vand.vi", "vand.vx" }, 0x09 },
        { { "vor.vv",  "vor.vi",  "vor.vx"  }, 0x0A },
        { { "vmul.vv", "vmul.vi", "vmul.vx" }, 0x25 }
    };
    static const unsigned vector_funct3[3] = { 0x0, 0x3, 0x4 };
    for (unsigned op = 0; op < sizeof(vector_ops) / sizeof(vector_ops[0]); ++op) {
        for (unsigned s = 0; s < 3; ++s) {
            uint32_t match = enc(OPC_OP_V, vector_funct3[s]) | (vector_ops[op].funct6 << 26);
            t.push_back(row(vector_ops[op].name[s], match, MASK_OP_V, IC_VECTOR, IMM_NONE,
                            ctrl_vector(vector_ops[op].funct6, vector_funct3[s])));
        }
    }
    t.push_back(row("vle32.v", enc(OPC_LOAD_FP, 6),  MASK_FUNCT3, IC_VECTOR_LOAD,  IMM_NONE, ctrl_vector_mem(false)));
    t.push_back(row("vse32.v", enc(OPC_STORE_FP, 6), MASK_FUNCT3, IC_VECTOR_STORE, IMM_NONE, ctrl_vector_mem(true)));

    t.push_back(row("mmul",    enc(OPC_MATRIX, MATRIX_MMUL), MASK_FUNCT3, IC_MATRIX, IMM_NONE,
                    ctrl_unit(RC_INT, RC_NONE, true, MATRIX_MMUL)));
    t.push_back(row("dot",     enc(OPC_MATRIX, MATRIX_DOT), MASK_FUNCT3, IC_DOT, IMM_NONE,
                    ctrl_unit(RC_INT, RC_NONE, true, MATRIX_DOT)));
    t.push_back(row("mac",     enc(OPC_MAC, MAC_ACC), MASK_FUNCT3, IC_MAC, IMM_NONE,
                    ctrl_unit(RC_INT, RC_INT, true, MAC_ACC)));
    t.push_back(row("macz",    enc(OPC_MAC, MAC_CLEAR_ACC), MASK_FUNCT3, IC_MAC, IMM_NONE,
                    ctrl_unit(RC_INT, RC_INT, true, MAC_CLEAR_ACC)));
    t.push_back(row("macr",    enc(OPC_MAC, MAC_READ), MASK_FUNCT3, IC_MAC, IMM_NONE,
                    ctrl_unit(RC_NONE, RC_NONE, true, MAC_READ)));
    t.push_back(row("act",     enc(OPC_MAC, MAC_ACT), MASK_FUNCT3, IC_ACT, IMM_NONE, ctrl_act()));
    t.push_back(row("maxpool", enc(OPC_POOL, 0), MASK_FUNCT3, IC_POOL, IMM_NONE,
                    ctrl_unit(RC_INT, RC_NONE, true, 0)));
    t.push_back(row("avgpool", enc(OPC_POOL, 1), MASK_FUNCT3, IC_POOL, IMM_NONE,
                    ctrl_unit(RC_INT, RC_NONE, true, 1)));
    t.push_back(row("dma.rd",  enc(OPC_DMA, DMA_CHANNEL_READ), MASK_FUNCT3, IC_DMA_CHANNEL, IMM_NONE,
                    ctrl_unit(RC_INT, RC_NONE, false, DMA_CHANNEL_READ)));
    t.push_back(row("dma.wr",  enc(OPC_DMA, DMA_CHANNEL_WRITE), MASK_FUNCT3, IC_DMA_CHANNEL, IMM_NONE,
                    ctrl_channel_write()));
    // every remaining funct3 is a transfer, mode = funct3
    t.push_back(row("dma",     enc(OPC_DMA), MASK_OPCODE, IC_DMA, IMM_NONE,
                    ctrl_unit(RC_INT, RC_INT, true, 0)));

    return t;
}

static const std::vector<decode_entry>& decode_table() {
    static const std::vector<decode_entry> table = build_table();
    return table;
}

// ---------------- public interface ----------------

sc_int<32> decode_immediate(sc_uint<32> word, imm_format format) {
    uint32_t w = word.to_uint();
    int32_t imm = 0;

    switch (format) {
        case IMM_I:
            imm = (int32_t)w >> 20;
            break;
        case IMM_S:
            imm = ((int32_t)(w & 0xFE000000) >> 20) | ((w >> 7) & 0x1F);
            break;
        case IMM_B:
            imm = ((int32_t)(w & 0x80000000) >> 19) | ((w & 0x80) << 4) |
                  ((w >> 20) & 0x7E0) | ((w >> 7) & 0x1E);
            break;
        case IMM_U:
            imm = (int32_t)(w & 0xFFFFF000);
            break;
        case IMM_J:
            imm = ((int32_t)(w & 0x80000000) >> 11) | (w & 0xFF000) |
                  ((w >> 9) & 0x800) | ((w >> 20) & 0x7FE);
            break;
        case IMM_NONE:
            break;
    }
    return imm;
}

DecodedInstruction decode_instruction(sc_uint<32> word) {
    DecodedInstruction d;
    d.raw    = word;
    d.opcode = word.range(6, 0);
    d.rd     = word.range(11, 7);
    d.funct3 = word.range(14, 12);
    d.rs1    = word.range(19, 15);
    d.rs2    = word.range(24, 20);
    d.funct7 = word.range(31, 25);

    const std::vector<decode_entry>& table = decode_table();
    uint32_t w = word.to_uint();
    for (size_t i = 0; i < table.size(); ++i) {
        if ((w & table[i].mask) == table[i].match) {
            d.iclass = table[i].iclass;
            d.entry  = (int)i;
            d.imm    = decode_immediate(word, table[i].format);
            return d;
        }
    }

    d.iclass = IC_NOP;
    d.entry  = -1;
    d.imm    = 0;
    return d;
}

ControlSignals control_for(const DecodedInstruction& inst) {
    const std::vector<decode_entry>& table = decode_table();
    if (inst.entry < 0 || inst.entry >= (int)table.size()) return ctrl_none();

    ControlSignals c = table[inst.entry].ctrl;
    switch (inst.iclass) {
        case IC_CSR: c.sub_op = inst.funct3.to_uint(); break;
        case IC_ACT: c.sub_op = inst.funct7.to_uint(); break;
        case IC_DMA: c.sub_op = inst.funct3.to_uint(); break;
        default: break;
    }
    return c;
}

const char* mnemonic_of(const DecodedInstruction& inst) {
    const std::vector<decode_entry>& table = decode_table();
    if (inst.entry < 0 || inst.entry >= (int)table.size()) return "unknown";
    return table[inst.entry].mnemonic;
}
