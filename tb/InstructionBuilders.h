// RISC-V instruction builders for test programs
#ifndef MEDRV_TB_INSTRUCTION_BUILDERS_H
#define MEDRV_TB_INSTRUCTION_BUILDERS_H

#include <systemc.h>

inline sc_uint<32> make_rtype(unsigned funct7, unsigned rs2, unsigned rs1,
                              unsigned funct3, unsigned rd, unsigned opcode) {
    return ((funct7 & 0x7F) << 25) | ((rs2 & 0x1F) << 20) | ((rs1 & 0x1F) << 15) |
           ((funct3 & 0x7) << 12) | ((rd & 0x1F) << 7) | (opcode & 0x7F);
}

inline sc_uint<32> make_itype(int imm, unsigned rs1, unsigned funct3, unsigned rd, unsigned opcode) {
    return (((uint32_t)imm & 0xFFF) << 20) | ((rs1 & 0x1F) << 15) | ((funct3 & 0x7) << 12) |
           ((rd & 0x1F) << 7) | (opcode & 0x7F);
}

inline sc_uint<32> make_stype(int imm, unsigned rs2, unsigned rs1, unsigned funct3, unsigned opcode) {
    uint32_t u = (uint32_t)imm;
    return (((u >> 5) & 0x7F) << 25) | ((rs2 & 0x1F) << 20) | ((rs1 & 0x1F) << 15) |
           ((funct3 & 0x7) << 12) | ((u & 0x1F) << 7) | (opcode & 0x7F);
}

inline sc_uint<32> make_btype(int offset, unsigned rs2, unsigned rs1, unsigned funct3) {
    uint32_t u = (uint32_t)offset;
    return (((u >> 12) & 0x1) << 31) | (((u >> 5) & 0x3F) << 25) | ((rs2 & 0x1F) << 20) |
           ((rs1 & 0x1F) << 15) | ((funct3 & 0x7) << 12) | (((u >> 1) & 0xF) << 8) |
           (((u >> 11) & 0x1) << 7) | 0x63;
}

inline sc_uint<32> make_utype(uint32_t imm20, unsigned rd, unsigned opcode) {
    return ((imm20 & 0xFFFFF) << 12) | ((rd & 0x1F) << 7) | (opcode & 0x7F);
}

inline sc_uint<32> make_jtype(int offset, unsigned rd) {
    uint32_t u = (uint32_t)offset;
    return (((u >> 20) & 0x1) << 31) | (((u >> 1) & 0x3FF) << 21) | (((u >> 11) & 0x1) << 20) |
           (((u >> 12) & 0xFF) << 12) | ((rd & 0x1F) << 7) | 0x6F;
}

// ---- common mnemonics ----

inline sc_uint<32> ADDI(unsigned rd, unsigned rs1, int imm) { return make_itype(imm, rs1, 0, rd, 0x13); }
inline sc_uint<32> ADD(unsigned rd, unsigned rs1, unsigned rs2) { return make_rtype(0, rs2, rs1, 0, rd, 0x33); }
inline sc_uint<32> SUB(unsigned rd, unsigned rs1, unsigned rs2) { return make_rtype(0x20, rs2, rs1, 0, rd, 0x33); }
inline sc_uint<32> LUI(unsigned rd, uint32_t imm20) { return make_utype(imm20, rd, 0x37); }
inline sc_uint<32> LW(unsigned rd, unsigned rs1, int imm) { return make_itype(imm, rs1, 2, rd, 0x03); }
inline sc_uint<32> SW(unsigned rs2, unsigned rs1, int imm) { return make_stype(imm, rs2, rs1, 2, 0x23); }
inline sc_uint<32> FLW(unsigned rd, unsigned rs1, int imm) { return make_itype(imm, rs1, 2, rd, 0x07); }
inline sc_uint<32> FSW(unsigned rs2, unsigned rs1, int imm) { return make_stype(imm, rs2, rs1, 2, 0x27); }
inline sc_uint<32> FLD(unsigned rd, unsigned rs1, int imm) { return make_itype(imm, rs1, 3, rd, 0x07); }
inline sc_uint<32> FSD(unsigned rs2, unsigned rs1, int imm) { return make_stype(imm, rs2, rs1, 3, 0x27); }
inline sc_uint<32> ECALL() { return 0x00000073; }
inline sc_uint<32> EBREAK() { return 0x00100073; }
inline sc_uint<32> NOP() { return 0x00000013; }

inline sc_uint<32> CSR(unsigned funct3, unsigned rd, unsigned csr, unsigned rs1_or_uimm) {
    return make_itype((int)csr, rs1_or_uimm, funct3, rd, 0x73);
}

inline sc_uint<32> AMO(unsigned funct5, unsigned rd, unsigned rs1, unsigned rs2, bool aq = false, bool rl = false) {
    unsigned funct7 = (funct5 << 2) | (aq ? 2u : 0u) | (rl ? 1u : 0u);
    return make_rtype(funct7, rs2, rs1, 2, rd, 0x2F);
}

// funct3: 0 vv, 3 vi (rs1 field = simm5), 4 vx
inline sc_uint<32> VOP(unsigned funct6, unsigned funct3, unsigned vd, unsigned vs2, unsigned src1) {
    return make_rtype((funct6 << 1) | 1, vs2, src1, funct3, vd, 0x57);
}
inline sc_uint<32> VLE32(unsigned vd, unsigned rs1) { return make_rtype(0, 0, rs1, 6, vd, 0x07); }
inline sc_uint<32> VSE32(unsigned vs3, unsigned rs1) { return make_rtype(0, 0, rs1, 6, vs3, 0x27); }

// custom extensions
inline sc_uint<32> MMUL(unsigned rd, unsigned rs1) { return make_rtype(0, 0, rs1, 0, rd, 0x0B); }
inline sc_uint<32> DOT(unsigned rd, unsigned rs1) { return make_rtype(0, 0, rs1, 1, rd, 0x0B); }
inline sc_uint<32> MAC(unsigned rd, unsigned rs1, unsigned rs2) { return make_rtype(0, rs2, rs1, 0, rd, 0x2B); }
inline sc_uint<32> MACZ(unsigned rd, unsigned rs1, unsigned rs2) { return make_rtype(0, rs2, rs1, 1, rd, 0x2B); }
inline sc_uint<32> MACR(unsigned rd) { return make_rtype(0, 0, 0, 2, rd, 0x2B); }
inline sc_uint<32> ACT(unsigned select, unsigned rd, unsigned rs1) { return make_rtype(select, 0, rs1, 4, rd, 0x2B); }
inline sc_uint<32> MAXPOOL(unsigned rd, unsigned rs1) { return make_rtype(0, 0, rs1, 0, rd, 0x5B); }
inline sc_uint<32> AVGPOOL(unsigned rd, unsigned rs1) { return make_rtype(0, 0, rs1, 1, rd, 0x5B); }
inline sc_uint<32> DMA(unsigned mode, unsigned rd, unsigned rs1, unsigned rs2) { return make_rtype(0, rs2, rs1, mode, rd, 0x7B); }
inline sc_uint<32> DMA_RD(unsigned rd, unsigned rs1) { return make_rtype(0, 0, rs1, 2, rd, 0x7B); }
inline sc_uint<32> DMA_WR(unsigned rs1, unsigned rs2) { return make_rtype(0, rs2, rs1, 3, 0, 0x7B); }

#endif
