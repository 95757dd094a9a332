#include <systemc.h>
#include <cstring>

#include "Decoder.h"
#include "InstructionBuilders.h"
#include "TestCommon.h"

static bool is(const DecodedInstruction& d, const char* mnemonic) {
    return std::strcmp(mnemonic_of(d), mnemonic) == 0;
}

int sc_main(int argc, char* argv[]) {
    (void)argc;
    (void)argv;

    cout << "\n=== Instruction Decoder Test ===\n";

    section("Fields and immediates");
    {
        DecodedInstruction d = decode_instruction(ADDI(5, 6, -1));
        check(is(d, "addi") && d.rd == 5 && d.rs1 == 6 && d.imm == -1, "addi x5, x6, -1");

        d = decode_instruction(SW(7, 2, -8));
        check(is(d, "sw") && d.rs1 == 2 && d.rs2 == 7 && d.imm == -8, "sw x7, -8(x2)");

        d = decode_instruction(make_btype(-16, 2, 1, 1));
        check(is(d, "bne") && d.imm == -16, "bne backwards offset");

        d = decode_instruction(make_btype(4094, 2, 1, 0));
        check(is(d, "beq") && d.imm == 4094, "beq largest forward offset");

        d = decode_instruction(make_jtype(-2048, 1));
        check(is(d, "jal") && d.rd == 1 && d.imm == -2048, "jal x1, -2048");

        d = decode_instruction(make_jtype(0x7FFFE, 0));
        check(d.imm == 0x7FFFE, "jal positive offset");

        d = decode_instruction(LUI(3, 0xABCDE));
        check(is(d, "lui") && (uint32_t)d.imm.to_int() == 0xABCDE000u, "lui upper immediate");
    }

    section("Control bundles");
    {
        DecodedInstruction d = decode_instruction(LW(4, 1, 8));
        ControlSignals c = control_for(d);
        check(d.iclass == IC_LOAD && c.mem_read && c.reg_write && c.late_result &&
              c.width == MW_WORD && c.rd_class == RC_INT, "lw is a late-result load");

        d = decode_instruction(make_rtype(0x01, 3, 2, 4, 1, 0x33));
        c = control_for(d);
        check(is(d, "div") && c.alu == ALU_DIV && c.reg_src == RS_ALU, "div from funct7 0000001");

        d = decode_instruction(make_itype(0x400 | 3, 1, 5, 2, 0x13));
        check(is(d, "srai") && control_for(d).alu == ALU_SRA, "srai distinguished from srli");

        d = decode_instruction(make_rtype(0x0D, 2, 1, 0, 3, 0x53));
        c = control_for(d);
        check(is(d, "fdiv.d") && c.fp_double && c.rd_class == RC_FP && c.sub_op == 3, "fdiv.d");

        d = decode_instruction(make_rtype(0x04, 2, 1, 7, 3, 0x53));
        check(is(d, "fsub.s") && !control_for(d).fp_double, "fsub.s with dynamic rounding mode");

        d = decode_instruction(FLD(2, 1, 16));
        c = control_for(d);
        check(d.iclass == IC_LOAD && c.width == MW_DOUBLE && c.rd_class == RC_FP, "fld");

        d = decode_instruction(FSW(2, 1, 4));
        c = control_for(d);
        check(d.iclass == IC_STORE && c.rs2_class == RC_FP, "fsw stores an fp register");

        d = decode_instruction(CSR(2, 5, 0x300, 0));
        c = control_for(d);
        check(d.iclass == IC_CSR && c.sub_op == 2 && c.late_result, "csrrs");

        d = decode_instruction(ECALL());
        check(d.iclass == IC_HALT, "ecall halts");
        d = decode_instruction(EBREAK());
        check(d.iclass == IC_HALT, "ebreak halts");
    }

    section("Extensions");
    {
        DecodedInstruction d = decode_instruction(AMO(0x0C, 5, 6, 7, true, false));
        ControlSignals c = control_for(d);
        check(is(d, "amoand.w") && c.sub_op == 0x0C && c.late_result, "amoand.w with aq");

        d = decode_instruction(VOP(0x25, 4, 1, 2, 3));
        c = control_for(d);
        check(is(d, "vmul.vx") && c.rs1_class == RC_INT && !c.reg_write, "vmul.vx reads x[rs1]");

        d = decode_instruction(VOP(0x02, 3, 1, 2, 0x1F));
        check(is(d, "vsub.vi") && control_for(d).rs1_class == RC_NONE, "vsub.vi");

        d = decode_instruction(VLE32(1, 10));
        check(d.iclass == IC_VECTOR_LOAD, "vle32.v");

        d = decode_instruction(MMUL(5, 10));
        c = control_for(d);
        check(d.iclass == IC_MATRIX && c.multi_cycle && c.late_result && c.reg_src == RS_UNIT, "mmul");

        d = decode_instruction(ACT(1, 5, 6));
        c = control_for(d);
        check(d.iclass == IC_ACT && c.sub_op == 1 && !c.late_result, "act tanh resolves in EX");

        d = decode_instruction(AVGPOOL(5, 10));
        check(d.iclass == IC_POOL && control_for(d).sub_op == 1, "avgpool");

        d = decode_instruction(DMA(1, 5, 10, 11));
        c = control_for(d);
        check(d.iclass == IC_DMA && c.sub_op == 1 && c.multi_cycle, "dma store mode");

        d = decode_instruction(DMA(6, 5, 10, 11));
        check(d.iclass == IC_DMA && control_for(d).sub_op == 6, "dma inert mode still decodes");

        d = decode_instruction(DMA_RD(5, 10));
        c = control_for(d);
        check(d.iclass == IC_DMA_CHANNEL && !c.multi_cycle && c.reg_write, "dma channel read");
    }

    section("Unknown encodings");
    {
        DecodedInstruction d = decode_instruction(0xFFFFFFFF);
        ControlSignals c = control_for(d);
        check(d.iclass == IC_NOP && d.entry == -1 && !c.reg_write && !c.mem_write, "all ones");

        d = decode_instruction(make_rtype(0x02, 2, 1, 0, 3, 0x33));
        check(d.entry == -1 && !control_for(d).reg_write, "OP with unknown funct7");

        d = decode_instruction(0x00000000);
        check(d.entry == -1, "all zeros");

        d = decode_instruction(make_itype(0, 0, 0, 0, 0x0F));
        check(is(d, "fence") && d.iclass == IC_NOP, "fence is a no-op");
    }

    return summary("Decoder");
}
