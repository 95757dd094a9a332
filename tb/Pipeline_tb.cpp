#include <systemc.h>
#include <vector>

#include "Simulator.h"
#include "InstructionBuilders.h"
#include "TestCommon.h"

typedef std::vector<sc_uint<32> > program_t;

static sc_uint<32> BEQ(unsigned rs1, unsigned rs2, int off) { return make_btype(off, rs2, rs1, 0); }
static sc_uint<32> BNE(unsigned rs1, unsigned rs2, int off) { return make_btype(off, rs2, rs1, 1); }
static sc_uint<32> JAL(unsigned rd, int off) { return make_jtype(off, rd); }
static sc_uint<32> JALR(unsigned rd, unsigned rs1, int imm) { return make_itype(imm, rs1, 0, rd, 0x67); }
static sc_uint<32> MUL(unsigned rd, unsigned rs1, unsigned rs2) { return make_rtype(1, rs2, rs1, 0, rd, 0x33); }
static sc_uint<32> DIV(unsigned rd, unsigned rs1, unsigned rs2) { return make_rtype(1, rs2, rs1, 4, rd, 0x33); }
static sc_uint<32> DIVU(unsigned rd, unsigned rs1, unsigned rs2) { return make_rtype(1, rs2, rs1, 5, rd, 0x33); }
static sc_uint<32> REM(unsigned rd, unsigned rs1, unsigned rs2) { return make_rtype(1, rs2, rs1, 6, rd, 0x33); }
static sc_uint<32> SB(unsigned rs2, unsigned rs1, int imm) { return make_stype(imm, rs2, rs1, 0, 0x23); }
static sc_uint<32> SH(unsigned rs2, unsigned rs1, int imm) { return make_stype(imm, rs2, rs1, 1, 0x23); }
static sc_uint<32> LB(unsigned rd, unsigned rs1, int imm) { return make_itype(imm, rs1, 0, rd, 0x03); }
static sc_uint<32> LH(unsigned rd, unsigned rs1, int imm) { return make_itype(imm, rs1, 1, rd, 0x03); }
static sc_uint<32> LBU(unsigned rd, unsigned rs1, int imm) { return make_itype(imm, rs1, 4, rd, 0x03); }
static sc_uint<32> LHU(unsigned rd, unsigned rs1, int imm) { return make_itype(imm, rs1, 5, rd, 0x03); }
static sc_uint<32> FMUL_S(unsigned rd, unsigned rs1, unsigned rs2) { return make_rtype(0x08, rs2, rs1, 0, rd, 0x53); }
static sc_uint<32> FDIV_S(unsigned rd, unsigned rs1, unsigned rs2) { return make_rtype(0x0C, rs2, rs1, 0, rd, 0x53); }
static sc_uint<32> FDIV_D(unsigned rd, unsigned rs1, unsigned rs2) { return make_rtype(0x0D, rs2, rs1, 0, rd, 0x53); }

static const unsigned CSRRW = 1, CSRRS = 2, CSRRC = 3, CSRRSI = 6;

static void load_and_reset(Simulator& sim, const program_t& program, uint32_t base = 0) {
    sim.load_program(program, base);
    sim.reset();
}

static run_status run_program(Simulator& sim, const program_t& program, uint64_t max_cycles = 2000) {
    load_and_reset(sim, program);
    return sim.run(max_cycles);
}

static DebugSnapshot step_until_retired(Simulator& sim, uint32_t pc, unsigned limit = 500) {
    for (unsigned i = 0; i < limit; ++i) {
        sim.step(1);
        DebugSnapshot d = sim.debug();
        if (d.retired && d.last_pc == pc) return d;
    }
    return sim.debug();
}

static void write_words(Simulator& sim, uint32_t addr, const int32_t* words, unsigned count) {
    for (unsigned i = 0; i < count; ++i) sim.write_word(addr + 4 * i, (uint32_t)words[i]);
}

static int32_t word_at(Simulator& sim, uint32_t addr) {
    return (int32_t)sim.read_word(addr).to_uint();
}

int sc_main(int argc, char* argv[]) {
    (void)argc;
    (void)argv;

    // both cores must exist before the first clock edge
    SimConfig second;
    second.memory_words = 1024;
    second.reset_pc = 0x100;
    Simulator sim("core0");
    Simulator other("core1", second);

    cout << "\n=== 5-Stage Pipeline Test ===\n";

    section("Forwarding");
    {
        program_t p;
        p.push_back(ADDI(1, 0, 0x20));
        p.push_back(ADDI(2, 0, 0x15));
        p.push_back(ADD(3, 1, 2));          // x1 from MEM/WB, x2 from EX/MEM
        p.push_back(ADD(4, 3, 0));
        p.push_back(ECALL());
        check(run_program(sim, p) == RUN_HALTED, "program halts on ecall");
        check_eq(sim.reg(3), 0x35, "x3 = x1 + x2");
        check_eq(sim.reg(4), 0x35, "x4 forwarded from x3");
        check_eq(sim.retired(), 5, "five instructions retired");
        check_eq(sim.cycles(), 9, "no stalls: 5 instructions in 9 cycles");

        DebugSnapshot d = sim.debug();
        check(d.halted && d.last_pc == 16 && d.last_instruction == ECALL(), "last retired is ecall");

        p.clear();
        p.push_back(ADDI(1, 0, 1));
        p.push_back(ADDI(1, 0, 2));
        p.push_back(ADD(2, 1, 0));          // youngest producer wins
        p.push_back(ADDI(0, 0, 5));
        p.push_back(ADD(5, 0, 0));          // x0 is never forwarded
        p.push_back(ECALL());
        run_program(sim, p);
        check_eq(sim.reg(2), 2, "EX/MEM has priority over MEM/WB");
        check_eq(sim.reg(5), 0, "write to x0 discarded");

        p.clear();
        p.push_back(ADDI(2, 0, 0x10));
        p.push_back(ADDI(3, 0, 0x20));
        p.push_back(ADDI(5, 0, 0x5));
        p.push_back(ADD(1, 2, 3));
        p.push_back(ADD(4, 1, 5));
        p.push_back(ECALL());
        run_program(sim, p);
        check_eq(sim.reg(4), 0x35, "back-to-back dependent adds");
    }

    section("Load-use stall");
    {
        sim.write_word(0x400, 7);
        program_t p;
        p.push_back(LW(1, 0, 0x400));
        p.push_back(ADD(2, 1, 1));
        p.push_back(ECALL());
        run_program(sim, p);
        check_eq(sim.reg(2), 14, "load value used after one bubble");
        check_eq(sim.cycles(), 8, "one stall cycle");

        p.clear();
        p.push_back(ADDI(2, 0, 0x400));
        p.push_back(LW(1, 2, 0));
        p.push_back(ADD(2, 1, 1));          // overwrites the base register
        p.push_back(ECALL());
        run_program(sim, p);
        check_eq(sim.reg(2), 14, "lw x1,0(x2) ; add x2,x1,x1");

        p.clear();
        p.push_back(LW(1, 0, 0x400));
        p.push_back(SW(1, 0, 0x404));       // store data depends on the load
        p.push_back(LW(3, 0, 0x404));
        p.push_back(ECALL());
        run_program(sim, p);
        check_eq(sim.reg(3), 7, "load -> store -> load");
    }

    section("Branches and jumps");
    {
        program_t p;
        p.push_back(ADDI(1, 0, 1));         // 0
        p.push_back(BNE(1, 1, 8));          // 4  not taken
        p.push_back(BEQ(1, 1, 12));         // 8  -> 20
        p.push_back(ADDI(2, 0, 99));        // 12 flushed
        p.push_back(ADDI(3, 0, 99));        // 16 skipped
        p.push_back(ADDI(4, 0, 5));         // 20
        p.push_back(ECALL());               // 24
        run_program(sim, p);
        check(sim.reg(2) == 0 && sim.reg(3) == 0, "wrong-path instructions squashed");
        check_eq(sim.reg(4), 5, "branch target executed");
        check_eq(sim.retired(), 5, "only the taken path retires");

        p.clear();
        p.push_back(JAL(1, 12));            // 0  -> 12
        p.push_back(ADDI(5, 0, 0x55));      // 4
        p.push_back(ECALL());               // 8
        p.push_back(ADDI(6, 0, 7));         // 12
        p.push_back(JALR(7, 1, 1));         // 16 -> (4 + 1) & ~1
        run_program(sim, p);
        check_eq(sim.reg(1), 4, "jal link = pc + 4");
        check_eq(sim.reg(7), 20, "jalr link = pc + 4");
        check(sim.reg(6) == 7 && sim.reg(5) == 0x55, "jalr target clears bit 0");

        p.clear();
        p.push_back(ADDI(1, 0, -1));        // 0
        p.push_back(ADDI(2, 0, 1));         // 4
        p.push_back(make_btype(8, 2, 1, 6)); // 8  bltu 0xFFFFFFFF < 1: not taken
        p.push_back(make_btype(8, 2, 1, 4)); // 12 blt -1 < 1: taken -> 20
        p.push_back(ADDI(3, 0, 1));         // 16 skipped
        p.push_back(ECALL());               // 20
        run_program(sim, p);
        check_eq(sim.reg(3), 0, "signed and unsigned compares");
    }

    section("M extension");
    {
        program_t p;
        p.push_back(ADDI(1, 0, -7));        // 0
        p.push_back(ADDI(2, 0, 2));         // 4
        p.push_back(DIV(3, 1, 2));          // 8
        p.push_back(REM(4, 1, 2));          // 12
        p.push_back(MUL(5, 1, 2));          // 16
        p.push_back(DIVU(6, 1, 0));         // 20 divide by zero
        p.push_back(ECALL());
        load_and_reset(sim, p);
        DebugSnapshot d = step_until_retired(sim, 20);
        check(d.retired && (d.status & STATUS_DIV_BY_ZERO) && d.rd_value == 0xFFFFFFFF,
              "divide by zero flag visible on retire");
        sim.run();
        check_eq(sim.reg(3), (uint32_t)-3, "div");
        check_eq(sim.reg(4), (uint32_t)-1, "rem");
        check_eq(sim.reg(5), (uint32_t)-14, "mul");
        check_eq(sim.reg(6), 0xFFFFFFFF, "divu by zero");
    }

    section("CSR access");
    {
        program_t p;
        p.push_back(ADDI(1, 0, 0x100));
        p.push_back(CSR(CSRRW, 2, 0x305, 1));
        p.push_back(CSR(CSRRSI, 3, 0x305, 3));
        p.push_back(CSR(CSRRC, 4, 0x305, 1));
        p.push_back(CSR(CSRRS, 5, 0x305, 0));
        p.push_back(ADDI(6, 5, 1));         // csr result is late
        p.push_back(CSR(CSRRW, 7, 0x7C0, 1));
        p.push_back(ECALL());
        run_program(sim, p);
        check(sim.reg(2) == 0 && sim.reg(3) == 0x100 && sim.reg(4) == 0x103 && sim.reg(5) == 3,
              "csrrw / csrrsi / csrrc / csrrs old values");
        check_eq(sim.reg(6), 4, "csr value forwarded");
        check_eq(sim.core().csr().read(CSR_MTVEC), 3, "mtvec final value");
        check_eq(sim.reg(7), 0, "unimplemented csr reads zero");
    }

    section("Sub-word memory access");
    {
        sim.write_word(0x500, 0);
        program_t p;
        p.push_back(ADDI(1, 0, 0x500));     // 0
        p.push_back(ADDI(2, 0, -1));        // 4
        p.push_back(SB(2, 1, 1));           // 8
        p.push_back(LW(3, 1, 0));           // 12
        p.push_back(LB(4, 1, 1));           // 16
        p.push_back(LBU(5, 1, 1));          // 20
        p.push_back(SH(2, 1, 2));           // 24
        p.push_back(LHU(6, 1, 2));          // 28
        p.push_back(LH(7, 1, 2));           // 32
        p.push_back(LUI(9, 0x10));          // 36 0x10000 is past memory
        p.push_back(LW(8, 9, 0));           // 40
        p.push_back(ECALL());
        load_and_reset(sim, p);
        DebugSnapshot d = step_until_retired(sim, 40);
        check(d.retired && (d.status & STATUS_MEM_FAULT), "load past memory faults");
        sim.run();
        check_eq(sim.reg(3), 0x0000FF00, "sb writes one lane");
        check_eq(sim.reg(4), 0xFFFFFFFF, "lb sign extends");
        check_eq(sim.reg(5), 0xFF, "lbu zero extends");
        check_eq(sim.reg(6), 0xFFFF, "lhu");
        check_eq(sim.reg(7), 0xFFFFFFFF, "lh");
        check_eq(sim.read_word(0x500), 0xFFFFFF00, "memory after sb/sh");
        check_eq(sim.reg(8), 0, "faulting load returns zero");
    }

    section("Matrix multiply in the pipeline");
    {
        int32_t a[] = { 1, 2, 3, 4 };
        int32_t b[] = { 5, 6, 7, 8 };
        int32_t desc[] = { 0x1000, 0x1100, 0x1200, 2, 2, 2 };
        write_words(sim, 0x1000, a, 4);
        write_words(sim, 0x1100, b, 4);
        write_words(sim, 0x600, desc, 6);

        program_t p;
        p.push_back(ADDI(10, 0, 0x600));
        p.push_back(ADDI(3, 0, 9));
        p.push_back(MMUL(5, 10));
        p.push_back(ADD(4, 3, 3));          // producer retires while MMUL holds the core
        p.push_back(ADD(6, 5, 5));          // waits for the MMUL result
        p.push_back(ECALL());
        check(run_program(sim, p) == RUN_HALTED, "program with MMUL halts");
        check_eq(sim.reg(5), 4, "rd = N * P");
        check_eq(sim.reg(6), 8, "MMUL result forwarded");
        check_eq(sim.reg(4), 18, "held operands refreshed during the unit stall");
        check(word_at(sim, 0x1200) == 19 && word_at(sim, 0x1204) == 22 &&
              word_at(sim, 0x1208) == 43 && word_at(sim, 0x120C) == 50, "C = A * B");
        check_eq(sim.cycles(), 10 + 8, "eight hold cycles for a 2x2x2 product");
    }

    section("Dot product and pooling in the pipeline");
    {
        int32_t a[] = { 1, 2, 3, 4 };
        int32_t b[] = { 4, 3, 2, 1 };
        int32_t dot_desc[] = { 0x1300, 0x1400, 4, 0, 0 };
        write_words(sim, 0x1300, a, 4);
        write_words(sim, 0x1400, b, 4);
        write_words(sim, 0x640, dot_desc, 5);

        int32_t img[] = { 1, 2, 3, 4, 5, 6, 7, 8, 9 };
        int32_t pool_desc[] = { 0x1500, 0x1600, 3, 2, 2 };
        write_words(sim, 0x1500, img, 9);
        write_words(sim, 0x680, pool_desc, 5);

        int32_t bad_desc[] = { 0x1500, 0x1600, 0, 2, 2 };
        write_words(sim, 0x6A0, bad_desc, 5);

        program_t p;
        p.push_back(ADDI(10, 0, 0x640));
        p.push_back(DOT(5, 10));
        p.push_back(ADDI(11, 0, 0x680));
        p.push_back(MAXPOOL(6, 11));
        p.push_back(ADDI(12, 0, 0x6A0));
        p.push_back(ADDI(7, 0, 0x77));
        p.push_back(AVGPOOL(7, 12));        // rejected, x7 keeps its value
        p.push_back(ECALL());
        run_program(sim, p);
        check_eq(sim.reg(5), 20, "dot product in rd");
        check_eq(word_at(sim, 0x64C), 20, "64-bit sum stored in the descriptor");
        check_eq(sim.reg(6), 4, "maxpool output count");
        check(word_at(sim, 0x1600) == 5 && word_at(sim, 0x1604) == 6 &&
              word_at(sim, 0x1608) == 8 && word_at(sim, 0x160C) == 9, "maxpool outputs");
        check_eq(sim.reg(7), 0x77, "rejected unit does not write rd");
    }

    section("MAC and activation");
    {
        program_t p;
        p.push_back(ADDI(1, 0, 3));
        p.push_back(ADDI(2, 0, 4));
        p.push_back(MACZ(3, 1, 2));
        p.push_back(MAC(4, 1, 2));
        p.push_back(MACR(5));
        p.push_back(LUI(6, 0x10));          // 1.0 in Q16.16
        p.push_back(ACT(1, 7, 6));          // tanh
        p.push_back(ACT(0, 8, 0));          // sigmoid(0)
        p.push_back(ADDI(9, 0, 0x55));
        p.push_back(ACT(9, 9, 6));          // unknown selector
        p.push_back(ECALL());
        run_program(sim, p);
        check(sim.reg(3) == 12 && sim.reg(4) == 24 && sim.reg(5) == 24, "macz / mac / macr");
        check_eq(sim.reg(7), 50972, "tanh(1.0)");
        check_eq(sim.reg(8), 0x8000, "sigmoid(0) = 0.5");
        check_eq(sim.reg(9), 0, "unknown activation gives 0");
    }

    section("DMA in the pipeline");
    {
        int32_t data[] = { 11, 22, 33, 44, 55, 66, 77, 88 };
        write_words(sim, 0x2000, data, 8);

        program_t p;
        p.push_back(LUI(11, 0x2));          // 0x2000
        p.push_back(ADDI(12, 0, 8));
        p.push_back(DMA(0, 5, 11, 12));     // load into the channel
        p.push_back(ADDI(13, 0, 3));
        p.push_back(DMA_RD(6, 13));
        p.push_back(LUI(14, 0x3));          // 0x3000
        p.push_back(DMA(1, 7, 14, 12));     // store from the channel
        p.push_back(ADDI(8, 0, 0x77));
        p.push_back(DMA(5, 8, 11, 12));     // inert mode
        p.push_back(ADDI(15, 0, 0x123));
        p.push_back(DMA_WR(13, 15));
        p.push_back(DMA_RD(9, 13));
        p.push_back(ECALL());
        int core_reports = sc_report_handler::get_count(MEDRV_MSG_CORE);
        run_program(sim, p);
        check_eq(sc_report_handler::get_count(MEDRV_MSG_CORE), core_reports,
                 "rejected transfer is silent at default verbosity");
        check(sim.reg(5) == 8 && sim.reg(7) == 8, "words transferred");
        check_eq(sim.reg(6), 44, "channel read");
        bool same = true;
        for (int i = 0; i < 8; ++i) same = same && word_at(sim, 0x3000 + 4 * i) == data[i];
        check(same, "load / store round trip");
        check_eq(sim.reg(8), 0x77, "inert mode leaves rd");
        check_eq(sim.reg(9), 0x123, "channel write then read");
    }

    section("Atomic memory operations");
    {
        sim.write_word(0x700, 10);
        program_t p;
        p.push_back(ADDI(10, 0, 0x700));
        p.push_back(ADDI(11, 0, 5));
        p.push_back(AMO(0x00, 12, 10, 11));         // amoadd
        p.push_back(AMO(0x01, 13, 10, 11, true));   // amoswap.aq
        p.push_back(ADDI(14, 10, 2));
        p.push_back(ADDI(15, 0, 0x33));
        p.push_back(AMO(0x00, 15, 14, 11));         // misaligned
        p.push_back(ADD(16, 12, 13));
        p.push_back(ECALL());
        run_program(sim, p);
        check(sim.reg(12) == 10 && sim.reg(13) == 15, "old values returned");
        check_eq(sim.read_word(0x700), 5, "memory after add then swap");
        check_eq(sim.reg(15), 0x33, "misaligned amo rejected");
        check_eq(sim.reg(16), 25, "amo results forwarded");
    }

    section("Vector unit");
    {
        int32_t v1[] = { 1, 2, 3, 4 };
        int32_t v2[] = { 10, 20, 30, 40 };
        write_words(sim, 0x780, v1, 4);
        write_words(sim, 0x790, v2, 4);

        program_t p;
        p.push_back(ADDI(10, 0, 0x780));
        p.push_back(ADDI(11, 0, 0x790));
        p.push_back(VLE32(1, 10));
        p.push_back(VLE32(2, 11));
        p.push_back(VOP(0x00, 0, 3, 2, 1));     // vadd.vv v3, v2, v1
        p.push_back(ADDI(12, 0, 5));
        p.push_back(VOP(0x02, 4, 4, 2, 12));    // vsub.vx v4, v2, x12
        p.push_back(VOP(0x25, 3, 5, 1, 0x1F));  // vmul.vi v5, v1, -1
        p.push_back(ADDI(13, 0, 0x7A0));
        p.push_back(VSE32(3, 13));
        p.push_back(ADDI(14, 0, 0x7B0));
        p.push_back(VSE32(5, 14));
        p.push_back(ECALL());
        run_program(sim, p);
        check(word_at(sim, 0x7A0) == 11 && word_at(sim, 0x7AC) == 44, "vadd.vv stored");
        const vreg& v4 = sim.core().vregs().read(4);
        check(v4.lane[0] == 5 && v4.lane[3] == 35, "vsub.vx broadcasts x[rs1]");
        check(word_at(sim, 0x7B0) == -1 && word_at(sim, 0x7BC) == -4, "vmul.vi sign extends simm5");
    }

    section("Floating point in the pipeline");
    {
        sim.write_word(0x7C0, floatToHex(2.0f));
        sim.write_word(0x7C4, floatToHex(3.0f));
        uint64_t six = doubleToHex(6.0), two = doubleToHex(2.0);
        sim.write_word(0x7D0, (uint32_t)six);
        sim.write_word(0x7D4, (uint32_t)(six >> 32));
        sim.write_word(0x7D8, (uint32_t)two);
        sim.write_word(0x7DC, (uint32_t)(two >> 32));

        program_t p;
        p.push_back(FLW(1, 0, 0x7C0));      // 0
        p.push_back(FLW(2, 0, 0x7C4));      // 4
        p.push_back(FMUL_S(3, 1, 2));       // 8
        p.push_back(FSW(3, 0, 0x7C8));      // 12
        p.push_back(FLD(4, 0, 0x7D0));      // 16
        p.push_back(FLD(5, 0, 0x7D8));      // 20
        p.push_back(FDIV_D(6, 4, 5));       // 24
        p.push_back(FSD(6, 0, 0x7E0));      // 28
        p.push_back(FDIV_S(7, 1, 0));       // 32 divide by f0 = 0
        p.push_back(ECALL());
        load_and_reset(sim, p);
        DebugSnapshot d = step_until_retired(sim, 32);
        check(d.retired && (d.status & STATUS_FP_INVALID) && d.rd_class == RC_FP,
              "fp invalid flag on retire");
        sim.run();
        check_eq(sim.fp_reg(3), floatToHex(6.0f), "fmul.s after load-use stalls");
        check_eq(sim.read_word(0x7C8), floatToHex(6.0f), "fsw");
        check_eq(sim.fp_reg(6), doubleToHex(3.0), "fdiv.d");
        check(sim.read_word(0x7E0) == 0 && sim.read_word(0x7E4) == 0x40080000, "fsd");
        check_eq(sim.fp_reg(7), FP32_QNAN, "divide by zero gives qNaN");
    }

    section("Decode errors and halting");
    {
        program_t p;
        p.push_back(ADDI(1, 0, 1));
        p.push_back(0xFFFFFFFF);
        p.push_back(0x00000000);
        p.push_back(ADDI(2, 1, 1));
        p.push_back(EBREAK());
        check(run_program(sim, p) == RUN_HALTED, "ebreak halts");
        check_eq(sim.reg(2), 2, "unknown words execute as no-ops");
        check_eq(sim.retired(), 5, "no-ops retire");

        p.clear();
        p.push_back(JAL(0, 0));
        check(run_program(sim, p, 200) == RUN_TIMEOUT, "watchdog stops a spinning program");
        check(!sim.halted() && sim.cycles() == 200, "watchdog cycle budget");
    }

    section("Coexisting cores");
    {
        program_t counter;
        counter.push_back(ADDI(1, 1, 1));   // 0
        counter.push_back(JAL(0, -4));      // 4
        load_and_reset(sim, counter);
        sim.step(30);
        sc_uint<32> count = sim.reg(1);
        uint64_t cycles = sim.cycles();
        check(count > 0 && cycles == 30, "first core counting");

        program_t p;
        p.push_back(ADDI(1, 0, 0x99));
        p.push_back(ADDI(2, 1, 1));
        p.push_back(ECALL());
        load_and_reset(other, p, 0x100);
        check(other.run() == RUN_HALTED, "second core halts");
        check_eq(other.reg(2), 0x9A, "second core result");
        check_eq(other.debug().last_pc, 0x108, "second core runs from its reset pc");
        check_eq(sim.reg(1), count, "first core registers untouched while the second runs");
        check_eq(sim.cycles(), cycles, "first core cycle count untouched");

        uint64_t other_cycles = other.cycles();
        sim.step(10);
        check(sim.reg(1) > count && sim.cycles() == cycles + 10, "first core resumes counting");
        check_eq(other.cycles(), other_cycles, "second core idle while the first steps");
    }

    return summary("Pipeline");
}
