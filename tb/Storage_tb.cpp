#include <systemc.h>
#include <vector>

#include "MemoryImage.h"
#include "RegisterFile.h"
#include "TestCommon.h"

int sc_main(int argc, char* argv[]) {
    (void)argc;
    (void)argv;

    MemoryImage mem("mem", 64);

    cout << "\n=== Register File / CSR / Memory Test ===\n";

    section("Integer register file");
    {
        RegisterFile rf;
        rf.write(0, 0xDEADBEEF);
        check_eq(rf.read(0), 0, "x0 ignores writes");
        rf.write(31, 0x12345678);
        check_eq(rf.read(31), 0x12345678, "x31 write/read");
        rf.reset();
        check_eq(rf.read(31), 0, "reset clears registers");
    }

    section("FP register file");
    {
        FpRegisterFile fp;
        fp.write(0, 0x3FF0000000000000ull);
        check_eq(fp.read(0), 0x3FF0000000000000ull, "f0 is a normal register");
        fp.write(1, 0x3F800000);
        check_eq(fp.read(1), 0x3F800000, "single precision in the low word, no boxing");
    }

    section("CSR bank");
    {
        CsrBank csr;
        check(CsrBank::implemented(CSR_MSTATUS) && !CsrBank::implemented(0x301), "implemented subset");

        sc_uint<32> old = csr.read_modify_write(CSR_MTVEC, CSR_OP_WRITE, 0x100, true);
        check(old == 0 && csr.read(CSR_MTVEC) == 0x100, "csrrw returns old, writes new");

        old = csr.read_modify_write(CSR_MTVEC, CSR_OP_SET, 0x0F, true);
        check(old == 0x100 && csr.read(CSR_MTVEC) == 0x10F, "csrrs sets bits");

        old = csr.read_modify_write(CSR_MTVEC, CSR_OP_CLEAR, 0x03, true);
        check(old == 0x10F && csr.read(CSR_MTVEC) == 0x10C, "csrrc clears bits");

        old = csr.read_modify_write(CSR_MTVEC, CSR_OP_SET, 0xFFFF, false);
        check(old == 0x10C && csr.read(CSR_MTVEC) == 0x10C, "read-only access leaves value");

        csr.write(0x7C0, 55);
        check_eq(csr.read(0x7C0), 0, "unimplemented address reads zero");

        csr.write(CSR_MEPC, 0x40);
        csr.write(CSR_MCAUSE, 11);
        csr.reset();
        check(csr.read(CSR_MEPC) == 0 && csr.read(CSR_MCAUSE) == 0, "reset clears CSRs");
    }

    section("Memory image");
    {
        std::vector<sc_uint<32> > image;
        image.push_back(0x00000013);
        image.push_back(0x11223344);
        mem.load(image, 0x10);
        check_eq(mem.peek(0x14), 0x11223344, "preload at base address");

        imem_response ir = mem.fetch(0x10);
        check(ir.ready && ir.instruction == 0x13, "instruction fetch");
        ir = mem.fetch(0x100);
        check(!ir.ready, "fetch outside memory not ready");
        ir = mem.fetch(0x12);
        check(!ir.ready, "misaligned fetch not ready");

        dmem_request req;
        req.addr = 0x14;
        req.wdata = 0x0000AA00;
        req.byte_enable = 0x2;
        req.we = true;
        req.req = true;
        dmem_response dr = mem.access(req);
        check(dr.ready && dr.rdata == 0x1122AA44, "byte enable merges one lane");

        req.addr = 0x100;
        req.wdata = 0xFFFFFFFF;
        req.byte_enable = 0xF;
        dr = mem.access(req);
        check(!dr.ready, "out of range access not ready");
        check_eq(mem.peek(0xFC), 0, "no mutation on out of range access");

        req.addr = 0x14;
        req.req = false;
        dr = mem.access(req);
        check(!dr.ready && mem.peek(0x14) == 0x1122AA44, "no request, no access");

        sc_uint<32> v;
        check(dmem_write_word(mem, 0x20, 0xCAFEF00D) && dmem_read_word(mem, 0x20, v) &&
              v == 0xCAFEF00D, "word helpers");
        check(mem.in_range(0xF8, 8) && !mem.in_range(0xFC, 8), "range check covers the span");

        bool reported = false;
        try {
            mem.load(std::vector<sc_uint<32> >(100, 0), 0);
        } catch (const sc_report& report) {
            reported = report.get_severity() == SC_ERROR;
        }
        check(reported, "oversized image reported as error");
    }

    return summary("Storage");
}
