// Host side driver for one core: clock, reset, stepping and state access.
//
// Several simulators may coexist, but all of them must be constructed
// before the first one is stepped, since SystemC freezes the module
// hierarchy at the first sc_start. Each core has its own clock signal that
// only its simulator toggles, so stepping one core leaves the others idle.
#ifndef MEDRV_SIMULATOR_H
#define MEDRV_SIMULATOR_H

#include <systemc.h>
#include <vector>

#include "MedRvConfig.h"
#include "MedRvCore.h"

enum run_status {
    RUN_HALTED = 0,
    RUN_TIMEOUT
};

class Simulator {
public:
    explicit Simulator(const char* name, const SimConfig& config = SimConfig());
    ~Simulator();

    void load_program(const std::vector<sc_uint<32> >& image, sc_uint<32> base = 0);
    sc_uint<32> read_word(sc_uint<32> addr) const;
    void write_word(sc_uint<32> addr, sc_uint<32> value);

    // clears register files, holds reset for one clock edge
    void reset();
    void step(unsigned cycles = 1);
    // max_cycles = 0 uses the configured watchdog
    run_status run(uint64_t max_cycles = 0);

    bool halted() const { return cpu->debug().halted; }
    uint64_t cycles() const { return cpu->debug().cycles; }
    uint64_t retired() const { return cpu->debug().retired_count; }
    DebugSnapshot debug() const { return cpu->debug(); }

    sc_uint<32> reg(unsigned index) const { return cpu->int_regs().read(index); }
    void set_reg(unsigned index, sc_uint<32> value) { cpu->int_regs().write(index, value); }
    sc_uint<64> fp_reg(unsigned index) const { return cpu->fp_regs().read(index); }
    void set_fp_reg(unsigned index, sc_uint<64> value) { cpu->fp_regs().write(index, value); }

    MedRvCore& core() { return *cpu; }
    const SimConfig& config() const { return cfg; }

private:
    Simulator(const Simulator&);
    Simulator& operator=(const Simulator&);

    SimConfig       cfg;
    sc_signal<bool> clock_sig;
    sc_signal<bool> reset_sig;
    MedRvCore*      cpu;
};

#endif
