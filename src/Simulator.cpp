#include "Simulator.h"

#include <sstream>
#include <string>

Simulator::Simulator(const char* name, const SimConfig& config)
    : cfg(config), clock_sig((std::string(name) + "_clk").c_str()),
      reset_sig((std::string(name) + "_reset").c_str()), cpu(nullptr) {
    if (sc_is_running() || sc_start_of_simulation_invoked()) {
        SC_REPORT_ERROR(MEDRV_MSG_SIM, "simulator constructed after simulation start");
        return;
    }

    cpu = new MedRvCore(name, cfg);
    cpu->clk(clock_sig);
    cpu->reset(reset_sig);

    // the clock is driven by hand, half periods may pass with no event
    sc_report_handler::set_actions(SC_ID_NO_SC_START_ACTIVITY_, SC_DO_NOTHING);

    if (cfg.trace_retire) sc_report_handler::set_verbosity_level(SC_DEBUG);
}

Simulator::~Simulator() {
    delete cpu;
}

void Simulator::load_program(const std::vector<sc_uint<32> >& image, sc_uint<32> base) {
    cpu->mem().load(image, base);
}

sc_uint<32> Simulator::read_word(sc_uint<32> addr) const {
    return cpu->mem().peek(addr);
}

void Simulator::write_word(sc_uint<32> addr, sc_uint<32> value) {
    cpu->mem().poke(addr, value);
}

void Simulator::reset() {
    cpu->int_regs().reset();
    cpu->fp_regs().reset();
    reset_sig.write(true);
    step(1);
    reset_sig.write(false);
}

// One full clock period per cycle: rising edge, then falling edge
void Simulator::step(unsigned count) {
    sc_time half = cfg.clock_period / 2;
    for (unsigned i = 0; i < count; ++i) {
        if (sc_get_status() == SC_STOPPED) {
            SC_REPORT_ERROR(MEDRV_MSG_SIM, "simulation already stopped");
            return;
        }
        clock_sig.write(true);
        sc_start(half);
        clock_sig.write(false);
        sc_start(half);
    }
}

run_status Simulator::run(uint64_t max_cycles) {
    uint64_t limit = max_cycles ? max_cycles : cfg.max_cycles;

    for (uint64_t n = 0; n < limit && !halted(); ++n) step(1);
    if (halted()) return RUN_HALTED;

    std::ostringstream msg;
    msg << cpu->name() << " did not halt within " << limit << " cycles (pc 0x" << std::hex
        << debug().fetch_pc.to_uint() << ")";
    SC_REPORT_WARNING(MEDRV_MSG_SIM, msg.str().c_str());
    return RUN_TIMEOUT;
}
