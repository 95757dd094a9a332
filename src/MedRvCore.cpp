#include "MedRvCore.h"

MedRvCore::MedRvCore(sc_module_name name, const SimConfig& config)
    : sc_module(name),
      if_id("if_id"), id_ex("id_ex"), ex_mem("ex_mem"), mem_wb("mem_wb"),
      load_use_stall("load_use_stall"), mem_busy("mem_busy"), redirect("redirect"),
      redirect_target("redirect_target"), halt_pending("halt_pending"),
      forward_a("forward_a"), forward_b("forward_b"), fetch_pc("fetch_pc") {
    memory          = new MemoryImage("memory", config.memory_words);
    fetch_stage     = new FetchStage("fetch");
    decode_stage    = new DecodeStage("decode");
    execute_stage   = new ExecuteStage("execute");
    memory_stage    = new MemoryStage("mem");
    writeback_stage = new WritebackStage("writeback");
    hazard_unit     = new HazardUnit("hazard_unit");

    fetch_stage->clk(clk);
    fetch_stage->reset(reset);
    fetch_stage->stall(load_use_stall);
    fetch_stage->mem_busy(mem_busy);
    fetch_stage->redirect(redirect);
    fetch_stage->redirect_target(redirect_target);
    fetch_stage->halt_pending(halt_pending);
    fetch_stage->if_id(if_id);
    fetch_stage->pc_out(fetch_pc);
    fetch_stage->imem(*memory);
    fetch_stage->set_reset_pc(config.reset_pc);

    decode_stage->clk(clk);
    decode_stage->reset(reset);
    decode_stage->stall(load_use_stall);
    decode_stage->mem_busy(mem_busy);
    decode_stage->redirect(redirect);
    decode_stage->if_id(if_id);
    decode_stage->mem_wb(mem_wb);
    decode_stage->forward_a(forward_a);
    decode_stage->forward_b(forward_b);
    decode_stage->id_ex(id_ex);
    decode_stage->halt_pending(halt_pending);
    decode_stage->set_register_files(&x_regs, &f_regs);

    execute_stage->clk(clk);
    execute_stage->reset(reset);
    execute_stage->mem_busy(mem_busy);
    execute_stage->id_ex(id_ex);
    execute_stage->mem_wb(mem_wb);
    execute_stage->forward_a(forward_a);
    execute_stage->forward_b(forward_b);
    execute_stage->ex_mem(ex_mem);
    execute_stage->redirect(redirect);
    execute_stage->redirect_target(redirect_target);

    memory_stage->clk(clk);
    memory_stage->reset(reset);
    memory_stage->ex_mem(ex_mem);
    memory_stage->mem_wb(mem_wb);
    memory_stage->mem_busy(mem_busy);
    memory_stage->dmem(*memory);
    memory_stage->set_mac_latency(config.mac_latency);

    writeback_stage->clk(clk);
    writeback_stage->reset(reset);
    writeback_stage->mem_wb(mem_wb);
    writeback_stage->set_register_files(&x_regs, &f_regs);
    writeback_stage->set_trace(config.trace_retire);

    hazard_unit->if_id(if_id);
    hazard_unit->id_ex(id_ex);
    hazard_unit->ex_mem(ex_mem);
    hazard_unit->mem_wb(mem_wb);
    hazard_unit->load_use_stall(load_use_stall);
    hazard_unit->forward_a(forward_a);
    hazard_unit->forward_b(forward_b);
}

MedRvCore::~MedRvCore() {
    delete hazard_unit;
    delete writeback_stage;
    delete memory_stage;
    delete execute_stage;
    delete decode_stage;
    delete fetch_stage;
    delete memory;
}

DebugSnapshot MedRvCore::debug() const {
    DebugSnapshot snap = writeback_stage->snapshot();
    snap.fetch_pc = fetch_pc.read();
    return snap;
}
