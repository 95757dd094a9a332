// Hazard detection and forwarding selection
#ifndef MEDRV_HAZARD_UNIT_H
#define MEDRV_HAZARD_UNIT_H

#include <systemc.h>

#include "MedRvTypes.h"

// forward_a / forward_b encodings
enum forward_select {
    FWD_NONE   = 0,
    FWD_MEM_WB = 1,
    FWD_EX_MEM = 2
};

// Operand value for an EX source after applying a forward selection
sc_uint<64> forward_operand(sc_uint<2> select, sc_uint<64> reg_value,
                            const ExMemReg& ex_mem, const MemWbReg& mem_wb);

SC_MODULE(HazardUnit) {
    sc_in<IfIdReg>   if_id;
    sc_in<IdExReg>   id_ex;
    sc_in<ExMemReg>  ex_mem;
    sc_in<MemWbReg>  mem_wb;

    sc_out<bool>       load_use_stall;
    sc_out<sc_uint<2>> forward_a;
    sc_out<sc_uint<2>> forward_b;

    void hazard_detect();

    SC_CTOR(HazardUnit) {
        SC_METHOD(hazard_detect);
        sensitive << if_id << id_ex << ex_mem << mem_wb;
    }

private:
    sc_uint<2> select_for(sc_uint<5> reg, reg_class cls,
                          const ExMemReg& ex, const MemWbReg& wb) const;
};

#endif
