// Block transfer engine between data memory and a private channel buffer
#ifndef MEDRV_DMA_UNIT_H
#define MEDRV_DMA_UNIT_H

#include <systemc.h>
#include <vector>

#include "MemoryImage.h"
#include "MultiCycleUnit.h"

enum dma_mode {
    DMA_LOAD  = 0,      // memory -> channel
    DMA_STORE = 1       // channel -> memory
};

class DmaUnit : public MultiCycleUnit {
public:
    DmaUnit();

    // modes other than load/store are inert and finish with valid() false
    void start(dmem_if& mem, unsigned mode, sc_uint<32> base, sc_uint<32> size);
    sc_uint<32> result() const { return size; }
    void reset();

    bool channel_read(sc_uint<32> index, sc_uint<32>& value) const;
    bool channel_write(sc_uint<32> index, sc_uint<32> value);

protected:
    void compute_step();

private:
    dmem_if*                  mem;
    dma_mode                  mode;
    sc_uint<32>               base;
    unsigned                  size;
    unsigned                  index;
    std::vector<sc_uint<32> > channel;
};

#endif
