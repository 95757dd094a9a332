// Max and average pooling over a square row-major image of signed words.
//
// Descriptor at x[rs1]: {in_addr, out_addr, dimensions, pool_size, stride}.
// Window origins are the multiples of stride below dimensions in both axes,
// visited row-major. A window reaching past the image edge is clipped to its
// in-bounds elements and averaged over that count. One output per tick.
#ifndef MEDRV_POOLING_UNIT_H
#define MEDRV_POOLING_UNIT_H

#include <systemc.h>

#include "MemoryImage.h"
#include "MultiCycleUnit.h"

enum pool_mode {
    POOL_MAX = 0,
    POOL_AVG = 1
};

class PoolingUnit : public MultiCycleUnit {
public:
    PoolingUnit();

    void start(dmem_if& mem, sc_uint<32> descriptor, pool_mode mode);
    sc_uint<32> result() const { return outputs; }
    void reset();

    // origins per axis for a given image edge and stride
    static unsigned origins(unsigned dimensions, unsigned stride);

protected:
    void compute_step();

private:
    dmem_if*    mem;
    pool_mode   mode;
    sc_uint<32> in_addr, out_addr;
    unsigned    dims, pool, stride;
    unsigned    per_row;
    unsigned    outputs;
    unsigned    index;
};

#endif
