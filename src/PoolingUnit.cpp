#include "PoolingUnit.h"
#include "MedRvConfig.h"

PoolingUnit::PoolingUnit()
    : mem(0), mode(POOL_MAX), in_addr(0), out_addr(0), dims(0), pool(0), stride(0),
      per_row(0), outputs(0), index(0) {}

unsigned PoolingUnit::origins(unsigned dimensions, unsigned stride) {
    return stride ? (dimensions + stride - 1) / stride : 0;
}

void PoolingUnit::start(dmem_if& memory, sc_uint<32> descriptor, pool_mode m) {
    sc_uint<32> d[5];
    mem = &memory;
    mode = m;
    outputs = 0;
    index = 0;

    if (descriptor.range(1, 0) != 0) {
        reject();
        return;
    }
    for (unsigned f = 0; f < 5; ++f) {
        if (!dmem_read_word(memory, descriptor + 4 * f, d[f])) {
            reject();
            return;
        }
    }
    in_addr  = d[0];
    out_addr = d[1];

    if (d[2] < 1 || d[2] > MEDRV_POOL_MAX_DIM || d[3] < 1 || d[3] > d[2] ||
        d[4] < 1) {
        reject();
        return;
    }
    dims   = d[2].to_uint();
    pool   = d[3].to_uint();
    stride = d[4].to_uint();
    per_row = origins(dims, stride);

    if (in_addr.range(1, 0) != 0 || out_addr.range(1, 0) != 0 ||
        !memory.in_range(in_addr, dims * dims * 4) ||
        !memory.in_range(out_addr, per_row * per_row * 4)) {
        reject();
        return;
    }

    outputs = per_row * per_row;
    begin(outputs);
}

void PoolingUnit::compute_step() {
    unsigned r0 = (index / per_row) * stride;
    unsigned c0 = (index % per_row) * stride;
    unsigned r1 = (r0 + pool < dims) ? r0 + pool : dims;
    unsigned c1 = (c0 + pool < dims) ? c0 + pool : dims;

    int64_t  sum = 0;
    int32_t  max = 0;
    unsigned count = 0;

    for (unsigned r = r0; r < r1; ++r) {
        for (unsigned c = c0; c < c1; ++c) {
            sc_uint<32> word;
            dmem_read_word(*mem, in_addr + 4 * (r * dims + c), word);
            int32_t v = (int32_t)word.to_uint();
            if (count == 0 || v > max) max = v;
            sum += v;
            ++count;
        }
    }

    int32_t out = (mode == POOL_AVG) ? (int32_t)(sum / (int64_t)count) : max;
    dmem_write_word(*mem, out_addr + 4 * index, (uint32_t)out);
    ++index;
}

void PoolingUnit::reset() {
    MultiCycleUnit::reset();
    mem = 0;
    outputs = 0;
    index = 0;
}
