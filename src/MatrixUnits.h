// Matrix multiply, multiply-accumulate and dot product units
#ifndef MEDRV_MATRIX_UNITS_H
#define MEDRV_MATRIX_UNITS_H

#include <systemc.h>

#include "MemoryImage.h"
#include "MultiCycleUnit.h"

// C[N x P] = A[N x M] * B[M x P], row-major signed 32-bit words.
// Descriptor at x[rs1]: {a_addr, b_addr, c_addr, n, m, p}.
class MatrixMultiplyUnit : public MultiCycleUnit {
public:
    MatrixMultiplyUnit();

    void start(dmem_if& mem, sc_uint<32> descriptor);
    sc_uint<32> result() const;     // elements written, N*P
    void reset();

protected:
    void compute_step();

private:
    dmem_if*    mem;
    sc_uint<32> a_addr, b_addr, c_addr;
    unsigned    n, m, p;
    unsigned    i, j, k;
    sc_int<32>  acc;
};

// acc = (clear ? 0 : acc) + a * b, applied on the last tick of its latency
class MacUnit : public MultiCycleUnit {
public:
    MacUnit();

    void start_mac(sc_int<32> a, sc_int<32> b, bool clear, unsigned latency);
    void start_read();
    sc_int<32> accumulator() const { return acc; }
    void reset();

protected:
    void compute_step();

private:
    sc_int<32> acc;
    sc_int<32> src1, src2;
    bool       clear_first;
    bool       accumulate;
};

// 64-bit sum of A[i] * B[i]. Descriptor at x[rs1]:
// {a_addr, b_addr, length, sum_lo, sum_hi}, the sum is stored back into
// the last two words.
class DotProductUnit : public MultiCycleUnit {
public:
    DotProductUnit();

    void start(dmem_if& mem, sc_uint<32> descriptor);
    sc_int<64> sum() const { return acc; }
    void reset();

protected:
    void compute_step();

private:
    dmem_if*    mem;
    sc_uint<32> descriptor;
    sc_uint<32> a_addr, b_addr;
    unsigned    length;
    unsigned    index;
    sc_int<64>  acc;
};

#endif
