#include "MatrixUnits.h"
#include "MedRvConfig.h"

static bool read_descriptor(dmem_if& mem, sc_uint<32> base, sc_uint<32>* fields, unsigned count) {
    for (unsigned f = 0; f < count; ++f) {
        if (!dmem_read_word(mem, base + 4 * f, fields[f])) return false;
    }
    return true;
}

static bool word_aligned(sc_uint<32> addr) {
    return addr.range(1, 0) == 0;
}

static sc_int<32> as_signed(sc_uint<32> word) {
    return (sc_int<32>)(int32_t)word.to_uint();
}

// ---------------- matrix multiply ----------------

MatrixMultiplyUnit::MatrixMultiplyUnit()
    : mem(0), a_addr(0), b_addr(0), c_addr(0), n(0), m(0), p(0), i(0), j(0), k(0), acc(0) {}

void MatrixMultiplyUnit::start(dmem_if& memory, sc_uint<32> descriptor) {
    sc_uint<32> d[6];
    mem = &memory;
    n = m = p = 0;
    i = j = k = 0;
    acc = 0;

    if (!word_aligned(descriptor) || !read_descriptor(memory, descriptor, d, 6)) {
        reject();
        return;
    }
    a_addr = d[0];
    b_addr = d[1];
    c_addr = d[2];

    for (int f = 3; f < 6; ++f) {
        if (d[f] < 1 || d[f] > MEDRV_MATRIX_MAX_DIM) {
            reject();
            return;
        }
    }
    n = d[3].to_uint();
    m = d[4].to_uint();
    p = d[5].to_uint();

    if (!word_aligned(a_addr) || !word_aligned(b_addr) || !word_aligned(c_addr) ||
        !memory.in_range(a_addr, n * m * 4) ||
        !memory.in_range(b_addr, m * p * 4) ||
        !memory.in_range(c_addr, n * p * 4)) {
        n = m = p = 0;
        reject();
        return;
    }

    begin(n * m * p);
}

// one multiply-accumulate per tick, C[i][j] stored when k wraps.
// Operand ranges were checked at start.
void MatrixMultiplyUnit::compute_step() {
    sc_uint<32> a, b;
    dmem_read_word(*mem, a_addr + 4 * (i * m + k), a);
    dmem_read_word(*mem, b_addr + 4 * (k * p + j), b);
    acc = (sc_int<32>)(acc + as_signed(a) * as_signed(b));

    if (++k == m) {
        dmem_write_word(*mem, c_addr + 4 * (i * p + j), (uint32_t)acc.to_int());
        acc = 0;
        k = 0;
        if (++j == p) {
            j = 0;
            ++i;
        }
    }
}

sc_uint<32> MatrixMultiplyUnit::result() const {
    return n * p;
}

void MatrixMultiplyUnit::reset() {
    MultiCycleUnit::reset();
    mem = 0;
    n = m = p = 0;
    i = j = k = 0;
    acc = 0;
}

// ---------------- multiply-accumulate ----------------

MacUnit::MacUnit() : acc(0), src1(0), src2(0), clear_first(false), accumulate(false) {}

void MacUnit::start_mac(sc_int<32> a, sc_int<32> b, bool clear, unsigned latency) {
    src1 = a;
    src2 = b;
    clear_first = clear;
    accumulate = true;
    begin(latency);
}

void MacUnit::start_read() {
    accumulate = false;
    begin(1);
}

void MacUnit::compute_step() {
    if (!accumulate || !finishing()) return;
    sc_int<32> base = clear_first ? sc_int<32>(0) : acc;
    acc = (sc_int<32>)(base + src1 * src2);
}

void MacUnit::reset() {
    MultiCycleUnit::reset();
    acc = 0;
    src1 = src2 = 0;
    clear_first = false;
    accumulate = false;
}

// ---------------- dot product ----------------

DotProductUnit::DotProductUnit()
    : mem(0), descriptor(0), a_addr(0), b_addr(0), length(0), index(0), acc(0) {}

void DotProductUnit::start(dmem_if& memory, sc_uint<32> desc) {
    sc_uint<32> d[3];
    mem = &memory;
    descriptor = desc;
    index = 0;
    acc = 0;

    if (!word_aligned(desc) || !read_descriptor(memory, desc, d, 3) || !memory.in_range(desc, 20)) {
        reject();
        return;
    }
    a_addr = d[0];
    b_addr = d[1];
    length = d[2].to_uint();

    if (length > MEDRV_DOT_MAX_LENGTH || !word_aligned(a_addr) || !word_aligned(b_addr) ||
        (length > 0 && (!memory.in_range(a_addr, length * 4) ||
                        !memory.in_range(b_addr, length * 4)))) {
        length = 0;
        reject();
        return;
    }

    begin(length);
}

void DotProductUnit::compute_step() {
    if (index < length) {
        sc_uint<32> a, b;
        dmem_read_word(*mem, a_addr + 4 * index, a);
        dmem_read_word(*mem, b_addr + 4 * index, b);
        acc += (sc_int<64>)((int64_t)(int32_t)a.to_uint() * (int64_t)(int32_t)b.to_uint());
        ++index;
    }
    if (finishing()) {
        sc_uint<64> bits = (uint64_t)acc.to_int64();
        dmem_write_word(*mem, descriptor + 12, bits.range(31, 0));
        dmem_write_word(*mem, descriptor + 16, bits.range(63, 32));
    }
}

void DotProductUnit::reset() {
    MultiCycleUnit::reset();
    mem = 0;
    length = 0;
    index = 0;
    acc = 0;
}
