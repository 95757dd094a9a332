#include <systemc.h>
#include <vector>

#include "Activation.h"
#include "AmoUnit.h"
#include "DmaUnit.h"
#include "MatrixUnits.h"
#include "MemoryImage.h"
#include "PoolingUnit.h"
#include "VectorUnit.h"
#include "TestCommon.h"

// Tick a started unit until it reports done, return the number of ticks
static unsigned run_unit(MultiCycleUnit& unit) {
    unsigned ticks = 0;
    while (!unit.done() && ticks < 100000) {
        unit.tick();
        ++ticks;
    }
    return ticks;
}

static void store_words(MemoryImage& mem, uint32_t addr, const std::vector<int32_t>& words) {
    for (size_t i = 0; i < words.size(); ++i) mem.poke(addr + 4 * i, (uint32_t)words[i]);
}

static int32_t word_at(MemoryImage& mem, uint32_t addr) {
    return (int32_t)mem.peek(addr).to_uint();
}

int sc_main(int argc, char* argv[]) {
    (void)argc;
    (void)argv;

    MemoryImage mem("mem", 4096);

    cout << "\n=== Medical Imaging Units Test ===\n";

    section("Matrix multiply");
    {
        MatrixMultiplyUnit mmul;
        int32_t a[] = { 1, 2, 3, 4 };
        int32_t id[] = { 1, 0, 0, 1 };
        store_words(mem, 0x100, std::vector<int32_t>(a, a + 4));
        store_words(mem, 0x200, std::vector<int32_t>(id, id + 4));
        int32_t desc[] = { 0x100, 0x200, 0x300, 2, 2, 2 };
        store_words(mem, 0x80, std::vector<int32_t>(desc, desc + 6));

        mmul.start(mem, 0x80);
        check(mmul.busy() && !mmul.finishing(), "unit busy after start");
        unsigned ticks = run_unit(mmul);
        check_eq(ticks, 8, "N*M*P ticks for 2x2x2");
        check(mmul.valid() && mmul.result() == 4, "four elements written");
        check(word_at(mem, 0x300) == 1 && word_at(mem, 0x304) == 2 &&
              word_at(mem, 0x308) == 3 && word_at(mem, 0x30C) == 4, "A * I == A");
        mmul.acknowledge();
        check(mmul.current_state() == UNIT_IDLE, "acknowledge returns to idle");

        int32_t a23[] = { 1, 2, 3, 4, 5, 6 };
        int32_t b32[] = { 7, 8, 9, 10, 11, 12 };
        store_words(mem, 0x100, std::vector<int32_t>(a23, a23 + 6));
        store_words(mem, 0x200, std::vector<int32_t>(b32, b32 + 6));
        int32_t desc2[] = { 0x100, 0x200, 0x300, 2, 3, 2 };
        store_words(mem, 0x80, std::vector<int32_t>(desc2, desc2 + 6));
        mmul.start(mem, 0x80);
        check_eq(run_unit(mmul), 12, "2x3 * 3x2 takes 12 ticks");
        check(word_at(mem, 0x300) == 58 && word_at(mem, 0x304) == 64 &&
              word_at(mem, 0x308) == 139 && word_at(mem, 0x30C) == 154, "2x3 * 3x2 product");
        mmul.acknowledge();

        int32_t bad[] = { 0x100, 0x200, 0x300, 17, 1, 1 };
        store_words(mem, 0x80, std::vector<int32_t>(bad, bad + 6));
        mmul.start(mem, 0x80);
        check_eq(run_unit(mmul), 1, "rejected start takes one tick");
        check(!mmul.valid(), "dimension 17 rejected");
        mmul.acknowledge();

        int32_t far[] = { 0x100, 0x200, 0x3FFC0, 4, 4, 4 };
        store_words(mem, 0x80, std::vector<int32_t>(far, far + 6));
        mmul.start(mem, 0x80);
        run_unit(mmul);
        check(!mmul.valid(), "output outside memory rejected");
        mmul.acknowledge();

        store_words(mem, 0x80, std::vector<int32_t>(desc, desc + 6));
        mmul.start(mem, 0x82);
        check_eq(run_unit(mmul), 1, "misaligned descriptor takes one tick");
        check(!mmul.valid(), "misaligned matrix descriptor rejected");
        mmul.acknowledge();
    }

    section("Dot product");
    {
        DotProductUnit dot;
        int32_t a[] = { 1, 2, 3, 4 };
        int32_t b[] = { 4, 3, 2, 1 };
        store_words(mem, 0x400, std::vector<int32_t>(a, a + 4));
        store_words(mem, 0x500, std::vector<int32_t>(b, b + 4));
        int32_t desc[] = { 0x400, 0x500, 4, 0, 0 };
        store_words(mem, 0x90, std::vector<int32_t>(desc, desc + 5));

        dot.start(mem, 0x90);
        check_eq(run_unit(dot), 4, "one element per tick");
        check(dot.valid() && dot.sum() == 20, "[1,2,3,4] . [4,3,2,1] = 20");
        check(word_at(mem, 0x9C) == 20 && word_at(mem, 0xA0) == 0, "sum stored in descriptor");
        dot.acknowledge();

        int32_t empty[] = { 0x400, 0x500, 0, 0, 0 };
        store_words(mem, 0x90, std::vector<int32_t>(empty, empty + 5));
        dot.start(mem, 0x90);
        check_eq(run_unit(dot), 1, "length 0 completes after one tick");
        check(dot.valid() && dot.sum() == 0, "empty sum is zero");
        dot.acknowledge();

        int32_t na[] = { -1 };
        int32_t nb[] = { 5 };
        store_words(mem, 0x400, std::vector<int32_t>(na, na + 1));
        store_words(mem, 0x500, std::vector<int32_t>(nb, nb + 1));
        int32_t one[] = { 0x400, 0x500, 1, 0, 0 };
        store_words(mem, 0x90, std::vector<int32_t>(one, one + 5));
        dot.start(mem, 0x90);
        run_unit(dot);
        check(word_at(mem, 0x9C) == -5 && word_at(mem, 0xA0) == -1, "negative 64-bit sum");
        dot.acknowledge();

        dot.start(mem, 0x92);
        run_unit(dot);
        check(!dot.valid(), "misaligned dot descriptor rejected");
        check(word_at(mem, 0x9C) == -5 && word_at(mem, 0xA0) == -1, "no sum written for it");
        dot.acknowledge();
    }

    section("Pooling");
    {
        PoolingUnit pool;
        std::vector<int32_t> flat(16, 7);
        store_words(mem, 0x600, flat);
        int32_t desc[] = { 0x600, 0x700, 4, 2, 2 };
        store_words(mem, 0xB0, std::vector<int32_t>(desc, desc + 5));

        pool.start(mem, 0xB0, POOL_MAX);
        check_eq(run_unit(pool), 4, "one output per tick");
        check(pool.valid() && pool.result() == 4, "4x4 / 2x2 stride 2 -> 4 outputs");
        bool all7 = true;
        for (int i = 0; i < 4; ++i) all7 = all7 && word_at(mem, 0x700 + 4 * i) == 7;
        check(all7, "uniform max pool");
        pool.acknowledge();

        pool.start(mem, 0xB0, POOL_AVG);
        run_unit(pool);
        all7 = true;
        for (int i = 0; i < 4; ++i) all7 = all7 && word_at(mem, 0x700 + 4 * i) == 7;
        check(all7, "uniform average pool");
        pool.acknowledge();

        int32_t img[] = { 1, 2, 3, 4, 5, 6, 7, 8, 9 };
        store_words(mem, 0x600, std::vector<int32_t>(img, img + 9));
        int32_t clip[] = { 0x600, 0x700, 3, 2, 2 };
        store_words(mem, 0xB0, std::vector<int32_t>(clip, clip + 5));

        pool.start(mem, 0xB0, POOL_MAX);
        run_unit(pool);
        check(pool.result() == 4 && word_at(mem, 0x700) == 5 && word_at(mem, 0x704) == 6 &&
              word_at(mem, 0x708) == 8 && word_at(mem, 0x70C) == 9, "max pool clips edge windows");
        pool.acknowledge();

        pool.start(mem, 0xB0, POOL_AVG);
        run_unit(pool);
        check(word_at(mem, 0x700) == 3 && word_at(mem, 0x704) == 4 &&
              word_at(mem, 0x708) == 7 && word_at(mem, 0x70C) == 9,
              "average over in-bounds elements only");
        pool.acknowledge();

        int32_t neg[] = { -1, -2, 0, 0 };
        store_words(mem, 0x600, std::vector<int32_t>(neg, neg + 4));
        int32_t one[] = { 0x600, 0x700, 2, 2, 2 };
        store_words(mem, 0xB0, std::vector<int32_t>(one, one + 5));
        pool.start(mem, 0xB0, POOL_AVG);
        run_unit(pool);
        check(word_at(mem, 0x700) == 0, "average truncates toward zero (-3 / 4)");
        pool.acknowledge();

        int32_t bad[] = { 0x600, 0x700, 4, 5, 1 };
        store_words(mem, 0xB0, std::vector<int32_t>(bad, bad + 5));
        pool.start(mem, 0xB0, POOL_MAX);
        run_unit(pool);
        check(!pool.valid(), "pool larger than the image rejected");
        pool.acknowledge();

        store_words(mem, 0xB0, std::vector<int32_t>(one, one + 5));
        pool.start(mem, 0xB2, POOL_MAX);
        run_unit(pool);
        check(!pool.valid() && pool.result() == 0, "misaligned pool descriptor rejected");
        pool.acknowledge();

        check(PoolingUnit::origins(5, 2) == 3 && PoolingUnit::origins(4, 2) == 2, "origin count");
    }

    section("Multiply-accumulate");
    {
        MacUnit mac;
        mac.start_mac(3, 4, false, 2);
        mac.tick();
        check(mac.busy() && mac.accumulator() == 0, "result not visible before latency");
        mac.tick();
        check(mac.done() && mac.accumulator() == 12, "3 * 4 after two ticks");
        mac.acknowledge();

        mac.start_mac(2, 5, false, 2);
        run_unit(mac);
        check(mac.accumulator() == 22, "accumulates 2 * 5");
        mac.acknowledge();

        mac.start_mac(-1, 1, true, 2);
        run_unit(mac);
        check(mac.accumulator() == -1, "clear then multiply");
        mac.acknowledge();

        mac.start_read();
        check_eq(run_unit(mac), 1, "accumulator read takes one tick");
        check(mac.valid() && mac.accumulator() == -1, "read keeps the accumulator");
        mac.acknowledge();

        mac.start_mac(0x7FFFFFFF, 2, true, 3);
        check_eq(run_unit(mac), 3, "configured latency");
        check(mac.accumulator() == -2, "32-bit wrap");
        mac.acknowledge();
    }

    section("Activation (Q16.16)");
    {
        check(activation_tanh(0) == 0, "tanh(0) = 0");
        check(activation_tanh(Q16_ONE) == 50972, "tanh(1.0) rational approximation");
        check(activation_tanh(-Q16_ONE) == -50972, "tanh is odd");
        check(activation_tanh(3 * Q16_ONE) == Q16_ONE, "tanh saturates at 3.0");
        check(activation_tanh(-5 * Q16_ONE) == -Q16_ONE, "tanh saturates at -3.0");
        check(activation_sigmoid(0) == Q16_ONE / 2, "sigmoid(0) = 0.5");
        check(activation_sigmoid(2 * Q16_ONE) == 58254, "sigmoid(2.0) through tanh(1.0)");
        check(activation_sigmoid(6 * Q16_ONE) == Q16_ONE, "sigmoid saturates to 1.0");
        check(activation_sigmoid(-6 * Q16_ONE) == 0, "sigmoid saturates to 0");
        check(activation_compute(ACT_TANH, Q16_ONE) == 50972, "selector 1 is tanh");
        check(activation_compute(7, Q16_ONE) == 0, "unknown selector gives 0");
    }

    section("DMA");
    {
        DmaUnit dma;
        int32_t src[] = { 11, 22, 33, 44, 55, 66, 77, 88 };
        store_words(mem, 0x800, std::vector<int32_t>(src, src + 8));

        dma.start(mem, DMA_LOAD, 0x800, 8);
        check_eq(run_unit(dma), 8, "one word per tick");
        check(dma.valid() && dma.result() == 8, "8 words loaded");
        dma.acknowledge();

        sc_uint<32> v;
        check(dma.channel_read(7, v) && v == 88, "channel holds the block");

        dma.start(mem, DMA_STORE, 0x900, 8);
        run_unit(dma);
        dma.acknowledge();
        bool same = true;
        for (int i = 0; i < 8; ++i) same = same && word_at(mem, 0x900 + 4 * i) == src[i];
        check(same, "load then store round trip");

        dma.start(mem, 5, 0x800, 8);
        check_eq(run_unit(dma), 1, "inert mode finishes at once");
        check(!dma.valid(), "inert mode has no valid output");
        dma.acknowledge();

        dma.start(mem, DMA_LOAD, 0x800, 300);
        run_unit(dma);
        check(!dma.valid(), "size above channel capacity rejected");
        dma.acknowledge();

        dma.start(mem, DMA_STORE, 0x3FF0, 8);
        run_unit(dma);
        check(!dma.valid() && word_at(mem, 0x3FF0) != 11, "span past memory end rejected, no writes");
        dma.acknowledge();

        check(dma.channel_write(0, 1234) && dma.channel_read(0, v) && v == 1234, "channel write/read");
        check(!dma.channel_read(256, v) && !dma.channel_write(256, 1), "channel index bounds");
    }

    section("Atomic memory operations");
    {
        mem.poke(0x40, 10);
        amo_result r = amo_execute(mem, AMO_ADD, 0x40, 5, false, false);
        check(r.valid && r.old_value == 10 && word_at(mem, 0x40) == 15, "amoadd returns old value");

        r = amo_execute(mem, AMO_SWAP, 0x40, 99, true, true);
        check(r.valid && r.old_value == 15 && word_at(mem, 0x40) == 99, "amoswap with aq/rl");

        mem.poke(0x40, 0xF0);
        r = amo_execute(mem, AMO_OR, 0x40, 0x0F, false, false);
        check(r.old_value == 0xF0 && word_at(mem, 0x40) == 0xFF, "amoor");

        r = amo_execute(mem, AMO_AND, 0x40, 0x3C, false, false);
        check(r.old_value == 0xFF && word_at(mem, 0x40) == 0x3C, "amoand");

        r = amo_execute(mem, AMO_ADD, 0x42, 1, false, false);
        check(!r.valid && word_at(mem, 0x40) == 0x3C, "misaligned address rejected");

        r = amo_execute(mem, AMO_ADD, 0x4000, 1, false, false);
        check(!r.valid, "address past memory rejected");
    }

    section("Vector");
    {
        vreg a, b, out;
        for (unsigned i = 0; i < MEDRV_VLEN; ++i) {
            a.lane[i] = i + 1;
            b.lane[i] = 10 * (i + 1);
        }
        check(vector_compute(VOP_ADD, b, a, out) && out.lane[0] == 11 && out.lane[3] == 44, "vadd");
        check(vector_compute(VOP_SUB, b, a, out) && out.lane[1] == 18, "vsub is vs2 - operand");
        check(vector_compute(VOP_MUL, b, vreg::broadcast((uint32_t)-2), out) &&
              out.lane[2] == (uint32_t)-60, "vmul by broadcast scalar");
        check(vector_compute(VOP_AND, vreg::broadcast(0xF0F0), vreg::broadcast(0xFF00), out) &&
              out.lane[0] == 0xF000, "vand");
        check(vector_compute(VOP_OR, vreg::broadcast(0xF0), vreg::broadcast(0x0F), out) &&
              out.lane[3] == 0xFF, "vor");
        check(!vector_compute(0x3F, a, b, out), "unknown funct6 rejected");

        VectorRegisterFile vrf;
        vrf.write(3, a);
        check(vrf.read(3) == a && vrf.read(4) == vreg(), "vector register file");
    }

    return summary("Units");
}
