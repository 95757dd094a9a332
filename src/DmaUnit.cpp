#include "DmaUnit.h"
#include "MedRvConfig.h"

DmaUnit::DmaUnit()
    : mem(0), mode(DMA_LOAD), base(0), size(0), index(0),
      channel(MEDRV_DMA_CHANNEL_WORDS, sc_uint<32>(0)) {}

void DmaUnit::start(dmem_if& memory, unsigned m, sc_uint<32> addr, sc_uint<32> words) {
    mem = &memory;
    base = addr;
    size = 0;
    index = 0;

    if (m != DMA_LOAD && m != DMA_STORE) {
        reject();
        return;
    }
    mode = (dma_mode)m;

    // whole span is checked up front so a transfer never faults midway
    if (words > MEDRV_DMA_CHANNEL_WORDS || addr.range(1, 0) != 0 ||
        (words > 0 && !memory.in_range(addr, words.to_uint() * 4))) {
        reject();
        return;
    }

    size = words.to_uint();
    begin(size);
}

void DmaUnit::compute_step() {
    if (index >= size) return;
    sc_uint<32> addr = base + 4 * index;
    if (mode == DMA_LOAD)
        dmem_read_word(*mem, addr, channel[index]);
    else
        dmem_write_word(*mem, addr, channel[index]);
    ++index;
}

bool DmaUnit::channel_read(sc_uint<32> i, sc_uint<32>& value) const {
    if (i >= MEDRV_DMA_CHANNEL_WORDS) {
        value = 0;
        return false;
    }
    value = channel[i.to_uint()];
    return true;
}

bool DmaUnit::channel_write(sc_uint<32> i, sc_uint<32> value) {
    if (i >= MEDRV_DMA_CHANNEL_WORDS) return false;
    channel[i.to_uint()] = value;
    return true;
}

void DmaUnit::reset() {
    MultiCycleUnit::reset();
    mem = 0;
    size = 0;
    index = 0;
    for (size_t i = 0; i < channel.size(); ++i) channel[i] = 0;
}
