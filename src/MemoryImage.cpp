#include "MemoryImage.h"
#include "MedRvConfig.h"

#include <sstream>

bool dmem_read_word(dmem_if& mem, sc_uint<32> addr, sc_uint<32>& value) {
    dmem_request request;
    request.addr = addr;
    request.byte_enable = 0xF;
    request.req = true;
    dmem_response response = mem.access(request);
    value = response.ready ? response.rdata : sc_uint<32>(0);
    return response.ready;
}

bool dmem_write_word(dmem_if& mem, sc_uint<32> addr, sc_uint<32> value) {
    dmem_request request;
    request.addr = addr;
    request.wdata = value;
    request.byte_enable = 0xF;
    request.we = true;
    request.req = true;
    return mem.access(request).ready;
}

MemoryImage::MemoryImage(sc_module_name name, unsigned words)
    : sc_module(name), mem(words, sc_uint<32>(0)) {}

imem_response MemoryImage::fetch(sc_uint<32> addr) {
    imem_response response;
    if (addr.range(1, 0) != 0 || !in_range(addr, 4)) return response;
    response.instruction = mem[addr.to_uint() >> 2];
    response.ready = true;
    return response;
}

dmem_response MemoryImage::access(const dmem_request& request) {
    dmem_response response;
    if (!request.req || !in_range(request.addr, 4)) return response;

    unsigned index = request.addr.to_uint() >> 2;
    if (request.we) {
        sc_uint<32> word = mem[index];
        for (int lane = 0; lane < 4; ++lane) {
            if (request.byte_enable[lane])
                word.range(lane * 8 + 7, lane * 8) = request.wdata.range(lane * 8 + 7, lane * 8);
        }
        mem[index] = word;
    }
    response.rdata = mem[index];
    response.ready = true;
    return response;
}

bool MemoryImage::in_range(sc_uint<32> addr, unsigned bytes) const {
    uint64_t end = (uint64_t)addr.to_uint() + bytes;
    return bytes > 0 && end <= (uint64_t)mem.size() * 4;
}

void MemoryImage::load(const std::vector<sc_uint<32> >& image, sc_uint<32> base) {
    if (image.empty()) return;
    if (base.range(1, 0) != 0 || !in_range(base, (unsigned)image.size() * 4)) {
        std::ostringstream msg;
        msg << "image of " << image.size() << " words at 0x" << std::hex << base.to_uint()
            << " does not fit in " << std::dec << mem.size() << " words";
        SC_REPORT_ERROR(MEDRV_MSG_MEMORY, msg.str().c_str());
        return;
    }
    unsigned index = base.to_uint() >> 2;
    for (size_t i = 0; i < image.size(); ++i) mem[index + i] = image[i];
}

sc_uint<32> MemoryImage::peek(sc_uint<32> addr) const {
    if (!in_range(addr, 4)) {
        SC_REPORT_ERROR(MEDRV_MSG_MEMORY, "peek outside memory");
        return 0;
    }
    return mem[addr.to_uint() >> 2];
}

void MemoryImage::poke(sc_uint<32> addr, sc_uint<32> value) {
    if (!in_range(addr, 4)) {
        SC_REPORT_ERROR(MEDRV_MSG_MEMORY, "poke outside memory");
        return;
    }
    mem[addr.to_uint() >> 2] = value;
}
