// Flat word memory shared by instruction fetch and data access
#ifndef MEDRV_MEMORY_IMAGE_H
#define MEDRV_MEMORY_IMAGE_H

#include <systemc.h>
#include <vector>

struct imem_response {
    sc_uint<32> instruction;
    bool        ready;

    imem_response() : instruction(0), ready(false) {}
};

struct dmem_request {
    sc_uint<32> addr;           // byte address, word aligned
    sc_uint<32> wdata;          // lane positioned write data
    sc_uint<4>  byte_enable;
    bool        we;
    bool        req;

    dmem_request() : addr(0), wdata(0), byte_enable(0), we(false), req(false) {}
};

struct dmem_response {
    sc_uint<32> rdata;
    bool        ready;

    dmem_response() : rdata(0), ready(false) {}
};

class imem_if : virtual public sc_interface {
public:
    // not ready means the fetch stage substitutes a NOP
    virtual imem_response fetch(sc_uint<32> addr) = 0;
};

class dmem_if : virtual public sc_interface {
public:
    // out of range or no request: ready = false and memory untouched
    virtual dmem_response access(const dmem_request& request) = 0;
    virtual bool in_range(sc_uint<32> addr, unsigned bytes) const = 0;
};

// Whole-word helpers used by the custom units
bool dmem_read_word(dmem_if& mem, sc_uint<32> addr, sc_uint<32>& value);
bool dmem_write_word(dmem_if& mem, sc_uint<32> addr, sc_uint<32> value);

class MemoryImage : public sc_module, public imem_if, public dmem_if {
public:
    MemoryImage(sc_module_name name, unsigned words);

    imem_response fetch(sc_uint<32> addr);
    dmem_response access(const dmem_request& request);
    bool in_range(sc_uint<32> addr, unsigned bytes) const;

    // host side preload and inspection
    void load(const std::vector<sc_uint<32> >& image, sc_uint<32> base);
    sc_uint<32> peek(sc_uint<32> addr) const;
    void poke(sc_uint<32> addr, sc_uint<32> value);
    unsigned size_words() const { return (unsigned)mem.size(); }

private:
    std::vector<sc_uint<32> > mem;
};

#endif
