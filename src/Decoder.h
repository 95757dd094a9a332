// Table driven RV32IMFD + medical extension decoder
#ifndef MEDRV_DECODER_H
#define MEDRV_DECODER_H

#include <systemc.h>

#include "MedRvTypes.h"

// major opcodes
enum rv_opcode {
    OPC_LOAD     = 0x03,
    OPC_LOAD_FP  = 0x07,
    OPC_MATRIX   = 0x0B,    // custom-0
    OPC_MISC_MEM = 0x0F,
    OPC_OP_IMM   = 0x13,
    OPC_AUIPC    = 0x17,
    OPC_STORE    = 0x23,
    OPC_STORE_FP = 0x27,
    OPC_MAC      = 0x2B,    // custom-1
    OPC_AMO      = 0x2F,
    OPC_OP       = 0x33,
    OPC_LUI      = 0x37,
    OPC_OP_FP    = 0x53,
    OPC_OP_V     = 0x57,
    OPC_POOL     = 0x5B,    // custom-2
    OPC_BRANCH   = 0x63,
    OPC_JALR     = 0x67,
    OPC_JAL      = 0x6F,
    OPC_SYSTEM   = 0x73,
    OPC_DMA      = 0x7B     // custom-3
};

// sub_op values of the custom classes
enum matrix_funct3 { MATRIX_MMUL = 0, MATRIX_DOT = 1 };
enum mac_funct3    { MAC_ACC = 0, MAC_CLEAR_ACC = 1, MAC_READ = 2, MAC_ACT = 4 };
enum dma_funct3    { DMA_CHANNEL_READ = 2, DMA_CHANNEL_WRITE = 3 };

struct decode_entry {
    const char*    mnemonic;
    uint32_t       match;
    uint32_t       mask;
    inst_class     iclass;
    imm_format     format;
    ControlSignals ctrl;
};

sc_int<32> decode_immediate(sc_uint<32> word, imm_format format);

// Unknown words decode to a no-op (entry -1, no register write)
DecodedInstruction decode_instruction(sc_uint<32> word);

ControlSignals control_for(const DecodedInstruction& inst);

const char* mnemonic_of(const DecodedInstruction& inst);

#endif
