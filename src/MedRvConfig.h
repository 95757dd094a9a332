// Architectural constants and simulation configuration
#ifndef MEDRV_CONFIG_H
#define MEDRV_CONFIG_H

#include <systemc.h>

static const unsigned MEDRV_XLEN             = 32;
static const unsigned MEDRV_NUM_REGS         = 32;
static const unsigned MEDRV_VLEN             = 4;     // lanes per vector register
static const unsigned MEDRV_DMA_CHANNEL_WORDS = 256;
static const unsigned MEDRV_MATRIX_MAX_DIM   = 16;
static const unsigned MEDRV_POOL_MAX_DIM     = 64;
static const unsigned MEDRV_DOT_MAX_LENGTH   = 4096;

static const unsigned MEDRV_NOP = 0x00000013;   // addi x0, x0, 0

static const char* const MEDRV_MSG_CORE   = "/medrv/core";
static const char* const MEDRV_MSG_MEMORY = "/medrv/memory";
static const char* const MEDRV_MSG_SIM    = "/medrv/sim";

struct SimConfig {
    unsigned    memory_words;
    sc_uint<32> reset_pc;
    unsigned    max_cycles;     // watchdog for run()
    unsigned    mac_latency;
    sc_time     clock_period;
    bool        trace_retire;

    SimConfig()
        : memory_words(16384), reset_pc(0), max_cycles(100000),
          mac_latency(2), clock_period(10, SC_NS), trace_retire(false) {}
};

#endif
