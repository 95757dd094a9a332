// Common FSM for the multi-cycle custom units owned by the MEM stage.
//
// A unit is started on one clock edge, advanced by tick() on every edge
// after that, and reports done() once its cycle budget is spent. The cycle
// budget is fixed at start so the pipeline can see the final tick coming
// through finishing(). A rejected start still takes one tick and leaves
// valid() false.
#ifndef MEDRV_MULTI_CYCLE_UNIT_H
#define MEDRV_MULTI_CYCLE_UNIT_H

enum unit_state {
    UNIT_IDLE = 0,
    UNIT_COMPUTE,
    UNIT_DONE
};

class MultiCycleUnit {
public:
    MultiCycleUnit() : state(UNIT_IDLE), cycles_left(0), result_ok(false) {}
    virtual ~MultiCycleUnit() {}

    void tick() {
        if (state != UNIT_COMPUTE) return;
        if (result_ok) compute_step();
        if (--cycles_left == 0) state = UNIT_DONE;
    }

    unit_state current_state() const { return state; }
    bool busy() const { return state == UNIT_COMPUTE; }
    bool finishing() const { return state == UNIT_COMPUTE && cycles_left == 1; }
    bool done() const { return state == UNIT_DONE; }
    bool valid() const { return result_ok; }

    // result consumed, back to idle
    void acknowledge() { state = UNIT_IDLE; }

    virtual void reset() {
        state = UNIT_IDLE;
        cycles_left = 0;
        result_ok = false;
    }

protected:
    void begin(unsigned cycles) {
        state = UNIT_COMPUTE;
        cycles_left = cycles ? cycles : 1;
        result_ok = true;
    }

    void reject() {
        state = UNIT_COMPUTE;
        cycles_left = 1;
        result_ok = false;
    }

    virtual void compute_step() = 0;

private:
    unit_state state;
    unsigned   cycles_left;
    bool       result_ok;
};

#endif
