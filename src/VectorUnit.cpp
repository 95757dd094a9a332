#include "VectorUnit.h"

bool vector_compute(unsigned funct6, const vreg& vs2, const vreg& operand, vreg& vd) {
    for (unsigned i = 0; i < MEDRV_VLEN; ++i) {
        uint32_t a = vs2.lane[i].to_uint();
        uint32_t b = operand.lane[i].to_uint();
        switch (funct6) {
            case VOP_ADD: vd.lane[i] = a + b; break;
            case VOP_SUB: vd.lane[i] = a - b; break;
            case VOP_AND: vd.lane[i] = a & b; break;
            case VOP_OR:  vd.lane[i] = a | b; break;
            case VOP_MUL: vd.lane[i] = (uint32_t)((int64_t)(int32_t)a * (int64_t)(int32_t)b); break;
            default:      return false;
        }
    }
    return true;
}
