#include "Attractors.h"

#include <cmath>

namespace cee {

const char* attractorKindName(AttractorKind k) {
    switch (k) {
        case AttractorKind::YangSpiral:     return "yang-spiral";
        case AttractorKind::YinVortex:      return "yin-vortex";
        case AttractorKind::BalancePoint:   return "balance-point";
        case AttractorKind::ChaoticStrange: return "chaotic-strange";
    }
    return "unknown";
}

AttractorGeometry attractorGeometry(AttractorKind kind, double t) {
    AttractorGeometry g;
    g.kind = kind;
    switch (kind) {
        case AttractorKind::YangSpiral:
            g.center = v3(10.0, 10.0, 20.0);
            g.strength = 0.05;
            g.yang_intensity = 0.9;
            g.yin_intensity = 0.1;
            break;
        case AttractorKind::YinVortex:
            g.center = v3(-10.0, -10.0, -20.0);
            g.strength = 0.05;
            g.yang_intensity = 0.1;
            g.yin_intensity = 0.9;
            break;
        case AttractorKind::BalancePoint:
            g.center = v3(0.0, 0.0, 0.0);
            g.strength = 0.02;
            g.yang_intensity = 0.5;
            g.yin_intensity = 0.5;
            break;
        case AttractorKind::ChaoticStrange: {
            g.center = v3(5.0 * std::sin(t * 0.1),
                          5.0 * std::cos(t * 0.1),
                          10.0 * std::sin(t * 0.05));
            g.strength = 0.03;
            const double s = std::sin(t * 0.2);
            g.yang_intensity = 0.5 + 0.3 * s;
            g.yin_intensity = 0.5 - 0.3 * s;
            break;
        }
    }
    return g;
}

} // namespace cee
