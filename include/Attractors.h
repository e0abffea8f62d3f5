#pragma once

// Attractors.h
//
// Attractor Geometry Provider. Pure function of (kind, t); safe to call from
// any thread for any t.

#include "EmergenceMath.h"

namespace cee {

enum class AttractorKind : int {
    YangSpiral     = 0,
    YinVortex      = 1,
    BalancePoint   = 2,
    ChaoticStrange = 3, // center orbits with simulation time
};

constexpr int kAttractorKindCount = 4;

const char* attractorKindName(AttractorKind k);

struct AttractorGeometry {
    AttractorKind kind = AttractorKind::BalancePoint;
    Vec3d center{};
    double strength = 0.0;
    // Independent intensities in [0,1]; they do not sum to 1.
    double yang_intensity = 0.0;
    double yin_intensity = 0.0;
};

AttractorGeometry attractorGeometry(AttractorKind kind, double t);

} // namespace cee
