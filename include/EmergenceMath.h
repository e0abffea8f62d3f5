#pragma once

// EmergenceMath.h
//
// 3-D phase-space primitives shared by the integrator, metrics and crystallizer.
// Plain POD + free inline functions; no allocation, no hidden state.

#include <algorithm>
#include <cmath>

namespace cee {

struct Vec3d {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;
};

static inline Vec3d v3(double x, double y, double z) { return Vec3d{x, y, z}; }

static inline Vec3d add(const Vec3d& a, const Vec3d& b) { return v3(a.x + b.x, a.y + b.y, a.z + b.z); }
static inline Vec3d sub(const Vec3d& a, const Vec3d& b) { return v3(a.x - b.x, a.y - b.y, a.z - b.z); }
static inline Vec3d mul(const Vec3d& a, double s)       { return v3(a.x * s,   a.y * s,   a.z * s); }

static inline double dot(const Vec3d& a, const Vec3d& b) { return a.x * b.x + a.y * b.y + a.z * b.z; }

static inline double magnitude(const Vec3d& v) {
    return std::sqrt(v.x * v.x + v.y * v.y + v.z * v.z);
}

static inline double distance(const Vec3d& a, const Vec3d& b) {
    const double dx = a.x - b.x;
    const double dy = a.y - b.y;
    const double dz = a.z - b.z;
    return std::sqrt(dx * dx + dy * dy + dz * dz);
}

static inline bool isFiniteVec(const Vec3d& v) {
    return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
}

// Non-finite input maps to 0 so downstream bounds hold.
static inline double clamp01(double x) {
    if (!std::isfinite(x)) return 0.0;
    return std::clamp(x, 0.0, 1.0);
}

// Bounded squashing used for every derived attribute: maps R to [-1,1]
// (tanh rounds to +-1 in double for |x| > ~19). Non-finite input maps to 0.
static inline double squash(double x) {
    if (!std::isfinite(x)) return 0.0;
    return std::tanh(x);
}

} // namespace cee
