#pragma once

// Signature.h
//
// Content-addressed hashing for crystallized output. FNV-1a32 over IEEE-754
// bit patterns: bit-identical input gives an identical signature, and any
// change of a hashed value changes the byte stream being hashed.

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>

#include "EmergenceMath.h"

namespace cee {

static inline std::uint32_t fnv1a32_begin() { return 2166136261u; }

static inline std::uint32_t fnv1a32_update(std::uint32_t h, const void* data, std::size_t len) {
    const std::uint8_t* p = reinterpret_cast<const std::uint8_t*>(data);
    for (std::size_t i = 0; i < len; ++i) {
        h ^= static_cast<std::uint32_t>(p[i]);
        h *= 16777619u;
    }
    return h;
}

static inline std::uint32_t fnv1a32_add_u32(std::uint32_t h, std::uint32_t v) {
    return fnv1a32_update(h, &v, sizeof(v));
}

static inline std::uint32_t fnv1a32_add_f64(std::uint32_t h, double v) {
    std::uint64_t bits = 0;
    static_assert(sizeof(bits) == sizeof(v), "unexpected double size");
    std::memcpy(&bits, &v, sizeof(v));
    return fnv1a32_update(h, &bits, sizeof(bits));
}

static inline std::uint32_t fnv1a32_text(const std::string& s) {
    return fnv1a32_update(fnv1a32_begin(), s.data(), s.size());
}

static inline std::uint32_t hashVec3(const Vec3d& v) {
    std::uint32_t h = fnv1a32_begin();
    h = fnv1a32_add_f64(h, v.x);
    h = fnv1a32_add_f64(h, v.y);
    h = fnv1a32_add_f64(h, v.z);
    return h;
}

// 8 lowercase hex digits, zero padded.
std::string hex8(std::uint32_t h);

// Jaccard index over the sets of characters present in a and b.
// Two empty strings compare as 0.
double charSetSimilarity(const std::string& a, const std::string& b);

} // namespace cee
