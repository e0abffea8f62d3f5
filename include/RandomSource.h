#pragma once

// RandomSource.h
//
// Explicit, per-run pseudorandom source. Every draw made while seeding a run
// goes through a UniformSource, so a fixed seed reproduces a run bit-for-bit
// and independent runs never share generator state.

#include <cstdint>
#include <functional>

namespace cee {

// Any callable returning values in [0,1).
using UniformSource = std::function<double()>;

class Xorshift32 {
public:
    // 0 is a fixed point of xorshift; it is remapped to a fixed constant.
    static constexpr std::uint32_t kZeroSeedFallback = 0xC0FFEE01u;

    explicit Xorshift32(std::uint32_t seed) : state_(seed != 0u ? seed : kZeroSeedFallback) {}

    std::uint32_t nextU32() {
        state_ ^= (state_ << 13);
        state_ ^= (state_ >> 17);
        state_ ^= (state_ << 5);
        return state_;
    }

    // [0,1)
    double nextU01() {
        return static_cast<double>(nextU32()) / 4294967296.0; // 2^32
    }

    std::uint32_t state() const { return state_; }

    // Adapter for APIs taking a UniformSource. The returned callable refers to
    // *this and must not outlive it.
    UniformSource asSource() {
        return [this]() { return nextU01(); };
    }

private:
    std::uint32_t state_;
};

// Non-deterministic seed for callers that explicitly want unrepeatable runs.
std::uint32_t entropySeed();

} // namespace cee
