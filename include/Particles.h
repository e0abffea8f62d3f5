#pragma once

// Particles.h
//
// Particle State Store: one particle per ParticleType in a 3-D phase space,
// plus the per-run interaction matrix. Owned exclusively by a single run.

#include <array>
#include <cstdint>
#include <map>
#include <string>

#include "Attractors.h"
#include "EmergenceMath.h"
#include "RandomSource.h"

namespace cee {

enum class ParticleType : int {
    Vital          = 0,
    Conscious      = 1,
    Creative       = 2,
    Connective     = 3,
    Transformative = 4,
};

constexpr int kParticleTypeCount = 5;

const char* particleTypeName(ParticleType t);

// Case-insensitive; returns false for unknown names.
bool parseParticleType(const std::string& name, ParticleType* out);

using InitialConcentrations = std::map<ParticleType, double>;

// Every particle type must be present with a finite value in [0,1].
// On failure *why (if non-null) names the offending entry.
bool validateConcentrations(const InitialConcentrations& conc, std::string* why);

// vital 0.7, conscious 0.8, creative 0.6, connective 0.5, transformative 0.4
InitialConcentrations referenceConcentrations();

struct ParticleState {
    Vec3d position{};
    Vec3d velocity{};
    // Per-attractor pull weight in [0,1); independent draws, not normalized.
    std::array<double, kAttractorKindCount> attractor_influence{{0.0, 0.0, 0.0, 0.0}};
    // [0.3, 0.8]
    double coupling_strength = 0.3;
};

// Position/velocity pair captured at crystallization.
struct SeedParticle {
    Vec3d position{};
    Vec3d velocity{};
};

using SeedState = std::array<SeedParticle, kParticleTypeCount>;
using InteractionMatrix = std::array<std::array<double, kParticleTypeCount>, kParticleTypeCount>;

class ParticleField {
public:
    // Seeding magnitudes (per axis).
    static constexpr double kPositionNoise = 0.001;   // (u - 0.5) * 0.001 -> +-0.0005
    static constexpr double kVelocitySpread = 0.1;    // (u - 0.5) * 0.1   -> +-0.05
    static constexpr double kCouplingMin = 0.3;
    static constexpr double kCouplingSpan = 0.5;
    static constexpr double kSelfInteractionMin = 0.2;
    static constexpr double kSelfInteractionSpan = 0.8;
    static constexpr double kCrossInteractionSpan = 0.3;

    ParticleField() = default;

    // Caller validates first (validateConcentrations). Draw order:
    // per particle in type order: position noise x,y,z; velocity x,y,z;
    // 4 affinities in AttractorKind order; coupling. Then the matrix, row-major.
    void seed(const InitialConcentrations& conc, const UniformSource& uniform01);

    ParticleState& particle(ParticleType t) { return particles_[static_cast<std::size_t>(t)]; }
    const ParticleState& particle(ParticleType t) const { return particles_[static_cast<std::size_t>(t)]; }

    ParticleState& at(int i) { return particles_[static_cast<std::size_t>(i)]; }
    const ParticleState& at(int i) const { return particles_[static_cast<std::size_t>(i)]; }

    // interaction(i, j): how strongly particle j drives particle i.
    double interaction(int i, int j) const {
        return matrix_[static_cast<std::size_t>(i)][static_cast<std::size_t>(j)];
    }

    SeedState snapshot() const;

    bool isFinite() const;

    static constexpr int size() { return kParticleTypeCount; }

private:
    std::array<ParticleState, kParticleTypeCount> particles_{};
    InteractionMatrix matrix_{};
};

} // namespace cee
