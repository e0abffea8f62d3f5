#pragma once

// Crystallizer.h
//
// Turns the final particle field into a named, scored, signed configuration.
// Entity counts depend only on the yang/yin intensities at crystallization,
// never on iteration count or wall-clock time.

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "Attractors.h"
#include "Particles.h"

namespace cee {

struct SystemMetrics {
    double entropy = 0.0;             // [0,1]
    double order_parameter = 0.0;     // Kuramoto |<e^{i phi}>|, [0,1]
    // Divergence proxy squashed to [-1,1] (tanh saturates in double);
    // >0 reads "more chaotic".
    // Not a Lyapunov exponent.
    double chaos_estimate = 0.0;
    double correlation_length = 0.0;  // 10 * order_parameter
};

struct TransitionState {
    double critical_threshold = 0.3;
    bool has_crystallized = false;    // one-way latch
    bool forced = false;              // latched by the iteration ceiling, not by dwell
    double dwell_time = 0.0;
    double crystallized_at_t = 0.0;
    std::uint64_t crystallized_at_step = 0;
};

enum class EntityClass : int {
    Hun = 0,
    Po  = 1,
};

struct EmergentEntity {
    EntityClass entity_class = EntityClass::Hun;
    int index = 0;
    std::string id;
    std::string name;
    std::string function_description;

    // All attributes are squash() of non-negative sums, so in [0,1).
    double strength = 0.0;
    double purity = 0.0;      // Hun only
    double viscosity = 0.0;   // Po only
    double connection = 0.0;  // heavenly (Hun) or earthly (Po)

    std::string signature;
};

struct EmergentConfiguration {
    std::vector<EmergentEntity> hun; // 5..9
    std::vector<EmergentEntity> po;  // 4..8

    std::uint32_t signature_u32 = 0;
    std::string signature;           // hex8(signature_u32)

    AttractorGeometry birth_attractor{};
    SeedState seed_state{};

    bool forced = false;
    double crystallized_at_t = 0.0;
    std::uint64_t steps = 0;
};

// Particle influence for one entity index, indexed by ParticleType.
using InfluenceVector = std::array<double, kParticleTypeCount>;

// Count derivation; intensity is clamped to [0,1] first.
int hunCountFor(double yang_intensity);
int poCountFor(double yin_intensity);

// Centroid, yang/yin statistics and dominant kind over the whole field.
// Dominant kind: highest single affinity across all particles; ties keep the
// first encountered (particles in type order, kinds in enum order), and an
// all-zero field reports BalancePoint.
AttractorGeometry analyzeAttractor(const ParticleField& field, double order_parameter);

InfluenceVector particleInfluence(int entity_index, const SeedState& seed);

std::uint32_t seedSignature(const SeedState& seed);

// Pool name for index i, or a synthesized placeholder past the pool.
std::string entityName(EntityClass c, int index);
std::string entityBaseFunction(EntityClass c, int index);
int entityNamePoolSize(EntityClass c);

EmergentEntity makeHunEntity(int index, const InfluenceVector& infl,
                             double yang_intensity, double entropy);
EmergentEntity makePoEntity(int index, const InfluenceVector& infl,
                            double yin_intensity, double entropy);

EmergentConfiguration crystallize(const ParticleField& field,
                                  const SystemMetrics& metrics,
                                  const TransitionState& transition);

} // namespace cee
