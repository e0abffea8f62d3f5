#include "Particles.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>

namespace cee {

namespace {

constexpr const char* kParticleTypeNames[kParticleTypeCount] = {
    "vital",
    "conscious",
    "creative",
    "connective",
    "transformative",
};

std::string toLower(std::string v) {
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return v;
}

} // namespace

const char* particleTypeName(ParticleType t) {
    const int i = static_cast<int>(t);
    if (i < 0 || i >= kParticleTypeCount) return "unknown";
    return kParticleTypeNames[i];
}

bool parseParticleType(const std::string& name, ParticleType* out) {
    const std::string n = toLower(name);
    for (int i = 0; i < kParticleTypeCount; ++i) {
        if (n == kParticleTypeNames[i]) {
            if (out) *out = static_cast<ParticleType>(i);
            return true;
        }
    }
    return false;
}

bool validateConcentrations(const InitialConcentrations& conc, std::string* why) {
    for (int i = 0; i < kParticleTypeCount; ++i) {
        const ParticleType t = static_cast<ParticleType>(i);
        const auto it = conc.find(t);
        if (it == conc.end()) {
            if (why) *why = std::string("missing concentration for '") + particleTypeName(t) + "'";
            return false;
        }
        const double c = it->second;
        if (!std::isfinite(c)) {
            if (why) *why = std::string("non-finite concentration for '") + particleTypeName(t) + "'";
            return false;
        }
        if (c < 0.0 || c > 1.0) {
            char buf[128];
            std::snprintf(buf, sizeof(buf), "concentration for '%s' out of [0,1]: %.9g",
                          particleTypeName(t), c);
            if (why) *why = buf;
            return false;
        }
    }
    // Keys outside the enum can only come from a cast; reject them too.
    if (conc.size() != static_cast<std::size_t>(kParticleTypeCount)) {
        if (why) *why = "unknown particle type in concentration map";
        return false;
    }
    return true;
}

InitialConcentrations referenceConcentrations() {
    return InitialConcentrations{
        {ParticleType::Vital, 0.7},
        {ParticleType::Conscious, 0.8},
        {ParticleType::Creative, 0.6},
        {ParticleType::Connective, 0.5},
        {ParticleType::Transformative, 0.4},
    };
}

void ParticleField::seed(const InitialConcentrations& conc, const UniformSource& uniform01) {
    auto noise = [&]() { return (uniform01() - 0.5) * kPositionNoise; };

    for (int i = 0; i < kParticleTypeCount; ++i) {
        const ParticleType t = static_cast<ParticleType>(i);
        const auto it = conc.find(t);
        const double c = (it != conc.end()) ? it->second : 0.0;

        ParticleState& p = particles_[static_cast<std::size_t>(i)];

        // Evaluation order of the draws is fixed explicitly (x, y, z).
        const double nx = noise();
        const double ny = noise();
        const double nz = noise();
        p.position = v3(c + nx, c * 0.5 + ny, c * 0.3 + nz);

        const double vx = (uniform01() - 0.5) * kVelocitySpread;
        const double vy = (uniform01() - 0.5) * kVelocitySpread;
        const double vz = (uniform01() - 0.5) * kVelocitySpread;
        p.velocity = v3(vx, vy, vz);

        for (int k = 0; k < kAttractorKindCount; ++k) {
            p.attractor_influence[static_cast<std::size_t>(k)] = uniform01();
        }

        p.coupling_strength = uniform01() * kCouplingSpan + kCouplingMin;
    }

    for (int i = 0; i < kParticleTypeCount; ++i) {
        for (int j = 0; j < kParticleTypeCount; ++j) {
            matrix_[static_cast<std::size_t>(i)][static_cast<std::size_t>(j)] =
                (i == j) ? uniform01() * kSelfInteractionSpan + kSelfInteractionMin
                         : (uniform01() - 0.5) * kCrossInteractionSpan;
        }
    }
}

SeedState ParticleField::snapshot() const {
    SeedState s{};
    for (int i = 0; i < kParticleTypeCount; ++i) {
        s[static_cast<std::size_t>(i)].position = particles_[static_cast<std::size_t>(i)].position;
        s[static_cast<std::size_t>(i)].velocity = particles_[static_cast<std::size_t>(i)].velocity;
    }
    return s;
}

bool ParticleField::isFinite() const {
    for (const auto& p : particles_) {
        if (!isFiniteVec(p.position) || !isFiniteVec(p.velocity)) return false;
    }
    return true;
}

} // namespace cee
