#include "Crystallizer.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <string>

#include "Signature.h"

namespace cee {

namespace {

struct NameTemplate {
    const char* name;
    const char* base_function;
};

constexpr NameTemplate kHunPool[] = {
    {"Tai Guang (太光)",          "Great Light"},
    {"Shuang Ling (爽靈)",        "Clear Spirit"},
    {"You Jing (幽精)",           "Dark Essence"},
    {"Tong Ming (通明)",          "Penetrating Brightness"},
    {"Zheng Zhong (正中)",        "Upright Center"},
    {"Ling Hui (靈慧)",           "Spiritual Intelligence"},
    {"Tian Chong (天冲)",         "Heaven Rush"},
    {"Mysterious Eighth (玄八)",  "Emergent Mystery"},
    {"Transcendent Ninth (超九)", "Beyond Form"},
};

constexpr NameTemplate kPoPool[] = {
    {"Shi Gou (尸狗)",         "Corpse Dog"},
    {"Fu Shi (伏矢)",          "Hidden Arrow"},
    {"Que Yin (雀陰)",         "Sparrow Yin"},
    {"Tun Zei (吞贼)",         "Swallowing Thief"},
    {"Fei Du (非毒)",          "Non-Poison"},
    {"Chu Hui (除秽)",         "Defilement Remover"},
    {"Shadow Seventh (影七)",  "Emergent Shadow"},
    {"Earth Eighth (地八)",    "Deep Earth"},
};

constexpr int kHunPoolSize = static_cast<int>(sizeof(kHunPool) / sizeof(kHunPool[0]));
constexpr int kPoPoolSize = static_cast<int>(sizeof(kPoPool) / sizeof(kPoPool[0]));

constexpr int kHunMin = 5;
constexpr int kPoMin = 4;
constexpr double kCountSpan = 4.0;

const NameTemplate* poolEntry(EntityClass c, int index) {
    if (index < 0) return nullptr;
    if (c == EntityClass::Hun) {
        return (index < kHunPoolSize) ? &kHunPool[index] : nullptr;
    }
    return (index < kPoPoolSize) ? &kPoPool[index] : nullptr;
}

std::uint32_t influenceSignature(const InfluenceVector& infl) {
    std::uint32_t h = fnv1a32_begin();
    for (double v : infl) h = fnv1a32_add_f64(h, v);
    return h;
}

std::string functionText(EntityClass c, int index, double strength) {
    char pct[32];
    std::snprintf(pct, sizeof(pct), "%.0f", strength * 100.0);
    return entityBaseFunction(c, index) + " (emergent: " + pct +
           (c == EntityClass::Hun ? "% developed)" : "% active)");
}

double influenceOf(const InfluenceVector& infl, ParticleType t) {
    return infl[static_cast<std::size_t>(t)];
}

} // namespace

int hunCountFor(double yang_intensity) {
    const double y = clamp01(yang_intensity);
    return static_cast<int>(std::floor(kHunMin + y * kCountSpan));
}

int poCountFor(double yin_intensity) {
    const double y = clamp01(yin_intensity);
    return static_cast<int>(std::floor(kPoMin + y * kCountSpan));
}

int entityNamePoolSize(EntityClass c) {
    return (c == EntityClass::Hun) ? kHunPoolSize : kPoPoolSize;
}

std::string entityName(EntityClass c, int index) {
    if (const NameTemplate* e = poolEntry(c, index)) return e->name;
    return std::string(c == EntityClass::Hun ? "Emergent Hun " : "Emergent Po ") +
           std::to_string(index + 1);
}

std::string entityBaseFunction(EntityClass c, int index) {
    if (const NameTemplate* e = poolEntry(c, index)) return e->base_function;
    return "Unnamed Emergence";
}

AttractorGeometry analyzeAttractor(const ParticleField& field, double order_parameter) {
    const int n = ParticleField::size();

    Vec3d center{};
    for (int i = 0; i < n; ++i) {
        center = add(center, field.at(i).position);
    }
    center = v3(center.x / n, center.y / n, center.z / n);

    double yang = 0.0;
    double yin = 0.0;
    for (int i = 0; i < n; ++i) {
        const ParticleState& p = field.at(i);
        const double speed = magnitude(p.velocity);

        // Yang: height and expansion. Yin: depth and stillness.
        const double upward = std::max(0.0, p.position.z / 10.0);
        const double expansive = speed / 5.0;
        yang += (upward + expansive) / 2.0;

        const double downward = std::max(0.0, -p.position.z / 10.0);
        const double contractive = 1.0 / (speed + 1.0);
        yin += (downward + contractive) / 2.0;
    }
    yang /= n;
    yin /= n;

    AttractorKind dominant = AttractorKind::BalancePoint;
    double max_influence = 0.0;
    for (int i = 0; i < n; ++i) {
        const ParticleState& p = field.at(i);
        for (int k = 0; k < kAttractorKindCount; ++k) {
            const double w = p.attractor_influence[static_cast<std::size_t>(k)];
            if (w > max_influence) {
                max_influence = w;
                dominant = static_cast<AttractorKind>(k);
            }
        }
    }

    AttractorGeometry g;
    g.kind = dominant;
    g.center = center;
    g.strength = order_parameter;
    g.yang_intensity = clamp01(yang);
    g.yin_intensity = clamp01(yin);
    return g;
}

InfluenceVector particleInfluence(int entity_index, const SeedState& seed) {
    InfluenceVector out{};
    const std::string index_hash = hex8(fnv1a32_text(std::to_string(entity_index)));

    for (int i = 0; i < kParticleTypeCount; ++i) {
        const SeedParticle& s = seed[static_cast<std::size_t>(i)];
        const std::string particle_hash = hex8(hashVec3(s.position));
        const double similarity = charSetSimilarity(index_hash, particle_hash);
        const double influence = similarity * similarity * magnitude(s.velocity);
        out[static_cast<std::size_t>(i)] = squash(influence);
    }
    return out;
}

std::uint32_t seedSignature(const SeedState& seed) {
    std::uint32_t h = fnv1a32_begin();
    for (const SeedParticle& s : seed) {
        h = fnv1a32_add_u32(h, hashVec3(s.position));
        h = fnv1a32_add_u32(h, hashVec3(s.velocity));
    }
    return h;
}

EmergentEntity makeHunEntity(int index, const InfluenceVector& infl,
                             double yang_intensity, double entropy) {
    const double conscious = influenceOf(infl, ParticleType::Conscious);
    const double transformative = influenceOf(infl, ParticleType::Transformative);
    const double yang = clamp01(yang_intensity);
    const double ent = clamp01(entropy);

    EmergentEntity e;
    e.entity_class = EntityClass::Hun;
    e.index = index;
    e.strength = squash(conscious * 2.0 + transformative * 1.5);
    e.purity = squash(yang * 2.0 + (1.0 - ent));
    e.connection = squash(transformative * 2.0 + yang * 1.5);
    e.signature = hex8(influenceSignature(infl));
    e.id = "hun-" + std::to_string(index) + "-" + e.signature;
    e.name = entityName(EntityClass::Hun, index);
    e.function_description = functionText(EntityClass::Hun, index, e.strength);
    return e;
}

EmergentEntity makePoEntity(int index, const InfluenceVector& infl,
                            double yin_intensity, double entropy) {
    const double vital = influenceOf(infl, ParticleType::Vital);
    const double connective = influenceOf(infl, ParticleType::Connective);
    const double yin = clamp01(yin_intensity);
    const double ent = clamp01(entropy);

    EmergentEntity e;
    e.entity_class = EntityClass::Po;
    e.index = index;
    e.strength = squash(vital * 2.0 + connective * 1.5);
    e.viscosity = squash(yin * 2.0 + ent);
    e.connection = squash(vital * 2.0 + yin * 1.5);
    e.signature = hex8(influenceSignature(infl));
    e.id = "po-" + std::to_string(index) + "-" + e.signature;
    e.name = entityName(EntityClass::Po, index);
    e.function_description = functionText(EntityClass::Po, index, e.strength);
    return e;
}

EmergentConfiguration crystallize(const ParticleField& field,
                                  const SystemMetrics& metrics,
                                  const TransitionState& transition) {
    EmergentConfiguration out;
    out.seed_state = field.snapshot();
    out.birth_attractor = analyzeAttractor(field, metrics.order_parameter);
    out.signature_u32 = seedSignature(out.seed_state);
    out.signature = hex8(out.signature_u32);
    out.forced = transition.forced;
    out.crystallized_at_t = transition.crystallized_at_t;
    out.steps = transition.crystallized_at_step;

    const int num_hun = hunCountFor(out.birth_attractor.yang_intensity);
    const int num_po = poCountFor(out.birth_attractor.yin_intensity);

    out.hun.reserve(static_cast<std::size_t>(num_hun));
    for (int i = 0; i < num_hun; ++i) {
        const InfluenceVector infl = particleInfluence(i, out.seed_state);
        out.hun.push_back(makeHunEntity(i, infl, out.birth_attractor.yang_intensity, metrics.entropy));
    }

    out.po.reserve(static_cast<std::size_t>(num_po));
    for (int i = 0; i < num_po; ++i) {
        const InfluenceVector infl = particleInfluence(i, out.seed_state);
        out.po.push_back(makePoEntity(i, infl, out.birth_attractor.yin_intensity, metrics.entropy));
    }

    return out;
}

} // namespace cee
