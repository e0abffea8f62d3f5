#include <algorithm>
#include <atomic>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "Crystallizer.h"
#include "EmergenceEngine.h"
#include "EmergenceSurvey.h"
#include "SensitivityAnalysis.h"
#include "Signature.h"

namespace {

// Always-on requirement: never compiled out in Release.
#define REQUIRE(cond, msg)                                                      \
    do {                                                                        \
        if (!(cond)) {                                                          \
            std::cerr << "[FAIL] " << __FILE__ << ":" << __LINE__ << " " << msg \
                      << "\n";                                                  \
            std::exit(1);                                                       \
        }                                                                       \
    } while (0)

static inline void REQUIRE_FINITE(double x, const char* name) {
    if (!std::isfinite(x)) {
        std::cerr << "[FAIL] Non-finite: " << name << " = " << x << "\n";
        std::exit(1);
    }
}

static inline double absd(double x) { return x < 0 ? -x : x; }

// Reference scenario: seed 1337 with the reference concentrations.
constexpr std::uint32_t kGoldenSeed = 1337u;
const char* const kGoldenSignature = "51968a43";
constexpr std::uint64_t kGoldenSteps = 916;
constexpr int kGoldenHun = 9;
constexpr int kGoldenPo = 4;

struct CapturedLog {
    std::vector<std::string> info;
    std::vector<std::string> warn;
    std::vector<std::string> error;
};

static cee::LogSink captureInto(CapturedLog& log) {
    return [&log](cee::LogLevel level, const std::string& msg) {
        switch (level) {
            case cee::LogLevel::Info:  log.info.push_back(msg); break;
            case cee::LogLevel::Warn:  log.warn.push_back(msg); break;
            case cee::LogLevel::Error: log.error.push_back(msg); break;
        }
    };
}

static void quietSink(cee::LogLevel, const std::string&) {}

static bool contains(const std::string& hay, const std::string& needle) {
    return hay.find(needle) != std::string::npos;
}

static std::string readFile(const std::string& path) {
    std::ifstream in(path);
    std::string all;
    std::string line;
    while (std::getline(in, line)) {
        all += line;
        all += '\n';
    }
    return all;
}

static void requireEntityBounds(const cee::EmergentEntity& e) {
    REQUIRE_FINITE(e.strength, "entity.strength");
    REQUIRE_FINITE(e.purity, "entity.purity");
    REQUIRE_FINITE(e.viscosity, "entity.viscosity");
    REQUIRE_FINITE(e.connection, "entity.connection");
    REQUIRE(e.strength >= 0.0 && e.strength < 1.0, "entity strength out of [0,1)");
    REQUIRE(e.purity >= 0.0 && e.purity < 1.0, "entity purity out of [0,1)");
    REQUIRE(e.viscosity >= 0.0 && e.viscosity < 1.0, "entity viscosity out of [0,1)");
    REQUIRE(e.connection >= 0.0 && e.connection < 1.0, "entity connection out of [0,1)");
    REQUIRE(e.signature.size() == 8, "entity signature must be 8 hex digits");
    REQUIRE(!e.name.empty(), "entity name empty");
}

static void requireConfigurationShape(const cee::EmergentConfiguration& c) {
    REQUIRE(c.hun.size() >= 5 && c.hun.size() <= 9, "hun count outside [5,9]");
    REQUIRE(c.po.size() >= 4 && c.po.size() <= 8, "po count outside [4,8]");
    REQUIRE(c.signature.size() == 8, "configuration signature must be 8 hex digits");
    REQUIRE(c.signature == cee::hex8(c.signature_u32), "signature text disagrees with value");
    REQUIRE(c.birth_attractor.yang_intensity >= 0.0 && c.birth_attractor.yang_intensity <= 1.0,
            "yang intensity out of [0,1]");
    REQUIRE(c.birth_attractor.yin_intensity >= 0.0 && c.birth_attractor.yin_intensity <= 1.0,
            "yin intensity out of [0,1]");
    for (const auto& e : c.hun) {
        REQUIRE(e.entity_class == cee::EntityClass::Hun, "hun list holds a po entity");
        requireEntityBounds(e);
    }
    for (const auto& e : c.po) {
        REQUIRE(e.entity_class == cee::EntityClass::Po, "po list holds a hun entity");
        requireEntityBounds(e);
    }
}

static void runVectorPrimitives_1A() {
    const cee::Vec3d a = cee::v3(1.0, 2.0, 2.0);
    const cee::Vec3d b = cee::v3(4.0, 6.0, 2.0);
    REQUIRE(cee::magnitude(a) == 3.0, "|(1,2,2)| != 3");
    REQUIRE(cee::distance(a, b) == 5.0, "distance((1,2,2),(4,6,2)) != 5");
    REQUIRE(cee::dot(a, b) == 20.0, "dot product mismatch");

    const cee::Vec3d s = cee::add(a, cee::mul(b, -1.0));
    const cee::Vec3d d = cee::sub(a, b);
    REQUIRE(s.x == d.x && s.y == d.y && s.z == d.z, "a + (-1)b != a - b");

    REQUIRE(cee::isFiniteVec(a), "finite vector reported non-finite");
    REQUIRE(!cee::isFiniteVec(cee::v3(0.0, std::nan(""), 0.0)), "NaN vector reported finite");

    REQUIRE(cee::clamp01(-0.5) == 0.0, "clamp01(-0.5)");
    REQUIRE(cee::clamp01(1.5) == 1.0, "clamp01(1.5)");
    REQUIRE(cee::clamp01(std::nan("")) == 0.0, "clamp01(NaN) must be 0");
    REQUIRE(cee::squash(0.0) == 0.0, "squash(0)");
    REQUIRE(cee::squash(std::numeric_limits<double>::infinity()) == 0.0, "squash(inf) must be 0");
    REQUIRE(cee::squash(50.0) <= 1.0, "squash exceeds 1");

    std::cout << "[PASS] 1A vector primitives\n";
}

static void runRandomSourceDeterminism_1B() {
    cee::Xorshift32 r(1u);
    REQUIRE(r.nextU32() == 270369u, "xorshift32(1) draw 0");
    REQUIRE(r.nextU32() == 67634689u, "xorshift32(1) draw 1");
    REQUIRE(r.nextU32() == 2647435461u, "xorshift32(1) draw 2");

    cee::Xorshift32 z(0u);
    REQUIRE(z.state() == cee::Xorshift32::kZeroSeedFallback, "seed 0 not remapped");
    REQUIRE(z.nextU32() == 2596651870u, "xorshift32(0) first draw");

    cee::Xorshift32 a(kGoldenSeed);
    cee::Xorshift32 b(kGoldenSeed);
    cee::UniformSource src = b.asSource();
    for (int i = 0; i < 1000; ++i) {
        const double u = a.nextU01();
        REQUIRE(u >= 0.0 && u < 1.0, "nextU01 out of [0,1)");
        REQUIRE(u == src(), "asSource diverges from nextU01");
    }

    std::cout << "[PASS] 1B deterministic random source\n";
}

static void runSignaturePrimitives_1C() {
    REQUIRE(cee::fnv1a32_text("abc") == 0x1a47e90bu, "FNV-1a32(\"abc\")");
    REQUIRE(cee::fnv1a32_text("") == cee::fnv1a32_begin(), "FNV-1a32 of empty text");
    REQUIRE(cee::hex8(0x1au) == "0000001a", "hex8 zero padding / lowercase");

    REQUIRE(cee::charSetSimilarity("", "") == 0.0, "empty/empty similarity");
    REQUIRE(cee::charSetSimilarity("abc", "cab") == 1.0, "same set similarity");
    REQUIRE(absd(cee::charSetSimilarity("ab", "bc") - 1.0 / 3.0) < 1e-15, "Jaccard(ab,bc)");
    REQUIRE(cee::charSetSimilarity("aaaa", "bbbb") == 0.0, "disjoint similarity");

    // Bit patterns, not rounded text: the smallest change alters the hash.
    const cee::Vec3d v = cee::v3(0.7, 0.35, 0.21);
    cee::Vec3d w = v;
    w.x = std::nextafter(w.x, 1.0);
    REQUIRE(cee::hashVec3(v) != cee::hashVec3(w), "1-ulp change not visible in hashVec3");
    REQUIRE(cee::hashVec3(v) == cee::hashVec3(cee::v3(0.7, 0.35, 0.21)), "hashVec3 not deterministic");

    std::cout << "[PASS] 1C signature primitives\n";
}

static void runConcentrationValidation_2A() {
    CapturedLog log;
    cee::EmergenceEngine e;
    e.setLogSink(captureInto(log));

    cee::InitialConcentrations missing = cee::referenceConcentrations();
    missing.erase(cee::ParticleType::Creative);
    REQUIRE(!e.reset(missing, 1u), "missing type accepted");
    REQUIRE(contains(e.lastError(), "creative"), "error must name the missing type");
    REQUIRE(!e.isReady(), "engine ready after rejected reset");

    cee::InitialConcentrations high = cee::referenceConcentrations();
    high[cee::ParticleType::Vital] = 1.5;
    REQUIRE(!e.reset(high, 1u), "concentration 1.5 accepted");
    REQUIRE(contains(e.lastError(), "vital"), "error must name the out-of-range type");

    cee::InitialConcentrations neg = cee::referenceConcentrations();
    neg[cee::ParticleType::Transformative] = -0.01;
    REQUIRE(!e.reset(neg, 1u), "negative concentration accepted");

    cee::InitialConcentrations nan = cee::referenceConcentrations();
    nan[cee::ParticleType::Connective] = std::nan("");
    REQUIRE(!e.reset(nan, 1u), "NaN concentration accepted");
    REQUIRE(contains(e.lastError(), "connective"), "error must name the NaN type");

    REQUIRE(!e.reset(cee::referenceConcentrations(), cee::UniformSource{}), "empty random source accepted");
    REQUIRE(log.warn.size() == 5, "each rejection logs one WARN");

    // Boundary values are valid.
    cee::InitialConcentrations edges = cee::referenceConcentrations();
    edges[cee::ParticleType::Vital] = 0.0;
    edges[cee::ParticleType::Conscious] = 1.0;
    REQUIRE(e.reset(edges, 1u), "0 and 1 must be accepted");

    // A rejected reset leaves a running engine untouched.
    for (int i = 0; i < 10; ++i) e.step();
    REQUIRE(!e.reset(high, 2u), "invalid reset accepted");
    REQUIRE(e.isReady() && e.stepCount() == 10, "rejected reset touched engine state");

    cee::EmergenceEngine idle;
    idle.setLogSink(quietSink);
    idle.step();
    REQUIRE(idle.stepCount() == 0, "step before reset advanced the engine");
    REQUIRE(idle.runUntilCrystallized() == cee::RunStatus::InvalidInput, "run before reset");

    const cee::RunResult r = cee::runSimulation(high, 1u, cee::EngineConfigV1{}, nullptr, quietSink);
    REQUIRE(r.status == cee::RunStatus::InvalidInput, "runSimulation accepted invalid input");
    REQUIRE(contains(r.error, "vital"), "runSimulation error must name the type");

    cee::ParticleType t;
    REQUIRE(cee::parseParticleType("Transformative", &t) && t == cee::ParticleType::Transformative,
            "parseParticleType is case-insensitive");
    REQUIRE(!cee::parseParticleType("ether", &t), "unknown particle type parsed");

    std::cout << "[PASS] 2A concentration validation\n";
}

static void runEngineConfigContract_2B() {
    CapturedLog log;
    cee::EmergenceEngine e;
    e.setLogSink(captureInto(log));

    const std::uint32_t h0 = e.config().fnv_hash_u32;
    REQUIRE(h0 == cee::hashEngineConfig(cee::EngineConfigV1{}), "default hash mismatch");

    cee::EngineConfigV1 bad;
    bad.dt = 0.0;
    REQUIRE(!e.setConfig(bad), "dt=0 accepted");
    bad = cee::EngineConfigV1{};
    bad.dt = std::nan("");
    REQUIRE(!e.setConfig(bad), "dt=NaN accepted");
    bad = cee::EngineConfigV1{};
    bad.critical_threshold = 0.0;
    REQUIRE(!e.setConfig(bad), "threshold 0 accepted");
    bad = cee::EngineConfigV1{};
    bad.max_iterations = 0;
    REQUIRE(!e.setConfig(bad), "max_iterations 0 accepted");
    bad = cee::EngineConfigV1{};
    bad.telemetry_every_steps = 0;
    REQUIRE(!e.setConfig(bad), "telemetry cadence 0 accepted");
    bad = cee::EngineConfigV1{};
    bad.version_u32 = 2;
    REQUIRE(!e.setConfig(bad), "unknown version accepted");
    REQUIRE(e.config().fnv_hash_u32 == h0 && e.config().dt == 0.01, "rejected config replaced previous");
    REQUIRE(log.warn.size() == 6, "each rejected config logs one WARN");

    cee::EngineConfigV1 c;
    c.rho = 30.0;
    REQUIRE(e.setConfig(c), "valid config rejected");
    REQUIRE(e.config().fnv_hash_u32 != h0, "hash ignores rho");

    char a[2048];
    char b[2048];
    const int na = e.exportConfigText(a, static_cast<int>(sizeof(a)));
    const int nb = e.exportConfigText(b, static_cast<int>(sizeof(b)));
    REQUIRE(na > 0 && na == nb && std::string(a, na) == std::string(b, nb), "export text not deterministic");
    REQUIRE(contains(a, "rho=30"), "export text misses rho");
    REQUIRE(contains(a, "ExportTextHash"), "export text misses its hash");

    char tiny[16];
    const int nt = e.exportConfigText(tiny, static_cast<int>(sizeof(tiny)));
    REQUIRE(nt <= 16 && tiny[sizeof(tiny) - 1] == '\0', "truncated export not NUL terminated");

    std::cout << "[PASS] 2B engine config contract\n";
}

static void runAttractorGeometry_3A() {
    const cee::AttractorGeometry yang = cee::attractorGeometry(cee::AttractorKind::YangSpiral, 123.0);
    REQUIRE(yang.center.x == 10.0 && yang.center.y == 10.0 && yang.center.z == 20.0, "yang center");
    REQUIRE(yang.strength == 0.05 && yang.yang_intensity == 0.9 && yang.yin_intensity == 0.1, "yang basin");

    const cee::AttractorGeometry yin = cee::attractorGeometry(cee::AttractorKind::YinVortex, 0.0);
    REQUIRE(yin.center.z == -20.0 && yin.yin_intensity == 0.9, "yin basin");

    const cee::AttractorGeometry bal = cee::attractorGeometry(cee::AttractorKind::BalancePoint, 5.0);
    REQUIRE(bal.strength == 0.02 && bal.yang_intensity == 0.5 && bal.yin_intensity == 0.5, "balance basin");

    const cee::AttractorGeometry s0 = cee::attractorGeometry(cee::AttractorKind::ChaoticStrange, 0.0);
    REQUIRE(s0.center.x == 0.0 && s0.center.y == 5.0 && s0.center.z == 0.0, "strange center at t=0");
    REQUIRE(s0.yang_intensity == 0.5 && s0.yin_intensity == 0.5, "strange intensities at t=0");

    for (double t = 0.0; t < 200.0; t += 0.37) {
        const cee::AttractorGeometry s = cee::attractorGeometry(cee::AttractorKind::ChaoticStrange, t);
        const cee::AttractorGeometry again = cee::attractorGeometry(cee::AttractorKind::ChaoticStrange, t);
        REQUIRE(s.center.x == again.center.x && s.center.z == again.center.z, "geometry not pure");
        REQUIRE(s.strength == 0.03, "strange strength");
        REQUIRE(absd(s.yang_intensity + s.yin_intensity - 1.0) < 1e-12, "strange intensities do not mirror");
        REQUIRE(s.yang_intensity >= 0.2 - 1e-12 && s.yang_intensity <= 0.8 + 1e-12, "strange yang range");
        REQUIRE(absd(s.center.x) <= 5.0 && absd(s.center.z) <= 10.0, "strange center range");
    }

    std::cout << "[PASS] 3A attractor geometry\n";
}

static void runSeedingLayout_3B() {
    const cee::InitialConcentrations conc = cee::referenceConcentrations();
    cee::Xorshift32 rng(kGoldenSeed);
    cee::ParticleField f;
    f.seed(conc, rng.asSource());

    for (int i = 0; i < cee::kParticleTypeCount; ++i) {
        const cee::ParticleState& p = f.at(i);
        const double c = conc.at(static_cast<cee::ParticleType>(i));
        REQUIRE(absd(p.position.x - c) <= 0.0005 + 1e-12, "position.x not near c");
        REQUIRE(absd(p.position.y - c * 0.5) <= 0.0005 + 1e-12, "position.y not near c/2");
        REQUIRE(absd(p.position.z - c * 0.3) <= 0.0005 + 1e-12, "position.z not near 0.3c");
        REQUIRE(absd(p.velocity.x) <= 0.05 && absd(p.velocity.y) <= 0.05 && absd(p.velocity.z) <= 0.05,
                "initial velocity too large");
        REQUIRE(p.coupling_strength >= 0.3 && p.coupling_strength <= 0.8, "coupling out of [0.3,0.8]");
        for (double w : p.attractor_influence) {
            REQUIRE(w >= 0.0 && w < 1.0, "affinity out of [0,1)");
        }
        for (int j = 0; j < cee::kParticleTypeCount; ++j) {
            const double m = f.interaction(i, j);
            if (i == j) {
                REQUIRE(m >= 0.2 && m <= 1.0, "self interaction out of [0.2,1.0]");
            } else {
                REQUIRE(m >= -0.15 && m <= 0.15, "cross interaction out of [-0.15,0.15]");
            }
        }
    }

    // Exactly 11 draws per particle then 25 for the matrix.
    cee::Xorshift32 counter(kGoldenSeed);
    int draws = 0;
    cee::ParticleField g;
    g.seed(conc, [&]() { ++draws; return counter.nextU01(); });
    REQUIRE(draws == 5 * 11 + 25, "seeding draw count");

    std::cout << "[PASS] 3B particle seeding layout\n";
}

static void runDominantAttractor_3C() {
    cee::ParticleField f;
    REQUIRE(cee::analyzeAttractor(f, 0.0).kind == cee::AttractorKind::BalancePoint,
            "all-zero affinities must report BalancePoint");

    f.at(2).attractor_influence[static_cast<std::size_t>(cee::AttractorKind::YinVortex)] = 0.9;
    REQUIRE(cee::analyzeAttractor(f, 0.0).kind == cee::AttractorKind::YinVortex, "max affinity ignored");

    cee::ParticleField tie;
    tie.at(0).attractor_influence[static_cast<std::size_t>(cee::AttractorKind::YangSpiral)] = 0.5;
    tie.at(1).attractor_influence[static_cast<std::size_t>(cee::AttractorKind::ChaoticStrange)] = 0.5;
    REQUIRE(cee::analyzeAttractor(tie, 0.0).kind == cee::AttractorKind::YangSpiral, "tie must keep first");

    // Resting field at the origin: no height, no speed.
    const cee::AttractorGeometry g = cee::analyzeAttractor(cee::ParticleField{}, 0.42);
    REQUIRE(g.strength == 0.42, "birth strength must be the order parameter");
    REQUIRE(g.yang_intensity == 0.0, "resting yang");
    REQUIRE(g.yin_intensity == 0.5, "resting yin");

    std::cout << "[PASS] 3C dominant attractor + intensities\n";
}

static void runEntityCountsAndAttributes_4A() {
    REQUIRE(cee::hunCountFor(0.0) == 5 && cee::hunCountFor(1.0) == 9, "hun count extremes");
    REQUIRE(cee::poCountFor(0.0) == 4 && cee::poCountFor(1.0) == 8, "po count extremes");
    REQUIRE(cee::hunCountFor(0.999) == 8 && cee::poCountFor(0.25) == 5, "count floor");
    REQUIRE(cee::hunCountFor(7.0) == 9 && cee::poCountFor(-3.0) == 4, "count clamps intensity");
    REQUIRE(cee::hunCountFor(std::nan("")) == 5, "NaN intensity");

    int prev_h = cee::hunCountFor(0.0);
    int prev_p = cee::poCountFor(0.0);
    for (int i = 1; i <= 1000; ++i) {
        const double x = i / 1000.0;
        const int h = cee::hunCountFor(x);
        const int p = cee::poCountFor(x);
        REQUIRE(h >= prev_h && p >= prev_p, "counts not monotone in intensity");
        REQUIRE(h >= 5 && h <= 9 && p >= 4 && p <= 8, "counts out of range");
        prev_h = h;
        prev_p = p;
    }

    cee::InfluenceVector full{};
    full.fill(1.0);
    cee::InfluenceVector none{};
    for (int i = 0; i < 12; ++i) {
        requireEntityBounds(cee::makeHunEntity(i, full, 1.0, 0.0));
        requireEntityBounds(cee::makeHunEntity(i, none, 0.0, 1.0));
        requireEntityBounds(cee::makePoEntity(i, full, 1.0, 1.0));
        requireEntityBounds(cee::makePoEntity(i, none, 0.0, 0.0));
    }
    const cee::EmergentEntity flat = cee::makeHunEntity(0, none, 0.0, 1.0);
    REQUIRE(flat.strength == 0.0 && flat.purity == 0.0 && flat.connection == 0.0, "zero-input hun");
    const cee::EmergentEntity po = cee::makePoEntity(3, full, 1.0, 1.0);
    REQUIRE(absd(po.strength - std::tanh(3.5)) < 1e-15, "po strength formula");
    REQUIRE(absd(po.viscosity - std::tanh(3.0)) < 1e-15, "po viscosity formula");
    REQUIRE(contains(po.function_description, "% active)"), "po function text");
    REQUIRE(po.id == "po-3-" + po.signature, "po id layout");

    REQUIRE(cee::entityNamePoolSize(cee::EntityClass::Hun) == 9, "hun pool size");
    REQUIRE(cee::entityNamePoolSize(cee::EntityClass::Po) == 8, "po pool size");
    REQUIRE(contains(cee::entityName(cee::EntityClass::Hun, 0), "Tai Guang"), "first hun name");
    REQUIRE(contains(cee::entityName(cee::EntityClass::Po, 7), "Earth Eighth"), "last po name");
    REQUIRE(cee::entityName(cee::EntityClass::Hun, 9) == "Emergent Hun 10", "hun pool overflow name");
    REQUIRE(cee::entityName(cee::EntityClass::Po, 8) == "Emergent Po 9", "po pool overflow name");
    REQUIRE(cee::entityBaseFunction(cee::EntityClass::Po, 8) == "Unnamed Emergence", "overflow function");
    const cee::EmergentEntity extra = cee::makeHunEntity(10, full, 1.0, 0.0);
    REQUIRE(extra.name == "Emergent Hun 11" && contains(extra.function_description, "Unnamed Emergence"),
            "overflow entity text");

    std::cout << "[PASS] 4A entity counts + attribute bounds + name pools\n";
}

static void runSignatureSensitivity_4B() {
    cee::EmergenceEngine e;
    e.setLogSink(quietSink);
    REQUIRE(e.reset(cee::referenceConcentrations(), kGoldenSeed), "reset failed");
    const cee::SeedState base = e.field().snapshot();

    const std::uint32_t s0 = cee::seedSignature(base);
    REQUIRE(s0 == cee::seedSignature(e.field().snapshot()), "signature not deterministic");

    for (int i = 0; i < cee::kParticleTypeCount; ++i) {
        cee::SeedState a = base;
        a[static_cast<std::size_t>(i)].position.z =
            std::nextafter(a[static_cast<std::size_t>(i)].position.z, 10.0);
        REQUIRE(cee::seedSignature(a) != s0, "1-ulp position change kept the signature");

        cee::SeedState b = base;
        b[static_cast<std::size_t>(i)].velocity.y += 1e-12;
        REQUIRE(cee::seedSignature(b) != s0, "tiny velocity change kept the signature");
    }

    // Order of particles matters.
    cee::SeedState swapped = base;
    std::swap(swapped[0], swapped[1]);
    REQUIRE(cee::seedSignature(swapped) != s0, "signature ignores particle order");

    std::cout << "[PASS] 4B signature sensitivity\n";
}

static void runDetectorDwellAndLatch_5A() {
    cee::EngineConfigV1 cfg;
    cfg.telemetry_every_steps = 1;

    cee::EmergenceEngine e;
    e.setLogSink(quietSink);
    REQUIRE(e.setConfig(cfg), "config rejected");
    REQUIRE(e.reset(cee::referenceConcentrations(), kGoldenSeed), "reset failed");

    std::uint32_t events = 0;
    double prev_dwell = 0.0;
    bool saw_reset_or_growth = false;
    double max_chaos = -1.0;
    while (!e.hasCrystallized() && e.stepCount() < cfg.max_iterations) {
        e.step();
        events |= e.getLatestEvents();
        const cee::EngineSnapshot s = e.observe();

        REQUIRE_FINITE(s.metrics.entropy, "entropy");
        REQUIRE_FINITE(s.metrics.order_parameter, "order_parameter");
        REQUIRE_FINITE(s.metrics.chaos_estimate, "chaos_estimate");
        REQUIRE(s.metrics.entropy >= 0.0 && s.metrics.entropy <= 1.0, "entropy out of [0,1]");
        REQUIRE(s.metrics.order_parameter >= 0.0 && s.metrics.order_parameter <= 1.0, "order out of [0,1]");
        REQUIRE(s.metrics.chaos_estimate >= -1.0 && s.metrics.chaos_estimate <= 1.0, "chaos out of [-1,1]");
        max_chaos = std::max(max_chaos, s.metrics.chaos_estimate);
        REQUIRE(s.metrics.correlation_length == s.metrics.order_parameter * 10.0, "correlation length");

        if (s.metrics.order_parameter > cfg.critical_threshold) {
            REQUIRE(absd(s.transition.dwell_time - (prev_dwell + cfg.dt)) < 1e-12, "dwell must grow by dt");
            saw_reset_or_growth = true;
        } else {
            REQUIRE(s.transition.dwell_time == 0.0, "dwell must reset below threshold");
        }
        prev_dwell = s.transition.dwell_time;
        REQUIRE(absd(e.time() - e.stepCount() * cfg.dt) < 1e-9, "time != steps * dt");
    }

    REQUIRE(e.hasCrystallized(), "reference scenario did not crystallize");
    REQUIRE(saw_reset_or_growth, "dwell never accumulated");
    // Divergence grows past ~19 on this run; tanh must saturate, not overflow.
    REQUIRE(max_chaos > 0.999, "chaos estimate never approached saturation");
    REQUIRE(cee::squash(40.0) == 1.0 && cee::squash(-40.0) == -1.0, "squash saturation");
    REQUIRE(cee::squash(1.0e300) == 1.0, "squash overflow");
    REQUIRE(e.observe().transition.dwell_time > cfg.min_dwell_time, "latched before dwell elapsed");
    REQUIRE(e.stepCount() >= 100, "crystallized in fewer steps than the minimum dwell");
    REQUIRE((events & cee::Event_EnterCritical) != 0, "no enter-critical event");
    REQUIRE((events & cee::Event_Crystallized) != 0, "no crystallized event");
    REQUIRE((events & cee::Event_ForcedCrystallization) == 0, "natural crystallization flagged forced");
    REQUIRE(e.getLatestEvents() == 0, "events not cleared on read");

    // Monotonic latch: later steps are no-ops.
    const cee::EngineSnapshot latched = e.observe();
    for (int i = 0; i < 50; ++i) e.step();
    const cee::EngineSnapshot after = e.observe();
    REQUIRE(after.step == latched.step && after.t == latched.t, "step after crystallization advanced");
    REQUIRE(after.transition.has_crystallized, "latch released");
    REQUIRE(after.transition.crystallized_at_step == latched.step, "crystallization step moved");

    // Forcing after a natural latch changes nothing.
    e.forceCrystallization();
    REQUIRE(!e.observe().transition.forced, "forced flag set after natural crystallization");

    std::cout << "[PASS] 5A detector dwell reset + monotonic latch\n";
}

static void runDeterminism_5B() {
    const cee::InitialConcentrations conc = cee::referenceConcentrations();
    const cee::RunResult a = cee::runSimulation(conc, kGoldenSeed, cee::EngineConfigV1{}, nullptr, quietSink);
    const cee::RunResult b = cee::runSimulation(conc, kGoldenSeed, cee::EngineConfigV1{}, nullptr, quietSink);
    REQUIRE(a.status == cee::RunStatus::Crystallized && b.status == cee::RunStatus::Crystallized,
            "reference runs did not crystallize");
    REQUIRE(a.configuration.signature == b.configuration.signature, "same seed, different signature");
    REQUIRE(a.configuration.steps == b.configuration.steps, "same seed, different step count");
    REQUIRE(a.configuration.hun.size() == b.configuration.hun.size(), "same seed, different hun count");
    for (std::size_t i = 0; i < a.configuration.hun.size(); ++i) {
        REQUIRE(a.configuration.hun[i].id == b.configuration.hun[i].id, "same seed, different hun id");
        REQUIRE(a.configuration.hun[i].strength == b.configuration.hun[i].strength, "hun strength drift");
    }

    cee::Xorshift32 rng(kGoldenSeed);
    const cee::RunResult c = cee::runSimulation(conc, rng.asSource(), cee::EngineConfigV1{}, nullptr, quietSink);
    REQUIRE(c.configuration.signature == a.configuration.signature, "injected source differs from seed path");

    // Different seeds, identical concentrations: distinct individuals.
    std::set<std::string> sigs;
    for (std::uint32_t s : {1u, 2u, 3u, 42u, 1337u}) {
        const cee::RunResult r = cee::runSimulation(conc, s, cee::EngineConfigV1{}, nullptr, quietSink);
        requireConfigurationShape(r.configuration);
        sigs.insert(r.configuration.signature);
    }
    REQUIRE(sigs.size() == 5, "distinct seeds collided on signature");

    std::cout << "[PASS] 5B determinism for a fixed seed\n";
}

static void runSelfCouplingOption_5C() {
    const cee::InitialConcentrations conc = cee::referenceConcentrations();
    cee::EngineConfigV1 with_self;
    with_self.include_self_coupling_u32 = 1u;

    const cee::RunResult a = cee::runSimulation(conc, kGoldenSeed, cee::EngineConfigV1{}, nullptr, quietSink);
    const cee::RunResult b = cee::runSimulation(conc, kGoldenSeed, with_self, nullptr, quietSink);
    REQUIRE(b.status != cee::RunStatus::InvalidInput, "self-coupling config rejected");
    requireConfigurationShape(b.configuration);
    REQUIRE(a.configuration.signature != b.configuration.signature, "self-coupling had no effect");

    cee::EngineConfigV1 bad;
    bad.include_self_coupling_u32 = 2u;
    std::string why;
    REQUIRE(!cee::validateEngineConfig(bad, &why), "self-coupling flag must be 0 or 1");

    std::cout << "[PASS] 5C self-coupling option\n";
}

static void runConfigSnapshot_5D() {
    const cee::InitialConcentrations conc = cee::referenceConcentrations();
    cee::EmergenceEngine a;
    cee::EmergenceEngine b;
    a.setLogSink(quietSink);
    b.setLogSink(quietSink);
    REQUIRE(a.reset(conc, kGoldenSeed) && b.reset(conc, kGoldenSeed), "reset failed");

    for (int i = 0; i < 10; ++i) {
        a.step();
        b.step();
    }

    // A new config mid-run must not reach the running integration.
    cee::EngineConfigV1 changed;
    changed.dt = 0.02;
    changed.sigma = 20.0;
    changed.critical_threshold = 0.05;
    changed.min_dwell_time = 0.05;
    REQUIRE(b.setConfig(changed), "changed config rejected");
    REQUIRE(b.config().sigma == 20.0 && b.activeConfig().sigma == 10.0, "pending vs active config");

    for (int i = 0; i < 200; ++i) {
        a.step();
        b.step();
    }
    const cee::EngineSnapshot sa = a.observe();
    const cee::EngineSnapshot sb = b.observe();
    REQUIRE(sa.step == sb.step && sa.t == sb.t, "mid-run config changed the clock");
    REQUIRE(sa.transition.has_crystallized == sb.transition.has_crystallized &&
            sa.transition.dwell_time == sb.transition.dwell_time &&
            sb.transition.critical_threshold == 0.3, "mid-run config changed the detector");
    for (int i = 0; i < cee::ParticleField::size(); ++i) {
        const cee::ParticleState& pa = a.field().at(i);
        const cee::ParticleState& pb = b.field().at(i);
        REQUIRE(pa.position.x == pb.position.x && pa.position.y == pb.position.y &&
                pa.position.z == pb.position.z && pa.velocity.x == pb.velocity.x,
                "mid-run config changed the dynamics");
    }

    REQUIRE(b.reset(conc, kGoldenSeed), "reset failed");
    REQUIRE(b.activeConfig().sigma == 20.0 && b.observe().transition.critical_threshold == 0.05,
            "reset did not pick up the pending config");

    std::cout << "[PASS] 5D config snapshot per run\n";
}

static void runForcedTimeout_6A() {
    CapturedLog log;
    cee::EngineConfigV1 cfg;
    cfg.max_iterations = 50; // dwell needs more than 100 steps

    const cee::RunResult r = cee::runSimulation(cee::referenceConcentrations(), kGoldenSeed, cfg, nullptr,
                                                captureInto(log));
    REQUIRE(r.status == cee::RunStatus::ForcedTimeout, "small iteration ceiling did not time out");
    REQUIRE(r.configuration.forced, "forced flag missing on configuration");
    REQUIRE(r.configuration.steps == 50, "forced configuration step count");
    REQUIRE(r.final_snapshot.transition.has_crystallized, "forced run not latched");
    requireConfigurationShape(r.configuration);
    REQUIRE(log.warn.size() == 1 && contains(log.warn[0], "forcing"), "forced path must log one WARN");

    // Concentrations at the floor still produce a complete configuration.
    cee::InitialConcentrations zeros;
    for (int i = 0; i < cee::kParticleTypeCount; ++i) zeros[static_cast<cee::ParticleType>(i)] = 0.0;
    const cee::RunResult z = cee::runSimulation(zeros, 7u, cfg, nullptr, quietSink);
    REQUIRE(z.status == cee::RunStatus::ForcedTimeout, "all-zero run with small iteration ceiling");
    requireConfigurationShape(z.configuration);

    cee::EmergenceEngine e;
    e.setLogSink(quietSink);
    REQUIRE(e.setConfig(cfg) && e.reset(cee::referenceConcentrations(), 9u), "setup failed");
    REQUIRE(e.runUntilCrystallized() == cee::RunStatus::ForcedTimeout, "engine loop did not time out");
    const std::uint32_t ev = e.getLatestEvents();
    REQUIRE((ev & cee::Event_ForcedCrystallization) && (ev & cee::Event_Crystallized), "forced event bits");
    REQUIRE(e.runUntilCrystallized() == cee::RunStatus::ForcedTimeout, "repeat run changed status");
    REQUIRE(e.stepCount() == 50, "repeat run advanced the engine");

    std::cout << "[PASS] 6A forced timeout\n";
}

static void runCancellation_6B() {
    std::atomic<bool> cancel{true};
    const cee::RunResult r = cee::runSimulation(cee::referenceConcentrations(), kGoldenSeed,
                                                cee::EngineConfigV1{}, &cancel, quietSink);
    REQUIRE(r.status == cee::RunStatus::Cancelled, "pre-set cancel flag ignored");
    REQUIRE(r.final_snapshot.step == 0, "cancelled run advanced");
    REQUIRE(r.configuration.hun.empty() && r.configuration.po.empty(), "cancelled run produced entities");
    REQUIRE(!r.error.empty(), "cancelled run without message");

    std::atomic<bool> keep_going{false};
    const cee::RunResult ok = cee::runSimulation(cee::referenceConcentrations(), kGoldenSeed,
                                                 cee::EngineConfigV1{}, &keep_going, quietSink);
    REQUIRE(ok.status == cee::RunStatus::Crystallized, "clear cancel flag changed the run");

    std::cout << "[PASS] 6B cooperative cancellation\n";
}

static void runNonFiniteWarning_6C() {
    CapturedLog log;
    cee::EngineConfigV1 cfg;
    cfg.sigma = 1.0e300; // overflows within a few steps

    cee::EmergenceEngine e;
    e.setLogSink(captureInto(log));
    REQUIRE(e.setConfig(cfg), "finite sigma rejected");
    REQUIRE(e.reset(cee::referenceConcentrations(), kGoldenSeed), "reset failed");

    std::uint32_t events = 0;
    for (int i = 0; i < 20; ++i) {
        e.step();
        events |= e.getLatestEvents();
        const cee::SystemMetrics m = e.observe().metrics;
        REQUIRE_FINITE(m.entropy, "entropy under overflow");
        REQUIRE_FINITE(m.order_parameter, "order under overflow");
        REQUIRE_FINITE(m.chaos_estimate, "chaos under overflow");
        REQUIRE(m.order_parameter >= 0.0 && m.order_parameter <= 1.0, "order bound under overflow");
    }
    REQUIRE((events & cee::Warn_NonFiniteState) != 0, "non-finite state not flagged");
    REQUIRE(log.warn.size() == 1, "non-finite warning must be logged once");

    cee::ParticleField broken;
    broken.at(0).velocity.x = std::nan("");
    REQUIRE(!e.loadField(broken), "non-finite field loaded");

    std::cout << "[PASS] 6C non-finite state warning\n";
}

static void runLogLevels_6D() {
    CapturedLog log;
    const cee::RunResult r = cee::runSimulation(cee::referenceConcentrations(), kGoldenSeed,
                                                cee::EngineConfigV1{}, nullptr, captureInto(log));
    REQUIRE(r.status == cee::RunStatus::Crystallized, "reference run did not crystallize");
    REQUIRE(log.info.size() == 1 && contains(log.info[0], "crystallized at t=9.16"),
            "natural crystallization must log one INFO");
    REQUIRE(log.warn.empty() && log.error.empty(), "clean run logged WARN/ERROR");

    CapturedLog unready;
    cee::EmergenceEngine e;
    e.setLogSink(captureInto(unready));
    REQUIRE(e.runUntilCrystallized() == cee::RunStatus::InvalidInput, "run without reset accepted");
    REQUIRE(unready.error.size() == 1 && !e.lastError().empty(), "run without reset must log one ERROR");

    REQUIRE(std::string(cee::logLevelTag(cee::LogLevel::Info)) == "INFO" &&
            std::string(cee::logLevelTag(cee::LogLevel::Error)) == "ERROR", "level tags");

    std::cout << "[PASS] 6D log levels\n";
}

static void runTelemetryRingBuffer_7A() {
    cee::EmergenceEngine e;
    e.setLogSink(quietSink);
    REQUIRE(e.reset(cee::referenceConcentrations(), kGoldenSeed), "reset failed");
    REQUIRE(e.runUntilCrystallized() == cee::RunStatus::Crystallized, "reference run");

    std::vector<cee::TelemetrySample> buf(4096);
    const int n = e.getTelemetrySamples(buf.data(), static_cast<int>(buf.size()));
    REQUIRE(n == static_cast<int>(kGoldenSteps / 10 + 1), "sample count = cadence samples + final");
    REQUIRE(buf[static_cast<std::size_t>(n - 1)].crystallized_u32 == 1u, "last sample not crystallized");
    REQUIRE(e.getTelemetrySamples(nullptr, 10) == 0, "null buffer");
    REQUIRE(e.getTelemetrySamples(buf.data(), 3) == 3, "cap not honored");

    // Overflow: never critical, every step sampled.
    cee::EngineConfigV1 cfg;
    cfg.critical_threshold = 1.0;
    cfg.max_iterations = 3000;
    cfg.telemetry_every_steps = 1;
    REQUIRE(e.setConfig(cfg), "config rejected");
    REQUIRE(e.reset(cee::referenceConcentrations(), kGoldenSeed), "reset failed");
    REQUIRE(e.runUntilCrystallized() == cee::RunStatus::ForcedTimeout, "threshold 1.0 must time out");

    const int m = e.getTelemetrySamples(buf.data(), static_cast<int>(buf.size()));
    REQUIRE(m == 2048, "ring buffer capacity");
    for (int i = 1; i < m; ++i) {
        REQUIRE(buf[static_cast<std::size_t>(i)].t >= buf[static_cast<std::size_t>(i - 1)].t,
                "telemetry not oldest-first");
    }
    REQUIRE(buf[static_cast<std::size_t>(m - 1)].crystallized_u32 == 1u, "forced sample missing");

    std::cout << "[PASS] 7A telemetry ring buffer\n";
}

static void runSurvey_8A() {
    cee::EmergenceSurvey::SurveyConfig sc;
    sc.bots = 6;
    sc.threads = 1;
    sc.base_seed = kGoldenSeed;

    cee::EmergenceSurvey serial;
    REQUIRE(serial.setConfig(sc), "survey config rejected");
    REQUIRE(serial.run(), "serial survey failed");

    sc.threads = 3;
    cee::EmergenceSurvey parallel;
    REQUIRE(parallel.setConfig(sc), "survey config rejected");
    REQUIRE(parallel.run(), "parallel survey failed");

    REQUIRE(serial.rows().size() == 6 && parallel.rows().size() == 6, "row count");
    for (std::size_t i = 0; i < serial.rows().size(); ++i) {
        const auto& a = serial.rows()[i];
        const auto& b = parallel.rows()[i];
        REQUIRE(a.index == static_cast<int>(i), "rows out of order");
        REQUIRE(a.seed == cee::EmergenceSurvey::seedForRun(kGoldenSeed, static_cast<int>(i)), "seed schedule");
        REQUIRE(a.signature == b.signature && a.steps == b.steps, "thread count changed results");
        REQUIRE(a.hun_count >= 5 && a.hun_count <= 9 && a.po_count >= 4 && a.po_count <= 8, "row counts");
    }
    REQUIRE(serial.rows()[0].signature == kGoldenSignature, "survey run 0 is the reference run");
    REQUIRE(serial.workersUsed() == 1 && parallel.workersUsed() == 3, "worker count");

    // More threads than runs: the pool is capped and every slot still filled.
    cee::EmergenceSurvey::SurveyConfig wide = sc;
    wide.bots = 2;
    wide.threads = 64;
    cee::EmergenceSurvey oversubscribed;
    REQUIRE(oversubscribed.setConfig(wide) && oversubscribed.run(), "oversubscribed survey failed");
    REQUIRE(oversubscribed.workersUsed() == 2, "pool not capped at the run count");
    REQUIRE(oversubscribed.rows().size() == 2 && oversubscribed.rows()[1].signature == serial.rows()[1].signature,
            "oversubscribed survey changed results");
    REQUIRE(cee::EmergenceSurvey::seedForRun(0xFFFFFFFFu, 1) == 0x9E3779B8u, "seed schedule wraps mod 2^32");

    const auto s = serial.summary();
    REQUIRE(s.runs == 6 && s.crystallized + s.forced == 6, "summary status counts");
    int hist = 0;
    for (const auto& kv : s.hun_count_distribution) hist += kv.second;
    REQUIRE(hist == 6, "hun distribution total");
    REQUIRE(s.unique_signatures >= 1 && s.unique_signatures <= 6, "unique signatures");
    REQUIRE(s.hun_count.ci_lower_95 <= s.hun_count.median && s.hun_count.median <= s.hun_count.ci_upper_95,
            "hun count interval");
    REQUIRE(s.crystallization_time.mean > 0.0, "crystallization time mean");

    const auto st = cee::EmergenceSurvey::summarize({1.0, 2.0, 3.0, 4.0});
    REQUIRE(st.mean == 2.5 && st.median == 2.5, "summarize mean/median");
    REQUIRE(absd(st.std_dev - std::sqrt(1.25)) < 1e-12, "summarize std dev");
    const auto empty = cee::EmergenceSurvey::summarize({});
    REQUIRE(empty.mean == 0.0 && empty.std_dev == 0.0, "summarize empty");

    sc.bots = 0;
    cee::EmergenceSurvey none;
    REQUIRE(!none.setConfig(sc) && !none.lastError().empty(), "zero bots accepted");

    std::atomic<bool> cancel{true};
    sc.bots = 3;
    cee::EmergenceSurvey cancelled;
    REQUIRE(cancelled.setConfig(sc) && cancelled.run(&cancel), "cancelled survey failed to start");
    REQUIRE(cancelled.summary().cancelled == 3, "cancelled runs not reported");

    const std::string csv = "cee_test_survey.csv";
    const std::string md = "cee_test_survey.md";
    REQUIRE(serial.exportRunsCSV(csv), "CSV export failed");
    REQUIRE(serial.writeMarkdownReport(md), "report export failed");
    const std::string csv_text = readFile(csv);
    const std::string md_text = readFile(md);
    REQUIRE(csv_text.rfind("index,seed,status,", 0) == 0, "CSV header");
    REQUIRE(contains(csv_text, kGoldenSignature), "CSV misses the reference signature");
    REQUIRE(contains(md_text, "# Emergence Survey Report"), "report title");
    REQUIRE(contains(md_text, "## Initial Conditions") && contains(md_text, "transformative"),
            "report initial conditions");
    REQUIRE(contains(md_text, "| 5 | "), "report run table");
    std::remove(csv.c_str());
    std::remove(md.c_str());

    REQUIRE(!serial.exportRunsCSV("/nonexistent-cee-dir/runs.csv"), "CSV to missing dir succeeded");
    REQUIRE(!serial.writeMarkdownReport("/nonexistent-cee-dir/report.md"), "report to missing dir succeeded");

    std::cout << "[PASS] 8A survey reproducibility + reports\n";
}

static void runSensitivityAnalyzer_9A() {
    cee::SensitivityAnalyzer analyzer;
    cee::SensitivityAnalyzer::SweepConfig sc;
    sc.seed = kGoldenSeed;
    REQUIRE(analyzer.setConfig(sc), "sweep config rejected");

    cee::SensitivityAnalyzer::ParameterRange range;
    range.nominal = 0.7;
    range.min = 0.5;
    range.max = 0.9;
    range.samples = 3;
    REQUIRE(analyzer.analyzeConcentration(cee::ParticleType::Vital, range), "concentration sweep failed");

    const auto& rows = analyzer.results();
    REQUIRE(rows.size() == 3, "sweep row count");
    REQUIRE(rows[0].parameter_value == 0.5 && rows[2].parameter_value == 0.9, "sweep endpoints");
    REQUIRE(rows[1].parameter_value == 0.7, "sweep midpoint");
    REQUIRE(rows[1].parameter_name == "vital", "sweep parameter name");
    REQUIRE(rows[1].metrics.signature == kGoldenSignature, "sweep midpoint is the reference run");
    for (const auto& row : rows) {
        REQUIRE(row.metrics.status != cee::RunStatus::InvalidInput, "sweep run rejected");
        REQUIRE(row.metrics.hun_count >= 5 && row.metrics.hun_count <= 9, "sweep hun count");
    }

    range.max = 1.2;
    REQUIRE(!analyzer.analyzeConcentration(cee::ParticleType::Vital, range), "sweep beyond 1 accepted");
    REQUIRE(!analyzer.lastError().empty(), "sweep error message");

    REQUIRE(analyzer.analyzeSeedDivergence({1u, 2u, 3u, 42u, 1337u}), "seed divergence failed");
    REQUIRE(analyzer.results().size() == 5, "seed divergence row count");
    REQUIRE(analyzer.distinctSignatures() == 5, "identical concentrations, distinct seeds must diverge");
    REQUIRE(!analyzer.analyzeSeedDivergence({}), "empty seed list accepted");

    const std::string csv = "cee_test_sensitivity.csv";
    REQUIRE(analyzer.analyzeSeedDivergence({1u, 2u}), "seed divergence failed");
    REQUIRE(analyzer.exportSensitivityCSV(csv), "sensitivity CSV failed");
    REQUIRE(readFile(csv).rfind("parameter,value,seed,status,", 0) == 0, "sensitivity CSV header");
    std::remove(csv.c_str());
    REQUIRE(!analyzer.exportSensitivityCSV("/nonexistent-cee-dir/s.csv"), "CSV to missing dir succeeded");

    // Butterfly effect from one shared state: a 1e-9 nudge grows by orders of magnitude.
    cee::EmergenceEngine e;
    e.setLogSink(quietSink);
    REQUIRE(e.reset(cee::referenceConcentrations(), kGoldenSeed), "reset failed");
    const auto rep = analyzer.compareFromPerturbedSeedState(
        e.field(), cee::ParticleType::Vital, cee::SensitivityAnalyzer::StateComponent::PositionX, 1e-9, 2000);
    REQUIRE(rep.valid, "perturbation comparison invalid");
    REQUIRE(rep.initial_separation > 0.0, "perturbation not applied");
    REQUIRE(rep.max_separation > rep.initial_separation * 1.0e3, "perturbation did not grow");
    REQUIRE(rep.signatures_differ, "perturbed state kept the signature");

    const auto same = analyzer.compareFromPerturbedSeedState(
        e.field(), cee::ParticleType::Creative, cee::SensitivityAnalyzer::StateComponent::VelocityZ, 0.0, 200);
    REQUIRE(same.valid && same.max_separation == 0.0 && !same.signatures_differ, "zero nudge diverged");

    std::cout << "[PASS] 9A sensitivity analyzer\n";
}

static void runGoldenScenario_10A() {
    const cee::RunResult r = cee::runSimulation(cee::referenceConcentrations(), kGoldenSeed,
                                                cee::EngineConfigV1{}, nullptr, quietSink);
    REQUIRE(r.status == cee::RunStatus::Crystallized, "golden: status");
    const cee::EmergentConfiguration& c = r.configuration;
    requireConfigurationShape(c);

    if (c.signature != kGoldenSignature || c.steps != kGoldenSteps) {
        std::cerr << "[FAIL] golden: signature=" << c.signature << " steps=" << c.steps
                  << " (expected " << kGoldenSignature << " / " << kGoldenSteps << ")\n";
        std::exit(1);
    }
    REQUIRE(static_cast<int>(c.hun.size()) == kGoldenHun, "golden: hun count");
    REQUIRE(static_cast<int>(c.po.size()) == kGoldenPo, "golden: po count");
    REQUIRE(absd(c.crystallized_at_t - 9.16) < 1e-9, "golden: crystallization time");
    REQUIRE(c.hun[0].id == "hun-0-0f913542", "golden: first hun id");
    REQUIRE(c.hun[1].id == "hun-1-32e57a4b", "golden: second hun id");
    REQUIRE(c.po[0].signature == c.hun[0].signature, "po/hun of one index share the influence signature");
    REQUIRE(!c.forced, "golden: not forced");

    std::cout << "[PASS] 10A golden scenario (seed " << kGoldenSeed << ")\n";
}

} // namespace

int main() {
    // Canary: prove the test fails in Release when checks are active.
    if (std::getenv("CEE_CANARY_NAN")) {
        REQUIRE_FINITE(std::nan(""), "CANARY_NAN");
        return 0; // unreachable
    }

    runVectorPrimitives_1A();
    runRandomSourceDeterminism_1B();
    runSignaturePrimitives_1C();

    runConcentrationValidation_2A();
    runEngineConfigContract_2B();

    runAttractorGeometry_3A();
    runSeedingLayout_3B();
    runDominantAttractor_3C();

    runEntityCountsAndAttributes_4A();
    runSignatureSensitivity_4B();

    runDetectorDwellAndLatch_5A();
    runDeterminism_5B();
    runSelfCouplingOption_5C();
    runConfigSnapshot_5D();

    runForcedTimeout_6A();
    runCancellation_6B();
    runNonFiniteWarning_6C();
    runLogLevels_6D();

    runTelemetryRingBuffer_7A();

    runSurvey_8A();
    runSensitivityAnalyzer_9A();

    runGoldenScenario_10A();

    return 0;
}
