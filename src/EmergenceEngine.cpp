// EmergenceEngine.cpp
//
// Integrator, metrics engine, phase-transition detector and the blocking run
// loop. The evaluation order inside step() is part of the reproducibility
// contract: a fixed seed must give bit-identical signatures.

#include "EmergenceEngine.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <iostream>
#include <utility>

#include "Signature.h"

namespace cee {

namespace {

bool isFinitePositive(double x) {
    return std::isfinite(x) && x > 0.0;
}

double velocityPhase(const Vec3d& v) {
    return std::atan2(v.y, v.x);
}

} // namespace

const char* logLevelTag(LogLevel level) {
    switch (level) {
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

void stderrLogSink(LogLevel level, const std::string& msg) {
    std::cerr << "[" << logLevelTag(level) << "] " << msg << "\n";
}

const char* runStatusName(RunStatus s) {
    switch (s) {
        case RunStatus::Crystallized:  return "crystallized";
        case RunStatus::ForcedTimeout: return "forced-timeout";
        case RunStatus::Cancelled:     return "cancelled";
        case RunStatus::InvalidInput:  return "invalid-input";
    }
    return "unknown";
}

std::uint32_t hashEngineConfig(const EngineConfigV1& cfg) {
    std::uint32_t h = fnv1a32_begin();
    h = fnv1a32_add_u32(h, cfg.version_u32);
    h = fnv1a32_add_u32(h, cfg.size_bytes_u32);
    h = fnv1a32_add_f64(h, cfg.dt);
    h = fnv1a32_add_f64(h, cfg.sigma);
    h = fnv1a32_add_f64(h, cfg.rho);
    h = fnv1a32_add_f64(h, cfg.beta);
    h = fnv1a32_add_f64(h, cfg.critical_threshold);
    h = fnv1a32_add_f64(h, cfg.min_dwell_time);
    h = fnv1a32_add_u32(h, cfg.max_iterations);
    h = fnv1a32_add_f64(h, cfg.baseline_distance);
    h = fnv1a32_add_f64(h, cfg.chaos_offset);
    h = fnv1a32_add_u32(h, cfg.include_self_coupling_u32);
    h = fnv1a32_add_u32(h, cfg.telemetry_every_steps);
    return h;
}

bool validateEngineConfig(const EngineConfigV1& cfg, std::string* why) {
    auto reject = [&](const char* msg) {
        if (why) *why = msg;
        return false;
    };

    if (cfg.version_u32 != 1u || cfg.size_bytes_u32 != sizeof(EngineConfigV1)) {
        return reject("config version/size mismatch");
    }
    if (!isFinitePositive(cfg.dt)) return reject("dt must be finite and > 0");
    if (!std::isfinite(cfg.sigma) || !std::isfinite(cfg.rho) || !std::isfinite(cfg.beta)) {
        return reject("Lorenz parameters must be finite");
    }
    if (!std::isfinite(cfg.critical_threshold) ||
        cfg.critical_threshold <= 0.0 || cfg.critical_threshold > 1.0) {
        return reject("critical_threshold must be in (0,1]");
    }
    if (!isFinitePositive(cfg.min_dwell_time)) return reject("min_dwell_time must be finite and > 0");
    if (cfg.max_iterations == 0u) return reject("max_iterations must be > 0");
    if (!std::isfinite(cfg.baseline_distance) || cfg.baseline_distance < 0.0) {
        return reject("baseline_distance must be finite and >= 0");
    }
    if (!std::isfinite(cfg.chaos_offset)) return reject("chaos_offset must be finite");
    if (cfg.include_self_coupling_u32 > 1u) return reject("include_self_coupling_u32 must be 0 or 1");
    if (cfg.telemetry_every_steps == 0u) return reject("telemetry_every_steps must be >= 1");
    return true;
}

EmergenceEngine::EmergenceEngine() : log_sink_(stderrLogSink) {
    cfg_.fnv_hash_u32 = hashEngineConfig(cfg_);
    active_cfg_ = cfg_;
}

bool EmergenceEngine::setConfig(const EngineConfigV1& cfg) {
    std::string why;
    if (!validateEngineConfig(cfg, &why)) {
        last_error_ = "invalid engine config: " + why;
        log(LogLevel::Warn, last_error_);
        return false;
    }
    cfg_ = cfg;
    cfg_.fnv_hash_u32 = hashEngineConfig(cfg_);
    return true;
}

void EmergenceEngine::setLogSink(LogSink sink) {
    log_sink_ = sink ? std::move(sink) : LogSink(stderrLogSink);
}

void EmergenceEngine::log(LogLevel level, const std::string& msg) const {
    if (log_sink_) {
        log_sink_(level, msg);
    } else {
        stderrLogSink(level, msg);
    }
}

bool EmergenceEngine::reset(const InitialConcentrations& conc, std::uint32_t seed) {
    Xorshift32 rng(seed);
    return reset(conc, rng.asSource());
}

bool EmergenceEngine::reset(const InitialConcentrations& conc, const UniformSource& uniform01) {
    std::string why;
    if (!validateConcentrations(conc, &why)) {
        last_error_ = "invalid initial concentrations: " + why;
        log(LogLevel::Warn, last_error_);
        return false;
    }
    if (!uniform01) {
        last_error_ = "no random source supplied";
        log(LogLevel::Warn, last_error_);
        return false;
    }

    field_ = ParticleField{};
    field_.seed(conc, uniform01);
    beginRun();
    return true;
}

bool EmergenceEngine::loadField(const ParticleField& field) {
    if (!field.isFinite()) {
        last_error_ = "particle field holds non-finite state";
        log(LogLevel::Warn, last_error_);
        return false;
    }
    field_ = field;
    beginRun();
    return true;
}

void EmergenceEngine::beginRun() {
    active_cfg_ = cfg_;

    // High disorder, no order before the first step.
    metrics_ = SystemMetrics{};
    metrics_.entropy = 0.8;

    transition_ = TransitionState{};
    transition_.critical_threshold = active_cfg_.critical_threshold;

    t_ = 0.0;
    step_ = 0;
    latest_events_bits_ = 0;
    prev_critical_ = false;
    nonfinite_reported_ = false;
    telemetry_head_ = 0;
    telemetry_count_ = 0;

    last_error_.clear();
    ready_ = true;
}

void EmergenceEngine::integrate() {
    const int n = ParticleField::size();
    const double dt = active_cfg_.dt;

    // 1) Chaotic self-dynamics: Lorenz flow with the velocity as state.
    for (int i = 0; i < n; ++i) {
        ParticleState& p = field_.at(i);
        const Vec3d v = p.velocity;

        const double dx = active_cfg_.sigma * (v.y - v.x);
        const double dy = v.x * (active_cfg_.rho - v.z) - v.y;
        const double dz = v.x * v.y - active_cfg_.beta * v.z;

        p.velocity.x += dx * dt;
        p.velocity.y += dy * dt;
        p.velocity.z += dz * dt;

        p.position.x += p.velocity.x * dt;
        p.position.y += p.velocity.y * dt;
        p.position.z += p.velocity.z * dt;
    }

    // 2) Pairwise phase coupling. Phases are read live, so particle j < i is
    //    seen after its own update in this pass.
    const bool self_coupling = (active_cfg_.include_self_coupling_u32 != 0u);
    for (int i = 0; i < n; ++i) {
        ParticleState& pi = field_.at(i);
        const double phase_i = velocityPhase(pi.velocity);

        for (int j = 0; j < n; ++j) {
            if (i == j && !self_coupling) continue;
            const double phase_j = velocityPhase(field_.at(j).velocity);

            const double coupling = field_.interaction(i, j) * pi.coupling_strength;
            const double phase_diff = phase_j - phase_i;

            pi.velocity.x += coupling * std::sin(phase_diff) * dt;
            pi.velocity.y += coupling * std::cos(phase_diff) * dt;
        }
    }

    // 3) Attractor pull, geometry evaluated at the pre-step time.
    std::array<AttractorGeometry, kAttractorKindCount> basins{};
    for (int k = 0; k < kAttractorKindCount; ++k) {
        basins[static_cast<std::size_t>(k)] = attractorGeometry(static_cast<AttractorKind>(k), t_);
    }
    for (int i = 0; i < n; ++i) {
        ParticleState& p = field_.at(i);
        for (int k = 0; k < kAttractorKindCount; ++k) {
            const AttractorGeometry& g = basins[static_cast<std::size_t>(k)];
            const Vec3d to_center = sub(g.center, p.position);
            const double strength = g.strength * p.attractor_influence[static_cast<std::size_t>(k)];

            p.velocity.x += to_center.x * strength * dt;
            p.velocity.y += to_center.y * strength * dt;
            p.velocity.z += to_center.z * strength * dt;
        }
    }
}

void EmergenceEngine::updateMetrics() {
    const int n = ParticleField::size();

    double total_sq = 0.0;
    for (int i = 0; i < n; ++i) {
        const double speed = magnitude(field_.at(i).velocity);
        total_sq += speed * speed;
    }
    metrics_.entropy = clamp01(std::min(1.0, total_sq / (n * 100.0)));

    double re = 0.0;
    double im = 0.0;
    for (int i = 0; i < n; ++i) {
        const double phase = velocityPhase(field_.at(i).velocity);
        re += std::cos(phase);
        im += std::sin(phase);
    }
    metrics_.order_parameter = clamp01(std::sqrt(re * re + im * im) / n);

    // Adjacent pairs in storage order; a divergence proxy only.
    double divergence = 0.0;
    for (int i = 0; i + 1 < n; ++i) {
        const double d = distance(field_.at(i).position, field_.at(i + 1).position);
        divergence += std::fabs(d - active_cfg_.baseline_distance);
    }
    metrics_.chaos_estimate = squash(divergence / n - active_cfg_.chaos_offset);

    metrics_.correlation_length = metrics_.order_parameter * 10.0;
}

void EmergenceEngine::updateTransition() {
    const bool critical = (metrics_.order_parameter > transition_.critical_threshold);

    if (critical && !prev_critical_) latest_events_bits_ |= Event_EnterCritical;
    if (!critical && prev_critical_) latest_events_bits_ |= Event_ExitCritical;
    prev_critical_ = critical;

    if (transition_.has_crystallized) return;

    if (critical) {
        transition_.dwell_time += active_cfg_.dt;
        if (transition_.dwell_time > active_cfg_.min_dwell_time) {
            transition_.has_crystallized = true;
            latest_events_bits_ |= Event_Crystallized;
        }
    } else {
        transition_.dwell_time = 0.0;
    }
}

void EmergenceEngine::sampleTelemetry() {
    TelemetrySample s;
    s.t = static_cast<float>(t_);
    s.entropy = static_cast<float>(metrics_.entropy);
    s.order_parameter = static_cast<float>(metrics_.order_parameter);
    s.chaos_estimate = static_cast<float>(metrics_.chaos_estimate);
    s.correlation_length = static_cast<float>(metrics_.correlation_length);
    s.dwell_time = static_cast<float>(transition_.dwell_time);
    s.crystallized_u32 = transition_.has_crystallized ? 1u : 0u;

    telemetry_rb_[static_cast<std::size_t>(telemetry_head_)] = s;
    telemetry_head_ = (telemetry_head_ + 1) % kTelemetryCapacity_;
    if (telemetry_count_ < kTelemetryCapacity_) ++telemetry_count_;
}

void EmergenceEngine::step() {
    if (!ready_ || transition_.has_crystallized) return;

    integrate();

    if (!nonfinite_reported_ && !field_.isFinite()) {
        nonfinite_reported_ = true;
        latest_events_bits_ |= Warn_NonFiniteState;
        char buf[96];
        std::snprintf(buf, sizeof(buf), "non-finite particle state at step %llu",
                      static_cast<unsigned long long>(step_ + 1));
        log(LogLevel::Warn, buf);
    }

    updateMetrics();
    updateTransition();

    t_ += active_cfg_.dt;
    ++step_;

    if (transition_.has_crystallized) {
        transition_.crystallized_at_t = t_;
        transition_.crystallized_at_step = step_;

        char buf[128];
        std::snprintf(buf, sizeof(buf), "crystallized at t=%.2f after %llu steps (order=%.4f)",
                      t_, static_cast<unsigned long long>(step_), metrics_.order_parameter);
        log(LogLevel::Info, buf);
    }

    if (step_ % active_cfg_.telemetry_every_steps == 0u || transition_.has_crystallized) {
        sampleTelemetry();
    }
}

void EmergenceEngine::forceCrystallization() {
    if (!ready_ || transition_.has_crystallized) return;

    transition_.has_crystallized = true;
    transition_.forced = true;
    transition_.crystallized_at_t = t_;
    transition_.crystallized_at_step = step_;
    latest_events_bits_ |= (Event_Crystallized | Event_ForcedCrystallization);

    char buf[160];
    std::snprintf(buf, sizeof(buf),
                  "no phase transition after %llu steps (order=%.4f, dwell=%.3f); forcing crystallization",
                  static_cast<unsigned long long>(step_),
                  metrics_.order_parameter, transition_.dwell_time);
    log(LogLevel::Warn, buf);

    sampleTelemetry();
}

RunStatus EmergenceEngine::runUntilCrystallized(const std::atomic<bool>* cancel) {
    if (!ready_) {
        last_error_ = "run requested before a successful reset";
        log(LogLevel::Error, last_error_);
        return RunStatus::InvalidInput;
    }

    while (!transition_.has_crystallized && step_ < active_cfg_.max_iterations) {
        if (cancel && cancel->load(std::memory_order_relaxed)) {
            return RunStatus::Cancelled;
        }
        step();
    }

    if (!transition_.has_crystallized) {
        forceCrystallization();
    }
    return transition_.forced ? RunStatus::ForcedTimeout : RunStatus::Crystallized;
}

EmergentConfiguration EmergenceEngine::crystallize() const {
    return cee::crystallize(field_, metrics_, transition_);
}

EngineSnapshot EmergenceEngine::observe() const {
    EngineSnapshot s;
    s.t = t_;
    s.step = step_;
    s.metrics = metrics_;
    s.transition = transition_;
    return s;
}

int EmergenceEngine::getTelemetrySamples(TelemetrySample* out_ptr, int cap) const {
    if (!out_ptr || cap <= 0) return 0;
    const int n = std::min<int>(telemetry_count_, cap);
    // Oldest sample index = head - count (mod capacity)
    int idx = (telemetry_head_ - telemetry_count_);
    while (idx < 0) idx += kTelemetryCapacity_;
    for (int i = 0; i < n; ++i) {
        out_ptr[i] = telemetry_rb_[static_cast<std::size_t>((idx + i) % kTelemetryCapacity_)];
    }
    return n;
}

std::uint32_t EmergenceEngine::getLatestEvents() {
    const std::uint32_t out = latest_events_bits_;
    latest_events_bits_ = 0;
    return out;
}

int EmergenceEngine::exportConfigText(char* buf, int cap) const {
    if (!buf || cap <= 0) return 0;
    buf[0] = '\0';

    int n = 0;
    auto app = [&](const char* fmt, auto... args) {
        if (n >= cap) return;
        const int w = std::snprintf(buf + n, static_cast<std::size_t>(cap - n), fmt, args...);
        if (w > 0) n += std::min(w, cap - n);
    };

    app("EngineConfigV1\n");
    app("  version_u32=%u\n", cfg_.version_u32);
    app("  size_bytes_u32=%u\n", cfg_.size_bytes_u32);
    app("  dt=%.9g\n", cfg_.dt);
    app("  sigma=%.9g\n", cfg_.sigma);
    app("  rho=%.9g\n", cfg_.rho);
    app("  beta=%.9g\n", cfg_.beta);
    app("  critical_threshold=%.9g\n", cfg_.critical_threshold);
    app("  min_dwell_time=%.9g\n", cfg_.min_dwell_time);
    app("  max_iterations=%u\n", cfg_.max_iterations);
    app("  baseline_distance=%.9g\n", cfg_.baseline_distance);
    app("  chaos_offset=%.9g\n", cfg_.chaos_offset);
    app("  include_self_coupling_u32=%u\n", cfg_.include_self_coupling_u32);
    app("  telemetry_every_steps=%u\n", cfg_.telemetry_every_steps);
    app("  fnv_hash_u32=0x%08X\n", cfg_.fnv_hash_u32);

    // snprintf truncation keeps buf NUL-terminated.
    const std::uint32_t export_hash = fnv1a32_text(std::string(buf));
    app("ExportTextHash(FNV-1a32)=0x%08X\n", export_hash);

    return std::min(n, cap);
}

namespace {

RunResult runConfigured(EmergenceEngine& engine,
                        const EngineConfigV1& cfg,
                        const std::atomic<bool>* cancel,
                        const std::function<bool(EmergenceEngine&)>& seedRun) {
    RunResult r;
    if (!engine.setConfig(cfg) || !seedRun(engine)) {
        r.status = RunStatus::InvalidInput;
        r.error = engine.lastError();
        return r;
    }

    r.status = engine.runUntilCrystallized(cancel);
    r.final_snapshot = engine.observe();
    if (r.status == RunStatus::Cancelled) {
        r.error = "run cancelled";
        return r;
    }
    r.configuration = engine.crystallize();
    return r;
}

} // namespace

RunResult runSimulation(const InitialConcentrations& conc,
                        std::uint32_t seed,
                        const EngineConfigV1& cfg,
                        const std::atomic<bool>* cancel,
                        LogSink sink) {
    EmergenceEngine engine;
    engine.setLogSink(std::move(sink));
    return runConfigured(engine, cfg, cancel,
                         [&](EmergenceEngine& e) { return e.reset(conc, seed); });
}

RunResult runSimulation(const InitialConcentrations& conc,
                        const UniformSource& uniform01,
                        const EngineConfigV1& cfg,
                        const std::atomic<bool>* cancel,
                        LogSink sink) {
    EmergenceEngine engine;
    engine.setLogSink(std::move(sink));
    return runConfigured(engine, cfg, cancel,
                         [&](EmergenceEngine& e) { return e.reset(conc, uniform01); });
}

} // namespace cee
