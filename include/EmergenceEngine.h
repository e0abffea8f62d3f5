#pragma once

#include <array>
#include <atomic>
#include <cstdint>
#include <functional>
#include <string>

#include "Attractors.h"
#include "Crystallizer.h"
#include "Particles.h"
#include "RandomSource.h"

namespace cee {

// ============================================================
// Chaotic Emergence Engine
//
// Single-threaded, CPU-bound, no I/O inside the step loop. One engine per run;
// independent runs share nothing and can be placed on separate threads.
// ============================================================

enum class LogLevel : int {
    Info  = 0,
    Warn  = 1,
    Error = 2,
};

const char* logLevelTag(LogLevel level);

using LogSink = std::function<void(LogLevel, const std::string&)>;

// Writes "[WARN] msg" style lines to std::cerr.
void stderrLogSink(LogLevel level, const std::string& msg);

// Versioned, hashable tunables. Every recognized option is listed here.
struct EngineConfigV1 {
    std::uint32_t version_u32 = 1;
    std::uint32_t size_bytes_u32 = sizeof(EngineConfigV1);
    std::uint32_t fnv_hash_u32 = 0;

    // Fixed, non-adaptive step (simulated time units).
    double dt = 0.01;

    // Chaotic flow (Lorenz). Standard values keep the flow chaotic.
    double sigma = 10.0;
    double rho = 28.0;
    double beta = 8.0 / 3.0;

    // Phase-transition detector.
    double critical_threshold = 0.3;
    double min_dwell_time = 1.0;
    std::uint32_t max_iterations = 50000;

    // Chaos estimate: tanh(sum|d_i,i+1 - baseline| / n - offset).
    double baseline_distance = 5.0;
    double chaos_offset = 2.0;

    // Apply the coupling term for i == j as well (phase difference 0).
    std::uint32_t include_self_coupling_u32 = 0;

    // Telemetry cadence in steps (>= 1).
    std::uint32_t telemetry_every_steps = 10;
};

// FNV-1a32 over the effective fields (explicit list, fixed order).
std::uint32_t hashEngineConfig(const EngineConfigV1& cfg);

// On failure *why (if non-null) names the rejected field.
bool validateEngineConfig(const EngineConfigV1& cfg, std::string* why);

struct TelemetrySample {
    float t = 0.0f;
    float entropy = 0.0f;
    float order_parameter = 0.0f;
    float chaos_estimate = 0.0f;
    float correlation_length = 0.0f;
    float dwell_time = 0.0f;
    std::uint32_t crystallized_u32 = 0;
};

// Developer-visible edge events; never affect results.
enum EngineEventBits : std::uint32_t {
    Event_None                  = 0u,
    Event_EnterCritical         = 1u << 0,
    Event_ExitCritical          = 1u << 1,
    Event_Crystallized          = 1u << 2,
    Event_ForcedCrystallization = 1u << 3,
    Warn_NonFiniteState         = 1u << 16,
};

struct EngineSnapshot {
    double t = 0.0;
    std::uint64_t step = 0;
    SystemMetrics metrics{};
    TransitionState transition{};
};

enum class RunStatus : int {
    Crystallized  = 0,
    ForcedTimeout = 1, // iteration ceiling reached; lower-confidence output
    Cancelled     = 2,
    InvalidInput  = 3,
};

const char* runStatusName(RunStatus s);

struct RunResult {
    RunStatus status = RunStatus::InvalidInput;
    std::string error;
    // Valid for Crystallized and ForcedTimeout only.
    EmergentConfiguration configuration{};
    EngineSnapshot final_snapshot{};
};

class EmergenceEngine {
public:
    EmergenceEngine();

    EmergenceEngine(const EmergenceEngine&) = delete;
    EmergenceEngine& operator=(const EmergenceEngine&) = delete;

    // Rejects invalid configs and keeps the previous one. Takes effect on the
    // next reset()/loadField(); a running integration keeps the config it
    // started with.
    bool setConfig(const EngineConfigV1& cfg);
    const EngineConfigV1& config() const { return cfg_; }
    // Config of the current run (snapshot taken at reset()/loadField()).
    const EngineConfigV1& activeConfig() const { return active_cfg_; }

    void setLogSink(LogSink sink);

    // Validation happens before any state is touched; on failure returns false
    // and lastError() holds the reason.
    bool reset(const InitialConcentrations& conc, std::uint32_t seed);
    bool reset(const InitialConcentrations& conc, const UniformSource& uniform01);

    // Starts a run from an explicit field (perturbation studies). Rejects
    // non-finite state.
    bool loadField(const ParticleField& field);

    bool isReady() const noexcept { return ready_; }
    const std::string& lastError() const { return last_error_; }

    // One integration step. No-op when not ready or already crystallized.
    void step();

    // Blocking loop until crystallization, the iteration ceiling, or
    // *cancel becoming true (checked at the top of each step).
    RunStatus runUntilCrystallized(const std::atomic<bool>* cancel = nullptr);

    // Latches a forced crystallization if the detector has not fired.
    void forceCrystallization();

    EmergentConfiguration crystallize() const;

    // Side-effect free.
    EngineSnapshot observe() const;
    const ParticleField& field() const { return field_; }

    double time() const noexcept { return t_; }
    std::uint64_t stepCount() const noexcept { return step_; }
    bool hasCrystallized() const noexcept { return transition_.has_crystallized; }

    // Oldest first; returns number written.
    int getTelemetrySamples(TelemetrySample* out_ptr, int cap) const;

    // Returns and clears accumulated EngineEventBits.
    std::uint32_t getLatestEvents();

    int exportConfigText(char* buf, int cap) const;

private:
    void integrate();
    void updateMetrics();
    void updateTransition();
    void sampleTelemetry();
    void beginRun();
    void log(LogLevel level, const std::string& msg) const;

    EngineConfigV1 cfg_{};
    EngineConfigV1 active_cfg_{};
    LogSink log_sink_;

    ParticleField field_{};
    SystemMetrics metrics_{};
    TransitionState transition_{};

    bool ready_ = false;
    std::string last_error_;

    double t_ = 0.0;
    std::uint64_t step_ = 0;

    std::uint32_t latest_events_bits_ = 0;
    bool prev_critical_ = false;
    bool nonfinite_reported_ = false;

    static constexpr int kTelemetryCapacity_ = 2048;
    std::array<TelemetrySample, kTelemetryCapacity_> telemetry_rb_{};
    int telemetry_head_ = 0;
    int telemetry_count_ = 0;
};

// One self-contained run: validate, seed, integrate, crystallize.
RunResult runSimulation(const InitialConcentrations& conc,
                        std::uint32_t seed,
                        const EngineConfigV1& cfg = EngineConfigV1{},
                        const std::atomic<bool>* cancel = nullptr,
                        LogSink sink = LogSink{});

RunResult runSimulation(const InitialConcentrations& conc,
                        const UniformSource& uniform01,
                        const EngineConfigV1& cfg = EngineConfigV1{},
                        const std::atomic<bool>* cancel = nullptr,
                        LogSink sink = LogSink{});

} // namespace cee
