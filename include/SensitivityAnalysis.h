#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "EmergenceEngine.h"

namespace cee {

class SensitivityAnalyzer {
public:
    struct ParameterRange {
        double nominal = 0.0;
        double min = 0.0;
        double max = 0.0;
        int samples = 0;
    };

    struct SweepConfig {
        std::uint32_t seed = 1337u;
        InitialConcentrations concentrations = referenceConcentrations();
        EngineConfigV1 engine{};
    };

    struct SampleResult {
        RunStatus status = RunStatus::InvalidInput;
        int hun_count = 0;
        int po_count = 0;
        double crystallized_at_t = 0.0;
        std::uint64_t steps = 0;
        std::string signature;
    };

    struct SensitivityRow {
        std::string parameter_name;
        double parameter_value = 0.0;
        std::uint32_t seed = 0;
        SampleResult metrics{};
    };

    enum class StateComponent : int {
        PositionX = 0,
        PositionY = 1,
        PositionZ = 2,
        VelocityX = 3,
        VelocityY = 4,
        VelocityZ = 5,
    };

    // Two copies of one field, one nudged by epsilon in a single component,
    // integrated side by side with the detector held off.
    struct DivergenceReport {
        ParticleType particle = ParticleType::Vital;
        StateComponent component = StateComponent::PositionX;
        double epsilon = 0.0;
        int horizon_steps = 0;

        double initial_separation = 0.0;  // RMS over particle positions
        double final_separation = 0.0;
        double max_separation = 0.0;

        std::string baseline_signature;
        std::string perturbed_signature;
        bool signatures_differ = false;
        bool valid = false;
    };

    SensitivityAnalyzer();

    bool setConfig(const SweepConfig& cfg);
    const SweepConfig& config() const { return cfg_; }
    const std::string& lastError() const { return last_error_; }

    void clearResults();

    // Sweeps one concentration in [min,max] (inside [0,1]) at the fixed seed.
    bool analyzeConcentration(ParticleType type, const ParameterRange& range);

    // Same concentrations, one run per seed.
    bool analyzeSeedDivergence(const std::vector<std::uint32_t>& seeds);

    DivergenceReport compareFromPerturbedSeedState(const ParticleField& field,
                                                   ParticleType particle,
                                                   StateComponent component,
                                                   double epsilon,
                                                   int horizon_steps) const;

    int distinctSignatures() const;

    bool exportSensitivityCSV(const std::string& filename) const;
    const std::vector<SensitivityRow>& results() const;

    static const char* stateComponentName(StateComponent c);

private:
    SweepConfig cfg_{};
    std::vector<SensitivityRow> results_{};
    std::string last_error_;

    SampleResult runScenario(const InitialConcentrations& conc, std::uint32_t seed) const;
    std::vector<double> sampleValues(const ParameterRange& range) const;
};

} // namespace cee
