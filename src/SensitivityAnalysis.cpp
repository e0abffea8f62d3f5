#include "SensitivityAnalysis.h"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <set>

namespace cee {

namespace {

// Long enough that the detector cannot latch inside any sensible horizon.
constexpr double kDetectorHoldOff = 1.0e12;

double& componentRef(ParticleState& p, SensitivityAnalyzer::StateComponent c) {
    switch (c) {
        case SensitivityAnalyzer::StateComponent::PositionX: return p.position.x;
        case SensitivityAnalyzer::StateComponent::PositionY: return p.position.y;
        case SensitivityAnalyzer::StateComponent::PositionZ: return p.position.z;
        case SensitivityAnalyzer::StateComponent::VelocityX: return p.velocity.x;
        case SensitivityAnalyzer::StateComponent::VelocityY: return p.velocity.y;
        case SensitivityAnalyzer::StateComponent::VelocityZ: return p.velocity.z;
    }
    return p.position.x;
}

double rmsSeparation(const ParticleField& a, const ParticleField& b) {
    const int n = ParticleField::size();
    double sum = 0.0;
    for (int i = 0; i < n; ++i) {
        const double d = distance(a.at(i).position, b.at(i).position);
        sum += d * d;
    }
    return std::sqrt(sum / n);
}

} // namespace

SensitivityAnalyzer::SensitivityAnalyzer() = default;

const char* SensitivityAnalyzer::stateComponentName(StateComponent c) {
    switch (c) {
        case StateComponent::PositionX: return "position.x";
        case StateComponent::PositionY: return "position.y";
        case StateComponent::PositionZ: return "position.z";
        case StateComponent::VelocityX: return "velocity.x";
        case StateComponent::VelocityY: return "velocity.y";
        case StateComponent::VelocityZ: return "velocity.z";
    }
    return "unknown";
}

bool SensitivityAnalyzer::setConfig(const SweepConfig& cfg) {
    std::string why;
    if (!validateConcentrations(cfg.concentrations, &why)) {
        last_error_ = "invalid initial concentrations: " + why;
        return false;
    }
    if (!validateEngineConfig(cfg.engine, &why)) {
        last_error_ = "invalid engine config: " + why;
        return false;
    }
    cfg_ = cfg;
    last_error_.clear();
    return true;
}

void SensitivityAnalyzer::clearResults() {
    results_.clear();
}

std::vector<double> SensitivityAnalyzer::sampleValues(const ParameterRange& range) const {
    std::vector<double> values;
    if (range.samples <= 1 || range.max <= range.min) {
        values.push_back(range.nominal);
        return values;
    }

    values.reserve(static_cast<std::size_t>(range.samples));
    const double span = range.max - range.min;
    const int steps = range.samples - 1;
    for (int i = 0; i < range.samples; ++i) {
        const double t = static_cast<double>(i) / static_cast<double>(steps);
        values.push_back(range.min + span * t);
    }
    return values;
}

SensitivityAnalyzer::SampleResult SensitivityAnalyzer::runScenario(const InitialConcentrations& conc,
                                                                   std::uint32_t seed) const {
    SampleResult m{};
    const RunResult r = runSimulation(conc, seed, cfg_.engine);
    m.status = r.status;
    if (r.status != RunStatus::Crystallized && r.status != RunStatus::ForcedTimeout) {
        return m;
    }
    m.hun_count = static_cast<int>(r.configuration.hun.size());
    m.po_count = static_cast<int>(r.configuration.po.size());
    m.crystallized_at_t = r.configuration.crystallized_at_t;
    m.steps = r.configuration.steps;
    m.signature = r.configuration.signature;
    return m;
}

bool SensitivityAnalyzer::analyzeConcentration(ParticleType type, const ParameterRange& range) {
    clearResults();

    const std::vector<double> values = sampleValues(range);
    for (double v : values) {
        if (!std::isfinite(v) || v < 0.0 || v > 1.0) {
            last_error_ = std::string("sweep value for '") + particleTypeName(type) + "' outside [0,1]";
            return false;
        }
    }

    const std::string name = particleTypeName(type);
    for (double value : values) {
        InitialConcentrations conc = cfg_.concentrations;
        conc[type] = value;
        results_.push_back({name, value, cfg_.seed, runScenario(conc, cfg_.seed)});
    }
    last_error_.clear();
    return true;
}

bool SensitivityAnalyzer::analyzeSeedDivergence(const std::vector<std::uint32_t>& seeds) {
    clearResults();
    if (seeds.empty()) {
        last_error_ = "no seeds given";
        return false;
    }
    for (std::uint32_t seed : seeds) {
        results_.push_back({"seed", static_cast<double>(seed), seed, runScenario(cfg_.concentrations, seed)});
    }
    last_error_.clear();
    return true;
}

SensitivityAnalyzer::DivergenceReport SensitivityAnalyzer::compareFromPerturbedSeedState(
    const ParticleField& field,
    ParticleType particle,
    StateComponent component,
    double epsilon,
    int horizon_steps) const {
    DivergenceReport rep;
    rep.particle = particle;
    rep.component = component;
    rep.epsilon = epsilon;
    rep.horizon_steps = horizon_steps;

    if (!std::isfinite(epsilon) || horizon_steps < 0) {
        return rep;
    }

    ParticleField nudged = field;
    componentRef(nudged.particle(particle), component) += epsilon;

    EngineConfigV1 cfg = cfg_.engine;
    cfg.min_dwell_time = kDetectorHoldOff;

    auto quiet = [](LogLevel, const std::string&) {};
    EmergenceEngine base;
    EmergenceEngine pert;
    base.setLogSink(quiet);
    pert.setLogSink(quiet);
    if (!base.setConfig(cfg) || !pert.setConfig(cfg)) return rep;
    if (!base.loadField(field) || !pert.loadField(nudged)) return rep;

    rep.initial_separation = rmsSeparation(base.field(), pert.field());
    rep.max_separation = rep.initial_separation;
    for (int i = 0; i < horizon_steps; ++i) {
        base.step();
        pert.step();
        const double sep = rmsSeparation(base.field(), pert.field());
        if (std::isfinite(sep)) rep.max_separation = std::max(rep.max_separation, sep);
    }
    rep.final_separation = rmsSeparation(base.field(), pert.field());

    rep.baseline_signature = base.crystallize().signature;
    rep.perturbed_signature = pert.crystallize().signature;
    rep.signatures_differ = (rep.baseline_signature != rep.perturbed_signature);
    rep.valid = true;
    return rep;
}

int SensitivityAnalyzer::distinctSignatures() const {
    std::set<std::string> sigs;
    for (const auto& row : results_) {
        if (!row.metrics.signature.empty()) sigs.insert(row.metrics.signature);
    }
    return static_cast<int>(sigs.size());
}

bool SensitivityAnalyzer::exportSensitivityCSV(const std::string& filename) const {
    std::ofstream out(filename);
    if (!out.is_open()) {
        return false;
    }

    out << "parameter,value,seed,status,hun_count,po_count,crystallized_at_t,steps,signature\n";
    out << std::fixed << std::setprecision(6);
    for (const auto& row : results_) {
        out << row.parameter_name << ','
            << row.parameter_value << ','
            << row.seed << ','
            << runStatusName(row.metrics.status) << ','
            << row.metrics.hun_count << ','
            << row.metrics.po_count << ','
            << row.metrics.crystallized_at_t << ','
            << row.metrics.steps << ','
            << row.metrics.signature << '\n';
    }
    return static_cast<bool>(out);
}

const std::vector<SensitivityAnalyzer::SensitivityRow>& SensitivityAnalyzer::results() const {
    return results_;
}

} // namespace cee
