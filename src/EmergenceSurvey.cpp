#include "EmergenceSurvey.h"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <numeric>
#include <set>
#include <system_error>
#include <thread>

namespace cee {

namespace {

constexpr std::uint32_t kSeedStride = 0x9E3779B9u;

std::mutex g_log_mutex;

// Workers share stderr; keep whole lines together.
LogSink surveyLogSink(int index) {
    return [index](LogLevel level, const std::string& msg) {
        std::lock_guard<std::mutex> lock(g_log_mutex);
        std::cerr << "[" << logLevelTag(level) << "] run " << index << ": " << msg << "\n";
    };
}

double meanStrength(const std::vector<EmergentEntity>& entities) {
    if (entities.empty()) return 0.0;
    double sum = 0.0;
    for (const auto& e : entities) sum += e.strength;
    return sum / static_cast<double>(entities.size());
}

bool hasConfiguration(const EmergenceSurvey::RunRow& row) {
    return row.status == RunStatus::Crystallized || row.status == RunStatus::ForcedTimeout;
}

int resolveThreadCount(int requested, int bots) {
    int n = requested;
    if (n <= 0) n = static_cast<int>(std::thread::hardware_concurrency());
    if (n <= 0) n = 1;
    return std::min(n, bots);
}

} // namespace

EmergenceSurvey::EmergenceSurvey() = default;

std::uint32_t EmergenceSurvey::seedForRun(std::uint32_t base_seed, int index) {
    return base_seed + static_cast<std::uint32_t>(index) * kSeedStride;
}

bool EmergenceSurvey::setConfig(const SurveyConfig& cfg) {
    std::string why;
    if (cfg.bots < 1) {
        last_error_ = "survey needs at least one bot";
        return false;
    }
    if (!validateConcentrations(cfg.concentrations, &why)) {
        last_error_ = "invalid initial concentrations: " + why;
        return false;
    }
    if (!validateEngineConfig(cfg.engine, &why)) {
        last_error_ = "invalid engine config: " + why;
        return false;
    }
    cfg_ = cfg;
    rows_.clear();
    last_error_.clear();
    return true;
}

EmergenceSurvey::RunRow EmergenceSurvey::runOne(const SurveyConfig& cfg, int index, std::uint32_t seed,
                                                const std::atomic<bool>* cancel) {
    RunRow row;
    row.index = index;
    row.seed = seed;

    const RunResult r = runSimulation(cfg.concentrations, seed, cfg.engine, cancel, surveyLogSink(index));
    row.status = r.status;
    row.error = r.error;
    if (!hasConfiguration(row)) return row;

    const EmergentConfiguration& c = r.configuration;
    row.hun_count = static_cast<int>(c.hun.size());
    row.po_count = static_cast<int>(c.po.size());
    row.signature = c.signature;
    row.birth_kind = c.birth_attractor.kind;
    row.yang_intensity = c.birth_attractor.yang_intensity;
    row.yin_intensity = c.birth_attractor.yin_intensity;
    row.crystallized_at_t = c.crystallized_at_t;
    row.steps = c.steps;
    row.mean_hun_strength = meanStrength(c.hun);
    row.mean_po_strength = meanStrength(c.po);
    return row;
}

bool EmergenceSurvey::run(const std::atomic<bool>* cancel) {
    std::string why;
    if (!validateConcentrations(cfg_.concentrations, &why)) {
        last_error_ = "invalid initial concentrations: " + why;
        return false;
    }

    const int bots = cfg_.bots;
    std::vector<std::uint32_t> seeds(static_cast<std::size_t>(bots));
    for (int i = 0; i < bots; ++i) {
        seeds[static_cast<std::size_t>(i)] = cfg_.reproducible ? seedForRun(cfg_.base_seed, i) : entropySeed();
    }

    rows_.assign(static_cast<std::size_t>(bots), RunRow{});

    // One slot per run; workers claim indices, so the row order never depends
    // on scheduling.
    std::atomic<int> next{0};
    const SurveyConfig cfg = cfg_;
    auto worker = [&]() {
        for (;;) {
            const int i = next.fetch_add(1);
            if (i >= bots) return;
            rows_[static_cast<std::size_t>(i)] = runOne(cfg, i, seeds[static_cast<std::size_t>(i)], cancel);
        }
    };

    // The calling thread is one of the workers, so the survey completes even
    // when no extra thread can be started.
    const int thread_count = resolveThreadCount(cfg_.threads, bots);
    std::vector<std::thread> threads;
    threads.reserve(static_cast<std::size_t>(thread_count - 1));
    for (int t = 1; t < thread_count; ++t) {
        try {
            threads.emplace_back(worker);
        } catch (const std::system_error& e) {
            std::lock_guard<std::mutex> lock(g_log_mutex);
            std::cerr << "[WARN] survey: started " << threads.size() + 1 << " of " << thread_count
                      << " workers (" << e.what() << ")\n";
            break;
        }
    }
    workers_used_ = static_cast<int>(threads.size()) + 1;
    worker();
    for (auto& th : threads) {
        th.join();
    }

    last_error_.clear();
    return true;
}

EmergenceSurvey::Stat EmergenceSurvey::summarize(const std::vector<double>& values) {
    Stat result{};
    if (values.empty()) {
        return result;
    }

    const double mean = std::accumulate(values.begin(), values.end(), 0.0) / values.size();
    double variance = 0.0;
    for (double v : values) {
        const double d = v - mean;
        variance += d * d;
    }
    variance /= static_cast<double>(values.size());

    std::vector<double> sorted = values;
    std::sort(sorted.begin(), sorted.end());

    auto percentile = [&](double p) {
        if (sorted.size() == 1) return sorted.front();
        const double pos = p * (sorted.size() - 1);
        const std::size_t idx = static_cast<std::size_t>(pos);
        const double frac = pos - static_cast<double>(idx);
        if (idx + 1 >= sorted.size()) return sorted.back();
        return sorted[idx] * (1.0 - frac) + sorted[idx + 1] * frac;
    };

    result.mean = mean;
    result.median = percentile(0.5);
    result.ci_lower_95 = percentile(0.025);
    result.ci_upper_95 = percentile(0.975);
    result.std_dev = std::sqrt(variance);
    return result;
}

EmergenceSurvey::SurveySummary EmergenceSurvey::summary() const {
    SurveySummary s{};
    s.runs = static_cast<int>(rows_.size());

    std::set<std::string> signatures;
    std::vector<double> times;
    std::vector<double> hun;
    std::vector<double> po;

    for (const auto& row : rows_) {
        switch (row.status) {
            case RunStatus::Crystallized:  ++s.crystallized; break;
            case RunStatus::ForcedTimeout: ++s.forced; break;
            case RunStatus::Cancelled:     ++s.cancelled; break;
            case RunStatus::InvalidInput:  ++s.invalid; break;
        }
        if (!hasConfiguration(row)) continue;

        signatures.insert(row.signature);
        ++s.hun_count_distribution[row.hun_count];
        ++s.po_count_distribution[row.po_count];
        ++s.birth_kind_distribution[row.birth_kind];
        times.push_back(row.crystallized_at_t);
        hun.push_back(static_cast<double>(row.hun_count));
        po.push_back(static_cast<double>(row.po_count));
    }

    s.unique_signatures = static_cast<int>(signatures.size());
    s.crystallization_time = summarize(times);
    s.hun_count = summarize(hun);
    s.po_count = summarize(po);
    return s;
}

bool EmergenceSurvey::exportRunsCSV(const std::string& filename) const {
    std::ofstream out(filename);
    if (!out.is_open()) {
        return false;
    }

    out << "index,seed,status,hun_count,po_count,signature,birth_attractor,"
           "yang_intensity,yin_intensity,crystallized_at_t,steps,mean_hun_strength,mean_po_strength\n";
    out << std::fixed << std::setprecision(6);
    for (const auto& row : rows_) {
        out << row.index << ','
            << row.seed << ','
            << runStatusName(row.status) << ','
            << row.hun_count << ','
            << row.po_count << ','
            << row.signature << ','
            << attractorKindName(row.birth_kind) << ','
            << row.yang_intensity << ','
            << row.yin_intensity << ','
            << row.crystallized_at_t << ','
            << row.steps << ','
            << row.mean_hun_strength << ','
            << row.mean_po_strength << '\n';
    }
    return static_cast<bool>(out);
}

bool EmergenceSurvey::writeMarkdownReport(const std::string& filename) const {
    std::ofstream md(filename);
    if (!md.is_open()) {
        return false;
    }

    const SurveySummary s = summary();
    const EngineConfigV1& e = cfg_.engine;

    md << "# Emergence Survey Report\n\n";
    md << "Runs: " << s.runs << " (crystallized " << s.crystallized
       << ", forced " << s.forced
       << ", cancelled " << s.cancelled
       << ", invalid " << s.invalid << ")\n\n";
    md << "Unique signatures: " << s.unique_signatures << "\n\n";

    md << "## Initial Conditions\n\n";
    md << "| Particle | Concentration |\n|---|---|\n";
    md << std::fixed << std::setprecision(3);
    for (const auto& kv : cfg_.concentrations) {
        md << "| " << particleTypeName(kv.first) << " | " << kv.second << " |\n";
    }
    md << "\nSeeding: " << (cfg_.reproducible ? "reproducible, base seed " : "entropy")
       << (cfg_.reproducible ? std::to_string(cfg_.base_seed) : std::string()) << "\n\n";

    md << "## Configuration\n\n";
    md << "| Parameter | Value |\n|---|---|\n";
    md << std::setprecision(6);
    md << "| dt | " << e.dt << " |\n";
    md << "| sigma | " << e.sigma << " |\n";
    md << "| rho | " << e.rho << " |\n";
    md << "| beta | " << e.beta << " |\n";
    md << "| critical_threshold | " << e.critical_threshold << " |\n";
    md << "| min_dwell_time | " << e.min_dwell_time << " |\n";
    md << "| max_iterations | " << e.max_iterations << " |\n";
    md << "| include_self_coupling | " << (e.include_self_coupling_u32 ? "yes" : "no") << " |\n";

    md << "\n## Distributions\n\n";
    md << "| Hun count | Runs |\n|---|---|\n";
    for (const auto& kv : s.hun_count_distribution) md << "| " << kv.first << " | " << kv.second << " |\n";
    md << "\n| Po count | Runs |\n|---|---|\n";
    for (const auto& kv : s.po_count_distribution) md << "| " << kv.first << " | " << kv.second << " |\n";
    md << "\n| Birth attractor | Runs |\n|---|---|\n";
    for (const auto& kv : s.birth_kind_distribution) {
        md << "| " << attractorKindName(kv.first) << " | " << kv.second << " |\n";
    }

    auto statRow = [&](const char* name, const Stat& st) {
        md << "| " << name << " | " << st.mean << " | " << st.median << " | "
           << st.ci_lower_95 << " - " << st.ci_upper_95 << " | " << st.std_dev << " |\n";
    };
    md << "\n| Quantity | Mean | Median | 95% interval | Std dev |\n|---|---|---|---|---|\n";
    md << std::setprecision(3);
    statRow("crystallization time", s.crystallization_time);
    statRow("hun count", s.hun_count);
    statRow("po count", s.po_count);

    md << "\n## Runs\n\n";
    md << "| # | Seed | Status | Hun | Po | Signature | Attractor | t | Hun strength | Po strength |\n";
    md << "|---|---|---|---|---|---|---|---|---|---|\n";
    for (const auto& row : rows_) {
        md << "| " << row.index
           << " | " << row.seed
           << " | " << runStatusName(row.status)
           << " | " << row.hun_count
           << " | " << row.po_count
           << " | " << (row.signature.empty() ? "-" : row.signature)
           << " | " << attractorKindName(row.birth_kind)
           << " | " << row.crystallized_at_t
           << " | " << row.mean_hun_strength
           << " | " << row.mean_po_strength << " |\n";
    }
    return static_cast<bool>(md);
}

} // namespace cee
