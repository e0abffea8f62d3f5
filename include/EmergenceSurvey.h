#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "EmergenceEngine.h"

namespace cee {

// Population survey: N independent runs with identical concentrations, one
// engine per run, distributed over a small worker pool.
class EmergenceSurvey {
public:
    struct SurveyConfig {
        int bots = 10;
        int threads = 0;                  // <= 0: hardware_concurrency
        std::uint32_t base_seed = 1337u;
        bool reproducible = true;         // false: entropy seeds
        InitialConcentrations concentrations = referenceConcentrations();
        EngineConfigV1 engine{};
    };

    struct RunRow {
        int index = 0;
        std::uint32_t seed = 0;
        RunStatus status = RunStatus::InvalidInput;
        std::string error;

        int hun_count = 0;
        int po_count = 0;
        std::string signature;
        AttractorKind birth_kind = AttractorKind::BalancePoint;
        double yang_intensity = 0.0;
        double yin_intensity = 0.0;
        double crystallized_at_t = 0.0;
        std::uint64_t steps = 0;
        double mean_hun_strength = 0.0;
        double mean_po_strength = 0.0;
    };

    struct Stat {
        double mean = 0.0;
        double median = 0.0;
        double ci_lower_95 = 0.0;
        double ci_upper_95 = 0.0;
        double std_dev = 0.0;
    };

    struct SurveySummary {
        int runs = 0;
        int crystallized = 0;
        int forced = 0;
        int cancelled = 0;
        int invalid = 0;
        int unique_signatures = 0;

        std::map<int, int> hun_count_distribution;
        std::map<int, int> po_count_distribution;
        std::map<AttractorKind, int> birth_kind_distribution;

        // Over runs that produced a configuration.
        Stat crystallization_time{};
        Stat hun_count{};
        Stat po_count{};
    };

    EmergenceSurvey();

    // Rejects bots < 1, invalid concentrations, invalid engine config.
    bool setConfig(const SurveyConfig& cfg);
    const SurveyConfig& config() const { return cfg_; }
    const std::string& lastError() const { return last_error_; }

    // Blocking. Returns false only when the survey could not start; individual
    // run failures are reported per row.
    bool run(const std::atomic<bool>* cancel = nullptr);

    const std::vector<RunRow>& rows() const { return rows_; }
    // Workers in the last run(), the calling thread included.
    int workersUsed() const { return workers_used_; }
    SurveySummary summary() const;

    bool exportRunsCSV(const std::string& filename) const;
    bool writeMarkdownReport(const std::string& filename) const;

    // baseSeed + i * 0x9E3779B9 (mod 2^32)
    static std::uint32_t seedForRun(std::uint32_t base_seed, int index);

    static Stat summarize(const std::vector<double>& values);

private:
    SurveyConfig cfg_{};
    std::vector<RunRow> rows_{};
    std::string last_error_;
    int workers_used_ = 0;

    static RunRow runOne(const SurveyConfig& cfg, int index, std::uint32_t seed,
                         const std::atomic<bool>* cancel);
};

} // namespace cee
