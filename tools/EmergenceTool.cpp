#include "EmergenceEngine.h"
#include "EmergenceSurvey.h"
#include "SensitivityAnalysis.h"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {
std::string toLower(std::string v) {
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return v;
}

void printUsage() {
    std::cout << "EmergenceTool usage:\n"
              << "  EmergenceTool run    [--seed n | --unseeded] [--conc vital=0.7,conscious=0.8,...] [--max-iter n] [--self-coupling]\n"
              << "  EmergenceTool survey --bots n [--threads t] [--seed n | --unseeded] [--conc ...] [--csv file] [--report file]\n"
              << "  EmergenceTool sweep  --param <vital|conscious|creative|connective|transformative|seed>\n"
              << "                       [--min v] [--max v] [--samples n] [--seed n] [--out file]\n"
              << "  EmergenceTool config\n";
}

std::uint32_t parseSeed(const std::string& s) {
    const unsigned long v = std::stoul(s, nullptr, 0);
    return static_cast<std::uint32_t>(v);
}

// "vital=0.7,conscious=0.8" overrides entries of conc; unknown names fail.
bool parseConcentrations(const std::string& text, cee::InitialConcentrations& conc) {
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        const auto eq = item.find('=');
        if (eq == std::string::npos) {
            std::cout << "Malformed concentration entry: " << item << "\n";
            return false;
        }
        cee::ParticleType t;
        if (!cee::parseParticleType(item.substr(0, eq), &t)) {
            std::cout << "Unknown particle type: " << item.substr(0, eq) << "\n";
            return false;
        }
        conc[t] = std::stod(item.substr(eq + 1));
    }
    return true;
}

void printEntities(const char* title, const std::vector<cee::EmergentEntity>& entities) {
    std::cout << title << " (" << entities.size() << ")\n";
    for (const auto& e : entities) {
        std::cout << "  " << std::left << std::setw(24) << e.id << std::right
                  << std::fixed << std::setprecision(3)
                  << " strength=" << e.strength;
        if (e.entity_class == cee::EntityClass::Hun) {
            std::cout << " purity=" << e.purity;
        } else {
            std::cout << " viscosity=" << e.viscosity;
        }
        std::cout << " connection=" << e.connection
                  << "  " << e.name << " - " << e.function_description << "\n";
    }
}

int runCommand(const std::vector<std::string>& args) {
    std::uint32_t seed = 1337u;
    bool unseeded = false;
    cee::InitialConcentrations conc = cee::referenceConcentrations();
    cee::EngineConfigV1 cfg;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--seed" && i + 1 < args.size()) {
            seed = parseSeed(args[++i]);
        } else if (arg == "--unseeded") {
            unseeded = true;
        } else if (arg == "--conc" && i + 1 < args.size()) {
            if (!parseConcentrations(args[++i], conc)) return 1;
        } else if (arg == "--max-iter" && i + 1 < args.size()) {
            cfg.max_iterations = static_cast<std::uint32_t>(std::stoul(args[++i]));
        } else if (arg == "--self-coupling") {
            cfg.include_self_coupling_u32 = 1u;
        } else {
            std::cout << "Unknown argument: " << arg << "\n";
            printUsage();
            return 1;
        }
    }
    if (unseeded) seed = cee::entropySeed();

    const cee::RunResult r = cee::runSimulation(conc, seed, cfg);
    if (r.status == cee::RunStatus::InvalidInput) {
        std::cout << "Run rejected: " << r.error << "\n";
        return 1;
    }

    const cee::EmergentConfiguration& c = r.configuration;
    std::cout << "Seed: " << seed << "\n"
              << "Outcome: " << cee::runStatusName(r.status) << "\n"
              << "Crystallized at t=" << std::fixed << std::setprecision(2) << c.crystallized_at_t
              << " (" << c.steps << " steps)\n"
              << "Birth attractor: " << cee::attractorKindName(c.birth_attractor.kind)
              << std::setprecision(3)
              << " yang=" << c.birth_attractor.yang_intensity
              << " yin=" << c.birth_attractor.yin_intensity << "\n"
              << "Signature: " << c.signature << "\n";
    printEntities("Hun", c.hun);
    printEntities("Po", c.po);
    return 0;
}

int surveyCommand(const std::vector<std::string>& args) {
    cee::EmergenceSurvey::SurveyConfig sc;
    std::string csv;
    std::string report;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--bots" && i + 1 < args.size()) {
            sc.bots = std::stoi(args[++i]);
        } else if (arg == "--threads" && i + 1 < args.size()) {
            sc.threads = std::stoi(args[++i]);
        } else if (arg == "--seed" && i + 1 < args.size()) {
            sc.base_seed = parseSeed(args[++i]);
        } else if (arg == "--unseeded") {
            sc.reproducible = false;
        } else if (arg == "--conc" && i + 1 < args.size()) {
            if (!parseConcentrations(args[++i], sc.concentrations)) return 1;
        } else if (arg == "--csv" && i + 1 < args.size()) {
            csv = args[++i];
        } else if (arg == "--report" && i + 1 < args.size()) {
            report = args[++i];
        } else {
            std::cout << "Unknown argument: " << arg << "\n";
            printUsage();
            return 1;
        }
    }

    cee::EmergenceSurvey survey;
    if (!survey.setConfig(sc) || !survey.run()) {
        std::cout << "Survey rejected: " << survey.lastError() << "\n";
        return 1;
    }

    const auto s = survey.summary();
    std::cout << "Runs: " << s.runs << " crystallized=" << s.crystallized
              << " forced=" << s.forced << " unique signatures=" << s.unique_signatures << "\n";
    std::cout << "Hun counts:";
    for (const auto& kv : s.hun_count_distribution) std::cout << " " << kv.first << "x" << kv.second;
    std::cout << "\nPo counts:";
    for (const auto& kv : s.po_count_distribution) std::cout << " " << kv.first << "x" << kv.second;
    std::cout << "\nCrystallization time: mean=" << std::fixed << std::setprecision(2)
              << s.crystallization_time.mean << " median=" << s.crystallization_time.median << "\n";

    if (!csv.empty()) {
        if (!survey.exportRunsCSV(csv)) {
            std::cout << "Could not write: " << csv << "\n";
            return 1;
        }
        std::cout << "Wrote survey runs to: " << csv << "\n";
    }
    if (!report.empty()) {
        if (!survey.writeMarkdownReport(report)) {
            std::cout << "Could not write: " << report << "\n";
            return 1;
        }
        std::cout << "Wrote survey report to: " << report << "\n";
    }
    return 0;
}

int sweepCommand(const std::vector<std::string>& args) {
    std::string param;
    double min_val = 0.0;
    double max_val = 0.0;
    int samples = 5;
    std::string out = "sensitivity.csv";
    bool min_set = false;
    bool max_set = false;
    cee::SensitivityAnalyzer::SweepConfig sc;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--param" && i + 1 < args.size()) {
            param = toLower(args[++i]);
        } else if (arg == "--min" && i + 1 < args.size()) {
            min_val = std::stod(args[++i]);
            min_set = true;
        } else if (arg == "--max" && i + 1 < args.size()) {
            max_val = std::stod(args[++i]);
            max_set = true;
        } else if (arg == "--samples" && i + 1 < args.size()) {
            samples = std::stoi(args[++i]);
        } else if (arg == "--seed" && i + 1 < args.size()) {
            sc.seed = parseSeed(args[++i]);
        } else if (arg == "--out" && i + 1 < args.size()) {
            out = args[++i];
        } else {
            std::cout << "Unknown argument: " << arg << "\n";
            printUsage();
            return 1;
        }
    }

    if (param.empty()) {
        printUsage();
        return 1;
    }

    cee::SensitivityAnalyzer analyzer;
    if (!analyzer.setConfig(sc)) {
        std::cout << "Sweep rejected: " << analyzer.lastError() << "\n";
        return 1;
    }

    bool ok = false;
    if (param == "seed") {
        // One run per consecutive seed starting at --seed.
        std::vector<std::uint32_t> seeds;
        for (int i = 0; i < std::max(samples, 1); ++i) {
            seeds.push_back(sc.seed + static_cast<std::uint32_t>(i));
        }
        ok = analyzer.analyzeSeedDivergence(seeds);
    } else {
        cee::ParticleType type;
        if (!cee::parseParticleType(param, &type)) {
            std::cout << "Unsupported parameter: " << param << "\n";
            printUsage();
            return 1;
        }

        cee::SensitivityAnalyzer::ParameterRange range;
        range.samples = samples;
        range.nominal = sc.concentrations.at(type);
        range.min = min_set ? min_val : std::max(0.0, range.nominal * 0.75);
        range.max = max_set ? max_val : std::min(1.0, range.nominal * 1.25);
        ok = analyzer.analyzeConcentration(type, range);
    }
    if (!ok) {
        std::cout << "Sweep rejected: " << analyzer.lastError() << "\n";
        return 1;
    }

    std::cout << "Distinct signatures: " << analyzer.distinctSignatures()
              << " of " << analyzer.results().size() << " runs\n";
    if (!analyzer.exportSensitivityCSV(out)) {
        std::cout << "Could not write: " << out << "\n";
        return 1;
    }
    std::cout << "Wrote sensitivity sweep to: " << out << "\n";
    return 0;
}

int configCommand() {
    cee::EmergenceEngine engine;
    char buf[2048];
    const int n = engine.exportConfigText(buf, static_cast<int>(sizeof(buf)));
    std::cout.write(buf, n);
    return 0;
}
} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        printUsage();
        return 1;
    }

    const std::string cmd = toLower(argv[1]);
    std::vector<std::string> args(argv + 2, argv + argc);

    if (cmd == "--help" || cmd == "-h" || cmd == "help") {
        printUsage();
        return 0;
    }

    try {
        if (cmd == "run") return runCommand(args);
        if (cmd == "survey") return surveyCommand(args);
        if (cmd == "sweep") return sweepCommand(args);
        if (cmd == "config") return configCommand();
    } catch (const std::invalid_argument& e) {
        std::cout << "Invalid numeric argument (" << e.what() << ")\n";
        printUsage();
        return 1;
    } catch (const std::out_of_range& e) {
        std::cout << "Numeric argument out of range (" << e.what() << ")\n";
        printUsage();
        return 1;
    }

    std::cout << "Unknown command: " << cmd << "\n";
    printUsage();
    return 1;
}
