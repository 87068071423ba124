#include <cstdint>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "Errors.hpp"
#include "RothConversionExplorer.hpp"
#include "Scenario.hpp"
#include "engine/engine.h"
#include "io/csv_writer.hpp"
#include "io/json_loader.hpp"

using namespace Glidepath;

struct CliOptions {
    std::string scenario_path;
    std::string tax_path;
    int paths = 1000;
    std::uint64_t seed = 42;
    std::string ledger_path;
    std::string summary_path;
    std::vector<double> sweep_caps;
};

static void usage() {
    std::cerr << "usage: glidepath_cli <scenario.json> <tax_tables.json> [--paths N] [--seed S]\n"
                 "                     [--ledger out.csv] [--summary out.csv] [--sweep c1,c2,...]"
              << std::endl;
}

static std::vector<double> parse_caps(const std::string& list) {
    std::vector<double> caps;
    std::stringstream ss(list);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) caps.push_back(std::stod(item));
    }
    if (caps.empty()) throw std::invalid_argument("--sweep needs at least one cap");
    return caps;
}

static CliOptions parse_args(int argc, char* argv[]) {
    CliOptions opt;
    std::vector<std::string> positional;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&]() -> std::string {
            if (i + 1 >= argc) throw std::invalid_argument(arg + " needs a value");
            return argv[++i];
        };
        if (arg == "--paths") opt.paths = std::stoi(next());
        else if (arg == "--seed") opt.seed = std::stoull(next());
        else if (arg == "--ledger") opt.ledger_path = next();
        else if (arg == "--summary") opt.summary_path = next();
        else if (arg == "--sweep") opt.sweep_caps = parse_caps(next());
        else if (arg.rfind("--", 0) == 0) throw std::invalid_argument("unknown option " + arg);
        else positional.push_back(arg);
    }
    if (positional.size() != 2) throw std::invalid_argument("expected a scenario file and a tax table file");
    opt.scenario_path = positional[0];
    opt.tax_path = positional[1];
    return opt;
}

static void print_summary(const SimulationSummary& s) {
    std::cout << "\n--- Scenario '" << s.scenario_id << "' ---" << std::endl;
    std::cout << "Paths: " << s.num_paths << ", seed " << s.seed << std::endl;
    std::cout << "Success probability: " << s.success_probability * 100.0 << "%" << std::endl;
    std::cout << "Terminal net worth p10/p50/p90: "
              << s.terminal_net_worth.at(10.0) << " / " << s.terminal_net_worth.at(50.0) << " / "
              << s.terminal_net_worth.at(90.0) << std::endl;
    std::cout << "Lifetime tax (median): " << s.lifetime_tax.at(50.0) << std::endl;
    std::cout << "Median path: #" << s.median_path_index
              << (s.median_path.success ? " (funded)" : " (depleted)") << std::endl;
}

static void print_sweep(const RothConversionExplorer::ConversionSweep& sw) {
    using E = RothConversionExplorer;
    std::cout << "\n--- Conversion sweep ---" << std::endl;
    std::cout << "cap";
    for (int m = 0; m < E::NumMetrics; ++m) std::cout << "," << E::metric_name(static_cast<E::Metric>(m));
    std::cout << std::endl;
    for (std::size_t i = 0; i < sw.caps.size(); ++i) {
        std::cout << sw.caps[i];
        for (int m = 0; m < E::NumMetrics; ++m) std::cout << "," << sw.metrics(static_cast<Eigen::Index>(i), m);
        std::cout << std::endl;
    }
    std::cout << "Best cap (success probability): " << sw.best_cap(E::SuccessProbability) << std::endl;
    std::cout << "Best cap (median lifetime tax): " << sw.best_cap(E::MedianLifetimeTax) << std::endl;
}

int main(int argc, char* argv[]) {
    CliOptions opt;
    try {
        opt = parse_args(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        usage();
        return 2;
    }

    try {
        std::cout << "=== Glidepath ===" << std::endl;
        for (const auto& path : {opt.scenario_path, opt.tax_path}) {
            if (!std::filesystem::exists(path)) {
                std::cerr << "Error: file not found: " << path << std::endl;
                return 1;
            }
        }

        ScenarioInput scenario = JsonLoader::load_scenario(opt.scenario_path);
        TaxTable taxes = JsonLoader::load_tax_table(opt.tax_path);

        MonteCarloEngine engine(taxes);
        RunOptions run_opts;
        run_opts.percentiles = {10.0, 50.0, 90.0};

        SimulationSummary summary = engine.run(scenario, opt.paths, opt.seed, run_opts);
        print_summary(summary);

        if (!opt.ledger_path.empty()) CsvWriter::write_ledger(opt.ledger_path, scenario, summary);
        if (!opt.summary_path.empty()) CsvWriter::write_summary(opt.summary_path, summary);

        if (!opt.sweep_caps.empty()) {
            RothConversionExplorer explorer(engine);
            print_sweep(explorer.sweep(scenario, opt.sweep_caps, opt.paths, opt.seed, run_opts));
        }

        std::cout << "\n=== Finished Successfully ===" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
