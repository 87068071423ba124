#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include <pybind11/stl.h>
#include "../RothConversionExplorer.hpp"
#include "../engine/engine.h"
#include "../io/json_loader.hpp"

namespace py = pybind11;
using namespace Glidepath;

namespace {

// Copies into a NumPy array the caller cannot write through
py::array_t<double> readonly(const Eigen::MatrixXd& m) {
    py::array_t<double> arr({m.rows(), m.cols()});
    auto view = arr.mutable_unchecked<2>();
    for (Eigen::Index i = 0; i < m.rows(); ++i)
        for (Eigen::Index j = 0; j < m.cols(); ++j) view(i, j) = m(i, j);
    arr.attr("setflags")(py::arg("write") = false);
    return arr;
}

py::array_t<double> readonly(const Eigen::VectorXd& v) {
    py::array_t<double> arr(v.size());
    auto view = arr.mutable_unchecked<1>();
    for (Eigen::Index i = 0; i < v.size(); ++i) view(i) = v(i);
    arr.attr("setflags")(py::arg("write") = false);
    return arr;
}

py::dict bands_dict(const PercentileBands& b) {
    py::dict d;
    d["levels"] = b.levels;
    d["values"] = readonly(b.values);
    return d;
}

py::dict stats_dict(const DistributionStats& s) {
    py::dict d;
    d["mean"] = s.mean;
    d["min"] = s.min;
    d["max"] = s.max;
    py::dict pct;
    for (std::size_t i = 0; i < s.levels.size(); ++i) pct[py::float_(s.levels[i])] = s.percentiles[i];
    d["percentiles"] = pct;
    return d;
}

py::dict ledger_year_dict(const LedgerYear& ly, const ScenarioInput& scenario) {
    py::dict d;
    d["year"] = ly.year;
    d["age"] = ly.age;
    d["social_security"] = ly.social_security;
    d["other_income"] = ly.other_income;
    d["spending"] = ly.spending;
    d["rmd_required"] = ly.rmd_required;
    d["rmd_taken"] = ly.rmd_taken;
    d["conversion"] = ly.conversion;
    d["conversion_tax"] = ly.conversion_tax;
    d["ordinary_income"] = ly.ordinary_income;
    d["capital_gains"] = ly.capital_gains;
    d["federal_tax"] = ly.federal_tax;
    d["state_tax"] = ly.state_tax;
    d["total_tax"] = ly.total_tax;
    d["surplus"] = ly.surplus;
    d["shortfall"] = ly.shortfall;
    d["cash"] = ly.cash;
    d["net_worth"] = ly.net_worth;

    py::list accounts;
    for (std::size_t i = 0; i < ly.accounts.size(); ++i) {
        const AccountYear& a = ly.accounts[i];
        py::dict ad;
        ad["name"] = scenario.accounts[i].name;
        ad["type"] = to_string(scenario.accounts[i].type);
        ad["start_balance"] = a.start_balance;
        ad["sampled_return"] = a.sampled_return;
        ad["growth"] = a.growth;
        ad["rmd_required"] = a.rmd_required;
        ad["rmd_taken"] = a.rmd_taken;
        ad["conversion_out"] = a.conversion_out;
        ad["conversion_in"] = a.conversion_in;
        ad["withdrawal"] = a.withdrawal;
        ad["realized_gain"] = a.realized_gain;
        ad["tax_paid"] = a.tax_paid;
        ad["contribution"] = a.contribution;
        ad["end_balance"] = a.end_balance;
        accounts.append(ad);
    }
    d["accounts"] = accounts;
    return d;
}

py::dict path_dict(const PathOutcome& p, const ScenarioInput& scenario) {
    py::dict d;
    d["path_index"] = p.path_index;
    d["success"] = p.success;
    d["failure_year"] = p.failure_year;
    d["terminal_net_worth"] = p.terminal_net_worth;
    d["lifetime_tax"] = p.lifetime_tax;
    py::list ledger;
    for (const auto& ly : p.ledger) ledger.append(ledger_year_dict(ly, scenario));
    d["ledger"] = ledger;
    return d;
}

py::dict summary_dict(const SimulationSummary& s, const ScenarioInput& scenario) {
    py::dict d;
    d["scenario_id"] = s.scenario_id;
    d["num_paths"] = s.num_paths;
    d["seed"] = s.seed;
    d["years"] = s.years;
    d["successes"] = s.successes;
    d["success_probability"] = s.success_probability;
    d["net_worth"] = bands_dict(s.net_worth);
    d["taxable"] = bands_dict(s.taxable);
    d["tax_deferred"] = bands_dict(s.tax_deferred);
    d["roth"] = bands_dict(s.roth);
    d["income"] = bands_dict(s.income);
    d["total_tax"] = bands_dict(s.total_tax);
    d["depletion_by_year"] = readonly(s.depletion_by_year);
    d["terminal_net_worth"] = stats_dict(s.terminal_net_worth);
    d["lifetime_tax"] = stats_dict(s.lifetime_tax);
    d["median_path_index"] = s.median_path_index;
    d["median_path"] = path_dict(s.median_path, scenario);
    py::list paths;
    for (const auto& p : s.paths) paths.append(path_dict(p, scenario));
    d["paths"] = paths;
    return d;
}

} // namespace

PYBIND11_MODULE(glidepath_core, m) {
    m.doc() = "Glidepath retirement Monte Carlo engine";

    py::register_exception<ValidationError>(m, "ValidationError", PyExc_ValueError);
    py::register_exception<DataError>(m, "DataError", PyExc_RuntimeError);
    py::register_exception<RunCancelled>(m, "RunCancelled", PyExc_RuntimeError);

    py::class_<ScenarioInput>(m, "ScenarioInput")
        .def_readonly("id", &ScenarioInput::id)
        .def_readonly("start_year", &ScenarioInput::start_year)
        .def_readonly("end_year", &ScenarioInput::end_year)
        .def_readonly("filing_status", &ScenarioInput::filing_status)
        .def_readonly("state", &ScenarioInput::state)
        .def("num_years", &ScenarioInput::num_years)
        .def("save", [](const ScenarioInput& s, const std::string& path) { JsonLoader::save_scenario(s, path); });

    py::class_<TaxTable>(m, "TaxTable")
        .def("years", [](const TaxTable& t) {
            std::vector<int> years;
            for (const auto& kv : t.federal_tables()) years.push_back(kv.first);
            return years;
        });

    m.def("load_scenario", &JsonLoader::load_scenario, py::arg("path"));
    m.def("load_tax_table", &JsonLoader::load_tax_table, py::arg("path"));

    m.def("run_monte_carlo",
        [](const ScenarioInput& scenario, const TaxTable& taxes, int num_paths, std::uint64_t seed,
           std::vector<double> percentiles, bool retain_paths) {
            MonteCarloEngine engine(taxes);
            RunOptions opts;
            opts.percentiles = std::move(percentiles);
            opts.retain_paths = retain_paths;
            SimulationSummary s;
            {
                py::gil_scoped_release release;
                s = engine.run(scenario, num_paths, seed, opts);
            }
            return summary_dict(s, scenario);
        },
        py::arg("scenario"), py::arg("tax_table"), py::arg("num_paths") = 1000, py::arg("seed") = 42,
        py::arg("percentiles") = std::vector<double>{10.0, 50.0, 90.0}, py::arg("retain_paths") = false);

    m.def("run_path",
        [](const ScenarioInput& scenario, const TaxTable& taxes, int path_index, std::uint64_t seed) {
            MonteCarloEngine engine(taxes);
            return path_dict(engine.run_path(scenario, path_index, seed), scenario);
        },
        py::arg("scenario"), py::arg("tax_table"), py::arg("path_index") = 0, py::arg("seed") = 42);

    m.def("sweep_conversions",
        [](const ScenarioInput& scenario, const TaxTable& taxes, std::vector<double> caps, int num_paths,
           std::uint64_t seed) {
            MonteCarloEngine engine(taxes);
            RothConversionExplorer explorer(engine);
            RothConversionExplorer::ConversionSweep sw;
            {
                py::gil_scoped_release release;
                sw = explorer.sweep(scenario, caps, num_paths, seed);
            }
            using E = RothConversionExplorer;
            py::dict d;
            d["caps"] = sw.caps;
            py::list names;
            for (int k = 0; k < E::NumMetrics; ++k) names.append(E::metric_name(static_cast<E::Metric>(k)));
            d["metric_names"] = names;
            d["metrics"] = readonly(sw.metrics);
            d["best_cap_success"] = sw.best_cap(E::SuccessProbability);
            d["best_cap_terminal_net_worth"] = sw.best_cap(E::MedianTerminalNetWorth);
            d["best_cap_lifetime_tax"] = sw.best_cap(E::MedianLifetimeTax);
            return d;
        },
        py::arg("scenario"), py::arg("tax_table"), py::arg("caps"), py::arg("num_paths") = 1000,
        py::arg("seed") = 42);
}
