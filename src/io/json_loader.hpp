#pragma once
#include <nlohmann/json.hpp>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <string>
#include <vector>
#include <stdexcept>
#include "../Errors.hpp"
#include "../Scenario.hpp"
#include "../kernel/TaxSystem.hpp"

namespace Glidepath {

// Scenario and tax table documents. Missing keys take the defaults of a
// default-constructed ScenarioInput; wrong types and unknown enum values are
// rejected with the field that caused them.
class JsonLoader {
public:
    using json = nlohmann::json;

    // ------------------------------------------------------------------
    // Scenario
    // ------------------------------------------------------------------

    static ScenarioInput load_scenario(const std::string& filepath) {
        json data = read_file(filepath, "scenario");
        ScenarioInput s = scenario_from_json(data);
        std::cout << "[Glidepath::IO] Loaded scenario '" << s.id << "' (" << s.start_year << "-"
                  << s.end_year << ", " << s.people.size() << " people, " << s.accounts.size()
                  << " accounts)" << std::endl;
        return s;
    }

    static void save_scenario(const ScenarioInput& s, const std::string& filepath) {
        write_file(scenario_to_json(s), filepath, "scenario");
    }

    static ScenarioInput scenario_from_json(const json& data) {
        ScenarioInput s;
        if (!data.is_object()) throw ValidationError("[Glidepath] scenario document must be a JSON object");
        try {
            s.id = data.value("id", s.id);
        } catch (const json::exception& e) {
            throw ValidationError(std::string("[Glidepath] scenario id: ") + e.what());
        }

        const std::string& id = s.id;
        auto field = [&id](const std::string& path, auto fn) {
            try {
                fn();
            } catch (const json::exception& e) {
                throw ValidationError(id, path, e.what());
            }
        };

        field("start_year", [&] { s.start_year = data.value("start_year", s.start_year); });
        field("end_year", [&] { s.end_year = data.value("end_year", s.end_year); });
        field("filing_status", [&] { s.filing_status = data.value("filing_status", s.filing_status); });
        field("state", [&] { s.state = data.value("state", s.state); });

        if (data.contains("people")) {
            const json& arr = list(data, "people", id);
            for (std::size_t i = 0; i < arr.size(); ++i) {
                field(indexed("people", i), [&] {
                    const json& p = arr[i];
                    Person person;
                    person.name = p.value("name", person.name);
                    person.birth_year = p.value("birth_year", person.birth_year);
                    person.pia = p.value("pia", person.pia);
                    person.claiming_age = p.value("claiming_age", person.claiming_age);
                    person.death_age = p.value("death_age", person.death_age);
                    s.people.push_back(person);
                });
            }
        }

        if (data.contains("accounts")) {
            const json& arr = list(data, "accounts", id);
            for (std::size_t i = 0; i < arr.size(); ++i) {
                const json& a = arr[i];
                Account acc;
                field(indexed("accounts", i), [&] {
                    acc.name = a.value("name", acc.name);
                    acc.balance = a.value("balance", acc.balance);
                    acc.cost_basis = a.value("cost_basis", acc.cost_basis);
                    acc.mean_return = a.value("mean_return", acc.mean_return);
                    acc.volatility = a.value("volatility", acc.volatility);
                    acc.owner = a.value("owner", acc.owner);
                });
                std::string type;
                field(indexed("accounts", i) + ".type", [&] { type = a.at("type").get<std::string>(); });
                acc.type = parse_account_type(type, id, indexed("accounts", i) + ".type");
                s.accounts.push_back(acc);
            }
        }

        if (data.contains("spending")) {
            field("spending", [&] {
                const json& sp = data["spending"];
                s.spending.annual = sp.value("annual", s.spending.annual);
                s.spending.inflation = sp.value("inflation", s.spending.inflation);
                if (sp.contains("items")) {
                    for (const auto& it : sp["items"]) {
                        s.spending.items.push_back({it.at("year").get<int>(), it.at("amount").get<double>()});
                    }
                }
            });
        }

        if (data.contains("contributions")) {
            const json& arr = list(data, "contributions", id);
            for (std::size_t i = 0; i < arr.size(); ++i) {
                const json& c = arr[i];
                Contribution con;
                field(indexed("contributions", i), [&] {
                    con.start_year = c.value("start_year", s.start_year);
                    con.end_year = c.value("end_year", s.end_year);
                    con.amount = c.value("amount", con.amount);
                    if (c.contains("account") && c["account"].is_string()) {
                        con.account = account_index(s, c["account"].get<std::string>());
                    } else {
                        con.account = c.value("account", con.account);
                    }
                });
                if (con.account < 0) {
                    throw ValidationError(id, indexed("contributions", i) + ".account",
                                          "no account named '" + c["account"].get<std::string>() + "'");
                }
                s.contributions.push_back(con);
            }
        }

        if (data.contains("income")) {
            const json& arr = list(data, "income", id);
            for (std::size_t i = 0; i < arr.size(); ++i) {
                field(indexed("income", i), [&] {
                    const json& in = arr[i];
                    IncomeStream st;
                    st.name = in.value("name", st.name);
                    st.start_year = in.value("start_year", s.start_year);
                    st.end_year = in.value("end_year", s.end_year);
                    st.amount = in.value("amount", st.amount);
                    st.growth = in.value("growth", st.growth);
                    st.taxable = in.value("taxable", st.taxable);
                    s.income.push_back(st);
                });
            }
        }

        if (data.contains("withdrawal_order")) {
            std::vector<std::string> order;
            field("withdrawal_order", [&] { order = data["withdrawal_order"].get<std::vector<std::string>>(); });
            s.withdrawal_order.clear();
            for (std::size_t i = 0; i < order.size(); ++i) {
                s.withdrawal_order.push_back(parse_account_type(order[i], id, indexed("withdrawal_order", i)));
            }
        }

        if (data.contains("withdrawal")) {
            const json& w = data["withdrawal"];
            std::string strategy = to_string(s.withdrawal.strategy);
            field("withdrawal", [&] {
                strategy = w.value("strategy", strategy);
                s.withdrawal.pre_tax_limit = w.value("pre_tax_limit", s.withdrawal.pre_tax_limit);
            });
            if (strategy == "ordered" || strategy == "standard") s.withdrawal.strategy = WithdrawalStrategy::Ordered;
            else if (strategy == "proportional") s.withdrawal.strategy = WithdrawalStrategy::Proportional;
            else if (strategy == "bracket_limited" || strategy == "tax_bracket") s.withdrawal.strategy = WithdrawalStrategy::BracketLimited;
            else throw ValidationError(id, "withdrawal.strategy", "unknown value '" + strategy + "'");
        }

        if (data.contains("roth")) {
            const json& r = data["roth"];
            std::string kind = to_string(s.roth.kind), funding = to_string(s.roth.funding);
            field("roth", [&] {
                kind = r.value("kind", kind);
                funding = r.value("funding", funding);
                s.roth.annual_cap = r.value("annual_cap", s.roth.annual_cap);
                s.roth.start_year = r.value("start_year", s.start_year);
                s.roth.end_year = r.value("end_year", s.end_year);
                s.roth.target_rate = r.value("target_rate", s.roth.target_rate);
            });
            if (kind == "none") s.roth.kind = ConversionKind::None;
            else if (kind == "fixed_cap") s.roth.kind = ConversionKind::FixedCap;
            else if (kind == "bracket_fill") s.roth.kind = ConversionKind::BracketFill;
            else throw ValidationError(id, "roth.kind", "unknown value '" + kind + "'");

            if (funding == "taxable") s.roth.funding = ConversionFunding::Taxable;
            else if (funding == "converted_amount") s.roth.funding = ConversionFunding::ConvertedAmount;
            else throw ValidationError(id, "roth.funding", "unknown value '" + funding + "'");
        }

        if (data.contains("assumptions")) {
            const json& a = data["assumptions"];
            std::string corr = to_string(s.assumptions.correlation);
            field("assumptions", [&] {
                s.assumptions.cola = a.value("cola", s.assumptions.cola);
                s.assumptions.ss_taxable_fraction = a.value("ss_taxable_fraction", s.assumptions.ss_taxable_fraction);
                s.assumptions.bracket_indexation = a.value("bracket_indexation", s.assumptions.bracket_indexation);
                corr = a.value("correlation", corr);
            });
            if (corr == "full") s.assumptions.correlation = CorrelationMode::Full;
            else if (corr == "independent") s.assumptions.correlation = CorrelationMode::Independent;
            else throw ValidationError(id, "assumptions.correlation", "unknown value '" + corr + "'");
        }

        s.validate_or_throw();
        return s;
    }

    static json scenario_to_json(const ScenarioInput& s) {
        json out;
        out["id"] = s.id;
        out["start_year"] = s.start_year;
        out["end_year"] = s.end_year;
        out["filing_status"] = s.filing_status;
        out["state"] = s.state;

        out["people"] = json::array();
        for (const auto& p : s.people) {
            out["people"].push_back({{"name", p.name}, {"birth_year", p.birth_year}, {"pia", p.pia},
                                     {"claiming_age", p.claiming_age}, {"death_age", p.death_age}});
        }

        out["accounts"] = json::array();
        for (const auto& a : s.accounts) {
            out["accounts"].push_back({{"name", a.name}, {"type", to_string(a.type)}, {"balance", a.balance},
                                       {"cost_basis", a.cost_basis}, {"mean_return", a.mean_return},
                                       {"volatility", a.volatility}, {"owner", a.owner}});
        }

        json items = json::array();
        for (const auto& it : s.spending.items) items.push_back({{"year", it.year}, {"amount", it.amount}});
        out["spending"] = {{"annual", s.spending.annual}, {"inflation", s.spending.inflation}, {"items", items}};

        out["contributions"] = json::array();
        for (const auto& c : s.contributions) {
            out["contributions"].push_back({{"account", c.account}, {"start_year", c.start_year},
                                            {"end_year", c.end_year}, {"amount", c.amount}});
        }

        out["income"] = json::array();
        for (const auto& in : s.income) {
            out["income"].push_back({{"name", in.name}, {"start_year", in.start_year}, {"end_year", in.end_year},
                                     {"amount", in.amount}, {"growth", in.growth}, {"taxable", in.taxable}});
        }

        out["withdrawal_order"] = json::array();
        for (AccountType t : s.withdrawal_order) out["withdrawal_order"].push_back(to_string(t));

        out["withdrawal"] = {{"strategy", to_string(s.withdrawal.strategy)},
                             {"pre_tax_limit", s.withdrawal.pre_tax_limit}};

        out["roth"] = {{"kind", to_string(s.roth.kind)}, {"annual_cap", s.roth.annual_cap},
                       {"start_year", s.roth.start_year}, {"end_year", s.roth.end_year},
                       {"target_rate", s.roth.target_rate}, {"funding", to_string(s.roth.funding)}};

        out["assumptions"] = {{"cola", s.assumptions.cola},
                              {"ss_taxable_fraction", s.assumptions.ss_taxable_fraction},
                              {"bracket_indexation", s.assumptions.bracket_indexation},
                              {"correlation", to_string(s.assumptions.correlation)}};
        return out;
    }

    // ------------------------------------------------------------------
    // Tax tables
    // ------------------------------------------------------------------

    static TaxTable load_tax_table(const std::string& filepath) {
        json data = read_file(filepath, "tax table");
        TaxTable t = tax_table_from_json(data);
        std::cout << "[Glidepath::IO] Loaded tax tables for " << t.federal_tables().size()
                  << " years from " << filepath << std::endl;
        return t;
    }

    static void save_tax_table(const TaxTable& t, const std::string& filepath) {
        write_file(tax_table_to_json(t), filepath, "tax table");
    }

    static TaxTable tax_table_from_json(const json& data) {
        if (!data.is_object()) throw DataError("tax table document must be a JSON object");
        TaxTable table;
        for (auto& [year_key, entry] : data.items()) {
            int year = parse_year(year_key);
            const std::string where = "tax table " + year_key;
            try {
                if (entry.contains("federal")) {
                    for (auto& [status, f] : entry["federal"].items()) {
                        FederalSchedule fs;
                        fs.standard_deduction = f.value("standard_deduction", 0.0);
                        fs.ordinary = parse_brackets(f.at("ordinary"));
                        if (f.contains("capital_gains")) fs.capital_gains = parse_brackets(f["capital_gains"]);
                        else fs.capital_gains.brackets = {{0.0, 0.0}};
                        table.add_federal(year, status, fs);
                    }
                }
                if (entry.contains("state")) {
                    for (auto& [code, st] : entry["state"].items()) {
                        if (is_state_schedule(st)) {
                            table.add_state(year, code, TaxTable::kAllStatuses, parse_state(st));
                        } else {
                            for (auto& [status, sched] : st.items()) {
                                table.add_state(year, code, status, parse_state(sched));
                            }
                        }
                    }
                }
            } catch (const json::exception& e) {
                throw DataError(where + ": " + e.what());
            }
        }
        if (table.empty()) throw DataError("tax table document has no federal schedules");
        return table;
    }

    static json tax_table_to_json(const TaxTable& t) {
        json out = json::object();
        for (const auto& [year, statuses] : t.federal_tables()) {
            json& f = out[std::to_string(year)]["federal"];
            for (const auto& [status, fs] : statuses) {
                f[status] = {{"standard_deduction", fs.standard_deduction},
                             {"ordinary", brackets_to_json(fs.ordinary)},
                             {"capital_gains", brackets_to_json(fs.capital_gains)}};
            }
        }
        for (const auto& [year, states] : t.state_tables()) {
            json& st = out[std::to_string(year)]["state"];
            for (const auto& [code, statuses] : states) {
                for (const auto& [status, ss] : statuses) {
                    json sched = {{"standard_deduction", ss.standard_deduction},
                                  {"brackets", brackets_to_json(ss.brackets)},
                                  {"includes_capital_gains", ss.includes_capital_gains}};
                    if (status == TaxTable::kAllStatuses) st[code] = sched;
                    else st[code][status] = sched;
                }
            }
        }
        return out;
    }

private:
    static json read_file(const std::string& filepath, const char* what) {
        std::ifstream f(filepath);
        if (!f.is_open()) {
            throw std::runtime_error("Could not open " + std::string(what) + " file: " + filepath);
        }
        try {
            return json::parse(f);
        } catch (const json::parse_error& e) {
            throw std::runtime_error("Could not parse " + std::string(what) + " file " + filepath + ": " + e.what());
        }
    }

    static void write_file(const json& data, const std::string& filepath, const char* what) {
        std::ofstream f(filepath);
        if (!f.is_open()) {
            throw std::runtime_error("Could not write " + std::string(what) + " file: " + filepath);
        }
        f << std::setw(2) << data << std::endl;
        std::cout << "[Glidepath::IO] Wrote " << what << " to " << filepath << std::endl;
    }

    static const json& list(const json& data, const char* key, const std::string& id) {
        const json& arr = data[key];
        if (!arr.is_array()) throw ValidationError(id, key, "must be a JSON array");
        return arr;
    }

    static std::string indexed(const char* list, std::size_t i) {
        return std::string(list) + "[" + std::to_string(i) + "]";
    }

    static AccountType parse_account_type(const std::string& v, const std::string& id, const std::string& path) {
        if (v == "taxable") return AccountType::Taxable;
        if (v == "tax_deferred") return AccountType::TaxDeferred;
        if (v == "roth") return AccountType::Roth;
        throw ValidationError(id, path, "unknown account type '" + v + "'");
    }

    static int account_index(const ScenarioInput& s, const std::string& name) {
        for (std::size_t i = 0; i < s.accounts.size(); ++i) {
            if (s.accounts[i].name == name) return static_cast<int>(i);
        }
        return -1;
    }

    static int parse_year(const std::string& key) {
        try {
            std::size_t used = 0;
            int year = std::stoi(key, &used);
            if (used == key.size()) return year;
        } catch (const std::exception&) {
        }
        throw DataError("tax table key '" + key + "' is not a year");
    }

    static BracketSchedule parse_brackets(const json& arr) {
        BracketSchedule b;
        for (const auto& pair : arr) {
            if (!pair.is_array() || pair.size() != 2) {
                throw DataError("bracket entries must be [lower_bound, rate] pairs");
            }
            b.brackets.push_back({pair[0].get<double>(), pair[1].get<double>()});
        }
        return b;
    }

    static json brackets_to_json(const BracketSchedule& b) {
        json arr = json::array();
        for (const auto& br : b.brackets) arr.push_back({br.lower, br.rate});
        return arr;
    }

    static bool is_state_schedule(const json& j) {
        return j.contains("rate") || j.contains("brackets");
    }

    // Flat shorthand {"rate": r} is a single bracket starting at 0
    static StateSchedule parse_state(const json& j) {
        StateSchedule s;
        s.standard_deduction = j.value("standard_deduction", 0.0);
        s.includes_capital_gains = j.value("includes_capital_gains", false);
        if (j.contains("brackets")) s.brackets = parse_brackets(j["brackets"]);
        else s.brackets.brackets = {{0.0, j.at("rate").get<double>()}};
        return s;
    }
};

} // namespace Glidepath
