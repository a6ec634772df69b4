#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "audit_trail.hpp"
#include "config.hpp"
#include "credit/credit_risk_engine.hpp"
#include "credit/exposure.hpp"
#include "io/json_writer.hpp"
#include "liability/cash_flow_schedule.hpp"
#include "liability/liability_engine.hpp"
#include "logger.hpp"
#include "macro_context.hpp"
#include "serialization.hpp"
#include "solvency/guarantee_fund.hpp"
#include "solvency/solvency_engine.hpp"

#include <nlohmann/json.hpp>
using json = nlohmann::json;

namespace {

struct CLIArgs {
    std::string macro_path;
    std::string config_path;
    std::string exposures_path;
    std::string scenario = "weighted";
    std::string cash_flows_path;
    double acquisition_costs = 0.0;
    std::string ra_method = "coc";
    std::string model = "gmm";
    bool vfa_eligible = false;
    std::string solvency_path;
    std::string guarantee_fund_path;
    std::string audit_log_path;
    std::string log_level;
    std::string output_path;
    bool help = false;
};

void print_usage(const char* program_name) {
    std::cerr << "regcalc v1.0.0\n\n";
    std::cerr << "Usage: " << program_name << " --macro <path> [options]\n\n";
    std::cerr << "Required:\n";
    std::cerr << "  --macro <path>              JSON macro context (rates, scenarios, valuation date)\n\n";
    std::cerr << "Configuration:\n";
    std::cerr << "  --config <path>             JSON engine configuration (default: built-in values)\n";
    std::cerr << "  --log-level <level>         DEBUG, INFO, WARN or ERROR\n\n";
    std::cerr << "Credit (ECL):\n";
    std::cerr << "  --exposures <path>          CSV or Parquet file with credit exposures\n";
    std::cerr << "  --scenario <name>           base, adverse, severe or weighted (default: weighted)\n\n";
    std::cerr << "Insurance liability:\n";
    std::cerr << "  --cash-flows <path>         CSV cash-flow schedule\n";
    std::cerr << "  --acquisition-costs <amt>   Acquisition costs at recognition (default: 0)\n";
    std::cerr << "  --ra-method <method>        var, tvar, coc or cte (default: coc)\n";
    std::cerr << "  --model <model>             gmm, vfa or paa (default: gmm)\n";
    std::cerr << "  --vfa-eligible              Contracts meet all direct-participation criteria\n\n";
    std::cerr << "Solvency:\n";
    std::cerr << "  --solvency <path>           JSON premium/claims bases and own-funds inputs\n";
    std::cerr << "  --guarantee-fund <path>     JSON fund balance and member insurers\n\n";
    std::cerr << "Output options:\n";
    std::cerr << "  --audit-log <path>          Append audit records as JSON lines\n";
    std::cerr << "  --output <path>             JSON report file (default: stdout)\n\n";
    std::cerr << "Other options:\n";
    std::cerr << "  --help                      Show this help message\n\n";
    std::cerr << "Example:\n";
    std::cerr << "  " << program_name << " --macro data/macro.json \\\n";
    std::cerr << "      --exposures data/exposures.csv --scenario weighted \\\n";
    std::cerr << "      --cash-flows data/cash_flows.csv --acquisition-costs 10000000 --ra-method coc \\\n";
    std::cerr << "      --solvency data/solvency.json --guarantee-fund data/guarantee_fund.json \\\n";
    std::cerr << "      --output report.json\n";
}

bool file_exists(const std::string& path) {
    std::ifstream f(path);
    return f.good();
}

bool ends_with(const std::string& str, const std::string& suffix) {
    if (str.length() < suffix.length()) return false;
    return str.compare(str.length() - suffix.length(), suffix.length(), suffix) == 0;
}

bool parse_args(int argc, char* argv[], CLIArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            args.help = true;
            return true;
        } else if (arg == "--macro" && i + 1 < argc) {
            args.macro_path = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--exposures" && i + 1 < argc) {
            args.exposures_path = argv[++i];
        } else if (arg == "--scenario" && i + 1 < argc) {
            args.scenario = argv[++i];
        } else if (arg == "--cash-flows" && i + 1 < argc) {
            args.cash_flows_path = argv[++i];
        } else if (arg == "--acquisition-costs" && i + 1 < argc) {
            try {
                args.acquisition_costs = std::stod(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Error: --acquisition-costs expects a number\n\n";
                return false;
            }
        } else if (arg == "--ra-method" && i + 1 < argc) {
            args.ra_method = argv[++i];
        } else if (arg == "--model" && i + 1 < argc) {
            args.model = argv[++i];
        } else if (arg == "--vfa-eligible") {
            args.vfa_eligible = true;
        } else if (arg == "--solvency" && i + 1 < argc) {
            args.solvency_path = argv[++i];
        } else if (arg == "--guarantee-fund" && i + 1 < argc) {
            args.guarantee_fund_path = argv[++i];
        } else if (arg == "--audit-log" && i + 1 < argc) {
            args.audit_log_path = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            args.log_level = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            args.output_path = argv[++i];
        } else {
            std::cerr << "Error: Unknown option or missing argument: " << arg << "\n\n";
            return false;
        }
    }
    return true;
}

bool validate_args(const CLIArgs& args) {
    bool valid = true;

    if (args.macro_path.empty()) {
        std::cerr << "Error: --macro is required\n";
        valid = false;
    } else if (!file_exists(args.macro_path)) {
        std::cerr << "Error: Macro file not found: " << args.macro_path << "\n";
        valid = false;
    }

    const std::vector<std::pair<std::string, std::string>> optional_files = {
        {"Config", args.config_path},
        {"Exposures", args.exposures_path},
        {"Cash-flow", args.cash_flows_path},
        {"Solvency", args.solvency_path},
        {"Guarantee fund", args.guarantee_fund_path}};
    for (const auto& file : optional_files) {
        if (!file.second.empty() && !file_exists(file.second)) {
            std::cerr << "Error: " << file.first << " file not found: " << file.second << "\n";
            valid = false;
        }
    }

    if (args.exposures_path.empty() && args.cash_flows_path.empty() && args.solvency_path.empty() &&
        args.guarantee_fund_path.empty()) {
        std::cerr << "Error: Provide at least one of --exposures, --cash-flows, --solvency or --guarantee-fund\n";
        valid = false;
    }

    if (args.acquisition_costs < 0) {
        std::cerr << "Error: --acquisition-costs must be non-negative\n";
        valid = false;
    }

    try {
        regcalc::parse_scenario_kind(args.scenario);
    } catch (const regcalc::ValidationError&) {
        std::cerr << "Error: --scenario must be base, adverse, severe or weighted\n";
        valid = false;
    }
    try {
        regcalc::liability::parse_ra_method(args.ra_method);
    } catch (const regcalc::ValidationError&) {
        std::cerr << "Error: --ra-method must be var, tvar, coc or cte\n";
        valid = false;
    }
    try {
        regcalc::liability::parse_measurement_model(args.model);
    } catch (const regcalc::ValidationError&) {
        std::cerr << "Error: --model must be gmm, vfa or paa\n";
        valid = false;
    }

    if (!args.log_level.empty() && args.log_level != "DEBUG" && args.log_level != "INFO" &&
        args.log_level != "WARN" && args.log_level != "ERROR") {
        std::cerr << "Error: --log-level must be DEBUG, INFO, WARN or ERROR\n";
        valid = false;
    }

    return valid;
}

// Solvency request file: bases, margin options, own funds and optional
// adjustment overrides
struct SolvencyRequest {
    double premium_base = 0.0;
    double claims_base = 0.0;
    regcalc::solvency::MarginOptions options;
    regcalc::solvency::OwnFundsInputs own_funds;
    json adjustments = json::object();
};

SolvencyRequest parse_solvency_request(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw std::runtime_error("Failed to open solvency input: " + path);
    }

    json j;
    try {
        f >> j;
    } catch (const json::exception& e) {
        throw std::runtime_error("Failed to parse JSON: " + std::string(e.what()));
    }

    SolvencyRequest request;
    try {
        request.premium_base = j.at("premium_base").get<double>();
        request.claims_base = j.at("claims_base").get<double>();
        request.options = j.get<regcalc::solvency::MarginOptions>();
        if (j.contains("own_funds")) {
            request.own_funds = j["own_funds"].get<regcalc::solvency::OwnFundsInputs>();
        }
        if (j.contains("adjustments")) {
            request.adjustments = j["adjustments"];
        }
    } catch (const json::exception& e) {
        throw std::runtime_error("Invalid solvency input: " + std::string(e.what()));
    }
    return request;
}

// Guarantee fund request file: fund balance and member profiles. The member
// named by reporting_insurer takes this run's solvency ratio when it has none.
struct GuaranteeFundRequest {
    double fund_balance = 0.0;
    std::vector<regcalc::solvency::InsurerProfile> insurers;
    std::string reporting_insurer;
};

GuaranteeFundRequest parse_guarantee_fund_request(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw std::runtime_error("Failed to open guarantee fund input: " + path);
    }

    json j;
    try {
        f >> j;
    } catch (const json::exception& e) {
        throw std::runtime_error("Failed to parse JSON: " + std::string(e.what()));
    }

    GuaranteeFundRequest request;
    try {
        request.fund_balance = j.at("fund_balance").get<double>();
        request.reporting_insurer = j.value("reporting_insurer", std::string());
        for (const auto& entry : j.value("insurers", json::array())) {
            request.insurers.push_back(entry.get<regcalc::solvency::InsurerProfile>());
        }
    } catch (const json::exception& e) {
        throw std::runtime_error("Invalid guarantee fund input: " + std::string(e.what()));
    }
    return request;
}

void write_audit_log(const std::string& path, const std::vector<regcalc::AuditRecord>& records) {
    std::ofstream file(path, std::ios::app);
    if (!file) {
        throw std::runtime_error("Failed to open audit log: " + path);
    }
    regcalc::StreamAuditSink sink(file);
    for (const auto& record : records) {
        sink.append(record);
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CLIArgs args;

    if (!parse_args(argc, argv, args)) {
        print_usage(argv[0]);
        return 1;
    }

    if (args.help) {
        print_usage(argv[0]);
        return 0;
    }

    if (!validate_args(args)) {
        std::cerr << "\nUse --help for usage information.\n";
        return 1;
    }

    try {
        auto start_time = std::chrono::high_resolution_clock::now();

        regcalc::EngineConfig config;
        if (!args.config_path.empty()) {
            config = regcalc::parse_engine_config_from_file(args.config_path);
        }
        if (!args.log_level.empty()) {
            config.logging.min_level = regcalc::string_to_level(args.log_level);
        }
        regcalc::Logger::get_instance().configure(config.logging);

        regcalc::MacroContext macro = regcalc::parse_macro_context_from_file(args.macro_path);
        regcalc::InMemoryAuditTrail audit;
        regcalc::io::RegcalcReport report;

        // Credit: portfolio ECL and scenario stress
        if (!args.exposures_path.empty()) {
            regcalc::credit::ExposureSet exposures = ends_with(args.exposures_path, ".parquet")
                ? regcalc::credit::ExposureSet::load_from_parquet(args.exposures_path)
                : regcalc::credit::ExposureSet::load_from_csv(args.exposures_path);
            std::cerr << "Loaded " << exposures.size() << " exposures from " << args.exposures_path << "\n";

            regcalc::credit::CreditRiskEngine credit(config.credit, config.rounding, audit);
            report.credit = credit.quantify_portfolio(
                exposures.exposures(), macro, regcalc::parse_scenario_kind(args.scenario));
            report.credit_stress = credit.stress_test(report.credit->total_ecl, macro);
        }

        // Insurance liability
        if (!args.cash_flows_path.empty()) {
            regcalc::liability::CashFlowSchedule schedule =
                regcalc::liability::CashFlowSchedule::load_from_csv(args.cash_flows_path);
            std::cerr << "Loaded " << schedule.size() << " cash-flow periods from " << args.cash_flows_path << "\n";

            std::optional<regcalc::liability::VFAFeatures> features;
            if (args.vfa_eligible) {
                features = regcalc::liability::VFAFeatures(true, true, true);
            }
            regcalc::liability::LiabilityEngine liability(config.liability, config.rounding, audit);
            report.liability = liability.measure_liability(
                schedule, args.acquisition_costs,
                regcalc::liability::parse_ra_method(args.ra_method),
                regcalc::liability::parse_measurement_model(args.model),
                macro, features);
        }

        // Solvency, with adjustments from the engines above unless overridden
        if (!args.solvency_path.empty()) {
            SolvencyRequest request = parse_solvency_request(args.solvency_path);

            regcalc::solvency::IFRSAdjustments adjustments;
            if (report.credit) {
                adjustments.ecl = report.credit->total_ecl;
            }
            if (report.liability) {
                adjustments.csm = report.liability->csm.csm;
            }
            try {
                regcalc::solvency::from_json(request.adjustments, adjustments);
            } catch (const json::exception& e) {
                throw std::runtime_error("Invalid solvency adjustments: " + std::string(e.what()));
            }

            regcalc::solvency::SolvencyEngine solvency(config.solvency, config.rounding, audit);
            report.solvency = solvency.assess_solvency(
                request.premium_base, request.claims_base, request.own_funds, adjustments, macro,
                request.options);
        }

        // Guarantee fund, consuming this run's solvency ratio for the reporting insurer
        if (!args.guarantee_fund_path.empty()) {
            GuaranteeFundRequest request = parse_guarantee_fund_request(args.guarantee_fund_path);
            if (report.solvency && !request.reporting_insurer.empty()) {
                for (auto& insurer : request.insurers) {
                    if (insurer.name == request.reporting_insurer && !insurer.solvency_ratio) {
                        insurer.solvency_ratio = report.solvency->ratio.ratio;
                    }
                }
            }
            std::cerr << "Loaded " << request.insurers.size() << " fund members from "
                      << args.guarantee_fund_path << "\n";

            regcalc::solvency::GuaranteeFundEngine fund(config.solvency.guarantee_fund, config.rounding, audit);
            report.guarantee_fund = fund.assess(request.insurers, request.fund_balance);
            for (const auto& insurer : request.insurers) {
                report.early_warnings.push_back(fund.early_warning_indicators(insurer));
            }
        }

        report.audit_records = audit.records();
        report.execution_time_ms = std::chrono::duration<double, std::milli>(
            std::chrono::high_resolution_clock::now() - start_time).count();

        if (!args.audit_log_path.empty()) {
            write_audit_log(args.audit_log_path, report.audit_records);
        }

        if (report.solvency) {
            std::cerr << "Solvency ratio: " << report.solvency->ratio.ratio
                      << (report.solvency->ratio.compliant ? " (compliant)" : " (non-compliant)") << "\n";
        }

        if (report.guarantee_fund && !report.guarantee_fund->empty()) {
            std::cerr << "Guarantee fund adequacy: " << report.guarantee_fund->adequacy.current_ratio
                      << (report.guarantee_fund->adequacy.adequate ? " (adequate)" : " (inadequate)") << "\n";
        }

        if (args.output_path.empty()) {
            regcalc::io::write_report_json(std::cout, report);
        } else {
            regcalc::io::write_report_json(args.output_path, report);
            std::cerr << "Output written to: " << args.output_path << "\n";
        }

        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
