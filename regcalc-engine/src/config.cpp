#include "config.hpp"
#include "errors.hpp"
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>

using json = nlohmann::json;

namespace regcalc {

// ============================================================================
// Defaults
// ============================================================================

StageThresholds::StageThresholds()
    : stage2_days_past_due(30),
      stage3_days_past_due(90),
      pd_relative_increase(2.0),
      pd_absolute_increase(0.005) {}

LogisticPDCoefficients::LogisticPDCoefficients()
    : intercept(-3.5), gdp_growth(-0.15), inflation(0.08) {}

CreditConfig::CreditConfig()
    : thresholds(),
      lgd_by_collateral{
          {credit::CollateralType::Unsecured, 0.69},
          {credit::CollateralType::SecuredRealEstate, 0.35},
          {credit::CollateralType::SecuredVehicles, 0.50},
          {credit::CollateralType::SecuredDeposits, 0.15},
          {credit::CollateralType::Sovereign, 0.45}},
      ccf_by_facility{
          {credit::FacilityType::CreditLines, 0.50},
          {credit::FacilityType::Guarantees, 0.75},
          {credit::FacilityType::LettersOfCredit, 0.60},
          {credit::FacilityType::UnusedLimits, 0.40}},
      default_ccf(0.50),
      reference_inflation(0.05),
      reference_base_rate(0.10),
      lgd_inflation_sensitivity(0.05),
      lgd_rate_sensitivity(0.10),
      max_remaining_term(credit::MAX_REMAINING_TERM),
      stage3_uplift(0.20),
      stage3_uplift_days(90),
      logistic(),
      default_asset_correlation(0.30),
      max_simulations(10000),
      seed(42),
      regulatory_reference("IFRS 9 5.5 Impairment") {}

double CreditConfig::base_lgd(credit::CollateralType type) const {
    auto it = lgd_by_collateral.find(type);
    return it != lgd_by_collateral.end() ? it->second : lgd_by_collateral.at(credit::CollateralType::Unsecured);
}

double CreditConfig::ccf(credit::FacilityType type) const {
    auto it = ccf_by_facility.find(type);
    return it != ccf_by_facility.end() ? it->second : default_ccf;
}

ReinsuranceConfig::ReinsuranceConfig()
    : held_relief(0.40), issued_relief(0.25) {}

LiabilityConfig::LiabilityConfig()
    : illiquidity_premium(0.005),
      illiquidity_term_factors{{3, 0.80}, {4, 0.75}},
      long_term_illiquidity_factor(0.70),
      discount_method(DiscountMethod::Continuous),
      default_lapse_rate(0.05),
      var_confidence(0.95),
      tvar_confidence(0.90),
      cte_confidence(0.90),
      single_period_volatility(0.10),
      coc_rate(0.065),
      coc_capital_factor(0.10),
      simulations(1000),
      max_simulations(10000),
      seed(42),
      risk_correlations(),
      default_risk_correlation(0.25),
      lic_coefficient_of_variation(0.15),
      lic_discount_duration(2.0),
      finance_duration(5.0),
      profitability_band(0.05),
      reinsurance(),
      regulatory_reference("IFRS 17 Insurance Contracts") {
    set_risk_correlation("mortality", "lapse", 0.50);
    set_risk_correlation("mortality", "morbidity", 0.25);
    set_risk_correlation("lapse", "expense", 0.30);
}

double LiabilityConfig::illiquidity_factor(uint32_t term) const {
    auto it = illiquidity_term_factors.lower_bound(term);
    return it != illiquidity_term_factors.end() ? it->second : long_term_illiquidity_factor;
}

double LiabilityConfig::risk_correlation(const std::string& a, const std::string& b) const {
    if (a == b) {
        return 1.0;
    }
    auto key = a < b ? std::make_pair(a, b) : std::make_pair(b, a);
    auto it = risk_correlations.find(key);
    return it != risk_correlations.end() ? it->second : default_risk_correlation;
}

void LiabilityConfig::set_risk_correlation(const std::string& a, const std::string& b, double rho) {
    auto key = a < b ? std::make_pair(a, b) : std::make_pair(b, a);
    risk_correlations[key] = rho;
}

TierSchedule::TierSchedule() : rate_tier1(0.0), threshold(0.0), rate_tier2(0.0) {}

TierSchedule::TierSchedule(double r1, double t, double r2)
    : rate_tier1(r1), threshold(t), rate_tier2(r2) {}

StressScenarioConfig::StressScenarioConfig()
    : name(), own_funds_shock(0.0), margin_shock(0.0) {}

StressScenarioConfig::StressScenarioConfig(const std::string& n, double of, double mm)
    : name(n), own_funds_shock(of), margin_shock(mm) {}

ScrShocks::ScrShocks()
    : equity_type1(0.39), equity_type2(0.49), property(0.25),
      interest_rate(0.20), spread(0.10) {}

GuaranteeFundConfig::GuaranteeFundConfig()
    : rate_low_risk(0.005),
      rate_medium_risk(0.010),
      rate_high_risk(0.020),
      required_adequacy_ratio(1.20),
      fund_share_of_reserves(0.10),
      no_claims_adequacy(10.0),
      no_claims_ratio(100.0),
      default_pd(0.05),
      default_recovery(0.30),
      default_correlation(0.30),
      simulations(1000),
      max_simulations(10000),
      seed(42),
      regulatory_reference("Insurance Payment Guarantee Fund Act No. 423-II") {}

SolvencyConfig::SolvencyConfig()
    : premium_tiers(0.18, 3500000000.0, 0.16),
      claims_tiers(0.26, 2500000000.0, 0.23),
      correction_coefficient_default(0.70),
      correction_coefficient_min(0.50),
      correction_coefficient_max(0.85),
      annuity_reserve_rate(0.08),
      mathematical_reserve_rate(0.03),
      compulsory_loading(0.50),
      guaranteed_fund_units_primary(500000.0),
      guaranteed_fund_units_reinsurance(3500000.0),
      subordinated_debt_cap(0.50),
      repo_limit_before(0.50),
      repo_limit_after(0.35),
      repo_limit_switch_date(2025, 7, 1),
      repo_penalty_rate(0.05),
      stress_scenarios{
          {"base", 0.0, 0.0},
          {"adverse", -0.20, 0.10},
          {"severe", -0.40, 0.20}},
      stress_simulations(1000),
      max_simulations(10000),
      own_funds_volatility(0.15),
      margin_volatility(0.05),
      tail_confidence(0.995),
      seed(42),
      minimum_ratio(1.0),
      status_excellent(2.0),
      status_good(1.5),
      scr(),
      operational_bscr_cap(0.30),
      operational_premium_rate(0.03),
      operational_provision_rate(0.03),
      high_liquid_ratio_minimum(1.0),
      guarantee_fund(),
      regulatory_reference("Prudential solvency margin standard") {}

EngineConfig::EngineConfig()
    : rounding(), credit(), liability(), solvency(), logging() {}

// ============================================================================
// Validation
// ============================================================================

namespace {

void require(bool condition, const std::string& field, const std::string& message) {
    if (!condition) {
        throw ConfigError(field + ": " + message);
    }
}

bool is_rate(double value) {
    return std::isfinite(value) && value >= 0.0 && value <= 1.0;
}

bool is_confidence(double value) {
    return std::isfinite(value) && value > 0.0 && value < 1.0;
}

void validate_tiers(const TierSchedule& tiers, const std::string& name) {
    require(is_rate(tiers.rate_tier1), name + ".rate_tier1", "must be in [0, 1]");
    require(is_rate(tiers.rate_tier2), name + ".rate_tier2", "must be in [0, 1]");
    require(std::isfinite(tiers.threshold) && tiers.threshold >= 0.0, name + ".threshold", "must be non-negative");
}

} // anonymous namespace

void validate_engine_config(const EngineConfig& config) {
    const auto& r = config.rounding;
    require(r.currency_decimals >= 0 && r.currency_decimals <= 8, "rounding.currency_decimals", "must be 0-8");
    require(r.ratio_decimals >= 0 && r.ratio_decimals <= 12, "rounding.ratio_decimals", "must be 0-12");
    require(r.digest_decimals >= r.currency_decimals && r.digest_decimals >= r.ratio_decimals &&
            r.digest_decimals <= 12, "rounding.digest_decimals", "must be 0-12 and not below the other precisions");

    const auto& c = config.credit;
    require(c.thresholds.stage2_days_past_due < c.thresholds.stage3_days_past_due,
            "credit.stage2_days_past_due", "must be below stage3_days_past_due");
    require(c.thresholds.pd_relative_increase > 1.0, "credit.pd_relative_increase", "must exceed 1");
    require(c.thresholds.pd_absolute_increase > 0.0, "credit.pd_absolute_increase", "must be positive");
    for (const auto& [type, lgd] : c.lgd_by_collateral) {
        require(is_rate(lgd), "credit.lgd_by_collateral." + credit::to_string(type), "must be in [0, 1]");
    }
    require(c.lgd_by_collateral.count(credit::CollateralType::Unsecured) == 1,
            "credit.lgd_by_collateral.unsecured", "is required");
    for (const auto& [type, ccf] : c.ccf_by_facility) {
        require(is_rate(ccf), "credit.ccf_by_facility." + credit::to_string(type), "must be in [0, 1]");
    }
    require(is_rate(c.default_ccf), "credit.default_ccf", "must be in [0, 1]");
    require(c.max_remaining_term > 0, "credit.max_remaining_term", "must be positive");
    require(c.stage3_uplift >= 0.0, "credit.stage3_uplift", "must be non-negative");
    require(c.stage3_uplift_days > 0, "credit.stage3_uplift_days", "must be positive");
    require(c.default_asset_correlation >= 0.0 && c.default_asset_correlation < 1.0,
            "credit.default_asset_correlation", "must be in [0, 1)");
    require(c.max_simulations > 0, "credit.max_simulations", "must be positive");

    const auto& l = config.liability;
    require(std::isfinite(l.illiquidity_premium) && l.illiquidity_premium >= 0.0,
            "liability.illiquidity_premium", "must be non-negative");
    require(l.default_lapse_rate >= 0.0 && l.default_lapse_rate < 1.0,
            "liability.default_lapse_rate", "must be in [0, 1)");
    require(is_confidence(l.var_confidence), "liability.var_confidence", "must be in (0, 1)");
    require(is_confidence(l.tvar_confidence), "liability.tvar_confidence", "must be in (0, 1)");
    require(is_confidence(l.cte_confidence), "liability.cte_confidence", "must be in (0, 1)");
    require(is_rate(l.coc_rate), "liability.coc_rate", "must be in [0, 1]");
    require(l.coc_capital_factor >= 0.0, "liability.coc_capital_factor", "must be non-negative");
    require(l.simulations > 0, "liability.simulations", "must be positive");
    require(l.max_simulations >= l.simulations, "liability.max_simulations", "must be at least simulations");
    for (const auto& [pair, rho] : l.risk_correlations) {
        require(rho >= -1.0 && rho <= 1.0, "liability.risk_correlations." + pair.first + "." + pair.second,
                "must be in [-1, 1]");
    }
    require(l.default_risk_correlation >= -1.0 && l.default_risk_correlation <= 1.0,
            "liability.default_risk_correlation", "must be in [-1, 1]");
    require(is_rate(l.reinsurance.held_relief), "liability.reinsurance.held_relief", "must be in [0, 1]");
    require(is_rate(l.reinsurance.issued_relief), "liability.reinsurance.issued_relief", "must be in [0, 1]");
    require(l.profitability_band >= 0.0, "liability.profitability_band", "must be non-negative");

    const auto& s = config.solvency;
    validate_tiers(s.premium_tiers, "solvency.premium_tiers");
    validate_tiers(s.claims_tiers, "solvency.claims_tiers");
    require(s.correction_coefficient_min <= s.correction_coefficient_default &&
            s.correction_coefficient_default <= s.correction_coefficient_max,
            "solvency.correction_coefficient_default", "must lie within [min, max]");
    require(is_rate(s.subordinated_debt_cap), "solvency.subordinated_debt_cap", "must be in [0, 1]");
    require(is_rate(s.repo_limit_before) && is_rate(s.repo_limit_after), "solvency.repo_limit", "must be in [0, 1]");
    require(s.stress_simulations > 0, "solvency.stress_simulations", "must be positive");
    require(s.max_simulations >= s.stress_simulations, "solvency.max_simulations", "must be at least stress_simulations");
    require(s.own_funds_volatility >= 0.0 && s.margin_volatility >= 0.0, "solvency.volatility", "must be non-negative");
    require(is_confidence(s.tail_confidence), "solvency.tail_confidence", "must be in (0, 1)");
    require(s.status_excellent >= s.status_good && s.status_good >= s.minimum_ratio,
            "solvency.status_bands", "must be ordered excellent >= good >= minimum");
    for (const auto& scenario : s.stress_scenarios) {
        require(!scenario.name.empty(), "solvency.stress_scenarios", "scenario name must not be empty");
        require(scenario.own_funds_shock > -1.0 && scenario.margin_shock > -1.0,
                "solvency.stress_scenarios." + scenario.name, "shocks must exceed -100%");
    }
    require(is_rate(s.operational_bscr_cap), "solvency.operational_bscr_cap", "must be in [0, 1]");

    const auto& g = s.guarantee_fund;
    require(is_rate(g.rate_low_risk) && is_rate(g.rate_medium_risk) && is_rate(g.rate_high_risk),
            "solvency.guarantee_fund.rates", "must be in [0, 1]");
    require(g.rate_low_risk <= g.rate_medium_risk && g.rate_medium_risk <= g.rate_high_risk,
            "solvency.guarantee_fund.rates", "must not decrease with risk class");
    require(g.required_adequacy_ratio > 0.0, "solvency.guarantee_fund.required_adequacy_ratio", "must be positive");
    require(is_rate(g.fund_share_of_reserves), "solvency.guarantee_fund.fund_share_of_reserves", "must be in [0, 1]");
    require(is_rate(g.default_pd), "solvency.guarantee_fund.default_pd", "must be in [0, 1]");
    require(is_rate(g.default_recovery), "solvency.guarantee_fund.default_recovery", "must be in [0, 1]");
    require(g.default_correlation >= 0.0 && g.default_correlation < 1.0,
            "solvency.guarantee_fund.default_correlation", "must be in [0, 1)");
    require(g.simulations > 0, "solvency.guarantee_fund.simulations", "must be positive");
    require(g.max_simulations >= g.simulations, "solvency.guarantee_fund.max_simulations",
            "must be at least simulations");
}

// ============================================================================
// Parsing
// ============================================================================

std::string expand_environment_variables(const std::string& value) {
    std::string result = value;
    size_t pos = 0;

    while ((pos = result.find('$', pos)) != std::string::npos) {
        size_t start = pos;
        pos++;

        bool braces = false;
        if (pos < result.size() && result[pos] == '{') {
            braces = true;
            pos++;
        }

        size_t name_start = pos;
        while (pos < result.size() &&
               (std::isalnum(static_cast<unsigned char>(result[pos])) || result[pos] == '_')) {
            pos++;
        }
        std::string var_name = result.substr(name_start, pos - name_start);

        if (braces && pos < result.size() && result[pos] == '}') {
            pos++;
        }

        const char* env_value = std::getenv(var_name.c_str());
        std::string replacement = env_value ? env_value : "";

        result.replace(start, pos - start, replacement);
        pos = start + replacement.size();
    }

    return result;
}

namespace {

template <typename T>
void read_if(const json& j, const char* key, T& target) {
    if (j.contains(key)) {
        target = j.at(key).get<T>();
    }
}

void read_tiers(const json& j, const char* key, TierSchedule& tiers) {
    if (!j.contains(key)) {
        return;
    }
    const json& t = j.at(key);
    read_if(t, "rate_tier1", tiers.rate_tier1);
    read_if(t, "threshold", tiers.threshold);
    read_if(t, "rate_tier2", tiers.rate_tier2);
}

void parse_rounding(const json& j, RoundingConfig& rounding) {
    read_if(j, "currency_decimals", rounding.currency_decimals);
    read_if(j, "ratio_decimals", rounding.ratio_decimals);
    read_if(j, "digest_decimals", rounding.digest_decimals);
}

void parse_logging(const json& j, LoggerConfig& logging) {
    if (j.contains("level")) {
        logging.min_level = string_to_level(j.at("level").get<std::string>());
    }
    read_if(j, "console", logging.enable_console);
    read_if(j, "json", logging.enable_json);
    if (j.contains("file")) {
        logging.enable_file = true;
        logging.log_file_path = expand_environment_variables(j.at("file").get<std::string>());
    }
}

void parse_credit(const json& j, CreditConfig& credit) {
    read_if(j, "stage2_days_past_due", credit.thresholds.stage2_days_past_due);
    read_if(j, "stage3_days_past_due", credit.thresholds.stage3_days_past_due);
    read_if(j, "pd_relative_increase", credit.thresholds.pd_relative_increase);
    read_if(j, "pd_absolute_increase", credit.thresholds.pd_absolute_increase);

    if (j.contains("lgd_by_collateral")) {
        for (auto it = j["lgd_by_collateral"].begin(); it != j["lgd_by_collateral"].end(); ++it) {
            credit.lgd_by_collateral[credit::parse_collateral_type(it.key())] = it.value().get<double>();
        }
    }
    if (j.contains("ccf_by_facility")) {
        for (auto it = j["ccf_by_facility"].begin(); it != j["ccf_by_facility"].end(); ++it) {
            credit.ccf_by_facility[credit::parse_facility_type(it.key())] = it.value().get<double>();
        }
    }

    read_if(j, "default_ccf", credit.default_ccf);
    read_if(j, "reference_inflation", credit.reference_inflation);
    read_if(j, "reference_base_rate", credit.reference_base_rate);
    read_if(j, "lgd_inflation_sensitivity", credit.lgd_inflation_sensitivity);
    read_if(j, "lgd_rate_sensitivity", credit.lgd_rate_sensitivity);
    read_if(j, "max_remaining_term", credit.max_remaining_term);
    read_if(j, "stage3_uplift", credit.stage3_uplift);
    read_if(j, "stage3_uplift_days", credit.stage3_uplift_days);
    if (j.contains("logistic")) {
        const json& lg = j["logistic"];
        read_if(lg, "intercept", credit.logistic.intercept);
        read_if(lg, "gdp_growth", credit.logistic.gdp_growth);
        read_if(lg, "inflation", credit.logistic.inflation);
    }
    read_if(j, "default_asset_correlation", credit.default_asset_correlation);
    read_if(j, "max_simulations", credit.max_simulations);
    read_if(j, "seed", credit.seed);
    read_if(j, "regulatory_reference", credit.regulatory_reference);
}

void parse_liability(const json& j, LiabilityConfig& liability) {
    read_if(j, "illiquidity_premium", liability.illiquidity_premium);
    if (j.contains("illiquidity_term_factors")) {
        liability.illiquidity_term_factors.clear();
        for (auto it = j["illiquidity_term_factors"].begin(); it != j["illiquidity_term_factors"].end(); ++it) {
            liability.illiquidity_term_factors[static_cast<uint32_t>(std::stoul(it.key()))] =
                it.value().get<double>();
        }
    }
    read_if(j, "long_term_illiquidity_factor", liability.long_term_illiquidity_factor);
    if (j.contains("discount_method")) {
        liability.discount_method = parse_discount_method(j["discount_method"].get<std::string>());
    }
    read_if(j, "default_lapse_rate", liability.default_lapse_rate);
    read_if(j, "var_confidence", liability.var_confidence);
    read_if(j, "tvar_confidence", liability.tvar_confidence);
    read_if(j, "cte_confidence", liability.cte_confidence);
    read_if(j, "single_period_volatility", liability.single_period_volatility);
    read_if(j, "coc_rate", liability.coc_rate);
    read_if(j, "coc_capital_factor", liability.coc_capital_factor);
    read_if(j, "simulations", liability.simulations);
    read_if(j, "max_simulations", liability.max_simulations);
    read_if(j, "seed", liability.seed);
    if (j.contains("risk_correlations")) {
        for (const auto& entry : j["risk_correlations"]) {
            liability.set_risk_correlation(entry.at("a").get<std::string>(),
                                           entry.at("b").get<std::string>(),
                                           entry.at("rho").get<double>());
        }
    }
    read_if(j, "default_risk_correlation", liability.default_risk_correlation);
    read_if(j, "lic_coefficient_of_variation", liability.lic_coefficient_of_variation);
    read_if(j, "lic_discount_duration", liability.lic_discount_duration);
    read_if(j, "finance_duration", liability.finance_duration);
    read_if(j, "profitability_band", liability.profitability_band);
    if (j.contains("reinsurance")) {
        read_if(j["reinsurance"], "held_relief", liability.reinsurance.held_relief);
        read_if(j["reinsurance"], "issued_relief", liability.reinsurance.issued_relief);
    }
    read_if(j, "regulatory_reference", liability.regulatory_reference);
}

void parse_solvency(const json& j, SolvencyConfig& solvency) {
    read_tiers(j, "premium_tiers", solvency.premium_tiers);
    read_tiers(j, "claims_tiers", solvency.claims_tiers);
    read_if(j, "correction_coefficient_default", solvency.correction_coefficient_default);
    read_if(j, "correction_coefficient_min", solvency.correction_coefficient_min);
    read_if(j, "correction_coefficient_max", solvency.correction_coefficient_max);
    read_if(j, "annuity_reserve_rate", solvency.annuity_reserve_rate);
    read_if(j, "mathematical_reserve_rate", solvency.mathematical_reserve_rate);
    read_if(j, "compulsory_loading", solvency.compulsory_loading);
    read_if(j, "guaranteed_fund_units_primary", solvency.guaranteed_fund_units_primary);
    read_if(j, "guaranteed_fund_units_reinsurance", solvency.guaranteed_fund_units_reinsurance);
    read_if(j, "subordinated_debt_cap", solvency.subordinated_debt_cap);
    read_if(j, "repo_limit_before", solvency.repo_limit_before);
    read_if(j, "repo_limit_after", solvency.repo_limit_after);
    if (j.contains("repo_limit_switch_date")) {
        solvency.repo_limit_switch_date = CalendarDate::parse(j["repo_limit_switch_date"].get<std::string>());
    }
    read_if(j, "repo_penalty_rate", solvency.repo_penalty_rate);
    if (j.contains("stress_scenarios")) {
        solvency.stress_scenarios.clear();
        for (const auto& entry : j["stress_scenarios"]) {
            solvency.stress_scenarios.emplace_back(
                entry.at("name").get<std::string>(),
                entry.at("own_funds_shock").get<double>(),
                entry.at("margin_shock").get<double>());
        }
    }
    read_if(j, "stress_simulations", solvency.stress_simulations);
    read_if(j, "max_simulations", solvency.max_simulations);
    read_if(j, "own_funds_volatility", solvency.own_funds_volatility);
    read_if(j, "margin_volatility", solvency.margin_volatility);
    read_if(j, "tail_confidence", solvency.tail_confidence);
    read_if(j, "seed", solvency.seed);
    read_if(j, "minimum_ratio", solvency.minimum_ratio);
    read_if(j, "status_excellent", solvency.status_excellent);
    read_if(j, "status_good", solvency.status_good);
    if (j.contains("scr")) {
        const json& scr = j["scr"];
        read_if(scr, "equity_type1", solvency.scr.equity_type1);
        read_if(scr, "equity_type2", solvency.scr.equity_type2);
        read_if(scr, "property", solvency.scr.property);
        read_if(scr, "interest_rate", solvency.scr.interest_rate);
        read_if(scr, "spread", solvency.scr.spread);
    }
    read_if(j, "operational_bscr_cap", solvency.operational_bscr_cap);
    read_if(j, "operational_premium_rate", solvency.operational_premium_rate);
    read_if(j, "operational_provision_rate", solvency.operational_provision_rate);
    read_if(j, "high_liquid_ratio_minimum", solvency.high_liquid_ratio_minimum);
    read_if(j, "regulatory_reference", solvency.regulatory_reference);
    if (j.contains("guarantee_fund")) {
        const json& g = j["guarantee_fund"];
        auto& fund = solvency.guarantee_fund;
        read_if(g, "rate_low_risk", fund.rate_low_risk);
        read_if(g, "rate_medium_risk", fund.rate_medium_risk);
        read_if(g, "rate_high_risk", fund.rate_high_risk);
        read_if(g, "required_adequacy_ratio", fund.required_adequacy_ratio);
        read_if(g, "fund_share_of_reserves", fund.fund_share_of_reserves);
        read_if(g, "no_claims_adequacy", fund.no_claims_adequacy);
        read_if(g, "no_claims_ratio", fund.no_claims_ratio);
        read_if(g, "default_pd", fund.default_pd);
        read_if(g, "default_recovery", fund.default_recovery);
        read_if(g, "default_correlation", fund.default_correlation);
        read_if(g, "simulations", fund.simulations);
        read_if(g, "max_simulations", fund.max_simulations);
        read_if(g, "seed", fund.seed);
        read_if(g, "regulatory_reference", fund.regulatory_reference);
    }
}

std::string read_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigError("Failed to open file: " + file_path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

} // anonymous namespace

EngineConfig parse_engine_config_from_string(const std::string& json_string) {
    EngineConfig config;

    try {
        json j = json::parse(json_string);
        if (!j.is_object()) {
            throw ConfigError("Engine configuration must be a JSON object");
        }
        if (j.contains("rounding")) parse_rounding(j["rounding"], config.rounding);
        if (j.contains("logging")) parse_logging(j["logging"], config.logging);
        if (j.contains("credit")) parse_credit(j["credit"], config.credit);
        if (j.contains("liability")) parse_liability(j["liability"], config.liability);
        if (j.contains("solvency")) parse_solvency(j["solvency"], config.solvency);
    } catch (const json::exception& e) {
        throw ConfigError("JSON parse error: " + std::string(e.what()));
    } catch (const ValidationError& e) {
        throw ConfigError(e.what());
    } catch (const std::invalid_argument& e) {
        throw ConfigError("Invalid numeric key: " + std::string(e.what()));
    }

    validate_engine_config(config);
    return config;
}

EngineConfig parse_engine_config_from_file(const std::string& file_path) {
    return parse_engine_config_from_string(read_file(file_path));
}

MacroContext parse_macro_context_from_string(const std::string& json_string) {
    MacroContextParams params;

    try {
        json j = json::parse(json_string);
        if (j.contains("valuation_date")) {
            params.valuation_date = CalendarDate::parse(j["valuation_date"].get<std::string>());
        }
        read_if(j, "base_rate", params.base_rate);
        read_if(j, "inflation_rate", params.inflation_rate);
        read_if(j, "gdp_growth", params.gdp_growth);
        read_if(j, "monthly_calculation_index", params.monthly_calculation_index);
        if (j.contains("fx_rates")) {
            for (auto it = j["fx_rates"].begin(); it != j["fx_rates"].end(); ++it) {
                params.fx_rates[it.key()] = it.value().get<double>();
            }
        }
        if (j.contains("scenarios")) {
            for (ScenarioKind kind : {ScenarioKind::Base, ScenarioKind::Adverse, ScenarioKind::Severe}) {
                const std::string name = to_string(kind);
                if (!j["scenarios"].contains(name)) {
                    continue;
                }
                const json& s = j["scenarios"][name];
                const size_t idx = static_cast<size_t>(kind);
                read_if(s, "multiplier", params.scenarios.multipliers[idx]);
                read_if(s, "weight", params.scenarios.weights[idx]);
            }
        }
    } catch (const json::exception& e) {
        throw ConfigError("JSON parse error: " + std::string(e.what()));
    }

    return MacroContext(params);
}

MacroContext parse_macro_context_from_file(const std::string& file_path) {
    return parse_macro_context_from_string(read_file(file_path));
}

} // namespace regcalc
