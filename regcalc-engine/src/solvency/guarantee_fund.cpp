#include "guarantee_fund.hpp"
#include "../credit/default_simulation.hpp"
#include "../serialization.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <nlohmann/json.hpp>

namespace regcalc {
namespace solvency {

namespace {

const char* const ENGINE_NAME = "guarantee_fund";

void require_non_negative(double value, const std::string& field) {
    if (!std::isfinite(value) || value < 0.0) {
        throw ValidationError(field, "must be non-negative");
    }
}

void require_probability(double value, const std::string& field) {
    if (!std::isfinite(value) || value < 0.0 || value > 1.0) {
        throw ValidationError(field, "must be in [0, 1]");
    }
}

} // anonymous namespace

// ============================================================================
// Enumerations
// ============================================================================

std::string to_string(RiskClass risk_class) {
    switch (risk_class) {
        case RiskClass::Low: return "low_risk";
        case RiskClass::Medium: return "medium_risk";
        case RiskClass::High: return "high_risk";
    }
    return "medium_risk";
}

RiskClass parse_risk_class(const std::string& value) {
    std::string v = value;
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return std::tolower(c); });
    if (v == "low_risk" || v == "low") return RiskClass::Low;
    if (v == "medium_risk" || v == "medium") return RiskClass::Medium;
    if (v == "high_risk" || v == "high") return RiskClass::High;
    throw ValidationError("risk_class", "unknown risk class '" + value + "'");
}

std::string to_string(WarningLevel level) {
    switch (level) {
        case WarningLevel::Normal: return "normal";
        case WarningLevel::Elevated: return "elevated";
        case WarningLevel::High: return "high";
        case WarningLevel::Critical: return "critical";
    }
    return "normal";
}

// ============================================================================
// Struct defaults
// ============================================================================

InsurerProfile::InsurerProfile()
    : name(),
      gross_premiums(0.0),
      reserves(0.0),
      solvency_ratio(),
      loss_ratio(0.70),
      combined_ratio(0.95),
      years_in_market(5),
      pd(),
      recovery(),
      premium_growth(0.0),
      risk_class() {}

void InsurerProfile::validate() const {
    if (name.empty()) {
        throw ValidationError("name", "insurer name must not be empty");
    }
    require_non_negative(gross_premiums, "gross_premiums");
    require_non_negative(reserves, "reserves");
    if (solvency_ratio) {
        require_non_negative(*solvency_ratio, "solvency_ratio");
    }
    require_non_negative(loss_ratio, "loss_ratio");
    require_non_negative(combined_ratio, "combined_ratio");
    if (pd) {
        require_probability(*pd, "pd");
    }
    if (recovery) {
        require_probability(*recovery, "recovery");
    }
    if (!std::isfinite(premium_growth) || premium_growth <= -1.0) {
        throw ValidationError("premium_growth", "must be finite and above -100%");
    }
}

RiskClassAssessment::RiskClassAssessment()
    : risk_class(RiskClass::Medium), score(0) {}

ContributionResult::ContributionResult()
    : insurer(),
      premium_base(0.0),
      risk_class(RiskClass::Medium),
      class_basis("default"),
      score(0),
      rate(0.0),
      contribution(0.0) {}

BankruptcySimulationResult::BankruptcySimulationResult()
    : simulations(0),
      insurers(0),
      correlation(0.0),
      expected_claims(0.0),
      var_95(0.0),
      var_99(0.0),
      assumed_fund(0.0),
      probability_of_shortfall(0.0),
      fund_adequacy(1.0),
      input_digest(),
      result_digest() {}

FundAdequacyResult::FundAdequacyResult()
    : fund_balance(0.0),
      expected_claims(0.0),
      contributions_pipeline(0.0),
      current_ratio(0.0),
      projected_ratio(0.0),
      required_ratio(0.0),
      adequate(false),
      will_be_adequate(false),
      shortfall(0.0),
      surplus(0.0) {}

GuaranteeFundAssessment::GuaranteeFundAssessment()
    : contributions(),
      total_contributions(0.0),
      fund_balance(0.0),
      bankruptcy(),
      adequacy(),
      input_digest(),
      result_digest() {}

EarlyWarning::EarlyWarning()
    : insurer(),
      risk_score(0),
      level(WarningLevel::Normal),
      warnings(),
      recommended_action(),
      solvency_ratio(0.0),
      loss_ratio(0.0),
      combined_ratio(0.0),
      premium_growth(0.0) {}

// ============================================================================
// GuaranteeFundEngine
// ============================================================================

GuaranteeFundEngine::GuaranteeFundEngine(const GuaranteeFundConfig& config, const RoundingConfig& rounding,
                                         AuditSink& audit)
    : config_(config), rounding_(rounding), audit_(audit) {}

void GuaranteeFundEngine::record(const ExecutionContext& ctx, const AuditRecord& record) const {
    audit_.append(record);
    Logger::get_instance().log_audit_appended(ctx, record.input_digest, record.result_digest);
}

RiskClassAssessment GuaranteeFundEngine::determine_risk_class(double solvency_ratio, double loss_ratio,
                                                              double combined_ratio,
                                                              uint32_t years_in_market) const {
    require_non_negative(solvency_ratio, "solvency_ratio");
    require_non_negative(loss_ratio, "loss_ratio");
    require_non_negative(combined_ratio, "combined_ratio");

    RiskClassAssessment result;
    if (solvency_ratio >= 2.0) {
        result.score += 3;
    } else if (solvency_ratio >= 1.5) {
        result.score += 2;
    } else if (solvency_ratio >= 1.0) {
        result.score += 1;
    }

    if (loss_ratio < 0.60) {
        result.score += 2;
    } else if (loss_ratio < 0.75) {
        result.score += 1;
    }

    if (combined_ratio < 0.90) {
        result.score += 2;
    } else if (combined_ratio < 1.0) {
        result.score += 1;
    }

    if (years_in_market >= 10) {
        result.score += 1;
    }

    if (result.score >= 7) {
        result.risk_class = RiskClass::Low;
    } else if (result.score >= 4) {
        result.risk_class = RiskClass::Medium;
    } else {
        result.risk_class = RiskClass::High;
    }
    return result;
}

double GuaranteeFundEngine::contribution_rate(RiskClass risk_class) const {
    switch (risk_class) {
        case RiskClass::Low: return config_.rate_low_risk;
        case RiskClass::Medium: return config_.rate_medium_risk;
        case RiskClass::High: return config_.rate_high_risk;
    }
    return config_.rate_medium_risk;
}

ContributionResult GuaranteeFundEngine::calculate_contribution(const InsurerProfile& insurer) const {
    insurer.validate();

    ContributionResult result;
    result.insurer = insurer.name;
    result.premium_base = round_amount(insurer.gross_premiums, rounding_);

    if (insurer.risk_class) {
        result.risk_class = *insurer.risk_class;
        result.class_basis = "assigned";
    } else if (insurer.solvency_ratio) {
        RiskClassAssessment assessment = determine_risk_class(
            *insurer.solvency_ratio, insurer.loss_ratio, insurer.combined_ratio, insurer.years_in_market);
        result.risk_class = assessment.risk_class;
        result.score = assessment.score;
        result.class_basis = "scored";
    } else {
        result.risk_class = RiskClass::Medium;
        result.class_basis = "default";
    }

    result.rate = contribution_rate(result.risk_class);
    result.contribution = round_amount(insurer.gross_premiums * result.rate, rounding_);
    return result;
}

FundAdequacyResult GuaranteeFundEngine::assess_fund_adequacy(double fund_balance, double expected_claims,
                                                             double contributions_pipeline) const {
    require_non_negative(fund_balance, "fund_balance");
    require_non_negative(expected_claims, "expected_claims");
    require_non_negative(contributions_pipeline, "contributions_pipeline");

    FundAdequacyResult result;
    result.fund_balance = round_amount(fund_balance, rounding_);
    result.expected_claims = round_amount(expected_claims, rounding_);
    result.contributions_pipeline = round_amount(contributions_pipeline, rounding_);
    result.required_ratio = config_.required_adequacy_ratio;

    if (expected_claims > 0.0) {
        result.current_ratio = round_ratio(fund_balance / expected_claims, rounding_);
        result.projected_ratio = round_ratio((fund_balance + contributions_pipeline) / expected_claims, rounding_);
    } else {
        result.current_ratio = config_.no_claims_ratio;
        result.projected_ratio = config_.no_claims_ratio;
    }
    result.adequate = result.current_ratio >= result.required_ratio;
    result.will_be_adequate = result.projected_ratio >= result.required_ratio;

    const double required_balance = expected_claims * config_.required_adequacy_ratio;
    result.shortfall = round_amount(std::max(0.0, required_balance - fund_balance), rounding_);
    result.surplus = round_amount(std::max(0.0, fund_balance - required_balance), rounding_);
    return result;
}

EarlyWarning GuaranteeFundEngine::early_warning_indicators(const InsurerProfile& insurer) const {
    insurer.validate();

    EarlyWarning result;
    result.insurer = insurer.name;
    result.solvency_ratio = insurer.solvency_ratio ? *insurer.solvency_ratio : 1.5;
    result.loss_ratio = insurer.loss_ratio;
    result.combined_ratio = insurer.combined_ratio;
    result.premium_growth = insurer.premium_growth;

    auto flag = [&result](int points, const std::string& message) {
        result.risk_score += points;
        result.warnings.push_back(message);
    };

    if (result.solvency_ratio < 1.0) {
        flag(5, "critical: solvency ratio below 100%");
    } else if (result.solvency_ratio < 1.2) {
        flag(3, "warning: solvency ratio below 120%");
    } else if (result.solvency_ratio < 1.5) {
        flag(1, "watch: solvency ratio below 150%");
    }

    if (result.loss_ratio > 0.90) {
        flag(4, "critical: loss ratio above 90%");
    } else if (result.loss_ratio > 0.80) {
        flag(2, "warning: loss ratio above 80%");
    }

    if (result.combined_ratio > 1.10) {
        flag(4, "critical: combined ratio above 110%");
    } else if (result.combined_ratio > 1.00) {
        flag(2, "warning: combined ratio above 100%");
    }

    if (result.premium_growth > 0.50) {
        flag(1, "watch: premium growth above 50%");
    } else if (result.premium_growth < -0.20) {
        flag(2, "warning: premium decline beyond 20%");
    }

    if (result.risk_score >= 8) {
        result.level = WarningLevel::Critical;
        result.recommended_action = "immediate supervisory intervention";
    } else if (result.risk_score >= 5) {
        result.level = WarningLevel::High;
        result.recommended_action = "enhanced monitoring";
    } else if (result.risk_score >= 2) {
        result.level = WarningLevel::Elevated;
        result.recommended_action = "regular monitoring";
    } else {
        result.level = WarningLevel::Normal;
        result.recommended_action = "standard monitoring";
    }
    return result;
}

// ============================================================================
// Bankruptcy simulation
// ============================================================================

BankruptcySimulationResult GuaranteeFundEngine::run_simulation(const std::vector<InsurerProfile>& insurers,
                                                               size_t num_simulations,
                                                               double correlation) const {
    BankruptcySimulationResult result;
    result.correlation = correlation;
    if (insurers.empty()) {
        return result;
    }

    std::vector<credit::Obligor> members;
    members.reserve(insurers.size());
    double total_reserves = 0.0;
    for (const auto& insurer : insurers) {
        insurer.validate();
        credit::Obligor member;
        member.id = insurer.name;
        member.pd = insurer.pd ? *insurer.pd : config_.default_pd;
        member.ead = insurer.reserves;
        member.lgd = 1.0 - (insurer.recovery ? *insurer.recovery : config_.default_recovery);
        members.push_back(member);
        total_reserves += insurer.reserves;
    }

    credit::DefaultSimulationParams params;
    params.num_simulations = num_simulations;
    params.asset_correlation = correlation;
    params.seed = config_.seed;
    params.loss_threshold = total_reserves * config_.fund_share_of_reserves;

    credit::DefaultSimulationResult sim = credit::simulate_correlated_defaults(members, params);

    result.simulations = sim.simulations;
    result.insurers = sim.obligors;
    result.expected_claims = round_amount(sim.expected_loss, rounding_);
    result.var_95 = round_amount(sim.var_95, rounding_);
    result.var_99 = round_amount(sim.var_99, rounding_);
    result.assumed_fund = round_amount(sim.loss_threshold, rounding_);
    result.probability_of_shortfall = round_ratio(sim.probability_exceeding_threshold, rounding_);
    result.fund_adequacy = sim.expected_loss > 0.0
        ? round_ratio(sim.loss_threshold / sim.expected_loss, rounding_)
        : config_.no_claims_adequacy;
    return result;
}

BankruptcySimulationResult GuaranteeFundEngine::simulate_bankruptcy(const std::vector<InsurerProfile>& insurers,
                                                                    std::optional<size_t> num_simulations,
                                                                    std::optional<double> correlation) const {
    ExecutionContext ctx(ENGINE_NAME, "simulate_bankruptcy");
    auto& logger = Logger::get_instance();

    size_t simulations = num_simulations ? *num_simulations : config_.simulations;
    if (simulations == 0) {
        logger.log_validation_error(ctx, "num_simulations", "must be positive");
        throw ValidationError("num_simulations", "must be positive");
    }
    if (simulations > config_.max_simulations) {
        logger.log_warning(ctx, "num_simulations " + std::to_string(simulations) +
                                " clamped to " + std::to_string(config_.max_simulations));
        simulations = config_.max_simulations;
    }
    const double rho = correlation ? *correlation : config_.default_correlation;
    if (!(rho >= 0.0 && rho < 1.0)) {
        logger.log_validation_error(ctx, "correlation", "must be in [0, 1)");
        throw ValidationError("correlation", "must be in [0, 1)");
    }

    BankruptcySimulationResult result;
    try {
        result = run_simulation(insurers, simulations, rho);
    } catch (const ValidationError& e) {
        logger.log_validation_error(ctx, e.field(), e.what());
        throw;
    }
    if (result.empty()) {
        return result;
    }

    nlohmann::json inputs;
    inputs["insurers"] = insurers;
    inputs["simulations"] = simulations;
    inputs["correlation"] = rho;
    inputs["seed"] = config_.seed;
    result.input_digest = digest_json(inputs, rounding_);
    result.result_digest = digest_json(strip_digests(result), rounding_);

    AuditRecord audit_record;
    audit_record.timestamp = utc_timestamp();
    audit_record.operation = "solvency.simulate_bankruptcy";
    audit_record.input_digest = result.input_digest;
    audit_record.result_digest = result.result_digest;
    audit_record.regulatory_reference = config_.regulatory_reference;
    record(ctx, audit_record);
    return result;
}

GuaranteeFundAssessment GuaranteeFundEngine::assess(const std::vector<InsurerProfile>& insurers,
                                                    double fund_balance) const {
    ExecutionContext ctx(ENGINE_NAME, "assess");
    auto& logger = Logger::get_instance();
    logger.log_calculation_start(ctx, insurers.size());

    GuaranteeFundAssessment assessment;
    try {
        require_non_negative(fund_balance, "fund_balance");
        assessment.fund_balance = round_amount(fund_balance, rounding_);

        double total = 0.0;
        assessment.contributions.reserve(insurers.size());
        for (const auto& insurer : insurers) {
            ContributionResult contribution = calculate_contribution(insurer);
            total += contribution.contribution;
            assessment.contributions.push_back(contribution);
        }
        assessment.total_contributions = round_amount(total, rounding_);

        size_t simulations = std::min(config_.simulations, config_.max_simulations);
        assessment.bankruptcy = run_simulation(insurers, simulations, config_.default_correlation);
        assessment.adequacy = assess_fund_adequacy(
            fund_balance, assessment.bankruptcy.expected_claims, assessment.total_contributions);
    } catch (const ValidationError& e) {
        logger.log_validation_error(ctx, e.field(), e.what());
        throw;
    }

    if (assessment.empty()) {
        logger.log_calculation_complete(ctx, CalculationMetrics());
        return assessment;
    }

    if (!assessment.adequacy.adequate) {
        logger.log_warning(ctx, "fund adequacy ratio " + format_fixed(assessment.adequacy.current_ratio, 6) +
                                " below required " + format_fixed(assessment.adequacy.required_ratio, 2));
    }

    nlohmann::json inputs;
    inputs["insurers"] = insurers;
    inputs["fund_balance"] = fund_balance;
    inputs["seed"] = config_.seed;
    assessment.input_digest = digest_json(inputs, rounding_);
    assessment.result_digest = digest_json(strip_digests(assessment), rounding_);

    AuditRecord audit_record;
    audit_record.timestamp = utc_timestamp();
    audit_record.operation = "solvency.assess_guarantee_fund";
    audit_record.input_digest = assessment.input_digest;
    audit_record.result_digest = assessment.result_digest;
    audit_record.regulatory_reference = config_.regulatory_reference;
    record(ctx, audit_record);

    CalculationMetrics metrics;
    metrics.items_processed = insurers.size();
    logger.log_calculation_complete(ctx, metrics);
    return assessment;
}

} // namespace solvency
} // namespace regcalc
