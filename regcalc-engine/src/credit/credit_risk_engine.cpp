#include "credit_risk_engine.hpp"
#include "../logger.hpp"
#include "../serialization.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <nlohmann/json.hpp>
#include <optional>
#ifdef HAVE_OPENMP
#include <omp.h>
#endif

namespace regcalc {
namespace credit {

namespace {

const char* const ENGINE_NAME = "credit";

const std::array<ScenarioKind, 3> STRESS_SCENARIOS = {
    ScenarioKind::Base, ScenarioKind::Adverse, ScenarioKind::Severe};

size_t stage_index(Stage stage) {
    return static_cast<size_t>(stage_number(stage) - 1);
}

} // anonymous namespace

// ============================================================================
// Result types
// ============================================================================

ECLResult::ECLResult()
    : exposure_id(),
      stage(Stage::Stage1),
      stage_triggers(),
      scenario(ScenarioKind::Weighted),
      scenario_multiplier(1.0),
      pd_adjusted(0.0),
      lgd_adjusted(0.0),
      ead(0.0),
      horizon(0),
      stage3_uplift(1.0),
      exposure_bound(0.0),
      ecl(0.0) {}

PortfolioECLResult::PortfolioECLResult()
    : scenario(ScenarioKind::Weighted),
      total_gca(0.0),
      total_ead(0.0),
      total_ecl(0.0),
      coverage_ratio(0.0),
      ecl_by_stage{0.0, 0.0, 0.0},
      gca_by_stage{0.0, 0.0, 0.0},
      count_by_stage{0, 0, 0},
      stage3_coverage(0.0),
      execution_time_ms(0.0) {}

StressedECL::StressedECL()
    : scenario(ScenarioKind::Base), multiplier(1.0), ecl(0.0), change_pct(0.0) {}

ECLStressResult::ECLStressResult() : base_ecl(0.0), scenarios() {}

BayesianPDEstimate::BayesianPDEstimate()
    : defaults(0),
      observations(0),
      posterior_alpha(0.0),
      posterior_beta(0.0),
      pd_mean(0.0),
      ci_lower(0.0),
      ci_upper(0.0) {}

// ============================================================================
// CreditRiskEngine
// ============================================================================

CreditRiskEngine::CreditRiskEngine(const CreditConfig& config, const RoundingConfig& rounding,
                                   AuditSink& audit)
    : config_(config), rounding_(rounding), audit_(audit) {}

void CreditRiskEngine::record(const ExecutionContext& ctx, const AuditRecord& record) const {
    audit_.append(record);
    Logger::get_instance().log_audit_appended(ctx, record.input_digest, record.result_digest);
}

double CreditRiskEngine::scenario_multiplier(const MacroContext& macro, ScenarioKind scenario) const {
    return macro.multiplier(scenario);
}

double CreditRiskEngine::adjust_pd(double pd_historical, double multiplier) const {
    if (!std::isfinite(pd_historical) || pd_historical < 0.0 || pd_historical > 1.0) {
        throw ValidationError("pd", "must be in [0, 1]");
    }
    if (!std::isfinite(multiplier) || multiplier <= 0.0) {
        throw ValidationError("scenario_multiplier", "must be positive");
    }
    return std::min(1.0, pd_historical * multiplier);
}

double CreditRiskEngine::lgd_macro_factor(const MacroContext& macro) const {
    return 1.0
        + config_.lgd_inflation_sensitivity * (macro.inflation_rate() - config_.reference_inflation)
        + config_.lgd_rate_sensitivity * (macro.base_rate() - config_.reference_base_rate);
}

double CreditRiskEngine::adjust_lgd(const Exposure& exposure, double ead, const MacroContext& macro) const {
    double lgd = (exposure.lgd && *exposure.lgd > 0.0)
        ? *exposure.lgd
        : config_.base_lgd(exposure.collateral_type);

    // Loss given collateral
    if (exposure.collateral_value > 0.0) {
        double uncovered = safe_divide(ead - exposure.collateral_value, ead);
        lgd *= std::clamp(uncovered, 0.0, 1.0);
    }

    lgd *= lgd_macro_factor(macro);
    return std::clamp(lgd, 0.0, 1.0);
}

double CreditRiskEngine::exposure_at_default(double gross_carrying_amount, double undrawn_amount,
                                             FacilityType facility) const {
    if (!std::isfinite(gross_carrying_amount) || gross_carrying_amount < 0.0) {
        throw ValidationError("gross_carrying_amount", "must be non-negative");
    }
    if (!std::isfinite(undrawn_amount) || undrawn_amount < 0.0) {
        throw ValidationError("undrawn_amount", "must be non-negative");
    }
    return gross_carrying_amount + undrawn_amount * config_.ccf(facility);
}

double CreditRiskEngine::downturn_lgd(double average_lgd, double lgd_std_dev, double confidence) const {
    if (!std::isfinite(average_lgd) || average_lgd < 0.0 || average_lgd > 1.0) {
        throw ValidationError("average_lgd", "must be in [0, 1]");
    }
    if (!std::isfinite(lgd_std_dev) || lgd_std_dev < 0.0) {
        throw ValidationError("lgd_std_dev", "must be non-negative");
    }
    double lgd = average_lgd + lgd_std_dev * normal_quantile(confidence);
    return round_ratio(std::clamp(lgd, 0.0, 1.0), rounding_);
}

BayesianPDEstimate CreditRiskEngine::estimate_pd_bayesian(uint64_t defaults, uint64_t observations,
                                                          double prior_alpha, double prior_beta) const {
    if (defaults > observations) {
        throw ValidationError("defaults", "cannot exceed observations");
    }
    if (!(prior_alpha > 0.0) || !(prior_beta > 0.0)) {
        throw ValidationError("prior", "alpha and beta must be positive");
    }

    BayesianPDEstimate estimate;
    estimate.defaults = defaults;
    estimate.observations = observations;
    estimate.posterior_alpha = prior_alpha + static_cast<double>(defaults);
    estimate.posterior_beta = prior_beta + static_cast<double>(observations - defaults);
    estimate.pd_mean = round_ratio(
        estimate.posterior_alpha / (estimate.posterior_alpha + estimate.posterior_beta), rounding_);
    estimate.ci_lower = round_ratio(
        beta_quantile(estimate.posterior_alpha, estimate.posterior_beta, 0.025), rounding_);
    estimate.ci_upper = round_ratio(
        beta_quantile(estimate.posterior_alpha, estimate.posterior_beta, 0.975), rounding_);
    return estimate;
}

double CreditRiskEngine::estimate_pd_logistic(double gdp_growth_pct, double inflation_pct) const {
    if (!std::isfinite(gdp_growth_pct) || !std::isfinite(inflation_pct)) {
        throw ValidationError("macro", "GDP growth and inflation must be finite");
    }
    const auto& c = config_.logistic;
    double logit = c.intercept + c.gdp_growth * gdp_growth_pct + c.inflation * inflation_pct;
    return round_ratio(1.0 / (1.0 + std::exp(-logit)), rounding_);
}

std::vector<double> CreditRiskEngine::marginal_pds(const std::vector<double>& cumulative) const {
    std::vector<double> marginal;
    marginal.reserve(cumulative.size());
    double previous = 0.0;
    for (size_t i = 0; i < cumulative.size(); ++i) {
        double pd = cumulative[i];
        if (!std::isfinite(pd) || pd < 0.0 || pd > 1.0) {
            throw ValidationError("cumulative_pd[" + std::to_string(i) + "]", "must be in [0, 1]");
        }
        if (pd < previous) {
            throw ValidationError("cumulative_pd[" + std::to_string(i) + "]", "curve must be non-decreasing");
        }
        marginal.push_back(round_ratio(pd - previous, rounding_));
        previous = pd;
    }
    return marginal;
}

// ============================================================================
// ECL aggregation
// ============================================================================

ECLResult CreditRiskEngine::compute_ecl(const Exposure& exposure, const StageAssessment& assessment,
                                        const MacroContext& macro, ScenarioKind scenario) const {
    exposure.validate(config_.max_remaining_term);

    ECLResult result;
    result.exposure_id = exposure.exposure_id;
    result.stage = assessment.stage;
    result.stage_triggers = assessment.triggers;
    result.scenario = scenario;
    result.scenario_multiplier = scenario_multiplier(macro, scenario);

    const double ead = exposure_at_default(
        exposure.gross_carrying_amount, exposure.undrawn_amount, exposure.facility_type);
    const double pd = adjust_pd(exposure.pd_annual, result.scenario_multiplier);
    const double lgd = adjust_lgd(exposure, ead, macro);

    // Zero remaining term floors at one period
    const uint32_t term = std::max<uint32_t>(1, exposure.remaining_term);
    result.horizon = (assessment.stage == Stage::Stage1) ? 1 : term;

    result.pd_values.reserve(result.horizon);
    result.ead_values.reserve(result.horizon);
    result.discount_factors.reserve(result.horizon);
    result.period_losses.reserve(result.horizon);

    double total = 0.0;
    double bound = 0.0;
    for (uint32_t t = 1; t <= result.horizon; ++t) {
        double pd_t = pd * std::pow(1.0 - pd, static_cast<double>(t - 1));
        double ead_t = ead * std::max(0.0, 1.0 - static_cast<double>(t - 1) / static_cast<double>(term));
        double df_t = discount_factor(exposure.effective_rate, static_cast<double>(t), DiscountMethod::Discrete);
        double loss_t = pd_t * lgd * ead_t * df_t;

        result.pd_values.push_back(pd_t);
        result.ead_values.push_back(ead_t);
        result.discount_factors.push_back(df_t);
        result.period_losses.push_back(loss_t);
        total += loss_t;
        bound += ead_t;
    }

    // Days-on-default uplift
    if (assessment.stage == Stage::Stage3) {
        double days_ratio = std::min(1.0, safe_divide(
            static_cast<double>(exposure.days_past_due),
            static_cast<double>(config_.stage3_uplift_days), 1.0));
        result.stage3_uplift = 1.0 + config_.stage3_uplift * days_ratio;
        total *= result.stage3_uplift;
    }

    result.pd_adjusted = round_ratio(pd, rounding_);
    result.lgd_adjusted = round_ratio(lgd, rounding_);
    result.ead = round_amount(ead, rounding_);
    result.exposure_bound = round_amount(bound, rounding_);
    result.ecl = std::min(round_amount(std::max(0.0, total), rounding_), result.exposure_bound);

    nlohmann::json inputs;
    inputs["exposure"] = exposure;
    inputs["macro"] = macro;
    inputs["scenario"] = scenario;
    inputs["stage"] = assessment.stage;
    result.input_digest = digest_json(inputs, rounding_);
    result.result_digest = digest_json(strip_digests(result), rounding_);
    return result;
}

ECLResult CreditRiskEngine::classify_and_quantify_ecl(const Exposure& exposure, const MacroContext& macro,
                                                      ScenarioKind scenario) const {
    ExecutionContext ctx(ENGINE_NAME, "classify_and_quantify_ecl");
    ctx.item_id = exposure.exposure_id;
    auto& logger = Logger::get_instance();
    auto start_time = std::chrono::high_resolution_clock::now();
    logger.log_calculation_start(ctx, 1);

    ECLResult result;
    try {
        exposure.validate(config_.max_remaining_term);
        StageAssessment assessment = determine_stage(StagingInputs(exposure), config_.thresholds);
        result = compute_ecl(exposure, assessment, macro, scenario);
    } catch (const ValidationError& e) {
        logger.log_validation_error(ctx, e.field(), e.what());
        throw;
    }

    AuditRecord audit_record;
    audit_record.timestamp = utc_timestamp();
    audit_record.operation = "credit.classify_and_quantify_ecl";
    audit_record.input_digest = result.input_digest;
    audit_record.result_digest = result.result_digest;
    audit_record.regulatory_reference = config_.regulatory_reference;
    record(ctx, audit_record);

    CalculationMetrics metrics;
    metrics.execution_time_ms = std::chrono::duration<double, std::milli>(
        std::chrono::high_resolution_clock::now() - start_time).count();
    metrics.items_processed = 1;
    logger.log_calculation_complete(ctx, metrics);
    return result;
}

ECLResult CreditRiskEngine::quantify_ecl(const Exposure& exposure, Stage stage, const MacroContext& macro,
                                         ScenarioKind scenario) const {
    ExecutionContext ctx(ENGINE_NAME, "quantify_ecl");
    ctx.item_id = exposure.exposure_id;

    StageAssessment assessment;
    assessment.stage = stage;
    assessment.triggers.push_back("stage_override");

    ECLResult result;
    try {
        result = compute_ecl(exposure, assessment, macro, scenario);
    } catch (const ValidationError& e) {
        Logger::get_instance().log_validation_error(ctx, e.field(), e.what());
        throw;
    }

    AuditRecord audit_record;
    audit_record.timestamp = utc_timestamp();
    audit_record.operation = "credit.quantify_ecl";
    audit_record.input_digest = result.input_digest;
    audit_record.result_digest = result.result_digest;
    audit_record.regulatory_reference = config_.regulatory_reference;
    record(ctx, audit_record);
    return result;
}

PortfolioECLResult CreditRiskEngine::quantify_portfolio(const std::vector<Exposure>& exposures,
                                                        const MacroContext& macro,
                                                        ScenarioKind scenario) const {
    ExecutionContext ctx(ENGINE_NAME, "quantify_portfolio");
    auto& logger = Logger::get_instance();
    auto start_time = std::chrono::high_resolution_clock::now();

    PortfolioECLResult portfolio;
    portfolio.scenario = scenario;
    if (exposures.empty()) {
        return portfolio;
    }

    logger.log_calculation_start(ctx, exposures.size());

    // One slot per exposure so the merge below runs in input order
    std::vector<std::optional<ECLResult>> slots(exposures.size());
    std::vector<std::string> errors(exposures.size());

#ifdef HAVE_OPENMP
    #pragma omp parallel for schedule(dynamic, 16)
    for (long long i = 0; i < static_cast<long long>(exposures.size()); ++i) {
#else
    for (size_t i = 0; i < exposures.size(); ++i) {
#endif
        const Exposure& exposure = exposures[static_cast<size_t>(i)];
        try {
            exposure.validate(config_.max_remaining_term);
            StageAssessment assessment = determine_stage(StagingInputs(exposure), config_.thresholds);
            slots[static_cast<size_t>(i)] = compute_ecl(exposure, assessment, macro, scenario);
        } catch (const std::exception& e) {
            errors[static_cast<size_t>(i)] = e.what();
        }
    }

    double stage3_gca = 0.0;
    for (size_t i = 0; i < exposures.size(); ++i) {
        if (!slots[i]) {
            ItemFailure failure;
            failure.item_id = exposures[i].exposure_id;
            failure.message = errors[i];
            logger.log_item_failed(ctx, failure.item_id, failure.message);
            portfolio.failures.push_back(failure);
            continue;
        }
        ECLResult& item = *slots[i];
        size_t s = stage_index(item.stage);
        portfolio.total_gca += exposures[i].gross_carrying_amount;
        portfolio.total_ead += item.ead;
        portfolio.total_ecl += item.ecl;
        portfolio.ecl_by_stage[s] += item.ecl;
        portfolio.gca_by_stage[s] += exposures[i].gross_carrying_amount;
        portfolio.count_by_stage[s] += 1;
        if (item.stage == Stage::Stage3) {
            stage3_gca += exposures[i].gross_carrying_amount;
        }
        portfolio.results.push_back(std::move(item));
    }

    portfolio.total_gca = round_amount(portfolio.total_gca, rounding_);
    portfolio.total_ead = round_amount(portfolio.total_ead, rounding_);
    portfolio.total_ecl = round_amount(portfolio.total_ecl, rounding_);
    for (size_t s = 0; s < 3; ++s) {
        portfolio.ecl_by_stage[s] = round_amount(portfolio.ecl_by_stage[s], rounding_);
        portfolio.gca_by_stage[s] = round_amount(portfolio.gca_by_stage[s], rounding_);
    }
    portfolio.coverage_ratio = round_ratio(safe_divide(portfolio.total_ecl, portfolio.total_gca), rounding_);
    portfolio.stage3_coverage = round_ratio(safe_divide(portfolio.ecl_by_stage[2], stage3_gca), rounding_);

    nlohmann::json inputs;
    inputs["exposures"] = exposures;
    inputs["macro"] = macro;
    inputs["scenario"] = scenario;
    portfolio.input_digest = digest_json(inputs, rounding_);
    portfolio.result_digest = digest_json(strip_digests(portfolio), rounding_);

    AuditRecord audit_record;
    audit_record.timestamp = utc_timestamp();
    audit_record.operation = "credit.quantify_portfolio";
    audit_record.input_digest = portfolio.input_digest;
    audit_record.result_digest = portfolio.result_digest;
    audit_record.regulatory_reference = config_.regulatory_reference;
    record(ctx, audit_record);

    auto end_time = std::chrono::high_resolution_clock::now();
    portfolio.execution_time_ms = std::chrono::duration<double, std::milli>(end_time - start_time).count();

    CalculationMetrics metrics;
    metrics.execution_time_ms = portfolio.execution_time_ms;
    metrics.items_processed = portfolio.results.size();
    metrics.items_failed = portfolio.failures.size();
    logger.log_calculation_complete(ctx, metrics);
    return portfolio;
}

ECLStressResult CreditRiskEngine::stress_test(double base_ecl, const MacroContext& macro) const {
    if (!std::isfinite(base_ecl) || base_ecl < 0.0) {
        throw ValidationError("base_ecl", "must be non-negative");
    }
    ExecutionContext ctx(ENGINE_NAME, "stress_test");

    ECLStressResult result;
    result.base_ecl = round_amount(base_ecl, rounding_);
    for (ScenarioKind kind : STRESS_SCENARIOS) {
        StressedECL stressed;
        stressed.scenario = kind;
        stressed.multiplier = macro.multiplier(kind);
        stressed.ecl = round_amount(base_ecl * stressed.multiplier, rounding_);
        stressed.change_pct = round_ratio((stressed.multiplier - 1.0) * 100.0, rounding_);
        result.scenarios.push_back(stressed);
    }

    nlohmann::json inputs;
    inputs["base_ecl"] = base_ecl;
    inputs["macro"] = macro;
    record(ctx, make_audit_record("credit.stress_test", inputs, nlohmann::json(result),
                                  config_.regulatory_reference, rounding_));
    return result;
}

DefaultSimulationResult CreditRiskEngine::simulate_portfolio_defaults(
    const std::vector<Exposure>& exposures,
    const MacroContext& macro,
    ScenarioKind scenario,
    DefaultSimulationParams params) const
{
    ExecutionContext ctx(ENGINE_NAME, "simulate_portfolio_defaults");
    auto& logger = Logger::get_instance();

    if (params.num_simulations > config_.max_simulations) {
        logger.log_warning(ctx, "num_simulations " + std::to_string(params.num_simulations) +
                                " clamped to " + std::to_string(config_.max_simulations));
        params.num_simulations = config_.max_simulations;
    }

    const double multiplier = scenario_multiplier(macro, scenario);
    std::vector<Obligor> obligors;
    obligors.reserve(exposures.size());
    for (const auto& exposure : exposures) {
        exposure.validate(config_.max_remaining_term);
        Obligor obligor;
        obligor.id = exposure.exposure_id;
        obligor.ead = exposure_at_default(
            exposure.gross_carrying_amount, exposure.undrawn_amount, exposure.facility_type);
        obligor.pd = adjust_pd(exposure.pd_annual, multiplier);
        obligor.lgd = adjust_lgd(exposure, obligor.ead, macro);
        obligors.push_back(obligor);
    }

    DefaultSimulationResult result = simulate_correlated_defaults(obligors, params);
    result.total_exposure = round_amount(result.total_exposure, rounding_);
    result.expected_loss = round_amount(result.expected_loss, rounding_);
    result.loss_std_dev = round_amount(result.loss_std_dev, rounding_);
    result.var_95 = round_amount(result.var_95, rounding_);
    result.var_99 = round_amount(result.var_99, rounding_);
    result.expected_shortfall_99 = round_amount(result.expected_shortfall_99, rounding_);
    result.loss_threshold = round_amount(result.loss_threshold, rounding_);
    result.mean_default_count = round_ratio(result.mean_default_count, rounding_);
    result.probability_exceeding_threshold = round_ratio(result.probability_exceeding_threshold, rounding_);

    nlohmann::json inputs;
    inputs["exposures"] = exposures;
    inputs["macro"] = macro;
    inputs["scenario"] = scenario;
    inputs["params"] = params;
    record(ctx, make_audit_record("credit.simulate_portfolio_defaults", inputs, nlohmann::json(result),
                                  config_.regulatory_reference, rounding_));
    return result;
}

} // namespace credit
} // namespace regcalc
