#include "liability_engine.hpp"
#include "../logger.hpp"
#include "../serialization.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <nlohmann/json.hpp>
#ifdef HAVE_OPENMP
#include <omp.h>
#endif

namespace regcalc {
namespace liability {

namespace {

const char* const ENGINE_NAME = "liability";

std::string lowercase(const std::string& value) {
    std::string v = value;
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return std::tolower(c); });
    return v;
}

AuditRecord audit_record_for(const std::string& operation, const std::string& input_digest,
                             const std::string& result_digest, const std::string& reference) {
    AuditRecord record;
    record.timestamp = utc_timestamp();
    record.operation = operation;
    record.input_digest = input_digest;
    record.result_digest = result_digest;
    record.regulatory_reference = reference;
    return record;
}

} // anonymous namespace

// ============================================================================
// Enumerations
// ============================================================================

std::string to_string(MeasurementModel model) {
    switch (model) {
        case MeasurementModel::GMM: return "gmm";
        case MeasurementModel::VFA: return "vfa";
        case MeasurementModel::PAA: return "paa";
    }
    return "gmm";
}

MeasurementModel parse_measurement_model(const std::string& value) {
    std::string v = lowercase(value);
    if (v == "gmm") return MeasurementModel::GMM;
    if (v == "vfa") return MeasurementModel::VFA;
    if (v == "paa") return MeasurementModel::PAA;
    throw ValidationError("measurement_model", "unknown measurement model '" + value + "'");
}

std::string to_string(ContractType type) {
    switch (type) {
        case ContractType::Direct: return "direct";
        case ContractType::ReinsuranceHeld: return "reinsurance_held";
        case ContractType::ReinsuranceIssued: return "reinsurance_issued";
    }
    return "direct";
}

ContractType parse_contract_type(const std::string& value) {
    std::string v = lowercase(value);
    if (v == "direct") return ContractType::Direct;
    if (v == "reinsurance_held") return ContractType::ReinsuranceHeld;
    if (v == "reinsurance_issued") return ContractType::ReinsuranceIssued;
    throw ValidationError("contract_type", "unknown contract type '" + value + "'");
}

std::string to_string(ProfitabilityGroup group) {
    switch (group) {
        case ProfitabilityGroup::Onerous: return "onerous";
        case ProfitabilityGroup::NoSignificantRisk: return "no_significant_risk";
        case ProfitabilityGroup::Remaining: return "remaining";
    }
    return "remaining";
}

// ============================================================================
// Result types
// ============================================================================

VFAFeatures::VFAFeatures()
    : substantial_share_fair_value(false), variable_payout_portion(false), investment_service(false) {}

VFAFeatures::VFAFeatures(bool share, bool payout, bool service)
    : substantial_share_fair_value(share), variable_payout_portion(payout), investment_service(service) {}

VFAEligibility::VFAEligibility()
    : eligible(false),
      substantial_share_fair_value(false),
      variable_payout_portion(false),
      investment_service(false),
      failed_criteria() {}

DiscountRateResolution::DiscountRateResolution()
    : term(0), base_rate(0.0), illiquidity_factor(0.0), illiquidity_premium(0.0), rate(0.0) {}

BELResult::BELResult()
    : discount(), method(DiscountMethod::Continuous), lapse_rate(0.0), bel(0.0) {}

PAAResult::PAAResult()
    : coverage_periods(0),
      premiums(0.0),
      acquisition_costs(0.0),
      dac(0.0),
      acquisition_expensed(0.0),
      ra(0.0),
      lrc(0.0) {}

LiabilityMeasurement::LiabilityMeasurement()
    : group_id(),
      requested_model(MeasurementModel::GMM),
      model(MeasurementModel::GMM),
      premiums(0.0),
      acquisition_costs(0.0),
      bel(),
      ra(),
      csm(),
      paa(),
      fulfilment_cash_flows(0.0),
      total_liability(0.0) {}

ContractGroup::ContractGroup()
    : group_id(),
      schedule(),
      acquisition_costs(0.0),
      ra_method(RAMethod::CoC),
      model(MeasurementModel::GMM),
      vfa_features() {}

LiabilityPortfolioResult::LiabilityPortfolioResult()
    : total_bel(0.0),
      total_ra(0.0),
      total_csm(0.0),
      total_loss_component(0.0),
      total_liability(0.0),
      execution_time_ms(0.0) {}

LICInputs::LICInputs()
    : reported_claims(0.0), ibnr(0.0), ibner(0.0), ulae(0.0), alae(0.0) {}

LICResult::LICResult()
    : base(0.0), ra(0.0), confidence_level(0.0), discount_factor(1.0), lic(0.0) {}

InsuranceFinanceInputs::InsuranceFinanceInputs()
    : opening_liability(0.0), closing_liability(0.0), opening_rate(0.0), closing_rate(0.0),
      oci_option(false) {}

InsuranceFinanceResult::InsuranceFinanceResult()
    : interest_accretion(0.0),
      rate_change_effect(0.0),
      assumption_change_effect(0.0),
      total(0.0),
      pnl(0.0),
      oci(0.0),
      oci_option(false) {}

LiabilityComponents::LiabilityComponents() : bel(0.0), ra(0.0), csm(0.0), total_liability(0.0) {}

NetGrossSplit::NetGrossSplit()
    : type(ContractType::Direct), relief_rate(0.0), gross(), relief(), net() {}

// ============================================================================
// LiabilityEngine
// ============================================================================

LiabilityEngine::LiabilityEngine(const LiabilityConfig& config, const RoundingConfig& rounding,
                                 AuditSink& audit, const DiscountCurveResolver* curve)
    : config_(config), rounding_(rounding), audit_(audit), curve_(curve) {}

void LiabilityEngine::record(const ExecutionContext& ctx, const AuditRecord& record) const {
    audit_.append(record);
    Logger::get_instance().log_audit_appended(ctx, record.input_digest, record.result_digest);
}

DiscountRateResolution LiabilityEngine::resolve_discount_rate(uint32_t term, const MacroContext& macro) const {
    if (term == 0) {
        throw ValidationError("term", "must be at least one period");
    }
    DiscountRateResolution resolution;
    resolution.term = term;
    resolution.base_rate = curve_ ? curve_->rate_for_tenor(term) : macro.base_rate();
    resolution.illiquidity_factor = config_.illiquidity_factor(term);
    resolution.illiquidity_premium = config_.illiquidity_premium * resolution.illiquidity_factor;
    resolution.rate = resolution.base_rate + resolution.illiquidity_premium;
    return resolution;
}

BELResult LiabilityEngine::calculate_bel(const CashFlowSchedule& schedule, const MacroContext& macro) const {
    schedule.validate();

    BELResult result;
    result.discount = resolve_discount_rate(schedule.term(), macro);
    result.method = config_.discount_method;
    result.lapse_rate = schedule.lapse_rate() ? *schedule.lapse_rate() : config_.default_lapse_rate;

    double bel = 0.0;
    for (const auto& period : schedule.periods()) {
        double net_cf = period.net_cash_flow();
        double survival = std::pow(1.0 - result.lapse_rate, static_cast<double>(period.period - 1));
        double df = discount_factor(result.discount.rate, static_cast<double>(period.period), result.method);
        double discounted = net_cf * survival * df;

        result.net_cash_flows.push_back(net_cf);
        result.survival_factors.push_back(survival);
        result.discount_factors.push_back(df);
        result.discounted_cash_flows.push_back(discounted);
        bel += discounted;
    }
    result.bel = round_amount(bel, rounding_);
    return result;
}

RAResult LiabilityEngine::calculate_risk_adjustment(const CashFlowSchedule& schedule, RAMethod method,
                                                    const BELResult& bel) const {
    RASimulationParams params;
    params.num_simulations = config_.simulations;
    params.seed = config_.seed;
    params.single_period_volatility = config_.single_period_volatility;
    if (params.num_simulations > config_.max_simulations) {
        ExecutionContext ctx(ENGINE_NAME, "calculate_risk_adjustment");
        Logger::get_instance().log_warning(ctx, "simulations " + std::to_string(params.num_simulations) +
                                                " clamped to " + std::to_string(config_.max_simulations));
        params.num_simulations = config_.max_simulations;
    }

    RAResult ra;
    switch (method) {
        case RAMethod::VaR:
            ra = risk_adjustment_var(bel.net_cash_flows, config_.var_confidence, params);
            break;
        case RAMethod::TVaR:
            ra = risk_adjustment_tvar(bel.net_cash_flows, config_.tvar_confidence, params);
            break;
        case RAMethod::CTE:
            ra = risk_adjustment_cte(bel.net_cash_flows, config_.cte_confidence, params);
            break;
        case RAMethod::CoC:
            ra = risk_adjustment_coc(config_.coc_capital_factor * std::fabs(bel.bel), schedule.term(),
                                     config_.coc_rate, bel.discount.rate, config_.discount_method);
            break;
    }

    ra.ra = round_amount(ra.ra, rounding_);
    ra.expected_value = round_amount(ra.expected_value, rounding_);
    ra.tail_value = round_amount(ra.tail_value, rounding_);
    ra.capital = round_amount(ra.capital, rounding_);
    ra.pv_capital = round_amount(ra.pv_capital, rounding_);
    return ra;
}

DiversifiedRA LiabilityEngine::diversify(const std::vector<RiskComponent>& components) const {
    std::vector<std::vector<double>> matrix(components.size(), std::vector<double>(components.size(), 0.0));
    for (size_t i = 0; i < components.size(); ++i) {
        for (size_t j = 0; j < components.size(); ++j) {
            matrix[i][j] = (i == j) ? 1.0 : config_.risk_correlation(components[i].risk, components[j].risk);
        }
    }

    ExecutionContext ctx(ENGINE_NAME, "diversify");
    DiversifiedRA result;
    try {
        result = diversify_risk_adjustment(components, matrix);
    } catch (const ComputationError& e) {
        Logger::get_instance().log_error(ctx, e.what());
        throw;
    }
    result.undiversified = round_amount(result.undiversified, rounding_);
    result.diversified = round_amount(result.diversified, rounding_);
    result.diversification_benefit = round_amount(result.diversification_benefit, rounding_);

    nlohmann::json inputs;
    inputs["components"] = components;
    inputs["correlations"] = matrix;
    record(ctx, make_audit_record("liability.diversify", inputs, nlohmann::json(result),
                                  config_.regulatory_reference, rounding_));
    return result;
}

VFAEligibility LiabilityEngine::check_vfa_eligibility(const VFAFeatures& features) const {
    VFAEligibility result;
    result.substantial_share_fair_value = features.substantial_share_fair_value;
    result.variable_payout_portion = features.variable_payout_portion;
    result.investment_service = features.investment_service;
    if (!features.substantial_share_fair_value) {
        result.failed_criteria.push_back("substantial_share_fair_value");
    }
    if (!features.variable_payout_portion) {
        result.failed_criteria.push_back("variable_payout_portion");
    }
    if (!features.investment_service) {
        result.failed_criteria.push_back("investment_service");
    }
    result.eligible = result.failed_criteria.empty();
    return result;
}

MeasurementModel LiabilityEngine::resolve_measurement_model(
    MeasurementModel requested, const std::optional<VFAFeatures>& features) const
{
    if (requested != MeasurementModel::VFA) {
        return requested;
    }
    ExecutionContext ctx(ENGINE_NAME, "resolve_measurement_model");
    if (!features) {
        Logger::get_instance().log_warning(ctx, "VFA requested without direct-participation features; using GMM");
        return MeasurementModel::GMM;
    }
    VFAEligibility eligibility = check_vfa_eligibility(*features);
    if (!eligibility.eligible) {
        std::string failed;
        for (const auto& criterion : eligibility.failed_criteria) {
            failed += (failed.empty() ? "" : ", ") + criterion;
        }
        Logger::get_instance().log_warning(ctx, "VFA ineligible (" + failed + "); using GMM");
        return MeasurementModel::GMM;
    }
    return MeasurementModel::VFA;
}

PAAResult LiabilityEngine::measure_paa(double premiums, double acquisition_costs, double ra,
                                       uint32_t coverage_periods) const {
    if (!std::isfinite(premiums) || premiums < 0.0) {
        throw ValidationError("premiums", "must be non-negative");
    }
    if (!std::isfinite(acquisition_costs) || acquisition_costs < 0.0) {
        throw ValidationError("acquisition_costs", "must be non-negative");
    }
    if (!std::isfinite(ra) || ra < 0.0) {
        throw ValidationError("ra", "must be non-negative");
    }
    if (coverage_periods == 0) {
        throw ValidationError("coverage_periods", "must be at least one period");
    }

    PAAResult result;
    result.coverage_periods = coverage_periods;
    result.premiums = round_amount(premiums, rounding_);
    result.acquisition_costs = round_amount(acquisition_costs, rounding_);
    result.ra = round_amount(ra, rounding_);

    if (coverage_periods <= 1) {
        result.acquisition_expensed = result.acquisition_costs;
    } else {
        result.dac = result.acquisition_costs;
        double per_period = acquisition_costs / static_cast<double>(coverage_periods);
        for (uint32_t t = 0; t < coverage_periods; ++t) {
            result.dac_amortisation.push_back(round_amount(per_period, rounding_));
        }
    }
    result.lrc = round_amount(premiums - result.dac - ra, rounding_);
    return result;
}

// ============================================================================
// Measurement
// ============================================================================

LiabilityMeasurement LiabilityEngine::compute_measurement(
    const std::string& group_id,
    const CashFlowSchedule& schedule,
    double acquisition_costs,
    RAMethod ra_method,
    MeasurementModel model,
    const MacroContext& macro,
    const std::optional<VFAFeatures>& vfa_features) const
{
    if (!std::isfinite(acquisition_costs) || acquisition_costs < 0.0) {
        throw ValidationError("acquisition_costs", "must be non-negative");
    }

    LiabilityMeasurement m;
    m.group_id = group_id;
    m.requested_model = model;
    m.model = resolve_measurement_model(model, vfa_features);
    m.acquisition_costs = round_amount(acquisition_costs, rounding_);
    m.bel = calculate_bel(schedule, macro);
    m.ra = calculate_risk_adjustment(schedule, ra_method, m.bel);
    m.premiums = round_amount(schedule.total_premiums(), rounding_);
    m.fulfilment_cash_flows = round_amount(m.bel.bel + m.ra.ra, rounding_);

    if (m.model == MeasurementModel::PAA) {
        m.paa = measure_paa(m.premiums, m.acquisition_costs, m.ra.ra, schedule.term());
        m.total_liability = m.paa->lrc;
    } else {
        m.csm = recognise_csm(m.premiums, m.acquisition_costs, m.bel.bel, m.ra.ra, rounding_);
        double margin_or_loss = m.csm.onerous ? m.csm.loss_component : m.csm.csm;
        m.total_liability = round_amount(m.fulfilment_cash_flows + margin_or_loss, rounding_);
    }

    nlohmann::json inputs;
    inputs["schedule"] = schedule;
    inputs["acquisition_costs"] = acquisition_costs;
    inputs["ra_method"] = ra_method;
    inputs["model"] = model;
    inputs["macro"] = macro;
    if (vfa_features) {
        inputs["vfa_features"] = *vfa_features;
    }
    m.input_digest = digest_json(inputs, rounding_);
    m.result_digest = digest_json(strip_digests(m), rounding_);
    return m;
}

LiabilityMeasurement LiabilityEngine::measure_liability(const CashFlowSchedule& schedule,
                                                        double acquisition_costs,
                                                        RAMethod ra_method,
                                                        MeasurementModel model,
                                                        const MacroContext& macro,
                                                        const std::optional<VFAFeatures>& vfa_features) const {
    ExecutionContext ctx(ENGINE_NAME, "measure_liability");
    auto& logger = Logger::get_instance();
    auto start_time = std::chrono::high_resolution_clock::now();
    logger.log_calculation_start(ctx, schedule.size());

    LiabilityMeasurement m;
    try {
        m = compute_measurement("", schedule, acquisition_costs, ra_method, model, macro, vfa_features);
    } catch (const ValidationError& e) {
        logger.log_validation_error(ctx, e.field(), e.what());
        throw;
    }

    record(ctx, audit_record_for("liability.measure_liability", m.input_digest, m.result_digest,
                                 config_.regulatory_reference));

    CalculationMetrics metrics;
    metrics.execution_time_ms = std::chrono::duration<double, std::milli>(
        std::chrono::high_resolution_clock::now() - start_time).count();
    metrics.items_processed = schedule.size();
    logger.log_calculation_complete(ctx, metrics);
    return m;
}

LiabilityPortfolioResult LiabilityEngine::measure_portfolio(const std::vector<ContractGroup>& groups,
                                                            const MacroContext& macro) const {
    ExecutionContext ctx(ENGINE_NAME, "measure_portfolio");
    auto& logger = Logger::get_instance();
    auto start_time = std::chrono::high_resolution_clock::now();

    LiabilityPortfolioResult portfolio;
    if (groups.empty()) {
        return portfolio;
    }

    logger.log_calculation_start(ctx, groups.size());

    std::vector<std::optional<LiabilityMeasurement>> slots(groups.size());
    std::vector<std::string> errors(groups.size());

#ifdef HAVE_OPENMP
    #pragma omp parallel for schedule(dynamic, 4)
    for (long long i = 0; i < static_cast<long long>(groups.size()); ++i) {
#else
    for (size_t i = 0; i < groups.size(); ++i) {
#endif
        const ContractGroup& group = groups[static_cast<size_t>(i)];
        try {
            slots[static_cast<size_t>(i)] = compute_measurement(
                group.group_id, group.schedule, group.acquisition_costs, group.ra_method,
                group.model, macro, group.vfa_features);
        } catch (const std::exception& e) {
            errors[static_cast<size_t>(i)] = e.what();
        }
    }

    for (size_t i = 0; i < groups.size(); ++i) {
        if (!slots[i]) {
            ItemFailure failure;
            failure.item_id = groups[i].group_id;
            failure.message = errors[i];
            logger.log_item_failed(ctx, failure.item_id, failure.message);
            portfolio.failures.push_back(failure);
            continue;
        }
        LiabilityMeasurement& m = *slots[i];
        portfolio.total_bel += m.bel.bel;
        portfolio.total_ra += m.ra.ra;
        portfolio.total_csm += m.csm.csm;
        portfolio.total_loss_component += m.csm.loss_component;
        portfolio.total_liability += m.total_liability;
        if (m.csm.onerous) {
            portfolio.onerous_groups.push_back(m.group_id);
        }
        portfolio.results.push_back(std::move(m));
    }

    portfolio.total_bel = round_amount(portfolio.total_bel, rounding_);
    portfolio.total_ra = round_amount(portfolio.total_ra, rounding_);
    portfolio.total_csm = round_amount(portfolio.total_csm, rounding_);
    portfolio.total_loss_component = round_amount(portfolio.total_loss_component, rounding_);
    portfolio.total_liability = round_amount(portfolio.total_liability, rounding_);

    nlohmann::json inputs;
    inputs["groups"] = groups;
    inputs["macro"] = macro;
    portfolio.input_digest = digest_json(inputs, rounding_);
    portfolio.result_digest = digest_json(strip_digests(portfolio), rounding_);
    record(ctx, audit_record_for("liability.measure_portfolio", portfolio.input_digest,
                                 portfolio.result_digest, config_.regulatory_reference));

    portfolio.execution_time_ms = std::chrono::duration<double, std::milli>(
        std::chrono::high_resolution_clock::now() - start_time).count();

    CalculationMetrics metrics;
    metrics.execution_time_ms = portfolio.execution_time_ms;
    metrics.items_processed = portfolio.results.size();
    metrics.items_failed = portfolio.failures.size();
    logger.log_calculation_complete(ctx, metrics);
    return portfolio;
}

// ============================================================================
// Roll-forward, incurred claims, insurance finance
// ============================================================================

CSMRollForward LiabilityEngine::roll_forward_gmm(const GMMRollForwardInputs& inputs) const {
    ExecutionContext ctx(ENGINE_NAME, "roll_forward_gmm");
    CSMRollForward rf = liability::roll_forward_gmm(inputs, rounding_);
    rf.input_digest = digest_json(nlohmann::json(inputs), rounding_);
    rf.result_digest = digest_json(strip_digests(rf), rounding_);
    record(ctx, audit_record_for("liability.roll_forward_gmm", rf.input_digest, rf.result_digest,
                                 config_.regulatory_reference));
    return rf;
}

CSMRollForward LiabilityEngine::roll_forward_vfa(const VFARollForwardInputs& inputs) const {
    ExecutionContext ctx(ENGINE_NAME, "roll_forward_vfa");
    CSMRollForward rf = liability::roll_forward_vfa(inputs, rounding_);
    rf.input_digest = digest_json(nlohmann::json(inputs), rounding_);
    rf.result_digest = digest_json(strip_digests(rf), rounding_);
    record(ctx, audit_record_for("liability.roll_forward_vfa", rf.input_digest, rf.result_digest,
                                 config_.regulatory_reference));
    return rf;
}

LICResult LiabilityEngine::measure_incurred_claims(const LICInputs& inputs, double confidence,
                                                   std::optional<double> discount_rate) const {
    const std::pair<const char*, double> components[] = {
        {"reported_claims", inputs.reported_claims}, {"ibnr", inputs.ibnr}, {"ibner", inputs.ibner},
        {"ulae", inputs.ulae}, {"alae", inputs.alae}};
    for (const auto& c : components) {
        if (!std::isfinite(c.second) || c.second < 0.0) {
            throw ValidationError(c.first, "must be non-negative");
        }
    }
    if (discount_rate && !std::isfinite(*discount_rate)) {
        throw ValidationError("discount_rate", "must be finite");
    }

    ExecutionContext ctx(ENGINE_NAME, "measure_incurred_claims");
    LICResult result;
    result.confidence_level = confidence;
    double base = inputs.reported_claims + inputs.ibnr + inputs.ibner + inputs.ulae + inputs.alae;
    double ra = std::max(0.0, base * config_.lic_coefficient_of_variation * normal_quantile(confidence));
    if (discount_rate) {
        result.discount_factor = std::exp(-*discount_rate * config_.lic_discount_duration);
    }
    result.base = round_amount(base, rounding_);
    result.ra = round_amount(ra, rounding_);
    result.lic = round_amount((base + ra) * result.discount_factor, rounding_);

    nlohmann::json in = inputs;
    in["confidence"] = confidence;
    if (discount_rate) {
        in["discount_rate"] = *discount_rate;
    }
    result.input_digest = digest_json(in, rounding_);
    result.result_digest = digest_json(strip_digests(result), rounding_);
    record(ctx, audit_record_for("liability.measure_incurred_claims", result.input_digest,
                                 result.result_digest, config_.regulatory_reference));
    return result;
}

InsuranceFinanceResult LiabilityEngine::insurance_finance(const InsuranceFinanceInputs& inputs) const {
    if (!std::isfinite(inputs.opening_liability) || !std::isfinite(inputs.closing_liability)) {
        throw ValidationError("liability", "opening and closing liabilities must be finite");
    }
    if (!std::isfinite(inputs.opening_rate) || !std::isfinite(inputs.closing_rate)) {
        throw ValidationError("rate", "opening and closing rates must be finite");
    }

    ExecutionContext ctx(ENGINE_NAME, "insurance_finance");
    double accretion = inputs.opening_liability * inputs.opening_rate;
    double rate_effect = -inputs.opening_liability * (inputs.closing_rate - inputs.opening_rate) *
                         config_.finance_duration;
    double assumption_effect = inputs.closing_liability - inputs.opening_liability - accretion - rate_effect;
    double total = accretion + rate_effect + assumption_effect;

    InsuranceFinanceResult result;
    result.oci_option = inputs.oci_option;
    result.interest_accretion = round_amount(accretion, rounding_);
    result.rate_change_effect = round_amount(rate_effect, rounding_);
    result.assumption_change_effect = round_amount(assumption_effect, rounding_);
    result.total = round_amount(total, rounding_);
    if (inputs.oci_option) {
        result.oci = round_amount(rate_effect, rounding_);
        result.pnl = round_amount(accretion + assumption_effect, rounding_);
    } else {
        result.pnl = result.total;
    }

    result.input_digest = digest_json(nlohmann::json(inputs), rounding_);
    result.result_digest = digest_json(strip_digests(result), rounding_);
    record(ctx, audit_record_for("liability.insurance_finance", result.input_digest,
                                 result.result_digest, config_.regulatory_reference));
    return result;
}

// ============================================================================
// Presentation helpers
// ============================================================================

namespace {

LiabilityComponents components_of(const LiabilityMeasurement& m) {
    LiabilityComponents c;
    c.bel = m.bel.bel;
    c.ra = m.ra.ra;
    c.csm = m.csm.csm;
    c.total_liability = m.total_liability;
    return c;
}

LiabilityComponents scaled(const LiabilityComponents& c, double factor, const RoundingConfig& rounding) {
    LiabilityComponents out;
    out.bel = round_amount(c.bel * factor, rounding);
    out.ra = round_amount(c.ra * factor, rounding);
    out.csm = round_amount(c.csm * factor, rounding);
    out.total_liability = round_amount(c.total_liability * factor, rounding);
    return out;
}

LiabilityComponents combined(const LiabilityComponents& a, const LiabilityComponents& b, double sign,
                             const RoundingConfig& rounding) {
    LiabilityComponents out;
    out.bel = round_amount(a.bel + sign * b.bel, rounding);
    out.ra = round_amount(a.ra + sign * b.ra, rounding);
    out.csm = round_amount(a.csm + sign * b.csm, rounding);
    out.total_liability = round_amount(a.total_liability + sign * b.total_liability, rounding);
    return out;
}

} // anonymous namespace

NetGrossSplit LiabilityEngine::split_net_gross(const LiabilityMeasurement& measurement, ContractType type) const {
    NetGrossSplit split;
    split.type = type;
    LiabilityComponents measured = components_of(measurement);

    switch (type) {
        case ContractType::Direct:
            split.gross = measured;
            split.net = measured;
            break;
        case ContractType::ReinsuranceHeld:
            // Measured amounts are gross; the ceded share is relief
            split.relief_rate = config_.reinsurance.held_relief;
            split.gross = measured;
            split.relief = scaled(measured, split.relief_rate, rounding_);
            split.net = combined(split.gross, split.relief, -1.0, rounding_);
            break;
        case ContractType::ReinsuranceIssued:
            // Measured amounts are net; the assumed share is added back
            split.relief_rate = config_.reinsurance.issued_relief;
            split.net = measured;
            split.relief = scaled(measured, split.relief_rate, rounding_);
            split.gross = combined(split.net, split.relief, 1.0, rounding_);
            break;
    }
    return split;
}

ProfitabilityGroup LiabilityEngine::classify_profitability(double expected_profit, double premium) const {
    if (!std::isfinite(expected_profit) || !std::isfinite(premium) || premium < 0.0) {
        throw ValidationError("premium", "profit must be finite and premium non-negative");
    }
    if (premium == 0.0) {
        if (expected_profit > 0.0) return ProfitabilityGroup::Remaining;
        if (expected_profit < 0.0) return ProfitabilityGroup::Onerous;
        return ProfitabilityGroup::NoSignificantRisk;
    }
    double margin = expected_profit / premium;
    if (margin < -config_.profitability_band) {
        return ProfitabilityGroup::Onerous;
    }
    if (margin < config_.profitability_band) {
        return ProfitabilityGroup::NoSignificantRisk;
    }
    return ProfitabilityGroup::Remaining;
}

std::vector<CSMReleasePeriod> LiabilityEngine::project_csm_release(double csm,
                                                                   const std::vector<double>& coverage_units,
                                                                   double locked_in_rate) const {
    return liability::project_csm_release(csm, coverage_units, locked_in_rate, rounding_);
}

} // namespace liability
} // namespace regcalc
