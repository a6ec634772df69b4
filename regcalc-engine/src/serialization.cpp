#include "serialization.hpp"

using json = nlohmann::json;

namespace regcalc {

// ============================================================================
// Shared
// ============================================================================

void to_json(json& j, const CalendarDate& date) {
    j = date.to_string();
}

void to_json(json& j, ScenarioKind kind) {
    j = to_string(kind);
}

void to_json(json& j, DiscountMethod method) {
    j = to_string(method);
}

void to_json(json& j, const MacroContext& macro) {
    json scenarios = json::object();
    for (ScenarioKind kind : {ScenarioKind::Base, ScenarioKind::Adverse, ScenarioKind::Severe}) {
        const size_t idx = static_cast<size_t>(kind);
        scenarios[to_string(kind)] = {
            {"multiplier", macro.scenarios().multipliers[idx]},
            {"weight", macro.scenarios().weights[idx]}};
    }
    j = json{
        {"valuation_date", macro.valuation_date()},
        {"base_rate", macro.base_rate()},
        {"inflation_rate", macro.inflation_rate()},
        {"gdp_growth", macro.gdp_growth()},
        {"fx_rates", macro.fx_rates()},
        {"monthly_calculation_index", macro.monthly_calculation_index()},
        {"scenarios", scenarios}};
}

void to_json(json& j, const ItemFailure& failure) {
    j = json{{"item_id", failure.item_id}, {"message", failure.message}};
}

void to_json(json& j, const AuditRecord& record) {
    j = audit_record_to_json(record);
}

json strip_digests(const json& document) {
    if (document.is_object()) {
        json out = json::object();
        for (auto it = document.begin(); it != document.end(); ++it) {
            if (it.key() == "input_digest" || it.key() == "result_digest") {
                continue;
            }
            out[it.key()] = strip_digests(it.value());
        }
        return out;
    }
    if (document.is_array()) {
        json out = json::array();
        for (const auto& item : document) {
            out.push_back(strip_digests(item));
        }
        return out;
    }
    return document;
}

// ============================================================================
// Credit
// ============================================================================

namespace credit {

void to_json(json& j, CollateralType type) {
    j = to_string(type);
}

void to_json(json& j, FacilityType type) {
    j = to_string(type);
}

void to_json(json& j, Stage stage) {
    j = stage_number(stage);
}

void to_json(json& j, const QualitativeFlags& flags) {
    j = json{
        {"default_event", flags.default_event},
        {"restructuring", flags.restructuring},
        {"watchlist", flags.watchlist},
        {"covenant_breach", flags.covenant_breach}};
}

void to_json(json& j, const Exposure& exposure) {
    j = json{
        {"exposure_id", exposure.exposure_id},
        {"gross_carrying_amount", exposure.gross_carrying_amount},
        {"pd", exposure.pd_annual},
        {"pd_origination", exposure.pd_at_origination},
        {"effective_rate", exposure.effective_rate},
        {"remaining_term", exposure.remaining_term},
        {"days_past_due", exposure.days_past_due},
        {"collateral_type", exposure.collateral_type},
        {"collateral_value", exposure.collateral_value},
        {"undrawn_amount", exposure.undrawn_amount},
        {"facility_type", exposure.facility_type},
        {"flags", exposure.flags}};
    j["lgd"] = exposure.lgd ? json(*exposure.lgd) : json(nullptr);
    if (!exposure.attributes.empty()) {
        j["attributes"] = exposure.attributes;
    }
}

void to_json(json& j, const ECLResult& result) {
    j = json{
        {"exposure_id", result.exposure_id},
        {"stage", result.stage},
        {"stage_triggers", result.stage_triggers},
        {"scenario", result.scenario},
        {"scenario_multiplier", result.scenario_multiplier},
        {"pd_adjusted", result.pd_adjusted},
        {"lgd_adjusted", result.lgd_adjusted},
        {"ead", result.ead},
        {"horizon", result.horizon},
        {"pd_values", result.pd_values},
        {"ead_values", result.ead_values},
        {"discount_factors", result.discount_factors},
        {"period_losses", result.period_losses},
        {"stage3_uplift", result.stage3_uplift},
        {"exposure_bound", result.exposure_bound},
        {"ecl", result.ecl},
        {"input_digest", result.input_digest},
        {"result_digest", result.result_digest}};
}

void to_json(json& j, const PortfolioECLResult& result) {
    json by_stage = json::object();
    for (size_t s = 0; s < 3; ++s) {
        by_stage[std::to_string(s + 1)] = {
            {"ecl", result.ecl_by_stage[s]},
            {"gca", result.gca_by_stage[s]},
            {"count", result.count_by_stage[s]}};
    }
    j = json{
        {"scenario", result.scenario},
        {"total_gca", result.total_gca},
        {"total_ead", result.total_ead},
        {"total_ecl", result.total_ecl},
        {"coverage_ratio", result.coverage_ratio},
        {"by_stage", by_stage},
        {"stage3_coverage", result.stage3_coverage},
        {"results", result.results},
        {"failures", result.failures},
        {"input_digest", result.input_digest},
        {"result_digest", result.result_digest}};
}

void to_json(json& j, const StressedECL& stressed) {
    j = json{
        {"scenario", stressed.scenario},
        {"multiplier", stressed.multiplier},
        {"ecl", stressed.ecl},
        {"change_pct", stressed.change_pct}};
}

void to_json(json& j, const ECLStressResult& result) {
    j = json{{"base_ecl", result.base_ecl}, {"scenarios", result.scenarios}};
}

void to_json(json& j, const BayesianPDEstimate& estimate) {
    j = json{
        {"defaults", estimate.defaults},
        {"observations", estimate.observations},
        {"posterior_alpha", estimate.posterior_alpha},
        {"posterior_beta", estimate.posterior_beta},
        {"pd_mean", estimate.pd_mean},
        {"ci_lower", estimate.ci_lower},
        {"ci_upper", estimate.ci_upper}};
}

void to_json(json& j, const DefaultSimulationParams& params) {
    j = json{
        {"num_simulations", params.num_simulations},
        {"asset_correlation", params.asset_correlation},
        {"seed", params.seed}};
    j["loss_threshold"] = params.loss_threshold ? json(*params.loss_threshold) : json(nullptr);
}

void to_json(json& j, const DefaultSimulationResult& result) {
    j = json{
        {"simulations", result.simulations},
        {"obligors", result.obligors},
        {"total_exposure", result.total_exposure},
        {"expected_loss", result.expected_loss},
        {"loss_std_dev", result.loss_std_dev},
        {"var_95", result.var_95},
        {"var_99", result.var_99},
        {"expected_shortfall_99", result.expected_shortfall_99},
        {"mean_default_count", result.mean_default_count},
        {"loss_threshold", result.loss_threshold},
        {"probability_exceeding_threshold", result.probability_exceeding_threshold}};
}

} // namespace credit

// ============================================================================
// Liability
// ============================================================================

namespace liability {

void to_json(json& j, const PeriodCashFlow& period) {
    j = json{
        {"period", period.period},
        {"premiums", period.premiums},
        {"claims", period.claims},
        {"expenses", period.expenses},
        {"acquisition_costs", period.acquisition_costs}};
}

void to_json(json& j, const CashFlowSchedule& schedule) {
    j = json{{"periods", schedule.periods()}};
    j["lapse_rate"] = schedule.lapse_rate() ? json(*schedule.lapse_rate()) : json(nullptr);
}

void to_json(json& j, RAMethod method) {
    j = to_string(method);
}

void to_json(json& j, const RAResult& result) {
    j = json{
        {"method", result.method},
        {"confidence_level", result.confidence_level},
        {"ra", result.ra}};
    if (result.method == RAMethod::CoC) {
        j["capital"] = result.capital;
        j["pv_capital"] = result.pv_capital;
        j["coc_rate"] = result.coc_rate;
    } else {
        j["simulations"] = result.simulations;
        j["expected_value"] = result.expected_value;
        j["tail_value"] = result.tail_value;
    }
}

void to_json(json& j, const RiskComponent& component) {
    j = json{{"risk", component.risk}, {"ra", component.ra}};
}

void to_json(json& j, const DiversifiedRA& result) {
    j = json{
        {"components", result.components},
        {"correlations", result.correlations},
        {"undiversified", result.undiversified},
        {"diversified", result.diversified},
        {"diversification_benefit", result.diversification_benefit}};
}

void to_json(json& j, const CSMResult& result) {
    j = json{
        {"csm", result.csm},
        {"loss_component", result.loss_component},
        {"onerous", result.onerous}};
}

void to_json(json& j, const GMMRollForwardInputs& inputs) {
    j = json{
        {"opening_csm", inputs.opening_csm},
        {"new_business_csm", inputs.new_business_csm},
        {"locked_in_rate", inputs.locked_in_rate},
        {"changes_future_service", inputs.changes_future_service},
        {"currency_effect", inputs.currency_effect},
        {"coverage_units_current", inputs.coverage_units_current},
        {"coverage_units_remaining", inputs.coverage_units_remaining}};
}

void to_json(json& j, const VFARollForwardInputs& inputs) {
    j = json{
        {"opening_csm", inputs.opening_csm},
        {"new_business_csm", inputs.new_business_csm},
        {"change_fv_underlying", inputs.change_fv_underlying},
        {"changes_fcf_non_variable", inputs.changes_fcf_non_variable},
        {"currency_effect", inputs.currency_effect},
        {"coverage_units_current", inputs.coverage_units_current},
        {"coverage_units_remaining", inputs.coverage_units_remaining}};
}

void to_json(json& j, const CSMRollForward& rf) {
    j = json{
        {"model", rf.model},
        {"opening", rf.opening},
        {"new_business", rf.new_business},
        {"interest_accretion", rf.interest_accretion},
        {"changes_future_service", rf.changes_future_service},
        {"change_fv_underlying", rf.change_fv_underlying},
        {"changes_fcf_non_variable", rf.changes_fcf_non_variable},
        {"currency_effect", rf.currency_effect},
        {"pre_release", rf.pre_release},
        {"release", rf.release},
        {"closing", rf.closing},
        {"input_digest", rf.input_digest},
        {"result_digest", rf.result_digest}};
}

void to_json(json& j, const CSMReleasePeriod& period) {
    j = json{
        {"period", period.period},
        {"opening", period.opening},
        {"interest_accretion", period.interest_accretion},
        {"release", period.release},
        {"closing", period.closing}};
}

void to_json(json& j, CoverageUnitsMethod method) {
    j = to_string(method);
}

void to_json(json& j, MeasurementModel model) {
    j = to_string(model);
}

void to_json(json& j, const VFAFeatures& features) {
    j = json{
        {"substantial_share_fair_value", features.substantial_share_fair_value},
        {"variable_payout_portion", features.variable_payout_portion},
        {"investment_service", features.investment_service}};
}

void to_json(json& j, const VFAEligibility& eligibility) {
    j = json{
        {"eligible", eligibility.eligible},
        {"substantial_share_fair_value", eligibility.substantial_share_fair_value},
        {"variable_payout_portion", eligibility.variable_payout_portion},
        {"investment_service", eligibility.investment_service},
        {"failed_criteria", eligibility.failed_criteria}};
}

void to_json(json& j, const DiscountRateResolution& resolution) {
    j = json{
        {"term", resolution.term},
        {"base_rate", resolution.base_rate},
        {"illiquidity_factor", resolution.illiquidity_factor},
        {"illiquidity_premium", resolution.illiquidity_premium},
        {"rate", resolution.rate}};
}

void to_json(json& j, const BELResult& result) {
    j = json{
        {"discount", result.discount},
        {"method", result.method},
        {"lapse_rate", result.lapse_rate},
        {"net_cash_flows", result.net_cash_flows},
        {"survival_factors", result.survival_factors},
        {"discount_factors", result.discount_factors},
        {"discounted_cash_flows", result.discounted_cash_flows},
        {"bel", result.bel}};
}

void to_json(json& j, const PAAResult& result) {
    j = json{
        {"coverage_periods", result.coverage_periods},
        {"premiums", result.premiums},
        {"acquisition_costs", result.acquisition_costs},
        {"dac", result.dac},
        {"acquisition_expensed", result.acquisition_expensed},
        {"ra", result.ra},
        {"lrc", result.lrc},
        {"dac_amortisation", result.dac_amortisation}};
}

void to_json(json& j, const LiabilityMeasurement& measurement) {
    j = json{
        {"group_id", measurement.group_id},
        {"requested_model", measurement.requested_model},
        {"model", measurement.model},
        {"premiums", measurement.premiums},
        {"acquisition_costs", measurement.acquisition_costs},
        {"bel", measurement.bel},
        {"ra", measurement.ra},
        {"csm", measurement.csm},
        {"fulfilment_cash_flows", measurement.fulfilment_cash_flows},
        {"total_liability", measurement.total_liability},
        {"input_digest", measurement.input_digest},
        {"result_digest", measurement.result_digest}};
    j["paa"] = measurement.paa ? json(*measurement.paa) : json(nullptr);
}

void to_json(json& j, const ContractGroup& group) {
    j = json{
        {"group_id", group.group_id},
        {"schedule", group.schedule},
        {"acquisition_costs", group.acquisition_costs},
        {"ra_method", group.ra_method},
        {"model", group.model}};
    j["vfa_features"] = group.vfa_features ? json(*group.vfa_features) : json(nullptr);
}

void to_json(json& j, const LiabilityPortfolioResult& result) {
    j = json{
        {"total_bel", result.total_bel},
        {"total_ra", result.total_ra},
        {"total_csm", result.total_csm},
        {"total_loss_component", result.total_loss_component},
        {"total_liability", result.total_liability},
        {"onerous_groups", result.onerous_groups},
        {"results", result.results},
        {"failures", result.failures},
        {"input_digest", result.input_digest},
        {"result_digest", result.result_digest}};
}

void to_json(json& j, const LICInputs& inputs) {
    j = json{
        {"reported_claims", inputs.reported_claims},
        {"ibnr", inputs.ibnr},
        {"ibner", inputs.ibner},
        {"ulae", inputs.ulae},
        {"alae", inputs.alae}};
}

void to_json(json& j, const LICResult& result) {
    j = json{
        {"base", result.base},
        {"ra", result.ra},
        {"confidence_level", result.confidence_level},
        {"discount_factor", result.discount_factor},
        {"lic", result.lic},
        {"input_digest", result.input_digest},
        {"result_digest", result.result_digest}};
}

void to_json(json& j, const InsuranceFinanceInputs& inputs) {
    j = json{
        {"opening_liability", inputs.opening_liability},
        {"closing_liability", inputs.closing_liability},
        {"opening_rate", inputs.opening_rate},
        {"closing_rate", inputs.closing_rate},
        {"oci_option", inputs.oci_option}};
}

void to_json(json& j, const InsuranceFinanceResult& result) {
    j = json{
        {"interest_accretion", result.interest_accretion},
        {"rate_change_effect", result.rate_change_effect},
        {"assumption_change_effect", result.assumption_change_effect},
        {"total", result.total},
        {"pnl", result.pnl},
        {"oci", result.oci},
        {"oci_option", result.oci_option},
        {"input_digest", result.input_digest},
        {"result_digest", result.result_digest}};
}

void to_json(json& j, ContractType type) {
    j = to_string(type);
}

void to_json(json& j, const LiabilityComponents& components) {
    j = json{
        {"bel", components.bel},
        {"ra", components.ra},
        {"csm", components.csm},
        {"total_liability", components.total_liability}};
}

void to_json(json& j, const NetGrossSplit& split) {
    j = json{
        {"type", split.type},
        {"relief_rate", split.relief_rate},
        {"gross", split.gross},
        {"relief", split.relief},
        {"net", split.net}};
}

void to_json(json& j, ProfitabilityGroup group) {
    j = to_string(group);
}

} // namespace liability

// ============================================================================
// Solvency
// ============================================================================

namespace solvency {

void to_json(json& j, InsurerType type) {
    j = to_string(type);
}

void to_json(json& j, SolvencyStatus status) {
    j = to_string(status);
}

void to_json(json& j, const MarginOptions& options) {
    j = json{
        {"compulsory_lines", options.compulsory_lines},
        {"annuity_reserves", options.annuity_reserves},
        {"mathematical_reserves", options.mathematical_reserves},
        {"insurer_type", options.insurer_type}};
    j["correction_coefficient"] = options.correction_coefficient
        ? json(*options.correction_coefficient)
        : json(nullptr);
}

void to_json(json& j, const MinimumMarginResult& result) {
    j = json{
        {"premium_base", result.premium_base},
        {"claims_base", result.claims_base},
        {"correction_coefficient", result.correction_coefficient},
        {"mmp_premiums", result.mmp_premiums},
        {"mmp_claims", result.mmp_claims},
        {"base_margin", result.base_margin},
        {"life_addon", result.life_addon},
        {"compulsory_loading", result.compulsory_loading},
        {"guaranteed_fund", result.guaranteed_fund},
        {"guaranteed_fund_applied", result.guaranteed_fund_applied},
        {"mmp", result.mmp}};
}

void to_json(json& j, const OwnFundsInputs& inputs) {
    j = json{
        {"equity", inputs.equity},
        {"illiquid_assets", inputs.illiquid_assets},
        {"intangible_assets", inputs.intangible_assets},
        {"subordinated_debt", inputs.subordinated_debt},
        {"repo_amount", inputs.repo_amount},
        {"reserves", inputs.reserves}};
}

void to_json(json& j, const IFRSAdjustments& adjustments) {
    j = json{{"ecl", adjustments.ecl}, {"csm", adjustments.csm}};
}

void to_json(json& j, const RepoCheck& check) {
    j = json{
        {"repo_amount", check.repo_amount},
        {"reserves", check.reserves},
        {"ratio", check.ratio},
        {"limit", check.limit},
        {"breach", check.breach},
        {"penalty", check.penalty}};
}

void to_json(json& j, const OwnFundsResult& result) {
    j = json{
        {"equity", result.equity},
        {"ecl_adjustment", result.ecl_adjustment},
        {"csm_adjustment", result.csm_adjustment},
        {"illiquid_assets", result.illiquid_assets},
        {"intangible_assets", result.intangible_assets},
        {"pre_subordinated", result.pre_subordinated},
        {"subordinated_debt", result.subordinated_debt},
        {"subordinated_cap", result.subordinated_cap},
        {"subordinated_included", result.subordinated_included},
        {"subordinated_excess", result.subordinated_excess},
        {"repo", result.repo},
        {"fmp", result.fmp}};
}

void to_json(json& j, const RatioResult& result) {
    j = json{
        {"fmp", result.fmp},
        {"mmp", result.mmp},
        {"ratio", result.ratio},
        {"compliant", result.compliant},
        {"status", result.status}};
}

void to_json(json& j, const ScenarioStress& stress) {
    j = json{
        {"name", stress.name},
        {"own_funds_shock", stress.own_funds_shock},
        {"margin_shock", stress.margin_shock},
        {"fmp", stress.fmp},
        {"mmp", stress.mmp},
        {"ratio", stress.ratio},
        {"compliant", stress.compliant}};
}

void to_json(json& j, const MonteCarloStress& stress) {
    j = json{
        {"simulations", stress.simulations},
        {"seed", stress.seed},
        {"own_funds_volatility", stress.own_funds_volatility},
        {"margin_volatility", stress.margin_volatility},
        {"confidence", stress.confidence},
        {"mean_ratio", stress.mean_ratio},
        {"tail_ratio", stress.tail_ratio},
        {"probability_below_minimum", stress.probability_below_minimum}};
}

void to_json(json& j, const StressTestResult& result) {
    j = json{
        {"base_ratio", result.base_ratio},
        {"scenarios", result.scenarios},
        {"monte_carlo", result.monte_carlo}};
}

void to_json(json& j, const SolvencyPosition& position) {
    j = json{
        {"minimum_margin", position.minimum_margin},
        {"own_funds", position.own_funds},
        {"ratio", position.ratio},
        {"stress", position.stress},
        {"input_digest", position.input_digest},
        {"result_digest", position.result_digest}};
}

void to_json(json& j, const MarketRiskExposures& market) {
    j = json{
        {"equity_type1", market.equity_type1},
        {"equity_type2", market.equity_type2},
        {"property", market.property},
        {"interest_rate_sensitivity", market.interest_rate_sensitivity},
        {"spread", market.spread}};
}

void to_json(json& j, const UnderwritingRisks& underwriting) {
    j = json{
        {"premium_risk", underwriting.premium_risk},
        {"reserve_risk", underwriting.reserve_risk},
        {"catastrophe_risk", underwriting.catastrophe_risk}};
}

void to_json(json& j, const SCRResult& result) {
    j = json{
        {"scr_equity", result.scr_equity},
        {"scr_property", result.scr_property},
        {"scr_interest_rate", result.scr_interest_rate},
        {"scr_spread", result.scr_spread},
        {"scr_market", result.scr_market},
        {"scr_underwriting", result.scr_underwriting},
        {"scr_counterparty", result.scr_counterparty},
        {"bscr", result.bscr},
        {"scr_operational", result.scr_operational},
        {"scr", result.scr},
        {"input_digest", result.input_digest},
        {"result_digest", result.result_digest}};
}

void to_json(json& j, const IFRSImpactResult& result) {
    j = json{
        {"pre_fmp", result.pre_fmp},
        {"pre_mmp", result.pre_mmp},
        {"pre_ratio", result.pre_ratio},
        {"ecl_impact", result.ecl_impact},
        {"csm_impact", result.csm_impact},
        {"bel_ra_impact", result.bel_ra_impact},
        {"post_fmp", result.post_fmp},
        {"post_mmp", result.post_mmp},
        {"post_ratio", result.post_ratio},
        {"ratio_change_pp", result.ratio_change_pp},
        {"input_digest", result.input_digest},
        {"result_digest", result.result_digest}};
}

void to_json(json& j, const HighLiquidCheck& check) {
    j = json{
        {"high_liquid_assets", check.high_liquid_assets},
        {"short_term_liabilities", check.short_term_liabilities},
        {"ratio", check.ratio},
        {"required", check.required},
        {"compliant", check.compliant}};
}

void from_json(const json& j, MarginOptions& options) {
    if (j.contains("correction_coefficient") && !j.at("correction_coefficient").is_null()) {
        options.correction_coefficient = j.at("correction_coefficient").get<double>();
    }
    options.compulsory_lines = j.value("compulsory_lines", options.compulsory_lines);
    options.annuity_reserves = j.value("annuity_reserves", options.annuity_reserves);
    options.mathematical_reserves = j.value("mathematical_reserves", options.mathematical_reserves);
    if (j.contains("insurer_type")) {
        options.insurer_type = parse_insurer_type(j.at("insurer_type").get<std::string>());
    }
}

void from_json(const json& j, OwnFundsInputs& inputs) {
    inputs.equity = j.value("equity", inputs.equity);
    inputs.illiquid_assets = j.value("illiquid_assets", inputs.illiquid_assets);
    inputs.intangible_assets = j.value("intangible_assets", inputs.intangible_assets);
    inputs.subordinated_debt = j.value("subordinated_debt", inputs.subordinated_debt);
    inputs.repo_amount = j.value("repo_amount", inputs.repo_amount);
    inputs.reserves = j.value("reserves", inputs.reserves);
}

void from_json(const json& j, IFRSAdjustments& adjustments) {
    adjustments.ecl = j.value("ecl", adjustments.ecl);
    adjustments.csm = j.value("csm", adjustments.csm);
}


// ============================================================================
// Guarantee fund
// ============================================================================

namespace {

json optional_number(const std::optional<double>& value) {
    return value ? json(*value) : json(nullptr);
}

} // anonymous namespace

void to_json(json& j, RiskClass risk_class) {
    j = to_string(risk_class);
}

void to_json(json& j, WarningLevel level) {
    j = to_string(level);
}

void to_json(json& j, const InsurerProfile& insurer) {
    j = json{
        {"name", insurer.name},
        {"gross_premiums", insurer.gross_premiums},
        {"reserves", insurer.reserves},
        {"solvency_ratio", optional_number(insurer.solvency_ratio)},
        {"loss_ratio", insurer.loss_ratio},
        {"combined_ratio", insurer.combined_ratio},
        {"years_in_market", insurer.years_in_market},
        {"pd", optional_number(insurer.pd)},
        {"recovery", optional_number(insurer.recovery)},
        {"premium_growth", insurer.premium_growth}};
    j["risk_class"] = insurer.risk_class ? json(*insurer.risk_class) : json(nullptr);
}

void to_json(json& j, const ContributionResult& result) {
    j = json{
        {"insurer", result.insurer},
        {"premium_base", result.premium_base},
        {"risk_class", result.risk_class},
        {"class_basis", result.class_basis},
        {"score", result.score},
        {"rate", result.rate},
        {"contribution", result.contribution}};
}

void to_json(json& j, const BankruptcySimulationResult& result) {
    j = json{
        {"simulations", result.simulations},
        {"insurers", result.insurers},
        {"correlation", result.correlation},
        {"expected_claims", result.expected_claims},
        {"var_95", result.var_95},
        {"var_99", result.var_99},
        {"assumed_fund", result.assumed_fund},
        {"probability_of_shortfall", result.probability_of_shortfall},
        {"fund_adequacy", result.fund_adequacy},
        {"input_digest", result.input_digest},
        {"result_digest", result.result_digest}};
}

void to_json(json& j, const FundAdequacyResult& result) {
    j = json{
        {"fund_balance", result.fund_balance},
        {"expected_claims", result.expected_claims},
        {"contributions_pipeline", result.contributions_pipeline},
        {"current_ratio", result.current_ratio},
        {"projected_ratio", result.projected_ratio},
        {"required_ratio", result.required_ratio},
        {"adequate", result.adequate},
        {"will_be_adequate", result.will_be_adequate},
        {"shortfall", result.shortfall},
        {"surplus", result.surplus}};
}

void to_json(json& j, const GuaranteeFundAssessment& assessment) {
    j = json{
        {"contributions", assessment.contributions},
        {"total_contributions", assessment.total_contributions},
        {"fund_balance", assessment.fund_balance},
        {"bankruptcy", assessment.bankruptcy},
        {"adequacy", assessment.adequacy},
        {"input_digest", assessment.input_digest},
        {"result_digest", assessment.result_digest}};
}

void to_json(json& j, const EarlyWarning& warning) {
    j = json{
        {"insurer", warning.insurer},
        {"risk_score", warning.risk_score},
        {"level", warning.level},
        {"warnings", warning.warnings},
        {"recommended_action", warning.recommended_action},
        {"solvency_ratio", warning.solvency_ratio},
        {"loss_ratio", warning.loss_ratio},
        {"combined_ratio", warning.combined_ratio},
        {"premium_growth", warning.premium_growth}};
}

void from_json(const json& j, InsurerProfile& insurer) {
    insurer.name = j.value("name", insurer.name);
    insurer.gross_premiums = j.value("gross_premiums", insurer.gross_premiums);
    insurer.reserves = j.value("reserves", insurer.reserves);
    if (j.contains("solvency_ratio") && !j.at("solvency_ratio").is_null()) {
        insurer.solvency_ratio = j.at("solvency_ratio").get<double>();
    }
    insurer.loss_ratio = j.value("loss_ratio", insurer.loss_ratio);
    insurer.combined_ratio = j.value("combined_ratio", insurer.combined_ratio);
    insurer.years_in_market = j.value("years_in_market", insurer.years_in_market);
    if (j.contains("pd") && !j.at("pd").is_null()) {
        insurer.pd = j.at("pd").get<double>();
    }
    if (j.contains("recovery") && !j.at("recovery").is_null()) {
        insurer.recovery = j.at("recovery").get<double>();
    }
    insurer.premium_growth = j.value("premium_growth", insurer.premium_growth);
    if (j.contains("risk_class") && !j.at("risk_class").is_null()) {
        insurer.risk_class = parse_risk_class(j.at("risk_class").get<std::string>());
    }
}

} // namespace solvency

} // namespace regcalc
