#ifndef REGCALC_SERIALIZATION_HPP
#define REGCALC_SERIALIZATION_HPP

#include "audit_trail.hpp"
#include "credit/credit_risk_engine.hpp"
#include "errors.hpp"
#include "liability/liability_engine.hpp"
#include "macro_context.hpp"
#include "numeric.hpp"
#include "solvency/guarantee_fund.hpp"
#include "solvency/solvency_engine.hpp"
#include <nlohmann/json.hpp>

// JSON forms of engine inputs and results. The functions live in the
// namespace of the type they serialize so nlohmann::json finds them by ADL.
// Enumerations serialize as their lowercase names.

namespace regcalc {

void to_json(nlohmann::json& j, const CalendarDate& date);
void to_json(nlohmann::json& j, ScenarioKind kind);
void to_json(nlohmann::json& j, DiscountMethod method);
void to_json(nlohmann::json& j, const MacroContext& macro);
void to_json(nlohmann::json& j, const ItemFailure& failure);
void to_json(nlohmann::json& j, const AuditRecord& record);

// Copy of a result document without input_digest / result_digest keys at
// any depth; the result digest is taken over this form
nlohmann::json strip_digests(const nlohmann::json& document);

namespace credit {

void to_json(nlohmann::json& j, CollateralType type);
void to_json(nlohmann::json& j, FacilityType type);
void to_json(nlohmann::json& j, Stage stage);
void to_json(nlohmann::json& j, const QualitativeFlags& flags);
void to_json(nlohmann::json& j, const Exposure& exposure);
void to_json(nlohmann::json& j, const ECLResult& result);
void to_json(nlohmann::json& j, const PortfolioECLResult& result);
void to_json(nlohmann::json& j, const StressedECL& stressed);
void to_json(nlohmann::json& j, const ECLStressResult& result);
void to_json(nlohmann::json& j, const BayesianPDEstimate& estimate);
void to_json(nlohmann::json& j, const DefaultSimulationParams& params);
void to_json(nlohmann::json& j, const DefaultSimulationResult& result);

} // namespace credit

namespace liability {

void to_json(nlohmann::json& j, const PeriodCashFlow& period);
void to_json(nlohmann::json& j, const CashFlowSchedule& schedule);
void to_json(nlohmann::json& j, RAMethod method);
void to_json(nlohmann::json& j, const RAResult& result);
void to_json(nlohmann::json& j, const RiskComponent& component);
void to_json(nlohmann::json& j, const DiversifiedRA& result);
void to_json(nlohmann::json& j, const CSMResult& result);
void to_json(nlohmann::json& j, const GMMRollForwardInputs& inputs);
void to_json(nlohmann::json& j, const VFARollForwardInputs& inputs);
void to_json(nlohmann::json& j, const CSMRollForward& rf);
void to_json(nlohmann::json& j, const CSMReleasePeriod& period);
void to_json(nlohmann::json& j, CoverageUnitsMethod method);
void to_json(nlohmann::json& j, MeasurementModel model);
void to_json(nlohmann::json& j, const VFAFeatures& features);
void to_json(nlohmann::json& j, const VFAEligibility& eligibility);
void to_json(nlohmann::json& j, const DiscountRateResolution& resolution);
void to_json(nlohmann::json& j, const BELResult& result);
void to_json(nlohmann::json& j, const PAAResult& result);
void to_json(nlohmann::json& j, const LiabilityMeasurement& measurement);
void to_json(nlohmann::json& j, const ContractGroup& group);
void to_json(nlohmann::json& j, const LiabilityPortfolioResult& result);
void to_json(nlohmann::json& j, const LICInputs& inputs);
void to_json(nlohmann::json& j, const LICResult& result);
void to_json(nlohmann::json& j, const InsuranceFinanceInputs& inputs);
void to_json(nlohmann::json& j, const InsuranceFinanceResult& result);
void to_json(nlohmann::json& j, ContractType type);
void to_json(nlohmann::json& j, const LiabilityComponents& components);
void to_json(nlohmann::json& j, const NetGrossSplit& split);
void to_json(nlohmann::json& j, ProfitabilityGroup group);

} // namespace liability

namespace solvency {

void to_json(nlohmann::json& j, InsurerType type);
void to_json(nlohmann::json& j, SolvencyStatus status);
void to_json(nlohmann::json& j, const MarginOptions& options);
void to_json(nlohmann::json& j, const MinimumMarginResult& result);
void to_json(nlohmann::json& j, const OwnFundsInputs& inputs);
void to_json(nlohmann::json& j, const IFRSAdjustments& adjustments);
void to_json(nlohmann::json& j, const RepoCheck& check);
void to_json(nlohmann::json& j, const OwnFundsResult& result);
void to_json(nlohmann::json& j, const RatioResult& result);
void to_json(nlohmann::json& j, const ScenarioStress& stress);
void to_json(nlohmann::json& j, const MonteCarloStress& stress);
void to_json(nlohmann::json& j, const StressTestResult& result);
void to_json(nlohmann::json& j, const SolvencyPosition& position);
void to_json(nlohmann::json& j, const MarketRiskExposures& market);
void to_json(nlohmann::json& j, const UnderwritingRisks& underwriting);
void to_json(nlohmann::json& j, const SCRResult& result);
void to_json(nlohmann::json& j, const IFRSImpactResult& result);
void to_json(nlohmann::json& j, const HighLiquidCheck& check);
void to_json(nlohmann::json& j, RiskClass risk_class);
void to_json(nlohmann::json& j, WarningLevel level);
void to_json(nlohmann::json& j, const InsurerProfile& insurer);
void to_json(nlohmann::json& j, const ContributionResult& result);
void to_json(nlohmann::json& j, const BankruptcySimulationResult& result);
void to_json(nlohmann::json& j, const FundAdequacyResult& result);
void to_json(nlohmann::json& j, const GuaranteeFundAssessment& assessment);
void to_json(nlohmann::json& j, const EarlyWarning& warning);

// Request inputs; absent keys keep their defaults
void from_json(const nlohmann::json& j, MarginOptions& options);
void from_json(const nlohmann::json& j, OwnFundsInputs& inputs);
void from_json(const nlohmann::json& j, IFRSAdjustments& adjustments);
void from_json(const nlohmann::json& j, InsurerProfile& insurer);

} // namespace solvency

} // namespace regcalc

#endif // REGCALC_SERIALIZATION_HPP
