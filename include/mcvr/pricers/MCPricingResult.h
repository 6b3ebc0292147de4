#ifndef MCVR_PRICERS_MCPRICINGRESULT_H
#define MCVR_PRICERS_MCPRICINGRESULT_H

#include <mcvr/montecarlo/MonteCarlo.h>
#include <mcvr/montecarlo/Sampler.h>
#include <mcvr/montecarlo/VarianceReduction.h>
#include <optional>
#include <string>
#include <vector>

struct ControlVariateReport {
    std::vector<std::string> controls;   // names, in beta order
    std::vector<double> beta;
    double varianceReductionFactor = 1.0;
    EstimateStatistics adjusted;
};

struct MCPricingResult {
    SamplingMethod method = SamplingMethod::Plain;
    bool antithetic = false;
    std::optional<bool> qmcScramble;                  // Sobol / Halton only
    EstimateStatistics baseline;
    std::optional<ControlVariateReport> controlVariate;
};

/**
 * Shared tail of the MC pricers: baseline statistics of the discounted payoffs,
 * then (if controls are given) one regression on all of them.
 * An empty control list means control variates are off.
 */
MCPricingResult assemblePricingResult(
    const SamplingConfig& config,
    const std::vector<double>& payoffs,
    const std::vector<ControlSpec>& controls,
    double alpha);

#endif // MCVR_PRICERS_MCPRICINGRESULT_H
