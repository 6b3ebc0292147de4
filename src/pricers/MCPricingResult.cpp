#include <mcvr/pricers/MCPricingResult.h>

MCPricingResult assemblePricingResult(
    const SamplingConfig& config,
    const std::vector<double>& payoffs,
    const std::vector<ControlSpec>& controls,
    double alpha)
{
    MCPricingResult out;
    out.method = config.method;
    out.antithetic = config.antithetic;
    if (isQuasiMonteCarlo(config.method)) {
        out.qmcScramble = config.scramble;
    }
    out.baseline = EstimateStatistics::compute(payoffs, alpha);

    if (controls.empty()) {
        return out;
    }

    const VarianceReductionResult vr = ControlVariateAdjuster::adjust(payoffs, controls);

    ControlVariateReport report;
    for (const auto& c : controls) {
        report.controls.push_back(c.name);
    }
    report.beta = vr.beta;
    report.varianceReductionFactor = vr.varianceReductionFactor;
    report.adjusted = EstimateStatistics::compute(vr.adjustedSamples, alpha);
    out.controlVariate = report;
    return out;
}
