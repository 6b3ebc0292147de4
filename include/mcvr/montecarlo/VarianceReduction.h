#ifndef MCVR_MONTECARLO_VARIANCE_REDUCTION_H
#define MCVR_MONTECARLO_VARIANCE_REDUCTION_H

#include <mcvr/montecarlo/MonteCarlo.h>
#include <mcvr/optimization/LinearAlgebra.h>
#include <optional>
#include <string>
#include <vector>

// a simulated control together with its closed-form expectation
struct ControlSpec {
    std::string name;
    std::vector<double> samples;
    double knownMean = 0.0;
};

struct VarianceReductionResult {
    std::vector<double> beta;
    std::vector<double> adjustedSamples;
    double baselineSd = 0.0;
    double adjustedSd = 0.0;
    double varianceReductionFactor = 1.0;   // baselineSd / adjustedSd, +inf if adjustedSd == 0
};

// regression CV estimator - works with any MC that keeps the control payoffs of each path
class ControlVariateAdjuster {
public:
    static constexpr double defaultRidge = 1e-12;
    static constexpr double degenerateVariance = 1e-15;

    /**
     * beta = (Cov(Y) + ridge*I)^(-1) Cov(Y, x)
     * adjusted[i] = target[i] + sum_j beta_j (controlMeans[j] - controls[i][j])
     *
     * controls is n x k (one row per path). Controls whose sample variance is below
     * degenerateVariance get beta = 0 and stay out of the solve; if the remaining
     * system is not positive definite the whole beta is zero.
     */
    static VarianceReductionResult adjust(
        const std::vector<double>& target,
        const Matrix& controls,
        const std::vector<double>& controlMeans,
        double ridge = defaultRidge);

    // k = 1
    static VarianceReductionResult adjust(
        const std::vector<double>& target,
        const std::vector<double>& control,
        double controlMean,
        double ridge = defaultRidge);

    // named controls, columns in the order given
    static VarianceReductionResult adjust(
        const std::vector<double>& target,
        const std::vector<ControlSpec>& controls,
        double ridge = defaultRidge);

private:
    ControlVariateAdjuster() = delete;
};

// ============================================================================
// Diagnostics
// ============================================================================

struct VRDiagnostics {
    std::string label;
    EstimateStatistics baseline;
    std::optional<EstimateStatistics> adjusted;
    std::optional<std::vector<double>> beta;
    std::optional<double> varianceReductionFactor;
};

VRDiagnostics summarizeVarianceReduction(
    const std::string& label,
    const std::vector<double>& baselineSamples,
    const std::optional<std::vector<double>>& adjustedSamples = std::nullopt,
    const std::optional<std::vector<double>>& beta = std::nullopt,
    double alpha = 0.05);

// baseline / adjusted with the zero-denominator convention
double varianceReductionRatio(double baselineSd, double adjustedSd);

#endif
