#include <mcvr/montecarlo/VarianceReduction.h>
#include <mcvr/montecarlo/MonteCarlo.h>
#include <mcvr/utils/Errors.h>
#include <cmath>
#include <limits>
#include <string>

double varianceReductionRatio(double baselineSd, double adjustedSd)
{
    if (adjustedSd == 0.0) return std::numeric_limits<double>::infinity();
    return baselineSd / adjustedSd;
}

VarianceReductionResult ControlVariateAdjuster::adjust(
    const std::vector<double>& target,
    const Matrix& controls,
    const std::vector<double>& controlMeans,
    double ridge)
{
    const size_t n = target.size();
    if (controls.size() != n) {
        throw DimensionMismatch("ControlVariateAdjuster::adjust: controls have " + std::to_string(controls.size()) +
                                " rows, target has " + std::to_string(n));
    }
    const size_t k = controlMeans.size();
    for (const auto& row : controls) {
        if (row.size() != k) {
            throw DimensionMismatch("ControlVariateAdjuster::adjust: every control row needs " +
                                    std::to_string(k) + " entries (one per control mean)");
        }
    }
    if (n < 2) {
        throw InsufficientSamples("ControlVariateAdjuster::adjust: need at least 2 samples");
    }
    if (!(ridge >= 0.0)) {
        throw InvalidInput("ControlVariateAdjuster::adjust: ridge must be >= 0");
    }

    VarianceReductionResult result;
    result.beta.assign(k, 0.0);
    result.baselineSd = sampleStdDev(target);

    if (k == 0) {
        result.adjustedSamples = target;
        result.adjustedSd = result.baselineSd;
        result.varianceReductionFactor = varianceReductionRatio(result.baselineSd, result.adjustedSd);
        return result;
    }

    // centre target and controls
    const double nd = static_cast<double>(n);
    double meanX = 0.0;
    for (double x : target) meanX += x;
    meanX /= nd;

    std::vector<double> meanY(k, 0.0);
    for (const auto& row : controls)
        for (size_t j = 0; j < k; ++j)
            meanY[j] += row[j];
    for (double& m : meanY) m /= nd;

    Matrix Yc(n, std::vector<double>(k));
    std::vector<double> xc(n);
    for (size_t i = 0; i < n; ++i) {
        xc[i] = target[i] - meanX;
        for (size_t j = 0; j < k; ++j) {
            Yc[i][j] = controls[i][j] - meanY[j];
        }
    }

    Matrix covYY = MatrixOps::multiplyAtA(Yc);
    std::vector<double> covYx = MatrixOps::multiplyAtb(Yc, xc);
    for (size_t a = 0; a < k; ++a) {
        covYx[a] /= (nd - 1.0);
        for (size_t b = 0; b < k; ++b) {
            covYY[a][b] /= (nd - 1.0);
        }
    }

    // drop degenerate controls from the system
    std::vector<size_t> active;
    for (size_t j = 0; j < k; ++j) {
        if (covYY[j][j] >= degenerateVariance) active.push_back(j);
    }

    if (!active.empty()) {
        const size_t m = active.size();
        Matrix S(m, std::vector<double>(m));
        std::vector<double> rhs(m);
        for (size_t a = 0; a < m; ++a) {
            rhs[a] = covYx[active[a]];
            for (size_t b = 0; b < m; ++b) {
                S[a][b] = covYY[active[a]][active[b]];
            }
            S[a][a] += ridge;
        }

        try {
            const Matrix L = Cholesky::decompose(S);
            const std::vector<double> solved = Cholesky::solve(L, rhs);
            for (size_t a = 0; a < m; ++a) {
                result.beta[active[a]] = solved[a];
            }
        } catch (const NotPositiveDefinite&) {
            // collinear controls: fall back to the unadjusted estimator
            result.beta.assign(k, 0.0);
        }
    }

    result.adjustedSamples.resize(n);
    for (size_t i = 0; i < n; ++i) {
        double correction = 0.0;
        for (size_t j = 0; j < k; ++j) {
            correction += result.beta[j] * (controlMeans[j] - controls[i][j]);
        }
        result.adjustedSamples[i] = target[i] + correction;
    }

    result.adjustedSd = sampleStdDev(result.adjustedSamples);
    result.varianceReductionFactor = varianceReductionRatio(result.baselineSd, result.adjustedSd);
    return result;
}

VarianceReductionResult ControlVariateAdjuster::adjust(
    const std::vector<double>& target,
    const std::vector<double>& control,
    double controlMean,
    double ridge)
{
    Matrix Y(control.size(), std::vector<double>(1));
    for (size_t i = 0; i < control.size(); ++i) {
        Y[i][0] = control[i];
    }
    return adjust(target, Y, std::vector<double>{controlMean}, ridge);
}

VarianceReductionResult ControlVariateAdjuster::adjust(
    const std::vector<double>& target,
    const std::vector<ControlSpec>& controls,
    double ridge)
{
    const size_t n = target.size();
    const size_t k = controls.size();
    Matrix Y(n, std::vector<double>(k));
    std::vector<double> means(k);
    for (size_t j = 0; j < k; ++j) {
        if (controls[j].samples.size() != n) {
            throw DimensionMismatch("ControlVariateAdjuster::adjust: control '" + controls[j].name + "' has " +
                                    std::to_string(controls[j].samples.size()) + " samples, target has " +
                                    std::to_string(n));
        }
        means[j] = controls[j].knownMean;
        for (size_t i = 0; i < n; ++i) {
            Y[i][j] = controls[j].samples[i];
        }
    }
    return adjust(target, Y, means, ridge);
}

VRDiagnostics summarizeVarianceReduction(
    const std::string& label,
    const std::vector<double>& baselineSamples,
    const std::optional<std::vector<double>>& adjustedSamples,
    const std::optional<std::vector<double>>& beta,
    double alpha)
{
    VRDiagnostics out;
    out.label = label;
    out.baseline = EstimateStatistics::compute(baselineSamples, alpha);
    out.beta = beta;
    if (adjustedSamples) {
        out.adjusted = EstimateStatistics::compute(*adjustedSamples, alpha);
        out.varianceReductionFactor = varianceReductionRatio(out.baseline.sd, out.adjusted->sd);
    }
    return out;
}
