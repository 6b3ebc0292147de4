// bindings for the sampler, the CI utility and the control-variate estimator
#include "bindings_common.h"
#include <mcvr/montecarlo/VarianceReduction.h>

void bind_montecarlo(py::module_ &m)
{
    m.def("mc_mean_ci", [](const std::vector<double>& samples, double alpha) {
        return statsToDict(EstimateStatistics::compute(samples, alpha));
    }, py::arg("samples"), py::arg("alpha") = 0.05,
       "Mean, sd, se and two-sided normal CI of a sample");

    m.def("normals", [](size_t n, size_t d, const std::string& method, bool antithetic,
                        uint64_t seed, bool qmc_scramble) {
        SamplingConfig config;
        config.method = parseSamplingMethod(method);
        config.antithetic = antithetic;
        config.seed = seed;
        config.scramble = qmc_scramble;
        return NormalSampler::generateNormals(n, d, config);
    }, py::arg("n"), py::arg("d"), py::arg("method") = "plain", py::arg("antithetic") = false,
       py::arg("seed") = 123, py::arg("qmc_scramble") = true,
       "Standard normal draws as a list of rows");

    m.def("adjust_with_controls", [](const std::vector<double>& target, const Matrix& controls,
                                     const std::vector<double>& control_means, double ridge) {
        const VarianceReductionResult res = ControlVariateAdjuster::adjust(target, controls, control_means, ridge);
        py::dict d;
        d["beta"] = res.beta;
        d["adjusted_samples"] = res.adjustedSamples;
        d["baseline_sd"] = res.baselineSd;
        d["adjusted_sd"] = res.adjustedSd;
        d["variance_reduction_factor"] = res.varianceReductionFactor;
        return d;
    }, py::arg("target"), py::arg("controls"), py::arg("control_means"),
       py::arg("ridge") = ControlVariateAdjuster::defaultRidge,
       "Regression control-variate adjustment; controls is n x k (one row per sample)");

    m.def("summarize_vr", [](const std::string& label, const std::vector<double>& baseline,
                             std::optional<std::vector<double>> adjusted,
                             std::optional<std::vector<double>> beta, double alpha) {
        const VRDiagnostics diag = summarizeVarianceReduction(label, baseline, adjusted, beta, alpha);
        py::dict d;
        d["label"] = diag.label;
        d["baseline"] = statsToDict(diag.baseline);
        if (diag.adjusted) {
            d["adjusted"] = statsToDict(*diag.adjusted);
            d["variance_reduction_factor"] = *diag.varianceReductionFactor;
        }
        if (diag.beta) d["beta"] = *diag.beta;
        return d;
    }, py::arg("label"), py::arg("baseline_samples"), py::arg("adjusted_samples") = py::none(),
       py::arg("beta") = py::none(), py::arg("alpha") = 0.05,
       "Baseline / adjusted statistics side by side");
}
