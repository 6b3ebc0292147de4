// common includes for all binding modules
#pragma once

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <mcvr/montecarlo/MonteCarlo.h>
#include <mcvr/montecarlo/Sampler.h>
#include <mcvr/pricers/MCPricingResult.h>

namespace py = pybind11;

// forward declarations for bind functions
void bind_montecarlo(py::module_ &m);
void bind_pricers(py::module_ &m);
void bind_market(py::module_ &m);

// ---- result -> dict helpers (shared by the bind files) ----

inline py::dict statsToDict(const EstimateStatistics& s)
{
    py::dict d;
    d["n"] = s.n;
    d["mean"] = s.mean;
    d["sd"] = s.sd;
    d["se"] = s.se;
    d["alpha"] = s.alpha;
    d["ci_low"] = s.ciLow;
    d["ci_high"] = s.ciHigh;
    return d;
}

inline py::dict pricingResultToDict(const MCPricingResult& r)
{
    py::dict d;
    d["method"] = toString(r.method);
    d["antithetic"] = r.antithetic;
    d["qmc_scramble"] = r.qmcScramble ? py::object(py::bool_(*r.qmcScramble)) : py::object(py::none());
    d["baseline"] = statsToDict(r.baseline);
    if (r.controlVariate) {
        py::dict cv;
        cv["controls"] = r.controlVariate->controls;
        cv["beta"] = r.controlVariate->beta;
        cv["variance_reduction_factor"] = r.controlVariate->varianceReductionFactor;
        cv["adjusted"] = statsToDict(r.controlVariate->adjusted);
        d["control_variate"] = cv;
    }
    return d;
}
