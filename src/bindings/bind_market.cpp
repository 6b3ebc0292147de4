// bindings for implied vols, smiles, VolatilitySurface and static-arbitrage checks
#include "bindings_common.h"
#include <mcvr/calibration/ImpliedVolatility.h>
#include <mcvr/market/VolatilitySurface.h>

void bind_market(py::module_ &m)
{
    m.def("implied_vol", [](double price, bool is_call, double S0, double K, double r, double T, double q,
                            double vol_low, double vol_high, double tol, int max_iter) {
        ImpliedVolOptions opts;
        opts.volLow = vol_low;
        opts.volHigh = vol_high;
        opts.tol = tol;
        opts.maxIter = max_iter;
        return ImpliedVolatility::solve(price, is_call ? Option::Type::Call : Option::Type::Put,
                                        S0, K, r, T, q, opts);
    }, py::arg("price"), py::arg("is_call"), py::arg("S0"), py::arg("K"), py::arg("r"), py::arg("T"),
       py::arg("q") = 0.0, py::arg("vol_low") = 1e-6, py::arg("vol_high") = 5.0, py::arg("tol") = 1e-10,
       py::arg("max_iter") = 200,
       "Implied volatility by bisection");

    m.def("implied_vols_from_prices", [](const std::vector<double>& strikes, const std::vector<double>& prices,
                                         double S0, double r, double T, bool is_call, double q,
                                         double clamp_low, double clamp_high) {
        return ImpliedVolatility::fromPrices(strikes, prices, S0, r, T,
                                             is_call ? Option::Type::Call : Option::Type::Put, q,
                                             clamp_low, clamp_high);
    }, py::arg("strikes"), py::arg("prices"), py::arg("S0"), py::arg("r"), py::arg("T"),
       py::arg("is_call") = true, py::arg("q") = 0.0, py::arg("clamp_low") = 1e-6, py::arg("clamp_high") = 5.0);

    py::enum_<SmileInterpolation>(m, "SmileInterpolation", "Interpolation method across strikes")
        .value("Linear", SmileInterpolation::Linear)
        .value("Pchip", SmileInterpolation::Pchip, "Shape-preserving cubic (no overshoot)")
        .export_values();

    py::class_<ImpliedVolSmile>(m, "ImpliedVolSmile", "Single-maturity smile vol(K)")
        .def(py::init<const std::vector<double>&, const std::vector<double>&, SmileInterpolation>(),
             py::arg("strikes"), py::arg("vols"), py::arg("kind") = SmileInterpolation::Linear)
        .def("__call__", &ImpliedVolSmile::volatility, py::arg("strike"))
        .def("__call__", [](const ImpliedVolSmile& s, const std::vector<double>& strikes) {
            std::vector<double> out;
            out.reserve(strikes.size());
            for (double k : strikes) out.push_back(s.volatility(k));
            return out;
        }, py::arg("strikes"));

    py::class_<SmileSlice>(m, "SmileSlice", "Quotes for one maturity")
        .def(py::init<double, std::vector<double>, std::vector<double>>(),
             py::arg("T"), py::arg("strikes"), py::arg("vols"))
        .def_readwrite("T", &SmileSlice::maturity)
        .def_readwrite("strikes", &SmileSlice::strikes)
        .def_readwrite("vols", &SmileSlice::vols);

    py::class_<VolatilitySurface>(m, "VolatilitySurface", "Total-variance implied volatility surface")
        .def(py::init<const std::vector<SmileSlice>&, double, double, double, SmileInterpolation>(),
             py::arg("smiles"), py::arg("S0"), py::arg("r"), py::arg("q") = 0.0,
             py::arg("kind") = SmileInterpolation::Pchip)
        .def("implied_volatility", &VolatilitySurface::impliedVolatility, py::arg("strike"), py::arg("maturity"))
        .def("__call__", [](const VolatilitySurface& s, double T, double K) {
            return s.impliedVolatility(K, T);
        }, py::arg("T"), py::arg("K"))
        .def("total_variance", &VolatilitySurface::totalVariance, py::arg("strike"), py::arg("maturity"))
        .def("maturities", &VolatilitySurface::maturities)
        .def("calendar_diagnostics", [](const VolatilitySurface& s, double tol) {
            py::list out;
            for (const auto& d : s.calendarDiagnostics(tol)) {
                py::dict row;
                row["maturity_idx"] = d.maturityIdx;
                row["log_moneyness"] = d.logMoneyness;
                row["value"] = d.value;
                row["type"] = d.type;
                out.append(row);
            }
            return out;
        }, py::arg("tol") = 1e-12);

    m.def("sanity_check_call_prices_convex_in_strike", [](const std::vector<double>& strikes,
                                                          const std::vector<double>& call_prices, double atol) {
        const StaticArbitrageReport r = checkCallPricesInStrike(strikes, call_prices, atol);
        py::dict d;
        d["monotone_nonincreasing"] = r.monotoneNonIncreasing;
        d["convex"] = r.convex;
        d["worst_monotone_slope"] = r.worstMonotoneSlope;
        d["worst_convex_second_diff"] = r.worstConvexSecondDiff;
        return d;
    }, py::arg("strikes"), py::arg("call_prices"), py::arg("atol") = 1e-10);
}
