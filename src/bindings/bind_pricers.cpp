// bindings for the MC pricers, closed forms, BlackScholesFormulas and CRR trees
#include "bindings_common.h"
#include <mcvr/pricers/AsianPricer.h>
#include <mcvr/pricers/BasketPricer.h>
#include <mcvr/pricers/BlackScholesFormulas.h>
#include <mcvr/pricers/BinomialTree.h>
#include <mcvr/market/FinancialInstrument.h>

void bind_pricers(py::module_ &m)
{
    // Option type enum
    py::enum_<Option::Type>(m, "OptionType", "Option type enumeration")
        .value("Call", Option::Type::Call)
        .value("Put", Option::Type::Put)
        .export_values();

    // ---- Monte Carlo ----

    m.def("price_asian_mc", [](double S0, double K, double r, double T, double sigma, int n_obs,
                               size_t n_paths, uint64_t seed, const std::string& method, bool antithetic,
                               bool qmc_scramble, bool use_control_variate, bool use_extra_control, double alpha) {
        AsianMCParams p;
        p.spot = S0;
        p.strike = K;
        p.rate = r;
        p.maturity = T;
        p.volatility = sigma;
        p.numObservations = n_obs;
        p.numPaths = n_paths;
        p.seed = seed;
        p.method = parseSamplingMethod(method);
        p.antithetic = antithetic;
        p.qmcScramble = qmc_scramble;
        p.useControlVariate = use_control_variate;
        p.useExtraControl = use_extra_control;
        p.alpha = alpha;
        return pricingResultToDict(AsianPricer::priceArithmeticCall(p));
    }, py::arg("S0"), py::arg("K"), py::arg("r"), py::arg("T"), py::arg("sigma"), py::arg("n_obs"),
       py::arg("n_paths") = 20000, py::arg("seed") = 123, py::arg("method") = "plain",
       py::arg("antithetic") = true, py::arg("qmc_scramble") = true, py::arg("use_control_variate") = true,
       py::arg("use_extra_control") = true, py::arg("alpha") = 0.05,
       "Arithmetic Asian call by Monte Carlo with variance reduction");

    m.def("price_basket_mc", [](const std::vector<double>& S0, const std::vector<double>& w, double K, double r,
                                double T, const std::vector<double>& vol, const Matrix& corr, size_t n_paths,
                                uint64_t seed, const std::string& method, bool lhs, bool antithetic,
                                bool qmc_scramble, bool use_control_variate, bool use_extra_control, double alpha) {
        BasketMCParams p;
        p.spots = S0;
        p.weights = w;
        p.strike = K;
        p.rate = r;
        p.maturity = T;
        p.volatilities = vol;
        p.correlation = corr;
        p.numPaths = n_paths;
        p.seed = seed;
        p.method = parseSamplingMethod(method);
        p.latinHypercube = lhs;
        p.antithetic = antithetic;
        p.qmcScramble = qmc_scramble;
        p.useControlVariate = use_control_variate;
        p.useExtraControl = use_extra_control;
        p.alpha = alpha;
        return pricingResultToDict(BasketPricer::priceCall(p));
    }, py::arg("S0"), py::arg("w"), py::arg("K"), py::arg("r"), py::arg("T"), py::arg("vol"), py::arg("corr"),
       py::arg("n_paths") = 20000, py::arg("seed") = 123, py::arg("method") = "plain", py::arg("lhs") = false,
       py::arg("antithetic") = true, py::arg("qmc_scramble") = true, py::arg("use_control_variate") = true,
       py::arg("use_extra_control") = true, py::arg("alpha") = 0.05,
       "Basket call by Monte Carlo with variance reduction");

    m.def("closed_form_geometric_asian", &AsianPricer::geometricCallClosedForm,
          py::arg("S0"), py::arg("K"), py::arg("r"), py::arg("T"), py::arg("sigma"), py::arg("n_obs"),
          "Discretely monitored geometric Asian call");

    m.def("closed_form_geometric_basket", &BasketPricer::geometricCallClosedForm,
          py::arg("S0"), py::arg("w"), py::arg("K"), py::arg("r"), py::arg("T"), py::arg("vol"), py::arg("corr"),
          "Geometric basket call under correlated GBM");

    // ---- Black-Scholes ----

    m.def("bs_price", &BlackScholesFormulas::price,
          py::arg("spot"), py::arg("strike"), py::arg("rate"), py::arg("volatility"), py::arg("maturity"),
          py::arg("option_type"), py::arg("dividend") = 0.0,
          "Black-Scholes price with dividend yield");

    m.def("bs_call_price", &BlackScholesFormulas::callPrice,
          py::arg("spot"), py::arg("strike"), py::arg("rate"), py::arg("volatility"), py::arg("maturity"),
          py::arg("dividend") = 0.0);

    m.def("bs_put_price", &BlackScholesFormulas::putPrice,
          py::arg("spot"), py::arg("strike"), py::arg("rate"), py::arg("volatility"), py::arg("maturity"),
          py::arg("dividend") = 0.0);

    m.def("bs_greeks", [](double spot, double strike, double rate, double volatility, double maturity,
                          Option::Type type, double dividend) {
        py::dict d;
        d["price"] = BlackScholesFormulas::price(spot, strike, rate, volatility, maturity, type, dividend);
        d["delta"] = BlackScholesFormulas::delta(spot, strike, rate, volatility, maturity, type, dividend);
        d["gamma"] = BlackScholesFormulas::gamma(spot, strike, rate, volatility, maturity, dividend);
        d["vega"] = BlackScholesFormulas::vega(spot, strike, rate, volatility, maturity, dividend);
        d["theta"] = BlackScholesFormulas::theta(spot, strike, rate, volatility, maturity, type, dividend);
        d["rho"] = BlackScholesFormulas::rho(spot, strike, rate, volatility, maturity, type, dividend);
        return d;
    }, py::arg("spot"), py::arg("strike"), py::arg("rate"), py::arg("volatility"), py::arg("maturity"),
       py::arg("option_type"), py::arg("dividend") = 0.0,
       "Price and first/second order Greeks");

    // ---- Trees ----

    m.def("crr_price", [](Option::Type type, bool american, double S0, double K, double r, double T,
                          double sigma, size_t steps) {
        BinomialTreePricer tree(steps);
        if (american) {
            return tree.price(AmericanOption(type, K, T), S0, r, sigma);
        }
        return tree.price(EuropeanOption(type, K, T), S0, r, sigma);
    }, py::arg("option_type"), py::arg("american"), py::arg("S0"), py::arg("K"), py::arg("r"), py::arg("T"),
       py::arg("sigma"), py::arg("steps"),
       "Cox-Ross-Rubinstein binomial price");

    m.def("one_step_replication", [](double S0, double Su, double Sd, double Vu, double Vd, double r_dt) {
        const ReplicatingPortfolio p = oneStepReplication(S0, Su, Sd, Vu, Vd, r_dt);
        return py::make_tuple(p.delta, p.bond);
    }, py::arg("S0"), py::arg("Su"), py::arg("Sd"), py::arg("Vu"), py::arg("Vd"), py::arg("r_dt"),
       "One-period replicating portfolio (delta, bond)");
}
