// pybind11 module entry point
#include "bindings_common.h"

PYBIND11_MODULE(_core, m)
{
    m.doc() = R"pbdoc(
        mcvr Python Bindings
        --------------------

        Python interface to the mcvr Monte Carlo variance-reduction library.
        Provides access to:
        - Arithmetic Asian and basket call pricers (plain / lhs / sobol / halton,
          antithetic pairing, multi-control variates)
        - Geometric Asian and geometric basket closed forms
        - The control-variate estimator for custom control designs
        - Black-Scholes formulas, CRR trees, implied volatility and smile/surface fits

        Example:
            from mcvr import _core

            res = _core.price_asian_mc(S0=100, K=100, r=0.03, T=1.0, sigma=0.2,
                                       n_obs=50, n_paths=20000, seed=123)
            res["baseline"]["mean"], res["control_variate"]["adjusted"]["sd"]

        Errors: invalid input raises ValueError, unbracketed implied vols and
        non positive definite correlation raise RuntimeError.
    )pbdoc";

    bind_montecarlo(m);
    bind_pricers(m);
    bind_market(m);

    m.attr("__version__") = "0.1.0";
}
