#ifndef MCVR_PRICERS_BASKETPRICER_H
#define MCVR_PRICERS_BASKETPRICER_H

#include <mcvr/pricers/MCPricingResult.h>
#include <mcvr/montecarlo/Sampler.h>
#include <mcvr/optimization/LinearAlgebra.h>
#include <cstddef>
#include <cstdint>
#include <vector>

struct BasketMCParams {
    std::vector<double> spots;
    std::vector<double> weights;
    double strike = 100.0;
    double rate = 0.0;
    double maturity = 1.0;
    std::vector<double> volatilities;
    Matrix correlation;

    size_t numPaths = 20000;
    uint64_t seed = 123;
    SamplingMethod method = SamplingMethod::Plain;
    bool latinHypercube = false;    // legacy switch, overrides method when set
    bool antithetic = true;
    bool qmcScramble = true;
    bool useControlVariate = true;
    bool useExtraControl = true;    // discounted linear basket next to the geometric basket
    double alpha = 0.05;
};

// legacy LHS flag folded into the method; applied before any validation
SamplingMethod normalizeSamplingSelection(SamplingMethod method, bool latinHypercube);

/**
 * European call on a weighted basket of correlated GBM assets, payoff (sum w_i S_T,i - K)^+.
 *
 * Controls: discounted geometric basket call ("geom_basket_call", closed form)
 * and, optionally, discounted linear basket ("disc_linear_basket", mean sum w_i S0_i).
 */
class BasketPricer
{
public:
    static MCPricingResult priceCall(const BasketMCParams& params);

    // exp(-rT) E[(G - K)^+] with G = exp(sum_i w_i log S_T,i); weights are exponents, not normalised
    static double geometricCallClosedForm(const std::vector<double>& spots, const std::vector<double>& weights,
                                          double strike, double rate, double maturity,
                                          const std::vector<double>& volatilities, const Matrix& correlation);

    static constexpr size_t minPaths = 1000;

private:
    BasketPricer() = delete;
};

#endif // MCVR_PRICERS_BASKETPRICER_H
