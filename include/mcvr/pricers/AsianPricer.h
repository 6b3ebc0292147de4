#ifndef MCVR_PRICERS_ASIANPRICER_H
#define MCVR_PRICERS_ASIANPRICER_H

#include <mcvr/pricers/MCPricingResult.h>
#include <mcvr/montecarlo/Sampler.h>
#include <cstddef>
#include <cstdint>

struct AsianMCParams {
    double spot = 100.0;
    double strike = 100.0;
    double rate = 0.0;
    double maturity = 1.0;
    double volatility = 0.2;
    int numObservations = 12;       // equally spaced fixings at T/n, 2T/n, ..., T

    size_t numPaths = 20000;
    uint64_t seed = 123;
    SamplingMethod method = SamplingMethod::Plain;
    bool antithetic = true;
    bool qmcScramble = true;
    bool useControlVariate = true;
    bool useExtraControl = true;    // discounted terminal price next to the geometric Asian
    double alpha = 0.05;
};

/**
 * Discretely monitored arithmetic-average Asian call under GBM.
 *
 * Controls: discounted geometric Asian call ("geom_asian_call", closed form)
 * and, optionally, discounted terminal price ("disc_terminal_S", mean S0).
 */
class AsianPricer
{
public:
    static MCPricingResult priceArithmeticCall(const AsianMCParams& params);

    // exp(-rT) E[(G - K)^+] with G the geometric average of the fixings
    static double geometricCallClosedForm(double spot, double strike, double rate, double maturity,
                                          double volatility, int numObservations);

    static constexpr size_t minPaths = 1000;

private:
    AsianPricer() = delete;
};

#endif // MCVR_PRICERS_ASIANPRICER_H
