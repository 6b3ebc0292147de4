#ifndef MCVR_BLACKSCHOLESFORMULAS_H
#define MCVR_BLACKSCHOLESFORMULAS_H

#include <mcvr/market/FinancialInstrument.h>

/**
 * @class BlackScholesFormulas
 * @brief Static utility class for Black-Scholes formulas and Greeks
 *
 * Flat rate r and continuous dividend yield q (default 0).
 * spot, strike, volatility and maturity must be positive (InvalidInput otherwise).
 * When σ√T < 1e-10 the price collapses to the discounted intrinsic value on the forward.
 */
class BlackScholesFormulas
{
public:
    // d1/d2 helpers
    static double d1(double spot, double strike, double rate, double volatility, double maturity, double dividend = 0.0);
    static double d2(double spot, double strike, double rate, double volatility, double maturity, double dividend = 0.0);

    // Pricing functions
    static double price(double spot, double strike, double rate, double volatility, double maturity,
                        Option::Type optionType, double dividend = 0.0);
    static double callPrice(double spot, double strike, double rate, double volatility, double maturity, double dividend = 0.0);
    static double putPrice(double spot, double strike, double rate, double volatility, double maturity, double dividend = 0.0);

    // Greeks - First order
    static double delta(double spot, double strike, double rate, double volatility, double maturity,
                        Option::Type optionType, double dividend = 0.0);
    static double vega(double spot, double strike, double rate, double volatility, double maturity, double dividend = 0.0);
    static double theta(double spot, double strike, double rate, double volatility, double maturity,
                        Option::Type optionType, double dividend = 0.0);
    static double rho(double spot, double strike, double rate, double volatility, double maturity,
                      Option::Type optionType, double dividend = 0.0);

    // Greeks - Second order
    static double gamma(double spot, double strike, double rate, double volatility, double maturity, double dividend = 0.0);

    static constexpr double degenerateStdDev = 1e-10;

private:
    BlackScholesFormulas() = delete;
};


#endif //MCVR_BLACKSCHOLESFORMULAS_H
