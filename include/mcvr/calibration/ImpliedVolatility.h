/**
    Implied volatility
    - bisection on the Black-Scholes price (no Newton blow-ups)
    - element-wise inversion of a strike strip
*/

#ifndef MCVR_IMPLIEDVOLATILITY_H
#define MCVR_IMPLIEDVOLATILITY_H

#include <mcvr/market/FinancialInstrument.h>
#include <vector>

// ---- options ----

struct ImpliedVolOptions {
    double volLow = 1e-6;
    double volHigh = 5.0;
    double tol = 1e-10;
    int maxIter = 200;
    int maxExpansions = 30;       // volHigh *= 1.5 while unbracketed
    double expansionCeiling = 50.0;
};

class ImpliedVolatility
{
public:
    // throws InvalidInput (price <= 0, bad market data) or UnbracketedRoot
    static double solve(double price, Option::Type type, double spot, double strike, double rate,
                        double maturity, double dividend = 0.0, const ImpliedVolOptions& opts = {});

    // one vol per strike, clamped to [clampLow, clampHigh]
    static std::vector<double> fromPrices(const std::vector<double>& strikes, const std::vector<double>& prices,
                                          double spot, double rate, double maturity,
                                          Option::Type type = Option::Type::Call, double dividend = 0.0,
                                          double clampLow = 1e-6, double clampHigh = 5.0);

private:
    ImpliedVolatility() = delete;
};

#endif // MCVR_IMPLIEDVOLATILITY_H
