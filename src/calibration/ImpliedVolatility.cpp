#include <mcvr/calibration/ImpliedVolatility.h>
#include <mcvr/pricers/BlackScholesFormulas.h>
#include <mcvr/utils/Errors.h>
#include <algorithm>
#include <cmath>
#include <string>

double ImpliedVolatility::solve(double price, Option::Type type, double spot, double strike, double rate,
                                double maturity, double dividend, const ImpliedVolOptions& opts)
{
    if (!(price > 0.0))
        throw InvalidInput("ImpliedVolatility::solve: price must be > 0");
    if (!(spot > 0.0) || !(strike > 0.0))
        throw InvalidInput("ImpliedVolatility::solve: spot and strike must be > 0");
    if (!(maturity > 0.0))
        throw InvalidInput("ImpliedVolatility::solve: maturity must be > 0");

    auto f = [&](double sigma) {
        return BlackScholesFormulas::price(spot, strike, rate, sigma, maturity, type, dividend) - price;
    };

    double lo = std::max(opts.volLow, 1e-12);
    double hi = std::max(opts.volHigh, lo * 1.01);
    double flo = f(lo);
    double fhi = f(hi);

    // widen the bracket upwards
    int expansions = 0;
    while (flo * fhi > 0.0 && hi < opts.expansionCeiling && expansions < opts.maxExpansions) {
        hi *= 1.5;
        fhi = f(hi);
        ++expansions;
    }
    if (flo * fhi > 0.0) {
        throw UnbracketedRoot("ImpliedVolatility::solve: could not bracket implied vol for price " +
                              std::to_string(price) + " (check price against no-arbitrage bounds)");
    }

    for (int iter = 0; iter < opts.maxIter; ++iter) {
        const double mid = 0.5 * (lo + hi);
        const double fmid = f(mid);
        if (std::abs(fmid) < opts.tol || (hi - lo) < opts.tol) {
            return mid;
        }
        if (flo * fmid <= 0.0) {
            hi = mid;
        } else {
            lo = mid;
            flo = fmid;
        }
    }
    return 0.5 * (lo + hi);
}

std::vector<double> ImpliedVolatility::fromPrices(const std::vector<double>& strikes, const std::vector<double>& prices,
                                                  double spot, double rate, double maturity,
                                                  Option::Type type, double dividend,
                                                  double clampLow, double clampHigh)
{
    if (strikes.size() != prices.size())
        throw DimensionMismatch("ImpliedVolatility::fromPrices: strikes and prices must have the same size");

    std::vector<double> vols(strikes.size());
    for (size_t i = 0; i < strikes.size(); ++i) {
        const double v = solve(prices[i], type, spot, strikes[i], rate, maturity, dividend);
        vols[i] = std::clamp(v, clampLow, clampHigh);
    }
    return vols;
}
