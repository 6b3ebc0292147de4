#ifndef MCVR_VOLATILITYSURFACE_H
#define MCVR_VOLATILITYSURFACE_H

#include <mcvr/utils/InterpolationSchemes.h>
#include <vector>
#include <memory>
#include <string>

enum class SmileInterpolation { Linear, Pchip };

/**
 * Single-maturity smile vol(K), fitted through the quotes.
 * Quotes may come in any strike order; they are sorted on construction.
 * Outside the quoted range the boundary piece is extended.
 */
class ImpliedVolSmile
{
public:
    ImpliedVolSmile(const std::vector<double>& strikes,
                    const std::vector<double>& vols,
                    SmileInterpolation interpolation = SmileInterpolation::Linear);
    ImpliedVolSmile(const ImpliedVolSmile& other);
    ImpliedVolSmile& operator=(const ImpliedVolSmile& other);

    double volatility(double strike) const { return (*_interpolator)(strike); }
    double operator()(double strike) const { return volatility(strike); }

    const std::vector<double>& strikes() const { return _strikes; }
    const std::vector<double>& vols() const { return _vols; }

private:
    std::vector<double> _strikes;
    std::vector<double> _vols;
    std::unique_ptr<InterpolationScheme> _interpolator;
};

// quotes for one maturity; each slice may carry its own strikes
struct SmileSlice {
    double maturity;
    std::vector<double> strikes;
    std::vector<double> vols;
};

// diagnostics from arbitrage checks
struct ArbitrageDiagnostic {
    int maturityIdx;       // lower slice of the offending pair
    double logMoneyness;   // k = log(K/F(T)) where the check failed
    double value;          // w(T_{i+1}, k) - w(T_i, k)
    std::string type;      // "calendar"
};

/**
 * Implied volatility surface interpolated in total variance
 *
 *  w(T, k) = σ(T, k)^2 T on log-forward-moneyness k = log(K / F(T)), F(T) = S0 exp((r - q) T)
 *  - each slice: w(k) through the slice quotes (PCHIP by default)
 *  - between slices: linear in T at fixed k
 *  - outside [T_min, T_max]: the nearest slice's w(k)
 *  σ(T, K) = sqrt(max(w, 0) / T); NaN for T <= 0
 *
 * Not arbitrage-free by construction; see calendarDiagnostics().
 */
class VolatilitySurface
{
public:
    VolatilitySurface(const std::vector<SmileSlice>& slices,
                      double spot,
                      double rate,
                      double dividend = 0.0,
                      SmileInterpolation smileInterpolation = SmileInterpolation::Pchip);
    VolatilitySurface(const VolatilitySurface& other);

    double impliedVolatility(double strike, double maturity) const;
    double totalVariance(double strike, double maturity) const;
    double forward(double maturity) const;

    // total variance decreasing in T at any slice knot
    std::vector<ArbitrageDiagnostic> calendarDiagnostics(double tol = 1e-12) const;

    const std::vector<double>& maturities() const { return _maturities; }

private:
    double _spot;
    double _rate;
    double _dividend;
    SmileInterpolation _smileInterpolation;

    std::vector<double> _maturities;                                      // sorted ascending
    std::vector<std::vector<double>> _logMoneyness;                       // knots per slice
    std::vector<std::unique_ptr<InterpolationScheme>> _totalVariance;     // w(k), one per maturity

    double sliceTotalVariance(size_t idx, double k) const { return (*_totalVariance[idx])(k); }
};

struct StaticArbitrageReport {
    bool monotoneNonIncreasing = true;
    bool convex = true;
    double worstMonotoneSlope = 0.0;       // largest C(K_{i+1}) - C(K_i)
    double worstConvexSecondDiff = 0.0;    // smallest second difference
};

// call prices at one maturity must fall and be convex in strike; reported, not enforced
StaticArbitrageReport checkCallPricesInStrike(const std::vector<double>& strikes,
                                              const std::vector<double>& callPrices,
                                              double atol = 1e-10);

#endif //MCVR_VOLATILITYSURFACE_H
