#include <mcvr/market/VolatilitySurface.h>
#include <mcvr/utils/Errors.h>
#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <utility>

namespace {
    // indices that sort v ascending
    std::vector<size_t> sortOrder(const std::vector<double>& v)
    {
        std::vector<size_t> idx(v.size());
        std::iota(idx.begin(), idx.end(), 0);
        std::stable_sort(idx.begin(), idx.end(), [&](size_t a, size_t b) { return v[a] < v[b]; });
        return idx;
    }

    std::unique_ptr<InterpolationScheme> makeInterpolator(const std::vector<double>& x,
                                                          const std::vector<double>& y,
                                                          SmileInterpolation type)
    {
        if (type == SmileInterpolation::Pchip) {
            return std::make_unique<PchipInterpolation>(x, y, ExtrapolationType::Natural);
        }
        return std::make_unique<LinearInterpolation>(x, y, ExtrapolationType::Natural);
    }
}

// ============================================================================
// ImpliedVolSmile
// ============================================================================

ImpliedVolSmile::ImpliedVolSmile(const std::vector<double>& strikes,
                                 const std::vector<double>& vols,
                                 SmileInterpolation interpolation)
{
    if (strikes.size() != vols.size()) {
        throw DimensionMismatch("ImpliedVolSmile: strikes and vols must have the same size");
    }
    const auto order = sortOrder(strikes);
    _strikes.reserve(order.size());
    _vols.reserve(order.size());
    for (size_t i : order) {
        _strikes.push_back(strikes[i]);
        _vols.push_back(vols[i]);
    }
    _interpolator = makeInterpolator(_strikes, _vols, interpolation);
}

ImpliedVolSmile::ImpliedVolSmile(const ImpliedVolSmile& other)
    : _strikes(other._strikes), _vols(other._vols), _interpolator(other._interpolator->clone())
{
}

ImpliedVolSmile& ImpliedVolSmile::operator=(const ImpliedVolSmile& other)
{
    if (this != &other) {
        _strikes = other._strikes;
        _vols = other._vols;
        _interpolator = other._interpolator->clone();
    }
    return *this;
}

// ============================================================================
// VolatilitySurface
// ============================================================================

VolatilitySurface::VolatilitySurface(const std::vector<SmileSlice>& slices,
                                     double spot,
                                     double rate,
                                     double dividend,
                                     SmileInterpolation smileInterpolation)
    : _spot(spot), _rate(rate), _dividend(dividend), _smileInterpolation(smileInterpolation)
{
    if (!(spot > 0.0)) {
        throw InvalidInput("VolatilitySurface: spot must be positive");
    }
    if (slices.size() < 2) {
        throw InvalidInput("VolatilitySurface: need at least two maturities to build a surface");
    }

    std::vector<double> sliceMaturities;
    for (const auto& s : slices) {
        if (!(s.maturity > 0.0)) {
            throw InvalidInput("VolatilitySurface: slice maturity must be > 0");
        }
        if (s.strikes.size() != s.vols.size()) {
            throw DimensionMismatch("VolatilitySurface: slice strikes and vols must have the same size");
        }
        sliceMaturities.push_back(s.maturity);
    }

    for (size_t i : sortOrder(sliceMaturities)) {
        const SmileSlice& s = slices[i];
        const double T = s.maturity;
        const double F = forward(T);

        std::vector<double> k(s.strikes.size());
        std::vector<double> w(s.strikes.size());
        for (size_t j = 0; j < s.strikes.size(); ++j) {
            if (!(s.strikes[j] > 0.0)) {
                throw InvalidInput("VolatilitySurface: strikes must be positive");
            }
            k[j] = std::log(s.strikes[j] / F);
            w[j] = s.vols[j] * s.vols[j] * T;
        }

        const auto order = sortOrder(k);
        std::vector<double> kSorted, wSorted;
        for (size_t j : order) {
            kSorted.push_back(k[j]);
            wSorted.push_back(w[j]);
        }

        _maturities.push_back(T);
        _totalVariance.push_back(makeInterpolator(kSorted, wSorted, _smileInterpolation));
        _logMoneyness.push_back(std::move(kSorted));
    }
}

VolatilitySurface::VolatilitySurface(const VolatilitySurface& other)
    : _spot(other._spot), _rate(other._rate), _dividend(other._dividend),
      _smileInterpolation(other._smileInterpolation),
      _maturities(other._maturities), _logMoneyness(other._logMoneyness)
{
    _totalVariance.reserve(other._totalVariance.size());
    for (const auto& interp : other._totalVariance) {
        _totalVariance.push_back(interp->clone());
    }
}

double VolatilitySurface::forward(double maturity) const
{
    return _spot * std::exp((_rate - _dividend) * maturity);
}

double VolatilitySurface::totalVariance(double strike, double maturity) const
{
    if (!(maturity > 0.0)) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    const double k = std::log(strike / forward(maturity));

    if (maturity <= _maturities.front()) {
        return sliceTotalVariance(0, k);
    }
    if (maturity >= _maturities.back()) {
        return sliceTotalVariance(_maturities.size() - 1, k);
    }

    const auto it = std::lower_bound(_maturities.begin(), _maturities.end(), maturity);
    const size_t hi = static_cast<size_t>(std::distance(_maturities.begin(), it));
    const size_t lo = hi - 1;

    const double lambda = (maturity - _maturities[lo]) / (_maturities[hi] - _maturities[lo]);
    return (1.0 - lambda) * sliceTotalVariance(lo, k) + lambda * sliceTotalVariance(hi, k);
}

double VolatilitySurface::impliedVolatility(double strike, double maturity) const
{
    const double w = totalVariance(strike, maturity);
    if (std::isnan(w)) {
        return w;
    }
    return std::sqrt(std::max(w, 0.0) / maturity);
}

std::vector<ArbitrageDiagnostic> VolatilitySurface::calendarDiagnostics(double tol) const
{
    // total variance must be non-decreasing in T at fixed k; checked on both slices' knots
    std::vector<ArbitrageDiagnostic> out;
    for (size_t i = 0; i + 1 < _maturities.size(); ++i) {
        std::vector<double> grid = _logMoneyness[i];
        grid.insert(grid.end(), _logMoneyness[i + 1].begin(), _logMoneyness[i + 1].end());
        std::sort(grid.begin(), grid.end());
        grid.erase(std::unique(grid.begin(), grid.end()), grid.end());

        for (double k : grid) {
            const double w1 = sliceTotalVariance(i, k);
            const double w2 = sliceTotalVariance(i + 1, k);
            if (w2 < w1 - tol) {
                out.push_back({static_cast<int>(i), k, w2 - w1, "calendar"});
            }
        }
    }
    return out;
}

// ============================================================================
// Static-arbitrage sanity check in strike
// ============================================================================

StaticArbitrageReport checkCallPricesInStrike(const std::vector<double>& strikes,
                                              const std::vector<double>& callPrices,
                                              double atol)
{
    if (strikes.size() != callPrices.size()) {
        throw DimensionMismatch("checkCallPricesInStrike: strikes and callPrices must have the same size");
    }

    std::vector<double> C;
    for (size_t i : sortOrder(strikes)) {
        C.push_back(callPrices[i]);
    }

    StaticArbitrageReport report;
    if (C.size() >= 2) {
        report.worstMonotoneSlope = -std::numeric_limits<double>::infinity();
        for (size_t i = 0; i + 1 < C.size(); ++i) {
            const double dC = C[i + 1] - C[i];
            report.worstMonotoneSlope = std::max(report.worstMonotoneSlope, dC);
            if (dC > atol) report.monotoneNonIncreasing = false;
        }
    }
    if (C.size() >= 3) {
        report.worstConvexSecondDiff = std::numeric_limits<double>::infinity();
        for (size_t i = 0; i + 2 < C.size(); ++i) {
            const double ddC = C[i + 2] - 2.0 * C[i + 1] + C[i];
            report.worstConvexSecondDiff = std::min(report.worstConvexSecondDiff, ddC);
            if (ddC < -atol) report.convex = false;
        }
    }
    return report;
}
