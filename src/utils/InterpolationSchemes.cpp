#include <mcvr/utils/InterpolationSchemes.h>
#include <mcvr/utils/Errors.h>
#include <algorithm>
#include <cmath>
#include <iterator>


// ============================================================================
// InterpolationScheme Base Class Implementation
// ============================================================================
InterpolationScheme::InterpolationScheme(const std::vector<double>& xData, const std::vector<double>& yData, ExtrapolationType extraType)
    : _xData(xData), _yData(yData), _extrapolationType(extraType)
{
    validateData();

    // Initialization happens in derived class constructors after their setup is complete
    switch (extraType) {
        case ExtrapolationType::Flat:
            _extrapolationScheme = std::make_unique<FlatExtrapolation>();
            break;
        case ExtrapolationType::Linear:
            _extrapolationScheme = std::make_unique<LinearExtrapolation>();
            break;
        case ExtrapolationType::Natural:
            break;
    }
}

void InterpolationScheme::validateData() const
{
    if (_xData.size() != _yData.size()) {
        throw DimensionMismatch("InterpolationScheme: xData and yData must have same size");
    }

    if (_xData.size() < 2) {
        throw InvalidInput("InterpolationScheme: At least 2 data points required");
    }

    auto notIncreasing = std::adjacent_find(_xData.begin(), _xData.end(),
                                            [](double a, double b) { return !(a < b); });
    if (notIncreasing != _xData.end()) {
        throw InvalidInput("InterpolationScheme: xData must be strictly increasing");
    }
}

std::pair<double, double> InterpolationScheme::getRange() const
{
    return {_xData.front(), _xData.back()};
}

size_t InterpolationScheme::findInterval(double x) const
{
    // binary search: O(log n)
    auto it = std::upper_bound(_xData.begin(), _xData.end(), x);

    if (it == _xData.begin()) {
        return 0;
    }

    size_t idx = std::distance(_xData.begin(), it) - 1;
    if (idx >= _xData.size() - 1) {
        idx = _xData.size() - 2;
    }
    return idx;
}

double InterpolationScheme::operator()(double x) const
{
    auto [xMin, xMax] = getRange();
    if ((x < xMin || x > xMax) && _extrapolationScheme) {
        // Extrapolation needs to query the interpolation object for boundary values and derivatives
        return _extrapolationScheme->extrapolate(x, *this);
    }
    return interpolate(x);
}

// ============================================================================
// LinearInterpolation Implementation
// ============================================================================

LinearInterpolation::LinearInterpolation(const std::vector<double>& xData,
                                         const std::vector<double>& yData,
                                         ExtrapolationType extraType)
    : InterpolationScheme(xData, yData, extraType)
{
    if (_extrapolationScheme) _extrapolationScheme->initialize(*this);
}

double LinearInterpolation::interpolate(double x) const
{
    size_t idx = findInterval(x);

    double x0 = _xData[idx];
    double x1 = _xData[idx + 1];
    double y0 = _yData[idx];
    double y1 = _yData[idx + 1];

    return y0 + (y1 - y0) * (x - x0) / (x1 - x0);
}

double LinearInterpolation::derivative(double x) const
{
    // slope of the interval
    size_t idx = findInterval(x);
    return (_yData[idx + 1] - _yData[idx]) / (_xData[idx + 1] - _xData[idx]);
}

double LinearInterpolation::secondDerivative(double) const
{
    return 0.0;
}

std::unique_ptr<InterpolationScheme> LinearInterpolation::clone() const
{
    return std::make_unique<LinearInterpolation>(_xData, _yData, _extrapolationType);
}

// ============================================================================
// PchipInterpolation Implementation
// ============================================================================

namespace {
    // one-sided three-point end slope, limited to keep the end piece shape-preserving
    double pchipEndSlope(double h0, double h1, double m0, double m1)
    {
        double d = ((2.0 * h0 + h1) * m0 - h0 * m1) / (h0 + h1);
        if (std::signbit(d) != std::signbit(m0) || d == 0.0 || m0 == 0.0) {
            return 0.0;
        }
        if (std::signbit(m0) != std::signbit(m1) && std::abs(d) > 3.0 * std::abs(m0)) {
            return 3.0 * m0;
        }
        return d;
    }
}

PchipInterpolation::PchipInterpolation(const std::vector<double>& xData,
                                       const std::vector<double>& yData,
                                       ExtrapolationType extraType)
    : InterpolationScheme(xData, yData, extraType)
{
    computeSlopes();
    if (_extrapolationScheme) _extrapolationScheme->initialize(*this);
}

void PchipInterpolation::computeSlopes()
{
    const size_t n = _xData.size();
    std::vector<double> h(n - 1), m(n - 1);
    for (size_t k = 0; k + 1 < n; ++k) {
        h[k] = _xData[k + 1] - _xData[k];
        m[k] = (_yData[k + 1] - _yData[k]) / h[k];
    }

    _slopes.assign(n, 0.0);
    if (n == 2) {
        _slopes[0] = _slopes[1] = m[0];
        return;
    }

    for (size_t k = 1; k + 1 < n; ++k) {
        if (m[k - 1] * m[k] <= 0.0) {
            _slopes[k] = 0.0;   // local extremum or flat secant
        } else {
            const double w1 = 2.0 * h[k] + h[k - 1];
            const double w2 = h[k] + 2.0 * h[k - 1];
            _slopes[k] = (w1 + w2) / (w1 / m[k - 1] + w2 / m[k]);
        }
    }
    _slopes[0] = pchipEndSlope(h[0], h[1], m[0], m[1]);
    _slopes[n - 1] = pchipEndSlope(h[n - 2], h[n - 3], m[n - 2], m[n - 3]);
}

double PchipInterpolation::interpolate(double x) const
{
    const size_t k = findInterval(x);
    const double h = _xData[k + 1] - _xData[k];
    const double t = (x - _xData[k]) / h;
    const double t2 = t * t;
    const double t3 = t2 * t;

    // Hermite basis
    const double h00 = 2.0 * t3 - 3.0 * t2 + 1.0;
    const double h10 = t3 - 2.0 * t2 + t;
    const double h01 = -2.0 * t3 + 3.0 * t2;
    const double h11 = t3 - t2;

    return h00 * _yData[k] + h10 * h * _slopes[k] + h01 * _yData[k + 1] + h11 * h * _slopes[k + 1];
}

double PchipInterpolation::derivative(double x) const
{
    const size_t k = findInterval(x);
    const double h = _xData[k + 1] - _xData[k];
    const double t = (x - _xData[k]) / h;
    const double t2 = t * t;

    return (6.0 * t2 - 6.0 * t) / h * _yData[k] + (3.0 * t2 - 4.0 * t + 1.0) * _slopes[k]
         + (-6.0 * t2 + 6.0 * t) / h * _yData[k + 1] + (3.0 * t2 - 2.0 * t) * _slopes[k + 1];
}

double PchipInterpolation::secondDerivative(double x) const
{
    const size_t k = findInterval(x);
    const double h = _xData[k + 1] - _xData[k];
    const double t = (x - _xData[k]) / h;

    return (12.0 * t - 6.0) / (h * h) * (_yData[k] - _yData[k + 1])
         + ((6.0 * t - 4.0) * _slopes[k] + (6.0 * t - 2.0) * _slopes[k + 1]) / h;
}

std::unique_ptr<InterpolationScheme> PchipInterpolation::clone() const
{
    return std::make_unique<PchipInterpolation>(_xData, _yData, _extrapolationType);
}


// ============================================================================
// ExtrapolationScheme Implementations
// ============================================================================

// FlatExtrapolation
std::unique_ptr<ExtrapolationScheme> FlatExtrapolation::clone() const
{
    auto cloned = std::make_unique<FlatExtrapolation>();
    cloned->_yMin = _yMin;
    cloned->_yMax = _yMax;
    return cloned;
}

void FlatExtrapolation::initialize(const InterpolationScheme& interp)
{
    auto [xMin, xMax] = interp.getRange();
    _yMin = interp.interpolate(xMin);
    _yMax = interp.interpolate(xMax);
}

double FlatExtrapolation::extrapolate(double x, const InterpolationScheme& interp) const
{
    auto [xMin, xMax] = interp.getRange();
    return (x < xMin) ? _yMin : _yMax;
}

// LinearExtrapolation
std::unique_ptr<ExtrapolationScheme> LinearExtrapolation::clone() const
{
    auto cloned = std::make_unique<LinearExtrapolation>();
    cloned->_yMin = _yMin;
    cloned->_yMax = _yMax;
    cloned->_dyMin = _dyMin;
    cloned->_dyMax = _dyMax;
    return cloned;
}

void LinearExtrapolation::initialize(const InterpolationScheme& interp)
{
    auto [xMin, xMax] = interp.getRange();
    _yMin = interp.interpolate(xMin);
    _yMax = interp.interpolate(xMax);
    _dyMin = interp.derivative(xMin);
    _dyMax = interp.derivative(xMax);
}

double LinearExtrapolation::extrapolate(double x, const InterpolationScheme& interp) const
{
    auto [xMin, xMax] = interp.getRange();

    if (x < xMin) {
        return _yMin + _dyMin * (x - xMin);
    }
    return _yMax + _dyMax * (x - xMax);
}
