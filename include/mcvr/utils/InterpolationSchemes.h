#ifndef MCVR_INTERPOLATIONSCHEMES_H
#define MCVR_INTERPOLATIONSCHEMES_H

#include <vector>
#include <memory>
#include <utility>


/**
 *  InterpolationScheme has a constructor that only require which extrapolation you want [ExtrapolationType]
 *  When calling the extrapolation() method, the data member _extrapolationType will determine how to extrapolation
 *  You need one protected method per extrapolation type
 *
 *  Natural = keep evaluating the boundary piece (straight line for linear, end cubic for PCHIP)
 */

// Extrapolation type enum
enum class ExtrapolationType { Flat, Linear, Natural };

// Forward declaration
class ExtrapolationScheme;

// ============================================================================
// BASE CLASS: InterpolationScheme
// ============================================================================
class InterpolationScheme
{
public:
    // xData strictly increasing, same size as yData, at least 2 points
    InterpolationScheme(const std::vector<double>& xData,
                        const std::vector<double>& yData,
                        ExtrapolationType extraType = ExtrapolationType::Natural);
    virtual ~InterpolationScheme() = default;

    // Core interface
    virtual double interpolate(double x) const = 0;
    virtual double derivative(double x) const = 0;
    virtual double secondDerivative(double x) const = 0;
    virtual std::unique_ptr<InterpolationScheme> clone() const = 0;

    double operator()(double x) const; // Unified interface: routes to interpolate or extrapolate automatically
    std::pair<double, double> getRange() const;

protected:
    std::vector<double> _xData;
    std::vector<double> _yData;
    std::unique_ptr<ExtrapolationScheme> _extrapolationScheme;   // null for Natural

    ExtrapolationType _extrapolationType;

    void validateData() const;

    // index i such that x is in [xData[i], xData[i+1]), clamped to the end intervals
    size_t findInterval(double x) const;
};


/**
 * Linear interpolation: y = y0 + (y1-y0) * (x-x0) / (x1-x0)
 */
class LinearInterpolation : public InterpolationScheme
{
public:
    LinearInterpolation(const std::vector<double>& xData,
                        const std::vector<double>& yData,
                        ExtrapolationType extraType = ExtrapolationType::Natural);

    double interpolate(double x) const override;
    double derivative(double x) const override;
    double secondDerivative(double x) const override;
    std::unique_ptr<InterpolationScheme> clone() const override;
};

// ============================================================================
// PCHIP INTERPOLATION
// ============================================================================

/**
 * Piecewise cubic Hermite interpolation with Fritsch-Carlson slopes.
 * Node slopes are the weighted harmonic mean of the adjacent secants (0 at local extrema),
 * end slopes use the one-sided three-point formula with the same shape limiting.
 * Monotone data stays monotone, no overshoot between knots.
 */
class PchipInterpolation : public InterpolationScheme
{
public:
    PchipInterpolation(const std::vector<double>& xData,
                       const std::vector<double>& yData,
                       ExtrapolationType extraType = ExtrapolationType::Natural);

    double interpolate(double x) const override;
    double derivative(double x) const override;
    double secondDerivative(double x) const override;
    std::unique_ptr<InterpolationScheme> clone() const override;

    const std::vector<double>& nodeSlopes() const { return _slopes; }

private:
    std::vector<double> _slopes;

    void computeSlopes();
};


// ============================================================================
// BASE CLASS: ExtrapolationScheme
// ============================================================================
class ExtrapolationScheme
{
public:
    virtual ~ExtrapolationScheme() = default;
    virtual std::unique_ptr<ExtrapolationScheme> clone() const = 0;
    virtual void initialize(const InterpolationScheme& interp) = 0;
    virtual double extrapolate(double x, const InterpolationScheme& interp) const = 0;
};

// Flat extrapolation: y = y(boundary)
class FlatExtrapolation : public ExtrapolationScheme
{
public:
    std::unique_ptr<ExtrapolationScheme> clone() const override;
    void initialize(const InterpolationScheme& interp) override; //extract the boundary information from the interpolation scheme
    double extrapolate(double x, const InterpolationScheme& interp) const override;

private:
    double _yMin, _yMax;
};

// Linear extrapolation: y = y(boundary) + y'(boundary) * dx
class LinearExtrapolation : public ExtrapolationScheme
{
public:
    std::unique_ptr<ExtrapolationScheme> clone() const override;
    void initialize(const InterpolationScheme& interp) override;
    double extrapolate(double x, const InterpolationScheme& interp) const override;  // avoid circular reference!

private:
    double _yMin, _yMax;
    double _dyMin, _dyMax;
};

#endif //MCVR_INTERPOLATIONSCHEMES_H
