#include <mcvr/pricers/BlackScholesFormulas.h>
#include <mcvr/utils/Utils.h>
#include <mcvr/utils/Errors.h>

#include <cmath>
#include <algorithm>
#include <limits>
#include <string>

// ============================================================================
// Helper Functions
// ============================================================================
namespace {
    double normCdf(double x) {
        return Utils::stdNormCdf(x);
    }

    double normPdf(double x) {
        return Utils::stdNormPdf(x);
    }

    void validate(const char* who, double spot, double strike, double volatility, double maturity)
    {
        if (!(spot > 0.0))
            throw InvalidInput(std::string("BlackScholesFormulas::") + who + ": spot must be positive");
        if (!(strike > 0.0))
            throw InvalidInput(std::string("BlackScholesFormulas::") + who + ": strike must be positive");
        if (!(volatility > 0.0))
            throw InvalidInput(std::string("BlackScholesFormulas::") + who + ": volatility must be positive");
        if (!(maturity > 0.0))
            throw InvalidInput(std::string("BlackScholesFormulas::") + who + ": maturity must be positive");
    }

    bool isDegenerate(double volatility, double maturity)
    {
        return volatility * std::sqrt(maturity) < BlackScholesFormulas::degenerateStdDev;
    }

    // d1 without validation; ±inf in the zero-variance limit so N(.) and φ(.) take their limits
    double rawD1(double spot, double strike, double rate, double volatility, double maturity, double dividend)
    {
        const double logMoneyness = std::log(spot / strike) + (rate - dividend) * maturity;
        if (isDegenerate(volatility, maturity)) {
            if (logMoneyness > 0.0) return std::numeric_limits<double>::infinity();
            if (logMoneyness < 0.0) return -std::numeric_limits<double>::infinity();
            return 0.0;
        }
        const double stdDev = volatility * std::sqrt(maturity);
        return (logMoneyness + 0.5 * stdDev * stdDev) / stdDev;
    }

    double rawD2(double spot, double strike, double rate, double volatility, double maturity, double dividend)
    {
        const double d1Val = rawD1(spot, strike, rate, volatility, maturity, dividend);
        if (std::isinf(d1Val)) return d1Val;
        return d1Val - volatility * std::sqrt(maturity);
    }
}

// ============================================================================
// d1/d2 Helpers
// ============================================================================

/**
 * d₁ = [ln(S/K) + (r - q + σ²/2)T] / (σ√T)
 */
double BlackScholesFormulas::d1(double spot, double strike, double rate, double volatility, double maturity, double dividend)
{
    validate("d1", spot, strike, volatility, maturity);
    return rawD1(spot, strike, rate, volatility, maturity, dividend);
}

// d2 = d1 - σ√T
double BlackScholesFormulas::d2(double spot, double strike, double rate, double volatility, double maturity, double dividend)
{
    validate("d2", spot, strike, volatility, maturity);
    return rawD2(spot, strike, rate, volatility, maturity, dividend);
}

// ============================================================================
// Pricing Functions
// ============================================================================

double BlackScholesFormulas::price(double spot, double strike, double rate, double volatility, double maturity,
                                   Option::Type optionType, double dividend)
{
    return (optionType == Option::Type::Call)
            ? callPrice(spot, strike, rate, volatility, maturity, dividend)
            : putPrice(spot, strike, rate, volatility, maturity, dividend);
}

/**
 * Black-Scholes Call Option Formula
 * C = S*e^(-qT)*N(d1) - K*e^(-rT)*N(d2)
 */
double BlackScholesFormulas::callPrice(double spot, double strike, double rate, double volatility, double maturity, double dividend)
{
    validate("callPrice", spot, strike, volatility, maturity);
    const double discountFactor = std::exp(-rate * maturity);
    const double dividendFactor = std::exp(-dividend * maturity);

    if (isDegenerate(volatility, maturity)) {
        return std::max(spot * dividendFactor - strike * discountFactor, 0.0);
    }
    const double d1Val = rawD1(spot, strike, rate, volatility, maturity, dividend);
    const double d2Val = rawD2(spot, strike, rate, volatility, maturity, dividend);

    return spot * dividendFactor * normCdf(d1Val) - strike * discountFactor * normCdf(d2Val);
}

/**
 * Black-Scholes Put Option Formula
 * P = K*e^(-rT)*N(-d2) - S*e^(-qT)*N(-d1)
 */
double BlackScholesFormulas::putPrice(double spot, double strike, double rate, double volatility, double maturity, double dividend)
{
    validate("putPrice", spot, strike, volatility, maturity);
    const double discountFactor = std::exp(-rate * maturity);
    const double dividendFactor = std::exp(-dividend * maturity);

    if (isDegenerate(volatility, maturity)) {
        return std::max(strike * discountFactor - spot * dividendFactor, 0.0);
    }
    const double d1Val = rawD1(spot, strike, rate, volatility, maturity, dividend);
    const double d2Val = rawD2(spot, strike, rate, volatility, maturity, dividend);

    return strike * discountFactor * normCdf(-d2Val) - spot * dividendFactor * normCdf(-d1Val);
}

// ============================================================================
// Greeks - First order
// ============================================================================

/**
 * Delta: ∂V/∂S
 * Call Delta: e^(-qT) N(d1)
 * Put Delta:  -e^(-qT) N(-d1)
 */
double BlackScholesFormulas::delta(double spot, double strike, double rate, double volatility, double maturity,
                                   Option::Type optionType, double dividend)
{
    validate("delta", spot, strike, volatility, maturity);
    const double d1Val = rawD1(spot, strike, rate, volatility, maturity, dividend);
    const double dividendFactor = std::exp(-dividend * maturity);
    return (optionType == Option::Type::Call)
            ? dividendFactor * normCdf(d1Val)
            : -dividendFactor * normCdf(-d1Val);
}

// ν = S·e^(-qT)·φ(d1)·sqrt(T), same for calls and puts
double BlackScholesFormulas::vega(double spot, double strike, double rate, double volatility, double maturity, double dividend)
{
    validate("vega", spot, strike, volatility, maturity);
    const double d1Val = rawD1(spot, strike, rate, volatility, maturity, dividend);
    return spot * std::exp(-dividend * maturity) * normPdf(d1Val) * std::sqrt(maturity);
}

double BlackScholesFormulas::theta(double spot, double strike, double rate, double volatility, double maturity,
                                   Option::Type optionType, double dividend)
{
    validate("theta", spot, strike, volatility, maturity);
    // Θ_call = -S·e^(-qT)·φ(d₁)·σ/(2√T) - rK·e^(-rT)·N(d₂) + qS·e^(-qT)·N(d₁)
    // Θ_put  = -S·e^(-qT)·φ(d₁)·σ/(2√T) + rK·e^(-rT)·N(-d₂) - qS·e^(-qT)·N(-d₁)
    const double d1Val = rawD1(spot, strike, rate, volatility, maturity, dividend);
    const double d2Val = rawD2(spot, strike, rate, volatility, maturity, dividend);
    const double discountFactor = std::exp(-rate * maturity);
    const double dividendFactor = std::exp(-dividend * maturity);

    const double term1 = -spot * dividendFactor * normPdf(d1Val) * volatility / (2.0 * std::sqrt(maturity));

    if (optionType == Option::Type::Call) {
        return term1 - rate * strike * discountFactor * normCdf(d2Val)
                     + dividend * spot * dividendFactor * normCdf(d1Val);
    }
    return term1 + rate * strike * discountFactor * normCdf(-d2Val)
                 - dividend * spot * dividendFactor * normCdf(-d1Val);
}

/**
 * Rho: ∂V/∂r
 * Call Rho: K·T·e^(-rT)·N(d2)
 * Put Rho: -K·T·e^(-rT)·N(-d₂)
 */
double BlackScholesFormulas::rho(double spot, double strike, double rate, double volatility, double maturity,
                                 Option::Type optionType, double dividend)
{
    validate("rho", spot, strike, volatility, maturity);
    const double d2Val = rawD2(spot, strike, rate, volatility, maturity, dividend);
    const double discountFactor = std::exp(-rate * maturity);

    if (optionType == Option::Type::Call) {
        return strike * maturity * discountFactor * normCdf(d2Val);
    }
    return -strike * maturity * discountFactor * normCdf(-d2Val);
}

// ============================================================================
// Greeks - Second Order (Convexity)
// ============================================================================

/**
 * Gamma: ∂2V/∂S^2, same for calls and puts
 * Γ = e^(-qT)·φ(d1) / (S*σ*√T)
 */
double BlackScholesFormulas::gamma(double spot, double strike, double rate, double volatility, double maturity, double dividend)
{
    validate("gamma", spot, strike, volatility, maturity);
    if (isDegenerate(volatility, maturity)) {
        return 0.0;
    }
    const double d1Val = rawD1(spot, strike, rate, volatility, maturity, dividend);
    return std::exp(-dividend * maturity) * normPdf(d1Val) / (spot * volatility * std::sqrt(maturity));
}
