#include <mcvr/utils/Utils.h>
#include <mcvr/utils/Errors.h>
#include <cmath>
#include <numbers>
#include <algorithm>
#include <string>
#include <boost/math/distributions/normal.hpp>     // exact quantile for confidence intervals
#include <boost/math/special_functions/prime.hpp>  // prime table for Halton bases

// ============================================================================
// * Statistics
// ============================================================================

constexpr double PI = std::numbers::pi; // C++ 20 pi

// Standard normal CDF
double Utils::stdNormCdf(double x)
{
    return 0.5 * std::erfc(-x / std::sqrt(2.0));
}

double Utils::stdNormPdf(double x)
{
    // PDF of standard normal distribution: φ(x) = (1/√(2π)) * exp(-x²/2)
    return (1.0 / std::sqrt(2.0 * PI)) * std::exp(-0.5 * x * x);
}

double Utils::inverseNormalCDF(double u)
{
    /**
     * Moro's Inverse Normal CDF Algorithm (1995)
     *
     * Approximates Φ⁻¹(u) where Φ is the standard normal CDF
     *
     * Accuracy:
     * - Central region (0.08 < u < 0.92): |error| < 3×10⁻⁹
     * - Tail regions (u ≤ 0.08 or u ≥ 0.92): |error| < 10⁻⁷
     *
     * Reference: Moro, B. (1995), "The Full Monte", RISK, Vol. 8, No. 2
     */

    // Clamp to safe range to prevent log(0) or log(negative)
    const double eps = 1e-15;
    u = std::max(eps, std::min(u, 1.0 - eps));

    double x = u - 0.5;

    if (std::abs(x) < 0.42) {
        // Central region: |u - 0.5| < 0.42
        double r = x * x;

        static const double a0 =  2.50662823884;
        static const double a1 = -18.61500062529;
        static const double a2 =  41.39119773534;
        static const double a3 = -25.44106049637;

        static const double b0 = -8.47351093090;
        static const double b1 =  23.08336743743;
        static const double b2 = -21.06224101826;
        static const double b3 =   3.13082909833;

        double num = a0 + r * (a1 + r * (a2 + r * a3));
        double den = 1.0 + r * (b0 + r * (b1 + r * (b2 + r * b3)));

        return x * num / den;
    }

    // Tail regions: u ≤ 0.08 or u ≥ 0.92
    double r = (x < 0.0) ? u : (1.0 - u);
    r = std::log(-std::log(r));

    static const double c0 = 0.3374754822726147;
    static const double c1 = 0.9761690190917186;
    static const double c2 = 0.1607979714918209;
    static const double c3 = 0.0276438810333863;
    static const double c4 = 0.0038405729373609;
    static const double c5 = 0.0003951896511919;
    static const double c6 = 0.0000321767881768;
    static const double c7 = 0.0000002888167364;
    static const double c8 = 0.0000003960315187;

    double z = c0 + r * (c1 + r * (c2 + r * (c3 + r * (c4 +
               r * (c5 + r * (c6 + r * (c7 + r * c8)))))));

    return (x < 0.0) ? -z : z;
}

double Utils::normalQuantile(double p)
{
    if (!(p > 0.0 && p < 1.0)) {
        throw InvalidInput("Utils::normalQuantile: p must lie in (0, 1)");
    }
    static const boost::math::normal_distribution<double> stdNormal(0.0, 1.0);
    return boost::math::quantile(stdNormal, p);
}

std::vector<unsigned> Utils::primes(std::size_t n)
{
    // boost::math::prime covers the first max_prime + 1 primes (10000)
    if (n > boost::math::max_prime + 1) {
        throw InvalidInput("Utils::primes: at most " + std::to_string(boost::math::max_prime + 1) +
                           " primes available");
    }
    std::vector<unsigned> out(n);
    for (std::size_t i = 0; i < n; ++i) {
        out[i] = boost::math::prime(static_cast<unsigned>(i));
    }
    return out;
}
