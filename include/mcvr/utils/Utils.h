#ifndef MCVR_UTILS_H
#define MCVR_UTILS_H

#include <vector>
#include <cstddef>


/**
 *  NOTES:
 *  (1) inverseNormalCDF is Moro's rational approximation; it drives every sampler
 *      (plain, LHS and QMC), so it must stay cheap.
 *  (2) normalQuantile goes through Boost.Math and is accurate to machine precision;
 *      it is used where a single quantile matters (confidence intervals).
 *  (3) Boost library used in: normalQuantile, primes (Halton bases).
 */


class Utils
{
public:
    static double stdNormCdf(double x);

    static double stdNormPdf(double x);

    /** Moro's Inverse Normal CDF Algorithm
     * Inverse of the standard normal CDF: Φ^(-1)(u)
     *
     * @param u Uniform random variable in (0, 1)
     * @return Standard normal random variable Z ~ N(0,1)
     */
    static double inverseNormalCDF(double u);

    // Φ^(-1)(p) to full double precision, p in (0, 1)
    static double normalQuantile(double p);

    // first n primes: 2, 3, 5, 7, ...
    static std::vector<unsigned> primes(std::size_t n);

private:
    Utils() = delete; // delete constructor; everything is static
};

#endif // MCVR_UTILS_H
