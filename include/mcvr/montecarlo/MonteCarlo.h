/**
    Sample statistics for MC estimators

*/


#ifndef MCVR_MONTECARLO_MONTECARLO_H
#define MCVR_MONTECARLO_MONTECARLO_H

#include <vector>
#include <cstddef>

// mean, sd (n-1), se = sd/sqrt(n) and a two-sided normal-approximation CI
struct EstimateStatistics {
    size_t n = 0;
    double mean = 0.0;
    double sd = 0.0;
    double se = 0.0;
    double alpha = 0.05;
    double ciLow = 0.0;
    double ciHigh = 0.0;

    // throws InsufficientSamples for n < 2, InvalidInput for alpha outside (0, 1)
    static EstimateStatistics compute(const std::vector<double>& samples, double alpha = 0.05);
};

// sample standard deviation with n-1 denominator (n >= 2)
double sampleStdDev(const std::vector<double>& samples);

#endif
