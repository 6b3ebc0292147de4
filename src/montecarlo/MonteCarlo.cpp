#include <mcvr/montecarlo/MonteCarlo.h>
#include <mcvr/utils/Utils.h>
#include <mcvr/utils/Errors.h>
#include <numeric>
#include <cmath>

namespace {
    double sampleMean(const std::vector<double>& samples)
    {
        double sum = std::accumulate(samples.begin(), samples.end(), 0.0);
        return sum / static_cast<double>(samples.size());
    }

    double sampleVariance(const std::vector<double>& samples, double mean)
    {
        double sqSum = 0.0;
        for (double s : samples) {
            sqSum += (s - mean) * (s - mean);
        }
        return sqSum / static_cast<double>(samples.size() - 1);
    }
}

double sampleStdDev(const std::vector<double>& samples)
{
    if (samples.size() < 2) {
        throw InsufficientSamples("sampleStdDev: need at least 2 samples");
    }
    return std::sqrt(sampleVariance(samples, sampleMean(samples)));
}

EstimateStatistics EstimateStatistics::compute(const std::vector<double>& samples, double alpha)
{
    size_t n = samples.size();
    if (n < 2) {
        throw InsufficientSamples("EstimateStatistics::compute: need at least 2 samples");
    }
    if (!(alpha > 0.0 && alpha < 1.0)) {
        throw InvalidInput("EstimateStatistics::compute: alpha must lie in (0, 1)");
    }

    double mean = sampleMean(samples);
    double sd = std::sqrt(sampleVariance(samples, mean));
    double se = sd / std::sqrt(static_cast<double>(n));

    double z = Utils::normalQuantile(1.0 - alpha / 2.0);

    EstimateStatistics out;
    out.n = n;
    out.mean = mean;
    out.sd = sd;
    out.se = se;
    out.alpha = alpha;
    out.ciLow = mean - z * se;
    out.ciHigh = mean + z * se;
    return out;
}
