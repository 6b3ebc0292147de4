#include <mcvr/pricers/AsianPricer.h>
#include <mcvr/utils/Utils.h>
#include <mcvr/utils/Errors.h>
#include <algorithm>
#include <cmath>

namespace {
    void validate(const AsianMCParams& p)
    {
        if (p.numObservations <= 0)
            throw InvalidInput("AsianPricer::priceArithmeticCall: numObservations must be > 0");
        if (p.numPaths < AsianPricer::minPaths)
            throw InvalidInput("AsianPricer::priceArithmeticCall: numPaths must be >= 1000");
        if (!(p.maturity > 0.0))
            throw InvalidInput("AsianPricer::priceArithmeticCall: maturity must be > 0");
        if (!(p.volatility > 0.0))
            throw InvalidInput("AsianPricer::priceArithmeticCall: volatility must be > 0");
        if (!(p.spot > 0.0))
            throw InvalidInput("AsianPricer::priceArithmeticCall: spot must be > 0");
        if (!(p.strike > 0.0))
            throw InvalidInput("AsianPricer::priceArithmeticCall: strike must be > 0");
        if (!(p.alpha > 0.0 && p.alpha < 1.0))
            throw InvalidInput("AsianPricer::priceArithmeticCall: alpha must lie in (0, 1)");
    }
}

double AsianPricer::geometricCallClosedForm(double spot, double strike, double rate, double maturity,
                                            double volatility, int numObservations)
{
    if (numObservations <= 0)
        throw InvalidInput("AsianPricer::geometricCallClosedForm: numObservations must be > 0");
    if (!(spot > 0.0) || !(strike > 0.0))
        throw InvalidInput("AsianPricer::geometricCallClosedForm: spot and strike must be > 0");
    if (!(maturity > 0.0))
        throw InvalidInput("AsianPricer::geometricCallClosedForm: maturity must be > 0");
    if (!(volatility > 0.0))
        throw InvalidInput("AsianPricer::geometricCallClosedForm: volatility must be > 0");

    // log G ~ N(mu, v) for fixings at iT/n, i = 1..n
    const double n = static_cast<double>(numObservations);
    const double mu = std::log(spot) + (rate - 0.5 * volatility * volatility) * maturity * (n + 1.0) / (2.0 * n);
    const double v = volatility * volatility * maturity * (n + 1.0) * (2.0 * n + 1.0) / (6.0 * n * n);
    const double sd = std::sqrt(v);

    const double d1 = (mu - std::log(strike) + v) / sd;
    const double d2 = d1 - sd;
    return std::exp(-rate * maturity) *
           (std::exp(mu + 0.5 * v) * Utils::stdNormCdf(d1) - strike * Utils::stdNormCdf(d2));
}

MCPricingResult AsianPricer::priceArithmeticCall(const AsianMCParams& params)
{
    validate(params);

    SamplingConfig config;
    config.method = params.method;
    config.antithetic = params.antithetic;
    config.seed = params.seed;
    config.scramble = params.qmcScramble;

    const size_t nObs = static_cast<size_t>(params.numObservations);
    const Matrix Z = NormalSampler::generateNormals(params.numPaths, nObs, config);
    const size_t numPaths = Z.size();

    const double dt = params.maturity / static_cast<double>(nObs);
    const double drift = (params.rate - 0.5 * params.volatility * params.volatility) * dt;
    const double diffusion = params.volatility * std::sqrt(dt);
    const double df = std::exp(-params.rate * params.maturity);
    const double logSpot = std::log(params.spot);

    std::vector<double> payoffs(numPaths);
    std::vector<double> geometric(numPaths);
    std::vector<double> terminal(numPaths);

    for (size_t p = 0; p < numPaths; ++p) {
        double logS = logSpot;
        double sumS = 0.0;
        double sumLogS = 0.0;
        for (size_t j = 0; j < nObs; ++j) {
            logS += drift + diffusion * Z[p][j];
            sumS += std::exp(logS);
            sumLogS += logS;
        }
        const double arithmeticAvg = sumS / static_cast<double>(nObs);
        const double geometricAvg = std::exp(sumLogS / static_cast<double>(nObs));

        payoffs[p] = df * std::max(arithmeticAvg - params.strike, 0.0);
        geometric[p] = df * std::max(geometricAvg - params.strike, 0.0);
        terminal[p] = df * std::exp(logS);
    }

    std::vector<ControlSpec> controls;
    if (params.useControlVariate) {
        controls.push_back({"geom_asian_call", std::move(geometric),
                            geometricCallClosedForm(params.spot, params.strike, params.rate, params.maturity,
                                                    params.volatility, params.numObservations)});
        if (params.useExtraControl) {
            // E[exp(-rT) S_T] = S0
            controls.push_back({"disc_terminal_S", std::move(terminal), params.spot});
        }
    }

    return assemblePricingResult(config, payoffs, controls, params.alpha);
}
