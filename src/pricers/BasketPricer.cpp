#include <mcvr/pricers/BasketPricer.h>
#include <mcvr/utils/Utils.h>
#include <mcvr/utils/Errors.h>
#include <algorithm>
#include <cmath>
#include <string>

namespace {
    void checkDimensions(const char* who, const std::vector<double>& spots, const std::vector<double>& weights,
                         const std::vector<double>& volatilities, const Matrix& correlation)
    {
        const size_t d = spots.size();
        if (d == 0)
            throw DimensionMismatch(std::string(who) + ": basket has no assets");
        if (weights.size() != d || volatilities.size() != d || correlation.size() != d)
            throw DimensionMismatch(std::string(who) + ": weights, volatilities and correlation must match " +
                                    std::to_string(d) + " spots");
        for (const auto& row : correlation)
            if (row.size() != d)
                throw DimensionMismatch(std::string(who) + ": correlation must be " +
                                        std::to_string(d) + "x" + std::to_string(d));
    }

    void checkMarket(const char* who, const std::vector<double>& spots, const std::vector<double>& volatilities,
                     double strike, double maturity)
    {
        if (!(maturity > 0.0))
            throw InvalidInput(std::string(who) + ": maturity must be > 0");
        if (!(strike > 0.0))
            throw InvalidInput(std::string(who) + ": strike must be > 0");
        for (double s : spots)
            if (!(s > 0.0))
                throw InvalidInput(std::string(who) + ": spots must be > 0");
        for (double v : volatilities)
            if (!(v >= 0.0))
                throw InvalidInput(std::string(who) + ": volatilities must be >= 0");
    }
}

SamplingMethod normalizeSamplingSelection(SamplingMethod method, bool latinHypercube)
{
    return latinHypercube ? SamplingMethod::LatinHypercube : method;
}

double BasketPricer::geometricCallClosedForm(const std::vector<double>& spots, const std::vector<double>& weights,
                                             double strike, double rate, double maturity,
                                             const std::vector<double>& volatilities, const Matrix& correlation)
{
    const char* who = "BasketPricer::geometricCallClosedForm";
    checkDimensions(who, spots, weights, volatilities, correlation);
    checkMarket(who, spots, volatilities, strike, maturity);

    const size_t d = spots.size();
    // log G ~ N(meanLog, varLog)
    double meanLog = 0.0;
    for (size_t i = 0; i < d; ++i) {
        meanLog += weights[i] * (std::log(spots[i]) + (rate - 0.5 * volatilities[i] * volatilities[i]) * maturity);
    }
    double varLog = 0.0;
    for (size_t i = 0; i < d; ++i) {
        for (size_t j = 0; j < d; ++j) {
            varLog += weights[i] * volatilities[i] * correlation[i][j] * volatilities[j] * weights[j];
        }
    }
    varLog *= maturity;

    const double df = std::exp(-rate * maturity);
    if (!(varLog > 0.0)) {
        return df * std::max(std::exp(meanLog) - strike, 0.0);
    }
    const double sd = std::sqrt(varLog);
    const double d1 = (meanLog - std::log(strike) + varLog) / sd;
    const double d2 = d1 - sd;
    return df * (std::exp(meanLog + 0.5 * varLog) * Utils::stdNormCdf(d1) - strike * Utils::stdNormCdf(d2));
}

MCPricingResult BasketPricer::priceCall(const BasketMCParams& params)
{
    const char* who = "BasketPricer::priceCall";

    SamplingConfig config;
    config.method = normalizeSamplingSelection(params.method, params.latinHypercube);
    config.antithetic = params.antithetic;
    config.seed = params.seed;
    config.scramble = params.qmcScramble;

    // all shape checks happen before anything is simulated
    checkDimensions(who, params.spots, params.weights, params.volatilities, params.correlation);
    if (params.numPaths < minPaths)
        throw InvalidInput(std::string(who) + ": numPaths must be >= 1000");
    checkMarket(who, params.spots, params.volatilities, params.strike, params.maturity);
    if (!(params.alpha > 0.0 && params.alpha < 1.0))
        throw InvalidInput(std::string(who) + ": alpha must lie in (0, 1)");

    const size_t d = params.spots.size();
    const Matrix Z = NormalSampler::generateCorrelatedNormals(params.numPaths, params.correlation, config);
    const size_t numPaths = Z.size();

    const double T = params.maturity;
    const double sqrtT = std::sqrt(T);
    const double df = std::exp(-params.rate * T);

    std::vector<double> logDrift(d);
    for (size_t i = 0; i < d; ++i) {
        const double vol = params.volatilities[i];
        logDrift[i] = std::log(params.spots[i]) + (params.rate - 0.5 * vol * vol) * T;
    }

    std::vector<double> payoffs(numPaths);
    std::vector<double> geometric(numPaths);
    std::vector<double> linear(numPaths);

    for (size_t p = 0; p < numPaths; ++p) {
        double basket = 0.0;
        double weightedLog = 0.0;
        for (size_t i = 0; i < d; ++i) {
            const double logST = logDrift[i] + params.volatilities[i] * sqrtT * Z[p][i];
            basket += params.weights[i] * std::exp(logST);
            weightedLog += params.weights[i] * logST;
        }
        payoffs[p] = df * std::max(basket - params.strike, 0.0);
        geometric[p] = df * std::max(std::exp(weightedLog) - params.strike, 0.0);
        linear[p] = df * basket;
    }

    std::vector<ControlSpec> controls;
    if (params.useControlVariate) {
        controls.push_back({"geom_basket_call", std::move(geometric),
                            geometricCallClosedForm(params.spots, params.weights, params.strike, params.rate,
                                                    T, params.volatilities, params.correlation)});
        if (params.useExtraControl) {
            // discounted forward of the linear basket
            double forwardValue = 0.0;
            for (size_t i = 0; i < d; ++i) forwardValue += params.weights[i] * params.spots[i];
            controls.push_back({"disc_linear_basket", std::move(linear), forwardValue});
        }
    }

    return assemblePricingResult(config, payoffs, controls, params.alpha);
}
