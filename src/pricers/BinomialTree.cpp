#include <mcvr/pricers/BinomialTree.h>
#include <mcvr/utils/Errors.h>
#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

BinomialTreePricer::BinomialTreePricer(size_t steps)
    : _steps(steps)
{
    if (steps == 0)
        throw InvalidInput("BinomialTreePricer: steps must be > 0");
}

double BinomialTreePricer::price(const Option& option, double spot, double rate, double volatility) const
{
    if (!(spot > 0.0))
        throw InvalidInput("BinomialTreePricer::price: spot must be positive");
    if (!(volatility > 0.0))
        throw InvalidInput("BinomialTreePricer::price: volatility must be positive");

    const double dt = option.maturity() / static_cast<double>(_steps);
    const double u = std::exp(volatility * std::sqrt(dt));
    const double d = 1.0 / u;
    const double q = (std::exp(rate * dt) - d) / (u - d);
    if (!(q > 0.0 && q < 1.0))
        throw InvalidInput("BinomialTreePricer::price: risk-neutral probability out of (0,1): " + std::to_string(q));
    const double disc = std::exp(-rate * dt);

    // node j at step n has j up-moves
    std::vector<double> values(_steps + 1);
    for (size_t j = 0; j <= _steps; ++j) {
        const double ST = spot * std::pow(u, static_cast<double>(j)) * std::pow(d, static_cast<double>(_steps - j));
        values[j] = option.payoff(ST);
    }

    const bool early = option.isEarlyExercisable();
    for (size_t step = _steps; step-- > 0;) {
        for (size_t j = 0; j <= step; ++j) {
            const double continuation = disc * (q * values[j + 1] + (1.0 - q) * values[j]);
            if (early) {
                const double S = spot * std::pow(u, static_cast<double>(j)) * std::pow(d, static_cast<double>(step - j));
                values[j] = std::max(option.payoff(S), continuation);
            } else {
                values[j] = continuation;
            }
        }
    }
    return values[0];
}

ReplicatingPortfolio oneStepReplication(double /*spot*/, double spotUp, double spotDown,
                                        double valueUp, double valueDown, double rateTimesDt)
{
    if (spotUp == spotDown)
        throw InvalidInput("oneStepReplication: spotUp == spotDown, cannot replicate");
    const double delta = (valueUp - valueDown) / (spotUp - spotDown);
    const double bond = std::exp(-rateTimesDt) * (valueUp - delta * spotUp);
    return {delta, bond};
}
