#ifndef MCVR_PRICERS_BINOMIALTREE_H
#define MCVR_PRICERS_BINOMIALTREE_H

#include <mcvr/market/FinancialInstrument.h>
#include <cstddef>

/**
 * Cox-Ross-Rubinstein tree
 *  u = exp(σ√dt), d = 1/u, q = (exp(r dt) - d)/(u - d)
 * European options roll back without exercise, American options take
 * max(exercise, continuation) at every node.
 */
class BinomialTreePricer
{
public:
    explicit BinomialTreePricer(size_t steps);

    double price(const Option& option, double spot, double rate, double volatility) const;

    size_t steps() const { return _steps; }

private:
    size_t _steps;
};

struct ReplicatingPortfolio {
    double delta;   // units of stock
    double bond;    // cash position
};

// one-period hedge: delta = (Vu - Vd)/(Su - Sd), bond = exp(-r dt) (Vu - delta Su)
ReplicatingPortfolio oneStepReplication(double spot, double spotUp, double spotDown,
                                        double valueUp, double valueDown, double rateTimesDt);

#endif // MCVR_PRICERS_BINOMIALTREE_H
