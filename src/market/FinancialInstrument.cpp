#include <mcvr/market/FinancialInstrument.h>
#include <mcvr/utils/Errors.h>
#include <algorithm>

Option::Option(Option::Type type, double strike, double maturity)
    : _type(type), _strike(strike), _maturity(maturity)
{
    if (strike <= 0.0)
        throw InvalidInput("Option: strike must be positive");
    if (maturity <= 0.0)
        throw InvalidInput("Option: maturity must be positive");
}

double Option::payoff(double spot) const
{
    return (_type == Type::Call) ? std::max(spot - _strike, 0.0)
                                 : std::max(_strike - spot, 0.0);
}

EuropeanOption::EuropeanOption(Type type, double strike, double maturity)
    : Option(type, strike, maturity) // call base constructor
{
}

EuropeanOption *EuropeanOption::clone() const
{
    return new EuropeanOption(*this); // copy construct of current object
}

AmericanOption::AmericanOption(Type type, double strike, double maturity)
    : Option(type, strike, maturity)
{
}

AmericanOption *AmericanOption::clone() const
{
    return new AmericanOption(*this);
}
