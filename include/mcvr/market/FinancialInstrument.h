//
// Vanilla option contracts priced by the closed-form and tree pricers.
//

#ifndef MCVR_FINANCIALINSTRUMENT_H
#define MCVR_FINANCIALINSTRUMENT_H


class FinancialInstrument // Abstract class - base class
{
public:
    virtual FinancialInstrument* clone() const = 0; // Virtual Pure method - clone

    virtual ~FinancialInstrument() = default;
};

class Option : public FinancialInstrument // Abstract class - base class for Option
{
public:
    enum class Type { Call, Put }; // place first!

    Option(Type type, double strike, double maturity);
    Option(const Option&) = default;
    Option& operator=(const Option&) = default;
    ~Option() override = default;

    Type type() const { return _type; }
    double strike() const { return _strike; }
    double maturity() const { return _maturity; }

    // exercise value at spot
    double payoff(double spot) const;

    // true if the holder may exercise before maturity
    virtual bool isEarlyExercisable() const = 0;
    Option* clone() const override = 0;

protected:
    Type _type;
    double _strike {0.0};
    double _maturity {0.0};
};


class EuropeanOption : public Option
{
public:
    EuropeanOption(Type type, double strike, double maturity);

    bool isEarlyExercisable() const override { return false; }
    EuropeanOption* clone() const override;
};


class AmericanOption : public Option
{
public:
    AmericanOption(Type type, double strike, double maturity);

    bool isEarlyExercisable() const override { return true; }
    AmericanOption* clone() const override;
};

#endif //MCVR_FINANCIALINSTRUMENT_H
