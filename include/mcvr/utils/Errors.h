#ifndef MCVR_ERRORS_H
#define MCVR_ERRORS_H

#include <stdexcept>
#include <string>

/**
 * Error taxonomy shared by the pricers, the sampler and the calibration layer.
 *
 *   InvalidInput          bad scalar parameter (T <= 0, sigma <= 0, path floor, ...)
 *    |- DimensionMismatch  vector/matrix shapes disagree
 *    |- InsufficientSamples fewer than 2 observations
 *    |- UnknownMethod      unrecognised sampling method name
 *   UnbracketedRoot       implied-vol solver could not bracket the target price
 *   NotPositiveDefinite   Cholesky factorisation failed
 *
 * Every error is fatal to the call that raised it. No partial results.
 */

class InvalidInput : public std::invalid_argument
{
public:
    explicit InvalidInput(const std::string& what) : std::invalid_argument(what) {}
};

class DimensionMismatch : public InvalidInput
{
public:
    explicit DimensionMismatch(const std::string& what) : InvalidInput(what) {}
};

class InsufficientSamples : public InvalidInput
{
public:
    explicit InsufficientSamples(const std::string& what) : InvalidInput(what) {}
};

class UnknownMethod : public InvalidInput
{
public:
    explicit UnknownMethod(const std::string& what) : InvalidInput(what) {}
};

class UnbracketedRoot : public std::runtime_error
{
public:
    explicit UnbracketedRoot(const std::string& what) : std::runtime_error(what) {}
};

class NotPositiveDefinite : public std::runtime_error
{
public:
    explicit NotPositiveDefinite(const std::string& what) : std::runtime_error(what) {}
};

#endif // MCVR_ERRORS_H
