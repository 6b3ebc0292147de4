#ifndef MCVR_RANDOMNUMBERGENERATOR_H
#define MCVR_RANDOMNUMBERGENERATOR_H


#include <pcg_random.hpp>
#include <mcvr/utils/Utils.h>
#include <cstdint>


// ============================================================================
// BASE CLASS
// ============================================================================

// One generator per pricing call; nothing here is shared between calls
class RandomNumberGenerator {
public:
    virtual ~RandomNumberGenerator() = default;

    // sampling
    virtual double uniform() = 0;                  // [0, 1), 53 bits
    virtual uint32_t nextUInt32() = 0;
    virtual uint32_t uniformInt(uint32_t bound) = 0; // [0, bound), unbiased
    double normal();

protected:
    RandomNumberGenerator() = default;
};

// ============================================================================
// PCG32 GENERATOR
// ============================================================================

class PCG32Generator : public RandomNumberGenerator {
public:
    explicit PCG32Generator(uint64_t seed);

    double uniform() override;
    uint32_t nextUInt32() override;
    uint32_t uniformInt(uint32_t bound) override;

private:
    pcg32 _rng;
};

// ============================================================================
// INLINE IMPLEMENTATIONS
// ============================================================================

inline double RandomNumberGenerator::normal() {
    return Utils::inverseNormalCDF(uniform());
}

#endif // MCVR_RANDOMNUMBERGENERATOR_H
