#include <mcvr/montecarlo/RandomNumberGenerator.h>

// ============================================================================
// PCG32 GENERATOR
// ============================================================================

PCG32Generator::PCG32Generator(uint64_t seed)
    : _rng(seed)
{}

double PCG32Generator::uniform() {
    // 53 bits from two 32-bit words, independent of the standard library
    const uint64_t hi = _rng();
    const uint64_t lo = _rng();
    return static_cast<double>((hi << 21) ^ (lo >> 11)) * 0x1.0p-53;
}

uint32_t PCG32Generator::nextUInt32() {
    return _rng();
}

uint32_t PCG32Generator::uniformInt(uint32_t bound) {
    // pcg's bounded draw rejects the biased tail
    return _rng(bound);
}
