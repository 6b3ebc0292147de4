#ifndef MCVR_MONTECARLO_LOWDISCREPANCY_H
#define MCVR_MONTECARLO_LOWDISCREPANCY_H

#include <mcvr/optimization/LinearAlgebra.h>
#include <cstdint>
#include <cstddef>
#include <vector>

/**
 * Low-discrepancy point sets in [0,1)^d
 *
 * Sobol:  Boost.Random sobol engine (Joe-Kuo direction numbers, d <= 3667).
 *         The engine skips the all-zero first point.
 *         scramble = nested uniform (Owen) scrambling of the leading 32 bits;
 *         every flip bit is a hash of (dimension seed, depth, original prefix).
 * Halton: radical inverse in the first d primes, index starting at 1.
 *         scramble = random digit permutation per (dimension, digit position).
 *
 * Dimension seeds and permutations come from a PCG32 stream seeded with `seed`,
 * so a given (count, dimensions, scramble, seed) always yields the same points.
 * Points are returned row-major: [count][dimensions].
 */
class LowDiscrepancy
{
public:
    static Matrix sobolUniforms(size_t count, size_t dimensions, bool scramble, uint64_t seed);
    static Matrix haltonUniforms(size_t count, size_t dimensions, bool scramble, uint64_t seed);

    // Owen scramble of a 32-bit binary fraction
    static uint32_t owenScramble(uint32_t bits, uint64_t dimensionSeed);

    // Φ_b(index), optionally through per-digit permutations perms[k][digit]
    static double radicalInverse(uint64_t index, unsigned base);
    static double scrambledRadicalInverse(uint64_t index, unsigned base,
                                          const std::vector<std::vector<unsigned>>& perms);

    static constexpr size_t maxSobolDimension = 3667;

private:
    LowDiscrepancy() = delete;
};

#endif // MCVR_MONTECARLO_LOWDISCREPANCY_H
