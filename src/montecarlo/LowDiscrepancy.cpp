#include <mcvr/montecarlo/LowDiscrepancy.h>
#include <mcvr/montecarlo/RandomNumberGenerator.h>
#include <mcvr/utils/Utils.h>
#include <mcvr/utils/Errors.h>
#include <boost/random/sobol.hpp>
#include <cmath>
#include <numeric>
#include <utility>
#include <string>

namespace {

    // splitmix64 finaliser
    uint64_t mix64(uint64_t z)
    {
        z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
        z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
        return z ^ (z >> 31);
    }

    uint64_t nextSeed64(RandomNumberGenerator& rng)
    {
        uint64_t hi = rng.nextUInt32();
        uint64_t lo = rng.nextUInt32();
        return (hi << 32) | lo;
    }

    // enough base-b digits to resolve a double mantissa
    size_t digitsForDoublePrecision(unsigned base)
    {
        return static_cast<size_t>(std::ceil(53.0 / std::log2(static_cast<double>(base))));
    }

    void validateShape(const char* who, size_t count, size_t dimensions)
    {
        if (count == 0) {
            throw InvalidInput(std::string(who) + ": count must be > 0");
        }
        if (dimensions == 0) {
            throw InvalidInput(std::string(who) + ": dimensions must be > 0");
        }
    }
}

// ============================================================================
// Sobol
// ============================================================================

uint32_t LowDiscrepancy::owenScramble(uint32_t bits, uint64_t dimensionSeed)
{
    // Depth k flips bit k (from the top) with a coin that depends only on the
    // k original bits above it: a nested uniform scramble.
    uint32_t out = 0;
    uint64_t prefix = 0;
    for (int bit = 31; bit >= 0; --bit) {
        const uint64_t depth = static_cast<uint64_t>(31 - bit);
        const uint64_t key = dimensionSeed
                           ^ mix64(depth + 0x9E3779B97F4A7C15ULL)
                           ^ mix64((prefix << 6) | depth);
        const uint32_t flip = static_cast<uint32_t>(mix64(key) >> 63);
        const uint32_t b = (bits >> bit) & 1u;
        out |= (b ^ flip) << bit;
        prefix = (prefix << 1) | b;
    }
    return out;
}

Matrix LowDiscrepancy::sobolUniforms(size_t count, size_t dimensions, bool scramble, uint64_t seed)
{
    validateShape("LowDiscrepancy::sobolUniforms", count, dimensions);
    if (dimensions > maxSobolDimension) {
        throw InvalidInput("LowDiscrepancy::sobolUniforms: at most " + std::to_string(maxSobolDimension) +
                           " dimensions supported");
    }

    std::vector<uint64_t> dimensionSeeds;
    if (scramble) {
        PCG32Generator rng(seed);
        dimensionSeeds.resize(dimensions);
        for (auto& s : dimensionSeeds) s = nextSeed64(rng);
    }

    boost::random::sobol engine(dimensions);
    Matrix U(count, std::vector<double>(dimensions));
    for (size_t i = 0; i < count; ++i) {
        for (size_t j = 0; j < dimensions; ++j) {
            const uint64_t x = engine();   // consecutive calls walk the coordinates of one point
            if (scramble) {
                const uint32_t top = static_cast<uint32_t>(x >> 32);
                const uint32_t s = owenScramble(top, dimensionSeeds[j]);
                U[i][j] = std::ldexp(static_cast<double>(s) + 0.5, -32);  // centre of the 2^-32 cell
            } else {
                U[i][j] = std::ldexp(static_cast<double>(x), -64);
            }
        }
    }
    return U;
}

// ============================================================================
// Halton
// ============================================================================

double LowDiscrepancy::radicalInverse(uint64_t index, unsigned base)
{
    const double invBase = 1.0 / static_cast<double>(base);
    double f = invBase;
    double result = 0.0;
    while (index > 0) {
        result += static_cast<double>(index % base) * f;
        index /= base;
        f *= invBase;
    }
    return result;
}

double LowDiscrepancy::scrambledRadicalInverse(uint64_t index, unsigned base,
                                               const std::vector<std::vector<unsigned>>& perms)
{
    // Trailing zero digits are permuted too, so walk every digit position
    const double invBase = 1.0 / static_cast<double>(base);
    double f = invBase;
    double result = 0.0;
    for (const auto& perm : perms) {
        const unsigned digit = static_cast<unsigned>(index % base);
        result += static_cast<double>(perm[digit]) * f;
        index /= base;
        f *= invBase;
    }
    return result;
}

Matrix LowDiscrepancy::haltonUniforms(size_t count, size_t dimensions, bool scramble, uint64_t seed)
{
    validateShape("LowDiscrepancy::haltonUniforms", count, dimensions);
    const std::vector<unsigned> bases = Utils::primes(dimensions);

    // perms[dim][digitPosition][digit]
    std::vector<std::vector<std::vector<unsigned>>> perms;
    if (scramble) {
        PCG32Generator rng(seed);
        perms.resize(dimensions);
        for (size_t j = 0; j < dimensions; ++j) {
            const unsigned b = bases[j];
            perms[j].resize(digitsForDoublePrecision(b));
            for (auto& p : perms[j]) {
                p.resize(b);
                std::iota(p.begin(), p.end(), 0u);
                for (unsigned k = b - 1; k > 0; --k) {
                    const unsigned r = rng.uniformInt(k + 1);
                    std::swap(p[k], p[r]);
                }
            }
        }
    }

    Matrix U(count, std::vector<double>(dimensions));
    for (size_t i = 0; i < count; ++i) {
        const uint64_t index = static_cast<uint64_t>(i) + 1;  // skip the origin
        for (size_t j = 0; j < dimensions; ++j) {
            U[i][j] = scramble ? scrambledRadicalInverse(index, bases[j], perms[j])
                               : radicalInverse(index, bases[j]);
        }
    }
    return U;
}
