#ifndef MCVR_MONTECARLO_SAMPLER_H
#define MCVR_MONTECARLO_SAMPLER_H

#include <mcvr/optimization/LinearAlgebra.h>
#include <mcvr/montecarlo/RandomNumberGenerator.h>
#include <cstdint>
#include <cstddef>
#include <string>

// enum class based sampling switcher
enum class SamplingMethod {
    Plain = 0,           // iid N(0,1) from a seeded PCG32 stream
    LatinHypercube = 1,  // stratified uniforms, one permutation per dimension
    Sobol = 2,
    Halton = 3,
};

// "plain", "lhs" / "latin-hypercube", "sobol", "halton"; throws UnknownMethod
SamplingMethod parseSamplingMethod(const std::string& name);
std::string toString(SamplingMethod method);
bool isQuasiMonteCarlo(SamplingMethod method);

/**
 * Per-call sampling configuration.
 *  antithetic: half the rows are drawn, the other half mirror them
 *              (-Z for plain draws, 1-U before inversion otherwise)
 *  scramble:   only read by Sobol / Halton
 */
struct SamplingConfig {
    SamplingMethod method = SamplingMethod::Plain;
    bool antithetic = false;
    uint64_t seed = 123;
    bool scramble = true;
};

class NormalSampler {
public:
    // rows produced for a requested count: 2*ceil(n/2) when antithetic, n otherwise
    static size_t effectiveCount(size_t count, bool antithetic);

    // [effectiveCount][dimensions] standard normals, bit-identical for identical inputs
    static Matrix generateNormals(size_t count, size_t dimensions, const SamplingConfig& config);

    // Z * L^T with corr = L * L^T; throws DimensionMismatch, NotPositiveDefinite
    static Matrix generateCorrelatedNormals(size_t count, const Matrix& correlation, const SamplingConfig& config);

    // single-method arms, each drawing from the generator it is handed
    static Matrix plainNormals(size_t count, size_t dimensions, RandomNumberGenerator& rng);
    static Matrix latinHypercubeUniforms(size_t count, size_t dimensions, RandomNumberGenerator& rng);

    static constexpr double uniformClip = 1e-12;

private:
    // clip away from {0, 1} and invert through Φ^(-1), in place
    static void uniformsToNormals(Matrix& U);

    NormalSampler() = delete;
};

#endif // MCVR_MONTECARLO_SAMPLER_H
