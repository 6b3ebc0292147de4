#include <mcvr/montecarlo/Sampler.h>
#include <mcvr/montecarlo/LowDiscrepancy.h>
#include <mcvr/utils/Utils.h>
#include <mcvr/utils/Errors.h>
#include <algorithm>
#include <utility>

// ============================================================================
// SamplingMethod helpers
// ============================================================================

SamplingMethod parseSamplingMethod(const std::string& name)
{
    if (name == "plain") return SamplingMethod::Plain;
    if (name == "lhs" || name == "latin-hypercube") return SamplingMethod::LatinHypercube;
    if (name == "sobol") return SamplingMethod::Sobol;
    if (name == "halton") return SamplingMethod::Halton;
    throw UnknownMethod("parseSamplingMethod: method must be one of: plain, lhs, sobol, halton (got '" + name + "')");
}

std::string toString(SamplingMethod method)
{
    switch (method) {
        case SamplingMethod::Plain:          return "plain";
        case SamplingMethod::LatinHypercube: return "lhs";
        case SamplingMethod::Sobol:          return "sobol";
        case SamplingMethod::Halton:         return "halton";
    }
    throw UnknownMethod("toString: invalid sampling method");
}

bool isQuasiMonteCarlo(SamplingMethod method)
{
    return method == SamplingMethod::Sobol || method == SamplingMethod::Halton;
}

// ============================================================================
// NormalSampler
// ============================================================================

size_t NormalSampler::effectiveCount(size_t count, bool antithetic)
{
    return antithetic ? 2 * ((count + 1) / 2) : count;
}

Matrix NormalSampler::plainNormals(size_t count, size_t dimensions, RandomNumberGenerator& rng)
{
    Matrix Z(count, std::vector<double>(dimensions));
    for (auto& row : Z)
        for (auto& z : row)
            z = rng.normal();
    return Z;
}

Matrix NormalSampler::latinHypercubeUniforms(size_t count, size_t dimensions, RandomNumberGenerator& rng)
{
    // column j: stratum i gets (i + U)/n, then the column is shuffled on its own
    Matrix U(count, std::vector<double>(dimensions));
    std::vector<double> column(count);
    const double n = static_cast<double>(count);
    for (size_t j = 0; j < dimensions; ++j) {
        for (size_t i = 0; i < count; ++i) {
            column[i] = (static_cast<double>(i) + rng.uniform()) / n;
        }
        // Fisher-Yates with pcg's bounded draw, so the permutation does not depend on the standard library
        for (size_t i = count - 1; i > 0; --i) {
            const size_t r = rng.uniformInt(static_cast<uint32_t>(i + 1));
            std::swap(column[i], column[r]);
        }
        for (size_t i = 0; i < count; ++i) {
            U[i][j] = column[i];
        }
    }
    return U;
}

void NormalSampler::uniformsToNormals(Matrix& U)
{
    for (auto& row : U)
        for (auto& u : row)
            u = Utils::inverseNormalCDF(std::clamp(u, uniformClip, 1.0 - uniformClip));
}

Matrix NormalSampler::generateNormals(size_t count, size_t dimensions, const SamplingConfig& config)
{
    if (count == 0) {
        throw InvalidInput("NormalSampler::generateNormals: count must be > 0");
    }
    if (dimensions == 0) {
        throw InvalidInput("NormalSampler::generateNormals: dimensions must be > 0");
    }
    if (count > UINT32_MAX) {
        throw InvalidInput("NormalSampler::generateNormals: count exceeds 2^32 - 1");
    }

    const size_t base = config.antithetic ? (count + 1) / 2 : count;
    PCG32Generator rng(config.seed);  // owned by this call only

    if (config.method == SamplingMethod::Plain) {
        Matrix Z = plainNormals(base, dimensions, rng);
        if (config.antithetic) {
            Z.reserve(2 * base);
            for (size_t i = 0; i < base; ++i) {
                std::vector<double> mirrored(Z[i]);
                for (auto& z : mirrored) z = -z;
                Z.push_back(std::move(mirrored));
            }
        }
        return Z;
    }

    Matrix U;
    switch (config.method) {
        case SamplingMethod::LatinHypercube:
            U = latinHypercubeUniforms(base, dimensions, rng);
            break;
        case SamplingMethod::Sobol:
            U = LowDiscrepancy::sobolUniforms(base, dimensions, config.scramble, config.seed);
            break;
        case SamplingMethod::Halton:
            U = LowDiscrepancy::haltonUniforms(base, dimensions, config.scramble, config.seed);
            break;
        default:
            throw UnknownMethod("NormalSampler::generateNormals: invalid sampling method");
    }

    if (config.antithetic) {
        // complement before inversion
        U.reserve(2 * base);
        for (size_t i = 0; i < base; ++i) {
            std::vector<double> mirrored(U[i]);
            for (auto& u : mirrored) u = 1.0 - u;
            U.push_back(std::move(mirrored));
        }
    }
    uniformsToNormals(U);
    return U;
}

Matrix NormalSampler::generateCorrelatedNormals(size_t count, const Matrix& correlation, const SamplingConfig& config)
{
    const size_t d = correlation.size();
    if (d == 0) {
        throw DimensionMismatch("NormalSampler::generateCorrelatedNormals: correlation matrix is empty");
    }
    for (const auto& row : correlation) {
        if (row.size() != d) {
            throw DimensionMismatch("NormalSampler::generateCorrelatedNormals: correlation matrix must be square");
        }
    }

    const Matrix L = Cholesky::decompose(correlation);
    const Matrix Z = generateNormals(count, d, config);
    return MatrixOps::multiplyABt(Z, L);
}
