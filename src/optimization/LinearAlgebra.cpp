#include <mcvr/optimization/LinearAlgebra.h>
#include <mcvr/utils/Errors.h>
#include <algorithm>
#include <cmath>

// ===========================================================================
// Matrix Operations
// ===========================================================================

std::vector<double> MatrixOps::multiply(const Matrix &A, const std::vector<double> &x)
{
    size_t m = A.size();
    if (m == 0)
        return {};
    size_t n = A[0].size();
    if (n != x.size())
        throw DimensionMismatch("MatrixOps::multiply: columns of A must match size of x");

    std::vector<double> y(m, 0.0);
    for (size_t i = 0; i < m; ++i)
        for (size_t j = 0; j < n; ++j)
            y[i] += A[i][j] * x[j];
    return y;
}

Matrix MatrixOps::multiply(const Matrix &A, const Matrix &B)
{
    size_t m = A.size();
    if (m == 0)
        return {};
    size_t k = A[0].size();

    if (B.size() != k)
        throw DimensionMismatch("MatrixOps::multiply: columns of A must match rows of B");
    size_t n = k == 0 ? 0 : B[0].size();

    Matrix C = zeros(m, n);
    // i-l-j order for cache efficiency: B[l][j] now contiguous
    for (size_t i = 0; i < m; ++i) {
        for (size_t l = 0; l < k; ++l) {
            double a_il = A[i][l];
            for (size_t j = 0; j < n; ++j)
                C[i][j] += a_il * B[l][j];
        }
    }
    return C;
}

Matrix MatrixOps::multiplyABt(const Matrix &A, const Matrix &B)
{
    size_t m = A.size();
    if (m == 0)
        return {};
    size_t k = A[0].size();
    size_t n = B.size();
    for (const auto &row : B)
        if (row.size() != k)
            throw DimensionMismatch("MatrixOps::multiplyABt: columns of A must match columns of B");

    Matrix C = zeros(m, n);
    // rows of A and B are both contiguous here
    for (size_t i = 0; i < m; ++i) {
        const auto &a = A[i];
        for (size_t j = 0; j < n; ++j) {
            const auto &b = B[j];
            double sum = 0.0;
            for (size_t l = 0; l < k; ++l)
                sum += a[l] * b[l];
            C[i][j] = sum;
        }
    }
    return C;
}

Matrix MatrixOps::transpose(const Matrix &A)
{
    if (A.empty())
        return {};
    const size_t m = A.size();
    const size_t n = A[0].size();

    Matrix At(n, std::vector<double>(m));
    for (size_t i = 0; i < m; ++i) {
        if (A[i].size() != n)
            throw DimensionMismatch("MatrixOps::transpose: rows of A have different lengths");
        for (size_t j = 0; j < n; ++j)
            At[j][i] = A[i][j];
    }
    return At;
}

double MatrixOps::dot(const std::vector<double> &x, const std::vector<double> &y)
{
    if (x.size() != y.size())
        throw DimensionMismatch("MatrixOps::dot: vectors must have same size");
    double sum = 0.0;
    for (size_t i = 0; i < x.size(); ++i)
        sum += x[i] * y[i];
    return sum;
}

Matrix MatrixOps::identity(size_t n)
{
    Matrix I = zeros(n, n);
    for (size_t i = 0; i < n; ++i)
        I[i][i] = 1.0;
    return I;
}

Matrix MatrixOps::zeros(size_t m, size_t n)
{
    return Matrix(m, std::vector<double>(n, 0.0));
}

Matrix MatrixOps::multiplyAtA(const Matrix &A)
{
    size_t m = A.size();
    if (m == 0) return {};
    size_t n = A[0].size();

    Matrix C = zeros(n, n);
    // only compute upper triangle, then mirror
    for (size_t i = 0; i < n; ++i) {
        for (size_t j = i; j < n; ++j) {
            double sum = 0.0;
            for (size_t k = 0; k < m; ++k)
                sum += A[k][i] * A[k][j];
            C[i][j] = sum;
            C[j][i] = sum;
        }
    }
    return C;
}

std::vector<double> MatrixOps::multiplyAtb(const Matrix &A, const std::vector<double> &b)
{
    size_t m = A.size();
    if (m == 0) return {};
    if (b.size() != m)
        throw DimensionMismatch("MatrixOps::multiplyAtb: rows of A must match size of b");
    size_t n = A[0].size();

    std::vector<double> y(n, 0.0);
    for (size_t j = 0; j < n; ++j)
        for (size_t i = 0; i < m; ++i)
            y[j] += A[i][j] * b[i];
    return y;
}

bool MatrixOps::isRectangular(const Matrix &A)
{
    if (A.empty()) return true;
    const size_t n = A[0].size();
    return std::all_of(A.begin(), A.end(), [n](const std::vector<double> &row) { return row.size() == n; });
}

// ===========================================================================
// Cholesky
// ===========================================================================
Matrix Cholesky::decompose(const Matrix &S)
{
    size_t n = S.size();
    if (n == 0)
        return {};

    for (const auto &row : S)
        if (row.size() != n)
            throw DimensionMismatch("Cholesky::decompose: matrix must be square");

    // check symmetry
    for (size_t i = 0; i < n; ++i)
        for (size_t j = i + 1; j < n; ++j)
            if (std::abs(S[i][j] - S[j][i]) > 1e-10)
                throw InvalidInput("Cholesky::decompose: matrix is not symmetric");

    Matrix L = MatrixOps::zeros(n, n);

    for (size_t i = 0; i < n; ++i)
    {
        for (size_t j = 0; j <= i; ++j)
        {
            double sum = S[i][j];
            for (size_t k = 0; k < j; ++k)
                sum -= L[i][k] * L[j][k];

            if (i == j)
            {
                if (!(sum > 0.0))
                    throw NotPositiveDefinite("Cholesky::decompose: matrix not positive definite");
                L[i][j] = std::sqrt(sum);
            }
            else
            {
                L[i][j] = sum / L[j][j]; // divide diagonal
            }
        }
    }
    return L;
}

std::vector<double> Cholesky::solveL(const Matrix &L, const std::vector<double> &b)
{
    size_t n = L.size();
    std::vector<double> y(n);

    for (size_t i = 0; i < n; ++i)
    {
        double sum = b[i];
        for (size_t j = 0; j < i; ++j)
            sum -= L[i][j] * y[j];
        y[i] = sum / L[i][i];
    }
    return y;
}

std::vector<double> Cholesky::solveLT(const Matrix &L, const std::vector<double> &y)
{
    size_t n = L.size();
    std::vector<double> x(n);

    for (int i = static_cast<int>(n) - 1; i >= 0; --i)
    {
        double sum = y[i];
        for (size_t j = i + 1; j < n; ++j)
            sum -= L[j][i] * x[j];
        x[i] = sum / L[i][i];
    }
    return x;
}

std::vector<double> Cholesky::solve(const Matrix &L, const std::vector<double> &b)
{
    if (b.size() != L.size())
        throw DimensionMismatch("Cholesky::solve: right-hand side has wrong size");
    auto y = solveL(L, b);
    return solveLT(L, y);
}
