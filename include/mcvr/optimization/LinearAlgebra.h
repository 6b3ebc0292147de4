#ifndef MCVR_LINEARALGEBRA_H
#define MCVR_LINEARALGEBRA_H

#include <vector>
#include <cstddef>

// Matrix = row-major 2D vector
// Sample matrices follow the same layout: one row per path, one column per dimension
using Matrix = std::vector<std::vector<double>>;

// Basic matrix/vector operations
class MatrixOps
{
public:
    // y = A * x
    static std::vector<double> multiply(const Matrix &A, const std::vector<double> &x);
    // C = A * B
    static Matrix multiply(const Matrix &A, const Matrix &B);
    // C = A * B^T (avoids forming B^T)
    static Matrix multiplyABt(const Matrix &A, const Matrix &B);
    // A^T
    static Matrix transpose(const Matrix &A);
    // dot product
    static double dot(const std::vector<double> &x, const std::vector<double> &y);
    // identity matrix
    static Matrix identity(size_t n);
    // zero matrix
    static Matrix zeros(size_t m, size_t n);
    // A^T * A (symmetric, avoids forming A^T)
    static Matrix multiplyAtA(const Matrix &A);
    // A^T * b (avoids forming A^T)
    static std::vector<double> multiplyAtb(const Matrix &A, const std::vector<double> &b);
    // true if every row has the same length as the first
    static bool isRectangular(const Matrix &A);

private:
    MatrixOps() = delete;
};

// Cholesky: S = L * L^T for symmetric positive definite S
class Cholesky
{
public:
    // returns lower triangular L; throws NotPositiveDefinite
    static Matrix decompose(const Matrix &S);
    // solve L * y = b (forward substitution)
    static std::vector<double> solveL(const Matrix &L, const std::vector<double> &b);
    // solve L^T * x = y (back substitution)
    static std::vector<double> solveLT(const Matrix &L, const std::vector<double> &y);
    // solve S * x = b via L * L^T
    static std::vector<double> solve(const Matrix &L, const std::vector<double> &b);

private:
    Cholesky() = delete;
};

#endif // MCVR_LINEARALGEBRA_H
