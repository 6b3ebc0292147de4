#include <cmath>
#include <mcvr/optimization/LinearAlgebra.h>
#include <mcvr/utils/Errors.h>
#include <gtest/gtest.h>

TEST(LinearAlgebraTest, MatrixOps_Multiply) {
    Matrix A        = {{1, 2}, {3, 4}};
    Matrix B        = {{5, 6}, {7, 8}};
    Matrix C        = MatrixOps::multiply(A, B);
    Matrix expected = {{19, 22}, {43, 50}};
    EXPECT_EQ(C, expected);
}

TEST(LinearAlgebraTest, MatrixOps_MultiplyVector) {
    Matrix A = {{1, 2, 3}, {4, 5, 6}};
    std::vector<double> x = {1, 0, -1};
    std::vector<double> y = MatrixOps::multiply(A, x);
    ASSERT_EQ(y.size(), 2u);
    EXPECT_NEAR(y[0], -2.0, 1e-14);
    EXPECT_NEAR(y[1], -2.0, 1e-14);
}

TEST(LinearAlgebraTest, MatrixOps_MultiplyABtMatchesExplicitTranspose) {
    Matrix A = {{1, 2, 3}, {4, 5, 6}, {7, 8, 9}, {1, 0, 1}};
    Matrix B = {{2, 0, 1}, {1, 1, 1}};
    Matrix viaTranspose = MatrixOps::multiply(A, MatrixOps::transpose(B));
    Matrix direct = MatrixOps::multiplyABt(A, B);
    ASSERT_EQ(direct.size(), 4u);
    ASSERT_EQ(direct[0].size(), 2u);
    for (size_t i = 0; i < direct.size(); ++i)
        for (size_t j = 0; j < direct[i].size(); ++j)
            EXPECT_NEAR(direct[i][j], viaTranspose[i][j], 1e-14);
}

TEST(LinearAlgebraTest, MatrixOps_Transpose) {
    Matrix A        = {{1, 2}, {3, 4}};
    Matrix B        = MatrixOps::transpose(A);
    Matrix expected = {{1, 3}, {2, 4}};
    EXPECT_EQ(B, expected);
}

TEST(LinearAlgebraTest, MatrixOps_Dot) {
    std::vector<double> x = {1, 3, 5, 7, 9};
    std::vector<double> y = {2, 4, 6, 8, 10};

    double expected = 0.0;
    for (size_t i = 0; i < x.size(); ++i)
        expected += x[i] * y[i];

    EXPECT_NEAR(MatrixOps::dot(x, y), expected, 1e-10);
}

TEST(LinearAlgebraTest, MatrixOps_AtAAndAtb) {
    Matrix A = {{1, 2}, {3, 4}, {5, 6}};
    std::vector<double> b = {1, 1, 1};

    Matrix AtA = MatrixOps::multiplyAtA(A);
    Matrix expected = MatrixOps::multiply(MatrixOps::transpose(A), A);
    EXPECT_EQ(AtA, expected);

    std::vector<double> Atb = MatrixOps::multiplyAtb(A, b);
    EXPECT_NEAR(Atb[0], 9.0, 1e-14);
    EXPECT_NEAR(Atb[1], 12.0, 1e-14);
}

TEST(LinearAlgebraTest, MatrixOps_ShapeErrors) {
    Matrix A = {{1, 2}, {3, 4}};
    EXPECT_THROW(MatrixOps::multiply(A, std::vector<double>{1, 2, 3}), DimensionMismatch);
    EXPECT_THROW(MatrixOps::multiply(A, Matrix{{1, 2}}), DimensionMismatch);
    EXPECT_THROW(MatrixOps::dot({1, 2}, {1}), DimensionMismatch);
    EXPECT_TRUE(MatrixOps::isRectangular(A));
    EXPECT_FALSE(MatrixOps::isRectangular(Matrix{{1, 2}, {3}}));
}

TEST(LinearAlgebraTest, Cholesky_Decompose) {
    Matrix S = {{4, 2}, {2, 3}};
    Matrix L = Cholesky::decompose(S);
    EXPECT_NEAR(L[0][0], 2.0, 1e-14);
    EXPECT_NEAR(L[0][1], 0.0, 1e-14);
    EXPECT_NEAR(L[1][0], 1.0, 1e-14);
    EXPECT_NEAR(L[1][1], std::sqrt(2.0), 1e-14);

    // L * L^T reproduces S
    Matrix LLt = MatrixOps::multiplyABt(L, L);
    for (size_t i = 0; i < 2; ++i)
        for (size_t j = 0; j < 2; ++j)
            EXPECT_NEAR(LLt[i][j], S[i][j], 1e-12);
}

TEST(LinearAlgebraTest, Cholesky_Solve) {
    Matrix S = {{4, 12, -16}, {12, 37, -43}, {-16, -43, 98}};
    std::vector<double> xTrue = {1.0, -2.0, 0.5};
    std::vector<double> b = MatrixOps::multiply(S, xTrue);

    Matrix L = Cholesky::decompose(S);
    std::vector<double> x = Cholesky::solve(L, b);
    for (size_t i = 0; i < 3; ++i)
        EXPECT_NEAR(x[i], xTrue[i], 1e-10);
}

TEST(LinearAlgebraTest, Cholesky_Errors) {
    EXPECT_THROW(Cholesky::decompose({{1, 2}, {2, 1}}), NotPositiveDefinite);      // indefinite
    EXPECT_THROW(Cholesky::decompose({{1, 1}, {1, 1}}), NotPositiveDefinite);      // singular
    EXPECT_THROW(Cholesky::decompose({{1, 0.5, 0}, {0.5, 1}}), DimensionMismatch);
    EXPECT_THROW(Cholesky::decompose({{1, 0.5}, {0.2, 1}}), InvalidInput);         // not symmetric
}
