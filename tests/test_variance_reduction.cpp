#include <gtest/gtest.h>
#include <mcvr/montecarlo/VarianceReduction.h>
#include <mcvr/montecarlo/RandomNumberGenerator.h>
#include <mcvr/utils/Errors.h>
#include <cmath>
#include <vector>

namespace {
    // x = 2 y + small noise, E[y] = 0
    struct LinearSample {
        std::vector<double> target;
        std::vector<double> control;
    };

    LinearSample makeLinearSample(size_t n, double noise, uint64_t seed)
    {
        PCG32Generator rng(seed);
        LinearSample s;
        s.target.resize(n);
        s.control.resize(n);
        for (size_t i = 0; i < n; ++i) {
            const double y = rng.normal();
            s.control[i] = y;
            s.target[i] = 1.0 + 2.0 * y + noise * rng.normal();
        }
        return s;
    }

    double covariance(const std::vector<double>& a, const std::vector<double>& b)
    {
        const double n = static_cast<double>(a.size());
        double ma = 0.0, mb = 0.0;
        for (size_t i = 0; i < a.size(); ++i) {
            ma += a[i];
            mb += b[i];
        }
        ma /= n;
        mb /= n;
        double c = 0.0;
        for (size_t i = 0; i < a.size(); ++i) c += (a[i] - ma) * (b[i] - mb);
        return c / (n - 1.0);
    }
}

TEST(ControlVariateTest, SingleControlBetaIsCovOverVar) {
    LinearSample s = makeLinearSample(5000, 0.3, 1);
    VarianceReductionResult res = ControlVariateAdjuster::adjust(s.target, s.control, 0.0);

    const double expectedBeta = covariance(s.target, s.control) / covariance(s.control, s.control);
    ASSERT_EQ(res.beta.size(), 1u);
    EXPECT_NEAR(res.beta[0], expectedBeta, 1e-8);
    EXPECT_NEAR(res.beta[0], 2.0, 0.05);

    EXPECT_EQ(res.adjustedSamples.size(), s.target.size());
    EXPECT_LT(res.adjustedSd, res.baselineSd);
    EXPECT_NEAR(res.varianceReductionFactor, res.baselineSd / res.adjustedSd, 1e-12);
    // residual noise is all that is left
    EXPECT_NEAR(res.adjustedSd, 0.3, 0.02);
}

TEST(ControlVariateTest, AdjustedMeanUsesKnownControlMean) {
    LinearSample s = makeLinearSample(2000, 0.1, 2);
    VarianceReductionResult res = ControlVariateAdjuster::adjust(s.target, s.control, 0.0);

    double mx = 0.0, my = 0.0, ma = 0.0;
    for (size_t i = 0; i < s.target.size(); ++i) {
        mx += s.target[i];
        my += s.control[i];
        ma += res.adjustedSamples[i];
    }
    const double n = static_cast<double>(s.target.size());
    EXPECT_NEAR(ma / n, mx / n + res.beta[0] * (0.0 - my / n), 1e-10);
    EXPECT_NEAR(ma / n, 1.0, 0.01);
}

TEST(ControlVariateTest, DegenerateControlIsIgnored) {
    LinearSample s = makeLinearSample(100, 0.5, 3);
    std::vector<double> constant(100, 5.0);
    VarianceReductionResult res = ControlVariateAdjuster::adjust(s.target, constant, 5.0);

    ASSERT_EQ(res.beta.size(), 1u);
    EXPECT_EQ(res.beta[0], 0.0);
    EXPECT_EQ(res.adjustedSamples, s.target);
    EXPECT_DOUBLE_EQ(res.adjustedSd, res.baselineSd);
}

TEST(ControlVariateTest, DegenerateColumnDoesNotBlockTheOthers) {
    LinearSample s = makeLinearSample(1000, 0.2, 4);
    Matrix Y(1000, std::vector<double>(2));
    for (size_t i = 0; i < 1000; ++i) {
        Y[i][0] = 3.0;
        Y[i][1] = s.control[i];
    }
    VarianceReductionResult res = ControlVariateAdjuster::adjust(s.target, Y, {3.0, 0.0});
    EXPECT_EQ(res.beta[0], 0.0);
    EXPECT_NEAR(res.beta[1], 2.0, 0.05);
    EXPECT_LT(res.adjustedSd, 0.5 * res.baselineSd);
}

TEST(ControlVariateTest, NoControlsPassesTargetThrough) {
    LinearSample s = makeLinearSample(50, 1.0, 5);
    Matrix Y(50);   // 50 rows, zero columns
    VarianceReductionResult res = ControlVariateAdjuster::adjust(s.target, Y, {});
    EXPECT_TRUE(res.beta.empty());
    EXPECT_EQ(res.adjustedSamples, s.target);
    EXPECT_DOUBLE_EQ(res.varianceReductionFactor, 1.0);
}

TEST(ControlVariateTest, NeverWorseThanBaselineInSample) {
    // an unrelated control can only shrink the in-sample variance
    PCG32Generator rng(6);
    std::vector<double> x(3000), y(3000), z(3000);
    for (size_t i = 0; i < x.size(); ++i) {
        x[i] = rng.normal();
        y[i] = rng.normal();
        z[i] = rng.uniform();
    }
    Matrix Y(x.size(), std::vector<double>(2));
    for (size_t i = 0; i < x.size(); ++i) {
        Y[i][0] = y[i];
        Y[i][1] = z[i];
    }
    VarianceReductionResult res = ControlVariateAdjuster::adjust(x, Y, {0.0, 0.5});
    EXPECT_LE(res.adjustedSd, res.baselineSd + 1e-12);
    EXPECT_GE(res.varianceReductionFactor, 1.0 - 1e-12);
}

TEST(ControlVariateTest, NamedControlsKeepColumnOrder) {
    LinearSample s = makeLinearSample(1500, 0.2, 7);
    std::vector<double> shifted(s.control.size());
    PCG32Generator rng(8);
    for (size_t i = 0; i < shifted.size(); ++i) shifted[i] = 10.0 + rng.normal();

    std::vector<ControlSpec> controls = {
        {"linear", s.control, 0.0},
        {"noise", shifted, 10.0},
    };
    VarianceReductionResult named = ControlVariateAdjuster::adjust(s.target, controls);

    Matrix Y(s.target.size(), std::vector<double>(2));
    for (size_t i = 0; i < Y.size(); ++i) {
        Y[i][0] = s.control[i];
        Y[i][1] = shifted[i];
    }
    VarianceReductionResult plain = ControlVariateAdjuster::adjust(s.target, Y, {0.0, 10.0});

    ASSERT_EQ(named.beta.size(), 2u);
    EXPECT_DOUBLE_EQ(named.beta[0], plain.beta[0]);
    EXPECT_DOUBLE_EQ(named.beta[1], plain.beta[1]);
    EXPECT_NEAR(named.beta[0], 2.0, 0.05);
    EXPECT_NEAR(named.beta[1], 0.0, 0.05);
}

TEST(ControlVariateTest, Errors) {
    std::vector<double> x = {1.0, 2.0, 3.0};

    EXPECT_THROW(ControlVariateAdjuster::adjust(x, Matrix{{1.0}, {2.0}}, {0.0}), DimensionMismatch);
    EXPECT_THROW(ControlVariateAdjuster::adjust(x, Matrix{{1.0}, {2.0}, {3.0, 4.0}}, {0.0}), DimensionMismatch);
    EXPECT_THROW(ControlVariateAdjuster::adjust(x, Matrix{{1.0}, {2.0}, {3.0}}, {0.0, 1.0}), DimensionMismatch);
    EXPECT_THROW(ControlVariateAdjuster::adjust(x, std::vector<double>{1.0, 2.0}, 0.0), DimensionMismatch);

    std::vector<ControlSpec> shortControl = {{"short", {1.0, 2.0}, 0.0}};
    EXPECT_THROW(ControlVariateAdjuster::adjust(x, shortControl), DimensionMismatch);

    EXPECT_THROW(ControlVariateAdjuster::adjust({1.0}, std::vector<double>{1.0}, 0.0), InsufficientSamples);
    EXPECT_THROW(ControlVariateAdjuster::adjust(x, std::vector<double>{1.0, 2.0, 4.0}, 0.0, -1.0), InvalidInput);
}
