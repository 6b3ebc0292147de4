#include <gtest/gtest.h>
#include <mcvr/montecarlo/MonteCarlo.h>
#include <mcvr/montecarlo/VarianceReduction.h>
#include <mcvr/utils/Errors.h>
#include <cmath>
#include <limits>
#include <vector>

namespace {
    const double Z975 = 1.959963984540054;   // Φ^(-1)(0.975)
}

TEST(EstimateStatisticsTest, MeanSdSeAndInterval) {
    std::vector<double> x = {1.0, 2.0, 3.0, 4.0, 5.0};
    EstimateStatistics s = EstimateStatistics::compute(x);

    EXPECT_EQ(s.n, 5u);
    EXPECT_NEAR(s.mean, 3.0, 1e-14);
    EXPECT_NEAR(s.sd, std::sqrt(2.5), 1e-14);
    EXPECT_NEAR(s.se, std::sqrt(2.5) / std::sqrt(5.0), 1e-14);
    EXPECT_DOUBLE_EQ(s.alpha, 0.05);
    EXPECT_NEAR(s.ciLow, 3.0 - Z975 * s.se, 1e-12);
    EXPECT_NEAR(s.ciHigh, 3.0 + Z975 * s.se, 1e-12);
}

TEST(EstimateStatisticsTest, NarrowerIntervalForLargerAlpha) {
    std::vector<double> x = {0.3, -1.2, 2.5, 0.7, 1.1, -0.4};
    EstimateStatistics s95 = EstimateStatistics::compute(x, 0.05);
    EstimateStatistics s80 = EstimateStatistics::compute(x, 0.20);
    EXPECT_DOUBLE_EQ(s95.mean, s80.mean);
    EXPECT_LT(s80.ciHigh - s80.ciLow, s95.ciHigh - s95.ciLow);
}

TEST(EstimateStatisticsTest, ConstantSampleHasZeroWidth) {
    std::vector<double> x(10, 4.2);
    EstimateStatistics s = EstimateStatistics::compute(x);
    EXPECT_NEAR(s.sd, 0.0, 1e-12);
    EXPECT_NEAR(s.ciLow, s.ciHigh, 1e-12);
}

TEST(EstimateStatisticsTest, Errors) {
    EXPECT_THROW(EstimateStatistics::compute({1.0}), InsufficientSamples);
    EXPECT_THROW(EstimateStatistics::compute({}), InsufficientSamples);
    // InsufficientSamples is an InvalidInput
    EXPECT_THROW(EstimateStatistics::compute({1.0}), InvalidInput);
    EXPECT_THROW(EstimateStatistics::compute({1.0, 2.0}, 0.0), InvalidInput);
    EXPECT_THROW(EstimateStatistics::compute({1.0, 2.0}, 1.0), InvalidInput);
}

TEST(VRDiagnosticsTest, FactorIsRatioOfSds) {
    std::vector<double> baseline = {1.0, 3.0, 5.0, 7.0};
    std::vector<double> adjusted = {3.0, 4.0, 4.0, 5.0};
    VRDiagnostics d = summarizeVarianceReduction("demo", baseline, adjusted, std::vector<double>{0.5});

    EXPECT_EQ(d.label, "demo");
    ASSERT_TRUE(d.adjusted.has_value());
    ASSERT_TRUE(d.varianceReductionFactor.has_value());
    ASSERT_TRUE(d.beta.has_value());
    EXPECT_NEAR(*d.varianceReductionFactor, d.baseline.sd / d.adjusted->sd, 1e-14);
    EXPECT_DOUBLE_EQ((*d.beta)[0], 0.5);
}

TEST(VRDiagnosticsTest, BaselineOnlyAndZeroAdjustedSd) {
    std::vector<double> baseline = {1.0, 2.0, 4.0};
    VRDiagnostics only = summarizeVarianceReduction("plain", baseline);
    EXPECT_FALSE(only.adjusted.has_value());
    EXPECT_FALSE(only.varianceReductionFactor.has_value());

    VRDiagnostics perfect = summarizeVarianceReduction("perfect", baseline, std::vector<double>{2.0, 2.0, 2.0});
    ASSERT_TRUE(perfect.varianceReductionFactor.has_value());
    EXPECT_EQ(*perfect.varianceReductionFactor, std::numeric_limits<double>::infinity());
}
