#include <gtest/gtest.h>
#include <mcvr/pricers/BasketPricer.h>
#include <mcvr/pricers/BlackScholesFormulas.h>
#include <mcvr/montecarlo/MonteCarlo.h>
#include <mcvr/montecarlo/Sampler.h>
#include <mcvr/utils/Errors.h>
#include <algorithm>
#include <cmath>
#include <iostream>
#include <vector>

namespace {
    BasketMCParams referenceParams()
    {
        BasketMCParams p;
        p.spots = {100.0, 95.0, 105.0};
        p.weights = {0.5, 0.3, 0.2};
        p.volatilities = {0.2, 0.25, 0.18};
        p.correlation = {{1.0, 0.3, 0.2},
                         {0.3, 1.0, 0.25},
                         {0.2, 0.25, 1.0}};
        p.strike = 100.0;
        p.rate = 0.02;
        p.maturity = 1.0;
        p.numPaths = 30000;
        p.seed = 321;
        p.method = SamplingMethod::Plain;
        p.antithetic = true;
        p.useControlVariate = true;
        return p;
    }
}

TEST(BasketPricerTest, ControlVariateShrinksStandardDeviation) {
    MCPricingResult res = BasketPricer::priceCall(referenceParams());

    ASSERT_TRUE(res.controlVariate.has_value());
    const ControlVariateReport& cv = *res.controlVariate;
    ASSERT_EQ(cv.controls.size(), 2u);
    EXPECT_EQ(cv.controls[0], "geom_basket_call");
    EXPECT_EQ(cv.controls[1], "disc_linear_basket");
    EXPECT_EQ(res.baseline.n, 30000u);

    std::cout << "baseline " << res.baseline.mean << " +/- " << res.baseline.se
              << ", adjusted " << cv.adjusted.mean << " +/- " << cv.adjusted.se
              << ", vr " << cv.varianceReductionFactor << std::endl;

    EXPECT_LT(cv.adjusted.sd, 0.9 * res.baseline.sd);
    EXPECT_NEAR(cv.adjusted.mean, res.baseline.mean, 3.0 * res.baseline.se);
    EXPECT_GT(cv.adjusted.mean, 0.0);
}

TEST(BasketPricerTest, SingleAssetGeometricIsBlackScholes) {
    const double geo = BasketPricer::geometricCallClosedForm({100.0}, {1.0}, 110.0, 0.03, 2.0, {0.25}, {{1.0}});
    const double bs = BlackScholesFormulas::callPrice(100.0, 110.0, 0.03, 0.25, 2.0);
    EXPECT_NEAR(geo, bs, 1e-12);
}

TEST(BasketPricerTest, GeometricClosedFormMatchesSimulatedGeometricBasket) {
    // pins the log-mean sum w_i (log S0_i + (r - vol_i^2/2) T) against the simulated geometric basket
    const BasketMCParams p = referenceParams();
    const double T = p.maturity;
    const double df = std::exp(-p.rate * T);

    SamplingConfig cfg;
    cfg.method = SamplingMethod::Plain;
    cfg.antithetic = false;
    cfg.seed = 2718;
    const Matrix Z = NormalSampler::generateCorrelatedNormals(400000, p.correlation, cfg);

    std::vector<double> geoPayoffs(Z.size());
    for (size_t k = 0; k < Z.size(); ++k) {
        double logG = 0.0;
        for (size_t i = 0; i < p.spots.size(); ++i) {
            const double vol = p.volatilities[i];
            logG += p.weights[i] * (std::log(p.spots[i]) + (p.rate - 0.5 * vol * vol) * T + vol * std::sqrt(T) * Z[k][i]);
        }
        geoPayoffs[k] = df * std::max(std::exp(logG) - p.strike, 0.0);
    }
    const EstimateStatistics mc = EstimateStatistics::compute(geoPayoffs);
    const double cf = BasketPricer::geometricCallClosedForm(p.spots, p.weights, p.strike, p.rate, T,
                                                            p.volatilities, p.correlation);

    std::cout << "geometric basket: MC " << mc.mean << " +/- " << mc.se << ", closed form " << cf << std::endl;
    EXPECT_NEAR(cf, mc.mean, 4.0 * mc.se);
    EXPECT_LT(mc.se, 0.03);
}

TEST(BasketPricerTest, ZeroVolatilityGeometricIsDiscountedIntrinsic) {
    const double geo = BasketPricer::geometricCallClosedForm({100.0, 100.0}, {0.5, 0.5}, 90.0, 0.05, 1.0,
                                                             {0.0, 0.0}, {{1.0, 0.0}, {0.0, 1.0}});
    // G_T = 100 e^{rT}
    EXPECT_NEAR(geo, std::exp(-0.05) * (100.0 * std::exp(0.05) - 90.0), 1e-10);
}

TEST(BasketPricerTest, SameInputsSameOutput) {
    MCPricingResult a = BasketPricer::priceCall(referenceParams());
    MCPricingResult b = BasketPricer::priceCall(referenceParams());
    EXPECT_EQ(a.baseline.mean, b.baseline.mean);
    EXPECT_EQ(a.controlVariate->beta, b.controlVariate->beta);

    BasketMCParams other = referenceParams();
    other.seed = 322;
    MCPricingResult c = BasketPricer::priceCall(other);
    EXPECT_NE(a.baseline.mean, c.baseline.mean);
}

TEST(BasketPricerTest, LegacyLatinHypercubeFlagSelectsLhs) {
    EXPECT_EQ(normalizeSamplingSelection(SamplingMethod::Sobol, true), SamplingMethod::LatinHypercube);
    EXPECT_EQ(normalizeSamplingSelection(SamplingMethod::Halton, false), SamplingMethod::Halton);

    BasketMCParams legacy = referenceParams();
    legacy.numPaths = 5000;
    legacy.method = SamplingMethod::Sobol;
    legacy.latinHypercube = true;
    MCPricingResult viaFlag = BasketPricer::priceCall(legacy);

    BasketMCParams explicitLhs = legacy;
    explicitLhs.method = SamplingMethod::LatinHypercube;
    explicitLhs.latinHypercube = false;
    MCPricingResult viaMethod = BasketPricer::priceCall(explicitLhs);

    EXPECT_EQ(viaFlag.method, SamplingMethod::LatinHypercube);
    EXPECT_FALSE(viaFlag.qmcScramble.has_value());
    EXPECT_EQ(viaFlag.baseline.mean, viaMethod.baseline.mean);
}

TEST(BasketPricerTest, SobolRecordsScramble) {
    BasketMCParams p = referenceParams();
    p.numPaths = 4096;
    p.antithetic = false;
    p.method = SamplingMethod::Sobol;
    MCPricingResult res = BasketPricer::priceCall(p);
    ASSERT_TRUE(res.qmcScramble.has_value());
    EXPECT_TRUE(*res.qmcScramble);

    MCPricingResult ref = BasketPricer::priceCall(referenceParams());
    EXPECT_NEAR(res.controlVariate->adjusted.mean, ref.controlVariate->adjusted.mean,
                4.0 * ref.controlVariate->adjusted.se + 0.02);
}

TEST(BasketPricerTest, ShapeErrorsComeFirst) {
    BasketMCParams p = referenceParams();
    p.volatilities = {0.2, 0.25};
    p.numPaths = 10;   // would also be rejected, but the shape check runs first
    EXPECT_THROW(BasketPricer::priceCall(p), DimensionMismatch);

    p = referenceParams();
    p.weights = {1.0};
    EXPECT_THROW(BasketPricer::priceCall(p), DimensionMismatch);

    p = referenceParams();
    p.correlation = {{1.0, 0.3}, {0.3, 1.0}, {0.2, 0.25}};
    EXPECT_THROW(BasketPricer::priceCall(p), DimensionMismatch);

    p = referenceParams();
    p.spots.clear();
    p.weights.clear();
    p.volatilities.clear();
    p.correlation.clear();
    EXPECT_THROW(BasketPricer::priceCall(p), DimensionMismatch);
}

TEST(BasketPricerTest, InvalidInputs) {
    BasketMCParams p = referenceParams();
    p.numPaths = 999;
    EXPECT_THROW(BasketPricer::priceCall(p), InvalidInput);

    p = referenceParams();
    p.maturity = -1.0;
    EXPECT_THROW(BasketPricer::priceCall(p), InvalidInput);

    p = referenceParams();
    p.spots[1] = 0.0;
    EXPECT_THROW(BasketPricer::priceCall(p), InvalidInput);

    p = referenceParams();
    p.correlation = {{1.0, 0.99, 0.99}, {0.99, 1.0, -0.99}, {0.99, -0.99, 1.0}};
    EXPECT_THROW(BasketPricer::priceCall(p), NotPositiveDefinite);
}
