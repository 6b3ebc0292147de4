#include <gtest/gtest.h>
#include <mcvr/pricers/AsianPricer.h>
#include <mcvr/pricers/BlackScholesFormulas.h>
#include <mcvr/montecarlo/MonteCarlo.h>
#include <mcvr/montecarlo/Sampler.h>
#include <mcvr/utils/Errors.h>
#include <algorithm>
#include <cmath>
#include <iostream>
#include <vector>

namespace {
    AsianMCParams referenceParams()
    {
        AsianMCParams p;
        p.spot = 100.0;
        p.strike = 100.0;
        p.rate = 0.03;
        p.maturity = 1.0;
        p.volatility = 0.2;
        p.numObservations = 50;
        p.numPaths = 20000;
        p.seed = 123;
        p.method = SamplingMethod::Plain;
        p.antithetic = true;
        p.useControlVariate = true;
        return p;
    }
}

TEST(AsianPricerTest, GeometricClosedFormWithOneFixingIsBlackScholes) {
    const double geo = AsianPricer::geometricCallClosedForm(100.0, 95.0, 0.04, 0.75, 0.3, 1);
    const double bs = BlackScholesFormulas::callPrice(100.0, 95.0, 0.04, 0.3, 0.75);
    EXPECT_NEAR(geo, bs, 1e-12);
}

TEST(AsianPricerTest, GeometricClosedFormMatchesSimulatedGeometricAverage) {
    const AsianMCParams p = referenceParams();
    const size_t nObs = static_cast<size_t>(p.numObservations);
    const double dt = p.maturity / static_cast<double>(nObs);
    const double drift = (p.rate - 0.5 * p.volatility * p.volatility) * dt;
    const double diffusion = p.volatility * std::sqrt(dt);
    const double df = std::exp(-p.rate * p.maturity);

    // 4 x 60000 paths, one seed per batch to keep the normal matrix small
    std::vector<double> geoPayoffs;
    for (uint64_t batch = 0; batch < 4; ++batch) {
        SamplingConfig cfg;
        cfg.method = SamplingMethod::Plain;
        cfg.antithetic = false;
        cfg.seed = 1000 + batch;
        const Matrix Z = NormalSampler::generateNormals(60000, nObs, cfg);
        for (const auto& row : Z) {
            double logS = std::log(p.spot);
            double sumLogS = 0.0;
            for (size_t j = 0; j < nObs; ++j) {
                logS += drift + diffusion * row[j];
                sumLogS += logS;
            }
            const double G = std::exp(sumLogS / static_cast<double>(nObs));
            geoPayoffs.push_back(df * std::max(G - p.strike, 0.0));
        }
    }
    const EstimateStatistics mc = EstimateStatistics::compute(geoPayoffs);
    const double cf = AsianPricer::geometricCallClosedForm(p.spot, p.strike, p.rate, p.maturity,
                                                           p.volatility, p.numObservations);

    std::cout << "geometric Asian: MC " << mc.mean << " +/- " << mc.se << ", closed form " << cf << std::endl;
    EXPECT_EQ(mc.n, 240000u);
    EXPECT_NEAR(cf, mc.mean, 4.0 * mc.se);
}

TEST(AsianPricerTest, GeometricClosedFormDecreasesWithMoreFixings) {
    // averaging lowers the effective variance
    const double g1 = AsianPricer::geometricCallClosedForm(100.0, 100.0, 0.0, 1.0, 0.2, 1);
    const double g12 = AsianPricer::geometricCallClosedForm(100.0, 100.0, 0.0, 1.0, 0.2, 12);
    const double g250 = AsianPricer::geometricCallClosedForm(100.0, 100.0, 0.0, 1.0, 0.2, 250);
    EXPECT_GT(g1, g12);
    EXPECT_GT(g12, g250);
    EXPECT_GT(g250, 0.0);
}

TEST(AsianPricerTest, ControlVariateShrinksStandardDeviation) {
    MCPricingResult res = AsianPricer::priceArithmeticCall(referenceParams());

    EXPECT_EQ(res.method, SamplingMethod::Plain);
    EXPECT_TRUE(res.antithetic);
    EXPECT_FALSE(res.qmcScramble.has_value());
    EXPECT_EQ(res.baseline.n, 20000u);

    ASSERT_TRUE(res.controlVariate.has_value());
    const ControlVariateReport& cv = *res.controlVariate;
    ASSERT_EQ(cv.controls.size(), 2u);
    EXPECT_EQ(cv.controls[0], "geom_asian_call");
    EXPECT_EQ(cv.controls[1], "disc_terminal_S");
    ASSERT_EQ(cv.beta.size(), 2u);

    std::cout << "baseline " << res.baseline.mean << " +/- " << res.baseline.se
              << ", adjusted " << cv.adjusted.mean << " +/- " << cv.adjusted.se
              << ", vr " << cv.varianceReductionFactor << std::endl;

    EXPECT_LT(cv.adjusted.sd, 0.85 * res.baseline.sd);
    EXPECT_GT(cv.varianceReductionFactor, 1.0 / 0.85);
    EXPECT_NEAR(cv.adjusted.mean, res.baseline.mean, 3.0 * res.baseline.se);
    EXPECT_LE(cv.adjusted.ciLow, cv.adjusted.mean);
    EXPECT_GE(cv.adjusted.ciHigh, cv.adjusted.mean);

    // arithmetic average dominates the geometric one
    const double geo = AsianPricer::geometricCallClosedForm(100.0, 100.0, 0.03, 1.0, 0.2, 50);
    EXPECT_GT(cv.adjusted.mean, geo);
    EXPECT_LT(cv.adjusted.mean, geo + 1.0);
}

TEST(AsianPricerTest, SameInputsSameOutput) {
    MCPricingResult a = AsianPricer::priceArithmeticCall(referenceParams());
    MCPricingResult b = AsianPricer::priceArithmeticCall(referenceParams());
    EXPECT_EQ(a.baseline.mean, b.baseline.mean);
    EXPECT_EQ(a.controlVariate->adjusted.mean, b.controlVariate->adjusted.mean);
    EXPECT_EQ(a.controlVariate->beta, b.controlVariate->beta);
}

TEST(AsianPricerTest, ControlVariateOffAndSingleControl) {
    AsianMCParams p = referenceParams();
    p.useControlVariate = false;
    MCPricingResult off = AsianPricer::priceArithmeticCall(p);
    EXPECT_FALSE(off.controlVariate.has_value());

    p.useControlVariate = true;
    p.useExtraControl = false;
    MCPricingResult single = AsianPricer::priceArithmeticCall(p);
    ASSERT_TRUE(single.controlVariate.has_value());
    EXPECT_EQ(single.controlVariate->controls.size(), 1u);
    EXPECT_EQ(single.controlVariate->beta.size(), 1u);

    // baseline payoffs do not depend on the control settings
    EXPECT_EQ(off.baseline.mean, single.baseline.mean);
}

TEST(AsianPricerTest, QuasiMonteCarloRecordsScrambleAndAgrees) {
    AsianMCParams p = referenceParams();
    p.numObservations = 12;
    p.numPaths = 4096;
    p.antithetic = false;

    MCPricingResult plain = AsianPricer::priceArithmeticCall(p);

    for (SamplingMethod m : {SamplingMethod::Sobol, SamplingMethod::Halton}) {
        p.method = m;
        p.qmcScramble = false;
        MCPricingResult res = AsianPricer::priceArithmeticCall(p);
        ASSERT_TRUE(res.qmcScramble.has_value());
        EXPECT_FALSE(*res.qmcScramble);
        EXPECT_EQ(res.method, m);

        p.qmcScramble = true;
        MCPricingResult scrambled = AsianPricer::priceArithmeticCall(p);
        ASSERT_TRUE(scrambled.qmcScramble.has_value());
        EXPECT_TRUE(*scrambled.qmcScramble);

        EXPECT_NEAR(scrambled.controlVariate->adjusted.mean, plain.controlVariate->adjusted.mean,
                    4.0 * plain.controlVariate->adjusted.se + 0.02);
    }
}

TEST(AsianPricerTest, OddPathCountWithAntitheticRoundsUp) {
    AsianMCParams p = referenceParams();
    p.numPaths = 1001;
    p.numObservations = 4;
    MCPricingResult res = AsianPricer::priceArithmeticCall(p);
    EXPECT_EQ(res.baseline.n, 1002u);
}

TEST(AsianPricerTest, InvalidInputs) {
    AsianMCParams p = referenceParams();
    p.numObservations = 0;
    EXPECT_THROW(AsianPricer::priceArithmeticCall(p), InvalidInput);

    p = referenceParams();
    p.numPaths = 999;
    EXPECT_THROW(AsianPricer::priceArithmeticCall(p), InvalidInput);

    p = referenceParams();
    p.maturity = 0.0;
    EXPECT_THROW(AsianPricer::priceArithmeticCall(p), InvalidInput);

    p = referenceParams();
    p.volatility = -0.1;
    EXPECT_THROW(AsianPricer::priceArithmeticCall(p), InvalidInput);

    p = referenceParams();
    p.spot = 0.0;
    EXPECT_THROW(AsianPricer::priceArithmeticCall(p), InvalidInput);

    p = referenceParams();
    p.alpha = 1.5;
    EXPECT_THROW(AsianPricer::priceArithmeticCall(p), InvalidInput);

    EXPECT_THROW(AsianPricer::geometricCallClosedForm(100.0, 100.0, 0.0, 1.0, 0.2, 0), InvalidInput);
    EXPECT_THROW(AsianPricer::geometricCallClosedForm(100.0, 100.0, 0.0, 1.0, 0.0, 12), InvalidInput);
}
