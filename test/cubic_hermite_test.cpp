#include <sstream>
#include <stdexcept>

#include <gtest/gtest.h>
#include <Interpolant/cubic_hermite.hpp>
#include <Interpolant/errors.hpp>

using namespace interpolant;

namespace {
SampleSet Squares() { return SampleSet({0.0, 1.0, 2.0, 3.0}, {0.0, 1.0, 4.0, 9.0}); }
SampleSet Irregular() { return SampleSet({0.0, 0.4, 1.3, 2.0, 3.5}, {1.0, -0.5, 2.0, 2.2, 0.3}); }

const DerivativeRule kRules[] = {DerivativeRule::SecantAverage, DerivativeRule::Monotone,
                                 DerivativeRule::NaturalSpline};
}

TEST(HermiteCubicInterpolator, SuppliedDerivativesReproduceCubics) {
  // Exact derivatives of x^2: the Hermite cubic is the parabola itself
  SampleSet samples({0.0, 1.0, 2.0, 3.0}, {0.0, 1.0, 4.0, 9.0}, {0.0, 2.0, 4.0, 6.0});
  HermiteCubicInterpolator interp(samples, DerivativeRule::NaturalSpline);
  EXPECT_TRUE(interp.DerivativesSupplied());
  EXPECT_DOUBLE_EQ(interp.Derivatives()[3], 6.0);
  EXPECT_NEAR(interp(1.5), 2.25, 1e-12);
  EXPECT_NEAR(interp(0.25), 0.0625, 1e-12);
  EXPECT_NEAR(interp.Derivative(2.5), 5.0, 1e-12);

  // The configured rule is reported but was never applied
  EXPECT_EQ(interp.Rule(), DerivativeRule::NaturalSpline);
  HermiteCubicInterpolator secant(samples);
  EXPECT_EQ(secant.Derivatives(), interp.Derivatives());
  std::ostringstream os;
  os << interp;
  EXPECT_NE(os.str().find("derivatives: supplied"), std::string::npos);
}

TEST(HermiteCubicInterpolator, SecantAverageRule) {
  HermiteCubicInterpolator interp(Squares());
  EXPECT_FALSE(interp.DerivativesSupplied());
  EXPECT_EQ(interp.Rule(), DerivativeRule::SecantAverage);
  // Secants are 1, 3, 5
  const auto& d = interp.Derivatives();
  ASSERT_EQ(d.size(), 4);
  EXPECT_DOUBLE_EQ(d[0], 1.0);
  EXPECT_DOUBLE_EQ(d[1], 2.0);
  EXPECT_DOUBLE_EQ(d[2], 4.0);
  EXPECT_DOUBLE_EQ(d[3], 5.0);
  // Interior derivatives are exact for a parabola on a uniform grid
  EXPECT_NEAR(interp(1.5), 2.25, 1e-12);
}

TEST(HermiteCubicInterpolator, EstimationIsDeterministic) {
  for (DerivativeRule rule : kRules) {
    HermiteCubicInterpolator a(Irregular(), rule), b(Irregular(), rule);
    EXPECT_EQ(a.Derivatives(), b.Derivatives()) << rule;
  }
}

TEST(HermiteCubicInterpolator, ReproducesKnots) {
  SampleSet samples = Irregular();
  for (DerivativeRule rule : kRules) {
    HermiteCubicInterpolator interp(samples, rule);
    for (uint64_t i = 0; i < samples.size(); ++i) {
      EXPECT_DOUBLE_EQ(interp(samples.x()[i]), samples.y()[i]) << rule << " knot " << i;
    }
  }
}

TEST(HermiteCubicInterpolator, FirstDerivativeContinuousAtKnots) {
  SampleSet samples = Irregular();
  for (DerivativeRule rule : kRules) {
    HermiteCubicInterpolator interp(samples, rule);
    const auto& d = interp.Derivatives();
    for (uint64_t i = 1; i + 1 < samples.size(); ++i) {
      double knot = samples.x()[i];
      EXPECT_NEAR(interp.EvaluateOnInterval(i - 1, knot), samples.y()[i], 1e-12) << rule;
      EXPECT_NEAR(interp.EvaluateOnInterval(i, knot), samples.y()[i], 1e-12) << rule;
      EXPECT_NEAR(interp.DerivativeOnInterval(i - 1, knot), d[i], 1e-9) << rule << " knot " << i;
      EXPECT_NEAR(interp.DerivativeOnInterval(i, knot), d[i], 1e-9) << rule << " knot " << i;
    }
  }
}

TEST(HermiteCubicInterpolator, MonotoneRulePreservesMonotonicity) {
  SampleSet samples({0.0, 1.0, 2.0, 3.0, 4.0, 5.0}, {0.0, 1.0, 1.5, 10.0, 10.5, 11.0});
  HermiteCubicInterpolator interp(samples, DerivativeRule::Monotone);
  double previous = interp(0.0);
  for (int k = 1; k <= 500; ++k) {
    double current = interp(k * 0.01);
    EXPECT_GE(current, previous - 1e-12) << "at x = " << k * 0.01;
    previous = current;
  }

  // Flat at a local extremum
  HermiteCubicInterpolator peak(SampleSet({0.0, 1.0, 2.0}, {0.0, 1.0, 0.0}), DerivativeRule::Monotone);
  EXPECT_DOUBLE_EQ(peak.Derivatives()[1], 0.0);
  EXPECT_LE(peak(0.5), 1.0);
  EXPECT_LE(peak(1.5), 1.0);
}

TEST(HermiteCubicInterpolator, NaturalSplineReproducesLines) {
  SampleSet line({0.0, 0.5, 2.0, 2.1, 4.0}, {1.0, 2.0, 5.0, 5.2, 9.0});
  HermiteCubicInterpolator interp(line, DerivativeRule::NaturalSpline);
  for (Eigen::Index i = 0; i < interp.Derivatives().size(); ++i) {
    EXPECT_NEAR(interp.Derivatives()[i], 2.0, 1e-12);
  }
  EXPECT_NEAR(interp(1.0), 3.0, 1e-12);
  EXPECT_NEAR(interp(3.3), 7.6, 1e-12);
}

TEST(HermiteCubicInterpolator, NaturalSplineSecondDerivative) {
  SampleSet samples = Irregular();
  HermiteCubicInterpolator interp(samples, DerivativeRule::NaturalSpline);
  const auto& x = samples.x();
  const auto& y = samples.y();
  const auto& d = interp.Derivatives();
  const uint64_t N = samples.size();

  auto secant = [&](uint64_t i) { return (y[i + 1] - y[i]) / (x[i + 1] - x[i]); };
  // Second derivative of piece i at its left and right ends
  auto left_end = [&](uint64_t i) { return (6 * secant(i) - 4 * d[i] - 2 * d[i + 1]) / (x[i + 1] - x[i]); };
  auto right_end = [&](uint64_t i) { return (-6 * secant(i) + 2 * d[i] + 4 * d[i + 1]) / (x[i + 1] - x[i]); };

  EXPECT_NEAR(left_end(0), 0.0, 1e-9);
  EXPECT_NEAR(right_end(N - 2), 0.0, 1e-9);
  for (uint64_t i = 1; i + 1 < N; ++i) {
    EXPECT_NEAR(right_end(i - 1), left_end(i), 1e-9) << "knot " << i;
  }
}

TEST(HermiteCubicInterpolator, TwoPointsGiveTheChord) {
  SampleSet samples({1.0, 3.0}, {2.0, 6.0});
  for (DerivativeRule rule : kRules) {
    HermiteCubicInterpolator interp(samples, rule);
    EXPECT_NEAR(interp.Derivatives()[0], 2.0, 1e-12) << rule;
    EXPECT_NEAR(interp.Derivatives()[1], 2.0, 1e-12) << rule;
    EXPECT_NEAR(interp(2.0), 4.0, 1e-12) << rule;
  }
}

TEST(HermiteCubicInterpolator, OutOfDomainPolicies) {
  HermiteCubicInterpolator strict(Squares());
  EXPECT_THROW(strict(-1.0), OutOfDomain);
  EXPECT_THROW(strict.Derivative(3.5), OutOfDomain);

  HermiteCubicInterpolator clamp(Squares(), DerivativeRule::SecantAverage, OutOfDomainPolicy::Clamp);
  EXPECT_DOUBLE_EQ(clamp(-1.0), 0.0);
  EXPECT_DOUBLE_EQ(clamp(4.0), 9.0);
  EXPECT_DOUBLE_EQ(clamp.Derivative(4.0), 0.0);

  HermiteCubicInterpolator extra(Squares(), DerivativeRule::SecantAverage, OutOfDomainPolicy::Extrapolate);
  EXPECT_DOUBLE_EQ(extra(-1.0), extra.EvaluateOnInterval(0, -1.0));
  EXPECT_DOUBLE_EQ(extra(4.0), extra.EvaluateOnInterval(2, 4.0));
  EXPECT_DOUBLE_EQ(extra.Derivative(4.0), extra.DerivativeOnInterval(2, 4.0));
}

TEST(HermiteCubicInterpolator, RejectsBadSamples) {
  EXPECT_THROW(HermiteCubicInterpolator{SampleSet({1.0}, {1.0})}, InsufficientPoints);
  EXPECT_THROW(HermiteCubicInterpolator{SampleSet({0.0, 1.0, 0.0}, {0.0, 1.0, 2.0})}, DuplicateAbscissa);
  EXPECT_THROW(HermiteCubicInterpolator{SampleSet({0.0, 2.0, 1.0}, {0.0, 1.0, 2.0})}, UnsortedInput);

  HermiteCubicInterpolator interp(Squares());
  EXPECT_THROW(interp.EvaluateOnInterval(3, 1.0), std::out_of_range);
  EXPECT_THROW(interp.DerivativeOnInterval(3, 1.0), std::out_of_range);
}

TEST(HermiteCubicInterpolator, Print) {
  std::ostringstream os;
  os << HermiteCubicInterpolator(Squares(), DerivativeRule::Monotone);
  EXPECT_NE(os.str().find("monotone"), std::string::npos);
}
