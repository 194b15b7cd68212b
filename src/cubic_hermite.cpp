#include <cmath>
#include <stdexcept>

#include <Interpolant/cubic_hermite.hpp>
#include <Interpolant/domain.hpp>
#include <Interpolant/errors.hpp>
#include <Interpolant/utils.hpp>

namespace interpolant {

const char* ToString(DerivativeRule rule) {
  switch (rule) {
    case DerivativeRule::SecantAverage: return "secant average";
    case DerivativeRule::Monotone: return "monotone";
    case DerivativeRule::NaturalSpline: return "natural spline";
  }
  throw std::out_of_range("Unknown derivative rule");
}

HermiteCubicInterpolator::HermiteCubicInterpolator(const SampleSet& s, DerivativeRule r, OutOfDomainPolicy p)
: samples(s), rule(r), policy(p) {
  RequirePiecewise(samples, "HermiteCubicInterpolator");

  if (samples.HasDerivatives()) {
    deriv = samples.dy();
  } else {
    EstimateDerivatives();
  }
}

void HermiteCubicInterpolator::EstimateDerivatives() {
  const auto& x = samples.x();
  const auto& y = samples.y();
  const uint64_t N = samples.size();

  // Interval widths and secant slopes
  Eigen::VectorXd h = x.tail(N - 1) - x.head(N - 1);
  Eigen::VectorXd s = (y.tail(N - 1) - y.head(N - 1)).cwiseQuotient(h);

  deriv.resize(N);
  switch (rule) {
    case DerivativeRule::SecantAverage: EstimateSecantAverage(s); break;
    case DerivativeRule::Monotone: EstimateMonotone(h, s); break;
    case DerivativeRule::NaturalSpline: SolveNaturalSpline(h, s); break;
  }
}

void HermiteCubicInterpolator::EstimateSecantAverage(const Eigen::VectorXd& s) {
  const uint64_t n = s.size();
  deriv[0] = s[0];
  deriv[n] = s[n - 1];
  for (uint64_t i = 1; i < n; ++i) {
    deriv[i] = 0.5 * (s[i - 1] + s[i]);
  }
}

void HermiteCubicInterpolator::EstimateMonotone(const Eigen::VectorXd& h, const Eigen::VectorXd& s) {
  const uint64_t n = s.size();
  deriv[0] = s[0];
  deriv[n] = s[n - 1];
  for (uint64_t i = 1; i < n; ++i) {
    // Flat at local extrema and where either neighbouring secant is flat
    if (s[i - 1] * s[i] <= 0.0) {
      deriv[i] = 0.0;
      continue;
    }
    double w1 = 2 * h[i] + h[i - 1];
    double w2 = h[i] + 2 * h[i - 1];
    deriv[i] = (w1 + w2) / (w1 / s[i - 1] + w2 / s[i]);
  }
}

void HermiteCubicInterpolator::SolveNaturalSpline(const Eigen::VectorXd& h, const Eigen::VectorXd& s) {
  const uint64_t N = h.size() + 1;

  // Continuity of the second derivative gives the tridiagonal system A d = b:
  //   h_i d_{i-1} + 2 (h_{i-1} + h_i) d_i + h_{i-1} d_{i+1} = 3 (h_i s_{i-1} + h_{i-1} s_i)
  // closed by d''(x_0) = d''(x_{N-1}) = 0.
  Eigen::VectorXd upper(N - 1), middle(N), lower(N - 1), b(N);

  middle[0] = 2;
  upper[0] = 1;
  b[0] = 3 * s[0];
  for (uint64_t i = 1; i < N - 1; ++i) {
    lower[i - 1] = h[i];
    middle[i] = 2 * (h[i - 1] + h[i]);
    upper[i] = h[i - 1];
    b[i] = 3 * (h[i] * s[i - 1] + h[i - 1] * s[i]);
  }
  lower[N - 2] = 1;
  middle[N - 1] = 2;
  b[N - 1] = 3 * s[N - 2];

  // Thomas algorithm, forward sweep
  upper[0] /= middle[0];
  b[0] /= middle[0];
  for (uint64_t i = 1; i < N; ++i) {
    double tmp = 1 / std::fma(-upper[i - 1], lower[i - 1], middle[i]);
    if (i < N - 1) { upper[i] *= tmp; }
    b[i] = (b[i] - b[i - 1] * lower[i - 1]) * tmp;
  }

  // Back substitution
  deriv[N - 1] = b[N - 1];
  for (uint64_t i = N - 1; i-- > 0;) {
    deriv[i] = std::fma(-upper[i], deriv[i + 1], b[i]);
  }
}

void HermiteCubicInterpolator::CheckInterval(uint64_t idx) const {
  if (idx + 1 >= samples.size()) { throw std::out_of_range("Requested interval index out of range"); }
}

double HermiteCubicInterpolator::EvaluateOnInterval(uint64_t i, double v) const {
  CheckInterval(i);
  const auto& x = samples.x();
  const auto& y = samples.y();

  double h = x[i + 1] - x[i];
  double t = (v - x[i]) / h;
  double t2 = pow_n<2>(t);
  double t3 = pow_n<3>(t);

  double h00 = 2 * t3 - 3 * t2 + 1;
  double h10 = t3 - 2 * t2 + t;
  double h01 = -2 * t3 + 3 * t2;
  double h11 = t3 - t2;

  return h00 * y[i] + h10 * h * deriv[i] + h01 * y[i + 1] + h11 * h * deriv[i + 1];
}

double HermiteCubicInterpolator::DerivativeOnInterval(uint64_t i, double v) const {
  CheckInterval(i);
  const auto& x = samples.x();
  const auto& y = samples.y();

  double h = x[i + 1] - x[i];
  double t = (v - x[i]) / h;
  double t2 = pow_n<2>(t);

  // d/dx = (1 / h) d/dt applied to the basis above
  double d00 = 6 * t2 - 6 * t;
  double d10 = 3 * t2 - 4 * t + 1;
  double d01 = -6 * t2 + 6 * t;
  double d11 = 3 * t2 - 2 * t;

  return (d00 * y[i] + d01 * y[i + 1]) / h + d10 * deriv[i] + d11 * deriv[i + 1];
}

double HermiteCubicInterpolator::Evaluate(double v) const {
  RequirePoints(samples, 2, "HermiteCubicInterpolator");
  const auto& x = samples.x();
  const auto& y = samples.y();
  const uint64_t last = samples.size() - 1;

  if (v < x[0] || v > x[last]) {
    switch (policy) {
      case OutOfDomainPolicy::Throw: throw OutOfDomain(v, x[0], x[last]);
      case OutOfDomainPolicy::Clamp: return v < x[0] ? y[0] : y[last];
      case OutOfDomainPolicy::Extrapolate: break;
    }
  }
  return EvaluateOnInterval(FindInterval(x, v), v);
}

double HermiteCubicInterpolator::Derivative(double v) const {
  RequirePoints(samples, 2, "HermiteCubicInterpolator");
  const auto& x = samples.x();
  const uint64_t last = samples.size() - 1;

  if (v < x[0] || v > x[last]) {
    switch (policy) {
      case OutOfDomainPolicy::Throw: throw OutOfDomain(v, x[0], x[last]);
      case OutOfDomainPolicy::Clamp: return 0.0;
      case OutOfDomainPolicy::Extrapolate: break;
    }
  }
  return DerivativeOnInterval(FindInterval(x, v), v);
}

void HermiteCubicInterpolator::Print(std::ostream& os) const {
  os << "HermiteCubicInterpolator over " << samples.size() << " knots, derivatives: "
     << (DerivativesSupplied() ? "supplied" : ToString(rule))
     << ", out of domain: " << policy << '\n';
}

}
