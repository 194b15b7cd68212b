#include <stdexcept>

#include <Interpolant/domain.hpp>
#include <Interpolant/errors.hpp>
#include <Interpolant/lagrange.hpp>

namespace interpolant {

LagrangeInterpolator::LagrangeInterpolator(const SampleSet& s) : samples(s.WithoutDerivatives()) {
  RequirePoints(samples, 1, "LagrangeInterpolator");
  RequireDistinct(samples);

  const auto& x = samples.x();
  const uint64_t N = samples.size();
  weights.resize(N);
  for (uint64_t i = 0; i < N; ++i) {
    double prod = 1.0;
    for (uint64_t j = 0; j < N; ++j) {
      if (j != i) { prod *= x[i] - x[j]; }
    }
    weights[i] = 1.0 / prod;
  }
}

double LagrangeInterpolator::Basis(uint64_t i, double v) const {
  if (i >= samples.size()) { throw std::out_of_range("Requested basis index out of range"); }
  const auto& x = samples.x();
  double L = 1.0;
  for (uint64_t j = 0; j < samples.size(); ++j) {
    if (j != i) { L *= (v - x[j]) / (x[i] - x[j]); }
  }
  return L;
}

double LagrangeInterpolator::Evaluate(double v) const {
  RequirePoints(samples, 1, "LagrangeInterpolator");
  const auto& y = samples.y();
  double sum = 0.0;
  for (uint64_t i = 0; i < samples.size(); ++i) {
    sum += y[i] * Basis(i, v);
  }
  return sum;
}

double LagrangeInterpolator::EvaluateBarycentric(double v) const {
  RequirePoints(samples, 1, "LagrangeInterpolator");
  const auto& x = samples.x();
  const auto& y = samples.y();

  // l(x) * sum_i w_i y_i / (x - x_i), with l(x) = prod_i (x - x_i)
  double l = 1.0;
  double sum = 0.0;
  for (uint64_t i = 0; i < samples.size(); ++i) {
    double dx = v - x[i];
    if (dx == 0.0) { return y[i]; }
    l *= dx;
    sum += weights[i] * y[i] / dx;
  }
  return l * sum;
}

LagrangeInterpolator LagrangeInterpolator::Extend(const SamplePoint& point) const {
  const auto& x = samples.x();
  const uint64_t N = samples.size();
  for (uint64_t i = 0; i < N; ++i) {
    if (x[i] == point.x) { throw DuplicateAbscissa(point.x); }
  }

  // w_i -> w_i / (x_i - x_new), and the new node gets 1 / prod_j (x_new - x_j)
  LagrangeInterpolator result(*this);
  result.weights.conservativeResize(N + 1);
  double prod = 1.0;
  for (uint64_t i = 0; i < N; ++i) {
    result.weights[i] /= x[i] - point.x;
    prod *= point.x - x[i];
  }
  result.weights[N] = 1.0 / prod;
  result.samples = samples.Appended(SamplePoint(point.x, point.y));
  return result;
}

LagrangeInterpolator LagrangeInterpolator::Without(uint64_t idx) const {
  if (idx >= samples.size()) { throw std::out_of_range("Requested sample index out of range"); }
  if (samples.size() == 1) { throw InsufficientPoints("LagrangeInterpolator", 1, 0); }

  const auto& x = samples.x();
  const uint64_t N = samples.size();

  // w_i -> w_i * (x_i - x_removed)
  LagrangeInterpolator result;
  result.samples = samples.Without(idx);
  result.weights.resize(N - 1);
  for (uint64_t i = 0, k = 0; i < N; ++i) {
    if (i == idx) { continue; }
    result.weights[k++] = weights[i] * (x[i] - x[idx]);
  }
  return result;
}

LagrangeInterpolator LagrangeInterpolator::Replace(uint64_t idx, const SamplePoint& point) const {
  if (idx >= samples.size()) { throw std::out_of_range("Requested sample index out of range"); }
  const auto& x = samples.x();
  const uint64_t N = samples.size();
  for (uint64_t i = 0; i < N; ++i) {
    if (i != idx && x[i] == point.x) { throw DuplicateAbscissa(point.x); }
  }

  LagrangeInterpolator result(*this);
  double prod = 1.0;
  for (uint64_t i = 0; i < N; ++i) {
    if (i == idx) { continue; }
    result.weights[i] *= (x[i] - x[idx]) / (x[i] - point.x);
    prod *= point.x - x[i];
  }
  result.weights[idx] = 1.0 / prod;
  result.samples = samples.Replaced(idx, SamplePoint(point.x, point.y));
  return result;
}

void LagrangeInterpolator::Print(std::ostream& os) const {
  os << "LagrangeInterpolator of degree " << Degree() << " over " << samples.size() << " nodes\n";
}

}
