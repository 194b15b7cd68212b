#include <cmath>
#include <utility>

#include <Interpolant/domain.hpp>
#include <Interpolant/errors.hpp>
#include <Interpolant/newton.hpp>

namespace interpolant {

NewtonInterpolator::NewtonInterpolator(const SampleSet& s) : samples(s.WithoutDerivatives()) {
  RequirePoints(samples, 1, "NewtonInterpolator");
  RequireDistinct(samples);

  // Build the table row by row; only the coefficients and the latest row are kept.
  coef.resize(0);
  divided_diff.resize(0);
  for (uint64_t i = 0; i < samples.size(); ++i) {
    AppendRow(i);
  }
}

void NewtonInterpolator::AppendRow(uint64_t i) {
  const auto& x = samples.x();
  const auto& y = samples.y();

  // new_row[0] = f[x_i], new_row[j+1] = f[x_{i-1-j}, ..., x_i]
  Eigen::VectorXd new_row(i + 1);
  new_row[0] = y[i];
  for (uint64_t j = 0; j < i; ++j) {
    new_row[j + 1] = (divided_diff[j] - new_row[j]) / (x[i - 1 - j] - x[i]);
  }

  divided_diff = std::move(new_row);
  coef.conservativeResize(i + 1);
  coef[i] = divided_diff[i];
}

bool NewtonInterpolator::SameTable(const Eigen::VectorXd& stored, const Eigen::VectorXd& rebuilt) {
  if (stored.size() != rebuilt.size()) { return false; }
  for (Eigen::Index i = 0; i < stored.size(); ++i) {
    if (!(std::abs(stored[i] - rebuilt[i]) <= 1e-9 * (1.0 + std::abs(rebuilt[i])))) { return false; }
  }
  return true;
}

NewtonInterpolator NewtonInterpolator::Extend(const SamplePoint& point) const {
  const auto& x = samples.x();
  for (Eigen::Index i = 0; i < x.size(); ++i) {
    if (x[i] == point.x) { throw DuplicateAbscissa(point.x); }
  }

  NewtonInterpolator result(*this);
  result.samples = samples.Appended(SamplePoint(point.x, point.y));
  result.AppendRow(samples.size());
  return result;
}

double NewtonInterpolator::Evaluate(double v) const {
  RequirePoints(samples, 1, "NewtonInterpolator");
  const auto& x = samples.x();
  const uint64_t N = samples.size();
  double y = coef[N - 1];
  for (uint64_t i = N - 1; i-- > 0;) {
    y = y * (v - x[i]) + coef[i];
  }
  return y;
}

double NewtonInterpolator::Derivative(double v) const {
  RequirePoints(samples, 1, "NewtonInterpolator");
  const auto& x = samples.x();
  const uint64_t N = samples.size();
  double p = coef[N - 1];
  double dp = 0.0;
  for (uint64_t i = N - 1; i-- > 0;) {
    dp = dp * (v - x[i]) + p;
    p = p * (v - x[i]) + coef[i];
  }
  return dp;
}

void NewtonInterpolator::Print(std::ostream& os) const {
  os << "NewtonInterpolator of degree " << Degree() << " over " << samples.size() << " nodes\n";
  os << "coefficients: " << coef.transpose() << '\n';
}

}
