#include <stdexcept>

#include <Interpolant/interpolator.hpp>

namespace interpolant {

const char* Name(Method method) {
  switch (method) {
    case Method::Linear: return "linear";
    case Method::HermiteCubic: return "hermite cubic";
    case Method::Lagrange: return "lagrange";
    case Method::Newton: return "newton";
  }
  throw std::out_of_range("Unknown interpolation method");
}

Interpolator Fit(Method method, const SampleSet& samples, const FitOptions& options) {
  switch (method) {
    case Method::Linear: return LinearInterpolator(samples, options.domain_policy);
    case Method::HermiteCubic:
      return HermiteCubicInterpolator(samples, options.derivative_rule, options.domain_policy);
    case Method::Lagrange: return LagrangeInterpolator(samples);
    case Method::Newton: return NewtonInterpolator(samples);
  }
  throw std::out_of_range("Unknown interpolation method");
}

double Evaluate(const Interpolator& interp, double x) {
  return std::visit([x](const auto& i) { return i.Evaluate(x); }, interp);
}

Eigen::VectorXd Evaluate(const Interpolator& interp, const Eigen::VectorXd& xs) {
  return std::visit([&xs](const auto& i) {
    Eigen::VectorXd ys(xs.size());
    for (Eigen::Index k = 0; k < xs.size(); ++k) { ys[k] = i.Evaluate(xs[k]); }
    return ys;
  }, interp);
}

const SampleSet& Samples(const Interpolator& interp) {
  return std::visit([](const auto& i) -> const SampleSet& { return i.Samples(); }, interp);
}

std::pair<double, double> Domain(const Interpolator& interp) { return Samples(interp).Limits(); }

Method GetMethod(const Interpolator& interp) { return static_cast<Method>(interp.index()); }

std::ostream& operator<<(std::ostream& os, const Interpolator& interp) {
  std::visit([&os](const auto& i) { i.Print(os); }, interp);
  return os;
}

}
