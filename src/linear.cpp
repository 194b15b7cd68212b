#include <stdexcept>

#include <Interpolant/domain.hpp>
#include <Interpolant/errors.hpp>
#include <Interpolant/linear.hpp>
#include <Interpolant/utils.hpp>

namespace interpolant {

LinearInterpolator::LinearInterpolator(const SampleSet& s, OutOfDomainPolicy p)
: samples(s), policy(p) {
  RequirePiecewise(samples, "LinearInterpolator");
}

double LinearInterpolator::Slope(uint64_t idx) const {
  if (idx + 1 >= samples.size()) { throw std::out_of_range("Requested segment index out of range"); }
  const auto& x = samples.x();
  const auto& y = samples.y();
  return (y[idx + 1] - y[idx]) / (x[idx + 1] - x[idx]);
}

double LinearInterpolator::Evaluate(double v) const {
  RequirePoints(samples, 2, "LinearInterpolator");
  const auto& x = samples.x();
  const auto& y = samples.y();
  const uint64_t last = samples.size() - 1;

  if (v < x[0] || v > x[last]) {
    switch (policy) {
      case OutOfDomainPolicy::Throw: throw OutOfDomain(v, x[0], x[last]);
      case OutOfDomainPolicy::Clamp: return v < x[0] ? y[0] : y[last];
      case OutOfDomainPolicy::Extrapolate: break;  // FindInterval hands back the edge segment
    }
  }

  if (v == x[last]) { return y[last]; }

  uint64_t i = FindInterval(x, v);
  // y = y_i + (y_{i+1} - y_i) * (x - x_i) / (x_{i+1} - x_i)
  return y[i] + (y[i + 1] - y[i]) * (v - x[i]) / (x[i + 1] - x[i]);
}

void LinearInterpolator::Print(std::ostream& os) const {
  os << "LinearInterpolator over " << samples.size() << " knots, out of domain: " << policy << '\n';
}

}
