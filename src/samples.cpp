#include <algorithm>
#include <iomanip>
#include <numeric>
#include <stdexcept>

#include <Interpolant/errors.hpp>
#include <Interpolant/samples.hpp>

namespace interpolant {

namespace {
Eigen::VectorXd ToColumn(const std::vector<double>& values) {
  return Eigen::Map<const Eigen::VectorXd>(values.data(), values.size());
}

Eigen::VectorXd Erase(const Eigen::VectorXd& column, uint64_t idx) {
  const uint64_t n = column.size();
  Eigen::VectorXd result(n - 1);
  result.head(idx) = column.head(idx);
  result.tail(n - 1 - idx) = column.tail(n - 1 - idx);
  return result;
}
}

/* Constructors */
SampleSet::SampleSet(const std::vector<double>& x, const std::vector<double>& y)
: xs(ToColumn(x)), ys(ToColumn(y)) {
  if (x.size() != y.size()) {
    throw MismatchedLengths("SampleSet requires x and y to have the same size.");
  }
}

SampleSet::SampleSet(const std::vector<double>& x, const std::vector<double>& y, const std::vector<double>& dy)
: xs(ToColumn(x)), ys(ToColumn(y)), dys(ToColumn(dy)) {
  if (x.size() != y.size() || x.size() != dy.size()) {
    throw MismatchedLengths("SampleSet requires x, y and dy to have the same size.");
  }
}

SampleSet::SampleSet(const std::vector<SamplePoint>& points)
: xs(points.size()), ys(points.size()) {
  uint64_t with_derivative = std::count_if(points.begin(), points.end(),
                                           [](const SamplePoint& p) { return p.dy.has_value(); });
  if (with_derivative != 0 && with_derivative != points.size()) {
    throw MismatchedLengths("SampleSet requires either all or none of the points to carry a derivative.");
  }
  if (with_derivative) { dys.resize(points.size()); }

  for (uint64_t i = 0; i < points.size(); ++i) {
    xs[i] = points[i].x;
    ys[i] = points[i].y;
    if (with_derivative) { dys[i] = *points[i].dy; }
  }
}

/* Access */
SamplePoint SampleSet::operator[](uint64_t idx) const {
  if (idx >= size()) { throw std::out_of_range("Requested sample index out of range"); }
  if (HasDerivatives()) { return SamplePoint(xs[idx], ys[idx], dys[idx]); }
  return SamplePoint(xs[idx], ys[idx]);
}

/* Checks */
std::optional<uint64_t> SampleSet::FirstUnsortedIndex() const {
  for (uint64_t i = 1; i < size(); ++i) {
    if (!(xs[i] > xs[i - 1])) { return i; }
  }
  return std::nullopt;
}

bool SampleSet::IsSorted() const { return !FirstUnsortedIndex().has_value(); }

std::optional<double> SampleSet::FindDuplicateAbscissa() const {
  std::vector<double> sorted(xs.data(), xs.data() + xs.size());
  std::sort(sorted.begin(), sorted.end());
  auto dup = std::adjacent_find(sorted.begin(), sorted.end());
  if (dup == sorted.end()) { return std::nullopt; }
  return *dup;
}

/* Derived sets */
SampleSet SampleSet::Sorted() const {
  std::vector<uint64_t> order(size());
  std::iota(order.begin(), order.end(), 0);
  std::stable_sort(order.begin(), order.end(), [this](uint64_t a, uint64_t b) { return xs[a] < xs[b]; });

  SampleSet result(*this);
  for (uint64_t i = 0; i < order.size(); ++i) {
    result.xs[i] = xs[order[i]];
    result.ys[i] = ys[order[i]];
    if (HasDerivatives()) { result.dys[i] = dys[order[i]]; }
  }
  return result;
}

SampleSet SampleSet::Appended(const SamplePoint& point) const {
  if (!empty() && HasDerivatives() != point.dy.has_value()) {
    throw MismatchedLengths("Appended point must match the set in carrying a derivative.");
  }
  SampleSet result(*this);
  uint64_t n = size();
  result.xs.conservativeResize(n + 1);
  result.ys.conservativeResize(n + 1);
  result.xs[n] = point.x;
  result.ys[n] = point.y;
  if (point.dy) {
    result.dys.conservativeResize(n + 1);
    result.dys[n] = *point.dy;
  }
  return result;
}

SampleSet SampleSet::Without(uint64_t idx) const {
  if (idx >= size()) { throw std::out_of_range("Requested sample index out of range"); }
  SampleSet result;
  result.xs = Erase(xs, idx);
  result.ys = Erase(ys, idx);
  if (HasDerivatives()) { result.dys = Erase(dys, idx); }
  return result;
}

SampleSet SampleSet::Replaced(uint64_t idx, const SamplePoint& point) const {
  if (idx >= size()) { throw std::out_of_range("Requested sample index out of range"); }
  if (HasDerivatives() != point.dy.has_value()) {
    throw MismatchedLengths("Replacement point must match the set in carrying a derivative.");
  }
  SampleSet result(*this);
  result.xs[idx] = point.x;
  result.ys[idx] = point.y;
  if (point.dy) { result.dys[idx] = *point.dy; }
  return result;
}

SampleSet SampleSet::WithoutDerivatives() const {
  SampleSet result;
  result.xs = xs;
  result.ys = ys;
  return result;
}

std::pair<double, double> SampleSet::Limits() const {
  if (empty()) { throw std::range_error("An empty SampleSet has no limits."); }
  return {xs.minCoeff(), xs.maxCoeff()};
}

void SampleSet::Print(std::ostream& os) const {
  os << size() << (HasDerivatives() ? " samples (x, y, dy)\n" : " samples (x, y)\n");
  os << std::setprecision(6) << std::scientific;
  for (uint64_t i = 0; i < size(); ++i) {
    os << std::setw(15) << xs[i] << " " << std::setw(15) << ys[i];
    if (HasDerivatives()) { os << " " << std::setw(15) << dys[i]; }
    os << '\n';
  }
}

}
