#pragma once

#include <cstdint>
#include <iostream>
#include <optional>
#include <utility>
#include <vector>

#include <Eigen/Dense>
#include <Interpolant/serialisation.hpp>

namespace interpolant {

/** A single sample (x, f(x)), optionally with f'(x). */
struct SamplePoint {
  double x = 0.0;
  double y = 0.0;
  std::optional<double> dy;

  SamplePoint() = default;
  SamplePoint(double x, double y) : x(x), y(y) { }
  SamplePoint(double x, double y, double dy) : x(x), y(y), dy(dy) { }
};

/** \brief Ordered collection of samples shared by all interpolation methods.
 *  \details Stores the abscissae, ordinates and (optionally) derivatives as separate Eigen columns.
 *  The set itself does not enforce ordering or distinctness of x; each interpolator checks what it
 *  needs when it is constructed.
 */
class SampleSet {
public:
  using Column = Eigen::VectorXd;

  /** Empty set. */
  SampleSet() = default;

  /** \brief Construct from x and y columns.
   *  \throws MismatchedLengths if the columns differ in length.
   */
  SampleSet(const std::vector<double>& x, const std::vector<double>& y);

  /** \brief Construct from x, y and derivative columns.
   *  \throws MismatchedLengths if the columns differ in length.
   */
  SampleSet(const std::vector<double>& x, const std::vector<double>& y, const std::vector<double>& dy);

  /** \brief Construct from points.
   *  \details Derivatives are kept only if every point has one.
   *  \throws MismatchedLengths if only some points carry a derivative.
   */
  explicit SampleSet(const std::vector<SamplePoint>& points);

  SampleSet(const SampleSet&) = default;
  SampleSet(SampleSet&&) = default;
  SampleSet& operator=(const SampleSet&) = default;
  SampleSet& operator=(SampleSet&&) = default;

  inline uint64_t size() const { return xs.size(); }
  inline bool empty() const { return xs.size() == 0; }
  inline bool HasDerivatives() const { return !empty() && dys.size() == xs.size(); }

  inline const Column& x() const { return xs; }
  inline const Column& y() const { return ys; }
  /** Derivative column, empty when no derivatives were supplied. */
  inline const Column& dy() const { return dys; }

  /** Access the sample at the given index. */
  SamplePoint operator[](uint64_t idx) const;

  /** True if x is strictly ascending. */
  bool IsSorted() const;
  /** Index of the first sample that is not strictly greater than its predecessor. */
  std::optional<uint64_t> FirstUnsortedIndex() const;
  bool HasDistinctAbscissae() const { return !FindDuplicateAbscissa().has_value(); }
  /** An x value that occurs more than once, if any. */
  std::optional<double> FindDuplicateAbscissa() const;

  /** Copy of the set sorted ascending by x. Equal x keep their relative order. */
  SampleSet Sorted() const;
  /** Copy of the set with \p point added at the end. */
  SampleSet Appended(const SamplePoint& point) const;
  /** Copy of the set with sample \p idx removed. \throws std::out_of_range */
  SampleSet Without(uint64_t idx) const;
  /** Copy of the set with sample \p idx replaced by \p point. \throws std::out_of_range, MismatchedLengths */
  SampleSet Replaced(uint64_t idx, const SamplePoint& point) const;
  /** Copy of the set keeping only x and y. */
  SampleSet WithoutDerivatives() const;

  /** Closed interval [min x, max x]. */
  std::pair<double, double> Limits() const;

  void Print(std::ostream& os) const;

  template <typename Archive>
  void CEREAL_SAVE_FUNCTION_NAME(Archive& ar, const uint32_t version) const {
    ar(CEREAL_NVP_("x", xs), CEREAL_NVP_("y", ys), CEREAL_NVP_("dy", dys));
  }

  template <typename Archive>
  void CEREAL_LOAD_FUNCTION_NAME(Archive& ar, const uint32_t version) {
    ar(CEREAL_NVP_("x", xs), CEREAL_NVP_("y", ys), CEREAL_NVP_("dy", dys));
    if (ys.size() != xs.size() || (dys.size() != 0 && dys.size() != xs.size())) {
      throw cereal::Exception("Serialised sample columns have different lengths.");
    }
  }

private:
  Column xs, ys, dys;
};

static inline std::ostream& operator<<(std::ostream& os, const SampleSet& samples) {
  samples.Print(os);
  return os;
}

}
CEREAL_CLASS_VERSION(interpolant::SampleSet, 1);
