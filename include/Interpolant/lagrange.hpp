#pragma once

#include <cstdint>
#include <iostream>

#include <Eigen/Dense>
#include <Interpolant/samples.hpp>
#include <Interpolant/serialisation.hpp>

namespace interpolant {

/** \brief Global interpolating polynomial in Lagrange form.
 *  \details P(x) = sum_i y_i L_i(x) with L_i(x) = prod_{j != i} (x - x_j) / (x_i - x_j), the unique
 *  polynomial of degree at most n - 1 through all n samples. Sample order does not matter.
 *
 *  Evaluate() uses the basis form directly and costs O(n^2). It is numerically unstable for many or
 *  clustered nodes, and like any high degree interpolant it oscillates near the ends of equispaced
 *  nodes (Runge phenomenon). Neither is corrected here. EvaluateBarycentric() is the O(n) barycentric
 *  form over the same polynomial, using weights computed once at construction.
 *
 *  Extend(), Without() and Replace() return the interpolant of a modified node set. They rescale the
 *  existing weights by one factor each instead of recomputing them, so each costs O(n). Derivatives in
 *  the samples are ignored.
 */
class LagrangeInterpolator {
public:
  /** Empty interpolant, a target for deserialisation. Evaluating it throws InsufficientPoints. */
  LagrangeInterpolator() = default;
  /** \throws InsufficientPoints (empty set), DuplicateAbscissa */
  explicit LagrangeInterpolator(const SampleSet& samples);

  double Evaluate(double x) const;
  inline double operator()(double x) const { return Evaluate(x); }

  /** Value of the basis polynomial L_idx at \p x. */
  double Basis(uint64_t idx, double x) const;

  /** Same polynomial through the first barycentric form, exact at the nodes. */
  double EvaluateBarycentric(double x) const;
  /** Barycentric weights w_i = 1 / prod_{j != i} (x_i - x_j). */
  inline const Eigen::VectorXd& Weights() const { return weights; }

  /** \brief Interpolant over the current samples plus \p point.
   *  \throws DuplicateAbscissa if \p point.x is already a node.
   */
  LagrangeInterpolator Extend(const SamplePoint& point) const;
  inline LagrangeInterpolator Extend(double x, double y) const { return Extend(SamplePoint(x, y)); }
  /** \brief Interpolant over the current samples less sample \p idx.
   *  \throws std::out_of_range, InsufficientPoints when removing the only node.
   */
  LagrangeInterpolator Without(uint64_t idx) const;
  /** \brief Interpolant with sample \p idx moved to \p point.
   *  \throws std::out_of_range, DuplicateAbscissa if \p point.x is another node.
   */
  LagrangeInterpolator Replace(uint64_t idx, const SamplePoint& point) const;

  inline uint64_t Degree() const { return samples.empty() ? 0 : samples.size() - 1; }
  inline const SampleSet& Samples() const { return samples; }

  void Print(std::ostream& os) const;

  template <typename Archive>
  void CEREAL_SAVE_FUNCTION_NAME(Archive& ar, const uint32_t version) const {
    ar(CEREAL_NVP_("samples", samples));
  }

  template <typename Archive>
  void CEREAL_LOAD_FUNCTION_NAME(Archive& ar, const uint32_t version) {
    SampleSet loaded;
    ar(CEREAL_NVP_("samples", loaded));
    *this = LagrangeInterpolator(loaded);
  }

private:
  SampleSet samples;
  Eigen::VectorXd weights;
};

static inline std::ostream& operator<<(std::ostream& os, const LagrangeInterpolator& interp) {
  interp.Print(os);
  return os;
}

}
CEREAL_CLASS_VERSION(interpolant::LagrangeInterpolator, 1);
