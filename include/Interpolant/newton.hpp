#pragma once

#include <cstdint>
#include <iostream>
#include <utility>

#include <Eigen/Dense>
#include <Interpolant/samples.hpp>
#include <Interpolant/serialisation.hpp>

namespace interpolant {

/** \brief Global interpolating polynomial in Newton form.
 *  \details Builds the divided difference table
 *
 *      f[x_i] = y_i
 *      f[x_i, ..., x_{i+k}] = (f[x_{i+1}, ..., x_{i+k}] - f[x_i, ..., x_{i+k-1}]) / (x_{i+k} - x_i)
 *
 *  one row per sample, keeping the coefficients c_k = f[x_0, ..., x_k] and the most recent row. The
 *  polynomial is the same one LagrangeInterpolator produces. Keeping the last row lets Extend() absorb
 *  one more sample in O(n) without touching the existing coefficients. Derivatives in the samples are
 *  ignored.
 */
class NewtonInterpolator {
public:
  /** Empty interpolant, a target for deserialisation. Evaluating it throws InsufficientPoints. */
  NewtonInterpolator() = default;
  /** \throws InsufficientPoints (empty set), DuplicateAbscissa */
  explicit NewtonInterpolator(const SampleSet& samples);

  /** Nested evaluation c_0 + (x - x_0)(c_1 + (x - x_1)(c_2 + ...)). */
  double Evaluate(double x) const;
  inline double operator()(double x) const { return Evaluate(x); }
  double Derivative(double x) const;

  /** \brief Interpolant over the current samples plus \p point.
   *  \details Only the new bottom row of the table is computed.
   *  \throws DuplicateAbscissa if \p point.x is already a node.
   */
  NewtonInterpolator Extend(const SamplePoint& point) const;
  inline NewtonInterpolator Extend(double x, double y) const { return Extend(SamplePoint(x, y)); }

  /** c_k = f[x_0, ..., x_k] for k = 0 .. n-1. */
  inline const Eigen::VectorXd& Coefficients() const { return coef; }
  /** f[x_{n-1}], f[x_{n-2}, x_{n-1}], ..., f[x_0, ..., x_{n-1}] */
  inline const Eigen::VectorXd& LastRow() const { return divided_diff; }

  inline uint64_t Degree() const { return samples.empty() ? 0 : samples.size() - 1; }
  inline const SampleSet& Samples() const { return samples; }

  void Print(std::ostream& os) const;

  template <typename Archive>
  void CEREAL_SAVE_FUNCTION_NAME(Archive& ar, const uint32_t version) const {
    ar(CEREAL_NVP_("samples", samples), CEREAL_NVP_("coefficients", coef), CEREAL_NVP_("last_row", divided_diff));
  }

  /** The table is rebuilt from the stored samples; a stored table that disagrees with it is rejected. */
  template <typename Archive>
  void CEREAL_LOAD_FUNCTION_NAME(Archive& ar, const uint32_t version) {
    SampleSet loaded;
    Eigen::VectorXd loaded_coef, loaded_row;
    ar(CEREAL_NVP_("samples", loaded), CEREAL_NVP_("coefficients", loaded_coef), CEREAL_NVP_("last_row", loaded_row));
    NewtonInterpolator rebuilt(loaded);
    if (!SameTable(loaded_coef, rebuilt.coef) || !SameTable(loaded_row, rebuilt.divided_diff)) {
      throw cereal::Exception("Serialised divided difference table does not match the samples.");
    }
    *this = std::move(rebuilt);
  }

private:
  /** Replace the last row with row \p idx of the table and record f[x_0, ..., x_idx]. */
  void AppendRow(uint64_t idx);
  /** Entry-wise agreement of a stored table with a rebuilt one, up to rounding. */
  static bool SameTable(const Eigen::VectorXd& stored, const Eigen::VectorXd& rebuilt);

private:
  SampleSet samples;
  Eigen::VectorXd coef;
  Eigen::VectorXd divided_diff;
};

static inline std::ostream& operator<<(std::ostream& os, const NewtonInterpolator& interp) {
  interp.Print(os);
  return os;
}

}
CEREAL_CLASS_VERSION(interpolant::NewtonInterpolator, 1);
