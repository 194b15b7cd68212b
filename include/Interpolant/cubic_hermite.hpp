#pragma once

#include <cstdint>
#include <iostream>

#include <Eigen/Dense>
#include <Interpolant/domain.hpp>
#include <Interpolant/samples.hpp>
#include <Interpolant/serialisation.hpp>

namespace interpolant {

/** How knot derivatives are estimated when the samples do not carry them. */
enum class DerivativeRule : uint8_t {
  SecantAverage,  ///< mean of the adjacent secant slopes, one-sided secant at the ends
  Monotone,       ///< Fritsch-Carlson weighted harmonic mean, zero at local extrema
  NaturalSpline   ///< C2 cubic spline with zero second derivative at both ends
};

const char* ToString(DerivativeRule rule);

inline std::ostream& operator<<(std::ostream& os, DerivativeRule rule) {
  return os << ToString(rule);
}

/** \brief Piecewise cubic Hermite interpolant.
 *  \details On each interval [x_i, x_{i+1}] the cubic matches y and dy at both ends, so the result is
 *  C1 across the whole domain. Derivatives come from the samples when supplied, otherwise from the
 *  DerivativeRule. Nothing per interval is cached; every evaluation works from the knots.
 */
class HermiteCubicInterpolator {
public:
  /** Empty interpolant, a target for deserialisation. Evaluating it throws InsufficientPoints. */
  HermiteCubicInterpolator() = default;
  /** \throws InsufficientPoints, DuplicateAbscissa, UnsortedInput */
  explicit HermiteCubicInterpolator(const SampleSet& samples,
                                    DerivativeRule rule = DerivativeRule::SecantAverage,
                                    OutOfDomainPolicy policy = OutOfDomainPolicy::Throw);

  double Evaluate(double x) const;
  inline double operator()(double x) const { return Evaluate(x); }
  /** First derivative of the interpolant at \p x. Zero outside the domain under Clamp. */
  double Derivative(double x) const;

  /** Evaluate the cubic belonging to interval \p idx at any \p x. */
  double EvaluateOnInterval(uint64_t idx, double x) const;
  /** First derivative of the cubic belonging to interval \p idx at any \p x. */
  double DerivativeOnInterval(uint64_t idx, double x) const;

  /** Derivative at every knot, supplied or estimated. */
  inline const Eigen::VectorXd& Derivatives() const { return deriv; }
  inline bool DerivativesSupplied() const { return samples.HasDerivatives(); }

  inline const SampleSet& Samples() const { return samples; }
  /** \brief Rule given at construction.
   *  \details Only applied when the samples carry no derivatives; check DerivativesSupplied() first.
   */
  inline DerivativeRule Rule() const { return rule; }
  inline OutOfDomainPolicy Policy() const { return policy; }

  void Print(std::ostream& os) const;

  template <typename Archive>
  void CEREAL_SAVE_FUNCTION_NAME(Archive& ar, const uint32_t version) const {
    ar(CEREAL_NVP_("samples", samples), CEREAL_NVP_("rule", rule), CEREAL_NVP_("policy", policy));
  }

  template <typename Archive>
  void CEREAL_LOAD_FUNCTION_NAME(Archive& ar, const uint32_t version) {
    SampleSet loaded;
    DerivativeRule loaded_rule;
    OutOfDomainPolicy loaded_policy;
    ar(CEREAL_NVP_("samples", loaded), CEREAL_NVP_("rule", loaded_rule), CEREAL_NVP_("policy", loaded_policy));
    *this = HermiteCubicInterpolator(loaded, loaded_rule, loaded_policy);
  }

private:
  void EstimateDerivatives();
  void EstimateSecantAverage(const Eigen::VectorXd& s);
  void EstimateMonotone(const Eigen::VectorXd& h, const Eigen::VectorXd& s);
  void SolveNaturalSpline(const Eigen::VectorXd& h, const Eigen::VectorXd& s);

  void CheckInterval(uint64_t idx) const;

private:
  SampleSet samples;
  DerivativeRule rule = DerivativeRule::SecantAverage;
  OutOfDomainPolicy policy = OutOfDomainPolicy::Throw;
  Eigen::VectorXd deriv;
};

static inline std::ostream& operator<<(std::ostream& os, const HermiteCubicInterpolator& interp) {
  interp.Print(os);
  return os;
}

}
CEREAL_CLASS_VERSION(interpolant::HermiteCubicInterpolator, 1);
