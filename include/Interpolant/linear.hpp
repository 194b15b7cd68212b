#pragma once

#include <cstdint>
#include <iostream>

#include <Interpolant/domain.hpp>
#include <Interpolant/samples.hpp>
#include <Interpolant/serialisation.hpp>

namespace interpolant {

/** \brief Piecewise linear interpolant through strictly ascending samples.
 *  \details Continuous but with a kink at every interior knot. Queries outside the sampled domain are
 *  handled according to the OutOfDomainPolicy given at construction.
 */
class LinearInterpolator {
public:
  /** Empty interpolant, a target for deserialisation. Evaluating it throws InsufficientPoints. */
  LinearInterpolator() = default;
  /** \throws InsufficientPoints, DuplicateAbscissa, UnsortedInput */
  explicit LinearInterpolator(const SampleSet& samples, OutOfDomainPolicy policy = OutOfDomainPolicy::Throw);

  /** \throws OutOfDomain when the policy is Throw and \p x is outside the domain. */
  double Evaluate(double x) const;
  inline double operator()(double x) const { return Evaluate(x); }

  /** Slope of segment \p idx, joining samples idx and idx + 1. */
  double Slope(uint64_t idx) const;

  inline const SampleSet& Samples() const { return samples; }
  inline OutOfDomainPolicy Policy() const { return policy; }

  void Print(std::ostream& os) const;

  template <typename Archive>
  void CEREAL_SAVE_FUNCTION_NAME(Archive& ar, const uint32_t version) const {
    ar(CEREAL_NVP_("samples", samples), CEREAL_NVP_("policy", policy));
  }

  template <typename Archive>
  void CEREAL_LOAD_FUNCTION_NAME(Archive& ar, const uint32_t version) {
    SampleSet loaded;
    OutOfDomainPolicy loaded_policy;
    ar(CEREAL_NVP_("samples", loaded), CEREAL_NVP_("policy", loaded_policy));
    *this = LinearInterpolator(loaded, loaded_policy);
  }

private:
  SampleSet samples;
  OutOfDomainPolicy policy = OutOfDomainPolicy::Throw;
};

static inline std::ostream& operator<<(std::ostream& os, const LinearInterpolator& interp) {
  interp.Print(os);
  return os;
}

}
CEREAL_CLASS_VERSION(interpolant::LinearInterpolator, 1);
