#pragma once

#include <cstdint>
#include <iostream>
#include <string>

#include <Interpolant/samples.hpp>

namespace interpolant {

/** What piecewise interpolators do with a query outside [x_0, x_{n-1}]. */
enum class OutOfDomainPolicy : uint8_t {
  Throw,       ///< raise OutOfDomain
  Clamp,       ///< return y_0 below the domain and y_{n-1} above it
  Extrapolate  ///< continue the edge piece
};

const char* ToString(OutOfDomainPolicy policy);

inline std::ostream& operator<<(std::ostream& os, OutOfDomainPolicy policy) {
  return os << ToString(policy);
}

/** Throws InsufficientPoints if \p samples holds fewer than \p required points. */
void RequirePoints(const SampleSet& samples, uint64_t required, const std::string& method);
/** Throws DuplicateAbscissa if two samples share an x value. */
void RequireDistinct(const SampleSet& samples);
/** Throws UnsortedInput unless x is strictly ascending. */
void RequireSorted(const SampleSet& samples, const std::string& method);

/** Checks shared by the piecewise methods: two points, distinct, ascending. */
inline void RequirePiecewise(const SampleSet& samples, const std::string& method) {
  RequirePoints(samples, 2, method);
  RequireDistinct(samples);
  RequireSorted(samples, method);
}

}
