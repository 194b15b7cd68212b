#pragma once

#include <algorithm>
#include <cstdint>

#include <Eigen/Dense>

namespace interpolant {

template <int64_t N, typename T>
inline constexpr T pow_n(const T& x) {
  if constexpr (N == 0) { return T(1); }
  else if constexpr (N < 0) { return T(1) / pow_n<-N>(x); }
  else if constexpr (N & 1) { return x * pow_n<N - 1>(x); }
  else {
    T x2 = pow_n<N / 2>(x);
    return x2 * x2;
  }
}

/** \brief Index of the interval [knots[i], knots[i+1]] holding \p value.
 *  \details Knots must be strictly ascending with at least two entries. Values on an interior knot
 *  belong to the interval on its right; values beyond either end map to the edge interval.
 */
inline uint64_t FindInterval(const Eigen::VectorXd& knots, double value) {
  const double* first = knots.data();
  const double* last = first + knots.size();
  uint64_t upper = std::distance(first, std::upper_bound(first, last, value));
  if (upper == 0) { return 0; }
  uint64_t n_intervals = knots.size() - 1;
  return std::min(upper - 1, n_intervals - 1);
}

}
