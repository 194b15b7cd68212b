#pragma once

#include <cstdint>
#include <iostream>
#include <utility>
#include <variant>

#include <Eigen/Dense>
#include <Interpolant/cubic_hermite.hpp>
#include <Interpolant/domain.hpp>
#include <Interpolant/lagrange.hpp>
#include <Interpolant/linear.hpp>
#include <Interpolant/newton.hpp>
#include <Interpolant/samples.hpp>

namespace interpolant {

enum class Method : uint8_t { Linear, HermiteCubic, Lagrange, Newton };

const char* Name(Method method);

inline std::ostream& operator<<(std::ostream& os, Method method) { return os << Name(method); }

/** Settings that apply to some of the methods; the rest ignore them. */
struct FitOptions {
  /** Linear and HermiteCubic only. */
  OutOfDomainPolicy domain_policy = OutOfDomainPolicy::Throw;
  /** HermiteCubic only, and only when the samples carry no derivatives. */
  DerivativeRule derivative_rule = DerivativeRule::SecantAverage;
};

/** Any of the fitted interpolants. Alternatives appear in the same order as Method. */
using Interpolator = std::variant<LinearInterpolator, HermiteCubicInterpolator, LagrangeInterpolator, NewtonInterpolator>;

/** \brief Fit \p samples with the given method.
 *  \throws InsufficientPoints, DuplicateAbscissa, UnsortedInput as the method requires.
 */
Interpolator Fit(Method method, const SampleSet& samples, const FitOptions& options = FitOptions());

/** Evaluate the interpolant at \p x. */
double Evaluate(const Interpolator& interp, double x);
/** Evaluate the interpolant at every entry of \p xs. */
Eigen::VectorXd Evaluate(const Interpolator& interp, const Eigen::VectorXd& xs);

const SampleSet& Samples(const Interpolator& interp);
/** Closed interval spanned by the samples. */
std::pair<double, double> Domain(const Interpolator& interp);
Method GetMethod(const Interpolator& interp);

std::ostream& operator<<(std::ostream& os, const Interpolator& interp);

}
