#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace interpolant {

/** \brief Base class of every error raised while fitting or evaluating an interpolant. */
class InterpolationError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/** Fewer samples than the method needs. */
class InsufficientPoints : public InterpolationError {
public:
  InsufficientPoints(const std::string& method, uint64_t required, uint64_t supplied)
  : InterpolationError(method + " requires at least " + std::to_string(required)
                       + " points, got " + std::to_string(supplied) + "."),
    required(required), supplied(supplied) { }

  const uint64_t required, supplied;
};

/** Two samples share the same x value. */
class DuplicateAbscissa : public InterpolationError {
public:
  explicit DuplicateAbscissa(double x)
  : InterpolationError("Cannot use two points with the same x value (x = " + std::to_string(x) + ")."),
    x(x) { }

  const double x;
};

/** Samples are not strictly ascending in x. */
class UnsortedInput : public InterpolationError {
public:
  UnsortedInput(const std::string& method, uint64_t index)
  : InterpolationError(method + " requires x values to be strictly ascending (first violation at index "
                       + std::to_string(index) + ")."),
    index(index) { }

  const uint64_t index;
};

/** Query point outside [lower, upper] with no extrapolation policy in force. */
class OutOfDomain : public InterpolationError {
public:
  OutOfDomain(double x, double lower, double upper)
  : InterpolationError("Query x = " + std::to_string(x) + " is outside the sampled domain ["
                       + std::to_string(lower) + ", " + std::to_string(upper) + "]."),
    x(x), lower(lower), upper(upper) { }

  const double x, lower, upper;
};

/** Sample columns (x, y, dy) of different lengths. */
class MismatchedLengths : public InterpolationError {
public:
  using InterpolationError::InterpolationError;
};

}
