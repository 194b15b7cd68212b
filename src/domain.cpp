#include <Interpolant/domain.hpp>
#include <Interpolant/errors.hpp>

namespace interpolant {

const char* ToString(OutOfDomainPolicy policy) {
  switch (policy) {
    case OutOfDomainPolicy::Throw: return "throw";
    case OutOfDomainPolicy::Clamp: return "clamp";
    case OutOfDomainPolicy::Extrapolate: return "extrapolate";
  }
  throw std::out_of_range("Unknown out of domain policy");
}

void RequirePoints(const SampleSet& samples, uint64_t required, const std::string& method) {
  if (samples.size() < required) { throw InsufficientPoints(method, required, samples.size()); }
}

void RequireDistinct(const SampleSet& samples) {
  if (auto dup = samples.FindDuplicateAbscissa()) { throw DuplicateAbscissa(*dup); }
}

void RequireSorted(const SampleSet& samples, const std::string& method) {
  if (auto idx = samples.FirstUnsortedIndex()) { throw UnsortedInput(method, *idx); }
}

}
