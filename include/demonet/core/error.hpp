#pragma once

#include <stdexcept>
#include <string>

namespace demonet::core {

// Caller contract violation: length mismatch, out-of-range id, shape mismatch.
struct InvalidArgument : public std::invalid_argument {
  using std::invalid_argument::invalid_argument;
};

// Ratio is not a scalar, a mapping or a sequence.
struct UnsupportedScaleType : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

} // namespace demonet::core
