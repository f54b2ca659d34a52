#pragma once

#include <stdexcept>
#include <string>

namespace exotica {

// Base of every error raised by the pricers. A call either returns a
// complete result or throws one of these; partial results are never returned.
class PricingError : public std::runtime_error {
public:
    explicit PricingError(const std::string& what) : std::runtime_error(what) {}
};

// Non-finite or out-of-range inputs, rejected before any computation
class ValidationError : public PricingError {
public:
    explicit ValidationError(const std::string& what) : PricingError(what) {}
};

// Regression or lattice failure during the computation itself
class NumericalError : public PricingError {
public:
    explicit NumericalError(const std::string& what) : PricingError(what) {}
};

// Method has no implementation for the option type (or is unknown)
class UnsupportedMethodError : public PricingError {
public:
    explicit UnsupportedMethodError(const std::string& what) : PricingError(what) {}
};

class CancelledError : public PricingError {
public:
    explicit CancelledError(const std::string& what) : PricingError(what) {}
};

} // namespace exotica
