#pragma once

#include <stdexcept>
#include <string>

// Malformed variation or design request (kind/cardinality mismatch, grid on a
// continuous dimension, bad CDF, bad sample counts). Raised before any run is dispatched.
class ValidationError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Option not supported by the requested method (e.g. ignore_indices for MOAT/RBD)
class UnsupportedOptionError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Expected persisted row, column or base value is absent
class LookupError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Numerical failure while normalising indices (zero total variance)
class ComputationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Replicate values violate the configured aggregation policy
class EvaluationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};
