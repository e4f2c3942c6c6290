#pragma once

#include <stdexcept>

namespace libbnx {

// A variable name that has no member in the network.
class UnknownVariable : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// A CPT lookup for a parent-value combination that was never supplied.
class MissingConditionalRow : public std::out_of_range {
public:
    using std::out_of_range::out_of_range;
};

// A variable handle used against a network that does not own it.
class VariableNotInNetwork : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Normalization of a table whose weights sum to zero.
class ZeroTotalProbability : public std::domain_error {
public:
    using std::domain_error::domain_error;
};

// A weight that is negative or non-finite, or a normalized value outside [0, 1].
class InvalidProbabilityValue : public std::out_of_range {
public:
    using std::out_of_range::out_of_range;
};

}  // namespace libbnx
