#pragma once

#include <stdexcept>
#include <string>

namespace libinfstat {
namespace core {

/**
 * Error kinds raised by libinfstat
 *
 * Every error is a deterministic input-validity failure, so all of them
 * derive from std::invalid_argument. Callers can catch the specific kind
 * or std::invalid_argument for "this analysis cannot be computed".
 */

/// Fewer observations than parameters + 1 (N <= p)
class InsufficientDataError : public std::invalid_argument {
public:
	explicit InsufficientDataError(const std::string &msg) : std::invalid_argument(msg) {}
};

/// Rank-deficient design matrix or a predictor collinear with the intercept
class SingularDesignError : public std::invalid_argument {
public:
	explicit SingularDesignError(const std::string &msg) : std::invalid_argument(msg) {}
};

/// Reduced model is not a strict subset of the full model
class NotNestedError : public std::invalid_argument {
public:
	explicit NotNestedError(const std::string &msg) : std::invalid_argument(msg) {}
};

/// Inputs that must be co-indexed have different lengths
class DimensionMismatchError : public std::invalid_argument {
public:
	explicit DimensionMismatchError(const std::string &msg) : std::invalid_argument(msg) {}
};

/// A row or column total of a contingency table is zero
class DegenerateMarginError : public std::invalid_argument {
public:
	explicit DegenerateMarginError(const std::string &msg) : std::invalid_argument(msg) {}
};

/// Table has the wrong shape for the requested operation
class ShapeError : public std::invalid_argument {
public:
	explicit ShapeError(const std::string &msg) : std::invalid_argument(msg) {}
};

} // namespace core
} // namespace libinfstat
