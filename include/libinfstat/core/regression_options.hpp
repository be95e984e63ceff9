#pragma once

#include <cstdint>
#include <string>
#include <stdexcept>

namespace libinfstat {
namespace core {

/// Alternative hypothesis for coefficient t-tests
enum class Tail : uint8_t {
	TWO_SIDED = 0, ///< H1: beta != 0
	LESS = 1,      ///< H1: beta < 0
	GREATER = 2    ///< H1: beta > 0
};

/**
 * Configuration options for least-squares fitting
 *
 * Design notes:
 * - All defaults specified in-class for clarity
 * - Validation method to check for invalid combinations
 * - The intercept is implicit (prepended column of ones) when intercept=true;
 *   callers that build their own design with a ones column pass intercept=false
 */
struct RegressionOptions {
	// ========================================================================
	// Model structure
	// ========================================================================

	/// Prepend an intercept column of ones to the design matrix
	/// Default: true
	bool intercept = true;

	// ========================================================================
	// Statistical inference parameters
	// ========================================================================

	/// Confidence level for coefficient confidence intervals
	/// Default: 0.95
	double confidence_level = 0.95;

	/// Alternative hypothesis for coefficient p-values
	/// Default: two-sided
	Tail tail = Tail::TWO_SIDED;

	// ========================================================================
	// Computational parameters
	// ========================================================================

	/// Rank tolerance for the decomposition (-1 = auto, use Eigen default)
	/// Default: -1.0 (auto)
	double qr_tolerance = -1.0;

	/// Relative spread (max - min) / max|x| at or below which a column counts as constant
	/// Default: 1e-10
	double constant_tolerance = 1e-10;

	/// Solver algorithm to use
	/// Options: "qr" (default), "svd", "cholesky"
	/// Default: "qr"
	std::string solver = "qr";

	// ========================================================================
	// Constructors
	// ========================================================================

	/// Default constructor with all default values
	RegressionOptions() = default;

	/// Convenience constructor for common OLS options
	static RegressionOptions OLS(bool intercept_ = true) {
		RegressionOptions opts;
		opts.intercept = intercept_;
		return opts;
	}

	/// Convenience constructor selecting the decomposition
	static RegressionOptions WithSolver(const std::string &solver_, bool intercept_ = true) {
		RegressionOptions opts;
		opts.intercept = intercept_;
		opts.solver = solver_;
		return opts;
	}

	// ========================================================================
	// Validation
	// ========================================================================

	/**
	 * Validate option values
	 *
	 * @throws std::invalid_argument if validation fails
	 */
	void Validate() const {
		// Confidence level must be in (0, 1)
		if (!(confidence_level > 0.0 && confidence_level < 1.0)) {
			throw std::invalid_argument("confidence_level must be in (0, 1) (got " +
			                            std::to_string(confidence_level) + ")");
		}

		if (!(constant_tolerance >= 0.0)) {
			throw std::invalid_argument("constant_tolerance must be non-negative (got " +
			                            std::to_string(constant_tolerance) + ")");
		}

		// Solver must be valid
		if (solver != "qr" && solver != "svd" && solver != "cholesky") {
			throw std::invalid_argument("solver must be 'qr', 'svd', or 'cholesky' (got '" + solver + "')");
		}
	}
};

/// Human-readable name of a tail, used in log output
inline const char *TailName(Tail tail) {
	switch (tail) {
	case Tail::LESS:
		return "less";
	case Tail::GREATER:
		return "greater";
	case Tail::TWO_SIDED:
	default:
		return "two-sided";
	}
}

} // namespace core
} // namespace libinfstat
