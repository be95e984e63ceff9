#pragma once

#include "libinfstat/core/regression_options.hpp"
#include <Eigen/Dense>
#include <cstdint>
#include <limits>

namespace libinfstat {
namespace core {

/**
 * Statistical inference results for regression coefficients
 *
 * All vectors have length n_params and are co-indexed with the
 * coefficient vector of the model they describe.
 */
struct CoefficientInference {
	/// Standard errors: sqrt(MSE * (X'X)^{-1}_{jj})
	Eigen::VectorXd std_errors;

	/// t-statistics: coef / std_error
	Eigen::VectorXd t_statistics;

	/// p-values for H0: coef = 0 under the requested tail
	Eigen::VectorXd p_values;

	/// Lower bounds of confidence intervals: coef - t_critical * std_error
	Eigen::VectorXd ci_lower;

	/// Upper bounds of confidence intervals: coef + t_critical * std_error
	Eigen::VectorXd ci_upper;

	/// Confidence level used (e.g., 0.95 for 95% CI)
	double confidence_level = 0.95;

	/// Alternative hypothesis of the p-values
	Tail tail = Tail::TWO_SIDED;

	/// Degrees of freedom used for t-distribution
	size_t degrees_of_freedom = 0;

	CoefficientInference() = default;

	/// Convenience constructor with dimensions
	explicit CoefficientInference(size_t n_params, double conf_level = 0.95) : confidence_level(conf_level) {
		const auto n = static_cast<Eigen::Index>(n_params);
		std_errors = Eigen::VectorXd::Zero(n);
		t_statistics = Eigen::VectorXd::Zero(n);
		p_values = Eigen::VectorXd::Ones(n);
		ci_lower = Eigen::VectorXd::Zero(n);
		ci_upper = Eigen::VectorXd::Zero(n);
	}
};

} // namespace core
} // namespace libinfstat
