#pragma once

#include "coefficient_inference.hpp"
#include <algorithm>
#include <stdexcept>

namespace libinfstat {
namespace inference {

// Implementation of CoefficientInference methods

inline Eigen::VectorXd CoefficientInference::ComputeStdErrors(double mse, const Eigen::MatrixXd &xtx_inverse) {
	const auto p = xtx_inverse.rows();
	const double sigma2 = std::max(mse, kMinMse);

	Eigen::VectorXd std_errors(p);
	for (Eigen::Index j = 0; j < p; j++) {
		std_errors(j) = std::sqrt(sigma2 * xtx_inverse(j, j));
	}
	return std_errors;
}

inline Eigen::VectorXd CoefficientInference::ComputeTStatistics(const Eigen::VectorXd &coefficients,
                                                                const Eigen::VectorXd &std_errors) {
	if (coefficients.size() != std_errors.size()) {
		throw std::invalid_argument("coefficients and std_errors must have the same length");
	}

	Eigen::VectorXd t_stats(coefficients.size());
	for (Eigen::Index j = 0; j < coefficients.size(); j++) {
		t_stats(j) = coefficients(j) / std_errors(j);
	}
	return t_stats;
}

inline Eigen::VectorXd CoefficientInference::ComputePValues(const Eigen::VectorXd &t_statistics, size_t df,
                                                            core::Tail tail) {
	const auto dof = static_cast<double>(df);

	Eigen::VectorXd p_values(t_statistics.size());
	for (Eigen::Index j = 0; j < t_statistics.size(); j++) {
		switch (tail) {
		case core::Tail::LESS:
			p_values(j) = utils::student_t_cdf(t_statistics(j), dof);
			break;
		case core::Tail::GREATER:
			p_values(j) = utils::student_t_sf(t_statistics(j), dof);
			break;
		case core::Tail::TWO_SIDED:
		default:
			p_values(j) = utils::student_t_pvalue(t_statistics(j), dof);
			break;
		}
	}
	return p_values;
}

inline std::pair<Eigen::VectorXd, Eigen::VectorXd>
CoefficientInference::ComputeConfidenceIntervals(const Eigen::VectorXd &coefficients,
                                                 const Eigen::VectorXd &std_errors, size_t df,
                                                 double confidence_level) {
	const double alpha = 1.0 - confidence_level;
	const double t_crit = utils::student_t_critical(alpha / 2.0, static_cast<double>(df));

	Eigen::VectorXd ci_lower = coefficients - t_crit * std_errors;
	Eigen::VectorXd ci_upper = coefficients + t_crit * std_errors;
	return {ci_lower, ci_upper};
}

inline core::CoefficientInference CoefficientInference::ComputeInference(const Eigen::VectorXd &coefficients,
                                                                         const Eigen::MatrixXd &xtx_inverse,
                                                                         double mse, size_t df,
                                                                         double confidence_level, core::Tail tail) {
	if (df == 0) {
		throw std::invalid_argument("Insufficient observations for inference: n <= p");
	}
	if (xtx_inverse.rows() != coefficients.size() || xtx_inverse.cols() != coefficients.size()) {
		throw std::invalid_argument("(X'X)^-1 must be p x p for p coefficients");
	}

	core::CoefficientInference inference(static_cast<size_t>(coefficients.size()), confidence_level);

	inference.std_errors = ComputeStdErrors(mse, xtx_inverse);
	inference.t_statistics = ComputeTStatistics(coefficients, inference.std_errors);
	inference.p_values = ComputePValues(inference.t_statistics, df, tail);

	auto intervals = ComputeConfidenceIntervals(coefficients, inference.std_errors, df, confidence_level);
	inference.ci_lower = intervals.first;
	inference.ci_upper = intervals.second;

	inference.degrees_of_freedom = df;
	inference.tail = tail;

	return inference;
}

} // namespace inference
} // namespace libinfstat
