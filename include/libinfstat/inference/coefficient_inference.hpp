#pragma once

#include "../core/inference_result.hpp"
#include "../core/regression_options.hpp"
#include "../utils/distributions.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <limits>
#include <utility>

namespace libinfstat {
namespace inference {

/**
 * CoefficientInference: Statistical inference for regression coefficients
 *
 * This class provides methods to compute:
 * - Standard errors of coefficients
 * - t-statistics for hypothesis testing
 * - p-values (two-tailed by default, one-tailed on request)
 * - Confidence intervals
 *
 * The inference is based on the standard OLS theory:
 * - SE(β_j) = sqrt(σ² * (X'X)^{-1}_{jj})
 * - t_j = β_j / SE(β_j)  ~ t(n - p)
 * - p_j = 2 * P(T > |t_j|)   (two-sided)
 * - CI_j = β_j ± t_{α/2} * SE(β_j)
 *
 * Where:
 * - σ² = MSE = RSS / (n - p)
 * - X is the full design matrix including the intercept column
 * - p counts every column of X
 */
class CoefficientInference {
public:
	/**
	 * Compute coefficient inference from a least-squares solution
	 *
	 * @param coefficients Coefficient estimates (length p)
	 * @param xtx_inverse (X'X)^{-1} (p × p)
	 * @param mse Mean squared error SS_error / df
	 * @param df Residual degrees of freedom (n - p), must be positive
	 * @param confidence_level Confidence level for intervals
	 * @param tail Alternative hypothesis for the p-values
	 * @return CoefficientInference with standard errors, t-statistics, p-values and CIs
	 */
	static core::CoefficientInference ComputeInference(const Eigen::VectorXd &coefficients,
	                                                   const Eigen::MatrixXd &xtx_inverse, double mse, size_t df,
	                                                   double confidence_level = 0.95,
	                                                   core::Tail tail = core::Tail::TWO_SIDED);

	/**
	 * Compute coefficient standard errors
	 *
	 * SE(β_j) = sqrt(MSE * (X'X)^{-1}_{jj})
	 */
	static Eigen::VectorXd ComputeStdErrors(double mse, const Eigen::MatrixXd &xtx_inverse);

	/// t_j = β_j / SE(β_j)
	static Eigen::VectorXd ComputeTStatistics(const Eigen::VectorXd &coefficients, const Eigen::VectorXd &std_errors);

	/**
	 * Compute p-values from t-statistics
	 *
	 * two-sided: P(|T| > |t_j|), less: P(T < t_j), greater: P(T > t_j)
	 */
	static Eigen::VectorXd ComputePValues(const Eigen::VectorXd &t_statistics, size_t df,
	                                      core::Tail tail = core::Tail::TWO_SIDED);

	/**
	 * Compute confidence intervals for coefficients
	 *
	 * CI_j = β_j ± t_{α/2, df} * SE(β_j)
	 *
	 * @return Pair of (lower_bounds, upper_bounds)
	 */
	static std::pair<Eigen::VectorXd, Eigen::VectorXd> ComputeConfidenceIntervals(const Eigen::VectorXd &coefficients,
	                                                                              const Eigen::VectorXd &std_errors,
	                                                                              size_t df, double confidence_level);

	/// Floor applied to MSE so perfect fits keep finite t-statistics
	static constexpr double kMinMse = 1e-20;
};

} // namespace inference
} // namespace libinfstat
