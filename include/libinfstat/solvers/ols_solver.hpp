#pragma once

#include "libinfstat/core/errors.hpp"
#include "libinfstat/core/regression_options.hpp"
#include "libinfstat/core/regression_result.hpp"
#include "libinfstat/inference/coefficient_inference.hpp"
#include "libinfstat/inference/coefficient_inference_impl.hpp"
#include "libinfstat/linalg/least_squares.hpp"
#include "libinfstat/utils/distributions.hpp"
#include "libinfstat/utils/tracing.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <limits>
#include <string>
#include <vector>

namespace libinfstat {
namespace solvers {

/**
 * Ordinary Least Squares (OLS) Regression Solver
 *
 * Fits y = X b + e with Gaussian errors and full coefficient inference.
 * One matrix estimator serves every model, from a single predictor to
 * dummy-coded factors with interaction columns.
 *
 * Algorithm:
 * 1. Validate dimensions, N >= p + 1 and the constant-column rule
 * 2. Solve the normal equations via LeastSquaresKernel (QR by default),
 *    which rejects rank-deficient designs
 * 3. Compute fitted values, residuals and the sum-of-squares decomposition
 * 4. Compute SE, t-statistics, p-values and confidence intervals
 * 5. Compute R², adjusted R², overall F-test and information criteria
 *
 * Unlike lm(), aliased columns are an error here: a rank-deficient design
 * throws SingularDesignError instead of returning NaN coefficients.
 *
 * Design notes:
 * - Header-only
 * - Stateless design (all methods are static)
 */
class OLSSolver {
public:
	/**
	 * Fit OLS regression with coefficient inference
	 *
	 * @param y Response vector (length n)
	 * @param X Design matrix (n × k); without an intercept column when
	 *          options.intercept is true
	 * @param options Regression options (intercept, solver, confidence level, tail)
	 * @return Immutable FittedModel
	 * @throws core::DimensionMismatchError if y and X disagree on n
	 * @throws core::InsufficientDataError if n < p + 1
	 * @throws core::SingularDesignError if X is rank deficient or has a constant
	 *         column besides the intercept
	 */
	static core::FittedModel Fit(const Eigen::VectorXd &y, const Eigen::MatrixXd &X,
	                             const core::RegressionOptions &options = core::RegressionOptions::OLS());

	/**
	 * Fit with named columns
	 *
	 * @param column_names One name per column of X (the implicit intercept is
	 *        named "(Intercept)")
	 */
	static core::FittedModel Fit(const Eigen::VectorXd &y, const Eigen::MatrixXd &X,
	                             const std::vector<std::string> &column_names,
	                             const core::RegressionOptions &options = core::RegressionOptions::OLS());

	/**
	 * Predict responses for new rows
	 *
	 * @param model Fitted model
	 * @param X_new New rows laid out like the X passed to Fit()
	 * @return Predicted values
	 */
	static Eigen::VectorXd Predict(const core::FittedModel &model, const Eigen::MatrixXd &X_new);

	/**
	 * Quick check for constant columns
	 *
	 * A column is constant when max - min <= tol * max|x|. An all-zero column
	 * is constant.
	 *
	 * @param X Design matrix
	 * @param tol Relative spread below which a column counts as constant
	 * @return Vector of bools, true if column is constant
	 */
	static std::vector<bool> DetectConstantColumns(const Eigen::MatrixXd &X, double tol = 1e-10);

	/// Name given to the implicit intercept column
	static constexpr const char *kInterceptName = "(Intercept)";

private:
	static Eigen::MatrixXd BuildDesign(const Eigen::MatrixXd &X, bool intercept);

	static void ValidateInputs(const Eigen::VectorXd &y, const Eigen::MatrixXd &X);

	/// Returns the index of the intercept column, or -1 if there is none
	static Eigen::Index CheckConstantColumns(const Eigen::MatrixXd &design, const std::vector<std::string> &names,
	                                         double tol);

	static void ComputeStatistics(core::FittedModel &model);
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline core::FittedModel OLSSolver::Fit(const Eigen::VectorXd &y, const Eigen::MatrixXd &X,
                                        const core::RegressionOptions &options) {
	return Fit(y, X, std::vector<std::string>(), options);
}

inline core::FittedModel OLSSolver::Fit(const Eigen::VectorXd &y, const Eigen::MatrixXd &X,
                                        const std::vector<std::string> &column_names,
                                        const core::RegressionOptions &options) {
	options.Validate();
	ValidateInputs(y, X);

	if (!column_names.empty() && column_names.size() != static_cast<size_t>(X.cols())) {
		throw core::DimensionMismatchError("got " + std::to_string(column_names.size()) + " column names for " +
		                                   std::to_string(X.cols()) + " columns");
	}

	core::FittedModel model;
	model.design_ = BuildDesign(X, options.intercept);
	model.response_ = y;
	model.implicit_intercept_ = options.intercept;
	model.solver_ = options.solver;
	model.confidence_level_ = options.confidence_level;
	model.tail_ = options.tail;

	if (!column_names.empty()) {
		if (options.intercept) {
			model.column_names_.push_back(kInterceptName);
		}
		model.column_names_.insert(model.column_names_.end(), column_names.begin(), column_names.end());
	}

	const auto n = static_cast<size_t>(model.design_.rows());
	const auto p = static_cast<size_t>(model.design_.cols());
	model.n_obs_ = n;
	model.n_params_ = p;

	// Step 1: Estimability
	if (p == 0) {
		throw core::SingularDesignError("design matrix has no columns");
	}
	if (n < p + 1) {
		INFSTAT_WARN("Rejecting fit: " << n << " observations for " << p << " parameters");
		throw core::InsufficientDataError("need at least p + 1 = " + std::to_string(p + 1) +
		                                  " observations, got " + std::to_string(n));
	}

	const Eigen::Index intercept_col =
	    CheckConstantColumns(model.design_, model.column_names_, options.constant_tolerance);
	model.has_intercept_ = intercept_col >= 0;
	model.intercept_index_ = model.has_intercept_ ? static_cast<size_t>(intercept_col) : 0;

	// Step 2: Solve (throws SingularDesignError on rank deficiency)
	linalg::LeastSquaresSolution solution = linalg::LeastSquaresKernel::Solve(model.design_, y, options);
	model.coefficients_ = solution.coefficients;
	model.xtx_inverse_ = solution.xtx_inverse;

	// Step 3: Fitted values and residuals
	model.fitted_values_ = model.design_ * model.coefficients_;
	model.residuals_ = y - model.fitted_values_;

	// Steps 4-6: Sums of squares, inference and fit statistics
	ComputeStatistics(model);

	INFSTAT_DEBUG("OLS fit (" << model.solver_ << "): n=" << n << " p=" << p << " R2=" << model.r_squared_
	                          << " sigma=" << model.residual_standard_error_);

	return model;
}

inline Eigen::VectorXd OLSSolver::Predict(const core::FittedModel &model, const Eigen::MatrixXd &X_new) {
	const auto expected_cols =
	    static_cast<Eigen::Index>(model.implicit_intercept() ? model.n_params() - 1 : model.n_params());
	if (X_new.cols() != expected_cols) {
		throw core::DimensionMismatchError("model expects " + std::to_string(expected_cols) +
		                                   " columns for prediction, got " + std::to_string(X_new.cols()));
	}
	return BuildDesign(X_new, model.implicit_intercept()) * model.coefficients();
}

inline std::vector<bool> OLSSolver::DetectConstantColumns(const Eigen::MatrixXd &X, double tol) {
	const auto n = X.rows();
	const auto p = static_cast<size_t>(X.cols());
	std::vector<bool> is_constant(p, false);

	if (n < 2) {
		return is_constant;
	}

	for (size_t j = 0; j < p; j++) {
		const auto col = X.col(static_cast<Eigen::Index>(j));

		// Spread relative to the column's magnitude, invariant under rescaling
		const double range = col.maxCoeff() - col.minCoeff();
		const double scale = col.cwiseAbs().maxCoeff();

		if (range <= tol * scale) {
			is_constant[j] = true;
		}
	}

	return is_constant;
}

inline Eigen::MatrixXd OLSSolver::BuildDesign(const Eigen::MatrixXd &X, bool intercept) {
	if (!intercept) {
		return X;
	}
	Eigen::MatrixXd design(X.rows(), X.cols() + 1);
	design.col(0).setOnes();
	design.rightCols(X.cols()) = X;
	return design;
}

inline void OLSSolver::ValidateInputs(const Eigen::VectorXd &y, const Eigen::MatrixXd &X) {
	if (y.size() != X.rows()) {
		throw core::DimensionMismatchError("response length " + std::to_string(y.size()) +
		                                   " does not match design rows " + std::to_string(X.rows()));
	}
	if (!y.allFinite()) {
		throw std::invalid_argument("response contains NaN or infinite values");
	}
	if (!X.allFinite()) {
		throw std::invalid_argument("design matrix contains NaN or infinite values");
	}
}

inline Eigen::Index OLSSolver::CheckConstantColumns(const Eigen::MatrixXd &design,
                                                    const std::vector<std::string> &names, double tol) {
	auto column_label = [&names](Eigen::Index j) {
		if (!names.empty()) {
			return "'" + names[static_cast<size_t>(j)] + "'";
		}
		return std::to_string(j);
	};

	const std::vector<bool> is_constant = DetectConstantColumns(design, tol);
	Eigen::Index intercept_col = -1;

	for (Eigen::Index j = 0; j < design.cols(); j++) {
		if (!is_constant[static_cast<size_t>(j)]) {
			continue;
		}
		if (design.col(j).cwiseAbs().maxCoeff() == 0.0) {
			INFSTAT_WARN("Rejecting fit: column " << column_label(j) << " is identically zero");
			throw core::SingularDesignError("column " + column_label(j) + " is identically zero");
		}
		if (intercept_col >= 0) {
			// A second constant column is collinear with the first one
			INFSTAT_WARN("Rejecting fit: column " << column_label(j) << " is constant");
			throw core::SingularDesignError("column " + column_label(j) +
			                                " has zero variance and is collinear with the intercept");
		}
		intercept_col = j;
	}
	return intercept_col;
}

inline void OLSSolver::ComputeStatistics(core::FittedModel &model) {
	const auto n = model.n_obs_;
	const auto p = model.n_params_;
	const auto n_d = static_cast<double>(n);
	const auto df = n - p;
	const auto df_d = static_cast<double>(df);

	// Sum-of-squares decomposition
	const double y_mean = model.response_.mean();
	model.ss_error_ = model.residuals_.squaredNorm();
	model.ss_total_ = (model.response_.array() - y_mean).square().sum();
	if (!(model.ss_total_ > 0.0)) {
		throw std::invalid_argument("response is constant; R-squared is undefined");
	}
	model.ss_model_ = model.ss_total_ - model.ss_error_;

	model.ms_error_ = model.ss_error_ / df_d;
	model.residual_standard_error_ = std::sqrt(model.ms_error_);

	// Coefficient inference
	core::CoefficientInference coef_inference = inference::CoefficientInference::ComputeInference(
	    model.coefficients_, model.xtx_inverse_, model.ms_error_, df, model.confidence_level_, model.tail_);
	model.std_errors_ = coef_inference.std_errors;
	model.t_statistics_ = coef_inference.t_statistics;
	model.p_values_ = coef_inference.p_values;
	model.ci_lower_ = coef_inference.ci_lower;
	model.ci_upper_ = coef_inference.ci_upper;

	// R-squared and adjusted R-squared
	model.r_squared_ = model.ss_model_ / model.ss_total_;
	const double k0 = model.has_intercept_ ? 1.0 : 0.0;
	model.adj_r_squared_ = 1.0 - (1.0 - model.r_squared_) * (n_d - k0) / df_d;

	// Overall F-test against the intercept-only model
	const size_t df_model = model.has_intercept_ ? p - 1 : 0;
	if (model.has_intercept_ && df_model > 0) {
		const double mse = std::max(model.ms_error_, inference::CoefficientInference::kMinMse);
		model.f_statistic_ = (model.ss_model_ / static_cast<double>(df_model)) / mse;
		model.f_statistic_pvalue_ = utils::f_sf(model.f_statistic_, static_cast<double>(df_model), df_d);
		model.has_f_statistic_ = true;
	}

	// Information criteria; k counts coefficients plus the error variance
	constexpr double two_pi = 2.0 * 3.14159265358979323846;
	const double sigma2_ml = std::max(model.ss_error_ / n_d, std::numeric_limits<double>::min());
	model.log_likelihood_ = -0.5 * n_d * (std::log(two_pi) + std::log(sigma2_ml) + 1.0);
	const double k = static_cast<double>(p) + 1.0;
	model.aic_ = -2.0 * model.log_likelihood_ + 2.0 * k;
	model.bic_ = -2.0 * model.log_likelihood_ + std::log(n_d) * k;
}

} // namespace solvers
} // namespace libinfstat
