#pragma once

#include "libinfstat/core/regression_options.hpp"
#include <Eigen/Dense>
#include <string>
#include <vector>
#include <limits>

namespace libinfstat {

namespace solvers {
class OLSSolver;
} // namespace solvers

namespace core {

/**
 * Result of an ordinary least squares fit
 *
 * Contains coefficients, residuals, the sum-of-squares decomposition,
 * coefficient inference and fit quality statistics.
 *
 * Design notes:
 * - Immutable once constructed: only OLSSolver writes the fields, readers
 *   get const accessors, so a model can be shared across threads
 * - Coefficient vectors include the intercept (index 0 when it was added
 *   implicitly by the solver)
 * - The effective design matrix and response are retained so nested
 *   models can be compared without the caller re-supplying the data
 * - Optional outputs (overall F test) are indicated by has_* flags
 */
class FittedModel {
public:
	FittedModel() = default;

	// ========================================================================
	// Core regression outputs
	// ========================================================================

	/// Estimated coefficients (length = n_params)
	const Eigen::VectorXd &coefficients() const {
		return coefficients_;
	}

	/// Residuals: y - X*beta (length = n_obs)
	const Eigen::VectorXd &residuals() const {
		return residuals_;
	}

	/// Fitted values X*beta (length = n_obs)
	const Eigen::VectorXd &fitted_values() const {
		return fitted_values_;
	}

	/// Response the model was fitted to
	const Eigen::VectorXd &response() const {
		return response_;
	}

	/// Effective design matrix, including the intercept column when implicit
	const Eigen::MatrixXd &design() const {
		return design_;
	}

	/// (X'X)^-1 of the effective design
	const Eigen::MatrixXd &xtx_inverse() const {
		return xtx_inverse_;
	}

	/// Column names of the effective design (empty if none were given)
	const std::vector<std::string> &column_names() const {
		return column_names_;
	}

	/// True if the design contains a constant column acting as intercept
	bool has_intercept() const {
		return has_intercept_;
	}

	/// True if the solver prepended the intercept column itself
	bool implicit_intercept() const {
		return implicit_intercept_;
	}

	/// Index of the intercept column (only valid if has_intercept())
	size_t intercept_index() const {
		return intercept_index_;
	}

	size_t n_obs() const {
		return n_obs_;
	}

	/// Number of coefficients p, including the intercept
	size_t n_params() const {
		return n_params_;
	}

	// ========================================================================
	// Degrees of freedom
	// ========================================================================

	/// Residual degrees of freedom: N - p
	size_t df_residual() const {
		return n_obs_ - n_params_;
	}

	/// Model degrees of freedom, excluding the intercept
	size_t df_model() const {
		return has_intercept_ ? n_params_ - 1 : n_params_;
	}

	// ========================================================================
	// Sum-of-squares decomposition
	// ========================================================================

	/// Σ e²
	double ss_error() const {
		return ss_error_;
	}

	/// Σ (y - ȳ)²
	double ss_total() const {
		return ss_total_;
	}

	/// SS_total - SS_error
	double ss_model() const {
		return ss_model_;
	}

	/// SS_error / df_residual
	double ms_error() const {
		return ms_error_;
	}

	/// sqrt(MS_error), the residual standard error
	double residual_standard_error() const {
		return residual_standard_error_;
	}

	// ========================================================================
	// Coefficient inference
	// ========================================================================

	const Eigen::VectorXd &std_errors() const {
		return std_errors_;
	}

	const Eigen::VectorXd &t_statistics() const {
		return t_statistics_;
	}

	/// p-values for H0: coef = 0 under the configured tail
	const Eigen::VectorXd &p_values() const {
		return p_values_;
	}

	const Eigen::VectorXd &ci_lower() const {
		return ci_lower_;
	}

	const Eigen::VectorXd &ci_upper() const {
		return ci_upper_;
	}

	double confidence_level() const {
		return confidence_level_;
	}

	Tail tail() const {
		return tail_;
	}

	// ========================================================================
	// Fit quality statistics
	// ========================================================================

	/// SS_model / SS_total
	double r_squared() const {
		return r_squared_;
	}

	/// 1 - (1-R²)(N-k0)/(N-p), k0 = 1 with an intercept
	double adj_r_squared() const {
		return adj_r_squared_;
	}

	/// False for intercept-only models (no slopes to test)
	bool has_f_statistic() const {
		return has_f_statistic_;
	}

	/// Overall F against the intercept-only (or empty) model
	double f_statistic() const {
		return f_statistic_;
	}

	double f_statistic_pvalue() const {
		return f_statistic_pvalue_;
	}

	/// Gaussian log-likelihood at the ML variance estimate SS_error / N
	double log_likelihood() const {
		return log_likelihood_;
	}

	/// -2 logL + 2(p + 1), counting the error variance as a parameter
	double aic() const {
		return aic_;
	}

	/// -2 logL + log(N)(p + 1)
	double bic() const {
		return bic_;
	}

	/// Decomposition used for the fit ("qr", "cholesky", "svd")
	const std::string &solver() const {
		return solver_;
	}

private:
	friend class solvers::OLSSolver;

	Eigen::VectorXd coefficients_;
	Eigen::VectorXd residuals_;
	Eigen::VectorXd fitted_values_;
	Eigen::VectorXd response_;
	Eigen::MatrixXd design_;
	Eigen::MatrixXd xtx_inverse_;
	std::vector<std::string> column_names_;

	bool has_intercept_ = false;
	bool implicit_intercept_ = false;
	size_t intercept_index_ = 0;
	size_t n_obs_ = 0;
	size_t n_params_ = 0;

	double ss_error_ = std::numeric_limits<double>::quiet_NaN();
	double ss_total_ = std::numeric_limits<double>::quiet_NaN();
	double ss_model_ = std::numeric_limits<double>::quiet_NaN();
	double ms_error_ = std::numeric_limits<double>::quiet_NaN();
	double residual_standard_error_ = std::numeric_limits<double>::quiet_NaN();

	Eigen::VectorXd std_errors_;
	Eigen::VectorXd t_statistics_;
	Eigen::VectorXd p_values_;
	Eigen::VectorXd ci_lower_;
	Eigen::VectorXd ci_upper_;
	double confidence_level_ = 0.95;
	Tail tail_ = Tail::TWO_SIDED;

	double r_squared_ = std::numeric_limits<double>::quiet_NaN();
	double adj_r_squared_ = std::numeric_limits<double>::quiet_NaN();
	bool has_f_statistic_ = false;
	double f_statistic_ = std::numeric_limits<double>::quiet_NaN();
	double f_statistic_pvalue_ = std::numeric_limits<double>::quiet_NaN();
	double log_likelihood_ = std::numeric_limits<double>::quiet_NaN();
	double aic_ = std::numeric_limits<double>::quiet_NaN();
	double bic_ = std::numeric_limits<double>::quiet_NaN();

	std::string solver_ = "qr";
};

} // namespace core
} // namespace libinfstat
