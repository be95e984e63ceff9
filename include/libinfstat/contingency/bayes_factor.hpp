#pragma once

#include "libinfstat/core/contingency_options.hpp"
#include "libinfstat/core/contingency_table.hpp"
#include "libinfstat/core/errors.hpp"
#include "libinfstat/core/test_result.hpp"
#include "libinfstat/utils/distributions.hpp"
#include "libinfstat/utils/tracing.hpp"
#include <Eigen/Dense>
#include <cfloat>
#include <cmath>
#include <string>

namespace libinfstat {
namespace contingency {

/**
 * Gunel-Dickey Bayes factor for association in a contingency table
 *
 * K = m(y | association) / m(y | independence), with cell or conditional
 * probabilities integrated out analytically against a symmetric
 * Dirichlet(a) prior. With D(α) the multivariate Beta function, y the
 * I × J counts, r the row totals and c the column totals:
 *
 * Joint multinomial (only N fixed):
 *   m1 = D(y + a) / D(a)                         over all I·J cells
 *   m0 = D(r + ξ)/D(ξ) · D(c + ζ)/D(ζ)           ξ_i = J a - (J-1), ζ_j = I a - (I-1)
 *
 * Independent multinomial, rows fixed by design:
 *   m1 = Π_i D(y_i + a) / D(a)                   one Dirichlet per row
 *   m0 = D(c + ζ) / D(ζ)                         ζ_j = I a - (I-1)
 *
 * The margin concentrations ξ, ζ are the ones induced by the cell prior
 * (Gunel and Dickey 1974), so with a = 1 every prior is uniform. The
 * multinomial coefficients are identical under both hypotheses and cancel.
 *
 * The two plans answer different questions and give different K for the
 * same table; every result carries the plan it was computed under.
 */
class BayesFactor {
public:
	/**
	 * @param table Observed counts
	 * @param plan Sampling plan that produced the table
	 * @param options Prior concentration and, for the fixed-margin plan, which margin is fixed
	 * @throws core::ShapeError if the table has fewer than two rows or columns
	 * @throws core::DegenerateMarginError if the table has no observations
	 * @throws std::invalid_argument if the prior concentration induces a non-positive margin prior
	 */
	static core::BayesFactorResult Compute(const core::ContingencyTable &table, core::SamplingPlan plan,
	                                       const core::BayesFactorOptions &options = core::BayesFactorOptions());

	/// log m1 - log m0 for the joint multinomial plan
	static double LogBayesFactorJoint(const Eigen::MatrixXd &counts, double a);

	/// log m1 - log m0 with the rows of counts fixed by design
	static double LogBayesFactorFixedRows(const Eigen::MatrixXd &counts, double a);

private:
	static Eigen::ArrayXd Flatten(const Eigen::MatrixXd &m) {
		return Eigen::Map<const Eigen::ArrayXd>(m.data(), m.size());
	}
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline double BayesFactor::LogBayesFactorJoint(const Eigen::MatrixXd &counts, double a) {
	const auto I = static_cast<double>(counts.rows());
	const auto J = static_cast<double>(counts.cols());

	const Eigen::ArrayXd cells = Flatten(counts);
	const Eigen::ArrayXd prior_cells = Eigen::ArrayXd::Constant(cells.size(), a);
	const double log_m1 = utils::log_multivariate_beta(cells + a) - utils::log_multivariate_beta(prior_cells);

	const Eigen::ArrayXd row_totals = counts.rowwise().sum().array();
	const Eigen::ArrayXd col_totals = counts.colwise().sum().transpose().array();
	const Eigen::ArrayXd xi = Eigen::ArrayXd::Constant(row_totals.size(), J * a - (J - 1.0));
	const Eigen::ArrayXd zeta = Eigen::ArrayXd::Constant(col_totals.size(), I * a - (I - 1.0));
	const double log_m0 = utils::log_multivariate_beta(row_totals + xi) - utils::log_multivariate_beta(xi) +
	                      utils::log_multivariate_beta(col_totals + zeta) - utils::log_multivariate_beta(zeta);

	return log_m1 - log_m0;
}

inline double BayesFactor::LogBayesFactorFixedRows(const Eigen::MatrixXd &counts, double a) {
	const auto I = static_cast<double>(counts.rows());

	const Eigen::ArrayXd prior_row = Eigen::ArrayXd::Constant(counts.cols(), a);
	const double log_prior_row = utils::log_multivariate_beta(prior_row);
	double log_m1 = 0.0;
	for (Eigen::Index i = 0; i < counts.rows(); i++) {
		const Eigen::ArrayXd row = counts.row(i).transpose().array();
		log_m1 += utils::log_multivariate_beta(row + a) - log_prior_row;
	}

	const Eigen::ArrayXd col_totals = counts.colwise().sum().transpose().array();
	const Eigen::ArrayXd zeta = Eigen::ArrayXd::Constant(col_totals.size(), I * a - (I - 1.0));
	const double log_m0 = utils::log_multivariate_beta(col_totals + zeta) - utils::log_multivariate_beta(zeta);

	return log_m1 - log_m0;
}

inline core::BayesFactorResult BayesFactor::Compute(const core::ContingencyTable &table, core::SamplingPlan plan,
                                                    const core::BayesFactorOptions &options) {
	options.Validate();

	if (table.rows() < 2 || table.cols() < 2) {
		throw core::ShapeError("Bayes factor needs at least a 2 x 2 table (got " + std::to_string(table.rows()) +
		                       " x " + std::to_string(table.cols()) + ")");
	}
	if (!(table.GrandTotal() > 0.0)) {
		throw core::DegenerateMarginError("Bayes factor needs at least one observation");
	}

	const double a = options.prior_concentration;
	const auto J = static_cast<double>(table.cols());

	// Orient the table so the fixed margin is always the rows
	Eigen::MatrixXd counts = table.AsDouble();
	if (plan == core::SamplingPlan::INDEPENDENT_MULTINOMIAL_FIXED_MARGIN &&
	    options.fixed_margin == core::FixedMargin::COLUMNS) {
		counts.transposeInPlace();
	}

	// Induced margin concentrations must stay positive
	const double oriented_rows = static_cast<double>(counts.rows());
	const bool zeta_ok = oriented_rows * a - (oriented_rows - 1.0) > 0.0;
	const bool xi_ok = plan != core::SamplingPlan::JOINT_MULTINOMIAL || J * a - (J - 1.0) > 0.0;
	if (!zeta_ok || !xi_ok) {
		throw std::invalid_argument("prior_concentration " + std::to_string(a) + " is too small for a " +
		                            std::to_string(table.rows()) + " x " + std::to_string(table.cols()) +
		                            " table; the induced margin prior would be improper");
	}

	core::BayesFactorResult result;
	result.plan = plan;
	result.fixed_margin = options.fixed_margin;
	result.prior_concentration = a;
	result.log_bayes_factor = (plan == core::SamplingPlan::JOINT_MULTINOMIAL) ? LogBayesFactorJoint(counts, a)
	                                                                           : LogBayesFactorFixedRows(counts, a);

	// exp() overflows past log(DBL_MAX); report the clamp instead of +inf
	const double log_max = std::log(DBL_MAX);
	if (result.log_bayes_factor > log_max) {
		result.bayes_factor = DBL_MAX;
		result.saturated = true;
	} else {
		result.bayes_factor = std::exp(result.log_bayes_factor);
	}

	INFSTAT_DEBUG("Bayes factor (" << result.plan_name() << "): log K = " << result.log_bayes_factor);
	return result;
}

} // namespace contingency
} // namespace libinfstat
