#pragma once

#include "libinfstat/core/errors.hpp"
#include "libinfstat/core/regression_result.hpp"
#include "libinfstat/core/test_result.hpp"
#include "libinfstat/inference/coefficient_inference.hpp"
#include "libinfstat/utils/distributions.hpp"
#include "libinfstat/utils/tracing.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

namespace libinfstat {
namespace inference {

/**
 * ModelComparison: F-test between nested linear models
 *
 * The reduced model must be fitted to the same response and its design
 * columns must be a strict subset of the full model's design columns.
 * Columns are matched by value; when both models carry column names the
 * names must agree as well.
 */
class ModelComparison {
public:
	/**
	 * Compare a full model against a reduced (nested) model
	 *
	 * F = [(SSE_reduced - SSE_full) / (p_full - p_reduced)] / MSE_full
	 *
	 * @param full Model with the larger predictor set
	 * @param reduced Model whose predictors are a strict subset of full's
	 * @return F statistic, degrees of freedom and upper-tail p-value
	 * @throws core::NotNestedError if the subset relationship does not hold
	 */
	static core::NestedModelComparison Compare(const core::FittedModel &full, const core::FittedModel &reduced);

	/**
	 * Check whether reduced is nested in full
	 *
	 * @param reason Receives a human-readable explanation when not nested
	 */
	static bool IsNested(const core::FittedModel &full, const core::FittedModel &reduced, std::string *reason = nullptr);

	/// Relative tolerance for matching response values and design columns
	static constexpr double kMatchTolerance = 1e-12;

private:
	static bool VectorsMatch(const Eigen::VectorXd &a, const Eigen::VectorXd &b);
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline bool ModelComparison::VectorsMatch(const Eigen::VectorXd &a, const Eigen::VectorXd &b) {
	if (a.size() != b.size()) {
		return false;
	}
	const double scale = std::max(1.0, std::max(a.cwiseAbs().maxCoeff(), b.cwiseAbs().maxCoeff()));
	return (a - b).cwiseAbs().maxCoeff() <= kMatchTolerance * scale;
}

inline bool ModelComparison::IsNested(const core::FittedModel &full, const core::FittedModel &reduced,
                                      std::string *reason) {
	auto fail = [reason](const std::string &why) {
		if (reason != nullptr) {
			*reason = why;
		}
		return false;
	};

	if (full.n_obs() != reduced.n_obs()) {
		return fail("models were fitted to different numbers of observations (" + std::to_string(full.n_obs()) +
		            " vs " + std::to_string(reduced.n_obs()) + ")");
	}
	if (!VectorsMatch(full.response(), reduced.response())) {
		return fail("models were fitted to different responses");
	}
	if (reduced.n_params() >= full.n_params()) {
		return fail("reduced model has " + std::to_string(reduced.n_params()) + " parameters, full model has " +
		            std::to_string(full.n_params()) + "; reduced must have strictly fewer");
	}

	const bool use_names = !full.column_names().empty() && !reduced.column_names().empty();
	std::vector<bool> used(full.n_params(), false);

	for (Eigen::Index j = 0; j < reduced.design().cols(); j++) {
		bool matched = false;
		for (Eigen::Index k = 0; k < full.design().cols(); k++) {
			const auto ku = static_cast<size_t>(k);
			if (used[ku]) {
				continue;
			}
			if (use_names && full.column_names()[ku] != reduced.column_names()[static_cast<size_t>(j)]) {
				continue;
			}
			if (VectorsMatch(full.design().col(k), reduced.design().col(j))) {
				used[ku] = true;
				matched = true;
				break;
			}
		}
		if (!matched) {
			const std::string label =
			    use_names ? "'" + reduced.column_names()[static_cast<size_t>(j)] + "'" : std::to_string(j);
			return fail("reduced model column " + label + " does not appear in the full model");
		}
	}
	return true;
}

inline core::NestedModelComparison ModelComparison::Compare(const core::FittedModel &full,
                                                            const core::FittedModel &reduced) {
	std::string reason;
	if (!IsNested(full, reduced, &reason)) {
		INFSTAT_WARN("Rejecting model comparison: " << reason);
		throw core::NotNestedError("models are not nested: " + reason);
	}

	core::NestedModelComparison comparison;
	comparison.df1 = full.n_params() - reduced.n_params();
	comparison.df2 = full.df_residual();
	comparison.ss_error_full = full.ss_error();
	comparison.ss_error_reduced = reduced.ss_error();
	comparison.delta_r_squared = full.r_squared() - reduced.r_squared();

	// Adding columns can only lower SSE; a negative difference is rounding noise
	const double delta_sse = std::max(0.0, reduced.ss_error() - full.ss_error());
	const double mse_full = std::max(full.ms_error(), CoefficientInference::kMinMse);

	comparison.f_statistic = (delta_sse / static_cast<double>(comparison.df1)) / mse_full;
	comparison.p_value = utils::f_sf(comparison.f_statistic, static_cast<double>(comparison.df1),
	                                 static_cast<double>(comparison.df2));

	INFSTAT_DEBUG("Nested F-test: F(" << comparison.df1 << ", " << comparison.df2 << ") = " << comparison.f_statistic
	                                  << ", p = " << comparison.p_value);

	return comparison;
}

} // namespace inference
} // namespace libinfstat
