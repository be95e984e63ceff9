#pragma once

#include <cstdint>
#include <string>
#include <stdexcept>

namespace libinfstat {
namespace core {

/**
 * Options for Pearson chi-squared tests
 */
struct ChiSquaredOptions {
	/// Apply Yates' continuity correction (2x2 independence tests only)
	/// Default: false
	bool continuity_correction = false;

	/// Allowed deviation of sum(expected proportions) from 1
	/// Default: 1e-8
	double proportion_tolerance = 1e-8;

	ChiSquaredOptions() = default;

	static ChiSquaredOptions Yates() {
		ChiSquaredOptions opts;
		opts.continuity_correction = true;
		return opts;
	}

	void Validate() const {
		if (!(proportion_tolerance >= 0.0)) {
			throw std::invalid_argument("proportion_tolerance must be non-negative (got " +
			                            std::to_string(proportion_tolerance) + ")");
		}
	}
};

/**
 * Options for 2x2 odds ratios
 */
struct OddsRatioOptions {
	/// Add 0.5 to every cell before computing the ratio (Haldane-Anscombe)
	/// Default: false
	bool haldane_correction = false;

	/// Confidence level for the Woolf (log-scale) interval
	/// Default: 0.95
	double confidence_level = 0.95;

	OddsRatioOptions() = default;

	static OddsRatioOptions Haldane() {
		OddsRatioOptions opts;
		opts.haldane_correction = true;
		return opts;
	}

	void Validate() const {
		if (!(confidence_level > 0.0 && confidence_level < 1.0)) {
			throw std::invalid_argument("confidence_level must be in (0, 1) (got " +
			                            std::to_string(confidence_level) + ")");
		}
	}
};

/// Sampling plan that produced a contingency table
enum class SamplingPlan : uint8_t {
	/// One margin fixed by design; one multinomial per level of that margin
	INDEPENDENT_MULTINOMIAL_FIXED_MARGIN = 0,
	/// Only the grand total fixed; one multinomial over all cells
	JOINT_MULTINOMIAL = 1
};

/// Which margin is fixed under the independent-multinomial plan
enum class FixedMargin : uint8_t { ROWS = 0, COLUMNS = 1 };

inline std::string SamplingPlanName(SamplingPlan plan) {
	switch (plan) {
	case SamplingPlan::INDEPENDENT_MULTINOMIAL_FIXED_MARGIN:
		return "independent-multinomial-fixed-margin";
	case SamplingPlan::JOINT_MULTINOMIAL:
	default:
		return "joint-multinomial";
	}
}

/**
 * Options for the Gunel-Dickey contingency Bayes factor
 */
struct BayesFactorOptions {
	/// Symmetric Dirichlet concentration on each cell
	/// Default: 1.0 (uniform prior)
	double prior_concentration = 1.0;

	/// Margin fixed by design (only used by the independent-multinomial plan)
	/// Default: rows
	FixedMargin fixed_margin = FixedMargin::ROWS;

	BayesFactorOptions() = default;

	static BayesFactorOptions FixedColumns(double prior_concentration_ = 1.0) {
		BayesFactorOptions opts;
		opts.prior_concentration = prior_concentration_;
		opts.fixed_margin = FixedMargin::COLUMNS;
		return opts;
	}

	void Validate() const {
		if (!(prior_concentration > 0.0)) {
			throw std::invalid_argument("prior_concentration must be positive (got " +
			                            std::to_string(prior_concentration) + ")");
		}
	}
};

} // namespace core
} // namespace libinfstat
