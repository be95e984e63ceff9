#pragma once

#include "libinfstat/core/contingency_options.hpp"
#include "libinfstat/core/contingency_table.hpp"
#include "libinfstat/core/errors.hpp"
#include "libinfstat/core/test_result.hpp"
#include "libinfstat/utils/distributions.hpp"
#include <cmath>
#include <limits>
#include <string>

namespace libinfstat {
namespace contingency {

/**
 * Odds ratio of a 2 × 2 table
 *
 * OR = (n11 / n12) / (n21 / n22). Zero cells never produce a silent NaN:
 * the result status says whether the ratio is zero, infinite or undefined.
 * The Haldane-Anscombe option adds 0.5 to every cell, which always gives
 * a finite ratio.
 */
class OddsRatio {
public:
	/**
	 * @throws core::ShapeError if the table is not 2 × 2
	 */
	static core::OddsRatioResult Compute(const core::ContingencyTable &table,
	                                     const core::OddsRatioOptions &options = core::OddsRatioOptions());
};

inline core::OddsRatioResult OddsRatio::Compute(const core::ContingencyTable &table,
                                                const core::OddsRatioOptions &options) {
	options.Validate();

	if (table.rows() != 2 || table.cols() != 2) {
		throw core::ShapeError("odds ratio requires a 2 x 2 table (got " + std::to_string(table.rows()) + " x " +
		                       std::to_string(table.cols()) + ")");
	}

	const double shift = options.haldane_correction ? 0.5 : 0.0;
	const double a = static_cast<double>(table.count(0, 0)) + shift;
	const double b = static_cast<double>(table.count(0, 1)) + shift;
	const double c = static_cast<double>(table.count(1, 0)) + shift;
	const double d = static_cast<double>(table.count(1, 1)) + shift;

	core::OddsRatioResult result;
	result.haldane_correction = options.haldane_correction;
	result.confidence_level = options.confidence_level;

	const double numerator = a * d;
	const double denominator = b * c;

	if (numerator == 0.0 && denominator == 0.0) {
		result.status = core::OddsRatioStatus::UNDEFINED;
		return result;
	}
	if (denominator == 0.0) {
		result.status = core::OddsRatioStatus::INFINITE;
		result.odds_ratio = std::numeric_limits<double>::infinity();
		// a and d are positive here, so at most one of the odds is infinite
		result.odds_row1 = a / b;
		result.odds_row2 = c / d;
		return result;
	}
	if (numerator == 0.0) {
		result.status = core::OddsRatioStatus::ZERO;
		result.odds_ratio = 0.0;
		result.odds_row1 = a / b;
		result.odds_row2 = c / d;
		return result;
	}

	result.status = core::OddsRatioStatus::FINITE;
	result.odds_row1 = a / b;
	result.odds_row2 = c / d;
	result.odds_ratio = result.odds_row1 / result.odds_row2;

	// Woolf interval on the log scale
	result.log_odds_ratio = std::log(result.odds_ratio);
	result.log_std_error = std::sqrt(1.0 / a + 1.0 / b + 1.0 / c + 1.0 / d);
	const double z = utils::normal_quantile(1.0 - (1.0 - options.confidence_level) / 2.0);
	result.ci_lower = std::exp(result.log_odds_ratio - z * result.log_std_error);
	result.ci_upper = std::exp(result.log_odds_ratio + z * result.log_std_error);
	result.has_interval = true;

	return result;
}

} // namespace contingency
} // namespace libinfstat
