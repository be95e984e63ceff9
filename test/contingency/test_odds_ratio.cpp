#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <libinfstat/contingency/odds_ratio.hpp>
#include <libinfstat/core/errors.hpp>
#include <cmath>

using namespace libinfstat;
using namespace libinfstat::contingency;
using namespace libinfstat::core;

namespace {

ContingencyTable TwoByTwo(int64_t a, int64_t b, int64_t c, int64_t d) {
	CountMatrix counts(2, 2);
	counts << a, b,
	          c, d;
	return ContingencyTable::FromCounts(counts);
}

} // namespace

TEST_CASE("Odds Ratio: Seat Belt Table", "[contingency][odds_ratio]") {
	auto result = OddsRatio::Compute(TwoByTwo(1219, 36244, 3108, 239241));

	REQUIRE(result.status == OddsRatioStatus::FINITE);
	REQUIRE(result.is_finite());
	REQUIRE_THAT(result.odds_ratio, Catch::Matchers::WithinRel(2.58894117583142, 1e-10));
	REQUIRE_THAT(result.odds_row1, Catch::Matchers::WithinRel(1219.0 / 36244.0, 1e-12));
	REQUIRE_THAT(result.odds_row2, Catch::Matchers::WithinRel(3108.0 / 239241.0, 1e-12));

	// Woolf interval
	REQUIRE(result.has_interval);
	REQUIRE_THAT(result.log_std_error, Catch::Matchers::WithinAbs(0.034261720996749796, 1e-12));
	REQUIRE_THAT(result.ci_lower, Catch::Matchers::WithinRel(2.4207980063524874, 1e-6));
	REQUIRE_THAT(result.ci_upper, Catch::Matchers::WithinRel(2.7687631906201347, 1e-6));
	REQUIRE(result.ci_lower < result.odds_ratio);
	REQUIRE(result.ci_upper > result.odds_ratio);
}

TEST_CASE("Odds Ratio: No Association", "[contingency][odds_ratio]") {
	auto result = OddsRatio::Compute(TwoByTwo(10, 20, 30, 60));

	REQUIRE_THAT(result.odds_ratio, Catch::Matchers::WithinAbs(1.0, 1e-12));
	REQUIRE_THAT(result.log_odds_ratio, Catch::Matchers::WithinAbs(0.0, 1e-12));
}

TEST_CASE("Odds Ratio: Swapping Rows Inverts the Ratio", "[contingency][odds_ratio]") {
	auto forward = OddsRatio::Compute(TwoByTwo(12, 5, 7, 9));
	auto swapped = OddsRatio::Compute(TwoByTwo(7, 9, 12, 5));

	REQUIRE_THAT(forward.odds_ratio * swapped.odds_ratio, Catch::Matchers::WithinAbs(1.0, 1e-12));
	REQUIRE_THAT(forward.ci_lower * swapped.ci_upper, Catch::Matchers::WithinAbs(1.0, 1e-9));
}

TEST_CASE("Odds Ratio: Zero Cells", "[contingency][odds_ratio]") {
	SECTION("Zero in the denominator is infinite") {
		auto result = OddsRatio::Compute(TwoByTwo(10, 0, 5, 5));
		REQUIRE(result.status == OddsRatioStatus::INFINITE);
		REQUIRE(std::isinf(result.odds_ratio));
		REQUIRE(result.odds_ratio > 0.0);
		REQUIRE(std::isinf(result.odds_row1));
		REQUIRE_THAT(result.odds_row2, Catch::Matchers::WithinAbs(1.0, 1e-12));
		REQUIRE_FALSE(result.has_interval);
	}

	SECTION("Zero in the numerator is zero") {
		auto result = OddsRatio::Compute(TwoByTwo(0, 10, 5, 5));
		REQUIRE(result.status == OddsRatioStatus::ZERO);
		REQUIRE(result.odds_ratio == 0.0);
		REQUIRE(result.odds_row1 == 0.0);
		REQUIRE_THAT(result.odds_row2, Catch::Matchers::WithinAbs(1.0, 1e-12));
		REQUIRE_FALSE(result.has_interval);
	}

	SECTION("Zero in the off-diagonal with a finite row odds") {
		auto result = OddsRatio::Compute(TwoByTwo(10, 4, 0, 5));
		REQUIRE(result.status == OddsRatioStatus::INFINITE);
		REQUIRE_THAT(result.odds_row1, Catch::Matchers::WithinAbs(2.5, 1e-12));
		REQUIRE(result.odds_row2 == 0.0);
	}

	SECTION("Zeros on both diagonals are undefined") {
		auto result = OddsRatio::Compute(TwoByTwo(0, 0, 5, 5));
		REQUIRE(result.status == OddsRatioStatus::UNDEFINED);
		REQUIRE(std::isnan(result.odds_ratio));
		REQUIRE_FALSE(result.is_finite());
	}

	SECTION("Haldane correction always gives a finite ratio") {
		auto result = OddsRatio::Compute(TwoByTwo(10, 0, 5, 5), OddsRatioOptions::Haldane());
		REQUIRE(result.status == OddsRatioStatus::FINITE);
		REQUIRE(result.haldane_correction);
		// (10.5 * 5.5) / (0.5 * 5.5)
		REQUIRE_THAT(result.odds_ratio, Catch::Matchers::WithinAbs(21.0, 1e-12));
		REQUIRE(result.has_interval);
	}
}

TEST_CASE("Odds Ratio: Confidence Level", "[contingency][odds_ratio]") {
	OddsRatioOptions opts;
	opts.confidence_level = 0.99;

	auto narrow = OddsRatio::Compute(TwoByTwo(12, 5, 7, 9));
	auto wide = OddsRatio::Compute(TwoByTwo(12, 5, 7, 9), opts);

	REQUIRE(wide.confidence_level == 0.99);
	REQUIRE(wide.ci_lower < narrow.ci_lower);
	REQUIRE(wide.ci_upper > narrow.ci_upper);
}

TEST_CASE("Odds Ratio: Requires 2x2", "[contingency][odds_ratio][validation]") {
	CountMatrix counts(2, 3);
	counts << 1, 2, 3,
	          4, 5, 6;

	REQUIRE_THROWS_AS(OddsRatio::Compute(ContingencyTable::FromCounts(counts)), ShapeError);
}

TEST_CASE("Odds Ratio: Deterministic Results", "[contingency][odds_ratio]") {
	auto first = OddsRatio::Compute(TwoByTwo(1219, 36244, 3108, 239241));
	auto second = OddsRatio::Compute(TwoByTwo(1219, 36244, 3108, 239241));

	REQUIRE(first.odds_ratio == second.odds_ratio);
	REQUIRE(first.log_std_error == second.log_std_error);
	REQUIRE(first.ci_lower == second.ci_lower);
	REQUIRE(first.ci_upper == second.ci_upper);
}
