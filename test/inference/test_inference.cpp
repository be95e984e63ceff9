#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <libinfstat/inference/coefficient_inference.hpp>
#include <libinfstat/inference/coefficient_inference_impl.hpp>
#include <libinfstat/utils/distributions.hpp>
#include <Eigen/Dense>
#include <cmath>

using namespace libinfstat;
using namespace libinfstat::inference;

const double TOLERANCE = 1e-10;

TEST_CASE("Inference: Standard Errors", "[inference]") {
	Eigen::MatrixXd xtx_inv(2, 2);
	xtx_inv << 0.5, -0.1,
	           -0.1, 0.04;

	auto se = CoefficientInference::ComputeStdErrors(2.0, xtx_inv);

	REQUIRE(se.size() == 2);
	REQUIRE_THAT(se(0), Catch::Matchers::WithinAbs(1.0, TOLERANCE));
	REQUIRE_THAT(se(1), Catch::Matchers::WithinAbs(std::sqrt(0.08), TOLERANCE));
}

TEST_CASE("Inference: Zero Residual Variance Is Floored", "[inference]") {
	Eigen::MatrixXd xtx_inv = Eigen::MatrixXd::Identity(2, 2);
	Eigen::Vector2d coefs(1.0, 2.0);

	auto se = CoefficientInference::ComputeStdErrors(0.0, xtx_inv);
	REQUIRE(se(0) > 0.0);

	// A perfect fit still yields finite t-statistics and p-values
	auto inf = CoefficientInference::ComputeInference(coefs, xtx_inv, 0.0, 3, 0.95, core::Tail::TWO_SIDED);
	REQUIRE(std::isfinite(inf.t_statistics(0)));
	REQUIRE(std::isfinite(inf.p_values(1)));
	REQUIRE(inf.p_values(1) < 1e-6);
}

TEST_CASE("Inference: T-Statistics and P-Values", "[inference]") {
	Eigen::Vector3d coefs(2.0, -1.0, 0.0);
	Eigen::Vector3d se(0.5, 0.5, 0.5);

	auto t = CoefficientInference::ComputeTStatistics(coefs, se);
	REQUIRE_THAT(t(0), Catch::Matchers::WithinAbs(4.0, TOLERANCE));
	REQUIRE_THAT(t(1), Catch::Matchers::WithinAbs(-2.0, TOLERANCE));
	REQUIRE_THAT(t(2), Catch::Matchers::WithinAbs(0.0, TOLERANCE));

	SECTION("Two-sided") {
		auto p = CoefficientInference::ComputePValues(t, 10, core::Tail::TWO_SIDED);
		REQUIRE_THAT(p(0), Catch::Matchers::WithinAbs(utils::student_t_pvalue(4.0, 10.0), TOLERANCE));
		REQUIRE_THAT(p(2), Catch::Matchers::WithinAbs(1.0, TOLERANCE));
		for (Eigen::Index j = 0; j < 3; j++) {
			REQUIRE(p(j) >= 0.0);
			REQUIRE(p(j) <= 1.0);
		}
	}

	SECTION("Upper tail") {
		auto p = CoefficientInference::ComputePValues(t, 10, core::Tail::GREATER);
		REQUIRE(p(0) < 0.01);
		REQUIRE(p(1) > 0.9);
		REQUIRE_THAT(p(2), Catch::Matchers::WithinAbs(0.5, TOLERANCE));
	}

	SECTION("Lower tail") {
		auto p = CoefficientInference::ComputePValues(t, 10, core::Tail::LESS);
		REQUIRE(p(0) > 0.99);
		REQUIRE(p(1) < 0.05);
	}

	REQUIRE_THROWS_AS(CoefficientInference::ComputeTStatistics(coefs, Eigen::Vector2d(1.0, 1.0)),
	                  std::invalid_argument);
}

TEST_CASE("Inference: Confidence Intervals", "[inference]") {
	Eigen::Vector2d coefs(1.0, 3.0);
	Eigen::Vector2d se(0.2, 1.0);

	auto ci = CoefficientInference::ComputeConfidenceIntervals(coefs, se, 10, 0.95);
	const double t_crit = 2.228138851986274;

	REQUIRE_THAT(ci.first(0), Catch::Matchers::WithinAbs(1.0 - t_crit * 0.2, 1e-6));
	REQUIRE_THAT(ci.second(1), Catch::Matchers::WithinAbs(3.0 + t_crit, 1e-6));
	REQUIRE(ci.first(1) < coefs(1));
	REQUIRE(ci.second(1) > coefs(1));
}

TEST_CASE("Inference: Full Computation", "[inference]") {
	Eigen::Vector2d coefs(0.05, 1.99);
	Eigen::MatrixXd xtx_inv(2, 2);
	xtx_inv << 1.1, -0.3,
	           -0.3, 0.1;
	const double mse = 0.107 / 3.0;

	auto inf = CoefficientInference::ComputeInference(coefs, xtx_inv, mse, 3, 0.95, core::Tail::TWO_SIDED);

	REQUIRE(inf.degrees_of_freedom == 3);
	REQUIRE(inf.tail == core::Tail::TWO_SIDED);
	REQUIRE_THAT(inf.std_errors(1), Catch::Matchers::WithinAbs(0.05972157622389642, 1e-9));
	REQUIRE_THAT(inf.p_values(1), Catch::Matchers::WithinRel(5.941539111755358e-05, 1e-6));

	SECTION("Zero degrees of freedom") {
		REQUIRE_THROWS_AS(
		    CoefficientInference::ComputeInference(coefs, xtx_inv, mse, 0, 0.95, core::Tail::TWO_SIDED),
		    std::invalid_argument);
	}

	SECTION("Mis-shaped inverse") {
		REQUIRE_THROWS_AS(CoefficientInference::ComputeInference(coefs, Eigen::MatrixXd::Identity(3, 3), mse, 3,
		                                                         0.95, core::Tail::TWO_SIDED),
		                  std::invalid_argument);
	}
}
