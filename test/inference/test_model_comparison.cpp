#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <libinfstat/core/errors.hpp>
#include <libinfstat/design/design_matrix.hpp>
#include <libinfstat/inference/model_comparison.hpp>
#include <libinfstat/solvers/ols_solver.hpp>
#include <Eigen/Dense>
#include <random>
#include <string>
#include <vector>

using namespace libinfstat;
using namespace libinfstat::inference;
using namespace libinfstat::solvers;
using namespace libinfstat::core;

namespace {

// Two groups with different slopes over x = 1..12
struct GroupedData {
	Eigen::VectorXd x;
	Eigen::VectorXd group;
	Eigen::VectorXd y;

	GroupedData() : x(12), group(12), y(12) {
		for (int i = 0; i < 12; i++) {
			x(i) = i + 1;
			group(i) = i % 2;
		}
		y << 3.1, 5.9, 4.8, 8.7, 7.2, 11.9, 9.1, 14.6, 10.8, 17.9, 13.2, 20.3;
	}

	Eigen::MatrixXd Full() const {
		Eigen::MatrixXd X(12, 3);
		X << x, group, x.cwiseProduct(group);
		return X;
	}

	// Main effects only, without the x:group interaction
	Eigen::MatrixXd MainEffects() const {
		Eigen::MatrixXd X(12, 2);
		X << x, group;
		return X;
	}

	Eigen::MatrixXd Reduced() const {
		return Eigen::MatrixXd(x);
	}
};

} // namespace

TEST_CASE("Model Comparison: Nested F-Test", "[inference][comparison]") {
	GroupedData data;
	auto full = OLSSolver::Fit(data.y, data.Full());
	auto reduced = OLSSolver::Fit(data.y, data.Reduced());

	REQUIRE(ModelComparison::IsNested(full, reduced));

	auto cmp = ModelComparison::Compare(full, reduced);

	REQUIRE(cmp.df1 == 2);
	REQUIRE(cmp.df2 == 8);
	REQUIRE_THAT(cmp.ss_error_full, Catch::Matchers::WithinAbs(0.35523809523809396, 1e-9));
	REQUIRE_THAT(cmp.ss_error_reduced, Catch::Matchers::WithinAbs(53.443881118881116, 1e-9));
	REQUIRE_THAT(cmp.f_statistic, Catch::Matchers::WithinRel(597.780967022256, 1e-8));
	REQUIRE_THAT(cmp.p_value, Catch::Matchers::WithinRel(1.95202858851647e-09, 1e-6));
	REQUIRE_THAT(cmp.delta_r_squared, Catch::Matchers::WithinAbs(0.9988208353338431 - 0.8226002867304059, 1e-9));
}

TEST_CASE("Model Comparison: Interaction Term Only", "[inference][comparison]") {
	GroupedData data;
	auto full = OLSSolver::Fit(data.y, data.Full());
	auto main_effects = OLSSolver::Fit(data.y, data.MainEffects());

	REQUIRE(ModelComparison::IsNested(full, main_effects));

	auto cmp = ModelComparison::Compare(full, main_effects);
	REQUIRE(cmp.df1 == 1);
	REQUIRE(cmp.df2 == 8);
	REQUIRE(cmp.ss_error_full < cmp.ss_error_reduced);
	REQUIRE(cmp.f_statistic > 0.0);
	REQUIRE(cmp.p_value < 1e-4);

	// One added term: F equals the squared t of the interaction coefficient
	const double t = full.t_statistics()(3);
	REQUIRE_THAT(cmp.f_statistic, Catch::Matchers::WithinRel(t * t, 1e-9));
	REQUIRE_THAT(cmp.p_value, Catch::Matchers::WithinRel(full.p_values()(3), 1e-8));
}

TEST_CASE("Model Comparison: Single Added Term Matches t-Test", "[inference][comparison]") {
	GroupedData data;
	Eigen::MatrixXd two(12, 2);
	two << data.x, data.group;

	auto full = OLSSolver::Fit(data.y, two);
	auto reduced = OLSSolver::Fit(data.y, data.Reduced());
	auto cmp = ModelComparison::Compare(full, reduced);

	// F(1, df) = t² for the added coefficient
	const double t = full.t_statistics()(2);
	REQUIRE(cmp.df1 == 1);
	REQUIRE_THAT(cmp.f_statistic, Catch::Matchers::WithinRel(t * t, 1e-9));
	REQUIRE_THAT(cmp.p_value, Catch::Matchers::WithinRel(full.p_values()(2), 1e-8));
}

TEST_CASE("Model Comparison: Against Intercept-Only Model", "[inference][comparison]") {
	GroupedData data;
	auto full = OLSSolver::Fit(data.y, data.Full());
	auto null_model = OLSSolver::Fit(data.y, Eigen::MatrixXd::Ones(12, 1), RegressionOptions::OLS(false));

	auto cmp = ModelComparison::Compare(full, null_model);

	// Equivalent to the overall F-test of the full model
	REQUIRE(cmp.df1 == 3);
	REQUIRE_THAT(cmp.f_statistic, Catch::Matchers::WithinRel(full.f_statistic(), 1e-9));
	REQUIRE_THAT(cmp.p_value, Catch::Matchers::WithinRel(full.f_statistic_pvalue(), 1e-6));
}

TEST_CASE("Model Comparison: Column Order Does Not Matter", "[inference][comparison]") {
	GroupedData data;
	Eigen::MatrixXd shuffled(12, 3);
	shuffled << data.x.cwiseProduct(data.group), data.x, data.group;

	auto full = OLSSolver::Fit(data.y, shuffled);
	auto reduced = OLSSolver::Fit(data.y, data.Reduced());
	auto reference = ModelComparison::Compare(OLSSolver::Fit(data.y, data.Full()), reduced);
	auto cmp = ModelComparison::Compare(full, reduced);

	REQUIRE_THAT(cmp.f_statistic, Catch::Matchers::WithinRel(reference.f_statistic, 1e-9));
}

TEST_CASE("Model Comparison: Named Columns From the Design Builder", "[inference][comparison]") {
	GroupedData data;
	std::vector<std::string> group;
	for (Eigen::Index i = 0; i < data.group.size(); i++) {
		group.push_back(data.group(i) > 0.5 ? "treated" : "control");
	}

	design::DesignMatrixBuilder full_design(12);
	full_design.AddIntercept().AddColumn("x", data.x).AddDummyCoded("arm", group).AddInteraction("x", "arm[treated]");
	design::DesignMatrixBuilder reduced_design(12);
	reduced_design.AddIntercept().AddColumn("x", data.x);

	auto full = OLSSolver::Fit(data.y, full_design.AsMatrix(), full_design.column_names(), RegressionOptions::OLS(false));
	auto reduced =
	    OLSSolver::Fit(data.y, reduced_design.AsMatrix(), reduced_design.column_names(), RegressionOptions::OLS(false));

	auto cmp = ModelComparison::Compare(full, reduced);
	REQUIRE(cmp.df1 == 2);
	REQUIRE_THAT(cmp.f_statistic, Catch::Matchers::WithinRel(597.780967022256, 1e-8));

	SECTION("Renamed column breaks nesting") {
		design::DesignMatrixBuilder renamed(12);
		renamed.AddIntercept().AddColumn("dose", data.x);
		auto other =
		    OLSSolver::Fit(data.y, renamed.AsMatrix(), renamed.column_names(), RegressionOptions::OLS(false));

		std::string reason;
		REQUIRE_FALSE(ModelComparison::IsNested(full, other, &reason));
		REQUIRE(reason.find("'dose'") != std::string::npos);
		REQUIRE_THROWS_AS(ModelComparison::Compare(full, other), NotNestedError);
	}
}

TEST_CASE("Model Comparison: Non-Nested Models", "[inference][comparison][validation]") {
	GroupedData data;
	auto full = OLSSolver::Fit(data.y, data.Full());

	SECTION("Reduced has a column the full model lacks") {
		Eigen::VectorXd x2 = data.x.array().square();
		auto other = OLSSolver::Fit(data.y, Eigen::MatrixXd(x2));
		REQUIRE_THROWS_AS(ModelComparison::Compare(full, other), NotNestedError);
	}

	SECTION("Same number of parameters") {
		REQUIRE_THROWS_AS(ModelComparison::Compare(full, full), NotNestedError);
	}

	SECTION("Arguments swapped") {
		auto reduced = OLSSolver::Fit(data.y, data.Reduced());
		REQUIRE_THROWS_AS(ModelComparison::Compare(reduced, full), NotNestedError);
	}

	SECTION("Different response") {
		Eigen::VectorXd y2 = data.y * 2.0;
		auto reduced = OLSSolver::Fit(y2, data.Reduced());
		std::string reason;
		REQUIRE_FALSE(ModelComparison::IsNested(full, reduced, &reason));
		REQUIRE(reason.find("response") != std::string::npos);
		REQUIRE_THROWS_AS(ModelComparison::Compare(full, reduced), NotNestedError);
	}

	SECTION("Different observations") {
		Eigen::VectorXd y_short = data.y.head(10);
		Eigen::MatrixXd x_short = data.Reduced().topRows(10);
		auto reduced = OLSSolver::Fit(y_short, x_short);
		REQUIRE_THROWS_AS(ModelComparison::Compare(full, reduced), NotNestedError);
	}

	SECTION("Nested errors are invalid_argument") {
		auto reduced = OLSSolver::Fit(data.y, data.Reduced());
		REQUIRE_THROWS_AS(ModelComparison::Compare(reduced, full), std::invalid_argument);
	}
}

TEST_CASE("Model Comparison: Synthetic Signal and Noise Predictors", "[inference][comparison]") {
	const Eigen::Index n = 200;
	std::mt19937 rng(20240917);
	std::normal_distribution<double> noise(0.0, 1.0);

	Eigen::MatrixXd X(n, 2);
	Eigen::VectorXd y(n);
	for (Eigen::Index i = 0; i < n; i++) {
		X(i, 0) = noise(rng);
		X(i, 1) = noise(rng);
		// Only the first column carries signal
		y(i) = 1.5 + 3.0 * X(i, 0) + noise(rng);
	}

	auto both = OLSSolver::Fit(y, X);
	auto signal_only = OLSSolver::Fit(y, Eigen::MatrixXd(X.col(0)));
	auto noise_only = OLSSolver::Fit(y, Eigen::MatrixXd(X.col(1)));

	SECTION("Dropping the noise column is not significant") {
		auto cmp = ModelComparison::Compare(both, signal_only);
		REQUIRE(cmp.ss_error_full <= cmp.ss_error_reduced);
		REQUIRE(cmp.f_statistic >= 0.0);
		REQUIRE(cmp.p_value > 1e-4);
	}

	SECTION("Dropping the signal column is highly significant") {
		auto cmp = ModelComparison::Compare(both, noise_only);
		REQUIRE(cmp.ss_error_full < cmp.ss_error_reduced);
		REQUIRE(cmp.p_value < 1e-12);
		REQUIRE(cmp.delta_r_squared > 0.5);
	}
}
