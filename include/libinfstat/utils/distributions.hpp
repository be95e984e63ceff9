#pragma once

#include <Eigen/Dense>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace libinfstat {
namespace utils {

/**
 * Sampling distributions used for significance testing
 *
 * Provides CDFs, survival functions and quantiles for:
 * - Student's t (two-sided p-values for coefficient tests)
 * - Chi-squared (goodness of fit, independence, G-test)
 * - F (nested model comparison, overall regression F)
 * - Standard normal (Woolf interval for the odds ratio)
 *
 * All functions are pure and deterministic. Survival functions are
 * evaluated directly from the incomplete beta/gamma functions instead of
 * as 1 - CDF, so small upper-tail probabilities keep relative accuracy.
 *
 * Degrees of freedom are doubles; integer df can be passed directly.
 */

namespace detail {

constexpr double kPi = 3.14159265358979323846;
constexpr double kEps = 1e-15;
constexpr double kFpMin = 1e-300;
constexpr int kMaxIterations = 100000;

inline void RequirePositiveDf(double df, const char *name) {
	if (!(df > 0.0) || !std::isfinite(df)) {
		throw std::invalid_argument(std::string(name) + " must be positive and finite (got " + std::to_string(df) +
		                            ")");
	}
}

inline void RequireProbability(double p) {
	if (!(p > 0.0 && p < 1.0)) {
		throw std::invalid_argument("probability must be in (0, 1) (got " + std::to_string(p) + ")");
	}
}

/**
 * Continued fraction for the incomplete beta function (modified Lentz)
 */
inline double BetaContinuedFraction(double x, double a, double b) {
	const double qab = a + b;
	const double qap = a + 1.0;
	const double qam = a - 1.0;

	double c = 1.0;
	double d = 1.0 - qab * x / qap;
	if (std::fabs(d) < kFpMin) {
		d = kFpMin;
	}
	d = 1.0 / d;
	double h = d;

	for (int m = 1; m <= kMaxIterations; m++) {
		const double m2 = 2.0 * m;

		// Even step
		double aa = m * (b - m) * x / ((qam + m2) * (a + m2));
		d = 1.0 + aa * d;
		if (std::fabs(d) < kFpMin) {
			d = kFpMin;
		}
		c = 1.0 + aa / c;
		if (std::fabs(c) < kFpMin) {
			c = kFpMin;
		}
		d = 1.0 / d;
		h *= d * c;

		// Odd step
		aa = -(a + m) * (qab + m) * x / ((a + m2) * (qap + m2));
		d = 1.0 + aa * d;
		if (std::fabs(d) < kFpMin) {
			d = kFpMin;
		}
		c = 1.0 + aa / c;
		if (std::fabs(c) < kFpMin) {
			c = kFpMin;
		}
		d = 1.0 / d;
		const double del = d * c;
		h *= del;

		if (std::fabs(del - 1.0) < kEps) {
			return h;
		}
	}
	throw std::runtime_error("incomplete beta continued fraction failed to converge");
}

/// Series for the lower regularized gamma function P(a, x), valid for x < a + 1
inline double GammaSeries(double a, double x, double log_gamma_a) {
	double ap = a;
	double sum = 1.0 / a;
	double del = sum;
	for (int n = 1; n <= kMaxIterations; n++) {
		ap += 1.0;
		del *= x / ap;
		sum += del;
		if (std::fabs(del) < std::fabs(sum) * kEps) {
			return sum * std::exp(-x + a * std::log(x) - log_gamma_a);
		}
	}
	throw std::runtime_error("incomplete gamma series failed to converge");
}

/// Continued fraction for the upper regularized gamma function Q(a, x), valid for x >= a + 1
inline double GammaContinuedFraction(double a, double x, double log_gamma_a) {
	double b = x + 1.0 - a;
	double c = 1.0 / kFpMin;
	double d = 1.0 / b;
	double h = d;
	for (int i = 1; i <= kMaxIterations; i++) {
		const double an = -i * (i - a);
		b += 2.0;
		d = an * d + b;
		if (std::fabs(d) < kFpMin) {
			d = kFpMin;
		}
		c = b + an / c;
		if (std::fabs(c) < kFpMin) {
			c = kFpMin;
		}
		d = 1.0 / d;
		const double del = d * c;
		h *= del;
		if (std::fabs(del - 1.0) < kEps) {
			return std::exp(-x + a * std::log(x) - log_gamma_a) * h;
		}
	}
	throw std::runtime_error("incomplete gamma continued fraction failed to converge");
}

/**
 * Find x with cdf(x) = p for a monotone non-decreasing CDF by bracketing and bisection
 *
 * @param lower Lower end of the support (-inf allowed)
 */
template <typename Cdf>
double InvertCdf(const Cdf &cdf, double p, double lower, double start) {
	double lo = std::isfinite(lower) ? lower : -start;
	double hi = start;

	// Expand the bracket until it contains the target
	int guard = 0;
	while (cdf(hi) < p && guard++ < 2000) {
		lo = hi;
		hi *= 2.0;
	}
	guard = 0;
	while (!std::isfinite(lower) && cdf(lo) > p && guard++ < 2000) {
		hi = lo;
		lo *= 2.0;
	}

	for (int i = 0; i < 400; i++) {
		const double mid = 0.5 * (lo + hi);
		if (mid == lo || mid == hi) {
			break;
		}
		if (cdf(mid) < p) {
			lo = mid;
		} else {
			hi = mid;
		}
	}
	return 0.5 * (lo + hi);
}

} // namespace detail

// ============================================================================
// Special functions
// ============================================================================

/**
 * Natural log of the gamma function for x > 0 (Lanczos, g = 7, n = 9)
 */
inline double log_gamma(double x) {
	static const double kCoefficients[9] = {0.99999999999980993,  676.5203681218851,     -1259.1392167224028,
	                                        771.32342877765313,   -176.61502916214059,   12.507343278686905,
	                                        -0.13857109526572012, 9.9843695780195716e-6, 1.5056327351493116e-7};

	if (!(x > 0.0)) {
		throw std::invalid_argument("log_gamma requires x > 0 (got " + std::to_string(x) + ")");
	}

	if (x < 0.5) {
		// Reflection: Γ(x)Γ(1-x) = π / sin(πx)
		return std::log(detail::kPi / std::sin(detail::kPi * x)) - log_gamma(1.0 - x);
	}

	const double z = x - 1.0;
	double a = kCoefficients[0];
	const double t = z + 7.5;
	for (int i = 1; i < 9; i++) {
		a += kCoefficients[i] / (z + static_cast<double>(i));
	}
	return 0.5 * std::log(2.0 * detail::kPi) + (z + 0.5) * std::log(t) - t + std::log(a);
}

/// log B(a, b) = log Γ(a) + log Γ(b) - log Γ(a+b)
inline double log_beta(double a, double b) {
	return log_gamma(a) + log_gamma(b) - log_gamma(a + b);
}

/**
 * Log of the multivariate Beta function
 *
 * log D(α) = Σ log Γ(α_k) - log Γ(Σ α_k)
 * This is the normalizing constant of a Dirichlet(α) density.
 */
inline double log_multivariate_beta(const Eigen::ArrayXd &alpha) {
	double sum_log = 0.0;
	double total = 0.0;
	for (Eigen::Index k = 0; k < alpha.size(); k++) {
		sum_log += log_gamma(alpha(k));
		total += alpha(k);
	}
	return sum_log - log_gamma(total);
}

/**
 * Regularized incomplete beta function I_x(a, b)
 */
inline double beta_inc_reg(double x, double a, double b) {
	if (!(a > 0.0) || !(b > 0.0)) {
		throw std::invalid_argument("beta_inc_reg requires a > 0 and b > 0");
	}
	if (x <= 0.0) {
		return 0.0;
	}
	if (x >= 1.0) {
		return 1.0;
	}

	const double log_front = a * std::log(x) + b * std::log1p(-x) - log_beta(a, b);
	const double front = std::exp(log_front);

	if (x < (a + 1.0) / (a + b + 2.0)) {
		return front * detail::BetaContinuedFraction(x, a, b) / a;
	}
	return 1.0 - front * detail::BetaContinuedFraction(1.0 - x, b, a) / b;
}

/// Regularized lower incomplete gamma function P(a, x)
inline double gamma_inc_reg(double a, double x) {
	if (!(a > 0.0)) {
		throw std::invalid_argument("gamma_inc_reg requires a > 0");
	}
	if (x <= 0.0) {
		return 0.0;
	}
	if (std::isinf(x)) {
		return 1.0;
	}
	const double lga = log_gamma(a);
	if (x < a + 1.0) {
		return detail::GammaSeries(a, x, lga);
	}
	return 1.0 - detail::GammaContinuedFraction(a, x, lga);
}

/// Regularized upper incomplete gamma function Q(a, x) = 1 - P(a, x)
inline double gamma_inc_reg_upper(double a, double x) {
	if (!(a > 0.0)) {
		throw std::invalid_argument("gamma_inc_reg_upper requires a > 0");
	}
	if (x <= 0.0) {
		return 1.0;
	}
	if (std::isinf(x)) {
		return 0.0;
	}
	const double lga = log_gamma(a);
	if (x < a + 1.0) {
		return 1.0 - detail::GammaSeries(a, x, lga);
	}
	return detail::GammaContinuedFraction(a, x, lga);
}

// ============================================================================
// Standard normal
// ============================================================================

inline double normal_cdf(double z) {
	return 0.5 * std::erfc(-z / std::sqrt(2.0));
}

inline double normal_quantile(double p) {
	detail::RequireProbability(p);
	return detail::InvertCdf([](double z) { return normal_cdf(z); }, p, -std::numeric_limits<double>::infinity(),
	                         1.0);
}

// ============================================================================
// Student's t
// ============================================================================

/**
 * CDF of Student's t distribution
 *
 * P(T <= t) = 1 - I_{df/(df+t²)}(df/2, 1/2) / 2 for t >= 0
 */
inline double student_t_cdf(double t, double df) {
	detail::RequirePositiveDf(df, "df");
	if (std::isnan(t)) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	const double x = df / (df + t * t);
	const double tail = 0.5 * beta_inc_reg(x, 0.5 * df, 0.5);
	return (t >= 0.0) ? (1.0 - tail) : tail;
}

/// Upper tail P(T > t)
inline double student_t_sf(double t, double df) {
	return student_t_cdf(-t, df);
}

/**
 * Two-tailed p-value P(|T| > |t|)
 *
 * Equal to 2 * (1 - CDF(|t|)), evaluated without the subtraction.
 */
inline double student_t_pvalue(double t, double df) {
	detail::RequirePositiveDf(df, "df");
	if (std::isnan(t)) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	const double x = df / (df + t * t);
	return beta_inc_reg(x, 0.5 * df, 0.5);
}

/// Quantile: t such that P(T <= t) = p
inline double student_t_quantile(double p, double df) {
	detail::RequireProbability(p);
	detail::RequirePositiveDf(df, "df");
	if (p == 0.5) {
		return 0.0;
	}
	return detail::InvertCdf([df](double t) { return student_t_cdf(t, df); }, p,
	                         -std::numeric_limits<double>::infinity(), 1.0);
}

/**
 * Upper critical value: t such that P(T > t) = alpha
 *
 * For a two-sided (1 - α) interval use student_t_critical(α / 2, df).
 */
inline double student_t_critical(double alpha, double df) {
	return student_t_quantile(1.0 - alpha, df);
}

// ============================================================================
// Chi-squared
// ============================================================================

inline double chi_squared_cdf(double x, double df) {
	detail::RequirePositiveDf(df, "df");
	return gamma_inc_reg(0.5 * df, 0.5 * x);
}

/// Survival function P(X > x), used for all chi-squared p-values
inline double chi_squared_sf(double x, double df) {
	detail::RequirePositiveDf(df, "df");
	return gamma_inc_reg_upper(0.5 * df, 0.5 * x);
}

inline double chi_squared_quantile(double p, double df) {
	detail::RequireProbability(p);
	detail::RequirePositiveDf(df, "df");
	return detail::InvertCdf([df](double x) { return chi_squared_cdf(x, df); }, p, 0.0, df + 1.0);
}

// ============================================================================
// F
// ============================================================================

/**
 * CDF of the F(df1, df2) distribution
 *
 * P(F <= f) = I_{df1 f / (df1 f + df2)}(df1/2, df2/2)
 */
inline double f_cdf(double f, double df1, double df2) {
	detail::RequirePositiveDf(df1, "df1");
	detail::RequirePositiveDf(df2, "df2");
	if (f <= 0.0) {
		return 0.0;
	}
	if (std::isinf(f)) {
		return 1.0;
	}
	return beta_inc_reg(df1 * f / (df1 * f + df2), 0.5 * df1, 0.5 * df2);
}

/// Survival function P(F > f) = I_{df2 / (df2 + df1 f)}(df2/2, df1/2)
inline double f_sf(double f, double df1, double df2) {
	detail::RequirePositiveDf(df1, "df1");
	detail::RequirePositiveDf(df2, "df2");
	if (f <= 0.0) {
		return 1.0;
	}
	if (std::isinf(f)) {
		return 0.0;
	}
	return beta_inc_reg(df2 / (df2 + df1 * f), 0.5 * df2, 0.5 * df1);
}

inline double f_quantile(double p, double df1, double df2) {
	detail::RequireProbability(p);
	detail::RequirePositiveDf(df1, "df1");
	detail::RequirePositiveDf(df2, "df2");
	return detail::InvertCdf([df1, df2](double f) { return f_cdf(f, df1, df2); }, p, 0.0, 1.0);
}

} // namespace utils
} // namespace libinfstat
