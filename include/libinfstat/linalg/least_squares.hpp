#pragma once

#include "libinfstat/core/errors.hpp"
#include "libinfstat/core/regression_options.hpp"
#include <Eigen/Dense>
#include <string>

namespace libinfstat {
namespace linalg {

/**
 * Solution of the least-squares normal equations X'X b = X'y
 */
struct LeastSquaresSolution {
	/// Coefficient estimates (length p)
	Eigen::VectorXd coefficients;

	/// (X'X)^-1 (p × p), scales the residual variance into coefficient covariances
	Eigen::MatrixXd xtx_inverse;

	/// Numerical rank found by the decomposition (always p on success)
	size_t rank = 0;

	/// Threshold used to decide the rank
	double threshold = -1.0;
};

/**
 * Dense least-squares kernel
 *
 * Solves the normal equations without forming (X'X)^-1 naively:
 * - "qr": ColPivHouseholderQR on X; (X'X)^-1 = P R^-1 R^-T P'
 * - "cholesky": LDLT on X'X with a relative pivot threshold
 * - "svd": JacobiSVD on X; (X'X)^-1 = V S^-2 V'
 *
 * Any rank deficiency raises SingularDesignError. A partial solution is
 * never returned.
 *
 * Stateless design (all methods are static).
 */
class LeastSquaresKernel {
public:
	/**
	 * Solve min ||y - X b||²
	 *
	 * @param X Design matrix (n × p), already including any intercept column
	 * @param y Response vector (length n)
	 * @param options Solver selection and rank tolerance
	 * @return Coefficients and (X'X)^-1
	 * @throws core::DimensionMismatchError if y.size() != X.rows()
	 * @throws core::SingularDesignError if X is not of full column rank
	 */
	static LeastSquaresSolution Solve(const Eigen::MatrixXd &X, const Eigen::VectorXd &y,
	                                  const core::RegressionOptions &options = core::RegressionOptions::OLS());

	/**
	 * Check if matrix is full column rank
	 *
	 * @param X Design matrix
	 * @param tolerance Threshold for rank determination (-1 = auto)
	 * @return true if rank(X) == ncol(X)
	 */
	static bool IsFullRank(const Eigen::MatrixXd &X, double tolerance = -1.0);

private:
	static LeastSquaresSolution SolveQR(const Eigen::MatrixXd &X, const Eigen::VectorXd &y, double tolerance);
	static LeastSquaresSolution SolveCholesky(const Eigen::MatrixXd &X, const Eigen::VectorXd &y, double tolerance);
	static LeastSquaresSolution SolveSVD(const Eigen::MatrixXd &X, const Eigen::VectorXd &y, double tolerance);

	static void ThrowRankDeficient(size_t rank, size_t p, const std::string &method) {
		throw core::SingularDesignError("design matrix is rank deficient (" + method + " rank " +
		                                std::to_string(rank) + " < " + std::to_string(p) +
		                                " columns); remove collinear predictors");
	}
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline LeastSquaresSolution LeastSquaresKernel::Solve(const Eigen::MatrixXd &X, const Eigen::VectorXd &y,
                                                      const core::RegressionOptions &options) {
	if (y.size() != X.rows()) {
		throw core::DimensionMismatchError("response length " + std::to_string(y.size()) +
		                                   " does not match design rows " + std::to_string(X.rows()));
	}
	if (X.cols() == 0) {
		throw core::SingularDesignError("design matrix has no columns");
	}

	if (options.solver == "cholesky") {
		return SolveCholesky(X, y, options.qr_tolerance);
	}
	if (options.solver == "svd") {
		return SolveSVD(X, y, options.qr_tolerance);
	}
	return SolveQR(X, y, options.qr_tolerance);
}

inline bool LeastSquaresKernel::IsFullRank(const Eigen::MatrixXd &X, double tolerance) {
	Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(X);
	if (tolerance > 0.0) {
		qr.setThreshold(tolerance);
	}

	return qr.rank() == X.cols();
}

inline LeastSquaresSolution LeastSquaresKernel::SolveQR(const Eigen::MatrixXd &X, const Eigen::VectorXd &y,
                                                        double tolerance) {
	const auto p = X.cols();

	// Step 1: QR decomposition with column pivoting: X*P = Q*R
	Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(X);
	if (tolerance > 0.0) {
		qr.setThreshold(tolerance);
	}

	// Step 2: Rank from R diagonal
	const auto rank = qr.rank();
	if (rank < p) {
		ThrowRankDeficient(static_cast<size_t>(rank), static_cast<size_t>(p), "QR");
	}

	LeastSquaresSolution solution;
	solution.rank = static_cast<size_t>(rank);
	solution.threshold = qr.threshold();

	// Step 3: Solve R b_pivoted = Q'y, then undo the permutation
	solution.coefficients = qr.solve(y);

	// Step 4: (X'X)^-1 = P (R'R)^-1 P' = P R^-1 R^-T P'
	const Eigen::MatrixXd R = qr.matrixQR().topLeftCorner(p, p).triangularView<Eigen::Upper>();
	const Eigen::MatrixXd R_inv =
	    R.triangularView<Eigen::Upper>().solve(Eigen::MatrixXd::Identity(p, p));
	const Eigen::MatrixXd pivoted_inverse = R_inv * R_inv.transpose();
	const auto &P = qr.colsPermutation();
	solution.xtx_inverse = P * pivoted_inverse * P.transpose();

	return solution;
}

inline LeastSquaresSolution LeastSquaresKernel::SolveCholesky(const Eigen::MatrixXd &X, const Eigen::VectorXd &y,
                                                              double tolerance) {
	const auto p = X.cols();
	const Eigen::MatrixXd XtX = X.transpose() * X;
	const Eigen::VectorXd Xty = X.transpose() * y;

	Eigen::LDLT<Eigen::MatrixXd> ldlt(XtX);
	if (ldlt.info() != Eigen::Success) {
		throw core::SingularDesignError("LDLT decomposition of X'X failed");
	}

	// A pivot that is tiny relative to the largest one signals collinearity.
	// Pivots live on the scale of squared columns, hence the squared epsilon default.
	const Eigen::VectorXd pivots = ldlt.vectorD();
	const double max_pivot = pivots.cwiseAbs().maxCoeff();
	const double threshold =
	    (tolerance > 0.0) ? tolerance * tolerance
	                      : static_cast<double>(p) * Eigen::NumTraits<double>::epsilon() * 1e3;
	size_t rank = 0;
	for (Eigen::Index i = 0; i < pivots.size(); i++) {
		if (pivots(i) > threshold * max_pivot) {
			rank++;
		}
	}
	if (max_pivot <= 0.0 || rank < static_cast<size_t>(p)) {
		ThrowRankDeficient(rank, static_cast<size_t>(p), "Cholesky");
	}

	LeastSquaresSolution solution;
	solution.rank = rank;
	solution.threshold = threshold;
	solution.coefficients = ldlt.solve(Xty);
	solution.xtx_inverse = ldlt.solve(Eigen::MatrixXd::Identity(p, p));
	return solution;
}

inline LeastSquaresSolution LeastSquaresKernel::SolveSVD(const Eigen::MatrixXd &X, const Eigen::VectorXd &y,
                                                         double tolerance) {
	const auto p = X.cols();

	Eigen::JacobiSVD<Eigen::MatrixXd> svd(X, Eigen::ComputeThinU | Eigen::ComputeThinV);
	if (tolerance > 0.0) {
		svd.setThreshold(tolerance);
	}

	const auto rank = svd.rank();
	if (rank < p) {
		ThrowRankDeficient(static_cast<size_t>(rank), static_cast<size_t>(p), "SVD");
	}

	LeastSquaresSolution solution;
	solution.rank = static_cast<size_t>(rank);
	solution.threshold = svd.threshold();
	solution.coefficients = svd.solve(y);

	const Eigen::VectorXd inv_sq = svd.singularValues().array().square().inverse().matrix();
	solution.xtx_inverse = svd.matrixV() * inv_sq.asDiagonal() * svd.matrixV().transpose();
	return solution;
}

} // namespace linalg
} // namespace libinfstat
