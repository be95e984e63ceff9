#pragma once

#include "libinfstat/core/errors.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

namespace libinfstat {
namespace design {

/**
 * DesignMatrixBuilder: assemble a named regression design column by column
 *
 * Produces the (X, column_names) pair accepted by OLSSolver::Fit. When the
 * builder already holds an intercept column, fit with intercept = false so
 * the solver does not prepend a second one.
 *
 * Usage:
 *   DesignMatrixBuilder b(n);
 *   b.AddIntercept().AddColumn("dose", dose).AddDummyCoded("group", labels, "control");
 *   auto model = OLSSolver::Fit(y, b.AsMatrix(), b.column_names(), RegressionOptions::OLS(false));
 */
class DesignMatrixBuilder {
public:
	explicit DesignMatrixBuilder(size_t n_obs) : n_obs_(n_obs) {
		if (n_obs == 0) {
			throw std::invalid_argument("DesignMatrixBuilder needs at least one observation");
		}
	}

	/// Append a column of ones named "(Intercept)"
	DesignMatrixBuilder &AddIntercept() {
		if (has_intercept_) {
			throw std::invalid_argument("design already has an intercept column");
		}
		has_intercept_ = true;
		return AddColumn("(Intercept)", Eigen::VectorXd::Ones(static_cast<Eigen::Index>(n_obs_)));
	}

	/**
	 * Append a numeric predictor
	 *
	 * @throws core::DimensionMismatchError if values has the wrong length
	 * @throws std::invalid_argument on an empty or duplicate name, or non-finite values
	 */
	DesignMatrixBuilder &AddColumn(const std::string &name, const Eigen::VectorXd &values) {
		if (static_cast<size_t>(values.size()) != n_obs_) {
			throw core::DimensionMismatchError("column '" + name + "' has " + std::to_string(values.size()) +
			                                   " values, design has " + std::to_string(n_obs_) + " rows");
		}
		RequireNewName(name);
		if (!values.allFinite()) {
			throw std::invalid_argument("column '" + name + "' contains non-finite values");
		}
		columns_.push_back(values);
		names_.push_back(name);
		return *this;
	}

	/**
	 * Append treatment-coded indicators for a categorical predictor
	 *
	 * One 0/1 column per level other than the reference, in sorted level
	 * order, named "<name>[<level>]".
	 *
	 * @param reference Level absorbed into the intercept; empty selects the first sorted level
	 * @throws std::invalid_argument if the reference level is absent or only one level is present
	 */
	DesignMatrixBuilder &AddDummyCoded(const std::string &name, const std::vector<std::string> &labels,
	                                   const std::string &reference = "") {
		if (labels.size() != n_obs_) {
			throw core::DimensionMismatchError("factor '" + name + "' has " + std::to_string(labels.size()) +
			                                   " labels, design has " + std::to_string(n_obs_) + " rows");
		}

		std::vector<std::string> levels(labels);
		std::sort(levels.begin(), levels.end());
		levels.erase(std::unique(levels.begin(), levels.end()), levels.end());
		if (levels.size() < 2) {
			throw std::invalid_argument("factor '" + name + "' needs at least two levels");
		}

		const std::string ref = reference.empty() ? levels.front() : reference;
		if (std::find(levels.begin(), levels.end(), ref) == levels.end()) {
			throw std::invalid_argument("reference level '" + ref + "' does not occur in factor '" + name + "'");
		}

		for (const auto &level : levels) {
			if (level == ref) {
				continue;
			}
			Eigen::VectorXd indicator(static_cast<Eigen::Index>(n_obs_));
			for (size_t i = 0; i < n_obs_; i++) {
				indicator(static_cast<Eigen::Index>(i)) = labels[i] == level ? 1.0 : 0.0;
			}
			AddColumn(name + "[" + level + "]", indicator);
		}
		return *this;
	}

	/**
	 * Append the elementwise product of two existing columns, named "a:b"
	 *
	 * @throws std::invalid_argument if either column is unknown
	 */
	DesignMatrixBuilder &AddInteraction(const std::string &a, const std::string &b) {
		const size_t ia = IndexOf(a);
		const size_t ib = IndexOf(b);
		return AddColumn(a + ":" + b, columns_[ia].cwiseProduct(columns_[ib]));
	}

	/// n_obs × n_columns design matrix
	Eigen::MatrixXd AsMatrix() const {
		Eigen::MatrixXd X(static_cast<Eigen::Index>(n_obs_), static_cast<Eigen::Index>(columns_.size()));
		for (size_t j = 0; j < columns_.size(); j++) {
			X.col(static_cast<Eigen::Index>(j)) = columns_[j];
		}
		return X;
	}

	const std::vector<std::string> &column_names() const {
		return names_;
	}
	size_t n_obs() const {
		return n_obs_;
	}
	size_t n_columns() const {
		return columns_.size();
	}
	bool has_intercept() const {
		return has_intercept_;
	}

	/// Position of a named column
	size_t IndexOf(const std::string &name) const {
		const auto it = std::find(names_.begin(), names_.end(), name);
		if (it == names_.end()) {
			throw std::invalid_argument("design has no column named '" + name + "'");
		}
		return static_cast<size_t>(it - names_.begin());
	}

private:
	void RequireNewName(const std::string &name) const {
		if (name.empty()) {
			throw std::invalid_argument("design column name must not be empty");
		}
		if (std::find(names_.begin(), names_.end(), name) != names_.end()) {
			throw std::invalid_argument("design already has a column named '" + name + "'");
		}
	}

	size_t n_obs_;
	bool has_intercept_ = false;
	std::vector<Eigen::VectorXd> columns_;
	std::vector<std::string> names_;
};

} // namespace design
} // namespace libinfstat
