#pragma once

#include "libinfstat/core/errors.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace libinfstat {
namespace core {

/// Integer cell counts, rows × columns
using CountMatrix = Eigen::Matrix<int64_t, Eigen::Dynamic, Eigen::Dynamic>;

/// Integer counts of a single categorical variable
using CountVector = Eigen::Matrix<int64_t, Eigen::Dynamic, 1>;

/**
 * Two-way contingency table of non-negative counts
 *
 * Row and column categories are ordered and fixed at construction.
 * Marginals are derived from the counts on every read and can never be
 * set independently of the table.
 */
class ContingencyTable {
public:
	ContingencyTable() = default;

	/**
	 * Build a table from a count matrix
	 *
	 * @param counts Non-negative cell counts
	 * @param row_labels Row category names (default "1".."r")
	 * @param col_labels Column category names (default "1".."c")
	 * @throws std::invalid_argument on negative counts
	 * @throws DimensionMismatchError if label counts disagree with the matrix
	 */
	static ContingencyTable FromCounts(const CountMatrix &counts, std::vector<std::string> row_labels = {},
	                                   std::vector<std::string> col_labels = {});

	/**
	 * Cross-tabulate paired categorical observations
	 *
	 * Categories are sorted ascending.
	 *
	 * @throws DimensionMismatchError if the sequences differ in length
	 */
	static ContingencyTable FromObservations(const std::vector<std::string> &row_values,
	                                         const std::vector<std::string> &col_values);

	/**
	 * Cross-tabulate with caller-given category order
	 *
	 * Every category in row_order/col_order gets a row/column even when unobserved.
	 *
	 * @throws std::invalid_argument if an observation is not in the given order
	 *         or an order lists a category twice
	 */
	static ContingencyTable FromObservations(const std::vector<std::string> &row_values,
	                                         const std::vector<std::string> &col_values,
	                                         const std::vector<std::string> &row_order,
	                                         const std::vector<std::string> &col_order);

	// ========================================================================
	// Shape and cells
	// ========================================================================

	Eigen::Index rows() const {
		return counts_.rows();
	}

	Eigen::Index cols() const {
		return counts_.cols();
	}

	int64_t count(Eigen::Index i, Eigen::Index j) const {
		return counts_(i, j);
	}

	const CountMatrix &counts() const {
		return counts_;
	}

	const std::vector<std::string> &row_labels() const {
		return row_labels_;
	}

	const std::vector<std::string> &col_labels() const {
		return col_labels_;
	}

	// ========================================================================
	// Marginals (recomputed on read)
	// ========================================================================

	Eigen::VectorXd RowTotals() const {
		return counts_.cast<double>().rowwise().sum();
	}

	Eigen::VectorXd ColTotals() const {
		return counts_.cast<double>().colwise().sum().transpose();
	}

	double GrandTotal() const {
		return static_cast<double>(counts_.sum());
	}

	/// Counts as doubles, for arithmetic
	Eigen::MatrixXd AsDouble() const {
		return counts_.cast<double>();
	}

	/// Same categories with rows and columns swapped
	ContingencyTable Transposed() const {
		return FromCounts(CountMatrix(counts_.transpose()), col_labels_, row_labels_);
	}

private:
	static std::vector<std::string> DefaultLabels(Eigen::Index n) {
		std::vector<std::string> labels;
		labels.reserve(static_cast<size_t>(n));
		for (Eigen::Index i = 0; i < n; i++) {
			labels.push_back(std::to_string(i + 1));
		}
		return labels;
	}

	static std::map<std::string, Eigen::Index> IndexCategories(const std::vector<std::string> &order,
	                                                           const char *what);

	CountMatrix counts_;
	std::vector<std::string> row_labels_;
	std::vector<std::string> col_labels_;
};

/// Null hypothesis an expected table was derived from
enum class ExpectedKind : uint8_t { UNIFORM = 0, SPECIFIED_PROPORTIONS = 1, INDEPENDENCE = 2, RESIDUALS = 3 };

/**
 * Real-valued table parallel to a ContingencyTable
 *
 * Holds expected counts under a stated null, or per-cell residuals.
 */
struct ExpectedTable {
	Eigen::MatrixXd values;
	std::vector<std::string> row_labels;
	std::vector<std::string> col_labels;
	ExpectedKind kind = ExpectedKind::INDEPENDENCE;

	ExpectedTable() = default;

	ExpectedTable(Eigen::MatrixXd values_, const ContingencyTable &source, ExpectedKind kind_)
	    : values(std::move(values_)), row_labels(source.row_labels()), col_labels(source.col_labels()),
	      kind(kind_) {
	}

	Eigen::Index rows() const {
		return values.rows();
	}

	Eigen::Index cols() const {
		return values.cols();
	}

	double operator()(Eigen::Index i, Eigen::Index j) const {
		return values(i, j);
	}
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline ContingencyTable ContingencyTable::FromCounts(const CountMatrix &counts, std::vector<std::string> row_labels,
                                                     std::vector<std::string> col_labels) {
	if ((counts.array() < 0).any()) {
		throw std::invalid_argument("contingency table counts must be non-negative");
	}
	if (row_labels.empty()) {
		row_labels = DefaultLabels(counts.rows());
	}
	if (col_labels.empty()) {
		col_labels = DefaultLabels(counts.cols());
	}
	if (row_labels.size() != static_cast<size_t>(counts.rows()) ||
	    col_labels.size() != static_cast<size_t>(counts.cols())) {
		throw DimensionMismatchError("label counts (" + std::to_string(row_labels.size()) + ", " +
		                             std::to_string(col_labels.size()) + ") do not match table shape (" +
		                             std::to_string(counts.rows()) + ", " + std::to_string(counts.cols()) + ")");
	}

	ContingencyTable table;
	table.counts_ = counts;
	table.row_labels_ = std::move(row_labels);
	table.col_labels_ = std::move(col_labels);
	return table;
}

inline ContingencyTable ContingencyTable::FromObservations(const std::vector<std::string> &row_values,
                                                           const std::vector<std::string> &col_values) {
	if (row_values.size() != col_values.size()) {
		throw DimensionMismatchError("paired observations differ in length (" + std::to_string(row_values.size()) +
		                             " vs " + std::to_string(col_values.size()) + ")");
	}
	const std::set<std::string> row_set(row_values.begin(), row_values.end());
	const std::set<std::string> col_set(col_values.begin(), col_values.end());
	return FromObservations(row_values, col_values, std::vector<std::string>(row_set.begin(), row_set.end()),
	                        std::vector<std::string>(col_set.begin(), col_set.end()));
}

inline ContingencyTable ContingencyTable::FromObservations(const std::vector<std::string> &row_values,
                                                           const std::vector<std::string> &col_values,
                                                           const std::vector<std::string> &row_order,
                                                           const std::vector<std::string> &col_order) {
	if (row_values.size() != col_values.size()) {
		throw DimensionMismatchError("paired observations differ in length (" + std::to_string(row_values.size()) +
		                             " vs " + std::to_string(col_values.size()) + ")");
	}

	const auto row_index = IndexCategories(row_order, "row");
	const auto col_index = IndexCategories(col_order, "column");

	CountMatrix counts =
	    CountMatrix::Zero(static_cast<Eigen::Index>(row_order.size()), static_cast<Eigen::Index>(col_order.size()));
	for (size_t k = 0; k < row_values.size(); k++) {
		const auto r = row_index.find(row_values[k]);
		if (r == row_index.end()) {
			throw std::invalid_argument("row category '" + row_values[k] + "' is not in the given order");
		}
		const auto c = col_index.find(col_values[k]);
		if (c == col_index.end()) {
			throw std::invalid_argument("column category '" + col_values[k] + "' is not in the given order");
		}
		counts(r->second, c->second)++;
	}

	return FromCounts(counts, row_order, col_order);
}

inline std::map<std::string, Eigen::Index> ContingencyTable::IndexCategories(const std::vector<std::string> &order,
                                                                             const char *what) {
	std::map<std::string, Eigen::Index> index;
	for (size_t i = 0; i < order.size(); i++) {
		if (!index.emplace(order[i], static_cast<Eigen::Index>(i)).second) {
			throw std::invalid_argument(std::string(what) + " category '" + order[i] + "' listed twice");
		}
	}
	return index;
}

} // namespace core
} // namespace libinfstat
