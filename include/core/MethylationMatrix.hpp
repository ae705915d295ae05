#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <Eigen/Dense>

namespace Methodical {

/**
 * @brief Numeric table with named rows and columns.
 *
 * Used as input to the correlation engine: rows are samples, columns are
 * features. Missing values are NaN.
 */
struct LabeledMatrix {
    std::vector<std::string> row_names;
    std::vector<std::string> col_names;
    Eigen::MatrixXd values;

    int num_rows() const { return static_cast<int>(values.rows()); }
    int num_cols() const { return static_cast<int>(values.cols()); }
};

/**
 * @brief Methylation values of Sites x Samples for one contiguous range.
 *
 * Rows correspond to sites ordered by position on a single sequence, columns
 * to samples. Values are in [0, 1], NaN for missing. A window is read-only
 * once built and may be shared between threads.
 */
class MethylationWindow {
public:
    std::string seqname;
    std::vector<int64_t> positions;         ///< 1-based site positions, ascending
    std::vector<std::string> sample_names;  ///< Maps column index to sample
    Eigen::MatrixXd values;                 ///< Sites x Samples

    int num_sites() const { return static_cast<int>(positions.size()); }
    int num_samples() const { return static_cast<int>(sample_names.size()); }
    bool empty() const { return positions.empty(); }

    /**
     * @brief Checks that rows match positions, columns match samples and
     * positions are sorted.
     *
     * @throws std::runtime_error describing the first inconsistency.
     */
    void check_consistency() const;
};

} // namespace Methodical
