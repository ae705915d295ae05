#pragma once

#include <optional>
#include <string>
#include <vector>
#include <Eigen/Dense>

#include "DataStructs.hpp"
#include "MethylationMatrix.hpp"
#include "Types.hpp"

namespace Methodical {

/**
 * @brief Configuration for pairwise correlation tests.
 */
struct CorrelationConfig {
    CorrelationMethod method = CorrelationMethod::PEARSON;  ///< Correlation coefficient
    int n_covariates = 0;                                  ///< Covariates subtracted from the degrees of freedom
    PAdjustMethod p_adjust = PAdjustMethod::BH;            ///< Adjustment over all pair p-values
    int num_threads = 1;                                   ///< Threads used across table1 columns
};

/**
 * @brief Correlation statistics of a single column pair.
 */
struct PairStatistic {
    int n_obs = 0;   ///< Rows where both columns are present
    double df = 0;   ///< n_obs - 2 - n_covariates
    std::optional<double> correlation;
    std::optional<double> p_value;
};

/**
 * @brief Flat result of correlating every column of table1 with every column of table2.
 *
 * Pairs are stored table1-column major: pair (i, j) is at i * num_table2_cols + j.
 */
class CorrelationTable {
public:
    std::vector<CorrelationPair> pairs;
    int num_table1_cols = 0;
    int num_table2_cols = 0;
    bool has_q_values = false;

    size_t size() const { return pairs.size(); }
    bool empty() const { return pairs.empty(); }

    const CorrelationPair& at(int i, int j) const {
        return pairs.at(static_cast<size_t>(i) * num_table2_cols + j);
    }
};

/**
 * @brief Vectorized correlation-significance engine.
 *
 * For each column pair the correlation is computed on complete observations,
 * its significance from a two-sided Student-t approximation with
 * df = n - 2 - n_covariates. p-values are missing when fewer than 3 complete
 * pairs are available, when df <= 0 or when |r| == 1.
 *
 * Usage:
 * @code
 * CorrelationEngine engine(config);
 * CorrelationTable table = engine.compute(methylation, expression);
 * @endcode
 */
class CorrelationEngine {
public:
    explicit CorrelationEngine(const CorrelationConfig& config) : config_(config) {}

    /**
     * @brief Correlates all column pairs of two sample-aligned tables.
     *
     * @throws DimensionMismatchError if the row counts differ.
     */
    CorrelationTable compute(const LabeledMatrix& table1, const LabeledMatrix& table2) const;

    /**
     * @brief Correlation test for one pair of columns. NaN marks missing values.
     */
    static PairStatistic correlate_pair(const Eigen::Ref<const Eigen::VectorXd>& x,
                                        const Eigen::Ref<const Eigen::VectorXd>& y, CorrelationMethod method,
                                        int n_covariates);

    const CorrelationConfig& config() const { return config_; }

private:
    CorrelationConfig config_;
};

/**
 * @brief Convenience wrapper around CorrelationEngine::compute.
 */
CorrelationTable correlate_tables(const LabeledMatrix& table1, const LabeledMatrix& table2,
                                  const CorrelationConfig& config);

} // namespace Methodical
