#include "core/CorrelationEngine.hpp"

#include <algorithm>
#include <cmath>
#include <string>

#include "core/Errors.hpp"
#include "core/Statistics.hpp"

namespace Methodical {

PairStatistic CorrelationEngine::correlate_pair(const Eigen::Ref<const Eigen::VectorXd>& x,
                                                const Eigen::Ref<const Eigen::VectorXd>& y, CorrelationMethod method,
                                                int n_covariates) {
    PairStatistic stat;

    // Collect complete observations
    std::vector<double> vals_x;
    std::vector<double> vals_y;
    vals_x.reserve(x.size());
    vals_y.reserve(y.size());
    const Eigen::Index n = std::min(x.size(), y.size());
    for (Eigen::Index k = 0; k < n; ++k) {
        if (!std::isnan(x(k)) && !std::isnan(y(k))) {
            vals_x.push_back(x(k));
            vals_y.push_back(y(k));
        }
    }

    stat.n_obs = static_cast<int>(vals_x.size());
    stat.df = static_cast<double>(stat.n_obs) - 2.0 - static_cast<double>(n_covariates);

    if (method == CorrelationMethod::SPEARMAN) {
        vals_x = Stats::average_ranks(vals_x);
        vals_y = Stats::average_ranks(vals_y);
    }

    stat.correlation = Stats::pearson(vals_x, vals_y);
    if (!stat.correlation || stat.n_obs < 3 || stat.df <= 0.0) {
        return stat;
    }

    double r = *stat.correlation;
    double one_minus_r2 = 1.0 - r * r;
    if (std::abs(r) >= 1.0 || one_minus_r2 <= 0.0) {
        // Perfect fit: t is unbounded, leave p undefined
        return stat;
    }

    double t_stat = r * std::sqrt(stat.df) / std::sqrt(one_minus_r2);
    stat.p_value = Stats::student_t_two_sided_p(t_stat, stat.df);
    return stat;
}

CorrelationTable CorrelationEngine::compute(const LabeledMatrix& table1, const LabeledMatrix& table2) const {
    if (table1.num_rows() != table2.num_rows()) {
        throw DimensionMismatchError("Number of rows of table1 (" + std::to_string(table1.num_rows()) +
                                     ") and table2 (" + std::to_string(table2.num_rows()) + ") must be equal");
    }

    CorrelationTable result;
    result.num_table1_cols = table1.num_cols();
    result.num_table2_cols = table2.num_cols();
    result.pairs.resize(static_cast<size_t>(result.num_table1_cols) * result.num_table2_cols);

    const int n1 = result.num_table1_cols;
    const int n2 = result.num_table2_cols;
    const int threads = std::max(1, config_.num_threads);

    // Each slot is written by exactly one iteration, so the loop needs no locking
#pragma omp parallel for schedule(dynamic) num_threads(threads) if (threads > 1)
    for (int i = 0; i < n1; ++i) {
        for (int j = 0; j < n2; ++j) {
            PairStatistic stat =
                correlate_pair(table1.values.col(i), table2.values.col(j), config_.method, config_.n_covariates);

            CorrelationPair& pair = result.pairs[static_cast<size_t>(i) * n2 + j];
            pair.feature1 = i < static_cast<int>(table1.col_names.size()) ? table1.col_names[i] : std::to_string(i);
            pair.feature2 = j < static_cast<int>(table2.col_names.size()) ? table2.col_names[j] : std::to_string(j);
            pair.n_obs = stat.n_obs;
            pair.correlation = stat.correlation;
            pair.p_value = stat.p_value;
        }
    }

    if (config_.p_adjust != PAdjustMethod::NONE) {
        std::vector<std::optional<double>> p_values;
        p_values.reserve(result.pairs.size());
        for (const auto& pair : result.pairs) {
            p_values.push_back(pair.p_value);
        }
        auto q_values = Stats::p_adjust(p_values, config_.p_adjust);
        for (size_t k = 0; k < result.pairs.size(); ++k) {
            result.pairs[k].q_value = q_values[k];
        }
        result.has_q_values = true;
    }

    return result;
}

CorrelationTable correlate_tables(const LabeledMatrix& table1, const LabeledMatrix& table2,
                                  const CorrelationConfig& config) {
    return CorrelationEngine(config).compute(table1, table2);
}

} // namespace Methodical
