/**
 * @file test_correlation_engine.cpp
 * @brief Unit tests for CorrelationEngine
 *
 * Tests cover:
 * 1. Pearson and Spearman coefficients and their t-test p-values
 * 2. Undefined statistics (perfect fit, too few observations, zero variance)
 * 3. Covariate-adjusted degrees of freedom
 * 4. Table layout, symmetry under swapping the tables and q-values
 * 5. Row-count mismatch
 */

#include <gtest/gtest.h>

#include <cmath>
#include <limits>

#include "core/CorrelationEngine.hpp"
#include "core/Errors.hpp"

using namespace Methodical;

namespace {

const double NA = std::numeric_limits<double>::quiet_NaN();

LabeledMatrix make_table(const std::vector<std::string>& cols, const std::vector<std::vector<double>>& columns) {
    LabeledMatrix m;
    m.col_names = cols;
    const int rows = columns.empty() ? 0 : static_cast<int>(columns[0].size());
    for (int r = 0; r < rows; ++r) m.row_names.push_back("S" + std::to_string(r + 1));
    m.values.resize(rows, static_cast<int>(columns.size()));
    for (size_t c = 0; c < columns.size(); ++c) {
        for (int r = 0; r < rows; ++r) m.values(r, c) = columns[c][r];
    }
    return m;
}

Eigen::VectorXd vec(const std::vector<double>& v) {
    return Eigen::Map<const Eigen::VectorXd>(v.data(), static_cast<Eigen::Index>(v.size()));
}

}  // namespace

// ============================================================================
// Single pairs
// ============================================================================

TEST(CorrelationPairTest, PearsonWithPValue) {
    auto stat = CorrelationEngine::correlate_pair(vec({1, 2, 3, 4, 5}), vec({2, 1, 4, 3, 5}),
                                                  CorrelationMethod::PEARSON, 0);
    EXPECT_EQ(stat.n_obs, 5);
    EXPECT_DOUBLE_EQ(stat.df, 3.0);
    ASSERT_TRUE(stat.correlation.has_value());
    EXPECT_NEAR(*stat.correlation, 0.8, 1e-12);
    // t = 0.8 * sqrt(3) / 0.6, two-sided with 3 df
    ASSERT_TRUE(stat.p_value.has_value());
    EXPECT_NEAR(*stat.p_value, 0.1040880, 1e-6);
}

TEST(CorrelationPairTest, PerfectAntiCorrelationHasNoPValue) {
    auto stat = CorrelationEngine::correlate_pair(vec({1, 2, 3, 4, 5}), vec({5, 4, 3, 2, 1}),
                                                  CorrelationMethod::PEARSON, 0);
    ASSERT_TRUE(stat.correlation.has_value());
    EXPECT_NEAR(*stat.correlation, -1.0, 1e-12);
    EXPECT_FALSE(stat.p_value.has_value());
}

TEST(CorrelationPairTest, NearPerfectFitKeepsPValue) {
    // 1 - r is about 2e-14 here; only an exact +-1 leaves p undefined
    auto stat = CorrelationEngine::correlate_pair(vec({1, 2, 3, 4, 5}), vec({1, 2, 3, 4, 5.000001}),
                                                  CorrelationMethod::PEARSON, 0);
    ASSERT_TRUE(stat.correlation.has_value());
    EXPECT_LT(*stat.correlation, 1.0);
    EXPECT_GT(*stat.correlation, 1.0 - 1e-12);
    ASSERT_TRUE(stat.p_value.has_value());
    EXPECT_LT(*stat.p_value, 1e-12);
}

TEST(CorrelationPairTest, SpearmanUsesRanks) {
    // Monotone but non-linear: rho = 1, so p is undefined
    auto stat = CorrelationEngine::correlate_pair(vec({1, 2, 3, 4, 5}), vec({1, 4, 9, 16, 100}),
                                                  CorrelationMethod::SPEARMAN, 0);
    ASSERT_TRUE(stat.correlation.has_value());
    EXPECT_NEAR(*stat.correlation, 1.0, 1e-12);
    EXPECT_FALSE(stat.p_value.has_value());

    auto pearson = CorrelationEngine::correlate_pair(vec({1, 2, 3, 4, 5}), vec({1, 4, 9, 16, 100}),
                                                     CorrelationMethod::PEARSON, 0);
    EXPECT_LT(*pearson.correlation, 0.9);
}

TEST(CorrelationPairTest, MissingValuesArePairwiseDeleted) {
    auto stat = CorrelationEngine::correlate_pair(vec({1, 2, NA, 3, 4, 5}), vec({2, 1, 7, 4, 3, 5}),
                                                  CorrelationMethod::PEARSON, 0);
    EXPECT_EQ(stat.n_obs, 5);
    EXPECT_NEAR(*stat.correlation, 0.8, 1e-12);
}

TEST(CorrelationPairTest, TooFewObservations) {
    auto stat = CorrelationEngine::correlate_pair(vec({1, 2, NA}), vec({3, 1, 2}), CorrelationMethod::PEARSON, 0);
    EXPECT_EQ(stat.n_obs, 2);
    EXPECT_FALSE(stat.p_value.has_value());
}

TEST(CorrelationPairTest, ZeroVarianceIsUndefined) {
    auto stat = CorrelationEngine::correlate_pair(vec({0.5, 0.5, 0.5, 0.5}), vec({1, 2, 3, 4}),
                                                  CorrelationMethod::PEARSON, 0);
    EXPECT_FALSE(stat.correlation.has_value());
    EXPECT_FALSE(stat.p_value.has_value());
}

TEST(CorrelationPairTest, CovariatesReduceDegreesOfFreedom) {
    std::vector<double> x = {1, 2, 3, 4, 5, 6, 7, 8, 9, 10};
    std::vector<double> y = {2, 1, 4, 3, 6, 5, 8, 7, 10, 9};

    auto plain = CorrelationEngine::correlate_pair(vec(x), vec(y), CorrelationMethod::PEARSON, 0);
    auto adjusted = CorrelationEngine::correlate_pair(vec(x), vec(y), CorrelationMethod::PEARSON, 2);

    EXPECT_DOUBLE_EQ(plain.df, 8.0);
    EXPECT_DOUBLE_EQ(adjusted.df, 6.0);
    EXPECT_DOUBLE_EQ(*plain.correlation, *adjusted.correlation);
    ASSERT_TRUE(plain.p_value.has_value());
    ASSERT_TRUE(adjusted.p_value.has_value());
    EXPECT_GT(*adjusted.p_value, *plain.p_value);
}

TEST(CorrelationPairTest, NonPositiveDegreesOfFreedom) {
    auto stat = CorrelationEngine::correlate_pair(vec({1, 2, 3, 4}), vec({2, 1, 4, 3}), CorrelationMethod::PEARSON, 2);
    EXPECT_DOUBLE_EQ(stat.df, 0.0);
    EXPECT_TRUE(stat.correlation.has_value());
    EXPECT_FALSE(stat.p_value.has_value());
}

// ============================================================================
// Tables
// ============================================================================

class CorrelationEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        table1 = make_table({"cg1", "cg2", "cg3"}, {{0.1, 0.4, 0.35, 0.8, 0.7, 0.9},
                                                    {0.9, 0.8, 0.6, 0.5, 0.3, 0.1},
                                                    {0.5, NA, 0.2, 0.6, 0.1, 0.4}});
        table2 = make_table({"geneA", "geneB"}, {{1.0, 2.0, 3.0, 4.0, 5.0, 6.0},
                                                 {3.2, 1.1, 4.8, 2.2, 5.1, 0.7}});
    }

    LabeledMatrix table1;
    LabeledMatrix table2;
};

TEST_F(CorrelationEngineTest, LayoutIsTable1Major) {
    CorrelationConfig config;
    config.p_adjust = PAdjustMethod::NONE;
    CorrelationTable result = CorrelationEngine(config).compute(table1, table2);

    ASSERT_EQ(result.size(), 6u);
    EXPECT_EQ(result.num_table1_cols, 3);
    EXPECT_EQ(result.num_table2_cols, 2);
    EXPECT_FALSE(result.has_q_values);
    EXPECT_EQ(result.pairs[1].feature1, "cg1");
    EXPECT_EQ(result.pairs[1].feature2, "geneB");
    EXPECT_EQ(result.at(2, 0).feature1, "cg3");
    EXPECT_EQ(result.at(2, 0).n_obs, 5);
    for (const auto& pair : result.pairs) {
        ASSERT_TRUE(pair.correlation.has_value());
        EXPECT_GE(*pair.correlation, -1.0);
        EXPECT_LE(*pair.correlation, 1.0);
        EXPECT_FALSE(pair.q_value.has_value());
    }
}

TEST_F(CorrelationEngineTest, SwappingTablesGivesSameStatistics) {
    for (auto method : {CorrelationMethod::PEARSON, CorrelationMethod::SPEARMAN}) {
        CorrelationConfig config;
        config.method = method;
        CorrelationEngine engine(config);
        CorrelationTable forward = engine.compute(table1, table2);
        CorrelationTable backward = engine.compute(table2, table1);

        for (int i = 0; i < 3; ++i) {
            for (int j = 0; j < 2; ++j) {
                const auto& a = forward.at(i, j);
                const auto& b = backward.at(j, i);
                EXPECT_EQ(a.feature1, b.feature2);
                EXPECT_NEAR(*a.correlation, *b.correlation, 1e-12);
                ASSERT_EQ(a.p_value.has_value(), b.p_value.has_value());
                if (a.p_value) EXPECT_NEAR(*a.p_value, *b.p_value, 1e-12);
                ASSERT_EQ(a.q_value.has_value(), b.q_value.has_value());
                if (a.q_value) EXPECT_NEAR(*a.q_value, *b.q_value, 1e-12);
            }
        }
    }
}

TEST_F(CorrelationEngineTest, QValuesAdjustAllPairs) {
    CorrelationConfig config;
    config.p_adjust = PAdjustMethod::BONFERRONI;
    CorrelationTable result = CorrelationEngine(config).compute(table1, table2);

    EXPECT_TRUE(result.has_q_values);
    for (const auto& pair : result.pairs) {
        ASSERT_TRUE(pair.p_value.has_value());
        ASSERT_TRUE(pair.q_value.has_value());
        EXPECT_NEAR(*pair.q_value, std::min(1.0, *pair.p_value * 6.0), 1e-12);
    }
}

TEST_F(CorrelationEngineTest, ThreadCountDoesNotChangeResults) {
    CorrelationConfig single;
    CorrelationConfig multi;
    multi.num_threads = 4;
    CorrelationTable a = CorrelationEngine(single).compute(table1, table2);
    CorrelationTable b = correlate_tables(table1, table2, multi);

    ASSERT_EQ(a.size(), b.size());
    for (size_t k = 0; k < a.size(); ++k) {
        EXPECT_EQ(a.pairs[k].feature1, b.pairs[k].feature1);
        EXPECT_EQ(a.pairs[k].feature2, b.pairs[k].feature2);
        EXPECT_DOUBLE_EQ(*a.pairs[k].correlation, *b.pairs[k].correlation);
        EXPECT_DOUBLE_EQ(*a.pairs[k].q_value, *b.pairs[k].q_value);
    }
}

TEST_F(CorrelationEngineTest, RowCountMismatchThrows) {
    LabeledMatrix short_table = make_table({"geneA"}, {{1.0, 2.0, 3.0}});
    CorrelationEngine engine{CorrelationConfig{}};
    EXPECT_THROW(engine.compute(table1, short_table), DimensionMismatchError);
}
