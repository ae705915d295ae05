/**
 * @file test_statistics.cpp
 * @brief Unit tests for the special functions, ranks and p-value adjustment
 */

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <optional>
#include <vector>

#include "core/Errors.hpp"
#include "core/Statistics.hpp"

using namespace Methodical;
using namespace Methodical::Stats;

// ============================================================================
// Special functions
// ============================================================================

TEST(StatisticsTest, LogGammaMatchesFactorials) {
    EXPECT_NEAR(log_gamma(1.0), 0.0, 1e-12);
    EXPECT_NEAR(log_gamma(5.0), std::log(24.0), 1e-12);
    EXPECT_NEAR(log_gamma(0.5), 0.5 * std::log(std::acos(-1.0)), 1e-12);
    EXPECT_NEAR(log_gamma(10.5), std::lgamma(10.5), 1e-10);
}

TEST(StatisticsTest, IncompleteBetaBoundsAndUniform) {
    EXPECT_DOUBLE_EQ(beta_inc(2.0, 3.0, 0.0), 0.0);
    EXPECT_DOUBLE_EQ(beta_inc(2.0, 3.0, 1.0), 1.0);
    // I_x(1, 1) = x
    EXPECT_NEAR(beta_inc(1.0, 1.0, 0.3), 0.3, 1e-12);
    // Symmetry I_x(a, b) = 1 - I_{1-x}(b, a)
    EXPECT_NEAR(beta_inc(2.5, 4.0, 0.35), 1.0 - beta_inc(4.0, 2.5, 0.65), 1e-12);
}

TEST(StatisticsTest, StudentTTwoSided) {
    // df = 1 is the Cauchy distribution: P(|T| > 1) = 0.5
    auto p1 = student_t_two_sided_p(1.0, 1.0);
    ASSERT_TRUE(p1.has_value());
    EXPECT_NEAR(*p1, 0.5, 1e-10);

    // df = 2 has the closed form 1 - t / sqrt(2 + t^2)
    auto p2 = student_t_two_sided_p(2.0, 2.0);
    ASSERT_TRUE(p2.has_value());
    EXPECT_NEAR(*p2, 1.0 - 2.0 / std::sqrt(6.0), 1e-10);

    // Tabulated 97.5% quantile of t with 8 df
    auto p8 = student_t_two_sided_p(2.306004, 8.0);
    ASSERT_TRUE(p8.has_value());
    EXPECT_NEAR(*p8, 0.05, 1e-6);

    // Sign does not matter
    EXPECT_NEAR(*student_t_two_sided_p(-2.0, 2.0), *p2, 1e-14);
    EXPECT_DOUBLE_EQ(*student_t_two_sided_p(0.0, 5.0), 1.0);
}

TEST(StatisticsTest, StudentTUndefinedInputs) {
    EXPECT_FALSE(student_t_two_sided_p(1.0, 0.0).has_value());
    EXPECT_FALSE(student_t_two_sided_p(1.0, -3.0).has_value());
    EXPECT_FALSE(student_t_two_sided_p(std::nan(""), 4.0).has_value());
}

// ============================================================================
// Ranks and Pearson
// ============================================================================

TEST(StatisticsTest, AverageRanksWithTies) {
    auto ranks = average_ranks({10.0, 20.0, 20.0, 30.0, 5.0});
    std::vector<double> expected = {2.0, 3.5, 3.5, 5.0, 1.0};
    ASSERT_EQ(ranks.size(), expected.size());
    for (size_t i = 0; i < expected.size(); ++i) {
        EXPECT_DOUBLE_EQ(ranks[i], expected[i]) << "at " << i;
    }
}

TEST(StatisticsTest, PearsonKnownValue) {
    auto r = pearson({1, 2, 3, 4, 5}, {2, 1, 4, 3, 5});
    ASSERT_TRUE(r.has_value());
    EXPECT_NEAR(*r, 0.8, 1e-12);
}

TEST(StatisticsTest, PearsonZeroVarianceIsUndefined) {
    EXPECT_FALSE(pearson({1, 2, 3}, {4, 4, 4}).has_value());
    EXPECT_FALSE(pearson({1}, {2}).has_value());
}

// ============================================================================
// p.adjust
// ============================================================================

namespace {

std::vector<std::optional<double>> as_optional(const std::vector<double>& v) {
    return std::vector<std::optional<double>>(v.begin(), v.end());
}

void expect_values(const std::vector<std::optional<double>>& actual, const std::vector<double>& expected,
                   double tol = 1e-12) {
    ASSERT_EQ(actual.size(), expected.size());
    for (size_t i = 0; i < expected.size(); ++i) {
        ASSERT_TRUE(actual[i].has_value()) << "at " << i;
        EXPECT_NEAR(*actual[i], expected[i], tol) << "at " << i;
    }
}

// Simes p-value of a subset of hypotheses
double simes(std::vector<double> subset) {
    std::sort(subset.begin(), subset.end());
    double best = 1.0;
    for (size_t j = 0; j < subset.size(); ++j) {
        best = std::min(best, subset.size() * subset[j] / (j + 1));
    }
    return best;
}

}  // namespace

TEST(PAdjustTest, StepwiseMethods) {
    auto p = as_optional({0.01, 0.02, 0.03, 0.04, 0.05});

    expect_values(p_adjust(p, PAdjustMethod::BONFERRONI), {0.05, 0.10, 0.15, 0.20, 0.25});
    expect_values(p_adjust(p, PAdjustMethod::HOLM), {0.05, 0.08, 0.09, 0.09, 0.09});
    expect_values(p_adjust(p, PAdjustMethod::HOCHBERG), {0.05, 0.05, 0.05, 0.05, 0.05});
    expect_values(p_adjust(p, PAdjustMethod::BH), {0.05, 0.05, 0.05, 0.05, 0.05});

    double harmonic = 1.0 + 1.0 / 2 + 1.0 / 3 + 1.0 / 4 + 1.0 / 5;
    expect_values(p_adjust(p, PAdjustMethod::BY), std::vector<double>(5, 0.05 * harmonic));

    expect_values(p_adjust(p, PAdjustMethod::NONE), {0.01, 0.02, 0.03, 0.04, 0.05});
}

TEST(PAdjustTest, OrderIsPreserved) {
    auto p = as_optional({0.04, 0.01, 0.05, 0.02, 0.03});
    expect_values(p_adjust(p, PAdjustMethod::HOLM), {0.09, 0.05, 0.09, 0.08, 0.09});
}

TEST(PAdjustTest, BonferroniCapsAtOne) {
    auto q = p_adjust(as_optional({0.3, 0.6}), PAdjustMethod::BONFERRONI);
    expect_values(q, {0.6, 1.0});
}

TEST(PAdjustTest, MissingValuesStayMissingAndAreNotCounted) {
    std::vector<std::optional<double>> p = {0.01, std::nullopt, 0.02};
    auto q = p_adjust(p, PAdjustMethod::BONFERRONI);
    ASSERT_EQ(q.size(), 3u);
    EXPECT_NEAR(*q[0], 0.02, 1e-12);
    EXPECT_FALSE(q[1].has_value());
    EXPECT_NEAR(*q[2], 0.04, 1e-12);
}

TEST(PAdjustTest, HommelSmallExample) {
    expect_values(p_adjust(as_optional({0.01, 0.02, 0.04}), PAdjustMethod::HOMMEL), {0.03, 0.04, 0.04});
}

TEST(PAdjustTest, HommelMatchesClosedSimesTesting) {
    std::vector<double> p = {0.002, 0.011, 0.021, 0.047, 0.19, 0.6};
    auto q = p_adjust(as_optional(p), PAdjustMethod::HOMMEL);

    const size_t n = p.size();
    for (size_t i = 0; i < n; ++i) {
        // Adjusted p = max Simes p over all subsets containing hypothesis i
        double expected = 0.0;
        for (unsigned mask = 1; mask < (1u << n); ++mask) {
            if (!(mask & (1u << i))) continue;
            std::vector<double> subset;
            for (size_t k = 0; k < n; ++k) {
                if (mask & (1u << k)) subset.push_back(p[k]);
            }
            expected = std::max(expected, simes(subset));
        }
        ASSERT_TRUE(q[i].has_value());
        EXPECT_NEAR(*q[i], expected, 1e-12) << "hypothesis " << i;
    }
}

TEST(PAdjustTest, HommelWithTwoValuesIsHochberg) {
    auto p = as_optional({0.03, 0.04});
    auto hommel = p_adjust(p, PAdjustMethod::HOMMEL);
    auto hochberg = p_adjust(p, PAdjustMethod::HOCHBERG);
    for (size_t i = 0; i < p.size(); ++i) {
        EXPECT_DOUBLE_EQ(*hommel[i], *hochberg[i]);
    }
}

TEST(PAdjustTest, SingleValueUnchanged) {
    expect_values(p_adjust(as_optional({0.03}), PAdjustMethod::BH), {0.03});
    EXPECT_TRUE(p_adjust({}, PAdjustMethod::HOLM).empty());
}

// ============================================================================
// Method names
// ============================================================================

TEST(MethodNameTest, CorrelationMethods) {
    EXPECT_EQ(parse_correlation_method("pearson"), CorrelationMethod::PEARSON);
    EXPECT_EQ(parse_correlation_method("Spearman"), CorrelationMethod::SPEARMAN);
    EXPECT_EQ(parse_correlation_method("s"), CorrelationMethod::SPEARMAN);
    EXPECT_THROW(parse_correlation_method("kendall"), InvalidMethodError);
    EXPECT_THROW(parse_correlation_method(""), InvalidMethodError);
}

TEST(MethodNameTest, PAdjustMethods) {
    EXPECT_EQ(parse_p_adjust_method("BH"), PAdjustMethod::BH);
    EXPECT_EQ(parse_p_adjust_method("fdr"), PAdjustMethod::BH);
    EXPECT_EQ(parse_p_adjust_method("hommel"), PAdjustMethod::HOMMEL);
    EXPECT_EQ(parse_p_adjust_method("none"), PAdjustMethod::NONE);
    EXPECT_THROW(parse_p_adjust_method("storey"), InvalidMethodError);

    for (auto m : {PAdjustMethod::NONE, PAdjustMethod::HOLM, PAdjustMethod::HOCHBERG, PAdjustMethod::HOMMEL,
                   PAdjustMethod::BONFERRONI, PAdjustMethod::BH, PAdjustMethod::BY}) {
        EXPECT_EQ(parse_p_adjust_method(p_adjust_method_to_string(m)), m);
    }
}
