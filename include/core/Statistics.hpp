#pragma once

#include <optional>
#include <string>
#include <vector>

#include "Types.hpp"

namespace Methodical {
namespace Stats {

/**
 * @brief log Γ(x) via the Lanczos approximation (g = 7).
 *
 * Used instead of std::lgamma, which writes the global signgam and is not
 * safe to call from several OpenMP threads.
 */
double log_gamma(double x);

/**
 * @brief Regularized incomplete beta function I_x(a, b).
 *
 * Continued fraction evaluated with the modified Lentz algorithm.
 */
double beta_inc(double a, double b, double x);

/**
 * @brief Two-sided tail probability 2·P(T_df > |t|) of Student's t.
 *
 * @return Empty when df <= 0 or t is NaN.
 */
std::optional<double> student_t_two_sided_p(double t, double df);

/**
 * @brief Average ranks (1-based), ties receive the mean of their ranks.
 */
std::vector<double> average_ranks(const std::vector<double>& values);

/**
 * @brief Pearson correlation of two equally sized vectors without missing values.
 *
 * @return Empty when fewer than 2 values or either vector has zero variance.
 */
std::optional<double> pearson(const std::vector<double>& x, const std::vector<double>& y);

/**
 * @brief Adjusts p-values for multiple testing, following R's p.adjust.
 *
 * Missing entries stay missing and are not counted in the number of tests.
 * The result is in the same order as the input.
 */
std::vector<std::optional<double>> p_adjust(const std::vector<std::optional<double>>& p_values,
                                            PAdjustMethod method);

/**
 * @brief Parses "pearson"/"spearman" (case-insensitive, unambiguous prefixes allowed).
 * @throws InvalidMethodError for anything else.
 */
CorrelationMethod parse_correlation_method(const std::string& name);

/**
 * @brief Parses an R p.adjust method name ("BH", "fdr", "holm", ..., "none").
 * @throws InvalidMethodError for anything else.
 */
PAdjustMethod parse_p_adjust_method(const std::string& name);

std::string correlation_method_to_string(CorrelationMethod method);
std::string p_adjust_method_to_string(PAdjustMethod method);

} // namespace Stats
} // namespace Methodical
