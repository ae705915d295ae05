#pragma once

#include <optional>
#include <string>
#include <vector>

#include "AnchorCorrelation.hpp"
#include "DataStructs.hpp"

namespace Methodical {

/**
 * @brief Largest score magnitude, reached when p underflows to 0.
 *
 * Equals -log10 of the smallest positive double.
 */
extern const double kMaxScore;

/**
 * @brief Per-site scores for one anchor, ordered by position.
 */
struct ScoreSeries {
    GenomicCoordinate anchor;   ///< Anchor the scores belong to
    std::string feature;        ///< Anchor feature name
    std::vector<ScoredSite> sites;

    size_t size() const { return sites.size(); }
    bool empty() const { return sites.empty(); }
};

/**
 * @brief Signed significance score -sign(r)·log10(p).
 *
 * @return Empty when r or p is missing.
 */
std::optional<double> methodical_score(const std::optional<double>& correlation, const std::optional<double>& p_value);

/**
 * @brief Raw score of every record, same order as the input.
 */
std::vector<std::optional<double>> compute_scores(const std::vector<CorrelationRecord>& records);

/**
 * @brief Exponentially weighted moving average over neighbouring sites.
 *
 * The smoothed value at i is the weighted mean of raw[j] for
 * |i - j| <= offset_length with weight smoothing_factor^|i - j|. Missing
 * scores contribute to neither numerator nor denominator; a window without
 * any score gives a missing value.
 *
 * @param offset_length Number of sites on each side (>= 0).
 * @param smoothing_factor Weight decay in [0, 1]; 1 is a uniform window.
 * @throws std::invalid_argument for out-of-range parameters.
 */
std::vector<std::optional<double>> smooth_scores(const std::vector<std::optional<double>>& raw_scores,
                                                 int offset_length, double smoothing_factor);

/**
 * @brief Scores and smoothed scores for an anchor's correlation records.
 */
ScoreSeries build_score_series(const AnchorCorrelations& correlations, int offset_length, double smoothing_factor);

} // namespace Methodical
