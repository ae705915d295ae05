#pragma once

#include <cstdint>
#include <vector>

#include "DataStructs.hpp"
#include "ScoreSmoother.hpp"

namespace Methodical {

/**
 * @brief Thresholds and merge settings for TMR calling.
 */
struct TmrParams {
    double p_value_threshold = 0.005;  ///< Converted to score threshold T = -log10(p)
    bool smooth = true;                ///< Threshold smoothed (true) or raw (false) scores
    int offset_length = 10;            ///< Smoothing half-window in sites
    double smoothing_factor = 0.75;    ///< Smoothing weight decay
    int min_meth_sites = 5;            ///< Minimum sites inside a reported TMR
    int64_t min_gapwidth = 150;        ///< Maximum bp between merged same-direction regions
};

/**
 * @brief Score threshold T = -log10(p_value_threshold).
 * @throws std::invalid_argument unless 0 < p_value_threshold <= 1.
 */
double score_threshold(double p_value_threshold);

/**
 * @brief Calls TMRs from a score series.
 *
 * A site is positive-significant when its score >= T and
 * negative-significant when its score <= -T. Maximal runs of consecutive
 * same-direction sites form candidates. Candidates of the same direction whose
 * boundary positions are at most min_gapwidth apart are merged (chained),
 * regardless of opposite-direction candidates between them. Regions with
 * fewer than min_meth_sites sites are dropped.
 *
 * @return TMRs ordered by start (regions of opposite direction may overlap);
 *         empty when nothing breaches the threshold.
 */
std::vector<Tmr> call_tmrs(const ScoreSeries& series, const TmrParams& params);

} // namespace Methodical
